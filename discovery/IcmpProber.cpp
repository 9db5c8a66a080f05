#include "ReachabilityProber.hpp"
#include "../common/Log.hpp"
#include <memory>
#include <tins/tins.h>

namespace host_sweep::discovery
{
    namespace Log = common::Log;

    bool IcmpProber::Probe(const Ipv4Address &address, std::chrono::seconds timeout)
    {
        const std::string target = address.ToString();
        Log::Info("Ping") << "Probing " << target << " (icmp)";

        try
        {
            Tins::IP request = Tins::IP(target) / Tins::ICMP();
            Tins::ICMP &icmp = request.rfind_pdu<Tins::ICMP>();
            icmp.type(Tins::ICMP::ECHO_REQUEST);
            icmp.id(static_cast<uint16_t>(address.Value() & 0xFFFF));
            icmp.sequence(1);

            // A sender per probe: PacketSender owns sockets and is not shared
            // between workers.
            Tins::PacketSender sender(Tins::NetworkInterface::default_interface(),
                                      static_cast<uint32_t>(timeout.count()));
            std::unique_ptr<Tins::PDU> reply(sender.send_recv(request));

            if (reply)
            {
                Log::Info("Ping") << target << " responded";
                return true;
            }
        }
        catch (const std::exception &e)
        {
            Log::Warn("Ping") << "ICMP probe of " << target << " failed: " << e.what();
            return false;
        }

        Log::Info("Ping") << target << " did not respond";
        return false;
    }
}
