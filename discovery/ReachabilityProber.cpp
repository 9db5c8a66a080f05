#include "ReachabilityProber.hpp"
#include "../common/Log.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace host_sweep::discovery
{
    namespace Log = common::Log;

    PingProber::PingProber(std::string program) : m_program(std::move(program))
    {
    }

    bool PingProber::Probe(const Ipv4Address &address, std::chrono::seconds timeout)
    {
        const std::string target = address.ToString();
        Log::Info("Ping") << "Probing " << target;

        std::vector<std::string> args = {m_program, "-c", "1", "-W", std::to_string(timeout.count()), target};
        std::vector<char *> argv;
        argv.reserve(args.size() + 1);
        for (auto &arg : args)
            argv.push_back(arg.data());
        argv.push_back(nullptr);

        pid_t child = ::fork();
        if (child < 0)
        {
            Log::Error("Ping") << "fork failed for " << target << ": " << std::strerror(errno);
            return false;
        }

        if (child == 0)
        {
            const int dev_null = ::open("/dev/null", O_RDWR);
            if (dev_null >= 0)
            {
                ::dup2(dev_null, STDIN_FILENO);
                ::dup2(dev_null, STDOUT_FILENO);
                ::dup2(dev_null, STDERR_FILENO);
                if (dev_null > STDERR_FILENO)
                    ::close(dev_null);
            }
            ::execvp(argv[0], argv.data());
            _exit(127);
        }

        int status = 0;
        while (::waitpid(child, &status, 0) < 0)
        {
            if (errno != EINTR)
            {
                Log::Error("Ping") << "waitpid failed for " << target << ": " << std::strerror(errno);
                return false;
            }
        }

        bool alive = WIFEXITED(status) && WEXITSTATUS(status) == 0;
        if (alive)
            Log::Info("Ping") << target << " responded";
        else
            Log::Info("Ping") << target << " did not respond";
        return alive;
    }

    std::unique_ptr<ReachabilityProber> MakeProber(const common::DiscoveryConfig &config)
    {
        if (config.probe_method == common::ProbeMethod::Icmp)
            return std::make_unique<IcmpProber>();
        return std::make_unique<PingProber>();
    }
}
