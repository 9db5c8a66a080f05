#include <catch2/catch_test_macros.hpp>
#include "common/Errors.hpp"
#include "discovery/DiscoveryPipeline.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

using namespace host_sweep;
using namespace host_sweep::discovery;
using namespace std::chrono_literals;

namespace {

class CountingProber : public ReachabilityProber {
public:
    std::function<bool(const Ipv4Address&)> alive = [](const Ipv4Address&) { return true; };
    std::chrono::milliseconds latency{0};

    bool Probe(const Ipv4Address& address, std::chrono::seconds timeout) override {
        if (latency.count() > 0) {
            std::this_thread::sleep_for(latency);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_[address.Value()];
        last_timeout_ = timeout;
        return alive(address);
    }

    std::map<uint32_t, int> Calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::chrono::seconds LastTimeout() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_timeout_;
    }

private:
    mutable std::mutex mutex_;
    std::map<uint32_t, int> calls_;
    std::chrono::seconds last_timeout_{0};
};

class FakeIdentity : public IdentityQuery {
public:
    std::function<std::string(const Ipv4Address&)> answer = [](const Ipv4Address& address) {
        return "host-" + std::to_string(address.Octet(3));
    };
    std::atomic<int> calls{0};

    std::string QueryIdentity(const Ipv4Address& address) override {
        ++calls;
        return answer(address);
    }
};

class RecordingRegistrar : public HostRegistrar {
public:
    bool fail = false;

    void Register(const HostRecord& host, const std::string& group_id, const std::string& proxy_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        registered_.push_back(host);
        group_ = group_id;
        proxy_ = proxy_id;
        if (fail) {
            throw RegistrationError("backend unavailable");
        }
    }

    std::vector<HostRecord> Registered() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return registered_;
    }

    std::string Group() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return group_;
    }

    std::string Proxy() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return proxy_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<HostRecord> registered_;
    std::string group_;
    std::string proxy_;
};

common::DiscoveryConfig MakeConfig(int workers) {
    common::DiscoveryConfig config;
    config.workers = workers;
    config.ping_timeout = 2;
    config.zabbix_group_id = "42";
    config.zabbix_proxy_id = "10501";
    return config;
}

} // namespace

TEST_CASE("Pipeline rejects a pool without workers", "[pipeline]") {
    CountingProber prober;
    FakeIdentity identity;
    RecordingRegistrar registrar;
    auto config = MakeConfig(0);

    REQUIRE_THROWS_AS(DiscoveryPipeline(config, prober, identity, registrar), std::invalid_argument);
}

TEST_CASE("Every address is probed exactly once", "[pipeline]") {
    CountingProber prober;
    prober.alive = [](const Ipv4Address&) { return false; };
    FakeIdentity identity;
    RecordingRegistrar registrar;
    auto config = MakeConfig(4);

    DiscoveryPipeline pipeline(config, prober, identity, registrar);
    pipeline.Run(std::vector<std::string>{"10.0.0.0/24", "10.0.1.1-50"});

    auto calls = prober.Calls();
    REQUIRE(calls.size() == 254 + 50);
    for (const auto& entry : calls) {
        REQUIRE(entry.second == 1);
    }
    REQUIRE(prober.LastTimeout() == std::chrono::seconds(2));
    REQUIRE(identity.calls.load() == 0);
    REQUIRE(registrar.Registered().empty());
}

TEST_CASE("A malformed range is skipped and the rest still run", "[pipeline]") {
    CountingProber prober;
    prober.alive = [](const Ipv4Address&) { return false; };
    FakeIdentity identity;
    RecordingRegistrar registrar;
    auto config = MakeConfig(2);

    DiscoveryPipeline pipeline(config, prober, identity, registrar);
    pipeline.Run(std::vector<std::string>{"10.0.0.1", "10.0.0/24", "not-a-range", "10.0.0.5-6"});

    auto calls = prober.Calls();
    REQUIRE(calls.size() == 3);
    REQUIRE(calls.count(common::Ipv4Address::FromOctets(10, 0, 0, 1).Value()) == 1);
    REQUIRE(calls.count(common::Ipv4Address::FromOctets(10, 0, 0, 6).Value()) == 1);
}

TEST_CASE("Registration happens once per host that passes probe and query", "[pipeline]") {
    CountingProber prober;
    prober.alive = [](const Ipv4Address& address) { return address.Octet(3) % 2 == 0; };
    FakeIdentity identity;
    identity.answer = [](const Ipv4Address& address) -> std::string {
        if (address.Octet(3) % 3 == 0) {
            throw SnmpQueryError("timeout");
        }
        return "host-" + std::to_string(address.Octet(3));
    };
    RecordingRegistrar registrar;
    auto config = MakeConfig(3);

    DiscoveryPipeline pipeline(config, prober, identity, registrar);
    pipeline.Run(std::vector<std::string>{"10.0.0.1-30"});

    // Even and not a multiple of three: 2 4 8 10 14 16 20 22 26 28.
    std::set<int> expected = {2, 4, 8, 10, 14, 16, 20, 22, 26, 28};
    auto registered = registrar.Registered();
    REQUIRE(registered.size() == expected.size());

    std::set<int> seen;
    for (const auto& host : registered) {
        REQUIRE(host.name == "host-" + std::to_string(host.address.Octet(3)));
        seen.insert(host.address.Octet(3));
    }
    REQUIRE(seen == expected);
    REQUIRE(identity.calls.load() == 15);
    REQUIRE(registrar.Group() == "42");
    REQUIRE(registrar.Proxy() == "10501");
}

TEST_CASE("ProcessAddress reports the terminal state of each stage", "[pipeline]") {
    CountingProber prober;
    FakeIdentity identity;
    RecordingRegistrar registrar;
    auto config = MakeConfig(1);
    DiscoveryPipeline pipeline(config, prober, identity, registrar);
    auto address = common::Ipv4Address::FromOctets(192, 0, 2, 7);

    SECTION("unreachable") {
        prober.alive = [](const Ipv4Address&) { return false; };
        REQUIRE(pipeline.ProcessAddress(address) == HostState::Unreachable);
        REQUIRE(identity.calls.load() == 0);
    }

    SECTION("identity connect failure") {
        identity.answer = [](const Ipv4Address&) -> std::string { throw SnmpConnectError("no socket"); };
        REQUIRE(pipeline.ProcessAddress(address) == HostState::IdentityFailed);
        REQUIRE(registrar.Registered().empty());
    }

    SECTION("identity value is not a string") {
        identity.answer = [](const Ipv4Address&) -> std::string { throw SnmpUnexpectedTypeError("integer"); };
        REQUIRE(pipeline.ProcessAddress(address) == HostState::IdentityFailed);
        REQUIRE(registrar.Registered().empty());
    }

    SECTION("registration failure") {
        registrar.fail = true;
        REQUIRE(pipeline.ProcessAddress(address) == HostState::RegistrationFailed);
        REQUIRE(registrar.Registered().size() == 1);
    }

    SECTION("registered") {
        REQUIRE(pipeline.ProcessAddress(address) == HostState::Registered);
        REQUIRE(registrar.Registered().front().name == "host-7");
    }
}

TEST_CASE("Registration failures do not stop the run", "[pipeline]") {
    CountingProber prober;
    FakeIdentity identity;
    RecordingRegistrar registrar;
    registrar.fail = true;
    auto config = MakeConfig(2);

    DiscoveryPipeline pipeline(config, prober, identity, registrar);
    pipeline.Run(std::vector<std::string>{"10.1.1.1-8"});

    REQUIRE(registrar.Registered().size() == 8);
}

TEST_CASE("Workers probe concurrently", "[pipeline][timing]") {
    CountingProber prober;
    prober.alive = [](const Ipv4Address&) { return false; };
    prober.latency = 200ms;
    FakeIdentity identity;
    RecordingRegistrar registrar;
    auto config = MakeConfig(4);

    DiscoveryPipeline pipeline(config, prober, identity, registrar);

    auto start = std::chrono::steady_clock::now();
    pipeline.Run(std::vector<std::string>{"10.2.0.1-8"});
    auto elapsed = std::chrono::steady_clock::now() - start;

    // Serial would take 8 x 200ms; four workers need about 2 x 200ms.
    REQUIRE(prober.Calls().size() == 8);
    REQUIRE(elapsed < 1000ms);
    REQUIRE(elapsed >= 400ms);
}

TEST_CASE("Pre-expanded addresses run through the same pool", "[pipeline]") {
    CountingProber prober;
    FakeIdentity identity;
    RecordingRegistrar registrar;
    auto config = MakeConfig(3);

    std::vector<common::Ipv4Address> addresses;
    for (uint8_t i = 1; i <= 20; ++i) {
        addresses.push_back(common::Ipv4Address::FromOctets(172, 16, 0, i));
    }

    DiscoveryPipeline pipeline(config, prober, identity, registrar);
    pipeline.Run(addresses);

    REQUIRE(prober.Calls().size() == 20);
    REQUIRE(registrar.Registered().size() == 20);
}
