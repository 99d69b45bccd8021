// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief hop two-node demo entry-point.
///
/// Starts two nodes on TCP loopback inside one process, moves a 128 KiB
/// execution to the follower in full, brings it back as a one-page delta,
/// then finishes the program and shuts the cluster down.
// /////////////////////////////////////////////////////////////////////////////

#include <hop/node/Node.hpp>
#include <hop/migration/InMemoryHost.hpp>
#include <hop/core/Constants.hpp>
#include <hop/core/Log.hpp>

#include <format>
#include <thread>

namespace {

constexpr hop::core::u64 kModuleDigest = 0x686F70;

void fillPage(hop::migration::InMemoryHost& host, hop::core::usize page, hop::core::u8 value)
{
    const hop::core::Bytes bytes(hop::core::kPageSize, hop::core::byte{value});
    if (auto written = host.writeMemory(page * hop::core::kPageSize, bytes); !written)
        hop::core::Log::error("demo", written.error().describe());
}

} // namespace

int main(int /*argc*/, char* /*argv*/[])
{
    using namespace std::chrono_literals;

    hop::core::Log::info("demo", "=== hop two-node demo ===");

    auto config = hop::cluster::ClusterConfig::Builder{}
        .name("demo")
        .addNode("entry", "127.0.0.1", 47'010)
        .addNode("worker", "127.0.0.1", 47'011)
        .heartbeatInterval(200ms)
        .build();
    if (!config)
    {
        hop::core::Log::error("demo", config.error().describe());
        return 1;
    }

    hop::migration::InMemoryHost entryHost{kModuleDigest, 2};
    hop::migration::InMemoryHost workerHost{kModuleDigest, 2};

    hop::node::Node worker{"worker", *config, workerHost};
    hop::node::Node entry{"entry", *config, entryHost};

    if (auto result = worker.init(); !result)
    {
        hop::core::Log::error("demo", std::format("worker init failed: {}", result.error().describe()));
        return 1;
    }
    std::thread workerThread{[&worker] { worker.run(); }};

    auto finish = [&](int code) {
        entry.programFinished();
        workerThread.join();
        entry.shutdown();
        return code;
    };

    if (auto result = entry.init(); !result)
    {
        hop::core::Log::error("demo", std::format("entry init failed: {}", result.error().describe()));
        worker.requestShutdown("entry failed to start");
        workerThread.join();
        return 1;
    }

    entry.startExecution();
    fillPage(entryHost, 0, 0x11);
    fillPage(entryHost, 1, 0x22);

    // entry -> worker: no baseline yet, the whole image travels.
    if (auto outbound = entry.migrateTo("worker"); !outbound)
        return finish(1);

    // The worker touches one page, then returns.
    fillPage(workerHost, 1, 0x33);
    if (auto inbound = worker.migrateTo("entry"); !inbound)
        return finish(1);

    const auto stats = worker.coordinator().stats();
    hop::core::Log::info("demo", std::format("return trip: {} delta image(s), {} page(s) sent",
                                             stats.deltaImagesSent, stats.pagesSent));

    if (entryHost.memory() != workerHost.memory())
    {
        hop::core::Log::error("demo", "memory diverged after the round trip");
        return finish(1);
    }

    hop::core::Log::info("demo", "round trip verified");
    return finish(0);
}
