// /////////////////////////////////////////////////////////////////////////////
/// @file Node.cpp
/// @brief Node façade implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <hop/node/Node.hpp>
#include <hop/net/Dispatcher.hpp>
#include <hop/net/PeerClient.hpp>
#include <hop/net/transport/SocketTransport.hpp>
#include <hop/core/Constants.hpp>
#include <hop/core/Log.hpp>

#include <condition_variable>
#include <format>
#include <mutex>

namespace hop::node {

namespace {

std::unique_ptr<net::transport::IListener> tcpListener(const core::NodeId& self,
                                                       const cluster::ClusterConfig& config)
{
    const auto* node = config.nodes().find(self);
    if (!node)
        return nullptr;
    return std::make_unique<net::transport::SocketListener>("0.0.0.0", node->port, core::kInboundWorkerThreads);
}

} // anonymous namespace

struct Node::Impl
{
    core::NodeId           self;
    cluster::ClusterConfig config;

    std::shared_ptr<net::transport::ITransport> transport;
    std::unique_ptr<net::transport::IListener>  listener;

    net::PeerClient                 peers;
    net::Dispatcher                 dispatcher;
    migration::MigrationCoordinator coordinator;
    liveness::LivenessManager       liveness;

    mutable std::mutex      mutex;
    std::condition_variable cv;
    bool                    stopRequested{false};
    std::string             reason;

    bool initialised{false};

    Impl(core::NodeId id,
         cluster::ClusterConfig cfg,
         migration::IExecutionHost& host,
         std::shared_ptr<net::transport::ITransport> tx,
         std::unique_ptr<net::transport::IListener> rx)
        : self{std::move(id)}
        , config{std::move(cfg)}
        , transport{tx ? std::move(tx) : std::make_shared<net::transport::SocketTransport>()}
        , listener{rx ? std::move(rx) : tcpListener(self, config)}
        , peers{config.nodes(), transport}
        , dispatcher{}
        , coordinator{self, config, host, peers}
        , liveness{self, config, peers}
    {
    }
};

Node::Node(core::NodeId self,
           cluster::ClusterConfig config,
           migration::IExecutionHost& host,
           std::shared_ptr<net::transport::ITransport> transport,
           std::unique_ptr<net::transport::IListener> listener)
    : impl_{std::make_unique<Impl>(std::move(self), std::move(config), host, std::move(transport),
                                   std::move(listener))}
{
}

Node::~Node()
{
    if (impl_ && impl_->initialised)
    {
        shutdown();
    }
}

core::Expected<void> Node::init()
{
    if (impl_->initialised)
    {
        return {};
    }
    if (!impl_->config.nodes().contains(impl_->self))
    {
        return core::makeError(core::ErrorCode::kNotFound,
                               std::format("node {} is not part of cluster {}", impl_->self, impl_->config.name()));
    }

    core::Log::info("node", std::format("{} init, wiring subsystems", impl_->self));

    impl_->coordinator.registerHandlers(impl_->dispatcher);
    impl_->liveness.registerHandlers(impl_->dispatcher);

    impl_->liveness.onShutdownRequested([this](const std::string& reason) { requestShutdown(reason); });
    impl_->liveness.onPeerLost([this](const core::NodeId& peer) { impl_->coordinator.forgetPeer(peer); });

    HOP_TRY_VOID(impl_->listener->open(impl_->dispatcher.asFrameHandler()));
    core::Log::info("node", std::format("{} listening on {} ({})", impl_->self,
                                        impl_->listener->endpoint().toString(), impl_->listener->name()));

    if (auto ready = impl_->liveness.awaitPeersReady(); !ready)
    {
        core::Log::error("node", std::format("{} peers not ready: {}", impl_->self, ready.error().describe()));
        impl_->listener->close();
        return ready;
    }

    impl_->liveness.start();
    impl_->initialised = true;
    core::Log::info("node", std::format("{} init done", impl_->self));
    return {};
}

void Node::startExecution()
{
    if (!impl_->liveness.isEntry())
    {
        return;
    }
    impl_->liveness.markExecutionStarted();
    core::Log::info("node", std::format("{} execution started", impl_->self));
}

namespace {

core::Expected<migration::MigrationOutcome> fatalOnFailure(Node& node,
                                                           core::Expected<migration::MigrationOutcome> result)
{
    if (!result)
    {
        const auto reason = std::format("migration failed on {}: {}", node.self(), result.error().describe());
        core::Log::fatal("node", reason);
        node.requestShutdown(reason);
    }
    return result;
}

} // anonymous namespace

core::Expected<migration::MigrationOutcome> Node::migrateTo(const core::NodeId& destination)
{
    return fatalOnFailure(*this, impl_->coordinator.migrateTo(destination));
}

core::Expected<migration::MigrationOutcome> Node::enterFunction(const core::NodeId& target, core::u32 stackHeight)
{
    return fatalOnFailure(*this, impl_->coordinator.enterFunction(target, stackHeight));
}

core::Expected<migration::MigrationOutcome> Node::exitFunction(core::u32 stackHeight)
{
    return fatalOnFailure(*this, impl_->coordinator.exitFunction(stackHeight));
}

void Node::programFinished()
{
    const auto reason = std::format("program finished on {}", impl_->self);
    core::Log::info("node", reason);
    impl_->liveness.broadcastShutdown(reason);
    requestShutdown(reason);
}

void Node::run()
{
    if (!impl_->initialised)
    {
        core::Log::error("node", std::format("{} run() before init()", impl_->self));
        return;
    }

    {
        std::unique_lock lock{impl_->mutex};
        impl_->cv.wait(lock, [this] { return impl_->stopRequested; });
    }
    shutdown();
}

bool Node::waitForShutdown(std::chrono::milliseconds timeout)
{
    std::unique_lock lock{impl_->mutex};
    return impl_->cv.wait_for(lock, timeout, [this] { return impl_->stopRequested; });
}

void Node::requestShutdown(const std::string& reason)
{
    {
        std::lock_guard lock{impl_->mutex};
        if (impl_->stopRequested)
        {
            return;
        }
        impl_->stopRequested = true;
        impl_->reason = reason;
    }
    core::Log::warn("node", std::format("{} shutdown requested: {}", impl_->self, reason));
    impl_->cv.notify_all();
}

void Node::shutdown()
{
    if (!impl_->initialised)
    {
        return;
    }

    core::Log::info("node", std::format("{} shutdown", impl_->self));
    impl_->liveness.stop();
    impl_->listener->close();
    impl_->initialised = false;
}

bool Node::shutdownRequested() const noexcept
{
    std::lock_guard lock{impl_->mutex};
    return impl_->stopRequested;
}

std::string Node::shutdownReason() const
{
    std::lock_guard lock{impl_->mutex};
    return impl_->reason;
}

const core::NodeId& Node::self() const noexcept
{
    return impl_->self;
}

const cluster::ClusterConfig& Node::config() const noexcept
{
    return impl_->config;
}

bool Node::isEntry() const noexcept
{
    return impl_->liveness.isEntry();
}

net::transport::Endpoint Node::endpoint() const
{
    if (!impl_->listener)
    {
        return {};
    }
    return impl_->listener->endpoint();
}

migration::MigrationCoordinator& Node::coordinator() noexcept
{
    return impl_->coordinator;
}

liveness::LivenessManager& Node::liveness() noexcept
{
    return impl_->liveness;
}

} // namespace hop::node
