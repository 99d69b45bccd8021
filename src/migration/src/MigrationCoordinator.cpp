/**
 * @file MigrationCoordinator.cpp
 * @brief MigrationCoordinator implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hop/migration/MigrationCoordinator.hpp>
#include <hop/migration/CallChain.hpp>
#include <hop/migration/DeltaEngine.hpp>
#include <hop/migration/PairLock.hpp>
#include <hop/migration/RecentIdCache.hpp>
#include <hop/migration/SnapshotCapturer.hpp>
#include <hop/migration/StateRestorer.hpp>
#include <hop/net/MigrationTransport.hpp>
#include <hop/core/Assert.hpp>
#include <hop/core/Constants.hpp>
#include <hop/core/Log.hpp>

#include <atomic>
#include <format>
#include <limits>
#include <mutex>
#include <random>

namespace hop::migration {

using net::protocol::MigrationRequest;
using net::protocol::MigrationResponse;
using net::protocol::RejectReason;

std::string_view toString(SourceState state) noexcept
{
    switch (state)
    {
    case SourceState::Idle:         return "Idle";
    case SourceState::Capturing:    return "Capturing";
    case SourceState::Transferring: return "Transferring";
    case SourceState::AwaitingAck:  return "AwaitingAck";
    case SourceState::Completed:    return "Completed";
    case SourceState::Failed:       return "Failed";
    }
    HOP_UNREACHABLE();
}

std::string_view toString(DestinationState state) noexcept
{
    switch (state)
    {
    case DestinationState::Listening:  return "Listening";
    case DestinationState::Validating: return "Validating";
    case DestinationState::Restoring:  return "Restoring";
    case DestinationState::Resumed:    return "Resumed";
    }
    HOP_UNREACHABLE();
}

std::string_view toString(MigrationOutcome outcome) noexcept
{
    switch (outcome)
    {
    case MigrationOutcome::StayedLocal:    return "StayedLocal";
    case MigrationOutcome::AwaitingReturn: return "AwaitingReturn";
    case MigrationOutcome::Terminated:     return "Terminated";
    }
    HOP_UNREACHABLE();
}

// ========================================================================== //
//  Impl                                                                      //
// ========================================================================== //

struct MigrationCoordinator::Impl
{
    core::NodeId                  self;
    const cluster::ClusterConfig &config;
    IExecutionHost               &host;
    const net::PeerClient        &peers;

    BaselineStore           baselines;
    DeltaEngine             delta;
    SnapshotCapturer        capturer;
    StateRestorer           restorer;
    net::MigrationTransport transport;
    RecentIdCache           recent;
    PairLock                pairs;

    mutable std::mutex chainMutex;
    CallChain          chain;
    /// Bumped under chainMutex whenever an inbound migration adopts the execution.
    core::u64          adoption{0};
    core::u64          adoptions{0};

    std::mutex inboundMutex;

    std::mutex      rngMutex;
    std::mt19937_64 rng{std::random_device{}()};

    std::atomic<SourceState>      sourceState{SourceState::Idle};
    std::atomic<DestinationState> destinationState{DestinationState::Listening};
    std::atomic<bool>             hostsExecution;

    std::atomic<core::u64> sent{0};
    std::atomic<core::u64> received{0};
    std::atomic<core::u64> duplicates{0};
    std::atomic<core::u64> rejected{0};
    std::atomic<core::u64> failed{0};
    std::atomic<core::u64> fullImages{0};
    std::atomic<core::u64> deltaImages{0};
    std::atomic<core::u64> pagesSent{0};

    Impl(core::NodeId id, const cluster::ClusterConfig &cfg, IExecutionHost &h, const net::PeerClient &p)
        : self(std::move(id))
        , config(cfg)
        , host(h)
        , peers(p)
        , delta(baselines, cfg.migration())
        , capturer(h)
        , restorer(h)
        , transport(p, cfg.migration().retry)
        , hostsExecution(cfg.nodes().isEntry(self))
    {
    }

    core::MigrationId nextId()
    {
        std::lock_guard lock{rngMutex};
        std::uniform_int_distribution<core::u64> dist{1, std::numeric_limits<core::u64>::max()};
        return dist(rng);
    }

    core::Unexpected fail(core::Error error)
    {
        sourceState = SourceState::Failed;
        ++failed;
        core::Log::error("migration", std::format("migration failed: {}", error.describe()));
        return core::Unexpected{std::move(error)};
    }

    std::optional<core::u64> remoteBaseline(const core::NodeId &destination)
    {
        const auto reply = peers.queryBaseline(destination, net::protocol::BaselineQuery{self},
                                               std::chrono::milliseconds{core::kControlTimeoutMs});
        if (!reply)
        {
            core::Log::debug("migration", std::format("baseline query to {} failed: {}", destination,
                                                      reply.error().describe()));
            return std::nullopt;
        }
        if (!reply->hasBaseline)
            return std::nullopt;
        return reply->baselineId;
    }

    core::Expected<MigrationOutcome> send(const core::NodeId &destination)
    {
        sourceState = SourceState::Capturing;

        std::vector<serial::CallFrame> frames;
        {
            std::lock_guard lock{chainMutex};
            frames = chain.frames();
        }

        auto snapshot = capturer.capture(std::move(frames));
        if (!snapshot)
            return fail(std::move(snapshot.error()));

        sourceState = SourceState::Transferring;

        const auto raw = std::make_shared<const core::Bytes>(snapshot->takeMemory().takeBlob());

        std::optional<core::u64> remote;
        if (config.migration().strategy == cluster::MemoryStrategy::Delta && baselines.find(destination))
            remote = remoteBaseline(destination);

        auto image = delta.encode(destination, *raw, remote);
        if (!image)
            return fail(std::move(image.error()));

        MigrationRequest request;
        request.migrationId    = nextId();
        request.source         = self;
        request.destination    = destination;
        request.moduleDigest   = host.moduleDigest();
        request.nextBaselineId = request.migrationId;
        request.snapshot       = std::move(*snapshot).withMemory(std::move(*image));

        core::Log::info("migration", std::format("migration {:#x}: {} -> {} ({} memory, {} pages)",
                                                 request.migrationId, self, destination,
                                                 request.snapshot.memory().isDelta() ? "delta" : "full",
                                                 request.snapshot.memory().pages()));

        core::u64 adoptionBeforeSend;
        {
            std::lock_guard lock{chainMutex};
            adoptionBeforeSend = adoption;
        }

        sourceState = SourceState::AwaitingAck;
        auto response = transport.send(request);

        if (response && !response->isAcknowledged() && response->reason == RejectReason::BaselineMismatch
            && request.snapshot.memory().isDelta())
        {
            core::Log::warn("migration", std::format("migration {:#x}: {} lost baseline {}, resending full image",
                                                     request.migrationId, destination,
                                                     request.snapshot.memory().baselineId()));
            baselines.invalidate(destination);

            auto full = delta.encodeFull(*raw);
            if (!full)
                return fail(std::move(full.error()));
            request.snapshot = std::move(request.snapshot).withMemory(std::move(*full));
            response = transport.send(request);
        }

        if (!response)
            return fail(std::move(response.error()));

        if (!response->isAcknowledged())
        {
            ++rejected;
            return fail(core::Error{core::ErrorCode::kMigrationRejected,
                                    std::format("{} rejected migration {:#x}: {} ({})", destination,
                                                request.migrationId, net::protocol::toString(response->reason),
                                                response->detail)});
        }

        const auto &memory = request.snapshot.memory();
        if (memory.isDelta())
        {
            ++deltaImages;
            pagesSent += memory.patches().size();
        }
        else
        {
            ++fullImages;
            pagesSent += memory.pages();
        }

        {
            std::lock_guard lock{chainMutex};
            // The destination resumes before it acks, so the execution may
            // already be back here with a newer chain and baseline.
            if (adoption == adoptionBeforeSend)
            {
                baselines.record(destination, request.nextBaselineId, raw);
                chain.clear();
                hostsExecution = false;
            }
            else
            {
                core::Log::debug("migration", std::format("migration {:#x}: execution came back before the ack",
                                                          request.migrationId));
            }
        }
        ++sent;
        sourceState = SourceState::Completed;

        core::Log::info("migration", std::format("migration {:#x} acknowledged by {}", request.migrationId,
                                                 destination));

        return config.migration().semantics == cluster::ReturnSemantics::CallReturn
                   ? MigrationOutcome::AwaitingReturn
                   : MigrationOutcome::Terminated;
    }

    MigrationResponse reject(core::MigrationId id, RejectReason reason, std::string detail)
    {
        ++rejected;
        destinationState = DestinationState::Listening;
        core::Log::warn("migration", std::format("rejecting migration {:#x}: {} ({})", id,
                                                 net::protocol::toString(reason), detail));
        return MigrationResponse::rejected(id, reason, std::move(detail));
    }
};

// ========================================================================== //
//  Public API                                                                //
// ========================================================================== //

MigrationCoordinator::MigrationCoordinator(core::NodeId self,
                                           const cluster::ClusterConfig &config,
                                           IExecutionHost &host,
                                           const net::PeerClient &peers)
    : _impl(std::make_unique<Impl>(std::move(self), config, host, peers))
{
}

MigrationCoordinator::~MigrationCoordinator() = default;

core::Expected<MigrationOutcome> MigrationCoordinator::migrateTo(const core::NodeId &destination)
{
    if (destination == _impl->self)
        return MigrationOutcome::StayedLocal;

    if (!_impl->config.nodes().contains(destination))
    {
        return _impl->fail(core::Error{core::ErrorCode::kInvalidArgument,
                                       std::format("unknown migration target '{}'", destination)});
    }

    const auto guard = _impl->pairs.acquire(_impl->self, destination);
    return _impl->send(destination);
}

core::Expected<MigrationOutcome> MigrationCoordinator::enterFunction(const core::NodeId &target,
                                                                     core::u32 stackHeight)
{
    {
        std::lock_guard lock{_impl->chainMutex};
        if (!_impl->chain.enter(_impl->self, target, stackHeight))
            return MigrationOutcome::StayedLocal;
    }

    auto outcome = migrateTo(target);
    if (!outcome)
    {
        std::lock_guard lock{_impl->chainMutex};
        _impl->chain.abandonLast();
    }
    return outcome;
}

core::Expected<MigrationOutcome> MigrationCoordinator::exitFunction(core::u32 stackHeight)
{
    std::optional<core::NodeId> caller;
    {
        std::lock_guard lock{_impl->chainMutex};
        caller = _impl->chain.exit(_impl->self, stackHeight);
    }
    if (!caller)
        return MigrationOutcome::StayedLocal;

    core::Log::debug("migration", std::format("returning to {} at stack height {}", *caller, stackHeight));
    return migrateTo(*caller);
}

MigrationResponse MigrationCoordinator::handleMigrate(MigrationRequest request)
{
    auto &impl = *_impl;
    std::lock_guard inbound{impl.inboundMutex};

    const auto id = request.migrationId;
    if (auto cached = impl.recent.find(id))
    {
        ++impl.duplicates;
        core::Log::info("migration", std::format("migration {:#x} already applied, replaying acknowledgment", id));
        return *cached;
    }

    impl.destinationState = DestinationState::Validating;

    if (request.destination != impl.self)
    {
        return impl.reject(id, RejectReason::NotHostedHere,
                           std::format("addressed to '{}', this is '{}'", request.destination, impl.self));
    }
    if (!impl.config.nodes().contains(request.source))
        return impl.reject(id, RejectReason::MalformedPayload, std::format("unknown source '{}'", request.source));
    if (request.moduleDigest != impl.host.moduleDigest())
    {
        return impl.reject(id, RejectReason::ModuleMismatch,
                           std::format("module digest {:#x}, expected {:#x}", request.moduleDigest,
                                       impl.host.moduleDigest()));
    }

    const auto pages = request.snapshot.memory().pages();
    if (pages == 0)
        return impl.reject(id, RejectReason::MalformedPayload, "memory image has zero pages");
    if (pages > impl.config.migration().maxMemoryPages)
    {
        return impl.reject(id, RejectReason::InsufficientResources,
                           std::format("{} pages exceed the limit of {}", pages,
                                       impl.config.migration().maxMemoryPages));
    }

    auto memory = impl.delta.decode(request.source, request.snapshot.takeMemory());
    if (!memory)
    {
        if (memory.error().code() == core::ErrorCode::kBaselineMismatch)
        {
            impl.baselines.invalidate(request.source);
            return impl.reject(id, RejectReason::BaselineMismatch, memory.error().message());
        }
        return impl.reject(id, RejectReason::MalformedPayload, memory.error().message());
    }

    impl.destinationState = DestinationState::Restoring;

    // Everything the resumed execution may overwrite by migrating again is
    // settled before the host resumes it.
    const auto baseline = std::make_shared<const core::Bytes>(*memory);
    const auto previousBaseline = impl.baselines.find(request.source);
    std::vector<serial::CallFrame> previousChain;
    core::u64 previousAdoption;
    bool previouslyHosting;
    {
        std::lock_guard lock{impl.chainMutex};
        previousChain = impl.chain.frames();
        impl.chain.replace(request.snapshot.callChain());
        previousAdoption = impl.adoption;
        impl.adoption = ++impl.adoptions;
        previouslyHosting = impl.hostsExecution.exchange(true);
        impl.baselines.record(request.source, request.nextBaselineId, baseline);
    }

    auto restored = impl.restorer.restore(
        std::move(request.snapshot).withMemory(serial::MemoryImage::full(std::move(*memory))));
    if (!restored)
    {
        {
            std::lock_guard lock{impl.chainMutex};
            impl.chain.replace(std::move(previousChain));
            impl.adoption = previousAdoption;
            impl.hostsExecution = previouslyHosting;
            if (previousBaseline)
                impl.baselines.record(request.source, previousBaseline->baselineId, previousBaseline->image);
            else
                impl.baselines.invalidate(request.source);
        }
        core::Log::error("migration", std::format("migration {:#x}: {}", id, restored.error().describe()));
        return impl.reject(id, RejectReason::RestoreFailed, restored.error().message());
    }

    auto ack = MigrationResponse::acknowledged(id);
    impl.recent.insert(ack);
    ++impl.received;
    impl.destinationState = DestinationState::Resumed;

    core::Log::info("migration", std::format("migration {:#x} from {} resumed here ({} pages)", id,
                                             request.source, pages));
    return ack;
}

net::protocol::BaselineReply MigrationCoordinator::handleBaselineQuery(
    const net::protocol::BaselineQuery &query) const
{
    const auto record = _impl->baselines.find(query.requester);
    if (!record)
        return net::protocol::BaselineReply{false, 0};
    return net::protocol::BaselineReply{true, record->baselineId};
}

void MigrationCoordinator::registerHandlers(net::Dispatcher &dispatcher)
{
    dispatcher.on(net::protocol::MessageType::MigrateRequest,
                  [this](const net::protocol::Frame &frame) -> core::Expected<net::protocol::Frame> {
                      auto request = MigrationRequest::decode(frame);
                      if (!request)
                      {
                          const auto id = MigrationRequest::peekId(frame).value_or(0);
                          return _impl->reject(id, RejectReason::MalformedPayload, request.error().message())
                              .encode();
                      }
                      return handleMigrate(std::move(*request)).encode();
                  });

    dispatcher.on(net::protocol::MessageType::BaselineQuery,
                  [this](const net::protocol::Frame &frame) -> core::Expected<net::protocol::Frame> {
                      const auto query = HOP_TRY(net::protocol::BaselineQuery::decode(frame));
                      return handleBaselineQuery(query).encode();
                  });
}

void MigrationCoordinator::forgetPeer(const core::NodeId &peer)
{
    _impl->baselines.invalidate(peer);
}

const core::NodeId &MigrationCoordinator::self() const noexcept
{
    return _impl->self;
}

SourceState MigrationCoordinator::sourceState() const noexcept
{
    return _impl->sourceState.load();
}

DestinationState MigrationCoordinator::destinationState() const noexcept
{
    return _impl->destinationState.load();
}

bool MigrationCoordinator::hostsExecution() const noexcept
{
    return _impl->hostsExecution.load();
}

MigrationStats MigrationCoordinator::stats() const noexcept
{
    const auto &impl = *_impl;
    return MigrationStats{impl.sent.load(),       impl.received.load(),   impl.duplicates.load(),
                          impl.rejected.load(),   impl.failed.load(),     impl.fullImages.load(),
                          impl.deltaImages.load(), impl.pagesSent.load()};
}

const BaselineStore &MigrationCoordinator::baselines() const noexcept
{
    return _impl->baselines;
}

std::vector<serial::CallFrame> MigrationCoordinator::callChain() const
{
    std::lock_guard lock{_impl->chainMutex};
    return _impl->chain.frames();
}

} // namespace hop::migration
