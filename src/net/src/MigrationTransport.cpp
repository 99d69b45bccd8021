/**
 * @file MigrationTransport.cpp
 * @brief MigrationTransport implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hop/net/MigrationTransport.hpp>
#include <hop/core/Log.hpp>

#include <algorithm>
#include <format>
#include <thread>

namespace hop::net {

MigrationTransport::MigrationTransport(const PeerClient &peers, cluster::RetrySettings retry)
    : _peers(peers), _retry(retry)
{
}

std::chrono::milliseconds MigrationTransport::backoffAfter(const cluster::RetrySettings &retry,
                                                           core::u32 attempt) noexcept
{
    auto delay = retry.initialBackoff;
    for (core::u32 i = 1; i < attempt && delay < retry.maxBackoff; ++i)
        delay *= 2;
    return std::min(delay, retry.maxBackoff);
}

core::Expected<protocol::MigrationResponse> MigrationTransport::send(
    const protocol::MigrationRequest &request) const
{
    const auto frame = HOP_TRY(request.encode());
    const auto attempts = std::max<core::u32>(_retry.maxAttempts, 1);

    std::string lastError;
    for (core::u32 attempt = 1; attempt <= attempts; ++attempt)
    {
        auto response = _peers.migrate(request.destination, frame, _retry.ackTimeout);
        if (response)
        {
            if (response->migrationId != request.migrationId)
            {
                return core::makeError(core::ErrorCode::kProtocolViolation,
                                       std::format("response for migration {:#x} while waiting for {:#x}",
                                                   response->migrationId, request.migrationId));
            }
            return response;
        }

        if (!core::isRetryable(response.error().code()))
            return std::unexpected(std::move(response.error()));

        lastError = response.error().describe();
        if (attempt == attempts)
            break;

        const auto delay = backoffAfter(_retry, attempt);
        core::Log::warn("migration", std::format("migration {:#x} to {}: attempt {}/{} failed ({}), retrying in {}ms",
                                                 request.migrationId, request.destination, attempt, attempts,
                                                 lastError, delay.count()));
        std::this_thread::sleep_for(delay);
    }

    return core::makeError(core::ErrorCode::kTransportFailure,
                           std::format("migration {:#x} to {} failed after {} attempts: {}",
                                       request.migrationId, request.destination, attempts, lastError));
}

} // namespace hop::net
