/**
 * @file Dispatcher.cpp
 * @brief Dispatcher implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hop/net/Dispatcher.hpp>
#include <hop/net/protocol/Messages.hpp>
#include <hop/core/Log.hpp>

#include <format>

namespace hop::net {

namespace {

protocol::Frame errorFrame(core::ErrorCode code, std::string message)
{
    return protocol::ErrorMessage{code, std::move(message)}.encode();
}

} // namespace

void Dispatcher::on(protocol::MessageType type, Handler handler)
{
    _handlers[type] = std::move(handler);
}

bool Dispatcher::handles(protocol::MessageType type) const
{
    return _handlers.contains(type);
}

protocol::Frame Dispatcher::dispatch(const protocol::Frame &request) const
{
    const auto type = request.type();

    if (request.header.version != protocol::kProtocolVersion)
    {
        const auto detail = std::format("scheme version {} not supported (expected {})",
                                        request.header.version, protocol::kProtocolVersion);
        core::Log::warn("net", std::format("rejecting {}: {}", protocol::toString(type), detail));

        if (type == protocol::MessageType::MigrateRequest)
        {
            const auto id = protocol::MigrationRequest::peekId(request).value_or(0);
            return protocol::MigrationResponse::rejected(
                       id, protocol::RejectReason::UnsupportedVersion, detail).encode();
        }
        return errorFrame(core::ErrorCode::kProtocolViolation, detail);
    }

    const auto it = _handlers.find(type);
    if (it == _handlers.end())
    {
        return errorFrame(core::ErrorCode::kNotSupported,
                          std::format("no handler for {}", protocol::toString(type)));
    }

    auto response = it->second(request);
    if (!response)
    {
        core::Log::warn("net", std::format("{} handler failed: {}",
                                           protocol::toString(type), response.error().describe()));
        return errorFrame(response.error().code(), response.error().message());
    }
    return std::move(*response);
}

transport::FrameHandler Dispatcher::asFrameHandler() const
{
    return [this](const protocol::Frame &request) { return dispatch(request); };
}

} // namespace hop::net
