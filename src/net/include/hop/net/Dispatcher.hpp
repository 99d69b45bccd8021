/**
 * @file Dispatcher.hpp
 * @brief Routes inbound frames to per-message-type handlers.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HOP_NET_DISPATCHER_HPP
    #define HOP_NET_DISPATCHER_HPP

#include <hop/net/protocol/Protocol.hpp>
#include <hop/net/transport/ITransport.hpp>
#include <hop/core/Expected.hpp>

#include <functional>
#include <unordered_map>

namespace hop::net {

/**
 * @brief Server-side demultiplexer.
 *
 * Handlers are registered once, before the listener opens; @ref dispatch
 * is then called concurrently from the listener workers without locking.
 *
 * Every request gets exactly one answer:
 *   - a frame of an unknown scheme version is rejected (a MigrateResponse
 *     for migration requests, an Error frame otherwise);
 *   - a type with no handler yields an Error frame (kNotSupported);
 *   - a handler error is returned to the caller as an Error frame.
 */
class Dispatcher final {
public:
    using Handler = std::function<core::Expected<protocol::Frame>(const protocol::Frame &)>;

    /// @brief Installs (or replaces) the handler for @p type.
    void on(protocol::MessageType type, Handler handler);

    [[nodiscard]] bool handles(protocol::MessageType type) const;

    [[nodiscard]] protocol::Frame dispatch(const protocol::Frame &request) const;

    /// @brief Adapter suitable for IListener::open.  The dispatcher must
    ///        outlive the listener.
    [[nodiscard]] transport::FrameHandler asFrameHandler() const;

private:
    std::unordered_map<protocol::MessageType, Handler> _handlers;
};

} // namespace hop::net

#endif // HOP_NET_DISPATCHER_HPP
