/**
 * @file Platform.hpp
 * @brief POSIX target detection and the few platform switches hop needs.
 *
 * hop talks to peers over BSD sockets and runs its timers on std::thread,
 * so only Linux and macOS are supported.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef HOP_CORE_PLATFORM_HPP
    #define HOP_CORE_PLATFORM_HPP

    #if defined(__linux__)
        #define HOP_OS_LINUX 1
    #elif defined(__APPLE__)
        #define HOP_OS_MACOS 1
    #else
        #error "hop needs a POSIX socket API (Linux or macOS)"
    #endif

// Branch hints for contract checks.
    #if defined(__GNUC__) || defined(__clang__)
        #define HOP_LIKELY(x)   __builtin_expect(!!(x), 1)
        #define HOP_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #else
        #define HOP_LIKELY(x)   (x)
        #define HOP_UNLIKELY(x) (x)
    #endif

// A peer closing mid-frame must surface as EPIPE, not kill the node with
// SIGPIPE.  Linux suppresses it per send(); macOS per socket (SO_NOSIGPIPE).
    #if defined(HOP_OS_LINUX)
        #define HOP_SEND_FLAGS       MSG_NOSIGNAL
        #define HOP_SOCKET_NOSIGPIPE 0
    #else
        #define HOP_SEND_FLAGS       0
        #define HOP_SOCKET_NOSIGPIPE 1
    #endif

#endif // HOP_CORE_PLATFORM_HPP
