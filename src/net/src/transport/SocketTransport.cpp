// /////////////////////////////////////////////////////////////////////////////
/// @file SocketTransport.cpp
/// @brief POSIX TCP client and listener implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <hop/net/transport/SocketTransport.hpp>
#include <hop/concurrency/ThreadPool.hpp>
#include <hop/core/Constants.hpp>
#include <hop/core/Log.hpp>
#include <hop/core/Platform.hpp>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>
#include <thread>
#include <utility>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace hop::net::transport {

namespace {

using Clock    = std::chrono::steady_clock;
using Deadline = Clock::time_point;

/// Owning file descriptor.
class Fd final : public core::NonCopyable<Fd>
{
public:
    Fd() = default;
    explicit Fd(int fd) noexcept : fd_{fd} {}
    ~Fd() { reset(); }

    Fd(Fd&& other) noexcept : fd_{std::exchange(other.fd_, -1)} {}
    Fd& operator=(Fd&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    [[nodiscard]] int  get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    void reset() noexcept
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_{-1};
};

std::string lastErrno()
{
    return std::strerror(errno);
}

core::ExpectedVoid setNonBlocking(int fd)
{
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
    {
        return core::makeError(core::ErrorCode::kIoError,
                               std::format("fcntl(O_NONBLOCK) failed: {}", lastErrno()));
    }
    return {};
}

/// Small request/response frames: disable Nagle.  Best effort.
void tuneSocket(int fd)
{
    const int one = 1;
    if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) < 0)
        core::Log::debug("net", std::format("TCP_NODELAY not set: {}", lastErrno()));
#if HOP_SOCKET_NOSIGPIPE
    if (::setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one)) < 0)
        core::Log::debug("net", std::format("SO_NOSIGPIPE not set: {}", lastErrno()));
#endif
}

int remainingMs(Deadline deadline)
{
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

/// Waits until @p fd is ready for @p events or the deadline passes.
core::ExpectedVoid waitReady(int fd, short events, Deadline deadline, core::ErrorCode onFailure)
{
    for (;;)
    {
        pollfd pfd{fd, events, 0};
        const int timeout = remainingMs(deadline);
        const int rc = ::poll(&pfd, 1, timeout);
        if (rc > 0)
        {
            if ((pfd.revents & (POLLERR | POLLNVAL)) != 0)
            {
                return core::makeError(onFailure, "socket error while waiting");
            }
            return {};
        }
        if (rc == 0)
        {
            return core::makeError(core::ErrorCode::kTimeout, "socket operation timed out");
        }
        if (errno != EINTR)
        {
            return core::makeError(onFailure, std::format("poll() failed: {}", lastErrno()));
        }
    }
}

core::ExpectedVoid writeAll(int fd, std::span<const core::byte> data, Deadline deadline)
{
    core::usize sent = 0;
    while (sent < data.size())
    {
        const auto n = ::send(fd, data.data() + sent, data.size() - sent, HOP_SEND_FLAGS);
        if (n > 0)
        {
            sent += static_cast<core::usize>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
        {
            HOP_TRY_VOID(waitReady(fd, POLLOUT, deadline, core::ErrorCode::kNetworkSendFailed));
            continue;
        }
        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        return core::makeError(core::ErrorCode::kNetworkSendFailed,
                               std::format("send() failed: {}", lastErrno()));
    }
    return {};
}

core::ExpectedVoid readExact(int fd, std::span<core::byte> out, Deadline deadline)
{
    core::usize got = 0;
    while (got < out.size())
    {
        const auto n = ::recv(fd, out.data() + got, out.size() - got, 0);
        if (n > 0)
        {
            got += static_cast<core::usize>(n);
            continue;
        }
        if (n == 0)
        {
            return core::makeError(core::ErrorCode::kNetworkDisconnected,
                                   std::format("peer closed after {} of {} bytes", got, out.size()));
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK)
        {
            HOP_TRY_VOID(waitReady(fd, POLLIN, deadline, core::ErrorCode::kNetworkReceiveFailed));
            continue;
        }
        if (errno == EINTR)
        {
            continue;
        }
        return core::makeError(core::ErrorCode::kNetworkReceiveFailed,
                               std::format("recv() failed: {}", lastErrno()));
    }
    return {};
}

core::Expected<protocol::Frame> readFrame(int fd, Deadline deadline)
{
    core::Bytes headerBytes(protocol::kFrameHeaderSize);
    HOP_TRY_VOID(readExact(fd, headerBytes, deadline));

    protocol::Frame frame;
    frame.header = HOP_TRY(protocol::decodeHeader(headerBytes));
    frame.payload.resize(frame.header.payloadSize);
    HOP_TRY_VOID(readExact(fd, frame.payload, deadline));
    return frame;
}

core::ExpectedVoid writeFrame(int fd, const protocol::Frame& frame, Deadline deadline)
{
    auto header = frame.header;
    header.payloadSize = static_cast<core::u32>(frame.payload.size());

    const auto headerBytes = protocol::encodeHeader(header);
    HOP_TRY_VOID(writeAll(fd, headerBytes, deadline));
    return writeAll(fd, frame.payload, deadline);
}

core::Expected<Fd> connectTo(const Endpoint& endpoint, Deadline deadline)
{
    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    const auto service = std::to_string(endpoint.port);
    const int rc = ::getaddrinfo(endpoint.host.c_str(), service.c_str(), &hints, &result);
    if (rc != 0 || result == nullptr)
    {
        return core::makeError(core::ErrorCode::kNetworkConnectFailed,
                               std::format("cannot resolve {}: {}", endpoint.toString(), ::gai_strerror(rc)));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard{result, &::freeaddrinfo};

    Fd fd{::socket(result->ai_family, result->ai_socktype, result->ai_protocol)};
    if (!fd.valid())
    {
        return core::makeError(core::ErrorCode::kNetworkConnectFailed,
                               std::format("socket() failed: {}", lastErrno()));
    }
    HOP_TRY_VOID(setNonBlocking(fd.get()));

    tuneSocket(fd.get());

    if (::connect(fd.get(), result->ai_addr, result->ai_addrlen) < 0)
    {
        if (errno != EINPROGRESS)
        {
            return core::makeError(core::ErrorCode::kNetworkConnectFailed,
                                   std::format("connect({}) failed: {}", endpoint.toString(), lastErrno()));
        }

        auto ready = waitReady(fd.get(), POLLOUT, deadline, core::ErrorCode::kNetworkConnectFailed);
        if (!ready)
        {
            return core::makeError(core::ErrorCode::kNetworkConnectFailed,
                                   std::format("connect({}): {}", endpoint.toString(), ready.error().message()));
        }

        int soError = 0;
        socklen_t len = sizeof(soError);
        if (::getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &soError, &len) < 0 || soError != 0)
        {
            return core::makeError(core::ErrorCode::kNetworkConnectFailed,
                                   std::format("connect({}) failed: {}", endpoint.toString(),
                                               std::strerror(soError)));
        }
    }

    return fd;
}

} // anonymous namespace

// ----- //  SocketTransport  // ----- //

SocketTransport::SocketTransport() = default;
SocketTransport::~SocketTransport() = default;

core::Expected<protocol::Frame> SocketTransport::request(
    const Endpoint& endpoint,
    const protocol::Frame& frame,
    std::chrono::milliseconds timeout)
{
    const auto deadline = Clock::now() + timeout;

    auto fd = HOP_TRY(connectTo(endpoint, deadline));
    HOP_TRY_VOID(writeFrame(fd.get(), frame, deadline));
    return readFrame(fd.get(), deadline);
}

const char* SocketTransport::name() const noexcept
{
    return "SocketTransport";
}

// ----- //  SocketListener  // ----- //

struct SocketListener::Impl
{
    std::string  bindAddress;
    core::u16    port;
    core::u32    workerCount;
    core::u16    boundPort{0};
    Fd           listenFd;
    FrameHandler handler;

    std::atomic<bool>                          running{false};
    std::thread                                acceptThread;
    std::unique_ptr<concurrency::ThreadPool>   pool;

    Impl(std::string addr, core::u16 p, core::u32 w)
        : bindAddress{std::move(addr)}, port{p}, workerCount{w} {}

    void acceptLoop()
    {
        while (running.load(std::memory_order_acquire))
        {
            pollfd pfd{listenFd.get(), POLLIN, 0};
            const int rc = ::poll(&pfd, 1, 100);
            if (rc <= 0)
            {
                continue;
            }

            const int client = ::accept(listenFd.get(), nullptr, nullptr);
            if (client < 0)
            {
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                {
                    core::Log::warn("net", std::format("accept() failed: {}", lastErrno()));
                }
                continue;
            }

            auto conn = std::make_shared<Fd>(client);
            tuneSocket(conn->get());
            if (auto nb = setNonBlocking(conn->get()); !nb)
            {
                core::Log::warn("net", nb.error().message());
                continue;
            }

            if (!pool->submit([this, conn] { serve(*conn); }))
            {
                core::Log::debug("net", "listener stopping; dropping connection");
            }
        }
    }

    void serve(const Fd& conn)
    {
        const auto readDeadline = Clock::now() + std::chrono::milliseconds{core::kMigrationAckTimeoutMs};
        auto request = readFrame(conn.get(), readDeadline);
        if (!request)
        {
            core::Log::debug("net", std::format("dropping inbound request: {}", request.error().describe()));
            return;
        }

        const auto response = handler(*request);

        const auto writeDeadline = Clock::now() + std::chrono::milliseconds{core::kMigrationAckTimeoutMs};
        if (auto sent = writeFrame(conn.get(), response, writeDeadline); !sent)
        {
            core::Log::warn("net", std::format("failed to answer {}: {}",
                                               protocol::toString(request->type()),
                                               sent.error().describe()));
        }
    }
};

SocketListener::SocketListener(std::string bindAddress, core::u16 port, core::u32 workers)
    : impl_{std::make_unique<Impl>(std::move(bindAddress), port, workers)}
{}

SocketListener::~SocketListener()
{
    close();
}

core::Expected<void> SocketListener::open(FrameHandler handler)
{
    if (impl_->running.load())
    {
        return core::makeError(core::ErrorCode::kInvalidState, "listener already open");
    }

    Fd fd{::socket(AF_INET, SOCK_STREAM, 0)};
    if (!fd.valid())
    {
        return core::makeError(core::ErrorCode::kIoError, std::format("socket() failed: {}", lastErrno()));
    }

    const int one = 1;
    if (::setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) < 0)
    {
        core::Log::warn("net", std::format("SO_REUSEADDR not set: {}", lastErrno()));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(impl_->port);
    if (::inet_pton(AF_INET, impl_->bindAddress.c_str(), &addr.sin_addr) != 1)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               std::format("invalid bind address '{}'", impl_->bindAddress));
    }

    if (::bind(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0)
    {
        return core::makeError(core::ErrorCode::kIoError,
                               std::format("bind({}:{}) failed: {}", impl_->bindAddress, impl_->port, lastErrno()));
    }
    if (::listen(fd.get(), SOMAXCONN) < 0)
    {
        return core::makeError(core::ErrorCode::kIoError, std::format("listen() failed: {}", lastErrno()));
    }
    HOP_TRY_VOID(setNonBlocking(fd.get()));

    socklen_t len = sizeof(addr);
    if (::getsockname(fd.get(), reinterpret_cast<sockaddr*>(&addr), &len) < 0)
    {
        return core::makeError(core::ErrorCode::kIoError, std::format("getsockname() failed: {}", lastErrno()));
    }

    impl_->boundPort = ntohs(addr.sin_port);
    impl_->listenFd  = std::move(fd);
    impl_->handler   = std::move(handler);
    impl_->pool      = std::make_unique<concurrency::ThreadPool>(impl_->workerCount);
    impl_->running.store(true, std::memory_order_release);
    impl_->acceptThread = std::thread{[this] { impl_->acceptLoop(); }};

    core::Log::info("net", std::format("SocketListener: listening on {}:{}",
                                       impl_->bindAddress, impl_->boundPort));
    return {};
}

void SocketListener::close()
{
    if (!impl_->running.exchange(false))
    {
        return;
    }

    if (impl_->acceptThread.joinable())
    {
        impl_->acceptThread.join();
    }
    impl_->pool->shutdown();
    impl_->listenFd.reset();
}

Endpoint SocketListener::endpoint() const
{
    return Endpoint{impl_->bindAddress, impl_->boundPort};
}

const char* SocketListener::name() const noexcept
{
    return "SocketListener";
}

} // namespace hop::net::transport
