#include <cerrno>
#include <chrono>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <sidecar/sidecar.hpp>

namespace sidecar {

namespace {

using Clock = std::chrono::steady_clock;

class Socket {
    int fd{-1};
public:
    Socket() = default;
    explicit Socket(int fd) : fd(fd) {}
    ~Socket() { if (fd >= 0) ::close(fd); }
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    Socket(Socket&& other) noexcept : fd(other.fd) { other.fd = -1; }
    Socket& operator=(Socket&& other) noexcept {
        if (this != &other) {
            if (fd >= 0) ::close(fd);
            fd = other.fd;
            other.fd = -1;
        }
        return *this;
    }
    int get() const { return fd; }
    bool valid() const { return fd >= 0; }
};

int millisecondsLeft(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

// Waits for `events` on fd. Returns 1 when ready, 0 on timeout, -1 on error (errno set).
int waitFor(int fd, short events, Clock::time_point deadline) {
    pollfd pfd{ fd, events, 0 };
    while (true) {
        int rc = ::poll(&pfd, 1, millisecondsLeft(deadline));
        if (rc == -1 && errno == EINTR) {
            if (Clock::now() >= deadline)
                return 0;
            continue;
        }
        return rc;
    }
}

// Non-blocking connect bounded by the deadline. Fills `error` on failure.
Socket connectTo(const addrinfo* ai, Clock::time_point deadline, std::string& error) {
    Socket sock{::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol)};
    if (!sock.valid()) {
        error = std::string{"socket: "} + strerror(errno);
        return {};
    }
#ifdef SO_NOSIGPIPE
    int one = 1;
    ::setsockopt(sock.get(), SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif
    int flags = ::fcntl(sock.get(), F_GETFL, 0);
    if (flags < 0 || ::fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
        error = std::string{"fcntl: "} + strerror(errno);
        return {};
    }

    if (::connect(sock.get(), ai->ai_addr, ai->ai_addrlen) == 0)
        return sock;
    if (errno != EINPROGRESS) {
        error = std::string{"connect: "} + strerror(errno);
        return {};
    }

    int rc = waitFor(sock.get(), POLLOUT, deadline);
    if (rc == 0) {
        error = "connect: timed out";
        return {};
    }
    if (rc < 0) {
        error = std::string{"poll: "} + strerror(errno);
        return {};
    }
    int soError = 0;
    socklen_t len = sizeof(soError);
    if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &soError, &len) < 0) {
        error = std::string{"getsockopt: "} + strerror(errno);
        return {};
    }
    if (soError != 0) {
        error = std::string{"connect: "} + strerror(soError);
        return {};
    }
    return sock;
}

bool sendAll(int fd, const std::string& data, Clock::time_point deadline, std::string& error) {
#ifdef MSG_NOSIGNAL
    constexpr int sendFlags = MSG_NOSIGNAL;
#else
    constexpr int sendFlags = 0;
#endif
    size_t total = 0;
    while (total < data.size()) {
        ssize_t written = ::send(fd, data.data() + total, data.size() - total, sendFlags);
        if (written > 0) {
            total += static_cast<size_t>(written);
        } else if (written == -1 && errno == EINTR) {
            continue;
        } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (waitFor(fd, POLLOUT, deadline) <= 0) {
                error = "send: timed out";
                return false;
            }
        } else {
            error = std::string{"send: "} + strerror(errno);
            return false;
        }
    }
    return true;
}

// Reads until the first CRLF (the status line) or until the peer closes.
std::optional<std::string> receiveStatusLine(int fd, Clock::time_point deadline, std::string& error) {
    std::string buffer;
    char temp[512];
    while (true) {
        if (auto pos = buffer.find("\r\n"); pos != std::string::npos)
            return buffer.substr(0, pos);
        // nobody sends a status line this long
        if (buffer.size() > 8192) {
            error = "status line too long";
            return std::nullopt;
        }

        int rc = waitFor(fd, POLLIN, deadline);
        if (rc == 0) {
            error = "no response: timed out";
            return std::nullopt;
        }
        if (rc < 0) {
            error = std::string{"poll: "} + strerror(errno);
            return std::nullopt;
        }

        ssize_t n = ::recv(fd, temp, sizeof(temp), 0);
        if (n > 0) {
            buffer.append(temp, static_cast<size_t>(n));
        } else if (n == 0) {
            if (buffer.empty()) {
                error = "connection closed without response";
                return std::nullopt;
            }
            return buffer;
        } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
            continue;
        } else {
            error = std::string{"recv: "} + strerror(errno);
            return std::nullopt;
        }
    }
}

} // namespace

HttpHealthProbe::HttpHealthProbe(BackendEndpoint endpoint)
    : endpoint(std::move(endpoint)) {
}

std::optional<int> HttpHealthProbe::parseStatusLine(const std::string& line) {
    // HTTP/1.1 200 OK
    if (line.rfind("HTTP/", 0) != 0)
        return std::nullopt;
    auto space = line.find(' ');
    if (space == std::string::npos || line.size() < space + 4)
        return std::nullopt;
    int code = 0;
    for (size_t i = space + 1; i < space + 4; ++i) {
        char c = line[i];
        if (c < '0' || c > '9')
            return std::nullopt;
        code = code * 10 + (c - '0');
    }
    if (line.size() > space + 4 && line[space + 4] != ' ')
        return std::nullopt;
    return code;
}

ProbeResult HttpHealthProbe::check() {
    auto unreachable = [this](std::string detail) {
        if (endpoint.reportTransportErrors)
            return ProbeResult::transportError(std::move(detail));
        return ProbeResult::notReady();
    };

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* addresses = nullptr;
    auto service = std::to_string(endpoint.port);
    if (int rc = ::getaddrinfo(endpoint.host.c_str(), service.c_str(), &hints, &addresses); rc != 0)
        return unreachable(std::string{"cannot resolve "} + endpoint.host + ": " + gai_strerror(rc));

    auto connectDeadline = Clock::now() + endpoint.timeout;
    Socket sock;
    std::string error;
    for (auto ai = addresses; ai != nullptr; ai = ai->ai_next) {
        sock = connectTo(ai, connectDeadline, error);
        if (sock.valid())
            break;
    }
    ::freeaddrinfo(addresses);
    if (!sock.valid())
        return unreachable(error.empty() ? "no usable address" : error);

    auto responseDeadline = Clock::now() + endpoint.timeout;
    std::string request = "GET " + endpoint.probePath() + " HTTP/1.1\r\n"
        "Host: " + endpoint.host + ":" + service + "\r\n"
        "User-Agent: sidecar-launcher\r\n"
        "Accept: */*\r\n"
        "Connection: close\r\n"
        "\r\n";
    if (!sendAll(sock.get(), request, responseDeadline, error))
        return unreachable(error);

    auto line = receiveStatusLine(sock.get(), responseDeadline, error);
    if (!line)
        return unreachable(error);

    auto code = parseStatusLine(*line);
    if (!code)
        return unreachable("malformed status line: " + line->substr(0, 80));

    if (*code >= 200 && *code < 300)
        return ProbeResult::ready(*code);
    return ProbeResult::notReady(*code);
}

}
