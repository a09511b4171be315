#include "socket_utils.h"

#include "cpp_logger.h"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace capturehub {
namespace devices {
namespace utils {

namespace {

class ScopedFd {
public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

} // namespace

const char* to_string(ConnectOutcome outcome) {
    switch (outcome) {
        case ConnectOutcome::CONNECTED: return "connected";
        case ConnectOutcome::FAILED: return "failed";
        case ConnectOutcome::TIMED_OUT: return "timed out";
        case ConnectOutcome::CANCELLED: return "cancelled";
    }
    return "unknown";
}

bool is_valid_ipv4(const std::string& ip) {
    int octets = 0;
    size_t pos = 0;
    while (pos <= ip.size()) {
        size_t dot = ip.find('.', pos);
        if (dot == std::string::npos) {
            dot = ip.size();
        }
        const std::string part = ip.substr(pos, dot - pos);
        if (part.empty() || part.size() > 3 ||
            !std::all_of(part.begin(), part.end(), [](unsigned char c) { return c >= '0' && c <= '9'; })) {
            return false;
        }
        // Leading zeros are rejected, as inet_pton does.
        if ((part.size() > 1 && part[0] == '0') || std::stoi(part) > 255) {
            return false;
        }
        ++octets;
        pos = dot + 1;
        if (dot == ip.size()) {
            break;
        }
    }
    return octets == 4;
}

ConnectOutcome tcp_connect_probe(const std::string& ip, uint16_t port,
                                 std::chrono::milliseconds timeout,
                                 const StopSignal& stop,
                                 std::string* error_detail) {
    auto fail = [error_detail](const std::string& reason) {
        if (error_detail) {
            *error_detail = reason;
        }
        return ConnectOutcome::FAILED;
    };

    sockaddr_in addr {};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        return fail("invalid address");
    }

    ScopedFd fd(::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if (fd.get() < 0) {
        return fail(std::string("socket: ") + std::strerror(errno));
    }

    if (::connect(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
        return ConnectOutcome::CONNECTED;
    }
    if (errno != EINPROGRESS) {
        return fail(std::strerror(errno));
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (stop.stop_requested()) {
            return ConnectOutcome::CANCELLED;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            if (error_detail) {
                *error_detail = "connect timed out";
            }
            return ConnectOutcome::TIMED_OUT;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const int slice = static_cast<int>(std::min(remaining, kPollSlice).count());

        pollfd pfd {};
        pfd.fd = fd.get();
        pfd.events = POLLOUT;
        const int rc = ::poll(&pfd, 1, std::max(slice, 1));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return fail(std::string("poll: ") + std::strerror(errno));
        }
        if (rc == 0) {
            continue;
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (::getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
            return fail(std::string("getsockopt: ") + std::strerror(errno));
        }
        if (so_error != 0) {
            return fail(std::strerror(so_error));
        }
        return ConnectOutcome::CONNECTED;
    }
}

std::vector<UdpDatagram> multicast_query(const std::string& group, uint16_t port,
                                         const std::string& request,
                                         std::chrono::milliseconds timeout,
                                         const StopSignal& stop,
                                         const std::string& log_prefix,
                                         int ttl) {
    std::vector<UdpDatagram> replies;

    ScopedFd fd(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
    if (fd.get() < 0) {
        LOG_CPP_WARNING("%s Failed to create UDP socket: %s", log_prefix.c_str(), std::strerror(errno));
        return replies;
    }

    unsigned char mcast_ttl = static_cast<unsigned char>(std::max(1, std::min(ttl, 255)));
    if (::setsockopt(fd.get(), IPPROTO_IP, IP_MULTICAST_TTL, &mcast_ttl, sizeof(mcast_ttl)) < 0) {
        LOG_CPP_WARNING("%s Failed to set IP_MULTICAST_TTL: %s", log_prefix.c_str(), std::strerror(errno));
    }

    sockaddr_in bind_addr {};
    bind_addr.sin_family = AF_INET;
    bind_addr.sin_addr.s_addr = htonl(INADDR_ANY);
    bind_addr.sin_port = 0;
    if (::bind(fd.get(), reinterpret_cast<sockaddr*>(&bind_addr), sizeof(bind_addr)) < 0) {
        LOG_CPP_WARNING("%s Failed to bind UDP socket: %s", log_prefix.c_str(), std::strerror(errno));
        return replies;
    }

    sockaddr_in dest {};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(port);
    if (inet_pton(AF_INET, group.c_str(), &dest.sin_addr) != 1) {
        LOG_CPP_WARNING("%s Invalid multicast group %s", log_prefix.c_str(), group.c_str());
        return replies;
    }

    const ssize_t sent = ::sendto(fd.get(), request.data(), request.size(), 0,
                                  reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        LOG_CPP_WARNING("%s sendto %s:%u failed: %s", log_prefix.c_str(), group.c_str(),
                        static_cast<unsigned>(port), std::strerror(errno));
        return replies;
    }
    LOG_CPP_DEBUG("%s Query sent to %s:%u (%zd bytes)", log_prefix.c_str(), group.c_str(),
                  static_cast<unsigned>(port), sent);

    char buffer[9000];
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!stop.stop_requested()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const int slice = static_cast<int>(std::min(remaining, kPollSlice).count());

        pollfd pfd {};
        pfd.fd = fd.get();
        pfd.events = POLLIN;
        const int rc = ::poll(&pfd, 1, std::max(slice, 1));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_CPP_WARNING("%s poll() error: %s", log_prefix.c_str(), std::strerror(errno));
            break;
        }
        if (rc == 0 || !(pfd.revents & POLLIN)) {
            continue;
        }

        sockaddr_in sender {};
        socklen_t len = sizeof(sender);
        const ssize_t received = ::recvfrom(fd.get(), buffer, sizeof(buffer), 0,
                                            reinterpret_cast<sockaddr*>(&sender), &len);
        if (received <= 0) {
            continue;
        }
        char sender_ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &sender.sin_addr, sender_ip, sizeof(sender_ip));

        UdpDatagram datagram;
        datagram.sender_ip = sender_ip;
        datagram.data.assign(buffer, static_cast<size_t>(received));
        replies.push_back(std::move(datagram));
    }

    LOG_CPP_DEBUG("%s Collected %zu replies", log_prefix.c_str(), replies.size());
    return replies;
}

} // namespace utils
} // namespace devices
} // namespace capturehub
