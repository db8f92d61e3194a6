#include "ConnectPortProbe.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include <algorithm>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace lanprobe {

namespace {
struct Fd {
    int fd;
    explicit Fd(int f) : fd(f) {}
    Fd(Fd&& o) noexcept : fd(o.fd) { o.fd = -1; }
    ~Fd(){ if(fd >= 0) ::close(fd); }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    Fd& operator=(Fd&&) = delete;
};

enum class ProbeOutcome { Open, Closed, Unreachable };

ProbeOutcome classify(int err){
    if(err == 0) return ProbeOutcome::Open;
    if(err == ENETUNREACH || err == EHOSTUNREACH) return ProbeOutcome::Unreachable;
    return ProbeOutcome::Closed;
}

// Connections in flight per poll round.
constexpr int kBatchSize = 128;

struct Tally {
    std::vector<uint16_t> open;
    size_t answered = 0;  // ports that gave a definite open / refused answer
    int unreachable = 0;  // last asynchronous EHOSTUNREACH / ENETUNREACH
};

void record(Tally& t, uint16_t port, int err, const std::string& host){
    switch(classify(err)){
        case ProbeOutcome::Open:
            Logger::instance().debug(host + ":" + std::to_string(port) + " open");
            t.open.push_back(port);
            ++t.answered;
            break;
        case ProbeOutcome::Closed:
            ++t.answered;
            break;
        case ProbeOutcome::Unreachable:
            t.unreachable = err;
            break;
    }
}
}

std::vector<uint16_t> ConnectPortProbe::open_ports(const std::string& host, const PortRange& range){
    addrinfo hints{}; hints.ai_family = AF_INET; hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if(gai != 0 || !res) throw ScanFailure("Unable to resolve host \"" + host + "\"");
    sockaddr_in target = *reinterpret_cast<sockaddr_in*>(res->ai_addr);
    freeaddrinfo(res);

    Tally tally;
    for(int base = range.first; base <= range.last; base += kBatchSize){
        int end = std::min(range.last, base + kBatchSize - 1);
        std::vector<Fd> socks; std::vector<pollfd> pfds; std::vector<uint16_t> ports;
        socks.reserve(kBatchSize); pfds.reserve(kBatchSize); ports.reserve(kBatchSize);

        for(int port = base; port <= end; ++port){
            Fd sock(::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
            if(sock.fd < 0) throw ScanFailure("Unable to connect to host \"" + host + "\": " + std::strerror(errno));
            target.sin_port = htons(static_cast<uint16_t>(port));
            if(::connect(sock.fd, reinterpret_cast<sockaddr*>(&target), sizeof(target)) == 0){
                record(tally, static_cast<uint16_t>(port), 0, host);
                continue;
            }
            int err = errno;
            if(err != EINPROGRESS){
                // Synchronous routing failure: nothing on this host is reachable.
                if(classify(err) == ProbeOutcome::Unreachable)
                    throw ScanFailure("Unable to connect to host \"" + host + "\": " + std::strerror(err));
                record(tally, static_cast<uint16_t>(port), err, host);
                continue;
            }
            pfds.push_back({sock.fd, POLLOUT, 0});
            ports.push_back(static_cast<uint16_t>(port));
            socks.push_back(std::move(sock));
        }

        size_t pending = pfds.size();
        auto deadline = std::chrono::steady_clock::now() + timeout_;
        while(pending > 0){
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
            if(left <= 0) break;
            int rc = poll(pfds.data(), pfds.size(), static_cast<int>(left));
            if(rc < 0){
                if(errno == EINTR) continue;
                throw ScanFailure("Unable to connect to host \"" + host + "\": poll failed: " + std::strerror(errno));
            }
            if(rc == 0) break;
            for(size_t i = 0; i < pfds.size(); ++i){
                if(pfds[i].fd < 0 || pfds[i].revents == 0) continue;
                int err = 0; socklen_t len = sizeof(err);
                if(getsockopt(pfds[i].fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0) err = errno;
                pfds[i].fd = -1; // poll skips negative descriptors
                --pending;
                record(tally, ports[i], err, host);
            }
        }
        if(pending > 0) Logger::instance().trace(host + ": " + std::to_string(pending) + " ports without answer in " + std::to_string(base) + "-" + std::to_string(end));
    }

    // Open ports and refusals both prove the host is there; silence or ICMP errors alone do not.
    if(tally.answered == 0){
        std::string why = tally.unreachable ? std::strerror(tally.unreachable) : "no response within " + std::to_string(timeout_.count()) + " ms";
        throw ScanFailure("Unable to connect to host \"" + host + "\": " + why);
    }
    std::sort(tally.open.begin(), tally.open.end());
    return tally.open;
}

}
