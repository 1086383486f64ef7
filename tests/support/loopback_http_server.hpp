#pragma once

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace plyfetch::test_support {

/**
 * Single-threaded HTTP/1.1 server on 127.0.0.1:<ephemeral>. One request per connection
 * ("Connection: close"); the request path is handed to `route`.
 */
class LoopbackHttpServer {
public:
    struct Response {
        int status{200};
        std::string body;
        std::string contentType{"application/octet-stream"};
    };
    using Route = std::function<Response(const std::string& path)>;

    explicit LoopbackHttpServer(Route route) : route_(std::move(route)) {
        fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd_ < 0)
            return;
        int one = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(fd_, 64) != 0) {
            ::close(fd_);
            fd_ = -1;
            return;
        }
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::jthread([this](std::stop_token st) { serve(st); });
    }

    ~LoopbackHttpServer() {
        if (thread_.joinable()) {
            thread_.request_stop();
            thread_.join();
        }
        if (fd_ >= 0)
            ::close(fd_);
    }

    LoopbackHttpServer(const LoopbackHttpServer&) = delete;
    LoopbackHttpServer& operator=(const LoopbackHttpServer&) = delete;

    bool ok() const { return fd_ >= 0; }
    std::uint16_t port() const { return port_; }
    std::string baseUrl() const { return "http://127.0.0.1:" + std::to_string(port_); }

    std::vector<std::string> paths() const {
        std::lock_guard<std::mutex> lk(mu_);
        return paths_;
    }

private:
    void serve(const std::stop_token& st) {
        while (!st.stop_requested()) {
            pollfd pfd{fd_, POLLIN, 0};
            const int ready = ::poll(&pfd, 1, 20);
            if (ready <= 0)
                continue;
            const int client = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (client < 0)
                continue;
            handle(client);
            ::close(client);
        }
    }

    void handle(int client) {
        std::string request;
        char buf[4096];
        while (request.find("\r\n\r\n") == std::string::npos && request.size() < 64 * 1024) {
            const auto n = ::recv(client, buf, sizeof(buf), 0);
            if (n < 0 && errno == EINTR)
                continue;
            if (n <= 0)
                return;
            request.append(buf, static_cast<std::size_t>(n));
        }

        // "GET /path HTTP/1.1"
        std::string path;
        const auto sp1 = request.find(' ');
        const auto sp2 = sp1 == std::string::npos ? sp1 : request.find(' ', sp1 + 1);
        if (sp2 != std::string::npos)
            path = request.substr(sp1 + 1, sp2 - sp1 - 1);
        {
            std::lock_guard<std::mutex> lk(mu_);
            paths_.push_back(path);
        }

        const Response r = route_ ? route_(path) : Response{404, "not found"};
        std::string out = "HTTP/1.1 " + std::to_string(r.status) + " " +
                          (r.status < 400 ? "OK" : "Error") + "\r\n";
        out += "Content-Type: " + r.contentType + "\r\n";
        out += "Content-Length: " + std::to_string(r.body.size()) + "\r\n";
        out += "Connection: close\r\n\r\n";
        out += r.body;

        std::size_t sent = 0;
        while (sent < out.size()) {
            const auto n = ::send(client, out.data() + sent, out.size() - sent, MSG_NOSIGNAL);
            if (n < 0 && errno == EINTR)
                continue;
            if (n <= 0)
                return;
            sent += static_cast<std::size_t>(n);
        }
    }

    Route route_;
    int fd_{-1};
    std::uint16_t port_{0};
    mutable std::mutex mu_;
    std::vector<std::string> paths_;
    std::jthread thread_;
};

} // namespace plyfetch::test_support
