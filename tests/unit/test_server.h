#pragma once
// Loopback HTTP server for the end-to-end tests. Serves one connection at a
// time on 127.0.0.1 and closes each connection after answering it.

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace minhttp::testing {

struct ReceivedRequest {
    std::string method;
    std::string target;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string raw;
};

using Handler = std::function<std::string(const ReceivedRequest&)>;

// "HTTP/1.1 <code> <reason>" with Content-Length and Connection: close.
inline std::string make_response(int code, const std::string& reason,
                                 const std::string& body,
                                 const std::vector<std::pair<std::string, std::string>>& extra = {}) {
    std::string out = "HTTP/1.1 " + std::to_string(code) + " " + reason + "\r\n";
    for (const auto& [name, value] : extra) {
        out += name + ": " + value + "\r\n";
    }
    out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    out += "Connection: close\r\n\r\n";
    out += body;
    return out;
}

class TestServer {
public:
    explicit TestServer(Handler handler) : handler_(std::move(handler)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int yes = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(listen_fd_, 16);

        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { run(); });
    }

    ~TestServer() {
        stopping_ = true;
        ::shutdown(listen_fd_, SHUT_RDWR);
        ::close(listen_fd_);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    TestServer(const TestServer&) = delete;
    TestServer& operator=(const TestServer&) = delete;

    uint16_t port() const { return port_; }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    std::vector<ReceivedRequest> requests() const {
        std::lock_guard<std::mutex> lock(mu_);
        return requests_;
    }

private:
    void run() {
        while (!stopping_) {
            int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) {
                if (errno == EINTR) continue;
                return;
            }
            serve(fd);
            ::close(fd);
        }
    }

    static bool read_request(int fd, ReceivedRequest& req) {
        std::string buffer;
        char chunk[4096];
        size_t header_end = std::string::npos;
        while (header_end == std::string::npos) {
            ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
            if (n <= 0) return false;
            buffer.append(chunk, static_cast<size_t>(n));
            header_end = buffer.find("\r\n\r\n");
        }

        const std::string head = buffer.substr(0, header_end);
        size_t line_end = head.find("\r\n");
        const std::string request_line = head.substr(0, line_end);
        const size_t sp1 = request_line.find(' ');
        const size_t sp2 = request_line.rfind(' ');
        req.method = request_line.substr(0, sp1);
        req.target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);

        size_t pos = (line_end == std::string::npos) ? head.size() : line_end + 2;
        while (pos < head.size()) {
            size_t next = head.find("\r\n", pos);
            if (next == std::string::npos) next = head.size();
            const std::string line = head.substr(pos, next - pos);
            const size_t colon = line.find(':');
            if (colon != std::string::npos) {
                size_t vstart = colon + 1;
                while (vstart < line.size() && line[vstart] == ' ') ++vstart;
                req.headers[line.substr(0, colon)] = line.substr(vstart);
            }
            pos = next + 2;
        }

        size_t content_length = 0;
        auto it = req.headers.find("Content-Length");
        if (it != req.headers.end()) {
            content_length = std::stoul(it->second);
        }

        std::string body = buffer.substr(header_end + 4);
        while (body.size() < content_length) {
            ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
            if (n <= 0) return false;
            body.append(chunk, static_cast<size_t>(n));
        }
        req.body = body.substr(0, content_length);
        req.raw = buffer.substr(0, header_end + 4) + req.body;
        return true;
    }

    void serve(int fd) {
        ReceivedRequest req;
        if (!read_request(fd, req)) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mu_);
            requests_.push_back(req);
        }

        const std::string reply = handler_(req);
        size_t sent = 0;
        while (sent < reply.size()) {
            ssize_t n = ::send(fd, reply.data() + sent, reply.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) return;
            sent += static_cast<size_t>(n);
        }
        ::shutdown(fd, SHUT_WR);
    }

    Handler handler_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> stopping_{false};
    std::thread thread_;
    mutable std::mutex mu_;
    std::vector<ReceivedRequest> requests_;
};

} // namespace minhttp::testing
