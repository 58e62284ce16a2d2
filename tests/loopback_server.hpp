#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// Minimal HTTP/1.1 server on 127.0.0.1 for exercising the curl paths.
// One request per connection; replies are looked up by path (404 otherwise).
class LoopbackHttpServer {
public:
    struct Reply {
        int status = 200;
        std::string body;
    };

    struct Request {
        std::string method;
        std::string path;
        std::string head;   // request line plus headers
        std::string body;

        bool has_header(const std::string& line) const {
            return lower(head).find(lower(line)) != std::string::npos;
        }
    };

    LoopbackHttpServer() {
        // Transfers to the loopback address must never go through a proxy
        setenv("NO_PROXY", "127.0.0.1,localhost", 1);
        setenv("no_proxy", "127.0.0.1,localhost", 1);

        listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) throw std::runtime_error("socket() failed");
        int reuse = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        struct sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0 ||
            listen(listen_fd_, 8) < 0) {
            close(listen_fd_);
            throw std::runtime_error("cannot listen on 127.0.0.1");
        }
        socklen_t len = sizeof(addr);
        getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this]() { serve(); });
    }

    ~LoopbackHttpServer() {
        stop_.store(true);
        if (thread_.joinable()) thread_.join();
        close(listen_fd_);
    }

    LoopbackHttpServer(const LoopbackHttpServer&) = delete;
    LoopbackHttpServer& operator=(const LoopbackHttpServer&) = delete;

    std::string base_url() const { return "http://127.0.0.1:" + std::to_string(port_); }
    std::string url(const std::string& path) const { return base_url() + path; }

    void route(const std::string& path, int status, const std::string& body = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        replies_[path] = Reply{status, body};
    }

    std::vector<Request> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    int listen_fd_ = -1;
    int port_ = 0;
    std::atomic<bool> stop_{false};
    std::thread thread_;
    mutable std::mutex mutex_;
    std::map<std::string, Reply> replies_;
    std::vector<Request> requests_;

    static std::string lower(std::string s) {
        for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return s;
    }

    static std::string reason(int status) {
        switch (status) {
            case 200: return "OK";
            case 201: return "Created";
            case 204: return "No Content";
            case 403: return "Forbidden";
            case 404: return "Not Found";
            case 500: return "Internal Server Error";
            default:  return "Status";
        }
    }

    static void send_all(int fd, const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) return;
            sent += static_cast<size_t>(n);
        }
    }

    // Appends to buf; false on EOF, error or receive timeout.
    static bool recv_more(int fd, std::string& buf) {
        char chunk[8192];
        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n <= 0) return false;
        buf.append(chunk, static_cast<size_t>(n));
        return true;
    }

    static size_t header_value(const std::string& lower_head, const std::string& name) {
        auto pos = lower_head.find("\r\n" + name + ":");
        if (pos == std::string::npos) return 0;
        pos += name.size() + 3;
        return static_cast<size_t>(std::strtoull(lower_head.c_str() + pos, nullptr, 10));
    }

    // Decodes a complete chunked body; false until the terminating chunk arrived.
    static bool dechunk(const std::string& raw, std::string& out) {
        out.clear();
        size_t pos = 0;
        while (true) {
            auto eol = raw.find("\r\n", pos);
            if (eol == std::string::npos) return false;
            size_t size = std::strtoul(raw.substr(pos, eol - pos).c_str(), nullptr, 16);
            pos = eol + 2;
            if (size == 0) return raw.find("\r\n", pos) != std::string::npos;
            if (raw.size() < pos + size + 2) return false;
            out.append(raw, pos, size);
            pos += size + 2;
        }
    }

    void serve() {
        while (!stop_.load()) {
            struct pollfd pfd = {listen_fd_, POLLIN, 0};
            int pr = poll(&pfd, 1, 100);
            if (pr <= 0) continue;

            int client = accept(listen_fd_, nullptr, nullptr);
            if (client < 0) continue;
            handle(client);
            close(client);
        }
    }

    void handle(int fd) {
        struct timeval tv{2, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        std::string buf;
        size_t head_end;
        while ((head_end = buf.find("\r\n\r\n")) == std::string::npos) {
            if (!recv_more(fd, buf)) return;
        }

        Request req;
        req.head = buf.substr(0, head_end + 2);
        std::string raw = buf.substr(head_end + 4);
        std::string lower_head = lower(req.head);

        auto sp1 = req.head.find(' ');
        auto sp2 = req.head.find(' ', sp1 + 1);
        req.method = req.head.substr(0, sp1);
        req.path = req.head.substr(sp1 + 1, sp2 - sp1 - 1);

        bool chunked = lower_head.find("transfer-encoding: chunked") != std::string::npos;
        size_t length = header_value(lower_head, "content-length");
        if (lower_head.find("expect: 100-continue") != std::string::npos &&
            (chunked || raw.size() < length)) {
            send_all(fd, "HTTP/1.1 100 Continue\r\n\r\n");
        }

        if (chunked) {
            while (!dechunk(raw, req.body)) {
                if (!recv_more(fd, raw)) break;
            }
        } else {
            while (raw.size() < length) {
                if (!recv_more(fd, raw)) break;
            }
            req.body = raw.substr(0, length);
        }

        Reply reply{404, ""};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = replies_.find(req.path);
            if (it != replies_.end()) reply = it->second;
            requests_.push_back(req);
        }

        std::string out = "HTTP/1.1 " + std::to_string(reply.status) + " " + reason(reply.status) +
                          "\r\nContent-Length: " + std::to_string(reply.body.size()) +
                          "\r\nConnection: close\r\n\r\n" + reply.body;
        send_all(fd, out);
    }
};
