#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace crelay {
namespace test {

/**
 * @brief 只服务一个连接的本地HTTP服务器，按脚本写回原始字节
 *
 * 用于在真实传输上测试上游客户端：读完一个请求后依次写出每个片段，
 * 片段之间暂停pauseMs，最后再保持holdMs后关闭连接。
 */
class CannedHttpServer {
public:
    struct Script {
        std::vector<std::string> pieces;
        int pauseMs = 20;
        int holdMs = 0;
    };

    explicit CannedHttpServer(Script script) : script_(std::move(script)), listenFd_(-1), port_(0), stop_(false) {
        listenFd_ = socket(AF_INET, SOCK_STREAM, 0);
        if (listenFd_ < 0) {
            return;
        }
        int opt = 1;
        setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        struct sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        socklen_t len = sizeof(addr);
        if (bind(listenFd_, (struct sockaddr*)&addr, sizeof(addr)) < 0 ||
            listen(listenFd_, 4) < 0 ||
            getsockname(listenFd_, (struct sockaddr*)&addr, &len) < 0) {
            close(listenFd_);
            listenFd_ = -1;
            return;
        }
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread(&CannedHttpServer::serve, this);
    }

    ~CannedHttpServer() {
        stop_.store(true);
        if (thread_.joinable()) {
            thread_.join();
        }
        if (listenFd_ >= 0) {
            close(listenFd_);
        }
    }

    bool listening() const { return port_ != 0; }

    std::string url() const {
        return "http://127.0.0.1:" + std::to_string(port_);
    }

    /**
     * @brief 收到的请求（头部和请求体）
     */
    std::string request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return request_;
    }

    static std::string statusHead(int status, const std::string& reason, const std::string& contentType,
                                  long contentLength = -1) {
        std::string head = "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n";
        head += "Content-Type: " + contentType + "\r\n";
        if (contentLength >= 0) {
            head += "Content-Length: " + std::to_string(contentLength) + "\r\n";
        }
        head += "Connection: close\r\n\r\n";
        return head;
    }

    static std::string jsonResponse(int status, const std::string& reason, const std::string& body) {
        return statusHead(status, reason, "application/json", static_cast<long>(body.size())) + body;
    }

    /**
     * @brief 无Content-Length的事件流响应头，响应体以关闭连接结束
     */
    static std::string eventStreamHead() {
        return statusHead(200, "OK", "application/vnd.amazon.eventstream");
    }

private:
    bool waitReadable(int fd) {
        while (!stop_.load()) {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLIN;
            pfd.revents = 0;
            int rc = poll(&pfd, 1, 100);
            if (rc > 0) {
                return true;
            }
        }
        return false;
    }

    void serve() {
        if (!waitReadable(listenFd_)) {
            return;
        }
        int fd = accept(listenFd_, nullptr, nullptr);
        if (fd < 0) {
            return;
        }

        readRequest(fd);

        for (size_t i = 0; i < script_.pieces.size() && !stop_.load(); ++i) {
            if (i > 0 && script_.pauseMs > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(script_.pauseMs));
            }
            const std::string& piece = script_.pieces[i];
            if (send(fd, piece.data(), piece.size(), MSG_NOSIGNAL) < 0) {
                break;
            }
        }

        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(script_.holdMs);
        while (!stop_.load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        close(fd);
    }

    void readRequest(int fd) {
        std::string data;
        char buf[4096];
        size_t expected = std::string::npos;
        while (waitReadable(fd)) {
            ssize_t n = recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) {
                break;
            }
            data.append(buf, static_cast<size_t>(n));

            size_t headerEnd = data.find("\r\n\r\n");
            if (headerEnd != std::string::npos && expected == std::string::npos) {
                size_t length = 0;
                std::string lower = data.substr(0, headerEnd);
                for (char& c : lower) {
                    c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
                }
                size_t pos = lower.find("content-length:");
                if (pos != std::string::npos) {
                    length = static_cast<size_t>(std::strtoul(lower.c_str() + pos + 15, nullptr, 10));
                }
                expected = headerEnd + 4 + length;
            }
            if (expected != std::string::npos && data.size() >= expected) {
                break;
            }
        }
        std::lock_guard<std::mutex> lock(mutex_);
        request_ = data;
    }

    Script script_;
    int listenFd_;
    int port_;
    std::atomic<bool> stop_;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::string request_;
};

} // namespace test
} // namespace crelay
