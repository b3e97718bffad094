#include "crelay/http/http_server.h"
#include "crelay/http/response_builder.h"
#include "crelay/common/config.h"
#include "crelay/common/logger.h"
#include "crelay/common/utils.h"
#include <sys/socket.h>
#include <sys/epoll.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <cstring>
#include <cstdio>
#include <cstdlib>
#include <algorithm>
#include <chrono>
#include <errno.h>

namespace crelay {

HttpServer* HttpServer::instance_ = nullptr;
std::mutex HttpServer::instance_mutex_;

namespace {

// 阻塞发送全部数据；对端断开或发送超时返回false
bool sendAll(int fd, const std::string& data) {
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t sent = send(fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        offset += static_cast<size_t>(sent);
    }
    return true;
}

} // namespace

bool HttpServer::parseRequestHead(const std::string& head, HttpRequest& request) {
    size_t pos = 0;
    bool firstLine = true;
    
    while (pos < head.length()) {
        size_t lineEnd = head.find("\r\n", pos);
        if (lineEnd == std::string::npos) {
            lineEnd = head.length();
        }
        if (lineEnd == pos) {
            break;
        }
        
        std::string line = head.substr(pos, lineEnd - pos);
        pos = lineEnd + 2;
        
        if (firstLine) {
            size_t firstSpace = line.find(' ');
            if (firstSpace == std::string::npos) {
                return false;
            }
            size_t secondSpace = line.find(' ', firstSpace + 1);
            if (secondSpace == std::string::npos || secondSpace == firstSpace + 1) {
                return false;
            }
            request.setMethod(line.substr(0, firstSpace));
            request.setPath(line.substr(firstSpace + 1, secondSpace - firstSpace - 1));
            firstLine = false;
            continue;
        }
        
        size_t colonPos = line.find(':');
        if (colonPos == std::string::npos) {
            continue;
        }
        request.setHeader(line.substr(0, colonPos), trimString(line.substr(colonPos + 1)));
    }
    
    return !firstLine;
}

std::string HttpServer::buildResponseHead(const HttpResponse& response, bool chunked, bool keepAlive) {
    std::string result;
    result.reserve(256);
    
    result += "HTTP/1.1 ";
    result += std::to_string(response.getStatusCode());
    result += " ";
    result += HttpResponse::reasonPhrase(response.getStatusCode());
    result += "\r\n";
    
    for (const auto& header : response.getAllHeaders()) {
        result += header.first;
        result += ": ";
        result += header.second;
        result += "\r\n";
    }
    
    if (chunked) {
        result += "Transfer-Encoding: chunked\r\n";
    } else {
        result += "Content-Length: ";
        result += std::to_string(response.getBody().length());
        result += "\r\n";
    }
    
    result += keepAlive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
    result += "\r\n";
    return result;
}

std::string HttpServer::buildHttpResponse(const HttpResponse& response, bool keepAlive) {
    std::string result = buildResponseHead(response, false, keepAlive);
    result += response.getBody();
    return result;
}

std::string HttpServer::encodeChunk(const std::string& data) {
    char sizeLine[32];
    std::snprintf(sizeLine, sizeof(sizeLine), "%zx\r\n", data.size());
    
    std::string result(sizeLine);
    result.reserve(result.size() + data.size() + 2);
    result += data;
    result += "\r\n";
    return result;
}

void HttpServer::init(const std::string& host, int port, HttpHandler* handler) {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    
    if (instance_ != nullptr) {
        CRELAY_ERROR("HttpServer already initialized");
        return;
    }
    
    instance_ = new HttpServer();
    instance_->host_ = host;
    instance_->port_ = port;
    instance_->handler_ = handler;
    instance_->serverFd_ = -1;
    instance_->running_.store(false);
    
    unsigned int threads = static_cast<unsigned int>(std::max(0, Config::instance().serverNumThreads()));
    const unsigned int minThreads = static_cast<unsigned int>(std::max(0, Config::instance().serverMinThreads()));
    const unsigned int hw = std::max(1u, std::thread::hardware_concurrency());
    if (threads == 0) {
        threads = hw;
    }
    threads = std::max(threads, minThreads);
    threads = std::max(threads, 2u);
    instance_->numThreads_ = threads;
    
    CRELAY_INFO("HttpServer initialized: %s:%d, threads=%u", host.c_str(), port, threads);
}

bool HttpServer::start() {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    
    if (instance_ == nullptr) {
        CRELAY_ERROR("HttpServer not initialized");
        return false;
    }
    
    if (instance_->running_.load()) {
        CRELAY_WARN("HttpServer already running");
        return true;
    }
    
    instance_->running_.store(true);
    if (!instance_->run()) {
        instance_->running_.store(false);
        return false;
    }
    return true;
}

void HttpServer::stop() {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    
    if (instance_ == nullptr || !instance_->running_.load()) {
        return;
    }
    
    instance_->running_.store(false);
    
    if (instance_->serverFd_ >= 0) {
        close(instance_->serverFd_);
        instance_->serverFd_ = -1;
    }
    
    // 先shutdown所有连接并唤醒等待上游的流，让worker尽快返回
    {
        std::lock_guard<std::mutex> connLock(instance_->connectionsMutex_);
        for (auto& pair : instance_->connections_) {
            shutdown(pair.first, SHUT_RDWR);
        }
        for (auto& pair : instance_->activeStreams_) {
            pair.second->interruptStream();
        }
    }
    
    for (auto& thread : instance_->workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    instance_->workerThreads_.clear();
    
    for (int epfd : instance_->epollFds_) {
        if (epfd >= 0) {
            close(epfd);
        }
    }
    instance_->epollFds_.clear();
    
    {
        std::lock_guard<std::mutex> connLock(instance_->connectionsMutex_);
        for (auto& pair : instance_->connections_) {
            close(pair.first);
        }
        instance_->connections_.clear();
    }
    
    CRELAY_INFO("HttpServer stopped");
}

bool HttpServer::isRunning() {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    return instance_ != nullptr && instance_->running_.load();
}

bool HttpServer::run() {
    serverFd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (serverFd_ < 0) {
        CRELAY_ERROR("Failed to create socket: %s", strerror(errno));
        return false;
    }
    
    int opt = 1;
    setsockopt(serverFd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    
    int flags = fcntl(serverFd_, F_GETFL, 0);
    fcntl(serverFd_, F_SETFL, flags | O_NONBLOCK);
    
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port_));
    
    if (host_ == "0.0.0.0" || host_.empty()) {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
        CRELAY_ERROR("Invalid listen address: %s", host_.c_str());
        close(serverFd_);
        serverFd_ = -1;
        return false;
    }
    
    if (bind(serverFd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        CRELAY_ERROR("Failed to bind %s:%d: %s", host_.c_str(), port_, strerror(errno));
        close(serverFd_);
        serverFd_ = -1;
        return false;
    }
    
    if (listen(serverFd_, 512) < 0) {
        CRELAY_ERROR("Failed to listen: %s", strerror(errno));
        close(serverFd_);
        serverFd_ = -1;
        return false;
    }
    
    CRELAY_INFO("HttpServer listening on %s:%d", host_.c_str(), port_);
    
    if (!setupEventLoop()) {
        close(serverFd_);
        serverFd_ = -1;
        return false;
    }
    
    for (unsigned int i = 0; i < numThreads_; ++i) {
        workerThreads_.emplace_back(&HttpServer::eventLoop, this, i);
    }
    
    CRELAY_INFO("HttpServer started with %u epoll worker threads", numThreads_);
    return true;
}

void HttpServer::eventLoop(int workerId) {
    int epfd = epollFds_[workerId];
    CRELAY_DEBUG("Event loop %d started (epfd=%d)", workerId, epfd);
    
    const int MAX_EVENTS = 64;
    struct epoll_event events[MAX_EVENTS];
    
    while (running_.load()) {
        int nfds = epoll_wait(epfd, events, MAX_EVENTS, 100);  // 100ms超时
        if (nfds < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (running_.load()) {
                CRELAY_ERROR("epoll_wait failed: %s", strerror(errno));
            }
            break;
        }
        
        for (int i = 0; i < nfds; ++i) {
            int fd = events[i].data.fd;
            uint32_t ev = events[i].events;
            
            if (fd == serverFd_) {
                acceptConnections();
                continue;
            }
            if (ev & (EPOLLIN | EPOLLERR | EPOLLHUP)) {
                handleReadEvent(fd);
            }
            if (ev & EPOLLOUT) {
                handleWriteEvent(fd);
            }
        }
    }
    
    CRELAY_DEBUG("Event loop %d stopped", workerId);
}

void HttpServer::acceptConnections() {
    while (running_.load()) {
        struct sockaddr_in clientAddr;
        socklen_t clientLen = sizeof(clientAddr);
        int clientFd = accept(serverFd_, (struct sockaddr*)&clientAddr, &clientLen);
        if (clientFd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && running_.load()) {
                CRELAY_ERROR("Accept failed: %s", strerror(errno));
            }
            return;
        }
        
        {
            std::lock_guard<std::mutex> lock(connectionsMutex_);
            if (connections_.size() >= MAX_CONNECTIONS) {
                CRELAY_WARN("Max connections (%zu) reached, rejecting new connection", MAX_CONNECTIONS);
                close(clientFd);
                continue;
            }
            connections_[clientFd] = ConnectionState();
        }
        
        int flags = fcntl(clientFd, F_GETFL, 0);
        if (fcntl(clientFd, F_SETFL, flags | O_NONBLOCK) < 0) {
            CRELAY_ERROR("Failed to set non-blocking: %s", strerror(errno));
            closeConnection(clientFd);
            continue;
        }
        
        int opt = 1;
        setsockopt(clientFd, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
        
        addEvent(clientFd, EPOLLIN);
    }
}

bool HttpServer::setupEventLoop() {
    epollFds_.clear();
    
    for (unsigned int i = 0; i < numThreads_; ++i) {
        int epfd = epoll_create1(EPOLL_CLOEXEC);
        if (epfd < 0) {
            CRELAY_ERROR("Failed to create epoll instance: %s", strerror(errno));
            return false;
        }
        
        // 监听socket只加入第一个epoll实例
        if (i == 0) {
            struct epoll_event ev;
            ev.events = EPOLLIN | EPOLLET;
            ev.data.fd = serverFd_;
            if (epoll_ctl(epfd, EPOLL_CTL_ADD, serverFd_, &ev) < 0) {
                CRELAY_ERROR("Failed to add server socket to epoll: %s", strerror(errno));
                close(epfd);
                return false;
            }
        }
        epollFds_.push_back(epfd);
    }
    
    CRELAY_DEBUG("Event loop setup complete: %zu instances", epollFds_.size());
    return true;
}

void HttpServer::addEvent(int fd, uint32_t events) {
    // 轮询分配给worker
    size_t workerId = nextWorker_.fetch_add(1) % epollFds_.size();
    
    struct epoll_event ev;
    ev.events = events | EPOLLET;
    ev.data.fd = fd;
    if (epoll_ctl(epollFds_[workerId], EPOLL_CTL_ADD, fd, &ev) < 0) {
        CRELAY_ERROR("Failed to add fd %d to epoll: %s", fd, strerror(errno));
    }
}

void HttpServer::modEvent(int fd, uint32_t events) {
    for (int epfd : epollFds_) {
        struct epoll_event ev;
        ev.events = events | EPOLLET;
        ev.data.fd = fd;
        if (epoll_ctl(epfd, EPOLL_CTL_MOD, fd, &ev) == 0) {
            return;
        }
    }
}

void HttpServer::delEvent(int fd) {
    for (int epfd : epollFds_) {
        epoll_ctl(epfd, EPOLL_CTL_DEL, fd, nullptr);
    }
}

void HttpServer::closeConnection(int clientFd) {
    delEvent(clientFd);
    std::lock_guard<std::mutex> lock(connectionsMutex_);
    if (connections_.erase(clientFd) > 0) {
        close(clientFd);
    }
}

void HttpServer::handleReadEvent(int clientFd) {
    ConnectionState* conn = nullptr;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        auto it = connections_.find(clientFd);
        if (it == connections_.end()) {
            return;
        }
        conn = &it->second;
    }
    ConnectionState& connection = *conn;
    
    // 边缘触发：读到EAGAIN为止
    char buf[4096];
    while (true) {
        ssize_t n = recv(clientFd, buf, sizeof(buf), 0);
        if (n > 0) {
            connection.readBuffer.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            CRELAY_DEBUG("Connection %d closed by peer", clientFd);
            closeConnection(clientFd);
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            break;
        }
        CRELAY_WARN("Read error on connection %d: %s", clientFd, strerror(errno));
        closeConnection(clientFd);
        return;
    }
    
    processBufferedRequest(clientFd, connection);
}

void HttpServer::processBufferedRequest(int clientFd, ConnectionState& connection) {
    HttpResponse response;
    bool haveResponse = false;
    
    if (connection.state == ConnectionState::READING_HEADER) {
        size_t headerEnd = connection.readBuffer.find("\r\n\r\n");
        if (headerEnd == std::string::npos) {
            if (connection.readBuffer.size() > MAX_HEADER_SIZE) {
                CRELAY_WARN("Request header too large on connection %d", clientFd);
                response = ResponseBuilder::badRequest("Request header too large");
                connection.keepAlive = false;
                connection.state = ConnectionState::WRITING;
                haveResponse = true;
            } else {
                return;
            }
        } else {
            std::string headerPart = connection.readBuffer.substr(0, headerEnd);
            connection.readBuffer.erase(0, headerEnd + 4);
            
            if (!parseRequestHead(headerPart, connection.request)) {
                response = ResponseBuilder::badRequest("Malformed request line");
                connection.keepAlive = false;
                connection.state = ConnectionState::WRITING;
                haveResponse = true;
            } else {
                connection.keepAlive = toLowerCopy(connection.request.getHeader("connection")) != "close";
                connection.state = ConnectionState::WRITING;
                
                std::string contentLengthStr = connection.request.getHeader("content-length");
                if (!contentLengthStr.empty()) {
                    char* end = nullptr;
                    unsigned long long length = std::strtoull(contentLengthStr.c_str(), &end, 10);
                    if (end == contentLengthStr.c_str() || *end != '\0' || length > MAX_BODY_SIZE) {
                        response = ResponseBuilder::badRequest("Invalid or too large Content-Length");
                        connection.keepAlive = false;
                        haveResponse = true;
                    } else if (length > 0) {
                        connection.contentLength = static_cast<size_t>(length);
                        connection.state = ConnectionState::READING_BODY;
                    }
                }
            }
        }
    }
    
    if (connection.state == ConnectionState::READING_BODY) {
        if (connection.readBuffer.length() < connection.contentLength) {
            return;
        }
        connection.request.setBody(connection.readBuffer.substr(0, connection.contentLength));
        connection.readBuffer.erase(0, connection.contentLength);
        connection.state = ConnectionState::WRITING;
    }
    
    if (connection.state != ConnectionState::WRITING) {
        return;
    }
    
    if (!haveResponse) {
        try {
            if (handler_) {
                response = handler_->handleRequest(connection.request);
            } else {
                CRELAY_ERROR("Handler not set for request");
                response = ResponseBuilder::internalError("Handler not set");
            }
        } catch (const std::exception& e) {
            CRELAY_ERROR("Exception in request handler for connection %d: %s", clientFd, e.what());
            response = ResponseBuilder::internalError(std::string("Internal server error: ") + e.what());
        }
    }
    
    CRELAY_INFO("%s %s -> %d%s", connection.request.getMethod().c_str(), connection.request.getPath().c_str(),
                response.getStatusCode(), response.isStreaming() ? " (streamed)" : "");
    
    if (response.isStreaming()) {
        // 流式连接移出事件循环，由当前worker独占直到流结束
        delEvent(clientFd);
        connection.state = ConnectionState::STREAMING;
        {
            std::lock_guard<std::mutex> lock(connectionsMutex_);
            activeStreams_[clientFd] = &response;
        }
        streamResponse(clientFd, response);
        {
            std::lock_guard<std::mutex> lock(connectionsMutex_);
            activeStreams_.erase(clientFd);
        }
        closeConnection(clientFd);
        return;
    }
    
    connection.writeBuffer = buildHttpResponse(response, connection.keepAlive);
    modEvent(clientFd, EPOLLOUT);
}

void HttpServer::streamResponse(int clientFd, HttpResponse& response) {
    int flags = fcntl(clientFd, F_GETFL, 0);
    fcntl(clientFd, F_SETFL, flags & ~O_NONBLOCK);
    
    struct timeval timeout;
    timeout.tv_sec = STREAM_SEND_TIMEOUT_SEC;
    timeout.tv_usec = 0;
    setsockopt(clientFd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));
    
    if (!sendAll(clientFd, buildResponseHead(response, true, false))) {
        CRELAY_INFO("Client on connection %d left before the stream started", clientFd);
        response.cancelStream();
        return;
    }
    
    const auto startTime = std::chrono::steady_clock::now();
    std::string fragment;
    size_t chunksSent = 0;
    while (running_.load()) {
        if (!response.nextChunk(fragment)) {
            if (!sendAll(clientFd, LAST_CHUNK)) {
                CRELAY_DEBUG("Failed to send last chunk on connection %d", clientFd);
            }
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - startTime);
            CRELAY_INFO("Stream on connection %d finished: %zu chunks in %s",
                        clientFd, chunksSent, formatDuration(elapsed).c_str());
            return;
        }
        // 空分块会被解析为结束标记
        if (fragment.empty()) {
            continue;
        }
        if (!sendAll(clientFd, encodeChunk(fragment))) {
            CRELAY_INFO("Client on connection %d disconnected after %zu chunks: %s",
                        clientFd, chunksSent, strerror(errno));
            response.cancelStream();
            return;
        }
        ++chunksSent;
    }
    
    CRELAY_INFO("Server stopping, abandoning stream on connection %d", clientFd);
    response.cancelStream();
}

void HttpServer::handleWriteEvent(int clientFd) {
    ConnectionState* conn = nullptr;
    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        auto it = connections_.find(clientFd);
        if (it == connections_.end()) {
            return;
        }
        conn = &it->second;
    }
    ConnectionState& connection = *conn;
    
    while (!connection.writeBuffer.empty()) {
        ssize_t sent = send(clientFd, connection.writeBuffer.data(), connection.writeBuffer.length(), MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return;
            }
            CRELAY_WARN("Write error on connection %d: %s", clientFd, strerror(errno));
            closeConnection(clientFd);
            return;
        }
        connection.writeBuffer.erase(0, static_cast<size_t>(sent));
    }
    
    if (!connection.keepAlive) {
        closeConnection(clientFd);
        return;
    }
    
    // Keep-Alive：保留已读到的后续数据，重置请求状态
    std::string pending = std::move(connection.readBuffer);
    connection = ConnectionState();
    connection.readBuffer = std::move(pending);
    modEvent(clientFd, EPOLLIN);
    
    // 流水线请求已在缓冲区中，边缘触发不会再通知
    if (!connection.readBuffer.empty()) {
        processBufferedRequest(clientFd, connection);
    }
}

} // namespace crelay
