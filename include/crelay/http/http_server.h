#pragma once

#include "crelay/http/handler.h"
#include <string>
#include <thread>
#include <atomic>
#include <vector>
#include <mutex>
#include <map>
#include <cstdint>

namespace crelay {

/**
 * @brief 基于epoll的HTTP/1.1服务器
 * 
 * 每个worker线程运行独立的epoll实例，普通响应通过非阻塞写事件发送，
 * 流式响应在当前worker上以分块传输编码逐块发送，发送完毕后关闭连接。
 */
class HttpServer {
public:
    /**
     * @brief 初始化服务器，线程数取自Config的server.num_threads/min_threads
     * @param host 监听地址
     * @param port 监听端口
     * @param handler HTTP请求处理器，生命周期由调用方保证
     */
    static void init(const std::string& host, int port, HttpHandler* handler);
    
    /**
     * @brief 启动服务器（后台worker线程）
     * @return 监听失败时返回false
     */
    static bool start();
    
    /**
     * @brief 停止服务器并等待worker线程退出
     */
    static void stop();
    
    static bool isRunning();
    
    /**
     * @brief 构建完整的非流式响应报文（带Content-Length）
     */
    static std::string buildHttpResponse(const HttpResponse& response, bool keepAlive);
    
    /**
     * @brief 构建状态行和头部
     * @param chunked 为true时写入Transfer-Encoding: chunked，否则写入Content-Length
     */
    static std::string buildResponseHead(const HttpResponse& response, bool chunked, bool keepAlive);
    
    /**
     * @brief 将数据编码为一个HTTP分块
     */
    static std::string encodeChunk(const std::string& data);
    
    /**
     * @brief 解析请求行和头部（不含末尾的空行）
     * @return 请求行格式错误时返回false
     */
    static bool parseRequestHead(const std::string& head, HttpRequest& request);

    static constexpr const char* LAST_CHUNK = "0\r\n\r\n";

private:
    HttpServer() = default;
    ~HttpServer() = default;
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;
    
    bool run();
    void eventLoop(int workerId);
    void acceptConnections();
    void handleReadEvent(int clientFd);
    void handleWriteEvent(int clientFd);
    
    /**
     * @brief 在当前线程内发送流式响应，每发送完一块才拉取下一块
     */
    void streamResponse(int clientFd, HttpResponse& response);
    
    void closeConnection(int clientFd);
    
    bool setupEventLoop();
    void addEvent(int fd, uint32_t events);
    void modEvent(int fd, uint32_t events);
    void delEvent(int fd);
    
    // 连接状态管理
    struct ConnectionState {
        std::string readBuffer;
        std::string writeBuffer;
        HttpRequest request;
        enum { READING_HEADER, READING_BODY, WRITING, STREAMING } state;
        size_t contentLength;
        bool keepAlive;
        
        ConnectionState() : state(READING_HEADER), contentLength(0), keepAlive(true) {}
    };
    
    /**
     * @brief 从读缓冲区解析一个完整请求并分发，数据不足时直接返回
     */
    void processBufferedRequest(int clientFd, ConnectionState& connection);
    
    static HttpServer* instance_;
    static std::mutex instance_mutex_;
    
    std::string host_;
    int port_;
    HttpHandler* handler_;
    int serverFd_;
    
    std::vector<int> epollFds_;  // 每个worker一个epoll实例
    std::atomic<size_t> nextWorker_{0};
    
    std::atomic<bool> running_;
    std::vector<std::thread> workerThreads_;
    unsigned int numThreads_;
    
    std::map<int, ConnectionState> connections_;
    std::map<int, HttpResponse*> activeStreams_;  // 正在发送的流式响应，stop()时唤醒
    std::mutex connectionsMutex_;
    
    static constexpr size_t MAX_CONNECTIONS = 1024;
    static constexpr size_t MAX_HEADER_SIZE = 64 * 1024;
    static constexpr size_t MAX_BODY_SIZE = 10 * 1024 * 1024;
    static constexpr int STREAM_SEND_TIMEOUT_SEC = 60;
};

} // namespace crelay
