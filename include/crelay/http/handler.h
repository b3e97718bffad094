/**
 * @file handler.h
 * @brief HTTP请求处理器，用于注册和分发HTTP请求
 * @author cRelay Team
 * @date 2026-10-14
 */
#ifndef CRELAY_HTTP_HANDLER_H
#define CRELAY_HTTP_HANDLER_H

#include <string>
#include <map>
#include <functional>
#include "crelay/http/request.h"
#include "crelay/http/response.h"

namespace crelay {

/**
 * @brief HTTP请求处理器
 * 
 * 按方法和路径匹配已注册的处理函数。流式响应同样通过HandlerFunc返回，
 * 由HttpResponse携带数据块生产函数。
 */
class HttpHandler {
public:
    /**
     * @brief HTTP请求处理函数类型定义
     */
    typedef std::function<HttpResponse(const HttpRequest&)> HandlerFunc;
    
    HttpHandler();
    ~HttpHandler();
    
    /**
     * @brief 注册GET请求处理器
     * @param path 请求路径
     * @param handler 处理函数
     */
    void get(const std::string& path, HandlerFunc handler);
    
    /**
     * @brief 注册POST请求处理器
     * @param path 请求路径
     * @param handler 处理函数
     */
    void post(const std::string& path, HandlerFunc handler);
    
    /**
     * @brief 处理HTTP请求
     * @param request HTTP请求对象
     * @return 未匹配的路径返回404，不支持的方法返回400
     */
    virtual HttpResponse handleRequest(const HttpRequest& request);
    
    bool hasHandler(const std::string& method, const std::string& path) const;
    
private:
    /**
     * @brief 规范化请求路径，去掉末尾的'/'，根路径保持为"/"
     */
    std::string normalizePath(const std::string& path) const;
    
    const std::map<std::string, HandlerFunc>* handlersFor(const std::string& method) const;
    
    std::map<std::string, HandlerFunc> getHandlers_;     ///< GET请求处理器映射
    std::map<std::string, HandlerFunc> postHandlers_;    ///< POST请求处理器映射
};

} // namespace crelay

#endif
