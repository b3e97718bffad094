/**
 * @file api_endpoint.h
 * @brief API端点基类
 * @author cRelay Team
 * @date 2026-10-15
 */
#ifndef CRELAY_API_ENDPOINT_H
#define CRELAY_API_ENDPOINT_H

#include <string>
#include "crelay/http/handler.h"
#include "crelay/http/request.h"
#include "crelay/http/response.h"

namespace crelay {

/**
 * @brief API端点基类
 * 
 * 子类实现handle方法处理具体请求，通过registerTo挂到HttpHandler上。
 */
class ApiEndpoint {
public:
    /**
     * @brief 构造函数
     * @param name 端点名称
     * @param path 请求路径
     * @param method 请求方法（GET或POST）
     */
    ApiEndpoint(
        const std::string& name,
        const std::string& path,
        const std::string& method
    );
    
    virtual ~ApiEndpoint();
    
    std::string getName() const;
    std::string getPath() const;
    std::string getMethod() const;
    
    /**
     * @brief 按自身的方法和路径注册到处理器，端点的生命周期需覆盖处理器
     * @param handler HTTP请求处理器
     */
    void registerTo(HttpHandler& handler);
    
    /**
     * @brief 处理HTTP请求，纯虚函数，子类必须实现
     * @param request HTTP请求对象
     * @return HTTP响应对象
     */
    virtual HttpResponse handle(const HttpRequest& request) = 0;
    
protected:
    std::string name_;     ///< 端点名称
    std::string path_;     ///< 请求路径
    std::string method_;   ///< 请求方法
};

}

#endif
