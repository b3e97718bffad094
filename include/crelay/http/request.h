/**
 * @file request.h
 * @brief HTTP请求类，保存解析后的请求行、头部与请求体
 * @author cRelay Team
 * @date 2026-10-14
 */
#ifndef CRELAY_HTTP_REQUEST_H
#define CRELAY_HTTP_REQUEST_H

#include <string>
#include <map>

namespace crelay {

/**
 * @brief HTTP请求类
 *
 * 头部名称统一以小写存储，查询时大小写不敏感。
 */
class HttpRequest {
public:
    HttpRequest();
    ~HttpRequest();
    
    /**
     * @brief 获取HTTP请求方法
     * @return 请求方法（如GET、POST等）
     */
    std::string getMethod() const;
    
    /**
     * @brief 获取HTTP请求路径（不含查询字符串）
     */
    std::string getPath() const;
    
    /**
     * @brief 获取指定名称的HTTP请求头部
     * @param name 头部名称
     * @return 头部值，如果不存在则返回空字符串
     */
    std::string getHeader(const std::string& name) const;
    
    /**
     * @brief 获取HTTP请求体
     */
    const std::string& getBody() const;
    
    void setMethod(const std::string& method);
    
    /**
     * @brief 设置HTTP请求路径，查询字符串部分被丢弃
     */
    void setPath(const std::string& path);
    
    void setHeader(const std::string& name, const std::string& value);
    void setBody(const std::string& body);
    
private:
    std::string method_;             ///< HTTP请求方法
    std::string path_;               ///< HTTP请求路径
    std::map<std::string, std::string> headers_;  ///< HTTP请求头部（小写名称）
    std::string body_;               ///< HTTP请求体
};

}

#endif
