/**
 * @file secrets.h
 * @brief 启动密钥加载，环境变量优先，其次为YAML密钥文件
 * @author cRelay Team
 * @date 2026-10-12
 */

#pragma once

#include <map>
#include <string>
#include <vector>

namespace crelay {

/**
 * @brief 访问上游推理服务所需的凭据
 */
struct Credentials {
    std::string accessKeyId;      ///< AWS_ACCESS_KEY_ID
    std::string secretAccessKey;  ///< AWS_SECRET_ACCESS_KEY
    std::string endpointUrl;      ///< AWS_URL，推理服务端点
};

/**
 * @brief 密钥存储
 *
 * 每个键先查环境变量，再查密钥文件中的同名顶层键。空字符串视为缺失。
 */
class SecretStore {
public:
    static constexpr const char* ACCESS_KEY_ID = "AWS_ACCESS_KEY_ID";
    static constexpr const char* SECRET_ACCESS_KEY = "AWS_SECRET_ACCESS_KEY";
    static constexpr const char* ENDPOINT_URL = "AWS_URL";

    SecretStore() = default;

    /**
     * @brief 从YAML文件加载密钥
     * @param path 密钥文件路径，为空时只使用环境变量
     * @throws ConfigException 文件存在但无法解析
     */
    void loadFile(const std::string& path);

    /**
     * @brief 直接设置密钥（优先级低于环境变量）
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief 查询密钥
     * @param key 键名
     * @param value 输出值
     * @return 存在且非空时返回true
     */
    bool get(const std::string& key, std::string& value) const;

    /**
     * @brief 读取全部凭据
     * @throws ConfigException 任一密钥缺失，消息中列出缺失的键名
     */
    Credentials requireCredentials() const;

private:
    std::map<std::string, std::string> values_;
};

}  // namespace crelay
