#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace crelay {

class JsonRequestParser {
public:
    template<typename T>
    static bool getField(const nlohmann::json& json, const std::string& key, T& value, bool required = false);
    
    /**
     * @brief 解析请求体，要求顶层为JSON对象
     */
    static bool validateJson(const std::string& body, nlohmann::json& json);
    
    static std::string getLastError();
    
private:
    static thread_local std::string lastError_;
};

template<typename T>
bool JsonRequestParser::getField(const nlohmann::json& json, const std::string& key, T& value, bool required) {
    if (!json.contains(key)) {
        if (required) {
            lastError_ = "Required field '" + key + "' is missing";
        }
        return !required;
    }
    
    try {
        value = json.at(key).get<T>();
        return true;
    } catch (const nlohmann::json::exception& e) {
        lastError_ = std::string("Failed to parse field '") + key + "': " + e.what();
        return false;
    }
}

}
