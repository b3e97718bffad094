#include "crelay/http/json_request_parser.h"

namespace crelay {

thread_local std::string JsonRequestParser::lastError_;

bool JsonRequestParser::validateJson(const std::string& body, nlohmann::json& json) {
    try {
        json = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        lastError_ = std::string("JSON parse error: ") + e.what();
        return false;
    } catch (const nlohmann::json::exception& e) {
        lastError_ = std::string("JSON error: ") + e.what();
        return false;
    }
    
    if (!json.is_object()) {
        lastError_ = "Request body must be a JSON object";
        return false;
    }
    return true;
}

std::string JsonRequestParser::getLastError() {
    return lastError_;
}

}
