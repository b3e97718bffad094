#include "crelay/http/api_endpoint.h"
#include "crelay/common/logger.h"

namespace crelay {

ApiEndpoint::ApiEndpoint(
    const std::string& name,
    const std::string& path,
    const std::string& method
) : name_(name), path_(path), method_(method) {
}

ApiEndpoint::~ApiEndpoint() {
}

std::string ApiEndpoint::getName() const {
    return name_;
}

std::string ApiEndpoint::getPath() const {
    return path_;
}

std::string ApiEndpoint::getMethod() const {
    return method_;
}

void ApiEndpoint::registerTo(HttpHandler& handler) {
    auto func = [this](const HttpRequest& request) {
        return handle(request);
    };
    
    if (method_ == "GET") {
        handler.get(path_, func);
    } else {
        handler.post(path_, func);
    }
    CRELAY_INFO("  - %-4s %s (%s)", method_.c_str(), path_.c_str(), name_.c_str());
}

}
