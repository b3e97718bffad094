#include "crelay/http/request.h"
#include "crelay/common/utils.h"

namespace crelay {

HttpRequest::HttpRequest() {
}

HttpRequest::~HttpRequest() {
}

std::string HttpRequest::getMethod() const {
    return method_;
}

std::string HttpRequest::getPath() const {
    return path_;
}

std::string HttpRequest::getHeader(const std::string& name) const {
    auto it = headers_.find(toLowerCopy(name));
    if (it != headers_.end()) {
        return it->second;
    }
    return "";
}

const std::string& HttpRequest::getBody() const {
    return body_;
}

void HttpRequest::setMethod(const std::string& method) {
    method_ = method;
}

void HttpRequest::setPath(const std::string& path) {
    size_t queryPos = path.find('?');
    path_ = (queryPos == std::string::npos) ? path : path.substr(0, queryPos);
}

void HttpRequest::setHeader(const std::string& name, const std::string& value) {
    headers_[toLowerCopy(name)] = value;
}

void HttpRequest::setBody(const std::string& body) {
    body_ = body;
}

}
