#include "crelay/http/response.h"
#include <nlohmann/json.hpp>
#include <utility>

namespace crelay {

HttpResponse::HttpResponse() : statusCode_(200), streaming_(false) {
    setContentType("text/plain; charset=utf-8");
}

HttpResponse::~HttpResponse() {
}

void HttpResponse::setStatusCode(int code) {
    statusCode_ = code;
}

void HttpResponse::setHeader(const std::string& name, const std::string& value) {
    headers_[name] = value;
}

void HttpResponse::setBody(const std::string& body) {
    body_ = body;
}

void HttpResponse::setContentType(const std::string& contentType) {
    setHeader("Content-Type", contentType);
}

int HttpResponse::getStatusCode() const {
    return statusCode_;
}

std::string HttpResponse::getHeader(const std::string& name) const {
    auto it = headers_.find(name);
    if (it != headers_.end()) {
        return it->second;
    }
    return "";
}

const std::string& HttpResponse::getBody() const {
    return body_;
}

std::string HttpResponse::getContentType() const {
    return getHeader("Content-Type");
}

const std::map<std::string, std::string>& HttpResponse::getAllHeaders() const {
    return headers_;
}

void HttpResponse::setError(int code, const std::string& message) {
    setStatusCode(code);
    
    nlohmann::json errorJson;
    errorJson["error"]["code"] = code;
    errorJson["error"]["message"] = message;
    setBody(errorJson.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    setContentType("application/json");
}

void HttpResponse::enableStreaming(ChunkProducer producer, std::function<void()> onCancel,
                                   std::function<void()> onInterrupt) {
    streaming_ = true;
    producer_ = std::move(producer);
    onCancel_ = std::move(onCancel);
    onInterrupt_ = std::move(onInterrupt);
    setHeader("Cache-Control", "no-cache");
}

bool HttpResponse::isStreaming() const {
    return streaming_;
}

bool HttpResponse::nextChunk(std::string& chunk) {
    if (!producer_) {
        return false;
    }
    if (!producer_(chunk)) {
        producer_ = nullptr;
        onCancel_ = nullptr;
        return false;
    }
    return true;
}

void HttpResponse::cancelStream() {
    if (onCancel_) {
        onCancel_();
    }
    onCancel_ = nullptr;
    producer_ = nullptr;
}

void HttpResponse::interruptStream() const {
    if (onInterrupt_) {
        onInterrupt_();
    }
}

const char* HttpResponse::reasonPhrase(int code) {
    switch (code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

}
