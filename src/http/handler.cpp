#include "crelay/http/handler.h"
#include "crelay/http/response_builder.h"

namespace crelay {

HttpHandler::HttpHandler() {
}

HttpHandler::~HttpHandler() {
}

void HttpHandler::get(const std::string& path, HandlerFunc handler) {
    getHandlers_[normalizePath(path)] = std::move(handler);
}

void HttpHandler::post(const std::string& path, HandlerFunc handler) {
    postHandlers_[normalizePath(path)] = std::move(handler);
}

const std::map<std::string, HttpHandler::HandlerFunc>* HttpHandler::handlersFor(const std::string& method) const {
    if (method == "GET") {
        return &getHandlers_;
    }
    if (method == "POST") {
        return &postHandlers_;
    }
    return nullptr;
}

HttpResponse HttpHandler::handleRequest(const HttpRequest& request) {
    const std::string& method = request.getMethod();
    std::string path = normalizePath(request.getPath());
    
    const std::map<std::string, HandlerFunc>* handlers = handlersFor(method);
    if (handlers == nullptr) {
        return ResponseBuilder::badRequest("Unsupported HTTP method: " + method);
    }
    
    auto it = handlers->find(path);
    if (it != handlers->end()) {
        return it->second(request);
    }
    
    return ResponseBuilder::notFound("No route for " + method + " " + request.getPath());
}

bool HttpHandler::hasHandler(const std::string& method, const std::string& path) const {
    const std::map<std::string, HandlerFunc>* handlers = handlersFor(method);
    if (handlers == nullptr) {
        return false;
    }
    
    return handlers->find(normalizePath(path)) != handlers->end();
}

std::string HttpHandler::normalizePath(const std::string& path) const {
    std::string normalized = path;
    
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    if (normalized.empty()) {
        normalized = "/";
    }
    
    return normalized;
}

}
