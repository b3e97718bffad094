#include "crelay/http/response_builder.h"

namespace crelay {

HttpResponse ResponseBuilder::text(const std::string& text, int statusCode) {
    HttpResponse response;
    response.setStatusCode(statusCode);
    response.setBody(text);
    response.setContentType("text/plain; charset=utf-8");
    return response;
}

HttpResponse ResponseBuilder::error(int statusCode, const std::string& message) {
    HttpResponse response;
    response.setError(statusCode, message);
    return response;
}

HttpResponse ResponseBuilder::badRequest(const std::string& message) {
    return error(400, message);
}

HttpResponse ResponseBuilder::notFound(const std::string& message) {
    return error(404, message);
}

HttpResponse ResponseBuilder::internalError(const std::string& message) {
    return error(500, message);
}

HttpResponse ResponseBuilder::badGateway(const std::string& message) {
    return error(502, message);
}

HttpResponse ResponseBuilder::streamingText(ChunkProducer producer, std::function<void()> onCancel,
                                            std::function<void()> onInterrupt) {
    HttpResponse response;
    response.setStatusCode(200);
    response.setContentType("text/plain; charset=utf-8");
    response.enableStreaming(std::move(producer), std::move(onCancel), std::move(onInterrupt));
    return response;
}

}
