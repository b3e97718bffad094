#include "crelay/client/bedrock_client.h"
#include "crelay/common/exceptions.h"
#include "crelay/common/logger.h"
#include "crelay/common/utils.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>

namespace crelay {

namespace {

std::once_flag g_curlInitFlag;

size_t appendToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

// 上游错误体通常为 {"message": "..."}
std::string extractErrorMessage(const std::string& body) {
    try {
        nlohmann::json json = nlohmann::json::parse(body);
        if (json.is_object()) {
            auto it = json.find("message");
            if (it == json.end()) {
                it = json.find("Message");
            }
            if (it != json.end() && it->is_string()) {
                return it->get<std::string>();
            }
        }
    } catch (const nlohmann::json::exception&) {
        // 非JSON错误体，按原文返回
    }
    return truncateForLog(body);
}

} // namespace

BedrockClient::BedrockClient(BedrockClientOptions options)
    : options_(std::move(options)) {
    std::call_once(g_curlInitFlag, [] {
        CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (code != CURLE_OK) {
            throw ChannelException(std::string("curl_global_init failed: ") + curl_easy_strerror(code));
        }
    });

    while (!options_.credentials.endpointUrl.empty() && options_.credentials.endpointUrl.back() == '/') {
        options_.credentials.endpointUrl.pop_back();
    }

    sigv4_ = "aws:amz:" + options_.region + ":" + options_.signingService;
    userPwd_ = options_.credentials.accessKeyId + ":" + options_.credentials.secretAccessKey;

    CRELAY_INFO("BedrockClient initialized: endpoint=%s, region=%s",
                options_.credentials.endpointUrl.c_str(), options_.region.c_str());
}

std::string BedrockClient::buildInvokeUrl(const std::string& modelId, bool streaming) const {
    std::string url = options_.credentials.endpointUrl;
    url += "/model/";
    url += urlEncodePathSegment(modelId);
    url += streaming ? "/invoke-with-response-stream" : "/invoke";
    return url;
}

CURL* BedrockClient::createHandle(const std::string& url, const std::string& payload,
                                  const char* accept, curl_slist** headers) const {
    CURL* curl = curl_easy_init();
    if (curl == nullptr) {
        throw ChannelException("curl_easy_init failed");
    }

    curl_slist* list = nullptr;
    list = curl_slist_append(list, "Content-Type: application/json");
    list = curl_slist_append(list, (std::string("Accept: ") + accept).c_str());

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_COPYPOSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
    curl_easy_setopt(curl, CURLOPT_AWS_SIGV4, sigv4_.c_str());
    curl_easy_setopt(curl, CURLOPT_USERPWD, userPwd_.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connectTimeoutMs));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.requestTimeoutMs));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    *headers = list;
    return curl;
}

std::string BedrockClient::invokeOnce(const std::string& modelId, const std::string& payload) const {
    curl_slist* headers = nullptr;
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(
        createHandle(buildInvokeUrl(modelId, false), payload, "application/json", &headers),
        &curl_easy_cleanup);
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headerGuard(headers, &curl_slist_free_all);

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, appendToString);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw ChannelException(std::string("invoke failed: ") + curl_easy_strerror(res));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        throw ChannelException("invoke returned HTTP " + std::to_string(status) + ": " +
                               extractErrorMessage(body), status);
    }

    CRELAY_DEBUG("invoke %s completed: %zu bytes", modelId.c_str(), body.size());
    return body;
}

std::unique_ptr<IChunkSource> BedrockClient::invokeStreaming(const std::string& modelId,
                                                             const std::string& payload) const {
    curl_slist* headers = nullptr;
    CURL* curl = createHandle(buildInvokeUrl(modelId, true), payload,
                              "application/vnd.amazon.eventstream", &headers);

    auto source = std::make_unique<BedrockChunkSource>(curl, headers);
    source->open();

    CRELAY_DEBUG("invoke-with-response-stream %s opened", modelId.c_str());
    return source;
}

// ============================================================================
// BedrockChunkSource
// ============================================================================

BedrockChunkSource::BedrockChunkSource(CURL* easy, curl_slist* headers)
    : multi_(curl_multi_init()),
      easy_(easy),
      headers_(headers),
      httpStatus_(0),
      transferDone_(false),
      transferResult_(CURLE_OK),
      failed_(false),
      interrupted_(false) {
    if (multi_ == nullptr) {
        curl_easy_cleanup(easy_);
        curl_slist_free_all(headers_);
        throw ChannelException("curl_multi_init failed");
    }
    curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &BedrockChunkSource::onWrite);
    curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
    curl_multi_add_handle(multi_, easy_);
}

BedrockChunkSource::~BedrockChunkSource() {
    curl_multi_remove_handle(multi_, easy_);
    curl_easy_cleanup(easy_);
    curl_multi_cleanup(multi_);
    curl_slist_free_all(headers_);
}

size_t BedrockChunkSource::onWrite(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* self = static_cast<BedrockChunkSource*>(userdata);
    const size_t length = size * nmemb;

    self->updateStatus();

    if (self->httpStatus_ == 200) {
        self->decoder_.feed(ptr, length);
    } else {
        self->errorBody_.append(ptr, length);
    }
    return length;
}

void BedrockChunkSource::updateStatus() {
    if (httpStatus_ != 0) {
        return;
    }
    long code = 0;
    curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &code);
    // 忽略1xx中间响应
    if (code >= 200) {
        httpStatus_ = code;
    }
}

void BedrockChunkSource::pump() {
    int running = 0;
    CURLMcode mc = curl_multi_perform(multi_, &running);
    if (mc != CURLM_OK) {
        transferDone_ = true;
        transferResult_ = CURLE_RECV_ERROR;
        lastError_ = std::string("curl_multi_perform failed: ") + curl_multi_strerror(mc);
        return;
    }

    if (running == 0) {
        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_) {
                transferResult_ = msg->data.result;
            }
        }
        transferDone_ = true;
        updateStatus();
        return;
    }

    // 响应头到达后即可确定状态，不必等待第一个数据字节
    updateStatus();

    mc = curl_multi_poll(multi_, nullptr, 0, 1000, nullptr);
    if (mc != CURLM_OK) {
        transferDone_ = true;
        transferResult_ = CURLE_RECV_ERROR;
        lastError_ = std::string("curl_multi_poll failed: ") + curl_multi_strerror(mc);
    }
}

void BedrockChunkSource::interrupt() {
    interrupted_.store(true);
    CURLMcode mc = curl_multi_wakeup(multi_);
    if (mc != CURLM_OK) {
        CRELAY_WARN("curl_multi_wakeup failed: %s", curl_multi_strerror(mc));
    }
}

void BedrockChunkSource::open() {
    while (httpStatus_ == 0 && !transferDone_) {
        pump();
    }

    if (transferDone_ && transferResult_ != CURLE_OK) {
        std::string reason = lastError_.empty() ? curl_easy_strerror(transferResult_) : lastError_;
        throw ChannelException("invoke-with-response-stream failed: " + reason);
    }

    if (httpStatus_ != 200) {
        // 读完错误体再抛出
        while (!transferDone_) {
            pump();
        }
        throw ChannelException("invoke-with-response-stream returned HTTP " + std::to_string(httpStatus_) +
                               ": " + extractErrorMessage(errorBody_), httpStatus_);
    }
}

PullResult BedrockChunkSource::fail(const std::string& message) {
    failed_ = true;
    lastError_ = message;
    return PullResult::FAILED;
}

PullResult BedrockChunkSource::pull(Chunk& chunk) {
    if (failed_) {
        return PullResult::FAILED;
    }

    while (true) {
        EventStreamMessage message;
        try {
            if (decoder_.next(message)) {
                std::string error;
                PullResult result = translate(message, chunk, error);
                if (result == PullResult::FAILED) {
                    return fail(error);
                }
                return result;
            }
        } catch (const ChannelException& e) {
            return fail(e.what());
        }

        if (interrupted_.load()) {
            return fail("transfer interrupted");
        }

        if (transferDone_) {
            if (transferResult_ != CURLE_OK) {
                return fail(lastError_.empty() ? curl_easy_strerror(transferResult_) : lastError_);
            }
            if (decoder_.bufferedBytes() > 0) {
                return fail("stream ended inside a message (" + std::to_string(decoder_.bufferedBytes()) +
                            " bytes pending)");
            }
            return PullResult::END_OF_STREAM;
        }

        pump();
    }
}

PullResult BedrockChunkSource::translate(const EventStreamMessage& message, Chunk& chunk, std::string& error) {
    const std::string messageType = message.headerString(":message-type");

    if (messageType == "exception" || messageType == "error") {
        std::string kind = message.headerString(":exception-type");
        if (kind.empty()) {
            kind = message.headerString(":error-code");
        }
        std::string detail = message.headerString(":error-message");
        if (detail.empty()) {
            detail = extractErrorMessage(message.payload);
        }
        error = (kind.empty() ? messageType : kind) + ": " + detail;
        return PullResult::FAILED;
    }

    chunk = Chunk();
    chunk.eventType = message.headerString(":event-type");

    if (messageType != "event" || chunk.eventType != "chunk") {
        chunk.kind = Chunk::Kind::CONTROL;
        return PullResult::CHUNK;
    }

    chunk.kind = Chunk::Kind::DATA;

    nlohmann::json envelope;
    try {
        envelope = nlohmann::json::parse(message.payload);
    } catch (const nlohmann::json::exception& e) {
        error = std::string("malformed chunk envelope: ") + e.what();
        return PullResult::FAILED;
    }

    if (!envelope.is_object()) {
        error = "malformed chunk envelope: not an object";
        return PullResult::FAILED;
    }

    // 没有bytes字段的chunk保留为空数据，由解码阶段判定为无效
    auto it = envelope.find("bytes");
    if (it != envelope.end() && it->is_string()) {
        if (!base64Decode(it->get<std::string>(), chunk.bytes)) {
            error = "chunk bytes are not valid base64";
            return PullResult::FAILED;
        }
    }
    return PullResult::CHUNK;
}

}  // namespace crelay
