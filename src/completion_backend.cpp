#include "completion_backend.h"
#include "key_manager.h"
#include "logger.h"
#include "utils.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <mutex>
#include <sstream>

using json = nlohmann::json;

namespace lingo {

namespace {

constexpr size_t MAX_ERROR_BODY = 2048;

const std::vector<std::string> QUOTA_PATTERNS = {
    "429", "too many requests", "rate", "401", "403",
    "unauthorized", "forbidden", "invalid api key", "insufficient_quota"};

std::once_flag curl_init_once;

struct StreamContext {
    const FragmentCallback* on_fragment = nullptr;
    const std::atomic<bool>* cancel = nullptr;
    CURL* curl = nullptr;
    SseLineBuffer sse;
    long http_status = 0;
    bool done = false;
    bool stopped = false;
    std::string error_body;
    std::string stream_error;
    size_t fragments = 0;
};

size_t sse_write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    auto* ctx = static_cast<StreamContext*>(userp);

    if (ctx->http_status == 0) {
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &ctx->http_status);
    }
    if (ctx->http_status >= 400) {
        if (ctx->error_body.size() < MAX_ERROR_BODY) {
            ctx->error_body.append(static_cast<char*>(contents),
                                   std::min(total, MAX_ERROR_BODY - ctx->error_body.size()));
        }
        return total;
    }
    if (ctx->done) {
        return total;
    }

    ctx->sse.append(static_cast<char*>(contents), total);
    std::string payload;
    while (ctx->sse.next_payload(payload)) {
        if (*ctx->cancel) {
            ctx->stopped = true;
            return 0;  // aborts the transfer with CURLE_WRITE_ERROR
        }
        if (payload == "[DONE]") {
            ctx->done = true;
            break;
        }
        std::string content;
        std::string error;
        if (!parse_delta_payload(payload, content, error)) {
            continue;
        }
        if (!error.empty()) {
            ctx->stream_error = error;
            ctx->done = true;
            break;
        }
        if (content.empty()) {
            continue;
        }
        ctx->fragments++;
        if (!(*ctx->on_fragment)(content)) {
            ctx->stopped = true;
            return 0;
        }
    }
    return total;
}

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<StreamContext*>(clientp);
    if (*ctx->cancel) {
        ctx->stopped = true;
        return 1;
    }
    return 0;
}

Error classify(const std::string& message) {
    if (is_quota_or_auth_error(message)) {
        return make_quota_error(message);
    }
    return make_backend_error(message);
}

} // anonymous namespace

const char* role_name(MessageRole role) {
    switch (role) {
        case MessageRole::System: return "system";
        case MessageRole::User: return "user";
        case MessageRole::Assistant: return "assistant";
    }
    return "user";
}

ConversationTurn ConversationTurn::build(const std::string& system_prompt,
                                         const std::vector<ChatMessage>& history,
                                         const std::string& user_text,
                                         size_t max_history) {
    ConversationTurn turn;
    if (!system_prompt.empty()) {
        turn.system_messages.push_back({MessageRole::System, system_prompt});
    }
    size_t start = history.size() > max_history ? history.size() - max_history : 0;
    turn.prior_history.assign(history.begin() + static_cast<std::ptrdiff_t>(start), history.end());
    turn.user_message = {MessageRole::User, user_text};
    return turn;
}

std::vector<ChatMessage> ConversationTurn::messages() const {
    std::vector<ChatMessage> out = system_messages;
    out.insert(out.end(), prior_history.begin(), prior_history.end());
    out.push_back(user_message);
    return out;
}

bool is_quota_or_auth_error(const std::string& message) {
    return utils::contains_any(message, QUOTA_PATTERNS);
}

void SseLineBuffer::append(const char* data, size_t len) {
    buffer_.append(data, len);
}

bool SseLineBuffer::next_payload(std::string& payload) {
    size_t pos;
    while ((pos = buffer_.find('\n')) != std::string::npos) {
        std::string line = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        // Comments (": keep-alive") and other fields are skipped
        if (!utils::starts_with(line, "data:")) {
            continue;
        }
        payload = utils::trim_copy(line.substr(5));
        if (payload.empty()) {
            continue;
        }
        return true;
    }
    return false;
}

bool parse_delta_payload(const std::string& payload, std::string& content, std::string& error) {
    content.clear();
    error.clear();
    try {
        json j = json::parse(payload);
        if (j.contains("error")) {
            const auto& e = j["error"];
            if (e.is_object() && e.contains("message") && e["message"].is_string()) {
                error = e["message"].get<std::string>();
                if (e.contains("code")) {
                    error = e["code"].dump() + " " + error;
                }
            } else {
                error = e.dump();
            }
            return true;
        }
        if (j.contains("choices") && j["choices"].is_array() && !j["choices"].empty()) {
            const auto& choice = j["choices"][0];
            if (choice.contains("delta") && choice["delta"].is_object()) {
                const auto& delta = choice["delta"];
                if (delta.contains("content") && delta["content"].is_string()) {
                    content = delta["content"].get<std::string>();
                }
            }
        }
        return true;
    } catch (const json::exception&) {
        return false;
    }
}

class OpenRouterBackend::Impl {
public:
    Impl(const ProviderConfig& provider, const CompletionConfig& config, const KeyManager& keys)
        : provider_(provider), config_(config), keys_(keys) {
        std::call_once(curl_init_once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    std::string build_request_json(const ConversationTurn& turn) const {
        json request;
        request["model"] = provider_.model;
        request["stream"] = true;
        request["max_tokens"] = config_.max_tokens;
        request["temperature"] = config_.temperature;
        request["stop"] = json(config_.stop_sequences);
        json messages = json::array();
        for (const auto& m : turn.messages()) {
            messages.push_back({{"role", role_name(m.role)}, {"content", m.content}});
        }
        request["messages"] = messages;
        return request.dump();
    }

    VoidResult stream(const ConversationTurn& turn,
                      const FragmentCallback& on_fragment,
                      const std::atomic<bool>& cancel) {
        std::string key = keys_.key(provider_.key_name);
        if (key.empty()) {
            return make_quota_error(provider_.name + ": no API key for " + provider_.key_name + " (unauthorized)");
        }

        CURL* curl = curl_easy_init();
        if (!curl) {
            return make_backend_error(provider_.name + ": failed to initialize CURL");
        }

        std::string request_json = build_request_json(turn);

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        headers = curl_slist_append(headers, "Accept: text/event-stream");
        headers = curl_slist_append(headers, ("Authorization: Bearer " + key).c_str());
        headers = curl_slist_append(headers, ("HTTP-Referer: " + config_.referer).c_str());
        headers = curl_slist_append(headers, ("X-Title: " + config_.title).c_str());

        StreamContext ctx;
        ctx.on_fragment = &on_fragment;
        ctx.cancel = &cancel;
        ctx.curl = curl;

        curl_easy_setopt(curl, CURLOPT_URL, provider_.endpoint.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request_json.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, sse_write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.request_timeout_ms));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.connect_timeout_ms));

        LOG_LLM(provider_.name + ": POST " + provider_.endpoint + " model=" + provider_.model);
        CURLcode res = curl_easy_perform(curl);
        if (ctx.http_status == 0) {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &ctx.http_status);
        }

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (ctx.stopped || cancel) {
            LOG_LLM(provider_.name + ": stopped after " + std::to_string(ctx.fragments) + " fragments");
            return VoidResult();
        }
        if (ctx.http_status >= 400) {
            std::ostringstream oss;
            oss << provider_.name << ": HTTP " << ctx.http_status << " " << utils::trim_copy(ctx.error_body);
            return classify(oss.str());
        }
        if (res != CURLE_OK) {
            return make_backend_error(provider_.name + ": " + curl_easy_strerror(res));
        }
        if (!ctx.stream_error.empty()) {
            return classify(provider_.name + ": " + ctx.stream_error);
        }
        LOG_LLM(provider_.name + ": finished with " + std::to_string(ctx.fragments) + " fragments");
        return VoidResult();
    }

    const ProviderConfig& provider() const { return provider_; }

private:
    ProviderConfig provider_;
    CompletionConfig config_;
    const KeyManager& keys_;
};

OpenRouterBackend::OpenRouterBackend(const ProviderConfig& provider, const CompletionConfig& config,
                                     const KeyManager& keys)
    : pimpl_(std::make_unique<Impl>(provider, config, keys)) {}

OpenRouterBackend::~OpenRouterBackend() = default;

std::string OpenRouterBackend::name() const {
    return pimpl_->provider().name;
}

VoidResult OpenRouterBackend::stream(const ConversationTurn& turn,
                                     const FragmentCallback& on_fragment,
                                     const std::atomic<bool>& cancel) {
    return pimpl_->stream(turn, on_fragment, cancel);
}

std::string OpenRouterBackend::build_request_json(const ConversationTurn& turn) const {
    return pimpl_->build_request_json(turn);
}

} // namespace lingo
