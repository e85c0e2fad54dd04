#pragma once

#include "config.h"
#include "errors.h"
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace lingo {

class KeyManager;

enum class MessageRole {
    System,
    User,
    Assistant
};

const char* role_name(MessageRole role);

struct ChatMessage {
    MessageRole role;
    std::string content;
};

/**
 * @brief One request's worth of conversation, immutable once built
 */
struct ConversationTurn {
    std::vector<ChatMessage> system_messages;
    std::vector<ChatMessage> prior_history;
    ChatMessage user_message{MessageRole::User, ""};

    /**
     * @brief Assemble a turn keeping only the newest max_history history messages
     */
    static ConversationTurn build(const std::string& system_prompt,
                                  const std::vector<ChatMessage>& history,
                                  const std::string& user_text,
                                  size_t max_history);

    /// System, history, then user message, in request order
    std::vector<ChatMessage> messages() const;
};

/**
 * @brief Receives each token fragment; return false to stop the stream
 */
using FragmentCallback = std::function<bool(const std::string& fragment)>;

/**
 * @brief One interchangeable chat-completion provider
 */
class ICompletionBackend {
public:
    virtual ~ICompletionBackend() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Stream a completion for turn, calling on_fragment per delta
     *
     * Returns once the provider finishes, on_fragment returns false, or
     * cancel becomes true (checked at least once per received token).
     * @return Ok when finished or stopped; BackendError or QuotaOrAuthError otherwise
     */
    virtual VoidResult stream(const ConversationTurn& turn,
                              const FragmentCallback& on_fragment,
                              const std::atomic<bool>& cancel) = 0;
};

/**
 * @brief True for rate-limit, quota and credential failures
 */
bool is_quota_or_auth_error(const std::string& message);

/**
 * @brief Splits a server-sent-events byte stream into "data:" payloads
 */
class SseLineBuffer {
public:
    void append(const char* data, size_t len);

    /// Next complete data payload (without the "data:" prefix); false when none is buffered
    bool next_payload(std::string& payload);

private:
    std::string buffer_;
};

/**
 * @brief Pull choices[0].delta.content (or an error message) out of one SSE payload
 * @return False if the payload is not valid JSON
 */
bool parse_delta_payload(const std::string& payload, std::string& content, std::string& error);

/**
 * @brief OpenAI-compatible streaming chat completions over libcurl (OpenRouter)
 */
class OpenRouterBackend : public ICompletionBackend {
public:
    OpenRouterBackend(const ProviderConfig& provider, const CompletionConfig& config, const KeyManager& keys);
    ~OpenRouterBackend() override;

    OpenRouterBackend(const OpenRouterBackend&) = delete;
    OpenRouterBackend& operator=(const OpenRouterBackend&) = delete;

    std::string name() const override;

    VoidResult stream(const ConversationTurn& turn,
                      const FragmentCallback& on_fragment,
                      const std::atomic<bool>& cancel) override;

    /// Request body as sent (exposed for logging and tests)
    std::string build_request_json(const ConversationTurn& turn) const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace lingo
