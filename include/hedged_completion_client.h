#pragma once

#include "completion_backend.h"
#include "config.h"
#include "errors.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lingo {

/**
 * @brief Drops fragments a backend replays after a hiccup
 *
 * A fragment of at least min_chars that already occurs verbatim in the last
 * window_chars of emitted text is rejected. A window of 0 disables the filter.
 */
class ReplayFilter {
public:
    ReplayFilter(size_t window_chars, size_t min_chars);

    /// True if fragment should be forwarded (and it is then remembered)
    bool accept(const std::string& fragment);

    size_t dropped() const { return dropped_; }

private:
    size_t window_chars_;
    size_t min_chars_;
    std::string tail_;
    size_t dropped_ = 0;
};

/**
 * @brief Operator-facing notice for a rate-limited or unauthorized account
 */
std::string quota_advisory_text(const std::string& profile_label);

/**
 * @brief Lazy, finite, non-restartable sequence of reply fragments from one race
 *
 * Destroying the stream cancels every candidate still running and joins
 * their threads.
 */
class FragmentStream {
public:
    class Impl;

    /// Streams are created by HedgedCompletionClient::stream(); Impl is private to it
    explicit FragmentStream(std::unique_ptr<Impl> impl);
    ~FragmentStream();

    FragmentStream(const FragmentStream&) = delete;
    FragmentStream& operator=(const FragmentStream&) = delete;

    /**
     * @brief Block for the next fragment
     * @return False once every started candidate has finished and the queue is drained
     */
    bool next(std::string& fragment);

    /// Stop every candidate and make next() return false (thread-safe, does not block)
    void cancel();

    /// Set after next() returned false when no candidate won and no advisory was produced
    Error error() const;

    /// Index (into the provider list) of the candidate whose text was yielded
    std::optional<size_t> winner() const;

    /// Number of candidates started so far (2, or 3 after escalation)
    size_t candidates_started() const;

    /// True if the candidate was told to stop
    bool was_cancelled(size_t index) const;

    /// Milliseconds from stream start to the winner's first fragment (-1 if none)
    int64_t first_token_ms() const;

private:
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Source of reply fragments for a conversation turn
 */
class ICompletionSource {
public:
    virtual ~ICompletionSource() = default;

    virtual std::unique_ptr<FragmentStream> stream(ConversationTurn turn) = 0;
};

/**
 * @brief Races chat-completion backends, winner takes all
 *
 * The first two backends start together. The first fragment to reach the
 * shared decision point makes its candidate the winner; every other candidate
 * is cancelled before anything else from it can be forwarded. If no winner
 * exists after first_token_timeout_ms (or the first two have already failed),
 * the third backend joins the race under the same rule.
 *
 * Quota or credential failures before any winner produce a single advisory
 * fragment naming the active credential profile. Other failures of losing
 * candidates are dropped; only total failure surfaces as BackendError.
 */
class HedgedCompletionClient : public ICompletionSource {
public:
    using LabelProvider = std::function<std::string()>;

    HedgedCompletionClient(std::vector<std::shared_ptr<ICompletionBackend>> backends,
                           const CompletionConfig& config,
                           LabelProvider active_label);
    ~HedgedCompletionClient() override;

    HedgedCompletionClient(const HedgedCompletionClient&) = delete;
    HedgedCompletionClient& operator=(const HedgedCompletionClient&) = delete;

    std::unique_ptr<FragmentStream> stream(ConversationTurn turn) override;

private:
    std::vector<std::shared_ptr<ICompletionBackend>> backends_;
    CompletionConfig config_;
    LabelProvider active_label_;
};

} // namespace lingo
