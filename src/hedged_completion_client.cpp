#include "hedged_completion_client.h"
#include "common.h"
#include "logger.h"
#include "utils.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <sstream>
#include <thread>

namespace lingo {

namespace {

constexpr size_t OUTPUT_QUEUE_CAPACITY = 256;
constexpr size_t PRIMARY_CANDIDATES = 2;
constexpr size_t BACKUP_INDEX = 2;

} // anonymous namespace

// ============================================================================
// ReplayFilter
// ============================================================================

ReplayFilter::ReplayFilter(size_t window_chars, size_t min_chars)
    : window_chars_(window_chars), min_chars_(min_chars) {}

bool ReplayFilter::accept(const std::string& fragment) {
    if (window_chars_ == 0) {
        return true;
    }
    if (!fragment.empty() && fragment.size() >= min_chars_ &&
        tail_.find(fragment) != std::string::npos) {
        dropped_++;
        return false;
    }
    tail_ += fragment;
    if (tail_.size() > window_chars_) {
        tail_.erase(0, tail_.size() - window_chars_);
    }
    return true;
}

std::string quota_advisory_text(const std::string& profile_label) {
    return "[API Notice] The current OpenRouter account \"" + profile_label +
           "\" appears to be rate-limited or out of quota. "
           "Please switch to another credential profile, then try again.";
}

// ============================================================================
// FragmentStream::Impl - one race
// ============================================================================

class FragmentStream::Impl {
public:
    Impl(const std::vector<std::shared_ptr<ICompletionBackend>>& backends,
         const CompletionConfig& config,
         ConversationTurn turn,
         HedgedCompletionClient::LabelProvider active_label)
        : backends_(backends)
        , config_(config)
        , turn_(std::move(turn))
        , active_label_(std::move(active_label))
        , started_(backends.size(), false)
        , filter_(static_cast<size_t>(config.dedup_window_chars),
                  static_cast<size_t>(config.dedup_min_chars)) {
        for (size_t i = 0; i < backends_.size(); ++i) {
            cancel_.push_back(std::make_unique<std::atomic<bool>>(false));
        }
        if (backends_.size() > BACKUP_INDEX) {
            backup_index_ = BACKUP_INDEX;
        }
    }

    ~Impl() {
        shutdown();
    }

    void start() {
        std::lock_guard<std::mutex> lock(mutex_);
        start_time_ = Clock::now();
        for (size_t i = 0; i < PRIMARY_CANDIDATES && i < backends_.size(); ++i) {
            start_candidate_locked(i);
        }
        if (started_count_ == 0) {
            terminal_ = true;
            error_ = make_backend_error("no completion backends configured");
            return;
        }
        watchdog_ = std::thread(&Impl::watchdog_loop, this);
    }

    bool next(std::string& fragment) {
        while (true) {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || terminal_ || closed_; });
            if (closed_ || queue_.empty()) {
                return false;
            }
            std::string candidate = std::move(queue_.front());
            queue_.pop_front();
            space_cv_.notify_one();
            lock.unlock();

            if (!filter_.accept(candidate)) {
                LOG_LLM("Dropped replayed fragment: \"" + candidate + "\"");
                continue;
            }
            fragment = std::move(candidate);
            return true;
        }
    }

    // Wakes the consumer and every candidate; does not join
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            for (auto& flag : cancel_) {
                flag->store(true);
            }
        }
        cv_.notify_all();
        space_cv_.notify_all();
        watchdog_cv_.notify_all();
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shut_down_) return;
            shut_down_ = true;
        }
        cancel();

        if (watchdog_.joinable()) {
            watchdog_.join();
        }
        // closed_ prevents new candidates, so threads_ is stable here
        for (auto& t : threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
    }

    Error error() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_;
    }

    std::optional<size_t> winner() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return winner_;
    }

    size_t candidates_started() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return started_count_;
    }

    bool was_cancelled(size_t index) const {
        return index < cancel_.size() && cancel_[index]->load();
    }

    int64_t first_token_ms() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!first_token_at_) return -1;
        return ms_between(start_time_, *first_token_at_);
    }

private:
    void start_candidate_locked(size_t index) {
        started_[index] = true;
        started_count_++;
        LOG_LLM("Starting candidate " + std::to_string(index) + " (" + backends_[index]->name() + ")");
        threads_.emplace_back(&Impl::run_candidate, this, index);
    }

    void run_candidate(size_t index) {
        FragmentCallback on_fragment = [this, index](const std::string& raw) {
            return on_candidate_fragment(index, raw);
        };
        VoidResult result = backends_[index]->stream(turn_, on_fragment, *cancel_[index]);

        std::lock_guard<std::mutex> lock(mutex_);
        if (result.is_error()) {
            if (!winner_) {
                Logger::warn("[LLM] Candidate " + backends_[index]->name() + " failed: " + result.error().message);
                failures_.push_back(result.error());
            } else if (*winner_ == index) {
                Logger::warn("[LLM] Winning candidate " + backends_[index]->name() +
                             " ended early: " + result.error().message);
            } else {
                LOG_LLM("Losing candidate " + backends_[index]->name() + " ended: " + result.error().message);
            }
        }
        finished_count_++;
        on_candidate_finished_locked();
    }

    // Runs on the candidate's own thread for every received fragment
    bool on_candidate_fragment(size_t index, const std::string& raw) {
        if (cancel_[index]->load()) {
            return false;
        }
        std::string clean = utils::strip_disallowed_symbols(raw);

        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (!winner_) {
            winner_ = index;
            first_token_at_ = Clock::now();
            for (size_t j = 0; j < cancel_.size(); ++j) {
                if (j != index) cancel_[j]->store(true);
            }
            std::ostringstream oss;
            oss << "Winner: " << backends_[index]->name() << " after "
                << ms_between(start_time_, *first_token_at_) << " ms";
            LOG_LLM(oss.str());
            watchdog_cv_.notify_all();
        } else if (*winner_ != index) {
            return false;
        }

        if (clean.empty()) {
            return true;
        }
        space_cv_.wait(lock, [this] { return queue_.size() < OUTPUT_QUEUE_CAPACITY || closed_; });
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(clean));
        cv_.notify_one();
        return true;
    }

    void on_candidate_finished_locked() {
        if (finished_count_ < started_count_) {
            return;
        }
        if (!winner_ && !closed_ && backup_index_ && !started_[*backup_index_]) {
            LOG_LLM("Every candidate failed before the first token; starting backup early");
            start_candidate_locked(*backup_index_);
            return;
        }
        finish_locked();
    }

    void finish_locked() {
        terminal_ = true;
        if (!winner_ && !failures_.empty()) {
            bool quota = false;
            std::ostringstream oss;
            oss << "all " << started_count_ << " candidates failed:";
            for (const auto& f : failures_) {
                if (f.type == ErrorType::QuotaOrAuthError) quota = true;
                oss << " [" << f.message << "]";
            }
            if (quota) {
                std::string label = active_label_ ? active_label_() : std::string("default");
                Logger::warn("[LLM] " + oss.str());
                queue_.push_back(quota_advisory_text(label));
            } else {
                error_ = make_backend_error(oss.str());
            }
        }
        cv_.notify_all();
        watchdog_cv_.notify_all();
    }

    void watchdog_loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        auto deadline = start_time_ + std::chrono::milliseconds(config_.first_token_timeout_ms);
        watchdog_cv_.wait_until(lock, deadline, [this] {
            return winner_.has_value() || terminal_ || closed_ ||
                   (backup_index_ && started_[*backup_index_]);
        });
        if (winner_ || terminal_ || closed_) {
            return;
        }
        if (!backup_index_) {
            LOG_LLM("No first token after " + std::to_string(config_.first_token_timeout_ms) +
                    " ms and no backup configured");
            return;
        }
        if (started_[*backup_index_]) {
            return;
        }
        LOG_LLM("No first token after " + std::to_string(config_.first_token_timeout_ms) +
                " ms; starting backup");
        start_candidate_locked(*backup_index_);
    }

    std::vector<std::shared_ptr<ICompletionBackend>> backends_;
    CompletionConfig config_;
    ConversationTurn turn_;
    HedgedCompletionClient::LabelProvider active_label_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable space_cv_;
    std::condition_variable watchdog_cv_;

    std::vector<std::unique_ptr<std::atomic<bool>>> cancel_;
    std::vector<bool> started_;
    size_t started_count_ = 0;
    size_t finished_count_ = 0;
    std::optional<size_t> backup_index_;
    std::optional<size_t> winner_;
    TimePoint start_time_;
    std::optional<TimePoint> first_token_at_;

    std::deque<std::string> queue_;
    std::vector<Error> failures_;
    Error error_;
    bool terminal_ = false;
    bool closed_ = false;
    bool shut_down_ = false;

    std::vector<std::thread> threads_;
    std::thread watchdog_;

    // Consumer side only
    ReplayFilter filter_;
};

// ============================================================================
// FragmentStream
// ============================================================================

FragmentStream::FragmentStream(std::unique_ptr<Impl> impl) : pimpl_(std::move(impl)) {}

FragmentStream::~FragmentStream() = default;

bool FragmentStream::next(std::string& fragment) {
    return pimpl_->next(fragment);
}

void FragmentStream::cancel() {
    pimpl_->cancel();
}

Error FragmentStream::error() const {
    return pimpl_->error();
}

std::optional<size_t> FragmentStream::winner() const {
    return pimpl_->winner();
}

size_t FragmentStream::candidates_started() const {
    return pimpl_->candidates_started();
}

bool FragmentStream::was_cancelled(size_t index) const {
    return pimpl_->was_cancelled(index);
}

int64_t FragmentStream::first_token_ms() const {
    return pimpl_->first_token_ms();
}

// ============================================================================
// HedgedCompletionClient
// ============================================================================

HedgedCompletionClient::HedgedCompletionClient(std::vector<std::shared_ptr<ICompletionBackend>> backends,
                                               const CompletionConfig& config,
                                               LabelProvider active_label)
    : backends_(std::move(backends)), config_(config), active_label_(std::move(active_label)) {}

HedgedCompletionClient::~HedgedCompletionClient() = default;

std::unique_ptr<FragmentStream> HedgedCompletionClient::stream(ConversationTurn turn) {
    auto impl = std::make_unique<FragmentStream::Impl>(backends_, config_, std::move(turn), active_label_);
    impl->start();
    return std::make_unique<FragmentStream>(std::move(impl));
}

} // namespace lingo
