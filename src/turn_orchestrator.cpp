#include "turn_orchestrator.h"
#include "bounded_queue.h"
#include "chunking_flusher.h"
#include "logger.h"
#include "utils.h"
#include <atomic>
#include <condition_variable>
#include <iostream>
#include <optional>
#include <random>
#include <thread>

namespace lingo {

// ============================================================================
// ConsoleDisplay
// ============================================================================

void ConsoleDisplay::show_user(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "You: " << text << std::endl;
}

void ConsoleDisplay::commit_reply(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "Lingo: " << text << std::endl;
}

void ConsoleDisplay::show_notice(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "[!] " << text << std::endl;
}

// ============================================================================
// TurnOrchestrator
// ============================================================================

namespace {

constexpr size_t MAX_STORED_HISTORY = 32;
constexpr int CHUNK_POLL_MS = 100;
constexpr int DRAIN_POLL_MS = 20;

enum class RequestType {
    Speak,
    Text
};

struct TurnRequest {
    RequestType type;
    std::string text;
};

// Either a chunk for the synthesizer or the end-of-reply sentinel
struct ChunkItem {
    bool end;
    TextChunk chunk;
};

} // anonymous namespace

class TurnOrchestrator::Impl {
public:
    Impl(const Config& config, TurnCollaborators collaborators)
        : config_(config)
        , c_(collaborators)
        , rng_(std::random_device{}()) {}

    ~Impl() {
        stop();
    }

    void start() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (thread_.joinable()) return;
        stopping_ = false;
        thread_ = std::thread(&Impl::control_loop, this);
        LOG_TURN("Orchestrator started");
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!thread_.joinable() || stopping_) return;
            stopping_ = true;
        }
        cv_.notify_all();
        c_.recorder.cancel();
        {
            std::lock_guard<std::mutex> lock(active_mutex_);
            if (active_stream_) active_stream_->cancel();
            if (active_queue_) active_queue_->close();
        }
        thread_.join();
        idle_cv_.notify_all();
        LOG_TURN("Orchestrator stopped");
    }

    bool speak() {
        return post({RequestType::Speak, ""});
    }

    bool submit_text(const std::string& text) {
        std::string clean = utils::trim_copy(text);
        if (clean.empty()) return false;
        return post({RequestType::Text, clean});
    }

    void lend_camera() {
        std::lock_guard<std::mutex> lock(mutex_);
        lent_ = true;
        resume_at_.reset();
        c_.tracker.pause();
        LOG_TURN("Camera lent");
    }

    void return_camera() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lent_ = false;
            if (!busy_ && !pending_) {
                schedule_resume_locked(config_.turn.login_resume_ms);
            }
        }
        cv_.notify_all();
        LOG_TURN("Camera returned");
    }

    bool wait_until_idle(int timeout_ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                 [this] { return !busy_ && !pending_; });
    }

    TurnState state() const {
        return state_.get_state();
    }

    std::vector<TurnState> state_history() const {
        return state_.history();
    }

    std::vector<ChatMessage> history() const {
        std::lock_guard<std::mutex> lock(history_mutex_);
        return history_;
    }

    size_t turns_completed() const {
        return turns_completed_.load();
    }

private:
    bool post(TurnRequest request) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!thread_.joinable() || stopping_) {
                Logger::warn("Orchestrator not running; request ignored");
                return false;
            }
            if (busy_ || pending_) {
                LOG_TURN("Turn already in progress; request ignored");
                return false;
            }
            pending_ = std::move(request);
        }
        cv_.notify_all();
        return true;
    }

    void schedule_resume_locked(int delay_ms) {
        resume_at_ = Clock::now() + std::chrono::milliseconds(delay_ms);
    }

    bool stopping() {
        std::lock_guard<std::mutex> lock(mutex_);
        return stopping_;
    }

    // False if shutdown interrupted the wait
    bool sleep_ms(int ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, std::chrono::milliseconds(ms), [this] { return stopping_; });
    }

    void control_loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopping_) {
            if (pending_) {
                TurnRequest request = std::move(*pending_);
                pending_.reset();
                busy_ = true;
                resume_at_.reset();
                lock.unlock();

                run_turn(request);

                lock.lock();
                busy_ = false;
                turns_completed_++;
                if (!lent_ && !stopping_) {
                    schedule_resume_locked(config_.turn.idle_settle_ms);
                }
                idle_cv_.notify_all();
                continue;
            }

            if (resume_at_ && Clock::now() >= *resume_at_) {
                resume_at_.reset();
                if (!lent_) {
                    c_.tracker.resume();
                }
                continue;
            }

            if (resume_at_) {
                cv_.wait_until(lock, *resume_at_);
            } else {
                cv_.wait(lock);
            }
        }
    }

    void run_turn(const TurnRequest& request) {
        int turn_id = ++turn_id_;
        if (request.type == RequestType::Speak) {
            run_spoken_turn(turn_id);
        } else {
            run_typed_turn(turn_id, request.text);
        }
    }

    void run_spoken_turn(int turn_id) {
        const char* listen = std::uniform_int_distribution<int>(0, 1)(rng_) == 0 ? gesture::LISTEN_LEFT
                                                                                 : gesture::LISTEN_RIGHT;
        bool listening = state_.on_speak_trigger([this, listen] {
            c_.tracker.pause();
            c_.actuator.send(listen);
        });
        if (!listening) return;
        LOG_TRACE(turn_id, "listen", "");

        if (stopping()) {
            finish_turn(turn_id);
            return;
        }
        Result<Utterance> recorded = c_.recorder.record();
        if (stopping()) {
            finish_turn(turn_id);
            return;
        }
        if (recorded.is_error()) {
            fail_turn(turn_id, recorded.error());
            return;
        }
        const Utterance& utterance = recorded.value();
        if (utterance.empty()) {
            LOG_TURN("No speech detected");
            end_quietly(turn_id);
            return;
        }
        LOG_TRACE(turn_id, "recorded", "audio_ms=" + std::to_string(utterance.duration_ms()));

        state_.on_utterance([this] { c_.actuator.send(gesture::THINK); });

        Result<Transcript> transcript = c_.stt.transcribe(utterance);
        if (transcript.is_error()) {
            fail_turn(turn_id, transcript.error());
            return;
        }
        std::string text = utils::trim_copy(transcript.value().text);
        LOG_TRACE(turn_id, "stt", "ms=" + std::to_string(transcript.value().processing_ms) + " text=\"" + text + "\"");
        if (text.empty()) {
            LOG_TURN("Empty transcript");
            end_quietly(turn_id);
            return;
        }
        reply_to(turn_id, text);
    }

    void run_typed_turn(int turn_id, const std::string& text) {
        bool thinking = state_.on_text_submitted([this] {
            c_.tracker.pause();
            c_.actuator.send(gesture::THINK);
        });
        if (!thinking) return;
        LOG_TRACE(turn_id, "typed", "text=\"" + text + "\"");
        reply_to(turn_id, text);
    }

    void reply_to(int turn_id, const std::string& text) {
        c_.display.show_user(text);

        ConversationTurn turn = ConversationTurn::build(
            config_.completion.system_prompt, history(), text,
            static_cast<size_t>(config_.completion.history_turns));

        FullReplyBuffer reply;
        ChunkingFlusher flusher(config_.chunker, reply);
        BoundedQueue<ChunkItem> queue(config_.turn.chunk_queue_capacity);
        std::unique_ptr<FragmentStream> stream = c_.completion.stream(std::move(turn));
        set_active(stream.get(), &queue);
        if (stopping()) {
            stream->cancel();
            queue.close();
        }

        FragmentStream* source = stream.get();
        std::thread producer([source, &flusher, &queue] {
            std::string fragment;
            while (source->next(fragment)) {
                std::optional<TextChunk> chunk = flusher.push(fragment);
                if (chunk && !queue.push(ChunkItem{false, std::move(*chunk)})) return;
            }
            std::optional<TextChunk> last = flusher.finish();
            if (last && !queue.push(ChunkItem{false, std::move(*last)})) return;
            queue.push(ChunkItem{true, TextChunk()});
        });

        Error failure;
        bool reached_end = false;
        size_t fed = 0;
        while (!stopping()) {
            std::optional<ChunkItem> item = queue.pop_for(std::chrono::milliseconds(CHUNK_POLL_MS));
            if (!item) {
                if (queue.closed()) break;
                continue;
            }
            if (item->end) {
                reached_end = true;
                break;
            }
            VoidResult result = c_.synthesizer.feed(item->chunk);
            if (result.is_error()) {
                failure = result.error();
                break;
            }
            fed++;
            if (state_.on_first_chunk([this] { c_.actuator.send(gesture::TALK); })) {
                LOG_TRACE(turn_id, "talk", "first_token_ms=" + std::to_string(stream->first_token_ms()));
            }
        }

        if (!reached_end) {
            stream->cancel();
            queue.close();
        }
        producer.join();
        set_active(nullptr, nullptr);
        Error backend_error = stream->error();
        stream.reset();

        if (failure) {
            fail_turn(turn_id, failure);
            return;
        }
        if (!reached_end) {
            finish_turn(turn_id);
            return;
        }
        if (backend_error && fed == 0) {
            fail_turn(turn_id, backend_error);
            return;
        }

        if (!wait_for_drain()) {
            LOG_TURN("Shutdown before playback drained; reply not committed");
            finish_turn(turn_id);
            return;
        }

        std::string full = reply.text();
        if (!full.empty()) {
            c_.display.commit_reply(full);
            remember(text, full);
        }
        LOG_TRACE(turn_id, "commit", "chunks=" + std::to_string(fed) + " chars=" + std::to_string(full.size()));
        finish_turn(turn_id);
    }

    bool wait_for_drain() {
        while (c_.synthesizer.drained_since_ms() < config_.turn.drain_holdoff_ms) {
            if (!sleep_ms(DRAIN_POLL_MS)) return false;
        }
        return true;
    }

    // Empty utterance or transcript: a single stop, nothing else ran
    void end_quietly(int turn_id) {
        c_.actuator.send(gesture::STOP);
        state_.on_turn_finished();
        LOG_TRACE(turn_id, "idle", "empty");
    }

    void fail_turn(int turn_id, const Error& error) {
        Logger::error("Turn " + std::to_string(turn_id) + " failed: " + error.describe());
        c_.display.show_notice(error.describe());
        finish_turn(turn_id);
    }

    // Stop is sent twice in case the controller drops one
    void finish_turn(int turn_id) {
        c_.actuator.send(gesture::STOP);
        sleep_ms(config_.turn.stop_repeat_gap_ms);
        c_.actuator.send(gesture::STOP);
        state_.on_turn_finished();
        LOG_TRACE(turn_id, "idle", "");
    }

    void remember(const std::string& user_text, const std::string& reply) {
        std::lock_guard<std::mutex> lock(history_mutex_);
        history_.push_back({MessageRole::User, user_text});
        history_.push_back({MessageRole::Assistant, reply});
        if (history_.size() > MAX_STORED_HISTORY) {
            history_.erase(history_.begin(),
                           history_.begin() + static_cast<std::ptrdiff_t>(history_.size() - MAX_STORED_HISTORY));
        }
    }

    void set_active(FragmentStream* stream, BoundedQueue<ChunkItem>* queue) {
        std::lock_guard<std::mutex> lock(active_mutex_);
        active_stream_ = stream;
        active_queue_ = queue;
    }

    Config config_;
    TurnCollaborators c_;
    TurnStateMachine state_;
    std::mt19937 rng_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::optional<TurnRequest> pending_;
    std::optional<TimePoint> resume_at_;
    bool busy_ = false;
    bool stopping_ = false;
    bool lent_ = false;
    std::thread thread_;

    std::mutex active_mutex_;
    FragmentStream* active_stream_ = nullptr;
    BoundedQueue<ChunkItem>* active_queue_ = nullptr;

    mutable std::mutex history_mutex_;
    std::vector<ChatMessage> history_;

    std::atomic<size_t> turns_completed_{0};
    int turn_id_ = 0;
};

TurnOrchestrator::TurnOrchestrator(const Config& config, TurnCollaborators collaborators)
    : pimpl_(std::make_unique<Impl>(config, collaborators)) {}

TurnOrchestrator::~TurnOrchestrator() = default;

void TurnOrchestrator::start() {
    pimpl_->start();
}

void TurnOrchestrator::stop() {
    pimpl_->stop();
}

bool TurnOrchestrator::speak() {
    return pimpl_->speak();
}

bool TurnOrchestrator::submit_text(const std::string& text) {
    return pimpl_->submit_text(text);
}

void TurnOrchestrator::lend_camera() {
    pimpl_->lend_camera();
}

void TurnOrchestrator::return_camera() {
    pimpl_->return_camera();
}

bool TurnOrchestrator::wait_until_idle(int timeout_ms) {
    return pimpl_->wait_until_idle(timeout_ms);
}

TurnState TurnOrchestrator::state() const {
    return pimpl_->state();
}

std::vector<TurnState> TurnOrchestrator::state_history() const {
    return pimpl_->state_history();
}

std::vector<ChatMessage> TurnOrchestrator::history() const {
    return pimpl_->history();
}

size_t TurnOrchestrator::turns_completed() const {
    return pimpl_->turns_completed();
}

} // namespace lingo
