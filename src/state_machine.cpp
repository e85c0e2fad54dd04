#include "state_machine.h"
#include "logger.h"
#include <mutex>

namespace lingo {

const char* turn_state_name(TurnState state) {
    switch (state) {
        case TurnState::Idle: return "IDLE";
        case TurnState::Listening: return "LISTENING";
        case TurnState::Thinking: return "THINKING";
        case TurnState::Talking: return "TALKING";
    }
    return "UNKNOWN";
}

class TurnStateMachine::Impl {
public:
    Impl() : state_(TurnState::Idle) {
        history_.push_back(state_);
    }

    TurnState get_state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    bool on_speak_trigger(const Action& before_enter) {
        return transition(TurnState::Idle, TurnState::Listening, before_enter);
    }

    bool on_utterance(const Action& before_enter) {
        return transition(TurnState::Listening, TurnState::Thinking, before_enter);
    }

    bool on_text_submitted(const Action& before_enter) {
        return transition(TurnState::Idle, TurnState::Thinking, before_enter);
    }

    bool on_first_chunk(const Action& before_enter) {
        return transition(TurnState::Thinking, TurnState::Talking, before_enter);
    }

    bool on_turn_finished() {
        Observer observer;
        TurnState from;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == TurnState::Idle) {
                return false;
            }
            from = state_;
            enter_locked(TurnState::Idle);
            observer = observer_;
        }
        if (observer) observer(from, TurnState::Idle);
        return true;
    }

    void set_observer(Observer observer) {
        std::lock_guard<std::mutex> lock(mutex_);
        observer_ = std::move(observer);
    }

    std::vector<TurnState> history() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return history_;
    }

private:
    bool transition(TurnState expected, TurnState next, const Action& before_enter) {
        Observer observer;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != expected) {
                LOG_DEBUG(std::string("Ignored transition to ") + turn_state_name(next) +
                          " while " + turn_state_name(state_));
                return false;
            }
            if (before_enter) before_enter();
            enter_locked(next);
            observer = observer_;
        }
        if (observer) observer(expected, next);
        return true;
    }

    void enter_locked(TurnState next) {
        LOG_TURN(std::string(turn_state_name(state_)) + " -> " + turn_state_name(next));
        state_ = next;
        history_.push_back(next);
    }

    mutable std::mutex mutex_;
    TurnState state_;
    std::vector<TurnState> history_;
    Observer observer_;
};

TurnStateMachine::TurnStateMachine() : pimpl_(std::make_unique<Impl>()) {}
TurnStateMachine::~TurnStateMachine() = default;

TurnState TurnStateMachine::get_state() const {
    return pimpl_->get_state();
}

bool TurnStateMachine::on_speak_trigger(const Action& before_enter) {
    return pimpl_->on_speak_trigger(before_enter);
}

bool TurnStateMachine::on_utterance(const Action& before_enter) {
    return pimpl_->on_utterance(before_enter);
}

bool TurnStateMachine::on_text_submitted(const Action& before_enter) {
    return pimpl_->on_text_submitted(before_enter);
}

bool TurnStateMachine::on_first_chunk(const Action& before_enter) {
    return pimpl_->on_first_chunk(before_enter);
}

bool TurnStateMachine::on_turn_finished() {
    return pimpl_->on_turn_finished();
}

void TurnStateMachine::set_observer(Observer observer) {
    pimpl_->set_observer(std::move(observer));
}

std::vector<TurnState> TurnStateMachine::history() const {
    return pimpl_->history();
}

} // namespace lingo
