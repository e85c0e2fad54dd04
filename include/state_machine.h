#pragma once

#include <functional>
#include <memory>
#include <vector>

namespace lingo {

/**
 * @brief Conversational turn state (one live instance per session)
 */
enum class TurnState {
    Idle,       ///< Waiting for a speak trigger or typed text
    Listening,  ///< Recording the operator's utterance
    Thinking,   ///< Transcribing and waiting for the first spoken chunk
    Talking     ///< Reply audio is being synthesized
};

const char* turn_state_name(TurnState state);

/**
 * @brief Turn lifecycle
 *
 * - Idle -> Listening (on_speak_trigger)
 * - Listening -> Thinking (on_utterance)
 * - Idle -> Thinking (on_text_submitted, typed path)
 * - Thinking -> Talking (on_first_chunk, at most once per turn)
 * - Listening/Thinking/Talking -> Idle (on_turn_finished)
 *
 * Events that do not apply in the current state are ignored and return
 * false. An event's before_enter action runs only when the transition
 * applies, while the machine is locked and before the new state is entered,
 * so no reader ever sees a state whose gesture has not been sent yet.
 * before_enter must not call back into the state machine.
 */
class TurnStateMachine {
public:
    using Observer = std::function<void(TurnState from, TurnState to)>;
    using Action = std::function<void()>;

    TurnStateMachine();
    ~TurnStateMachine();

    TurnStateMachine(const TurnStateMachine&) = delete;
    TurnStateMachine& operator=(const TurnStateMachine&) = delete;

    TurnState get_state() const;

    bool on_speak_trigger(const Action& before_enter = Action());
    bool on_utterance(const Action& before_enter = Action());
    bool on_text_submitted(const Action& before_enter = Action());
    bool on_first_chunk(const Action& before_enter = Action());
    bool on_turn_finished();

    /// Called after every transition, on the thread that caused it
    void set_observer(Observer observer);

    /// Every state entered since construction, starting with Idle
    std::vector<TurnState> history() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace lingo
