#pragma once

#include "completion_backend.h"
#include "config.h"
#include "face_tracker.h"
#include "gesture_actuator.h"
#include "hedged_completion_client.h"
#include "speech_synthesizer.h"
#include "state_machine.h"
#include "stt_engine.h"
#include "voice_activity_recorder.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lingo {

/**
 * @brief Where the operator sees the conversation
 */
class IDisplaySurface {
public:
    virtual ~IDisplaySurface() = default;

    /// Text the operator said or typed
    virtual void show_user(const std::string& text) = 0;

    /// Full reply, shown once its audio has finished playing
    virtual void commit_reply(const std::string& text) = 0;

    /// Error or status line
    virtual void show_notice(const std::string& text) = 0;
};

/**
 * @brief Prints the conversation to stdout
 */
class ConsoleDisplay : public IDisplaySurface {
public:
    void show_user(const std::string& text) override;
    void commit_reply(const std::string& text) override;
    void show_notice(const std::string& text) override;

private:
    std::mutex mutex_;
};

/**
 * @brief Everything a turn talks to; all references must outlive the orchestrator
 */
struct TurnCollaborators {
    IUtteranceRecorder& recorder;
    ISpeechToText& stt;
    ICompletionSource& completion;
    ISpeechSynthesizer& synthesizer;
    IGestureActuator& actuator;
    IFaceTracker& tracker;
    IDisplaySurface& display;
};

/**
 * @brief Sequences conversational turns: LISTEN -> THINK -> TALK -> IDLE
 *
 * Turns run one at a time on a single control thread. For each turn:
 * - speak(): pause tracking, listen gesture, record, think gesture, transcribe
 * - submit_text(): pause tracking, think gesture (no recording)
 * - the completion race feeds a flusher thread whose chunks reach the
 *   synthesizer in order; the first chunk fed while THINKING sends talk
 * - after the end of the reply, once the synthesizer has been quiet for
 *   drain_holdoff_ms, the reply is committed to the display, stop is sent
 *   twice and the turn returns to IDLE
 * - face tracking resumes idle_settle_ms later
 *
 * Every failure still ends in stop gestures, IDLE and a scheduled tracker
 * resume, so the head is never left mid-gesture.
 */
class TurnOrchestrator {
public:
    TurnOrchestrator(const Config& config, TurnCollaborators collaborators);
    ~TurnOrchestrator();

    TurnOrchestrator(const TurnOrchestrator&) = delete;
    TurnOrchestrator& operator=(const TurnOrchestrator&) = delete;

    /// Start the control thread
    void start();

    /// Abort any running turn and join the control thread
    void stop();

    /**
     * @brief Request a spoken turn
     * @return False if a turn is already queued or running
     */
    bool speak();

    /**
     * @brief Request a typed turn
     * @return False if text is blank or a turn is already queued or running
     */
    bool submit_text(const std::string& text);

    /// Pause tracking and hand the camera to another flow (returns once it is released)
    void lend_camera();

    /// Take the camera back; tracking resumes after login_resume_ms
    void return_camera();

    /// Block until no turn is queued or running; false on timeout
    bool wait_until_idle(int timeout_ms);

    TurnState state() const;
    std::vector<TurnState> state_history() const;

    /// Messages carried into the next turn's context
    std::vector<ChatMessage> history() const;

    /// Turns that reached IDLE, successful or not
    size_t turns_completed() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace lingo
