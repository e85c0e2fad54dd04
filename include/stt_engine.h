#pragma once

#include "common.h"
#include "config.h"
#include "errors.h"
#include <string>
#include <memory>

namespace lingo {

/**
 * @brief Speech-to-text collaborator: utterance in, transcript out
 */
class ISpeechToText {
public:
    virtual ~ISpeechToText() = default;

    virtual Result<Transcript> transcribe(const Utterance& utterance) = 0;
};

/**
 * @brief whisper.cpp transcriber, model kept resident for the session
 */
class STTEngine : public ISpeechToText {
public:
    explicit STTEngine(const STTConfig& config);
    ~STTEngine() override;

    // Non-copyable
    STTEngine(const STTEngine&) = delete;
    STTEngine& operator=(const STTEngine&) = delete;

    Result<Transcript> transcribe(const Utterance& utterance) override;

    bool is_ready() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace lingo
