#pragma once

#include "audio_io.h"
#include "chunking_flusher.h"
#include "common.h"
#include "config.h"
#include "errors.h"
#include <memory>
#include <string>
#include <vector>

namespace lingo {

/**
 * @brief Streaming text-to-speech collaborator fed chunk by chunk
 */
class ISpeechSynthesizer {
public:
    virtual ~ISpeechSynthesizer() = default;

    /// Bring the engine up (idempotent)
    virtual VoidResult start() = 0;

    /**
     * @brief Queue one chunk for speech
     *
     * Sentence-final chunks end with a line break so the engine closes the
     * sentence; others end with a space so it keeps accumulating.
     * @return SynthesisPipeError if the engine could not be reached even after a restart
     */
    virtual VoidResult feed(const TextChunk& chunk) = 0;

    /**
     * @brief Milliseconds since the engine last accepted text or produced audio
     *
     * The turn treats playback as drained once this exceeds its hold-off.
     */
    virtual int64_t drained_since_ms() const = 0;

    virtual void close() = 0;
};

/**
 * @brief Persistent Piper process: text on stdin, raw PCM on stdout
 *
 * A pump thread copies stdout to the audio sink in 4096-byte reads. A broken
 * stdin pipe restarts the process and the write is retried once.
 */
class PiperSynthesizer : public ISpeechSynthesizer {
public:
    /**
     * @param command Process argv; empty runs piper_command(config)
     */
    PiperSynthesizer(const TTSConfig& config, IAudioSink& sink,
                     std::vector<std::string> command = {});
    ~PiperSynthesizer() override;

    PiperSynthesizer(const PiperSynthesizer&) = delete;
    PiperSynthesizer& operator=(const PiperSynthesizer&) = delete;

    VoidResult start() override;
    VoidResult feed(const TextChunk& chunk) override;
    int64_t drained_since_ms() const override;
    void close() override;

    /// Output rate: config value, else the voice json, else 22050
    int sample_rate() const;

    /// Number of times the process was restarted after a broken pipe
    int restarts() const;

    /// Samples handed to the sink since construction
    size_t samples_written() const;

    /// Piper argv for config (binary, voice, raw output, sentence silence)
    static std::vector<std::string> piper_command(const TTSConfig& config);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace lingo
