#pragma once

#include "common.h"
#include <string>
#include <memory>

namespace lingo {

/**
 * @brief Continuous source of fixed-size mono PCM frames
 */
class IFrameSource {
public:
    virtual ~IFrameSource() = default;

    /**
     * @brief Open the device and start delivering frames
     * @return False if the device cannot be opened
     */
    virtual bool open(int sample_rate, int samples_per_frame) = 0;

    /**
     * @brief Next captured frame (blocking)
     * @return False on timeout, device error or when closed
     */
    virtual bool read_frame(AudioFrame& frame, int timeout_ms) = 0;

    virtual void close() = 0;
};

/**
 * @brief Destination for synthesized PCM
 */
class IAudioSink {
public:
    virtual ~IAudioSink() = default;

    /// Blocking write of count samples; false if the device failed
    virtual bool write(const Sample* samples, size_t count) = 0;
};

/**
 * @brief Microphone capture using PortAudio
 *
 * The PortAudio callback copies each buffer into a bounded frame queue;
 * read_frame() pops from it on the caller's thread. When the consumer falls
 * behind the oldest frames are dropped.
 *
 * Thread Safety:
 * - Audio callback runs in PortAudio's thread
 * - Frame queue is protected by a mutex
 */
class AudioInput : public IFrameSource {
public:
    explicit AudioInput(const std::string& device_name);
    ~AudioInput() override;

    AudioInput(const AudioInput&) = delete;
    AudioInput& operator=(const AudioInput&) = delete;

    bool open(int sample_rate, int samples_per_frame) override;
    bool read_frame(AudioFrame& frame, int timeout_ms) override;
    void close() override;

    /**
     * @brief Log all audio devices
     */
    static void list_devices();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Speaker output using a blocking PortAudio stream
 */
class AudioOutput : public IAudioSink {
public:
    explicit AudioOutput(const std::string& device_name);
    ~AudioOutput() override;

    AudioOutput(const AudioOutput&) = delete;
    AudioOutput& operator=(const AudioOutput&) = delete;

    /**
     * @brief Open the output device at the synthesizer's sample rate
     * @return False on error (logged)
     */
    bool open(int sample_rate);

    bool write(const Sample* samples, size_t count) override;

    void close();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace lingo
