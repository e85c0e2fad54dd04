#include "audio_io.h"
#include "logger.h"
#include <portaudio.h>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <sstream>

namespace lingo {

namespace {

constexpr size_t MAX_QUEUED_FRAMES = 100;

// Resolve "default", a numeric index, or an exact device name. -1 if none matches.
int find_device(const std::string& name, bool is_input) {
    int num_devices = Pa_GetDeviceCount();

    if (name == "default" || name.empty()) {
        int default_idx = is_input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
        if (default_idx != paNoDevice) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(default_idx);
            std::ostringstream oss;
            oss << "Using default " << (is_input ? "input" : "output")
                << " device: [" << default_idx << "] " << (info ? info->name : "?");
            Logger::debug(oss.str());
            return default_idx;
        }
        return -1;
    }

    try {
        int device_idx = std::stoi(name);
        if (device_idx >= 0 && device_idx < num_devices && Pa_GetDeviceInfo(device_idx)) {
            return device_idx;
        }
    } catch (const std::exception&) {
        // Not a number, continue to name matching
    }

    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->name != name) continue;
        int channels = is_input ? info->maxInputChannels : info->maxOutputChannels;
        if (channels > 0) {
            return i;
        }
    }

    return -1;
}

} // anonymous namespace

// ============================================================================
// AudioInput
// ============================================================================

class AudioInput::Impl {
public:
    explicit Impl(const std::string& device_name)
        : device_name_(device_name), stream_(nullptr), initialized_(false), open_(false) {}

    ~Impl() {
        close();
    }

    bool open(int sample_rate, int samples_per_frame) {
        close();

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
            return false;
        }
        initialized_ = true;

        int idx = find_device(device_name_, true);
        const PaDeviceInfo* info = idx >= 0 ? Pa_GetDeviceInfo(idx) : nullptr;
        if (!info || info->maxInputChannels == 0) {
            Logger::error("Input device not found: " + device_name_);
            close();
            return false;
        }

        PaStreamParameters params;
        params.device = idx;
        params.channelCount = 1;
        params.sampleFormat = paInt16;
        params.suggestedLatency = info->defaultLowInputLatency;
        params.hostApiSpecificStreamInfo = nullptr;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.clear();
            overflow_count_ = 0;
        }

        err = Pa_OpenStream(&stream_, &params, nullptr, sample_rate,
                            static_cast<unsigned long>(samples_per_frame), paClipOff,
                            input_callback, this);
        if (err != paNoError) {
            Logger::error("Failed to open input stream: " + std::string(Pa_GetErrorText(err)));
            stream_ = nullptr;
            close();
            return false;
        }

        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            Logger::error("Failed to start input stream: " + std::string(Pa_GetErrorText(err)));
            close();
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }

        std::ostringstream oss;
        oss << "Capturing from [" << idx << "] " << info->name << " at " << sample_rate << " Hz";
        LOG_AUDIO(oss.str());
        return true;
    }

    bool read_frame(AudioFrame& frame, int timeout_ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool ready = cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                  [this] { return !queue_.empty() || !open_; });
        if (!ready || queue_.empty()) {
            return false;
        }
        frame = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = false;
        }
        cv_.notify_all();
        if (stream_) {
            Pa_StopStream(stream_);
            Pa_CloseStream(stream_);
            stream_ = nullptr;
        }
        if (initialized_) {
            Pa_Terminate();
            initialized_ = false;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
        if (overflow_count_ > 0) {
            LOG_AUDIO("Input overflowed " + std::to_string(overflow_count_) + " times");
            overflow_count_ = 0;
        }
    }

private:
    static int input_callback(const void* input, void* output,
                              unsigned long frame_count,
                              const PaStreamCallbackTimeInfo* time_info,
                              PaStreamCallbackFlags status_flags,
                              void* user_data) {
        (void)output;
        (void)time_info;
        Impl* self = static_cast<Impl*>(user_data);
        if (!input) {
            return paContinue;
        }
        const Sample* in = static_cast<const Sample*>(input);
        {
            std::lock_guard<std::mutex> lock(self->mutex_);
            if (status_flags & paInputOverflow) {
                self->overflow_count_++;
            }
            if (self->queue_.size() >= MAX_QUEUED_FRAMES) {
                self->queue_.pop_front();
            }
            self->queue_.emplace_back(in, in + frame_count);
        }
        self->cv_.notify_one();
        return paContinue;
    }

    std::string device_name_;
    PaStream* stream_;
    bool initialized_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<AudioFrame> queue_;
    bool open_;
    size_t overflow_count_ = 0;
};

AudioInput::AudioInput(const std::string& device_name)
    : pimpl_(std::make_unique<Impl>(device_name)) {}

AudioInput::~AudioInput() = default;

bool AudioInput::open(int sample_rate, int samples_per_frame) {
    return pimpl_->open(sample_rate, samples_per_frame);
}

bool AudioInput::read_frame(AudioFrame& frame, int timeout_ms) {
    return pimpl_->read_frame(frame, timeout_ms);
}

void AudioInput::close() {
    pimpl_->close();
}

void AudioInput::list_devices() {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
        return;
    }

    int num_devices = Pa_GetDeviceCount();
    Logger::info("Available audio devices:");

    for (int i = 0; i < num_devices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;
        std::ostringstream oss;
        oss << "  [" << i << "] " << info->name;
        if (info->maxInputChannels > 0) oss << " (IN:" << info->maxInputChannels << ")";
        if (info->maxOutputChannels > 0) oss << " (OUT:" << info->maxOutputChannels << ")";
        Logger::info(oss.str());
    }

    Pa_Terminate();
}

// ============================================================================
// AudioOutput
// ============================================================================

class AudioOutput::Impl {
public:
    explicit Impl(const std::string& device_name)
        : device_name_(device_name), stream_(nullptr), initialized_(false) {}

    ~Impl() {
        close();
    }

    bool open(int sample_rate) {
        close();

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
            return false;
        }
        initialized_ = true;

        int idx = find_device(device_name_, false);
        const PaDeviceInfo* info = idx >= 0 ? Pa_GetDeviceInfo(idx) : nullptr;
        if (!info) {
            Logger::error("Output device not found: " + device_name_);
            close();
            return false;
        }

        PaStreamParameters params;
        params.device = idx;
        params.channelCount = 1;
        params.sampleFormat = paInt16;
        params.suggestedLatency = info->defaultLowOutputLatency;
        params.hostApiSpecificStreamInfo = nullptr;

        // Blocking stream: the synthesizer pump thread paces itself on Pa_WriteStream
        err = Pa_OpenStream(&stream_, nullptr, &params, sample_rate,
                            paFramesPerBufferUnspecified, paClipOff, nullptr, nullptr);
        if (err != paNoError) {
            Logger::error("Failed to open output stream: " + std::string(Pa_GetErrorText(err)));
            stream_ = nullptr;
            close();
            return false;
        }

        err = Pa_StartStream(stream_);
        if (err != paNoError) {
            Logger::error("Failed to start output stream: " + std::string(Pa_GetErrorText(err)));
            close();
            return false;
        }

        std::ostringstream oss;
        oss << "Playing to [" << idx << "] " << info->name << " at " << sample_rate << " Hz";
        LOG_AUDIO(oss.str());
        return true;
    }

    bool write(const Sample* samples, size_t count) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stream_) return false;
        PaError err = Pa_WriteStream(stream_, samples, static_cast<unsigned long>(count));
        if (err == paOutputUnderflowed) {
            LOG_AUDIO("Output underflow");
        } else if (err != paNoError) {
            Logger::error("Output write failed: " + std::string(Pa_GetErrorText(err)));
            return false;
        }
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stream_) {
            Pa_StopStream(stream_);
            Pa_CloseStream(stream_);
            stream_ = nullptr;
        }
        if (initialized_) {
            Pa_Terminate();
            initialized_ = false;
        }
    }

private:
    std::string device_name_;
    PaStream* stream_;
    bool initialized_;
    std::mutex mutex_;
};

AudioOutput::AudioOutput(const std::string& device_name)
    : pimpl_(std::make_unique<Impl>(device_name)) {}

AudioOutput::~AudioOutput() = default;

bool AudioOutput::open(int sample_rate) {
    return pimpl_->open(sample_rate);
}

bool AudioOutput::write(const Sample* samples, size_t count) {
    return pimpl_->write(samples, count);
}

void AudioOutput::close() {
    pimpl_->close();
}

} // namespace lingo
