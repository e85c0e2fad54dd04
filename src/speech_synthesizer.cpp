#include "speech_synthesizer.h"
#include "logger.h"
#include "path_utils.h"
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <limits>
#include <mutex>
#include <sstream>
#include <thread>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lingo {

namespace {

constexpr size_t PUMP_READ_BYTES = 4096;

std::once_flag sigpipe_once;

int64_t now_ms() {
    return std::chrono::duration_cast<Duration>(Clock::now().time_since_epoch()).count();
}

std::string find_piper_binary(const std::string& configured) {
    if (!configured.empty()) {
        std::ifstream test(configured);
        if (test.good()) return configured;
        Logger::warn("[TTS] Configured piper not found at " + configured + ", searching");
    }

    std::vector<std::string> candidates;
    const char* home = std::getenv("HOME");
    if (home) {
        candidates.push_back(std::string(home) + "/bin/piper");
        candidates.push_back(std::string(home) + "/.local/bin/piper");
    }
    candidates.push_back("/usr/local/bin/piper");
    candidates.push_back("/usr/bin/piper");

    for (const auto& path : candidates) {
        std::ifstream test(path);
        if (test.good()) return path;
    }
    return "piper";  // left to execvp's PATH lookup
}

// Returns 0 or the errno of the failed write
int write_all(int fd, const std::string& data) {
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = ::write(fd, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno;
        }
        offset += static_cast<size_t>(n);
    }
    return 0;
}

} // anonymous namespace

class PiperSynthesizer::Impl {
public:
    Impl(const TTSConfig& config, IAudioSink& sink, std::vector<std::string> command)
        : config_(config)
        , sink_(sink)
        , command_(command.empty() ? PiperSynthesizer::piper_command(config) : std::move(command))
        , sample_rate_(config.sample_rate > 0
                           ? config.sample_rate
                           : read_voice_sample_rate(config.voice_path, DEFAULT_SYNTH_SAMPLE_RATE)) {
        std::call_once(sigpipe_once, [] { signal(SIGPIPE, SIG_IGN); });
    }

    ~Impl() {
        close();
    }

    VoidResult start() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pid_ > 0) {
            return VoidResult();
        }
        return start_process_locked();
    }

    VoidResult feed(const TextChunk& chunk) {
        if (chunk.text.empty()) {
            return VoidResult();
        }
        std::string line = chunk.text + (chunk.is_sentence_final ? "\n" : " ");

        std::lock_guard<std::mutex> lock(mutex_);
        if (pid_ <= 0) {
            auto started = start_process_locked();
            if (started.is_error()) {
                return make_pipe_error("synthesizer not running: " + started.error().message);
            }
        }

        int err = write_all(stdin_fd_, line);
        if (err == EPIPE || err == EBADF) {
            Logger::warn("[TTS] Synthesizer pipe broken, restarting");
            restarts_++;
            stop_process_locked();
            auto restarted = start_process_locked();
            if (restarted.is_error()) {
                return make_pipe_error("synthesizer restart failed: " + restarted.error().message);
            }
            err = write_all(stdin_fd_, line);
        }
        if (err != 0) {
            return make_pipe_error(std::string("write to synthesizer failed: ") + std::strerror(err));
        }

        last_activity_ms_ = now_ms();
        LOG_TTS(std::string(chunk.is_sentence_final ? "Fed final: \"" : "Fed: \"") + chunk.text + "\"");
        return VoidResult();
    }

    int64_t drained_since_ms() const {
        int64_t last = last_activity_ms_.load();
        if (last < 0) {
            return std::numeric_limits<int64_t>::max();
        }
        return now_ms() - last;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_process_locked();
    }

    int sample_rate() const { return sample_rate_; }
    int restarts() const { return restarts_.load(); }
    size_t samples_written() const { return samples_written_.load(); }

private:
    VoidResult start_process_locked() {
        int to_child[2] = {-1, -1};
        int from_child[2] = {-1, -1};
        if (pipe(to_child) == -1) {
            return make_pipe_error(std::string("pipe: ") + std::strerror(errno));
        }
        if (pipe(from_child) == -1) {
            int saved = errno;
            ::close(to_child[0]);
            ::close(to_child[1]);
            return make_pipe_error(std::string("pipe: ") + std::strerror(saved));
        }

        // argv must be built before fork
        std::vector<char*> argv;
        for (auto& arg : command_) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        pid_t pid = fork();
        if (pid == -1) {
            int saved = errno;
            ::close(to_child[0]);
            ::close(to_child[1]);
            ::close(from_child[0]);
            ::close(from_child[1]);
            return make_pipe_error(std::string("fork: ") + std::strerror(saved));
        }

        if (pid == 0) {
            dup2(to_child[0], STDIN_FILENO);
            dup2(from_child[1], STDOUT_FILENO);
            ::close(to_child[0]);
            ::close(to_child[1]);
            ::close(from_child[0]);
            ::close(from_child[1]);
            int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0) {
                dup2(devnull, STDERR_FILENO);
                ::close(devnull);
            }
            execvp(argv[0], argv.data());
            _exit(127);
        }

        ::close(to_child[0]);
        ::close(from_child[1]);
        fcntl(to_child[1], F_SETFD, FD_CLOEXEC);
        fcntl(from_child[0], F_SETFD, FD_CLOEXEC);

        pid_ = pid;
        stdin_fd_ = to_child[1];
        stdout_fd_ = from_child[0];
        pump_ = std::thread(&Impl::pump_loop, this, stdout_fd_);

        LOG_TTS("Synthesizer started: " + command_.front() + " (PID " + std::to_string(pid_) +
                ", " + std::to_string(sample_rate_) + " Hz)");
        return VoidResult();
    }

    void stop_process_locked() {
        if (pid_ <= 0) {
            return;
        }
        if (stdin_fd_ >= 0) {
            ::close(stdin_fd_);
            stdin_fd_ = -1;
        }
        kill(pid_, SIGTERM);
        int status = 0;
        waitpid(pid_, &status, 0);
        pid_ = -1;

        // Child is gone, so the pump sees EOF
        if (pump_.joinable()) {
            pump_.join();
        }
        if (stdout_fd_ >= 0) {
            ::close(stdout_fd_);
            stdout_fd_ = -1;
        }
        LOG_TTS("Synthesizer stopped");
    }

    void pump_loop(int fd) {
        char buffer[PUMP_READ_BYTES];
        bool have_odd = false;
        char odd = 0;
        bool sink_failed = false;
        AudioBuffer samples;
        samples.reserve(PUMP_READ_BYTES / 2 + 1);

        while (true) {
            ssize_t n = ::read(fd, buffer, sizeof(buffer));
            if (n < 0) {
                if (errno == EINTR) continue;
                Logger::warn(std::string("[TTS] Read from synthesizer failed: ") + std::strerror(errno));
                break;
            }
            if (n == 0) {
                break;
            }
            last_activity_ms_ = now_ms();

            // Raw output is little-endian int16; a read may split a sample
            samples.clear();
            ssize_t i = 0;
            if (have_odd) {
                samples.push_back(static_cast<Sample>(
                    static_cast<uint8_t>(odd) | (static_cast<int8_t>(buffer[0]) << 8)));
                have_odd = false;
                i = 1;
            }
            for (; i + 1 < n; i += 2) {
                samples.push_back(static_cast<Sample>(
                    static_cast<uint8_t>(buffer[i]) | (static_cast<int8_t>(buffer[i + 1]) << 8)));
            }
            if (i < n) {
                odd = buffer[i];
                have_odd = true;
            }

            if (samples.empty()) continue;
            if (!sink_.write(samples.data(), samples.size())) {
                if (!sink_failed) {
                    Logger::error("[TTS] Audio sink rejected synthesized audio");
                    sink_failed = true;
                }
                continue;
            }
            samples_written_ += samples.size();
            last_activity_ms_ = now_ms();
        }
    }

    TTSConfig config_;
    IAudioSink& sink_;
    std::vector<std::string> command_;
    int sample_rate_;

    std::mutex mutex_;
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    std::thread pump_;

    std::atomic<int64_t> last_activity_ms_{-1};
    std::atomic<int> restarts_{0};
    std::atomic<size_t> samples_written_{0};
};

PiperSynthesizer::PiperSynthesizer(const TTSConfig& config, IAudioSink& sink, std::vector<std::string> command)
    : pimpl_(std::make_unique<Impl>(config, sink, std::move(command))) {}

PiperSynthesizer::~PiperSynthesizer() = default;

VoidResult PiperSynthesizer::start() {
    return pimpl_->start();
}

VoidResult PiperSynthesizer::feed(const TextChunk& chunk) {
    return pimpl_->feed(chunk);
}

int64_t PiperSynthesizer::drained_since_ms() const {
    return pimpl_->drained_since_ms();
}

void PiperSynthesizer::close() {
    pimpl_->close();
}

int PiperSynthesizer::sample_rate() const {
    return pimpl_->sample_rate();
}

int PiperSynthesizer::restarts() const {
    return pimpl_->restarts();
}

size_t PiperSynthesizer::samples_written() const {
    return pimpl_->samples_written();
}

std::vector<std::string> PiperSynthesizer::piper_command(const TTSConfig& config) {
    std::vector<std::string> argv;
    argv.push_back(find_piper_binary(config.piper_path));
    argv.push_back("--model");
    argv.push_back(config.voice_path);
    argv.push_back("--output-raw");
    std::ostringstream silence;
    silence << config.sentence_silence;
    argv.push_back("--sentence_silence");
    argv.push_back(silence.str());
    if (!config.espeak_data_path.empty()) {
        argv.push_back("--espeak_data");
        argv.push_back(config.espeak_data_path);
    }
    return argv;
}

} // namespace lingo
