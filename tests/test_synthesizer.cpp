/**
 * Synthesizer process plumbing with /bin/cat standing in for piper.
 * Asserts:
 * - Chunk text reaches the process with "\n" after final chunks and " " otherwise.
 * - The pump turns the process output into little-endian samples on the sink.
 * - drained_since_ms() restarts on every feed and output.
 * - A process that exits is restarted once and the write retried.
 * - The piper command line and voice sample rate come from config.
 */

#include "audio_io.h"
#include "chunking_flusher.h"
#include "config.h"
#include "errors.h"
#include "path_utils.h"
#include "speech_synthesizer.h"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace lingo;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

class CollectingSink : public IAudioSink {
public:
    bool write(const Sample* samples, size_t count) override {
        std::lock_guard<std::mutex> lock(mutex_);
        samples_.insert(samples_.end(), samples, samples + count);
        return true;
    }

    // Reassemble the bytes cat echoed back
    std::string bytes() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string out;
        for (Sample s : samples_) {
            out.push_back(static_cast<char>(static_cast<uint16_t>(s) & 0xFF));
            out.push_back(static_cast<char>((static_cast<uint16_t>(s) >> 8) & 0xFF));
        }
        return out;
    }

private:
    std::mutex mutex_;
    std::vector<Sample> samples_;
};

static bool wait_for(const std::function<bool()>& cond, int timeout_ms) {
    auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < until) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return cond();
}

static TextChunk chunk(const std::string& text, bool final) {
    TextChunk c;
    c.text = text;
    c.is_sentence_final = final;
    return c;
}

int main() {
    TTSConfig tts;
    tts.sample_rate = 16000;

    // --- Text in, PCM out through the pump ---
    {
        CollectingSink sink;
        PiperSynthesizer synth(tts, sink, {"/bin/cat"});
        ASSERT(synth.sample_rate() == 16000);
        ASSERT(synth.drained_since_ms() > 1000000);   // nothing fed yet
        ASSERT(synth.start().is_ok());
        ASSERT(synth.start().is_ok());                // idempotent

        ASSERT(synth.feed(chunk("Hello there", false)).is_ok());
        ASSERT(synth.drained_since_ms() < 500);
        ASSERT(synth.feed(chunk("friend.", true)).is_ok());
        ASSERT(synth.feed(chunk("", true)).is_ok());  // empty chunks are skipped

        const std::string expected = "Hello there friend.\n";  // 20 bytes = 10 samples
        ASSERT(wait_for([&] { return sink.bytes() == expected; }, 2000));
        ASSERT(synth.samples_written() == expected.size() / 2);

        std::this_thread::sleep_for(std::chrono::milliseconds(120));
        ASSERT(synth.drained_since_ms() >= 100);
        ASSERT(synth.restarts() == 0);
        synth.close();
    }

    // --- Odd byte counts are carried to the next read ---
    {
        CollectingSink sink;
        PiperSynthesizer synth(tts, sink, {"/bin/cat"});
        ASSERT(synth.feed(chunk("ab", false)).is_ok());   // "ab " = 3 bytes, starts the process
        ASSERT(wait_for([&] { return sink.bytes() == std::string("ab"); }, 2000));
        ASSERT(synth.feed(chunk("c", true)).is_ok());     // "c\n"
        ASSERT(wait_for([&] { return sink.bytes() == "ab c"; }, 2000));
        synth.close();
    }

    // --- Broken pipe: restart and retry once ---
    {
        CollectingSink sink;
        PiperSynthesizer synth(tts, sink, {"/bin/true"});
        ASSERT(synth.start().is_ok());
        std::this_thread::sleep_for(std::chrono::milliseconds(200));  // let it exit
        VoidResult result = synth.feed(chunk("Are you there?", true));
        ASSERT(synth.restarts() >= 1);
        if (result.is_error()) {
            ASSERT(result.error().type == ErrorType::SynthesisPipeError);
        }
        synth.close();
    }

    // --- A command that cannot be executed still fails cleanly ---
    {
        CollectingSink sink;
        PiperSynthesizer synth(tts, sink, {"/nonexistent/piper-binary"});
        ASSERT(synth.start().is_ok());                    // fork succeeds, exec fails in the child
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        VoidResult result = synth.feed(chunk("Hello.", true));
        ASSERT(synth.restarts() >= 1);
        if (result.is_error()) {
            ASSERT(result.error().type == ErrorType::SynthesisPipeError);
        }
        synth.close();
    }

    // --- Command line and voice sample rate ---
    {
        TTSConfig cfg;
        cfg.piper_path = "/bin/sh";   // any existing file
        cfg.voice_path = "/tmp/lingo_test_" + std::to_string(getpid()) + "_voice.onnx";
        cfg.sentence_silence = 0.25f;
        std::vector<std::string> argv = PiperSynthesizer::piper_command(cfg);
        ASSERT(!argv.empty() && argv[0] == "/bin/sh");
        ASSERT(std::find(argv.begin(), argv.end(), "--output-raw") != argv.end());
        auto model = std::find(argv.begin(), argv.end(), "--model");
        ASSERT(model != argv.end() && (model + 1) != argv.end() && *(model + 1) == cfg.voice_path);
        auto silence = std::find(argv.begin(), argv.end(), "--sentence_silence");
        ASSERT(silence != argv.end() && (silence + 1) != argv.end() && *(silence + 1) == "0.25");
        ASSERT(std::find(argv.begin(), argv.end(), "--espeak_data") == argv.end());

        CollectingSink sink;
        {
            PiperSynthesizer defaulted(cfg, sink, {"/bin/cat"});
            ASSERT(defaulted.sample_rate() == DEFAULT_SYNTH_SAMPLE_RATE);  // no voice json
        }

        std::string json_path = voice_config_path(cfg.voice_path);
        {
            std::ofstream f(json_path);
            f << R"({"audio": {"sample_rate": 16000, "quality": "low"}})";
        }
        ASSERT(read_voice_sample_rate(cfg.voice_path, 22050) == 16000);
        {
            PiperSynthesizer from_voice(cfg, sink, {"/bin/cat"});
            ASSERT(from_voice.sample_rate() == 16000);
        }
        cfg.sample_rate = 24000;
        {
            PiperSynthesizer overridden(cfg, sink, {"/bin/cat"});
            ASSERT(overridden.sample_rate() == 24000);
        }
        std::remove(json_path.c_str());
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All synthesizer tests passed.\n";
    return 0;
}
