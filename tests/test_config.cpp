/**
 * Configuration loading and validation.
 * Asserts:
 * - Defaults match the documented pipeline constants.
 * - Present keys override defaults; absent keys keep them.
 * - Unparsable input falls back to defaults.
 * - validate() names the first violated constraint.
 * - save_to_file() round-trips through load_from_file().
 * - Log level names parse; the log file keeps only lines at or above the level, tagged per thread.
 */

#include "config.h"
#include "errors.h"
#include "logger.h"
#include "utils.h"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace lingo;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static bool rejects(const Config& cfg, const std::string& fragment) {
    VoidResult r = cfg.validate();
    return r.is_error() && r.error().type == ErrorType::ConfigError &&
           r.error().message.find(fragment) != std::string::npos;
}

int main() {
    // --- Defaults ---
    {
        Config cfg;
        ASSERT(cfg.recorder.frame_ms == 20);
        ASSERT(cfg.recorder.vad_aggressiveness == 3);
        ASSERT(cfg.recorder.silence_ms == 1200);
        ASSERT(cfg.recorder.max_record_ms == 10000);
        ASSERT(cfg.completion.providers.size() == 3);
        ASSERT(cfg.completion.providers[0].model == "qwen/qwen3-coder:free");
        ASSERT(cfg.completion.providers[2].key_name == "GPT_OSS_API_KEY");
        ASSERT(cfg.completion.max_tokens == 48);
        ASSERT(cfg.completion.history_turns == 4);
        ASSERT(cfg.chunker.max_words == 10);
        ASSERT(cfg.chunker.max_interval_ms == 900);
        ASSERT(cfg.turn.drain_holdoff_ms == 600);
        ASSERT(cfg.turn.idle_settle_ms == 5000);
        ASSERT(cfg.turn.login_resume_ms == 1200);
        ASSERT(cfg.actuator.baud == 115200);
        ASSERT(cfg.actuator.startup_commands.size() == 3);
        ASSERT(cfg.validate().is_ok());
    }

    // --- Partial override ---
    {
        Config cfg = Config::load_from_string(R"({
            "recorder": {"silence_ms": 800, "energy_margin": 1.5},
            "completion": {
                "first_token_timeout_ms": 4000,
                "providers": [
                    {"name": "One", "model": "a/one", "key_name": "ONE_KEY"},
                    {"name": "Two", "model": "b/two", "key_name": "TWO_KEY"}
                ]
            },
            "chunker": {"max_words": 6},
            "actuator": {"device": "/dev/ttyACM0", "startup_commands": ["park"]},
            "tracker": {"enabled": false}
        })");
        ASSERT(cfg.recorder.silence_ms == 800);
        ASSERT(cfg.recorder.energy_margin == 1.5f);
        ASSERT(cfg.recorder.max_record_ms == 10000);
        ASSERT(cfg.completion.first_token_timeout_ms == 4000);
        ASSERT(cfg.completion.providers.size() == 2);
        ASSERT(cfg.completion.providers[1].model == "b/two");
        ASSERT(utils::starts_with(cfg.completion.providers[1].endpoint, "https://"));
        ASSERT(cfg.chunker.max_words == 6);
        ASSERT(cfg.chunker.max_interval_ms == 900);
        ASSERT(cfg.actuator.device == "/dev/ttyACM0");
        ASSERT(cfg.actuator.startup_commands.size() == 1);
        ASSERT(!cfg.tracker.enabled);
        ASSERT(cfg.validate().is_ok());
    }

    // --- Broken JSON falls back to defaults ---
    {
        Config cfg = Config::load_from_string("{ not json");
        ASSERT(cfg.recorder.silence_ms == 1200);
        ASSERT(cfg.completion.providers.size() == 3);
        Config missing = Config::load_from_file("/nonexistent/lingo/config.json");
        ASSERT(missing.turn.drain_holdoff_ms == 600);
    }

    // --- Validation ---
    {
        Config cfg;
        cfg.recorder.frame_ms = 25;
        ASSERT(rejects(cfg, "frame_ms"));
    }
    {
        Config cfg;
        cfg.recorder.vad_aggressiveness = 4;
        ASSERT(rejects(cfg, "vad_aggressiveness"));
    }
    {
        Config cfg;
        cfg.recorder.energy_min = 7000.0f;
        ASSERT(rejects(cfg, "energy_min"));
    }
    {
        Config cfg;
        cfg.completion.providers.resize(1);
        ASSERT(rejects(cfg, "at least two"));
    }
    {
        Config cfg;
        cfg.completion.providers[1].model.clear();
        ASSERT(rejects(cfg, cfg.completion.providers[1].name));
    }
    {
        Config cfg;
        cfg.chunker.max_words = 0;
        ASSERT(rejects(cfg, "chunker"));
    }
    {
        Config cfg;
        cfg.turn.drain_holdoff_ms = -1;
        ASSERT(rejects(cfg, "turn"));
    }

    // --- Save and reload ---
    {
        Config cfg;
        cfg.recorder.calibration_ms = 300;
        cfg.completion.dedup_min_chars = 0;
        cfg.turn.stop_repeat_gap_ms = 200;
        cfg.tracker.deadband_deg = 2.5f;
        std::string path = "/tmp/lingo_test_" + std::to_string(getpid()) + "_config.json";
        cfg.save_to_file(path);
        Config loaded = Config::load_from_file(path);
        ASSERT(loaded.recorder.calibration_ms == 300);
        ASSERT(loaded.completion.dedup_min_chars == 0);
        ASSERT(loaded.turn.stop_repeat_gap_ms == 200);
        ASSERT(loaded.tracker.deadband_deg == 2.5f);
        ASSERT(loaded.completion.providers.size() == 3);
        ASSERT(loaded.validate().is_ok());
        std::remove(path.c_str());
    }

    // --- Logging level names and file output ---
    {
        ASSERT(Logger::parse_level("debug") == LogLevel::DEBUG);
        ASSERT(Logger::parse_level("warning") == LogLevel::WARN);
        ASSERT(Logger::parse_level("ERROR") == LogLevel::ERROR);
        ASSERT(Logger::parse_level("chatty") == LogLevel::INFO);

        std::string path = "/tmp/lingo_test_" + std::to_string(getpid()) + "_log.txt";
        std::remove(path.c_str());
        Logger::initialize(LogLevel::WARN, path);
        ASSERT(Logger::get_level() == LogLevel::WARN);
        Logger::info("quiet line");
        Logger::warn("loud line");
        std::thread other([] { Logger::error("from another thread"); });
        other.join();
        Logger::shutdown();

        std::ifstream in(path);
        std::vector<std::string> lines;
        for (std::string line; std::getline(in, line);) lines.push_back(line);
        ASSERT(lines.size() == 2);
        if (lines.size() == 2) {
            ASSERT(utils::starts_with(lines[0], "[WARN ] "));
            ASSERT(lines[0].find(": loud line") != std::string::npos);
            ASSERT(utils::starts_with(lines[1], "[ERROR] "));
            // Each thread gets its own tag
            std::string tag0 = lines[0].substr(lines[0].find(" t"), lines[0].find(": ") - lines[0].find(" t"));
            std::string tag1 = lines[1].substr(lines[1].find(" t"), lines[1].find(": ") - lines[1].find(" t"));
            ASSERT(tag0 != tag1);
        }
        std::remove(path.c_str());
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}
