#include "path_utils.h"
#include <cstdlib>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>

namespace lingo {

std::string expand_path(const std::string& path) {
    if (path.empty()) return path;
    if (path.size() == 1 && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home);
        return path;
    }
    if (path.size() >= 2 && path[0] == '~' && (path[1] == '/' || path[1] == '\\')) {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home) + path.substr(1);
        return path;
    }
    return path;
}

static bool espeak_data_exists(const std::string& base) {
    std::ifstream f(base + "/phontab");
    return f.good();
}

std::string default_espeak_data_path() {
#if defined(__linux__)
    const char* candidates[] = {
        "/usr/share/espeak-ng-data",
        "/usr/lib/aarch64-linux-gnu/espeak-ng-data",
        "/usr/lib/x86_64-linux-gnu/espeak-ng-data",
    };
    for (const char* p : candidates) {
        if (espeak_data_exists(p)) return p;
    }
    return "/usr/share/espeak-ng-data";  // Piper may still use PATH
#elif defined(__APPLE__)
    return "/opt/homebrew/share/espeak-ng-data";
#else
    return "";
#endif
}

std::string voice_config_path(const std::string& voice_path) {
    if (voice_path.empty()) return voice_path;
    return voice_path + ".json";
}

int read_voice_sample_rate(const std::string& voice_path, int fallback) {
    std::ifstream f(voice_config_path(voice_path));
    if (!f.is_open()) return fallback;
    try {
        nlohmann::json j;
        f >> j;
        if (j.contains("audio") && j["audio"].is_object() &&
            j["audio"].contains("sample_rate") && j["audio"]["sample_rate"].is_number_integer()) {
            return j["audio"]["sample_rate"].get<int>();
        }
        if (j.contains("sample_rate") && j["sample_rate"].is_number_integer()) {
            return j["sample_rate"].get<int>();
        }
    } catch (const nlohmann::json::exception&) {
        return fallback;
    }
    return fallback;
}

} // namespace lingo
