#pragma once

/**
 * @file path_utils.h
 * @brief Path resolution: ~ expansion and platform defaults
 */

#include <string>

namespace lingo {

/**
 * Expands leading ~ to $HOME (getenv("HOME")). ~user not supported.
 * Returns path unchanged if path is empty or ~ expansion not applicable.
 */
std::string expand_path(const std::string& path);

/**
 * Returns platform-specific default espeak-ng data path when config leaves it empty.
 * macOS: /opt/homebrew/share/espeak-ng-data
 * Linux: /usr/share/espeak-ng-data
 * Other: empty string
 */
std::string default_espeak_data_path();

/**
 * Piper keeps voice metadata beside the model: "voice.onnx" -> "voice.onnx.json".
 */
std::string voice_config_path(const std::string& voice_path);

/**
 * Sample rate declared in a piper voice json ("audio.sample_rate" or top-level
 * "sample_rate"). Returns fallback when the file is missing or has neither key.
 */
int read_voice_sample_rate(const std::string& voice_path, int fallback);

} // namespace lingo
