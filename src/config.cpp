#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

void read_string_list(const json& node, std::vector<std::string>& out) {
    if (!node.is_array()) return;
    out.clear();
    for (const auto& item : node) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
}

/// Apply every recognized section present in j onto cfg; absent keys keep their defaults.
void apply_json_to_config(lingo::Config& cfg, const json& j) {
    if (j.contains("audio")) {
        auto& a = j["audio"];
        if (a.contains("input_device")) cfg.audio.input_device = a["input_device"];
        if (a.contains("output_device")) cfg.audio.output_device = a["output_device"];
        if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"];
    }

    if (j.contains("recorder")) {
        auto& r = j["recorder"];
        if (r.contains("frame_ms")) cfg.recorder.frame_ms = r["frame_ms"];
        if (r.contains("vad_aggressiveness")) cfg.recorder.vad_aggressiveness = r["vad_aggressiveness"];
        if (r.contains("silence_ms")) cfg.recorder.silence_ms = r["silence_ms"];
        if (r.contains("max_record_ms")) cfg.recorder.max_record_ms = r["max_record_ms"];
        if (r.contains("energy_margin")) cfg.recorder.energy_margin = r["energy_margin"];
        if (r.contains("energy_min")) cfg.recorder.energy_min = r["energy_min"];
        if (r.contains("energy_max")) cfg.recorder.energy_max = r["energy_max"];
        if (r.contains("calibration_ms")) cfg.recorder.calibration_ms = r["calibration_ms"];
    }

    if (j.contains("stt")) {
        auto& s = j["stt"];
        if (s.contains("model_path")) cfg.stt.model_path = s["model_path"];
        if (s.contains("language")) cfg.stt.language = s["language"];
        if (s.contains("n_threads")) cfg.stt.n_threads = s["n_threads"];
        if (s.contains("use_gpu")) cfg.stt.use_gpu = s["use_gpu"];
    }

    if (j.contains("completion")) {
        auto& c = j["completion"];
        if (c.contains("providers") && c["providers"].is_array()) {
            cfg.completion.providers.clear();
            for (const auto& p : c["providers"]) {
                if (!p.is_object()) continue;
                lingo::ProviderConfig provider;
                if (p.contains("name")) provider.name = p["name"];
                if (p.contains("endpoint")) provider.endpoint = p["endpoint"];
                if (p.contains("model")) provider.model = p["model"];
                if (p.contains("key_name")) provider.key_name = p["key_name"];
                cfg.completion.providers.push_back(provider);
            }
        }
        if (c.contains("first_token_timeout_ms")) cfg.completion.first_token_timeout_ms = c["first_token_timeout_ms"];
        if (c.contains("request_timeout_ms")) cfg.completion.request_timeout_ms = c["request_timeout_ms"];
        if (c.contains("connect_timeout_ms")) cfg.completion.connect_timeout_ms = c["connect_timeout_ms"];
        if (c.contains("max_tokens")) cfg.completion.max_tokens = c["max_tokens"];
        if (c.contains("temperature")) cfg.completion.temperature = c["temperature"];
        if (c.contains("stop_sequences")) read_string_list(c["stop_sequences"], cfg.completion.stop_sequences);
        if (c.contains("system_prompt")) cfg.completion.system_prompt = c["system_prompt"];
        if (c.contains("history_turns")) cfg.completion.history_turns = c["history_turns"];
        if (c.contains("dedup_window_chars")) cfg.completion.dedup_window_chars = c["dedup_window_chars"];
        if (c.contains("dedup_min_chars")) cfg.completion.dedup_min_chars = c["dedup_min_chars"];
        if (c.contains("referer")) cfg.completion.referer = c["referer"];
        if (c.contains("title")) cfg.completion.title = c["title"];
    }

    if (j.contains("credentials")) {
        auto& k = j["credentials"];
        if (k.contains("keys_file")) cfg.credentials.keys_file = k["keys_file"];
        if (k.contains("settings_file")) cfg.credentials.settings_file = k["settings_file"];
    }

    if (j.contains("chunker")) {
        auto& ch = j["chunker"];
        if (ch.contains("max_words")) cfg.chunker.max_words = ch["max_words"];
        if (ch.contains("max_interval_ms")) cfg.chunker.max_interval_ms = ch["max_interval_ms"];
    }

    if (j.contains("tts")) {
        auto& t = j["tts"];
        if (t.contains("piper_path")) cfg.tts.piper_path = t["piper_path"];
        if (t.contains("voice_path")) cfg.tts.voice_path = t["voice_path"];
        if (t.contains("espeak_data_path")) cfg.tts.espeak_data_path = t["espeak_data_path"];
        if (t.contains("sample_rate")) cfg.tts.sample_rate = t["sample_rate"];
        if (t.contains("sentence_silence")) cfg.tts.sentence_silence = t["sentence_silence"];
    }

    if (j.contains("turn")) {
        auto& tu = j["turn"];
        if (tu.contains("drain_holdoff_ms")) cfg.turn.drain_holdoff_ms = tu["drain_holdoff_ms"];
        if (tu.contains("idle_settle_ms")) cfg.turn.idle_settle_ms = tu["idle_settle_ms"];
        if (tu.contains("stop_repeat_gap_ms")) cfg.turn.stop_repeat_gap_ms = tu["stop_repeat_gap_ms"];
        if (tu.contains("login_resume_ms")) cfg.turn.login_resume_ms = tu["login_resume_ms"];
        if (tu.contains("chunk_queue_capacity")) cfg.turn.chunk_queue_capacity = tu["chunk_queue_capacity"];
    }

    if (j.contains("actuator")) {
        auto& ac = j["actuator"];
        if (ac.contains("device")) cfg.actuator.device = ac["device"];
        if (ac.contains("baud")) cfg.actuator.baud = ac["baud"];
        if (ac.contains("startup_commands")) read_string_list(ac["startup_commands"], cfg.actuator.startup_commands);
    }

    if (j.contains("tracker")) {
        auto& tr = j["tracker"];
        if (tr.contains("enabled")) cfg.tracker.enabled = tr["enabled"];
        if (tr.contains("gaze_rate_hz")) cfg.tracker.gaze_rate_hz = tr["gaze_rate_hz"];
        if (tr.contains("deadband_deg")) cfg.tracker.deadband_deg = tr["deadband_deg"];
        if (tr.contains("min_dwell_ms")) cfg.tracker.min_dwell_ms = tr["min_dwell_ms"];
        if (tr.contains("open_grace_ms")) cfg.tracker.open_grace_ms = tr["open_grace_ms"];
        if (tr.contains("retry_backoff_ms")) cfg.tracker.retry_backoff_ms = tr["retry_backoff_ms"];
    }

    if (j.contains("logging")) {
        auto& l = j["logging"];
        if (l.contains("level")) cfg.logging.level = l["level"];
        if (l.contains("file")) cfg.logging.file = l["file"];
    }
}

void expand_paths(lingo::Config& cfg) {
    if (!cfg.stt.model_path.empty()) cfg.stt.model_path = lingo::expand_path(cfg.stt.model_path);
    if (!cfg.tts.voice_path.empty()) cfg.tts.voice_path = lingo::expand_path(cfg.tts.voice_path);
    if (!cfg.tts.piper_path.empty()) cfg.tts.piper_path = lingo::expand_path(cfg.tts.piper_path);
    if (cfg.tts.espeak_data_path.empty())
        cfg.tts.espeak_data_path = lingo::default_espeak_data_path();
    else
        cfg.tts.espeak_data_path = lingo::expand_path(cfg.tts.espeak_data_path);
    cfg.credentials.keys_file = lingo::expand_path(cfg.credentials.keys_file);
    cfg.credentials.settings_file = lingo::expand_path(cfg.credentials.settings_file);
}

lingo::ProviderConfig make_provider(const std::string& name, const std::string& model, const std::string& key_name) {
    lingo::ProviderConfig p;
    p.name = name;
    p.model = model;
    p.key_name = key_name;
    return p;
}

} // anonymous namespace

namespace lingo {

Config::Config() {
    completion.providers = {
        make_provider("Qwen3 Coder", "qwen/qwen3-coder:free", "QWEN_API_KEY"),
        make_provider("Mistral 7B", "mistralai/mistral-7b-instruct:free", "MISTRAL_API_KEY"),
        make_provider("GPT-OSS-20B", "openai/gpt-oss-20b:free", "GPT_OSS_API_KEY"),
    };
}

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warn("Could not open config file: " + path + ". Using defaults.");
        expand_paths(cfg);
        return cfg;
    }
    json j;
    try {
        file >> j;
        apply_json_to_config(cfg, j);
    } catch (const json::exception& e) {
        Logger::error("Error parsing config JSON: " + std::string(e.what()));
        cfg = Config();
    }
    expand_paths(cfg);
    return cfg;
}

Config Config::load_from_string(const std::string& json_text) {
    Config cfg;
    try {
        apply_json_to_config(cfg, json::parse(json_text));
    } catch (const json::exception& e) {
        Logger::error("Error parsing config JSON: " + std::string(e.what()));
        cfg = Config();
    }
    expand_paths(cfg);
    return cfg;
}

void Config::save_to_file(const std::string& path) const {
    json j;

    j["audio"]["input_device"] = audio.input_device;
    j["audio"]["output_device"] = audio.output_device;
    j["audio"]["sample_rate"] = audio.sample_rate;

    j["recorder"]["frame_ms"] = recorder.frame_ms;
    j["recorder"]["vad_aggressiveness"] = recorder.vad_aggressiveness;
    j["recorder"]["silence_ms"] = recorder.silence_ms;
    j["recorder"]["max_record_ms"] = recorder.max_record_ms;
    j["recorder"]["energy_margin"] = recorder.energy_margin;
    j["recorder"]["energy_min"] = recorder.energy_min;
    j["recorder"]["energy_max"] = recorder.energy_max;
    j["recorder"]["calibration_ms"] = recorder.calibration_ms;

    j["stt"]["model_path"] = stt.model_path;
    j["stt"]["language"] = stt.language;
    j["stt"]["n_threads"] = stt.n_threads;
    j["stt"]["use_gpu"] = stt.use_gpu;

    json providers = json::array();
    for (const auto& p : completion.providers) {
        providers.push_back({{"name", p.name}, {"endpoint", p.endpoint},
                             {"model", p.model}, {"key_name", p.key_name}});
    }
    j["completion"]["providers"] = providers;
    j["completion"]["first_token_timeout_ms"] = completion.first_token_timeout_ms;
    j["completion"]["request_timeout_ms"] = completion.request_timeout_ms;
    j["completion"]["connect_timeout_ms"] = completion.connect_timeout_ms;
    j["completion"]["max_tokens"] = completion.max_tokens;
    j["completion"]["temperature"] = completion.temperature;
    j["completion"]["stop_sequences"] = completion.stop_sequences;
    j["completion"]["system_prompt"] = completion.system_prompt;
    j["completion"]["history_turns"] = completion.history_turns;
    j["completion"]["dedup_window_chars"] = completion.dedup_window_chars;
    j["completion"]["dedup_min_chars"] = completion.dedup_min_chars;
    j["completion"]["referer"] = completion.referer;
    j["completion"]["title"] = completion.title;

    j["credentials"]["keys_file"] = credentials.keys_file;
    j["credentials"]["settings_file"] = credentials.settings_file;

    j["chunker"]["max_words"] = chunker.max_words;
    j["chunker"]["max_interval_ms"] = chunker.max_interval_ms;

    j["tts"]["piper_path"] = tts.piper_path;
    j["tts"]["voice_path"] = tts.voice_path;
    j["tts"]["espeak_data_path"] = tts.espeak_data_path;
    j["tts"]["sample_rate"] = tts.sample_rate;
    j["tts"]["sentence_silence"] = tts.sentence_silence;

    j["turn"]["drain_holdoff_ms"] = turn.drain_holdoff_ms;
    j["turn"]["idle_settle_ms"] = turn.idle_settle_ms;
    j["turn"]["stop_repeat_gap_ms"] = turn.stop_repeat_gap_ms;
    j["turn"]["login_resume_ms"] = turn.login_resume_ms;
    j["turn"]["chunk_queue_capacity"] = turn.chunk_queue_capacity;

    j["actuator"]["device"] = actuator.device;
    j["actuator"]["baud"] = actuator.baud;
    j["actuator"]["startup_commands"] = actuator.startup_commands;

    j["tracker"]["enabled"] = tracker.enabled;
    j["tracker"]["gaze_rate_hz"] = tracker.gaze_rate_hz;
    j["tracker"]["deadband_deg"] = tracker.deadband_deg;
    j["tracker"]["min_dwell_ms"] = tracker.min_dwell_ms;
    j["tracker"]["open_grace_ms"] = tracker.open_grace_ms;
    j["tracker"]["retry_backoff_ms"] = tracker.retry_backoff_ms;

    j["logging"]["level"] = logging.level;
    j["logging"]["file"] = logging.file;

    std::ofstream file(path);
    if (!file.is_open()) {
        Logger::error("Could not write config file: " + path);
        return;
    }
    file << j.dump(2) << std::endl;
}

VoidResult Config::validate() const {
    if (audio.sample_rate != 8000 && audio.sample_rate != 16000 &&
        audio.sample_rate != 32000 && audio.sample_rate != 48000) {
        return make_config_error("audio.sample_rate must be 8000, 16000, 32000 or 48000");
    }
    if (recorder.frame_ms != 10 && recorder.frame_ms != 20 && recorder.frame_ms != 30) {
        return make_config_error("recorder.frame_ms must be 10, 20 or 30");
    }
    if (recorder.vad_aggressiveness < 0 || recorder.vad_aggressiveness > 3) {
        return make_config_error("recorder.vad_aggressiveness must be in [0, 3]");
    }
    if (recorder.silence_ms <= 0 || recorder.max_record_ms <= 0 || recorder.calibration_ms <= 0) {
        return make_config_error("recorder durations must be positive");
    }
    if (recorder.energy_min > recorder.energy_max) {
        return make_config_error("recorder.energy_min must not exceed recorder.energy_max");
    }
    if (recorder.energy_margin <= 0.0f) {
        return make_config_error("recorder.energy_margin must be positive");
    }
    if (completion.providers.size() < 2) {
        return make_config_error("completion.providers needs at least two entries");
    }
    for (const auto& p : completion.providers) {
        if (p.endpoint.empty() || p.model.empty()) {
            return make_config_error("completion provider \"" + p.name + "\" needs an endpoint and a model");
        }
    }
    if (completion.first_token_timeout_ms <= 0) {
        return make_config_error("completion.first_token_timeout_ms must be positive");
    }
    if (completion.max_tokens <= 0) {
        return make_config_error("completion.max_tokens must be positive");
    }
    if (completion.history_turns < 0 || completion.dedup_window_chars < 0 || completion.dedup_min_chars < 0) {
        return make_config_error("completion history and dedup sizes must not be negative");
    }
    if (chunker.max_words <= 0 || chunker.max_interval_ms <= 0) {
        return make_config_error("chunker thresholds must be positive");
    }
    if (turn.drain_holdoff_ms < 0 || turn.idle_settle_ms < 0 ||
        turn.stop_repeat_gap_ms < 0 || turn.login_resume_ms < 0) {
        return make_config_error("turn delays must not be negative");
    }
    if (turn.chunk_queue_capacity == 0) {
        return make_config_error("turn.chunk_queue_capacity must be positive");
    }
    if (tracker.gaze_rate_hz <= 0.0f) {
        return make_config_error("tracker.gaze_rate_hz must be positive");
    }
    return VoidResult();
}

} // namespace lingo
