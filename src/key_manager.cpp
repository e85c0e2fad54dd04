#include "key_manager.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <map>
#include <mutex>

using json = nlohmann::json;

namespace lingo {

namespace {

struct Profile {
    std::string label;
    std::map<std::string, std::string> keys;
};

} // anonymous namespace

class KeyManager::Impl {
public:
    explicit Impl(const CredentialsConfig& config) : config_(config), active_index_(0) {
        load_profiles();
        load_active_index();
        Logger::info("Credential profile: " + active_label());
    }

    std::vector<std::string> labels() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        for (const auto& p : profiles_) out.push_back(p.label);
        return out;
    }

    std::string active_label() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return profiles_[active_index_].label;
    }

    size_t active_index() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_index_;
    }

    std::string key(const std::string& key_name) const {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto& keys = profiles_[active_index_].keys;
            auto it = keys.find(key_name);
            if (it != keys.end() && !it->second.empty()) return it->second;
        }
        const char* env = std::getenv(key_name.c_str());
        return env ? std::string(env) : std::string();
    }

    void switch_to(size_t idx) {
        std::string label;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            active_index_ = idx % profiles_.size();
            label = profiles_[active_index_].label;
            persist_active_index();
        }
        Logger::info("Switched credential profile to: " + label);
    }

    void next_profile() {
        switch_to(active_index() + 1);
    }

private:
    void load_profiles() {
        std::ifstream f(config_.keys_file);
        if (f.is_open()) {
            try {
                json j;
                f >> j;
                if (j.contains("profiles") && j["profiles"].is_array()) {
                    for (const auto& entry : j["profiles"]) {
                        if (!entry.is_object()) continue;
                        Profile p;
                        p.label = "Profile " + std::to_string(profiles_.size() + 1);
                        for (auto it = entry.begin(); it != entry.end(); ++it) {
                            if (!it.value().is_string()) continue;
                            if (it.key() == "label") {
                                p.label = it.value().get<std::string>();
                            } else {
                                p.keys[it.key()] = it.value().get<std::string>();
                            }
                        }
                        profiles_.push_back(p);
                    }
                } else {
                    Logger::warn(config_.keys_file + " has no top-level \"profiles\" list");
                }
            } catch (const json::exception& e) {
                Logger::warn("Error parsing " + config_.keys_file + ": " + std::string(e.what()));
            }
        }
        if (profiles_.empty()) {
            // Keys come from the environment through key()
            Profile p;
            p.label = "ENV_DEFAULT";
            profiles_.push_back(p);
        }
    }

    void load_active_index() {
        std::ifstream f(config_.settings_file);
        if (f.is_open()) {
            try {
                json j;
                f >> j;
                if (j.contains("active_profile_index") && j["active_profile_index"].is_number_integer()) {
                    int idx = j["active_profile_index"].get<int>();
                    active_index_ = idx < 0 ? 0 : static_cast<size_t>(idx) % profiles_.size();
                    return;
                }
            } catch (const json::exception& e) {
                Logger::warn("Error parsing " + config_.settings_file + ": " + std::string(e.what()));
            }
        }
        active_index_ = 0;
        persist_active_index();
    }

    // Caller holds mutex_ (or is the constructor)
    void persist_active_index() {
        if (config_.settings_file.empty()) return;
        std::ofstream f(config_.settings_file);
        if (!f.is_open()) {
            Logger::warn("Could not persist active profile to " + config_.settings_file);
            return;
        }
        json j;
        j["active_profile_index"] = active_index_;
        f << j.dump(2) << std::endl;
    }

    CredentialsConfig config_;
    std::vector<Profile> profiles_;
    size_t active_index_;
    mutable std::mutex mutex_;
};

KeyManager::KeyManager(const CredentialsConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

KeyManager::~KeyManager() = default;

std::vector<std::string> KeyManager::labels() const {
    return pimpl_->labels();
}

std::string KeyManager::active_label() const {
    return pimpl_->active_label();
}

size_t KeyManager::active_index() const {
    return pimpl_->active_index();
}

std::string KeyManager::key(const std::string& key_name) const {
    return pimpl_->key(key_name);
}

void KeyManager::next_profile() {
    pimpl_->next_profile();
}

void KeyManager::switch_to(size_t idx) {
    pimpl_->switch_to(idx);
}

} // namespace lingo
