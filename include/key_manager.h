#pragma once

#include "config.h"
#include <string>
#include <vector>
#include <memory>

namespace lingo {

/**
 * @brief Credential profiles for the completion providers
 *
 * A keys file holds several account profiles, each carrying one key per
 * provider key name. The active profile index survives restarts through a
 * small settings file. Rotation is always an operator action; nothing in the
 * pipeline switches profiles on its own.
 *
 * Thread Safety: all methods are safe to call from any thread.
 */
class KeyManager {
public:
    explicit KeyManager(const CredentialsConfig& config);
    ~KeyManager();

    KeyManager(const KeyManager&) = delete;
    KeyManager& operator=(const KeyManager&) = delete;

    /// Profile labels in file order
    std::vector<std::string> labels() const;

    std::string active_label() const;
    size_t active_index() const;

    /**
     * @brief Key for a provider in the active profile
     * @param key_name e.g. "QWEN_API_KEY"
     * @return The profile value, else the environment variable of the same name, else ""
     */
    std::string key(const std::string& key_name) const;

    /// Advance to the next profile (wraps) and persist the choice
    void next_profile();

    /// Select profile idx (taken modulo the profile count) and persist the choice
    void switch_to(size_t idx);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace lingo
