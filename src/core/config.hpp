#pragma once

#include <string>
#include <optional>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Client settings from ~/.rexec/config.yaml. Every field is optional;
// command-line flags override whatever is set here.
class Config {
public:
    // Load from an explicit path. A missing file is an error.
    static Result<Config> load_file(const fs::path& path);

    // Load ~/.rexec/config.yaml. A missing file yields an empty Config.
    static Result<Config> load_default();

    // Parse YAML text (used by load_file and tests).
    static Result<Config> parse(const std::string& yaml, const std::string& origin = "<string>");

    // Accessors
    const std::optional<std::string>& user() const { return user_; }
    const std::optional<int>& port() const { return port_; }
    const std::optional<std::string>& private_key() const { return private_key_; }
    const std::optional<std::string>& certificate() const { return certificate_; }
    const std::optional<std::string>& key_passphrase() const { return key_passphrase_; }
    const std::optional<int>& timeout() const { return timeout_; }
    const std::vector<std::string>& kex() const { return kex_; }
    const std::vector<std::string>& host_key_algorithms() const { return host_key_algorithms_; }
    const std::optional<std::string>& known_hosts() const { return known_hosts_; }
    const std::vector<std::string>& fingerprints() const { return fingerprints_; }
    const std::optional<std::string>& disconnect_message() const { return disconnect_message_; }
    const std::optional<std::string>& log_file() const { return log_file_; }
    const fs::path& source() const { return source_; }

public:
    Config() = default;

private:
    std::optional<std::string> user_;
    std::optional<int> port_;
    std::optional<std::string> private_key_;
    std::optional<std::string> certificate_;
    std::optional<std::string> key_passphrase_;
    std::optional<int> timeout_;
    std::vector<std::string> kex_;
    std::vector<std::string> host_key_algorithms_;
    std::optional<std::string> known_hosts_;
    std::vector<std::string> fingerprints_;
    std::optional<std::string> disconnect_message_;
    std::optional<std::string> log_file_;
    fs::path source_;
};

// Helper to check if the default config exists
bool default_config_exists();

// Get paths
fs::path get_config_dir();
fs::path get_default_config_path();

// Write a commented default config if none exists
Result<void> create_default_config();

// "a,b" or ["a", "b"] both become "a,b"
std::string join_algorithms(const std::vector<std::string>& algorithms);
