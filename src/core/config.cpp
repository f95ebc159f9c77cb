#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

bool default_config_exists() {
    return fs::exists(get_default_config_path());
}

fs::path get_config_dir() {
    return platform::home_dir() / ".rexec";
}

fs::path get_default_config_path() {
    return get_config_dir() / "config.yaml";
}

std::string join_algorithms(const std::vector<std::string>& algorithms) {
    std::string out;
    for (const auto& a : algorithms) {
        if (a.empty()) continue;
        if (!out.empty()) out += ",";
        out += a;
    }
    return out;
}

Result<void> create_default_config() {
    fs::path config_path = get_default_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    // Ensure directory exists
    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::Config,
            "Failed to create " + config_path.parent_path().string() + ": " + ec.message());
    }

    // Default config content
    const char* default_config = R"(# rexec client configuration
# Command-line flags override anything set here.

# user: "deploy"                 # Remote user (default: local $USER)
port: 22
# private_key: "~/.ssh/id_ed25519"
# certificate: "~/.ssh/id_ed25519-cert.pub"

# Seconds without any traffic before the session is dropped
timeout: 5

# Key exchange is restricted to this list
kex:
  - curve25519-sha256
  - curve25519-sha256@libssh.org

# Server identity checks. With neither set, any host key is accepted.
# known_hosts: "~/.ssh/known_hosts"
# fingerprints:
#   - "SHA256:..."

# disconnect_message: "rexec: session closed by client"
# log_file: "/tmp/rexec_debug.log"
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err(ErrorKind::Config,
            "Failed to create config file at " + config_path.string());
    }
    out << default_config;
    out.close();
    if (!out) {
        return Result<void>::Err(ErrorKind::Config,
            "Failed to write config file at " + config_path.string());
    }
    return Result<void>::Ok();
}

// A key may hold a scalar ("a,b") or a sequence of scalars.
static std::vector<std::string> parse_string_list(const YAML::Node& node) {
    std::vector<std::string> out;
    if (!node) return out;
    if (node.IsSequence()) {
        for (const auto& item : node) out.push_back(item.as<std::string>());
        return out;
    }
    std::string joined = node.as<std::string>();
    size_t start = 0;
    while (start <= joined.size()) {
        size_t comma = joined.find(',', start);
        std::string part = joined.substr(start, comma == std::string::npos ? std::string::npos
                                                                           : comma - start);
        if (!part.empty()) out.push_back(part);
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return out;
}

static std::optional<std::string> optional_path(const YAML::Node& node) {
    if (!node || node.IsNull()) return std::nullopt;
    return platform::expand_user(node.as<std::string>()).string();
}

static std::optional<std::string> optional_string(const YAML::Node& node) {
    if (!node || node.IsNull()) return std::nullopt;
    return node.as<std::string>();
}

Result<Config> Config::parse(const std::string& yaml, const std::string& origin) {
    try {
        YAML::Node root = YAML::Load(yaml);
        Config config;
        config.source_ = origin;

        if (!root || root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err(ErrorKind::Config,
                "Config " + origin + " must be a mapping of settings");
        }

        config.user_ = optional_string(root["user"]);
        if (root["port"]) {
            int port = root["port"].as<int>();
            if (port <= 0 || port > 65535) {
                return Result<Config>::Err(ErrorKind::Config,
                    "Invalid port " + std::to_string(port) + " in " + origin);
            }
            config.port_ = port;
        }
        config.private_key_ = optional_path(root["private_key"]);
        config.certificate_ = optional_path(root["certificate"]);
        config.key_passphrase_ = optional_string(root["key_passphrase"]);
        if (root["timeout"]) {
            int timeout = root["timeout"].as<int>();
            if (timeout < 0) {
                return Result<Config>::Err(ErrorKind::Config,
                    "Invalid timeout " + std::to_string(timeout) + " in " + origin);
            }
            config.timeout_ = timeout;
        }
        config.kex_ = parse_string_list(root["kex"]);
        config.host_key_algorithms_ = parse_string_list(root["host_key_algorithms"]);
        config.known_hosts_ = optional_path(root["known_hosts"]);
        config.fingerprints_ = parse_string_list(root["fingerprints"]);
        config.disconnect_message_ = optional_string(root["disconnect_message"]);
        config.log_file_ = optional_path(root["log_file"]);

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(ErrorKind::Config,
            "Failed to parse config " + origin + ": " + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err(ErrorKind::Config, "Config not found at " + path.string());
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err(ErrorKind::Config, "Cannot read config " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parse(text, path.string());
}

Result<Config> Config::load_default() {
    if (!default_config_exists()) {
        return Result<Config>::Ok(Config());
    }
    return load_file(get_default_config_path());
}
