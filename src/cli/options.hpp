#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <ssh/session.hpp>

struct CliOptions {
    std::string host;
    std::optional<int> port;
    std::optional<std::string> username;
    std::optional<std::string> private_key;
    std::optional<std::string> certificate;
    std::optional<int> timeout;
    std::optional<std::string> config_path;
    std::optional<std::string> known_hosts;
    std::vector<std::string> fingerprints;
    std::vector<std::string> command;
    bool verbose = false;
    bool show_help = false;
    bool show_version = false;
    bool init_config = false;
};

// rexec [options] <host> <command> [args...]
// Everything after the host is the remote command, dashes included.
Result<CliOptions> parse_args(int argc, const char* const* argv);

// Merge flags over config. Fails (ErrorKind::Config) without a key or user.
Result<SessionTarget> build_target(const CliOptions& cli, const Config& config);

std::string usage();
