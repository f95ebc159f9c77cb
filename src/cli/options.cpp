#include "options.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <cstdlib>
#include <stdexcept>

static Result<int> parse_int(const std::string& flag, const std::string& value, int min, int max) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size() || v < min || v > max) throw std::out_of_range(value);
        return Result<int>::Ok(v);
    } catch (const std::exception&) {
        return Result<int>::Err(ErrorKind::Config,
            fmt::format("Invalid value for {}: '{}' (expected {}..{})", flag, value, min, max));
    }
}

Result<CliOptions> parse_args(int argc, const char* const* argv) {
    using R = Result<CliOptions>;
    CliOptions opts;

    int i = 1;
    for (; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--") { i++; break; }
        if (arg.empty() || arg[0] != '-' || arg == "-") break;

        // Split --name=value
        std::string name = arg;
        std::optional<std::string> inline_value;
        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            name = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
        }

        if (name == "-h" || name == "--help") { opts.show_help = true; continue; }
        if (name == "--version") { opts.show_version = true; continue; }
        if (name == "--init-config") { opts.init_config = true; continue; }
        if (name == "-v" || name == "--verbose") { opts.verbose = true; continue; }

        auto take_value = [&]() -> std::optional<std::string> {
            if (inline_value) return inline_value;
            if (i + 1 < argc) return std::string(argv[++i]);
            return std::nullopt;
        };

        std::optional<std::string> value;
        if (name == "-p" || name == "--port" ||
            name == "-u" || name == "--username" ||
            name == "-k" || name == "--private-key" ||
            name == "-o" || name == "--openssh-certificate" ||
            name == "-t" || name == "--timeout" ||
            name == "-c" || name == "--config" ||
            name == "--known-hosts" || name == "--fingerprint") {
            value = take_value();
            if (!value) return R::Err(ErrorKind::Config, "Missing value for " + name);
        } else {
            return R::Err(ErrorKind::Config, "Unknown option: " + arg);
        }

        if (name == "-p" || name == "--port") {
            auto port = parse_int(name, *value, 1, 65535);
            if (port.is_err()) return propagate<CliOptions>(port);
            opts.port = port.value;
        } else if (name == "-u" || name == "--username") {
            opts.username = *value;
        } else if (name == "-k" || name == "--private-key") {
            opts.private_key = *value;
        } else if (name == "-o" || name == "--openssh-certificate") {
            opts.certificate = *value;
        } else if (name == "-t" || name == "--timeout") {
            auto timeout = parse_int(name, *value, 0, 24 * 3600);
            if (timeout.is_err()) return propagate<CliOptions>(timeout);
            opts.timeout = timeout.value;
        } else if (name == "-c" || name == "--config") {
            opts.config_path = *value;
        } else if (name == "--known-hosts") {
            opts.known_hosts = *value;
        } else {
            opts.fingerprints.push_back(*value);
        }
    }

    if (opts.show_help || opts.show_version || opts.init_config) return R::Ok(opts);

    if (i >= argc) return R::Err(ErrorKind::Config, "Missing host");
    opts.host = argv[i++];
    for (; i < argc; i++) opts.command.emplace_back(argv[i]);
    if (opts.command.empty()) return R::Err(ErrorKind::Config, "Missing command");

    return R::Ok(opts);
}

static std::shared_ptr<HostKeyPolicy> build_policy(const std::optional<std::string>& known_hosts,
                                                   const std::vector<std::string>& fingerprints) {
    std::vector<std::unique_ptr<HostKeyPolicy>> policies;
    if (known_hosts) {
        policies.push_back(std::make_unique<KnownHostsPolicy>(
            platform::expand_user(*known_hosts).string()));
    }
    if (!fingerprints.empty()) {
        policies.push_back(std::make_unique<FingerprintPolicy>(fingerprints));
    }

    if (policies.empty()) return nullptr;
    if (policies.size() == 1) return std::shared_ptr<HostKeyPolicy>(std::move(policies.front()));
    return std::make_shared<AnyOfPolicy>(std::move(policies));
}

Result<SessionTarget> build_target(const CliOptions& cli, const Config& config) {
    using R = Result<SessionTarget>;
    SessionTarget target;

    target.host = cli.host;
    target.port = cli.port.value_or(config.port().value_or(DEFAULT_SSH_PORT));

    // No implicit privileged account: flag, config, then the local login name.
    if (cli.username) {
        target.user = *cli.username;
    } else if (config.user()) {
        target.user = *config.user();
    } else {
        target.user = local_username();
    }
    if (target.user.empty()) {
        return R::Err(ErrorKind::Config,
                      "No remote user: pass -u/--username or set 'user' in the config");
    }

    if (cli.private_key) {
        target.private_key_path = platform::expand_user(*cli.private_key);
    } else if (config.private_key()) {
        target.private_key_path = *config.private_key();
    } else {
        return R::Err(ErrorKind::Config,
                      "A private key is required: pass -k/--private-key or set 'private_key'");
    }

    if (cli.certificate) {
        target.certificate_path = platform::expand_user(*cli.certificate);
    } else if (config.certificate()) {
        target.certificate_path = fs::path(*config.certificate());
    }

    if (const char* pass = std::getenv(ENV_KEY_PASSPHRASE)) {
        target.key_passphrase = pass;
    } else if (config.key_passphrase()) {
        target.key_passphrase = *config.key_passphrase();
    }

    target.inactivity_timeout_secs =
        cli.timeout.value_or(config.timeout().value_or(DEFAULT_INACTIVITY_TIMEOUT_SECS));
    target.kex_algorithms = join_algorithms(config.kex());
    target.host_key_algorithms = join_algorithms(config.host_key_algorithms());
    target.disconnect_message = config.disconnect_message().value_or(DEFAULT_DISCONNECT_MESSAGE);

    // Flags replace the config's verification settings rather than adding to them.
    if (cli.known_hosts || !cli.fingerprints.empty()) {
        target.host_key_policy = build_policy(cli.known_hosts, cli.fingerprints);
    } else {
        target.host_key_policy = build_policy(config.known_hosts(), config.fingerprints());
    }

    return R::Ok(target);
}

std::string usage() {
    return fmt::format(
        "Usage: rexec [options] <host> <command> [args...]\n"
        "\n"
        "Run a command on a remote host over SSH and exit with its status.\n"
        "\n"
        "Options:\n"
        "  -k, --private-key <path>          Private key (required unless configured)\n"
        "  -o, --openssh-certificate <path>  OpenSSH certificate for the key\n"
        "  -u, --username <name>             Remote user (default: config, then $USER)\n"
        "  -p, --port <port>                 Port (default {})\n"
        "  -t, --timeout <secs>              Inactivity timeout (default {}, 0 = none)\n"
        "  -c, --config <path>               Config file (default ~/.rexec/config.yaml)\n"
        "      --known-hosts <path>          Verify the server against a known_hosts file\n"
        "      --fingerprint <SHA256:...>    Accept only this host key (repeatable)\n"
        "  -v, --verbose                     Print connection progress to stderr\n"
        "      --init-config                 Write a commented ~/.rexec/config.yaml and exit\n"
        "      --version                     Show version\n"
        "  -h, --help                        Show this help\n"
        "\n"
        "Without --known-hosts or --fingerprint any server key is accepted.\n",
        DEFAULT_SSH_PORT, DEFAULT_INACTIVITY_TIMEOUT_SECS);
}
