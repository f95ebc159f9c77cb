#include <iostream>
#include <string>
#include "cli/options.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/shell_escape.hpp>
#include <ssh/session.hpp>

int main(int argc, char** argv) {
    try {
        auto parsed = parse_args(argc, argv);
        if (parsed.is_err()) {
            std::cerr << theme::fail(parsed.error) << usage();
            return EXIT_LOCAL_FAILURE;
        }
        const CliOptions& cli = parsed.value;

        if (cli.show_help) {
            std::cout << usage();
            return 0;
        }
        if (cli.show_version) {
            std::cout << "rexec version " << REXEC_VERSION << "\n";
            return 0;
        }

        if (cli.init_config) {
            bool existed = default_config_exists();
            auto created = create_default_config();
            if (created.is_err()) {
                std::cerr << theme::fail(created.error);
                return EXIT_LOCAL_FAILURE;
            }
            std::cout << (existed ? "Config already exists: " : "Wrote ")
                      << get_default_config_path().string() << "\n";
            return 0;
        }

        auto config = cli.config_path ? Config::load_file(*cli.config_path)
                                      : Config::load_default();
        if (config.is_err()) {
            std::cerr << theme::fail(config.error);
            return EXIT_LOCAL_FAILURE;
        }
        if (config.value.log_file()) set_log_path(*config.value.log_file());

        auto target = build_target(cli, config.value);
        if (target.is_err()) {
            std::cerr << theme::fail(target.error);
            return EXIT_LOCAL_FAILURE;
        }
        if (!target.value.host_key_policy && cli.verbose) {
            std::cerr << theme::info("host key verification disabled (no known_hosts or fingerprint)");
        }

        StatusCallback status = nullptr;
        if (cli.verbose) {
            status = [](const std::string& msg) { std::cerr << theme::log(msg); };
            status("Debug log: " + rexec_log_path());
        }

        auto session = Session::connect(target.value, nullptr, status);
        if (session.is_err()) {
            std::cerr << theme::fail(std::string(error_kind_name(session.kind)) + ": " + session.error);
            return EXIT_LOCAL_FAILURE;
        }

        // The exec request carries a single string; quoting is ours to do.
        std::string command = join_command(cli.command);
        rexec_logf("Running on {}: {}", session.value->target(), command);
        auto result = session.value->call(command);
        session.value->close();

        if (result.is_err()) {
            std::cerr << theme::fail(std::string(error_kind_name(result.kind)) + ": " + result.error);
            return EXIT_LOCAL_FAILURE;
        }

        rexec_logf("Exit code: {}", result.value.exit_status);
        if (cli.verbose) status("Exit code: " + std::to_string(result.value.exit_status));
        return result.value.exit_status;
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return EXIT_LOCAL_FAILURE;
    }
}
