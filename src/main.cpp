#include <iostream>
#include <memory>
#include <vector>
#include <string>
#include <curl/curl.h>
#include "cli/theme.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/log.hpp"
#include "managers/notifier.hpp"
#include "managers/orchestrator.hpp"
#include "managers/share_resolver.hpp"
#include "platform/signals.hpp"

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    tivowatch "
              << theme::color::RESET << theme::dim("[DEVICE_ADDRESS [SEQUENCE]]")
              << theme::dim("          Run once and exit") << "\n";
    std::cout << theme::color::BLUE << "    tivowatch --daemon "
              << theme::color::RESET << theme::dim("[DEVICE_ADDRESS [SEQUENCE]]")
              << theme::dim(" Run every check interval") << "\n";
    std::cout << theme::color::BLUE << "    tivowatch --share-for-path "
              << theme::color::RESET << theme::dim("PATH")
              << theme::dim("                Print the share label for PATH") << "\n";
    std::cout << theme::color::BLUE << "    tivowatch --list-shares"
              << theme::color::RESET
              << theme::dim("                      List configured shares") << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    --config FILE         Configuration file (default "
              << DEFAULT_CONFIG_FILE << ")\n"
              << "    --version             Show version\n"
              << "    --help                Show this help"
              << theme::color::RESET << "\n\n";
}

struct Options {
    std::string config_file = DEFAULT_CONFIG_FILE;
    bool daemon = false;
    bool list_shares = false;
    std::string share_for_path;
    std::vector<std::string> positional;
};

static int list_shares(const Config& config) {
    ShareCatalog catalog(config.paths().share_config);
    auto shares = catalog.list_shares();
    if (shares.is_err()) {
        std::cerr << theme::fail(shares.error);
        return 1;
    }
    for (const auto& s : shares.value) {
        std::cout << s.label << "\t" << s.path << "\n";
    }
    return 0;
}

static int share_for_path(const Config& config, const std::string& path) {
    ShareCatalog catalog(config.paths().share_config);
    auto label = catalog.share_for_path(path);
    if (label.is_err()) {
        std::cerr << theme::fail(label.error);
        return 1;
    }
    std::cout << label.value << "\n";
    return 0;
}

static int run_pipeline(Config& config, bool daemon) {
    platform::TerminationGuard signals;
    curl_global_init(CURL_GLOBAL_DEFAULT);

    int rc;
    {
        Orchestrator orchestrator(config, std::make_unique<SmtpTransport>(config.mail()));
        if (daemon) {
            rc = orchestrator.run_forever();
        } else {
            Run run = orchestrator.run_once();
            rc = Orchestrator::exit_status_for(run);
        }
    }

    curl_global_cleanup();
    return rc;
}

int main(int argc, char** argv) {
    try {
        Options opts;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--version") {
                std::cout << theme::bold("tivowatch") << theme::dim(" version ")
                          << theme::dim(TIVOWATCH_VERSION) << "\n";
                return 0;
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else if (arg == "--daemon") {
                opts.daemon = true;
            } else if (arg == "--list-shares") {
                opts.list_shares = true;
            } else if (arg == "--config" || arg == "--share-for-path") {
                if (i + 1 >= argc) {
                    std::cerr << theme::fail("Missing value for " + arg);
                    return 1;
                }
                (arg == "--config" ? opts.config_file : opts.share_for_path) = argv[++i];
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << theme::fail("Unknown option: " + arg);
                print_usage();
                return 1;
            } else {
                opts.positional.push_back(arg);
            }
        }

        if (opts.positional.size() > 2) {
            std::cerr << theme::fail("Too many arguments.");
            print_usage();
            return 1;
        }

        auto loaded = Config::load(opts.config_file);
        if (loaded.is_err()) {
            std::cerr << theme::fail("Configuration error: " + loaded.error);
            return EXIT_CONFIG_ERROR;
        }
        Config config = std::move(loaded.value);

        if (!opts.share_for_path.empty()) return share_for_path(config, opts.share_for_path);
        if (opts.list_shares) return list_shares(config);

        if (opts.positional.size() >= 1) config.set_device_address(opts.positional[0]);
        if (opts.positional.size() >= 2) config.set_sequence(opts.positional[1]);

        set_log_file(config.paths().log_file);
        return run_pipeline(config, opts.daemon);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return EXIT_ORCHESTRATION_ERROR;
    }
}
