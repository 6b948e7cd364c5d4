/**
 * subforge - Subdomain Candidate Generator
 *
 * Combines one or two wordlists with a base domain to produce candidate
 * subdomain names for DNS resolution / probing tools.
 *
 * Usage:
 *   subforge -w <wordlist> -d <domain> [--depth 1|2|both] [-W <wordlist2>]
 *            [-o <output> | --stdout]
 *
 * Example:
 *   subforge -w words.txt -d example.com --depth both -o out/subs.txt
 *   subforge -w words.txt -d example.com --stdout | dnsx -silent
 */

#include <iostream>
#include <new>
#include <string>

#include "cli/arguments.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/pipeline.hpp"
#include "core/staged_file.hpp"
#include "core/version.hpp"

using namespace subforge;

/**
 * Main entry point.
 */
int main(int argc, char* argv[]) {
    Arguments args;
    try {
        args = parse_args(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(std::cerr);
        return to_int(e.code());
    }

    if (args.help) {
        print_usage(std::cout);
        return 0;
    }
    if (args.version) {
        print_version(std::cout);
        return 0;
    }

    // Termination signals must remove any staged output file
    install_cleanup_handlers();

    try {
        // Load config file (subforge.yml in current directory or ~/.subforge/config.yml)
        // Command-line arguments take precedence over config file
        AppConfig app_config;
        if (app_config.load(args.config_file)) {
            apply_config_to_args(args, app_config);
        }

        // Logging is best effort; a read-only home must not block generation
        auto& logger = Logger::instance();
        if (logger.init(args.log_dir)) {
            LOG_INFO(std::string("Starting subforge v") + SUBFORGE_VERSION);
            if (args.verbose) {
                std::cerr << "[*] Logging to " << logger.get_log_path() << "\n";
            }
            if (!app_config.source_path.empty()) {
                LOG_INFO("Config loaded from " + app_config.source_path);
            }
        } else if (args.verbose) {
            std::cerr << "[*] Logging disabled: cannot open log directory\n";
        }

        logger.log_startup(depth_name(args.depth), args.domain, args.wordlist, args.wordlist2,
                           args.stream_mode ? "<stdout>" : args.output);

        RunOptions options;
        options.wordlist = args.wordlist;
        options.wordlist2 = args.wordlist2;
        options.domain = args.domain;
        options.depth = args.depth;
        options.output = args.output;
        options.stream_mode = args.stream_mode;
        options.warn_threshold = args.warn_threshold;
        options.verbose = args.verbose;

        Pipeline pipeline(options, std::cin, std::cout, std::cerr);
        pipeline.run();
        return 0;

    } catch (const std::bad_alloc& e) {
        std::cerr << "Error: out of memory while generating candidates\n";
        Logger::instance().log_error("out of memory");
        return to_int(exit_code_for(e));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        Logger::instance().log_error(e.what());
        return to_int(exit_code_for(e));
    }
}
