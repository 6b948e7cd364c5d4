/**
 * subforge Command-Line Arguments
 *
 * Usage:
 *   subforge -w WORDLIST -d DOMAIN [--depth 1|2|both] [-W WORDLIST2] [-o OUTPUT | --stdout]
 *
 * Parsing is strict: unknown flags, stray positionals, missing values and
 * conflicting output modes are usage errors. --help and --version stop
 * parsing as soon as they are seen.
 */

#pragma once

#include "../core/errors.hpp"
#include "../core/generator.hpp"
#include "../core/config.hpp"
#include "../core/version.hpp"
#include "../sink/output_sink.hpp"

#include <cstdint>
#include <ostream>
#include <string>

namespace subforge {

/**
 * Command-line arguments.
 */
struct Arguments {
    std::string wordlist;                       // First wordlist (prefix1), "-" = stdin
    std::string wordlist2;                      // Second wordlist (prefix2), defaults to wordlist
    std::string domain;                         // Base domain, used verbatim
    Depth depth = Depth::ONE;                   // Generation depth
    std::string output = sink::DEFAULT_OUTPUT;  // File-mode destination
    bool stream_mode = false;                   // Write candidates to stdout instead of a file
    std::string config_file;                    // Custom config file path
    std::string log_dir;                        // Log directory (config only)
    uint64_t warn_threshold = AppConfig::DEFAULT_WARN_THRESHOLD;
    bool verbose = false;

    bool help = false;
    bool version = false;

    // Which options the command line set explicitly (config must not override)
    bool depth_set = false;
    bool output_set = false;
    bool stream_set = false;
};

namespace detail {

inline bool is_blank_value(const std::string& value) {
    return value.find_first_not_of(" \t") == std::string::npos;
}

}  // namespace detail

/**
 * Parse command-line arguments.
 * Throws UsageError for anything that is not a valid invocation.
 */
inline Arguments parse_args(int argc, const char* const argv[]) {
    Arguments args;

    if (argc <= 1) {
        throw UsageError("no arguments provided.");
    }

    std::string depth_value = depth_name(args.depth);

    int i = 1;
    auto take_value = [&](const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw UsageError("missing value for " + flag);
        }
        return argv[++i];
    };

    for (; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return args;
        } else if (arg == "--version" || arg == "-v") {
            args.version = true;
            return args;
        } else if (arg == "--wordlist" || arg == "-w") {
            args.wordlist = take_value(arg);
        } else if (arg == "--wordlist2" || arg == "-W") {
            args.wordlist2 = take_value(arg);
        } else if (arg == "--domain" || arg == "-d") {
            args.domain = take_value(arg);
        } else if (arg == "--depth") {
            depth_value = take_value(arg);
            args.depth_set = true;
        } else if (arg == "--out" || arg == "-o") {
            args.output = take_value(arg);
            args.output_set = true;
        } else if (arg == "--stdout") {
            args.stream_mode = true;
            args.stream_set = true;
        } else if (arg == "--config" || arg == "-c") {
            args.config_file = take_value(arg);
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--") {
            if (i + 1 < argc) {
                throw UsageError(std::string("unexpected positional argument: ") + argv[i + 1]);
            }
            break;
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            throw UsageError("unknown option: " + arg);
        } else {
            throw UsageError("unexpected positional argument: " + arg);
        }
    }

    if (detail::is_blank_value(args.wordlist)) {
        throw UsageError("--wordlist is required.");
    }
    if (detail::is_blank_value(args.domain)) {
        throw UsageError("--domain is required.");
    }
    if (detail::is_blank_value(args.wordlist2)) {
        args.wordlist2 = args.wordlist;
    }

    auto depth = parse_depth(depth_value);
    if (!depth) {
        throw UsageError("--depth must be one of: 1, 2, both");
    }
    args.depth = *depth;

    if (args.stream_mode && args.output_set && args.output != sink::DEFAULT_OUTPUT) {
        throw UsageError("--stdout cannot be combined with -o/--out " + args.output);
    }
    if (args.output_set && detail::is_blank_value(args.output)) {
        throw UsageError("-o/--out requires a non-empty path");
    }

    return args;
}

inline void print_version(std::ostream& out) {
    out << SUBFORGE_NAME << " v" << SUBFORGE_VERSION << "\n";
}

/**
 * Print usage information.
 */
inline void print_usage(std::ostream& out) {
    out << R"(Usage:
  subforge -w WORDLIST -d DOMAIN [--depth 1|2|both] [-W WORDLIST2] [-o OUTPUT | --stdout]

Required:
  -w, --wordlist PATH     First wordlist (prefix1), "-" reads stdin
  -d, --domain  DOMAIN    Base domain, e.g. example.com

Optional:
  -W, --wordlist2 PATH    Second wordlist (prefix2). Defaults to --wordlist.
  --depth {1|2|both}      Generation depth (default: 1)
  -o, --out PATH          Output file (default: ./subdomains.txt)
  --stdout                Write candidates to stdout instead of a file
  -c, --config PATH       Config file (default: ./subforge.yml)
  --verbose               Progress on stderr
  -h, --help              Show help and exit
  -v, --version           Show version and exit

Depths:
  1     <prefix1>.<domain>
  2     <prefix1>.<prefix2>.<domain>   (|wordlist| x |wordlist2| names)
  both  union of 1 and 2

Notes:
- Skips blank lines and lines starting with '#'.
- Lowercases prefixes; trims whitespace; strips CRLFs.
- Creates the output directory if needed.
- Output is sorted and deduplicated.

Exit codes:
  0 success, 1 I/O error, 2 usage error, 3 storage limit reached

Examples:
  subforge -w wordlist.txt -d example.com --depth 1
  subforge -w wordlist.txt -W sub2.txt -d example.com --depth 2 -o out.txt
  subforge -w wordlist.txt -d example.com --depth both --stdout | dnsx -silent
)";
}

}  // namespace subforge
