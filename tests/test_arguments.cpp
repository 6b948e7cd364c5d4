/**
 * Argument Parsing Tests
 *
 * Tests for required flags, defaults, depth validation, conflicting
 * output modes and help/version short-circuiting.
 */

#include "../src/cli/arguments.hpp"
#include <iostream>
#include <cassert>
#include <sstream>
#include <string>
#include <vector>

using namespace subforge;

static Arguments parse(std::vector<const char*> argv) {
    argv.insert(argv.begin(), "subforge");
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

static bool is_usage_error(std::vector<const char*> argv, const std::string& fragment = "") {
    try {
        parse(argv);
    } catch (const UsageError& e) {
        assert(e.code() == ExitCode::USAGE_ERROR);
        if (!fragment.empty()) {
            assert(std::string(e.what()).find(fragment) != std::string::npos);
        }
        return true;
    }
    return false;
}

void test_minimal_defaults() {
    Arguments args = parse({"-w", "words.txt", "-d", "example.com"});

    assert(args.wordlist == "words.txt");
    assert(args.wordlist2 == "words.txt");  // Defaults to wordlist
    assert(args.domain == "example.com");
    assert(args.depth == Depth::ONE);
    assert(args.output == "subdomains.txt");
    assert(!args.stream_mode);
    assert(!args.depth_set && !args.output_set && !args.stream_set);

    std::cout << "[PASS] Minimal invocation and defaults\n";
}

void test_long_options() {
    Arguments args = parse({"--wordlist", "a.txt", "--wordlist2", "b.txt", "--domain", "ex.com",
                            "--depth", "both", "--out", "out/subs.txt", "--config", "c.yml",
                            "--verbose"});

    assert(args.wordlist == "a.txt");
    assert(args.wordlist2 == "b.txt");
    assert(args.domain == "ex.com");
    assert(args.depth == Depth::BOTH);
    assert(args.depth_set);
    assert(args.output == "out/subs.txt");
    assert(args.output_set);
    assert(args.config_file == "c.yml");
    assert(args.verbose);

    std::cout << "[PASS] Long options\n";
}

void test_blank_wordlist2_defaults() {
    Arguments args = parse({"-w", "a.txt", "-W", "  ", "-d", "ex.com", "--depth", "2"});
    assert(args.wordlist2 == "a.txt");
    assert(args.depth == Depth::TWO);

    std::cout << "[PASS] Blank wordlist2 falls back to wordlist\n";
}

void test_stdin_wordlist() {
    Arguments args = parse({"-w", "-", "-d", "ex.com"});
    assert(args.wordlist == "-");
    assert(args.wordlist2 == "-");

    std::cout << "[PASS] Stdin wordlist\n";
}

void test_missing_required() {
    assert(is_usage_error({}, "no arguments"));
    assert(is_usage_error({"-d", "ex.com"}, "--wordlist is required"));
    assert(is_usage_error({"-w", "a.txt"}, "--domain is required"));
    assert(is_usage_error({"-w", "   ", "-d", "ex.com"}, "--wordlist is required"));
    assert(is_usage_error({"-w", "a.txt", "-d", ""}, "--domain is required"));

    std::cout << "[PASS] Missing required arguments\n";
}

void test_missing_value() {
    assert(is_usage_error({"-w", "a.txt", "-d"}, "missing value for -d"));
    assert(is_usage_error({"-d", "ex.com", "--wordlist"}, "missing value for --wordlist"));
    assert(is_usage_error({"-w", "a.txt", "-d", "ex.com", "--depth"}, "missing value for --depth"));

    std::cout << "[PASS] Missing option values\n";
}

void test_invalid_depth() {
    assert(is_usage_error({"-w", "a.txt", "-d", "ex.com", "--depth", "3"}, "--depth must be one of"));
    assert(is_usage_error({"-w", "a.txt", "-d", "ex.com", "--depth", "BOTH"}));
    assert(is_usage_error({"-w", "a.txt", "-d", "ex.com", "--depth", ""}));

    std::cout << "[PASS] Invalid depth values\n";
}

void test_unknown_and_extra() {
    assert(is_usage_error({"-w", "a.txt", "-d", "ex.com", "--fast"}, "unknown option: --fast"));
    assert(is_usage_error({"-w", "a.txt", "-d", "ex.com", "-x"}, "unknown option"));
    assert(is_usage_error({"-w", "a.txt", "-d", "ex.com", "extra"}, "unexpected positional argument: extra"));
    assert(is_usage_error({"-w", "a.txt", "-d", "ex.com", "--", "extra"}, "unexpected positional argument"));

    // A bare "--" at the end is fine
    Arguments args = parse({"-w", "a.txt", "-d", "ex.com", "--"});
    assert(args.domain == "ex.com");

    std::cout << "[PASS] Unknown flags and extra arguments\n";
}

void test_stdout_conflict() {
    assert(is_usage_error({"-w", "a.txt", "-d", "ex.com", "--stdout", "-o", "out.txt"}, "--stdout"));
    assert(is_usage_error({"-w", "a.txt", "-d", "ex.com", "-o", "dir/x.txt", "--stdout"}));

    // Naming the default path explicitly is not a conflict
    Arguments args = parse({"-w", "a.txt", "-d", "ex.com", "--stdout", "-o", "subdomains.txt"});
    assert(args.stream_mode);

    Arguments plain = parse({"-w", "a.txt", "-d", "ex.com", "--stdout"});
    assert(plain.stream_mode && plain.stream_set);

    std::cout << "[PASS] Stream mode and output path conflict\n";
}

void test_help_version_short_circuit() {
    Arguments help = parse({"--help"});
    assert(help.help);

    // Stops before later arguments are looked at
    Arguments help_first = parse({"-h", "--bogus", "--depth", "9"});
    assert(help_first.help);

    Arguments version = parse({"-w", "a.txt", "-v", "extra"});
    assert(version.version);
    assert(!version.help);

    // Errors before the flag still count
    assert(is_usage_error({"--bogus", "--help"}, "unknown option"));

    std::cout << "[PASS] Help and version short-circuit\n";
}

void test_usage_text() {
    std::ostringstream usage;
    print_usage(usage);
    assert(usage.str().find("--wordlist") != std::string::npos);
    assert(usage.str().find("--stdout") != std::string::npos);
    assert(usage.str().find("--depth {1|2|both}") != std::string::npos);

    std::ostringstream version;
    print_version(version);
    assert(version.str() == std::string("subforge v") + SUBFORGE_VERSION + "\n");

    std::cout << "[PASS] Usage and version text\n";
}

int main() {
    std::cout << "=== Argument Parsing Tests ===\n\n";

    test_minimal_defaults();
    test_long_options();
    test_blank_wordlist2_defaults();
    test_stdin_wordlist();
    test_missing_required();
    test_missing_value();
    test_invalid_depth();
    test_unknown_and_extra();
    test_stdout_conflict();
    test_help_version_short_circuit();
    test_usage_text();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
