/**
 * config.hpp - Simple YAML configuration loader for subforge
 *
 * Parses a subset of YAML (key: value pairs with sections) without external dependencies.
 * Command-line arguments override config file settings.
 *
 *   generate:
 *     depth: both
 *   output:
 *     path: out/subdomains.txt
 *     stdout: false
 *   settings:
 *     verbose: true
 *     warn_threshold: 5000000
 *   paths:
 *     log_dir: ~/.subforge
 */

#pragma once

#include <string>
#include <fstream>
#include <sstream>
#include <vector>
#include <filesystem>
#include <iostream>
#include <algorithm>
#include <optional>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <system_error>

#include "errors.hpp"
#include "generator.hpp"

namespace subforge {

/**
 * Application configuration loaded from subforge.yml
 */
struct AppConfig {
    static constexpr uint64_t DEFAULT_WARN_THRESHOLD = 10'000'000;

    // Generation
    std::optional<Depth> depth;

    // Output
    std::string output_path;
    std::optional<bool> stream_mode;

    // Settings
    bool verbose = false;
    uint64_t warn_threshold = DEFAULT_WARN_THRESHOLD;

    // Paths
    std::string log_dir;

    // File this config came from (empty = defaults only)
    std::string source_path;

    /**
     * Get possible config file paths (in order of priority)
     */
    static std::vector<std::string> get_config_paths() {
        std::vector<std::string> paths;

        // 1. Current directory
        paths.push_back("./subforge.yml");
        paths.push_back("./subforge.yaml");

        // 2. User home directory
        const char* home_env = std::getenv("HOME");
        std::string home = home_env ? home_env : "";
        if (!home.empty()) {
            paths.push_back(home + "/.subforge/config.yml");
            paths.push_back(home + "/.subforge/config.yaml");
        }

        return paths;
    }

    /**
     * Load configuration from YAML file.
     * Returns true if a config file was found and loaded.
     * Throws IoError if an explicit path is missing or unreadable.
     */
    bool load(const std::string& explicit_path = "", std::ostream& diagnostics = std::cerr) {
        std::string config_path;
        std::error_code ec;

        if (!explicit_path.empty()) {
            if (!std::filesystem::is_regular_file(explicit_path, ec)) {
                throw IoError("config file not found", explicit_path);
            }
            config_path = explicit_path;
        } else {
            for (const auto& path : get_config_paths()) {
                if (std::filesystem::is_regular_file(path, ec)) {
                    config_path = path;
                    break;
                }
            }
        }

        if (config_path.empty()) {
            return false;  // No config file found (this is OK)
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            throw IoError("cannot read config file", config_path);
        }

        parse(file, diagnostics);
        source_path = config_path;
        return true;
    }

    /**
     * Parse config text. Bad values are reported with their line number and skipped.
     */
    void parse(std::istream& in, std::ostream& diagnostics) {
        std::string line;
        std::string current_section;
        int line_number = 0;

        while (std::getline(in, line)) {
            line_number++;

            size_t indent = line.find_first_not_of(" \t");
            if (indent == std::string::npos) continue;

            // Drop trailing comments, then surrounding whitespace and CR
            std::string trimmed = trim(strip_comment(line.substr(indent)));

            // Skip empty lines, comments and document markers
            if (trimmed.empty() || trimmed[0] == '#' || trimmed.compare(0, 3, "---") == 0) {
                continue;
            }

            size_t colon_pos = trimmed.find(':');
            if (colon_pos == std::string::npos) continue;

            std::string key = trim(trimmed.substr(0, colon_pos));
            std::string value = unquote(trim(trimmed.substr(colon_pos + 1)));

            // Section header (no value, at column zero)
            if (value.empty() && indent == 0) {
                current_section = key;
                continue;
            }

            try {
                parse_value(current_section, key, value);
            } catch (const std::exception& e) {
                diagnostics << "[!] Config parse error at line " << line_number << ": " << e.what() << "\n";
            }
        }
    }

private:
    void parse_value(const std::string& section, const std::string& key, const std::string& value) {
        if (section == "generate") {
            if (key == "depth") {
                auto parsed = parse_depth(value);
                if (!parsed) {
                    throw std::invalid_argument("depth must be one of: 1, 2, both (got '" + value + "')");
                }
                depth = *parsed;
            }
        }
        else if (section == "output") {
            if (key == "path") output_path = value;
            else if (key == "stdout") stream_mode = parse_bool(value);
        }
        else if (section == "settings") {
            if (key == "verbose") verbose = parse_bool(value);
            else if (key == "warn_threshold") warn_threshold = parse_count(value);
        }
        else if (section == "paths") {
            if (key == "log_dir") log_dir = value;
        }
    }

    static std::string trim(const std::string& text) {
        const char* whitespace = " \t\r";
        size_t start = text.find_first_not_of(whitespace);
        if (start == std::string::npos) return "";
        size_t end = text.find_last_not_of(whitespace);
        return text.substr(start, end - start + 1);
    }

    // A '#' starts a comment only at the beginning or after whitespace
    static std::string strip_comment(const std::string& text) {
        for (size_t i = 1; i < text.size(); i++) {
            if (text[i] == '#' && (text[i - 1] == ' ' || text[i - 1] == '\t')) {
                return text.substr(0, i);
            }
        }
        return text;
    }

    static std::string unquote(const std::string& value) {
        if (value.length() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            return value.substr(1, value.length() - 2);
        }
        return value;
    }

    // stoull accepts "-5" and wraps it; only plain digits are a count
    static uint64_t parse_count(const std::string& value) {
        if (value.empty() || !std::all_of(value.begin(), value.end(),
                [](unsigned char c) { return std::isdigit(c) != 0; })) {
            throw std::invalid_argument("warn_threshold must be a non-negative integer (got '" + value + "')");
        }
        return std::stoull(value);
    }

    static bool parse_bool(const std::string& value) {
        std::string lower = value;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return (lower == "true" || lower == "yes" || lower == "1" || lower == "on");
    }
};

/**
 * Apply config file settings to Arguments struct.
 * Only applies settings the command line did not set explicitly.
 */
template<typename Arguments>
void apply_config_to_args(Arguments& args, const AppConfig& config) {
    if (!args.depth_set && config.depth) {
        args.depth = *config.depth;
    }

    // --stdout or -o on the command line picks the mode; the config only
    // fills in when neither was given
    if (!args.stream_set && !args.output_set) {
        if (config.stream_mode) {
            args.stream_mode = *config.stream_mode;
        }
        if (!config.output_path.empty()) {
            args.output = config.output_path;
        }
    }

    if (config.verbose) args.verbose = true;
    args.warn_threshold = config.warn_threshold;

    if (args.log_dir.empty() && !config.log_dir.empty()) {
        args.log_dir = config.log_dir;
    }
}

}  // namespace subforge
