/**
 * subforge Wordlist Loader
 *
 * Reads a line-oriented wordlist fully into memory as normalized prefixes,
 * in file order with duplicates kept. Sources are file paths, /dev/fd/N
 * handles (process substitution), or "-" for standard input.
 */

#pragma once

#include "errors.hpp"
#include "logger.hpp"
#include "normalizer.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <istream>
#include <string>
#include <system_error>
#include <vector>

namespace subforge {

/**
 * Name that selects standard input as a wordlist source.
 */
inline constexpr const char* STDIN_SOURCE = "-";

/**
 * One loaded wordlist.
 */
struct Wordlist {
    std::string source;                 // Path as given on the command line
    std::vector<std::string> prefixes;  // Normalized, file order, duplicates kept
    size_t raw_lines = 0;               // Lines read, including skipped ones

    size_t size() const { return prefixes.size(); }
    bool empty() const { return prefixes.empty(); }
    size_t skipped() const { return raw_lines - prefixes.size(); }
};

/**
 * Read every line of an open stream through the normalizer.
 * Throws IoError if the stream goes bad before end of input.
 */
inline Wordlist read_wordlist(std::istream& in, const std::string& source) {
    Wordlist list;
    list.source = source;

    std::string line;
    while (std::getline(in, line)) {
        list.raw_lines++;
        if (auto prefix = normalize_line(line)) {
            list.prefixes.push_back(std::move(*prefix));
        }
    }

    if (in.bad()) {
        throw IoError("failed while reading wordlist", source);
    }

    return list;
}

/**
 * Open and read a wordlist source.
 * @param stdin_stream Stream used when source is "-"
 */
inline Wordlist load_wordlist(const std::string& source, std::istream& stdin_stream = std::cin) {
    Wordlist list;
    if (source == STDIN_SOURCE) {
        list = read_wordlist(stdin_stream, source);
    } else {
        std::error_code ec;
        if (std::filesystem::is_directory(source, ec)) {
            throw IoError("cannot read wordlist at", source);
        }
        std::ifstream file(source);
        if (!file.is_open()) {
            throw IoError("cannot read wordlist at", source);
        }
        list = read_wordlist(file, source);
    }

    Logger::instance().log_wordlist(list.source, list.raw_lines, list.size());
    return list;
}

}  // namespace subforge
