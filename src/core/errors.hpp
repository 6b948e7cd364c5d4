/**
 * subforge Error Types
 *
 * Every failure that ends a run is thrown as a subforge::Error carrying
 * the process exit code it maps to. main() is the only place that turns
 * them into exit statuses.
 */

#pragma once

#include <new>
#include <stdexcept>
#include <string>

namespace subforge {

/**
 * Process exit codes.
 */
enum class ExitCode : int {
    SUCCESS = 0,
    IO_ERROR = 1,        // Unreadable input, uncreatable directory, unwritable output
    USAGE_ERROR = 2,     // Bad or conflicting command-line arguments
    RESOURCE_LIMIT = 3,  // Storage quota / file size limit hit while writing
};

inline int to_int(ExitCode code) {
    return static_cast<int>(code);
}

class Error : public std::runtime_error {
public:
    Error(const std::string& message, ExitCode code)
        : std::runtime_error(message), code_(code) {}

    ExitCode code() const { return code_; }

private:
    ExitCode code_;
};

/**
 * Missing, malformed, unknown or conflicting arguments.
 * Always raised before any input is read or output is touched.
 */
class UsageError : public Error {
public:
    explicit UsageError(const std::string& message)
        : Error(message, ExitCode::USAGE_ERROR) {}
};

/**
 * A source or destination could not be opened, created or written.
 */
class IoError : public Error {
public:
    IoError(const std::string& message, const std::string& path)
        : Error(message + " '" + path + "'", ExitCode::IO_ERROR), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * The storage layer refused further writes (ENOSPC, EDQUOT, EFBIG).
 * Kept apart from IoError: the fix is an environment limit, not a path.
 */
class ResourceLimitError : public Error {
public:
    ResourceLimitError(const std::string& message, const std::string& path)
        : Error(message + " '" + path + "'", ExitCode::RESOURCE_LIMIT), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * Exit status for an exception that ended a run. Anything that is not a
 * subforge::Error counts as an I/O failure, except running out of memory.
 */
inline ExitCode exit_code_for(const std::exception& e) {
    if (auto* error = dynamic_cast<const Error*>(&e)) {
        return error->code();
    }
    if (dynamic_cast<const std::bad_alloc*>(&e)) {
        return ExitCode::RESOURCE_LIMIT;
    }
    return ExitCode::IO_ERROR;
}

}  // namespace subforge
