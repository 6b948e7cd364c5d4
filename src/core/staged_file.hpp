/**
 * Staged Output File
 *
 * Scoped temporary file that becomes the destination only on commit().
 *
 * SAFETY:
 * - Created next to the destination so the final rename stays on one filesystem
 * - Destructor removes the temp file unless commit() succeeded
 * - SIGINT/SIGTERM/SIGHUP handlers unlink the temp file before the process dies
 * - commit() flushes, fsyncs, then renames atomically over the destination
 * - A symlinked destination keeps its link; an existing file keeps its mode
 */

#pragma once

#include "errors.hpp"
#include "logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace subforge {

namespace detail {

// At most one staged file is live per process; the handler reads these.
inline constexpr size_t CLEANUP_PATH_MAX = 4096;
inline char g_cleanup_path[CLEANUP_PATH_MAX] = {};
inline volatile std::sig_atomic_t g_cleanup_armed = 0;

inline void cleanup_signal_handler(int signum) {
    if (g_cleanup_armed) {
        ::unlink(g_cleanup_path);
        g_cleanup_armed = 0;
    }
    std::signal(signum, SIG_DFL);
    std::raise(signum);
}

inline void arm_cleanup(const std::string& path) {
    if (path.size() >= CLEANUP_PATH_MAX) return;
    g_cleanup_armed = 0;
    std::memcpy(g_cleanup_path, path.c_str(), path.size() + 1);
    g_cleanup_armed = 1;
}

inline void disarm_cleanup() {
    g_cleanup_armed = 0;
}

inline bool is_resource_limit(int err) {
    if (err == ENOSPC || err == EFBIG) return true;
#ifdef EDQUOT
    if (err == EDQUOT) return true;
#endif
    return false;
}

}  // namespace detail

/**
 * Route termination signals through the staged-file cleanup, and turn
 * RLIMIT_FSIZE overruns into EFBIG write errors instead of SIGXFSZ kills.
 */
inline void install_cleanup_handlers() {
    std::signal(SIGINT, detail::cleanup_signal_handler);
    std::signal(SIGTERM, detail::cleanup_signal_handler);
    std::signal(SIGHUP, detail::cleanup_signal_handler);
    std::signal(SIGXFSZ, SIG_IGN);
}

/**
 * Throw ResourceLimitError or IoError for a failed write, based on errno.
 */
[[noreturn]] inline void throw_write_error(int err, const std::string& path) {
    if (detail::is_resource_limit(err)) {
        throw ResourceLimitError(std::string("storage limit reached (") + std::strerror(err) +
                                 ") while writing", path);
    }
    if (err != 0) {
        throw IoError(std::string("write failed (") + std::strerror(err) + ") for", path);
    }
    throw IoError("write failed for", path);
}

class StagedFile {
public:
    /**
     * Create the temp file beside destination.
     * The destination's directory must already exist. A symlinked
     * destination is followed, so commit() replaces the file it points to.
     */
    explicit StagedFile(std::filesystem::path destination)
        : destination_(std::move(destination)), target_(resolve_target(destination_)) {
        std::filesystem::path dir = target_.parent_path();
        if (dir.empty()) dir = ".";

        std::string pattern = (dir / ("." + target_.filename().string() + ".XXXXXX")).string();

        int fd = ::mkstemp(pattern.data());
        if (fd < 0) {
            int err = errno;
            if (detail::is_resource_limit(err)) {
                throw ResourceLimitError("cannot create temporary file in", dir.string());
            }
            throw IoError("cannot write to", destination_.string());
        }

        // mkstemp creates 0600; keep an existing file's mode, else the umask'd default
        if (::fchmod(fd, output_mode(target_)) != 0) {
            LOG_WARN("Could not set permissions on " + pattern + ": " + std::strerror(errno));
        }
        ::close(fd);

        temp_path_ = pattern;
        detail::arm_cleanup(temp_path_);

        stream_.open(temp_path_, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!stream_.is_open()) {
            discard();
            throw IoError("cannot write to", destination_.string());
        }
    }

    ~StagedFile() {
        if (!committed_) {
            discard();
        }
    }

    StagedFile(const StagedFile&) = delete;
    StagedFile& operator=(const StagedFile&) = delete;

    std::ostream& stream() { return stream_; }

    const std::string& temp_path() const { return temp_path_; }
    const std::filesystem::path& destination() const { return destination_; }
    const std::filesystem::path& target() const { return target_; }
    bool committed() const { return committed_; }

    /**
     * Throw if any write so far has failed.
     */
    void check() {
        if (!stream_) {
            throw_write_error(errno, destination_.string());
        }
    }

    /**
     * Flush, sync and atomically move the temp file onto the destination.
     */
    void commit() {
        errno = 0;
        stream_.flush();
        check();
        stream_.close();
        if (stream_.fail()) {
            throw_write_error(errno, destination_.string());
        }

        // Sync to disk before rename
        {
            int fd = ::open(temp_path_.c_str(), O_RDONLY);
            if (fd >= 0) {
                if (::fsync(fd) != 0 && detail::is_resource_limit(errno)) {
                    int err = errno;
                    ::close(fd);
                    throw_write_error(err, destination_.string());
                }
                ::close(fd);
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp_path_, target_, ec);
        if (ec) {
            throw IoError("cannot move output into place at", destination_.string());
        }

        committed_ = true;
        detail::disarm_cleanup();
        LOG_DEBUG("Staged file committed: " + temp_path_ + " -> " + target_.string());
    }

private:
    static std::filesystem::path resolve_target(const std::filesystem::path& destination) {
        std::error_code ec;
        if (!std::filesystem::is_symlink(destination, ec)) {
            return destination;
        }
        std::filesystem::path resolved = std::filesystem::weakly_canonical(destination, ec);
        return ec ? destination : resolved;
    }

    static mode_t output_mode(const std::filesystem::path& target) {
        struct stat st;
        if (::stat(target.c_str(), &st) == 0 && S_ISREG(st.st_mode)) {
            return st.st_mode & 07777;
        }
        mode_t mask = ::umask(0);
        ::umask(mask);
        return 0666 & ~mask;
    }

    void discard() {
        if (stream_.is_open()) {
            stream_.close();
        }
        detail::disarm_cleanup();
        if (!temp_path_.empty()) {
            std::error_code ec;
            std::filesystem::remove(temp_path_, ec);
        }
    }

    std::filesystem::path destination_;
    std::filesystem::path target_;   // destination_ with a symlink followed
    std::string temp_path_;
    std::ofstream stream_;
    bool committed_ = false;
};

}  // namespace subforge
