/**
 * subforge Logger
 *
 * File-based run log for auditing what was generated and from which inputs.
 * Logs to ~/.subforge/subforge.log (or the configured log_dir) with
 * timestamps and rotation. Never writes to stdout, which stream mode owns.
 */

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <mutex>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <system_error>

namespace subforge {

class Logger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARN,
        ERR,    // Named ERR to avoid Windows ERROR macro conflict
        FATAL
    };

    static constexpr uintmax_t ROTATE_BYTES = 10 * 1024 * 1024;

    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /**
     * Open the log file. Returns false if the directory or file cannot be
     * prepared; logging then stays disabled and log() is a no-op.
     */
    bool init(const std::string& log_dir = "") {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string dir = expand_home(log_dir.empty() ? default_dir() : log_dir);

        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return false;
        }

        log_path_ = dir + "/subforge.log";

        // Rotate log if too large
        if (std::filesystem::exists(log_path_, ec)) {
            auto size = std::filesystem::file_size(log_path_, ec);
            if (!ec && size > ROTATE_BYTES) {
                std::string backup = log_path_ + ".old";
                std::filesystem::remove(backup, ec);
                std::filesystem::rename(log_path_, backup, ec);
            }
        }

        log_file_.open(log_path_, std::ios::app);
        if (!log_file_.is_open()) {
            return false;
        }

        initialized_ = true;

        // Write directly, we already hold the mutex
        log_file_ << timestamp() << " [INFO ] === subforge Logger Started ===\n";
        log_file_.flush();

        return true;
    }

    void log(Level level, const std::string& message) {
        if (!initialized_) return;

        std::lock_guard<std::mutex> lock(mutex_);

        log_file_ << timestamp() << " [" << level_str(level) << "] " << message << "\n";
        log_file_.flush();
    }

    void log_startup(const std::string& depth, const std::string& domain,
                     const std::string& wordlist, const std::string& wordlist2,
                     const std::string& destination) {
        std::stringstream ss;
        ss << "STARTUP: Depth=" << depth
           << ", Domain=" << domain
           << ", Wordlist=" << wordlist
           << ", Wordlist2=" << wordlist2
           << ", Output=" << destination;
        log(Level::INFO, ss.str());
    }

    void log_wordlist(const std::string& source, size_t raw_lines, size_t prefixes) {
        std::stringstream ss;
        ss << "WORDLIST: Source=" << source
           << ", Lines=" << raw_lines
           << ", Prefixes=" << prefixes
           << ", Skipped=" << (raw_lines - prefixes);
        log(Level::INFO, ss.str());
    }

    void log_estimate(uint64_t estimated) {
        log(Level::INFO, "ESTIMATE: Candidates=" + std::to_string(estimated));
    }

    void log_result(size_t generated, size_t unique, const std::string& destination,
                    double elapsed_sec) {
        std::stringstream ss;
        ss << "RESULT: Generated=" << generated
           << ", Unique=" << unique
           << ", Output=" << destination
           << ", ElapsedSec=" << std::fixed << std::setprecision(3) << elapsed_sec;
        log(Level::INFO, ss.str());
    }

    void log_error(const std::string& error_msg) {
        log(Level::ERR, "ERROR: " + error_msg);
    }

    std::string get_log_path() const { return log_path_; }

    ~Logger() {
        if (initialized_) {
            log(Level::INFO, "=== subforge Logger Stopped ===");
            log_file_.close();
        }
    }

private:
    Logger() : initialized_(false) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    static std::string home_dir() {
#ifdef _WIN32
        const char* home = std::getenv("USERPROFILE");
#else
        const char* home = std::getenv("HOME");
#endif
        return home ? home : "";
    }

    static std::string default_dir() {
        std::string home = home_dir();
        return home.empty() ? "." : home + "/.subforge";
    }

    static std::string expand_home(const std::string& dir) {
        if (dir.size() >= 1 && dir[0] == '~' && (dir.size() == 1 || dir[1] == '/')) {
            std::string home = home_dir();
            if (!home.empty()) return home + dir.substr(1);
        }
        return dir;
    }

    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::stringstream ss;
        ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S")
           << "." << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    static const char* level_str(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO:  return "INFO ";
            case Level::WARN:  return "WARN ";
            case Level::ERR:   return "ERROR";
            case Level::FATAL: return "FATAL";
            default: return "?????";
        }
    }

    bool initialized_;
    std::string log_path_;
    std::ofstream log_file_;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_INFO(msg)  subforge::Logger::instance().log(subforge::Logger::Level::INFO, msg)
#define LOG_WARN(msg)  subforge::Logger::instance().log(subforge::Logger::Level::WARN, msg)
#define LOG_ERROR(msg) subforge::Logger::instance().log(subforge::Logger::Level::ERR, msg)
#define LOG_DEBUG(msg) subforge::Logger::instance().log(subforge::Logger::Level::DEBUG, msg)

}  // namespace subforge
