// output_sink.hpp - Output routing for finalized candidate lists
// subforge - subdomain candidate generator

#pragma once

#include "../core/errors.hpp"
#include "../core/logger.hpp"
#include "../core/staged_file.hpp"

#include <cerrno>
#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace subforge {
namespace sink {

// Default file-mode destination
inline constexpr const char* DEFAULT_OUTPUT = "subdomains.txt";

// Output sink interface
class OutputSink {
public:
    virtual ~OutputSink() = default;

    // Validate the destination before any candidate is generated.
    // Throws IoError / ResourceLimitError.
    virtual void prepare() = 0;

    // Write the finalized list, one candidate per line. Called once.
    // Returns the number of lines written.
    virtual size_t write(const std::vector<std::string>& candidates) = 0;

    // Where output goes, for logs
    virtual std::string destination() const = 0;
};

// Stream mode: candidates only, nothing else, suitable for piping
class StreamSink : public OutputSink {
public:
    explicit StreamSink(std::ostream& out) : out_(out) {}

    void prepare() override {}

    size_t write(const std::vector<std::string>& candidates) override {
        errno = 0;
        for (const auto& candidate : candidates) {
            out_ << candidate << '\n';
            if (!out_) {
                throw_write_error(errno, destination());
            }
        }
        out_.flush();
        if (!out_) {
            throw_write_error(errno, destination());
        }
        return candidates.size();
    }

    std::string destination() const override { return "<stdout>"; }

private:
    std::ostream& out_;
};

// File mode: staged write, atomic rename, summary line on the diagnostic stream
class FileSink : public OutputSink {
public:
    FileSink(std::string path, std::ostream& diagnostics)
        : path_(std::move(path)), diagnostics_(diagnostics) {}

    void prepare() override {
        std::filesystem::path target(path_);
        std::filesystem::path dir = target.parent_path();

        std::error_code ec;
        if (!dir.empty()) {
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                throw IoError("cannot create output directory", dir.string());
            }
        }

        if (std::filesystem::is_directory(target, ec)) {
            throw IoError("cannot write to", path_);
        }
        if (std::filesystem::exists(target, ec) && ::access(path_.c_str(), W_OK) != 0) {
            throw IoError("cannot write to", path_);
        }

        staged_ = std::make_unique<StagedFile>(target);
        LOG_DEBUG("Output staged at " + staged_->temp_path());
    }

    size_t write(const std::vector<std::string>& candidates) override {
        if (!staged_) {
            prepare();
        }

        std::ostream& out = staged_->stream();
        errno = 0;
        for (const auto& candidate : candidates) {
            out << candidate << '\n';
            if (!out) {
                throw_write_error(errno, path_);
            }
        }

        staged_->commit();
        staged_.reset();

        diagnostics_ << "Wrote " << candidates.size() << " subdomains to " << path_ << "\n";
        return candidates.size();
    }

    std::string destination() const override { return path_; }

private:
    std::string path_;
    std::ostream& diagnostics_;
    std::unique_ptr<StagedFile> staged_;
};

// Build the sink for the selected mode
inline std::unique_ptr<OutputSink> make_sink(bool stream_mode, const std::string& path,
                                             std::ostream& out, std::ostream& diagnostics) {
    if (stream_mode) {
        return std::make_unique<StreamSink>(out);
    }
    return std::make_unique<FileSink>(path, diagnostics);
}

}  // namespace sink
}  // namespace subforge
