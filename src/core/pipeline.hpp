/**
 * subforge Generation Pipeline
 *
 * One invocation, strictly in sequence:
 *   load wordlists -> prepare sink -> generate -> deduplicate -> write
 *
 * The sink is prepared before generation so an unwritable destination
 * fails fast, before a potentially huge depth-2 product is built.
 */

#pragma once

#include "candidate_set.hpp"
#include "errors.hpp"
#include "generator.hpp"
#include "logger.hpp"
#include "wordlist.hpp"
#include "../sink/output_sink.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace subforge {

struct RunOptions {
    std::string wordlist;
    std::string wordlist2;  // Same as wordlist when not supplied
    std::string domain;
    Depth depth = Depth::ONE;
    std::string output = sink::DEFAULT_OUTPUT;
    bool stream_mode = false;
    uint64_t warn_threshold = 10'000'000;
    bool verbose = false;
};

struct RunSummary {
    size_t prefixes1 = 0;
    size_t prefixes2 = 0;
    uint64_t estimated = 0;
    uint64_t generated = 0;
    size_t unique = 0;
    size_t written = 0;
    std::string destination;
};

class Pipeline {
public:
    /**
     * @param in   Stream read for a "-" wordlist
     * @param out  Stream-mode destination
     * @param diag Warnings, progress and the file-mode summary line
     */
    Pipeline(RunOptions options, std::istream& in, std::ostream& out, std::ostream& diag)
        : options_(std::move(options)), in_(in), out_(out), diag_(diag) {}

    RunSummary run() {
        auto start = std::chrono::steady_clock::now();
        RunSummary summary;

        // Read both lists fully; an aliased second list is read only once
        Wordlist first = load_wordlist(options_.wordlist, in_);
        Wordlist second_storage;
        const Wordlist* second = &first;
        if (options_.wordlist2 != options_.wordlist) {
            second_storage = load_wordlist(options_.wordlist2, in_);
            second = &second_storage;
        }

        summary.prefixes1 = first.size();
        summary.prefixes2 = second->size();
        progress("Loaded " + std::to_string(first.size()) + " prefixes from " + first.source);
        if (second != &first) {
            progress("Loaded " + std::to_string(second->size()) + " prefixes from " + second->source);
        }

        auto output = sink::make_sink(options_.stream_mode, options_.output, out_, diag_);
        output->prepare();
        summary.destination = output->destination();

        summary.estimated = CandidateGenerator::estimate(options_.depth, first.size(), second->size());
        Logger::instance().log_estimate(summary.estimated);
        if (summary.estimated > options_.warn_threshold) {
            diag_ << "[!] Warning: depth " << depth_name(options_.depth) << " will generate "
                  << summary.estimated << " candidates before deduplication ("
                  << first.size() << " x " << second->size() << ")\n";
            LOG_WARN("Large generation: " + std::to_string(summary.estimated) + " candidates");
        }

        CandidateGenerator generator(options_.domain);
        CandidateSet candidates;
        summary.generated = generator.generate(options_.depth, first, *second,
            [&candidates](std::string&& candidate) {
                candidates.insert(std::move(candidate));
            });

        std::vector<std::string> result = candidates.finalize();
        summary.unique = result.size();
        progress("Generated " + std::to_string(summary.generated) + " candidates, "
                 + std::to_string(summary.unique) + " unique");

        summary.written = output->write(result);

        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        Logger::instance().log_result(summary.generated, summary.unique, summary.destination, elapsed);
        return summary;
    }

private:
    void progress(const std::string& message) {
        if (options_.verbose) {
            diag_ << "[*] " << message << "\n";
        }
        LOG_INFO(message);
    }

    RunOptions options_;
    std::istream& in_;
    std::ostream& out_;
    std::ostream& diag_;
};

}  // namespace subforge
