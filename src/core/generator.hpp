/**
 * subforge Candidate Generator
 *
 * Combines normalized prefixes with a base domain:
 *   depth 1    => <p1>.<domain>
 *   depth 2    => <p1>.<p2>.<domain>
 *   depth both => union of both passes (merged later by CandidateSet)
 *
 * COST: depth 2 emits |list1| x |list2| candidates before deduplication.
 * Call estimate() before generating; large products are the realistic way
 * to exhaust disk quota or file size limits.
 */

#pragma once

#include "wordlist.hpp"

#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace subforge {

enum class Depth : uint8_t {
    ONE,
    TWO,
    BOTH,
};

/**
 * Parse a depth selector. Accepts exactly "1", "2" or "both".
 */
inline std::optional<Depth> parse_depth(std::string_view value) {
    if (value == "1") return Depth::ONE;
    if (value == "2") return Depth::TWO;
    if (value == "both") return Depth::BOTH;
    return std::nullopt;
}

inline const char* depth_name(Depth depth) {
    switch (depth) {
        case Depth::ONE:  return "1";
        case Depth::TWO:  return "2";
        case Depth::BOTH: return "both";
    }
    return "?";
}

inline bool includes_depth1(Depth depth) {
    return depth == Depth::ONE || depth == Depth::BOTH;
}

inline bool includes_depth2(Depth depth) {
    return depth == Depth::TWO || depth == Depth::BOTH;
}

/**
 * Receives each generated candidate. May move from the argument.
 */
using CandidateCallback = std::function<void(std::string&&)>;

class CandidateGenerator {
public:
    explicit CandidateGenerator(std::string domain)
        : domain_(std::move(domain)) {}

    const std::string& domain() const { return domain_; }

    /**
     * Emit <p>.<domain> for every prefix of the list, in order.
     * @return Number of candidates emitted
     */
    uint64_t generate_depth1(const Wordlist& first, const CandidateCallback& callback) const {
        uint64_t emitted = 0;
        std::string candidate;

        for (const auto& p : first.prefixes) {
            candidate.clear();
            candidate.append(p).append(".").append(domain_);
            callback(collapse_dots(std::move(candidate)));
            emitted++;
        }
        return emitted;
    }

    /**
     * Emit <p1>.<p2>.<domain> for the full cross product,
     * first list outer, second list inner.
     * @return Number of candidates emitted
     */
    uint64_t generate_depth2(const Wordlist& first, const Wordlist& second,
                             const CandidateCallback& callback) const {
        uint64_t emitted = 0;
        std::string candidate;

        for (const auto& p1 : first.prefixes) {
            for (const auto& p2 : second.prefixes) {
                candidate.clear();
                candidate.append(p1).append(".").append(p2).append(".").append(domain_);
                callback(collapse_dots(std::move(candidate)));
                emitted++;
            }
        }
        return emitted;
    }

    /**
     * Run every pass the depth selects.
     * @return Number of candidates emitted, before deduplication
     */
    uint64_t generate(Depth depth, const Wordlist& first, const Wordlist& second,
                      const CandidateCallback& callback) const {
        uint64_t emitted = 0;
        if (includes_depth1(depth)) {
            emitted += generate_depth1(first, callback);
        }
        if (includes_depth2(depth)) {
            emitted += generate_depth2(first, second, callback);
        }
        return emitted;
    }

    /**
     * Number of candidates generate() will emit, saturating at UINT64_MAX.
     */
    static uint64_t estimate(Depth depth, uint64_t first_size, uint64_t second_size) {
        constexpr uint64_t MAX = std::numeric_limits<uint64_t>::max();

        uint64_t total = 0;
        if (includes_depth1(depth)) {
            total = first_size;
        }
        if (includes_depth2(depth)) {
            uint64_t product = MAX;
            if (first_size == 0 || second_size <= MAX / first_size) {
                product = first_size * second_size;
            }
            total = (product > MAX - total) ? MAX : total + product;
        }
        return total;
    }

    /**
     * Collapse every run of dots to a single dot ("a..b...c" => "a.b.c").
     */
    static std::string collapse_dots(std::string candidate) {
        size_t out = 0;
        for (size_t i = 0; i < candidate.size(); i++) {
            if (candidate[i] == '.' && out > 0 && candidate[out - 1] == '.') {
                continue;
            }
            candidate[out++] = candidate[i];
        }
        candidate.resize(out);
        return candidate;
    }

private:
    std::string domain_;
};

}  // namespace subforge
