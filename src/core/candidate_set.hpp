/**
 * Candidate Deduplication Set
 *
 * Exact set of generated candidates keyed by XXH3. Collects the output of
 * every generator pass, then finalizes once into a sorted, duplicate-free
 * list so identical inputs always produce identical output.
 *
 * USAGE:
 * - Call insert() for every candidate from every pass
 * - Returns true if the candidate is NEW, false if it was ALREADY seen
 * - Call finalize() once; the set is empty afterwards
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

// XXH3 for fast hashing of short strings
#define XXH_INLINE_ALL
#include <xxhash.h>

namespace subforge {

/**
 * XXH3-64 hasher usable as an unordered container hash.
 */
struct Xxh3Hash {
    size_t operator()(std::string_view s) const noexcept {
        return static_cast<size_t>(XXH3_64bits(s.data(), s.size()));
    }
};

class CandidateSet {
public:
    CandidateSet() = default;

    /**
     * Pre-size the table for an expected number of candidates.
     */
    explicit CandidateSet(size_t expected) {
        set_.reserve(expected);
    }

    /**
     * @return true if candidate is NEW, false if DUPLICATE
     */
    bool insert(std::string&& candidate) {
        if (set_.insert(std::move(candidate)).second) {
            return true;
        }
        duplicates_++;
        return false;
    }

    bool insert(const std::string& candidate) {
        return insert(std::string(candidate));
    }

    bool contains(const std::string& candidate) const {
        return set_.find(candidate) != set_.end();
    }

    size_t size() const { return set_.size(); }
    bool empty() const { return set_.empty(); }

    /**
     * Number of insert() calls rejected as duplicates.
     */
    uint64_t duplicates() const { return duplicates_; }

    /**
     * Move every candidate out in lexicographic byte order.
     */
    std::vector<std::string> finalize() {
        std::vector<std::string> result;
        result.reserve(set_.size());

        while (!set_.empty()) {
            auto node = set_.extract(set_.begin());
            result.push_back(std::move(node.value()));
        }

        std::sort(result.begin(), result.end());
        return result;
    }

private:
    std::unordered_set<std::string, Xxh3Hash> set_;
    uint64_t duplicates_ = 0;
};

}  // namespace subforge
