/**
 * Candidate Set Tests
 *
 * Tests for XXH3-keyed deduplication and deterministic finalization.
 */

#include "../src/core/candidate_set.hpp"
#include <iostream>
#include <cassert>
#include <algorithm>
#include <random>
#include <string>
#include <vector>

using namespace subforge;

void test_insert_and_duplicates() {
    CandidateSet set;

    assert(set.insert(std::string("www.example.com")));
    assert(set.insert(std::string("api.example.com")));
    assert(!set.insert(std::string("www.example.com")));
    assert(!set.insert(std::string("api.example.com")));

    assert(set.size() == 2);
    assert(set.duplicates() == 2);
    assert(set.contains("www.example.com"));
    assert(!set.contains("cdn.example.com"));

    std::cout << "[PASS] Insert and duplicate detection\n";
}

void test_finalize_sorted_unique() {
    CandidateSet set;
    for (const char* c : {"b.ex.com", "a.x.ex.com", "a.ex.com", "b.ex.com", "a.ex.com"}) {
        set.insert(std::string(c));
    }

    auto result = set.finalize();
    std::vector<std::string> expected = {"a.ex.com", "a.x.ex.com", "b.ex.com"};
    assert(result == expected);

    // Consumed
    assert(set.empty());

    std::cout << "[PASS] Finalize sorted and unique\n";
}

void test_order_independent() {
    std::vector<std::string> inputs;
    for (int i = 0; i < 500; i++) {
        inputs.push_back("host" + std::to_string(i % 137) + ".example.com");
    }

    CandidateSet forward;
    for (const auto& c : inputs) forward.insert(c);

    std::mt19937 rng(42);
    std::shuffle(inputs.begin(), inputs.end(), rng);

    CandidateSet shuffled;
    for (const auto& c : inputs) shuffled.insert(c);

    auto a = forward.finalize();
    auto b = shuffled.finalize();
    assert(a.size() == 137);
    assert(a == b);
    assert(std::is_sorted(a.begin(), a.end()));
    assert(std::adjacent_find(a.begin(), a.end()) == a.end());

    std::cout << "[PASS] Order-independent result\n";
}

void test_empty_set() {
    CandidateSet set(1024);
    assert(set.empty());
    assert(set.finalize().empty());
    assert(set.duplicates() == 0);

    std::cout << "[PASS] Empty set\n";
}

void test_hash_consistency() {
    Xxh3Hash hash;
    std::string s = "mail.example.com";
    assert(hash(s) == hash(std::string_view("mail.example.com")));
    assert(hash(s) != hash(std::string_view("mail.example.org")));

    std::cout << "[PASS] XXH3 hash consistency\n";
}

int main() {
    std::cout << "=== Candidate Set Tests ===\n\n";

    test_insert_and_duplicates();
    test_finalize_sorted_unique();
    test_order_independent();
    test_empty_set();
    test_hash_consistency();

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
