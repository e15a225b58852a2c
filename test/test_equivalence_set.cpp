#include <iostream>
#include <vector>
#include <list>
#include <cassert>
#include <set>
#include <sstream>
#include <string>
#include <algorithm>
#include "equiv/equivalence_set.hpp"

using namespace equiv;

// Plain equality on the value
bool natural_equals(const int& a, const int& b) { return a == b; }
size_t natural_hash(const int& a) { return std::hash<int>{}(a); }

// Every value is the same element
bool always_equal(const int&, const int&) { return true; }
size_t constant_hash(const int&) { return 1; }

// All even numbers are one element, every odd number is its own
bool same_parity_class(const int& a, const int& b) { return a == b || (a % 2 == 0 && b % 2 == 0); }
size_t parity_hash(const int& a) { return a % 2 == 0 ? 2 : static_cast<size_t>(a); }

std::set<int> contents(const EquivalenceSet<int>& set) {
    return std::set<int>(set.begin(), set.end());
}

std::vector<int> sorted(std::vector<int> values) {
    std::sort(values.begin(), values.end());
    return values;
}

void test_initially_empty() {
    std::cout << "Testing initial state...\n";

    EquivalenceSet<int> set(natural_equals, natural_hash);

    assert(set.empty());
    assert(set.size() == 0);
    assert(set.begin() == set.end());
    assert(!set.contains(1));
    assert(set.bucket_count() == EquivalenceSet<int>::DEFAULT_BUCKET_COUNT);
    assert(set.max_load_factor() == EquivalenceSet<int>::DEFAULT_MAX_LOAD_FACTOR);

    std::cout << "Initial state test passed!\n";
}

void test_insert_contains_erase() {
    std::cout << "Testing insert, contains and erase...\n";

    EquivalenceSet<int> set(natural_equals, natural_hash);

    assert(set.insert(1));
    assert(set.contains(1));
    assert(set.size() == 1);

    assert(!set.insert(1));
    assert(set.size() == 1);
    assert(contents(set) == std::set<int>({1}));

    assert(!set.erase(2));
    assert(set.size() == 1);

    assert(set.erase(1));
    assert(!set.contains(1));
    assert(set.empty());

    int value = 7;
    assert(set.insert(value));
    assert(set.emplace(8));
    assert(!set.emplace(7));
    assert(contents(set) == std::set<int>({7, 8}));

    std::cout << "Insert, contains and erase test passed!\n";
}

void test_insert_all() {
    std::cout << "Testing insert_all...\n";

    EquivalenceSet<int> set(natural_equals, natural_hash);

    assert(set.insert_all({3, 4, 5}));
    assert(contents(set) == std::set<int>({3, 4, 5}));

    // Nothing new
    assert(!set.insert_all({3, 4}));
    assert(set.size() == 3);

    // Partially new
    assert(set.insert_all(std::vector<int>{5, 6, 7}));
    assert(contents(set) == std::set<int>({3, 4, 5, 6, 7}));

    // Empty input never changes anything
    assert(!set.insert_all({}));
    assert(!set.insert_all(std::vector<int>{}));
    assert(set.size() == 5);

    // Any range of convertible values
    std::list<short> shorts = {8, 9};
    assert(set.insert_all(shorts));
    assert(set.contains(8) && set.contains(9));

    EquivalenceSet<int> empty(natural_equals, natural_hash);
    assert(!empty.insert_all({}));
    assert(empty.empty());

    std::cout << "insert_all test passed!\n";
}

void test_contains_all() {
    std::cout << "Testing contains_all...\n";

    EquivalenceSet<int> set(natural_equals, natural_hash);
    assert(set.insert_all({1, 2, 3}));

    assert(set.contains_all({1, 3}));
    assert(set.contains_all({1, 2, 3}));
    assert(!set.contains_all({3, 5}));
    assert(!set.contains_all(std::vector<int>{5}));

    // Empty input is vacuously contained
    assert(set.contains_all({}));
    assert(set.contains_all(std::vector<int>{}));

    EquivalenceSet<int> empty(natural_equals, natural_hash);
    assert(empty.contains_all({}));
    assert(!empty.contains_all({1}));

    std::cout << "contains_all test passed!\n";
}

void test_erase_all() {
    std::cout << "Testing erase_all...\n";

    EquivalenceSet<int> set(natural_equals, natural_hash);

    assert(set.insert_all({1, 2}));
    assert(!set.erase_all({3, 4}));
    assert(contents(set) == std::set<int>({1, 2}));

    assert(set.erase_all({1, 2}));
    assert(set.empty());

    assert(set.insert_all({1, 2}));
    assert(set.erase_all({1, 2, 3, 4}));
    assert(set.empty());

    assert(set.insert_all({1, 2}));
    assert(!set.erase_all({}));
    assert(set.size() == 2);

    std::cout << "erase_all test passed!\n";
}

void test_bulk_operations_with_sets() {
    std::cout << "Testing bulk operations taking sets...\n";

    // All of these share one chain in the default 16 buckets
    EquivalenceSet<int> set(natural_equals, natural_hash);
    assert(set.insert_all({0, 16, 32, 48, 64}));

    assert(!set.insert_all(set));
    assert(contents(set) == std::set<int>({0, 16, 32, 48, 64}));
    assert(!set.retain_all(set));
    assert(set.size() == 5);

    assert(set.erase_all(set));
    assert(set.empty());
    assert(!set.erase_all(set));

    // A set with other functions still contributes its stored values
    EquivalenceSet<int> evens_and_five(same_parity_class, parity_hash);
    assert(evens_and_five.insert_all({2, 4, 5}));
    assert(evens_and_five.size() == 2);

    assert(set.insert_all({1, 2, 3, 4, 5}));
    assert(set.erase_all(evens_and_five));
    assert(contents(set) == std::set<int>({1, 3, 4}));

    assert(set.insert_all(evens_and_five));
    assert(contents(set) == std::set<int>({1, 2, 3, 4, 5}));

    assert(set.retain_all(evens_and_five));
    assert(contents(set) == std::set<int>({2, 5}));

    std::cout << "Bulk operations taking sets test passed!\n";
}

void test_retain_all() {
    std::cout << "Testing retain_all...\n";

    EquivalenceSet<int> set(natural_equals, natural_hash);

    assert(set.insert_all({1, 2, 3}));
    assert(!set.retain_all({1, 2, 3}));
    assert(contents(set) == std::set<int>({1, 2, 3}));

    assert(!set.retain_all({1, 2, 3, 4}));
    assert(set.size() == 3);

    assert(set.retain_all({1, 2}));
    assert(contents(set) == std::set<int>({1, 2}));

    assert(set.retain_all({}));
    assert(set.empty());

    assert(!set.retain_all({}));

    std::cout << "retain_all test passed!\n";
}

void test_clear() {
    std::cout << "Testing clear...\n";

    EquivalenceSet<int> set(natural_equals, natural_hash);
    assert(set.insert_all({1, 2, 3}));

    set.clear();
    assert(set.empty());
    assert(!set.contains(1));
    assert(set.insert(1));

    std::cout << "Clear test passed!\n";
}

void test_to_array() {
    std::cout << "Testing to_array...\n";

    EquivalenceSet<int> set(natural_equals, natural_hash);
    assert(set.insert_all({1, 2}));

    auto plain = set.to_array();
    assert(sorted(plain) == std::vector<int>({1, 2}));

    // Buffer fits exactly
    auto fits = set.to_array(std::vector<int>(2, -1));
    assert(sorted(fits) == std::vector<int>({1, 2}));

    // Buffer too big: trailing slots are reset, length is kept
    auto padded = set.to_array(std::vector<int>(5, -1));
    assert(padded.size() == 5);
    assert(sorted(std::vector<int>(padded.begin(), padded.begin() + 2)) == std::vector<int>({1, 2}));
    assert(padded[2] == 0 && padded[3] == 0 && padded[4] == 0);

    // Buffer too small: a new array of the right size
    auto grown = set.to_array(std::vector<int>(1, -1));
    assert(grown.size() == 2);
    assert(sorted(grown) == std::vector<int>({1, 2}));

    // Same order as iteration
    std::vector<int> iterated(set.begin(), set.end());
    assert(plain == iterated);

    EquivalenceSet<int> empty(natural_equals, natural_hash);
    assert(empty.to_array().empty());

    std::cout << "to_array test passed!\n";
}

void test_cursor() {
    std::cout << "Testing cursor...\n";

    EquivalenceSet<int> set(natural_equals, natural_hash);
    assert(set.insert_all({1, 2, 3}));

    auto cursor = set.cursor();
    std::set<int> seen;
    for (int i = 0; i < 3; ++i) {
        assert(cursor.has_next());
        seen.insert(cursor.next());
    }
    assert(seen == std::set<int>({1, 2, 3}));
    assert(!cursor.has_next());

    bool exhausted = false;
    try {
        cursor.next();
    } catch (const NoSuchElement&) {
        exhausted = true;
    }
    assert(exhausted);

    EquivalenceSet<int> empty(natural_equals, natural_hash);
    auto empty_cursor = empty.cursor();
    assert(!empty_cursor.has_next());

    bool out_of_range = false;
    try {
        empty_cursor.next();
    } catch (const std::out_of_range&) {
        out_of_range = true;
    }
    assert(out_of_range);

    std::cout << "Cursor test passed!\n";
}

void test_fixed_functions() {
    std::cout << "Testing fixed equality and hash...\n";

    EquivalenceSet<int> set(always_equal, constant_hash);

    assert(set.insert(1));
    assert(set.size() == 1);

    assert(!set.insert(2));
    assert(!set.insert(5));
    assert(!set.insert(1));
    assert(contents(set) == std::set<int>({1}));

    // Removal is decided by the equivalence class, not the literal value
    assert(set.erase(5));
    assert(set.empty());
    assert(!set.erase(5));
    assert(!set.erase(1));

    assert(set.insert(9));
    assert(set.contains(-100));
    assert(!set.insert_all({1, 2, 3}));
    assert(set.size() == 1);

    std::cout << "Fixed equality and hash test passed!\n";
}

void test_parity_functions() {
    std::cout << "Testing parity equivalence...\n";

    EquivalenceSet<int> odds(same_parity_class, parity_hash);
    assert(odds.insert(1));
    assert(contents(odds) == std::set<int>({1}));
    assert(odds.insert(3));
    assert(contents(odds) == std::set<int>({1, 3}));
    assert(odds.insert_all({5, 7, 9, 11}));
    assert(contents(odds) == std::set<int>({1, 3, 5, 7, 9, 11}));

    EquivalenceSet<int> evens(same_parity_class, parity_hash);
    assert(evens.insert(2));
    assert(!evens.insert(4));
    assert(contents(evens) == std::set<int>({2}));
    assert(!evens.insert_all({6, 8, 10, 12}));
    assert(contents(evens) == std::set<int>({2}));
    assert(evens.contains(100));

    EquivalenceSet<int> mixed(same_parity_class, parity_hash);
    assert(mixed.insert(1));
    assert(mixed.size() == 1);
    assert(mixed.insert(2));
    assert(mixed.size() == 2);
    assert(mixed.insert(3));
    assert(mixed.size() == 3);
    assert(!mixed.insert(4));
    assert(mixed.size() == 3);
    assert(mixed.insert(5));
    assert(mixed.size() == 4);

    // Any even value removes the even representative
    assert(mixed.erase(4));
    assert(contents(mixed) == std::set<int>({1, 3, 5}));
    assert(!mixed.erase(6));

    std::cout << "Parity equivalence test passed!\n";
}

void test_initial_elements() {
    std::cout << "Testing construction from initial elements...\n";

    EquivalenceSet<int> set({1, 2, 3, 4, 5, 6}, same_parity_class, parity_hash);
    assert(set.size() == 4);
    assert(contents(set) == std::set<int>({1, 2, 3, 5}));

    // The first element of a class is its representative
    std::vector<int> values = {8, 1, 2, 4};
    EquivalenceSet<int> from_range(values.begin(), values.end(), same_parity_class, parity_hash);
    assert(contents(from_range) == std::set<int>({1, 8}));

    std::list<int> linked = {3, 3, 3};
    EquivalenceSet<int> from_list(linked.begin(), linked.end(), natural_equals, natural_hash);
    assert(from_list.size() == 1);

    EquivalenceSet<int> from_nothing(values.end(), values.end(), natural_equals, natural_hash);
    assert(from_nothing.empty());

    std::cout << "Initial elements test passed!\n";
}

void test_retain_by_equivalence() {
    std::cout << "Testing retain_all under a custom equivalence...\n";

    EquivalenceSet<int> set(same_parity_class, parity_hash);
    assert(set.insert_all({1, 2, 3}));

    // 8 is equivalent to the stored 2
    assert(set.retain_all({8}));
    assert(contents(set) == std::set<int>({2}));

    assert(!set.retain_all({4, 5}));
    assert(contents(set) == std::set<int>({2}));

    std::cout << "retain_all under a custom equivalence test passed!\n";
}

void test_size_counts_classes() {
    std::cout << "Testing that size counts equivalence classes...\n";

    EquivalenceSet<int> set(same_parity_class, parity_hash);
    size_t insert_calls = 0;

    for (int a = 1; a <= 20; ++a) {
        set.insert(a);
        ++insert_calls;
        assert(set.contains(a));
    }

    // Ten odd classes plus one even class
    assert(insert_calls == 20);
    assert(set.size() == 11);

    for (int a = 1; a <= 20; ++a) {
        for (int b = 1; b <= 20; ++b) {
            if (same_parity_class(a, b)) {
                size_t before = set.size();
                assert(!set.insert(b));
                assert(set.size() == before);
            }
        }
    }

    for (int a = 1; a <= 20; ++a) {
        set.erase(a);
        assert(!set.contains(a));
    }
    assert(set.empty());

    std::cout << "Size counts equivalence classes test passed!\n";
}

void test_set_relationships() {
    std::cout << "Testing set relationships...\n";

    EquivalenceSet<int> set1(natural_equals, natural_hash);
    EquivalenceSet<int> subset(natural_equals, natural_hash);

    for (int i = 1; i <= 10; ++i) {
        set1.insert(i);
    }
    subset.insert_all({2, 4, 6});

    assert(subset.is_subset_of(set1));
    assert(set1.is_superset_of(subset));
    assert(!set1.is_subset_of(subset));
    assert(!subset.is_superset_of(set1));

    // Membership in the other set follows that set's own equivalence
    EquivalenceSet<int> parity(same_parity_class, parity_hash);
    parity.insert_all({1, 2, 3, 5, 7, 9});
    assert(subset.is_subset_of(parity));

    assert(set1.contains_all(subset));
    assert(set1.count_if([](int x) { return x % 2 == 0; }) == 5);

    std::cout << "Set relationships test passed!\n";
}

void test_functions_and_sizing() {
    std::cout << "Testing function accessors and sizing hints...\n";

    EquivalenceSet<int> set(same_parity_class, parity_hash, 64, 0.5f);
    assert(set.bucket_count() == 64);
    assert(set.max_load_factor() == 0.5f);

    assert(set.equals_function()(2, 4));
    assert(!set.equals_function()(1, 3));
    assert(set.hash_function()(6) == 2);
    assert(set.hash_function()(7) == 7);

    for (int i = 0; i < 200; ++i) {
        set.insert(2 * i + 1);
    }
    assert(set.size() == 200);
    assert(set.load_factor() <= set.max_load_factor());

    set.reserve(1000);
    assert(set.bucket_count() >= 2000);
    assert(set.size() == 200);
    assert(set.contains(399));

    EquivalenceSet<int> tiny_factor(natural_equals, natural_hash, 16, 1e-30f);
    assert(tiny_factor.max_load_factor() >= 0.05f);
    for (int i = 0; i < 50; ++i) {
        assert(tiny_factor.insert(i));
    }
    assert(tiny_factor.size() == 50);
    assert(tiny_factor.load_factor() <= tiny_factor.max_load_factor());

    std::cout << "Function accessors and sizing hints test passed!\n";
}

void test_move() {
    std::cout << "Testing move construction...\n";

    EquivalenceSet<int> source(same_parity_class, parity_hash);
    assert(source.insert_all({1, 2}));

    EquivalenceSet<int> moved(std::move(source));
    assert(contents(moved) == std::set<int>({1, 2}));
    assert(!moved.insert(4));

    // The moved-from set keeps its functions
    assert(source.empty());
    assert(source.insert(4));
    assert(!source.insert(6));

    std::cout << "Move construction test passed!\n";
}

void test_stream_output() {
    std::cout << "Testing stream output...\n";

    EquivalenceSet<int> set(natural_equals, [](const int& a) { return static_cast<size_t>(a * 10); });
    std::ostringstream empty_out;
    empty_out << set;
    assert(empty_out.str() == "{}");

    set.insert(3);
    std::ostringstream out;
    out << set;
    assert(out.str() == "{3 (30)}");

    std::cout << "Stream output test passed!\n";
}

int main() {
    std::cout << "EquivalenceSet Tests\n";
    std::cout << "====================\n\n";

    test_initially_empty();
    test_insert_contains_erase();
    test_insert_all();
    test_contains_all();
    test_erase_all();
    test_bulk_operations_with_sets();
    test_retain_all();
    test_clear();
    test_to_array();
    test_cursor();
    test_fixed_functions();
    test_parity_functions();
    test_initial_elements();
    test_retain_by_equivalence();
    test_size_counts_classes();
    test_set_relationships();
    test_functions_and_sizing();
    test_move();
    test_stream_output();

    std::cout << "\nAll equivalence set tests passed!\n";

    return 0;
}
