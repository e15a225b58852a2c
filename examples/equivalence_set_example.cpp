#include <iostream>
#include <cctype>
#include <optional>
#include <string>
#include <vector>
#include "equiv/equivalence_set.hpp"

using namespace equiv;

void example_parity_classes() {
    std::cout << "=== Parity Classes ===\n";

    // All even numbers are one element, every odd number is its own
    EquivalenceSet<int> set(
        [](const int& a, const int& b) { return a == b || (a % 2 == 0 && b % 2 == 0); },
        [](const int& a) { return static_cast<size_t>(a % 2 == 0 ? 2 : a); });

    for (int value : {1, 2, 3, 4, 5, 6}) {
        bool inserted = set.insert(value);
        std::cout << "  insert(" << value << ") -> " << (inserted ? "inserted" : "already represented") << "\n";
    }

    std::cout << "Set: " << set << "\n";
    std::cout << "Size: " << set.size() << " (one entry per equivalence class)\n";

    std::cout << "contains(100): " << set.contains(100) << "\n";
    std::cout << "erase(8) removes the even representative: " << set.erase(8) << "\n";
    std::cout << "Set after erase: " << set << "\n\n";
}

void example_case_insensitive_words() {
    std::cout << "=== Case-Insensitive Words ===\n";

    auto lower = [](const std::string& s) {
        std::string result;
        for (char c : s) {
            result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        return result;
    };

    EquivalenceSet<std::string> words(
        [lower](const std::string& a, const std::string& b) { return lower(a) == lower(b); },
        [lower](const std::string& s) { return std::hash<std::string>{}(lower(s)); });

    std::vector<std::string> input = {"Apple", "banana", "APPLE", "Cherry", "BANANA", "apple"};
    bool changed = words.insert_all(input);

    std::cout << "insert_all changed the set: " << changed << "\n";
    std::cout << "Distinct words (first spelling wins):";
    for (const auto& word : words) {
        std::cout << " " << word;
    }
    std::cout << "\n";

    std::cout << "contains_all({\"cherry\", \"Banana\"}): "
              << words.contains_all({"cherry", "Banana"}) << "\n";

    bool removed = words.retain_all({"CHERRY"});
    std::cout << "retain_all({\"CHERRY\"}) removed words: " << removed
              << ", " << words.size() << " word(s) left\n\n";
}

void example_absent_values() {
    std::cout << "=== Absent Values ===\n";

    using MaybeInt = std::optional<int>;

    // These functions cannot handle std::nullopt
    EquivalenceSet<MaybeInt> set(
        [](const MaybeInt& a, const MaybeInt& b) { return a.value() == b.value(); },
        [](const MaybeInt& a) { return std::hash<int>{}(a.value()); });

    set.insert_all({1, 2, 3});

    std::cout << "contains(nullopt) reports false instead of throwing: " << set.contains(std::nullopt) << "\n";

    auto buffer = set.to_array(std::vector<MaybeInt>(5, MaybeInt(-1)));
    std::cout << "to_array into a 5-slot buffer:";
    for (const auto& slot : buffer) {
        if (slot) {
            std::cout << " " << *slot;
        } else {
            std::cout << " null";
        }
    }
    std::cout << "\n\n";
}

void example_cursor() {
    std::cout << "=== Cursor ===\n";

    EquivalenceSet<int> set(
        [](const int& a, const int& b) { return a == b; },
        [](const int& a) { return std::hash<int>{}(a); });
    set.insert_all({10, 20, 30});

    auto cursor = set.cursor();
    while (cursor.has_next()) {
        std::cout << "  next: " << cursor.next() << "\n";
    }

    try {
        cursor.next();
    } catch (const NoSuchElement& e) {
        std::cout << "  exhausted: " << e.what() << "\n";
    }
    std::cout << "\n";
}

int main() {
    std::cout << "EquivalenceSet Examples\n";
    std::cout << "=======================\n\n";

    example_parity_classes();
    example_case_insensitive_words();
    example_absent_values();
    example_cursor();

    std::cout << "All examples completed successfully!\n";

    return 0;
}
