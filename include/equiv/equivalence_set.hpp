#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <ostream>
#include <type_traits>
#include <utility>
#include <vector>

#include "equiv/errors.hpp"
#include "equiv/hash_bucket_set.hpp"

namespace equiv {

/**
 * @brief A set whose notion of "same element" is supplied by the caller.
 *
 * EquivalenceSet stores elements of type T but never consults T's own operator== or
 * std::hash specialization. Instead, an equality function and a hash function are
 * captured at construction and fixed for the lifetime of the set. Two elements for
 * which the equality function returns true are the same element as far as the set is
 * concerned, and at most one of them (the first one inserted, its representative) is
 * ever stored.
 *
 * @tparam T The type of elements stored in the set. Must be copy- or move-constructible.
 *
 * Key Features:
 * - Per-instance equivalence: redefine sameness without touching T
 * - First-wins representatives: an insert never overwrites an equivalent element
 * - Tolerant probes: contains/erase report false when the caller's functions reject
 *   a value (see probe_or_false), so sets of std::optional, std::any or std::variant
 *   can be probed with values the functions cannot handle
 * - Bulk operations: contains_all, insert_all, erase_all, retain_all over any range
 * - Array export: to_array snapshots, optionally into a caller-supplied buffer
 *
 * Preconditions (not checked):
 * - The equality function is reflexive, symmetric and transitive over every value
 *   that is stored, including an absent sentinel if one is stored.
 * - Equivalent values hash identically.
 * - The set is used from one thread at a time.
 *
 * Usage Example:
 * @code
 * // All even numbers are one element, odd numbers are themselves
 * equiv::EquivalenceSet<int> set(
 *     [](int a, int b) { return a == b || (a % 2 == 0 && b % 2 == 0); },
 *     [](int a) { return static_cast<std::size_t>(a % 2 == 0 ? 2 : a); });
 *
 * set.insert(2);   // true
 * set.insert(4);   // false, 2 already represents the even numbers
 * set.erase(6);    // true, removes 2
 * @endcode
 */
template<typename T>
class EquivalenceSet {
public:
    using EqualsFunction = std::function<bool(const T&, const T&)>;
    using HashFunction = std::function<std::size_t(const T&)>;

private:
    /**
     * @brief Holds one stored element. Immutable once constructed.
     */
    class Entry {
    public:
        explicit Entry(const T& value) : value_(value) {}
        explicit Entry(T&& value) : value_(std::move(value)) {}

        const T& value() const { return value_; }

    private:
        T value_;
    };

    /**
     * @brief Hashes entries, and bare probe values, with the injected hash function.
     */
    struct EntryHash {
        HashFunction hash;

        std::size_t operator()(const Entry& entry) const { return hash(entry.value()); }
        std::size_t operator()(const T& probe) const { return hash(probe); }
    };

    /**
     * @brief Compares a stored entry with an entry or probe value through the injected
     *        equality function. A recognized probe failure compares unequal.
     */
    struct EntryEqual {
        EqualsFunction equals;

        bool operator()(const Entry& stored, const Entry& candidate) const {
            return (*this)(stored, candidate.value());
        }

        bool operator()(const Entry& stored, const T& probe) const {
            return probe_or_false([&] { return equals(probe, stored.value()); });
        }
    };

    using Store = HashBucketSet<Entry, EntryHash, EntryEqual>;

    Store store_;

    static EntryHash checked_hash(HashFunction hash);
    static EntryEqual checked_equals(EqualsFunction equals);

public:
    static constexpr std::size_t DEFAULT_BUCKET_COUNT = Store::DEFAULT_BUCKET_COUNT;
    static constexpr float DEFAULT_MAX_LOAD_FACTOR = Store::DEFAULT_MAX_LOAD_FACTOR;

    /**
     * @brief Create an empty set.
     *
     * @param equals Function deciding whether two elements are equivalent
     * @param hash Function hashing an element consistently with equals
     * @param initial_bucket_count Sizing hint for the backing store
     * @param max_load_factor Sizing hint for the backing store
     * @throws ConfigurationError if equals or hash is empty
     */
    EquivalenceSet(EqualsFunction equals, HashFunction hash,
                   std::size_t initial_bucket_count = DEFAULT_BUCKET_COUNT,
                   float max_load_factor = DEFAULT_MAX_LOAD_FACTOR);

    /**
     * @brief Create a set holding the elements of [first, last).
     *
     * Elements are inserted in order, so the first element of each equivalence class
     * becomes its representative. The backing store is sized to fit the input.
     *
     * @throws ConfigurationError if equals or hash is empty
     */
    template<typename InputIt>
    EquivalenceSet(InputIt first, InputIt last, EqualsFunction equals, HashFunction hash);

    EquivalenceSet(std::initializer_list<T> elements, EqualsFunction equals, HashFunction hash);

    EquivalenceSet(const EquivalenceSet&) = delete;
    EquivalenceSet& operator=(const EquivalenceSet&) = delete;
    EquivalenceSet(EquivalenceSet&&) = default;
    EquivalenceSet& operator=(EquivalenceSet&&) = default;

    std::size_t size() const;
    bool empty() const;

    /**
     * @brief Check whether an element equivalent to value is stored.
     *
     * @return true if found; false if not found or if the injected functions
     *         rejected value with a recognized exception
     * @complexity O(1) average
     */
    bool contains(const T& value) const;

    /**
     * @brief Insert value unless an equivalent element is already stored.
     *
     * @return true if value was stored, false if an equivalent element exists (the
     *         existing representative is kept)
     * @throws Whatever the hash function throws; the set is unchanged
     */
    bool insert(const T& value);
    bool insert(T&& value);

    template<typename... Args>
    bool emplace(Args&&... args);

    /**
     * @brief Remove the stored element equivalent to value.
     *
     * value itself need not be stored; any equivalent value removes the representative.
     *
     * @return true if an element was removed; false otherwise, including when the
     *         injected functions rejected value with a recognized exception
     */
    bool erase(const T& value);

    /**
     * @brief Check every element of a range independently.
     *
     * @return true if all are contained; true for an empty range
     */
    template<typename Range>
    bool contains_all(const Range& elements) const;
    bool contains_all(std::initializer_list<T> elements) const;

    /**
     * @brief Insert every element of a range, in order.
     *
     * @return true if at least one element was inserted; false for an empty range
     */
    template<typename Range>
    bool insert_all(const Range& elements);
    bool insert_all(std::initializer_list<T> elements);

    /**
     * @brief Erase every element of a range.
     *
     * @return true if at least one element was removed; false for an empty range
     */
    template<typename Range>
    bool erase_all(const Range& elements);
    bool erase_all(std::initializer_list<T> elements);

    /**
     * @brief Keep only the stored elements with an equivalent counterpart in a range.
     *
     * The range is first collected into a set with the same functions; values the
     * functions reject are skipped. An empty range therefore clears the set.
     *
     * @return true if at least one element was removed
     */
    template<typename Range>
    bool retain_all(const Range& elements);
    bool retain_all(std::initializer_list<T> elements);

    void clear();

    /**
     * @brief Copy the stored elements into a new vector, in iteration order.
     */
    std::vector<T> to_array() const;

    /**
     * @brief Copy the stored elements into target if it is large enough.
     *
     * If target.size() >= size(), the elements are written to its front, every
     * remaining slot is reset to T{} and target is returned with its length intact.
     * Otherwise a new vector of exactly size() elements is returned.
     */
    std::vector<T> to_array(std::vector<T> target) const;

    /**
     * @brief Single-pass cursor over a set's elements.
     *
     * Obtained from EquivalenceSet::cursor(). Modifying the set while a cursor is in
     * use invalidates it.
     */
    class Cursor {
    public:
        bool has_next() const;

        /**
         * @brief Return the next element and advance.
         * @throws NoSuchElement if the cursor is exhausted
         */
        const T& next();

    private:
        friend class EquivalenceSet;

        using StoreIterator = typename Store::iterator;

        Cursor(StoreIterator current, StoreIterator end) : current_(current), end_(end) {}

        StoreIterator current_;
        StoreIterator end_;
    };

    Cursor cursor() const;

    /**
     * @brief Forward iterator yielding the stored elements.
     */
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        iterator() = default;

        const T& operator*() const { return current_->value(); }
        const T* operator->() const { return &current_->value(); }

        iterator& operator++() {
            ++current_;
            return *this;
        }

        iterator operator++(int) {
            iterator previous = *this;
            ++current_;
            return previous;
        }

        bool operator==(const iterator& other) const { return current_ == other.current_; }
        bool operator!=(const iterator& other) const { return current_ != other.current_; }

    private:
        friend class EquivalenceSet;

        explicit iterator(typename Store::iterator current) : current_(current) {}

        typename Store::iterator current_;
    };

    using const_iterator = iterator;

    iterator begin() const;
    iterator end() const;

    /**
     * @brief Count stored elements matching a predicate.
     */
    template<typename Predicate>
    std::size_t count_if(Predicate pred) const;

    /**
     * @brief Test whether every element of this set is contained in other.
     *
     * Membership in other is decided by other's functions.
     */
    bool is_subset_of(const EquivalenceSet& other) const;
    bool is_superset_of(const EquivalenceSet& other) const;

    const EqualsFunction& equals_function() const;
    const HashFunction& hash_function() const;

    std::size_t bucket_count() const;
    double load_factor() const;
    float max_load_factor() const;

    /**
     * @brief Make room for count elements without further growth.
     */
    void reserve(std::size_t count);
};

template<typename T>
typename EquivalenceSet<T>::EntryHash EquivalenceSet<T>::checked_hash(HashFunction hash) {
    if (!hash) {
        throw ConfigurationError("EquivalenceSet requires a hash function");
    }
    return EntryHash{std::move(hash)};
}

template<typename T>
typename EquivalenceSet<T>::EntryEqual EquivalenceSet<T>::checked_equals(EqualsFunction equals) {
    if (!equals) {
        throw ConfigurationError("EquivalenceSet requires an equality function");
    }
    return EntryEqual{std::move(equals)};
}

template<typename T>
EquivalenceSet<T>::EquivalenceSet(EqualsFunction equals, HashFunction hash,
                                  std::size_t initial_bucket_count, float max_load_factor)
    : store_(initial_bucket_count, max_load_factor,
             checked_hash(std::move(hash)), checked_equals(std::move(equals))) {}

template<typename T>
template<typename InputIt>
EquivalenceSet<T>::EquivalenceSet(InputIt first, InputIt last, EqualsFunction equals, HashFunction hash)
    : EquivalenceSet(std::move(equals), std::move(hash)) {
    if constexpr (std::is_base_of_v<std::forward_iterator_tag,
                                    typename std::iterator_traits<InputIt>::iterator_category>) {
        store_.reserve(static_cast<std::size_t>(std::distance(first, last)));
    }
    for (auto it = first; it != last; ++it) {
        insert(*it);
    }
}

template<typename T>
EquivalenceSet<T>::EquivalenceSet(std::initializer_list<T> elements, EqualsFunction equals, HashFunction hash)
    : EquivalenceSet(elements.begin(), elements.end(), std::move(equals), std::move(hash)) {}

template<typename T>
std::size_t EquivalenceSet<T>::size() const {
    return store_.size();
}

template<typename T>
bool EquivalenceSet<T>::empty() const {
    return store_.empty();
}

template<typename T>
bool EquivalenceSet<T>::contains(const T& value) const {
    return probe_or_false([&] { return store_.contains(value); });
}

template<typename T>
bool EquivalenceSet<T>::insert(const T& value) {
    return store_.insert(Entry(value));
}

template<typename T>
bool EquivalenceSet<T>::insert(T&& value) {
    return store_.insert(Entry(std::move(value)));
}

template<typename T>
template<typename... Args>
bool EquivalenceSet<T>::emplace(Args&&... args) {
    return store_.insert(Entry(T(std::forward<Args>(args)...)));
}

template<typename T>
bool EquivalenceSet<T>::erase(const T& value) {
    return probe_or_false([&] { return store_.erase(value); });
}

template<typename T>
template<typename Range>
bool EquivalenceSet<T>::contains_all(const Range& elements) const {
    for (const auto& element : elements) {
        if (!contains(element)) {
            return false;
        }
    }
    return true;
}

template<typename T>
bool EquivalenceSet<T>::contains_all(std::initializer_list<T> elements) const {
    return contains_all<std::initializer_list<T>>(elements);
}

template<typename T>
template<typename Range>
bool EquivalenceSet<T>::insert_all(const Range& elements) {
    if constexpr (std::is_same_v<Range, EquivalenceSet>) {
        if (&elements == this) {
            // Iterating our own store while inserting into it is invalid
            return insert_all(to_array());
        }
    }

    bool changed = false;
    for (const auto& element : elements) {
        if (insert(element)) {
            changed = true;
        }
    }
    return changed;
}

template<typename T>
bool EquivalenceSet<T>::insert_all(std::initializer_list<T> elements) {
    return insert_all<std::initializer_list<T>>(elements);
}

template<typename T>
template<typename Range>
bool EquivalenceSet<T>::erase_all(const Range& elements) {
    if constexpr (std::is_same_v<Range, EquivalenceSet>) {
        if (&elements == this) {
            // Iterating our own store while erasing from it is invalid
            return erase_all(to_array());
        }
    }

    bool changed = false;
    for (const auto& element : elements) {
        if (erase(element)) {
            changed = true;
        }
    }
    return changed;
}

template<typename T>
bool EquivalenceSet<T>::erase_all(std::initializer_list<T> elements) {
    return erase_all<std::initializer_list<T>>(elements);
}

template<typename T>
template<typename Range>
bool EquivalenceSet<T>::retain_all(const Range& elements) {
    EquivalenceSet keep(equals_function(), hash_function());
    for (const auto& element : elements) {
        probe_or_false([&] { return keep.insert(element); });
    }

    return store_.erase_if([&](const Entry& entry) { return !keep.contains(entry.value()); }) > 0;
}

template<typename T>
bool EquivalenceSet<T>::retain_all(std::initializer_list<T> elements) {
    return retain_all<std::initializer_list<T>>(elements);
}

template<typename T>
void EquivalenceSet<T>::clear() {
    store_.clear();
}

template<typename T>
std::vector<T> EquivalenceSet<T>::to_array() const {
    std::vector<T> result;
    result.reserve(store_.size());
    for (const auto& entry : store_) {
        result.push_back(entry.value());
    }
    return result;
}

template<typename T>
std::vector<T> EquivalenceSet<T>::to_array(std::vector<T> target) const {
    if (target.size() < store_.size()) {
        return to_array();
    }

    auto out = target.begin();
    for (const auto& entry : store_) {
        *out++ = entry.value();
    }
    for (; out != target.end(); ++out) {
        *out = T{};
    }
    return target;
}

template<typename T>
bool EquivalenceSet<T>::Cursor::has_next() const {
    return current_ != end_;
}

template<typename T>
const T& EquivalenceSet<T>::Cursor::next() {
    if (current_ == end_) {
        throw NoSuchElement("EquivalenceSet cursor has no more elements");
    }
    const Entry& entry = *current_;
    ++current_;
    return entry.value();
}

template<typename T>
typename EquivalenceSet<T>::Cursor EquivalenceSet<T>::cursor() const {
    return Cursor(store_.begin(), store_.end());
}

template<typename T>
typename EquivalenceSet<T>::iterator EquivalenceSet<T>::begin() const {
    return iterator(store_.begin());
}

template<typename T>
typename EquivalenceSet<T>::iterator EquivalenceSet<T>::end() const {
    return iterator(store_.end());
}

template<typename T>
template<typename Predicate>
std::size_t EquivalenceSet<T>::count_if(Predicate pred) const {
    return store_.count_if([&](const Entry& entry) { return pred(entry.value()); });
}

template<typename T>
bool EquivalenceSet<T>::is_subset_of(const EquivalenceSet& other) const {
    for (const auto& entry : store_) {
        if (!other.contains(entry.value())) {
            return false;
        }
    }
    return true;
}

template<typename T>
bool EquivalenceSet<T>::is_superset_of(const EquivalenceSet& other) const {
    return other.is_subset_of(*this);
}

template<typename T>
const typename EquivalenceSet<T>::EqualsFunction& EquivalenceSet<T>::equals_function() const {
    return store_.key_eq().equals;
}

template<typename T>
const typename EquivalenceSet<T>::HashFunction& EquivalenceSet<T>::hash_function() const {
    return store_.hash_function().hash;
}

template<typename T>
std::size_t EquivalenceSet<T>::bucket_count() const {
    return store_.bucket_count();
}

template<typename T>
double EquivalenceSet<T>::load_factor() const {
    return store_.load_factor();
}

template<typename T>
float EquivalenceSet<T>::max_load_factor() const {
    return store_.max_load_factor();
}

template<typename T>
void EquivalenceSet<T>::reserve(std::size_t count) {
    store_.reserve(count);
}

/**
 * @brief Debug rendering: every element followed by its injected hash, e.g. "{1 (1), 2 (2)}".
 */
template<typename T>
std::ostream& operator<<(std::ostream& os, const EquivalenceSet<T>& set) {
    os << '{';
    bool first = true;
    for (const auto& element : set) {
        if (!first) {
            os << ", ";
        }
        os << element << " (" << set.hash_function()(element) << ')';
        first = false;
    }
    return os << '}';
}

} // namespace equiv
