#pragma once

#include <cmath>
#include <cstddef>
#include <functional>
#include <iterator>
#include <utility>
#include <vector>

namespace equiv {

/**
 * @brief A hash set using separate chaining, with pluggable hash and equality functors.
 *
 * HashBucketSet is the storage engine behind EquivalenceSet, but it is usable on its
 * own wherever a plain chained hash set with a caller-chosen Hash/KeyEqual pair is
 * needed. Every node caches the hash of its element, so growing the table never
 * calls the hash functor again and lookups only call KeyEqual on hash matches.
 *
 * @tparam T The type of elements stored in the set.
 * @tparam Hash Hash functor for T. Defaults to std::hash<T>.
 * @tparam KeyEqual Equality functor for T. Defaults to std::equal_to<T>.
 *
 * Key Features:
 * - Unique elements: an insert never replaces an equivalent element already stored
 * - Transparent probing: contains/find/erase accept any key type the functors accept
 * - Automatic growth: the bucket array doubles once the max load factor is exceeded
 * - Physical removal: erase and erase_if unlink and free nodes immediately
 * - Move semantics: efficient for move-only and expensive-to-copy types
 *
 * Performance Characteristics:
 * - Insert: O(1) average, O(n) worst case (hash collisions)
 * - Erase: O(1) average, O(n) worst case (hash collisions)
 * - Contains: O(1) average, O(n) worst case (hash collisions)
 * - Memory: O(n + m) where n is elements, m is bucket count
 *
 * Usage Example:
 * @code
 * equiv::HashBucketSet<int> set;
 *
 * set.insert(42);
 * set.insert(42);  // Won't be inserted again
 *
 * if (set.contains(42)) {
 *     std::cout << "Set contains 42" << std::endl;
 * }
 *
 * set.erase_if([](int x) { return x > 40; });
 * @endcode
 *
 * @note Not thread-safe. Concurrent use requires external synchronization.
 * @note Iterators are invalidated by any insertion or removal.
 */
template<typename T, typename Hash = std::hash<T>, typename KeyEqual = std::equal_to<T>>
class HashBucketSet {
private:
    /**
     * @brief Internal node structure for set elements.
     */
    struct Node {
        T data;                 ///< The stored element
        size_t hash;            ///< Cached hash of data
        Node* next;             ///< Next node in the bucket chain

        Node(const T& item, size_t h) : data(item), hash(h), next(nullptr) {}
        Node(T&& item, size_t h) : data(std::move(item)), hash(h), next(nullptr) {}
    };

    /**
     * @brief Hash table bucket containing the head of a collision chain.
     */
    struct Bucket {
        Node* head;             ///< First node in bucket

        Bucket() : head(nullptr) {}
    };

    std::vector<Bucket> buckets_;       ///< Bucket array, never empty
    size_t size_;                       ///< Number of stored elements
    float max_load_factor_;             ///< Growth threshold, elements per bucket
    Hash hasher_;                       ///< Hash function instance
    KeyEqual key_equal_;                ///< Equality comparison function instance

    size_t bucket_index(size_t hash) const;

    /**
     * @brief Find the node equivalent to key in the bucket selected by hash.
     * @return Pointer to matching node or nullptr if not found
     */
    template<typename K>
    Node* find_node(const K& key, size_t hash) const;

    /**
     * @brief Double the bucket array if one more element would exceed the max load factor.
     */
    void grow_if_needed();
    size_t buckets_for(size_t elements) const;
    static float sanitize_load_factor(float max_load_factor);

    void link(Node* node);
    void destroy_nodes();

public:
    static constexpr size_t DEFAULT_BUCKET_COUNT = 16;
    static constexpr float DEFAULT_MAX_LOAD_FACTOR = 0.75f;
    static constexpr float MIN_MAX_LOAD_FACTOR = 0.05f;

    /**
     * @brief Create an empty set.
     *
     * @param initial_bucket_count Number of buckets to start with; 0 is treated as 1
     * @param max_load_factor Elements per bucket before the table grows; values that
     *                        are not positive fall back to DEFAULT_MAX_LOAD_FACTOR,
     *                        smaller positive values are raised to MIN_MAX_LOAD_FACTOR
     * @param hash Hash functor instance
     * @param equal Equality functor instance
     * @complexity O(initial_bucket_count)
     */
    explicit HashBucketSet(size_t initial_bucket_count = DEFAULT_BUCKET_COUNT,
                           float max_load_factor = DEFAULT_MAX_LOAD_FACTOR,
                           const Hash& hash = Hash(),
                           const KeyEqual& equal = KeyEqual());

    /**
     * @brief Destructor. Frees all nodes.
     *
     * @complexity O(n + m) where n is elements, m is buckets
     */
    ~HashBucketSet();

    // Non-copyable but movable; a moved-from set is empty and usable
    HashBucketSet(const HashBucketSet&) = delete;
    HashBucketSet& operator=(const HashBucketSet&) = delete;
    HashBucketSet(HashBucketSet&& other);
    HashBucketSet& operator=(HashBucketSet&& other);

    /**
     * @brief Insert an element by copying.
     *
     * @param value The value to copy and insert
     * @return true if inserted, false if an equivalent element is already stored
     * @complexity O(1) average, O(n) worst case due to hash collisions
     * @exception_safety Strong guarantee - if Hash, KeyEqual or T's copy constructor
     *                  throws, the set is unchanged
     */
    bool insert(const T& value);

    /**
     * @brief Insert an element by moving.
     *
     * @param value The value to move and insert
     * @return true if inserted, false if an equivalent element is already stored
     * @complexity O(1) average, O(n) worst case due to hash collisions
     * @exception_safety Strong guarantee
     *
     * @note value is left untouched when false is returned.
     */
    bool insert(T&& value);

    /**
     * @brief Construct an element and insert it.
     *
     * @return true if inserted, false if an equivalent element is already stored
     */
    template<typename... Args>
    bool emplace(Args&&... args);

    /**
     * @brief Insert elements from an iterator range, in order.
     *
     * @return Number of elements actually inserted
     */
    template<typename InputIt>
    size_t insert(InputIt first, InputIt last);

    /**
     * @brief Remove the element equivalent to key.
     *
     * @param key The key to remove
     * @return true if an element was removed, false if none matched
     * @complexity O(1) average, O(n) worst case due to hash collisions
     */
    template<typename K>
    bool erase(const K& key);

    /**
     * @brief Remove every element satisfying pred.
     *
     * @return Number of elements removed
     * @complexity O(n + m)
     * @exception_safety Basic guarantee - if pred throws, elements already
     *                  visited stay removed
     */
    template<typename Predicate>
    size_t erase_if(Predicate pred);

    /**
     * @brief Check whether an element equivalent to key is stored.
     * @complexity O(1) average, O(n) worst case due to hash collisions
     */
    template<typename K>
    bool contains(const K& key) const;

    /**
     * @brief Remove all elements. The bucket count is kept.
     * @complexity O(n + m)
     */
    void clear();

    bool empty() const;
    size_t size() const;
    size_t bucket_count() const;

    /**
     * @brief Get the current load factor of the hash table.
     * @return Ratio of elements to buckets
     */
    double load_factor() const;

    float max_load_factor() const;

    /**
     * @brief Rebuild the bucket array with at least count buckets.
     *
     * The count is raised if needed so the current elements respect the max load
     * factor. Cached hashes are reused.
     *
     * @complexity O(n + m)
     */
    void rehash(size_t count);

    /**
     * @brief Make room for count elements without further growth.
     *
     * Never shrinks the bucket array.
     */
    void reserve(size_t count);

    const Hash& hash_function() const;
    const KeyEqual& key_eq() const;

    /**
     * @brief Forward iterator over the stored elements, in bucket order.
     */
    class iterator {
    private:
        const HashBucketSet* set_;      ///< Pointer to the owning set
        size_t bucket_index_;           ///< Current bucket index
        Node* current_;                 ///< Current node being pointed to

        /**
         * @brief Skip forward over empty buckets.
         */
        void advance_to_next_valid();

    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        iterator();
        iterator(const HashBucketSet* set, size_t bucket_idx, Node* node);

        const T& operator*() const;
        const T* operator->() const;
        iterator& operator++();
        iterator operator++(int);
        bool operator==(const iterator& other) const;
        bool operator!=(const iterator& other) const;
    };

    using const_iterator = iterator;

    iterator begin() const;
    iterator end() const;

    /**
     * @brief Locate the element equivalent to key.
     * @return Iterator to the stored element, or end() if none matched
     */
    template<typename K>
    iterator find(const K& key) const;

    /**
     * @brief Count elements matching a predicate.
     */
    template<typename Predicate>
    size_t count_if(Predicate pred) const;
};

template<typename T, typename Hash, typename KeyEqual>
HashBucketSet<T, Hash, KeyEqual>::HashBucketSet(size_t initial_bucket_count, float max_load_factor,
                                                const Hash& hash, const KeyEqual& equal)
    : buckets_(initial_bucket_count > 0 ? initial_bucket_count : 1),
      size_(0),
      max_load_factor_(sanitize_load_factor(max_load_factor)),
      hasher_(hash),
      key_equal_(equal) {}

template<typename T, typename Hash, typename KeyEqual>
HashBucketSet<T, Hash, KeyEqual>::~HashBucketSet() {
    destroy_nodes();
}

template<typename T, typename Hash, typename KeyEqual>
HashBucketSet<T, Hash, KeyEqual>::HashBucketSet(HashBucketSet&& other)
    : buckets_(std::move(other.buckets_)),
      size_(std::exchange(other.size_, 0)),
      max_load_factor_(other.max_load_factor_),
      hasher_(other.hasher_),
      key_equal_(other.key_equal_) {
    other.buckets_.assign(1, Bucket());
}

template<typename T, typename Hash, typename KeyEqual>
HashBucketSet<T, Hash, KeyEqual>& HashBucketSet<T, Hash, KeyEqual>::operator=(HashBucketSet&& other) {
    if (this != &other) {
        destroy_nodes();
        buckets_ = std::move(other.buckets_);
        size_ = std::exchange(other.size_, 0);
        max_load_factor_ = other.max_load_factor_;
        hasher_ = other.hasher_;
        key_equal_ = other.key_equal_;
        other.buckets_.assign(1, Bucket());
    }
    return *this;
}

template<typename T, typename Hash, typename KeyEqual>
size_t HashBucketSet<T, Hash, KeyEqual>::bucket_index(size_t hash) const {
    return hash % buckets_.size();
}

template<typename T, typename Hash, typename KeyEqual>
template<typename K>
typename HashBucketSet<T, Hash, KeyEqual>::Node*
HashBucketSet<T, Hash, KeyEqual>::find_node(const K& key, size_t hash) const {
    Node* current = buckets_[bucket_index(hash)].head;

    while (current) {
        if (current->hash == hash && key_equal_(current->data, key)) {
            return current;
        }
        current = current->next;
    }

    return nullptr;
}

template<typename T, typename Hash, typename KeyEqual>
void HashBucketSet<T, Hash, KeyEqual>::grow_if_needed() {
    if (static_cast<double>(size_ + 1) > static_cast<double>(buckets_.size()) * max_load_factor_) {
        rehash(buckets_.size() * 2);
    }
}

template<typename T, typename Hash, typename KeyEqual>
size_t HashBucketSet<T, Hash, KeyEqual>::buckets_for(size_t elements) const {
    const double needed = std::ceil(static_cast<double>(elements) / max_load_factor_);
    // Saturate; allocating the vector reports a request this large
    const size_t limit = buckets_.max_size();
    if (!(needed < static_cast<double>(limit))) {
        return limit;
    }
    return static_cast<size_t>(needed);
}

template<typename T, typename Hash, typename KeyEqual>
float HashBucketSet<T, Hash, KeyEqual>::sanitize_load_factor(float max_load_factor) {
    if (!(max_load_factor > 0.0f)) {
        return DEFAULT_MAX_LOAD_FACTOR;
    }
    return max_load_factor < MIN_MAX_LOAD_FACTOR ? MIN_MAX_LOAD_FACTOR : max_load_factor;
}

template<typename T, typename Hash, typename KeyEqual>
void HashBucketSet<T, Hash, KeyEqual>::link(Node* node) {
    Bucket& bucket = buckets_[bucket_index(node->hash)];
    node->next = bucket.head;
    bucket.head = node;
    ++size_;
}

template<typename T, typename Hash, typename KeyEqual>
void HashBucketSet<T, Hash, KeyEqual>::destroy_nodes() {
    for (auto& bucket : buckets_) {
        Node* current = bucket.head;
        while (current) {
            Node* next = current->next;
            delete current;
            current = next;
        }
        bucket.head = nullptr;
    }
    size_ = 0;
}

template<typename T, typename Hash, typename KeyEqual>
bool HashBucketSet<T, Hash, KeyEqual>::insert(const T& value) {
    const size_t hash = hasher_(value);
    if (find_node(value, hash) != nullptr) {
        return false;
    }

    grow_if_needed();
    link(new Node(value, hash));
    return true;
}

template<typename T, typename Hash, typename KeyEqual>
bool HashBucketSet<T, Hash, KeyEqual>::insert(T&& value) {
    const size_t hash = hasher_(value);
    if (find_node(value, hash) != nullptr) {
        return false;
    }

    grow_if_needed();
    link(new Node(std::move(value), hash));
    return true;
}

template<typename T, typename Hash, typename KeyEqual>
template<typename... Args>
bool HashBucketSet<T, Hash, KeyEqual>::emplace(Args&&... args) {
    return insert(T(std::forward<Args>(args)...));
}

template<typename T, typename Hash, typename KeyEqual>
template<typename InputIt>
size_t HashBucketSet<T, Hash, KeyEqual>::insert(InputIt first, InputIt last) {
    size_t inserted = 0;
    for (auto it = first; it != last; ++it) {
        if (insert(*it)) {
            ++inserted;
        }
    }
    return inserted;
}

template<typename T, typename Hash, typename KeyEqual>
template<typename K>
bool HashBucketSet<T, Hash, KeyEqual>::erase(const K& key) {
    const size_t hash = hasher_(key);
    Node** slot = &buckets_[bucket_index(hash)].head;

    while (*slot) {
        Node* current = *slot;
        if (current->hash == hash && key_equal_(current->data, key)) {
            *slot = current->next;
            delete current;
            --size_;
            return true;
        }
        slot = &current->next;
    }

    return false;
}

template<typename T, typename Hash, typename KeyEqual>
template<typename Predicate>
size_t HashBucketSet<T, Hash, KeyEqual>::erase_if(Predicate pred) {
    size_t removed = 0;
    for (auto& bucket : buckets_) {
        Node** slot = &bucket.head;
        while (*slot) {
            Node* current = *slot;
            if (pred(static_cast<const T&>(current->data))) {
                *slot = current->next;
                delete current;
                --size_;
                ++removed;
            } else {
                slot = &current->next;
            }
        }
    }
    return removed;
}

template<typename T, typename Hash, typename KeyEqual>
template<typename K>
bool HashBucketSet<T, Hash, KeyEqual>::contains(const K& key) const {
    return find_node(key, hasher_(key)) != nullptr;
}

template<typename T, typename Hash, typename KeyEqual>
void HashBucketSet<T, Hash, KeyEqual>::clear() {
    destroy_nodes();
}

template<typename T, typename Hash, typename KeyEqual>
bool HashBucketSet<T, Hash, KeyEqual>::empty() const {
    return size_ == 0;
}

template<typename T, typename Hash, typename KeyEqual>
size_t HashBucketSet<T, Hash, KeyEqual>::size() const {
    return size_;
}

template<typename T, typename Hash, typename KeyEqual>
size_t HashBucketSet<T, Hash, KeyEqual>::bucket_count() const {
    return buckets_.size();
}

template<typename T, typename Hash, typename KeyEqual>
double HashBucketSet<T, Hash, KeyEqual>::load_factor() const {
    return static_cast<double>(size_) / buckets_.size();
}

template<typename T, typename Hash, typename KeyEqual>
float HashBucketSet<T, Hash, KeyEqual>::max_load_factor() const {
    return max_load_factor_;
}

template<typename T, typename Hash, typename KeyEqual>
void HashBucketSet<T, Hash, KeyEqual>::rehash(size_t count) {
    const size_t minimum = buckets_for(size_);
    if (count < minimum) {
        count = minimum;
    }
    if (count == 0) {
        count = 1;
    }
    if (count == buckets_.size()) {
        return;
    }

    std::vector<Bucket> rebuilt(count);
    for (auto& bucket : buckets_) {
        Node* current = bucket.head;
        while (current) {
            Node* next = current->next;
            Bucket& target = rebuilt[current->hash % count];
            current->next = target.head;
            target.head = current;
            current = next;
        }
        bucket.head = nullptr;
    }
    buckets_.swap(rebuilt);
}

template<typename T, typename Hash, typename KeyEqual>
void HashBucketSet<T, Hash, KeyEqual>::reserve(size_t count) {
    const size_t needed = buckets_for(count);
    if (needed > buckets_.size()) {
        rehash(needed);
    }
}

template<typename T, typename Hash, typename KeyEqual>
const Hash& HashBucketSet<T, Hash, KeyEqual>::hash_function() const {
    return hasher_;
}

template<typename T, typename Hash, typename KeyEqual>
const KeyEqual& HashBucketSet<T, Hash, KeyEqual>::key_eq() const {
    return key_equal_;
}

// Iterator implementation

template<typename T, typename Hash, typename KeyEqual>
HashBucketSet<T, Hash, KeyEqual>::iterator::iterator()
    : set_(nullptr), bucket_index_(0), current_(nullptr) {}

template<typename T, typename Hash, typename KeyEqual>
HashBucketSet<T, Hash, KeyEqual>::iterator::iterator(const HashBucketSet* set, size_t bucket_idx, Node* node)
    : set_(set), bucket_index_(bucket_idx), current_(node) {
    advance_to_next_valid();
}

template<typename T, typename Hash, typename KeyEqual>
void HashBucketSet<T, Hash, KeyEqual>::iterator::advance_to_next_valid() {
    while (!current_ && bucket_index_ < set_->buckets_.size()) {
        ++bucket_index_;
        if (bucket_index_ < set_->buckets_.size()) {
            current_ = set_->buckets_[bucket_index_].head;
        }
    }
}

template<typename T, typename Hash, typename KeyEqual>
const T& HashBucketSet<T, Hash, KeyEqual>::iterator::operator*() const {
    return current_->data;
}

template<typename T, typename Hash, typename KeyEqual>
const T* HashBucketSet<T, Hash, KeyEqual>::iterator::operator->() const {
    return &current_->data;
}

template<typename T, typename Hash, typename KeyEqual>
typename HashBucketSet<T, Hash, KeyEqual>::iterator&
HashBucketSet<T, Hash, KeyEqual>::iterator::operator++() {
    if (current_) {
        current_ = current_->next;
        advance_to_next_valid();
    }
    return *this;
}

template<typename T, typename Hash, typename KeyEqual>
typename HashBucketSet<T, Hash, KeyEqual>::iterator
HashBucketSet<T, Hash, KeyEqual>::iterator::operator++(int) {
    iterator previous = *this;
    ++(*this);
    return previous;
}

template<typename T, typename Hash, typename KeyEqual>
bool HashBucketSet<T, Hash, KeyEqual>::iterator::operator==(const iterator& other) const {
    return set_ == other.set_ && bucket_index_ == other.bucket_index_ && current_ == other.current_;
}

template<typename T, typename Hash, typename KeyEqual>
bool HashBucketSet<T, Hash, KeyEqual>::iterator::operator!=(const iterator& other) const {
    return !(*this == other);
}

template<typename T, typename Hash, typename KeyEqual>
typename HashBucketSet<T, Hash, KeyEqual>::iterator HashBucketSet<T, Hash, KeyEqual>::begin() const {
    return iterator(this, 0, buckets_[0].head);
}

template<typename T, typename Hash, typename KeyEqual>
typename HashBucketSet<T, Hash, KeyEqual>::iterator HashBucketSet<T, Hash, KeyEqual>::end() const {
    return iterator(this, buckets_.size(), nullptr);
}

template<typename T, typename Hash, typename KeyEqual>
template<typename K>
typename HashBucketSet<T, Hash, KeyEqual>::iterator
HashBucketSet<T, Hash, KeyEqual>::find(const K& key) const {
    const size_t hash = hasher_(key);
    Node* node = find_node(key, hash);
    if (!node) {
        return end();
    }
    return iterator(this, bucket_index(hash), node);
}

template<typename T, typename Hash, typename KeyEqual>
template<typename Predicate>
size_t HashBucketSet<T, Hash, KeyEqual>::count_if(Predicate pred) const {
    size_t count = 0;
    for (const auto& item : *this) {
        if (pred(item)) {
            ++count;
        }
    }
    return count;
}

} // namespace equiv
