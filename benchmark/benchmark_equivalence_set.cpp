#include <iostream>
#include <vector>
#include <chrono>
#include <unordered_set>
#include <random>
#include <string>
#include "equiv/equivalence_set.hpp"
#include "equiv/hash_bucket_set.hpp"

using namespace equiv;

// Values are equivalent when they agree modulo MODULUS
constexpr int MODULUS = 50000;

struct ModHash {
    size_t operator()(int value) const { return std::hash<int>{}(value % MODULUS); }
};

struct ModEqual {
    bool operator()(int a, int b) const { return a % MODULUS == b % MODULUS; }
};

// Adapters giving every set under test the same insert/erase/contains surface
class EquivalenceSetUnderTest {
private:
    EquivalenceSet<int> set_;

public:
    EquivalenceSetUnderTest()
        : set_([](const int& a, const int& b) { return ModEqual{}(a, b); },
               [](const int& a) { return ModHash{}(a); }) {}

    bool insert(int value) { return set_.insert(value); }
    bool erase(int value) { return set_.erase(value); }
    bool contains(int value) const { return set_.contains(value); }
    size_t size() const { return set_.size(); }
};

class BucketSetUnderTest {
private:
    HashBucketSet<int, ModHash, ModEqual> set_;

public:
    bool insert(int value) { return set_.insert(value); }
    bool erase(int value) { return set_.erase(value); }
    bool contains(int value) const { return set_.contains(value); }
    size_t size() const { return set_.size(); }
};

class StdSetUnderTest {
private:
    std::unordered_set<int, ModHash, ModEqual> set_;

public:
    bool insert(int value) { return set_.insert(value).second; }
    bool erase(int value) { return set_.erase(value) > 0; }
    bool contains(int value) const { return set_.count(value) > 0; }
    size_t size() const { return set_.size(); }
};

template<typename SetType>
void benchmark_set_throughput(const std::string& name, int operations, int read_percentage) {
    SetType set;

    // Pre-generate all random data to avoid RNG during timing
    std::vector<int> values(operations);
    std::vector<int> ops(operations);

    std::mt19937 gen(42);
    std::uniform_int_distribution<> value_dist(1, MODULUS * 4);
    std::uniform_int_distribution<> op_dist(0, 99);

    for (int i = 0; i < operations; ++i) {
        values[i] = value_dist(gen);
        ops[i] = op_dist(gen);
    }

    std::cout << "Benchmarking " << name << " - " << operations << " ops, "
              << read_percentage << "% reads\n";

    size_t hits = 0;
    auto start_time = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < operations; ++i) {
        if (ops[i] < read_percentage) {
            hits += set.contains(values[i]) ? 1 : 0;
        } else if (ops[i] < read_percentage + (100 - read_percentage) / 2) {
            hits += set.insert(values[i]) ? 1 : 0;
        } else {
            hits += set.erase(values[i]) ? 1 : 0;
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);
    double elapsed = duration.count() > 0 ? static_cast<double>(duration.count()) : 1.0;
    double throughput = (operations * 1000000.0) / elapsed;

    std::cout << "  Time: " << duration.count() << " us\n";
    std::cout << "  Throughput: " << static_cast<long>(throughput) << " ops/sec\n";
    std::cout << "  Successful ops: " << hits << "\n";
    std::cout << "  Final set size: " << set.size() << "\n\n";
}

void benchmark_workload(const std::string& title, int read_percentage) {
    std::cout << "=== " << title << " ===\n\n";

    constexpr int operations = 1000000;
    benchmark_set_throughput<EquivalenceSetUnderTest>("EquivalenceSet", operations, read_percentage);
    benchmark_set_throughput<BucketSetUnderTest>("HashBucketSet", operations, read_percentage);
    benchmark_set_throughput<StdSetUnderTest>("std::unordered_set", operations, read_percentage);
}

int main() {
    std::cout << "EquivalenceSet Performance Benchmark\n";
    std::cout << "====================================\n\n";

    benchmark_workload("Read-Heavy Workload (80% contains)", 80);
    benchmark_workload("Balanced Workload (50% contains)", 50);
    benchmark_workload("Write-Heavy Workload (20% contains)", 20);

    return 0;
}
