// SEQL Flatten Example
// Demonstrates flat_map and chain, including nested infinite sources

#include <seql/seql.h>
#include <iostream>
#include <map>
#include <string>
#include <tuple>
#include <vector>

int main() {
    std::cout << "=== Flatten Nested Vectors ===\n";
    std::vector<std::vector<int>> nested = {
        {1, 2, 3},
        {4, 5},
        {6, 7, 8, 9}
    };
    auto flat = seql::to_vector(
        seql::flat_map(nested, [](const std::vector<int>& inner) -> const std::vector<int>& {
            return inner;
        }));
    std::cout << "Flattened: ";
    for (int x : flat) std::cout << x << " ";
    std::cout << "\n";  // Output: 1 2 3 4 5 6 7 8 9

    std::cout << "\n=== Flat Map ===\n";
    std::vector<int> numbers = {1, 2, 3};
    std::cout << "Repeated: ";
    for (int x : seql::flat_map(numbers, [](int x) { return seql::repeat(x, x); })) {
        std::cout << x << " ";
    }
    std::cout << "\n";  // Output: 1 2 2 3 3 3

    std::cout << "\n=== Words From Sentences ===\n";
    std::vector<std::string> sentences = {"the quick brown", "fox jumps", "over the lazy dog"};
    auto split = [](const std::string& sentence) {
        std::vector<std::string> words;
        std::string current;
        for (char c : sentence) {
            if (c == ' ') {
                words.push_back(std::move(current));
                current.clear();
            } else {
                current += c;
            }
        }
        words.push_back(std::move(current));
        return words;
    };
    std::map<std::string, int> frequency;
    for (const auto& word : seql::flat_map(sentences, split)) ++frequency[word];
    for (const auto& [word, n] : frequency) {
        if (n > 1) std::cout << word << ": " << n << "\n";  // Output: the: 2
    }

    std::cout << "\n=== Pythagorean Triples ===\n";
    // Infinite search over c, then a and b below it
    auto triples = seql::flat_map(seql::count(1), [](int c) {
        return seql::flat_map(seql::take(seql::count(1), c), [c](int a) {
            return seql::map(
                seql::filter(seql::take(seql::count(a), c - a),
                             [a, c](int b) { return a * a + b * b == c * c; }),
                [a, c](int b) { return std::make_tuple(a, b, c); });
        });
    });
    for (auto& [a, b, c] : seql::take(triples, 5)) {
        std::cout << "(" << a << ", " << b << ", " << c << ")\n";
    }
    // Output: (3, 4, 5) (6, 8, 10) (5, 12, 13) (9, 12, 15) (8, 15, 17)

    std::cout << "\n=== Chain ===\n";
    std::vector<int> head = {1, 2};
    std::vector<long> tail = {100, 200};
    std::cout << "Chained: ";
    for (long x : seql::chain(head, seql::repeat(0, 2), tail)) std::cout << x << " ";
    std::cout << "\n";  // Output: 1 2 0 0 100 200

    std::cout << "Header then rows:\n";
    std::vector<std::string> rows = {"alice,30", "bob,25"};
    for (const auto& line : seql::chain(seql::repeat(std::string("name,age"), 1), rows)) {
        std::cout << "  " << line << "\n";
    }

    return 0;
}
