// SEQL Zip Example
// Demonstrates combining several sequences with zip and its length strategies

#include <seql/seql.h>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

int main() {
    std::cout << "=== Basic Zip ===\n";
    std::vector<int> numbers = {1, 2, 3, 4, 5};
    std::vector<std::string> words = {"one", "two", "three", "four", "five"};
    for (auto& [n, w] : seql::zip(numbers, words)) {
        std::cout << n << " -> " << w << "\n";
    }

    std::cout << "\n=== Dot Product ===\n";
    std::vector<double> a = {1.0, 2.0, 3.0};
    std::vector<double> b = {4.0, 5.0, 6.0};
    double dot_product = 0;
    for (auto& [x, y] : seql::zip(a, b)) dot_product += x * y;
    std::cout << "Dot product: " << dot_product << "\n";  // 1*4 + 2*5 + 3*6 = 32

    std::cout << "\n=== Zip Three Sequences ===\n";
    std::vector<int> xs = {1, 2, 3};
    std::vector<int> ys = {10, 20, 30};
    std::cout << "Sums: ";
    for (auto& [x, y, z] : seql::zip(xs, ys, seql::count(100, 100))) std::cout << x + y + z << " ";
    std::cout << "\n";  // Output: 111 222 333

    std::vector<std::string> letters = {"a", "b", "c", "d"};
    std::vector<std::string> digits = {"0", "1", "2"};

    std::cout << "\n=== Shortest (default) ===\n";
    for (auto& [l, d] : seql::zip(letters, digits)) std::cout << l << d << " ";
    std::cout << "\n";  // Output: a0 b1 c2

    std::cout << "\n=== Longest ===\n";
    for (auto& [l, d] : seql::zip(seql::zip_longest.fill("X"), letters, digits)) {
        std::cout << l << d << " ";
    }
    std::cout << "\n";  // Output: a0 b1 c2 dX

    for (auto& [l, d] : seql::zip(seql::zip_longest, letters, digits)) {
        std::cout << l.value_or("?") << (d ? *d : "<none>") << " ";
    }
    std::cout << "\n";  // Output: a0 b1 c2 d<none>

    std::cout << "\n=== Strict ===\n";
    try {
        for (auto& [l, d] : seql::zip(seql::zip_strict, letters, digits)) {
            std::cout << l << d << " ";
        }
    } catch (const seql::length_mismatch_error& e) {
        std::cout << "\nlength_mismatch_error: " << e.what() << "\n";
    }

    std::cout << "\n=== Strategy From Configuration ===\n";
    for (const char* name : {"shortest", "longest", "strict"}) {
        seql::zip_options options{seql::parse_zip_strategy(name)};
        std::cout << seql::to_string(options.strategy) << ":";
        try {
            for (auto& [l, d] : seql::zip(options, letters, digits)) {
                std::cout << " " << l.value_or("-") << d.value_or("-");
            }
            std::cout << "\n";
        } catch (const seql::length_mismatch_error&) {
            std::cout << " (length mismatch)\n";
        }
    }

    return 0;
}
