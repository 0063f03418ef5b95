// SEQL Generators Example
// Demonstrates the infinite sources count, iterate, repeat and cycle, and
// wrapping a callable with generator

#include <seql/seql.h>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

int main() {
    std::cout << "=== Count ===\n";
    std::cout << "count(): ";
    for (int x : seql::take(seql::count(), 10)) std::cout << x << " ";
    std::cout << "\n";  // Output: 0 1 2 3 4 5 6 7 8 9

    std::cout << "count(100, -25): ";
    for (int x : seql::take(seql::count(100, -25), 5)) std::cout << x << " ";
    std::cout << "\n";  // Output: 100 75 50 25 0

    std::cout << "count(0.0, 0.5): ";
    for (double x : seql::take(seql::count(0.0, 0.5), 4)) std::cout << x << " ";
    std::cout << "\n";  // Output: 0 0.5 1 1.5

    std::cout << "\n=== First 10 Squares ===\n";
    auto squares = seql::take(seql::map(seql::count(1), [](int x) { return x * x; }), 10);
    for (int x : squares) std::cout << x << " ";
    std::cout << "\n";  // Output: 1 4 9 16 25 36 49 64 81 100

    std::cout << "\n=== FizzBuzz (1-20) ===\n";
    for (int n : seql::take(seql::count(1), 20)) {
        if (n % 15 == 0) std::cout << "FizzBuzz ";
        else if (n % 3 == 0) std::cout << "Fizz ";
        else if (n % 5 == 0) std::cout << "Buzz ";
        else std::cout << n << " ";
    }
    std::cout << "\n";

    std::cout << "\n=== Iterate ===\n";
    auto collatz = seql::take_while(
        seql::iterate(27, [](int n) { return n % 2 == 0 ? n / 2 : 3 * n + 1; }),
        [](int n) { return n != 1; });
    int steps = 0;
    int peak = 0;
    for (int n : collatz) {
        ++steps;
        peak = n > peak ? n : peak;
    }
    std::cout << "Collatz(27): " << steps << " steps, peak " << peak << "\n";  // 111 steps, peak 9232

    std::cout << "\n=== Repeat ===\n";
    for (const auto& s : seql::repeat(std::string("ho"), 3)) std::cout << s << " ";
    std::cout << "\n";  // Output: ho ho ho

    std::cout << "\n=== Cycle ===\n";
    std::vector<std::string> shifts = {"day", "evening", "night"};
    for (auto& [week, shift] : seql::enumerate(seql::take(seql::cycle(shifts), 7), 1)) {
        std::cout << "Week " << week << ": " << shift << "\n";
    }

    std::cout << "\n=== Generator ===\n";
    // Fibonacci numbers below 100
    auto fibonacci = seql::generator([a = 0, b = 1]() mutable -> std::optional<int> {
        if (a >= 100) return std::nullopt;
        int current = a;
        a = b;
        b = current + b;
        return current;
    });
    for (int x : fibonacci) std::cout << x << " ";
    std::cout << "\n";  // Output: 0 1 1 2 3 5 8 13 21 34 55 89

    return 0;
}
