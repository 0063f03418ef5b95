// SEQL Basics Example
// Demonstrates the one-to-one and slicing adapters: map, filter, take, drop,
// take_while, drop_while, peek and enumerate

#include <seql/seql.h>
#include <iostream>
#include <string>
#include <vector>

int main() {
    std::vector<int> numbers = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};

    std::cout << "=== Map and Filter ===\n";
    auto doubled_evens = seql::to_vector(
        seql::map(seql::filter(numbers, [](int x) { return x % 2 == 0; }),
                  [](int x) { return x * 2; }));
    std::cout << "Doubled evens: ";
    for (int x : doubled_evens) std::cout << x << " ";
    std::cout << "\n";  // Output: 4 8 12 16 20

    // Callbacks may take the element's position as a second argument
    std::cout << "Every third: ";
    for (int x : seql::filter(numbers, [](int, std::size_t i) { return i % 3 == 0; })) {
        std::cout << x << " ";
    }
    std::cout << "\n";  // Output: 1 4 7 10

    std::cout << "\n=== Take and Drop ===\n";
    std::cout << "First 3: ";
    for (int x : seql::take(numbers, 3)) std::cout << x << " ";
    std::cout << "\n";  // Output: 1 2 3

    std::cout << "Drop 5: ";
    for (int x : seql::drop(numbers, 5)) std::cout << x << " ";
    std::cout << "\n";  // Output: 6 7 8 9 10

    // A cursor held by the caller resumes where a previous adapter stopped
    auto cursor = seql::make_cursor(numbers);
    auto head = seql::to_vector(seql::take(cursor, 4));
    auto tail = seql::to_vector(cursor);
    std::cout << "Split: " << head.size() << " + " << tail.size() << "\n";  // Output: 4 + 6

    std::cout << "\n=== Take While and Drop While ===\n";
    std::cout << "Below 5: ";
    for (int x : seql::take_while(numbers, [](int x) { return x < 5; })) std::cout << x << " ";
    std::cout << "\n";  // Output: 1 2 3 4

    std::cout << "From 5: ";
    for (int x : seql::drop_while(numbers, [](int x) { return x < 5; })) std::cout << x << " ";
    std::cout << "\n";  // Output: 5 6 7 8 9 10

    std::cout << "\n=== Peek ===\n";
    auto squares = seql::map(
        seql::peek(seql::take(numbers, 3), [](int x, std::size_t i) {
            std::cout << "  pulled [" << i << "] " << x << "\n";
        }),
        [](int x) { return x * x; });
    for (int x : squares) std::cout << "  square " << x << "\n";

    std::cout << "\n=== Enumerate ===\n";
    std::vector<std::string> items = {"apple", "banana", "cherry"};
    for (auto &[i, item] : seql::enumerate(items, 1)) {
        std::cout << i << ". " << item << "\n";
    }

    std::cout << "\n=== Errors ===\n";
    try {
        auto bad = seql::take(numbers, -1);
        (void)bad;
    } catch (const std::invalid_argument& e) {
        std::cout << "invalid_argument: " << e.what() << "\n";
    }

    return 0;
}
