// SEQL Grouping Example
// Demonstrates chunk, window, dedup and scan

#include <seql/seql.h>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_groups(const char* label, auto&& groups) {
    std::cout << label << ":";
    for (const auto& group : groups) {
        std::cout << " [";
        for (std::size_t i = 0; i < group.size(); ++i) {
            std::cout << (i ? " " : "") << group[i];
        }
        std::cout << "]";
    }
    std::cout << "\n";
}

}  // namespace

int main() {
    std::vector<int> data = {1, 2, 3, 4, 5, 6, 7};

    std::cout << "=== Chunk ===\n";
    print_groups("drop_end", seql::chunk(data, 3));
    // Output: [1 2 3] [4 5 6]
    print_groups("keep_end", seql::chunk(data, 3, seql::chunk_strategy::keep_end));
    // Output: [1 2 3] [4 5 6] [7]
    print_groups("pad_end", seql::chunk(data, 3,
                                        seql::chunk_options{seql::chunk_strategy::pad_end, -1}));
    // Output: [1 2 3] [4 5 6] [7 -1 -1]

    // The strategy can also come from a configuration string
    auto strategy = seql::parse_chunk_strategy("strict");
    try {
        print_groups(seql::to_string(strategy).data(), seql::chunk(data, 3, strategy));
    } catch (const seql::length_mismatch_error& e) {
        std::cout << "\nlength_mismatch_error: " << e.what() << "\n";
    }

    std::cout << "\n=== Window ===\n";
    print_groups("window(3)", seql::window(data, 3));
    // Output: [1 2 3] [2 3 4] [3 4 5] [4 5 6] [5 6 7]

    std::cout << "Moving average:";
    std::vector<double> prices = {10.0, 11.0, 12.0, 11.5, 13.0, 14.5};
    for (const auto& w : seql::window(prices, 3)) {
        std::cout << " " << (w[0] + w[1] + w[2]) / 3.0;
    }
    std::cout << "\n";

    std::cout << "\n=== Dedup ===\n";
    std::vector<int> runs = {1, 2, 2, 3, 3, 3, 4, 4, 4, 4, 3, 3, 3, 2, 2, 1};
    for (int x : seql::dedup(runs)) std::cout << x << " ";
    std::cout << "\n";  // Output: 1 2 3 4 3 2 1

    std::vector<std::string> readings = {"ok", "ok", "warn", "warn", "ok", "error", "error"};
    std::cout << "Status changes: ";
    for (const auto& s : seql::dedup(readings)) std::cout << s << " ";
    std::cout << "\n";  // Output: ok warn ok error

    std::cout << "\n=== Scan ===\n";
    std::vector<int> deposits = {3, 1, 4, 1, 5};
    std::cout << "Running total: ";
    for (int x : seql::scan(deposits, std::plus<>{})) std::cout << x << " ";
    std::cout << "\n";  // Output: 3 4 8 9 14

    std::cout << "Balance from 100: ";
    for (int x : seql::scan(deposits, std::plus<>{}, 100)) std::cout << x << " ";
    std::cout << "\n";  // Output: 103 104 108 109 114

    std::cout << "Running max: ";
    for (int x : seql::scan(deposits, [](int acc, int x) { return x > acc ? x : acc; })) {
        std::cout << x << " ";
    }
    std::cout << "\n";  // Output: 3 3 4 4 5

    return 0;
}
