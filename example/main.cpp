#include <array>
#include <iostream>
#include <vector>

#include <seql/seql.h>

constexpr auto calculate() {
  std::array v{1, 2, 3, 4};
  int sum = 0;
  for (int i : seql::filter(seql::map(v, [](int i) { return i * 2; }),
                            [](int i) { return i != 2; })) {
    sum += i;
  }
  return sum;
}

int main() {
  std::vector<int> v{1, 2, 3, 4};
  for (int i : seql::filter(v, [](auto &&i) { return i != 2; })) {
    std::cout << i << "\n";
  }
  static_assert(calculate() == 18);
  std::cout << "calculate:" << calculate() << std::endl;
  static_assert(std::same_as<decltype(calculate()), int>);

  auto evens = seql::to_vector(seql::take(seql::filter(seql::count(), [](int i) {
    return i % 2 == 0;
  }), 5));
  for (int i : evens) std::cout << i << " ";
  std::cout << std::endl;
  return 0;
}
