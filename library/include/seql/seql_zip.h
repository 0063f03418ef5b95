#ifndef SEQL_ZIP_H_
#define SEQL_ZIP_H_

#include "seql_core.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

namespace seql {

enum class zip_strategy : std::uint8_t {
  shortest,
  longest,
  strict
};

constexpr std::string_view to_string(zip_strategy strategy) {
  switch (strategy) {
    case zip_strategy::shortest: return "shortest";
    case zip_strategy::longest: return "longest";
    case zip_strategy::strict: return "strict";
  }
  return "unknown";
}

constexpr zip_strategy parse_zip_strategy(std::string_view name) {
  for (auto strategy : {zip_strategy::shortest, zip_strategy::longest,
                        zip_strategy::strict}) {
    if (to_string(strategy) == name) return strategy;
  }
  throw std::invalid_argument("seql::zip: unrecognized strategy \""
                                  + std::string(name) + "\"");
}

// ============================================================================
// Strategy descriptors
//
// A descriptor names the strategy and turns the values pulled for one step
// (one std::optional per source, empty for an exhausted source) into the
// element that is produced.
// ============================================================================

namespace detail {

template<typename... Ts>
constexpr std::tuple<Ts...> unwrap_all(std::tuple<std::optional<Ts>...> &&pulled) {
  return std::apply([](auto &&... values) {
    return std::tuple<Ts...>(std::move(*values)...);
  }, std::move(pulled));
}

} // namespace detail

struct zip_shortest_t {
  static constexpr zip_strategy strategy = zip_strategy::shortest;

  template<typename... Ts>
  using value_type = std::tuple<Ts...>;

  template<typename... Ts>
  constexpr std::tuple<Ts...> make(std::tuple<std::optional<Ts>...> &&pulled) const {
    return detail::unwrap_all(std::move(pulled));
  }
};

struct zip_strict_t {
  static constexpr zip_strategy strategy = zip_strategy::strict;

  template<typename... Ts>
  using value_type = std::tuple<Ts...>;

  template<typename... Ts>
  constexpr std::tuple<Ts...> make(std::tuple<std::optional<Ts>...> &&pulled) const {
    return detail::unwrap_all(std::move(pulled));
  }
};

// Longest with an explicit fill value, converted to each element type.
template<typename Fill>
struct zip_longest_fill_t {
  static constexpr zip_strategy strategy = zip_strategy::longest;

  template<typename... Ts>
  using value_type = std::tuple<Ts...>;

  Fill fill_value;

  template<typename... Ts>
  constexpr std::tuple<Ts...> make(std::tuple<std::optional<Ts>...> &&pulled) const {
    return [&]<std::size_t... Is>(std::index_sequence<Is...>) {
      return std::tuple<Ts...>(value_or_fill<Ts>(std::get<Is>(std::move(pulled)))...);
    }(std::index_sequence_for<Ts...>{});
  }

 private:
  template<typename T>
  constexpr T value_or_fill(std::optional<T> &&value) const {
    if (value) return std::move(*value);
    return static_cast<T>(fill_value);
  }
};

// Longest with no fill value: exhausted positions are std::nullopt.
struct zip_longest_t {
  static constexpr zip_strategy strategy = zip_strategy::longest;

  template<typename... Ts>
  using value_type = std::tuple<std::optional<Ts>...>;

  template<typename... Ts>
  constexpr std::tuple<std::optional<Ts>...> make(
      std::tuple<std::optional<Ts>...> &&pulled) const {
    return std::move(pulled);
  }

  template<typename Fill>
  constexpr zip_longest_fill_t<Fill> fill(Fill value) const {
    return {std::move(value)};
  }
};

inline constexpr zip_shortest_t zip_shortest{};
inline constexpr zip_strict_t zip_strict{};
inline constexpr zip_longest_t zip_longest{};

// Strategy chosen at run time. Elements are always tuples of std::optional;
// under shortest and strict every position is engaged.
struct zip_options {
  zip_strategy strategy = zip_strategy::shortest;

  template<typename... Ts>
  using value_type = std::tuple<std::optional<Ts>...>;

  template<typename... Ts>
  constexpr std::tuple<std::optional<Ts>...> make(
      std::tuple<std::optional<Ts>...> &&pulled) const {
    return std::move(pulled);
  }
};

template<typename D>
concept zip_descriptor = requires(const D &d) {
  { d.strategy } -> std::convertible_to<zip_strategy>;
};

// ============================================================================
// Multiplexer
// ============================================================================

template<zip_descriptor Descriptor, cursor... Cs>
struct zip_cursor : impl::cursor_impl<zip_cursor<Descriptor, Cs...>> {
  static constexpr std::size_t arity = sizeof...(Cs);

  using pulled_type = std::tuple<std::optional<cursor_value_t<Cs>>...>;
  using value_type = typename Descriptor::template value_type<cursor_value_t<Cs>...>;

  [[no_unique_address]] Descriptor descriptor_;
  std::tuple<Cs...> sources_;
  std::array<bool, arity> exhausted_{};
  std::size_t step_ = 0;
  bool done_ = false;

  constexpr explicit zip_cursor(Descriptor descriptor, Cs... sources)
      : descriptor_(std::move(descriptor)), sources_(std::move(sources)...) {
    switch (strategy()) {
      case zip_strategy::shortest:
      case zip_strategy::longest:
      case zip_strategy::strict: break;
      default:
        throw std::invalid_argument(
            "seql::zip: unrecognized strategy "
                + std::to_string(static_cast<int>(strategy())));
    }
  }

  constexpr zip_strategy strategy() const { return descriptor_.strategy; }

  constexpr std::optional<value_type> next() {
    if constexpr (arity == 0) {
      return std::nullopt;
    } else {
      if (done_) return std::nullopt;
      pulled_type pulled;
      bool produce = false;
      switch (strategy()) {
        case zip_strategy::shortest: produce = step_shortest(pulled); break;
        case zip_strategy::longest: produce = step_longest(pulled); break;
        case zip_strategy::strict: produce = step_strict(pulled); break;
      }
      if (!produce) {
        done_ = true;
        return std::nullopt;
      }
      ++step_;
      return std::optional<value_type>(std::in_place,
                                       descriptor_.make(std::move(pulled)));
    }
  }

 private:
  template<std::size_t I>
  constexpr bool pull(pulled_type &pulled) {
    if (exhausted_[I]) return false;
    std::get<I>(pulled) = std::get<I>(sources_).next();
    if (!std::get<I>(pulled)) {
      exhausted_[I] = true;
      return false;
    }
    return true;
  }

  // Stops at the first exhausted source; later sources are not pulled.
  constexpr bool step_shortest(pulled_type &pulled) {
    return [&]<std::size_t... Is>(std::index_sequence<Is...>) {
      return (pull<Is>(pulled) && ...);
    }(std::index_sequence_for<Cs...>{});
  }

  constexpr bool step_longest(pulled_type &pulled) {
    auto produced = [&]<std::size_t... Is>(std::index_sequence<Is...>) {
      return (std::size_t(pull<Is>(pulled)) + ...);
    }(std::index_sequence_for<Cs...>{});
    return produced > 0;
  }

  constexpr bool step_strict(pulled_type &pulled) {
    auto produced = [&]<std::size_t... Is>(std::index_sequence<Is...>) {
      return (std::size_t(pull<Is>(pulled)) + ...);
    }(std::index_sequence_for<Cs...>{});
    if (produced == arity) return true;
    if (produced == 0) return false;
    done_ = true;
    throw length_mismatch_error(
        "seql::zip: strict sources have different lengths, "
            + std::to_string(arity - produced) + " of " + std::to_string(arity)
            + " exhausted after " + std::to_string(step_) + " elements");
  }
};

template<sequence... Ss>
[[nodiscard]] constexpr auto zip(Ss &&... ss) {
  return zip_cursor<zip_shortest_t, cursor_t<Ss>...>(
      zip_shortest, make_cursor(std::forward<Ss>(ss))...);
}

template<zip_descriptor Descriptor, sequence... Ss>
[[nodiscard]] constexpr auto zip(Descriptor descriptor, Ss &&... ss) {
  return zip_cursor<Descriptor, cursor_t<Ss>...>(
      std::move(descriptor), make_cursor(std::forward<Ss>(ss))...);
}

} // namespace seql

#endif //SEQL_ZIP_H_
