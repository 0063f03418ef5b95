#ifndef SEQL_STAGES_H_
#define SEQL_STAGES_H_

#include "seql_core.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace seql {

namespace detail {

constexpr std::size_t checked_limit(std::string_view op, std::ptrdiff_t limit) {
  if (limit < 0) {
    throw std::invalid_argument(std::string(op) + ": limit must be >= 0, got "
                                    + std::to_string(limit));
  }
  return static_cast<std::size_t>(limit);
}

constexpr std::size_t checked_size(std::string_view op, std::ptrdiff_t size) {
  if (size <= 0) {
    throw std::invalid_argument(std::string(op) + ": size must be > 0, got "
                                    + std::to_string(size));
  }
  return static_cast<std::size_t>(size);
}

} // namespace detail

// ============================================================================
// One-state adapters
// ============================================================================

template<cursor C, typename F>
struct map_cursor : impl::cursor_impl<map_cursor<C, F>> {
  using value_type = std::remove_cvref_t<
      detail::indexed_result_t<F, cursor_value_t<C>>>;

  C source_;
  [[no_unique_address]] F mapping_;
  std::size_t index_ = 0;

  constexpr map_cursor(C source, F mapping)
      : source_(std::move(source)), mapping_(std::move(mapping)) {}

  constexpr std::optional<value_type> next() {
    auto v = source_.next();
    if (!v) return std::nullopt;
    return std::optional<value_type>(
        std::in_place,
        detail::invoke_indexed(mapping_, index_++, std::move(*v)));
  }
};

template<sequence S, typename F>
[[nodiscard]] constexpr auto map(S &&s, F mapping) {
  return map_cursor<cursor_t<S>, F>(make_cursor(std::forward<S>(s)),
                                    std::move(mapping));
}

// The index passed to the predicate counts source elements tested, not
// elements produced.
template<cursor C, typename Predicate>
struct filter_cursor : impl::cursor_impl<filter_cursor<C, Predicate>> {
  using value_type = cursor_value_t<C>;

  C source_;
  [[no_unique_address]] Predicate predicate_;
  std::size_t index_ = 0;

  constexpr filter_cursor(C source, Predicate predicate)
      : source_(std::move(source)), predicate_(std::move(predicate)) {}

  constexpr std::optional<value_type> next() {
    while (auto v = source_.next()) {
      if (detail::invoke_indexed(predicate_, index_++, std::as_const(*v))) {
        return v;
      }
    }
    return std::nullopt;
  }
};

template<sequence S, typename Predicate>
[[nodiscard]] constexpr auto filter(S &&s, Predicate predicate) {
  return filter_cursor<cursor_t<S>, Predicate>(make_cursor(std::forward<S>(s)),
                                               std::move(predicate));
}

template<cursor C>
struct take_cursor : impl::cursor_impl<take_cursor<C>> {
  using value_type = cursor_value_t<C>;

  C source_;
  std::size_t remaining_;

  constexpr take_cursor(C source, std::size_t limit)
      : source_(std::move(source)), remaining_(limit) {}

  constexpr std::optional<value_type> next() {
    // Once the limit is reached the source is never pulled again.
    if (remaining_ == 0) return std::nullopt;
    auto v = source_.next();
    remaining_ = v ? remaining_ - 1 : 0;
    return v;
  }
};

template<sequence S>
[[nodiscard]] constexpr auto take(S &&s, std::ptrdiff_t limit) {
  auto n = detail::checked_limit("seql::take", limit);
  return take_cursor<cursor_t<S>>(make_cursor(std::forward<S>(s)), n);
}

template<cursor C>
struct drop_cursor : impl::cursor_impl<drop_cursor<C>> {
  using value_type = cursor_value_t<C>;

  C source_;
  std::size_t remaining_;

  constexpr drop_cursor(C source, std::size_t limit)
      : source_(std::move(source)), remaining_(limit) {}

  constexpr std::optional<value_type> next() {
    for (; remaining_ > 0; --remaining_) {
      if (!source_.next()) {
        remaining_ = 0;
        return std::nullopt;
      }
    }
    return source_.next();
  }
};

template<sequence S>
[[nodiscard]] constexpr auto drop(S &&s, std::ptrdiff_t limit) {
  auto n = detail::checked_limit("seql::drop", limit);
  return drop_cursor<cursor_t<S>>(make_cursor(std::forward<S>(s)), n);
}

template<cursor C, typename Predicate>
struct take_while_cursor : impl::cursor_impl<take_while_cursor<C, Predicate>> {
  using value_type = cursor_value_t<C>;

  C source_;
  [[no_unique_address]] Predicate predicate_;
  std::size_t index_ = 0;
  bool done_ = false;

  constexpr take_while_cursor(C source, Predicate predicate)
      : source_(std::move(source)), predicate_(std::move(predicate)) {}

  constexpr std::optional<value_type> next() {
    if (done_) return std::nullopt;
    auto v = source_.next();
    if (!v || !detail::invoke_indexed(predicate_, index_++, std::as_const(*v))) {
      done_ = true;
      return std::nullopt;
    }
    return v;
  }
};

template<sequence S, typename Predicate>
[[nodiscard]] constexpr auto take_while(S &&s, Predicate predicate) {
  return take_while_cursor<cursor_t<S>, Predicate>(
      make_cursor(std::forward<S>(s)), std::move(predicate));
}

template<cursor C, typename Predicate>
struct drop_while_cursor : impl::cursor_impl<drop_while_cursor<C, Predicate>> {
  using value_type = cursor_value_t<C>;

  C source_;
  [[no_unique_address]] Predicate predicate_;
  std::size_t index_ = 0;
  bool dropping_ = true;

  constexpr drop_while_cursor(C source, Predicate predicate)
      : source_(std::move(source)), predicate_(std::move(predicate)) {}

  constexpr std::optional<value_type> next() {
    if (!dropping_) return source_.next();
    while (auto v = source_.next()) {
      if (!detail::invoke_indexed(predicate_, index_++, std::as_const(*v))) {
        dropping_ = false;
        return v;
      }
    }
    return std::nullopt;
  }
};

template<sequence S, typename Predicate>
[[nodiscard]] constexpr auto drop_while(S &&s, Predicate predicate) {
  return drop_while_cursor<cursor_t<S>, Predicate>(
      make_cursor(std::forward<S>(s)), std::move(predicate));
}

template<cursor C, typename Consumer>
struct peek_cursor : impl::cursor_impl<peek_cursor<C, Consumer>> {
  using value_type = cursor_value_t<C>;

  C source_;
  [[no_unique_address]] Consumer consumer_;
  std::size_t index_ = 0;

  constexpr peek_cursor(C source, Consumer consumer)
      : source_(std::move(source)), consumer_(std::move(consumer)) {}

  constexpr std::optional<value_type> next() {
    auto v = source_.next();
    if (v) {
      detail::invoke_indexed(consumer_, index_++, std::as_const(*v));
    }
    return v;
  }
};

template<sequence S, typename Consumer>
[[nodiscard]] constexpr auto peek(S &&s, Consumer consumer) {
  return peek_cursor<cursor_t<S>, Consumer>(make_cursor(std::forward<S>(s)),
                                            std::move(consumer));
}

// Depth-1 flattening. The inner sequence of one source element is drained
// before the next source element is pulled. The current source element is
// held on the heap while its inner sequence is traversed, so the mapping may
// return a reference into it and the cursor may still be moved.
template<cursor C, typename F>
struct flat_map_cursor : impl::cursor_impl<flat_map_cursor<C, F>> {
  using outer_type = cursor_value_t<C>;
  using inner_type = cursor_t<detail::indexed_result_t<F, outer_type &>>;
  using value_type = cursor_value_t<inner_type>;

  C source_;
  [[no_unique_address]] F mapping_;
  std::unique_ptr<outer_type> outer_;
  std::optional<inner_type> inner_;
  std::size_t index_ = 0;

  constexpr flat_map_cursor(C source, F mapping)
      : source_(std::move(source)), mapping_(std::move(mapping)) {}

  constexpr std::optional<value_type> next() {
    while (true) {
      if (inner_) {
        if (auto v = inner_->next()) return v;
        inner_.reset();
        outer_.reset();
      }
      auto outer = source_.next();
      if (!outer) return std::nullopt;
      outer_ = std::make_unique<outer_type>(std::move(*outer));
      inner_.emplace(make_cursor(detail::invoke_indexed(mapping_, index_++, *outer_)));
    }
  }
};

template<sequence S, typename F>
[[nodiscard]] constexpr auto flat_map(S &&s, F mapping) {
  return flat_map_cursor<cursor_t<S>, F>(make_cursor(std::forward<S>(s)),
                                         std::move(mapping));
}

// Replays the elements of a finite source forever. Keeps a copy of every
// element seen, so auxiliary space is O(source length).
template<cursor C>
struct cycle_cursor : impl::cursor_impl<cycle_cursor<C>> {
  using value_type = cursor_value_t<C>;

  C source_;
  std::vector<value_type> saved_;
  std::size_t replay_ = 0;
  bool source_done_ = false;

  constexpr explicit cycle_cursor(C source) : source_(std::move(source)) {}

  constexpr std::optional<value_type> next() {
    if (!source_done_) {
      if (auto v = source_.next()) {
        saved_.push_back(*v);
        return v;
      }
      source_done_ = true;
    }
    if (saved_.empty()) return std::nullopt;
    std::optional<value_type> result(std::in_place, saved_[replay_]);
    replay_ = (replay_ + 1) % saved_.size();
    return result;
  }
};

template<sequence S>
[[nodiscard]] constexpr auto cycle(S &&s) {
  return cycle_cursor<cursor_t<S>>(make_cursor(std::forward<S>(s)));
}

template<typename T>
struct repeat_cursor : impl::cursor_impl<repeat_cursor<T>> {
  using value_type = T;

  T value_;
  std::optional<std::size_t> remaining_;

  constexpr repeat_cursor(T value, std::optional<std::size_t> times)
      : value_(std::move(value)), remaining_(times) {}

  constexpr std::optional<value_type> next() {
    if (remaining_) {
      if (*remaining_ == 0) return std::nullopt;
      --*remaining_;
    }
    return value_;
  }
};

template<typename T>
[[nodiscard]] constexpr auto repeat(T value) {
  return repeat_cursor<T>(std::move(value), std::nullopt);
}

// A negative count behaves like zero.
template<typename T>
[[nodiscard]] constexpr auto repeat(T value, std::ptrdiff_t times) {
  return repeat_cursor<T>(std::move(value),
                          static_cast<std::size_t>(times < 0 ? 0 : times));
}

// Yields seed, update(seed, 0), update(update(seed, 0), 1), ...
// The update runs on the pull that needs its result.
template<typename T, typename F>
struct iterate_cursor : impl::cursor_impl<iterate_cursor<T, F>> {
  using value_type = T;

  T current_;
  [[no_unique_address]] F update_;
  std::size_t index_ = 0;
  bool started_ = false;

  constexpr iterate_cursor(T seed, F update)
      : current_(std::move(seed)), update_(std::move(update)) {}

  constexpr std::optional<value_type> next() {
    if (started_) {
      current_ = detail::invoke_indexed(update_, index_++, std::as_const(current_));
    }
    started_ = true;
    return current_;
  }
};

template<typename T, typename F>
[[nodiscard]] constexpr auto iterate(T seed, F update) {
  return iterate_cursor<T, F>(std::move(seed), std::move(update));
}

template<typename T>
struct count_cursor : impl::cursor_impl<count_cursor<T>> {
  using value_type = T;

  T current_;
  T step_;
  bool started_ = false;

  constexpr count_cursor(T start, T step) : current_(start), step_(step) {}

  constexpr std::optional<value_type> next() {
    if (started_) advance();
    started_ = true;
    return current_;
  }

 private:
  // Integral counts stop with std::overflow_error instead of wrapping.
  constexpr void advance() {
    if constexpr (std::is_integral_v<T>) {
      constexpr T max = std::numeric_limits<T>::max();
      constexpr T min = std::numeric_limits<T>::min();
      bool overflows = step_ > T(0) && current_ > max - step_;
      if constexpr (std::is_signed_v<T>) {
        overflows = overflows || (step_ < T(0) && current_ < min - step_);
      }
      if (overflows) {
        throw std::overflow_error("seql::count: next value after "
                                      + std::to_string(current_)
                                      + " is out of range of the element type");
      }
    }
    current_ += step_;
  }
};

template<typename T = int, typename U = T>
requires std::is_arithmetic_v<T> && std::is_arithmetic_v<U>
[[nodiscard]] constexpr auto count(T start = T(0), U step = U(1)) {
  using value_type = std::common_type_t<T, U>;
  return count_cursor<value_type>(static_cast<value_type>(start),
                                  static_cast<value_type>(step));
}

template<cursor... Cs>
requires(sizeof...(Cs) > 0)
struct chain_cursor : impl::cursor_impl<chain_cursor<Cs...>> {
  using value_type = std::common_type_t<cursor_value_t<Cs>...>;

  std::tuple<Cs...> sources_;
  std::size_t active_ = 0;

  constexpr explicit chain_cursor(Cs... sources)
      : sources_(std::move(sources)...) {}

  constexpr std::optional<value_type> next() {
    while (active_ < sizeof...(Cs)) {
      if (auto v = pull_active(std::index_sequence_for<Cs...>{})) return v;
      ++active_;
    }
    return std::nullopt;
  }

 private:
  template<std::size_t I>
  constexpr std::optional<value_type> pull_from() {
    auto v = std::get<I>(sources_).next();
    if (!v) return std::nullopt;
    return std::optional<value_type>(std::in_place, std::move(*v));
  }

  template<std::size_t... Is>
  constexpr std::optional<value_type> pull_active(std::index_sequence<Is...>) {
    std::optional<value_type> result;
    ((Is == active_ ? (result = pull_from<Is>(), true) : false) || ...);
    return result;
  }
};

template<sequence... Ss>
requires(sizeof...(Ss) > 0)
[[nodiscard]] constexpr auto chain(Ss &&... ss) {
  return chain_cursor<cursor_t<Ss>...>(make_cursor(std::forward<Ss>(ss))...);
}

// A sequence of T that is finished from the start.
template<typename T>
struct empty_cursor : impl::cursor_impl<empty_cursor<T>> {
  using value_type = T;

  constexpr std::optional<value_type> next() { return std::nullopt; }
};

// Chaining no sources yields nothing. The element type must be named.
template<typename T>
[[nodiscard]] constexpr auto chain() {
  return empty_cursor<T>{};
}

template<cursor C>
struct enumerate_cursor : impl::cursor_impl<enumerate_cursor<C>> {
  using value_type = std::pair<std::size_t, cursor_value_t<C>>;

  C source_;
  std::size_t index_;

  constexpr enumerate_cursor(C source, std::size_t start)
      : source_(std::move(source)), index_(start) {}

  constexpr std::optional<value_type> next() {
    auto v = source_.next();
    if (!v) return std::nullopt;
    return std::optional<value_type>(std::in_place, index_++, std::move(*v));
  }
};

template<sequence S>
[[nodiscard]] constexpr auto enumerate(S &&s, std::size_t start = 0) {
  return enumerate_cursor<cursor_t<S>>(make_cursor(std::forward<S>(s)), start);
}

// ============================================================================
// Buffered adapters
// ============================================================================

enum class window_state : std::uint8_t {
  filling,
  sliding,
  done
};

// Sliding window over a fixed size circular buffer. Every window is returned
// as its own vector, ordered oldest to newest.
template<cursor C>
struct window_cursor : impl::cursor_impl<window_cursor<C>> {
  using element_type = cursor_value_t<C>;
  using value_type = std::vector<element_type>;

  C source_;
  std::size_t size_;
  std::vector<element_type> buffer_;
  std::size_t front_ = 0;
  window_state state_ = window_state::filling;

  constexpr window_cursor(C source, std::size_t size)
      : source_(std::move(source)), size_(size) {}

  constexpr std::optional<value_type> next() {
    switch (state_) {
      case window_state::filling: return fill();
      case window_state::sliding: return slide();
      case window_state::done: break;
    }
    return std::nullopt;
  }

 private:
  constexpr std::optional<value_type> fill() {
    while (buffer_.size() < size_) {
      auto v = source_.next();
      if (!v) {
        state_ = window_state::done;
        buffer_.clear();
        return std::nullopt;
      }
      buffer_.push_back(std::move(*v));
    }
    state_ = window_state::sliding;
    return buffer_;
  }

  constexpr std::optional<value_type> slide() {
    auto v = source_.next();
    if (!v) {
      state_ = window_state::done;
      return std::nullopt;
    }
    buffer_[front_] = std::move(*v);
    front_ = (front_ + 1) % size_;

    auto split = buffer_.begin() + static_cast<std::ptrdiff_t>(front_);
    value_type snapshot;
    snapshot.reserve(size_);
    snapshot.insert(snapshot.end(), split, buffer_.end());
    snapshot.insert(snapshot.end(), buffer_.begin(), split);
    return snapshot;
  }
};

template<sequence S>
[[nodiscard]] constexpr auto window(S &&s, std::ptrdiff_t size) {
  auto n = detail::checked_size("seql::window", size);
  return window_cursor<cursor_t<S>>(make_cursor(std::forward<S>(s)), n);
}

// What chunk does with an incomplete trailing group.
enum class chunk_strategy : std::uint8_t {
  drop_end,
  keep_end,
  strict,
  pad_end
};

constexpr std::string_view to_string(chunk_strategy strategy) {
  switch (strategy) {
    case chunk_strategy::drop_end: return "drop_end";
    case chunk_strategy::keep_end: return "keep_end";
    case chunk_strategy::strict: return "strict";
    case chunk_strategy::pad_end: return "pad_end";
  }
  return "unknown";
}

constexpr chunk_strategy parse_chunk_strategy(std::string_view name) {
  for (auto strategy : {chunk_strategy::drop_end, chunk_strategy::keep_end,
                        chunk_strategy::strict, chunk_strategy::pad_end}) {
    if (to_string(strategy) == name) return strategy;
  }
  throw std::invalid_argument("seql::chunk: unrecognized strategy \""
                                  + std::string(name) + "\"");
}

struct no_fill {};

template<typename Fill = no_fill>
struct chunk_options {
  chunk_strategy strategy = chunk_strategy::drop_end;
  Fill fill_value{};
};

template<typename Fill>
chunk_options(chunk_strategy, Fill) -> chunk_options<Fill>;

template<cursor C, typename Fill>
struct chunk_cursor : impl::cursor_impl<chunk_cursor<C, Fill>> {
  using element_type = cursor_value_t<C>;
  using value_type = std::vector<element_type>;

  C source_;
  std::size_t size_;
  chunk_strategy strategy_;
  [[no_unique_address]] Fill fill_value_;
  bool done_ = false;

  constexpr chunk_cursor(C source, std::size_t size, chunk_options<Fill> options)
      : source_(std::move(source)),
        size_(size),
        strategy_(options.strategy),
        fill_value_(std::move(options.fill_value)) {
    switch (strategy_) {
      case chunk_strategy::drop_end:
      case chunk_strategy::keep_end:
      case chunk_strategy::strict: break;
      case chunk_strategy::pad_end:
        if constexpr (std::is_same_v<Fill, no_fill>) {
          throw std::invalid_argument(
              "seql::chunk: pad_end requires a fill value");
        }
        break;
      default:
        throw std::invalid_argument(
            "seql::chunk: unrecognized strategy "
                + std::to_string(static_cast<int>(strategy_)));
    }
  }

  constexpr std::optional<value_type> next() {
    if (done_) return std::nullopt;
    value_type group;
    while (group.size() < size_) {
      auto v = source_.next();
      if (!v) {
        done_ = true;
        return finish(std::move(group));
      }
      group.push_back(std::move(*v));
    }
    return group;
  }

 private:
  constexpr std::optional<value_type> finish(value_type group) {
    if (group.empty()) return std::nullopt;
    switch (strategy_) {
      case chunk_strategy::drop_end: return std::nullopt;
      case chunk_strategy::keep_end: return group;
      case chunk_strategy::strict:
        throw length_mismatch_error(
            "seql::chunk: trailing chunk has " + std::to_string(group.size())
                + " of " + std::to_string(size_) + " elements");
      case chunk_strategy::pad_end:
        if constexpr (!std::is_same_v<Fill, no_fill>) {
          group.insert(group.end(), size_ - group.size(),
                       static_cast<element_type>(fill_value_));
          return group;
        }
        break;
    }
    return std::nullopt;
  }
};

template<sequence S, typename Fill>
[[nodiscard]] constexpr auto chunk(S &&s, std::ptrdiff_t size,
                                   chunk_options<Fill> options) {
  auto n = detail::checked_size("seql::chunk", size);
  return chunk_cursor<cursor_t<S>, Fill>(make_cursor(std::forward<S>(s)), n,
                                         std::move(options));
}

template<sequence S>
[[nodiscard]] constexpr auto chunk(S &&s, std::ptrdiff_t size,
                                   chunk_strategy strategy = chunk_strategy::drop_end) {
  return chunk(std::forward<S>(s), size, chunk_options<>{strategy});
}

// ============================================================================
// Stateful comparison adapters
// ============================================================================

// Collapses runs of adjacent equal elements to their first element. Only the
// last produced element is kept.
template<cursor C, typename Eq>
struct dedup_cursor : impl::cursor_impl<dedup_cursor<C, Eq>> {
  using value_type = cursor_value_t<C>;

  C source_;
  [[no_unique_address]] Eq eq_;
  std::optional<value_type> last_;
  bool done_ = false;

  constexpr dedup_cursor(C source, Eq eq)
      : source_(std::move(source)), eq_(std::move(eq)) {}

  constexpr std::optional<value_type> next() {
    if (done_) return std::nullopt;
    if (!last_) {
      last_ = source_.next();
      done_ = !last_;
      return last_;
    }
    while (auto v = source_.next()) {
      if (!std::invoke(eq_, std::as_const(*v), std::as_const(*last_))) {
        last_ = *v;
        return v;
      }
    }
    done_ = true;
    return std::nullopt;
  }
};

template<sequence S, typename Eq = detail::equals_fn>
[[nodiscard]] constexpr auto dedup(S &&s, Eq eq = {}) {
  return dedup_cursor<cursor_t<S>, Eq>(make_cursor(std::forward<S>(s)),
                                       std::move(eq));
}

// Running fold. Without an initial value the first element is produced as-is
// and seeds the accumulator, and the fold index starts at 1. With an initial
// value the index starts at 0 and the initial value itself is not produced.
template<cursor C, typename F, typename Acc>
struct scan_cursor : impl::cursor_impl<scan_cursor<C, F, Acc>> {
  using value_type = Acc;

  C source_;
  [[no_unique_address]] F fold_;
  std::optional<Acc> acc_;
  std::size_t index_;
  bool done_ = false;

  constexpr scan_cursor(C source, F fold)
      : source_(std::move(source)), fold_(std::move(fold)), index_(1) {}

  constexpr scan_cursor(C source, F fold, Acc initial)
      : source_(std::move(source)),
        fold_(std::move(fold)),
        acc_(std::move(initial)),
        index_(0) {}

  constexpr std::optional<value_type> next() {
    if (done_) return std::nullopt;
    if (!acc_) {
      auto first = source_.next();
      if (!first) {
        done_ = true;
        return std::nullopt;
      }
      acc_.emplace(std::move(*first));
      return acc_;
    }
    auto v = source_.next();
    if (!v) {
      done_ = true;
      return std::nullopt;
    }
    *acc_ = detail::invoke_indexed(fold_, index_++, std::as_const(*acc_),
                                   std::move(*v));
    return acc_;
  }
};

template<sequence S, typename F>
[[nodiscard]] constexpr auto scan(S &&s, F fold) {
  using C = cursor_t<S>;
  return scan_cursor<C, F, cursor_value_t<C>>(make_cursor(std::forward<S>(s)),
                                              std::move(fold));
}

template<sequence S, typename F, typename T>
[[nodiscard]] constexpr auto scan(S &&s, F fold, T initial) {
  return scan_cursor<cursor_t<S>, F, T>(make_cursor(std::forward<S>(s)),
                                        std::move(fold), std::move(initial));
}

} // namespace seql

#endif //SEQL_STAGES_H_
