#ifndef SEQL_CORE_H_
#define SEQL_CORE_H_

#include <concepts>
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace seql {

// Thrown when sequences that are required to line up end at different points.
class length_mismatch_error : public std::length_error {
 public:
  using std::length_error::length_error;
};

// A cursor is the pull side of a sequence. next() produces the next element,
// or std::nullopt once the sequence is finished. A finished cursor keeps
// returning std::nullopt.
template<typename C>
concept cursor = requires(std::remove_cvref_t<C> &c) {
  typename std::remove_cvref_t<C>::value_type;
  { c.next() } -> std::same_as<std::optional<typename std::remove_cvref_t<C>::value_type>>;
};

template<cursor C>
using cursor_value_t = typename std::remove_cvref_t<C>::value_type;

namespace impl {

// Single pass input iterator over a cursor. Each increment pulls once.
template<typename Cursor>
class cursor_iterator {
 public:
  using value_type = typename Cursor::value_type;
  using difference_type = std::ptrdiff_t;

  constexpr cursor_iterator() = default;

  constexpr explicit cursor_iterator(Cursor &c)
      : cursor_(std::addressof(c)), current_(c.next()) {}

  constexpr value_type &operator*() const { return *current_; }

  constexpr cursor_iterator &operator++() {
    current_ = cursor_->next();
    return *this;
  }

  constexpr void operator++(int) { ++*this; }

  constexpr bool operator==(std::default_sentinel_t) const {
    return !current_.has_value();
  }

 private:
  Cursor *cursor_ = nullptr;
  mutable std::optional<value_type> current_;
};

// CRTP base shared by every cursor in the library. Lets a cursor drive a
// range-based for loop.
template<typename Child>
struct cursor_impl {
  constexpr auto begin() {
    return cursor_iterator<Child>(static_cast<Child &>(*this));
  }

  constexpr std::default_sentinel_t end() const { return {}; }
};

} // namespace impl

// Cursor over an iterator pair. The underlying range is not owned.
template<std::input_iterator I, std::sentinel_for<I> S>
struct range_cursor : impl::cursor_impl<range_cursor<I, S>> {
  using value_type = std::iter_value_t<I>;

  I current_;
  [[no_unique_address]] S last_;

  constexpr range_cursor(I first, S last)
      : current_(std::move(first)), last_(std::move(last)) {}

  constexpr std::optional<value_type> next() {
    if (current_ == last_) return std::nullopt;
    std::optional<value_type> result(std::in_place, *current_);
    ++current_;
    return result;
  }
};

// Cursor that owns an rvalue range. The range is held on the heap so the
// cursor can be moved without invalidating its iterators. Elements are moved
// out as they are produced.
template<std::ranges::input_range R>
class owning_range_cursor : public impl::cursor_impl<owning_range_cursor<R>> {
 public:
  using value_type = std::ranges::range_value_t<R>;

  constexpr explicit owning_range_cursor(R &&range)
      : range_(std::make_unique<R>(std::move(range))),
        current_(std::ranges::begin(*range_)),
        last_(std::ranges::end(*range_)) {}

  constexpr std::optional<value_type> next() {
    if (current_ == last_) return std::nullopt;
    std::optional<value_type> result(std::in_place,
                                     std::ranges::iter_move(current_));
    ++current_;
    return result;
  }

 private:
  std::unique_ptr<R> range_;
  std::ranges::iterator_t<R> current_;
  std::ranges::sentinel_t<R> last_;
};

// Non-owning view of a cursor the caller keeps. Pulling through the reference
// advances the caller's cursor.
template<cursor C>
struct cursor_ref : impl::cursor_impl<cursor_ref<C>> {
  using value_type = cursor_value_t<C>;

  C *target_;

  constexpr explicit cursor_ref(C &c) : target_(std::addressof(c)) {}

  constexpr std::optional<value_type> next() { return target_->next(); }
};

// Adapts a callable returning std::optional<T> into a cursor. The callable is
// not invoked again after it first returns std::nullopt.
template<typename F>
struct generator : impl::cursor_impl<generator<F>> {
  using value_type = typename std::invoke_result_t<F &>::value_type;

  [[no_unique_address]] F f;
  bool done_ = false;

  constexpr explicit generator(F f) : f(std::move(f)) {}

  constexpr std::optional<value_type> next() {
    if (done_) return std::nullopt;
    std::optional<value_type> result = std::invoke(f);
    done_ = !result.has_value();
    return result;
  }
};

template<typename F>
generator(F) -> generator<F>;

namespace detail {

// ADL customization point: a type can provide
//   auto SeqlMakeCursor(T&&)
// in its own namespace to control how it is traversed.
void SeqlMakeCursor() = delete;

template<typename S>
concept has_adl_make_cursor = requires(S &&s) {
  { SeqlMakeCursor(std::forward<S>(s)) } -> cursor;
};

template<typename S>
concept cursor_source = has_adl_make_cursor<S>
    || (cursor<S> && !std::is_const_v<std::remove_reference_t<S>>)
    || (!cursor<S> && std::ranges::input_range<std::remove_cvref_t<S>>);

struct make_cursor_fn {
  template<typename S>
  requires cursor_source<S>
  [[nodiscard]] constexpr auto operator()(S &&s) const {
    if constexpr (has_adl_make_cursor<S>) {
      return SeqlMakeCursor(std::forward<S>(s));
    } else if constexpr (cursor<S>) {
      if constexpr (std::is_lvalue_reference_v<S>) {
        return cursor_ref<std::remove_reference_t<S>>(s);
      } else {
        return std::remove_cvref_t<S>(std::move(s));
      }
    } else if constexpr (std::is_lvalue_reference_v<S>) {
      return range_cursor(std::ranges::begin(s), std::ranges::end(s));
    } else {
      return owning_range_cursor<std::remove_cvref_t<S>>(std::move(s));
    }
  }
};

// Calls f(args..., index) when f accepts the index, f(args...) otherwise.
template<typename F, typename... Args>
constexpr decltype(auto) invoke_indexed(F &f, std::size_t index, Args &&... args) {
  if constexpr (std::is_invocable_v<F &, Args..., std::size_t>) {
    return std::invoke(f, std::forward<Args>(args)..., index);
  } else {
    return std::invoke(f, std::forward<Args>(args)...);
  }
}

template<typename F, typename... Args>
using indexed_result_t = decltype(invoke_indexed(std::declval<F &>(),
                                                 std::size_t{},
                                                 std::declval<Args>()...));

template<typename L, typename R>
concept weakly_equality_comparable = requires(const L &l, const R &r) {
  { l == r } -> std::convertible_to<bool>;
};

template<typename L, typename R>
concept has_equals_member = requires(const L &l, const R &r) {
  { l.equals(r) } -> std::convertible_to<bool>;
};

struct equals_fn {
  template<typename L, typename R>
  requires weakly_equality_comparable<L, R> || has_equals_member<L, R>
  constexpr bool operator()(const L &left, const R &right) const {
    if constexpr (weakly_equality_comparable<L, R>) {
      if (left == right) return true;
      if constexpr (has_equals_member<L, R>) {
        return static_cast<bool>(left.equals(right));
      } else {
        return false;
      }
    } else {
      return static_cast<bool>(left.equals(right));
    }
  }
};

} // namespace detail

// Obtains a pull cursor from a sequence:
//  - lvalue range: iterates it in place
//  - rvalue range: takes ownership
//  - rvalue cursor: moved in
//  - lvalue cursor: referenced, so the caller can keep pulling afterwards
inline constexpr detail::make_cursor_fn make_cursor{};

// Compares with == and falls back to a member equals() for types that
// provide one.
inline constexpr detail::equals_fn equals{};

template<typename S>
concept sequence = requires(S &&s) {
  { make_cursor(std::forward<S>(s)) } -> cursor;
};

template<sequence S>
using cursor_t = decltype(make_cursor(std::declval<S>()));

template<sequence S>
using sequence_value_t = cursor_value_t<cursor_t<S>>;

template<sequence S>
[[nodiscard]] constexpr auto to_vector(S &&s) {
  auto c = make_cursor(std::forward<S>(s));
  std::vector<cursor_value_t<decltype(c)>> result;
  while (auto v = c.next()) {
    result.push_back(std::move(*v));
  }
  return result;
}

template<sequence S, typename F>
constexpr void for_each(S &&s, F f) {
  auto c = make_cursor(std::forward<S>(s));
  std::size_t index = 0;
  while (auto v = c.next()) {
    detail::invoke_indexed(f, index++, std::move(*v));
  }
}

} // namespace seql

#endif //SEQL_CORE_H_
