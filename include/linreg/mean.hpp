#pragma once

#include <cmath>
#include <cstddef>
#include <iterator>
#include <limits>
#include <optional>
#include <type_traits>

namespace linreg {

// Element count as F, or nullopt if F cannot hold it exactly
// (e.g. more than 2^24 samples for float, unless the count happens
// to be representable).
template <typename F>
std::optional<F> count_as(std::size_t n)
{
  static_assert(std::is_floating_point_v<F>, "working type must be floating point");

  const F f = static_cast<F>(n);
  // Anything at or past 2^64 would not survive the cast back. float(n) may
  // round up to exactly 2^64.
  const F limit = std::ldexp(F(1), std::numeric_limits<std::size_t>::digits);
  if (!(f < limit))
    return std::nullopt;
  if (static_cast<std::size_t>(f) != n)
    return std::nullopt;
  return f;
}

// Arithmetic mean of proj(*it) over [first, last).
// Single pass, plain left-to-right summation in F.
// nullopt for an empty sequence.
template <typename F = double, typename InputIt, typename Proj>
std::optional<F> mean(InputIt first, InputIt last, Proj proj)
{
  static_assert(std::is_floating_point_v<F>, "working type must be floating point");

  F sum = F(0);
  std::size_t n = 0;
  for (; first != last; ++first) {
    sum = sum + static_cast<F>(proj(*first));
    ++n;
  }

  if (n == 0)
    return std::nullopt;

  const std::optional<F> count = count_as<F>(n);
  if (!count)
    return std::nullopt;
  return sum / *count;
}

template <typename F = double, typename InputIt>
std::optional<F> mean(InputIt first, InputIt last)
{
  using Value = typename std::iterator_traits<InputIt>::value_type;
  static_assert(std::is_convertible_v<Value, F>, "elements must convert to the working type");

  return mean<F>(first, last, [](const Value& v) { return v; });
}

template <typename F = double, typename Range>
std::optional<F> mean(const Range& values)
{
  using std::begin;
  using std::end;
  return mean<F>(begin(values), end(values));
}

} // namespace linreg
