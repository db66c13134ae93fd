#pragma once

#include <cmath>
#include <cstddef>
#include <iterator>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

#include "linreg/line.hpp"
#include "linreg/mean.hpp"

namespace linreg {

// Reads the x and y component of a paired sample.
// Works for anything std::get<0>/std::get<1> accept (std::pair, std::tuple,
// std::array<T, 2>); specialise for other point types.
template <typename P>
struct PairAccess {
  static decltype(auto) x(const P& p) { return std::get<0>(p); }
  static decltype(auto) y(const P& p) { return std::get<1>(p); }
};

// Accumulates SUM (x - mean(x))^2 and SUM (x - mean(x)) (y - mean(y))
// around means computed beforehand.
template <typename F>
class DeviationSums
{
public:
  DeviationSums(F xMean, F yMean)
    : m_xMean(xMean), m_yMean(yMean)
  {
    static_assert(std::is_floating_point_v<F>, "working type must be floating point");
  }

  void add(F x, F y)
  {
    m_xxm2  = m_xxm2  + (x - m_xMean) * (x - m_xMean);
    m_xmym2 = m_xmym2 + (x - m_xMean) * (y - m_yMean);
  }

  // The slope is checked after dividing: zero x variance gives NaN (0/0),
  // a line too steep to represent gives inf. Both have no fit.
  std::optional<Line<F>> line() const
  {
    const F slope = m_xmym2 / m_xxm2;
    if (!std::isfinite(slope))
      return std::nullopt;

    const F intercept = m_yMean - slope * m_xMean;
    return Line<F>{slope, intercept};
  }

  F x_mean() const { return m_xMean; }
  F y_mean() const { return m_yMean; }
  F xxm2() const   { return m_xxm2; }
  F xmym2() const  { return m_xmym2; }

private:
  F m_xMean;
  F m_yMean;
  F m_xxm2  = F(0);
  F m_xmym2 = F(0);
};

// Regression over [first, last) with known means. proj maps an element to
// a std::pair<F, F>. The means imply a non-empty sequence; an empty one
// gives nullopt through the slope check anyway.
template <typename F, typename InputIt, typename Proj>
std::optional<Line<F>> lin_reg(InputIt first, InputIt last,
                               F xMean, F yMean, Proj proj)
{
  DeviationSums<F> sums(xMean, yMean);
  for (; first != last; ++first) {
    const std::pair<F, F> xy = proj(*first);
    sums.add(xy.first, xy.second);
  }
  return sums.line();
}

// Regression over already converted (x, y) pairs with known means.
template <typename F, typename InputIt>
std::optional<Line<F>> lin_reg(InputIt first, InputIt last, F xMean, F yMean)
{
  using Value  = typename std::iterator_traits<InputIt>::value_type;
  using Access = PairAccess<Value>;

  return lin_reg<F>(first, last, xMean, yMean, [](const Value& p) {
    return std::pair<F, F>(Access::x(p), Access::y(p));
  });
}

// Linear regression from two parallel sequences, x values and y values.
// Both are walked twice, so forward iterators are required.
//
// Returns nullopt if
//   - the sequences differ in length,
//   - either is empty,
//   - the element count cannot be represented as F,
//   - the slope is not finite (constant x, single point, too steep).
template <typename F = double, typename XIt, typename YIt>
std::optional<Line<F>> linear_regression(XIt xFirst, XIt xLast,
                                         YIt yFirst, YIt yLast)
{
  using X = typename std::iterator_traits<XIt>::value_type;
  using Y = typename std::iterator_traits<YIt>::value_type;
  static_assert(std::is_convertible_v<X, F>, "x values must convert to the working type");
  static_assert(std::is_convertible_v<Y, F>, "y values must convert to the working type");

  if (std::distance(xFirst, xLast) != std::distance(yFirst, yLast))
    return std::nullopt;

  // an empty axis fails here
  const std::optional<F> xMean = mean<F>(xFirst, xLast);
  if (!xMean)
    return std::nullopt;
  const std::optional<F> yMean = mean<F>(yFirst, yLast);
  if (!yMean)
    return std::nullopt;

  DeviationSums<F> sums(*xMean, *yMean);
  for (; xFirst != xLast; ++xFirst, ++yFirst)
    sums.add(static_cast<F>(*xFirst), static_cast<F>(*yFirst));
  return sums.line();
}

template <typename F = double, typename XRange, typename YRange>
std::optional<Line<F>> linear_regression(const XRange& xs, const YRange& ys)
{
  using std::begin;
  using std::end;
  return linear_regression<F>(begin(xs), end(xs), begin(ys), end(ys));
}

// Linear regression from a sequence of (x, y) pairs.
//
// Returns nullopt if
//   - the sequence is empty,
//   - the element count cannot be represented as F,
//   - the slope is not finite (constant x, single point, too steep).
//
// Both means come from one pass over the pairs; running mean() on each
// component separately would walk the data twice.
template <typename F = double, typename ForwardIt>
std::optional<Line<F>> linear_regression_of(ForwardIt first, ForwardIt last)
{
  using Value  = typename std::iterator_traits<ForwardIt>::value_type;
  using Access = PairAccess<Value>;
  static_assert(std::is_floating_point_v<F>, "working type must be floating point");

  if (first == last)
    return std::nullopt;

  const std::optional<F> n =
      count_as<F>(static_cast<std::size_t>(std::distance(first, last)));
  if (!n)
    return std::nullopt;

  F xSum = F(0);
  F ySum = F(0);
  for (ForwardIt it = first; it != last; ++it) {
    xSum = xSum + static_cast<F>(Access::x(*it));
    ySum = ySum + static_cast<F>(Access::y(*it));
  }
  const F xMean = xSum / *n;
  const F yMean = ySum / *n;

  return lin_reg<F>(first, last, xMean, yMean, [](const Value& p) {
    return std::pair<F, F>(static_cast<F>(Access::x(p)),
                           static_cast<F>(Access::y(p)));
  });
}

template <typename F = double, typename PairRange>
std::optional<Line<F>> linear_regression_of(const PairRange& xys)
{
  using std::begin;
  using std::end;
  return linear_regression_of<F>(begin(xys), end(xys));
}

} // namespace linreg
