#pragma once

namespace linreg {

// Fitted line y = slope * x + intercept.
template <typename F>
struct Line {
  F slope = F(0);
  F intercept = F(0);

  F at(F x) const { return slope * x + intercept; }
};

template <typename F>
bool operator==(const Line<F>& a, const Line<F>& b)
{
  return a.slope == b.slope && a.intercept == b.intercept;
}

template <typename F>
bool operator!=(const Line<F>& a, const Line<F>& b)
{
  return !(a == b);
}

} // namespace linreg
