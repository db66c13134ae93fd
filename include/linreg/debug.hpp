#pragma once

#include <cstddef>
#include <cstdio>
#include <optional>

#include "linreg/line.hpp"

namespace linreg {

// Prints a fit result to stderr. Compiled in only with LINREG_DEBUG.
static inline void debug_report_fit(const char* name,
                                    std::size_t n,
                                    const std::optional<Line<double>>& fit)
{
#ifdef LINREG_DEBUG
  if (fit) {
    std::fprintf(stderr, "[DEBUG] %s: n=%zu slope=%f intercept=%f\n",
            name, n, fit->slope, fit->intercept);
  } else {
    std::fprintf(stderr, "[DEBUG] %s: n=%zu no fit\n", name, n);
  }
#else
  (void)name;
  (void)n;
  (void)fit;
#endif
}

} // namespace linreg
