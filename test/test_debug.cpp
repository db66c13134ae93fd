// Built with LINREG_DEBUG so the diagnostic branch is compiled.
#include <optional>
#include <utility>
#include <vector>

#include "linreg/debug.hpp"
#include "linreg/regression.hpp"
#include "check.hpp"

using namespace linreg;

int main()
{
  const std::optional<Line<double>> fit = Line<double>{0.6, 2.2};
  debug_report_fit("test_debug(fit)", 5, fit);
  debug_report_fit("test_debug(none)", 1, std::nullopt);

  const std::optional<Line<double>> none = linear_regression_of(std::vector<std::pair<int, int>>{{1, 1}});
  LINREG_CHECK(!none.has_value());
  debug_report_fit("test_debug(single point)", 1, none);

  return linreg::test::finish("test_debug");
}
