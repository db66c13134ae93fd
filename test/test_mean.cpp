#include <cstdint>
#include <limits>
#include <list>
#include <sstream>
#include <iterator>
#include <utility>
#include <vector>

#include "linreg/mean.hpp"
#include "check.hpp"

using namespace linreg;

static void mean_of_integers()
{
  const std::vector<int> values = {5, 8, 12, 17};
  const std::optional<double> m = mean(values);
  LINREG_CHECK(m.has_value());
  LINREG_CHECK(m && *m == 10.5);

  const std::optional<float> mf = mean<float>(values);
  LINREG_CHECK(mf && *mf == 10.5f);
}

static void mean_of_empty()
{
  const std::vector<double> empty;
  LINREG_CHECK(!mean(empty).has_value());
  LINREG_CHECK(!mean<float>(empty.begin(), empty.end()).has_value());
}

static void mean_of_bytes()
{
  const std::vector<std::uint8_t> values = {250, 251, 252, 253};
  // summed in double, so no 8-bit wraparound
  const std::optional<double> m = mean(values);
  LINREG_CHECK(m && *m == 251.5);
}

static void mean_with_projection()
{
  const std::vector<std::pair<int, double>> xys = {{1, 0.5}, {2, 1.5}, {6, 4.0}};
  const auto mx = mean<double>(xys.begin(), xys.end(),
                               [](const std::pair<int, double>& p) { return p.first; });
  const auto my = mean<double>(xys.begin(), xys.end(),
                               [](const std::pair<int, double>& p) { return p.second; });
  LINREG_CHECK(mx && *mx == 3.0);
  LINREG_CHECK(my && *my == 2.0);
}

static void mean_single_pass_input()
{
  // istream iterators can only be walked once
  std::istringstream in("1 2 3 4");
  const auto m = mean<double>(std::istream_iterator<int>(in), std::istream_iterator<int>());
  LINREG_CHECK(m && *m == 2.5);

  const std::list<float> values = {1.0f, 2.0f};
  const auto ml = mean(values);
  LINREG_CHECK(ml && *ml == 1.5);
}

static void count_representability()
{
  LINREG_CHECK(count_as<float>(0) == 0.0f);
  LINREG_CHECK(count_as<float>(16777216u) == 16777216.0f);
  // 2^24 + 1 is the first integer float cannot hold
  LINREG_CHECK(!count_as<float>(16777217u).has_value());
  LINREG_CHECK(count_as<double>(16777217u) == 16777217.0);
  LINREG_CHECK(!count_as<double>(std::numeric_limits<std::size_t>::max()).has_value());

  // float(2^64 - 1) rounds up to 2^64, which no size_t equals
  LINREG_CHECK(!count_as<float>(std::numeric_limits<std::size_t>::max()).has_value());

  // a mantissa as wide as size_t holds every count exactly
  if constexpr (std::numeric_limits<long double>::digits >=
                std::numeric_limits<std::size_t>::digits) {
    const std::size_t most = std::numeric_limits<std::size_t>::max();
    const std::optional<long double> c = count_as<long double>(most);
    LINREG_CHECK(c.has_value());
    LINREG_CHECK(c && static_cast<std::size_t>(*c) == most);
  }
}

int main()
{
  mean_of_integers();
  mean_of_empty();
  mean_of_bytes();
  mean_with_projection();
  mean_single_pass_input();
  count_representability();
  return linreg::test::finish("test_mean");
}
