#pragma once

#include "linreg/line.hpp"
#include "linreg/mean.hpp"
#include "linreg/regression.hpp"
#include "linreg/cv_adapters.hpp"
