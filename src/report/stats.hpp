#pragma once

#include <vector>

#include "cdm/report/summary.hpp"

namespace cdm::detail {

Stats calc_stats(std::vector<double> values);

}  // namespace cdm::detail
