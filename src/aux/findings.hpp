#pragma once

#include <cstddef>

#include <utility>
#include <vector>

#include "detect/match.hpp"

namespace walletmask::detail
{

using line_no_t     = size_t;
using LineFindings  = std::pair<line_no_t, MatchList>;
using LinesFindings = std::vector<LineFindings>;

} // namespace walletmask::detail
