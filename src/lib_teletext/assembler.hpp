#pragma once

#include "page.hpp"
#include "station.hpp"
#include <cstdint>
#include <vector>

namespace Teletext {

// Coalesces the rows and stamps the page identity. 'subPage' 0 means 1.
// Throws IncompletePage (no rows, or fewer than cfg.rowCount) and
// MalformedPayload (page number out of 100-899, width differing from cfg.rowWidth).
Page assemble(const StationConfig &cfg, int page, int subPage, std::vector<Row> rows, int64_t timestamp);

}
