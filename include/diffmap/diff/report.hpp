#pragma once

#include "diffmap/diff/diff.hpp"
#include <nlohmann/json.hpp>

namespace diffmap::diff {

nlohmann::json to_json(const Box& box);
nlohmann::json to_json(const PixelCounts& counts);

// Status, counts, percentages, regions, rendered output names and timings.
// Raster data is not included.
nlohmann::json to_json(const DiffResult& result);

} // namespace diffmap::diff
