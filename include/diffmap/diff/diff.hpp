#pragma once

#include "diffmap/config/configuration.hpp"
#include "diffmap/core/events.hpp"
#include "diffmap/core/types.hpp"
#include "diffmap/diff/classifier.hpp"
#include "diffmap/diff/flag_map.hpp"
#include "diffmap/render/render_graph.hpp"

#include <opencv2/core.hpp>
#include <vector>

namespace diffmap::diff {

struct PixelPercent {
    double compared = 0.0;
    double diff = 0.0;
    double group = 0.0;
    double diff_compared = 0.0;  // 0 when nothing was compared
};

struct DiffTimings {
    double classify_ms = 0.0;
    double group_ms = 0.0;
    double render_ms = 0.0;
    double total_ms = 0.0;
};

struct DiffResult {
    DiffStatus status = DiffStatus::IDENTICAL;
    PixelCounts counts;
    PixelPercent percent;
    std::vector<Box> regions;
    FlagMap flags;
    bool rendered = false;
    render::RasterMap outputs;
    DiffTimings timings;
};

DiffStatus determine_status(const PixelCounts& counts, double mismatch_min_percent);

/**
 * Compare two or more RGB/RGBA images of identical size.
 * The first image is the original and the second the changed image; any
 * further images take part in classification only.
 * The config is validated first (ValidationError).
 * Outputs named in cfg.output.names are rendered only when the resulting
 * status is listed in cfg.output.render_when_status.
 * Events are emitted only when `events` is non-null.
 */
DiffResult diff(const std::vector<cv::Mat>& images, const config::Config& cfg,
                const render::ProgramCatalog& catalog,
                core::EventEmitter* events = nullptr);

DiffResult diff(const std::vector<cv::Mat>& images, const config::Config& cfg,
                core::EventEmitter* events = nullptr);

} // namespace diffmap::diff
