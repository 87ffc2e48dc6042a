#include "diffmap/diff/diff.hpp"
#include "diffmap/color/yiq.hpp"
#include "diffmap/core/errors.hpp"
#include "diffmap/core/utils.hpp"
#include "diffmap/diff/grouper.hpp"
#include "diffmap/image/raster.hpp"
#include "diffmap/render/programs.hpp"

#include <chrono>
#include <string>

namespace diffmap::diff {

namespace {

using Clock = std::chrono::steady_clock;

void validate_inputs(const std::vector<cv::Mat>& images) {
    if (images.size() < 2) {
        throw InvalidInputError("diff requires at least 2 images, got " +
                                std::to_string(images.size()));
    }
    const int w = images.front().cols;
    const int h = images.front().rows;
    for (size_t i = 0; i < images.size(); ++i) {
        image::require_bitmap(images[i], "diff input " + std::to_string(i));
        if (images[i].cols != w || images[i].rows != h) {
            throw InvalidInputError("diff requires all images to have the same dimensions, got " +
                                    std::to_string(w) + "x" + std::to_string(h) + " and " +
                                    std::to_string(images[i].cols) + "x" +
                                    std::to_string(images[i].rows));
        }
    }
    if (w < 1 || h < 1) {
        throw InvalidInputError("diff requires non-empty images");
    }
}

double percent_of(long part, long whole) {
    return whole > 0 ? 100.0 * static_cast<double>(part) / static_cast<double>(whole) : 0.0;
}

} // namespace

DiffStatus determine_status(const PixelCounts& counts, double mismatch_min_percent) {
    if (counts.diff > 0) {
        return percent_of(counts.diff, counts.all) >= mismatch_min_percent
                   ? DiffStatus::MISMATCH
                   : DiffStatus::DIFFERENT;
    }
    return counts.similar.all > 0 ? DiffStatus::SIMILAR : DiffStatus::IDENTICAL;
}

DiffResult diff(const std::vector<cv::Mat>& images, const config::Config& cfg,
                const render::ProgramCatalog& catalog, core::EventEmitter* events) {
    const auto t_start = Clock::now();
    DiffResult result;

    try {
        if (events) events->phase_start(Phase::VALIDATE);
        cfg.validate();
        validate_inputs(images);
        if (events) {
            events->phase_end(Phase::VALIDATE, "ok",
                              {{"images", images.size()},
                               {"width", images.front().cols},
                               {"height", images.front().rows}});
        }

        if (events) events->phase_start(Phase::CONVERT);
        std::vector<YiqImage> yiq;
        yiq.reserve(images.size());
        for (const auto& img : images) {
            yiq.push_back(color::to_yiq(img));
        }
        if (events) events->phase_end(Phase::CONVERT, "ok");

        if (events) events->phase_start(Phase::CLASSIFY);
        auto t_phase = Clock::now();
        result.flags = FlagMap(images.front().cols, images.front().rows);
        result.counts = classify(yiq, result.flags, cfg.classify_options());
        result.timings.classify_ms = core::elapsed_ms(t_phase);
        if (events) {
            events->phase_end(Phase::CLASSIFY, "ok",
                              {{"compared", result.counts.compared},
                               {"diff", result.counts.diff}});
        }

        if (events) events->phase_start(Phase::GROUP);
        t_phase = Clock::now();
        GroupResult grouped = group(result.flags, cfg.group_options());
        result.regions = std::move(grouped.regions);
        result.counts.group = grouped.group_pixels;
        result.timings.group_ms = core::elapsed_ms(t_phase);
        if (events) {
            events->phase_end(Phase::GROUP, "ok",
                              {{"regions", result.regions.size()},
                               {"group_pixels", result.counts.group}});
        }

        const long all = result.counts.all;
        result.percent.compared = percent_of(result.counts.compared, all);
        result.percent.diff = percent_of(result.counts.diff, all);
        result.percent.group = percent_of(result.counts.group, all);
        result.percent.diff_compared = percent_of(result.counts.diff, result.counts.compared);

        result.status = determine_status(result.counts, cfg.status.mismatch_min_percent);

        if (events) events->phase_start(Phase::RENDER);
        t_phase = Clock::now();
        if (cfg.should_render(result.status) && !cfg.output.names.empty()) {
            render::RasterMap seeds;
            seeds[render::kSeedFlags] = result.flags.encode();
            seeds[render::kSeedOriginal] = images.front();
            seeds[render::kSeedChanged] = images[1];

            if (events) {
                for (const auto& name : render::unknown_programs(cfg.output.names, seeds, catalog)) {
                    events->warning("requested output '" + name + "' has no render program");
                }
            }

            result.outputs = render::render_outputs(cfg.output.names, std::move(seeds), catalog,
                                                    cfg.output.options);
            result.rendered = true;
            result.timings.render_ms = core::elapsed_ms(t_phase);
            if (events) events->phase_end(Phase::RENDER, "ok", {{"outputs", result.outputs.size()}});
        } else {
            if (events) {
                if (!cfg.output.names.empty()) {
                    events->warning("render skipped for status " +
                                    diff_status_to_string(result.status));
                }
                events->phase_end(Phase::RENDER, "skipped");
            }
        }
    } catch (const std::exception& e) {
        if (events) events->error(e.what());
        throw;
    }

    result.timings.total_ms = core::elapsed_ms(t_start);
    if (events) {
        events->phase_start(Phase::DONE);
        events->phase_end(Phase::DONE, diff_status_to_string(result.status),
                          {{"total_ms", result.timings.total_ms}});
    }
    return result;
}

DiffResult diff(const std::vector<cv::Mat>& images, const config::Config& cfg,
                core::EventEmitter* events) {
    return diff(images, cfg, render::default_catalog(), events);
}

} // namespace diffmap::diff
