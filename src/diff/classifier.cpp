#include "diffmap/diff/classifier.hpp"
#include "diffmap/color/yiq.hpp"
#include "diffmap/core/errors.hpp"
#include "diffmap/image/raster.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>

namespace diffmap::diff {

bool ClassifyOptions::includes(Significance s) const {
    switch (s) {
        case Significance::FOREGROUND: return include_foreground;
        case Significance::BACKGROUND: return include_background;
        case Significance::ANTIALIAS: return include_antialias;
        default: return false;
    }
}

void SignificanceCounts::add(Significance s) {
    ++all;
    switch (s) {
        case Significance::FOREGROUND: ++foreground; break;
        case Significance::BACKGROUND: ++background; break;
        case Significance::ANTIALIAS: ++antialias; break;
    }
}

long SignificanceCounts::of(Significance s) const {
    switch (s) {
        case Significance::FOREGROUND: return foreground;
        case Significance::BACKGROUND: return background;
        case Significance::ANTIALIAS: return antialias;
        default: return 0;
    }
}

const SignificanceCounts& PixelCounts::similarity(Similarity s) const {
    switch (s) {
        case Similarity::SIMILAR: return similar;
        case Similarity::CHANGED: return changed;
        default: return identical;
    }
}

NeighborStats neighbor_stats(const YiqImage& image, int x, int y) {
    NeighborStats stats;
    const Yiq center = image.at(x, y);
    image::for_each_diagonal_neighbor(x, y, image.width(), image.height(), [&](int nx, int ny) {
        const Yiq adjacent = image.at(nx, ny);
        const double distance = color::abs_color_distance(center, adjacent);
        if (distance == 0.0) {
            ++stats.identical_count;
        } else {
            stats.max_distance = std::max(stats.max_distance, distance);
            stats.max_contrast = std::max(stats.max_contrast,
                                          std::fabs(color::contrast(center, adjacent)));
        }
        return false;
    });
    return stats;
}

Significance significance_of(const NeighborStats& s, const ClassifyOptions& opt) {
    const bool distance_in_band = s.max_distance >= opt.antialias_min_distance &&
                                  s.max_distance <= opt.antialias_max_distance;
    const bool contrast_in_band = s.max_contrast >= opt.antialias_min_distance &&
                                  s.max_contrast <= opt.antialias_max_distance;
    if (s.identical_count < 3 && distance_in_band && contrast_in_band) {
        return Significance::ANTIALIAS;
    }
    if (s.max_contrast <= opt.background_max_contrast) {
        return Significance::BACKGROUND;
    }
    return Significance::FOREGROUND;
}

PixelCounts classify(const std::vector<YiqImage>& images, FlagMap& flags,
                     const ClassifyOptions& options, Matrix2Df* distance_map,
                     Matrix2Df* contrast_map) {
    if (images.size() < 2) {
        throw InvalidInputError("classify requires at least 2 images, got " +
                                std::to_string(images.size()));
    }
    const int w = images.front().width();
    const int h = images.front().height();
    for (const auto& img : images) {
        if (img.width() != w || img.height() != h) {
            throw InvalidInputError("classify requires equal image sizes, got " +
                                    std::to_string(w) + "x" + std::to_string(h) + " and " +
                                    std::to_string(img.width()) + "x" +
                                    std::to_string(img.height()));
        }
    }
    if (flags.width() != w || flags.height() != h) {
        throw InvalidInputError("flag map is " + std::to_string(flags.width()) + "x" +
                                std::to_string(flags.height()) + ", images are " +
                                std::to_string(w) + "x" + std::to_string(h));
    }
    if (distance_map) distance_map->setZero(h, w);
    if (contrast_map) contrast_map->setZero(h, w);

    PixelCounts counts;
    counts.all = static_cast<long>(w) * static_cast<long>(h);

    image::for_each_pixel(w, h, [&](int x, int y) {
        // Similarity: largest pairwise distance across all images
        double max_distance = 0.0;
        for (size_t i = 0; i + 1 < images.size(); ++i) {
            const Yiq a = images[i].at(x, y);
            for (size_t j = i + 1; j < images.size(); ++j) {
                max_distance = std::max(max_distance,
                                        color::abs_color_distance(a, images[j].at(x, y)));
            }
        }

        // Significance: all images must agree, anything else is foreground
        std::optional<Significance> significance;
        for (const auto& img : images) {
            const NeighborStats stats = neighbor_stats(img, x, y);
            if (distance_map) (*distance_map)(y, x) = static_cast<float>(stats.max_distance);
            if (contrast_map) (*contrast_map)(y, x) = static_cast<float>(stats.max_contrast);

            const Significance s = significance_of(stats, options);
            if (s == Significance::FOREGROUND || (significance && *significance != s)) {
                significance = Significance::FOREGROUND;
                break;
            }
            if (!significance) {
                significance = s;
            }
        }

        Similarity similarity;
        if (max_distance == 0.0) {
            similarity = Similarity::IDENTICAL;
        } else if (max_distance < options.changed_min_distance) {
            similarity = Similarity::SIMILAR;
        } else {
            similarity = Similarity::CHANGED;
        }

        const Significance sig = significance.value_or(Significance::FOREGROUND);
        const bool compared = options.includes(sig);
        const bool different = compared && similarity == Similarity::CHANGED;

        PixelFlags& f = flags.at(x, y);
        f.similarity = similarity;
        f.significance = sig;
        f.different = f.different || different;

        counts.significance.add(sig);
        switch (similarity) {
            case Similarity::IDENTICAL: counts.identical.add(sig); break;
            case Similarity::SIMILAR: counts.similar.add(sig); break;
            case Similarity::CHANGED: counts.changed.add(sig); break;
        }
        if (compared) ++counts.compared;
        if (different) ++counts.diff;
        return false;
    });

    return counts;
}

} // namespace diffmap::diff
