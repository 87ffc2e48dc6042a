#pragma once

#include "diffmap/core/types.hpp"
#include "diffmap/diff/flag_map.hpp"

#include <vector>

namespace diffmap::diff {

struct ClassifyOptions {
    double changed_min_distance = 40.0;
    double antialias_min_distance = 12.0;
    double antialias_max_distance = 150.0;
    double background_max_contrast = 25.0;
    bool include_foreground = true;
    bool include_background = false;
    bool include_antialias = false;

    bool includes(Significance s) const;
};

// Pixel counts for one significance breakdown
struct SignificanceCounts {
    long all = 0;
    long foreground = 0;
    long background = 0;
    long antialias = 0;

    void add(Significance s);
    long of(Significance s) const;
};

struct PixelCounts {
    long all = 0;
    long compared = 0;
    long diff = 0;
    long group = 0;
    SignificanceCounts significance;  // .all mirrors `all`
    SignificanceCounts identical;
    SignificanceCounts similar;
    SignificanceCounts changed;

    const SignificanceCounts& similarity(Similarity s) const;
};

// Significance of a single pixel within one image, from its diagonal
// neighbours. Exposed for diagnostics and tests.
struct NeighborStats {
    double max_distance = 0.0;
    double max_contrast = 0.0;
    int identical_count = 0;
};

NeighborStats neighbor_stats(const YiqImage& image, int x, int y);
Significance significance_of(const NeighborStats& stats, const ClassifyOptions& opt);

// Fill similarity, significance and `different` for every pixel of `flags`.
// `distance_map` / `contrast_map`, when given, receive the neighbour maxima of
// the last image evaluated for each pixel; they are resized as needed.
// Throws InvalidInputError on fewer than 2 images or any size mismatch.
PixelCounts classify(const std::vector<YiqImage>& images, FlagMap& flags,
                     const ClassifyOptions& options,
                     Matrix2Df* distance_map = nullptr,
                     Matrix2Df* contrast_map = nullptr);

} // namespace diffmap::diff
