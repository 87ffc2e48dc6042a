#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace diffmap {

namespace fs = std::filesystem;

// Float planes (row-major, indexed (y, x))
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// 8-bit RGBA colour; also used for RGB pixels with a = 255
struct Rgba {
    int r = 0;
    int g = 0;
    int b = 0;
    int a = 255;

    bool operator==(const Rgba& o) const {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
    bool operator!=(const Rgba& o) const { return !(*this == o); }
};

// NTSC luminance/chrominance pixel
struct Yiq {
    double y = 0.0;
    double i = 0.0;
    double q = 0.0;
};

// Whole image in YIQ, one plane per component
struct YiqImage {
    Matrix2Df Y;
    Matrix2Df I;
    Matrix2Df Q;

    int width() const { return static_cast<int>(Y.cols()); }
    int height() const { return static_cast<int>(Y.rows()); }

    Yiq at(int x, int y) const {
        return {Y(y, x), I(y, x), Q(y, x)};
    }
};

// Box with absolute, inclusive coordinates
struct Box {
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;

    bool operator==(const Box& o) const {
        return left == o.left && top == o.top && right == o.right && bottom == o.bottom;
    }
};

// Box with origin and size
struct RelBox {
    int left = 0;
    int top = 0;
    int width = 0;
    int height = 0;
};

struct Point {
    int x = 0;
    int y = 0;
};

// Cross-image agreement of a pixel
enum class Similarity {
    IDENTICAL,
    SIMILAR,
    CHANGED
};

inline std::string similarity_to_string(Similarity s) {
    switch (s) {
        case Similarity::IDENTICAL: return "identical";
        case Similarity::SIMILAR: return "similar";
        case Similarity::CHANGED: return "changed";
        default: return "unknown";
    }
}

// Estimated visual importance of a pixel
enum class Significance {
    BACKGROUND,
    FOREGROUND,
    ANTIALIAS
};

inline std::string significance_to_string(Significance s) {
    switch (s) {
        case Significance::BACKGROUND: return "background";
        case Significance::FOREGROUND: return "foreground";
        case Significance::ANTIALIAS: return "antialias";
        default: return "unknown";
    }
}

// Diff region membership; ordered so that a later mark only ever rises
enum class GroupMark {
    NONE = 0,
    FILL = 1,
    BORDER = 2
};

// Overall result of a comparison
enum class DiffStatus {
    IDENTICAL,
    SIMILAR,
    DIFFERENT,
    MISMATCH
};

inline std::string diff_status_to_string(DiffStatus status) {
    switch (status) {
        case DiffStatus::IDENTICAL: return "identical";
        case DiffStatus::SIMILAR: return "similar";
        case DiffStatus::DIFFERENT: return "different";
        case DiffStatus::MISMATCH: return "mismatch";
        default: return "unknown";
    }
}

inline std::optional<DiffStatus> string_to_diff_status(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (norm == "identical") return DiffStatus::IDENTICAL;
    if (norm == "similar") return DiffStatus::SIMILAR;
    if (norm == "different") return DiffStatus::DIFFERENT;
    if (norm == "mismatch") return DiffStatus::MISMATCH;
    return std::nullopt;
}

inline std::vector<DiffStatus> all_diff_statuses() {
    return {DiffStatus::IDENTICAL, DiffStatus::SIMILAR,
            DiffStatus::DIFFERENT, DiffStatus::MISMATCH};
}

// Diff phase enumeration
enum class Phase {
    VALIDATE = 0,
    CONVERT = 1,
    CLASSIFY = 2,
    GROUP = 3,
    RENDER = 4,
    DONE = 5
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::VALIDATE: return "VALIDATE";
        case Phase::CONVERT: return "CONVERT";
        case Phase::CLASSIFY: return "CLASSIFY";
        case Phase::GROUP: return "GROUP";
        case Phase::RENDER: return "RENDER";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace diffmap
