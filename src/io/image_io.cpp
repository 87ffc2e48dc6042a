#include "diffmap/io/image_io.hpp"
#include "diffmap/core/errors.hpp"
#include "diffmap/core/utils.hpp"
#include "diffmap/image/raster.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace diffmap::io {

bool is_image_path(const fs::path& path) {
    const std::string ext = core::to_lower(path.extension().string());
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp" ||
           ext == ".tif" || ext == ".tiff" || ext == ".webp";
}

cv::Mat read_image(const fs::path& path) {
    if (!fs::exists(path)) {
        throw IOError("Image file not found: " + path.string());
    }
    cv::Mat raw = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    if (raw.empty()) {
        throw IOError("Cannot decode image: " + path.string());
    }

    if (raw.depth() == CV_16U) {
        raw.convertTo(raw, CV_8U, 1.0 / 257.0);
    } else if (raw.depth() != CV_8U) {
        throw IOError("Unsupported image depth in " + path.string());
    }

    cv::Mat out;
    switch (raw.channels()) {
        case 1: cv::cvtColor(raw, out, cv::COLOR_GRAY2RGB); break;
        case 3: cv::cvtColor(raw, out, cv::COLOR_BGR2RGB); break;
        case 4: cv::cvtColor(raw, out, cv::COLOR_BGRA2RGBA); break;
        default:
            throw IOError("Unsupported channel count " + std::to_string(raw.channels()) +
                          " in " + path.string());
    }
    return out;
}

void write_image(const fs::path& path, const cv::Mat& raster) {
    cv::Mat encoded;
    switch (image::raster_kind(raster)) {
        case image::RasterKind::VALUES: encoded = raster; break;
        case image::RasterKind::RGB: cv::cvtColor(raster, encoded, cv::COLOR_RGB2BGR); break;
        case image::RasterKind::RGBA: cv::cvtColor(raster, encoded, cv::COLOR_RGBA2BGRA); break;
        default:
            throw IOError("Cannot write raster of type " + std::to_string(raster.type()) +
                          " to " + path.string());
    }

    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw IOError("Cannot create directory " + path.parent_path().string() + ": " +
                          ec.message());
        }
    }
    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), encoded);
    } catch (const cv::Exception& e) {
        throw IOError("Cannot write image " + path.string() + ": " + e.what());
    }
    if (!ok) {
        throw IOError("Cannot write image: " + path.string());
    }
}

} // namespace diffmap::io
