#include "diffmap/image/raster.hpp"
#include "diffmap/core/errors.hpp"

namespace diffmap::image {

RasterKind raster_kind(const cv::Mat& mat) {
    switch (mat.type()) {
        case CV_8UC1: return RasterKind::VALUES;
        case CV_8UC3: return RasterKind::RGB;
        case CV_8UC4: return RasterKind::RGBA;
        default: return RasterKind::UNSUPPORTED;
    }
}

std::string raster_kind_to_string(RasterKind kind) {
    switch (kind) {
        case RasterKind::VALUES: return "values";
        case RasterKind::RGB: return "rgb";
        case RasterKind::RGBA: return "rgba";
        default: return "unsupported";
    }
}

void require_bitmap(const cv::Mat& mat, const std::string& context) {
    RasterKind kind = raster_kind(mat);
    if (kind != RasterKind::RGB && kind != RasterKind::RGBA) {
        throw UnsupportedOperandError(context + " requires an RGB/RGBA raster, got " +
                                      raster_kind_to_string(kind));
    }
}

void require_values(const cv::Mat& mat, const std::string& context) {
    RasterKind kind = raster_kind(mat);
    if (kind != RasterKind::VALUES) {
        throw UnsupportedOperandError(context + " requires a value map, got " +
                                      raster_kind_to_string(kind));
    }
}

cv::Mat create_bitmap(int width, int height, bool with_alpha) {
    return cv::Mat::zeros(height, width, with_alpha ? CV_8UC4 : CV_8UC3);
}

cv::Mat create_values(int width, int height) {
    return cv::Mat::zeros(height, width, CV_8UC1);
}

Rgba pixel_at(const cv::Mat& mat, int x, int y) {
    switch (raster_kind(mat)) {
        case RasterKind::RGB: {
            const cv::Vec3b& p = mat.at<cv::Vec3b>(y, x);
            return {p[0], p[1], p[2], 255};
        }
        case RasterKind::RGBA: {
            const cv::Vec4b& p = mat.at<cv::Vec4b>(y, x);
            return {p[0], p[1], p[2], p[3]};
        }
        case RasterKind::VALUES: {
            int v = mat.at<uint8_t>(y, x);
            return {v, v, v, 255};
        }
        default:
            throw UnsupportedOperandError("pixel_at on raster of type " + std::to_string(mat.type()));
    }
}

void set_pixel(cv::Mat& mat, int x, int y, const Rgba& c) {
    switch (raster_kind(mat)) {
        case RasterKind::RGB:
            mat.at<cv::Vec3b>(y, x) = cv::Vec3b(cv::saturate_cast<uint8_t>(c.r),
                                                cv::saturate_cast<uint8_t>(c.g),
                                                cv::saturate_cast<uint8_t>(c.b));
            break;
        case RasterKind::RGBA:
            mat.at<cv::Vec4b>(y, x) = cv::Vec4b(cv::saturate_cast<uint8_t>(c.r),
                                                cv::saturate_cast<uint8_t>(c.g),
                                                cv::saturate_cast<uint8_t>(c.b),
                                                cv::saturate_cast<uint8_t>(c.a));
            break;
        default:
            throw UnsupportedOperandError("set_pixel requires an RGB/RGBA raster");
    }
}

} // namespace diffmap::image
