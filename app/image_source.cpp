/*---------------------------------------------------------*/
/*                                                         */
/*   image_source.cpp - Shared decode/resize helpers       */
/*                                                         */
/*---------------------------------------------------------*/

#include "image_source.h"
#include "halfblock_errors.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

RasterFormat detectRasterFormat(const std::string& bytes)
{
    auto startsWith = [&](const char* magic, size_t len) {
        return bytes.size() >= len && bytes.compare(0, len, magic, len) == 0;
    };

    if (startsWith("GIF87a", 6) || startsWith("GIF89a", 6))
        return RasterFormat::Gif;
    if (startsWith("\x89PNG\r\n\x1a\n", 8))
        return RasterFormat::Png;
    if (startsWith("\xff\xd8\xff", 3))
        return RasterFormat::Jpeg;
    return RasterFormat::Unknown;
}

const char* rasterFormatName(RasterFormat fmt)
{
    switch (fmt) {
        case RasterFormat::Gif:  return "gif";
        case RasterFormat::Png:  return "png";
        case RasterFormat::Jpeg: return "jpeg";
        case RasterFormat::Unknown: break;
    }
    return "unknown";
}

std::string readImageFile(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw DecodeFailure("Unable to open image \"" + path + "\".");

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
        throw DecodeFailure("Unable to read image \"" + path + "\".");
    return ss.str();
}

int resizedHeight(int srcW, int srcH, int width)
{
    if (width <= 0)
        throw ResizeFailure("Unable to resize given image: width must be positive (got " +
                            std::to_string(width) + ").");
    if (srcW <= 0 || srcH <= 0)
        throw ResizeFailure("Unable to resize given image: source is empty.");

    double aspectRatio = (double) srcW / srcH;
    int height = (int) std::lround(width / aspectRatio);
    return std::max(1, height);
}

RgbaImage boxResize(const RgbaImage& src, int width, int height)
{
    if (width <= 0 || height <= 0 || src.w <= 0 || src.h <= 0)
        throw ResizeFailure("Unable to resize given image.");

    RgbaImage dst;
    dst.w = width;
    dst.h = height;
    dst.pixels.assign((size_t) width * height * 4, 0);

    const double sx = (double) src.w / width;
    const double sy = (double) src.h / height;

    for (int dy = 0; dy < height; ++dy) {
        double y0 = dy * sy, y1 = (dy + 1) * sy;
        int iy0 = std::max(0, (int) std::floor(y0));
        int iy1 = std::min(src.h, (int) std::ceil(y1));

        for (int dx = 0; dx < width; ++dx) {
            double x0 = dx * sx, x1 = (dx + 1) * sx;
            int ix0 = std::max(0, (int) std::floor(x0));
            int ix1 = std::min(src.w, (int) std::ceil(x1));

            double sum[4] = { 0, 0, 0, 0 };
            double total = 0;
            for (int y = iy0; y < iy1; ++y) {
                double wy = std::min(y1, (double) y + 1) - std::max(y0, (double) y);
                if (wy <= 0) continue;
                const uint8_t* row = &src.pixels[(size_t) y * src.w * 4];
                for (int x = ix0; x < ix1; ++x) {
                    double wx = std::min(x1, (double) x + 1) - std::max(x0, (double) x);
                    if (wx <= 0) continue;
                    double wgt = wx * wy;
                    const uint8_t* p = &row[x * 4];
                    for (int c = 0; c < 4; ++c)
                        sum[c] += p[c] * wgt;
                    total += wgt;
                }
            }

            uint8_t* out = &dst.pixels[((size_t) dy * width + dx) * 4];
            for (int c = 0; c < 4; ++c) {
                double v = total > 0 ? sum[c] / total : 0;
                out[c] = (uint8_t) std::min(255L, std::max(0L, std::lround(v)));
            }
        }
    }
    return dst;
}
