/*---------------------------------------------------------*/
/*                                                         */
/*   image_source.h - Shared decode/resize helpers         */
/*                                                         */
/*   Every engine satisfies the same pixel contract:       */
/*     int width() const;                                  */
/*     int height() const;                                 */
/*     std::string colorAt(int x, int y) const;  // "#..." */
/*   and the same resize contract: target width, height =  */
/*   round(width / aspect) (at least 1), box filter.       */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef IMAGE_SOURCE_H
#define IMAGE_SOURCE_H

#include <cstdint>
#include <string>
#include <vector>

struct RgbaImage {
    int w = 0, h = 0;
    std::vector<uint8_t> pixels; // RGBA, row-major
};

enum class RasterFormat { Unknown, Gif, Png, Jpeg };

// Sniffs the magic bytes; only GIF, PNG and JPEG are accepted.
RasterFormat detectRasterFormat(const std::string& bytes);
const char* rasterFormatName(RasterFormat fmt);

// Throws DecodeFailure if the file cannot be opened or read.
std::string readImageFile(const std::string& path);

// Throws ResizeFailure for a non-positive target width or empty source.
int resizedHeight(int srcW, int srcH, int width);

// Area-weighted average (box filter) of the source pixels covering each
// destination pixel. Channels are averaged independently.
RgbaImage boxResize(const RgbaImage& src, int width, int height);

#endif // IMAGE_SOURCE_H
