/*---------------------------------------------------------*/
/*                                                         */
/*   stb_image_source.cpp - stb_image engine ("stb")       */
/*                                                         */
/*---------------------------------------------------------*/

#include "stb_image_source.h"
#include "color_math.h"
#include "halfblock_errors.h"

#include <stdexcept>
#include <string>

// stb_image loader
#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_THREAD_LOCALS
#define STBI_NO_STDIO
#define STBI_ONLY_PNG
#define STBI_ONLY_JPEG
#define STBI_ONLY_GIF
extern "C" {
#include "stb_image.h"
}

RgbaImage StbImageSource::decode(const std::string& bytes)
{
    RasterFormat fmt = detectRasterFormat(bytes);
    if (fmt == RasterFormat::Unknown)
        throw DecodeFailure("Unsupported image type (GIF, PNG or JPEG expected).");

    RgbaImage img;
    int w, h, n;
    stbi_uc* data = stbi_load_from_memory(reinterpret_cast<const stbi_uc*>(bytes.data()),
                                          (int) bytes.size(), &w, &h, &n, 4);
    if (!data) {
        const char* reason = stbi_failure_reason();
        std::string msg = std::string("Unable to load ") + rasterFormatName(fmt) + " image";
        if (reason) { msg += " ("; msg += reason; msg += ")"; }
        throw DecodeFailure(msg + ".");
    }
    img.w = w;
    img.h = h;
    img.pixels.assign(data, data + (size_t) w * h * 4);
    stbi_image_free(data);
    return img;
}

StbImageSource::StbImageSource(const std::string& bytes, int width)
{
    RgbaImage decoded = decode(bytes);
    srcW = decoded.w;
    srcH = decoded.h;
    image = boxResize(decoded, width, resizedHeight(decoded.w, decoded.h, width));
}

std::string StbImageSource::colorAt(int x, int y) const
{
    if (x < 0 || y < 0 || x >= image.w || y >= image.h)
        throw std::out_of_range("Unable to get pixel from image.");
    const uint8_t* p = &image.pixels[((size_t) y * image.w + x) * 4];
    return ColorMath::rgbaToEngineHex(p[0], p[1], p[2], p[3]);
}
