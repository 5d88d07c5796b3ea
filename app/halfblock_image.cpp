/*---------------------------------------------------------*/
/*                                                         */
/*   halfblock_image.cpp - Image -> terminal text facade   */
/*                                                         */
/*---------------------------------------------------------*/

#include "halfblock_image.h"
#include "halfblock_errors.h"
#include "image_source.h"

#include <cstdio>
#include <utility>

const char* const ENGINE_STB = "stb";
const char* const ENGINE_OPENCV = "opencv";

ImageEngine HalfBlockImage::createEngine(const std::string& bytes, const RenderOptions& options)
{
    if (options.engine == ENGINE_STB)
        return ImageEngine(std::in_place_type<StbImageSource>, bytes, options.width);
    if (options.engine == ENGINE_OPENCV)
        return ImageEngine(std::in_place_type<OpenCvImageSource>, bytes, options.width);

    throw UnsupportedEngine("Unsupported engine type \"" + options.engine + "\".");
}

HalfBlockImage::HalfBlockImage(ImageEngine source, const RenderOptions& options)
    : engine(std::move(source)),
      opts(options),
      renderer(options.transparentColor)
{
}

HalfBlockImage HalfBlockImage::fromBytes(const std::string& bytes, const RenderOptions& options)
{
    if (options.verbose)
        fprintf(stderr, "[halfblock] decode %zu bytes (%s) with engine '%s'\n",
                bytes.size(), rasterFormatName(detectRasterFormat(bytes)), options.engine.c_str());

    HalfBlockImage image(createEngine(bytes, options), options);

    if (options.verbose) {
        std::visit([](const auto& src) {
            fprintf(stderr, "[halfblock] resized %dx%d -> %dx%d\n",
                    src.sourceWidth(), src.sourceHeight(), src.width(), src.height());
        }, image.engine);
    }
    return image;
}

HalfBlockImage HalfBlockImage::fromFile(const std::string& path, const RenderOptions& options)
{
    if (options.verbose)
        fprintf(stderr, "[halfblock] reading %s\n", path.c_str());
    return fromBytes(readImageFile(path), options);
}

std::vector<std::string> HalfBlockImage::lines() const
{
    return std::visit([this](const auto& src) { return renderer.render(src, overlay); }, engine);
}

std::string HalfBlockImage::toString() const
{
    return HalfBlockRenderer::join(lines());
}

int HalfBlockImage::width() const
{
    return std::visit([](const auto& src) { return src.width(); }, engine);
}

int HalfBlockImage::height() const
{
    return std::visit([](const auto& src) { return src.height(); }, engine);
}

std::string HalfBlockImage::colorAt(int x, int y) const
{
    return std::visit([x, y](const auto& src) { return src.colorAt(x, y); }, engine);
}

Lab HalfBlockImage::labAt(int x, int y) const
{
    // Drop the alpha prefix the stb engine may carry.
    long long color = ColorMath::hexToInt(colorAt(x, y)) & 0xFFFFFF;
    return ColorMath::intToLabArray(color, opts.precision);
}

HalfBlockImage& HalfBlockImage::addMarker(const std::string& color, const Point& point)
{
    if (opts.verbose)
        fprintf(stderr, "[halfblock] marker %s at (%g, %g)\n", color.c_str(), point.getX(), point.getY());
    overlay.add(color, point);
    return *this;
}

HalfBlockImage& HalfBlockImage::addMarkerSpherical(const std::string& color, double latitude, double longitude,
                                                   const std::string& projection)
{
    Point point = Point::make(latitude, longitude, COORDINATE_SYSTEM_SPHERICAL, projection, width(), height());
    if (opts.verbose)
        fprintf(stderr, "[halfblock] projected (%g, %g) via %s\n", latitude, longitude, projection.c_str());
    return addMarker(color, point);
}

HalfBlockImage& HalfBlockImage::setMarkers(const MarkerOverlay& markers)
{
    overlay = markers;
    return *this;
}
