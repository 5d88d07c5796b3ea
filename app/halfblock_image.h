/*---------------------------------------------------------*/
/*                                                         */
/*   halfblock_image.h - Image -> terminal text facade     */
/*                                                         */
/*   Owns one decoded+resized image (stb or OpenCV         */
/*   engine) and the marker overlay, and renders them      */
/*   through HalfBlockRenderer.                            */
/*                                                         */
/*   Usage:                                                */
/*     RenderOptions opts; opts.width = 80;                */
/*     auto img = HalfBlockImage::fromFile("map.png", opts);*/
/*     img.addMarkerSpherical("#ff0000", 40.71, -74.01);   */
/*     std::cout << img.toString() << "\n";                */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef HALFBLOCK_IMAGE_H
#define HALFBLOCK_IMAGE_H

#include "color_math.h"
#include "half_block_renderer.h"
#include "map_point.h"
#include "opencv_image_source.h"
#include "stb_image_source.h"

#include <string>
#include <variant>
#include <vector>

extern const char* const ENGINE_STB;      // "stb"
extern const char* const ENGINE_OPENCV;   // "opencv"

struct RenderOptions {
    int width = 80;
    std::string engine = ENGINE_STB;
    std::string transparentColor = HalfBlockRenderer::DEFAULT_TRANSPARENT_COLOR;
    int precision = ColorMath::PRECISION_NONE;  // for labAt()
    bool verbose = false;                       // decode/resize/marker logs on stderr
};

using ImageEngine = std::variant<StbImageSource, OpenCvImageSource>;

class HalfBlockImage {
public:
    // Throws UnsupportedEngine, DecodeFailure, ResizeFailure.
    static HalfBlockImage fromFile(const std::string& path, const RenderOptions& options = RenderOptions());
    static HalfBlockImage fromBytes(const std::string& bytes, const RenderOptions& options = RenderOptions());

    std::vector<std::string> lines() const;
    std::string toString() const;

    // Dimensions of the resized image.
    int width() const;
    int height() const;

    std::string colorAt(int x, int y) const;
    Lab labAt(int x, int y) const;

    HalfBlockImage& addMarker(const std::string& color, const Point& point);
    // Projected with the resized width/height.
    HalfBlockImage& addMarkerSpherical(const std::string& color, double latitude, double longitude,
                                       const std::string& projection = PROJECTION_KAVRAYSKIY_VII);
    HalfBlockImage& setMarkers(const MarkerOverlay& overlay);
    const MarkerOverlay& markers() const { return overlay; }

    const RenderOptions& options() const { return opts; }

private:
    HalfBlockImage(ImageEngine source, const RenderOptions& options);

    static ImageEngine createEngine(const std::string& bytes, const RenderOptions& options);

    ImageEngine engine;
    RenderOptions opts;
    HalfBlockRenderer renderer;
    MarkerOverlay overlay;
};

#endif // HALFBLOCK_IMAGE_H
