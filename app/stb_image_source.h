/*---------------------------------------------------------*/
/*                                                         */
/*   stb_image_source.h - stb_image engine ("stb")         */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef STB_IMAGE_SOURCE_H
#define STB_IMAGE_SOURCE_H

#include "image_source.h"

#include <string>

class StbImageSource {
public:
    // Decodes GIF/PNG/JPEG bytes to RGBA, then box-resizes to `width`.
    // Throws DecodeFailure / ResizeFailure.
    StbImageSource(const std::string& bytes, int width);

    int width() const { return image.w; }
    int height() const { return image.h; }

    // Hex color of the resized pixel. Translucent pixels carry a 7-bit
    // alpha prefix ("#7F000000" for fully transparent black).
    std::string colorAt(int x, int y) const;

    int sourceWidth() const { return srcW; }
    int sourceHeight() const { return srcH; }

private:
    RgbaImage image;
    int srcW = 0, srcH = 0;

    static RgbaImage decode(const std::string& bytes);
};

#endif // STB_IMAGE_SOURCE_H
