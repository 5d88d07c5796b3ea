/*---------------------------------------------------------*/
/*                                                         */
/*   color_math.h - RGB / hex / sRGB / XYZ / Lab           */
/*                                                         */
/*   Stateless conversions. "Array" inputs are channel     */
/*   maps keyed by channel letter ("r","g","b") so that    */
/*   a missing or mistyped channel can be reported.        */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef COLOR_MATH_H
#define COLOR_MATH_H

#include <cstdint>
#include <map>
#include <string>
#include <variant>

struct Rgb  { int r = 0, g = 0, b = 0; };
struct Srgb { double r = 0, g = 0, b = 0; };
struct Xyz  { double x = 0, y = 0, z = 0; };
struct Lab  { double L = 0, a = 0, b = 0; };

// Channel value is either an integer (RGB) or a floating value (sRGB).
using ChannelValue = std::variant<int, double>;
using ChannelMap = std::map<std::string, ChannelValue>;

class ColorMath {
public:
    static constexpr int PRECISION_NONE = -1;

    /*-- single channel --*/
    static std::string rgbToHex(int value, bool lowercase = false);
    static double rgbToSrgb(int value, int precision = PRECISION_NONE);
    static double xyzToLab(double value, int precision = PRECISION_NONE);

    /*-- whole color --*/
    static int rgbsToInt(int red, int green, int blue);
    static std::string rgbsToHex(int red, int green, int blue,
                                 bool prependHash = true, bool lowercase = false);

    // 0x0000FF -> "#0000FF". Values wider than 24 bits keep their extra digits.
    static std::string intToHex(long long color, bool prependHash = true, bool lowercase = false);
    static Rgb intToRgbArray(long long color);
    static Lab intToLabArray(long long color, int precision = PRECISION_NONE);

    // Leading '#' is stripped and other non-hex characters are skipped.
    // Throws InvalidInput with no hex digits or a value past long long.
    static long long hexToInt(const std::string& hex);
    static Rgb hexToRgbArray(const std::string& hex);

    static int rgbArrayToInt(const ChannelMap& rgb);
    static std::string rgbArrayToHex(const ChannelMap& rgb,
                                     bool prependHash = true, bool lowercase = false);
    static Srgb rgbArrayToSrgbArray(const ChannelMap& rgb, int precision = PRECISION_NONE);
    static Xyz srgbArrayToXyzArray(const ChannelMap& srgb, int precision = PRECISION_NONE);
    static Lab xyzArrayToLabArray(const Xyz& xyz, int precision = PRECISION_NONE);

    static ChannelMap toChannelMap(const Rgb& rgb);
    static ChannelMap toChannelMap(const Srgb& srgb);

    /*-- engine pixel decoders --*/

    // stb engine: packs the pixel like a GD truecolor value (7-bit alpha,
    // 127 = fully transparent, in bits 24..30) and formats it with intToHex.
    // Opaque pixels therefore give "#RRGGBB", translucent ones "#AARRGGBB".
    static std::string rgbaToEngineHex(uint8_t r, uint8_t g, uint8_t b, uint8_t a);

    // OpenCV engine: "#rrggbb" from a BGR(A) pixel. Alpha is ignored.
    static std::string bgraToHex(uint8_t b, uint8_t g, uint8_t r, bool prependHash = true);

    static double roundTo(double value, int precision);

private:
    static void checkRgb(const ChannelMap& rgb);
    static void checkSrgb(const ChannelMap& srgb);
};

#endif // COLOR_MATH_H
