/*---------------------------------------------------------*/
/*                                                         */
/*   color_math.cpp - RGB / hex / sRGB / XYZ / Lab         */
/*                                                         */
/*---------------------------------------------------------*/

#include "color_math.h"
#include "halfblock_errors.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <limits>
#include <string>

namespace {

// sRGB -> XYZ (D65), http://www.brucelindbloom.com/index.html?Eqn_RGB_XYZ_Matrix.html
const double MATRIX_SRGB_XYZ[3][3] = {
    { .4124564, .3575761, .1804375 },
    { .2126729, .7151522, .0721750 },
    { .0193339, .1191920, .9503041 },
};

// D65 reference white
const double WHITE_XN = .95047;
const double WHITE_YN = 1.0;
const double WHITE_ZN = 1.08883;

const double SRGB_LINEAR_LIMIT = .03928;

const double LAB_L_MIN = 0.,    LAB_L_MAX = 100.;
const double LAB_A_MIN = -128., LAB_A_MAX = 127.;
const double LAB_B_MIN = -128., LAB_B_MAX = 127.;

const char* const CHANNELS_RGB[] = { "r", "g", "b" };

inline double clampd(double v, double lo, double hi) { return std::min(std::max(v, lo), hi); }

} // namespace

double ColorMath::roundTo(double value, int precision)
{
    if (precision == PRECISION_NONE)
        return value;
    double scale = std::pow(10.0, precision);
    return std::round(value * scale) / scale;
}

std::string ColorMath::rgbToHex(int value, bool lowercase)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), lowercase ? "%02x" : "%02X", value);
    return buf;
}

double ColorMath::rgbToSrgb(int value, int precision)
{
    double v = value / 255.0;
    double srgb = v <= SRGB_LINEAR_LIMIT ? v / 12.92 : std::pow((v + .055) / 1.055, 2.4);
    return roundTo(srgb, precision);
}

double ColorMath::xyzToLab(double value, int precision)
{
    double lab = value > 216.0 / 24389.0 ? std::cbrt(value) : 841.0 * value / 108.0 + 4.0 / 29.0;
    return roundTo(lab, precision);
}

int ColorMath::rgbsToInt(int red, int green, int blue)
{
    return red * 256 * 256 + green * 256 + blue;
}

std::string ColorMath::rgbsToHex(int red, int green, int blue, bool prependHash, bool lowercase)
{
    return intToHex(rgbsToInt(red, green, blue), prependHash, lowercase);
}

std::string ColorMath::intToHex(long long color, bool prependHash, bool lowercase)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), lowercase ? "%06llx" : "%06llX", color);
    return prependHash ? std::string("#") + buf : std::string(buf);
}

Rgb ColorMath::intToRgbArray(long long color)
{
    Rgb rgb;
    rgb.r = (int) ((color >> 16) & 0xFF);
    rgb.g = (int) ((color >> 8) & 0xFF);
    rgb.b = (int) (color & 0xFF);
    return rgb;
}

Lab ColorMath::intToLabArray(long long color, int precision)
{
    Srgb srgb = rgbArrayToSrgbArray(toChannelMap(intToRgbArray(color)));
    return xyzArrayToLabArray(srgbArrayToXyzArray(toChannelMap(srgb)), precision);
}

long long ColorMath::hexToInt(const std::string& hex)
{
    size_t start = hex.find_first_not_of('#');
    if (start == std::string::npos)
        throw InvalidInput("Empty hex color \"" + hex + "\".");

    // Non-hex characters are skipped.
    const long long limit = std::numeric_limits<long long>::max();
    long long value = 0;
    size_t digits = 0;
    for (size_t i = start; i < hex.size(); ++i) {
        int c = std::tolower((unsigned char) hex[i]);
        int d;
        if (c >= '0' && c <= '9') d = c - '0';
        else if (c >= 'a' && c <= 'f') d = c - 'a' + 10;
        else continue;
        if (value > (limit - d) / 16)
            throw InvalidInput("Hex color \"" + hex + "\" is too large.");
        value = value * 16 + d;
        ++digits;
    }
    if (digits == 0)
        throw InvalidInput("Unparseable hex color \"" + hex + "\".");
    return value;
}

Rgb ColorMath::hexToRgbArray(const std::string& hex)
{
    return intToRgbArray(hexToInt(hex));
}

void ColorMath::checkRgb(const ChannelMap& rgb)
{
    for (const char* key : CHANNELS_RGB) {
        if (rgb.find(key) == rgb.end())
            throw InvalidInput(std::string("Missing color index \"") + key + "\".");
    }
    for (const char* key : CHANNELS_RGB) {
        if (!std::holds_alternative<int>(rgb.at(key)))
            throw InvalidInput(std::string("Unexpected value format given for color \"") + key +
                               "\". Integer expected.");
    }
}

void ColorMath::checkSrgb(const ChannelMap& srgb)
{
    for (const char* key : CHANNELS_RGB) {
        if (srgb.find(key) == srgb.end())
            throw InvalidInput(std::string("Missing color index \"") + key + "\".");
    }
    for (const char* key : CHANNELS_RGB) {
        if (!std::holds_alternative<double>(srgb.at(key)))
            throw InvalidInput(std::string("Unexpected value format given for color \"") + key +
                               "\". Float expected.");
    }
}

int ColorMath::rgbArrayToInt(const ChannelMap& rgb)
{
    checkRgb(rgb);
    return rgbsToInt(std::get<int>(rgb.at("r")), std::get<int>(rgb.at("g")), std::get<int>(rgb.at("b")));
}

std::string ColorMath::rgbArrayToHex(const ChannelMap& rgb, bool prependHash, bool lowercase)
{
    return intToHex(rgbArrayToInt(rgb), prependHash, lowercase);
}

Srgb ColorMath::rgbArrayToSrgbArray(const ChannelMap& rgb, int precision)
{
    checkRgb(rgb);
    Srgb srgb;
    srgb.r = rgbToSrgb(std::get<int>(rgb.at("r")), precision);
    srgb.g = rgbToSrgb(std::get<int>(rgb.at("g")), precision);
    srgb.b = rgbToSrgb(std::get<int>(rgb.at("b")), precision);
    return srgb;
}

Xyz ColorMath::srgbArrayToXyzArray(const ChannelMap& srgb, int precision)
{
    checkSrgb(srgb);
    const double v[3] = {
        std::get<double>(srgb.at("r")),
        std::get<double>(srgb.at("g")),
        std::get<double>(srgb.at("b")),
    };
    double out[3];
    for (int row = 0; row < 3; ++row) {
        out[row] = MATRIX_SRGB_XYZ[row][0] * v[0]
                 + MATRIX_SRGB_XYZ[row][1] * v[1]
                 + MATRIX_SRGB_XYZ[row][2] * v[2];
        out[row] = roundTo(out[row], precision);
    }
    Xyz xyz;
    xyz.x = out[0];
    xyz.y = out[1];
    xyz.z = out[2];
    return xyz;
}

Lab ColorMath::xyzArrayToLabArray(const Xyz& xyz, int precision)
{
    double fx = xyzToLab(xyz.x / WHITE_XN);
    double fy = xyzToLab(xyz.y / WHITE_YN);
    double fz = xyzToLab(xyz.z / WHITE_ZN);

    Lab lab;
    lab.L = clampd(116.0 * fy - 16.0, LAB_L_MIN, LAB_L_MAX);
    lab.a = clampd(500.0 * (fx - fy), LAB_A_MIN, LAB_A_MAX);
    lab.b = clampd(200.0 * (fy - fz), LAB_B_MIN, LAB_B_MAX);

    lab.L = roundTo(lab.L, precision);
    lab.a = roundTo(lab.a, precision);
    lab.b = roundTo(lab.b, precision);
    return lab;
}

ChannelMap ColorMath::toChannelMap(const Rgb& rgb)
{
    return ChannelMap{ { "r", rgb.r }, { "g", rgb.g }, { "b", rgb.b } };
}

ChannelMap ColorMath::toChannelMap(const Srgb& srgb)
{
    return ChannelMap{ { "r", srgb.r }, { "g", srgb.g }, { "b", srgb.b } };
}

std::string ColorMath::rgbaToEngineHex(uint8_t r, uint8_t g, uint8_t b, uint8_t a)
{
    long long alpha = 127 - (a >> 1);
    long long packed = (alpha << 24) | ((long long) r << 16) | ((long long) g << 8) | b;
    return intToHex(packed);
}

std::string ColorMath::bgraToHex(uint8_t b, uint8_t g, uint8_t r, bool prependHash)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), prependHash ? "#%02x%02x%02x" : "%02x%02x%02x", r, g, b);
    return buf;
}
