/*---------------------------------------------------------*/
/*   color_math_test.cpp - ctest for color conversions     */
/*---------------------------------------------------------*/

#include "color_math.h"
#include "halfblock_errors.h"

#include <cmath>
#include <iostream>
#include <string>

static int failures = 0;

static void check(const char* name, bool cond) {
    if (cond) {
        std::cout << "  PASS: " << name << "\n";
    } else {
        std::cerr << "  FAIL: " << name << "\n";
        failures++;
    }
}

static bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

template <typename E, typename F>
static bool throws(F&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    } catch (...) {
        return false;
    }
    return false;
}

int main() {
    std::cout << "=== ColorMath Tests ===\n\n";

    std::cout << "[single channel]\n";
    {
        check("rgbToHex 255 -> FF", ColorMath::rgbToHex(255) == "FF");
        check("rgbToHex 10 -> 0A", ColorMath::rgbToHex(10) == "0A");
        check("rgbToHex lowercase", ColorMath::rgbToHex(171, true) == "ab");
        check("rgbToSrgb(0) == 0.0", ColorMath::rgbToSrgb(0) == 0.0);
        check("rgbToSrgb(255) == 1.0", ColorMath::rgbToSrgb(255) == 1.0);
        check("rgbToSrgb linear segment", near(ColorMath::rgbToSrgb(10), 10 / 255.0 / 12.92));
        check("rgbToSrgb gamma segment",
              near(ColorMath::rgbToSrgb(128), std::pow((128 / 255.0 + .055) / 1.055, 2.4)));
        check("rgbToSrgb precision 4", ColorMath::rgbToSrgb(128, 4) == 0.2159);
        check("xyzToLab cube root branch", near(ColorMath::xyzToLab(0.125), 0.5));
        check("xyzToLab linear branch", near(ColorMath::xyzToLab(0.0), 4.0 / 29.0));
        check("xyzToLab precision 2", ColorMath::xyzToLab(0.125, 2) == 0.5);
    }

    std::cout << "\n[whole color]\n";
    {
        check("rgbsToInt", ColorMath::rgbsToInt(128, 0, 128) == 128 * 65536 + 128);
        check("intToHex 0x0000FF", ColorMath::intToHex(0x0000FF) == "#0000FF");
        check("intToHex white", ColorMath::intToHex(0xFFFFFF) == "#FFFFFF");
        check("intToHex no hash lowercase", ColorMath::intToHex(0x800080, false, true) == "800080");
        check("intToHex keeps alpha digits", ColorMath::intToHex(0x7F000000LL) == "#7F000000");
        check("rgbsToHex", ColorMath::rgbsToHex(255, 0, 16) == "#FF0010");
        check("hexToInt with hash", ColorMath::hexToInt("#800080") == 0x800080);
        check("hexToInt without hash", ColorMath::hexToInt("00ff00") == 0x00FF00);
        check("hexToInt empty throws", throws<InvalidInput>([] { ColorMath::hexToInt("#"); }));
        check("hexToInt garbage throws", throws<InvalidInput>([] { ColorMath::hexToInt("#zz"); }));
        check("hexToInt skips non-hex characters", ColorMath::hexToInt("#12zz34") == 0x1234);
        check("hexToInt 15 digits fit", ColorMath::hexToInt("#FFFFFFFFFFFFFFF") == 0xFFFFFFFFFFFFFFFLL);
        check("hexToInt max long long", ColorMath::hexToInt("7FFFFFFFFFFFFFFF") == 0x7FFFFFFFFFFFFFFFLL);
        check("hexToInt overflow throws",
              throws<InvalidInput>([] { ColorMath::hexToInt("#FFFFFFFFFFFFFFFF"); }));

        Rgb rgb = ColorMath::intToRgbArray(0x123456);
        check("intToRgbArray", rgb.r == 0x12 && rgb.g == 0x34 && rgb.b == 0x56);
        Rgb fromHex = ColorMath::hexToRgbArray("#ff8000");
        check("hexToRgbArray", fromHex.r == 255 && fromHex.g == 128 && fromHex.b == 0);
    }

    std::cout << "\n[round trips over the 24-bit range]\n";
    {
        bool hexOk = true, lowerOk = true, rgbOk = true;
        for (long long x = 0; x <= 0xFFFFFF; ++x) {
            if (ColorMath::hexToInt(ColorMath::intToHex(x)) != x) hexOk = false;
            if (ColorMath::hexToInt(ColorMath::intToHex(x, false, true)) != x) lowerOk = false;
            Rgb c = ColorMath::intToRgbArray(x);
            if (ColorMath::rgbsToInt(c.r, c.g, c.b) != x) rgbOk = false;
        }
        check("hexToInt(intToHex(x)) == x", hexOk);
        check("lowercase without hash round trips", lowerOk);
        check("rgbsToInt(intToRgbArray(x)) == x", rgbOk);
    }

    std::cout << "\n[channel maps]\n";
    {
        ChannelMap rgb{ { "r", 255 }, { "g", 255 }, { "b", 255 } };
        check("rgbArrayToInt", ColorMath::rgbArrayToInt(rgb) == 0xFFFFFF);
        check("rgbArrayToHex", ColorMath::rgbArrayToHex(rgb, true, true) == "#ffffff");

        Srgb srgb = ColorMath::rgbArrayToSrgbArray(rgb);
        check("rgbArrayToSrgbArray white", srgb.r == 1.0 && srgb.g == 1.0 && srgb.b == 1.0);

        Xyz xyz = ColorMath::srgbArrayToXyzArray(ColorMath::toChannelMap(srgb));
        check("srgb white -> X", near(xyz.x, .4124564 + .3575761 + .1804375));
        check("srgb white -> Y", near(xyz.y, 1.0000001));
        check("srgb white -> Z", near(xyz.z, .0193339 + .1191920 + .9503041));

        Xyz rounded = ColorMath::srgbArrayToXyzArray(ColorMath::toChannelMap(srgb), 3);
        check("srgb -> xyz precision 3", rounded.x == 0.95 && rounded.y == 1.0 && rounded.z == 1.089);

        ChannelMap missing{ { "r", 1 }, { "g", 2 } };
        check("missing channel throws InvalidInput",
              throws<InvalidInput>([&] { ColorMath::rgbArrayToSrgbArray(missing); }));

        ChannelMap wrongKind{ { "r", 1 }, { "g", 2.0 }, { "b", 3 } };
        check("float in rgb map throws InvalidInput",
              throws<InvalidInput>([&] { ColorMath::rgbArrayToInt(wrongKind); }));

        ChannelMap intSrgb{ { "r", 1 }, { "g", 0 }, { "b", 0 } };
        check("int in srgb map throws InvalidInput",
              throws<InvalidInput>([&] { ColorMath::srgbArrayToXyzArray(intSrgb); }));
    }

    std::cout << "\n[Lab]\n";
    {
        Lab white = ColorMath::intToLabArray(0xFFFFFF, 2);
        check("white L == 100", white.L == 100.0);
        check("white a ~ 0", std::fabs(white.a) < 0.05);
        check("white b ~ 0", std::fabs(white.b) < 0.05);

        Lab black = ColorMath::intToLabArray(0x000000);
        check("black L == 0", near(black.L, 0.0));

        Lab red = ColorMath::intToLabArray(0xFF0000, 1);
        check("red L ~ 53.2", near(red.L, 53.2, 0.11));
        check("red a ~ 80.1", near(red.a, 80.1, 0.11));
        check("red b ~ 67.2", near(red.b, 67.2, 0.11));

        Xyz outOfGamut{ 40.0, 0.0, -5.0 };
        Lab clamped = ColorMath::xyzArrayToLabArray(outOfGamut);
        check("L clamped to [0,100]", clamped.L >= 0.0 && clamped.L <= 100.0);
        check("a clamped to 127", clamped.a == 127.0);
        check("b clamped to [-128,127]", clamped.b >= -128.0 && clamped.b <= 127.0);

        Xyz bright{ 0.0, 50.0, 0.0 };
        Lab l = ColorMath::xyzArrayToLabArray(bright);
        check("L clamped to 100", l.L == 100.0);
        check("a clamped to -128", l.a == -128.0);
        check("b clamped to 127", l.b == 127.0);
    }

    std::cout << "\n[engine pixel decoders]\n";
    {
        check("opaque stb pixel", ColorMath::rgbaToEngineHex(0x12, 0x34, 0x56, 255) == "#123456");
        check("transparent stb pixel", ColorMath::rgbaToEngineHex(0, 0, 0, 0) == "#7F000000");
        check("half alpha stb pixel", ColorMath::rgbaToEngineHex(255, 0, 0, 128) == "#3FFF0000");
        check("opencv pixel is lowercase rgb", ColorMath::bgraToHex(0x56, 0x34, 0xAB) == "#ab3456");
        check("opencv pixel without hash", ColorMath::bgraToHex(0, 0, 255, false) == "ff0000");
    }

    std::cout << "\n=== " << (failures == 0 ? "ALL PASSED" : "FAILURES") << " ===\n";
    return failures == 0 ? 0 : 1;
}
