/*---------------------------------------------------------*/
/*                                                         */
/*   half_block_renderer.cpp - Pixels -> truecolor cells   */
/*                                                         */
/*---------------------------------------------------------*/

#include "half_block_renderer.h"
#include "color_math.h"
#include "halfblock_errors.h"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

const char* const HalfBlockRenderer::TRANSPARENT = "transparent";
const char* const HalfBlockRenderer::DEFAULT_TRANSPARENT_COLOR = "#000000";

namespace {

const char* const GLYPH_UPPER_HALF = "\xE2\x96\x80"; // U+2580
const char* const GLYPH_LOWER_HALF = "\xE2\x96\x84"; // U+2584
const char* const ANSI_RESET = "\x1b[0m";

// Hex digits compare case-insensitively: engines differ in letter case.
bool sameColor(const std::string& a, const std::string& b)
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char l, char r) {
               return std::tolower((unsigned char) l) == std::tolower((unsigned char) r);
           });
}

std::string repeatGlyph(const char* glyph, int repeat)
{
    std::string out;
    for (int i = 0; i < repeat; ++i) out += glyph;
    return out;
}

std::string fg(const Rgb& c)
{
    std::ostringstream oss;
    oss << "\x1b[38;2;" << c.r << ';' << c.g << ';' << c.b << 'm';
    return oss.str();
}

std::string bg(const Rgb& c)
{
    std::ostringstream oss;
    oss << "\x1b[48;2;" << c.r << ';' << c.g << ';' << c.b << 'm';
    return oss.str();
}

} // namespace

/*---------------------------------------------------------*/
/* MarkerOverlay                                           */
/*---------------------------------------------------------*/

void MarkerOverlay::add(const std::string& tag, const Point& point)
{
    for (auto& e : entries) {
        if (e.first == tag) {
            e.second = point;
            return;
        }
    }
    entries.emplace_back(tag, point);
}

bool MarkerOverlay::remove(const std::string& tag)
{
    for (auto it = entries.begin(); it != entries.end(); ++it) {
        if (it->first == tag) {
            entries.erase(it);
            return true;
        }
    }
    return false;
}

const Point* MarkerOverlay::find(const std::string& tag) const
{
    for (const auto& e : entries)
        if (e.first == tag) return &e.second;
    return nullptr;
}

const std::string* MarkerOverlay::tagAt(int cellX, int cellY) const
{
    for (const auto& e : entries)
        if (e.second.hits(cellX, cellY)) return &e.first;
    return nullptr;
}

/*---------------------------------------------------------*/
/* HalfBlockRenderer                                       */
/*---------------------------------------------------------*/

HalfBlockRenderer::HalfBlockRenderer(std::string transparentColor)
    : transparent(std::move(transparentColor))
{
}

std::string HalfBlockRenderer::join(const std::vector<std::string>& lines)
{
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) out += '\n';
        out += lines[i];
    }
    return out;
}

std::string HalfBlockRenderer::resolveColor(int cellX, int row, const std::string& color,
                                            const MarkerOverlay& markers)
{
    const std::string* tag = markers.tagAt(cellX, row);
    return tag ? *tag : color;
}

std::string HalfBlockRenderer::translateColor(const std::string& color) const
{
    static const std::regex withAlpha("^#[a-fA-F0-9]{1,2}([a-fA-F0-9]{6})$");
    static const std::regex plain("^#[a-fA-F0-9]{6}$");

    if (color == TRANSPARENT)
        return TRANSPARENT;

    std::string result = color;
    std::smatch m;
    if (std::regex_match(color, m, withAlpha))
        result = "#" + m[1].str();

    if (!std::regex_match(result, plain))
        throw InvalidColorFormat("Unexpected color given \"" + color + "\".");

    if (sameColor(result, transparent))
        return TRANSPARENT;

    return result;
}

std::string HalfBlockRenderer::get1x2Pixel(const std::string& colorTop,
                                           const std::optional<std::string>& colorBottom,
                                           int repeat) const
{
    std::string top = translateColor(colorTop);
    std::string bottom = translateColor(colorBottom ? *colorBottom : colorTop);

    const bool topClear = top == TRANSPARENT;
    const bool bottomClear = bottom == TRANSPARENT;

    if (repeat <= 0)
        return std::string();

    if (topClear && bottomClear)
        return std::string(repeat, ' ');

    if (topClear)
        return fg(ColorMath::hexToRgbArray(bottom)) + repeatGlyph(GLYPH_LOWER_HALF, repeat) + ANSI_RESET;

    if (bottomClear)
        return fg(ColorMath::hexToRgbArray(top)) + repeatGlyph(GLYPH_UPPER_HALF, repeat) + ANSI_RESET;

    return fg(ColorMath::hexToRgbArray(top)) + bg(ColorMath::hexToRgbArray(bottom)) +
           repeatGlyph(GLYPH_UPPER_HALF, repeat) + ANSI_RESET;
}
