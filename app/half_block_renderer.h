/*---------------------------------------------------------*/
/*                                                         */
/*   half_block_renderer.h - Pixels -> truecolor cells     */
/*                                                         */
/*   TL;DR                                                 */
/*   - One terminal cell shows two stacked pixels: the     */
/*     top pixel as foreground of U+2580 (upper half), the */
/*     bottom pixel as background.                         */
/*   - Pixels equal to the transparent color drop out:     */
/*     only-bottom uses U+2584 (lower half), neither gives */
/*     a blank.                                            */
/*   - Markers replace the pixel color of the cell their   */
/*     point truncates to. First registered marker wins.   */
/*   - Output rows = floor(height / 2). An odd last pixel  */
/*     row is dropped.                                     */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef HALF_BLOCK_RENDERER_H
#define HALF_BLOCK_RENDERER_H

#include "map_point.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

/*---------------------------------------------------------*/
/* MarkerOverlay - color tag -> point, insertion ordered   */
/*---------------------------------------------------------*/
class MarkerOverlay {
public:
    using Entry = std::pair<std::string, Point>;

    // Re-adding a tag replaces its point and keeps its original position.
    void add(const std::string& tag, const Point& point);
    bool remove(const std::string& tag);
    void clear() { entries.clear(); }

    const Point* find(const std::string& tag) const;

    // Tag of the first marker on (cellX, cellY), or nullptr.
    const std::string* tagAt(int cellX, int cellY) const;

    size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }
    const std::vector<Entry>& all() const { return entries; }

private:
    std::vector<Entry> entries;
};

/*---------------------------------------------------------*/
/* HalfBlockRenderer                                       */
/*---------------------------------------------------------*/
class HalfBlockRenderer {
public:
    static const char* const TRANSPARENT;       // token for "no pixel"
    static const char* const DEFAULT_TRANSPARENT_COLOR;

    explicit HalfBlockRenderer(std::string transparentColor = DEFAULT_TRANSPARENT_COLOR);

    // Source needs width(), height() and colorAt(x, y) -> hex string.
    template <typename Source>
    std::vector<std::string> render(const Source& image, const MarkerOverlay& markers) const;

    static std::string join(const std::vector<std::string>& lines);

    // Formats one cell. Without a bottom color the top color fills both halves.
    // A non-positive repeat gives an empty string once both colors validate.
    std::string get1x2Pixel(const std::string& colorTop,
                            const std::optional<std::string>& colorBottom = std::nullopt,
                            int repeat = 1) const;

    // "#AARRGGBB" -> "#RRGGBB"; transparent color (any letter case) -> TRANSPARENT.
    // Throws InvalidColorFormat for anything else that is not #RRGGBB.
    std::string translateColor(const std::string& color) const;

    const std::string& transparentColor() const { return transparent; }

private:
    std::string transparent;

    static std::string resolveColor(int cellX, int row, const std::string& color,
                                    const MarkerOverlay& markers);
};

template <typename Source>
std::vector<std::string> HalfBlockRenderer::render(const Source& image, const MarkerOverlay& markers) const
{
    const int width = image.width();
    const int height = image.height();

    std::vector<std::string> lines;
    lines.reserve(height / 2);
    for (int lineY = 0; lineY < height / 2; ++lineY) {
        const int rowTop = 2 * lineY;
        const int rowBottom = 2 * lineY + 1;

        std::string line;
        for (int cellX = 0; cellX < width; ++cellX) {
            std::string colorTop = image.colorAt(cellX, rowTop);
            std::string colorBottom = rowBottom < height ? image.colorAt(cellX, rowBottom)
                                                         : std::string(TRANSPARENT);
            line += get1x2Pixel(resolveColor(cellX, rowTop, colorTop, markers),
                                resolveColor(cellX, rowBottom, colorBottom, markers));
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

#endif // HALF_BLOCK_RENDERER_H
