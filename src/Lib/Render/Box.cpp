#include <Slowfetch/Render/Box.hpp>

#include <algorithm> // std::max
#include <utility>   // std::move

#include <Slowfetch/Render/Width.hpp>

namespace slowfetch::render {
  using namespace utils::types;

  namespace {
    auto Repeat(const StringView piece, const usize count) -> String {
      String out;
      out.reserve(piece.size() * count);

      for (usize i = 0; i < count; ++i)
        out += piece;

      return out;
    }
  } // namespace

  auto Box::width() const -> usize {
    return lines.empty() ? 0 : VisibleWidth(lines.front());
  }

  auto BuildBox(const Span<const String> lines, const BoxOptions& options, const Theme& theme) -> Box {
    Vec<usize> lineWidths;
    lineWidths.reserve(lines.size());

    usize contentWidth = 0;
    for (const String& line : lines) {
      lineWidths.push_back(VisibleWidth(line));
      contentWidth = std::max(contentWidth, lineWidths.back());
    }

    const usize titleWidth = options.title ? ScalarCount(*options.title) : 0;
    const usize innerWidth = std::max({ contentWidth, titleWidth, options.minWidth.value_or(0) });

    const usize naturalHeight = lines.size() + 2;
    const usize totalHeight   = std::max(naturalHeight, options.minHeight.value_or(0));
    const usize slack         = totalHeight - naturalHeight;
    const usize topPadding    = slack / 2;
    const usize bottomPadding = slack - topPadding;

    const String vertical = Paint(glyph::VERTICAL, theme.border);
    const String rule     = Paint(Repeat(glyph::HORIZONTAL, innerWidth + 2), theme.border);
    const String blankRow = vertical + String(innerWidth + 2, ' ') + vertical;

    Box box;
    box.lines.reserve(totalHeight);

    if (options.title) {
      const usize dashes = innerWidth - titleWidth;
      const usize left   = dashes / 2;

      box.lines.push_back(
        Paint(String(glyph::TOP_LEFT) + Repeat(glyph::HORIZONTAL, left), theme.border) +
        ' ' + Paint(*options.title, theme.title) + ' ' +
        Paint(Repeat(glyph::HORIZONTAL, dashes - left) + String(glyph::TOP_RIGHT), theme.border)
      );
    } else
      box.lines.push_back(Paint(glyph::TOP_LEFT, theme.border) + rule + Paint(glyph::TOP_RIGHT, theme.border));

    for (usize i = 0; i < topPadding; ++i)
      box.lines.push_back(blankRow);

    for (usize i = 0; i < lines.size(); ++i) {
      const usize pad   = innerWidth - lineWidths[i];
      const usize left  = options.centerContent ? pad / 2 : 0;
      const usize right = pad - left;

      String row;
      row.reserve(lines[i].size() + innerWidth + (vertical.size() * 2) + 2);

      row += vertical;
      row += ' ';
      row.append(left, ' ');
      row += lines[i];
      row.append(right, ' ');
      row += ' ';
      row += vertical;

      box.lines.push_back(std::move(row));
    }

    for (usize i = 0; i < bottomPadding; ++i)
      box.lines.push_back(blankRow);

    box.lines.push_back(Paint(glyph::BOTTOM_LEFT, theme.border) + rule + Paint(glyph::BOTTOM_RIGHT, theme.border));

    return box;
  }
} // namespace slowfetch::render
