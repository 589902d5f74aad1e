#include <Slowfetch/Render/Sections.hpp>

#include <algorithm> // std::max, std::ranges::move
#include <iterator>  // std::back_inserter

#include <Slowfetch/Render/Box.hpp>
#include <Slowfetch/Render/Width.hpp>

namespace slowfetch::render {
  using namespace utils::types;

  auto FormatSectionLine(const StringView key, const StringView value, const Theme& theme) -> String {
    String line = Paint(key, theme.key);
    line += ": ";
    line += Paint(value, theme.value);
    return line;
  }

  auto SectionsContentWidth(const Span<const Section> sections) -> usize {
    usize widest = 0;

    for (const Section& section : sections) {
      widest = std::max(widest, ScalarCount(section.title));

      for (const auto& [key, value] : section.lines)
        widest = std::max(widest, VisibleWidth(key) + 2 + VisibleWidth(value));
    }

    return widest;
  }

  auto SectionsHeight(const Span<const Section> sections) -> usize {
    usize height = 0;

    for (const Section& section : sections)
      height += section.lines.size() + 2;

    return height;
  }

  auto FormatSections(const Span<const Section> sections, const Option<usize> sharedWidth, const Theme& theme) -> Vec<String> {
    const usize innerWidth = std::max(SectionsContentWidth(sections), sharedWidth.value_or(0));

    Vec<String> out;
    out.reserve(SectionsHeight(sections));

    for (const Section& section : sections) {
      Vec<String> rows;
      rows.reserve(section.lines.size());

      for (const auto& [key, value] : section.lines)
        rows.push_back(FormatSectionLine(key, value, theme));

      Box box = BuildBox(rows, { .title = section.title, .minWidth = innerWidth, .centerContent = false }, theme);

      std::ranges::move(box.lines, std::back_inserter(out));
    }

    return out;
  }
} // namespace slowfetch::render
