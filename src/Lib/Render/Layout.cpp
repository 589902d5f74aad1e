#include <Slowfetch/Render/Layout.hpp>

#include <algorithm>                 // std::max
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name
#include <matchit.hpp>               // matchit::{match, is, _}

#include <Slowfetch/Render/Box.hpp>
#include <Slowfetch/Render/Width.hpp>
#include <Slowfetch/Utils/Logging.hpp>

namespace slowfetch::render {
  using namespace utils::types;

  namespace {
    auto ComposeSideBySide(const Box& artBox, const Span<const String> sectionRows, String& out) -> Unit {
      const usize  rowCount = std::max(artBox.height(), sectionRows.size());
      const String artGap(artBox.width(), ' ');

      for (usize row = 0; row < rowCount; ++row) {
        out += row < artBox.height() ? artBox.lines[row] : artGap;
        out += ' ';

        if (row < sectionRows.size())
          out += sectionRows[row];

        out += '\n';
      }
    }

    auto AppendRows(const Span<const String> rows, String& out) -> Unit {
      for (const String& row : rows) {
        out += row;
        out += '\n';
      }
    }

    auto RenderSideBySide(const ArtLines& art, const Span<const Section> sections, const Theme& theme) -> String {
      const Vec<String> sectionRows = FormatSections(sections, None, theme);
      const Box         artBox      = BuildBox(art, { .minHeight = sectionRows.size(), .centerContent = true }, theme);

      String out;
      ComposeSideBySide(artBox, sectionRows, out);
      return out;
    }

    auto RenderStacked(const ArtLines& art, const Span<const Section> sections, const Theme& theme) -> String {
      const usize       sharedWidth = std::max(MaxVisibleWidth(art), SectionsContentWidth(sections));
      const Box         artBox      = BuildBox(art, { .minWidth = sharedWidth, .centerContent = true }, theme);
      const Vec<String> sectionRows = FormatSections(sections, sharedWidth, theme);

      String out;
      AppendRows(artBox.lines, out);
      AppendRows(sectionRows, out);
      return out;
    }
  } // namespace

  auto RenderSectionsOnly(const Span<const Section> sections, const Theme& theme) -> String {
    String out;
    AppendRows(FormatSections(sections, None, theme), out);

    // Keep the output non-empty even with nothing to show.
    if (out.empty())
      out = "\n";

    return out;
  }

  auto SideBySideWidth(const Span<const String> art, const usize sectionsContentWidth) -> usize {
    return MaxVisibleWidth(art) + 4 + 1 + sectionsContentWidth + 4;
  }

  auto StackedHeight(const Span<const String> art, const usize sectionsHeight) -> usize {
    return art.size() + 2 + sectionsHeight;
  }

  auto SelectLayout(const ArtVariants& art, const Span<const Section> sections, const TerminalGeometry geometry) -> LayoutChoice {
    const usize contentWidth = SectionsContentWidth(sections);
    const usize height       = SectionsHeight(sections);

    if (geometry.columns >= SideBySideWidth(art.wide, contentWidth))
      return LayoutChoice::SideBySideWide;

    if (art.compact && geometry.columns >= SideBySideWidth(*art.compact, contentWidth))
      return LayoutChoice::SideBySideCompact;

    if (geometry.columns >= SideBySideWidth(art.medium, contentWidth))
      return LayoutChoice::SideBySideMedium;

    if (art.compact && geometry.rows >= StackedHeight(*art.compact, height))
      return LayoutChoice::StackedCompact;

    if (geometry.rows >= StackedHeight(art.narrow, height))
      return LayoutChoice::StackedNarrow;

    return LayoutChoice::SectionsOnly;
  }

  auto Render(const ArtVariants& art, const Span<const Section> sections, const TerminalGeometry geometry, const Theme& theme) -> String {
    using matchit::match, matchit::is, matchit::_;
    using enum LayoutChoice;

    const LayoutChoice choice = SelectLayout(art, sections, geometry);

    debug_log("{}x{} terminal, {} sections -> {}", geometry.columns, geometry.rows, sections.size(), magic_enum::enum_name(choice));

    // compact is only chosen when present
    return match(choice)(
      is | SideBySideWide    = [&] { return RenderSideBySide(art.wide, sections, theme); },
      is | SideBySideCompact = [&] { return RenderSideBySide(*art.compact, sections, theme); },
      is | SideBySideMedium  = [&] { return RenderSideBySide(art.medium, sections, theme); },
      is | StackedCompact    = [&] { return RenderStacked(*art.compact, sections, theme); },
      is | StackedNarrow     = [&] { return RenderStacked(art.narrow, sections, theme); },
      is | _                 = [&] { return RenderSectionsOnly(sections, theme); }
    );
  }

  auto Render(const ArtVariants& art, const Span<const Section> sections, const Theme& theme) -> String {
    return Render(art, sections, ProbeTerminal(), theme);
  }
} // namespace slowfetch::render
