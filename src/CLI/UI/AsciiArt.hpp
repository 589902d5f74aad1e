#pragma once

#include <filesystem> // std::filesystem::path

#include <Slowfetch/Render/Layout.hpp>
#include <Slowfetch/Utils/Logging.hpp>
#include <Slowfetch/Utils/Types.hpp>

namespace slowfetch::ui::ascii {
  namespace types = ::slowfetch::utils::types;

  using Rgb     = ::slowfetch::utils::logging::Rgb;
  using Palette = types::Array<Rgb, 9>;

  // Art text may contain {1}..{9}; each switches to that palette colour for
  // the rest of the art until the next placeholder.
  namespace logos {
    constexpr types::StringView DEFAULT_WIDE =
      "{3}  \\    /\n"
      "   \\  /          {5}.-''''-.\n"
      "{3}   (oo)       {5}.'  {6}.--.{5}  '.\n"
      "{4}   |  |      {5}/  {6}.'  {7}@{6} '.{5} \\\n"
      "{4}   |  |     {5}|  {6}|  {7}(_){6}  |{5} |\n"
      "{4}   |  |     {5}|   {6}'.    .'{5} /\n"
      "{4}  _|  |______{5}'.   {6}''''{5}  .'___\n"
      "{4} (_______________{5}'-....-'{4}_____)";

    constexpr types::StringView DEFAULT_MEDIUM =
      "{3} \\  /      {5}.--.\n"
      "{3}  oo     {5}.' {6}@@{5} '.\n"
      "{4}  ||    {5}(  {6}(  ){5}  )\n"
      "{4} _||_____{5}'.{6}__{5}.'{4}__\n"
      "(________________)";

    constexpr types::StringView DEFAULT_NARROW =
      "{3}\\/  {5}.-.\n"
      "{4}|| {5}( {6}@{5} )\n"
      "{4}'--{5}'-'{4}-'";

    constexpr types::StringView ARCH =
      "{6}                  -`\n"
      "                 .o+`\n"
      "                `ooo/\n"
      "               `+oooo:\n"
      "              `+oooooo:\n"
      "              -+oooooo+:\n"
      "            `/:-:++oooo+:\n"
      "           `/++++/+++++++:\n"
      "          `/++++++++++++++:\n"
      "         `/+++oooooooooooooo/`\n"
      "        ./ooosssso++osssssso+`\n"
      "       .oossssso-````/ossssss+`\n"
      "      -osssssso.      :ssssssso.\n"
      "     :osssssss/        osssso+++.\n"
      "    /ossssssss/        +ssssooo/-.\n"
      "  `/ossssso+/:-        -:/+osssso+-\n"
      " `+sso+:-`                 `.-/+oso:\n"
      "`++:.                           `-/+/\n"
      ".`                                 `/";

    constexpr types::StringView ARCH_SMOL =
      "{6}      /\\\n"
      "     /  \\\n"
      "    /\\   \\\n"
      "   /      \\\n"
      "  /   ,,   \\\n"
      " /   |  |  -\\\n"
      "/_-''    ''-_\\";

    constexpr types::StringView CACHYOS =
      "{5}      .-------------------------.\n"
      "     /  .-----------------------'\n"
      "    /  /           {4}()\n"
      "{5}   /  /     {4}.-.\n"
      "{5}  /  /      {4}'-'        ()\n"
      "{5} (  (\n"
      "  \\  \\            {4}o\n"
      "{5}   \\  \\\n"
      "    \\  '------------------------.\n"
      "     '-------------------------'";

    constexpr types::StringView CACHYOS_SMOL =
      "{5}   .-------.\n"
      "  /  .----'  {4}o\n"
      "{5} (  (    {4}.\n"
      "{5}  \\  '----.  {4}o\n"
      "{5}   '-------'";

    constexpr types::StringView FEDORA =
      "{7}             .',;::::;,'.\n"
      "         .';:cccccccccccc:;,.\n"
      "      .;cccccccccccccccccccccc;.\n"
      "    .:cccccccccccccccccccccccccc:.\n"
      "  .;ccccccccccccc;{5}.:dddl:.{7};ccccccc;.\n"
      " .:ccccccccccccc;{5}OWMKOOXMWd{7};ccccccc:.\n"
      ".:ccccccccccccc;{5}KMMc{7};cc;{5}xMMc{7};ccccccc:.\n"
      ",cccccccccccccc;{5}MMM.{7};cc;{5};WW:{7};cccccccc,\n"
      ":cccccccccccccc;{5}MMM.{7};cccccccccccccccc:\n"
      ":ccccccc;{5}oxOOOo{7};{5}MMM000k.{7};cccccccccccc:\n"
      "cccccc;{5}0MMKxdd:{7};{5}MMMkddc.{7};cccccccccccc;\n"
      "ccccc;{5}XMO'{7};cccc;{5}MMM.{7};cccccccccccccccc'\n"
      "ccccc;{5}MMo{7};ccccc;{5}MMW.{7};ccccccccccccccc;\n"
      "ccccc;{5}0MNc.{7}ccc{5}.xMMd{7};ccccccccccccccc;\n"
      "cccccc;{5}dNMWXXXWM0:{7};cccccccccccccc:,\n"
      "cccccccc;{5}.:odl:.{7};cccccccccccccc:,.\n"
      "ccccccccccccccccccccccccccccc:'.\n"
      ":ccccccccccccccccccccccc:;,..\n"
      " ':cccccccccccccccc::;,.";

    constexpr types::StringView FEDORA_SMOL =
      "{7}        ,'''''.\n"
      "       |   ,.  |\n"
      "       |  |  '_'\n"
      "  ,....|  |..\n"
      ".'  ,_;|   ..'\n"
      "|  |   |  |\n"
      "|  ',_,'  |\n"
      " '.     ,'\n"
      "   '''''";

    constexpr types::StringView UBUNTU =
      "{2}                             ....\n"
      "              .',:clooo:  .:looooo:.\n"
      "           .;looooooooc  .oooooooooo'\n"
      "        .;looooool:,'''.  :ooooooooooc\n"
      "       ;looool;.         'oooooooooo,\n"
      "      ;clool'             .cooooooc.  ,,\n"
      "         ...                ......  .:oo,\n"
      "  .;clol:,.                        .loooo'\n"
      " :ooooooooo,                        'ooool\n"
      "'ooooooooooo.                        loooo.\n"
      "'ooooooooool                         coooo.\n"
      " ,loooooooc.                        .loooo.\n"
      "   .,;;;'.                          ;ooooc\n"
      "       ...                         ,ooool.\n"
      "    .cooooc.              ..',,'.  .cooo.\n"
      "      ;ooooo:.           ;oooooooc.  :l.\n"
      "       .coooooc,..      coooooooooo.\n"
      "         .:ooooooolc:. .ooooooooooo'\n"
      "           .':loooooo;  ,oooooooooc\n"
      "               ..';::c'  .;loooo:'";

    constexpr types::StringView UBUNTU_SMOL =
      "{2}         _\n"
      "     ---(_)\n"
      " _/  ---  \\\n"
      "(_) |   |\n"
      "  \\  --- _/\n"
      "     ---(_)";

    constexpr types::StringView NIXOS =
      "{7}          ▗▄▄▄       {6}▗▄▄▄▄    ▄▄▄▖\n"
      "{7}          ▜███▙       {6}▜███▙  ▟███▛\n"
      "{7}           ▜███▙       {6}▜███▙▟███▛\n"
      "{7}            ▜███▙       {6}▜██████▛\n"
      "{7}     ▟█████████████████▙ {6}▜████▛     {7}▟▙\n"
      "    ▟███████████████████▙ {6}▜███▙    {7}▟██▙\n"
      "{6}           ▄▄▄▄▖           ▜███▙  {7}▟███▛\n"
      "{6}          ▟███▛             ▜██▛ {7}▟███▛\n"
      "{6}         ▟███▛               ▜▛ {7}▟███▛\n"
      "{6}▟███████████▛                  {7}▟██████████▙\n"
      "{6}▜██████████▛                  {7}▟███████████▛\n"
      "{6}      ▟███▛ {7}▟▙               ▟███▛\n"
      "{6}     ▟███▛ {7}▟██▙             ▟███▛\n"
      "{6}    ▟███▛  {7}▜███▙           ▝▀▀▀▀\n"
      "{6}    ▜██▛    {7}▜███▙ {6}▜██████████████████▛\n"
      "{6}     ▜▛     {7}▟████▙ {6}▜████████████████▛\n"
      "{7}           ▟██████▙       {6}▜███▙\n"
      "{7}          ▟███▛▜███▙       {6}▜███▙\n"
      "{7}         ▟███▛  ▜███▙       {6}▜███▙\n"
      "{7}         ▝▀▀▀    ▀▀▀▀▘       {6}▀▀▀▘";

    constexpr types::StringView NIXOS_SMOL =
      "{7}  \\\\  {6}\\\\ //\n"
      "{7} ==\\\\__\\\\/ {6}//\n"
      "{6}   //   \\\\//\n"
      "==//     //==\n"
      " //\\\\___//\n"
      "{7}// /\\\\  \\\\==\n"
      "  // \\\\  \\\\";
  } // namespace logos

  struct OsLogo {
    types::StringView full;
    types::StringView smol;
  };

  /**
   * @brief Finds the logo whose key occurs in @p osName, ignoring case.
   * @param osName Either a distribution id ("arch") or a pretty name ("Arch Linux").
   */
  auto FindOsLogo(types::StringView osName) -> types::Option<OsLogo>;

  /**
   * @brief Splits raw art text into lines. A trailing newline does not add an empty line.
   */
  auto SplitArt(types::StringView art) -> types::Vec<types::String>;

  /**
   * @brief Resolves colour placeholders.
   *
   * With a palette, each `{N}` becomes the SGR code for `palette[N - 1]`; a
   * colour still active at the end of a line is reset there and re-applied at
   * the start of the next. Without one, placeholders are removed. Any other
   * brace text is kept as is.
   */
  auto ColorizeArt(types::Span<const types::String> lines, const types::Option<Palette>& palette) -> types::Vec<types::String>;

  /**
   * @brief Reads an art file. Fails with NotFound, IoError, or ParseError for an empty file.
   */
  auto LoadCustomArt(const std::filesystem::path& path) -> types::Result<types::Vec<types::String>>;

  /// Built-in wide/medium/narrow logo, no compact variant.
  auto DefaultArt(const types::Option<Palette>& palette) -> render::ArtVariants;

  /**
   * @brief Art for a distribution: the full logo as wide, medium and narrow, the small one as compact.
   * @return None for unknown distributions.
   */
  auto OsArt(types::StringView osName, const types::Option<Palette>& palette) -> types::Option<render::ArtVariants>;

  /// One file's art used for every variant.
  auto CustomArt(types::Span<const types::String> lines, const types::Option<Palette>& palette) -> render::ArtVariants;
} // namespace slowfetch::ui::ascii
