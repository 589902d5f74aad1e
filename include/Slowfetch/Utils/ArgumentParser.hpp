/**
 * @file ArgumentParser.hpp
 * @brief Small command-line argument parser for slowfetch.
 *
 * Supports flags, valued options, options whose value may be omitted
 * (`--os` / `--os arch`), enum choices through magic_enum, and binding
 * parsed values straight into an options struct via bindTo().
 */

#pragma once

#include <algorithm>                 // std::ranges::transform, std::ranges::equal
#include <cctype>                    // std::tolower
#include <charconv>                  // std::from_chars
#include <concepts>                  // std::convertible_to
#include <format>                    // std::format
#include <functional>                // std::function
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name, magic_enum::enum_cast
#include <utility>                   // std::forward
#include <variant>                   // std::variant

#include "Error.hpp"
#include "Logging.hpp"
#include "Types.hpp"

namespace slowfetch::utils::argparse {
  namespace error   = ::slowfetch::utils::error;
  namespace logging = ::slowfetch::utils::logging;
  namespace types   = ::slowfetch::utils::types;

  class Argument;

  using ArgValue   = std::variant<bool, types::i32, types::String>;
  using ArgBinding = std::function<void(const Argument&)>;
  using ArgChoices = types::Vec<types::String>;

  inline auto ToLower(types::StringView text) -> types::String {
    types::String lower(text);
    std::ranges::transform(lower, lower.begin(), [](types::u8 chr) { return static_cast<char>(std::tolower(chr)); });
    return lower;
  }

  /**
   * @brief Enum <-> string conversion for scoped enums using magic_enum.
   */
  template <typename EnumType>
  struct EnumTraits {
    static constexpr bool has_string_conversion = magic_enum::is_scoped_enum_v<EnumType>;

    static auto getChoices() -> const ArgChoices& {
      static_assert(has_string_conversion, "Enum type must be a scoped enum");

      static const ArgChoices CACHED_CHOICES = [] {
        ArgChoices vec;
        for (const EnumType value : magic_enum::enum_values<EnumType>())
          vec.emplace_back(ToLower(magic_enum::enum_name(value)));
        return vec;
      }();

      return CACHED_CHOICES;
    }

    static auto stringToEnum(const types::StringView str) -> types::Option<EnumType> {
      return magic_enum::enum_cast<EnumType>(str, [](char lhs, char rhs) {
        return std::tolower(static_cast<types::u8>(lhs)) == std::tolower(static_cast<types::u8>(rhs));
      });
    }

    static auto enumToString(EnumType value) -> types::String {
      return ToLower(magic_enum::enum_name(value));
    }
  };

  /**
   * @brief A single command-line option and its parsed state.
   */
  class Argument {
   public:
    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, types::String> && ...))
    explicit Argument(NameTs&&... names)
      : m_names { types::String(std::forward<NameTs>(names))... } {}

    auto help(types::String helpText) -> Argument& {
      m_helpText = std::move(helpText);
      return *this;
    }

    auto flag() -> Argument& {
      m_isFlag       = true;
      m_defaultValue = false;
      return *this;
    }

    template <typename T>
      requires std::same_as<T, bool> || std::same_as<T, types::i32> || std::convertible_to<T, types::String>
    auto defaultValue(T value) -> Argument& {
      if constexpr (std::same_as<T, bool> || std::same_as<T, types::i32>)
        m_defaultValue = value;
      else
        m_defaultValue = types::String(std::move(value));
      return *this;
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    auto defaultValue(EnumType value) -> Argument& {
      m_defaultValue = EnumTraits<EnumType>::enumToString(value);
      return choices(EnumTraits<EnumType>::getChoices());
    }

    /**
     * @brief Value used when the option appears without one, e.g. a bare `--os`.
     *
     * The next token is only consumed as the value when it does not start with '-'.
     */
    auto implicitValue(types::String value) -> Argument& {
      m_implicitValue = std::move(value);
      return *this;
    }

    auto choices(const ArgChoices& allowed) -> Argument& {
      ArgChoices lowered;
      lowered.reserve(allowed.size());
      for (const types::String& choice : allowed)
        lowered.emplace_back(ToLower(choice));
      m_choices = std::move(lowered);
      return *this;
    }

    template <typename T>
    [[nodiscard]] auto get() const -> T {
      if (m_value.has_value())
        return std::get<T>(*m_value);

      if (m_defaultValue.has_value())
        return std::get<T>(*m_defaultValue);

      return T {};
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    [[nodiscard]] auto getEnum() const -> EnumType {
      return EnumTraits<EnumType>::stringToEnum(get<types::String>()).value_or(magic_enum::enum_values<EnumType>()[0]);
    }

    [[nodiscard]] auto isUsed() const -> bool {
      return m_isUsed;
    }

    [[nodiscard]] auto isFlag() const -> bool {
      return m_isFlag;
    }

    [[nodiscard]] auto acceptsImplicit() const -> bool {
      return m_implicitValue.has_value();
    }

    [[nodiscard]] auto getNames() const -> const types::Vec<types::String>& {
      return m_names;
    }

    [[nodiscard]] auto getPrimaryName() const -> const types::String& {
      return m_names.back();
    }

    [[nodiscard]] auto getHelpText() const -> const types::String& {
      return m_helpText;
    }

    [[nodiscard]] auto getChoices() const -> const types::Option<ArgChoices>& {
      return m_choices;
    }

    /**
     * @brief Stores a raw command-line value, validating choices and integer defaults.
     */
    auto setValue(types::String raw) -> types::Result<> {
      if (m_choices) {
        const types::String lower = ToLower(raw);

        if (std::ranges::find(*m_choices, lower) == m_choices->end()) {
          types::String allowed;
          for (const types::String& choice : *m_choices) {
            if (!allowed.empty())
              allowed += ", ";
            allowed += choice;
          }

          ERR_FMT(error::SlowErrorCode::InvalidArgument, "Invalid value '{}' for argument '{}'. Allowed values: {}", raw, getPrimaryName(), allowed);
        }

        raw = lower;
      }

      if (m_defaultValue && std::holds_alternative<types::i32>(*m_defaultValue)) {
        types::i32 parsed {};

        const auto [ptr, errc] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);

        if (errc != std::errc() || ptr != raw.data() + raw.size())
          ERR_FMT(error::SlowErrorCode::InvalidArgument, "Failed to parse '{}' as integer for argument '{}'", raw, getPrimaryName());

        m_value = parsed;
      } else
        m_value = std::move(raw);

      m_isUsed = true;
      return {};
    }

    auto markUsed() -> types::Unit {
      m_isUsed = true;

      if (m_isFlag)
        m_value = true;
      else if (m_implicitValue)
        m_value = *m_implicitValue;
    }

    template <typename T>
      requires std::same_as<T, bool> || std::same_as<T, types::i32> || std::same_as<T, types::String>
    auto bindTo(T& member) -> Argument& {
      m_binding = [&member](const Argument& arg) { member = arg.get<T>(); };
      return *this;
    }

    /**
     * @brief Binds an optional member, left empty unless the option was given.
     */
    auto bindTo(types::Option<types::String>& member) -> Argument& {
      m_binding = [&member](const Argument& arg) {
        if (arg.isUsed())
          member = arg.get<types::String>();
      };
      return *this;
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    auto bindToEnum(EnumType& member) -> Argument& {
      m_binding = [&member](const Argument& arg) { member = arg.getEnum<EnumType>(); };
      return *this;
    }

    auto applyBinding() const -> types::Unit {
      if (m_binding)
        m_binding(*this);
    }

   private:
    types::Vec<types::String>   m_names;
    types::String               m_helpText;
    types::Option<ArgValue>     m_value;
    types::Option<ArgValue>     m_defaultValue;
    types::Option<types::String> m_implicitValue;
    types::Option<ArgChoices>   m_choices;
    ArgBinding                  m_binding;
    bool                        m_isFlag {};
    bool                        m_isUsed {};
  };

  /**
   * @brief Main argument parser class.
   *
   * `--help` and `--version` are recorded rather than acted on so the caller
   * decides how to exit.
   */
  class ArgumentParser {
   public:
    ArgumentParser(types::String programName, types::String version)
      : m_programName(std::move(programName)), m_version(std::move(version)) {
      addArguments("-h", "--help").help("Show this help message and exit").flag();
      addArguments("-v", "--version").help("Show version information and exit").flag();
    }

    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, types::String> && ...))
    auto addArguments(NameTs&&... names) -> Argument& {
      m_arguments.emplace_back(std::make_unique<Argument>(std::forward<NameTs>(names)...));
      Argument& arg = *m_arguments.back();

      for (const types::String& name : arg.getNames())
        m_argumentMap[name] = &arg;

      return arg;
    }

    /**
     * @brief Parses argv-style input. The first element is the program name.
     */
    auto parseArgs(types::Span<const char* const> args) -> types::Result<> {
      types::Vec<types::String> owned(args.begin(), args.end());
      return parseArgs(owned);
    }

    auto parseArgs(const types::Vec<types::String>& args) -> types::Result<> {
      for (types::usize i = 1; i < args.size(); ++i) {
        types::StringView token = args[i];
        types::Option<types::String> inlineValue;

        // --name=value
        if (const types::usize eq = token.find('='); token.starts_with("--") && eq != types::StringView::npos) {
          inlineValue = types::String(token.substr(eq + 1));
          token       = token.substr(0, eq);
        }

        const auto iter = m_argumentMap.find(token);
        if (iter == m_argumentMap.end())
          ERR_FMT(error::SlowErrorCode::InvalidArgument, "Unknown argument: {}", token);

        Argument* argument = iter->second;

        if (argument->isFlag()) {
          if (inlineValue)
            ERR_FMT(error::SlowErrorCode::InvalidArgument, "Argument {} does not take a value", token);

          argument->markUsed();
          continue;
        }

        if (inlineValue) {
          TRY_VOID(argument->setValue(std::move(*inlineValue)));
          continue;
        }

        const bool hasNext = i + 1 < args.size() && !args[i + 1].starts_with('-');

        if (hasNext)
          TRY_VOID(argument->setValue(args[++i]));
        else if (argument->acceptsImplicit())
          argument->markUsed();
        else
          ERR_FMT(error::SlowErrorCode::InvalidArgument, "Argument {} requires a value", token);
      }

      return {};
    }

    /**
     * @brief Parses and then populates every bound member.
     */
    template <typename ArgsT>
    auto parseInto(const ArgsT& args) -> types::Result<> {
      TRY_VOID(parseArgs(args));
      applyBindings();
      return {};
    }

    auto applyBindings() const -> types::Unit {
      for (const auto& arg : m_arguments)
        arg->applyBinding();
    }

    template <typename T = types::String>
    [[nodiscard]] auto get(types::StringView name) const -> T {
      const auto iter = m_argumentMap.find(name);
      return iter != m_argumentMap.end() ? iter->second->get<T>() : T {};
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    [[nodiscard]] auto getEnum(types::StringView name) const -> EnumType {
      const auto iter = m_argumentMap.find(name);
      return iter != m_argumentMap.end() ? iter->second->getEnum<EnumType>() : magic_enum::enum_values<EnumType>()[0];
    }

    [[nodiscard]] auto isUsed(types::StringView name) const -> bool {
      const auto iter = m_argumentMap.find(name);
      return iter != m_argumentMap.end() && iter->second->isUsed();
    }

    [[nodiscard]] auto helpRequested() const -> bool {
      return isUsed("--help");
    }

    [[nodiscard]] auto versionRequested() const -> bool {
      return isUsed("--version");
    }

    [[nodiscard]] auto getVersion() const -> const types::String& {
      return m_version;
    }

    [[nodiscard]] auto helpText() const -> types::String {
      types::String out = std::format("Usage: {}", m_programName);

      for (const auto& arg : m_arguments) {
        out += std::format(" [{}", arg->getPrimaryName());
        if (arg->acceptsImplicit())
          out += " [VALUE]";
        else if (!arg->isFlag())
          out += " VALUE";
        out += ']';
      }

      out += "\n\nArguments:\n";

      for (const auto& arg : m_arguments) {
        types::String names;
        for (const types::String& name : arg->getNames()) {
          if (!names.empty())
            names += ", ";
          names += name;
        }

        out += std::format("  {}{}\n", names, arg->isFlag() ? "" : (arg->acceptsImplicit() ? " [VALUE]" : " VALUE"));

        if (!arg->getHelpText().empty())
          out += std::format("    {}\n", arg->getHelpText());

        if (const types::Option<ArgChoices>& choices = arg->getChoices()) {
          types::String joined;
          for (const types::String& choice : *choices) {
            if (!joined.empty())
              joined += ", ";
            joined += choice;
          }
          out += std::format("    Available values: {}\n", joined);
        }
      }

      return out;
    }

    auto printHelp() const -> types::Unit {
      logging::Print(helpText());
    }

   private:
    types::String                              m_programName;
    types::String                              m_version;
    types::Vec<types::UniquePointer<Argument>> m_arguments;
    types::Map<types::String, Argument*>       m_argumentMap;
  };
} // namespace slowfetch::utils::argparse
