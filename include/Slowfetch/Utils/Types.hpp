/**
 * @file Types.hpp
 * @brief Defines various type aliases for commonly used types.
 *
 * Shorthand aliases over standard library types used throughout slowfetch.
 */

#pragma once

#include <ankerl/unordered_dense.h> // ankerl::unordered_dense::map (UnorderedMap)
#include <array>                    // std::array (Array)
#include <cstdint>                  // std::{uint8_t, uint16_t, uint32_t, uint64_t, int32_t, int64_t}
#include <expected>                 // std::expected
#include <functional>               // std::function (Fn)
#include <future>                   // std::future (Future)
#include <map>                      // std::map (Map)
#include <memory>                   // std::unique_ptr (UniquePointer)
#include <optional>                 // std::optional (Option)
#include <span>                     // std::span (Span)
#include <string>                   // std::string (String)
#include <string_view>              // std::string_view (StringView)
#include <utility>                  // std::pair (Pair)
#include <vector>                   // std::vector (Vec)

namespace slowfetch::utils {
  // Forward decl for Result and Err
  namespace error {
    struct SlowError;
  } // namespace error

  namespace types {
    using u8  = std::uint8_t;  ///< 8-bit unsigned integer.
    using u16 = std::uint16_t; ///< 16-bit unsigned integer.
    using u32 = std::uint32_t; ///< 32-bit unsigned integer.
    using u64 = std::uint64_t; ///< 64-bit unsigned integer.
    using i32 = std::int32_t;  ///< 32-bit signed integer.
    using i64 = std::int64_t;  ///< 64-bit signed integer.
    using f64 = double;        ///< 64-bit floating-point number.

    /**
     * @brief Alias for std::size_t.
     *
     * Unsigned size type, used for every width and height in the renderer.
     */
    using usize = std::size_t;

    using String     = std::string;      ///< Owning, mutable string.
    using StringView = std::string_view; ///< Non-owning view of a string.
    using CStr       = char;             ///< Single character type.
    using PCStr      = const char*;      ///< Pointer to a null-terminated C-style string.

    /**
     * @brief Alias for void.
     *
     * Represents a unit type.
     */
    using Unit = void;

    using Exception = std::exception; ///< Standard exception type.

    /**
     * @brief Alias for std::optional<Tp>.
     * @tparam Tp The type of the potential value.
     */
    template <typename Tp>
    using Option = std::optional<Tp>;

    /**
     * @brief Represents an empty optional value.
     */
    inline constexpr std::nullopt_t None = std::nullopt;

    /**
     * @brief Helper function to create an Option with a value.
     * @tparam Tp The type of the value.
     * @param value The value to wrap in an Option.
     * @return An Option containing the value.
     */
    template <typename Tp>
    constexpr auto Some(Tp&& value) -> Option<std::remove_cvref_t<Tp>> {
      return std::make_optional<std::remove_cvref_t<Tp>>(std::forward<Tp>(value));
    }

    template <typename Tp, usize sz>
    using Array = std::array<Tp, sz>;

    template <typename Tp>
    using Vec = std::vector<Tp>;

    /**
     * @brief Alias for std::span<Tp, sz>.
     *
     * Non-owning view over contiguous elements; the renderer takes its inputs this way.
     */
    template <typename Tp, usize sz = std::dynamic_extent>
    using Span = std::span<Tp, sz>;

    template <typename T1, typename T2>
    using Pair = std::pair<T1, T2>;

    /**
     * @brief Alias for std::map<Key, Val> with transparent comparison.
     */
    template <typename Key, typename Val>
    using Map = std::map<Key, Val, std::less<>>;

    /**
     * @brief Alias for ankerl::unordered_dense::map<Key, Val>.
     *
     * High-performance unordered map using Robin Hood hashing.
     */
    template <typename Key, typename Val>
    using UnorderedMap = ankerl::unordered_dense::map<Key, Val>;

    template <typename Tp, typename Dp = std::default_delete<Tp>>
    using UniquePointer = std::unique_ptr<Tp, Dp>;

    template <typename Tp>
    using Future = std::future<Tp>;

    template <typename Tp>
    using Fn = std::function<Tp>;

    /**
     * @typedef Result
     * @brief Alias for std::expected<Tp, Er>. Represents a value that can either be
     * a success value of type Tp or an error value of type Er.
     */
    template <typename Tp = Unit, typename Er = error::SlowError>
    using Result = std::expected<Tp, Er>;

    /**
     * @typedef Err
     * @brief Alias for std::unexpected<Er>. Used to construct a Result in an error state.
     */
    template <typename Er = error::SlowError>
    using Err = std::unexpected<Er>;
  } // namespace types
} // namespace slowfetch::utils
