//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOLUTIL_CORE_COLOR_H_
#define MOLUTIL_CORE_COLOR_H_

//! @cond
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
//! @endcond

namespace molutil {
/**
 * @brief A packed 24-bit RGB color (`0xRRGGBB`).
 *
 * Bits above the lowest 24 (e.g., an alpha channel of an ARGB integer) are
 * discarded on construction.
 */
class Color {
public:
  constexpr Color() noexcept = default;

  constexpr explicit Color(std::uint32_t rgb) noexcept: rgb_(rgb & kMask) { }

  constexpr Color(std::uint8_t r, std::uint8_t g, std::uint8_t b) noexcept
      : rgb_((static_cast<std::uint32_t>(r) << 16)
             | (static_cast<std::uint32_t>(g) << 8) | b) { }

  constexpr std::uint32_t rgb() const noexcept { return rgb_; }

  constexpr std::uint8_t red() const noexcept { return (rgb_ >> 16) & 0xFF; }
  constexpr std::uint8_t green() const noexcept { return (rgb_ >> 8) & 0xFF; }
  constexpr std::uint8_t blue() const noexcept { return rgb_ & 0xFF; }

  /**
   * @brief Format the color as a CSS-style hex string.
   * @return The color in `#rrggbb` format (lowercase).
   */
  std::string hex() const;

  /**
   * @brief Parse a color.
   *
   * @param str The color string. Accepts `#rrggbb`, `0xrrggbb` (case
   *        insensitive), or a decimal integer.
   * @return The parsed color, or `std::nullopt` if \p str is not a valid
   *         color.
   */
  static std::optional<Color> parse(std::string_view str);

private:
  constexpr static std::uint32_t kMask = 0xFFFFFF;

  std::uint32_t rgb_ = 0;
};

constexpr bool operator==(Color lhs, Color rhs) noexcept {
  return lhs.rgb() == rhs.rgb();
}

constexpr bool operator!=(Color lhs, Color rhs) noexcept {
  return lhs.rgb() != rhs.rgb();
}
}  // namespace molutil

#endif /* MOLUTIL_CORE_COLOR_H_ */
