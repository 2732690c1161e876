//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "molutil/core/color.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_format.h>

namespace molutil {
std::string Color::hex() const {
  return absl::StrFormat("#%06x", rgb_);
}

std::optional<Color> Color::parse(std::string_view str) {
  str = absl::StripAsciiWhitespace(str);

  std::uint32_t value;
  if (absl::ConsumePrefix(&str, "#")) {
    if (str.size() != 6 || !absl::SimpleHexAtoi(str, &value))
      return std::nullopt;
    return Color(value);
  }

  if (absl::StartsWithIgnoreCase(str, "0x")) {
    str.remove_prefix(2);
    if (str.empty() || str.size() > 8 || !absl::SimpleHexAtoi(str, &value))
      return std::nullopt;
    return Color(value);
  }

  // Negative values are packed ARGB integers with the high alpha bit set
  std::int64_t signed_value;
  if (!absl::SimpleAtoi(str, &signed_value))
    return std::nullopt;

  return Color(static_cast<std::uint32_t>(signed_value));
}
}  // namespace molutil
