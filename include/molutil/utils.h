//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOLUTIL_UTILS_H_
#define MOLUTIL_UTILS_H_

//! @cond
#include <cmath>
#include <cstddef>
#include <filesystem>
#include <string_view>

#include <absl/base/optimization.h>
#include <absl/strings/ascii.h>
//! @endcond

namespace molutil {
inline std::string_view extension_no_dot(const std::filesystem::path &ext) {
  const std::string_view ext_view = ext.native();
  if (ABSL_PREDICT_TRUE(!ext_view.empty())) {
    return ext_view.substr(1);
  }
  return ext_view;
}

constexpr std::string_view slice(std::string_view str, std::size_t begin,
                                 std::size_t end) {
  return str.substr(begin, end - begin);
}

/**
 * @brief Get the first line of a (possibly multi-line) string, with leading
 *        and trailing whitespace removed.
 *
 * @param str The string.
 * @return A view of the first line. Empty if \p str is empty.
 */
inline std::string_view first_line(std::string_view str) {
  return absl::StripAsciiWhitespace(slice(str, 0, str.find('\n')));
}

namespace internal {
  template <class F>
  bool is_integral(F x) {
    return std::trunc(x) == x;
  }
}  // namespace internal
}  // namespace molutil

#endif /* MOLUTIL_UTILS_H_ */
