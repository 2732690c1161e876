//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOLUTIL_CORE_STATUS_H_
#define MOLUTIL_CORE_STATUS_H_

//! @cond
#include <string_view>

#include <absl/status/status.h>
//! @endcond

namespace molutil {
/**
 * @brief Create a status for a structure that could not be read.
 *
 * Reported when the structure text is invalid for the declared format, or
 * when the format name is not recognized by the engine.
 */
inline absl::Status parse_error(std::string_view message) {
  return absl::InvalidArgumentError(message);
}

/**
 * @brief Create a status for a failure inside the chemistry engine
 *        (protonation, serialization, or rendering).
 */
inline absl::Status engine_error(std::string_view message) {
  return absl::InternalError(message);
}

inline bool is_parse_error(const absl::Status &status) {
  return absl::IsInvalidArgument(status);
}

inline bool is_engine_error(const absl::Status &status) {
  return absl::IsInternal(status);
}
}  // namespace molutil

#endif /* MOLUTIL_CORE_STATUS_H_ */
