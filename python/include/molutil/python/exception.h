//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOLUTIL_PYTHON_EXCEPTION_H_
#define MOLUTIL_PYTHON_EXCEPTION_H_

#include <stdexcept>
#include <string>
#include <utility>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <pybind11/pybind11.h>

#include "molutil/core/status.h"
#include "molutil/python/config.h"

namespace molutil {
namespace python_internal {
/**
 * @brief Raise the Python exception matching a non-ok status.
 *
 * Parse errors raise ValueError, unknown names (engines, elements) raise
 * KeyError, and everything else raises RuntimeError.
 */
[[noreturn]] inline void throw_status(const absl::Status &status) {
  std::string msg(status.message());

  if (is_parse_error(status))
    throw py::value_error(msg);
  if (absl::IsNotFound(status))
    throw py::key_error(msg);

  throw std::runtime_error(msg);
}

inline void check_status(const absl::Status &status) {
  if (!status.ok())
    throw_status(status);
}

template <class T>
T value_or_throw(absl::StatusOr<T> &&result) {
  if (!result.ok())
    throw_status(result.status());
  return *std::move(result);
}
}  // namespace python_internal
}  // namespace molutil

#endif /* MOLUTIL_PYTHON_EXCEPTION_H_ */
