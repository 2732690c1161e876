//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "molutil/python/config.h"
#include "molutil/python/core_module.h"

namespace molutil {
namespace python_internal {
namespace {
MOLUTIL_PYTHON_MODULE(m) {
  bind_element(m);
  bind_formula(m);
  bind_chem(m);
}
}  // namespace
}  // namespace python_internal
}  // namespace molutil
