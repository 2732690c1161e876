//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "molutil/engine/engine.h"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/algorithm/container.h>
#include <absl/container/flat_hash_map.h>
#include <absl/log/absl_log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/types/span.h>

namespace molutil {
namespace {
absl::flat_hash_map<std::string, const ChemistryEngine *> &engine_registry() {
  static absl::flat_hash_map<std::string, const ChemistryEngine *> ret;
  return ret;
}

std::vector<std::unique_ptr<ChemistryEngine>> &engine_storage() {
  static std::vector<std::unique_ptr<ChemistryEngine>> engines;
  return engines;
}

constexpr std::string_view kVectorFormats[] = { "svg" };

constexpr std::string_view kLineFormats[] = {
  "smiles", "smi", "can", "inchi", "inchikey",
};

bool contains_lower(absl::Span<const std::string_view> names,
                    std::string_view format) {
  const std::string lower = absl::AsciiStrToLower(format);
  return absl::c_linear_search(names, lower);
}
}  // namespace

bool is_vector_format(std::string_view format) {
  return contains_lower(kVectorFormats, format);
}

bool is_line_format(std::string_view format) {
  return contains_lower(kLineFormats, format);
}

const ChemistryEngine *EngineRegistry::find(std::string_view name) {
  const auto &reg = engine_registry();

  auto it = reg.find(name);
  if (it == reg.end()) {
    return nullptr;
  }
  return it->second;
}

bool EngineRegistry::register_engine(std::unique_ptr<ChemistryEngine> engine,
                                     const std::vector<std::string> &names) {
  ChemistryEngine *e = engine_storage().emplace_back(std::move(engine)).get();
  // GCOV_EXCL_START
  ABSL_LOG_IF(WARNING, names.empty()) << "Empty name list for engine";
  // GCOV_EXCL_STOP

  for (const auto &name: names) {
    register_for(e, name);
  }

  return true;
}

void EngineRegistry::register_for(const ChemistryEngine *engine,
                                  std::string_view alias) {
  auto [_, inserted] = engine_registry().insert_or_assign(alias, engine);
  // GCOV_EXCL_START
  ABSL_LOG_IF(WARNING, !inserted)
      << "Duplicate engine name: " << alias
      << ". Overwriting existing engine (is this intended?).";
  // GCOV_EXCL_STOP
}

const ChemistryEngine *EngineRegistry::default_engine() {
  const auto &engines = engine_storage();
  return engines.empty() ? nullptr : engines.front().get();
}

absl::StatusOr<const ChemistryEngine *>
EngineRegistry::find_or_default(std::string_view name) {
  const ChemistryEngine *engine = name.empty() ? default_engine() : find(name);
  if (engine == nullptr) {
    return absl::NotFoundError(
        name.empty() ? std::string("No chemistry engine is registered")
                     : absl::StrCat("Unknown chemistry engine: ", name));
  }
  return engine;
}
}  // namespace molutil
