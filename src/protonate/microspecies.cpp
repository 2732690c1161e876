//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "molutil/protonate/microspecies.h"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/log/absl_log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <absl/types/span.h>

#include "molutil/engine/engine.h"
#include "molutil/engine/structure.h"
#include "molutil/utils.h"

namespace molutil {
namespace {
absl::StatusOr<std::string> write_structure(const ChemistryEngine &engine,
                                            const Structure &mol,
                                            std::string_view format) {
  absl::StatusOr<std::string> text = engine.write(mol, format);
  if (!text.ok())
    return text.status();

  if (is_line_format(format))
    return std::string(first_line(*text));

  return text;
}
}  // namespace

absl::StatusOr<std::string>
compute_major_microspecies(const ChemistryEngine &engine,
                           std::string_view structure,
                           std::string_view in_format,
                           std::string_view out_format,
                           const ProtonationConfig &config) {
  absl::StatusOr<std::unique_ptr<Structure>> mol =
      engine.parse(structure, in_format);
  if (!mol.ok()) {
    ABSL_LOG(WARNING) << "Failed to parse structure: " << mol.status();
    return mol.status();
  }

  absl::Status status = engine.dearomatize(**mol);
  if (!status.ok()) {
    ABSL_LOG(WARNING) << "Failed to dearomatize structure: " << status;
    return status;
  }

  status = engine.protonate(**mol, config);
  if (!status.ok()) {
    ABSL_LOG(WARNING) << "Failed to compute major microspecies at pH "
                      << config.ph << ": " << status;
    return status;
  }

  return write_structure(engine, **mol, out_format);
}

absl::StatusOr<std::vector<std::string>>
compute_major_microspecies_batch(const ChemistryEngine &engine,
                                 absl::Span<const std::string> structures,
                                 std::string_view in_format,
                                 std::string_view out_format,
                                 const ProtonationConfig &config) {
  std::vector<std::string> results;
  results.reserve(structures.size());

  for (std::size_t i = 0; i < structures.size(); ++i) {
    absl::StatusOr<std::string> result = compute_major_microspecies(
        engine, structures[i], in_format, out_format, config);
    if (!result.ok()) {
      return absl::Status(result.status().code(),
                          absl::StrCat("structure ", i, ": ",
                                       result.status().message()));
    }

    results.push_back(*std::move(result));
  }

  return results;
}

absl::StatusOr<std::string> convert_structure(const ChemistryEngine &engine,
                                              std::string_view structure,
                                              std::string_view in_format,
                                              std::string_view out_format) {
  absl::StatusOr<std::unique_ptr<Structure>> mol =
      engine.parse(structure, in_format);
  if (!mol.ok()) {
    ABSL_LOG(WARNING) << "Failed to parse structure: " << mol.status();
    return mol.status();
  }

  return write_structure(engine, **mol, out_format);
}
}  // namespace molutil
