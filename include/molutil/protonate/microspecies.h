//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOLUTIL_PROTONATE_MICROSPECIES_H_
#define MOLUTIL_PROTONATE_MICROSPECIES_H_

//! @cond
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <absl/types/span.h>
//! @endcond

#include "molutil/engine/engine.h"

namespace molutil {
/**
 * @brief Compute the major protonation/tautomeric microspecies of a structure
 *        at the given pH.
 *
 * @param engine The chemistry engine.
 * @param structure The input structure.
 * @param in_format The format of \p structure, e.g. "smiles" or "inchi".
 * @param out_format The format of the result.
 * @param config The protonation parameters.
 * @return The major microspecies in \p out_format. For line formats (see
 *         is_line_format()), only the first line of the serialized structure,
 *         stripped of surrounding whitespace, is returned.
 *
 * The structure is dearomatized before protonation. Parse errors and engine
 * errors are returned as-is.
 */
extern absl::StatusOr<std::string>
compute_major_microspecies(const ChemistryEngine &engine,
                           std::string_view structure,
                           std::string_view in_format,
                           std::string_view out_format,
                           const ProtonationConfig &config = {});

/**
 * @brief Compute the major microspecies of multiple structures.
 *
 * @return The major microspecies, in the order of \p structures.
 *
 * The structures are processed in order. The first failure aborts the whole
 * batch; its status is returned with the index of the failing structure
 * prepended to the message, and no partial results are returned.
 */
extern absl::StatusOr<std::vector<std::string>>
compute_major_microspecies_batch(const ChemistryEngine &engine,
                                 absl::Span<const std::string> structures,
                                 std::string_view in_format,
                                 std::string_view out_format,
                                 const ProtonationConfig &config = {});

/**
 * @brief Convert a structure to another format.
 *
 * @return The structure in \p out_format. The same first-line rule as in
 *         compute_major_microspecies() applies.
 */
extern absl::StatusOr<std::string> convert_structure(
    const ChemistryEngine &engine, std::string_view structure,
    std::string_view in_format, std::string_view out_format);
}  // namespace molutil

#endif /* MOLUTIL_PROTONATE_MICROSPECIES_H_ */
