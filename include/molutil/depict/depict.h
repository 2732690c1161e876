//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOLUTIL_DEPICT_DEPICT_H_
#define MOLUTIL_DEPICT_DEPICT_H_

//! @cond
#include <string>
#include <vector>

#include <absl/status/statusor.h>
//! @endcond

#include "molutil/depict/annotation.h"
#include "molutil/engine/engine.h"

namespace molutil {
struct DepictionRequest {
  std::string structure;
  // Format of the structure, e.g. "smiles" or "inchi"
  std::string format;
  std::vector<AtomLabel> atom_labels;
  std::vector<AtomSet> atom_sets;
  std::vector<BondSet> bond_sets;
  RenderConfig config;
};

/**
 * @brief Render a 2D depiction of a structure.
 *
 * @param engine The chemistry engine.
 * @param req The depiction request.
 * @return The image produced by the engine, without any post-processing.
 *
 * Labels, atom sets and bond sets are resolved against the parsed structure
 * with resolve_annotations(); references that do not resolve are ignored and
 * never fail the call. Returns an InvalidArgument error if the requested image
 * size is not positive, and propagates parse and engine errors.
 */
extern absl::StatusOr<RenderedImage>
render_molecule(const ChemistryEngine &engine, const DepictionRequest &req);
}  // namespace molutil

#endif /* MOLUTIL_DEPICT_DEPICT_H_ */
