//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "molutil/depict/depict.h"

#include <memory>

#include <absl/log/absl_log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

#include "molutil/depict/annotation.h"
#include "molutil/engine/engine.h"
#include "molutil/engine/structure.h"

namespace molutil {
absl::StatusOr<RenderedImage> render_molecule(const ChemistryEngine &engine,
                                              const DepictionRequest &req) {
  const RenderConfig &config = req.config;
  if (config.width <= 0 || config.height <= 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid image size: ", config.width, "x", config.height));
  }

  absl::StatusOr<std::unique_ptr<Structure>> mol =
      engine.parse(req.structure, req.format);
  if (!mol.ok()) {
    ABSL_LOG(WARNING) << "Failed to parse structure: " << mol.status();
    return mol.status();
  }

  DepictionAnnotations annot = resolve_annotations(
      **mol, req.atom_labels, req.atom_sets, req.bond_sets);
  ABSL_VLOG(1) << "Resolved " << annot.labels().size() << " of "
               << req.atom_labels.size() << " labels";

  absl::StatusOr<RenderedImage> image = engine.render(**mol, annot, config);
  ABSL_LOG_IF(WARNING, !image.ok())
      << "Failed to render structure: " << image.status();
  return image;
}
}  // namespace molutil
