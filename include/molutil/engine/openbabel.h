//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOLUTIL_ENGINE_OPENBABEL_H_
#define MOLUTIL_ENGINE_OPENBABEL_H_

//! @cond
#include <memory>
#include <string>
#include <string_view>

#include <absl/base/attributes.h>
#include <absl/base/thread_annotations.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/synchronization/mutex.h>
//! @endcond

#include "molutil/depict/annotation.h"
#include "molutil/engine/engine.h"
#include "molutil/engine/structure.h"

namespace molutil {
/**
 * @brief Chemistry engine backed by Open Babel 3.
 *
 * Registered as `openbabel` and `ob`.
 *
 * Format names are Open Babel format ids (`smi`, `smiles`, `can`, `inchi`,
 * `mol`, `sdf`, `svg`, `png`, ...). Protonation uses the Open Babel pH model
 * (equivalent to `obabel -p <pH>`). The pH model has no tautomer search, so
 * ProtonationConfig::major_tautomer has no effect.
 *
 * The render configuration maps to the output options of the image formats:
 *
 * | RenderConfig                    | Option        |
 * |---------------------------------|---------------|
 * | `monochrome`                    | `u`           |
 * | `show_atom_numbers`             | `i`           |
 * | `transparent_background`        | `b none`      |
 * | `margin == 0`                   | `m`           |
 * | `width`, `height`               | `w`, `h`      |
 * | any atom label                  | `A`           |
 * | `!include_header` (vector only) | `x`           |
 *
 * The molecule title is never drawn (`d`). Open Babel always scales the
 * depiction to fit the image, so `max_scale` is not applicable, and labels
 * are drawn at the atom font size, so `label_font_size` is ignored. Atom
 * labels are drawn as colored atom aliases. Set colors are attached as
 * `color` properties of the atoms and bonds; the depiction honors them unless
 * the `U` option is given, which is therefore never set.
 *
 * All calls into Open Babel are serialized with a mutex, as the toolkit keeps
 * global state (plugin tables, pH model).
 */
class OpenBabelEngine final: public ChemistryEngine {
public:
  OpenBabelEngine() = default;

  absl::StatusOr<std::unique_ptr<Structure>>
  parse(std::string_view text, std::string_view format) const override;

  absl::StatusOr<std::string> write(const Structure &mol,
                                    std::string_view format) const override;

  absl::Status dearomatize(Structure &mol) const override;

  absl::Status protonate(Structure &mol,
                         const ProtonationConfig &config) const override;

  absl::StatusOr<RenderedImage> render(Structure &mol,
                                       const DepictionAnnotations &annot,
                                       const RenderConfig &config) const override;

  std::string_view name() const override { return "openbabel"; }

private:
  void ensure_initialized() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  mutable absl::Mutex mutex_;
  mutable bool initialized_ ABSL_GUARDED_BY(mutex_) = false;

  static const bool kRegistered ABSL_ATTRIBUTE_UNUSED;
};
}  // namespace molutil

#endif /* MOLUTIL_ENGINE_OPENBABEL_H_ */
