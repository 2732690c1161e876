//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef MOLUTIL_ENGINE_ENGINE_H_
#define MOLUTIL_ENGINE_ENGINE_H_

//! @cond
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/base/attributes.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
//! @endcond

#include "molutil/depict/annotation.h"
#include "molutil/engine/structure.h"

namespace molutil {
struct ProtonationConfig {
  double ph = 7.4;
  // Take the major tautomeric form into account
  bool major_tautomer = false;
  bool keep_explicit_hydrogens = false;
};

/**
 * @brief Parameters of a depiction.
 *
 * The defaults reproduce the usual depiction setup:
 * monochrome atoms, transparent background, maximum scale 1000 and no margin.
 */
struct RenderConfig {
  // Image format name, e.g. "svg" or "png"
  std::string format = "svg";
  int width = 200;
  int height = 200;
  // Vector formats only; if false, the XML declaration is omitted
  bool include_header = true;
  bool show_atom_numbers = false;
  bool monochrome = true;
  bool transparent_background = true;
  // Upper bound of the zoom factor used to fit the molecule in the image
  int max_scale = 1000;
  // Font size of atom labels, relative to the bond length
  double label_font_size = 0.4;
  int margin = 0;
};

/**
 * @brief Test whether an image format is a vector (markup) format.
 *
 * @param format The image format name (case insensitive).
 * @return `true` for vector formats, whose output is text.
 */
extern bool is_vector_format(std::string_view format);

/**
 * @brief Test whether a structure format is a single-line identifier or line
 *        notation format, for which only the first output line is kept.
 *
 * @param format The structure format name (case insensitive).
 */
extern bool is_line_format(std::string_view format);

/**
 * @brief A rendered image.
 */
struct RenderedImage {
  std::string format;
  // Raw bytes for raster formats, markup text for vector formats
  std::string data;
  // true if data is text (vector format)
  bool text;
};

/**
 * @brief The interface to an external chemistry toolkit.
 *
 * None of the structural chemistry is implemented in this library; an engine
 * implementation adapts a toolkit's parser, serializer, protonation model and
 * renderer.
 *
 * All methods taking a Structure require that the structure was created by
 * the same engine.
 *
 * Implementations must be safe to call from multiple threads; if the
 * underlying toolkit is not, the implementation must serialize the calls.
 */
class ChemistryEngine {
public:
  ChemistryEngine() = default;
  ChemistryEngine(const ChemistryEngine &) = delete;
  ChemistryEngine &operator=(const ChemistryEngine &) = delete;
  ChemistryEngine(ChemistryEngine &&) noexcept = delete;
  ChemistryEngine &operator=(ChemistryEngine &&) noexcept = delete;
  virtual ~ChemistryEngine() noexcept = default;

  /**
   * @brief Parse a structure.
   *
   * @param text The structure text.
   * @param format The format name of \p text, e.g. "smiles" or "inchi".
   * @return The parsed structure, or a parse error (see parse_error()) if the
   *         format is unknown or the text is not valid in the format.
   */
  virtual absl::StatusOr<std::unique_ptr<Structure>>
  parse(std::string_view text, std::string_view format) const = 0;

  /**
   * @brief Serialize a structure.
   *
   * @param mol The structure.
   * @param format The output format name.
   * @return The serialized text, as written by the toolkit. Might contain
   *         multiple lines.
   */
  virtual absl::StatusOr<std::string> write(const Structure &mol,
                                            std::string_view format) const = 0;

  /**
   * @brief Replace aromatic bonds with explicit single/double bonds.
   */
  ABSL_MUST_USE_RESULT virtual absl::Status dearomatize(Structure &mol) const = 0;

  /**
   * @brief Replace the structure with its major microspecies at the given pH.
   * @pre The structure is dearomatized.
   */
  ABSL_MUST_USE_RESULT virtual absl::Status
  protonate(Structure &mol, const ProtonationConfig &config) const = 0;

  /**
   * @brief Render a structure.
   *
   * @param mol The structure. The engine may attach annotation data and 2D
   *        coordinates to the structure.
   * @param annot Resolved annotations of \p mol.
   * @param config Render parameters.
   * @return The rendered image, unmodified.
   */
  virtual absl::StatusOr<RenderedImage>
  render(Structure &mol, const DepictionAnnotations &annot,
         const RenderConfig &config) const = 0;

  /**
   * @brief Get the name of the engine.
   */
  virtual std::string_view name() const = 0;
};

/**
 * @brief The process-wide registry of chemistry engines.
 */
class EngineRegistry {
public:
  EngineRegistry() = delete;

  /**
   * @brief Find the engine registered with the given name.
   * @param name The name of the engine.
   * @return A pointer to the engine, or nullptr if no engine is registered for
   *         the given name.
   */
  static const ChemistryEngine *find(std::string_view name);

  /**
   * @brief Register an engine for the given name(s).
   *
   * @param engine The engine instance to register.
   * @param names The name(s) to register the engine for.
   * @return Always true.
   * @note The registry takes the ownership of the engine; registered engines
   *       live until the end of the program.
   * @note This function is not thread-safe. Some synchronization mechanism
   *       must be used to call register_*() functions from multiple threads.
   */
  static bool register_engine(std::unique_ptr<ChemistryEngine> engine,
                              const std::vector<std::string> &names);

  /**
   * @brief Register a registered engine for an alias name.
   *
   * @param engine An engine returned by find().
   * @param alias The alias name.
   */
  static void register_for(const ChemistryEngine *engine,
                           std::string_view alias);

  /**
   * @brief Get the default engine.
   * @return The first registered engine, or nullptr if no engine is
   *         registered.
   */
  static const ChemistryEngine *default_engine();

  /**
   * @brief Find an engine, falling back to the default engine for empty
   *        names.
   * @return The engine, or a NotFound error.
   */
  static absl::StatusOr<const ChemistryEngine *>
  find_or_default(std::string_view name);
};

template <class EngineImpl>
bool register_engine(const std::vector<std::string> &names) {
  return EngineRegistry::register_engine(std::make_unique<EngineImpl>(),
                                         names);
}
}  // namespace molutil

#endif /* MOLUTIL_ENGINE_ENGINE_H_ */
