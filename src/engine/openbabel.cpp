//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "molutil/engine/openbabel.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/log/absl_log.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/synchronization/mutex.h>

#include <openbabel/alias.h>
#include <openbabel/atom.h>
#include <openbabel/bond.h>
#include <openbabel/elements.h>
#include <openbabel/generic.h>
#include <openbabel/kekulize.h>
#include <openbabel/mol.h>
#include <openbabel/obconversion.h>
#include <openbabel/obiter.h>
#include <openbabel/oberror.h>

#include "molutil/core/color.h"
#include "molutil/core/status.h"
#include "molutil/depict/annotation.h"
#include "molutil/engine/engine.h"
#include "molutil/engine/structure.h"

namespace molutil {
namespace {
namespace ob = OpenBabel;

class OpenBabelStructure final: public Structure {
public:
  int num_atoms() const override { return static_cast<int>(mol_.NumAtoms()); }

  std::string_view atom_symbol(int atom) const override {
    return ob::OBElements::GetSymbol(get_atom(atom)->GetAtomicNum());
  }

  bool has_bond(int src, int dst) const override {
    return mol_.GetBond(src + 1, dst + 1) != nullptr;
  }

  int implicit_hydrogens(int atom) const override {
    return static_cast<int>(get_atom(atom)->GetImplicitHCount());
  }

  int formal_charge(int atom) const override {
    return get_atom(atom)->GetFormalCharge();
  }

  ob::OBMol &mol() { return mol_; }
  const ob::OBMol &mol() const { return mol_; }

  bool kekulized() const { return kekulized_; }
  void set_kekulized() { kekulized_ = true; }

private:
  ob::OBAtom *get_atom(int atom) const { return mol_.GetAtom(atom + 1); }

  ob::OBMol mol_;
  bool kekulized_ = false;
};

OpenBabelStructure &ob_structure(Structure &mol) {
  return static_cast<OpenBabelStructure &>(mol);
}

const OpenBabelStructure &ob_structure(const Structure &mol) {
  return static_cast<const OpenBabelStructure &>(mol);
}

bool is_smiles_family(std::string_view format) {
  return format == "smi" || format == "smiles" || format == "can";
}

// Collects the errors the toolkit reported since the last clear.
std::string toolkit_errors() {
  std::vector<std::string> msgs =
      ob::obErrorLog.GetMessagesOfLevel(ob::obError);
  ob::obErrorLog.ClearLog();
  return absl::StrJoin(msgs, "; ");
}

std::string with_toolkit_errors(std::string_view msg) {
  std::string errors = toolkit_errors();
  if (errors.empty())
    return std::string(msg);
  return absl::StrCat(msg, ": ", errors);
}

void set_color_data(ob::OBBase *obj, Color color) {
  // The depiction looks for a "color" pair on atoms and bonds
  auto *data = new ob::OBPairData();
  data->SetAttribute("color");
  data->SetValue(color.hex());
  obj->SetData(data);
}

void apply_annotations(ob::OBMol &mol, const DepictionAnnotations &annot) {
  for (const ResolvedLabel &label: annot.labels()) {
    ob::OBAtom *atom = mol.GetAtom(label.atom + 1);

    auto *alias = new ob::AliasData();
    alias->SetAlias(label.text);
    alias->SetColor(label.color.hex());
    atom->SetData(alias);
  }

  if (annot.num_atom_sets() > 0) {
    for (int i = 0; i < static_cast<int>(mol.NumAtoms()); ++i) {
      std::optional<Color> color = annot.atom_color(i);
      if (color)
        set_color_data(mol.GetAtom(i + 1), *color);
    }
  }

  if (annot.num_bond_sets() > 0) {
    for (auto it = mol.BeginBonds(); it != mol.EndBonds(); ++it) {
      ob::OBBond *bond = *it;
      std::optional<Color> color =
          annot.bond_color(static_cast<int>(bond->GetBeginAtomIdx()) - 1,
                           static_cast<int>(bond->GetEndAtomIdx()) - 1);
      if (color)
        set_color_data(bond, *color);
    }
  }
}

bool is_hydrogen(const ob::OBAtom *atom) {
  return atom->GetAtomicNum() == ob::OBElements::Hydrogen;
}

// Keyed by atom id, which survives the deletions done by the pH model.
absl::flat_hash_map<unsigned long, int>
count_explicit_hydrogens(ob::OBMol &mol) {
  absl::flat_hash_map<unsigned long, int> counts;
  FOR_ATOMS_OF_MOL (atom, mol) {
    if (is_hydrogen(&*atom))
      continue;

    int count = 0;
    FOR_NBORS_OF_ATOM (nbr, &*atom)
      count += static_cast<int>(is_hydrogen(&*nbr));
    if (count > 0)
      counts[atom->GetId()] = count;
  }
  return counts;
}

// Keeps at most as many hydrogens on each heavy atom as it had explicitly
// before protonation; the rest become implicit again.
bool delete_added_hydrogens(
    ob::OBMol &mol, const absl::flat_hash_map<unsigned long, int> &counts) {
  std::vector<ob::OBAtom *> added;
  FOR_ATOMS_OF_MOL (atom, mol) {
    if (is_hydrogen(&*atom))
      continue;

    auto it = counts.find(atom->GetId());
    int keep = it != counts.end() ? it->second : 0;
    FOR_NBORS_OF_ATOM (nbr, &*atom) {
      if (!is_hydrogen(&*nbr))
        continue;

      if (keep > 0) {
        --keep;
      } else {
        added.push_back(&*nbr);
      }
    }
  }

  ABSL_VLOG(2) << "Removing " << added.size() << " added hydrogens";

  bool ok = true;
  for (ob::OBAtom *h: added)
    ok &= mol.DeleteHydrogen(h);
  return ok;
}

void set_render_options(ob::OBConversion &conv,
                        const DepictionAnnotations &annot,
                        const RenderConfig &config) {
  constexpr auto kOut = ob::OBConversion::OUTOPTIONS;

  conv.AddOption("d", kOut);
  // draw labels (aliases) in place of the element symbols
  if (!annot.labels().empty())
    conv.AddOption("A", kOut);
  conv.AddOption("w", kOut, absl::StrCat(config.width).c_str());
  conv.AddOption("h", kOut, absl::StrCat(config.height).c_str());

  if (config.monochrome)
    conv.AddOption("u", kOut);
  if (config.show_atom_numbers)
    conv.AddOption("i", kOut);
  if (config.transparent_background)
    conv.AddOption("b", kOut, "none");
  if (config.margin == 0)
    conv.AddOption("m", kOut);
  if (is_vector_format(config.format) && !config.include_header)
    conv.AddOption("x", kOut);
}
}  // namespace

const bool OpenBabelEngine::kRegistered =
    register_engine<OpenBabelEngine>({ "openbabel", "ob" });

void OpenBabelEngine::ensure_initialized() const {
  if (initialized_)
    return;

  ob::obErrorLog.SetOutputLevel(ob::obError);

  ob::OBConversion conv;
  ABSL_LOG_IF(WARNING, !conv.SetInFormat("smi"))
      << "Open Babel format plugins are not available; check BABEL_LIBDIR";

  initialized_ = true;
}

absl::StatusOr<std::unique_ptr<Structure>>
OpenBabelEngine::parse(std::string_view text, std::string_view format) const {
  absl::MutexLock lock(&mutex_);
  ensure_initialized();

  ob::OBConversion conv;
  const std::string fmt(format);
  if (!conv.SetInFormat(fmt.c_str()))
    return parse_error(absl::StrCat("Unknown structure format: ", format));

  auto mol = std::make_unique<OpenBabelStructure>();
  ob::obErrorLog.ClearLog();
  if (!conv.ReadString(&mol->mol(), std::string(text)) || mol->empty()) {
    return parse_error(with_toolkit_errors(
        absl::StrCat("Invalid ", format, " structure \"", text, "\"")));
  }

  return std::unique_ptr<Structure>(std::move(mol));
}

absl::StatusOr<std::string> OpenBabelEngine::write(
    const Structure &mol, std::string_view format) const {
  absl::MutexLock lock(&mutex_);
  ensure_initialized();

  ob::OBConversion conv;
  const std::string fmt(format);
  if (!conv.SetOutFormat(fmt.c_str()))
    return parse_error(absl::StrCat("Unknown structure format: ", format));

  const OpenBabelStructure &obmol = ob_structure(mol);
  if (is_smiles_family(fmt)) {
    // title
    conv.AddOption("n", ob::OBConversion::OUTOPTIONS);
    if (obmol.kekulized())
      conv.AddOption("k", ob::OBConversion::OUTOPTIONS);
  }

  // The writers may perceive and cache properties on the molecule.
  ob::OBMol copy(obmol.mol());
  ob::obErrorLog.ClearLog();
  std::string out = conv.WriteString(&copy, false);
  if (out.empty()) {
    return engine_error(with_toolkit_errors(
        absl::StrCat("Failed to write structure in ", format, " format")));
  }

  return out;
}

absl::Status OpenBabelEngine::dearomatize(Structure &mol) const {
  absl::MutexLock lock(&mutex_);
  ensure_initialized();

  OpenBabelStructure &obmol = ob_structure(mol);
  ob::obErrorLog.ClearLog();
  if (!ob::OBKekulize(&obmol.mol()))
    return engine_error(with_toolkit_errors("Failed to kekulize structure"));

  obmol.set_kekulized();
  return absl::OkStatus();
}

absl::Status OpenBabelEngine::protonate(Structure &mol,
                                        const ProtonationConfig &config) const {
  absl::MutexLock lock(&mutex_);
  ensure_initialized();

  ABSL_LOG_IF_FIRST_N(WARNING, config.major_tautomer, 1)
      << "Tautomer search is not supported by Open Babel; ignoring";

  ob::OBMol &obmol = ob_structure(mol).mol();

  absl::flat_hash_map<unsigned long, int> explicit_hs;
  if (config.keep_explicit_hydrogens)
    explicit_hs = count_explicit_hydrogens(obmol);

  ob::obErrorLog.ClearLog();
  // Same as obabel -p <pH>
  if (!obmol.AddHydrogens(false, true, config.ph)) {
    return engine_error(with_toolkit_errors(
        absl::StrCat("Failed to protonate structure at pH ", config.ph)));
  }

  const bool deleted = config.keep_explicit_hydrogens
                           ? delete_added_hydrogens(obmol, explicit_hs)
                           : obmol.DeleteHydrogens();
  if (!deleted) {
    return engine_error(
        with_toolkit_errors("Failed to remove explicit hydrogens"));
  }

  ABSL_VLOG(2) << "Protonated structure at pH " << config.ph;
  return absl::OkStatus();
}

absl::StatusOr<RenderedImage>
OpenBabelEngine::render(Structure &mol, const DepictionAnnotations &annot,
                        const RenderConfig &config) const {
  absl::MutexLock lock(&mutex_);
  ensure_initialized();

  ob::OBConversion conv;
  if (!conv.SetOutFormat(config.format.c_str()))
    return parse_error(absl::StrCat("Unknown image format: ", config.format));

  if (config.max_scale != RenderConfig().max_scale) {
    ABSL_VLOG(1) << "Open Babel always fits the depiction to the image; "
                    "ignoring max_scale";
  }
  if (config.label_font_size != RenderConfig().label_font_size) {
    ABSL_VLOG(1) << "Open Babel draws labels at the atom font size; "
                    "ignoring label_font_size";
  }

  ob::OBMol &obmol = ob_structure(mol).mol();
  apply_annotations(obmol, annot);
  set_render_options(conv, annot, config);

  ob::obErrorLog.ClearLog();
  std::string data = conv.WriteString(&obmol, false);
  if (data.empty()) {
    return engine_error(with_toolkit_errors(
        absl::StrCat("Failed to render structure as ", config.format)));
  }

  return RenderedImage { config.format, std::move(data),
                         is_vector_format(config.format) };
}
}  // namespace molutil
