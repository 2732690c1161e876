//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <pybind11/gil.h>
#include <pybind11/pybind11.h>
#include <pybind11/pytypes.h>
#include <pybind11/stl.h>

#include "molutil/core/color.h"
#include "molutil/depict/annotation.h"
#include "molutil/depict/depict.h"
#include "molutil/engine/engine.h"
#include "molutil/protonate/microspecies.h"
#include "molutil/python/config.h"
#include "molutil/python/core_module.h"
#include "molutil/python/exception.h"

namespace molutil {
namespace python_internal {
namespace {
const ChemistryEngine &get_engine(std::string_view name) {
  return *value_or_throw(EngineRegistry::find_or_default(name));
}

template <class T>
T dict_item(const py::dict &d, const char *key, std::string_view what) {
  if (!d.contains(key)) {
    throw py::value_error(
        absl::StrCat(what, " is missing the key \"", key, "\""));
  }
  return d[key].cast<T>();
}

Color color_from_py(py::handle obj) {
  if (py::isinstance<py::str>(obj)) {
    std::string str = obj.cast<std::string>();
    auto color = Color::parse(str);
    if (!color)
      throw py::value_error(absl::StrCat("invalid color \"", str, "\""));
    return *color;
  }

  // Accepts ARGB integers with the alpha bit set (negative in Java)
  return Color(static_cast<std::uint32_t>(obj.cast<std::int64_t>()));
}

std::vector<AtomLabel> atom_labels_from_py(py::handle obj) {
  std::vector<AtomLabel> labels;
  if (obj.is_none())
    return labels;

  for (py::handle item: obj) {
    py::dict d = item.cast<py::dict>();
    constexpr std::string_view kWhat = "atom label";

    AtomLabel &label = labels.emplace_back();
    label.atom.position = dict_item<int>(d, "position", kWhat);
    label.atom.element = dict_item<std::string>(d, "element", kWhat);
    label.text = dict_item<std::string>(d, "label", kWhat);
    label.color = color_from_py(dict_item<py::object>(d, "color", kWhat));
  }

  return labels;
}

std::vector<AtomSet> atom_sets_from_py(py::handle obj) {
  std::vector<AtomSet> sets;
  if (obj.is_none())
    return sets;

  for (py::handle item: obj) {
    py::dict d = item.cast<py::dict>();
    constexpr std::string_view kWhat = "atom set";

    auto positions = dict_item<std::vector<int>>(d, "positions", kWhat);
    auto elements = dict_item<std::vector<std::string>>(d, "elements", kWhat);
    if (positions.size() != elements.size()) {
      throw py::value_error(
          "atom set positions and elements must have the same length");
    }

    AtomSet &set = sets.emplace_back();
    set.color = color_from_py(dict_item<py::object>(d, "color", kWhat));
    for (std::size_t i = 0; i < positions.size(); ++i)
      set.atoms.push_back({ positions[i], std::move(elements[i]) });
  }

  return sets;
}

std::vector<BondSet> bond_sets_from_py(py::handle obj) {
  std::vector<BondSet> sets;
  if (obj.is_none())
    return sets;

  for (py::handle item: obj) {
    py::dict d = item.cast<py::dict>();
    constexpr std::string_view kWhat = "bond set";

    auto positions =
        dict_item<std::vector<std::pair<int, int>>>(d, "positions", kWhat);
    auto elements =
        dict_item<std::vector<std::pair<std::string, std::string>>>(
            d, "elements", kWhat);
    if (positions.size() != elements.size()) {
      throw py::value_error(
          "bond set positions and elements must have the same length");
    }

    BondSet &set = sets.emplace_back();
    set.color = color_from_py(dict_item<py::object>(d, "color", kWhat));
    for (std::size_t i = 0; i < positions.size(); ++i) {
      set.bonds.push_back({
          { positions[i].first, std::move(elements[i].first) },
          { positions[i].second, std::move(elements[i].second) },
      });
    }
  }

  return sets;
}

py::object get_major_micro_species(py::handle structures,
                                   std::string_view in_format,
                                   std::string_view out_format, double ph,
                                   bool major_tautomer, bool keep_hydrogens,
                                   bool /* dearomatize */,
                                   std::string_view engine_name) {
  const ChemistryEngine &engine = get_engine(engine_name);

  ProtonationConfig config;
  config.ph = ph;
  config.major_tautomer = major_tautomer;
  config.keep_explicit_hydrogens = keep_hydrogens;

  if (py::isinstance<py::str>(structures)) {
    const std::string input = structures.cast<std::string>();

    absl::StatusOr<std::string> result;
    {
      const py::gil_scoped_release release;
      result = compute_major_microspecies(engine, input, in_format,
                                          out_format, config);
    }
    return py::str(value_or_throw(std::move(result)));
  }

  const auto inputs = structures.cast<std::vector<std::string>>();

  absl::StatusOr<std::vector<std::string>> results;
  {
    const py::gil_scoped_release release;
    results = compute_major_microspecies_batch(engine, inputs, in_format,
                                               out_format, config);
  }
  return py::cast(value_or_throw(std::move(results)));
}

py::object draw_molecule(std::string structure, std::string format,
                         std::string image_format,
                         py::handle atom_labels,
                         double atom_label_font_size, py::handle atom_sets,
                         py::handle bond_sets, bool show_atom_nums,
                         int width, int height, bool include_xml_header,
                         std::string_view engine_name) {
  const ChemistryEngine &engine = get_engine(engine_name);

  DepictionRequest req;
  req.structure = std::move(structure);
  req.format = std::move(format);
  req.atom_labels = atom_labels_from_py(atom_labels);
  req.atom_sets = atom_sets_from_py(atom_sets);
  req.bond_sets = bond_sets_from_py(bond_sets);
  req.config.format = std::move(image_format);
  req.config.width = width;
  req.config.height = height;
  req.config.include_header = include_xml_header;
  req.config.show_atom_numbers = show_atom_nums;
  req.config.label_font_size = atom_label_font_size;

  absl::StatusOr<RenderedImage> result;
  {
    const py::gil_scoped_release release;
    result = render_molecule(engine, req);
  }

  RenderedImage image = value_or_throw(std::move(result));
  if (image.text)
    return py::str(image.data);
  return py::bytes(image.data);
}
}  // namespace

void bind_chem(py::module &m) {
  m.def("get_major_micro_species", get_major_micro_species,
        py::arg("structures"), py::arg("in_format"), py::arg("out_format"),
        py::arg("ph") = 7.4, py::arg("major_tautomer") = false,
        py::arg("keep_hydrogens") = false, py::arg("dearomatize") = false,
        py::arg("engine") = "",
        R"doc(
    Calculate the major protonation microspecies of one or more structures.

    :param structures: A structure, or a list of structures.
    :param in_format: The format of the input structures (e.g. ``"inchi"``).
    :param out_format: The format of the results. For ``smiles`` and
      ``inchi``-like formats only the first line of the output is kept.
    :param ph: The pH.
    :param major_tautomer: Take the major tautomer into account.
    :param keep_hydrogens: Keep explicit hydrogens in the results.
    :param dearomatize: Accepted for compatibility. Structures are always
      dearomatized before protonation.
    :param engine: The chemistry engine. Defaults to the first registered one.
    :returns: The major microspecies; a list if ``structures`` is a list.
    :raises ValueError: If a structure could not be parsed. For a list, the
      message names the index of the structure and no partial results are
      returned.
    :raises RuntimeError: If the engine failed.
  )doc");

  m.def("draw_molecule", draw_molecule, py::arg("structure"),
        py::arg("format"), py::arg("image_format") = "svg",
        py::arg("atom_labels") = py::none(),
        py::arg("atom_label_font_size") = 0.4, py::arg("atom_sets") = py::none(),
        py::arg("bond_sets") = py::none(), py::arg("show_atom_nums") = false,
        py::arg("width") = 200, py::arg("height") = 200,
        py::arg("include_xml_header") = true, py::arg("engine") = "",
        R"doc(
    Draw an image of a molecule.

    :param structure: The structure.
    :param format: The format of ``structure`` (e.g. ``"inchi"``).
    :param image_format: The image format (e.g. ``"svg"`` or ``"png"``).
    :param atom_labels: A list of dicts with keys ``position`` (1-based),
      ``element``, ``label`` and ``color``. Labels with empty text are skipped.
    :param atom_label_font_size: Font size of the labels, relative to the bond
      length. Engines that cannot scale labels ignore it.
    :param atom_sets: A list of dicts with keys ``positions``, ``elements``
      and ``color``.
    :param bond_sets: A list of dicts with keys ``positions`` (pairs of atom
      positions), ``elements`` (pairs of element symbols) and ``color``.
    :param show_atom_nums: Draw atom numbers.
    :param width: The image width in pixels.
    :param height: The image height in pixels.
    :param include_xml_header: Include the XML declaration in SVG output.
    :param engine: The chemistry engine. Defaults to the first registered one.
    :returns: ``str`` for vector formats, ``bytes`` otherwise.

    References whose position is out of range or whose element does not match
    the structure are ignored. Colors are ``0xRRGGBB`` integers or
    ``"#rrggbb"`` strings.
  )doc");
}
}  // namespace python_internal
}  // namespace molutil
