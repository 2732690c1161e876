//
// Project MolUtil - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/base/log_severity.h>
#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/log/absl_log.h>
#include <absl/log/flags.h>  // IWYU pragma: keep
#include <absl/log/globals.h>
#include <absl/log/initialize.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/ascii.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_split.h>

#include "molutil/core/formula.h"
#include "molutil/depict/annotation.h"
#include "molutil/depict/depict.h"
#include "molutil/engine/engine.h"
#include "molutil/engine/structure.h"
#include "molutil/protonate/microspecies.h"
#include "molutil/utils.h"

ABSL_FLAG(std::string, engine, "",
          "Chemistry engine to use (default: the first registered engine)");
ABSL_FLAG(std::string, in_format, "smiles", "Format of the input structures");
ABSL_FLAG(std::string, out_format, "smiles",
          "Format of the output structures (protonate, convert)");
ABSL_FLAG(double, ph, 7.4, "pH at which to compute the major microspecies");
ABSL_FLAG(bool, major_tautomer, false, "Take the major tautomer into account");
ABSL_FLAG(bool, keep_hydrogens, false, "Keep explicit hydrogens in the output");
ABSL_FLAG(std::string, image_format, "",
          "Image format (default: extension of --output, or svg)");
ABSL_FLAG(int, width, 200, "Image width in pixels");
ABSL_FLAG(int, height, 200, "Image height in pixels");
ABSL_FLAG(bool, include_header, true,
          "Include the XML declaration in vector images");
ABSL_FLAG(bool, show_atom_numbers, false, "Draw atom numbers");
ABSL_FLAG(std::vector<std::string>, label, {},
          "Atom labels, position:element:text:color (comma separated)");
ABSL_FLAG(std::string, atom_set, "",
          "Atom sets, position:element,...@color (semicolon separated)");
ABSL_FLAG(std::string, bond_set, "",
          "Bond sets, position:element-position:element,...@color "
          "(semicolon separated)");
ABSL_FLAG(std::string, output, "", "Output file (default: stdout)");

namespace molutil {
namespace {
constexpr char kUsage[] =
    "Structure utilities.\n"
    "\n"
    "Usage: molutil <command> [flags] [structures...]\n"
    "\n"
    "Commands:\n"
    "  protonate  Major microspecies at --ph\n"
    "  depict     Draw a single structure\n"
    "  convert    Convert between structure formats\n"
    "  formula    Empirical formula and molecular weight\n"
    "\n"
    "Structures are read from the arguments, or from stdin (one per line) if\n"
    "none are given.";

enum ExitCode {
  kSuccess = 0,
  kFailure = 1,
  kUsageError = 2,
};

int report(const absl::Status &status) {
  std::cerr << "molutil: " << status << std::endl;
  return kFailure;
}

std::vector<std::string> read_structures(const std::vector<char *> &args) {
  std::vector<std::string> structures;

  if (args.size() > 2) {
    structures.assign(args.begin() + 2, args.end());
    return structures;
  }

  std::string line;
  while (std::getline(std::cin, line)) {
    std::string_view stripped = absl::StripAsciiWhitespace(line);
    if (!stripped.empty())
      structures.emplace_back(stripped);
  }
  return structures;
}

int run_protonate(const ChemistryEngine &engine,
                  const std::vector<std::string> &structures) {
  ProtonationConfig config;
  config.ph = absl::GetFlag(FLAGS_ph);
  config.major_tautomer = absl::GetFlag(FLAGS_major_tautomer);
  config.keep_explicit_hydrogens = absl::GetFlag(FLAGS_keep_hydrogens);

  absl::StatusOr<std::vector<std::string>> results =
      compute_major_microspecies_batch(engine, structures,
                                       absl::GetFlag(FLAGS_in_format),
                                       absl::GetFlag(FLAGS_out_format), config);
  if (!results.ok())
    return report(results.status());

  for (const std::string &result: *results)
    std::cout << result << '\n';
  return kSuccess;
}

int run_convert(const ChemistryEngine &engine,
                const std::vector<std::string> &structures) {
  for (const std::string &structure: structures) {
    absl::StatusOr<std::string> result =
        convert_structure(engine, structure, absl::GetFlag(FLAGS_in_format),
                          absl::GetFlag(FLAGS_out_format));
    if (!result.ok())
      return report(result.status());

    std::cout << *result << '\n';
  }
  return kSuccess;
}

int run_formula(const ChemistryEngine &engine,
                const std::vector<std::string> &structures) {
  for (const std::string &structure: structures) {
    absl::StatusOr<std::unique_ptr<Structure>> mol =
        engine.parse(structure, absl::GetFlag(FLAGS_in_format));
    if (!mol.ok())
      return report(mol.status());

    EmpiricalFormula formula = formula_of(**mol);
    absl::StatusOr<double> mw = formula.molecular_weight();
    if (!mw.ok())
      return report(mw.status());

    std::cout << absl::StrFormat("%s\t%.4f\n", formula.to_string(), *mw);
  }
  return kSuccess;
}

absl::Status parse_annotation_flags(DepictionRequest &req) {
  for (const std::string &spec: absl::GetFlag(FLAGS_label)) {
    absl::StatusOr<AtomLabel> label = parse_atom_label(spec);
    if (!label.ok())
      return label.status();
    req.atom_labels.push_back(*std::move(label));
  }

  for (std::string_view spec: absl::StrSplit(absl::GetFlag(FLAGS_atom_set),
                                             ';', absl::SkipWhitespace())) {
    absl::StatusOr<AtomSet> set = parse_atom_set(spec);
    if (!set.ok())
      return set.status();
    req.atom_sets.push_back(*std::move(set));
  }

  for (std::string_view spec: absl::StrSplit(absl::GetFlag(FLAGS_bond_set),
                                             ';', absl::SkipWhitespace())) {
    absl::StatusOr<BondSet> set = parse_bond_set(spec);
    if (!set.ok())
      return set.status();
    req.bond_sets.push_back(*std::move(set));
  }

  return absl::OkStatus();
}

int run_depict(const ChemistryEngine &engine,
               const std::vector<std::string> &structures) {
  if (structures.size() != 1) {
    std::cerr << "molutil: depict takes exactly one structure" << std::endl;
    return kUsageError;
  }

  const std::filesystem::path output = absl::GetFlag(FLAGS_output);

  DepictionRequest req;
  req.structure = structures[0];
  req.format = absl::GetFlag(FLAGS_in_format);

  req.config.format = absl::GetFlag(FLAGS_image_format);
  if (req.config.format.empty()) {
    const std::filesystem::path ext = output.extension();
    req.config.format = ext.empty()
                            ? "svg"
                            : absl::AsciiStrToLower(extension_no_dot(ext));
  }
  req.config.width = absl::GetFlag(FLAGS_width);
  req.config.height = absl::GetFlag(FLAGS_height);
  req.config.include_header = absl::GetFlag(FLAGS_include_header);
  req.config.show_atom_numbers = absl::GetFlag(FLAGS_show_atom_numbers);

  absl::Status status = parse_annotation_flags(req);
  if (!status.ok())
    return report(status);

  absl::StatusOr<RenderedImage> image = render_molecule(engine, req);
  if (!image.ok())
    return report(image.status());

  if (output.empty()) {
    std::cout << image->data;
    if (image->text)
      std::cout << '\n';
    return kSuccess;
  }

  std::ofstream ofs(output, image->text ? std::ios::out : std::ios::binary);
  if (!ofs || !ofs.write(image->data.data(),
                         static_cast<std::streamsize>(image->data.size()))) {
    std::perror(output.c_str());
    return kFailure;
  }

  ABSL_LOG(INFO) << "Wrote " << image->data.size() << " bytes to " << output;
  return kSuccess;
}

int run(const std::vector<char *> &args) {
  if (args.size() < 2) {
    std::cerr << absl::ProgramUsageMessage() << std::endl;
    return kUsageError;
  }

  absl::StatusOr<const ChemistryEngine *> engine =
      EngineRegistry::find_or_default(absl::GetFlag(FLAGS_engine));
  if (!engine.ok())
    return report(engine.status());
  ABSL_VLOG(1) << "Using engine " << (*engine)->name();

  const std::string_view command = args[1];
  const std::vector<std::string> structures = read_structures(args);

  if (command == "protonate")
    return run_protonate(**engine, structures);
  if (command == "depict")
    return run_depict(**engine, structures);
  if (command == "convert")
    return run_convert(**engine, structures);
  if (command == "formula")
    return run_formula(**engine, structures);

  std::cerr << "molutil: unknown command \"" << command << "\"\n\n"
            << absl::ProgramUsageMessage() << std::endl;
  return kUsageError;
}
}  // namespace
}  // namespace molutil

int main(int argc, char *argv[]) {
  absl::SetProgramUsageMessage(molutil::kUsage);
  // --stderrthreshold overrides
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kWarning);
  std::vector<char *> args = absl::ParseCommandLine(argc, argv);

  absl::InitializeLog();

  return molutil::run(args);
}
