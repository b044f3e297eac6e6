//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "proton/fmt/base.h"

#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include <absl/log/absl_log.h>
#include <absl/strings/ascii.h>

#include "proton/core/molecule.h"
#include "proton/fmt/sdf.h"
#include "proton/utils.h"

namespace proton {
bool read_molecules(std::vector<Molecule> &mols, int &unparsed,
                    const std::filesystem::path &path) {
  const std::string ext =
      absl::AsciiStrToLower(extension_no_dot(path.extension()));
  if (ext != "sdf" && ext != "mol") {
    ABSL_LOG(ERROR) << "Unsupported file format " << path
                    << "; expected .sdf or .mol";
    return false;
  }

  std::ifstream ifs(path);
  if (!ifs) {
    ABSL_LOG(ERROR) << "Cannot open " << path;
    return false;
  }

  SDFReader reader(ifs);
  MoleculeStream<SDFReader> stream(reader);
  for (int i = 0; stream.advance(); ++i) {
    Molecule &mol = stream.current();
    if (mol.empty()) {
      ABSL_LOG(WARNING) << "Skipping unparseable molecule #" << i << " of "
                        << path;
      ++unparsed;
      continue;
    }

    mols.push_back(std::move(mol));
  }

  return true;
}
}  // namespace proton
