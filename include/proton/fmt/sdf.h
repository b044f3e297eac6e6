//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef PROTON_FMT_SDF_H_
#define PROTON_FMT_SDF_H_

//! @cond
#include <istream>
#include <string>
#include <vector>
//! @endcond

#include "proton/core/molecule.h"
#include "proton/fmt/base.h"

namespace proton {
/**
 * @brief Read a single V2000 molfile block and return a molecule.
 *
 * @param sdf the lines of the block, without the `$$$$` terminator.
 * @return A molecule. On failure, the returned molecule is empty.
 *
 * The atom and bond blocks must hold exactly the number of lines given in the
 * counts line. SD data items are stored as molecule properties. If the block
 * has no explicit hydrogen atoms, implicit hydrogens are guessed. Ring
 * membership and hybridization are always perceived.
 */
extern Molecule read_sdf(const std::vector<std::string> &sdf);

class SDFReader final: public MoleculeReader {
public:
  /**
   * @note The stream must survive until the reader is destructed.
   */
  explicit SDFReader(std::istream &is): is_(&is) { }

  bool getnext(std::vector<std::string> &block) override;

  Molecule parse(const std::vector<std::string> &block) const override {
    return read_sdf(block);
  }

private:
  std::istream *is_;
};

/**
 * @brief Write a molecule as a V2000 SD record.
 *
 * @param out The string to append to.
 * @param mol The molecule to write.
 * @return Whether the write was successful. Molecules with more than 999
 *         atoms or bonds cannot be written.
 */
extern bool write_sdf(std::string &out, const Molecule &mol);
}  // namespace proton

#endif /* PROTON_FMT_SDF_H_ */
