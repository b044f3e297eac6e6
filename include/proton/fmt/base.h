//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef PROTON_FMT_BASE_H_
#define PROTON_FMT_BASE_H_

//! @cond
#include <filesystem>
#include <string>
#include <vector>

#include <absl/base/attributes.h>
//! @endcond

#include "proton/core/molecule.h"

namespace proton {
class MoleculeReader {
public:
  MoleculeReader() = default;
  MoleculeReader(const MoleculeReader &) = delete;
  MoleculeReader &operator=(const MoleculeReader &) = delete;
  MoleculeReader(MoleculeReader &&) noexcept = default;
  MoleculeReader &operator=(MoleculeReader &&) noexcept = default;
  virtual ~MoleculeReader() noexcept = default;

  /**
   * @brief Read the lines of the next molecule.
   * @param block Receives the lines of the next molecule. If true is returned,
   *              pre-existing contents of the block are discarded. Otherwise,
   *              the block is in a valid but unspecified state.
   * @return true if the reader has successfully advanced to the next molecule,
   *         false otherwise.
   */
  ABSL_MUST_USE_RESULT virtual bool
  getnext(std::vector<std::string> &block) = 0;

  /**
   * @brief Parse a block and return the molecule.
   * @note The returned molecule will be empty if the block cannot be parsed.
   */
  virtual Molecule parse(const std::vector<std::string> &block) const = 0;
};

template <class Reader = MoleculeReader>
class MoleculeStream {
public:
  MoleculeStream(Reader &reader): reader_(&reader) { }

  MoleculeStream(const MoleculeStream &) = delete;
  MoleculeStream &operator=(const MoleculeStream &) = delete;
  MoleculeStream(MoleculeStream &&) noexcept = default;
  MoleculeStream &operator=(MoleculeStream &&) noexcept = default;
  ~MoleculeStream() noexcept = default;

  /**
   * @brief Advance the stream to the next molecule.
   *
   * @return true if the stream is not at the end, false otherwise.
   * @note A block that fails to parse still advances the stream; the current
   *       molecule is empty in that case.
   */
  ABSL_MUST_USE_RESULT bool advance() {
    if (!reader_->getnext(block_))
      return false;

    mol_ = reader_->parse(block_);
    return true;
  }

  Molecule &current() { return mol_; }

  const Molecule &current() const { return mol_; }

private:
  Reader *reader_;
  std::vector<std::string> block_;
  Molecule mol_;
};

/**
 * @brief Read all molecules of an SD file.
 *
 * @param mols Receives the molecules, appended in file order.
 * @param unparsed Incremented by the number of blocks that failed to parse.
 * @param path The file. Must have a `.sdf` or `.mol` extension.
 * @return Whether the file could be opened. Blocks that fail to parse are
 *         logged, counted and skipped.
 */
extern bool read_molecules(std::vector<Molecule> &mols, int &unparsed,
                           const std::filesystem::path &path);
}  // namespace proton

#endif /* PROTON_FMT_BASE_H_ */
