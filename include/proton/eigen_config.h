//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//
#ifndef PROTON_EIGEN_CONFIG_H_
#define PROTON_EIGEN_CONFIG_H_

//! @cond
#include <cstdint>

#include <Eigen/Dense>
//! @endcond

namespace proton {
//! @privatesection

// NOLINTNEXTLINE(*-naming)
namespace E = Eigen;

using E::Array2Xi;
using E::ArrayXi;

using E::Matrix3Xd;
using E::MatrixXf;
using E::MatrixXi;
using E::Vector3d;
}  // namespace proton

#endif /* PROTON_EIGEN_CONFIG_H_ */
