//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "proton/pka/errors.h"

#include <string_view>

namespace proton {
std::string_view to_string(SiteError err) {
  switch (err) {
  case SiteError::kNone:
    return "none";
  case SiteError::kMissingPka:
    return "missing pKa";
  case SiteError::kMissingProtonated:
    return "missing protonated variant";
  case SiteError::kMissingDeprotonated:
    return "missing deprotonated variant";
  case SiteError::kEmptyVariant:
    return "empty variant";
  }

  return "unknown";
}

std::string_view to_string(CorrespondenceError err) {
  switch (err) {
  case CorrespondenceError::kNone:
    return "none";
  case CorrespondenceError::kHeavyAtomCountMismatch:
    return "heavy atom count mismatch";
  case CorrespondenceError::kHydrogenCountMismatch:
    return "hydrogen count mismatch";
  case CorrespondenceError::kNoBijection:
    return "no bijection";
  case CorrespondenceError::kAmbiguous:
    return "ambiguous bijection";
  case CorrespondenceError::kExcessDifference:
    return "excess difference";
  case CorrespondenceError::kSearchLimit:
    return "search limit exhausted";
  case CorrespondenceError::kCenterMismatch:
    return "reaction center mismatch";
  }

  return "unknown";
}

std::string_view to_string(EncodingError err) {
  switch (err) {
  case EncodingError::kNone:
    return "none";
  case EncodingError::kElement:
    return "element";
  case EncodingError::kFormalCharge:
    return "formal charge";
  case EncodingError::kHybridization:
    return "hybridization";
  case EncodingError::kHydrogenCount:
    return "hydrogen count";
  case EncodingError::kBondOrder:
    return "bond order";
  }

  return "unknown";
}

std::string_view to_string(IntegrityError err) {
  switch (err) {
  case IntegrityError::kNone:
    return "none";
  case IntegrityError::kDuplicateKey:
    return "duplicate (source_id, site_id)";
  case IntegrityError::kShapeViolation:
    return "graph pair shape violation";
  case IntegrityError::kVocabularyMismatch:
    return "vocabulary mismatch";
  }

  return "unknown";
}
}  // namespace proton
