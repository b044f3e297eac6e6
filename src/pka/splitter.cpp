//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "proton/pka/splitter.h"

#include <cmath>
#include <string>
#include <vector>

#include <absl/log/absl_log.h>

#include "proton/core/canonical.h"
#include "proton/pka/errors.h"
#include "proton/pka/record.h"

namespace proton {
SiteError validate_site(const SiteAnnotation &site) {
  if (!std::isfinite(site.pka))
    return SiteError::kMissingPka;

  if (!site.protonated)
    return SiteError::kMissingProtonated;

  if (!site.deprotonated)
    return SiteError::kMissingDeprotonated;

  if (site.protonated->empty() || site.deprotonated->empty())
    return SiteError::kEmptyVariant;

  return SiteError::kNone;
}

void split_record(std::vector<SiteRecord> &sites, SplitSummary &summary,
                  const MoleculeRecord &record,
                  const int min_sites_per_molecule) {
  ++summary.records;

  if (record.sites.empty()) {
    ABSL_LOG(INFO) << "Record " << record.source_id << " has no sites";
    ++summary.records_without_sites;
    return;
  }

  std::vector<const SiteAnnotation *> valid;
  valid.reserve(record.sites.size());
  for (const SiteAnnotation &site: record.sites) {
    SiteError err = validate_site(site);
    if (err != SiteError::kNone) {
      ABSL_LOG(INFO) << "Skipping site " << site.site_id << " of "
                     << record.source_id << ": " << err;
      summary.skipped.add(err);
      continue;
    }

    valid.push_back(&site);
  }

  if (static_cast<int>(valid.size()) < min_sites_per_molecule) {
    ABSL_LOG(INFO) << "Record " << record.source_id << " has " << valid.size()
                   << " valid sites (minimum " << min_sites_per_molecule
                   << ")";
    ++summary.below_min_sites;
    return;
  }

  const std::string parent_key = canonical_key(record.mol);
  for (const SiteAnnotation *site: valid) {
    SiteRecord &out = sites.emplace_back();
    out.source_id = record.source_id;
    out.site_id = site->site_id;
    out.parent_key = parent_key;
    out.pka = site->pka;
    out.reaction_center = site->reaction_center;
    out.pka_type = site->pka_type;
    out.protonated = *site->protonated;
    out.deprotonated = *site->deprotonated;
  }

  summary.emitted += static_cast<int>(valid.size());
}

std::vector<SiteRecord>
split_records(const std::vector<MoleculeRecord> &records,
              SplitSummary &summary, const int min_sites_per_molecule) {
  std::vector<SiteRecord> sites;
  for (const MoleculeRecord &record: records)
    split_record(sites, summary, record, min_sites_per_molecule);
  return sites;
}
}  // namespace proton
