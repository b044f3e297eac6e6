//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "proton/pka/normalizer.h"

#include <algorithm>
#include <limits>
#include <queue>
#include <tuple>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_set.h>
#include <absl/log/absl_check.h>
#include <absl/log/absl_log.h>

#include "proton/eigen_config.h"
#include "proton/core/canonical.h"
#include "proton/core/molecule.h"
#include "proton/pka/errors.h"
#include "proton/pka/record.h"
#include "proton/utils.h"

namespace proton {
namespace {
constexpr int kInfCost = std::numeric_limits<int>::max();

int total_hydrogens(const HeavyAtomGraph &graph) {
  int sum = 0;
  for (int i = 0; i < graph.size(); ++i)
    sum += graph.hydrogens(i);
  return sum;
}

MatrixXi bond_matrix(const HeavyAtomGraph &graph) {
  MatrixXi bonds = MatrixXi::Constant(graph.size(), graph.size(), -1);
  for (int i = 0; i < graph.size(); ++i) {
    for (const HeavyAtomGraph::Edge &edge: graph.edges(i))
      bonds(i, edge.dst) = edge.bid;
  }
  return bonds;
}

std::vector<int> bond_classes(const Molecule &mol) {
  std::vector<int> classes(mol.num_bonds());
  for (int i = 0; i < mol.num_bonds(); ++i)
    classes[i] = internal::bond_class(mol, i);
  return classes;
}

std::vector<bool> ring_pi_nodes(const HeavyAtomGraph &graph) {
  std::vector<bool> pi(graph.size());
  for (int i = 0; i < graph.size(); ++i)
    pi[i] = internal::ring_pi_atom(graph.mol(), graph.atom_id(i));
  return pi;
}

/*
 * Classes of atoms that cannot be told apart by any attribute compared in
 * the correspondence. Centers of one class give equivalent reactions.
 */
std::vector<int> attribute_classes(const HeavyAtomGraph &graph,
                                   const std::vector<int> &bond_cls,
                                   const std::vector<bool> &pi) {
  using Invariant = std::tuple<int, int, int, bool, bool, int>;
  std::vector<Invariant> invariants(graph.size());
  LabeledAdjacency adj(graph.size());

  for (int i = 0; i < graph.size(); ++i) {
    const AtomData &data = graph.data(i);
    invariants[i] = { data.atomic_number(),
                      graph.hydrogens(i),
                      data.formal_charge(),
                      pi[i],
                      data.is_ring_atom(),
                      graph.degree(i) };

    for (const HeavyAtomGraph::Edge &edge: graph.edges(i))
      adj[i].push_back({ edge.dst, bond_cls[edge.bid] });
  }

  return refine_ranks(adj, internal::dense_ranks(invariants));
}

struct PairContext {
  const HeavyAtomGraph &p;
  const HeavyAtomGraph &d;
  MatrixXi p_bonds;
  MatrixXi d_bonds;
  std::vector<int> p_bond_cls;
  std::vector<int> d_bond_cls;
  std::vector<bool> p_pi;
  std::vector<bool> d_pi;
};

/*
 * Joint colors of the two states, with the hydrogen count of the center of
 * the protonated state reduced by one. Atoms 0..n-1 are the protonated
 * state, n..2n-1 the deprotonated state. A correspondence can only map atoms
 * of the same color.
 */
std::vector<int> joint_colors(const PairContext &ctx, const int center) {
  const int n = ctx.p.size();

  using Label = std::tuple<int, int, bool>;
  std::vector<Label> labels(2 * static_cast<size_t>(n));
  LabeledAdjacency adj(labels.size());

  for (int i = 0; i < n; ++i) {
    const AtomData &data = ctx.p.data(i);
    labels[i] = { data.atomic_number(),
                  ctx.p.hydrogens(i) - static_cast<int>(i == center),
                  data.is_ring_atom() };
    for (const HeavyAtomGraph::Edge &edge: ctx.p.edges(i))
      adj[i].push_back({ edge.dst, 0 });
  }

  for (int j = 0; j < n; ++j) {
    const AtomData &data = ctx.d.data(j);
    labels[n + j] = { data.atomic_number(), ctx.d.hydrogens(j),
                      data.is_ring_atom() };
    for (const HeavyAtomGraph::Edge &edge: ctx.d.edges(j))
      adj[n + j].push_back({ n + edge.dst, 0 });
  }

  return refine_ranks(adj, internal::dense_ranks(labels));
}

bool same_color_multiset(const std::vector<int> &colors, const int n) {
  std::vector<int> p(colors.begin(), colors.begin() + n),
      d(colors.begin() + n, colors.end());
  std::sort(p.begin(), p.end());
  std::sort(d.begin(), d.end());
  return p == d;
}

class BijectionSearch {
public:
  BijectionSearch(const PairContext &ctx, std::vector<int> colors,
                  const int center, const int center_image, const int bound,
                  int &steps, const int limit)
      : ctx_(&ctx), colors_(std::move(colors)), n_(ctx.p.size()),
        center_(center), center_image_(center_image), best_cost_(bound),
        steps_(&steps), limit_(limit), map_(n_, -1), inv_(n_, -1) {
    build_order();
  }

  /**
   * @return false if the step limit was exhausted.
   */
  bool run() { return search(0, 0); }

  int best_cost() const { return best_found_ ? best_cost_ : kInfCost; }

  const std::vector<int> &best_mapping() const { return best_; }

private:
  void build_order() {
    order_.reserve(n_);
    std::vector<bool> seen(n_, false);
    std::queue<int> queue;

    auto bfs = [&](int root) {
      seen[root] = true;
      queue.push(root);
      while (!queue.empty()) {
        const int curr = queue.front();
        queue.pop();
        order_.push_back(curr);

        for (const HeavyAtomGraph::Edge &edge: ctx_->p.edges(curr)) {
          if (!seen[edge.dst]) {
            seen[edge.dst] = true;
            queue.push(edge.dst);
          }
        }
      }
    };

    bfs(center_);
    for (int i = 0; i < n_; ++i) {
      if (!seen[i])
        bfs(i);
    }
  }

  bool feasible(const int i, const int j) const {
    if (inv_[j] >= 0 || colors_[i] != colors_[n_ + j])
      return false;

    if (center_image_ >= 0 && (i == center_) != (j == center_image_))
      return false;

    int mapped_p = 0;
    for (const HeavyAtomGraph::Edge &edge: ctx_->p.edges(i)) {
      const int k = map_[edge.dst];
      if (k < 0)
        continue;

      if (ctx_->d_bonds(j, k) < 0)
        return false;
      ++mapped_p;
    }

    int mapped_d = 0;
    for (const HeavyAtomGraph::Edge &edge: ctx_->d.edges(j))
      mapped_d += static_cast<int>(inv_[edge.dst] >= 0);

    return mapped_p == mapped_d;
  }

  int assignment_cost(const int i, const int j) const {
    const AtomData &pd = ctx_->p.data(i), &dd = ctx_->d.data(j);

    // The charge of the center follows from the moved hydrogen
    int cost = static_cast<int>(i != center_
                                && pd.formal_charge() != dd.formal_charge());
    cost += static_cast<int>(ctx_->p_pi[i] != ctx_->d_pi[j]);

    for (const HeavyAtomGraph::Edge &edge: ctx_->p.edges(i)) {
      const int k = map_[edge.dst];
      if (k < 0)
        continue;

      const int d_bid = ctx_->d_bonds(j, k);
      cost += static_cast<int>(ctx_->p_bond_cls[edge.bid]
                               != ctx_->d_bond_cls[d_bid]);
    }

    return cost;
  }

  bool try_assign(const int depth, const int cost, const int i, const int j) {
    if (!feasible(i, j))
      return true;

    if (++*steps_ > limit_)
      return false;

    const int next_cost = cost + assignment_cost(i, j);
    if (next_cost >= best_cost_)
      return true;

    map_[i] = j;
    inv_[j] = i;
    const bool ok = search(depth + 1, next_cost);
    map_[i] = -1;
    inv_[j] = -1;
    return ok;
  }

  bool search(const int depth, const int cost) {
    if (depth == n_) {
      best_cost_ = cost;
      best_ = map_;
      best_found_ = true;
      return true;
    }

    const int i = order_[depth];

    // Most pairs keep the atom order of the input, so try it first
    if (!try_assign(depth, cost, i, i))
      return false;

    for (int j = 0; j < n_ && best_cost_ > 0; ++j) {
      if (j == i)
        continue;

      if (!try_assign(depth, cost, i, j))
        return false;
    }

    return true;
  }

  const PairContext *ctx_;
  std::vector<int> colors_;
  int n_;
  int center_;
  int center_image_;
  int best_cost_;
  bool best_found_ = false;
  int *steps_;
  int limit_;

  std::vector<int> order_;
  std::vector<int> map_;
  std::vector<int> inv_;
  std::vector<int> best_;
};

struct CenterResult {
  int center;
  int cost;
  std::vector<int> mapping;
};

void copy_site_info(ReactionDraft &draft, const SiteRecord &site) {
  draft.source_id = site.source_id;
  draft.site_id = site.site_id;
  draft.parent_key = site.parent_key;
  draft.pka = site.pka;
  draft.pka_type = site.pka_type;
}
}  // namespace

CorrespondenceError normalize_pair(ReactionDraft &draft,
                                   const SiteRecord &site,
                                   const NormalizerOptions &options) {
  copy_site_info(draft, site);
  draft.protonated = site.protonated;
  draft.deprotonated = site.deprotonated;
  draft.swapped = false;

  {
    const HeavyAtomGraph p(draft.protonated), d(draft.deprotonated);
    if (p.size() != d.size()) {
      ABSL_LOG(INFO) << "Rejecting site " << site.site_id << " of "
                     << site.source_id << ": heavy atom counts differ ("
                     << p.size() << " vs " << d.size() << ")";
      return CorrespondenceError::kHeavyAtomCountMismatch;
    }

    const int diff = total_hydrogens(p) - total_hydrogens(d);
    if (diff == -1) {
      draft.swapped = true;
    } else if (diff != 1) {
      ABSL_LOG(INFO) << "Rejecting site " << site.site_id << " of "
                     << site.source_id << ": hydrogen counts differ by "
                     << diff;
      return CorrespondenceError::kHydrogenCountMismatch;
    }
  }

  if (draft.swapped) {
    ABSL_LOG(INFO) << "Site " << site.site_id << " of " << site.source_id
                   << ": protonation states given in reverse order; swapping";
    std::swap(draft.protonated, draft.deprotonated);
  }

  const HeavyAtomGraph p(draft.protonated), d(draft.deprotonated);
  const int n = p.size();
  PairContext ctx { p,
                    d,
                    bond_matrix(p),
                    bond_matrix(d),
                    bond_classes(draft.protonated),
                    bond_classes(draft.deprotonated),
                    ring_pi_nodes(p),
                    ring_pi_nodes(d) };

  // The reaction center hint refers to the supplied protonated state, which
  // is the deprotonated state after a swap.
  int hint_p = -1, hint_d = -1;
  if (site.reaction_center >= 0) {
    const HeavyAtomGraph &hinted = draft.swapped ? d : p;
    const int node = site.reaction_center < hinted.mol().num_atoms()
                         ? hinted.node_id(site.reaction_center)
                         : -1;
    if (node < 0 || (!draft.swapped && p.hydrogens(node) == 0)) {
      ABSL_LOG(INFO) << "Rejecting site " << site.site_id << " of "
                     << site.source_id << ": invalid reaction center "
                     << site.reaction_center;
      return CorrespondenceError::kCenterMismatch;
    }

    (draft.swapped ? hint_d : hint_p) = node;
  }

  const std::vector<int> p_classes =
      attribute_classes(p, ctx.p_bond_cls, ctx.p_pi);

  std::vector<int> candidates;
  absl::flat_hash_set<int> seen_classes;
  for (int i = 0; i < n; ++i) {
    if (p.hydrogens(i) == 0 || (hint_p >= 0 && i != hint_p))
      continue;

    if (seen_classes.insert(p_classes[i]).second)
      candidates.push_back(i);
  }

  int steps = 0, best_cost = kInfCost;
  std::vector<CenterResult> results;
  for (const int c: candidates) {
    std::vector<int> colors = joint_colors(ctx, c);
    if (!same_color_multiset(colors, n))
      continue;

    const int bound = best_cost == kInfCost ? kInfCost : best_cost + 1;
    BijectionSearch search(ctx, std::move(colors), c, hint_d, bound, steps,
                           options.search_limit);
    if (!search.run()) {
      ABSL_LOG(INFO) << "Rejecting site " << site.site_id << " of "
                     << site.source_id << ": search limit exhausted after "
                     << options.search_limit << " steps";
      return CorrespondenceError::kSearchLimit;
    }

    if (search.best_cost() == kInfCost)
      continue;

    best_cost = proton::min(best_cost, search.best_cost());
    results.push_back({ c, search.best_cost(), search.best_mapping() });
  }

  if (best_cost == kInfCost) {
    ABSL_LOG(INFO) << "Rejecting site " << site.site_id << " of "
                   << site.source_id << ": no atom correspondence";
    return CorrespondenceError::kNoBijection;
  }

  if (best_cost > options.max_extra_deviations) {
    ABSL_LOG(INFO) << "Rejecting site " << site.site_id << " of "
                   << site.source_id << ": " << best_cost
                   << " differences besides the reaction center";
    return CorrespondenceError::kExcessDifference;
  }

  auto best = results.end();
  int num_best = 0;
  for (auto it = results.begin(); it != results.end(); ++it) {
    if (it->cost != best_cost)
      continue;

    ++num_best;
    if (best == results.end())
      best = it;
  }
  ABSL_DCHECK(best != results.end());

  if (num_best > 1) {
    ABSL_LOG(INFO) << "Rejecting site " << site.site_id << " of "
                   << site.source_id << ": " << num_best
                   << " non-equivalent reaction centers";
    return CorrespondenceError::kAmbiguous;
  }

  draft.protonated_atoms.resize(n);
  draft.deprotonated_atoms.resize(n);
  for (int i = 0; i < n; ++i) {
    draft.protonated_atoms[i] = p.atom_id(i);
    draft.deprotonated_atoms[i] = d.atom_id(best->mapping[i]);
  }

  draft.center = best->center;
  draft.transferred_hydrogen = p.last_explicit_hydrogen(best->center);
  draft.deviations = best_cost;

  return CorrespondenceError::kNone;
}
}  // namespace proton
