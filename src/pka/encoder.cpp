//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "proton/pka/encoder.h"

#include <algorithm>
#include <initializer_list>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include <absl/log/absl_check.h>
#include <absl/log/absl_log.h>
#include <absl/strings/ascii.h>
#include <absl/strings/str_split.h>

#include "proton/eigen_config.h"
#include "proton/core/canonical.h"
#include "proton/core/element.h"
#include "proton/core/molecule.h"
#include "proton/pka/errors.h"
#include "proton/pka/normalizer.h"
#include "proton/pka/vocabulary.h"

namespace proton {
namespace {
GraphNode make_node(const HeavyAtomGraph &graph, int node) {
  const AtomData &data = graph.data(node);
  return { data.atomic_number(), data.formal_charge(),
           data.hybridization(), data.is_aromatic(),
           data.is_ring_atom(),  graph.hydrogens(node),
           false };
}

/*
 * Append the heavy-atom bonds of the molecule, with node indices remapped to
 * shared atom indices.
 */
void add_edges(AttributedGraph &graph, const HeavyAtomGraph &view,
               const std::vector<int> &shared) {
  const Molecule &mol = view.mol();
  for (const Molecule::Bond &bond: mol.bonds()) {
    const int src = view.node_id(bond.src), dst = view.node_id(bond.dst);
    if (src < 0 || dst < 0)
      continue;

    const constants::BondOrder order =
        bond.data.is_aromatic() ? constants::kAromaticBond : bond.data.order();

    auto [u, v] = std::minmax(shared[src], shared[dst]);
    graph.edges.push_back({ u, v, order, bond.data.is_ring_bond() });
  }
}

void sort_edges(AttributedGraph &graph) {
  std::sort(graph.edges.begin(), graph.edges.end(),
            [](const GraphEdge &lhs, const GraphEdge &rhs) {
              return std::tie(lhs.src, lhs.dst) < std::tie(rhs.src, rhs.dst);
            });
}

constexpr GraphNode kTransferredHydrogen {
  1, 0, constants::kTerminal, false, false, 0, false,
};
}  // namespace

EncodingError check_vocabulary(const AttributedGraph &graph,
                               const Vocabulary &vocab) {
  for (const GraphNode &node: graph.nodes) {
    if (vocab.element_index(node.atomic_number) < 0)
      return EncodingError::kElement;
    if (vocab.formal_charge_index(node.formal_charge) < 0)
      return EncodingError::kFormalCharge;
    if (vocab.hybridization_index(node.hybridization) < 0)
      return EncodingError::kHybridization;
    if (vocab.hydrogen_count_index(node.hydrogens) < 0)
      return EncodingError::kHydrogenCount;
  }

  for (const GraphEdge &edge: graph.edges) {
    if (vocab.bond_order_index(edge.order) < 0)
      return EncodingError::kBondOrder;
  }

  return EncodingError::kNone;
}

EncodingError encode_reaction(ReactionSample &sample,
                              const ReactionDraft &draft,
                              const Vocabulary &vocab) {
  const int n = draft.num_shared_atoms();
  ABSL_DCHECK(draft.center >= 0 && draft.center < n);

  const HeavyAtomGraph p(draft.protonated), d(draft.deprotonated);
  ABSL_DCHECK_EQ(p.size(), n);
  ABSL_DCHECK_EQ(d.size(), n);

  std::vector<int> p_shared(n), d_shared(n);
  for (int i = 0; i < n; ++i) {
    p_shared[p.node_id(draft.protonated_atoms[i])] = i;
    d_shared[d.node_id(draft.deprotonated_atoms[i])] = i;
  }

  sample.protonated = AttributedGraph();
  sample.deprotonated = AttributedGraph();
  sample.protonated.nodes.reserve(n + 1);
  sample.deprotonated.nodes.reserve(n);

  for (int i = 0; i < n; ++i) {
    GraphNode &pn = sample.protonated.nodes.emplace_back(
        make_node(p, p.node_id(draft.protonated_atoms[i])));
    GraphNode &dn = sample.deprotonated.nodes.emplace_back(
        make_node(d, d.node_id(draft.deprotonated_atoms[i])));

    if (i == draft.center) {
      --pn.hydrogens;
      pn.reaction_center = dn.reaction_center = true;
    }
  }
  sample.protonated.nodes.push_back(kTransferredHydrogen);

  add_edges(sample.protonated, p, p_shared);
  sample.protonated.edges.push_back(
      { draft.center, n, constants::kSingleBond, false });
  add_edges(sample.deprotonated, d, d_shared);
  sort_edges(sample.protonated);
  sort_edges(sample.deprotonated);

  sample.protonated.total_charge = draft.protonated.total_charge();
  sample.deprotonated.total_charge = draft.deprotonated.total_charge();

  sample.pka = draft.pka;
  sample.source_id = draft.source_id;
  sample.site_id = draft.site_id;
  sample.parent_key = draft.parent_key;
  sample.pka_type = draft.pka_type;
  sample.center = draft.center;

  EncodingError err = check_vocabulary(sample.protonated, vocab);
  if (err == EncodingError::kNone)
    err = check_vocabulary(sample.deprotonated, vocab);

  ABSL_LOG_IF(INFO, err != EncodingError::kNone)
      << "Rejecting site " << draft.site_id << " of " << draft.source_id
      << ": " << err << " out of vocabulary " << vocab.version();

  return err;
}

Molecule decode_graph(const AttributedGraph &graph) {
  Molecule mol;
  mol.reserve(graph.num_nodes());
  mol.reserve_bonds(graph.num_edges());

  for (const GraphNode &node: graph.nodes) {
    mol.add_atom(AtomData(kPt[node.atomic_number], node.hydrogens,
                          node.formal_charge, node.hybridization,
                          node.aromatic, node.ring));
  }

  for (const GraphEdge &edge: graph.edges) {
    BondData data(edge.order);
    data.set_ring_bond(edge.ring)
        .set_aromatic(edge.order == constants::kAromaticBond);
    mol.add_bond(edge.src, edge.dst, data);
  }

  return mol;
}

std::string_view to_string(NodeFeature feature) {
  switch (feature) {
  case NodeFeature::kElement:
    return "element";
  case NodeFeature::kFormalCharge:
    return "formal_charge";
  case NodeFeature::kHybridization:
    return "hybridization";
  case NodeFeature::kAromatic:
    return "aromatic";
  case NodeFeature::kRing:
    return "ring";
  case NodeFeature::kHydrogenCount:
    return "hydrogens";
  case NodeFeature::kReactionCenter:
    return "reaction_center";
  }
  return "unknown";
}

std::string_view to_string(EdgeFeature feature) {
  switch (feature) {
  case EdgeFeature::kBondOrder:
    return "bond_order";
  case EdgeFeature::kRing:
    return "ring";
  }
  return "unknown";
}

FeatureSelection all_features() {
  return {
    { NodeFeature::kElement, NodeFeature::kFormalCharge,
      NodeFeature::kHybridization, NodeFeature::kAromatic, NodeFeature::kRing,
      NodeFeature::kHydrogenCount, NodeFeature::kReactionCenter },
    { EdgeFeature::kBondOrder, EdgeFeature::kRing },
  };
}

namespace {
template <class E>
bool parse_feature_list(std::vector<E> &selected, std::string_view list,
                        const std::vector<E> &choices) {
  selected.clear();
  if (absl::StripAsciiWhitespace(list).empty())
    return true;

  for (std::string_view name: absl::StrSplit(list, ',')) {
    name = absl::StripAsciiWhitespace(name);
    auto it = std::find_if(choices.begin(), choices.end(),
                           [&](E e) { return to_string(e) == name; });
    if (it == choices.end()) {
      ABSL_LOG(WARNING) << "Unknown feature " << name;
      return false;
    }

    if (std::find(selected.begin(), selected.end(), *it) != selected.end()) {
      ABSL_LOG(WARNING) << "Feature " << name << " selected twice";
      return false;
    }

    selected.push_back(*it);
  }

  return true;
}
}  // namespace

bool parse_feature_selection(FeatureSelection &selection,
                             std::string_view nodes, std::string_view edges) {
  const FeatureSelection all = all_features();

  FeatureSelection parsed;
  if (!parse_feature_list(parsed.nodes, nodes, all.nodes)
      || !parse_feature_list(parsed.edges, edges, all.edges))
    return false;

  selection = std::move(parsed);
  return true;
}

int feature_width(NodeFeature feature, const Vocabulary &vocab) {
  switch (feature) {
  case NodeFeature::kElement:
    return static_cast<int>(vocab.elements().size());
  case NodeFeature::kFormalCharge:
    return static_cast<int>(vocab.formal_charges().size());
  case NodeFeature::kHybridization:
    return static_cast<int>(vocab.hybridizations().size());
  case NodeFeature::kHydrogenCount:
    return static_cast<int>(vocab.hydrogen_counts().size());
  case NodeFeature::kAromatic:
  case NodeFeature::kRing:
  case NodeFeature::kReactionCenter:
    break;
  }
  return 1;
}

int feature_width(EdgeFeature feature, const Vocabulary &vocab) {
  if (feature == EdgeFeature::kBondOrder)
    return static_cast<int>(vocab.bond_orders().size());
  return 1;
}

namespace {
// Column of the set bit within the group, or -1 for a binary group
int node_feature_column(const GraphNode &node, NodeFeature feature,
                        const Vocabulary &vocab) {
  switch (feature) {
  case NodeFeature::kElement:
    return vocab.element_index(node.atomic_number);
  case NodeFeature::kFormalCharge:
    return vocab.formal_charge_index(node.formal_charge);
  case NodeFeature::kHybridization:
    return vocab.hybridization_index(node.hybridization);
  case NodeFeature::kHydrogenCount:
    return vocab.hydrogen_count_index(node.hydrogens);
  case NodeFeature::kAromatic:
  case NodeFeature::kRing:
  case NodeFeature::kReactionCenter:
    break;
  }
  return -1;
}

bool node_flag(const GraphNode &node, NodeFeature feature) {
  switch (feature) {
  case NodeFeature::kAromatic:
    return node.aromatic;
  case NodeFeature::kRing:
    return node.ring;
  case NodeFeature::kReactionCenter:
    return node.reaction_center;
  default:
    return false;
  }
}
}  // namespace

MatrixXf node_features(const AttributedGraph &graph, const Vocabulary &vocab,
                       const std::vector<NodeFeature> &selected) {
  int width = 0;
  for (NodeFeature feature: selected)
    width += feature_width(feature, vocab);

  MatrixXf features = MatrixXf::Zero(graph.num_nodes(), width);
  for (int i = 0; i < graph.num_nodes(); ++i) {
    const GraphNode &node = graph.nodes[i];

    int offset = 0;
    for (NodeFeature feature: selected) {
      const int col = node_feature_column(node, feature, vocab);
      if (col >= 0) {
        features(i, offset + col) = 1;
      } else {
        features(i, offset) = static_cast<float>(node_flag(node, feature));
      }
      offset += feature_width(feature, vocab);
    }
  }

  return features;
}

MatrixXf node_features(const AttributedGraph &graph,
                       const Vocabulary &vocab) {
  return node_features(graph, vocab, all_features().nodes);
}

MatrixXf edge_features(const AttributedGraph &graph, const Vocabulary &vocab,
                       const std::vector<EdgeFeature> &selected) {
  int width = 0;
  for (EdgeFeature feature: selected)
    width += feature_width(feature, vocab);

  MatrixXf features = MatrixXf::Zero(2 * graph.num_edges(), width);
  for (int k = 0; k < graph.num_edges(); ++k) {
    const GraphEdge &edge = graph.edges[k];

    int offset = 0;
    for (EdgeFeature feature: selected) {
      for (int row: { 2 * k, 2 * k + 1 }) {
        if (feature == EdgeFeature::kBondOrder) {
          features(row, offset + vocab.bond_order_index(edge.order)) = 1;
        } else {
          features(row, offset) = static_cast<float>(edge.ring);
        }
      }
      offset += feature_width(feature, vocab);
    }
  }

  return features;
}

MatrixXf edge_features(const AttributedGraph &graph,
                       const Vocabulary &vocab) {
  return edge_features(graph, vocab, all_features().edges);
}

Array2Xi edge_index(const AttributedGraph &graph) {
  Array2Xi index(2, 2 * graph.num_edges());
  for (int k = 0; k < graph.num_edges(); ++k) {
    const GraphEdge &edge = graph.edges[k];
    index.col(2 * k) << edge.src, edge.dst;
    index.col(2 * k + 1) << edge.dst, edge.src;
  }
  return index;
}

EncodedGraph encode_graph(const AttributedGraph &graph,
                          const Vocabulary &vocab,
                          const FeatureSelection &selection) {
  return { node_features(graph, vocab, selection.nodes), edge_index(graph),
           edge_features(graph, vocab, selection.edges) };
}

std::vector<EncodedGraph> export_sample(const ReactionSample &sample,
                                        ExportMode mode,
                                        const Vocabulary &vocab,
                                        const FeatureSelection &selection) {
  std::vector<EncodedGraph> graphs;
  if (mode != ExportMode::kDeprotonated)
    graphs.push_back(encode_graph(sample.protonated, vocab, selection));
  if (mode != ExportMode::kProtonated)
    graphs.push_back(encode_graph(sample.deprotonated, vocab, selection));
  return graphs;
}
}  // namespace proton
