//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#ifndef PROTON_PKA_ENCODER_H_
#define PROTON_PKA_ENCODER_H_

//! @cond
#include <limits>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>
//! @endcond

#include "proton/eigen_config.h"
#include "proton/core/molecule.h"
#include "proton/pka/errors.h"
#include "proton/pka/normalizer.h"
#include "proton/pka/vocabulary.h"

namespace proton {
struct GraphNode {
  int atomic_number;
  int formal_charge;
  constants::Hybridization hybridization;
  bool aromatic;
  bool ring;
  // Attached hydrogens, not counting the transferred hydrogen
  int hydrogens;
  bool reaction_center;
};

inline bool operator==(const GraphNode &lhs, const GraphNode &rhs) {
  return lhs.atomic_number == rhs.atomic_number
         && lhs.formal_charge == rhs.formal_charge
         && lhs.hybridization == rhs.hybridization
         && lhs.aromatic == rhs.aromatic && lhs.ring == rhs.ring
         && lhs.hydrogens == rhs.hydrogens
         && lhs.reaction_center == rhs.reaction_center;
}

inline bool operator!=(const GraphNode &lhs, const GraphNode &rhs) {
  return !(lhs == rhs);
}

/**
 * @brief An undirected edge, stored once with `src < dst`.
 */
struct GraphEdge {
  int src;
  int dst;
  constants::BondOrder order;
  bool ring;
};

inline bool operator==(const GraphEdge &lhs, const GraphEdge &rhs) {
  return lhs.src == rhs.src && lhs.dst == rhs.dst && lhs.order == rhs.order
         && lhs.ring == rhs.ring;
}

inline bool operator!=(const GraphEdge &lhs, const GraphEdge &rhs) {
  return !(lhs == rhs);
}

struct AttributedGraph {
  std::vector<GraphNode> nodes;
  std::vector<GraphEdge> edges;
  int total_charge = 0;

  int num_nodes() const { return static_cast<int>(nodes.size()); }

  int num_edges() const { return static_cast<int>(edges.size()); }
};

/**
 * @brief One training sample.
 *
 * Node `i < n` of both graphs is shared atom `i` of the reaction. The
 * protonated graph has one more node, the transferred hydrogen, at index `n`,
 * and one more edge, between the reaction center and the hydrogen.
 */
struct ReactionSample {
  AttributedGraph protonated;
  AttributedGraph deprotonated;
  double pka = std::numeric_limits<double>::quiet_NaN();
  std::string source_id;
  int site_id = -1;
  std::string parent_key;
  std::string pka_type;
  int center = -1;

  int num_shared_atoms() const { return deprotonated.num_nodes(); }
};

/**
 * @brief Encode a normalized pair.
 *
 * @param sample Receives the sample. Unspecified on failure.
 * @param draft The normalized pair.
 * @param vocab The vocabulary.
 * @return EncodingError::kNone on success, or the first attribute found out
 *         of vocabulary.
 */
extern EncodingError encode_reaction(ReactionSample &sample,
                                     const ReactionDraft &draft,
                                     const Vocabulary &vocab);

/**
 * @brief Check that all attributes of a graph are in the vocabulary.
 */
extern EncodingError check_vocabulary(const AttributedGraph &graph,
                                      const Vocabulary &vocab);

/**
 * @brief Reconstruct a molecule from a graph.
 *
 * Hydrogen counts of the nodes become implicit hydrogens. Ring and aromatic
 * flags are copied from the graph.
 */
extern Molecule decode_graph(const AttributedGraph &graph);

/**
 * @brief One-hot node features.
 * @return A (num nodes) x (vocab.num_node_features()) matrix.
 * @pre All attributes of the graph are in the vocabulary.
 */
extern MatrixXf node_features(const AttributedGraph &graph,
                              const Vocabulary &vocab);

/**
 * @brief One-hot edge features, one row per directed edge.
 * @return A (2 * num edges) x (vocab.num_edge_features()) matrix. Rows follow
 *         the columns of edge_index().
 * @pre All attributes of the graph are in the vocabulary.
 */
extern MatrixXf edge_features(const AttributedGraph &graph,
                              const Vocabulary &vocab);

/**
 * @brief Directed edge list of a graph.
 * @return A 2 x (2 * num edges) matrix. Column `2k` is edge `k` in its stored
 *         direction and column `2k + 1` the reverse.
 */
extern Array2Xi edge_index(const AttributedGraph &graph);

/**
 * @brief Groups of node feature columns, in the order of the full layout.
 */
enum class NodeFeature {
  kElement,
  kFormalCharge,
  kHybridization,
  kAromatic,
  kRing,
  kHydrogenCount,
  kReactionCenter,
};

enum class EdgeFeature {
  kBondOrder,
  kRing,
};

extern std::string_view to_string(NodeFeature feature);
extern std::string_view to_string(EdgeFeature feature);

inline std::ostream &operator<<(std::ostream &os, NodeFeature feature) {
  return os << to_string(feature);
}

inline std::ostream &operator<<(std::ostream &os, EdgeFeature feature) {
  return os << to_string(feature);
}

/**
 * @brief Feature groups to emit, in column order.
 */
struct FeatureSelection {
  std::vector<NodeFeature> nodes;
  std::vector<EdgeFeature> edges;
};

/**
 * @brief Every feature group, in the layout of node_features() and
 *        edge_features().
 */
extern FeatureSelection all_features();

/**
 * @brief Parse comma-separated feature group names.
 *
 * Names are those returned by to_string(), e.g. `element,hydrogens`. An empty
 * list selects nothing.
 *
 * @return Whether all names were known and none was repeated. On failure the
 *         selection is unchanged.
 */
extern bool parse_feature_selection(FeatureSelection &selection,
                                    std::string_view nodes,
                                    std::string_view edges);

extern int feature_width(NodeFeature feature, const Vocabulary &vocab);
extern int feature_width(EdgeFeature feature, const Vocabulary &vocab);

/**
 * @brief Node features restricted to the selected groups.
 * @return A (num nodes) x (sum of selected widths) matrix.
 * @pre All attributes of the graph are in the vocabulary.
 */
extern MatrixXf node_features(const AttributedGraph &graph,
                              const Vocabulary &vocab,
                              const std::vector<NodeFeature> &selected);

/**
 * @brief Edge features restricted to the selected groups.
 * @return A (2 * num edges) x (sum of selected widths) matrix.
 * @pre All attributes of the graph are in the vocabulary.
 */
extern MatrixXf edge_features(const AttributedGraph &graph,
                              const Vocabulary &vocab,
                              const std::vector<EdgeFeature> &selected);

enum class ExportMode {
  kPaired,
  kProtonated,
  kDeprotonated,
};

/**
 * @brief Tensors of a single graph.
 */
struct EncodedGraph {
  MatrixXf x;
  Array2Xi edge_index;
  MatrixXf edge_attr;
};

extern EncodedGraph encode_graph(const AttributedGraph &graph,
                                 const Vocabulary &vocab,
                                 const FeatureSelection &selection);

/**
 * @brief Export the tensors of a sample.
 *
 * @return Two graphs (protonated, then deprotonated) for
 *         ExportMode::kPaired, otherwise the graph of the requested state.
 */
extern std::vector<EncodedGraph>
export_sample(const ReactionSample &sample, ExportMode mode,
              const Vocabulary &vocab, const FeatureSelection &selection);
}  // namespace proton

#endif /* PROTON_PKA_ENCODER_H_ */
