//
// Project ProtonKit - Copyright 2026 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "proton/pka/dataset.h"

#include <cmath>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <istream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>
#include <absl/log/absl_log.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_split.h>
#include <boost/spirit/home/x3.hpp>

#include "proton/random.h"
#include "proton/utils.h"
#include "proton/core/molecule.h"
#include "proton/pka/encoder.h"
#include "proton/pka/errors.h"
#include "proton/pka/vocabulary.h"

namespace proton {
bool check_sample_shape(const ReactionSample &sample) {
  const AttributedGraph &p = sample.protonated, &d = sample.deprotonated;
  const int n = d.num_nodes();

  if (n == 0 || p.num_nodes() != n + 1 || p.num_edges() != d.num_edges() + 1)
    return false;

  if (sample.center < 0 || sample.center >= n)
    return false;

  if (p.nodes[n].atomic_number != 1)
    return false;

  auto valid_edges = [](const AttributedGraph &g) {
    for (const GraphEdge &edge: g.edges) {
      if (edge.src < 0 || edge.src >= edge.dst || edge.dst >= g.num_nodes())
        return false;
    }
    return true;
  };
  if (!valid_edges(p) || !valid_edges(d))
    return false;

  int hydrogen_edges = 0;
  for (const GraphEdge &edge: p.edges) {
    if (edge.dst != n)
      continue;

    if (edge.src != sample.center)
      return false;
    ++hydrogen_edges;
  }

  return hydrogen_edges == 1;
}

IntegrityError check_integrity(const std::vector<ReactionSample> &samples,
                               const Vocabulary &vocab) {
  absl::flat_hash_set<std::pair<std::string_view, int>> keys;
  keys.reserve(samples.size());

  for (int i = 0; i < static_cast<int>(samples.size()); ++i) {
    const ReactionSample &sample = samples[i];

    if (!keys.insert({ sample.source_id, sample.site_id }).second) {
      ABSL_LOG(ERROR) << "Duplicate sample key (" << sample.source_id << ", "
                      << sample.site_id << ") at index " << i;
      return IntegrityError::kDuplicateKey;
    }

    if (!check_sample_shape(sample)) {
      ABSL_LOG(ERROR) << "Invalid graph pair shape of sample " << i << " ("
                      << sample.source_id << ", " << sample.site_id << ")";
      return IntegrityError::kShapeViolation;
    }

    EncodingError err = check_vocabulary(sample.protonated, vocab);
    if (err == EncodingError::kNone)
      err = check_vocabulary(sample.deprotonated, vocab);
    if (err != EncodingError::kNone) {
      ABSL_LOG(ERROR) << "Sample " << i << " (" << sample.source_id << ", "
                      << sample.site_id << ") has " << err
                      << " outside vocabulary " << vocab.version();
      return IntegrityError::kVocabularyMismatch;
    }
  }

  return IntegrityError::kNone;
}

IntegrityError assemble_dataset(Dataset &dataset,
                                std::vector<ReactionSample> samples,
                                const Vocabulary &vocab) {
  IntegrityError err = check_integrity(samples, vocab);
  if (err != IntegrityError::kNone)
    return err;

  dataset.vocab_version_ = vocab.version();
  dataset.samples_ = std::move(samples);
  return IntegrityError::kNone;
}

namespace {
constexpr std::string_view kMagic = "PROTONKIT-DATASET";

void write_graph(std::string &out, const AttributedGraph &graph) {
  absl::StrAppend(&out, "graph ", graph.num_nodes(), " ", graph.num_edges(),
                  " ", graph.total_charge, "\n");

  for (const GraphNode &node: graph.nodes) {
    absl::StrAppend(&out, "node ", node.atomic_number, " ",
                    node.formal_charge, " ",
                    static_cast<int>(node.hybridization), " ",
                    static_cast<int>(node.aromatic), " ",
                    static_cast<int>(node.ring), " ", node.hydrogens, " ",
                    static_cast<int>(node.reaction_center), "\n");
  }

  for (const GraphEdge &edge: graph.edges) {
    absl::StrAppend(&out, "edge ", edge.src, " ", edge.dst, " ",
                    static_cast<int>(edge.order), " ",
                    static_cast<int>(edge.ring), "\n");
  }
}
}  // namespace

void write_dataset(std::string &out, const Dataset &dataset) {
  absl::StrAppend(&out, kMagic, " ", kDatasetFormatVersion, "\n",
                  "vocabulary ", dataset.vocabulary_version(), "\n",
                  "samples ", dataset.size(), "\n");

  for (const ReactionSample &sample: dataset) {
    absl::StrAppend(&out, "sample\n",
                    "source_id ", sample.source_id, "\n",
                    "site_id ", sample.site_id, "\n");
    absl::StrAppendFormat(&out, "pka %.17g\n", sample.pka);
    absl::StrAppend(&out, "pka_type ", sample.pka_type, "\n",
                    "parent_key ", sample.parent_key, "\n",
                    "center ", sample.center, "\n");
    write_graph(out, sample.protonated);
    write_graph(out, sample.deprotonated);
    absl::StrAppend(&out, "end\n");
  }
}

namespace {
namespace x3 = boost::spirit::x3;

// NOLINTBEGIN(readability-identifier-naming)
namespace parser {
constexpr auto int_list =  //
    x3::omit[*x3::blank] >> x3::int_ % +x3::blank
    >> x3::omit[*x3::space] >> x3::eoi;
}  // namespace parser
// NOLINTEND(readability-identifier-naming)

class LineReader {
public:
  explicit LineReader(std::istream &is): is_(&is) { }

  bool next() {
    ++lineno_;
    if (!std::getline(*is_, line_))
      return false;

    if (absl::EndsWith(line_, "\r"))
      line_.pop_back();
    return true;
  }

  /**
   * @brief Read the next line and split it into a key and the rest of the
   *        line.
   * @return false if the stream ended or the key does not match.
   */
  bool expect(std::string_view key, std::string_view &value) {
    if (!next()) {
      ABSL_LOG(WARNING) << "Unexpected end of dataset, expected " << key;
      return false;
    }

    std::pair<std::string_view, std::string_view> kv =
        absl::StrSplit(line_, absl::MaxSplits(' ', 1));
    if (kv.first != key) {
      ABSL_LOG(WARNING) << "Line " << lineno_ << ": expected " << key
                        << ", got " << kv.first;
      return false;
    }

    value = kv.second;
    return true;
  }

  bool expect_ints(std::string_view key, std::vector<int> &values,
                   size_t count) {
    std::string_view data;
    if (!expect(key, data))
      return false;

    values.clear();
    auto it = data.begin();
    if (!x3::parse(it, data.end(), parser::int_list, values)
        || values.size() != count) {
      ABSL_LOG(WARNING) << "Line " << lineno_ << ": expected " << count
                        << " integers";
      return false;
    }

    return true;
  }

  int lineno() const { return lineno_; }

private:
  std::istream *is_;
  std::string line_;
  int lineno_ = 0;
};

bool read_graph(AttributedGraph &graph, LineReader &reader) {
  std::vector<int> values;
  if (!reader.expect_ints("graph", values, 3))
    return false;

  const int num_nodes = values[0], num_edges = values[1];
  if (num_nodes < 0 || num_edges < 0) {
    ABSL_LOG(WARNING) << "Line " << reader.lineno()
                      << ": negative graph size";
    return false;
  }
  graph.total_charge = values[2];

  graph.nodes.clear();
  for (int i = 0; i < num_nodes; ++i) {
    if (!reader.expect_ints("node", values, 7))
      return false;

    if (values[0] < 0 || values[0] >= kPt.kElementCount_
        || values[2] < constants::kUnbound
        || values[2] > constants::kOtherHyb || values[5] < 0) {
      ABSL_LOG(WARNING) << "Line " << reader.lineno()
                        << ": invalid node attributes";
      return false;
    }

    graph.nodes.push_back({ values[0], values[1],
                            static_cast<constants::Hybridization>(values[2]),
                            values[3] != 0, values[4] != 0, values[5],
                            values[6] != 0 });
  }

  graph.edges.clear();
  for (int i = 0; i < num_edges; ++i) {
    if (!reader.expect_ints("edge", values, 4))
      return false;

    if (values[2] < constants::kOtherBond
        || values[2] > constants::kAromaticBond) {
      ABSL_LOG(WARNING) << "Line " << reader.lineno()
                        << ": invalid bond order " << values[2];
      return false;
    }

    graph.edges.push_back({ values[0], values[1],
                            static_cast<constants::BondOrder>(values[2]),
                            values[3] != 0 });
  }

  return true;
}

bool read_sample(ReactionSample &sample, LineReader &reader) {
  std::string_view value;

  if (!reader.expect("sample", value) || !reader.expect("source_id", value))
    return false;
  sample.source_id = std::string(value);

  if (!reader.expect("site_id", value)
      || !absl::SimpleAtoi(value, &sample.site_id)) {
    ABSL_LOG(WARNING) << "Line " << reader.lineno() << ": invalid site_id";
    return false;
  }

  if (!reader.expect("pka", value) || !absl::SimpleAtod(value, &sample.pka)
      || !std::isfinite(sample.pka)) {
    ABSL_LOG(WARNING) << "Line " << reader.lineno() << ": invalid pka";
    return false;
  }

  if (!reader.expect("pka_type", value))
    return false;
  sample.pka_type = std::string(value);

  if (!reader.expect("parent_key", value))
    return false;
  sample.parent_key = std::string(value);

  if (!reader.expect("center", value)
      || !absl::SimpleAtoi(value, &sample.center)) {
    ABSL_LOG(WARNING) << "Line " << reader.lineno() << ": invalid center";
    return false;
  }

  return read_graph(sample.protonated, reader)
         && read_graph(sample.deprotonated, reader)
         && reader.expect("end", value);
}
}  // namespace

bool read_dataset(Dataset &dataset, std::istream &is) {
  LineReader reader(is);
  std::string_view value;

  int format_version;
  if (!reader.expect(kMagic, value)
      || !absl::SimpleAtoi(value, &format_version)) {
    ABSL_LOG(ERROR) << "Not a dataset file";
    return false;
  }

  if (format_version != kDatasetFormatVersion) {
    ABSL_LOG(ERROR) << "Unsupported dataset format version "
                    << format_version;
    return false;
  }

  if (!reader.expect("vocabulary", value))
    return false;

  const Vocabulary *vocab = find_vocabulary(value);
  if (vocab == nullptr) {
    ABSL_LOG(ERROR) << "Unknown vocabulary version " << value;
    return false;
  }

  int num_samples;
  if (!reader.expect("samples", value)
      || !absl::SimpleAtoi(value, &num_samples) || num_samples < 0) {
    ABSL_LOG(ERROR) << "Invalid sample count";
    return false;
  }

  // Header counts are untrusted, grow only as records are read
  std::vector<ReactionSample> samples;
  for (int i = 0; i < num_samples; ++i) {
    ReactionSample sample;
    if (!read_sample(sample, reader)) {
      ABSL_LOG(ERROR) << "Failed to read sample " << i;
      return false;
    }
    samples.push_back(std::move(sample));
  }

  IntegrityError err = assemble_dataset(dataset, std::move(samples), *vocab);
  if (err != IntegrityError::kNone) {
    ABSL_LOG(ERROR) << "Dataset failed validation: " << err;
    return false;
  }

  return true;
}

bool save_dataset(const Dataset &dataset, const std::filesystem::path &path) {
  std::string data;
  write_dataset(data, dataset);

  std::filesystem::path tmp = path;
  tmp += ".tmp";

  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      ABSL_LOG(ERROR) << "Cannot open " << tmp << " for writing";
      return false;
    }

    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.close();
    if (!ofs) {
      ABSL_LOG(ERROR) << "Failed to write " << tmp;
      std::error_code ec;
      std::filesystem::remove(tmp, ec);
      return false;
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    ABSL_LOG(ERROR) << "Cannot move " << tmp << " to " << path << ": "
                    << ec.message();
    std::filesystem::remove(tmp, ec);
    return false;
  }

  ABSL_LOG(INFO) << "Wrote " << dataset.size() << " samples to " << path;
  return true;
}

bool load_dataset(Dataset &dataset, const std::filesystem::path &path) {
  std::ifstream ifs(path);
  if (!ifs) {
    ABSL_LOG(ERROR) << "Cannot open " << path;
    return false;
  }

  return read_dataset(dataset, ifs);
}

bool split_dataset(std::vector<int> &train, std::vector<int> &validation,
                   const int size, const double ratio, const int seed) {
  if (!(ratio > 0.0 && ratio < 1.0)) {
    ABSL_LOG(ERROR) << "Split ratio must be in (0, 1), got " << ratio;
    return false;
  }

  const std::vector<int> ids = internal::shuffled_indices(size, seed);

  const auto split = static_cast<std::ptrdiff_t>(std::lround(size * ratio));
  train.assign(ids.begin(), ids.begin() + split);
  validation.assign(ids.begin() + split, ids.end());
  return true;
}

std::vector<std::vector<int>> slice_indices(const int n, const int k) {
  std::vector<std::vector<int>> slices(proton::max(k, 0));
  if (k <= 0)
    return slices;

  const int slice_size = n / k;
  int remain = n % k, next = 0;
  for (std::vector<int> &slice: slices) {
    const int count = slice_size + static_cast<int>(remain > 0);
    remain -= static_cast<int>(remain > 0);

    slice.reserve(count);
    for (int i = 0; i < count; ++i)
      slice.push_back(next++);
  }

  return slices;
}

bool cross_validation_fold(std::vector<int> &train,
                           std::vector<int> &validation,
                           const std::vector<std::vector<int>> &slices,
                           const int fold) {
  if (fold < 0 || fold >= static_cast<int>(slices.size())) {
    ABSL_LOG(ERROR) << "Fold " << fold << " out of range (" << slices.size()
                    << " slices)";
    return false;
  }

  train.clear();
  for (int i = 0; i < static_cast<int>(slices.size()); ++i) {
    if (i != fold)
      train.insert(train.end(), slices[i].begin(), slices[i].end());
  }
  validation = slices[fold];
  return true;
}

absl::flat_hash_map<std::string, std::vector<int>>
provenance(const Dataset &dataset) {
  absl::flat_hash_map<std::string, std::vector<int>> result;
  for (int i = 0; i < dataset.size(); ++i)
    result[dataset[i].source_id].push_back(i);
  return result;
}
}  // namespace proton
