#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace docu_core {

// Per-query lists, in the same order as the query vectors
struct QueryResult {
  std::vector<std::vector<std::string>> ids;
  std::vector<std::vector<float>> distances;
  std::vector<std::vector<std::string>> documents;
  std::vector<std::vector<nlohmann::json>> metadatas;
};

/**
 * @brief Persistent store of embedded chunks with nearest-neighbour search.
 *
 * Distances are cosine distances in [0, 2]. Metadata is a flat JSON object of
 * scalars; filters are JSON objects whose entries must all equal the stored
 * metadata values. Every failure surfaces as VectorStoreError.
 */
class VectorStore {
 public:
  virtual ~VectorStore() = default;

  // Empty ids are replaced with generated UUIDs. Returns the ids actually stored.
  virtual std::vector<std::string> add(const std::vector<std::string>& ids,
                                       const std::vector<std::vector<float>>& vectors,
                                       const std::vector<std::string>& texts,
                                       const std::vector<nlohmann::json>& metadatas) = 0;

  // An empty filter object matches everything
  virtual QueryResult query(const std::vector<std::vector<float>>& vectors,
                            int k,
                            const nlohmann::json& filter) = 0;

  // Returns the number of deleted entries. An empty filter is rejected; use reset().
  virtual size_t delete_where(const nlohmann::json& filter) = 0;

  virtual size_t count() = 0;
  virtual void reset() = 0;
  virtual std::string collection_name() const = 0;
};

// Drops nulls, keeps strings, numbers and booleans, and stores anything else as its JSON text
nlohmann::json sanitize_metadata(const nlohmann::json& metadata);

// True when every entry of filter equals the metadata value under the same key
bool metadata_matches(const nlohmann::json& metadata, const nlohmann::json& filter);

}  // namespace docu_core
