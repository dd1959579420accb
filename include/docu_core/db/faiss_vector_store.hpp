#pragma once
#include <faiss/Index.h>
#include <faiss/IndexIDMap.h>
#include <sqlite_modern_cpp.h>

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

#include "docu_core/config.hpp"
#include "docu_core/db/database_manager.hpp"
#include "docu_core/db/vector_store.hpp"

namespace docu_core {

/**
 * @brief VectorStore backed by an SQLCipher table and an in-memory faiss HNSW index.
 *
 * One table per collection holds the chunk id, the zstd-compressed text, the
 * metadata as JSON text and the raw float vector. The HNSW index (inner
 * product over normalised vectors) mirrors every row and is rebuilt from the
 * table on construction and after deletes. Filtered queries search an exact
 * temporary index built from the matching rows only.
 */
class FaissVectorStore : public VectorStore {
 public:
  FaissVectorStore(DatabaseManager& db_manager, const VectorStoreSettings& settings, int dimension);
  ~FaissVectorStore() override = default;

  FaissVectorStore(const FaissVectorStore&) = delete;
  FaissVectorStore& operator=(const FaissVectorStore&) = delete;

  // Non-movable to keep DB references stable
  FaissVectorStore(FaissVectorStore&&) = delete;
  FaissVectorStore& operator=(FaissVectorStore&&) = delete;

  // All rows of one call are written in a single transaction
  std::vector<std::string> add(const std::vector<std::string>& ids,
                               const std::vector<std::vector<float>>& vectors,
                               const std::vector<std::string>& texts,
                               const std::vector<nlohmann::json>& metadatas) override;

  QueryResult query(const std::vector<std::vector<float>>& vectors,
                    int k,
                    const nlohmann::json& filter) override;

  size_t delete_where(const nlohmann::json& filter) override;
  size_t count() override;
  void reset() override;

  std::string collection_name() const override {
    return settings_.collection_name;
  }

  int dimension() const {
    return dimension_;
  }

  void rebuild_faiss_index();

 private:
  struct StoredRow {
    std::string chunk_id;
    std::string document;
    nlohmann::json metadata;
  };

  void setup_schema();
  std::unique_ptr<faiss::IndexIDMap> create_base_index() const;
  std::unique_ptr<faiss::IndexIDMap> create_filtered_index(const nlohmann::json& filter);
  void search_faiss_index(faiss::Index& index,
                          const std::vector<float>& query_vector,
                          int k,
                          std::vector<float>& scores,
                          std::vector<faiss::idx_t>& labels) const;
  std::unordered_map<int64_t, StoredRow> fetch_rows(const std::vector<int64_t>& row_ids);
  void check_dimension(const std::vector<float>& vector, const std::string& what) const;

  DatabaseManager& db_manager_;
  VectorStoreSettings settings_;
  int dimension_;
  std::string table_;

  // In-memory Faiss index over every stored row, keyed by row_id
  std::unique_ptr<faiss::IndexIDMap> faiss_index_;
};

}  // namespace docu_core
