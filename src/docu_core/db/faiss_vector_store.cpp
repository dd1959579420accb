#include "docu_core/db/faiss_vector_store.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/IndexHNSW.h>
#include <faiss/impl/FaissException.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <optional>
#include <regex>
#include <sstream>

#include "docu_core/db/pooled_connection.hpp"
#include "docu_core/db/sqlite_error_utils.hpp"
#include "docu_core/db/transaction.hpp"
#include "docu_core/errors.hpp"
#include "docu_core/services/compression_service.hpp"
#include "docu_core/util/hashing.hpp"

namespace docu_core {

namespace {

std::string row_ids_to_comma_string(const std::vector<int64_t>& row_ids) {
  std::stringstream ss;
  for (size_t i = 0; i < row_ids.size(); ++i) {
    ss << row_ids[i];
    if (i < row_ids.size() - 1)
      ss << ",";
  }
  return ss.str();
}

nlohmann::json parse_stored_metadata(const std::string& text) {
  nlohmann::json metadata = nlohmann::json::parse(text, nullptr, false);
  if (metadata.is_discarded() || !metadata.is_object()) {
    spdlog::warn("Ignoring unreadable stored metadata: {}", text);
    return nlohmann::json::object();
  }
  return metadata;
}

bool is_empty_filter(const nlohmann::json& filter) {
  return filter.is_null() || (filter.is_object() && filter.empty());
}

}  // namespace

FaissVectorStore::FaissVectorStore(DatabaseManager& db_manager,
                                   const VectorStoreSettings& settings,
                                   int dimension)
    : db_manager_(db_manager), settings_(settings), dimension_(dimension) {
  if (dimension_ <= 0) {
    throw VectorStoreError("Vector dimension must be greater than 0");
  }
  static const std::regex table_name_regex(R"([A-Za-z_][A-Za-z0-9_]*)");
  if (!std::regex_match(settings_.collection_name, table_name_regex)) {
    throw VectorStoreError("Invalid collection name: " + settings_.collection_name);
  }
  table_ = settings_.collection_name;

  setup_schema();
  rebuild_faiss_index();
  spdlog::info("Vector store '{}' ready with {} chunks", table_, faiss_index_->ntotal);
}

void FaissVectorStore::setup_schema() {
  try {
    PooledConnection conn(db_manager_);
    *conn << "CREATE TABLE IF NOT EXISTS " + table_ + R"( (
          row_id INTEGER PRIMARY KEY AUTOINCREMENT,
          chunk_id TEXT UNIQUE NOT NULL,
          document BLOB,
          metadata TEXT NOT NULL,
          vector_blob BLOB NOT NULL
      ))";
  } catch (const sqlite::sqlite_exception& e) {
    throw db_error("setup_schema", e);
  }
}

std::vector<std::string> FaissVectorStore::add(const std::vector<std::string>& ids,
                                               const std::vector<std::vector<float>>& vectors,
                                               const std::vector<std::string>& texts,
                                               const std::vector<nlohmann::json>& metadatas) {
  if (vectors.empty()) {
    throw VectorStoreError("Cannot add an empty batch to the vector store");
  }
  if (texts.size() != vectors.size() || metadatas.size() != vectors.size() ||
      (!ids.empty() && ids.size() != vectors.size())) {
    throw VectorStoreError("Mismatched batch sizes: " + std::to_string(ids.size()) + " ids, " +
                           std::to_string(vectors.size()) + " vectors, " +
                           std::to_string(texts.size()) + " texts, " +
                           std::to_string(metadatas.size()) + " metadatas");
  }
  for (const auto& vector : vectors) {
    check_dimension(vector, "Stored vector");
  }

  std::vector<std::string> stored_ids(vectors.size());
  for (size_t i = 0; i < vectors.size(); ++i) {
    stored_ids[i] = (ids.empty() || ids[i].empty()) ? generate_uuid4() : ids[i];
  }

  std::vector<faiss::idx_t> row_ids;
  row_ids.reserve(vectors.size());
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);
    for (size_t i = 0; i < vectors.size(); ++i) {
      std::vector<char> vector_blob(vectors[i].size() * sizeof(float));
      std::memcpy(vector_blob.data(), vectors[i].data(), vector_blob.size());

      *conn << "INSERT INTO " + table_ +
                   " (chunk_id, document, metadata, vector_blob) VALUES (?, ?, ?, ?)"
            << stored_ids[i] << CompressionService::compress(texts[i])
            << sanitize_metadata(metadatas[i]).dump() << vector_blob;
      row_ids.push_back(static_cast<faiss::idx_t>(conn->last_insert_rowid()));
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception& e) {
    throw db_error("add", e);
  } catch (const VectorStoreError&) {
    throw;
  } catch (const DocuMindError& e) {
    throw VectorStoreError("add failed: " + std::string(e.what()));
  }

  std::vector<float> all_vectors_flat;
  all_vectors_flat.reserve(vectors.size() * static_cast<size_t>(dimension_));
  for (const auto& vector : vectors) {
    all_vectors_flat.insert(all_vectors_flat.end(), vector.begin(), vector.end());
  }
  try {
    faiss_index_->add_with_ids(static_cast<faiss::idx_t>(row_ids.size()), all_vectors_flat.data(),
                               row_ids.data());
  } catch (const faiss::FaissException& e) {
    // The rows are committed; bring the index back in line with the table
    spdlog::warn("Faiss insert failed ({}), rebuilding index for '{}'", e.what(), table_);
    rebuild_faiss_index();
  }

  spdlog::debug("Stored {} chunks in '{}'", stored_ids.size(), table_);
  return stored_ids;
}

QueryResult FaissVectorStore::query(const std::vector<std::vector<float>>& vectors,
                                    int k,
                                    const nlohmann::json& filter) {
  if (k <= 0) {
    throw VectorStoreError("Query k must be greater than 0, got " + std::to_string(k));
  }
  if (!filter.is_null() && !filter.is_object()) {
    throw VectorStoreError("Metadata filter must be a JSON object");
  }

  std::unique_ptr<faiss::IndexIDMap> filtered_index;
  faiss::IndexIDMap* index = faiss_index_.get();
  if (!is_empty_filter(filter)) {
    filtered_index = create_filtered_index(filter);
    index = filtered_index.get();
  }

  QueryResult result;
  for (const auto& query_vector : vectors) {
    check_dimension(query_vector, "Query vector");

    std::vector<std::string> ids;
    std::vector<float> distances;
    std::vector<std::string> documents;
    std::vector<nlohmann::json> metadatas;

    const int actual_k = static_cast<int>(std::min<faiss::idx_t>(k, index->ntotal));
    if (actual_k > 0) {
      std::vector<float> scores(actual_k);
      std::vector<faiss::idx_t> labels(actual_k);
      search_faiss_index(*index, query_vector, actual_k, scores, labels);

      std::vector<int64_t> label_ids;
      for (const auto label : labels) {
        if (label != -1) {
          label_ids.push_back(label);
        }
      }
      auto rows = fetch_rows(label_ids);

      for (int i = 0; i < actual_k; ++i) {
        if (labels[i] == -1)
          continue;
        auto it = rows.find(labels[i]);
        if (it == rows.end()) {
          spdlog::warn("Faiss returned row {} but no corresponding row exists in '{}'", labels[i],
                       table_);
          continue;
        }
        // Inner product of unit vectors is the cosine similarity
        ids.push_back(it->second.chunk_id);
        distances.push_back(std::clamp(1.0f - scores[i], 0.0f, 2.0f));
        documents.push_back(std::move(it->second.document));
        metadatas.push_back(std::move(it->second.metadata));
      }
    }

    result.ids.push_back(std::move(ids));
    result.distances.push_back(std::move(distances));
    result.documents.push_back(std::move(documents));
    result.metadatas.push_back(std::move(metadatas));
  }
  return result;
}

size_t FaissVectorStore::delete_where(const nlohmann::json& filter) {
  if (!filter.is_object() || filter.empty()) {
    throw VectorStoreError("delete_where requires a non-empty filter object");
  }

  size_t deleted = 0;
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);

    std::vector<int64_t> row_ids;
    *conn << "SELECT row_id, metadata FROM " + table_ >>
        [&](int64_t row_id, std::string metadata) {
          if (metadata_matches(parse_stored_metadata(metadata), filter)) {
            row_ids.push_back(row_id);
          }
        };

    if (!row_ids.empty()) {
      *conn << "DELETE FROM " + table_ + " WHERE row_id IN (" +
                   row_ids_to_comma_string(row_ids) + ")";
    }
    tx.commit();
    deleted = row_ids.size();
  } catch (const sqlite::sqlite_exception& e) {
    throw db_error("delete_where", e);
  }

  if (deleted > 0) {
    rebuild_faiss_index();
  }
  return deleted;
}

size_t FaissVectorStore::count() {
  try {
    PooledConnection conn(db_manager_);
    int64_t total = 0;
    *conn << "SELECT count(*) FROM " + table_ >> total;
    return static_cast<size_t>(total);
  } catch (const sqlite::sqlite_exception& e) {
    throw db_error("count", e);
  }
}

void FaissVectorStore::reset() {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM " + table_;
  } catch (const sqlite::sqlite_exception& e) {
    throw db_error("reset", e);
  }
  rebuild_faiss_index();
  spdlog::info("Cleared all chunks from '{}'", table_);
}

void FaissVectorStore::rebuild_faiss_index() {
  auto index = create_base_index();

  try {
    std::vector<faiss::idx_t> faiss_ids;
    std::vector<float> all_vectors_flat;
    const size_t expected_bytes = static_cast<size_t>(dimension_) * sizeof(float);

    {
      // Scope the connection strictly to the DB fetch
      PooledConnection conn(db_manager_);
      *conn << "SELECT row_id, vector_blob FROM " + table_ >>
          [&](int64_t row_id, std::vector<char> vector_blob) {
            if (vector_blob.size() == expected_bytes) {
              faiss_ids.push_back(row_id);
              const float* vec_ptr = reinterpret_cast<const float*>(vector_blob.data());
              all_vectors_flat.insert(all_vectors_flat.end(), vec_ptr, vec_ptr + dimension_);
            } else {
              spdlog::warn(
                  "Skipping row {} during index rebuild due to mismatched vector dimension. "
                  "Expected {} bytes, got {} bytes.",
                  row_id, expected_bytes, vector_blob.size());
            }
          };
    }

    if (!faiss_ids.empty()) {
      index->add_with_ids(static_cast<faiss::idx_t>(faiss_ids.size()), all_vectors_flat.data(),
                          faiss_ids.data());
    }
  } catch (const sqlite::sqlite_exception& e) {
    throw db_error("rebuild_faiss_index", e);
  } catch (const faiss::FaissException& e) {
    throw VectorStoreError("Failed to rebuild Faiss index: " + std::string(e.what()));
  }

  faiss_index_ = std::move(index);
}

std::unique_ptr<faiss::IndexIDMap> FaissVectorStore::create_base_index() const {
  auto* base_index =
      new faiss::IndexHNSWFlat(dimension_, settings_.hnsw_m, faiss::METRIC_INNER_PRODUCT);
  base_index->hnsw.efConstruction = settings_.hnsw_ef_construction;
  base_index->hnsw.efSearch = settings_.hnsw_ef_search;
  // Wrap with IDMap to enable add_with_ids; the wrapper owns the HNSW index
  auto index = std::make_unique<faiss::IndexIDMap>(base_index);
  index->own_fields = true;
  return index;
}

// Exact search over the rows whose metadata matches the filter
std::unique_ptr<faiss::IndexIDMap> FaissVectorStore::create_filtered_index(
    const nlohmann::json& filter) {
  auto index = std::make_unique<faiss::IndexIDMap>(new faiss::IndexFlatIP(dimension_));
  index->own_fields = true;

  try {
    std::vector<faiss::idx_t> faiss_ids;
    std::vector<float> all_vectors_flat;
    const size_t expected_bytes = static_cast<size_t>(dimension_) * sizeof(float);
    {
      PooledConnection conn(db_manager_);
      *conn << "SELECT row_id, metadata, vector_blob FROM " + table_ >>
          [&](int64_t row_id, std::string metadata, std::vector<char> vector_blob) {
            if (vector_blob.size() != expected_bytes ||
                !metadata_matches(parse_stored_metadata(metadata), filter)) {
              return;
            }
            faiss_ids.push_back(row_id);
            const float* vec_ptr = reinterpret_cast<const float*>(vector_blob.data());
            all_vectors_flat.insert(all_vectors_flat.end(), vec_ptr, vec_ptr + dimension_);
          };
    }
    if (!faiss_ids.empty()) {
      index->add_with_ids(static_cast<faiss::idx_t>(faiss_ids.size()), all_vectors_flat.data(),
                          faiss_ids.data());
    }
  } catch (const sqlite::sqlite_exception& e) {
    throw db_error("create_filtered_index", e);
  } catch (const faiss::FaissException& e) {
    throw VectorStoreError("Failed to build filtered index: " + std::string(e.what()));
  }
  return index;
}

/* Wrapper for faiss search with error handling */
void FaissVectorStore::search_faiss_index(faiss::Index& index,
                                          const std::vector<float>& query_vector,
                                          int k,
                                          std::vector<float>& scores,
                                          std::vector<faiss::idx_t>& labels) const {
  try {
    index.search(1, query_vector.data(), k, scores.data(), labels.data());
  } catch (const faiss::FaissException& e) {
    throw VectorStoreError("Faiss search failed: " + std::string(e.what()));
  }
}

std::unordered_map<int64_t, FaissVectorStore::StoredRow> FaissVectorStore::fetch_rows(
    const std::vector<int64_t>& row_ids) {
  std::unordered_map<int64_t, StoredRow> rows;
  if (row_ids.empty()) {
    return rows;
  }

  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT row_id, chunk_id, document, metadata FROM " + table_ +
                 " WHERE row_id IN (" + row_ids_to_comma_string(row_ids) + ")" >>
        [&](int64_t row_id, std::string chunk_id, std::optional<std::vector<char>> document,
            std::string metadata) {
          StoredRow row;
          row.chunk_id = std::move(chunk_id);
          if (document) {
            row.document = CompressionService::decompress(*document);
          }
          row.metadata = parse_stored_metadata(metadata);
          rows[row_id] = std::move(row);
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw db_error("fetch_rows", e);
  } catch (const VectorStoreError&) {
    throw;
  } catch (const DocuMindError& e) {
    throw VectorStoreError("Failed to read stored chunk text: " + std::string(e.what()));
  }
  return rows;
}

void FaissVectorStore::check_dimension(const std::vector<float>& vector,
                                       const std::string& what) const {
  if (vector.size() != static_cast<size_t>(dimension_)) {
    throw VectorStoreError(what + " dimension mismatch. Expected " + std::to_string(dimension_) +
                           ", got " + std::to_string(vector.size()));
  }
}

}  // namespace docu_core
