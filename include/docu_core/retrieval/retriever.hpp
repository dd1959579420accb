#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "docu_core/config.hpp"
#include "docu_core/db/vector_store.hpp"
#include "docu_core/llm/embedder.hpp"
#include "docu_core/types/chunk.hpp"

namespace docu_core {

// Retrieved chunks plus summary statistics about them
struct RetrievalContext {
  std::string query;
  std::vector<RetrievedChunk> chunks;
  size_t total_chunks = 0;
  float avg_similarity = 0.0f;
  size_t num_sources = 0;
  std::vector<std::string> source_names;  // first-appearance order
};

/**
 * @brief Semantic search over the vector store.
 *
 * The query is embedded, the store returns its top_k nearest chunks, and
 * chunks whose similarity (1 - distance / 2, clamped to [0, 1]) is below the
 * configured threshold are dropped. The store's ordering is preserved.
 */
class Retriever {
 public:
  Retriever(std::shared_ptr<Embedder> embedder,
            std::shared_ptr<VectorStore> vector_store,
            const RetrievalSettings& settings);

  /**
   * @throws ValidationError for a blank query or a non-positive top_k
   * @throws RetrievalError when the embedder or the store fails
   */
  std::vector<RetrievedChunk> retrieve(const std::string& query,
                                       std::optional<int> top_k = std::nullopt,
                                       const nlohmann::json& filters = nlohmann::json::object());

  RetrievalContext retrieve_with_context(const std::string& query,
                                         std::optional<int> top_k = std::nullopt,
                                         const nlohmann::json& filters = nlohmann::json::object());

  const RetrievalSettings& settings() const {
    return settings_;
  }

 private:
  std::shared_ptr<Embedder> embedder_;
  std::shared_ptr<VectorStore> vector_store_;
  RetrievalSettings settings_;
};

// Maps a cosine distance in [0, 2] to a similarity in [0, 1]
float distance_to_similarity(float distance);

// Builds the summary statistics for an already retrieved list
RetrievalContext make_retrieval_context(const std::string& query, std::vector<RetrievedChunk> chunks);

}  // namespace docu_core
