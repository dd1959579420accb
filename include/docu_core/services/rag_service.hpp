#pragma once

#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "docu_core/config.hpp"
#include "docu_core/db/database_manager.hpp"
#include "docu_core/db/vector_store.hpp"
#include "docu_core/extractors/content_extractor_factory.hpp"
#include "docu_core/generation/citation_resolver.hpp"
#include "docu_core/generation/prompt_builder.hpp"
#include "docu_core/llm/embedder.hpp"
#include "docu_core/llm/text_generator.hpp"
#include "docu_core/retrieval/reranker.hpp"
#include "docu_core/retrieval/retriever.hpp"
#include "docu_core/services/document_indexer.hpp"

namespace docu_core {

struct RagResponse {
  std::string query;
  std::string answer;
  // The chunks shown to the generator, in prompt order; citation [n] is sources[n - 1]
  std::vector<RetrievedChunk> sources;
  std::vector<int> citations;
  CitationMap citation_map;
  std::vector<std::string> citation_errors;
  bool citations_valid = true;
  size_t num_sources = 0;
  float avg_similarity = 0.0f;
};

struct RagStats {
  size_t total_chunks = 0;
  std::string collection_name;
  std::string embedding_model;
  std::string llm_model;
};

/**
 * @brief Question answering over the indexed documents, with citations.
 *
 * A query runs retrieve -> rerank -> prompt -> generate -> resolve citations.
 * The PromptContext built for the generator is the single source of chunk
 * order for the response sources and the citation map.
 */
class RagService {
 public:
  RagService(const Config& config,
             std::shared_ptr<ContentExtractorFactory> extractor_factory,
             std::shared_ptr<Embedder> embedder,
             std::shared_ptr<VectorStore> vector_store,
             std::shared_ptr<TextGenerator> generator);
  ~RagService();

  RagService(const RagService&) = delete;
  RagService& operator=(const RagService&) = delete;

  // Wires the Ollama client, the embedding cache and the SQLCipher/faiss store from config
  static std::unique_ptr<RagService> create(const Config& config);

  /**
   * @throws ValidationError for a blank query or non-positive top_k
   * @throws RetrievalError, LlmError when a collaborator fails
   * @throws CitationValidationError for invalid citations when strict_citations is set
   */
  RagResponse query(const std::string& query,
                    std::optional<int> top_k = std::nullopt,
                    const nlohmann::json& filters = nlohmann::json::object(),
                    bool rerank = true);

  std::vector<IndexingResult> index_documents(const std::vector<std::filesystem::path>& file_paths);
  size_t delete_document(const std::string& file_name);
  RagStats get_stats();

  // Drops every stored chunk
  void clear_all();

 private:
  // Owned only when built by create(); declared first so it outlives the store
  std::unique_ptr<DatabaseManager> db_manager_;

  std::shared_ptr<Embedder> embedder_;
  std::shared_ptr<VectorStore> vector_store_;
  std::shared_ptr<TextGenerator> generator_;
  std::unique_ptr<DocumentIndexer> indexer_;
  std::unique_ptr<Retriever> retriever_;
  Reranker reranker_;
  PromptBuilder prompt_builder_;
  CitationResolver citation_resolver_;
  bool strict_citations_;
};

}  // namespace docu_core
