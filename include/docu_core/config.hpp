#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "docu_core/retrieval/rerank_strategy.hpp"

namespace docu_core {

enum class TokenizerKind { Approximate, PreTokenizer };

std::string to_string(TokenizerKind kind);
TokenizerKind tokenizer_kind_from_string(const std::string& str);

struct ChunkingSettings {
  int chunk_size = 300;
  int chunk_overlap = 50;
  int max_chunk_size = 500;
  TokenizerKind tokenizer = TokenizerKind::Approximate;
};

struct RetrievalSettings {
  int top_k = 5;
  float similarity_threshold = 0.3f;
  RerankStrategy rerank_strategy = RerankStrategy::Diversity;
};

struct EmbeddingSettings {
  std::string ollama_url = "http://localhost:11434";
  std::string embedding_model = "mxbai-embed-large";
  int embedding_dimension = 1024;
  int batch_size = 32;
  bool cache_enabled = true;
  std::string cache_dir = "./data/cache/embeddings";
};

struct GenerationSettings {
  std::string llm_model = "llama3";
  float temperature = 0.1f;
  int max_retries = 3;
  int retry_base_delay_ms = 500;
  int timeout_seconds = 120;
  int excerpt_max_chars = 800;
  bool strict_citations = false;
};

struct VectorStoreSettings {
  std::string db_path = "./data/vectordb/documind.db";
  std::string db_key;
  std::string collection_name = "documind_docs";
  int pool_size = 2;
  int hnsw_m = 32;
  int hnsw_ef_construction = 100;
  int hnsw_ef_search = 64;
};

struct LoggingSettings {
  std::string log_level = "info";
  std::string log_file = "./logs/documind.log";
  int max_file_size_mb = 10;
  int max_files = 7;
};

// Read-only after construction. Each component receives the section it needs.
class Config {
 public:
  ChunkingSettings chunking;
  RetrievalSettings retrieval;
  EmbeddingSettings embedding;
  GenerationSettings generation;
  VectorStoreSettings vector_store;
  LoggingSettings logging;

  // Load configuration from a JSON file, then apply DOCUMIND_* environment overrides
  static Config from_file(const std::string& filename);

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config);

  static Config defaults();

 private:
  void apply_environment_overrides();
  void validate() const;
};

}  // namespace docu_core
