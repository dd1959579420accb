#include "docu_core/config.hpp"

#include <array>
#include <cstdlib>
#include <fstream>
#include <regex>

#include "docu_core/errors.hpp"

namespace docu_core {

std::string to_string(TokenizerKind kind) {
  switch (kind) {
    case TokenizerKind::Approximate:
      return "approximate";
    case TokenizerKind::PreTokenizer:
      return "pretokenizer";
  }
  return "approximate";
}

TokenizerKind tokenizer_kind_from_string(const std::string& str) {
  if (str == "approximate")
    return TokenizerKind::Approximate;
  if (str == "pretokenizer")
    return TokenizerKind::PreTokenizer;
  throw ConfigError("Unknown tokenizer: '" + str + "' (expected approximate or pretokenizer)");
}

namespace {

const nlohmann::json& section_of(const nlohmann::json& root, const char* name) {
  static const nlohmann::json empty_section = nlohmann::json::object();
  auto it = root.find(name);
  if (it == root.end() || it->is_null()) {
    return empty_section;
  }
  if (!it->is_object()) {
    throw ConfigError(std::string("Config section '") + name + "' must be an object");
  }
  return *it;
}

// Missing keys fall back to the default; present keys of the wrong type are rejected
template <typename T>
T read_value(const nlohmann::json& section,
             const char* section_name,
             const char* key,
             const T& fallback) {
  auto it = section.find(key);
  if (it == section.end() || it->is_null()) {
    return fallback;
  }
  try {
    return it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("Invalid value for '") + section_name + "." + key +
                      "': " + e.what());
  }
}

void override_from_env(const char* variable, std::string& target) {
  const char* value = std::getenv(variable);
  if (value != nullptr && value[0] != '\0') {
    target = value;
  }
}

}  // namespace

Config Config::from_file(const std::string& filename) {
  std::ifstream file_stream(filename);
  if (!file_stream.is_open()) {
    throw ConfigError("Failed to open config file: " + filename);
  }

  nlohmann::json json_config;
  try {
    file_stream >> json_config;
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("Failed to parse JSON in config file '") + filename +
                      "': " + e.what());
  }

  Config config = from_json(json_config);
  config.apply_environment_overrides();
  config.validate();
  return config;
}

Config Config::from_json(const nlohmann::json& json_config) {
  if (!json_config.is_object()) {
    throw ConfigError("Config root must be a JSON object");
  }

  Config config;

  const auto& chunking = section_of(json_config, "chunking");
  config.chunking.chunk_size =
      read_value(chunking, "chunking", "chunk_size", config.chunking.chunk_size);
  config.chunking.chunk_overlap =
      read_value(chunking, "chunking", "chunk_overlap", config.chunking.chunk_overlap);
  config.chunking.max_chunk_size =
      read_value(chunking, "chunking", "max_chunk_size", config.chunking.max_chunk_size);
  config.chunking.tokenizer = tokenizer_kind_from_string(
      read_value(chunking, "chunking", "tokenizer", to_string(config.chunking.tokenizer)));

  const auto& retrieval = section_of(json_config, "retrieval");
  config.retrieval.top_k = read_value(retrieval, "retrieval", "top_k", config.retrieval.top_k);
  config.retrieval.similarity_threshold = read_value(
      retrieval, "retrieval", "similarity_threshold", config.retrieval.similarity_threshold);
  config.retrieval.rerank_strategy = rerank_strategy_from_string(read_value(
      retrieval, "retrieval", "rerank_strategy", to_string(config.retrieval.rerank_strategy)));

  const auto& embedding = section_of(json_config, "embedding");
  config.embedding.ollama_url =
      read_value(embedding, "embedding", "ollama_url", config.embedding.ollama_url);
  config.embedding.embedding_model =
      read_value(embedding, "embedding", "embedding_model", config.embedding.embedding_model);
  config.embedding.embedding_dimension = read_value(
      embedding, "embedding", "embedding_dimension", config.embedding.embedding_dimension);
  config.embedding.batch_size =
      read_value(embedding, "embedding", "embedding_batch_size", config.embedding.batch_size);
  config.embedding.cache_enabled =
      read_value(embedding, "embedding", "embedding_cache_enabled", config.embedding.cache_enabled);
  config.embedding.cache_dir =
      read_value(embedding, "embedding", "embedding_cache_dir", config.embedding.cache_dir);

  const auto& generation = section_of(json_config, "generation");
  config.generation.llm_model =
      read_value(generation, "generation", "llm_model", config.generation.llm_model);
  config.generation.temperature =
      read_value(generation, "generation", "llm_temperature", config.generation.temperature);
  config.generation.max_retries =
      read_value(generation, "generation", "llm_max_retries", config.generation.max_retries);
  config.generation.retry_base_delay_ms = read_value(
      generation, "generation", "llm_retry_base_delay_ms", config.generation.retry_base_delay_ms);
  config.generation.timeout_seconds = read_value(
      generation, "generation", "llm_timeout_seconds", config.generation.timeout_seconds);
  config.generation.excerpt_max_chars = read_value(
      generation, "generation", "excerpt_max_chars", config.generation.excerpt_max_chars);
  config.generation.strict_citations = read_value(
      generation, "generation", "strict_citations", config.generation.strict_citations);

  const auto& vector_store = section_of(json_config, "vector_store");
  config.vector_store.db_path =
      read_value(vector_store, "vector_store", "db_path", config.vector_store.db_path);
  config.vector_store.db_key =
      read_value(vector_store, "vector_store", "db_key", config.vector_store.db_key);
  config.vector_store.collection_name = read_value(
      vector_store, "vector_store", "collection_name", config.vector_store.collection_name);
  config.vector_store.pool_size =
      read_value(vector_store, "vector_store", "pool_size", config.vector_store.pool_size);
  config.vector_store.hnsw_m =
      read_value(vector_store, "vector_store", "hnsw_m", config.vector_store.hnsw_m);
  config.vector_store.hnsw_ef_construction = read_value(
      vector_store, "vector_store", "hnsw_ef_construction", config.vector_store.hnsw_ef_construction);
  config.vector_store.hnsw_ef_search =
      read_value(vector_store, "vector_store", "hnsw_ef_search", config.vector_store.hnsw_ef_search);

  const auto& logging = section_of(json_config, "logging");
  config.logging.log_level = read_value(logging, "logging", "log_level", config.logging.log_level);
  config.logging.log_file = read_value(logging, "logging", "log_file", config.logging.log_file);
  config.logging.max_file_size_mb =
      read_value(logging, "logging", "log_max_file_size_mb", config.logging.max_file_size_mb);
  config.logging.max_files =
      read_value(logging, "logging", "log_max_files", config.logging.max_files);

  config.validate();
  return config;
}

Config Config::defaults() {
  return from_json(nlohmann::json::object());
}

void Config::apply_environment_overrides() {
  override_from_env("DOCUMIND_OLLAMA_URL", embedding.ollama_url);
  override_from_env("DOCUMIND_EMBEDDING_MODEL", embedding.embedding_model);
  override_from_env("DOCUMIND_LLM_MODEL", generation.llm_model);
  override_from_env("DOCUMIND_DB_KEY", vector_store.db_key);
  override_from_env("DOCUMIND_LOG_LEVEL", logging.log_level);
}

void Config::validate() const {
  if (chunking.chunk_size < 50 || chunking.chunk_size > 1000) {
    throw ConfigError("chunk_size must be between 50 and 1000");
  }
  if (chunking.chunk_overlap < 0 || chunking.chunk_overlap > 200) {
    throw ConfigError("chunk_overlap must be between 0 and 200");
  }
  if (chunking.chunk_overlap >= chunking.chunk_size) {
    throw ConfigError("chunk_overlap must be smaller than chunk_size");
  }
  if (chunking.max_chunk_size < 100) {
    throw ConfigError("max_chunk_size must be at least 100");
  }
  if (chunking.max_chunk_size < chunking.chunk_size) {
    throw ConfigError("max_chunk_size must not be smaller than chunk_size");
  }

  if (retrieval.top_k < 1 || retrieval.top_k > 20) {
    throw ConfigError("top_k must be between 1 and 20");
  }
  if (retrieval.similarity_threshold < 0.0f || retrieval.similarity_threshold > 1.0f) {
    throw ConfigError("similarity_threshold must be between 0.0 and 1.0");
  }

  if (embedding.ollama_url.empty()) {
    throw ConfigError("ollama_url cannot be empty");
  }
  if (embedding.embedding_model.empty()) {
    throw ConfigError("embedding_model cannot be empty");
  }
  if (embedding.embedding_dimension <= 0) {
    throw ConfigError("embedding_dimension must be greater than 0");
  }
  if (embedding.batch_size <= 0) {
    throw ConfigError("embedding_batch_size must be greater than 0");
  }
  if (embedding.cache_enabled && embedding.cache_dir.empty()) {
    throw ConfigError("embedding_cache_dir cannot be empty when the cache is enabled");
  }

  if (generation.llm_model.empty()) {
    throw ConfigError("llm_model cannot be empty");
  }
  if (generation.temperature < 0.0f || generation.temperature > 2.0f) {
    throw ConfigError("llm_temperature must be between 0.0 and 2.0");
  }
  if (generation.max_retries < 0 || generation.max_retries > 10) {
    throw ConfigError("llm_max_retries must be between 0 and 10");
  }
  if (generation.retry_base_delay_ms < 0) {
    throw ConfigError("llm_retry_base_delay_ms cannot be negative");
  }
  if (generation.timeout_seconds <= 0) {
    throw ConfigError("llm_timeout_seconds must be greater than 0");
  }
  if (generation.excerpt_max_chars <= 0) {
    throw ConfigError("excerpt_max_chars must be greater than 0");
  }

  if (vector_store.db_path.empty()) {
    throw ConfigError("db_path cannot be empty");
  }
  static const std::regex collection_name_regex(R"([A-Za-z_][A-Za-z0-9_]*)");
  if (!std::regex_match(vector_store.collection_name, collection_name_regex)) {
    throw ConfigError("collection_name must be a valid identifier: " +
                      vector_store.collection_name);
  }
  if (vector_store.pool_size <= 0) {
    throw ConfigError("pool_size must be greater than 0");
  }
  if (vector_store.hnsw_m <= 0 || vector_store.hnsw_ef_construction <= 0 ||
      vector_store.hnsw_ef_search <= 0) {
    throw ConfigError("HNSW parameters must be greater than 0");
  }

  static const std::array<const char*, 8> log_levels = {
      "trace", "debug", "info", "warn", "warning", "error", "critical", "off"};
  bool known_level = false;
  for (const char* level : log_levels) {
    if (logging.log_level == level) {
      known_level = true;
      break;
    }
  }
  if (!known_level) {
    throw ConfigError("Unknown log_level: " + logging.log_level);
  }
  if (logging.max_file_size_mb <= 0) {
    throw ConfigError("log_max_file_size_mb must be greater than 0");
  }
  if (logging.max_files <= 0) {
    throw ConfigError("log_max_files must be greater than 0");
  }
}

}  // namespace docu_core
