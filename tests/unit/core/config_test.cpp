#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>

#include "docu_core/config.hpp"
#include "docu_core/errors.hpp"

using docu_core::Config;
using docu_core::ConfigError;

namespace {

std::string write_temp_file(const std::string& contents) {
  char filename_template[] = "/tmp/documind_config_test_XXXXXX.json";
  int fd = mkstemps(filename_template, 5);  // 5 for ".json"
  if (fd == -1) {
    throw std::runtime_error("Failed to create temporary file");
  }
  FILE* file = fdopen(fd, "w");
  if (!file) {
    close(fd);
    throw std::runtime_error("Failed to open temporary file stream");
  }
  fwrite(contents.data(), 1, contents.size(), file);
  fclose(file);
  return std::string(filename_template);
}

void remove_file(const std::string& path) {
  std::remove(path.c_str());
}

}  // namespace

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  Config cfg = Config::from_json(nlohmann::json::object());

  EXPECT_EQ(cfg.chunking.chunk_size, 300);
  EXPECT_EQ(cfg.chunking.chunk_overlap, 50);
  EXPECT_EQ(cfg.chunking.max_chunk_size, 500);
  EXPECT_EQ(cfg.chunking.tokenizer, docu_core::TokenizerKind::Approximate);
  EXPECT_EQ(cfg.retrieval.top_k, 5);
  EXPECT_FLOAT_EQ(cfg.retrieval.similarity_threshold, 0.3f);
  EXPECT_EQ(cfg.retrieval.rerank_strategy, docu_core::RerankStrategy::Diversity);
  EXPECT_EQ(cfg.embedding.ollama_url, "http://localhost:11434");
  EXPECT_EQ(cfg.embedding.embedding_model, "mxbai-embed-large");
  EXPECT_EQ(cfg.embedding.batch_size, 32);
  EXPECT_EQ(cfg.generation.llm_model, "llama3");
  EXPECT_FLOAT_EQ(cfg.generation.temperature, 0.1f);
  EXPECT_EQ(cfg.generation.max_retries, 3);
  EXPECT_FALSE(cfg.generation.strict_citations);
  EXPECT_EQ(cfg.vector_store.collection_name, "documind_docs");
  EXPECT_EQ(cfg.logging.log_level, "info");
}

TEST(ConfigTest, LoadsNestedSections) {
  nlohmann::json j = {
      {"chunking", {{"chunk_size", 200}, {"chunk_overlap", 20}, {"tokenizer", "pretokenizer"}}},
      {"retrieval", {{"top_k", 8}, {"similarity_threshold", 0.5}, {"rerank_strategy", "identity"}}},
      {"embedding", {{"embedding_model", "nomic-embed-text"}, {"embedding_dimension", 768}}},
      {"generation", {{"llm_model", "mistral"}, {"strict_citations", true}}},
      {"vector_store", {{"collection_name", "papers"}, {"pool_size", 4}}},
      {"logging", {{"log_level", "debug"}}}};

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.chunking.chunk_size, 200);
  EXPECT_EQ(cfg.chunking.chunk_overlap, 20);
  EXPECT_EQ(cfg.chunking.tokenizer, docu_core::TokenizerKind::PreTokenizer);
  EXPECT_EQ(cfg.retrieval.top_k, 8);
  EXPECT_FLOAT_EQ(cfg.retrieval.similarity_threshold, 0.5f);
  EXPECT_EQ(cfg.retrieval.rerank_strategy, docu_core::RerankStrategy::Identity);
  EXPECT_EQ(cfg.embedding.embedding_model, "nomic-embed-text");
  EXPECT_EQ(cfg.embedding.embedding_dimension, 768);
  EXPECT_EQ(cfg.generation.llm_model, "mistral");
  EXPECT_TRUE(cfg.generation.strict_citations);
  EXPECT_EQ(cfg.vector_store.collection_name, "papers");
  EXPECT_EQ(cfg.vector_store.pool_size, 4);
  EXPECT_EQ(cfg.logging.log_level, "debug");
}

TEST(ConfigTest, FromFileParsesAndValidates) {
  std::string contents = R"JSON({
    "retrieval": {"top_k": 3},
    "embedding": {"ollama_url": "http://ollama:11434"}
  })JSON";

  std::string path = write_temp_file(contents);
  Config cfg;
  try {
    cfg = Config::from_file(path);
  } catch (...) {
    remove_file(path);
    throw;
  }
  remove_file(path);

  EXPECT_EQ(cfg.retrieval.top_k, 3);
  EXPECT_EQ(cfg.embedding.ollama_url, "http://ollama:11434");
}

TEST(ConfigTest, InvalidPathThrows) {
  EXPECT_THROW({ (void)Config::from_file("/nonexistent/path/config.json"); }, ConfigError);
}

TEST(ConfigTest, MalformedJsonThrows) {
  std::string path = write_temp_file("{ \"retrieval\": ");
  EXPECT_THROW({ (void)Config::from_file(path); }, ConfigError);
  remove_file(path);
}

TEST(ConfigTest, WrongValueTypeThrows) {
  nlohmann::json j = {{"retrieval", {{"top_k", "five"}}}};

  EXPECT_THROW({ (void)Config::from_json(j); }, ConfigError);
}

TEST(ConfigTest, NonObjectSectionThrows) {
  nlohmann::json j = {{"chunking", 42}};

  EXPECT_THROW({ (void)Config::from_json(j); }, ConfigError);
}

TEST(ConfigTest, OutOfRangeValuesThrow) {
  EXPECT_THROW({ (void)Config::from_json({{"chunking", {{"chunk_size", 20}}}}); }, ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"chunking", {{"chunk_overlap", 300}}}}); },
               ConfigError);
  EXPECT_THROW(
      { (void)Config::from_json({{"chunking", {{"chunk_size", 100}, {"chunk_overlap", 100}}}}); },
      ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"retrieval", {{"top_k", 0}}}}); }, ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"retrieval", {{"top_k", 21}}}}); }, ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"retrieval", {{"similarity_threshold", 1.5}}}}); },
               ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"generation", {{"llm_temperature", 3.0}}}}); },
               ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"generation", {{"llm_max_retries", 70}}}}); },
               ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"generation", {{"llm_max_retries", -1}}}}); },
               ConfigError);
}

TEST(ConfigTest, EmptyRequiredFieldThrows) {
  EXPECT_THROW({ (void)Config::from_json({{"embedding", {{"ollama_url", ""}}}}); }, ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"generation", {{"llm_model", ""}}}}); }, ConfigError);
}

TEST(ConfigTest, UnknownNamesThrow) {
  EXPECT_THROW({ (void)Config::from_json({{"retrieval", {{"rerank_strategy", "fancy"}}}}); },
               ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"chunking", {{"tokenizer", "bpe"}}}}); }, ConfigError);
  EXPECT_THROW({ (void)Config::from_json({{"logging", {{"log_level", "loud"}}}}); }, ConfigError);
  EXPECT_THROW(
      { (void)Config::from_json({{"vector_store", {{"collection_name", "bad-name"}}}}); },
      ConfigError);
}

TEST(ConfigTest, SimpleIsAnAliasForIdentityReranking) {
  Config cfg = Config::from_json({{"retrieval", {{"rerank_strategy", "simple"}}}});

  EXPECT_EQ(cfg.retrieval.rerank_strategy, docu_core::RerankStrategy::Identity);
}

TEST(ConfigTest, EnvironmentOverridesFileValues) {
  std::string path = write_temp_file(R"JSON({"generation": {"llm_model": "llama3"}})JSON");
  setenv("DOCUMIND_LLM_MODEL", "phi3", 1);
  setenv("DOCUMIND_OLLAMA_URL", "http://gpu-box:11434", 1);

  Config cfg;
  try {
    cfg = Config::from_file(path);
  } catch (...) {
    unsetenv("DOCUMIND_LLM_MODEL");
    unsetenv("DOCUMIND_OLLAMA_URL");
    remove_file(path);
    throw;
  }
  unsetenv("DOCUMIND_LLM_MODEL");
  unsetenv("DOCUMIND_OLLAMA_URL");
  remove_file(path);

  EXPECT_EQ(cfg.generation.llm_model, "phi3");
  EXPECT_EQ(cfg.embedding.ollama_url, "http://gpu-box:11434");
}

TEST(ConfigTest, EnvironmentOverridesAreValidated) {
  std::string path = write_temp_file("{}");
  setenv("DOCUMIND_LOG_LEVEL", "chatty", 1);

  EXPECT_THROW({ (void)Config::from_file(path); }, ConfigError);

  unsetenv("DOCUMIND_LOG_LEVEL");
  remove_file(path);
}
