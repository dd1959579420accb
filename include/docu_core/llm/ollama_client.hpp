#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "docu_core/config.hpp"
#include "docu_core/llm/embedder.hpp"
#include "docu_core/llm/text_generator.hpp"

namespace docu_core {

/**
 * @brief Embedding and chat backend talking to an Ollama server through ollama-hpp.
 *
 * Embeddings are L2-normalised and checked against the configured dimension.
 * Chat calls are retried with exponential backoff before an LlmError is raised.
 */
class OllamaClient : public Embedder, public TextGenerator {
 public:
  OllamaClient(const EmbeddingSettings& embedding_settings,
               const GenerationSettings& generation_settings);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient&) = delete;
  OllamaClient& operator=(const OllamaClient&) = delete;

  std::vector<float> embed(const std::string& text) override;
  std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override;

  int dimension() const override {
    return embedding_settings_.embedding_dimension;
  }
  std::string model_name() const override {
    return embedding_settings_.embedding_model;
  }

  std::string generate(const std::string& system_prompt, const std::string& user_prompt) override;

  std::string llm_model() const override {
    return generation_settings_.llm_model;
  }

 private:
  EmbeddingSettings embedding_settings_;
  GenerationSettings generation_settings_;

  void setup_server_connection();
};

// Scales the vector to unit length in place; a zero vector is left unchanged
void l2_normalize(std::vector<float>& vector);

inline constexpr std::chrono::milliseconds kMaxRetryDelay{60000};

// Delay before the given retry (1-based): base * 2^(retry - 1), capped at kMaxRetryDelay
std::chrono::milliseconds retry_backoff_delay(int base_delay_ms, int retry);

}  // namespace docu_core
