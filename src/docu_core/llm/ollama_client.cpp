#include "docu_core/llm/ollama_client.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>

#include "docu_core/errors.hpp"
#include "ollama.hpp"

namespace docu_core {

OllamaClient::OllamaClient(const EmbeddingSettings& embedding_settings,
                           const GenerationSettings& generation_settings)
    : embedding_settings_(embedding_settings), generation_settings_(generation_settings) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  // Set the server URL for ollama-hpp
  ollama::setServerURL(embedding_settings_.ollama_url);
  ollama::setReadTimeout(generation_settings_.timeout_seconds);
  ollama::setWriteTimeout(generation_settings_.timeout_seconds);

  if (!ollama::is_running()) {
    throw LlmError("Ollama server is not running at " + embedding_settings_.ollama_url);
  }
  spdlog::info("Connected to Ollama at {} (embedding model '{}', llm model '{}')",
               embedding_settings_.ollama_url, embedding_settings_.embedding_model,
               generation_settings_.llm_model);
}

// The Ollama api supports batch requests for the embeddings; one request per text keeps
// failures attributable to a single input
std::vector<float> OllamaClient::embed(const std::string& text) {
  std::vector<float> embedding;
  try {
    ollama::response response =
        ollama::generate_embeddings(embedding_settings_.embedding_model, text);

    // Get the JSON structure
    auto json_response = response.as_json();

    if (!json_response.contains("embeddings")) {
      throw EmbeddingError("Response does not contain embeddings field");
    }

    // Handle different embedding response formats
    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw EmbeddingError("Embeddings field is not an array");
    }
    if (embeddings.size() > 0 && embeddings[0].is_array()) {
      // Array of arrays - take the first embedding vector
      embedding = embeddings[0].get<std::vector<float>>();
    } else {
      // Single array of floats
      embedding = embeddings.get<std::vector<float>>();
    }
  } catch (const ollama::exception& e) {
    throw EmbeddingError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception& e) {
    throw EmbeddingError("Malformed embedding response: " + std::string(e.what()));
  }

  if (embedding.size() != static_cast<size_t>(embedding_settings_.embedding_dimension)) {
    throw EmbeddingError("Embedding dimension mismatch for model '" +
                         embedding_settings_.embedding_model + "'. Expected " +
                         std::to_string(embedding_settings_.embedding_dimension) + ", got " +
                         std::to_string(embedding.size()));
  }
  l2_normalize(embedding);
  return embedding;
}

std::vector<std::vector<float>> OllamaClient::embed_batch(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> embeddings;
  embeddings.reserve(texts.size());
  for (const auto& text : texts) {
    embeddings.push_back(embed(text));
  }
  return embeddings;
}

std::string OllamaClient::generate(const std::string& system_prompt,
                                   const std::string& user_prompt) {
  ollama::messages messages = {ollama::message("system", system_prompt),
                               ollama::message("user", user_prompt)};
  ollama::options options;
  options["temperature"] = generation_settings_.temperature;

  std::string last_error;
  for (int attempt = 0; attempt <= generation_settings_.max_retries; ++attempt) {
    if (attempt > 0) {
      const auto delay = retry_backoff_delay(generation_settings_.retry_base_delay_ms, attempt);
      spdlog::warn("LLM call failed ({}), retry {}/{} in {} ms", last_error, attempt,
                   generation_settings_.max_retries, delay.count());
      std::this_thread::sleep_for(delay);
    }

    try {
      ollama::request request(generation_settings_.llm_model, messages, options, false);
      // Plain text answers, not JSON mode
      request.erase("format");
      ollama::response response = ollama::chat(request);
      return response.as_simple_string();
    } catch (const ollama::exception& e) {
      last_error = e.what();
    }
  }

  throw LlmError("Answer generation failed after " +
                 std::to_string(generation_settings_.max_retries + 1) +
                 " attempts: " + last_error);
}

std::chrono::milliseconds retry_backoff_delay(int base_delay_ms, int retry) {
  if (base_delay_ms <= 0 || retry <= 0) {
    return std::chrono::milliseconds(0);
  }
  long long delay = base_delay_ms;
  for (int i = 1; i < retry && delay < kMaxRetryDelay.count(); ++i) {
    delay *= 2;
  }
  return std::chrono::milliseconds(std::min(delay, static_cast<long long>(kMaxRetryDelay.count())));
}

void l2_normalize(std::vector<float>& vector) {
  double sum_of_squares = 0.0;
  for (const float value : vector) {
    sum_of_squares += static_cast<double>(value) * value;
  }
  if (sum_of_squares <= 0.0) {
    return;
  }
  const float inverse_norm = static_cast<float>(1.0 / std::sqrt(sum_of_squares));
  for (float& value : vector) {
    value *= inverse_norm;
  }
}

}  // namespace docu_core
