#pragma once

#include <string>
#include <vector>

namespace docu_core {

/**
 * @brief Turns text into fixed-length, L2-normalised float vectors.
 *
 * Every failure, including a vector of the wrong length, surfaces as
 * EmbeddingError.
 */
class Embedder {
 public:
  virtual ~Embedder() = default;

  virtual std::vector<float> embed(const std::string& text) = 0;

  // Returns exactly one vector per input text, in input order
  virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) = 0;

  virtual int dimension() const = 0;
  virtual std::string model_name() const = 0;
};

}  // namespace docu_core
