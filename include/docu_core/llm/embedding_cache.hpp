#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "docu_core/llm/embedder.hpp"

namespace docu_core {

struct EmbeddingCacheStats {
  size_t entries = 0;
  size_t hits = 0;
  size_t misses = 0;
};

/**
 * @brief Embedder decorator that persists vectors on disk.
 *
 * Entries are keyed by SHA-256 of "<model>\n<text>" and stored as raw float
 * files (<key>.bin) next to a metadata.json index recording when each entry
 * was written and its dimension. A missing or unreadable entry is a miss; a
 * failed write only logs a warning.
 */
class CachedEmbedder : public Embedder {
 public:
  CachedEmbedder(std::shared_ptr<Embedder> inner, const std::filesystem::path& cache_dir);
  ~CachedEmbedder() override;

  CachedEmbedder(const CachedEmbedder&) = delete;
  CachedEmbedder& operator=(const CachedEmbedder&) = delete;

  std::vector<float> embed(const std::string& text) override;
  std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) override;

  int dimension() const override {
    return inner_->dimension();
  }
  std::string model_name() const override {
    return inner_->model_name();
  }

  // Removes every cached vector and the index
  void clear();
  EmbeddingCacheStats stats() const;

  std::string cache_key(const std::string& text) const;

 private:
  std::optional<std::vector<float>> load(const std::string& key) const;
  void store(const std::string& key, const std::vector<float>& vector);
  void load_index();
  void save_index();
  std::filesystem::path entry_path(const std::string& key) const;

  std::shared_ptr<Embedder> inner_;
  std::filesystem::path cache_dir_;
  nlohmann::json index_;
  bool index_dirty_ = false;
  size_t hits_ = 0;
  size_t misses_ = 0;
};

}  // namespace docu_core
