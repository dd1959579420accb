#include "docu_core/llm/embedding_cache.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "docu_core/errors.hpp"
#include "docu_core/util/hashing.hpp"

namespace docu_core {

namespace {

constexpr const char* kIndexFileName = "metadata.json";

std::string utc_timestamp() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm_utc{};
  gmtime_r(&now, &tm_utc);
  std::ostringstream ss;
  ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

}  // namespace

CachedEmbedder::CachedEmbedder(std::shared_ptr<Embedder> inner,
                               const std::filesystem::path& cache_dir)
    : inner_(std::move(inner)), cache_dir_(cache_dir), index_(nlohmann::json::object()) {
  if (!inner_) {
    throw EmbeddingError("CachedEmbedder requires an underlying embedder");
  }
  std::error_code ec;
  std::filesystem::create_directories(cache_dir_, ec);
  if (ec) {
    spdlog::warn("Could not create embedding cache directory '{}': {}", cache_dir_.string(),
                 ec.message());
  }
  load_index();
  spdlog::info("Embedding cache at '{}' holds {} entries", cache_dir_.string(), index_.size());
}

CachedEmbedder::~CachedEmbedder() {
  if (index_dirty_) {
    save_index();
  }
}

std::string CachedEmbedder::cache_key(const std::string& text) const {
  return sha256_hex(inner_->model_name() + "\n" + text);
}

std::vector<float> CachedEmbedder::embed(const std::string& text) {
  const std::string key = cache_key(text);
  if (auto cached = load(key)) {
    ++hits_;
    spdlog::debug("Embedding cache hit {}", key);
    return *cached;
  }

  ++misses_;
  spdlog::debug("Embedding cache miss {}", key);
  auto vector = inner_->embed(text);
  store(key, vector);
  save_index();
  return vector;
}

std::vector<std::vector<float>> CachedEmbedder::embed_batch(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> results(texts.size());
  std::vector<std::string> keys(texts.size());
  std::vector<size_t> miss_positions;
  std::vector<std::string> miss_texts;

  for (size_t i = 0; i < texts.size(); ++i) {
    keys[i] = cache_key(texts[i]);
    if (auto cached = load(keys[i])) {
      ++hits_;
      results[i] = std::move(*cached);
    } else {
      ++misses_;
      miss_positions.push_back(i);
      miss_texts.push_back(texts[i]);
    }
  }
  spdlog::debug("Embedding cache batch: {} hits, {} misses", texts.size() - miss_texts.size(),
                miss_texts.size());

  if (miss_texts.empty()) {
    return results;
  }

  auto computed = inner_->embed_batch(miss_texts);
  if (computed.size() != miss_texts.size()) {
    throw EmbeddingError("Embedder returned " + std::to_string(computed.size()) +
                         " vectors for " + std::to_string(miss_texts.size()) + " texts");
  }
  for (size_t i = 0; i < miss_positions.size(); ++i) {
    store(keys[miss_positions[i]], computed[i]);
    results[miss_positions[i]] = std::move(computed[i]);
  }
  save_index();
  return results;
}

void CachedEmbedder::clear() {
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(cache_dir_, ec)) {
    if (entry.path().extension() == ".bin" || entry.path().filename() == kIndexFileName) {
      std::filesystem::remove(entry.path(), ec);
    }
  }
  index_ = nlohmann::json::object();
  index_dirty_ = false;
  hits_ = 0;
  misses_ = 0;
  spdlog::info("Cleared embedding cache at '{}'", cache_dir_.string());
}

EmbeddingCacheStats CachedEmbedder::stats() const {
  return EmbeddingCacheStats{index_.size(), hits_, misses_};
}

std::filesystem::path CachedEmbedder::entry_path(const std::string& key) const {
  return cache_dir_ / (key + ".bin");
}

std::optional<std::vector<float>> CachedEmbedder::load(const std::string& key) const {
  const auto path = entry_path(key);
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    return std::nullopt;
  }

  const std::streamsize size = file.tellg();
  const std::streamsize expected =
      static_cast<std::streamsize>(inner_->dimension()) * static_cast<std::streamsize>(sizeof(float));
  if (size != expected) {
    spdlog::debug("Ignoring cache entry {} with {} bytes, expected {}", key, size, expected);
    return std::nullopt;
  }

  std::vector<float> vector(static_cast<size_t>(inner_->dimension()));
  file.seekg(0, std::ios::beg);
  if (!file.read(reinterpret_cast<char*>(vector.data()), size)) {
    return std::nullopt;
  }
  return vector;
}

void CachedEmbedder::store(const std::string& key, const std::vector<float>& vector) {
  std::ofstream file(entry_path(key), std::ios::binary | std::ios::trunc);
  if (!file ||
      !file.write(reinterpret_cast<const char*>(vector.data()),
                  static_cast<std::streamsize>(vector.size() * sizeof(float)))) {
    spdlog::warn("Failed to write embedding cache entry {}", key);
    return;
  }
  index_[key] = {{"created_at", utc_timestamp()}, {"dimension", vector.size()}};
  index_dirty_ = true;
}

void CachedEmbedder::load_index() {
  std::ifstream file(cache_dir_ / kIndexFileName);
  if (!file) {
    return;
  }
  nlohmann::json parsed = nlohmann::json::parse(file, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    spdlog::warn("Embedding cache index in '{}' is unreadable, starting empty",
                 cache_dir_.string());
    return;
  }
  index_ = std::move(parsed);
}

void CachedEmbedder::save_index() {
  if (!index_dirty_) {
    return;
  }
  std::ofstream file(cache_dir_ / kIndexFileName, std::ios::trunc);
  if (!file || !(file << index_.dump(2))) {
    spdlog::warn("Failed to write embedding cache index in '{}'", cache_dir_.string());
    return;
  }
  index_dirty_ = false;
}

}  // namespace docu_core
