#include "docu_core/retrieval/retriever.hpp"

#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

#include "docu_core/errors.hpp"
#include "docu_core/util/text.hpp"

namespace docu_core {

float distance_to_similarity(float distance) {
  return std::clamp(1.0f - distance / 2.0f, 0.0f, 1.0f);
}

Retriever::Retriever(std::shared_ptr<Embedder> embedder,
                     std::shared_ptr<VectorStore> vector_store,
                     const RetrievalSettings& settings)
    : embedder_(std::move(embedder)), vector_store_(std::move(vector_store)), settings_(settings) {
  if (!embedder_ || !vector_store_) {
    throw RetrievalError("Retriever requires an embedder and a vector store");
  }
}

std::vector<RetrievedChunk> Retriever::retrieve(const std::string& query,
                                                std::optional<int> top_k,
                                                const nlohmann::json& filters) {
  if (is_blank(query)) {
    throw ValidationError("Query cannot be empty");
  }
  const int k = top_k.value_or(settings_.top_k);
  if (k <= 0) {
    throw ValidationError("top_k must be greater than 0, got " + std::to_string(k));
  }

  QueryResult result;
  try {
    const auto query_embedding = embedder_->embed(query);
    result = vector_store_->query({query_embedding}, k, filters);
  } catch (const std::exception& e) {
    throw RetrievalError("Retrieval failed: " + std::string(e.what()));
  }

  std::vector<RetrievedChunk> chunks;
  if (result.ids.empty() || result.ids[0].empty()) {
    spdlog::info("No chunks found for query: {}", query);
    return chunks;
  }

  const auto& ids = result.ids[0];
  if (result.distances.empty() || result.documents.empty() || result.metadatas.empty() ||
      result.distances[0].size() != ids.size() || result.documents[0].size() != ids.size() ||
      result.metadatas[0].size() != ids.size()) {
    throw RetrievalError("Vector store returned inconsistent result lists");
  }

  std::vector<float> scores;
  scores.reserve(ids.size());
  for (size_t i = 0; i < ids.size(); ++i) {
    const float distance = result.distances[0][i];
    const float similarity = distance_to_similarity(distance);
    scores.push_back(similarity);
    if (similarity < settings_.similarity_threshold) {
      continue;
    }

    RetrievedChunk chunk;
    static_cast<Chunk&>(chunk) = chunk_from_metadata(result.documents[0][i], result.metadatas[0][i]);
    chunk.id = ids[i];
    chunk.similarity_score = similarity;
    chunk.distance = distance;
    chunks.push_back(std::move(chunk));
  }

  spdlog::debug("Retrieval scores: [{}]", fmt::join(scores, ", "));
  spdlog::info("Retrieved {} chunks above threshold {} (from {} candidates)", chunks.size(),
               settings_.similarity_threshold, ids.size());
  return chunks;
}

RetrievalContext Retriever::retrieve_with_context(const std::string& query,
                                                  std::optional<int> top_k,
                                                  const nlohmann::json& filters) {
  return make_retrieval_context(query, retrieve(query, top_k, filters));
}

RetrievalContext make_retrieval_context(const std::string& query, std::vector<RetrievedChunk> chunks) {
  RetrievalContext context;
  context.query = query;
  context.total_chunks = chunks.size();

  float total_similarity = 0.0f;
  std::unordered_set<std::string> seen;
  for (const auto& chunk : chunks) {
    total_similarity += chunk.similarity_score;
    if (seen.insert(chunk.provenance.file_name).second) {
      context.source_names.push_back(chunk.provenance.file_name);
    }
  }
  context.avg_similarity = chunks.empty() ? 0.0f : total_similarity / chunks.size();
  context.num_sources = context.source_names.size();
  context.chunks = std::move(chunks);
  return context;
}

}  // namespace docu_core
