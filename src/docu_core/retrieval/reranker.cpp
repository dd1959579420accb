#include "docu_core/retrieval/reranker.hpp"

#include <spdlog/spdlog.h>

#include <unordered_map>

namespace docu_core {

Reranker::Reranker(RerankStrategy strategy) : strategy_(strategy) {
  spdlog::debug("Reranker using '{}' strategy", to_string(strategy_));
}

std::vector<RetrievedChunk> Reranker::rerank(std::vector<RetrievedChunk> chunks,
                                             const std::string& /*query*/) const {
  if (chunks.size() < 2) {
    return chunks;
  }

  switch (strategy_) {
    case RerankStrategy::Identity:
      return chunks;
    case RerankStrategy::Diversity:
      spdlog::debug("Reranking {} chunks for source diversity", chunks.size());
      return diversity_rerank(std::move(chunks));
  }
  return chunks;
}

std::vector<RetrievedChunk> Reranker::diversity_rerank(std::vector<RetrievedChunk> chunks) {
  std::vector<std::vector<RetrievedChunk>> groups;
  std::unordered_map<std::string, size_t> group_of_source;
  for (auto& chunk : chunks) {
    auto [it, inserted] = group_of_source.emplace(chunk.provenance.file_name, groups.size());
    if (inserted) {
      groups.emplace_back();
    }
    groups[it->second].push_back(std::move(chunk));
  }

  if (groups.size() == 1) {
    return std::move(groups.front());
  }

  std::vector<RetrievedChunk> reranked;
  reranked.reserve(chunks.size());
  for (size_t round = 0; reranked.size() < chunks.size(); ++round) {
    for (auto& group : groups) {
      if (round < group.size()) {
        reranked.push_back(std::move(group[round]));
      }
    }
  }
  return reranked;
}

}  // namespace docu_core
