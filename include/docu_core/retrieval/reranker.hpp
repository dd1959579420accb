#pragma once

#include <string>
#include <vector>

#include "docu_core/retrieval/rerank_strategy.hpp"
#include "docu_core/types/chunk.hpp"

namespace docu_core {

/**
 * @brief Reorders retrieved chunks without adding or dropping any.
 *
 * Identity keeps the input order. Diversity groups chunks by file name in
 * first-occurrence order and interleaves the groups round-robin, so the top
 * of the list spans as many documents as possible.
 */
class Reranker {
 public:
  explicit Reranker(RerankStrategy strategy = RerankStrategy::Diversity);

  // The query is accepted for strategies that score against it; none currently do
  std::vector<RetrievedChunk> rerank(std::vector<RetrievedChunk> chunks,
                                     const std::string& query = "") const;

  RerankStrategy strategy() const {
    return strategy_;
  }

 private:
  static std::vector<RetrievedChunk> diversity_rerank(std::vector<RetrievedChunk> chunks);

  RerankStrategy strategy_;
};

}  // namespace docu_core
