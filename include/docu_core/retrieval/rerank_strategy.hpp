#pragma once

#include <string>

#include "docu_core/errors.hpp"

namespace docu_core {

enum class RerankStrategy { Identity, Diversity };

inline std::string to_string(RerankStrategy strategy) {
  switch (strategy) {
    case RerankStrategy::Identity:
      return "identity";
    case RerankStrategy::Diversity:
      return "diversity";
  }
  return "unknown";
}

// Unknown names are a configuration error
inline RerankStrategy rerank_strategy_from_string(const std::string& str) {
  if (str == "identity" || str == "simple")
    return RerankStrategy::Identity;
  if (str == "diversity")
    return RerankStrategy::Diversity;
  throw ConfigError("Unknown rerank strategy: '" + str + "' (expected identity or diversity)");
}

}  // namespace docu_core
