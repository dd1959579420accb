#include "docu_core/db/vector_store.hpp"

#include "docu_core/errors.hpp"

namespace docu_core {

nlohmann::json sanitize_metadata(const nlohmann::json& metadata) {
  if (metadata.is_null()) {
    return nlohmann::json::object();
  }
  if (!metadata.is_object()) {
    throw VectorStoreError("Metadata must be a JSON object, got " +
                           std::string(metadata.type_name()));
  }

  nlohmann::json sanitized = nlohmann::json::object();
  for (auto it = metadata.begin(); it != metadata.end(); ++it) {
    const auto& value = it.value();
    if (value.is_null()) {
      continue;
    }
    if (value.is_string() || value.is_number() || value.is_boolean()) {
      sanitized[it.key()] = value;
    } else {
      sanitized[it.key()] = value.dump();
    }
  }
  return sanitized;
}

bool metadata_matches(const nlohmann::json& metadata, const nlohmann::json& filter) {
  if (filter.is_null() || filter.empty()) {
    return true;
  }
  if (!metadata.is_object()) {
    return false;
  }
  for (auto it = filter.begin(); it != filter.end(); ++it) {
    auto stored = metadata.find(it.key());
    if (stored == metadata.end() || *stored != it.value()) {
      return false;
    }
  }
  return true;
}

}  // namespace docu_core
