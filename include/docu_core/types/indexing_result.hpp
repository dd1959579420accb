#pragma once

#include <string>

namespace docu_core {

enum class IndexingStatus { Success, Failed, Skipped };

inline std::string to_string(IndexingStatus status) {
  switch (status) {
    case IndexingStatus::Success:
      return "success";
    case IndexingStatus::Failed:
      return "failed";
    case IndexingStatus::Skipped:
      return "skipped";
  }
  return "unknown";
}

struct IndexingResult {
  std::string file_name;
  IndexingStatus status = IndexingStatus::Failed;
  int chunks_created = 0;
  int chunks_stored = 0;
  int total_pages = 0;
  std::string error;
  std::string reason;

  static IndexingResult success_response(const std::string& file_name,
                                         int chunks_created,
                                         int chunks_stored,
                                         int total_pages) {
    return {file_name, IndexingStatus::Success, chunks_created, chunks_stored, total_pages, "", ""};
  }

  static IndexingResult failure_response(const std::string& file_name, const std::string& error) {
    return {file_name, IndexingStatus::Failed, 0, 0, 0, error, ""};
  }

  static IndexingResult skipped_response(const std::string& file_name,
                                         const std::string& reason,
                                         int total_pages = 0) {
    return {file_name, IndexingStatus::Skipped, 0, 0, total_pages, "", reason};
  }
};

}  // namespace docu_core
