#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "content_extractor.hpp"

namespace docu_core {

/**
 * @class ContentExtractorFactory
 * @brief Picks the ContentExtractor for a file by its extension.
 *
 * Holds one instance of every supported extractor. There is no fallback:
 * a file that no extractor claims is rejected.
 */
class ContentExtractorFactory {
 public:
  ContentExtractorFactory();
  virtual ~ContentExtractorFactory() = default;

  /**
   * @brief Finds the extractor for the given file.
   *
   * @param file_path The file that needs to be processed.
   * @return A reference to an extractor owned by this factory.
   * @throw DocumentProcessingError if no extractor handles the extension.
   */
  virtual const ContentExtractor& get_extractor_for(const std::filesystem::path& file_path) const;

  // Every extension some extractor accepts, in registration order
  std::vector<std::string> supported_extensions() const;

  ContentExtractorFactory(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory& operator=(const ContentExtractorFactory&) = delete;

 private:
  std::vector<ContentExtractorPtr> extractors_;
};

}  // namespace docu_core
