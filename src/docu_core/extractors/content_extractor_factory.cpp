#include "docu_core/extractors/content_extractor_factory.hpp"

#include "docu_core/errors.hpp"
#include "docu_core/extractors/markdown_extractor.hpp"
#include "docu_core/extractors/plaintext_extractor.hpp"
#include "docu_core/util/text.hpp"

namespace docu_core {

ContentExtractorFactory::ContentExtractorFactory() {
  extractors_.push_back(std::make_unique<PlainTextExtractor>());
  extractors_.push_back(std::make_unique<MarkdownExtractor>());
}

const ContentExtractor& ContentExtractorFactory::get_extractor_for(
    const std::filesystem::path& file_path) const {
  for (const auto& extractor : extractors_) {
    if (extractor->can_handle(file_path)) {
      return *extractor;
    }
  }
  throw DocumentProcessingError("Unsupported file type: '" + file_path.extension().string() +
                                "' for " + file_path.string() +
                                ". Supported: " + join(supported_extensions(), ", "));
}

std::vector<std::string> ContentExtractorFactory::supported_extensions() const {
  std::vector<std::string> extensions;
  for (const auto& extractor : extractors_) {
    for (const auto& extension : extractor->extensions()) {
      extensions.push_back(extension);
    }
  }
  return extensions;
}

}  // namespace docu_core
