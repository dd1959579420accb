#include "docu_core/extractors/plaintext_extractor.hpp"

#include <spdlog/spdlog.h>

namespace docu_core {

/**
 * @brief Extracts a plain text file as a single page.
 *
 * The page is always present, even when the file is empty; the chunker turns
 * an empty page into zero chunks and the indexer reports the file as skipped.
 */
ExtractedDocument PlainTextExtractor::extract(const std::filesystem::path& file_path) const {
    const std::string text = clean_text(get_string_content(file_path));

    std::vector<DocumentSection> sections;
    sections.push_back(make_section(1, SectionKind::Page, text));

    spdlog::debug("Extracted {} characters from {}", sections.front().char_count,
                  file_path.filename().string());
    return make_document(file_path, std::move(sections));
}

} // namespace docu_core
