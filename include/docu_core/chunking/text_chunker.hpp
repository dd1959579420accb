#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docu_core/chunking/sentence_splitter.hpp"
#include "docu_core/chunking/tokenizer.hpp"
#include "docu_core/config.hpp"
#include "docu_core/types/chunk.hpp"
#include "docu_core/types/document.hpp"

namespace docu_core {

/**
 * @brief Sentence-aware, overlap-aware chunking against a token budget.
 *
 * Sentences are accumulated greedily until the next one would push the chunk
 * past chunk_size. Each new chunk is seeded with the longest trailing run of
 * sentences from the previous chunk whose token count stays within
 * chunk_overlap. A sentence longer than max_chunk_size is emitted on its own
 * as word-split pieces of at most chunk_size tokens.
 *
 * Offsets are code point positions in the section text and are approximate:
 * chunk text is rebuilt from trimmed sentences joined by single spaces, so
 * whitespace runs in the source shift later offsets.
 */
class TextChunker {
 public:
  // A null tokenizer selects the word-count approximation; a null splitter the punctuation splitter
  explicit TextChunker(const ChunkingSettings& settings,
                       std::shared_ptr<const Tokenizer> tokenizer = nullptr,
                       std::shared_ptr<const SentenceSplitter> splitter = nullptr);

  // Empty or whitespace-only text yields no chunks. Throws ChunkingError.
  std::vector<Chunk> chunk_text(const std::string& text,
                                const ChunkProvenance& provenance = {}) const;

  // Chunks every section; chunk_index runs continuously across the whole document
  std::vector<Chunk> chunk_document(const ExtractedDocument& document) const;

  int count_tokens(const std::string& text) const;

  const ChunkingSettings& settings() const {
    return settings_;
  }

 private:
  Chunk make_chunk(const std::string& text,
                   size_t start_offset,
                   const ChunkProvenance& provenance,
                   int chunk_index) const;
  std::vector<std::string> overlap_window(const std::vector<std::string>& sentences) const;
  std::vector<std::string> split_long_sentence(const std::string& sentence) const;
  int count_joined(const std::vector<std::string>& sentences, const std::string& next) const;

  ChunkingSettings settings_;
  std::shared_ptr<const Tokenizer> tokenizer_;
  std::shared_ptr<const SentenceSplitter> splitter_;
};

}  // namespace docu_core
