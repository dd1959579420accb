#include "docu_core/chunking/text_chunker.hpp"

#include <spdlog/spdlog.h>
#include <utf8.h>

#include "docu_core/errors.hpp"
#include "docu_core/util/text.hpp"

namespace docu_core {

TextChunker::TextChunker(const ChunkingSettings& settings,
                         std::shared_ptr<const Tokenizer> tokenizer,
                         std::shared_ptr<const SentenceSplitter> splitter)
    : settings_(settings), tokenizer_(std::move(tokenizer)), splitter_(std::move(splitter)) {
  if (settings_.chunk_size <= 0) {
    throw ValidationError("chunk_size must be greater than 0");
  }
  if (settings_.chunk_overlap < 0 || settings_.chunk_overlap >= settings_.chunk_size) {
    throw ValidationError("chunk_overlap must be in [0, chunk_size)");
  }
  if (settings_.max_chunk_size < settings_.chunk_size) {
    throw ValidationError("max_chunk_size must not be smaller than chunk_size");
  }
  if (!splitter_) {
    splitter_ = std::make_shared<PunctuationSentenceSplitter>();
  }

  spdlog::info("Chunker initialized: chunk_size={}, overlap={}, max={}, tokenizer={}",
               settings_.chunk_size, settings_.chunk_overlap, settings_.max_chunk_size,
               tokenizer_ ? tokenizer_->name() : "approximate");
}

int TextChunker::count_tokens(const std::string& text) const {
  if (tokenizer_) {
    return tokenizer_->count_tokens(text);
  }
  return approximate_token_count(text);
}

std::vector<Chunk> TextChunker::chunk_text(const std::string& text,
                                           const ChunkProvenance& provenance) const {
  if (is_blank(text)) {
    return {};
  }

  try {
    const std::vector<std::string> sentences = splitter_->split(text);
    spdlog::debug("Split text into {} sentences", sentences.size());

    std::vector<Chunk> chunks;
    std::vector<std::string> current;

    // Leading whitespace is ASCII, so its byte length is its code point length
    size_t start_offset = 0;
    while (start_offset < text.size() && is_ascii_space(text[start_offset])) {
      ++start_offset;
    }

    for (const auto& sentence : sentences) {
      const int sentence_tokens = count_tokens(sentence);

      if (sentence_tokens > settings_.max_chunk_size) {
        spdlog::warn("Sentence exceeds max chunk size ({} tokens), splitting by words",
                     sentence_tokens);
        if (!current.empty()) {
          chunks.push_back(make_chunk(join(current, " "), start_offset, provenance,
                                      static_cast<int>(chunks.size())));
          start_offset = chunks.back().end_offset + 1;
          current.clear();
        }
        // Pieces never share a chunk with neighbouring sentences and seed no overlap
        for (const auto& piece : split_long_sentence(sentence)) {
          chunks.push_back(
              make_chunk(piece, start_offset, provenance, static_cast<int>(chunks.size())));
          start_offset = chunks.back().end_offset + 1;
        }
        continue;
      }

      if (!current.empty() && count_joined(current, sentence) > settings_.chunk_size) {
        chunks.push_back(make_chunk(join(current, " "), start_offset, provenance,
                                    static_cast<int>(chunks.size())));
        const Chunk& closed = chunks.back();

        std::vector<std::string> overlap = overlap_window(current);
        while (!overlap.empty() && count_joined(overlap, sentence) > settings_.max_chunk_size) {
          overlap.erase(overlap.begin());
        }

        // Two ways to place the next chunk: find the overlap inside the closed chunk,
        // or, when there is no overlap or it cannot be found verbatim, continue from
        // a cursor one past the closed chunk's end.
        start_offset = closed.end_offset + 1;
        if (!overlap.empty()) {
          const std::string overlap_text = join(overlap, " ");
          const size_t position = closed.text.rfind(overlap_text);
          if (position != std::string::npos) {
            start_offset = closed.start_offset +
                           static_cast<size_t>(utf8::distance(
                               closed.text.begin(), closed.text.begin() + position));
          }
        }
        current = std::move(overlap);
      }

      current.push_back(sentence);
    }

    // The trailing chunk is kept even when it is below the target size
    if (!current.empty()) {
      chunks.push_back(make_chunk(join(current, " "), start_offset, provenance,
                                  static_cast<int>(chunks.size())));
    }

    spdlog::debug("Created {} chunks from text", chunks.size());
    return chunks;
  } catch (const ChunkingError&) {
    throw;
  } catch (const std::exception& e) {
    spdlog::error("Chunking failed: {}", e.what());
    throw ChunkingError("Failed to chunk text: " + std::string(e.what()));
  }
}

std::vector<Chunk> TextChunker::chunk_document(const ExtractedDocument& document) const {
  std::vector<Chunk> all_chunks;

  for (const auto& section : document.sections) {
    ChunkProvenance provenance;
    provenance.file_name = document.file_name;
    provenance.file_type = document.file_type;
    provenance.file_path = document.file_path;
    provenance.page_or_paragraph = section.number;
    provenance.section_kind = section.kind;

    std::vector<Chunk> section_chunks = chunk_text(section.text, provenance);
    for (auto& chunk : section_chunks) {
      chunk.chunk_index = static_cast<int>(all_chunks.size());
      all_chunks.push_back(std::move(chunk));
    }
  }

  spdlog::info("Chunked document '{}' into {} chunks", document.file_name, all_chunks.size());
  return all_chunks;
}

Chunk TextChunker::make_chunk(const std::string& text,
                              size_t start_offset,
                              const ChunkProvenance& provenance,
                              int chunk_index) const {
  const size_t char_count = utf8_length(text);
  return {.text = text,
          .chunk_index = chunk_index,
          .start_offset = start_offset,
          .end_offset = start_offset + char_count,
          .token_count = count_tokens(text),
          .char_count = char_count,
          .provenance = provenance};
}

// Walks back from the last sentence while the joined window stays within chunk_overlap
std::vector<std::string> TextChunker::overlap_window(
    const std::vector<std::string>& sentences) const {
  if (settings_.chunk_overlap <= 0) {
    return {};
  }

  size_t first = sentences.size();
  while (first > 0) {
    std::vector<std::string> candidate(sentences.begin() + static_cast<long>(first - 1),
                                       sentences.end());
    if (count_tokens(join(candidate, " ")) > settings_.chunk_overlap) {
      break;
    }
    --first;
  }
  return std::vector<std::string>(sentences.begin() + static_cast<long>(first), sentences.end());
}

std::vector<std::string> TextChunker::split_long_sentence(const std::string& sentence) const {
  std::vector<std::string> pieces;
  std::vector<std::string> current;

  for (const auto& word : split_words(sentence)) {
    if (!current.empty() && count_joined(current, word) > settings_.chunk_size) {
      pieces.push_back(join(current, " "));
      current.clear();
    }
    current.push_back(word);
  }

  if (!current.empty()) {
    pieces.push_back(join(current, " "));
  }
  return pieces;
}

int TextChunker::count_joined(const std::vector<std::string>& sentences,
                              const std::string& next) const {
  std::string joined = join(sentences, " ");
  if (!next.empty()) {
    if (!joined.empty()) {
      joined += ' ';
    }
    joined += next;
  }
  return count_tokens(joined);
}

}  // namespace docu_core
