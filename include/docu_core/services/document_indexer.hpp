#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "docu_core/chunking/text_chunker.hpp"
#include "docu_core/db/vector_store.hpp"
#include "docu_core/extractors/content_extractor_factory.hpp"
#include "docu_core/llm/embedder.hpp"
#include "docu_core/types/indexing_result.hpp"

namespace docu_core {

struct IndexStats {
  size_t total_chunks = 0;
  std::string collection_name;
};

/**
 * @brief Ingestion pipeline: extract, chunk, embed, store.
 *
 * Every document ends in exactly one IndexingResult. Failures are caught at
 * the document boundary so a batch always runs to the end. A document's
 * chunks are all embedded before any is stored and are written by a single
 * VectorStore::add call.
 */
class DocumentIndexer {
 public:
  DocumentIndexer(std::shared_ptr<ContentExtractorFactory> extractor_factory,
                  std::shared_ptr<const TextChunker> chunker,
                  std::shared_ptr<Embedder> embedder,
                  std::shared_ptr<VectorStore> vector_store,
                  int batch_size = 32);

  IndexingResult index_document(const std::filesystem::path& file_path);

  // Chunks, embeds and stores a document that has already been extracted
  IndexingResult index_extracted_document(const ExtractedDocument& document);

  std::vector<IndexingResult> index_documents(const std::vector<std::filesystem::path>& file_paths);

  // Removes every chunk whose file_name metadata matches. Throws VectorStoreError.
  size_t delete_document(const std::string& file_name);

  IndexStats get_stats();

 private:
  std::vector<std::vector<float>> embed_in_batches(const std::vector<std::string>& texts);

  std::shared_ptr<ContentExtractorFactory> extractor_factory_;
  std::shared_ptr<const TextChunker> chunker_;
  std::shared_ptr<Embedder> embedder_;
  std::shared_ptr<VectorStore> vector_store_;
  int batch_size_;
};

}  // namespace docu_core
