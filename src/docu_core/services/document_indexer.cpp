#include "docu_core/services/document_indexer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "docu_core/errors.hpp"

namespace docu_core {

DocumentIndexer::DocumentIndexer(std::shared_ptr<ContentExtractorFactory> extractor_factory,
                                 std::shared_ptr<const TextChunker> chunker,
                                 std::shared_ptr<Embedder> embedder,
                                 std::shared_ptr<VectorStore> vector_store,
                                 int batch_size)
    : extractor_factory_(std::move(extractor_factory)),
      chunker_(std::move(chunker)),
      embedder_(std::move(embedder)),
      vector_store_(std::move(vector_store)),
      batch_size_(batch_size) {
  if (!extractor_factory_ || !chunker_ || !embedder_ || !vector_store_) {
    throw ValidationError("DocumentIndexer requires an extractor factory, chunker, embedder and vector store");
  }
  if (batch_size_ <= 0) {
    throw ValidationError("Embedding batch size must be greater than 0");
  }
  spdlog::info("DocumentIndexer initialized (batch size {})", batch_size_);
}

IndexingResult DocumentIndexer::index_document(const std::filesystem::path& file_path) {
  spdlog::info("Indexing document: {}", file_path.string());
  try {
    const auto& extractor = extractor_factory_->get_extractor_for(file_path);
    const ExtractedDocument document = extractor.extract(file_path);
    return index_extracted_document(document);
  } catch (const std::exception& e) {
    spdlog::error("Failed to index {}: {}", file_path.string(), e.what());
    return IndexingResult::failure_response(file_path.filename().string(), e.what());
  }
}

IndexingResult DocumentIndexer::index_extracted_document(const ExtractedDocument& document) {
  try {
    const auto chunks = chunker_->chunk_document(document);
    if (chunks.empty()) {
      spdlog::warn("No chunks generated for {}", document.file_name);
      return IndexingResult::skipped_response(document.file_name, "No text content",
                                              document.total_pages());
    }

    std::vector<std::string> texts;
    std::vector<nlohmann::json> metadatas;
    texts.reserve(chunks.size());
    metadatas.reserve(chunks.size());
    for (const auto& chunk : chunks) {
      texts.push_back(chunk.text);
      metadatas.push_back(sanitize_metadata(to_metadata(chunk)));
    }

    const auto embeddings = embed_in_batches(texts);
    const auto ids = vector_store_->add({}, embeddings, texts, metadatas);

    spdlog::info("Successfully indexed {}: {} chunks, {} stored", document.file_name,
                 chunks.size(), ids.size());
    return IndexingResult::success_response(document.file_name, static_cast<int>(chunks.size()),
                                            static_cast<int>(ids.size()), document.total_pages());
  } catch (const std::exception& e) {
    spdlog::error("Failed to index {}: {}", document.file_name, e.what());
    return IndexingResult::failure_response(document.file_name, e.what());
  }
}

std::vector<IndexingResult> DocumentIndexer::index_documents(
    const std::vector<std::filesystem::path>& file_paths) {
  spdlog::info("Indexing {} documents", file_paths.size());

  std::vector<IndexingResult> results;
  results.reserve(file_paths.size());
  for (const auto& file_path : file_paths) {
    results.push_back(index_document(file_path));
  }

  const auto count_status = [&results](IndexingStatus status) {
    return std::count_if(results.begin(), results.end(),
                         [status](const IndexingResult& r) { return r.status == status; });
  };
  spdlog::info("Indexing complete: {} successful, {} failed, {} skipped",
               count_status(IndexingStatus::Success), count_status(IndexingStatus::Failed),
               count_status(IndexingStatus::Skipped));
  return results;
}

size_t DocumentIndexer::delete_document(const std::string& file_name) {
  try {
    const nlohmann::json filter = {{"file_name", file_name}};
    const size_t deleted = vector_store_->delete_where(filter);
    spdlog::info("Deleted document: {} ({} chunks)", file_name, deleted);
    return deleted;
  } catch (const std::exception& e) {
    spdlog::error("Failed to delete {}: {}", file_name, e.what());
    throw VectorStoreError("Document deletion failed: " + std::string(e.what()));
  }
}

IndexStats DocumentIndexer::get_stats() {
  return IndexStats{vector_store_->count(), vector_store_->collection_name()};
}

std::vector<std::vector<float>> DocumentIndexer::embed_in_batches(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> embeddings;
  embeddings.reserve(texts.size());

  const size_t batch_size = static_cast<size_t>(batch_size_);
  for (size_t start = 0; start < texts.size(); start += batch_size) {
    const size_t end = std::min(start + batch_size, texts.size());
    std::vector<std::string> batch(texts.begin() + start, texts.begin() + end);

    auto batch_embeddings = embedder_->embed_batch(batch);
    if (batch_embeddings.size() != batch.size()) {
      throw EmbeddingError("Embedder returned " + std::to_string(batch_embeddings.size()) +
                           " vectors for " + std::to_string(batch.size()) + " texts");
    }
    spdlog::debug("Embedded batch {}-{} of {}", start + 1, end, texts.size());
    for (auto& embedding : batch_embeddings) {
      embeddings.push_back(std::move(embedding));
    }
  }
  return embeddings;
}

}  // namespace docu_core
