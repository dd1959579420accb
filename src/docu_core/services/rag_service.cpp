#include "docu_core/services/rag_service.hpp"

#include <spdlog/spdlog.h>

#include "docu_core/chunking/text_chunker.hpp"
#include "docu_core/db/faiss_vector_store.hpp"
#include "docu_core/errors.hpp"
#include "docu_core/llm/embedding_cache.hpp"
#include "docu_core/llm/ollama_client.hpp"
#include "docu_core/util/text.hpp"

namespace docu_core {

namespace {

constexpr const char* kNoResultsAnswer =
    "I couldn't find any relevant information in the indexed documents to answer your question.";

}  // namespace

RagService::RagService(const Config& config,
                       std::shared_ptr<ContentExtractorFactory> extractor_factory,
                       std::shared_ptr<Embedder> embedder,
                       std::shared_ptr<VectorStore> vector_store,
                       std::shared_ptr<TextGenerator> generator)
    : embedder_(std::move(embedder)),
      vector_store_(std::move(vector_store)),
      generator_(std::move(generator)),
      reranker_(config.retrieval.rerank_strategy),
      prompt_builder_(config.generation),
      strict_citations_(config.generation.strict_citations) {
  spdlog::info("Initializing RAG service...");
  if (!generator_) {
    throw ValidationError("RagService requires a text generator");
  }

  std::shared_ptr<const TextChunker> chunker =
      std::make_shared<TextChunker>(config.chunking, make_tokenizer(config.chunking.tokenizer));
  indexer_ = std::make_unique<DocumentIndexer>(std::move(extractor_factory), std::move(chunker),
                                               embedder_, vector_store_,
                                               config.embedding.batch_size);
  retriever_ = std::make_unique<Retriever>(embedder_, vector_store_, config.retrieval);
  spdlog::info("RAG service initialized successfully (rerank strategy '{}')",
               to_string(reranker_.strategy()));
}

RagService::~RagService() = default;

std::unique_ptr<RagService> RagService::create(const Config& config) {
  auto db_manager = std::make_unique<DatabaseManager>(
      config.vector_store.db_path, config.vector_store.db_key, config.vector_store.pool_size);
  auto vector_store = std::make_shared<FaissVectorStore>(*db_manager, config.vector_store,
                                                         config.embedding.embedding_dimension);

  auto ollama_client = std::make_shared<OllamaClient>(config.embedding, config.generation);
  std::shared_ptr<Embedder> embedder = ollama_client;
  if (config.embedding.cache_enabled) {
    embedder = std::make_shared<CachedEmbedder>(ollama_client, config.embedding.cache_dir);
  }

  auto service = std::make_unique<RagService>(config, std::make_shared<ContentExtractorFactory>(),
                                              embedder, vector_store, ollama_client);
  service->db_manager_ = std::move(db_manager);
  return service;
}

RagResponse RagService::query(const std::string& query,
                              std::optional<int> top_k,
                              const nlohmann::json& filters,
                              bool rerank) {
  spdlog::info("Processing query: '{}'", query);

  RetrievalContext retrieval = retriever_->retrieve_with_context(query, top_k, filters);

  RagResponse response;
  response.query = query;
  if (retrieval.chunks.empty()) {
    spdlog::warn("No relevant chunks found");
    response.answer = kNoResultsAnswer;
    return response;
  }

  std::vector<RetrievedChunk> chunks = std::move(retrieval.chunks);
  if (rerank) {
    chunks = reranker_.rerank(std::move(chunks), query);
  }

  // From here on the chunk order is fixed
  const PromptContext context = prompt_builder_.build(query, std::move(chunks));
  response.answer = generator_->generate(context.system_prompt(), context.user_prompt());

  response.citations = citation_resolver_.extract_citations(response.answer);
  response.citation_map =
      citation_resolver_.map_citations_to_sources(response.answer, context.chunks());
  auto validation = citation_resolver_.validate_citations(response.answer, context.chunks().size());
  if (!validation.is_valid) {
    spdlog::warn("Citation validation errors: {}", join(validation.errors, "; "));
    if (strict_citations_) {
      throw CitationValidationError(join(validation.errors, "; "));
    }
  }
  response.citations_valid = validation.is_valid;
  response.citation_errors = std::move(validation.errors);

  response.sources = context.chunks();
  response.num_sources = context.chunks().size();
  response.avg_similarity = retrieval.avg_similarity;

  spdlog::info("Query complete: {} citations, {} sources", response.citations.size(),
               response.num_sources);
  return response;
}

std::vector<IndexingResult> RagService::index_documents(
    const std::vector<std::filesystem::path>& file_paths) {
  return indexer_->index_documents(file_paths);
}

size_t RagService::delete_document(const std::string& file_name) {
  return indexer_->delete_document(file_name);
}

RagStats RagService::get_stats() {
  const IndexStats index_stats = indexer_->get_stats();
  return RagStats{index_stats.total_chunks, index_stats.collection_name, embedder_->model_name(),
                  generator_->llm_model()};
}

void RagService::clear_all() {
  vector_store_->reset();
  spdlog::info("All documents cleared");
}

}  // namespace docu_core
