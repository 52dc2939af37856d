/**
 * @file RagEngine.hpp
 * @brief Per-knowledge-base document store answering retrieval queries.
 */

#pragma once
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>
#include "application/RelevanceScorer.hpp"
#include "application/SourceProviderRegistry.hpp"
#include "application/TextChunker.hpp"
#include "domain/Document.hpp"
#include "domain/RagSource.hpp"

namespace ragforge::application {

/**
 * @class RagEngine
 * @brief Owns the documents ingested for one knowledge base.
 *
 * State is purely in memory and rebuilt from the sources on every start.
 * getContext may run on request threads while addSource/removeSource run on the
 * configuration thread; the document list is guarded by a read-write lock.
 */
class RagEngine {
public:
    static constexpr std::size_t kDefaultMaxChunks = 5;

    explicit RagEngine(std::shared_ptr<const SourceProviderRegistry> providers,
                       RelevanceScorer scorer = RelevanceScorer(),
                       TextChunker chunker = TextChunker());

    /**
     * @brief Reads, chunks and stores one source. Sources are not deduplicated.
     * @return A copy of the stored document.
     * @throws domain::SourceTypeUnsupported if no provider handles the source kind.
     * @throws domain::SourceUnavailable if the provider cannot read the source.
     */
    domain::Document addSource(const domain::RagSource& source);

    /** @brief Removes every document materialized from the given source id. */
    bool removeSource(const std::string& sourceId);

    void clear();

    /**
     * @brief Retrieval context for a query.
     *
     * Small corpora are returned whole; otherwise the top maxChunks scored chunks,
     * or the fallback chunks when nothing scored. Empty only when no documents exist.
     */
    std::string getContext(const std::string& query, std::size_t maxChunks = kDefaultMaxChunks) const;

    std::vector<domain::Document> documents() const;
    std::size_t documentCount() const;

    static std::string RenderFullContext(const std::vector<domain::Document>& documents);
    static std::string RenderRankedContext(const std::vector<ScoredChunk>& chunks);
    static std::string RenderFallbackContext(const std::vector<ScoredChunk>& chunks);

private:
    std::shared_ptr<const SourceProviderRegistry> m_providers;
    RelevanceScorer m_scorer;
    TextChunker m_chunker;

    std::vector<domain::Document> m_documents;
    mutable std::shared_mutex m_mutex;
};

} // namespace ragforge::application
