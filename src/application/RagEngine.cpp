/**
 * @file RagEngine.cpp
 * @brief Implementation of RagEngine.
 */

#include "application/RagEngine.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <sstream>

namespace ragforge::application {

namespace {

domain::DocumentType TypeFromSource(const domain::RagSource& source) {
    switch (source.kind) {
        case domain::SourceKind::Web: return domain::DocumentType::Web;
        case domain::SourceKind::Text: return domain::DocumentType::Text;
        case domain::SourceKind::File:
            return domain::DocumentTypeFromExtension(std::filesystem::path(source.value).extension().string());
        case domain::SourceKind::Other: break;
    }
    return domain::DocumentType::Unknown;
}

} // namespace

RagEngine::RagEngine(std::shared_ptr<const SourceProviderRegistry> providers,
                     RelevanceScorer scorer,
                     TextChunker chunker)
    : m_providers(std::move(providers)), m_scorer(std::move(scorer)), m_chunker(chunker) {}

domain::Document RagEngine::addSource(const domain::RagSource& source) {
    auto provider = m_providers ? m_providers->find(source.kind) : nullptr;
    if (!provider) {
        throw domain::SourceTypeUnsupported("No provider found for source type " +
                                            domain::SourceKindToString(source.kind));
    }

    domain::Document doc;
    try {
        doc.content = provider->getContent(source);
    } catch (const std::exception& e) {
        std::cerr << "[RagEngine] Error adding source " << source.name << ": " << e.what() << std::endl;
        throw;
    }

    doc.id = source.id;
    doc.fileName = source.name;
    doc.filePath = source.value;
    doc.type = TypeFromSource(source);
    if (!doc.content.empty()) {
        doc.chunks = m_chunker.chunk(doc.content);
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_documents.push_back(doc);
    std::cout << "[RagEngine] Added '" << doc.fileName << "' (" << doc.content.size()
              << " chars, " << doc.chunks.size() << " chunks). Total documents: "
              << m_documents.size() << std::endl;
    return doc;
}

bool RagEngine::removeSource(const std::string& sourceId) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto before = m_documents.size();
    m_documents.erase(std::remove_if(m_documents.begin(), m_documents.end(),
                          [&sourceId](const domain::Document& d) { return d.id == sourceId; }),
                      m_documents.end());
    return m_documents.size() != before;
}

void RagEngine::clear() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_documents.clear();
}

std::vector<domain::Document> RagEngine::documents() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_documents;
}

std::size_t RagEngine::documentCount() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_documents.size();
}

std::string RagEngine::getContext(const std::string& query, std::size_t maxChunks) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (m_documents.empty()) return std::string();

    if (RelevanceScorer::IsSmallCorpus(m_documents)) {
        return RenderFullContext(m_documents);
    }

    auto top = m_scorer.rank(m_documents, query, maxChunks);
    if (top.empty()) {
        return RenderFallbackContext(RelevanceScorer::Fallback(m_documents));
    }
    return RenderRankedContext(top);
}

std::string RagEngine::RenderFullContext(const std::vector<domain::Document>& documents) {
    std::stringstream ss;
    ss << "--- FULL DOCUMENT CONTEXT ---\n";
    for (const auto& doc : documents) {
        ss << "[Document: " << doc.fileName << "]:\n"
           << doc.content << "\n\n";
    }
    ss << "--- END CONTEXT ---\n";
    return ss.str();
}

std::string RagEngine::RenderRankedContext(const std::vector<ScoredChunk>& chunks) {
    std::stringstream ss;
    ss << "--- DOCUMENT CONTEXT ---\n";
    for (const auto& sc : chunks) {
        ss << "[From " << sc.document->fileName << "]:\n"
           << sc.chunk->content << "\n\n";
    }
    ss << "--- END CONTEXT ---\n";
    return ss.str();
}

std::string RagEngine::RenderFallbackContext(const std::vector<ScoredChunk>& chunks) {
    std::stringstream ss;
    ss << "--- DOCUMENT CONTEXT ---\n";
    for (const auto& sc : chunks) {
        ss << "[From " << sc.document->fileName << " - Part " << (sc.chunk->index + 1) << "]:\n"
           << sc.chunk->content << "\n\n";
    }
    ss << "--- END CONTEXT ---\n";
    return ss.str();
}

} // namespace ragforge::application
