/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/ApiServerManager.hpp"
#include "application/ChatService.hpp"
#include "application/ConversationService.hpp"
#include "application/SourceProviderRegistry.hpp"
#include "domain/InferenceEngine.hpp"
#include "domain/WebSearchService.hpp"
#include "infrastructure/KnowledgeBaseRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace ragforge::application {

struct AppServices {
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<domain::InferenceEngine> inferenceEngine;
    std::shared_ptr<ChatService> chatService;
    std::shared_ptr<SourceProviderRegistry> providers;
    std::shared_ptr<domain::WebSearchService> webSearch;
    std::shared_ptr<infrastructure::KnowledgeBaseRepository> repository;
    std::shared_ptr<ApiServerManager> serverManager;
    std::unique_ptr<ConversationService> conversationService;
};

} // namespace ragforge::application
