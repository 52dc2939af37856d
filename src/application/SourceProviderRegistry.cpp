/**
 * @file SourceProviderRegistry.cpp
 * @brief Implementation of SourceProviderRegistry.
 */

#include "application/SourceProviderRegistry.hpp"

namespace ragforge::application {

void SourceProviderRegistry::registerProvider(domain::SourceKind kind,
                                              std::shared_ptr<domain::SourceProvider> provider) {
    m_providers[kind] = std::move(provider);
}

std::shared_ptr<domain::SourceProvider> SourceProviderRegistry::find(domain::SourceKind kind) const {
    auto it = m_providers.find(kind);
    if (it == m_providers.end()) return nullptr;
    return it->second;
}

} // namespace ragforge::application
