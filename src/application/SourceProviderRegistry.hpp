/**
 * @file SourceProviderRegistry.hpp
 * @brief Maps source kinds to the provider able to read them.
 */

#pragma once
#include <map>
#include <memory>
#include "domain/RagSource.hpp"
#include "domain/SourceProvider.hpp"

namespace ragforge::application {

/**
 * @class SourceProviderRegistry
 * @brief New kinds are supported by registering another provider.
 */
class SourceProviderRegistry {
public:
    /** @brief Registers (or replaces) the provider for a kind. */
    void registerProvider(domain::SourceKind kind, std::shared_ptr<domain::SourceProvider> provider);

    /** @brief Provider for a kind, or nullptr when none is registered. */
    std::shared_ptr<domain::SourceProvider> find(domain::SourceKind kind) const;

    bool supports(domain::SourceKind kind) const { return find(kind) != nullptr; }

private:
    std::map<domain::SourceKind, std::shared_ptr<domain::SourceProvider>> m_providers;
};

} // namespace ragforge::application
