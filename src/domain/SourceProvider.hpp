/**
 * @file SourceProvider.hpp
 * @brief Capability that turns a RagSource into plain text.
 */

#pragma once
#include <string>
#include "domain/RagSource.hpp"

namespace ragforge::domain {

/**
 * @class SourceProvider
 * @brief Reads the content of one kind of source.
 */
class SourceProvider {
public:
    virtual ~SourceProvider() = default;

    /**
     * @brief Normalizes the source into plain text.
     * @throws SourceUnavailable when the underlying file or URL cannot be read.
     */
    virtual std::string getContent(const RagSource& source) = 0;
};

} // namespace ragforge::domain
