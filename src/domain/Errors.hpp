/**
 * @file Errors.hpp
 * @brief Exception types raised across the RAG and serving layers.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace ragforge::domain {

/** @brief A source could not be read (missing file, network failure). */
class SourceUnavailable : public std::runtime_error {
public:
    explicit SourceUnavailable(const std::string& what) : std::runtime_error(what) {}
};

/** @brief No provider is registered for the kind of a source. */
class SourceTypeUnsupported : public std::runtime_error {
public:
    explicit SourceTypeUnsupported(const std::string& what) : std::runtime_error(what) {}
};

/** @brief The HTTP listener of a knowledge base could not bind its port. */
class ListenerBindFailure : public std::runtime_error {
public:
    explicit ListenerBindFailure(const std::string& what) : std::runtime_error(what) {}
};

/** @brief No model is loaded in the inference engine. */
class InferenceUnavailable : public std::runtime_error {
public:
    explicit InferenceUnavailable(const std::string& what) : std::runtime_error(what) {}
};

class KnowledgeBaseNotFound : public std::runtime_error {
public:
    explicit KnowledgeBaseNotFound(const std::string& id)
        : std::runtime_error("Knowledge base not found: " + id) {}
};

class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace ragforge::domain
