#ifndef PIIREDACTOR_CORE_ERRORS_HPP
#define PIIREDACTOR_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

/*
  errors.hpp
  --------------------------------
  Exception hierarchy for the redactor. Everything derives from
  AnonymizationError, itself a std::runtime_error, so boundary code can catch a
  single type.

  Alignment failures are deliberately absent: an unresolved alignment is a soft
  condition carried on the span (see alignment_resolver.hpp), never thrown.
*/

namespace piiredactor {

class AnonymizationError : public std::runtime_error
{
public:
    explicit AnonymizationError(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

// Deanonymize asked for an entity type or placeholder the mapping does not hold.
class MappingNotFound : public AnonymizationError
{
public:
    MappingNotFound(const std::string &entityType, const std::string &placeholder)
        : AnonymizationError(placeholder.empty()
              ? "MappingNotFound: no mapping for entity type '" + entityType + "'"
              : "MappingNotFound: placeholder '" + placeholder +
                "' not mapped under entity type '" + entityType + "'"),
          m_entityType(entityType),
          m_placeholder(placeholder)
    {
    }

    const std::string& entityType() const { return m_entityType; }
    const std::string& placeholder() const { return m_placeholder; }

private:
    std::string m_entityType;
    std::string m_placeholder;
};

// Resolved spans and substitution items of one text unit disagree.
class SpanCorrespondenceMismatch : public AnonymizationError
{
public:
    SpanCorrespondenceMismatch(size_t resolvedCount, size_t substitutedCount)
        : AnonymizationError("SpanCorrespondenceMismatch: " + std::to_string(resolvedCount) +
                             " resolved spans vs " + std::to_string(substitutedCount) +
                             " substitution items"),
          m_resolvedCount(resolvedCount),
          m_substitutedCount(substitutedCount)
    {
    }

    size_t resolvedCount() const { return m_resolvedCount; }
    size_t substitutedCount() const { return m_substitutedCount; }

private:
    size_t m_resolvedCount;
    size_t m_substitutedCount;
};

class InvalidSpan : public AnonymizationError
{
public:
    explicit InvalidSpan(const std::string &what)
        : AnonymizationError("InvalidSpan: " + what)
    {
    }
};

class TextEncodingError : public AnonymizationError
{
public:
    explicit TextEncodingError(const std::string &what)
        : AnonymizationError("TextEncodingError: " + what)
    {
    }
};

class ConfigError : public AnonymizationError
{
public:
    explicit ConfigError(const std::string &what)
        : AnonymizationError("ConfigError: " + what)
    {
    }
};

class DetectorError : public AnonymizationError
{
public:
    explicit DetectorError(const std::string &what)
        : AnonymizationError("DetectorError: " + what)
    {
    }
};

class StoreError : public AnonymizationError
{
public:
    explicit StoreError(const std::string &what)
        : AnonymizationError("StoreError: " + what)
    {
    }
};

} // namespace piiredactor

#endif // PIIREDACTOR_CORE_ERRORS_HPP
