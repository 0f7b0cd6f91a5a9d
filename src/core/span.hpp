#ifndef PIIREDACTOR_CORE_SPAN_HPP
#define PIIREDACTOR_CORE_SPAN_HPP

#include <string>
#include <cstddef>
#include <utility>

namespace piiredactor {
namespace core {

/*
  span.hpp
  --------------------------------
  Plain value types shared by every stage of the pipeline.

  Offsets are code point indices into the paragraph (text unit) they were detected
  in, half-open: [start, end).
*/

// A detection as reported by one detector, before reconciliation.
struct RawSpan
{
    std::string entityType;
    size_t start = 0;
    size_t end = 0;
    double score = 0.0;
    std::string sourceId;

    RawSpan() = default;
    RawSpan(std::string type, size_t s, size_t e, double sc = 1.0, std::string source = "")
        : entityType(std::move(type)), start(s), end(e), score(sc), sourceId(std::move(source))
    {
    }

    size_t length() const { return end - start; }
};

// A reconciled detection. spanId is unique within its text unit and is the only key
// later stages use to pair a span with its substitution.
struct ResolvedSpan
{
    size_t spanId = 0;
    std::string entityType;
    size_t start = 0;
    size_t end = 0;
    double score = 0.0;
    std::string sourceId;

    size_t length() const { return end - start; }

    bool overlaps(const ResolvedSpan &other) const
    {
        return start < other.end && other.start < end;
    }
};

// One span actually substituted into the masked text.
struct SubstitutionItem
{
    size_t spanId = 0;
    std::string entityType;
    size_t originalStart = 0;
    size_t originalEnd = 0;
    size_t maskedStart = 0;
    size_t maskedEnd = 0;
    std::string operatorName;
    std::string replacement;
};

} // namespace core
} // namespace piiredactor

#endif // PIIREDACTOR_CORE_SPAN_HPP
