#ifndef PIIREDACTOR_CORE_ANONYMIZATION_RECORD_HPP
#define PIIREDACTOR_CORE_ANONYMIZATION_RECORD_HPP

#include <string>
#include <vector>
#include "core/entity_mapping.hpp"

namespace piiredactor {
namespace core {

/*
  AnonymizationRecord
  --------------------------------
  The result for one paragraph. Offsets of a SpanRecord are code point indices:
  [start, end) into fullText, [maskedStart, maskedEnd) into maskedText.
*/

struct SpanRecord
{
    size_t spanId = 0;
    std::string entityType;
    std::string entityValue;
    size_t start = 0;
    size_t end = 0;
    std::string maskedEntityValue;
    size_t maskedStart = 0;
    size_t maskedEnd = 0;
    std::string operatorName;
    double score = 0.0;
};

enum class RecordStatus {
    Complete,        // every resolved span was substituted and reported
    Realigned,       // span list rebuilt after a correspondence mismatch
    SpansDropped,    // correspondence mismatch, span list emptied
    DetectorFailed   // a detector threw; text returned unmasked
};

inline std::string toString(RecordStatus status)
{
    switch (status) {
    case RecordStatus::Complete:       return "complete";
    case RecordStatus::Realigned:      return "realigned";
    case RecordStatus::SpansDropped:   return "spans_dropped";
    case RecordStatus::DetectorFailed: return "detector_failed";
    }
    return "unknown";
}

struct AnonymizationRecord
{
    size_t paragraphIndex = 0;
    std::string fullText;
    std::string maskedText;
    std::vector<SpanRecord> spans;
    RecordStatus status = RecordStatus::Complete;
    std::vector<std::string> warnings;
    bool reversible = false;
    EntityMapping mapping;   // populated only when reversible
};

} // namespace core
} // namespace piiredactor

#endif // PIIREDACTOR_CORE_ANONYMIZATION_RECORD_HPP
