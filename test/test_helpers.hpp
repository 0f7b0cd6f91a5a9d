#ifndef PIIREDACTOR_TEST_TEST_HELPERS_HPP
#define PIIREDACTOR_TEST_TEST_HELPERS_HPP

#include <string>
#include <stdexcept>
#include <vector>
#include "core/span.hpp"
#include "core/placeholder_codec.hpp"
#include "core/anonymization_record.hpp"
#include "util/utf8.hpp"

namespace piiredactor {
namespace test {

// Code point offsets of the n-th occurrence of needle in text, as a RawSpan.
inline core::RawSpan spanOf(const std::string& text, const std::string& needle,
                            const std::string& type, double score = 0.85, size_t occurrence = 0,
                            const std::string& source = "test") {
    const std::u32string hay = util::utf8::decode(text);
    const std::u32string pin = util::utf8::decode(needle);
    size_t pos = hay.find(pin);
    for (size_t i = 0; i < occurrence && pos != std::u32string::npos; ++i) {
        pos = hay.find(pin, pos + 1);
    }
    if (pos == std::u32string::npos) {
        throw std::logic_error("test text does not contain the needle");
    }
    return core::RawSpan(type, pos, pos + pin.size(), score, source);
}

inline core::ResolvedSpan resolvedOf(size_t id, const core::RawSpan& raw) {
    core::ResolvedSpan rs;
    rs.spanId = id;
    rs.entityType = raw.entityType;
    rs.start = raw.start;
    rs.end = raw.end;
    rs.score = raw.score;
    rs.sourceId = raw.sourceId;
    return rs;
}

// SpanRecords carrying just what PlaceholderCodec::Deanonymize reads.
inline std::vector<core::SpanRecord> recordsOf(const core::SubstitutionResult& result) {
    std::vector<core::SpanRecord> out;
    for (const auto& item : result.items) {
        core::SpanRecord rec;
        rec.spanId = item.spanId;
        rec.entityType = item.entityType;
        rec.start = item.originalStart;
        rec.end = item.originalEnd;
        rec.maskedEntityValue = item.replacement;
        rec.maskedStart = item.maskedStart;
        rec.maskedEnd = item.maskedEnd;
        rec.operatorName = item.operatorName;
        out.push_back(rec);
    }
    return out;
}

inline std::string slice(const std::string& text, size_t start, size_t end) {
    return util::utf8::encode(util::utf8::decode(text), start, end);
}

} // namespace test
} // namespace piiredactor

#endif // PIIREDACTOR_TEST_TEST_HELPERS_HPP
