#ifndef PIIREDACTOR_SERVICE_RECORD_SERIALIZER_HPP
#define PIIREDACTOR_SERVICE_RECORD_SERIALIZER_HPP

#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include "core/anonymization_record.hpp"
#include "core/entity_mapping.hpp"
#include "core/span.hpp"
#include "core/errors.hpp"
#include "util/json.hpp"

/**
 * @file record_serializer.hpp
 * @brief JSON forms of anonymization records and of caller-supplied span files.
 *
 * DESIGN GOALS:
 *   - Non-reversible records serialize as
 *       {"full_text","masked","spans":[{"entity_type","entity_value",
 *        "start_position","end_position","operator"}]}
 *   - Reversible records serialize as
 *       {"text","masked","spans":[{"entity_type","entity_value","masked_entity_value",
 *        "start_position","end_position","masked_start","masked_end","operator"}],
 *        "entity_mapping":{...}}
 *     which is everything recordFromJson() needs to restore the text. Only spans
 *     whose operator is "counter" are restored.
 *   - "status" is written when it is not complete, "warnings" when there are any.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiredactor::service;
 *
 *   std::string out = recordsToJson(pipeline.Anonymize(text)).dump(4);
 *
 *   auto spans = parseSpansFile(R"([{"entity_type":"PERSON","start":0,"end":7,"score":0.9}])");
 *   auto records = pipeline.AnonymizeWithSpans(text, spans);
 *   @endcode
 */

namespace piiredactor {
namespace service {

inline util::json::JsonValue recordToJson(const core::AnonymizationRecord &record)
{
    using util::json::JsonValue;

    JsonValue out = JsonValue::object();
    out.set(record.reversible ? "text" : "full_text", record.fullText);
    out.set("masked", record.maskedText);

    JsonValue spans = JsonValue::array();
    for (const auto &span : record.spans) {
        JsonValue s = JsonValue::object();
        s.set("entity_type", span.entityType);
        s.set("entity_value", span.entityValue);
        if (record.reversible) {
            s.set("masked_entity_value", span.maskedEntityValue);
            s.set("start_position", span.start);
            s.set("end_position", span.end);
            s.set("masked_start", span.maskedStart);
            s.set("masked_end", span.maskedEnd);
        } else {
            s.set("start_position", span.start);
            s.set("end_position", span.end);
        }
        s.set("operator", span.operatorName);
        spans.push(s);
    }
    out.set("spans", spans);

    if (record.reversible) {
        out.set("entity_mapping", record.mapping.toJson());
    }
    if (record.status != core::RecordStatus::Complete) {
        out.set("status", core::toString(record.status));
    }
    if (!record.warnings.empty()) {
        JsonValue warnings = JsonValue::array();
        for (const auto &w : record.warnings) {
            warnings.push(w);
        }
        out.set("warnings", warnings);
    }
    return out;
}

inline util::json::JsonValue recordsToJson(const std::vector<core::AnonymizationRecord> &records)
{
    util::json::JsonValue out = util::json::JsonValue::array();
    for (const auto &r : records) {
        out.push(recordToJson(r));
    }
    return out;
}

/**
 * @brief Rebuild a reversible record from its JSON form.
 * @throw InvalidSpan if required fields are missing or of the wrong type.
 */
inline core::AnonymizationRecord recordFromJson(const util::json::JsonValue &json)
{
    core::AnonymizationRecord record;
    try {
        if (!json.isObject()) {
            throw InvalidSpan("record must be a JSON object");
        }
        record.reversible = json.contains("entity_mapping");
        if (json.contains("text")) {
            record.fullText = json.at("text").asString();
        } else if (json.contains("full_text")) {
            record.fullText = json.at("full_text").asString();
        }
        record.maskedText = json.at("masked").asString();

        size_t nextId = 0;
        for (const auto &s : json.at("spans").items()) {
            core::SpanRecord span;
            span.spanId = nextId++;
            span.entityType = s.at("entity_type").asString();
            if (s.contains("entity_value")) {
                span.entityValue = s.at("entity_value").asString();
            }
            span.start = static_cast<size_t>(s.at("start_position").asInt());
            span.end = static_cast<size_t>(s.at("end_position").asInt());
            if (s.contains("masked_entity_value")) {
                span.maskedEntityValue = s.at("masked_entity_value").asString();
                span.maskedStart = static_cast<size_t>(s.at("masked_start").asInt());
                span.maskedEnd = static_cast<size_t>(s.at("masked_end").asInt());
            }
            if (s.contains("operator")) {
                span.operatorName = s.at("operator").asString();
            }
            record.spans.push_back(span);
        }

        if (record.reversible) {
            record.mapping = core::EntityMapping::fromJson(json.at("entity_mapping"));
        }
        if (json.contains("warnings")) {
            for (const auto &w : json.at("warnings").items()) {
                record.warnings.push_back(w.asString());
            }
        }
    } catch (const AnonymizationError &) {
        throw;
    } catch (const std::runtime_error &ex) {
        throw InvalidSpan(std::string("malformed record: ") + ex.what());
    }
    return record;
}

namespace detail {

inline std::vector<core::RawSpan> parseSpanList(const util::json::JsonValue &list)
{
    std::vector<core::RawSpan> spans;
    for (const auto &s : list.items()) {
        int64_t start = s.at("start").asInt();
        int64_t end = s.at("end").asInt();
        if (start < 0 || end < 0) {
            throw InvalidSpan("negative offset in span list");
        }
        core::RawSpan span;
        span.entityType = s.at("entity_type").asString();
        span.start = static_cast<size_t>(start);
        span.end = static_cast<size_t>(end);
        span.score = s.contains("score") ? s.at("score").asNumber() : 1.0;
        span.sourceId = s.contains("source_id") ? s.at("source_id").asString() : "spans-file";
        spans.push_back(span);
    }
    return spans;
}

} // namespace detail

/**
 * @brief Parse caller-supplied spans. Either a plain array (spans of paragraph 0) or
 *        an object keyed by paragraph index: {"0": [...], "2": [...]}.
 * @throw InvalidSpan on malformed JSON or span entries.
 */
inline std::map<size_t, std::vector<core::RawSpan>> parseSpansFile(const std::string &content)
{
    std::map<size_t, std::vector<core::RawSpan>> out;
    try {
        util::json::JsonValue doc = util::json::parse(content);
        if (doc.isArray()) {
            out[0] = detail::parseSpanList(doc);
            return out;
        }
        if (!doc.isObject()) {
            throw InvalidSpan("spans file must hold an array or an object");
        }
        for (const auto &kv : doc.members()) {
            size_t idx = 0;
            size_t used = 0;
            try {
                idx = static_cast<size_t>(std::stoull(kv.first, &used));
            } catch (const std::logic_error &) {
                used = 0;
            }
            if (used == 0 || used != kv.first.size()) {
                throw InvalidSpan("spans file key '" + kv.first + "' is not a paragraph index");
            }
            std::vector<core::RawSpan> spans = detail::parseSpanList(kv.second);
            out[idx].insert(out[idx].end(), spans.begin(), spans.end());
        }
    } catch (const AnonymizationError &) {
        throw;
    } catch (const std::runtime_error &ex) {
        throw InvalidSpan(std::string("malformed spans file: ") + ex.what());
    }
    return out;
}

} // namespace service
} // namespace piiredactor

#endif // PIIREDACTOR_SERVICE_RECORD_SERIALIZER_HPP
