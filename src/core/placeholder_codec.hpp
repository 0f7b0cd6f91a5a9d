#ifndef PIIREDACTOR_CORE_PLACEHOLDER_CODEC_HPP
#define PIIREDACTOR_CORE_PLACEHOLDER_CODEC_HPP

#include <string>
#include <vector>
#include <algorithm>
#include <utility>
#include "core/span.hpp"
#include "core/operators.hpp"
#include "core/entity_mapping.hpp"
#include "core/anonymization_record.hpp"
#include "core/errors.hpp"
#include "util/utf8.hpp"
#include "util/logger.hpp"

/**
 * @file placeholder_codec.hpp
 * @brief Turns a resolved span set into a masked text, and a masked text back into the
 *        original.
 *
 * DESIGN GOALS:
 *   - Replacement values are chosen walking the spans left to right, so counter indices
 *     follow reading order ({{PERSON_0}} is the first person in the paragraph).
 *   - Replacements are written into the text from the highest start offset to the
 *     lowest, so an edit never shifts the offsets of a span still to be applied.
 *   - Overlapping spans are never both substituted. Of two overlapping spans the one
 *     seen first is kept unless the later one scores strictly higher. The loser gets no
 *     SubstitutionItem; the pipeline notices the gap by span id.
 *
 * USAGE:
 *   @code
 *   core::OperatorTable table;
 *   table.set("PERSON", std::make_shared<core::CounterOperator>());
 *   core::PlaceholderCodec codec(table);
 *
 *   core::EntityMapping mapping;
 *   auto result = codec.Substitute(text, resolvedSpans, mapping);
 *   // result.maskedText, result.items
 *   @endcode
 */

namespace piiredactor {
namespace core {

struct SubstitutionResult
{
    std::u32string maskedText;
    std::vector<SubstitutionItem> items;   // ascending by original offset
    std::vector<size_t> skippedSpanIds;    // overlapping spans left out
};

class PlaceholderCodec
{
public:
    explicit PlaceholderCodec(OperatorTable table)
        : m_table(std::move(table))
    {
    }

    const OperatorTable& operators() const { return m_table; }

    /**
     * @brief Apply the operator of every span to the text.
     * @param text  the original text unit
     * @param spans ResolvedSpans of that text unit, sorted by (start, end)
     * @param mapping session mapping, extended by counter operators
     */
    SubstitutionResult Substitute(const std::u32string &text,
                                  const std::vector<ResolvedSpan> &spans,
                                  EntityMapping &mapping) const
    {
        SubstitutionResult result;

        // 1) choose the spans to substitute
        std::vector<const ResolvedSpan*> accepted;
        for (const auto &span : spans) {
            if (span.end > text.size() || span.start >= span.end) {
                throw InvalidSpan("span " + std::to_string(span.spanId) + " [" +
                                  std::to_string(span.start) + "," + std::to_string(span.end) +
                                  ") outside text of length " + std::to_string(text.size()));
            }
            // accepted spans are disjoint and start no later than this one,
            // so only the last of them can reach into it
            if (!accepted.empty() && accepted.back()->overlaps(span)) {
                if (span.score > accepted.back()->score) {
                    result.skippedSpanIds.push_back(accepted.back()->spanId);
                    accepted.back() = &span;
                } else {
                    result.skippedSpanIds.push_back(span.spanId);
                }
                continue;
            }
            accepted.push_back(&span);
        }

        // 2) replacement values, left to right
        std::vector<std::u32string> replacements;
        replacements.reserve(accepted.size());
        long long delta = 0;
        for (const ResolvedSpan *span : accepted) {
            const Operator &op = m_table.forEntity(span->entityType);
            const std::string original = util::utf8::encode(text, span->start, span->end);
            const std::string replacement = op.Apply(original, span->entityType, mapping);
            std::u32string replacement32 = util::utf8::decode(replacement);

            SubstitutionItem item;
            item.spanId = span->spanId;
            item.entityType = span->entityType;
            item.originalStart = span->start;
            item.originalEnd = span->end;
            item.maskedStart = static_cast<size_t>(static_cast<long long>(span->start) + delta);
            item.maskedEnd = item.maskedStart + replacement32.size();
            item.operatorName = op.name();
            item.replacement = replacement;
            delta += static_cast<long long>(replacement32.size()) -
                     static_cast<long long>(span->length());

            result.items.push_back(std::move(item));
            replacements.push_back(std::move(replacement32));
        }

        // 3) write them in, right to left
        result.maskedText = text;
        for (size_t i = accepted.size(); i-- > 0;) {
            result.maskedText.replace(accepted[i]->start, accepted[i]->length(), replacements[i]);
        }

        if (!result.skippedSpanIds.empty()) {
            util::logger::warn("PlaceholderCodec: " + std::to_string(result.skippedSpanIds.size()) +
                               " overlapping span(s) not substituted");
        }
        return result;
    }

    /**
     * @brief Restore the original text from a masked text and its span records.
     *
     * Every span written by the counter operator is looked up in the mapping and
     * written back, from the highest masked offset to the lowest. Spans kept verbatim
     * (or replaced by a literal) are left alone, even if their text looks like a
     * placeholder. A span with no operator name is restored when its masked value is
     * a placeholder token.
     *
     * @throw MappingNotFound for an unknown entity type or placeholder.
     * @throw InvalidSpan if a span's masked range does not hold its placeholder.
     */
    static std::string Deanonymize(const std::string &maskedText,
                                   const std::vector<SpanRecord> &spans,
                                   const EntityMapping &mapping)
    {
        std::u32string text = util::utf8::decode(maskedText);

        std::vector<const SpanRecord*> ordered;
        for (const auto &span : spans) {
            if (restores(span)) {
                ordered.push_back(&span);
            }
        }
        std::sort(ordered.begin(), ordered.end(), [](const SpanRecord *a, const SpanRecord *b) {
            return a->maskedStart > b->maskedStart;
        });

        size_t limit = text.size();
        for (const SpanRecord *span : ordered) {
            const std::u32string token = util::utf8::decode(span->maskedEntityValue);
            if (span->maskedEnd > limit || span->maskedStart > span->maskedEnd ||
                text.compare(span->maskedStart, span->maskedEnd - span->maskedStart, token) != 0) {
                throw InvalidSpan("masked range [" + std::to_string(span->maskedStart) + "," +
                                  std::to_string(span->maskedEnd) + ") does not hold " +
                                  span->maskedEntityValue);
            }
            const std::string original = mapping.Deanonymize(span->maskedEntityValue, span->entityType);
            text.replace(span->maskedStart, span->maskedEnd - span->maskedStart,
                         util::utf8::decode(original));
            limit = span->maskedStart;
        }
        return util::utf8::encode(text);
    }

private:
    static bool restores(const SpanRecord &span)
    {
        if (!span.operatorName.empty()) {
            return span.operatorName == "counter";
        }
        return placeholder::isToken(span.maskedEntityValue);
    }

    OperatorTable m_table;
};

} // namespace core
} // namespace piiredactor

#endif // PIIREDACTOR_CORE_PLACEHOLDER_CODEC_HPP
