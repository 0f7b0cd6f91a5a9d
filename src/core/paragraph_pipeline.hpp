#ifndef PIIREDACTOR_CORE_PARAGRAPH_PIPELINE_HPP
#define PIIREDACTOR_CORE_PARAGRAPH_PIPELINE_HPP

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <future>
#include <algorithm>
#include <utility>
#include "config/pipeline_config.hpp"
#include "core/span.hpp"
#include "core/errors.hpp"
#include "core/detector.hpp"
#include "core/span_aggregator.hpp"
#include "core/operators.hpp"
#include "core/placeholder_codec.hpp"
#include "core/alignment_resolver.hpp"
#include "core/anonymization_record.hpp"
#include "util/utf8.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"
#include "util/thread_pool.hpp"

/**
 * @file paragraph_pipeline.hpp
 * @brief Runs detection, aggregation and substitution over every paragraph of a text.
 *
 * DESIGN GOALS:
 *   - A text is split on '\n' (a trailing '\r' is dropped); blank paragraphs are skipped
 *     and produce no record.
 *   - Each paragraph yields one AnonymizationRecord, in paragraph order.
 *   - Resolved spans and substitutions are paired by span id. A span left without a
 *     substitution is handled by the configured MismatchPolicy.
 *   - The entity mapping is scoped to a paragraph unless shareMapping is set. Without a
 *     shared mapping, paragraphs may run on a ThreadPool (workerThreads > 1).
 *
 * USAGE:
 *   @code
 *   piiredactor::config::PipelineConfig cfg;
 *   cfg.reversible = true;
 *   auto detector = std::make_shared<piiredactor::detectors::RemoteDetector>(...);
 *   piiredactor::core::ParagraphPipeline pipeline(cfg, {detector});
 *
 *   auto records = pipeline.Anonymize(text);
 *   std::string restored = ParagraphPipeline::Deanonymize(records[0]);
 *   @endcode
 */

namespace piiredactor {
namespace core {

/**
 * @brief Operator table described by a config: one entry per configured entity type
 *        plus DEFAULT, turned into counters in reversible mode.
 * @throw ConfigError on an unknown operator.
 */
inline OperatorTable buildOperatorTable(const config::PipelineConfig &cfg)
{
    OperatorTable table;
    for (const auto &kv : cfg.operators) {
        table.set(kv.first, OperatorTable::parse(kv.second));
    }
    return cfg.reversible ? table.reversible() : table;
}

inline SpanFilter buildSpanFilter(const config::PipelineConfig &cfg)
{
    SpanFilter filter;
    filter.entities = cfg.entities;
    filter.scoreThreshold = cfg.scoreThreshold;
    filter.allowList = cfg.allowList;
    return filter;
}

class ParagraphPipeline
{
public:
    ParagraphPipeline(const config::PipelineConfig &cfg,
                      std::vector<std::shared_ptr<const Detector>> detectors = {})
        : m_config(cfg),
          m_detectors(std::move(detectors)),
          m_aggregator(buildSpanFilter(cfg)),
          m_codec(buildOperatorTable(cfg)),
          m_resolver(cfg.contextWindow)
    {
    }

    const config::PipelineConfig& pipelineConfig() const { return m_config; }

    /**
     * @brief Non-blank lines of text, in order, without a trailing '\r'.
     * @throw TextEncodingError if text is not valid UTF-8.
     */
    static std::vector<std::string> SplitParagraphs(const std::string &text)
    {
        std::vector<std::string> paragraphs;
        size_t begin = 0;
        while (begin <= text.size()) {
            size_t nl = text.find('\n', begin);
            if (nl == std::string::npos) {
                nl = text.size();
            }
            std::string line = text.substr(begin, nl - begin);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!util::utf8::isBlank(util::utf8::decode(line))) {
                paragraphs.push_back(line);
            }
            begin = nl + 1;
        }
        return paragraphs;
    }

    /**
     * @brief Anonymize a text, running the configured detectors on each paragraph.
     */
    std::vector<AnonymizationRecord> Anonymize(const std::string &text) const
    {
        return run(text, nullptr);
    }

    /**
     * @brief Anonymize a text with caller-supplied spans, keyed by paragraph index
     *        (the index among the non-blank paragraphs). Detectors are not called.
     */
    std::vector<AnonymizationRecord> AnonymizeWithSpans(
        const std::string &text,
        const std::map<size_t, std::vector<RawSpan>> &spansByParagraph) const
    {
        return run(text, &spansByParagraph);
    }

    /**
     * @brief Aggregate, substitute and check one paragraph.
     * @param mapping session mapping; extended in reversible mode
     * @throw SpanCorrespondenceMismatch under MismatchPolicy::Fail
     * @throw TextEncodingError if paragraph is not valid UTF-8
     */
    AnonymizationRecord AnonymizeParagraph(const std::string &paragraph,
                                           const std::vector<RawSpan> &raw,
                                           EntityMapping &mapping,
                                           size_t paragraphIndex = 0) const
    {
        AnonymizationRecord record;
        record.paragraphIndex = paragraphIndex;
        record.fullText = paragraph;
        record.reversible = m_config.reversible;

        const std::u32string text = util::utf8::decode(paragraph);
        AggregationResult aggregated = m_aggregator.Aggregate(text, raw);
        if (aggregated.rejected > 0) {
            record.warnings.push_back(std::to_string(aggregated.rejected) +
                                      " malformed span(s) rejected");
        }

        SubstitutionResult substituted = m_codec.Substitute(text, aggregated.spans, mapping);
        record.maskedText = util::utf8::encode(substituted.maskedText);

        std::map<size_t, const ResolvedSpan*> spansById;
        for (const auto &span : aggregated.spans) {
            spansById[span.spanId] = &span;
        }
        std::map<size_t, const SubstitutionItem*> itemsById;
        for (const auto &item : substituted.items) {
            itemsById[item.spanId] = &item;
        }

        std::vector<const ResolvedSpan*> unsubstituted;
        for (const auto &span : aggregated.spans) {
            if (itemsById.count(span.spanId) == 0) {
                unsubstituted.push_back(&span);
            }
        }
        size_t orphanItems = 0;
        for (const auto &item : substituted.items) {
            if (spansById.count(item.spanId) == 0) {
                ++orphanItems;
            }
        }

        if (unsubstituted.empty() && orphanItems == 0) {
            for (const auto &item : substituted.items) {
                record.spans.push_back(makeSpanRecord(text, item, item.originalStart, item.originalEnd,
                                                      spansById[item.spanId]->score));
            }
            record.status = RecordStatus::Complete;
        } else {
            handleMismatch(text, substituted, aggregated.spans, spansById, unsubstituted, record);
        }

        if (m_config.reversible) {
            record.mapping = mapping;
        }

        util::logger::info("ParagraphPipeline: paragraph " + std::to_string(paragraphIndex) + " [" +
                           util::hashing::fingerprint(paragraph) + "] " +
                           std::to_string(record.spans.size()) + " span(s), " + toString(record.status));
        return record;
    }

    /**
     * @brief Restore the original paragraph of a reversible record.
     * @throw MappingNotFound, InvalidSpan
     */
    static std::string Deanonymize(const AnonymizationRecord &record)
    {
        return PlaceholderCodec::Deanonymize(record.maskedText, record.spans, record.mapping);
    }

private:
    std::vector<AnonymizationRecord> run(const std::string &text,
                                         const std::map<size_t, std::vector<RawSpan>> *supplied) const
    {
        const std::vector<std::string> paragraphs = SplitParagraphs(text);
        util::logger::info("ParagraphPipeline: session [" + util::hashing::fingerprint(text) + "] " +
                           std::to_string(paragraphs.size()) + " paragraph(s)");

        std::vector<AnonymizationRecord> records;
        records.reserve(paragraphs.size());

        if (m_config.workerThreads > 1 && !m_config.shareMapping && paragraphs.size() > 1) {
            util::ThreadPool pool(std::min<size_t>(m_config.workerThreads, paragraphs.size()));
            std::vector<std::future<AnonymizationRecord>> pending;
            pending.reserve(paragraphs.size());
            for (size_t i = 0; i < paragraphs.size(); ++i) {
                pending.push_back(pool.enqueue([this, &paragraphs, supplied, i]() {
                    EntityMapping mapping;
                    return processParagraph(paragraphs[i], i, supplied, mapping);
                }));
            }
            // get() rethrows whatever the task threw
            for (auto &f : pending) {
                records.push_back(f.get());
            }
            return records;
        }

        EntityMapping shared;
        for (size_t i = 0; i < paragraphs.size(); ++i) {
            if (m_config.shareMapping) {
                records.push_back(processParagraph(paragraphs[i], i, supplied, shared));
            } else {
                EntityMapping mapping;
                records.push_back(processParagraph(paragraphs[i], i, supplied, mapping));
            }
        }
        return records;
    }

    AnonymizationRecord processParagraph(const std::string &paragraph, size_t index,
                                         const std::map<size_t, std::vector<RawSpan>> *supplied,
                                         EntityMapping &mapping) const
    {
        util::logger::Scope scope("paragraph " + std::to_string(index));
        if (supplied) {
            auto it = supplied->find(index);
            static const std::vector<RawSpan> none;
            return AnonymizeParagraph(paragraph, it == supplied->end() ? none : it->second, mapping, index);
        }

        std::vector<RawSpan> raw;
        for (const auto &detector : m_detectors) {
            std::vector<RawSpan> found;
            try {
                found = detector->Detect(paragraph);
            } catch (const DetectorError &ex) {
                util::logger::warn("ParagraphPipeline: detector '" + detector->id() +
                                   "' failed on paragraph " + std::to_string(index) + ": " + ex.what());
                AnonymizationRecord record;
                record.paragraphIndex = index;
                record.fullText = paragraph;
                record.maskedText = paragraph;
                record.status = RecordStatus::DetectorFailed;
                record.reversible = m_config.reversible;
                record.warnings.push_back("detector '" + detector->id() + "' failed: " + ex.what());
                if (m_config.reversible) {
                    record.mapping = mapping;
                }
                return record;
            }
            for (auto &span : found) {
                if (span.sourceId.empty()) {
                    span.sourceId = detector->id();
                }
                raw.push_back(std::move(span));
            }
        }
        return AnonymizeParagraph(paragraph, raw, mapping, index);
    }

    static SpanRecord makeSpanRecord(const std::u32string &text, const SubstitutionItem &item,
                                     size_t start, size_t end, double score)
    {
        SpanRecord rec;
        rec.spanId = item.spanId;
        rec.entityType = item.entityType;
        rec.entityValue = util::utf8::encode(text, start, end);
        rec.start = start;
        rec.end = end;
        rec.maskedEntityValue = item.replacement;
        rec.maskedStart = item.maskedStart;
        rec.maskedEnd = item.maskedEnd;
        rec.operatorName = item.operatorName;
        rec.score = score;
        return rec;
    }

    void handleMismatch(const std::u32string &text,
                        const SubstitutionResult &substituted,
                        const std::vector<ResolvedSpan> &resolved,
                        std::map<size_t, const ResolvedSpan*> &spansById,
                        const std::vector<const ResolvedSpan*> &unsubstituted,
                        AnonymizationRecord &record) const
    {
        const std::string summary = std::to_string(resolved.size()) + " resolved span(s) vs " +
                                    std::to_string(substituted.items.size()) + " substitution(s)";

        switch (m_config.mismatchPolicy) {
        case config::MismatchPolicy::Fail:
            util::logger::error("ParagraphPipeline: span correspondence mismatch, " + summary);
            throw SpanCorrespondenceMismatch(resolved.size(), substituted.items.size());

        case config::MismatchPolicy::DropSpans:
            util::logger::warn("ParagraphPipeline: span correspondence mismatch, " + summary +
                               "; dropping spans of paragraph " + std::to_string(record.paragraphIndex));
            record.spans.clear();
            record.status = RecordStatus::SpansDropped;
            record.warnings.push_back("span correspondence mismatch (" + summary + "); spans dropped");
            return;

        case config::MismatchPolicy::Realign:
            break;
        }

        util::logger::warn("ParagraphPipeline: span correspondence mismatch, " + summary +
                           "; re-aligning paragraph " + std::to_string(record.paragraphIndex));
        record.warnings.push_back("span correspondence mismatch (" + summary + "); spans re-aligned");

        // An item paired with its resolved span by id carries exact offsets. Only an
        // item without one needs its original range recovered from the masked text.
        std::vector<const SubstitutionItem*> unpaired;
        for (const auto &item : substituted.items) {
            auto it = spansById.find(item.spanId);
            if (it != spansById.end()) {
                record.spans.push_back(makeSpanRecord(text, item, item.originalStart, item.originalEnd,
                                                      it->second->score));
            } else {
                unpaired.push_back(&item);
            }
        }

        if (!unpaired.empty()) {
            std::vector<PlaceholderOccurrence> occurrences;
            occurrences.reserve(unpaired.size());
            for (const SubstitutionItem *item : unpaired) {
                PlaceholderOccurrence occ;
                occ.entityType = item->entityType;
                occ.maskStart = item->maskedStart;
                occ.maskEnd = item->maskedEnd;
                occurrences.push_back(occ);
            }

            // unpaired is in masked order, so aligned[i] belongs to unpaired[i]
            const std::vector<AlignedSpan> aligned =
                m_resolver.Resolve(text, substituted.maskedText, occurrences);
            for (size_t i = 0; i < aligned.size(); ++i) {
                const SubstitutionItem &item = *unpaired[i];
                if (aligned[i].resolved) {
                    record.spans.push_back(makeSpanRecord(text, item, aligned[i].start, aligned[i].end, 0.0));
                } else if (item.operatorName == "counter") {
                    // its placeholder is in the mapping and must stay restorable
                    record.spans.push_back(makeSpanRecord(text, item, item.originalStart, item.originalEnd, 0.0));
                    record.warnings.push_back("span " + std::to_string(item.spanId) + " (" + item.entityType +
                                              ") could not be re-aligned; kept at its substitution offsets");
                } else {
                    record.warnings.push_back("span " + std::to_string(item.spanId) + " (" + item.entityType +
                                              ") could not be re-aligned; dropped");
                }
            }
            std::sort(record.spans.begin(), record.spans.end(), [](const SpanRecord &a, const SpanRecord &b) {
                return a.maskedStart < b.maskedStart;
            });
        }

        for (const ResolvedSpan *span : unsubstituted) {
            record.warnings.push_back("span " + std::to_string(span->spanId) + " (" + span->entityType +
                                      ") was not substituted; dropped");
        }
        record.status = RecordStatus::Realigned;
    }

    config::PipelineConfig m_config;
    std::vector<std::shared_ptr<const Detector>> m_detectors;
    SpanAggregator m_aggregator;
    PlaceholderCodec m_codec;
    AlignmentResolver m_resolver;
};

} // namespace core
} // namespace piiredactor

#endif // PIIREDACTOR_CORE_PARAGRAPH_PIPELINE_HPP
