#ifndef PIIREDACTOR_CORE_SPAN_AGGREGATOR_HPP
#define PIIREDACTOR_CORE_SPAN_AGGREGATOR_HPP

#include <string>
#include <vector>
#include <set>
#include <map>
#include <utility>
#include <algorithm>
#include "core/span.hpp"
#include "util/utf8.hpp"
#include "util/logger.hpp"

namespace piiredactor {
namespace core {

/*
  SpanAggregator
  --------------------------------
  Merges the raw detections of every detector for one text unit into a single
  ordered, non-contained span set.

  Steps:
    0. reject malformed spans (empty range, past the end of the text, no entity type)
       and drop spans excluded by the filter (entity list, score threshold, allow-list)
    1. collapse identical (start, end) ranges, keeping the highest score
       (first seen on a tie)
    2. drop any span fully contained in a strictly longer one
    3. sort by (start, end) and number the survivors 0..n-1

  Partially overlapping spans, and equal-length spans over different ranges, all
  survive. The codec decides which of them is substituted.

  Never throws on bad spans.
*/

struct SpanFilter
{
    std::set<std::string> entities;   // empty = accept every entity type
    double scoreThreshold = 0.0;
    std::set<std::string> allowList;  // covered texts that are never treated as PII
};

struct AggregationResult
{
    std::vector<ResolvedSpan> spans;
    size_t rejected = 0;  // malformed
    size_t filtered = 0;  // well-formed but excluded by the filter
};

class SpanAggregator
{
public:
    SpanAggregator() = default;
    explicit SpanAggregator(SpanFilter filter) : m_filter(std::move(filter)) {}

    const SpanFilter& filter() const { return m_filter; }

    AggregationResult Aggregate(const std::u32string &text, const std::vector<RawSpan> &raw) const
    {
        AggregationResult result;

        std::vector<RawSpan> accepted;
        accepted.reserve(raw.size());
        for (const auto &span : raw) {
            if (!isWellFormed(span, text.size())) {
                ++result.rejected;
                continue;
            }
            if (!passesFilter(span, text)) {
                ++result.filtered;
                continue;
            }
            accepted.push_back(span);
        }

        std::vector<RawSpan> unique = deduplicate(accepted);
        std::vector<RawSpan> outer = dropContained(unique);

        std::stable_sort(outer.begin(), outer.end(), [](const RawSpan &a, const RawSpan &b) {
            if (a.start != b.start) return a.start < b.start;
            return a.end < b.end;
        });

        result.spans.reserve(outer.size());
        for (size_t i = 0; i < outer.size(); ++i) {
            ResolvedSpan rs;
            rs.spanId = i;
            rs.entityType = outer[i].entityType;
            rs.start = outer[i].start;
            rs.end = outer[i].end;
            rs.score = outer[i].score;
            rs.sourceId = outer[i].sourceId;
            result.spans.push_back(std::move(rs));
        }

        if (result.rejected > 0) {
            util::logger::warn("SpanAggregator: rejected " + std::to_string(result.rejected) +
                               " malformed span(s)");
        }
        util::logger::debug("SpanAggregator: " + std::to_string(raw.size()) + " raw -> " +
                            std::to_string(result.spans.size()) + " resolved (" +
                            std::to_string(result.filtered) + " filtered)");
        return result;
    }

private:
    static bool isWellFormed(const RawSpan &span, size_t textLength)
    {
        if (span.entityType.empty()) {
            util::logger::warn("SpanAggregator: span [" + std::to_string(span.start) + "," +
                               std::to_string(span.end) + ") has no entity type");
            return false;
        }
        if (span.start >= span.end || span.end > textLength) {
            util::logger::warn("SpanAggregator: " + span.entityType + " span [" +
                               std::to_string(span.start) + "," + std::to_string(span.end) +
                               ") invalid for text of length " + std::to_string(textLength));
            return false;
        }
        return true;
    }

    bool passesFilter(const RawSpan &span, const std::u32string &text) const
    {
        if (!m_filter.entities.empty() && m_filter.entities.count(span.entityType) == 0) {
            return false;
        }
        if (span.score < m_filter.scoreThreshold) {
            return false;
        }
        if (!m_filter.allowList.empty() &&
            m_filter.allowList.count(util::utf8::encode(text, span.start, span.end)) > 0) {
            return false;
        }
        return true;
    }

    static std::vector<RawSpan> deduplicate(const std::vector<RawSpan> &spans)
    {
        std::map<std::pair<size_t, size_t>, size_t> byRange;
        std::vector<RawSpan> unique;
        for (const auto &span : spans) {
            auto key = std::make_pair(span.start, span.end);
            auto it = byRange.find(key);
            if (it == byRange.end()) {
                byRange.emplace(key, unique.size());
                unique.push_back(span);
            } else if (span.score > unique[it->second].score) {
                unique[it->second] = span;
            }
        }
        return unique;
    }

    // Ranges are unique here, so "contains and strictly longer" is simply "contains".
    static std::vector<RawSpan> dropContained(const std::vector<RawSpan> &spans)
    {
        std::vector<RawSpan> kept;
        for (size_t i = 0; i < spans.size(); ++i) {
            bool contained = false;
            for (size_t j = 0; j < spans.size() && !contained; ++j) {
                if (i == j) continue;
                contained = spans[j].start <= spans[i].start &&
                            spans[j].end >= spans[i].end &&
                            spans[j].length() > spans[i].length();
            }
            if (!contained) {
                kept.push_back(spans[i]);
            }
        }
        return kept;
    }

    SpanFilter m_filter;
};

} // namespace core
} // namespace piiredactor

#endif // PIIREDACTOR_CORE_SPAN_AGGREGATOR_HPP
