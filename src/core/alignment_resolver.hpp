#ifndef PIIREDACTOR_CORE_ALIGNMENT_RESOLVER_HPP
#define PIIREDACTOR_CORE_ALIGNMENT_RESOLVER_HPP

#include <string>
#include <vector>
#include <algorithm>
#include "core/entity_mapping.hpp"
#include "util/utf8.hpp"
#include "util/logger.hpp"

namespace piiredactor {
namespace core {

/*
  AlignmentResolver
  --------------------------------
  Recovers where each placeholder of a masked text came from in the original text,
  when the masked offsets no longer map 1:1 onto the original (index suffixes
  stripped, literal replacements of a different length, ...).

  For a placeholder at [maskStart, maskEnd):
    context   take up to contextWindow characters on each side, cut at the nearest
              other placeholder, find the "before" text in the original from the
              cursor on and the "after" text behind it; the entity is what lies
              between. An empty window only anchors at the matching text boundary.
    tokens    if a context is not found verbatim, use the last word of "before" and
              the first word of "after" instead and trim the whitespace between them.
    neither   the span comes back with resolved == false and a warning is logged.

  The cursor advances to the end of each resolved entity, so placeholders are
  matched in order. The method is heuristic: repeated text around an entity can
  anchor it at the wrong occurrence.
*/

struct PlaceholderOccurrence
{
    std::string entityType;
    size_t maskStart = 0;
    size_t maskEnd = 0;
};

enum class AlignmentStrategy {
    Context,
    Tokens,
    Unresolved
};

struct AlignedSpan
{
    std::string entityType;
    size_t maskStart = 0;
    size_t maskEnd = 0;
    bool resolved = false;
    size_t start = 0;   // valid only when resolved
    size_t end = 0;
    AlignmentStrategy strategy = AlignmentStrategy::Unresolved;
};

class AlignmentResolver
{
public:
    static constexpr size_t DEFAULT_CONTEXT_WINDOW = 20;

    explicit AlignmentResolver(size_t contextWindow = DEFAULT_CONTEXT_WINDOW)
        : contextWindow_(contextWindow)
    {
    }

    size_t contextWindow() const { return contextWindow_; }

    // Every {{...}} token of the masked text, in order.
    static std::vector<PlaceholderOccurrence> FindPlaceholders(const std::u32string &masked)
    {
        std::vector<PlaceholderOccurrence> found;
        size_t pos = 0;
        while ((pos = masked.find(U"{{", pos)) != std::u32string::npos) {
            size_t close = masked.find(U"}}", pos + 2);
            if (close == std::u32string::npos) {
                break;
            }
            // a "{{" inside the candidate means the earlier one was a stray brace pair
            size_t inner = masked.find(U"{{", pos + 2);
            if (inner != std::u32string::npos && inner < close) {
                pos = inner;
                continue;
            }
            PlaceholderOccurrence occ;
            occ.maskStart = pos;
            occ.maskEnd = close + 2;
            occ.entityType = placeholder::entityTypeOf(util::utf8::encode(masked, pos, close + 2));
            found.push_back(occ);
            pos = close + 2;
        }
        return found;
    }

    std::vector<AlignedSpan> Resolve(const std::u32string &original,
                                     const std::u32string &masked) const
    {
        return Resolve(original, masked, FindPlaceholders(masked));
    }

    /**
     * @brief Resolve explicit masked ranges. Occurrences are processed in order of
     *        maskStart; the result follows that order.
     */
    std::vector<AlignedSpan> Resolve(const std::u32string &original,
                                     const std::u32string &masked,
                                     std::vector<PlaceholderOccurrence> occurrences) const
    {
        std::stable_sort(occurrences.begin(), occurrences.end(),
                         [](const PlaceholderOccurrence &a, const PlaceholderOccurrence &b) {
                             return a.maskStart < b.maskStart;
                         });

        std::vector<AlignedSpan> out;
        out.reserve(occurrences.size());
        size_t cursor = 0;
        for (const auto &occ : occurrences) {
            AlignedSpan span;
            span.entityType = occ.entityType;
            span.maskStart = occ.maskStart;
            span.maskEnd = occ.maskEnd;

            if (occ.maskStart >= occ.maskEnd || occ.maskEnd > masked.size()) {
                util::logger::warn("AlignmentResolver: placeholder range [" +
                                   std::to_string(occ.maskStart) + "," + std::to_string(occ.maskEnd) +
                                   ") lies outside the masked text");
                out.push_back(span);
                continue;
            }

            const std::u32string before = beforeWindow(masked, occ.maskStart);
            const std::u32string after = afterWindow(masked, occ.maskEnd);
            const bool atStart = occ.maskStart == 0;
            const bool atEnd = occ.maskEnd == masked.size();

            if (anchorOnContext(original, before, after, atStart, atEnd, cursor, span.start, span.end)) {
                span.resolved = true;
                span.strategy = AlignmentStrategy::Context;
            } else if (anchorOnTokens(original, before, after, atStart, atEnd, cursor, span.start, span.end)) {
                span.resolved = true;
                span.strategy = AlignmentStrategy::Tokens;
            } else {
                util::logger::warn("AlignmentResolver: could not align " + occ.entityType +
                                   " placeholder at masked [" + std::to_string(occ.maskStart) + "," +
                                   std::to_string(occ.maskEnd) + ")");
            }

            if (span.resolved) {
                cursor = span.end;
            }
            out.push_back(span);
        }
        return out;
    }

private:
    std::u32string beforeWindow(const std::u32string &masked, size_t maskStart) const
    {
        size_t from = maskStart > contextWindow_ ? maskStart - contextWindow_ : 0;
        std::u32string window = masked.substr(from, maskStart - from);
        size_t close = window.rfind(U"}}");
        if (close != std::u32string::npos) {
            window.erase(0, close + 2);
        }
        return window;
    }

    std::u32string afterWindow(const std::u32string &masked, size_t maskEnd) const
    {
        std::u32string window = masked.substr(maskEnd, contextWindow_);
        size_t open = window.find(U"{{");
        if (open != std::u32string::npos) {
            window.erase(open);
        }
        return window;
    }

    static bool anchorOnContext(const std::u32string &original,
                                const std::u32string &before, const std::u32string &after,
                                bool atStart, bool atEnd, size_t cursor,
                                size_t &start, size_t &end)
    {
        size_t lo = 0;
        if (before.empty()) {
            if (!atStart) return false;
            lo = 0;
        } else {
            size_t pos = original.find(before, cursor);
            if (pos == std::u32string::npos) return false;
            lo = pos + before.size();
        }

        size_t hi = 0;
        if (after.empty()) {
            if (!atEnd) return false;
            hi = original.size();
        } else {
            // the entity is never empty, so "after" starts at least one character later
            size_t pos = original.find(after, lo + 1);
            if (pos == std::u32string::npos) return false;
            hi = pos;
        }

        if (hi <= lo) return false;
        start = lo;
        end = hi;
        return true;
    }

    static bool anchorOnTokens(const std::u32string &original,
                               const std::u32string &before, const std::u32string &after,
                               bool atStart, bool atEnd, size_t cursor,
                               size_t &start, size_t &end)
    {
        const std::vector<std::u32string> beforeTokens = util::utf8::splitWhitespace(before);
        const std::vector<std::u32string> afterTokens = util::utf8::splitWhitespace(after);

        size_t lo = 0;
        if (beforeTokens.empty()) {
            if (!atStart) return false;
        } else {
            const std::u32string &token = beforeTokens.back();
            size_t pos = original.find(token, cursor);
            if (pos == std::u32string::npos) return false;
            lo = pos + token.size();
        }

        size_t hi = original.size();
        if (afterTokens.empty()) {
            if (!atEnd) return false;
        } else {
            const std::u32string &token = afterTokens.front();
            size_t pos = original.find(token, lo);
            if (pos == std::u32string::npos) return false;
            hi = pos;
        }

        while (lo < hi && util::utf8::isSpace(original[lo])) ++lo;
        while (hi > lo && util::utf8::isSpace(original[hi - 1])) --hi;
        if (hi <= lo) return false;
        start = lo;
        end = hi;
        return true;
    }

    size_t contextWindow_;
};

} // namespace core
} // namespace piiredactor

#endif // PIIREDACTOR_CORE_ALIGNMENT_RESOLVER_HPP
