#ifndef PIIREDACTOR_CORE_DETECTOR_HPP
#define PIIREDACTOR_CORE_DETECTOR_HPP

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <utility>
#include "core/span.hpp"

namespace piiredactor {
namespace core {

/*
  Detector
  --------------------------------
  Anything that reports RawSpans for a text unit. Detectors are called from worker
  threads when paragraphs run in parallel, so Detect() must be safe to call
  concurrently. Failures are reported by throwing DetectorError.
*/
class Detector
{
public:
    virtual ~Detector() = default;

    virtual std::string id() const = 0;

    // Offsets in the returned spans are code point indices into text.
    virtual std::vector<RawSpan> Detect(const std::string &text) const = 0;
};

// Wraps a function, e.g. an in-process recognizer.
class CallbackDetector : public Detector
{
public:
    using Callback = std::function<std::vector<RawSpan>(const std::string &)>;

    CallbackDetector(std::string id, Callback callback)
        : m_id(std::move(id)), m_callback(std::move(callback))
    {
    }

    std::string id() const override { return m_id; }

    std::vector<RawSpan> Detect(const std::string &text) const override
    {
        return m_callback(text);
    }

private:
    std::string m_id;
    Callback m_callback;
};

// Replays spans recorded for known texts; unknown texts yield no spans.
class StaticSpanDetector : public Detector
{
public:
    explicit StaticSpanDetector(std::string id = "static")
        : m_id(std::move(id))
    {
    }

    void add(const std::string &text, std::vector<RawSpan> spans)
    {
        auto &slot = m_spans[text];
        slot.insert(slot.end(), spans.begin(), spans.end());
    }

    std::string id() const override { return m_id; }

    std::vector<RawSpan> Detect(const std::string &text) const override
    {
        auto it = m_spans.find(text);
        if (it == m_spans.end()) {
            return {};
        }
        return it->second;
    }

private:
    std::string m_id;
    std::map<std::string, std::vector<RawSpan>> m_spans;
};

} // namespace core
} // namespace piiredactor

#endif // PIIREDACTOR_CORE_DETECTOR_HPP
