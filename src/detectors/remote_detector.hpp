#ifndef PIIREDACTOR_REMOTE_DETECTOR_HPP
#define PIIREDACTOR_REMOTE_DETECTOR_HPP

#include <string>
#include <vector>
#include <set>
#include "core/detector.hpp"
#include "core/span.hpp"

namespace piiredactor {
namespace detectors {

/*
  RemoteDetector
  --------------------------------------------------------
  A Detector backed by an analyzer service reachable over HTTP.

  Request:   POST <baseUrl>/analyze
             {"text": "...", "language": "el", "entities": ["PERSON", ...]}
  Response:  [{"entity_type": "PERSON", "start": 0, "end": 7, "score": 0.85}, ...]

  Offsets in the response are code point indices, as everywhere else.
  Any transport error, non-2xx status or unparseable body throws DetectorError.
  Each Detect() call uses its own curl handle, so one instance may be shared by
  paragraph workers.

  Requires libcurl.
*/
class RemoteDetector : public core::Detector {
  public:
    RemoteDetector(const std::string& baseUrl,
                   const std::string& language = "el",
                   std::set<std::string> entities = {},
                   long timeoutSeconds = 30);

    std::string id() const override { return "remote:" + m_baseUrl; }

    std::vector<core::RawSpan> Detect(const std::string& text) const override;

    const std::string& endpoint() const { return m_endpoint; }

    // JSON body sent for text.
    std::string BuildRequestBody(const std::string& text) const;

    // Parse an analyzer response body. sourceId is stamped on every span.
    static std::vector<core::RawSpan> ParseResponse(const std::string& body,
                                                    const std::string& sourceId);

  private:
    std::string post(const std::string& body) const;

    std::string m_baseUrl;
    std::string m_endpoint;
    std::string m_language;
    std::set<std::string> m_entities;
    long m_timeoutSeconds;
};

} // namespace detectors
} // namespace piiredactor

#endif // PIIREDACTOR_REMOTE_DETECTOR_HPP
