#ifndef PIIREDACTOR_CONFIG_PIPELINE_CONFIG_HPP
#define PIIREDACTOR_CONFIG_PIPELINE_CONFIG_HPP

#include <string>
#include <set>
#include <map>
#include <cstdint>
#include "entity_defaults.hpp"

/**
 * @file pipeline_config.hpp
 * @brief Configuration of one redactor instance: masking mode, entity selection,
 *        operators, alignment and the external collaborators.
 *
 * USAGE:
 *   - Populate manually or through config_parser.hpp.
 *   - Pass to ParagraphPipeline / AnonymizationService at construction.
 */

namespace piiredactor {
namespace config {

/**
 * @brief What the pipeline does when resolved spans and substitutions disagree.
 */
enum class MismatchPolicy {
    Realign,     ///< keep substituted spans, re-locate unpaired items, drop the rest
    DropSpans,   ///< keep the masked text, report no spans
    Fail         ///< throw SpanCorrespondenceMismatch
};

inline std::string toString(MismatchPolicy policy)
{
    switch (policy) {
    case MismatchPolicy::Realign:   return "realign";
    case MismatchPolicy::DropSpans: return "drop_spans";
    case MismatchPolicy::Fail:      return "fail";
    }
    return "realign";
}

/**
 * @struct PipelineConfig
 * @brief Holds the settings of a redactor instance. Defaults follow the
 *        greek_documents preset (see entity_defaults.hpp).
 */
struct PipelineConfig
{
    /**
     * @brief Construct a new PipelineConfig with defaults:
     *   reversible = false, shareMapping = false
     *   entities/operators from the greek_documents preset
     *   scoreThreshold = 0, mismatchPolicy = realign, contextWindow = 20
     *   workerThreads = 1, logLevel = INFO
     *   detectorLanguage = "el", detectorTimeoutSeconds = 30
     *   resultStorePath = "./pii_redactor_results.db"
     */
    PipelineConfig()
        : reversible(false),
          shareMapping(false),
          scoreThreshold(0.0),
          mismatchPolicy(MismatchPolicy::Realign),
          contextWindow(20),
          workerThreads(1),
          logLevel("INFO"),
          detectorTimeoutSeconds(30),
          resultStorePath("./pii_redactor_results.db")
    {
        applyPreset(getGreekDocumentPreset());
    }

    /// Replace the entity list and operator table with a preset's.
    void applyPreset(const EntityDefaults &preset)
    {
        entities.clear();
        entities.insert(preset.entities.begin(), preset.entities.end());
        operators = preset.operators;
        detectorLanguage = preset.language;
    }

    /// Counter placeholders plus an entity mapping in every record.
    bool reversible;

    /// One mapping for the whole text instead of one per paragraph.
    bool shareMapping;

    /// Entity types to mask. Empty accepts every type a detector reports.
    std::set<std::string> entities;

    /// Spans scoring below this are ignored.
    double scoreThreshold;

    /// Exact texts never treated as PII.
    std::set<std::string> allowList;

    /// entity type (or DEFAULT) -> operator descriptor.
    std::map<std::string, std::string> operators;

    MismatchPolicy mismatchPolicy;

    /// Characters of literal context used on each side when aligning placeholders.
    uint32_t contextWindow;

    /// Paragraph worker threads. Values above 1 only apply without shareMapping.
    uint32_t workerThreads;

    std::string logLevel;

    /// Empty = console only.
    std::string logFile;

    /// Analyzer base URL for RemoteDetector; empty disables it.
    std::string detectorUrl;

    std::string detectorLanguage;

    uint32_t detectorTimeoutSeconds;

    /// SQLite file for anonymization job results.
    std::string resultStorePath;
};

} // namespace config
} // namespace piiredactor

#endif // PIIREDACTOR_CONFIG_PIPELINE_CONFIG_HPP
