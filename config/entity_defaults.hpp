#ifndef PIIREDACTOR_CONFIG_ENTITY_DEFAULTS_HPP
#define PIIREDACTOR_CONFIG_ENTITY_DEFAULTS_HPP

#include <string>
#include <vector>
#include <map>

/**
 * @file entity_defaults.hpp
 * @brief Entity type presets: which entity types are masked, and how, out of the box.
 *
 * Example usage:
 *  @code
 *    auto preset = piiredactor::config::getGreekDocumentPreset();
 *    for (const auto &type : preset.entities) { ... }
 *  @endcode
 */

namespace piiredactor {
namespace config {

/**
 * @struct EntityDefaults
 * @brief A named set of entity types with the operator applied to each.
 */
struct EntityDefaults
{
    // "greek_documents", "contact_details", ...
    std::string presetID;

    // The analyzer language the preset was built for.
    std::string language;

    // Entity types requested from detectors and accepted from them.
    std::vector<std::string> entities;

    // entity type -> operator descriptor (keep | placeholder | counter | replace:<value>).
    // The DEFAULT entry covers every type not listed.
    std::map<std::string, std::string> operators;
};

/**
 * @brief Names, places and financial/contact identifiers in Greek documents, each
 *        replaced by its type placeholder. Everything else is kept.
 */
inline EntityDefaults getGreekDocumentPreset()
{
    EntityDefaults ed;
    ed.presetID = "greek_documents";
    ed.language = "el";
    ed.entities = { "PERSON", "LOCATION", "IBAN_CODE", "CREDIT_CARD",
                    "PHONE_NUMBER", "EMAIL_ADDRESS" };
    for (const auto &type : ed.entities) {
        ed.operators[type] = "placeholder";
    }
    ed.operators["DEFAULT"] = "keep";
    return ed;
}

/**
 * @brief Only the pattern-detected contact and payment identifiers.
 */
inline EntityDefaults getContactDetailsPreset()
{
    EntityDefaults ed;
    ed.presetID = "contact_details";
    ed.language = "el";
    ed.entities = { "IBAN_CODE", "CREDIT_CARD", "PHONE_NUMBER", "EMAIL_ADDRESS" };
    for (const auto &type : ed.entities) {
        ed.operators[type] = "placeholder";
    }
    ed.operators["DEFAULT"] = "keep";
    return ed;
}

/**
 * @brief Look a preset up by its ID.
 * @return false if there is no such preset.
 */
inline bool findPreset(const std::string &presetID, EntityDefaults &out)
{
    if (presetID == "greek_documents") {
        out = getGreekDocumentPreset();
        return true;
    }
    if (presetID == "contact_details") {
        out = getContactDetailsPreset();
        return true;
    }
    return false;
}

} // namespace config
} // namespace piiredactor

#endif // PIIREDACTOR_CONFIG_ENTITY_DEFAULTS_HPP
