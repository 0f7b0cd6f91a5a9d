#ifndef PIIREDACTOR_CORE_ENTITY_MAPPING_HPP
#define PIIREDACTOR_CORE_ENTITY_MAPPING_HPP

#include <string>
#include <map>
#include <cctype>
#include <cstdint>
#include "core/errors.hpp"
#include "util/json.hpp"

/**
 * @file entity_mapping.hpp
 * @brief Placeholder token formatting and the per-session EntityMapping table.
 *
 * A mapping holds, for every entity type, original value -> placeholder. It is
 * append-only: entries are added by Anonymize() and never removed, so a value seen
 * twice always gets the same token and two different values never share one.
 *
 * USAGE:
 *   @code
 *   piiredactor::core::EntityMapping mapping;
 *   mapping.Anonymize("Γιάννης", "PERSON");   // {{PERSON_0}}
 *   mapping.Anonymize("Μαρία", "PERSON");     // {{PERSON_1}}
 *   mapping.Anonymize("Γιάννης", "PERSON");   // {{PERSON_0}} again
 *   mapping.Deanonymize("{{PERSON_1}}", "PERSON"); // "Μαρία"
 *   @endcode
 *
 * A mapping lives for one anonymization session and is never written to durable storage.
 */

namespace piiredactor {
namespace core {

namespace placeholder {

// {{PERSON}}
inline std::string typeToken(const std::string &entityType)
{
    return "{{" + entityType + "}}";
}

// {{PERSON_3}}
inline std::string indexedToken(const std::string &entityType, uint64_t index)
{
    return "{{" + entityType + "_" + std::to_string(index) + "}}";
}

inline bool isToken(const std::string &value)
{
    if (value.size() < 5 || value.compare(0, 2, "{{") != 0 ||
        value.compare(value.size() - 2, 2, "}}") != 0) {
        return false;
    }
    const std::string inner = value.substr(2, value.size() - 4);
    return inner.find('{') == std::string::npos && inner.find('}') == std::string::npos;
}

/**
 * @brief Parse the INDEX suffix of {{TYPE_INDEX}} for the given type.
 * @return false if the token is not an indexed token of that type, or the index has
 *         leading zeros.
 */
inline bool parseIndex(const std::string &token, const std::string &entityType, uint64_t &index)
{
    const std::string prefix = "{{" + entityType + "_";
    if (token.size() <= prefix.size() + 2 || token.compare(0, prefix.size(), prefix) != 0 ||
        token.compare(token.size() - 2, 2, "}}") != 0) {
        return false;
    }
    const std::string digits = token.substr(prefix.size(), token.size() - prefix.size() - 2);
    if (digits.empty() || digits.size() > 18 || (digits.size() > 1 && digits[0] == '0')) {
        return false;
    }
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    index = std::stoull(digits);
    return true;
}

// Entity type named by a token: {{PERSON_3}} -> PERSON, {{IBAN_CODE}} -> IBAN_CODE.
inline std::string entityTypeOf(const std::string &token)
{
    if (!isToken(token)) {
        return "";
    }
    std::string inner = token.substr(2, token.size() - 4);
    auto pos = inner.find_last_of('_');
    if (pos != std::string::npos && pos + 1 < inner.size()) {
        bool numeric = true;
        for (size_t i = pos + 1; i < inner.size(); ++i) {
            numeric = numeric && std::isdigit(static_cast<unsigned char>(inner[i]));
        }
        if (numeric) {
            inner.erase(pos);
        }
    }
    return inner;
}

} // namespace placeholder

class EntityMapping
{
public:
    using ValueMap = std::map<std::string, std::string>;  // original value -> placeholder

    /**
     * @brief Return the placeholder for (originalValue, entityType), assigning
     *        {{TYPE_n}} with n = max existing index + 1 (0 for a new type) on first sight.
     */
    std::string Anonymize(const std::string &originalValue, const std::string &entityType)
    {
        auto typeIt = m_entries.find(entityType);
        if (typeIt == m_entries.end()) {
            std::string token = placeholder::indexedToken(entityType, 0);
            m_entries[entityType][originalValue] = token;
            return token;
        }

        ValueMap &values = typeIt->second;
        auto valueIt = values.find(originalValue);
        if (valueIt != values.end()) {
            return valueIt->second;
        }

        uint64_t next = 0;
        for (const auto &kv : values) {
            uint64_t idx = 0;
            if (placeholder::parseIndex(kv.second, entityType, idx) && idx + 1 > next) {
                next = idx + 1;
            }
        }
        std::string token = placeholder::indexedToken(entityType, next);
        values[originalValue] = token;
        return token;
    }

    /**
     * @brief Reverse lookup of a placeholder under an entity type.
     * @throw MappingNotFound if the type or the placeholder is unknown.
     */
    std::string Deanonymize(const std::string &placeholderValue, const std::string &entityType) const
    {
        auto typeIt = m_entries.find(entityType);
        if (typeIt == m_entries.end()) {
            throw MappingNotFound(entityType, "");
        }
        for (const auto &kv : typeIt->second) {
            if (kv.second == placeholderValue) {
                return kv.first;
            }
        }
        throw MappingNotFound(entityType, placeholderValue);
    }

    bool empty() const { return m_entries.empty(); }

    size_t size() const
    {
        size_t n = 0;
        for (const auto &kv : m_entries) {
            n += kv.second.size();
        }
        return n;
    }

    const std::map<std::string, ValueMap>& entries() const { return m_entries; }

    // {"PERSON": {"Γιάννης": "{{PERSON_0}}"}, ...}
    util::json::JsonValue toJson() const
    {
        util::json::JsonValue out = util::json::JsonValue::object();
        for (const auto &typeKv : m_entries) {
            util::json::JsonValue values = util::json::JsonValue::object();
            for (const auto &kv : typeKv.second) {
                values.set(kv.first, kv.second);
            }
            out.set(typeKv.first, values);
        }
        return out;
    }

    /**
     * @brief Rebuild a mapping from its JSON form (e.g. the entity_mapping of a saved record).
     * @throw InvalidSpan if the structure is not an object of string objects.
     */
    static EntityMapping fromJson(const util::json::JsonValue &json)
    {
        if (!json.isObject()) {
            throw InvalidSpan("entity_mapping must be a JSON object");
        }
        EntityMapping mapping;
        for (const auto &typeKv : json.members()) {
            if (!typeKv.second.isObject()) {
                throw InvalidSpan("entity_mapping['" + typeKv.first + "'] must be an object");
            }
            ValueMap &values = mapping.m_entries[typeKv.first];
            for (const auto &kv : typeKv.second.members()) {
                if (!kv.second.isString()) {
                    throw InvalidSpan("entity_mapping['" + typeKv.first + "'] holds a non-string placeholder");
                }
                values[kv.first] = kv.second.asString();
            }
        }
        return mapping;
    }

private:
    std::map<std::string, ValueMap> m_entries;
};

} // namespace core
} // namespace piiredactor

#endif // PIIREDACTOR_CORE_ENTITY_MAPPING_HPP
