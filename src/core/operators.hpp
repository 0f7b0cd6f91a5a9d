#ifndef PIIREDACTOR_CORE_OPERATORS_HPP
#define PIIREDACTOR_CORE_OPERATORS_HPP

#include <string>
#include <map>
#include <memory>
#include <utility>
#include "core/entity_mapping.hpp"
#include "core/errors.hpp"

namespace piiredactor {
namespace core {

/*
  Operators
  --------------------------------
  An Operator decides what replaces one detected entity in the masked text.

    keep         leaves the text as is (the span is still reported)
    replace      a configured literal
    placeholder  {{ENTITY_TYPE}}, or a configured literal in its place
    counter      {{ENTITY_TYPE_INDEX}} through the session EntityMapping (reversible)

  OperatorTable selects an operator per entity type and falls back to the DEFAULT
  entry, which is keep unless configured otherwise.
*/

class Operator
{
public:
    virtual ~Operator() = default;

    virtual std::string name() const = 0;

    // Replacement text for originalValue. Only the counter operator touches the mapping.
    virtual std::string Apply(const std::string &originalValue,
                              const std::string &entityType,
                              EntityMapping &mapping) const = 0;
};

class KeepOperator : public Operator
{
public:
    std::string name() const override { return "keep"; }

    std::string Apply(const std::string &originalValue, const std::string &,
                      EntityMapping &) const override
    {
        return originalValue;
    }
};

class ReplaceOperator : public Operator
{
public:
    explicit ReplaceOperator(std::string newValue) : m_newValue(std::move(newValue)) {}

    std::string name() const override { return "replace"; }

    std::string Apply(const std::string &, const std::string &,
                      EntityMapping &) const override
    {
        return m_newValue;
    }

    const std::string& newValue() const { return m_newValue; }

private:
    std::string m_newValue;
};

class TypePlaceholderOperator : public Operator
{
public:
    TypePlaceholderOperator() = default;
    explicit TypePlaceholderOperator(std::string newValue) : m_newValue(std::move(newValue)) {}

    std::string name() const override { return "placeholder"; }

    std::string Apply(const std::string &, const std::string &entityType,
                      EntityMapping &) const override
    {
        if (!m_newValue.empty()) {
            return m_newValue;
        }
        return placeholder::typeToken(entityType);
    }

private:
    std::string m_newValue;
};

class CounterOperator : public Operator
{
public:
    std::string name() const override { return "counter"; }

    std::string Apply(const std::string &originalValue, const std::string &entityType,
                      EntityMapping &mapping) const override
    {
        return mapping.Anonymize(originalValue, entityType);
    }
};

class OperatorTable
{
public:
    static constexpr const char *DEFAULT_KEY = "DEFAULT";

    OperatorTable()
        : m_default(std::make_shared<KeepOperator>())
    {
    }

    /**
     * @brief Build an operator from its configuration text:
     *        keep | placeholder | counter | replace:<value>
     * @throw ConfigError on anything else.
     */
    static std::shared_ptr<const Operator> parse(const std::string &descriptor)
    {
        if (descriptor == "keep") {
            return std::make_shared<KeepOperator>();
        }
        if (descriptor == "placeholder") {
            return std::make_shared<TypePlaceholderOperator>();
        }
        if (descriptor == "counter") {
            return std::make_shared<CounterOperator>();
        }
        const std::string replacePrefix = "replace:";
        if (descriptor.compare(0, replacePrefix.size(), replacePrefix) == 0) {
            return std::make_shared<ReplaceOperator>(descriptor.substr(replacePrefix.size()));
        }
        throw ConfigError("unknown operator '" + descriptor + "'");
    }

    // entityType == DEFAULT replaces the fallback.
    void set(const std::string &entityType, std::shared_ptr<const Operator> op)
    {
        if (entityType == DEFAULT_KEY) {
            m_default = std::move(op);
        } else {
            m_byType[entityType] = std::move(op);
        }
    }

    const Operator& forEntity(const std::string &entityType) const
    {
        auto it = m_byType.find(entityType);
        if (it != m_byType.end()) {
            return *it->second;
        }
        return *m_default;
    }

    const Operator& defaultOperator() const { return *m_default; }

    /**
     * @brief The table used in reversible mode: every operator other than keep becomes
     *        counter, so each masked entity can be restored from the mapping.
     */
    OperatorTable reversible() const
    {
        std::shared_ptr<const Operator> counter = std::make_shared<CounterOperator>();
        OperatorTable out;
        out.m_default = isKeep(*m_default) ? m_default : counter;
        for (const auto &kv : m_byType) {
            out.m_byType[kv.first] = isKeep(*kv.second) ? kv.second : counter;
        }
        return out;
    }

private:
    static bool isKeep(const Operator &op) { return op.name() == "keep"; }

    std::map<std::string, std::shared_ptr<const Operator>> m_byType;
    std::shared_ptr<const Operator> m_default;
};

} // namespace core
} // namespace piiredactor

#endif // PIIREDACTOR_CORE_OPERATORS_HPP
