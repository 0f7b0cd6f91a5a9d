#ifndef PIIREDACTOR_TEST_UNIT_TEST_PLACEHOLDER_CODEC_HPP
#define PIIREDACTOR_TEST_UNIT_TEST_PLACEHOLDER_CODEC_HPP

#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <vector>
#include "core/entity_mapping.hpp"
#include "core/errors.hpp"
#include "core/operators.hpp"
#include "core/placeholder_codec.hpp"
#include "test_helpers.hpp"

namespace {

using piiredactor::core::CounterOperator;
using piiredactor::core::EntityMapping;
using piiredactor::core::OperatorTable;
using piiredactor::core::PlaceholderCodec;
using piiredactor::core::ReplaceOperator;
using piiredactor::core::ResolvedSpan;
using piiredactor::core::SubstitutionResult;
using piiredactor::core::TypePlaceholderOperator;
using piiredactor::test::resolvedOf;
using piiredactor::test::spanOf;
namespace utf8 = piiredactor::util::utf8;

OperatorTable counterTable() {
    OperatorTable table;
    table.set("PERSON", std::make_shared<CounterOperator>());
    table.set("LOCATION", std::make_shared<CounterOperator>());
    return table;
}

std::vector<ResolvedSpan> resolvedAll(const std::vector<piiredactor::core::RawSpan>& raw) {
    std::vector<ResolvedSpan> out;
    for (size_t i = 0; i < raw.size(); ++i) {
        out.push_back(resolvedOf(i, raw[i]));
    }
    return out;
}

TEST(EntityMappingTest, SameValueSameToken) {
    EntityMapping mapping;
    EXPECT_EQ(mapping.Anonymize("Γιάννης", "PERSON"), "{{PERSON_0}}");
    EXPECT_EQ(mapping.Anonymize("Μαρία", "PERSON"), "{{PERSON_1}}");
    EXPECT_EQ(mapping.Anonymize("Γιάννης", "PERSON"), "{{PERSON_0}}");
    EXPECT_EQ(mapping.Anonymize("Αθήνα", "LOCATION"), "{{LOCATION_0}}");
    EXPECT_EQ(mapping.size(), (size_t)3);
    EXPECT_EQ(mapping.Deanonymize("{{PERSON_1}}", "PERSON"), "Μαρία");
}

TEST(EntityMappingTest, NextIndexFollowsHighestExisting) {
    auto json = piiredactor::util::json::parse(
        "{\"PERSON\": {\"Γιάννης\": \"{{PERSON_0}}\", \"Νίκος\": \"{{PERSON_4}}\"}}");
    EntityMapping mapping = EntityMapping::fromJson(json);
    EXPECT_EQ(mapping.Anonymize("Ελένη", "PERSON"), "{{PERSON_5}}");
}

TEST(EntityMappingTest, UnknownTypeOrPlaceholderThrows) {
    EntityMapping mapping;
    mapping.Anonymize("Γιάννης", "PERSON");
    try {
        mapping.Deanonymize("{{LOCATION_0}}", "LOCATION");
        FAIL() << "expected MappingNotFound";
    } catch (const piiredactor::MappingNotFound& ex) {
        EXPECT_EQ(ex.entityType(), "LOCATION");
        EXPECT_TRUE(ex.placeholder().empty());
    }
    try {
        mapping.Deanonymize("{{PERSON_7}}", "PERSON");
        FAIL() << "expected MappingNotFound";
    } catch (const piiredactor::MappingNotFound& ex) {
        EXPECT_EQ(ex.placeholder(), "{{PERSON_7}}");
    }
}

TEST(EntityMappingTest, MalformedJsonMappingRejected) {
    EXPECT_THROW(EntityMapping::fromJson(piiredactor::util::json::parse("[1,2]")), piiredactor::InvalidSpan);
    EXPECT_THROW(EntityMapping::fromJson(piiredactor::util::json::parse("{\"PERSON\": {\"a\": 3}}")),
                 piiredactor::InvalidSpan);
}

TEST(PlaceholderTokenTest, TypeOfToken) {
    namespace placeholder = piiredactor::core::placeholder;
    EXPECT_EQ(placeholder::entityTypeOf("{{PERSON_3}}"), "PERSON");
    EXPECT_EQ(placeholder::entityTypeOf("{{IBAN_CODE}}"), "IBAN_CODE");
    EXPECT_EQ(placeholder::entityTypeOf("{{PHONE_NUMBER_12}}"), "PHONE_NUMBER");
    EXPECT_EQ(placeholder::entityTypeOf("PERSON"), "");
    uint64_t idx = 0;
    EXPECT_FALSE(placeholder::parseIndex("{{PERSON_01}}", "PERSON", idx));
    EXPECT_TRUE(placeholder::parseIndex("{{PERSON_10}}", "PERSON", idx));
    EXPECT_EQ(idx, (uint64_t)10);
}

TEST(OperatorTableTest, ParseAndFallback) {
    OperatorTable table;
    table.set("PERSON", OperatorTable::parse("placeholder"));
    table.set("PHONE_NUMBER", OperatorTable::parse("replace:<ΤΗΛΕΦΩΝΟ>"));
    EXPECT_EQ(table.forEntity("PERSON").name(), "placeholder");
    EXPECT_EQ(table.forEntity("PHONE_NUMBER").name(), "replace");
    EXPECT_EQ(table.forEntity("DATE_TIME").name(), "keep");

    table.set(OperatorTable::DEFAULT_KEY, OperatorTable::parse("placeholder"));
    EXPECT_EQ(table.forEntity("DATE_TIME").name(), "placeholder");

    EXPECT_THROW(OperatorTable::parse("redact"), piiredactor::ConfigError);
}

TEST(OperatorTableTest, ReversibleTurnsMaskingIntoCounter) {
    OperatorTable table;
    table.set("PERSON", OperatorTable::parse("placeholder"));
    table.set("PHONE_NUMBER", OperatorTable::parse("replace:***"));
    table.set("NRP", OperatorTable::parse("keep"));
    OperatorTable rev = table.reversible();
    EXPECT_EQ(rev.forEntity("PERSON").name(), "counter");
    EXPECT_EQ(rev.forEntity("PHONE_NUMBER").name(), "counter");
    EXPECT_EQ(rev.forEntity("NRP").name(), "keep");
    EXPECT_EQ(rev.defaultOperator().name(), "keep");
}

TEST(PlaceholderCodecTest, CounterMemoizesValues) {
    const std::string text = "Γιάννης είπε. Γιάννης έφυγε. Μαρία ήρθε.";
    PlaceholderCodec codec(counterTable());
    EntityMapping mapping;
    auto spans = resolvedAll({spanOf(text, "Γιάννης", "PERSON", 0.85, 0),
                              spanOf(text, "Γιάννης", "PERSON", 0.85, 1),
                              spanOf(text, "Μαρία", "PERSON")});
    SubstitutionResult res = codec.Substitute(utf8::decode(text), spans, mapping);
    EXPECT_EQ(utf8::encode(res.maskedText), "{{PERSON_0}} είπε. {{PERSON_0}} έφυγε. {{PERSON_1}} ήρθε.");
    ASSERT_EQ(res.items.size(), (size_t)3);
    EXPECT_EQ(mapping.size(), (size_t)2);
    EXPECT_TRUE(res.skippedSpanIds.empty());
}

TEST(PlaceholderCodecTest, MaskedOffsetsPointAtReplacements) {
    const std::string text = "Ο Γιάννης από την Αθήνα, τηλ. 6912345678.";
    OperatorTable table = counterTable();
    table.set("PHONE_NUMBER", std::make_shared<ReplaceOperator>("<ΤΗΛ>"));
    PlaceholderCodec codec(table);
    EntityMapping mapping;
    auto spans = resolvedAll({spanOf(text, "Γιάννης", "PERSON"), spanOf(text, "Αθήνα", "LOCATION"),
                              spanOf(text, "6912345678", "PHONE_NUMBER")});
    SubstitutionResult res = codec.Substitute(utf8::decode(text), spans, mapping);

    EXPECT_EQ(utf8::encode(res.maskedText), "Ο {{PERSON_0}} από την {{LOCATION_0}}, τηλ. <ΤΗΛ>.");
    for (const auto& item : res.items) {
        EXPECT_EQ(utf8::encode(res.maskedText, item.maskedStart, item.maskedEnd), item.replacement);
    }
    EXPECT_EQ(res.items[2].operatorName, "replace");
}

TEST(PlaceholderCodecTest, KeepReportsSpanButLeavesText) {
    const std::string text = "Συνάντηση στις 12 Μαΐου.";
    PlaceholderCodec codec{OperatorTable()};
    EntityMapping mapping;
    auto spans = resolvedAll({spanOf(text, "12 Μαΐου", "DATE_TIME")});
    SubstitutionResult res = codec.Substitute(utf8::decode(text), spans, mapping);
    EXPECT_EQ(utf8::encode(res.maskedText), text);
    ASSERT_EQ(res.items.size(), (size_t)1);
    EXPECT_EQ(res.items[0].operatorName, "keep");
    EXPECT_EQ(res.items[0].replacement, "12 Μαΐου");
    EXPECT_TRUE(mapping.empty());
}

TEST(PlaceholderCodecTest, TypePlaceholderWithoutIndex) {
    const std::string text = "Ο Γιάννης πήγε στην Αθήνα.";
    OperatorTable table;
    table.set("PERSON", std::make_shared<TypePlaceholderOperator>());
    table.set("LOCATION", std::make_shared<TypePlaceholderOperator>("[ΤΟΠΟΣ]"));
    PlaceholderCodec codec(table);
    EntityMapping mapping;
    auto spans = resolvedAll({spanOf(text, "Γιάννης", "PERSON"), spanOf(text, "Αθήνα", "LOCATION")});
    SubstitutionResult res = codec.Substitute(utf8::decode(text), spans, mapping);
    EXPECT_EQ(utf8::encode(res.maskedText), "Ο {{PERSON}} πήγε στην [ΤΟΠΟΣ].");
}

TEST(PlaceholderCodecTest, OverlapKeepsHigherScore) {
    const std::u32string text(20, U'x');
    PlaceholderCodec codec(counterTable());

    {
        EntityMapping mapping;
        std::vector<ResolvedSpan> spans = {
            resolvedOf(0, piiredactor::core::RawSpan("PERSON", 0, 7, 0.6)),
            resolvedOf(1, piiredactor::core::RawSpan("LOCATION", 5, 12, 0.9))};
        SubstitutionResult res = codec.Substitute(text, spans, mapping);
        ASSERT_EQ(res.items.size(), (size_t)1);
        EXPECT_EQ(res.items[0].spanId, (size_t)1);
        ASSERT_EQ(res.skippedSpanIds.size(), (size_t)1);
        EXPECT_EQ(res.skippedSpanIds[0], (size_t)0);
    }
    {
        EntityMapping mapping;
        std::vector<ResolvedSpan> spans = {
            resolvedOf(0, piiredactor::core::RawSpan("PERSON", 0, 7, 0.8)),
            resolvedOf(1, piiredactor::core::RawSpan("LOCATION", 5, 12, 0.8))};
        SubstitutionResult res = codec.Substitute(text, spans, mapping);
        ASSERT_EQ(res.items.size(), (size_t)1);
        EXPECT_EQ(res.items[0].spanId, (size_t)0);
        EXPECT_EQ(utf8::encode(res.maskedText), "{{PERSON_0}}" + std::string(13, 'x'));
    }
}

TEST(PlaceholderCodecTest, OutOfRangeSpanThrows) {
    PlaceholderCodec codec(counterTable());
    EntityMapping mapping;
    std::vector<ResolvedSpan> spans = {resolvedOf(0, piiredactor::core::RawSpan("PERSON", 3, 11))};
    EXPECT_THROW(codec.Substitute(U"0123456789", spans, mapping), piiredactor::InvalidSpan);
}

TEST(PlaceholderCodecTest, DeanonymizeRestoresOriginal) {
    const std::string text = "Ο Γιάννης και η Μαρία από την Αθήνα. Ο Γιάννης γύρισε.";
    PlaceholderCodec codec(counterTable());
    EntityMapping mapping;
    auto spans = resolvedAll({spanOf(text, "Γιάννης", "PERSON", 0.85, 0), spanOf(text, "Μαρία", "PERSON"),
                              spanOf(text, "Αθήνα", "LOCATION"), spanOf(text, "Γιάννης", "PERSON", 0.85, 1)});
    SubstitutionResult res = codec.Substitute(utf8::decode(text), spans, mapping);
    const std::string masked = utf8::encode(res.maskedText);
    EXPECT_EQ(PlaceholderCodec::Deanonymize(masked, piiredactor::test::recordsOf(res), mapping), text);
}

TEST(PlaceholderCodecTest, DeanonymizeLeavesLiteralsAlone) {
    const std::string text = "Κάλεσε τον Γιάννη στο 6912345678.";
    OperatorTable table = counterTable();
    table.set("PHONE_NUMBER", std::make_shared<ReplaceOperator>("<ΤΗΛ>"));
    PlaceholderCodec codec(table);
    EntityMapping mapping;
    auto spans = resolvedAll({spanOf(text, "Γιάννη", "PERSON"), spanOf(text, "6912345678", "PHONE_NUMBER")});
    SubstitutionResult res = codec.Substitute(utf8::decode(text), spans, mapping);
    EXPECT_EQ(PlaceholderCodec::Deanonymize(utf8::encode(res.maskedText), piiredactor::test::recordsOf(res),
                                            mapping),
              "Κάλεσε τον Γιάννη στο <ΤΗΛ>.");
}

TEST(PlaceholderCodecTest, DeanonymizeSkipsKeptPlaceholderLookalikes) {
    const std::string text = "Συμπλήρωσε το {{ONOMA}} με Γιάννης.";
    PlaceholderCodec codec(counterTable());   // TEMPLATE falls back to keep
    EntityMapping mapping;
    auto spans = resolvedAll({spanOf(text, "{{ONOMA}}", "TEMPLATE"), spanOf(text, "Γιάννης", "PERSON")});
    SubstitutionResult res = codec.Substitute(utf8::decode(text), spans, mapping);
    const std::string masked = utf8::encode(res.maskedText);
    EXPECT_EQ(masked, "Συμπλήρωσε το {{ONOMA}} με {{PERSON_0}}.");

    auto records = piiredactor::test::recordsOf(res);
    ASSERT_EQ(records.size(), (size_t)2);
    EXPECT_EQ(records[0].operatorName, "keep");
    EXPECT_EQ(PlaceholderCodec::Deanonymize(masked, records, mapping), text);
}

// Texts are built token by token, so spans never overlap; an empty filler makes two
// entities adjacent, and the first and last tokens are always entities.
TEST(PlaceholderCodecTest, RoundTripOverRandomSpanSets) {
    const std::vector<std::string> words = {"Γιάννης", "Μαρία", "Αθήνα", "ab", "Πάτρα", "x"};
    const std::vector<std::string> fillers = {" ", ", ", " και ", ""};
    const char* types[] = {"PERSON", "LOCATION"};
    PlaceholderCodec codec(counterTable());
    std::mt19937 rng(2024);

    for (int round = 0; round < 300; ++round) {
        std::u32string text;
        std::vector<ResolvedSpan> spans;
        const size_t tokens = 1 + rng() % 8;
        for (size_t t = 0; t < tokens; ++t) {
            if (t > 0) {
                text += utf8::decode(fillers[rng() % fillers.size()]);
            }
            const std::u32string word = utf8::decode(words[rng() % words.size()]);
            if (t == 0 || t + 1 == tokens || rng() % 3 != 0) {
                piiredactor::core::RawSpan raw(types[rng() % 2], text.size(), text.size() + word.size(), 0.8);
                spans.push_back(resolvedOf(spans.size(), raw));
            }
            text += word;
        }

        EntityMapping mapping;
        SubstitutionResult res = codec.Substitute(text, spans, mapping);
        ASSERT_EQ(res.items.size(), spans.size()) << "round " << round;

        // equal values of one type share a placeholder
        std::map<std::pair<std::string, std::u32string>, std::string> seen;
        for (const auto& item : res.items) {
            auto key = std::make_pair(item.entityType,
                                      text.substr(item.originalStart, item.originalEnd - item.originalStart));
            auto inserted = seen.emplace(key, item.replacement);
            EXPECT_EQ(inserted.first->second, item.replacement) << "round " << round;
        }

        const std::string masked = utf8::encode(res.maskedText);
        EXPECT_EQ(PlaceholderCodec::Deanonymize(masked, piiredactor::test::recordsOf(res), mapping),
                  utf8::encode(text))
            << "round " << round << ": " << masked;
    }
}

TEST(PlaceholderCodecTest, DeanonymizeFailures) {
    const std::string text = "Ο Γιάννης ήρθε.";
    PlaceholderCodec codec(counterTable());
    EntityMapping mapping;
    auto spans = resolvedAll({spanOf(text, "Γιάννης", "PERSON")});
    SubstitutionResult res = codec.Substitute(utf8::decode(text), spans, mapping);
    const std::string masked = utf8::encode(res.maskedText);

    auto shifted = piiredactor::test::recordsOf(res);
    shifted[0].maskedStart += 1;
    shifted[0].maskedEnd += 1;
    EXPECT_THROW(PlaceholderCodec::Deanonymize(masked, shifted, mapping), piiredactor::InvalidSpan);

    EntityMapping empty;
    EXPECT_THROW(PlaceholderCodec::Deanonymize(masked, piiredactor::test::recordsOf(res), empty),
                 piiredactor::MappingNotFound);
}

} // namespace

#endif // PIIREDACTOR_TEST_UNIT_TEST_PLACEHOLDER_CODEC_HPP
