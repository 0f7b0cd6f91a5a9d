#ifndef PIIREDACTOR_TEST_UNIT_TEST_RECORD_SERIALIZER_HPP
#define PIIREDACTOR_TEST_UNIT_TEST_RECORD_SERIALIZER_HPP

#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "config/pipeline_config.hpp"
#include "core/errors.hpp"
#include "core/paragraph_pipeline.hpp"
#include "detectors/remote_detector.hpp"
#include "service/record_serializer.hpp"
#include "test_helpers.hpp"

namespace {

using piiredactor::core::AnonymizationRecord;
using piiredactor::core::ParagraphPipeline;
using piiredactor::util::json::JsonValue;
namespace service = piiredactor::service;

std::vector<AnonymizationRecord> anonymizeAthens(bool reversible) {
    const std::string text = "Ο Γιάννης μένει στην Αθήνα.";
    piiredactor::config::PipelineConfig cfg;
    cfg.reversible = reversible;
    ParagraphPipeline pipeline(cfg);
    return pipeline.AnonymizeWithSpans(text, {{0, {piiredactor::test::spanOf(text, "Γιάννης", "PERSON"),
                                                   piiredactor::test::spanOf(text, "Αθήνα", "LOCATION")}}});
}

TEST(RecordSerializerTest, NonReversibleShape) {
    JsonValue out = service::recordToJson(anonymizeAthens(false)[0]);
    EXPECT_EQ(out.at("full_text").asString(), "Ο Γιάννης μένει στην Αθήνα.");
    EXPECT_EQ(out.at("masked").asString(), "Ο {{PERSON}} μένει στην {{LOCATION}}.");
    EXPECT_FALSE(out.contains("entity_mapping"));
    EXPECT_FALSE(out.contains("status"));
    EXPECT_FALSE(out.contains("warnings"));

    const JsonValue& span = out.at("spans").items()[0];
    EXPECT_EQ(span.at("entity_type").asString(), "PERSON");
    EXPECT_EQ(span.at("entity_value").asString(), "Γιάννης");
    EXPECT_EQ(span.at("start_position").asInt(), 2);
    EXPECT_EQ(span.at("end_position").asInt(), 9);
    EXPECT_EQ(span.at("operator").asString(), "placeholder");
    EXPECT_FALSE(span.contains("masked_start"));
}

TEST(RecordSerializerTest, ReversibleShapeRestoresText) {
    JsonValue out = service::recordToJson(anonymizeAthens(true)[0]);
    EXPECT_EQ(out.at("text").asString(), "Ο Γιάννης μένει στην Αθήνα.");
    EXPECT_EQ(out.at("masked").asString(), "Ο {{PERSON_0}} μένει στην {{LOCATION_0}}.");
    EXPECT_EQ(out.at("entity_mapping").at("PERSON").at("Γιάννης").asString(), "{{PERSON_0}}");
    const JsonValue& span = out.at("spans").items()[1];
    EXPECT_EQ(span.at("masked_entity_value").asString(), "{{LOCATION_0}}");
    EXPECT_EQ(span.at("masked_start").asInt(), 26);
    EXPECT_EQ(span.at("masked_end").asInt(), 40);
    EXPECT_EQ(span.at("operator").asString(), "counter");

    // through text and back, as a saved record file would be
    AnonymizationRecord restored = service::recordFromJson(piiredactor::util::json::parse(out.dump(4)));
    EXPECT_TRUE(restored.reversible);
    EXPECT_EQ(ParagraphPipeline::Deanonymize(restored), "Ο Γιάννης μένει στην Αθήνα.");
}

TEST(RecordSerializerTest, StatusAndWarningsAreWritten) {
    AnonymizationRecord rec;
    rec.fullText = "κείμενο";
    rec.maskedText = "κείμενο";
    rec.status = piiredactor::core::RecordStatus::DetectorFailed;
    rec.warnings.push_back("detector 'remote' failed");
    JsonValue out = service::recordToJson(rec);
    EXPECT_EQ(out.at("status").asString(), "detector_failed");
    ASSERT_EQ(out.at("warnings").size(), (size_t)1);
}

TEST(RecordSerializerTest, MalformedRecordRejected) {
    EXPECT_THROW(service::recordFromJson(piiredactor::util::json::parse("[]")), piiredactor::InvalidSpan);
    EXPECT_THROW(service::recordFromJson(piiredactor::util::json::parse("{\"text\": \"a\"}")),
                 piiredactor::InvalidSpan);
    EXPECT_THROW(service::recordFromJson(piiredactor::util::json::parse(
                     R"({"masked": "x", "spans": [{"entity_type": "PERSON", "start_position": "0"}]})")),
                 piiredactor::InvalidSpan);
}

TEST(SpansFileTest, ArrayMeansFirstParagraph) {
    auto spans = service::parseSpansFile(R"([{"entity_type": "PERSON", "start": 2, "end": 9, "score": 0.7},
                                              {"entity_type": "LOCATION", "start": 21, "end": 26}])");
    ASSERT_EQ(spans.size(), (size_t)1);
    ASSERT_EQ(spans[0].size(), (size_t)2);
    EXPECT_DOUBLE_EQ(spans[0][0].score, 0.7);
    EXPECT_DOUBLE_EQ(spans[0][1].score, 1.0);
    EXPECT_EQ(spans[0][1].sourceId, "spans-file");
}

TEST(SpansFileTest, ObjectKeyedByParagraph) {
    auto spans = service::parseSpansFile(
        R"({"0": [{"entity_type": "PERSON", "start": 0, "end": 3}], "2": [{"entity_type": "EMAIL_ADDRESS", "start": 4, "end": 20, "source_id": "regex"}]})");
    ASSERT_EQ(spans.size(), (size_t)2);
    EXPECT_EQ(spans.count(1), (size_t)0);
    EXPECT_EQ(spans[2][0].sourceId, "regex");
}

TEST(SpansFileTest, MalformedFilesRejected) {
    EXPECT_THROW(service::parseSpansFile("{\"first\": []}"), piiredactor::InvalidSpan);
    EXPECT_THROW(service::parseSpansFile("[{\"entity_type\": \"PERSON\", \"start\": -1, \"end\": 3}]"),
                 piiredactor::InvalidSpan);
    EXPECT_THROW(service::parseSpansFile("[{\"start\": 0, \"end\": 3}]"), piiredactor::InvalidSpan);
    EXPECT_THROW(service::parseSpansFile("not json"), piiredactor::InvalidSpan);
    EXPECT_THROW(service::parseSpansFile("42"), piiredactor::InvalidSpan);
}

TEST(RemoteDetectorTest, RequestBodyAndEndpoint) {
    piiredactor::detectors::RemoteDetector detector("http://localhost:5002/", "el", {"PERSON", "LOCATION"});
    EXPECT_EQ(detector.endpoint(), "http://localhost:5002/analyze");
    EXPECT_EQ(detector.id(), "remote:http://localhost:5002/");
    EXPECT_EQ(detector.BuildRequestBody("Γιάννης \"Γ\""),
              "{\"text\":\"Γιάννης \\\"Γ\\\"\",\"language\":\"el\",\"entities\":[\"LOCATION\",\"PERSON\"]}");
}

TEST(RemoteDetectorTest, ParseResponse) {
    auto spans = piiredactor::detectors::RemoteDetector::ParseResponse(
        R"([{"entity_type": "PERSON", "start": 0, "end": 7, "score": 0.85},
            {"entity_type": "LOCATION", "start": 18, "end": 23}])",
        "remote:test");
    ASSERT_EQ(spans.size(), (size_t)2);
    EXPECT_EQ(spans[0].entityType, "PERSON");
    EXPECT_EQ(spans[0].end, (size_t)7);
    EXPECT_DOUBLE_EQ(spans[0].score, 0.85);
    EXPECT_DOUBLE_EQ(spans[1].score, 1.0);
    EXPECT_EQ(spans[1].sourceId, "remote:test");
    EXPECT_TRUE(piiredactor::detectors::RemoteDetector::ParseResponse("[]", "x").empty());
}

TEST(RemoteDetectorTest, BadResponsesAreDetectorErrors) {
    using piiredactor::detectors::RemoteDetector;
    EXPECT_THROW(RemoteDetector::ParseResponse("{\"error\": \"boom\"}", "x"), piiredactor::DetectorError);
    EXPECT_THROW(RemoteDetector::ParseResponse("<html>", "x"), piiredactor::DetectorError);
    EXPECT_THROW(RemoteDetector::ParseResponse("[{\"entity_type\": \"PERSON\", \"start\": 1.5, \"end\": 3}]", "x"),
                 piiredactor::DetectorError);
}

// Nothing listens on port 1; the connection is refused right away.
TEST(RemoteDetectorTest, UnreachableServiceIsADetectorError) {
    piiredactor::detectors::RemoteDetector detector("http://127.0.0.1:1", "el", {}, 2);
    EXPECT_THROW(detector.Detect("Γιάννης"), piiredactor::DetectorError);
}

} // namespace

#endif // PIIREDACTOR_TEST_UNIT_TEST_RECORD_SERIALIZER_HPP
