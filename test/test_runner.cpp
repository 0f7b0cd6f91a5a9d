// test/test_runner.cpp
// -----------------------------------------------------------
// A simple test runner using Google Test to execute all unit and integration tests.
// Each suite lives in a header under test/unit or test/integration and is pulled in here.

#include <gtest/gtest.h>

#include "util/logger.hpp"

#include "unit/test_json.hpp"
#include "unit/test_config_parser.hpp"
#include "unit/test_span_aggregator.hpp"
#include "unit/test_placeholder_codec.hpp"
#include "unit/test_alignment_resolver.hpp"
#include "unit/test_paragraph_pipeline.hpp"
#include "unit/test_record_serializer.hpp"

#include "integration/test_result_store.hpp"
#include "integration/test_anonymization_service.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    // warnings are expected from the failure-path tests
    piiredactor::util::logger::setLogLevel(piiredactor::util::logger::LogLevel::ERROR);
    return RUN_ALL_TESTS();
}
