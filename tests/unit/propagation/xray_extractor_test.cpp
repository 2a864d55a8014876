/// @file xray_extractor_test.cpp
/// @brief Tests for AWS X-Ray header extraction

#include <gtest/gtest.h>

#include "src/propagation/xray_extractor.h"

namespace tracekeep::propagation {
namespace {

TEST(XRayExtractorTest, ParsesRootParentAndSampled) {
    XRayExtractor extractor;
    auto context = extractor.Extract(
        {{"X-Amzn-Trace-Id", "Root=1-5759e988-bd862e3fe1be46a994272793;Parent=53995c3f42cd8ad8;Sampled=1"}});

    ASSERT_TRUE(context.has_value());
    EXPECT_EQ(context->trace_id, "5759e988bd862e3fe1be46a994272793");
    EXPECT_EQ(context->span_id, "53995c3f42cd8ad8");
    EXPECT_TRUE(context->IsSampled());
    EXPECT_TRUE(context->is_remote);
    EXPECT_TRUE(context->IsValid());
}

TEST(XRayExtractorTest, NotSampled) {
    XRayExtractor extractor;
    auto context = extractor.Extract(
        {{"x-amzn-trace-id", "Root=1-5759e988-bd862e3fe1be46a994272793;Parent=53995c3f42cd8ad8;Sampled=0"}});
    ASSERT_TRUE(context.has_value());
    EXPECT_FALSE(context->IsSampled());
}

TEST(XRayExtractorTest, AbsentSampledDefaultsToSampled) {
    XRayExtractor extractor;
    auto context = extractor.Extract(
        {{"x-amzn-trace-id", "Root=1-5759e988-bd862e3fe1be46a994272793;Parent=53995c3f42cd8ad8"}});
    ASSERT_TRUE(context.has_value());
    EXPECT_TRUE(context->IsSampled());
}

TEST(XRayExtractorTest, UppercaseHexIsLowercased) {
    XRayExtractor extractor;
    auto context = extractor.Extract(
        {{"x-amzn-trace-id", "Parent=53995C3F42CD8AD8;Root=1-5759E988-BD862E3FE1BE46A994272793"}});
    ASSERT_TRUE(context.has_value());
    EXPECT_EQ(context->trace_id, "5759e988bd862e3fe1be46a994272793");
    EXPECT_EQ(context->span_id, "53995c3f42cd8ad8");
}

TEST(XRayExtractorTest, RequiresRootAndParent) {
    XRayExtractor extractor;
    EXPECT_FALSE(extractor.Extract({{"x-amzn-trace-id", "Root=1-5759e988-bd862e3fe1be46a994272793"}})
                     .has_value());
    EXPECT_FALSE(extractor.Extract({{"x-amzn-trace-id", "Parent=53995c3f42cd8ad8;Sampled=1"}})
                     .has_value());
    EXPECT_FALSE(extractor.Extract({{"x-amzn-trace-id", "Root=2-5759e988-bd862e3fe1be46a994272793;"
                                                        "Parent=53995c3f42cd8ad8"}})
                     .has_value());
    EXPECT_FALSE(extractor.Extract({}).has_value());
}

TEST(XRayExtractorTest, RejectsAllZeroIds) {
    XRayExtractor extractor;
    EXPECT_FALSE(extractor
                     .Extract({{"x-amzn-trace-id",
                                "Root=1-00000000-000000000000000000000000;Parent=53995c3f42cd8ad8"}})
                     .has_value());
    EXPECT_FALSE(extractor
                     .Extract({{"x-amzn-trace-id",
                                "Root=1-5759e988-bd862e3fe1be46a994272793;Parent=0000000000000000"}})
                     .has_value());
}

}  // namespace
}  // namespace tracekeep::propagation
