#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <engram/retain/retain_codec.h>

using namespace engram;
using namespace engram::retain;

TEST(RetainCodecTest, ItemsSurviveThePayload) {
    RetainItem full;
    full.content = "Alice ran a marathon.";
    full.documentId = "race";
    full.context = "diary";
    full.occurredHint = metadata::TimeRange{fromEpochMillis(1000), fromEpochMillis(2000)};
    full.metadata = {{"source", "phone"}};
    RetainItem bare;
    bare.content = "Bob slept.";

    auto decoded = decodeRetainItems(encodeRetainItems({full, bare}));
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded.value().size(), 2u);

    const auto& a = decoded.value()[0];
    EXPECT_EQ(a.content, full.content);
    EXPECT_EQ(a.documentId.value_or(""), "race");
    EXPECT_EQ(a.context, "diary");
    ASSERT_TRUE(a.occurredHint.has_value());
    EXPECT_EQ(toEpochMillis(a.occurredHint->start), 1000);
    EXPECT_EQ(toEpochMillis(a.occurredHint->end), 2000);
    EXPECT_EQ(a.metadata.at("source"), "phone");

    const auto& b = decoded.value()[1];
    EXPECT_FALSE(b.documentId.has_value());
    EXPECT_FALSE(b.occurredHint.has_value());
    EXPECT_TRUE(b.metadata.empty());
}

TEST(RetainCodecTest, LenientFieldsAndStrictShape) {
    auto decoded = decodeRetainItems(
        R"({"items": [{"content": "x", "occurred_start": 5, "metadata": {"n": 3}}]})");
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded.value().size(), 1u);
    ASSERT_TRUE(decoded.value()[0].occurredHint.has_value());
    EXPECT_EQ(toEpochMillis(decoded.value()[0].occurredHint->end), 5);
    EXPECT_EQ(decoded.value()[0].metadata.at("n"), "3");

    for (const char* bad : {"not json", "[]", R"({"items": {}})", R"({"items": [{"text": "x"}]})"}) {
        auto r = decodeRetainItems(bad);
        ASSERT_FALSE(r.has_value()) << bad;
        EXPECT_EQ(r.error().code, ErrorCode::InvalidData);
    }
}

TEST(RetainCodecTest, BatchResultSummary) {
    RetainBatchResult batch;
    RetainOutcome ok;
    ok.index = 0;
    ok.success = true;
    ok.createdUnitIds = {"mu-1"};
    RetainOutcome failed;
    failed.index = 1;
    failed.documentId = "d";
    failed.error = Error{ErrorCode::ExtractionFailure, "extractor down"};
    batch.items = {ok, failed};

    auto j = nlohmann::json::parse(encodeBatchResult(batch));
    EXPECT_EQ(j.at("succeeded").get<int>(), 1);
    EXPECT_EQ(j.at("failed").get<int>(), 1);
    ASSERT_EQ(j.at("items").size(), 2u);
    EXPECT_EQ(j.at("items")[0].at("created_unit_ids")[0].get<std::string>(), "mu-1");
    EXPECT_EQ(j.at("items")[1].at("document_id").get<std::string>(), "d");
    EXPECT_EQ(j.at("items")[1].at("error").at("message").get<std::string>(), "extractor down");
}
