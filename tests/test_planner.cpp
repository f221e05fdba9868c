#include <gtest/gtest.h>
#include "planner.h"
#include "errors.h"

#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

ResourceMetadata makeMetadata(const std::string& length,
                              const std::string& type = "image/png",
                              bool ranges = true) {
    ResourceMetadata meta;
    meta.status = 200;
    if (!length.empty()) {
        meta.headers["content-length"] = length;
    }
    if (!type.empty()) {
        meta.headers["content-type"] = type;
    }
    if (ranges) {
        meta.headers["accept-ranges"] = "bytes";
    }
    return meta;
}

ErrorKind planErrorKind(const ResourceMetadata& meta, int parallelism) {
    try {
        buildPlan(meta, "http://example.com/a", "out", parallelism);
    } catch (const DownloadError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "buildPlan did not throw";
    return ErrorKind::JobFailed;
}

// ── Content-Length parsing ─────────────────────────────────────

TEST(PlannerTest, ParsesContentLength) {
    EXPECT_EQ(parseContentLength(makeMetadata("1000")), 1000);
    EXPECT_EQ(parseContentLength(makeMetadata("0")), 0);
    EXPECT_EQ(parseContentLength(makeMetadata("9223372036854775807")), INT64_MAX);
}

TEST(PlannerTest, MissingLength) {
    EXPECT_EQ(planErrorKind(makeMetadata(""), 4), ErrorKind::MissingLength);
}

TEST(PlannerTest, InvalidLength) {
    for (const char* bad : {"-5", "12abc", "1.5", " ", "abc", "9223372036854775808"}) {
        ResourceMetadata meta = makeMetadata("1");
        meta.headers["content-length"] = bad;
        EXPECT_EQ(planErrorKind(meta, 4), ErrorKind::InvalidLength) << bad;
    }
}

TEST(PlannerTest, EmptyResource) {
    EXPECT_EQ(planErrorKind(makeMetadata("0"), 4), ErrorKind::EmptyResource);
}

TEST(PlannerTest, InvalidParallelismIsCheckedFirst) {
    EXPECT_EQ(planErrorKind(makeMetadata("1000"), 0), ErrorKind::InvalidParallelism);
    EXPECT_EQ(planErrorKind(makeMetadata("1000"), -1), ErrorKind::InvalidParallelism);
    EXPECT_EQ(planErrorKind(makeMetadata(""), 0), ErrorKind::InvalidParallelism);
}

TEST(PlannerTest, PlanningErrorCreatesNoFile) {
    fs::path base = fs::temp_directory_path() / "rangefetch_planner_missing";
    fs::remove(base.string() + ".png");
    EXPECT_THROW(buildPlan(makeMetadata(""), "http://example.com/a", base.string(), 4),
                 DownloadError);
    EXPECT_FALSE(fs::exists(base.string() + ".png"));
    EXPECT_FALSE(fs::exists(base));
}

// ── Plan contents ──────────────────────────────────────────────

TEST(PlannerTest, BuildsBalancedPlan) {
    ResourcePlan plan = buildPlan(makeMetadata("1000"), "http://example.com/a.png", "avatar", 4);

    EXPECT_EQ(plan.source_url, "http://example.com/a.png");
    EXPECT_EQ(plan.total_length, 1000);
    EXPECT_EQ(plan.content_kind, ContentKind::Image);
    EXPECT_EQ(plan.suffix, "png");
    EXPECT_EQ(plan.destination_path, "avatar.png");
    EXPECT_TRUE(plan.supports_partial_fetch);
    EXPECT_TRUE(plan.ranged_fetch);
    EXPECT_EQ(plan.requested_parallelism, 4);
    EXPECT_EQ(plan.scheme, PartitionScheme::Balanced);
    EXPECT_EQ(plan.bytes_written, 0);
    ASSERT_EQ(plan.blocks.size(), 4u);
    EXPECT_EQ(plan.blocks.back().range_end, 999);
}

TEST(PlannerTest, ParallelismOneGivesSingleBlock) {
    ResourcePlan plan = buildPlan(makeMetadata("777"), "http://example.com/a", "out", 1);
    ASSERT_EQ(plan.blocks.size(), 1u);
    EXPECT_EQ(plan.blocks[0].range_start, 0);
    EXPECT_EQ(plan.blocks[0].range_end, 776);
}

TEST(PlannerTest, UsesFinalUrlAfterRedirect) {
    ResourceMetadata meta = makeMetadata("10");
    meta.final_url = "https://cdn.example.com/real.png";
    ResourcePlan plan = buildPlan(meta, "http://example.com/short", "out", 2);
    EXPECT_EQ(plan.source_url, "https://cdn.example.com/real.png");
}

TEST(PlannerTest, UnknownContentTypeHasNoSuffix) {
    ResourcePlan plan = buildPlan(makeMetadata("10", ""), "http://example.com/a", "out", 2);
    EXPECT_EQ(plan.content_kind, ContentKind::Unknown);
    EXPECT_EQ(plan.destination_path, "out");
}

TEST(PlannerTest, NoRangeSupportFallsBackToOneUnrangedBlock) {
    ResourcePlan plan = buildPlan(makeMetadata("1000", "image/png", false),
                                  "http://example.com/a", "out", 8);
    EXPECT_FALSE(plan.supports_partial_fetch);
    EXPECT_FALSE(plan.ranged_fetch);
    ASSERT_EQ(plan.blocks.size(), 1u);
    EXPECT_EQ(plan.blocks[0].range_end, 999);
}

TEST(PlannerTest, AcceptRangesNoneIsNotRangeSupport) {
    ResourceMetadata meta = makeMetadata("1000", "image/png", false);
    meta.headers["accept-ranges"] = "none";
    EXPECT_FALSE(buildPlan(meta, "http://example.com/a", "out", 8).ranged_fetch);
}

TEST(PlannerTest, LegacyOptionsReproduceLegacyLayout) {
    ResourcePlan plan = buildPlan(makeMetadata("1000", "video/mp4", false),
                                  "http://example.com/a", "w", 4, PlanOptions::legacy());

    // Ranges are requested even though the server did not advertise them.
    EXPECT_FALSE(plan.supports_partial_fetch);
    EXPECT_TRUE(plan.ranged_fetch);
    EXPECT_EQ(plan.scheme, PartitionScheme::Legacy);
    EXPECT_EQ(plan.destination_path, "w.png");
    ASSERT_EQ(plan.blocks.size(), 5u);
    EXPECT_EQ(plan.blocks[0].range_start, 0);
    EXPECT_EQ(plan.blocks[0].range_end, 0);
    EXPECT_EQ(plan.blocks[1].range_start, 1);
    EXPECT_EQ(plan.blocks[1].range_end, 250);
    EXPECT_EQ(plan.blocks[4].range_start, 751);
    EXPECT_EQ(plan.blocks[4].range_end, 999);
}

} // namespace
