#include <gtest/gtest.h>
#include <managers/event_filter.hpp>
#include <core/constants.hpp>
#include "test_support.hpp"

class EventFilterTest : public ::testing::Test {
protected:
    ScratchDir dir{"dropwatch_filter_test"};

    EventFilter make_filter(std::vector<std::string> ignore = {ZONE_IDENTIFIER_PATTERN},
                            std::vector<std::string> include = {}) {
        WatchConfig cfg;
        cfg.ignore = std::move(ignore);
        cfg.include = std::move(include);
        auto f = EventFilter::from_config(cfg);
        EXPECT_TRUE(f.is_ok()) << f.error;
        return f.value;
    }
};

// ── Path resolution ─────────────────────────────────────────

TEST(ResolveEventPath, TrailingSeparatorIsIrrelevant) {
    EXPECT_EQ(resolve_event_path("/data", "a.fits"), resolve_event_path("/data/", "a.fits"));
    EXPECT_EQ(resolve_event_path("/data/", "a.fits").string(), "/data/a.fits");
}

TEST(ResolveEventPath, NormalizesDotSegments) {
    EXPECT_EQ(resolve_event_path("/data/./raw//", "a.fits").string(), "/data/raw/a.fits");
}

// ── Filtering ───────────────────────────────────────────────

TEST_F(EventFilterTest, AcceptsCompletedRegularFile) {
    dir.write("cube001.fits");
    auto filter = make_filter();

    auto candidate = filter.filter(write_event(dir.path(), "cube001.fits"));
    ASSERT_TRUE(candidate.has_value());
    EXPECT_EQ(candidate->path, dir.path() / "cube001.fits");
    EXPECT_EQ(candidate->filename, "cube001.fits");
}

TEST_F(EventFilterTest, CandidatePathSameWithOrWithoutTrailingSlash) {
    dir.write("a.fits");
    auto filter = make_filter();

    auto plain = filter.filter(RawEvent{dir.path().string(), EventKind::WriteCompleted, "a.fits"});
    auto slashed = filter.filter(RawEvent{dir.path().string() + "/", EventKind::WriteCompleted, "a.fits"});
    ASSERT_TRUE(plain.has_value());
    ASSERT_TRUE(slashed.has_value());
    EXPECT_EQ(plain->path, slashed->path);
}

TEST_F(EventFilterTest, RejectsEveryNonWriteCompletedKind) {
    dir.write("cube001.fits");
    auto filter = make_filter();

    CandidateFile out;
    RawEvent ev{dir.path().string(), EventKind::Other, "cube001.fits"};
    EXPECT_EQ(filter.evaluate(ev, out), FilterVerdict::NotWriteCompleted);
    EXPECT_FALSE(filter.filter(ev).has_value());
}

TEST_F(EventFilterTest, RejectsZoneIdentifierArtifacts) {
    auto filter = make_filter();
    const std::vector<std::string> names = {
        "cube001.fits:Zone.Identifier",
        "a:Zone.Identifier",
        "with space.txt:Zone.Identifier",
        ":Zone.Identifier",
    };

    for (const auto& name : names) {
        dir.write(name);
        CandidateFile out;
        EXPECT_EQ(filter.evaluate(write_event(dir.path(), name), out),
                  FilterVerdict::IgnoredPattern) << name;
    }
}

TEST_F(EventFilterTest, ZoneIdentifierMustBeASuffix) {
    dir.write("Zone.Identifier.fits");
    auto filter = make_filter();
    EXPECT_TRUE(filter.filter(write_event(dir.path(), "Zone.Identifier.fits")).has_value());
}

TEST_F(EventFilterTest, RejectsDirectories) {
    fs::create_directories(dir.path() / "subdir");
    auto filter = make_filter();

    CandidateFile out;
    EXPECT_EQ(filter.evaluate(write_event(dir.path(), "subdir"), out),
              FilterVerdict::NotRegularFile);
}

TEST_F(EventFilterTest, RejectsVanishedFile) {
    auto filter = make_filter();
    CandidateFile out;
    EXPECT_EQ(filter.evaluate(write_event(dir.path(), "gone.fits"), out),
              FilterVerdict::NotRegularFile);
}

TEST_F(EventFilterTest, AcceptsSymlinkToRegularFile) {
    auto target = dir.write("real.fits");
    fs::create_symlink(target, dir.path() / "link.fits");
    auto filter = make_filter();
    EXPECT_TRUE(filter.filter(write_event(dir.path(), "link.fits")).has_value());
}

TEST_F(EventFilterTest, IncludeListRestrictsNames) {
    dir.write("cube.fits");
    dir.write("notes.txt");
    auto filter = make_filter({ZONE_IDENTIFIER_PATTERN}, {"*.fits"});

    CandidateFile out;
    EXPECT_EQ(filter.evaluate(write_event(dir.path(), "cube.fits"), out), FilterVerdict::Accepted);
    EXPECT_EQ(filter.evaluate(write_event(dir.path(), "notes.txt"), out), FilterVerdict::NotIncluded);
}

TEST_F(EventFilterTest, IgnoreWinsOverInclude) {
    dir.write("cube.fits:Zone.Identifier");
    auto filter = make_filter({ZONE_IDENTIFIER_PATTERN}, {"*"});
    CandidateFile out;
    EXPECT_EQ(filter.evaluate(write_event(dir.path(), "cube.fits:Zone.Identifier"), out),
              FilterVerdict::IgnoredPattern);
}

TEST_F(EventFilterTest, ExtraIgnorePatternsNeedNoCodeChange) {
    dir.write(".cube.fits.swp");
    dir.write("cube.fits.part");
    auto filter = make_filter({ZONE_IDENTIFIER_PATTERN, ".*.swp", "*.part"});

    EXPECT_FALSE(filter.filter(write_event(dir.path(), ".cube.fits.swp")).has_value());
    EXPECT_FALSE(filter.filter(write_event(dir.path(), "cube.fits.part")).has_value());
}

TEST_F(EventFilterTest, MalformedPatternFailsConstruction) {
    WatchConfig cfg;
    cfg.ignore = {"[unclosed"};
    auto f = EventFilter::from_config(cfg);
    EXPECT_TRUE(f.is_err());
    EXPECT_NE(f.error.find("ignore"), std::string::npos);
}

TEST(VerdictReason, EveryVerdictHasText) {
    EXPECT_STREQ(verdict_reason(FilterVerdict::IgnoredPattern), "matches an ignore pattern");
    EXPECT_STREQ(verdict_reason(FilterVerdict::NotRegularFile), "not a regular file");
}
