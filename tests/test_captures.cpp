// PCREKit - Capture Group Tests
// Copyright (c) 2026 greenteng.com

#include "pcrekit.h"

#include <gtest/gtest.h>

namespace {

using pcrekit::Regex;

TEST(CapturesTest, PositionalGroups) {
    Regex re("(\\d{4})-(\\d{2})-(\\d{2})");
    const std::string subject = "on 2026-01-25";
    auto caps = re.captures(subject);
    ASSERT_TRUE(caps);
    EXPECT_EQ(caps->len(), 4u);
    EXPECT_EQ((*caps)[0], "2026-01-25");
    EXPECT_EQ((*caps)[1], "2026");
    EXPECT_EQ((*caps)[2], "01");
    EXPECT_EQ((*caps)[3], "25");
    EXPECT_EQ(caps->get(1)->start(), 3u);
    EXPECT_FALSE(caps->get(4));
}

TEST(CapturesTest, NoMatch) {
    Regex re("(x)");
    EXPECT_FALSE(re.captures("abc"));
}

TEST(CapturesTest, NamedGroupThatDidNotParticipate) {
    Regex re("(?P<foo>x)?y");
    const std::string subject = "ay";
    auto caps = re.captures(subject);
    ASSERT_TRUE(caps);
    EXPECT_FALSE(caps->name("foo"));
    EXPECT_FALSE(caps->get(1));
    auto whole = caps->get(0);
    ASSERT_TRUE(whole);
    EXPECT_EQ(whole->start(), 1u);
    EXPECT_EQ(whole->end(), 2u);
}

TEST(CapturesTest, NamedGroupLookup) {
    Regex re("(?<name>\\w+):(?<age>\\d+)");
    const std::string subject = "John:25";
    auto caps = re.captures(subject);
    ASSERT_TRUE(caps);
    EXPECT_EQ((*caps)["name"], "John");
    EXPECT_EQ((*caps)["age"], "25");
    EXPECT_EQ(caps->name("age")->start(), 5u);
    EXPECT_FALSE(caps->name("missing"));
}

TEST(CapturesTest, IndexingMissingGroupThrows) {
    Regex re("(a)|(b)");
    const std::string subject = "b";
    auto caps = re.captures(subject);
    ASSERT_TRUE(caps);
    EXPECT_THROW((*caps)[1], std::out_of_range);
    EXPECT_THROW((*caps)[7], std::out_of_range);
    EXPECT_THROW((*caps)["nope"], std::out_of_range);
    EXPECT_EQ((*caps)[2], "b");
}

TEST(CapturesTest, TrailingUnsetGroups) {
    Regex re("(a)(b)?(c)?");
    const std::string subject = "a";
    auto caps = re.captures(subject);
    ASSERT_TRUE(caps);
    EXPECT_EQ(caps->len(), 4u);
    EXPECT_TRUE(caps->get(1));
    EXPECT_FALSE(caps->get(2));
    EXPECT_FALSE(caps->get(3));
}

TEST(CapturesTest, CaptureNamesMetadata) {
    Regex re("(a)(?<second>b)");
    ASSERT_EQ(re.capturesLen(), 3u);
    const auto& names = re.captureNames();
    ASSERT_EQ(names.size(), 3u);
    EXPECT_FALSE(names[0]);
    EXPECT_FALSE(names[1]);
    ASSERT_TRUE(names[2]);
    EXPECT_EQ(*names[2], "second");
}

TEST(CapturesTest, DuplicateNamesLastGroupWins) {
    Regex re("(?J)(?<n>a)|(?<n>b)");
    ASSERT_EQ(re.capturesLen(), 3u);

    const std::string a = "a";
    auto capsA = re.captures(a);
    ASSERT_TRUE(capsA);
    EXPECT_EQ((*capsA)[1], "a");
    EXPECT_FALSE(capsA->name("n"));

    const std::string b = "b";
    auto capsB = re.captures(b);
    ASSERT_TRUE(capsB);
    ASSERT_TRUE(capsB->name("n"));
    EXPECT_EQ(capsB->name("n")->start(), 0u);
    EXPECT_EQ((*capsB)["n"], "b");
}

TEST(CaptureLocationsTest, FreshLocationsAreEmpty) {
    Regex re("(a)(b)");
    auto locs = re.captureLocations();
    EXPECT_EQ(locs.len(), 3u);
    EXPECT_FALSE(locs.get(0));
    EXPECT_FALSE(locs.get(3));
}

TEST(CaptureLocationsTest, ReadFillsLocations) {
    Regex re("(\\w)(\\d)?");
    auto locs = re.captureLocations();
    const std::string subject = "-x-y7";

    auto m = re.capturesRead(locs, subject);
    ASSERT_TRUE(m);
    EXPECT_EQ(m->start(), 1u);
    EXPECT_EQ(locs.get(0), std::make_optional(std::make_pair<size_t, size_t>(1, 2)));
    EXPECT_EQ(locs.get(1), std::make_optional(std::make_pair<size_t, size_t>(1, 2)));
    EXPECT_FALSE(locs.get(2));

    m = re.capturesReadAt(locs, subject, 2);
    ASSERT_TRUE(m);
    EXPECT_EQ(m->start(), 3u);
    EXPECT_EQ(m->end(), 5u);
    EXPECT_EQ(locs.get(2), std::make_optional(std::make_pair<size_t, size_t>(4, 5)));
}

TEST(CaptureLocationsTest, ReadIsIdempotent) {
    Regex re("(?<k>\\w+)=(?<v>\\w*)");
    const std::string subject = "a=1 bb=";

    auto first = re.captureLocations();
    auto second = re.captureLocations();
    ASSERT_TRUE(re.capturesReadAt(first, subject, 3));
    ASSERT_TRUE(re.capturesReadAt(second, subject, 3));
    for (size_t i = 0; i < first.len(); i++) {
        EXPECT_EQ(first.get(i), second.get(i)) << "group " << i;
    }
}

TEST(CaptureLocationsTest, CopyIsFreshScratch) {
    Regex re("(a)");
    auto locs = re.captureLocations();
    ASSERT_TRUE(re.capturesRead(locs, "a"));
    ASSERT_TRUE(locs.get(1));

    auto copy = locs;
    EXPECT_EQ(copy.len(), locs.len());
    EXPECT_FALSE(copy.get(1));
    EXPECT_TRUE(re.capturesRead(copy, "ba"));
    EXPECT_EQ(copy.get(1)->first, 1u);
}

TEST(CaptureLocationsTest, SharedAcrossRegexCopies) {
    Regex re("(a)");
    Regex copy = re;
    auto locs = re.captureLocations();
    EXPECT_TRUE(copy.capturesRead(locs, "a"));
}

TEST(CaptureLocationsTest, RejectsLocationsOfAnotherRegex) {
    Regex a("(a)");
    Regex b("(a)");
    auto locs = a.captureLocations();
    EXPECT_THROW(b.capturesRead(locs, "a"), std::invalid_argument);
}

} // namespace
