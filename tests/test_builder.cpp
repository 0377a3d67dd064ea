// PCREKit - Builder Tests
// Copyright (c) 2026 greenteng.com

#include "pcrekit.h"

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>

namespace {

using pcrekit::CompileError;
using pcrekit::ErrorKind;
using pcrekit::Regex;
using pcrekit::RegexBuilder;

TEST(BuilderTest, DefaultsAreCaseSensitive) {
    Regex re("abc");
    EXPECT_TRUE(re.isMatch("abc"));
    EXPECT_FALSE(re.isMatch("ABC"));
}

TEST(BuilderTest, Caseless) {
    Regex re = RegexBuilder().caseless(true).build("abc");
    EXPECT_TRUE(re.isMatch("xABCx"));
}

TEST(BuilderTest, Dotall) {
    EXPECT_FALSE(Regex("a.b").isMatch("a\nb"));
    EXPECT_TRUE(RegexBuilder().dotall(true).build("a.b").isMatch("a\nb"));
}

TEST(BuilderTest, Extended) {
    Regex re = RegexBuilder().extended(true).build("a b c  # comment");
    EXPECT_TRUE(re.isMatch("abc"));
    EXPECT_FALSE(re.isMatch("a b c"));
}

TEST(BuilderTest, MultiLine) {
    EXPECT_FALSE(Regex("^b$").isMatch("a\nb\nc"));
    EXPECT_TRUE(RegexBuilder().multiLine(true).build("^b$").isMatch("a\nb\nc"));
}

TEST(BuilderTest, CrlfRecognizesCarriageReturn) {
    Regex plain = RegexBuilder().multiLine(true).build("^b");
    EXPECT_FALSE(plain.isMatch("a\rb"));

    Regex crlf = RegexBuilder().multiLine(true).crlf(true).build("^b");
    auto m = crlf.find("a\rb");
    ASSERT_TRUE(m);
    EXPECT_EQ(m->start(), 2u);
    EXPECT_TRUE(crlf.isMatch("a\r\nb"));
}

TEST(BuilderTest, UcpMakesClassesUnicodeAware) {
    // U+00E9, two bytes in UTF-8
    const std::string subject = "\xC3\xA9";

    EXPECT_FALSE(Regex("\\w").isMatch(subject));

    Regex re = RegexBuilder().ucp(true).build("\\w");
    auto m = re.find(subject);
    ASSERT_TRUE(m);
    EXPECT_EQ(m->start(), 0u);
    EXPECT_EQ(m->end(), 2u);
}

TEST(BuilderTest, UtfMatchesCodepoints) {
    const std::string subject = "\xC3\xA9";

    auto bytewise = Regex("^.$").find(subject);
    EXPECT_FALSE(bytewise);

    auto m = RegexBuilder().utf(true).build("^.$").find(subject);
    ASSERT_TRUE(m);
    EXPECT_EQ(m->end(), 2u);
}

TEST(BuilderTest, NeverUtfRejectsUtfVerb) {
    EXPECT_NO_THROW(Regex("(*UTF)a"));
    EXPECT_THROW(RegexBuilder().neverUtf(true).build("(*UTF)a"), CompileError);
}

TEST(BuilderTest, SyntaxErrorReportsOffset) {
    try {
        Regex re("abc(");
        FAIL() << "expected a compile error";
    } catch (const CompileError& e) {
        EXPECT_EQ(e.kind, ErrorKind::Compile);
        EXPECT_GT(e.code, 0);
        ASSERT_TRUE(e.offset.has_value());
        EXPECT_EQ(*e.offset, 4u);
        EXPECT_FALSE(e.errorMessage().empty());
        EXPECT_NE(std::string(e.what()).find("error compiling pattern at offset 4"), std::string::npos);
    }
}

TEST(BuilderTest, CompileErrorIsAnError) {
    EXPECT_THROW(Regex("[a-"), pcrekit::Error);
    EXPECT_THROW(Regex("a{2,1}"), std::runtime_error);
}

TEST(BuilderTest, JitAlways) {
    if (!pcrekit::jitAvailable()) {
        try {
            RegexBuilder().jit(true).build("a+");
            FAIL() << "expected a JIT error";
        } catch (const CompileError& e) {
            EXPECT_EQ(e.kind, ErrorKind::Jit);
        }
        return;
    }
    Regex re = RegexBuilder().jit(true).build("a+");
    EXPECT_TRUE(re.isJitCompiled());
    auto m = re.find("baaa");
    ASSERT_TRUE(m);
    EXPECT_EQ(m->start(), 1u);
    EXPECT_EQ(m->end(), 4u);
}

TEST(BuilderTest, JitIfAvailableNeverFails) {
    Regex re = RegexBuilder().jitIfAvailable(true).build("\\d+");
    EXPECT_EQ(re.isJitCompiled(), pcrekit::jitAvailable());
    EXPECT_TRUE(re.isMatch("abc123"));
}

TEST(BuilderTest, JitSettingsOverrideEachOther) {
    Regex re = RegexBuilder().jitIfAvailable(true).jit(false).build("x");
    EXPECT_FALSE(re.isJitCompiled());
}

TEST(BuilderTest, MaxJitStackSize) {
    Regex re = RegexBuilder()
        .jitIfAvailable(true)
        .maxJitStackSize(1024 * 1024)
        .build("(a|b)*c");
    std::string subject(5000, 'a');
    subject += 'c';
    auto m = re.find(subject);
    ASSERT_TRUE(m);
    EXPECT_EQ(m->end(), subject.size());
}

TEST(BuilderTest, MaxJitStackSizeWithoutJitHasNoEffect) {
    Regex re = RegexBuilder().maxJitStackSize(64 * 1024).build("b");
    EXPECT_TRUE(re.isMatch("abc"));
}

TEST(BuilderTest, MaxJitStackSizeRejectsZero) {
    RegexBuilder builder;
    EXPECT_THROW(builder.maxJitStackSize(0), std::invalid_argument);
    EXPECT_NO_THROW(builder.maxJitStackSize(std::nullopt));

    Regex re = builder.jitIfAvailable(true).build("a+");
    EXPECT_TRUE(re.isMatch("baa"));
}

TEST(BuilderTest, ErrorFieldsArePublic) {
    try {
        RegexBuilder().build("(?<n>a)(?<n>b)");
        FAIL() << "expected a compile error";
    } catch (const pcrekit::Error& e) {
        ErrorKind kind = e.kind;
        int code = e.code;
        std::optional<size_t> offset = e.offset;
        EXPECT_EQ(kind, ErrorKind::Compile);
        EXPECT_GT(code, 0);
        EXPECT_TRUE(offset.has_value());
    }
}

TEST(BuilderTest, PatternTextIsKept) {
    Regex re = RegexBuilder().caseless(true).build("(?<year>\\d{4})");
    EXPECT_EQ(re.asStr(), "(?<year>\\d{4})");
}

TEST(BuilderTest, BuilderIsReusable) {
    RegexBuilder builder;
    builder.caseless(true);
    Regex a = builder.build("a");
    Regex b = builder.build("b");
    EXPECT_TRUE(a.isMatch("A"));
    EXPECT_TRUE(b.isMatch("B"));
}

} // namespace
