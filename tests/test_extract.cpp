#include <gtest/gtest.h>

#include "miniparse/processors/Extract.hpp"

#include <string>

using namespace miniparse;

static IntentResult record(const std::string& text) {
    IntentResult r;
    r.text = text;
    return r;
}

// ---------------- emails ----------------

TEST(EmailExtractor, FindsAddressWithOffsets) {
    auto r = record("contact me at john.doe@example.com please");
    extract_emails(r);

    ASSERT_EQ(r.entities.size(), 1u);
    EXPECT_EQ(r.entities[0].type, EntityType::Email);
    EXPECT_EQ(r.entities[0].value, "john.doe@example.com");
    EXPECT_EQ(r.entities[0].start, 14u);
    EXPECT_EQ(r.entities[0].end, 34u);
}

TEST(EmailExtractor, FindsEmbeddedAndMultipleMatches) {
    auto r = record("mailto:john@ex.com. cc a@b.co,x.y+z@mail.example.org");
    extract_emails(r);

    ASSERT_EQ(r.entities.size(), 3u);
    EXPECT_EQ(r.entities[0].value, "john@ex.com");
    EXPECT_EQ(r.entities[0].start, 7u);
    EXPECT_EQ(r.entities[0].end, 18u);
    EXPECT_EQ(r.entities[1].value, "a@b.co");
    EXPECT_EQ(r.entities[2].value, "x.y+z@mail.example.org");
}

TEST(EmailExtractor, RejectsShortOrMissingTld) {
    auto r = record("x@y.c and user@localhost and @example.com");
    extract_emails(r);
    EXPECT_TRUE(r.entities.empty());
}

TEST(EmailExtractor, ResumesInsideALocalRunAfterAMatch) {
    auto r = record("a@b.cc.d@x.io user@sub.example.c");
    extract_emails(r);

    ASSERT_EQ(r.entities.size(), 3u);
    EXPECT_EQ(r.entities[0].value, "a@b.cc");
    EXPECT_EQ(r.entities[1].value, ".d@x.io");
    EXPECT_EQ(r.entities[1].start, 6u);
    EXPECT_EQ(r.entities[2].value, "user@sub.example");
}

TEST(EmailExtractor, MegabyteWordDoesNotExhaustTheStack) {
    const std::string word(1 << 20, 'a');

    auto plain = record(word);
    extract_emails(plain);
    EXPECT_TRUE(plain.entities.empty());

    auto r = record(word + "@example.com");
    extract_emails(r);
    ASSERT_EQ(r.entities.size(), 1u);
    EXPECT_EQ(r.entities[0].start, 0u);
    EXPECT_EQ(r.entities[0].end, word.size() + 12);

    auto tld = record("x@y." + word);
    extract_emails(tld);
    ASSERT_EQ(tld.entities.size(), 1u);
    EXPECT_EQ(tld.entities[0].end, tld.text.size());
}

// ---------------- phones ----------------

TEST(PhoneExtractor, FindsDashedNumber) {
    auto r = record("call 555-123-4567 today");
    extract_phones(r);

    ASSERT_EQ(r.entities.size(), 1u);
    EXPECT_EQ(r.entities[0].type, EntityType::Phone);
    EXPECT_EQ(r.entities[0].value, "555-123-4567");
    EXPECT_EQ(r.entities[0].start, 5u);
    EXPECT_EQ(r.entities[0].end, 17u);
}

TEST(PhoneExtractor, AcceptsPlusAndDots) {
    auto r = record("intl: +1.415.555.1234;");
    extract_phones(r);

    ASSERT_EQ(r.entities.size(), 1u);
    EXPECT_EQ(r.entities[0].value, "+1.415.555.1234");
    EXPECT_EQ(r.entities[0].start, 6u);
}

TEST(PhoneExtractor, RejectsWrongDigitCountsAndStrayCharacters) {
    auto r = record("123-456-789 1234567890123456 555-123-4567x (555) 123-4567");
    extract_phones(r);
    EXPECT_TRUE(r.entities.empty());
}

TEST(PhoneExtractor, RepeatedCandidateReportsFirstOccurrence) {
    auto r = record("555-123-4567 or 555-123-4567");
    extract_phones(r);

    ASSERT_EQ(r.entities.size(), 2u);
    EXPECT_EQ(r.entities[0].start, 0u);
    EXPECT_EQ(r.entities[1].start, 0u);
}

// ---------------- urls ----------------

TEST(UrlExtractor, FindsUrlWithPath) {
    auto r = record("visit http://example.com/path now");
    extract_urls(r);

    ASSERT_EQ(r.entities.size(), 1u);
    EXPECT_EQ(r.entities[0].type, EntityType::Url);
    EXPECT_EQ(r.entities[0].value, "http://example.com/path");
    EXPECT_EQ(r.entities[0].start, 6u);
    EXPECT_EQ(r.entities[0].end, 29u);
}

TEST(UrlExtractor, SingleLabelHostIsRejected) {
    auto r = record("http://bad");
    extract_urls(r);
    EXPECT_TRUE(r.entities.empty());
}

TEST(UrlExtractor, StopsAtBracketsAndRunsHttpPassFirst) {
    auto r = record("(see https://x.io) or http://a.b.com/q?x=1");
    extract_urls(r);

    ASSERT_EQ(r.entities.size(), 2u);
    EXPECT_EQ(r.entities[0].value, "http://a.b.com/q?x=1");
    EXPECT_EQ(r.entities[1].value, "https://x.io");
    EXPECT_EQ(r.entities[1].start, 5u);
    EXPECT_EQ(r.entities[1].end, 17u);
}

TEST(UrlExtractor, InvalidCandidatesDoNotStopTheScan) {
    auto r = record("http://a..com http:// http://ok.example");
    extract_urls(r);

    ASSERT_EQ(r.entities.size(), 1u);
    EXPECT_EQ(r.entities[0].value, "http://ok.example");
}

TEST(UrlExtractor, ValidationRules) {
    EXPECT_TRUE(is_valid_url("https://sub.example-site.org/a/b"));
    EXPECT_FALSE(is_valid_url("ftp://example.com"));
    EXPECT_FALSE(is_valid_url("http://example.com://x"));
    EXPECT_FALSE(is_valid_url("http://exa_mple.com"));
    EXPECT_FALSE(is_valid_url("http://example.com:8080/"));
    EXPECT_FALSE(is_valid_url("http:///path"));
}

// ---------------- numbers ----------------

TEST(NumberExtractor, FindsDecimal) {
    auto r = record("price is 12.50 dollars");
    extract_numbers(r);

    ASSERT_EQ(r.entities.size(), 1u);
    EXPECT_EQ(r.entities[0].type, EntityType::Number);
    EXPECT_EQ(r.entities[0].value, "12.50");
    EXPECT_EQ(r.entities[0].start, 9u);
    EXPECT_EQ(r.entities[0].end, 14u);
}

TEST(NumberExtractor, SentencePeriodIsNotANumber) {
    auto r = record("end of sentence. Next");
    extract_numbers(r);
    EXPECT_TRUE(r.entities.empty());
}

TEST(NumberExtractor, TrailingPeriodAndSecondDecimalPointSplit) {
    auto r = record("version 2. then 1.2.3");
    extract_numbers(r);

    ASSERT_EQ(r.entities.size(), 3u);
    EXPECT_EQ(r.entities[0].value, "2");
    EXPECT_EQ(r.entities[1].value, "1.2");
    EXPECT_EQ(r.entities[2].value, ".3");
    EXPECT_EQ(r.entities[2].start, 19u);
}

TEST(NumberExtractor, UnderflowingLiteralIsStillANumber) {
    const std::string tiny = "0." + std::string(330, '0') + "1";
    auto r = record(tiny + " and 1e5");
    extract_numbers(r);

    ASSERT_EQ(r.entities.size(), 3u);
    EXPECT_EQ(r.entities[0].value, tiny);
    EXPECT_EQ(r.entities[0].start, 0u);
    EXPECT_EQ(r.entities[1].value, "1");
    EXPECT_EQ(r.entities[2].value, "5");
}

TEST(NumberExtractor, DotsOnlyTerminates) {
    auto r = record(". .. ....");
    extract_numbers(r);
    EXPECT_TRUE(r.entities.empty());
}

// ---------------- stages ----------------

TEST(ExtractStage, RunsExtractorsInFixedOrderWithOverlaps) {
    auto r = extract(record("mail a@b.io or call 555-123-4567"));

    ASSERT_EQ(r.entities.size(), 5u);
    EXPECT_EQ(r.entities[0].type, EntityType::Email);
    EXPECT_EQ(r.entities[1].type, EntityType::Phone);
    EXPECT_EQ(r.entities[2].type, EntityType::Number);
    EXPECT_EQ(r.entities[2].value, "555");
    EXPECT_EQ(r.entities[3].value, "123");
    EXPECT_EQ(r.entities[4].value, "4567");
}

TEST(ExtractStage, SingleTypeStagesOnlyAppendTheirType) {
    auto r = extract_urls_only(record("a@b.io http://x.com 42"));
    ASSERT_EQ(r.entities.size(), 1u);
    EXPECT_EQ(r.entities[0].type, EntityType::Url);

    r = extract_numbers_only(std::move(r));
    ASSERT_EQ(r.entities.size(), 2u);
    EXPECT_EQ(r.entities[1].value, "42");
}

TEST(ExtractStage, EntityValuesMatchTheirSpans) {
    const std::string text = "Reach JOHN@Example.com at +44 20 7946 0958? or https://Example.com/x 3.5";
    auto r = extract(record(text));

    ASSERT_FALSE(r.entities.empty());
    for (const auto& e : r.entities) {
        ASSERT_LT(e.start, e.end);
        ASSERT_LE(e.end, text.size());
        EXPECT_EQ(e.value, text.substr(e.start, e.end - e.start));
    }
}
