#include <gtest/gtest.h>

#include <cvpipe/parsing/text_normalizer.h>
#include "../../common/test_helpers.h"

using namespace cvpipe::parsing;

TEST(TextNormalizerTest, CollapsesHorizontalWhitespace) {
    EXPECT_EQ(normalize("Jane    Doe\t\tEngineer  "), "Jane Doe Engineer");
    // NBSP and thin space count as whitespace
    EXPECT_EQ(normalize("Jane\xC2\xA0\xE2\x80\x89"
                        "Doe"),
              "Jane Doe");
}

TEST(TextNormalizerTest, KeepsLineStructure) {
    EXPECT_EQ(normalize("Experience\r\nAcme Corp\rGlobex"), "Experience\nAcme Corp\nGlobex");
    EXPECT_EQ(normalize("\n\n\nSummary\n\n\n\nText\n\n"), "Summary\n\nText");
}

TEST(TextNormalizerTest, DropsControlCharacters) {
    EXPECT_EQ(normalize("Ja\x01ne\x7F Doe\xE2\x80\x8B"), "Jane Doe");
}

TEST(TextNormalizerTest, UnifiesBullets) {
    EXPECT_EQ(normalize("\xE2\x97\x8F Led team"), "\xE2\x80\xA2 Led team");
    EXPECT_EQ(normalize("\xE2\x96\xAA Built API"), "\xE2\x80\xA2 Built API");
    EXPECT_EQ(normalize("\xEF\x82\xB7 Wrote tests"), "\xE2\x80\xA2 Wrote tests");
}

TEST(TextNormalizerTest, RepairsRecognitionErrorsInHeadings) {
    EXPECT_EQ(normalize("Exper1ence"), "Experience");
    EXPECT_EQ(normalize("Educat10n"), "Education");
    EXPECT_EQ(normalize("Sk111s"), "Skills");
    EXPECT_EQ(normalize("Pr0jects"), "Projects");
    EXPECT_EQ(normalize("Certificat10ns"), "Certifications");
    EXPECT_EQ(normalize("Master 0f Science"), "Master of Science");
}

TEST(TextNormalizerTest, LeavesOrdinaryDigitsAlone) {
    EXPECT_EQ(normalize("Managed 10 engineers in 2019"), "Managed 10 engineers in 2019");
    EXPECT_EQ(normalize("Office 365 and 0ffice"), "Office 365 and 0ffice");
}

TEST(TextNormalizerTest, IsIdempotent) {
    const std::vector<std::string> inputs{
        "",
        "   ",
        "\r\n\r\n",
        cvpipe::test::sampleResumeText(),
        "Exper1ence\t\t\xE2\x97\x8F  Led   team \r\n\r\n\r\n\xC2\xA0Sk111s:  C++,\tGo",
        "\xE2\x80\xA2\xE2\x80\xA2 double bullet \x0b vertical tab",
        "Invalid \xC3 utf8 \xFF bytes",
        "0f 0f 0f Educat1On",
    };
    for (const auto& input : inputs) {
        auto once = normalize(input);
        EXPECT_EQ(normalize(once), once) << "input: " << input;
    }
}

TEST(TextNormalizerTest, BlankInputNormalizesToEmpty) {
    EXPECT_TRUE(normalize("").empty());
    EXPECT_TRUE(normalize(" \t \r\n \n").empty());
}
