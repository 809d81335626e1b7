#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cvpipe/parsing/field_extractors.h>

using namespace cvpipe::parsing;
using ::testing::Contains;
using ::testing::ElementsAre;

TEST(SkillsExtractorTest, SplitsOnListSeparators) {
    auto skills = extractSkills("Languages: Python, C++; Go\n"
                                "\xE2\x80\xA2 Docker | Kubernetes\n"
                                "Scikit-learn - Pandas\n");
    ASSERT_GE(skills.size(), 7u);
    std::vector<std::string> listed(skills.begin(), skills.begin() + 7);
    EXPECT_THAT(listed, ElementsAre("Python", "C++", "Go", "Docker", "Kubernetes",
                                    "Scikit-learn", "Pandas"));
}

TEST(SkillsExtractorTest, DeduplicatesIgnoringCase) {
    auto skills = extractSkills("python, Python, PYTHON");
    ASSERT_EQ(skills.size(), 1u);
    EXPECT_EQ(skills.front(), "python");
}

TEST(SkillsExtractorTest, AddsVocabularyTermsFromProse) {
    auto skills = extractSkills("Comfortable deploying with Terraform on AWS every week of the year");
    EXPECT_THAT(skills, Contains("AWS"));
}

TEST(SummaryExtractorTest, JoinsLongLinesAndSkipsBullets) {
    auto summary = extractSummary("Short line\n"
                                  "Backend engineer with eight years of experience.\n"
                                  "\xE2\x80\xA2 bullet point that is long enough\n"
                                  "Ships reliable services quickly.\n");
    EXPECT_EQ(summary, "Backend engineer with eight years of experience. "
                       "Ships reliable services quickly.");
    EXPECT_EQ(extractSummary(""), "");
}

TEST(ProjectsExtractorTest, NameTechnologiesAndUrl) {
    auto projects = extractProjects("Resume Parser | Python, Flask\n"
                                    "\xE2\x80\xA2 Parses PDF resumes into JSON\n"
                                    "Technologies: Docker, Redis\n"
                                    "https://github.com/janedoe/parser\n");
    ASSERT_EQ(projects.size(), 1u);
    const auto& p = projects[0];
    EXPECT_EQ(p.name, "Resume Parser");
    EXPECT_EQ(p.url, "https://github.com/janedoe/parser");
    ASSERT_GE(p.technologies.size(), 2u);
    EXPECT_EQ(p.technologies[0], "Docker");
    EXPECT_EQ(p.technologies[1], "Redis");
    EXPECT_THAT(p.description, Contains("Parses PDF resumes into JSON"));
}

TEST(ProjectsExtractorTest, ShortEntriesAreDropped) {
    EXPECT_TRUE(extractProjects("Tiny\n\nAlso tiny").empty());
}

TEST(CertificationsExtractorTest, IssuerDateAndCredential) {
    auto certs = extractCertifications(
        "AWS Certified Solutions Architect - Amazon Web Services, Mar 2021\n"
        "Credential ID: ABC-123\n");
    ASSERT_EQ(certs.size(), 1u);
    EXPECT_EQ(certs[0].name, "AWS Certified Solutions Architect");
    EXPECT_EQ(certs[0].issuer, "Amazon Web Services");
    EXPECT_EQ(certs[0].dateIssued, "Mar 2021");
    EXPECT_EQ(certs[0].credentialId, "ABC-123");
}

TEST(LanguagesExtractorTest, BulletsAndCommas) {
    EXPECT_THAT(extractLanguages("\xE2\x80\xA2 English\n\xE2\x80\xA2 Spanish, French\n"),
                ElementsAre("English", "Spanish", "French"));
}

TEST(AchievementsExtractorTest, BulletsAndLongLines) {
    EXPECT_THAT(extractAchievements("\xE2\x80\xA2 Won hackathon 2019\n"
                                    "Short\n"
                                    "Speaker at CppCon 2022\n"),
                ElementsAre("Won hackathon 2019", "Speaker at CppCon 2022"));
}
