#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>

#include <cvpipe/io/json_serialization.h>
#include <cvpipe/parsing/resume_parser.h>
#include "../../common/test_helpers.h"

using namespace cvpipe;
using namespace cvpipe::io;
using ::testing::HasSubstr;

namespace {

parsing::CandidateProfile richProfile() {
    parsing::CandidateProfile p;
    p.contact.name = "Jane Doe";
    p.contact.email = "jane@example.com";
    p.contact.postalCode = "94105";
    p.summary = "Backend engineer";
    p.experience.push_back(
        {"Acme", "Engineer", "Remote", "Jan 2020", "Present", {"Built things"}, {"Go"}});
    p.education.push_back(
        {"State University", "B.S.", "Physics", "2012", "2016", "3.9", {"Cum laude"}, {}});
    p.skills = {"Go", "C++"};
    p.projects.push_back({"cvpipe", {"Parser"}, {"C++"}, "https://example.com", "", ""});
    p.certifications.push_back({"CKA", "CNCF", "2021", "X-1", ""});
    p.languages = {"English"};
    p.achievements = {"Speaker at a conference"};
    p.sectionsFound = {parsing::SectionType::Summary, parsing::SectionType::Experience};
    p.parsingConfidence = 0.75;
    return p;
}

} // namespace

TEST(JsonSerializationTest, ProfileUsesSnakeCaseAndOmitsAbsentContactFields) {
    auto j = toJson(richProfile());
    EXPECT_EQ(j["contact"]["postal_code"], "94105");
    EXPECT_FALSE(j["contact"].contains("phone"));
    EXPECT_EQ(j["experience"][0]["start_date"], "Jan 2020");
    EXPECT_EQ(j["education"][0]["field_of_study"], "Physics");
    EXPECT_EQ(j["certifications"][0]["credential_id"], "X-1");
    EXPECT_EQ(j["sections_found"], json::array({"summary", "experience"}));
    EXPECT_DOUBLE_EQ(j["parsing_confidence"].get<double>(), 0.75);
}

TEST(JsonSerializationTest, ProfileRoundTrip) {
    auto original = richProfile();
    auto restored = profileFromJson(toJson(original));
    ASSERT_TRUE(restored) << restored.error().message;
    EXPECT_EQ(restored.value(), original);
}

TEST(JsonSerializationTest, ParsedProfileRoundTrip) {
    parsing::ResumeParser parser;
    auto parsed = parser.parse(test::sampleResumeText(), 0.9);
    ASSERT_TRUE(parsed);
    auto restored = profileFromJson(toJson(parsed.value()));
    ASSERT_TRUE(restored);
    EXPECT_EQ(restored.value(), parsed.value());
}

TEST(JsonSerializationTest, MalformedProfileJson) {
    auto notObject = profileFromJson(json::array());
    ASSERT_FALSE(notObject);
    EXPECT_EQ(notObject.error().code, ErrorCode::InvalidData);

    auto badSection = profileFromJson(json{{"sections_found", json::array({"hobbies"})}});
    ASSERT_FALSE(badSection);
    EXPECT_EQ(badSection.error().code, ErrorCode::InvalidData);

    auto wrongType = profileFromJson(json{{"skills", 42}});
    ASSERT_FALSE(wrongType);
    EXPECT_EQ(wrongType.error().code, ErrorCode::InvalidData);
}

TEST(JsonSerializationTest, PipelineResultCarriesStagesAndScores) {
    pipeline::PipelineResult result;
    result.inputRef = "resume.pdf";
    result.processingId = "cv-1";
    result.overallSuccess = true;
    result.confidenceScore = 0.5;
    result.stageResults[pipeline::StageId::Parsing].status = pipeline::StageStatus::Completed;
    result.stageResults[pipeline::StageId::Parsing].payload = richProfile();
    result.stageResults[pipeline::StageId::Matching].status = pipeline::StageStatus::Skipped;

    auto j = toJson(result);
    EXPECT_EQ(j["input"], "resume.pdf");
    EXPECT_EQ(j["overall_success"], true);
    EXPECT_DOUBLE_EQ(j["scores"]["confidence"].get<double>(), 0.5);
    EXPECT_EQ(j["stage_results"]["parsing"]["status"], "completed");
    EXPECT_TRUE(j["stage_results"]["parsing"].contains("elapsed_ms"));
    EXPECT_EQ(j["stage_results"]["matching"]["status"], "skipped");
    EXPECT_FALSE(j["stage_results"]["matching"].contains("start_time"));
    EXPECT_EQ(j["profile"]["contact"]["name"], "Jane Doe");
    EXPECT_FALSE(j.contains("match"));

    for (const char* key : {"processing_id", "processed_at", "total_elapsed_ms"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
    for (const auto& [key, value] : j.items()) {
        EXPECT_EQ(key.find_first_of("ABCDEFGHIJKLMNOPQRSTUVWXYZ"), std::string::npos) << key;
    }
}

TEST(JsonSerializationTest, WriteJsonFile) {
    auto dir = test::make_temp_dir("cvpipe_json_");
    auto path = dir / "out.json";
    ASSERT_TRUE(writeJsonFile(path, json{{"ok", true}}));

    std::ifstream in(path);
    auto parsed = json::parse(in);
    EXPECT_EQ(parsed["ok"], true);

    auto bad = writeJsonFile(dir / "no" / "such" / "dir.json", json::object());
    EXPECT_FALSE(bad);
    std::filesystem::remove_all(dir);
}

TEST(JsonSerializationTest, InvalidUtf8IsReplacedOnOutput) {
    extraction::ExtractionResult extracted;
    extracted.text = std::string("Jane Doe \xff\xfe r\xe9sum\xe9");
    const json j = toJson(extracted);

    std::string text;
    EXPECT_NO_THROW(text = dumpJson(j));
    EXPECT_THAT(text, HasSubstr("\xEF\xBF\xBD"));
    EXPECT_THAT(text, HasSubstr("Jane Doe"));

    auto dir = test::make_temp_dir("cvpipe_json_");
    auto path = dir / "raw.json";
    ASSERT_TRUE(writeJsonFile(path, j));
    std::ifstream in(path);
    auto parsed = json::parse(in);
    EXPECT_TRUE(parsed.contains("text"));

    std::filesystem::remove_all(dir);
}
