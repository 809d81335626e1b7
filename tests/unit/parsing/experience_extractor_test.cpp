#include <gtest/gtest.h>

#include <algorithm>

#include <cvpipe/parsing/field_extractors.h>

using namespace cvpipe::parsing;

TEST(ExperienceExtractorTest, ThreeEntriesInOrder) {
    const std::string section = "Senior Engineer at Acme Corp\n"
                                "Jan 2020 - Present\n"
                                "\xE2\x80\xA2 Led migration of core services to Kubernetes\n"
                                "\n"
                                "Software Engineer at Globex\n"
                                "Mar 2017 - Dec 2019\n"
                                "\xE2\x80\xA2 Built data ingestion services in Python\n"
                                "\n"
                                "Intern at Initech\n"
                                "2016 - 2017\n"
                                "\xE2\x80\xA2 Wrote internal tooling for the QA team\n";

    auto jobs = extractExperience(section);
    ASSERT_EQ(jobs.size(), 3u);

    EXPECT_EQ(jobs[0].company, "Acme Corp");
    EXPECT_EQ(jobs[0].position, "Senior Engineer");
    EXPECT_EQ(jobs[0].startDate, "Jan 2020");
    EXPECT_EQ(jobs[0].endDate, "Present");
    ASSERT_EQ(jobs[0].description.size(), 1u);
    EXPECT_EQ(jobs[0].description[0], "Led migration of core services to Kubernetes");
    EXPECT_NE(std::find(jobs[0].technologies.begin(), jobs[0].technologies.end(), "Kubernetes"),
              jobs[0].technologies.end());

    EXPECT_EQ(jobs[1].company, "Globex");
    EXPECT_EQ(jobs[1].startDate, "Mar 2017");
    EXPECT_EQ(jobs[1].endDate, "Dec 2019");

    EXPECT_EQ(jobs[2].company, "Initech");
    EXPECT_EQ(jobs[2].position, "Intern");
    EXPECT_EQ(jobs[2].startDate, "2016");
    EXPECT_EQ(jobs[2].endDate, "2017");
}

TEST(ExperienceExtractorTest, HeaderSeparators) {
    auto dash = extractExperience("Acme Corp - Staff Engineer\n"
                                  "Owned the billing platform end to end for four years");
    ASSERT_EQ(dash.size(), 1u);
    EXPECT_EQ(dash[0].company, "Acme Corp");
    EXPECT_EQ(dash[0].position, "Staff Engineer");

    auto pipe = extractExperience("Staff Engineer | Acme Corp\n"
                                  "Owned the billing platform end to end for four years");
    ASSERT_EQ(pipe.size(), 1u);
    EXPECT_EQ(pipe[0].company, "Acme Corp");
    EXPECT_EQ(pipe[0].position, "Staff Engineer");
}

TEST(ExperienceExtractorTest, DatesOnHeaderLineAndLocation) {
    auto jobs = extractExperience("Data Engineer at Initech Jan 2018 - Feb 2020\n"
                                  "Austin, TX\n"
                                  "- Scaled the nightly batch jobs");
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0].position, "Data Engineer");
    EXPECT_EQ(jobs[0].company, "Initech");
    EXPECT_EQ(jobs[0].startDate, "Jan 2018");
    EXPECT_EQ(jobs[0].endDate, "Feb 2020");
    EXPECT_EQ(jobs[0].location, "Austin, TX");
    ASSERT_EQ(jobs[0].description.size(), 1u);
    EXPECT_EQ(jobs[0].description[0], "Scaled the nightly batch jobs");
}

TEST(ExperienceExtractorTest, ShortFragmentsAreDropped) {
    EXPECT_TRUE(extractExperience("Acme Corp\n2019").empty());
    EXPECT_TRUE(extractExperience("").empty());
}

TEST(ExperienceExtractorTest, DateRangeForms) {
    auto months = findDateRange("Sept. 2019 to Present");
    ASSERT_TRUE(months.has_value());
    EXPECT_EQ(months->start, "Sept. 2019");
    EXPECT_EQ(months->end, "Present");

    auto years = findDateRange("Acme (2015 \xE2\x80\x93 2018)");
    ASSERT_TRUE(years.has_value());
    EXPECT_EQ(years->start, "2015");
    EXPECT_EQ(years->end, "2018");

    // Numeric month/day ranges are not recognized
    EXPECT_FALSE(findDateRange("03/01/2019 - 04/01/2020").has_value());
    EXPECT_FALSE(findDateRange("Mayor of nothing").has_value());
}

TEST(EducationExtractorTest, DegreeInstitutionAndYears) {
    auto schools = extractEducation("Bachelor of Science in Computer Science\n"
                                    "State University\n"
                                    "2012 - 2016\n"
                                    "GPA: 3.8/4.0");
    ASSERT_EQ(schools.size(), 1u);
    EXPECT_EQ(schools[0].degree, "Bachelor of Science");
    EXPECT_EQ(schools[0].fieldOfStudy, "Computer Science");
    EXPECT_EQ(schools[0].institution, "State University");
    EXPECT_EQ(schools[0].startDate, "2012");
    EXPECT_EQ(schools[0].endDate, "2016");
    EXPECT_EQ(schools[0].gpa, "3.8");
}
