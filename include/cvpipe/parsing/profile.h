#pragma once

#include <array>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace cvpipe::parsing {

enum class SectionType {
    Contact,
    Summary,
    Experience,
    Education,
    Skills,
    Projects,
    Certifications,
    Languages,
    Achievements
};

inline constexpr std::array<SectionType, 9> kAllSections{
    SectionType::Contact,        SectionType::Summary,   SectionType::Experience,
    SectionType::Education,      SectionType::Skills,    SectionType::Projects,
    SectionType::Certifications, SectionType::Languages, SectionType::Achievements};

const char* sectionName(SectionType type);
std::optional<SectionType> sectionFromName(std::string_view name);

struct ContactInfo {
    std::optional<std::string> name;
    std::optional<std::string> email;
    std::optional<std::string> phone;
    std::optional<std::string> linkedin;
    std::optional<std::string> github;
    std::optional<std::string> website;
    std::optional<std::string> address;
    std::optional<std::string> city;
    std::optional<std::string> state;
    std::optional<std::string> country;
    std::optional<std::string> postalCode;

    bool operator==(const ContactInfo&) const = default;
};

struct WorkExperience {
    std::string company;
    std::string position;
    std::string location;
    std::string startDate; // free text as written, e.g. "Jan 2020"
    std::string endDate;   // free text, e.g. "Present"
    std::vector<std::string> description;
    std::vector<std::string> technologies;

    bool operator==(const WorkExperience&) const = default;
};

struct Education {
    std::string institution;
    std::string degree;
    std::string fieldOfStudy;
    std::string startDate;
    std::string endDate; // graduation year
    std::string gpa;
    std::vector<std::string> honors;
    std::vector<std::string> coursework;

    bool operator==(const Education&) const = default;
};

struct Project {
    std::string name;
    std::vector<std::string> description;
    std::vector<std::string> technologies;
    std::string url;
    std::string startDate;
    std::string endDate;

    bool operator==(const Project&) const = default;
};

struct Certification {
    std::string name;
    std::string issuer;
    std::string dateIssued;
    std::string credentialId;
    std::string url;

    bool operator==(const Certification&) const = default;
};

/**
 * @brief Structured candidate profile produced by the parser
 */
struct CandidateProfile {
    ContactInfo contact;
    std::vector<WorkExperience> experience;
    std::vector<Education> education;
    std::vector<std::string> skills; // case-insensitively unique, first-seen order
    std::vector<Project> projects;
    std::vector<Certification> certifications;
    std::vector<std::string> languages;
    std::vector<std::string> achievements;
    std::string summary;
    std::set<SectionType> sectionsFound;
    double parsingConfidence = 0.0;

    bool operator==(const CandidateProfile&) const = default;
};

} // namespace cvpipe::parsing
