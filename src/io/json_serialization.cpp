#include <fmt/format.h>

#include <fstream>

#include <cvpipe/core/ids.h>
#include <cvpipe/io/json_serialization.h>

namespace cvpipe::io {

namespace {

void putOptional(json& j, const char* key, const std::optional<std::string>& value) {
    if (value) {
        j[key] = *value;
    }
}

void getOptional(const json& j, const char* key, std::optional<std::string>& out) {
    if (j.contains(key) && j[key].is_string()) {
        out = j[key].get<std::string>();
    }
}

std::vector<std::string> stringList(const json& j, const char* key) {
    if (!j.contains(key)) {
        return {};
    }
    return j.at(key).get<std::vector<std::string>>();
}

std::string isoTime(TimePoint tp) {
    return core::isoTimestamp(tp);
}

} // namespace

json toJson(const parsing::CandidateProfile& profile) {
    json contact = json::object();
    putOptional(contact, "name", profile.contact.name);
    putOptional(contact, "email", profile.contact.email);
    putOptional(contact, "phone", profile.contact.phone);
    putOptional(contact, "linkedin", profile.contact.linkedin);
    putOptional(contact, "github", profile.contact.github);
    putOptional(contact, "website", profile.contact.website);
    putOptional(contact, "address", profile.contact.address);
    putOptional(contact, "city", profile.contact.city);
    putOptional(contact, "state", profile.contact.state);
    putOptional(contact, "country", profile.contact.country);
    putOptional(contact, "postal_code", profile.contact.postalCode);

    json experience = json::array();
    for (const auto& e : profile.experience) {
        experience.push_back({{"company", e.company},
                              {"position", e.position},
                              {"location", e.location},
                              {"start_date", e.startDate},
                              {"end_date", e.endDate},
                              {"description", e.description},
                              {"technologies", e.technologies}});
    }

    json education = json::array();
    for (const auto& e : profile.education) {
        education.push_back({{"institution", e.institution},
                             {"degree", e.degree},
                             {"field_of_study", e.fieldOfStudy},
                             {"start_date", e.startDate},
                             {"end_date", e.endDate},
                             {"gpa", e.gpa},
                             {"honors", e.honors},
                             {"coursework", e.coursework}});
    }

    json projects = json::array();
    for (const auto& p : profile.projects) {
        projects.push_back({{"name", p.name},
                            {"description", p.description},
                            {"technologies", p.technologies},
                            {"url", p.url},
                            {"start_date", p.startDate},
                            {"end_date", p.endDate}});
    }

    json certifications = json::array();
    for (const auto& c : profile.certifications) {
        certifications.push_back({{"name", c.name},
                                  {"issuer", c.issuer},
                                  {"date_issued", c.dateIssued},
                                  {"credential_id", c.credentialId},
                                  {"url", c.url}});
    }

    json sections = json::array();
    for (auto type : profile.sectionsFound) {
        sections.push_back(parsing::sectionName(type));
    }

    json j;
    j["contact"] = std::move(contact);
    j["summary"] = profile.summary;
    j["experience"] = std::move(experience);
    j["education"] = std::move(education);
    j["skills"] = profile.skills;
    j["projects"] = std::move(projects);
    j["certifications"] = std::move(certifications);
    j["languages"] = profile.languages;
    j["achievements"] = profile.achievements;
    j["sections_found"] = std::move(sections);
    j["parsing_confidence"] = profile.parsingConfidence;
    return j;
}

json toJson(const extraction::ExtractionResult& extraction) {
    json attempts = json::array();
    for (const auto& a : extraction.attempts) {
        json attempt{{"engine", extraction::engineName(a.engine)},
                     {"text_length", a.textLength},
                     {"confidence", a.confidence}};
        if (!a.error.empty()) {
            attempt["error"] = a.error;
        }
        attempts.push_back(std::move(attempt));
    }

    json j;
    j["method"] = extraction::engineName(extraction.method);
    j["confidence"] = extraction.confidence;
    j["page_count"] = extraction.pageCount;
    j["text_length"] = extraction.text.size();
    j["text"] = extraction.text;
    j["errors"] = extraction.errors;
    j["metadata"] = extraction.metadata;
    j["attempts"] = std::move(attempts);
    j["elapsed_ms"] = extraction.elapsed.count();
    return j;
}

json toJson(const services::EnhancementReport& report) {
    return {{"overall_score", report.overallScore},
            {"ats_compatibility", report.atsCompatibility},
            {"estimated_experience_level", report.estimatedExperienceLevel},
            {"strengths", report.strengths},
            {"weaknesses", report.weaknesses},
            {"suggestions", report.suggestions},
            {"suitable_roles", report.suitableRoles},
            {"skill_gaps", report.skillGaps},
            {"missing_keywords", report.missingKeywords}};
}

json toJson(const services::MatchReport& report) {
    return {{"overall_match", report.overallMatch},
            {"skill_match", report.skillMatch},
            {"keyword_match", report.keywordMatch},
            {"matched_skills", report.matchedSkills},
            {"missing_skills", report.missingSkills}};
}

json toJson(const pipeline::PipelineResult& result) {
    json stages = json::object();
    for (const auto& [id, stage] : result.stageResults) {
        json s;
        s["status"] = pipeline::statusName(stage.status);
        s["success"] = stage.success;
        if (stage.status != pipeline::StageStatus::Skipped &&
            stage.status != pipeline::StageStatus::Pending) {
            s["start_time"] = isoTime(stage.startTime);
            s["end_time"] = isoTime(stage.endTime);
            s["elapsed_ms"] = stage.elapsed().count();
        }
        if (stage.error) {
            s["error"] = {{"code", errorToString(stage.error->code)},
                          {"message", stage.error->message}};
        }
        if (!stage.warnings.empty()) {
            s["warnings"] = stage.warnings;
        }
        stages[pipeline::stageName(id)] = std::move(s);
    }

    json j;
    j["input"] = result.inputRef;
    j["processing_id"] = result.processingId;
    j["processed_at"] = result.processedAt;
    j["overall_success"] = result.overallSuccess;
    j["cancelled"] = result.cancelled;
    j["scores"] = {{"confidence", result.confidenceScore},
                   {"quality", result.qualityScore},
                   {"completeness", result.completenessScore}};
    j["stage_results"] = std::move(stages);
    j["errors"] = result.errors;
    j["warnings"] = result.warnings;
    j["total_elapsed_ms"] = result.totalElapsed.count();

    if (const auto* extraction = result.extraction()) {
        j["extraction"] = toJson(*extraction);
    }
    if (const auto* profile = result.profile()) {
        j["profile"] = toJson(*profile);
    }
    if (const auto* enhancement = result.enhancement()) {
        j["enhancement"] = toJson(*enhancement);
    }
    if (const auto* match = result.match()) {
        j["match"] = toJson(*match);
    }
    if (const auto* validation = result.validation()) {
        j["validation"] = {{"passed", validation->passed()},
                           {"warnings", validation->warnings}};
    }
    return j;
}

Result<parsing::CandidateProfile> profileFromJson(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidData, "Profile JSON must be an object"};
    }

    try {
        parsing::CandidateProfile profile;

        if (j.contains("contact")) {
            const auto& c = j.at("contact");
            getOptional(c, "name", profile.contact.name);
            getOptional(c, "email", profile.contact.email);
            getOptional(c, "phone", profile.contact.phone);
            getOptional(c, "linkedin", profile.contact.linkedin);
            getOptional(c, "github", profile.contact.github);
            getOptional(c, "website", profile.contact.website);
            getOptional(c, "address", profile.contact.address);
            getOptional(c, "city", profile.contact.city);
            getOptional(c, "state", profile.contact.state);
            getOptional(c, "country", profile.contact.country);
            getOptional(c, "postal_code", profile.contact.postalCode);
        }

        profile.summary = j.value("summary", "");

        for (const auto& e : j.value("experience", json::array())) {
            parsing::WorkExperience w;
            w.company = e.value("company", "");
            w.position = e.value("position", "");
            w.location = e.value("location", "");
            w.startDate = e.value("start_date", "");
            w.endDate = e.value("end_date", "");
            w.description = stringList(e, "description");
            w.technologies = stringList(e, "technologies");
            profile.experience.push_back(std::move(w));
        }

        for (const auto& e : j.value("education", json::array())) {
            parsing::Education ed;
            ed.institution = e.value("institution", "");
            ed.degree = e.value("degree", "");
            ed.fieldOfStudy = e.value("field_of_study", "");
            ed.startDate = e.value("start_date", "");
            ed.endDate = e.value("end_date", "");
            ed.gpa = e.value("gpa", "");
            ed.honors = stringList(e, "honors");
            ed.coursework = stringList(e, "coursework");
            profile.education.push_back(std::move(ed));
        }

        profile.skills = stringList(j, "skills");

        for (const auto& p : j.value("projects", json::array())) {
            parsing::Project proj;
            proj.name = p.value("name", "");
            proj.description = stringList(p, "description");
            proj.technologies = stringList(p, "technologies");
            proj.url = p.value("url", "");
            proj.startDate = p.value("start_date", "");
            proj.endDate = p.value("end_date", "");
            profile.projects.push_back(std::move(proj));
        }

        for (const auto& c : j.value("certifications", json::array())) {
            parsing::Certification cert;
            cert.name = c.value("name", "");
            cert.issuer = c.value("issuer", "");
            cert.dateIssued = c.value("date_issued", "");
            cert.credentialId = c.value("credential_id", "");
            cert.url = c.value("url", "");
            profile.certifications.push_back(std::move(cert));
        }

        profile.languages = stringList(j, "languages");
        profile.achievements = stringList(j, "achievements");

        for (const auto& name : stringList(j, "sections_found")) {
            auto type = parsing::sectionFromName(name);
            if (!type) {
                return Error{ErrorCode::InvalidData, fmt::format("Unknown section '{}'", name)};
            }
            profile.sectionsFound.insert(*type);
        }

        profile.parsingConfidence = j.value("parsing_confidence", 0.0);
        return profile;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, fmt::format("Malformed profile JSON: {}", e.what())};
    }
}

std::string dumpJson(const json& j) {
    return j.dump(2, ' ', false, json::error_handler_t::replace);
}

Result<void> writeJsonFile(const std::filesystem::path& path, const json& j) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::PermissionDenied,
                     fmt::format("Cannot open {} for writing", path.string())};
    }
    out << dumpJson(j) << '\n';
    if (!out) {
        return Error{ErrorCode::InternalError, fmt::format("Failed writing {}", path.string())};
    }
    return {};
}

} // namespace cvpipe::io
