#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <charconv>
#include <fstream>
#include <set>
#include <sstream>

#include <cvpipe/config/config_loader.h>

namespace cvpipe::config {

namespace {

constexpr uint64_t kMiB = 1024ull * 1024ull;

Error badValue(const std::string& section, const std::string& key, const std::string& value,
               const char* expected) {
    return Error{ErrorCode::InvalidArgument,
                 fmt::format("{}.{}: expected {}, got '{}'", section, key, expected, value)};
}

template <typename T> std::optional<T> parseNumber(const std::string& value) {
    T out{};
    const char* first = value.data();
    const char* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return out;
}

// Binds the keys of one section to typed setters and reports the first bad value
class SectionReader {
public:
    SectionReader(const ConfigSections& sections, std::string name)
        : name_(std::move(name)) {
        if (auto it = sections.find(name_); it != sections.end()) {
            values_ = &it->second;
        }
    }

    template <typename T> void number(const std::string& key, T& target) {
        withValue(key, [&](const std::string& v) {
            if (auto n = parseNumber<T>(v); n) {
                target = *n;
                return true;
            }
            return false;
        }, "a number");
    }

    void flag(const std::string& key, bool& target) {
        withValue(key, [&](const std::string& v) {
            if (auto b = parse_bool(v); b) {
                target = *b;
                return true;
            }
            return false;
        }, "a boolean");
    }

    void text(const std::string& key, std::string& target) {
        withValue(key, [&](const std::string& v) {
            target = v;
            return true;
        }, "a string");
    }

    template <typename Fn> void custom(const std::string& key, const char* expected, Fn&& fn) {
        withValue(key, std::forward<Fn>(fn), expected);
    }

    void warnUnknown() const {
        if (!values_) {
            return;
        }
        for (const auto& [key, value] : *values_) {
            if (known_.find(key) == known_.end()) {
                spdlog::debug("Ignoring unknown config key {}.{}", name_, key);
            }
        }
    }

    const std::optional<Error>& error() const { return error_; }

private:
    template <typename Fn> void withValue(const std::string& key, Fn&& fn, const char* expected) {
        known_.insert(key);
        if (!values_ || error_) {
            return;
        }
        auto it = values_->find(key);
        if (it == values_->end()) {
            return;
        }
        if (!fn(it->second)) {
            error_ = badValue(name_, key, it->second, expected);
        }
    }

    std::string name_;
    const std::map<std::string, std::string>* values_ = nullptr;
    std::set<std::string> known_;
    std::optional<Error> error_;
};

Result<std::string> readTextFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::FileNotFound,
                     fmt::format("Cannot read job description: {}", path.string())};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

Result<pipeline::PipelineConfig> applyConfigSections(const ConfigSections& sections,
                                                     pipeline::PipelineConfig base,
                                                     const std::filesystem::path& baseDir) {
    auto& cfg = base;

    SectionReader extractionSection(sections, "extraction");
    extractionSection.custom("method", "an engine name or 'auto'", [&](const std::string& v) {
        if (v == "auto" || v.empty()) {
            cfg.extraction.preferredMethod.reset();
            return true;
        }
        auto id = extraction::engineFromString(v);
        if (!id) {
            return false;
        }
        cfg.extraction.preferredMethod = *id;
        return true;
    });
    extractionSection.flag("use_fallback", cfg.extraction.useFallback);
    extractionSection.custom("max_pages", "a page count (0 = all)", [&](const std::string& v) {
        auto n = parseNumber<size_t>(v);
        if (!n) {
            return false;
        }
        cfg.extraction.maxPages = *n == 0 ? std::nullopt : std::optional<size_t>(*n);
        return true;
    });
    extractionSection.flag("clean_text", cfg.extraction.cleanText);
    extractionSection.custom("ocr_languages", "a list of languages", [&](const std::string& v) {
        auto langs = parse_string_list(v);
        if (langs.empty()) {
            return false;
        }
        cfg.extraction.ocrLanguages = std::move(langs);
        return true;
    });
    extractionSection.number("ocr_dpi", cfg.extraction.ocrDpi);
    extractionSection.text("pdftotext_path", cfg.extraction.pdftotextPath);
    extractionSection.custom("max_file_size_mb", "a size in MiB", [&](const std::string& v) {
        auto n = parseNumber<uint64_t>(v);
        if (!n || *n == 0) {
            return false;
        }
        cfg.extraction.maxFileSize = *n * kMiB;
        return true;
    });
    extractionSection.custom("small_file_mb", "a size in MiB", [&](const std::string& v) {
        auto n = parseNumber<uint64_t>(v);
        if (!n) {
            return false;
        }
        cfg.engine.thresholds.smallFileBytes = *n * kMiB;
        return true;
    });
    extractionSection.custom("medium_file_mb", "a size in MiB", [&](const std::string& v) {
        auto n = parseNumber<uint64_t>(v);
        if (!n) {
            return false;
        }
        cfg.engine.thresholds.mediumFileBytes = *n * kMiB;
        return true;
    });
    extractionSection.number("fallback_min_text_length", cfg.engine.fallback.minTextLength);
    extractionSection.number("fallback_min_confidence", cfg.engine.fallback.minConfidence);
    extractionSection.number("fallback_max_special_char_ratio",
                             cfg.engine.fallback.maxSpecialCharRatio);
    if (extractionSection.error()) {
        return *extractionSection.error();
    }
    extractionSection.warnUnknown();

    SectionReader pipelineSection(sections, "pipeline");
    pipelineSection.flag("enable_enhancement", cfg.enableEnhancement);
    pipelineSection.flag("enable_matching", cfg.enableMatching);
    pipelineSection.flag("enable_validation", cfg.enableValidation);
    pipelineSection.number("min_confidence_threshold", cfg.minConfidenceThreshold);
    pipelineSection.flag("include_raw_text", cfg.includeRawText);
    pipelineSection.number("workers", cfg.workers);
    pipelineSection.custom("stage_timeout_seconds", "seconds", [&](const std::string& v) {
        auto n = parseNumber<long long>(v);
        if (!n || *n < 0) {
            return false;
        }
        cfg.stageTimeout = std::chrono::seconds(*n);
        return true;
    });
    std::optional<Error> jobError;
    pipelineSection.custom("job_description_file", "a readable file", [&](const std::string& v) {
        auto path = expand_tilde(v);
        if (path.is_relative() && !baseDir.empty()) {
            path = baseDir / path;
        }
        auto text = readTextFile(path);
        if (!text) {
            jobError = text.error();
            return true;
        }
        cfg.jobDescription = std::move(text).value();
        return true;
    });
    if (pipelineSection.error()) {
        return *pipelineSection.error();
    }
    if (jobError) {
        return *jobError;
    }
    pipelineSection.warnUnknown();

    SectionReader scoringSection(sections, "scoring");
    scoringSection.number("extraction", cfg.scoring.extraction);
    scoringSection.number("parsing", cfg.scoring.parsing);
    scoringSection.number("enhancement", cfg.scoring.enhancement);
    scoringSection.number("no_enhancement_base", cfg.scoring.noEnhancementBase);
    scoringSection.number("contact", cfg.scoring.contact);
    scoringSection.number("experience", cfg.scoring.experience);
    scoringSection.number("education", cfg.scoring.education);
    scoringSection.number("skills", cfg.scoring.skills);
    scoringSection.number("summary", cfg.scoring.summary);
    if (scoringSection.error()) {
        return *scoringSection.error();
    }
    scoringSection.warnUnknown();

    return base;
}

Result<pipeline::PipelineConfig> loadPipelineConfig(const std::filesystem::path& path,
                                                    pipeline::PipelineConfig base) {
    auto sections = parse_config_file(path);
    if (!sections) {
        return sections.error();
    }
    spdlog::debug("Loaded config from {}", path.string());
    return applyConfigSections(sections.value(), std::move(base), path.parent_path());
}

} // namespace cvpipe::config
