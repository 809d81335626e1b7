// Shared helpers for cvpipe unit tests
#pragma once

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <cvpipe/extraction/document.h>
#include <cvpipe/extraction/text_extractor.h>

namespace cvpipe::test {

inline std::filesystem::path make_temp_dir(const std::string& prefix = "cvpipe_test_") {
    auto base = std::filesystem::temp_directory_path();
    for (int i = 0; i < 1000; ++i) {
        auto p = base / (prefix + std::to_string(::getpid()) + "_" + std::to_string(i));
        if (std::filesystem::create_directories(p))
            return p;
    }
    return base;
}

inline std::filesystem::path write_file(const std::filesystem::path& p, const std::string& data) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary);
    ofs << data;
    return p;
}

/// A complete, well-formed résumé in plain text
inline std::string sampleResumeText() {
    return "Jane Doe\n"
           "jane.doe@example.com | (415) 555-0100\n"
           "San Francisco, CA 94105\n"
           "linkedin.com/in/janedoe\n"
           "\n"
           "Summary\n"
           "Backend engineer with eight years of experience building distributed systems "
           "and data pipelines.\n"
           "\n"
           "Experience\n"
           "Senior Engineer at Acme Corp\n"
           "Jan 2020 - Present\n"
           "\xE2\x80\xA2 Led migration of core services to Kubernetes and Docker\n"
           "\xE2\x80\xA2 Designed REST APIs used by forty internal teams\n"
           "\n"
           "Software Engineer at Globex\n"
           "Mar 2017 - Dec 2019\n"
           "\xE2\x80\xA2 Built data ingestion services in Python and PostgreSQL\n"
           "\n"
           "Education\n"
           "Bachelor of Science in Computer Science\n"
           "State University\n"
           "2012 - 2016\n"
           "\n"
           "Skills\n"
           "Python, C++, Docker, Kubernetes, PostgreSQL, Git\n";
}

/// Bytes that Document classifies as a PDF; content is never parsed by fake engines
inline extraction::Document fakePdfDocument(const std::string& name = "resume.pdf",
                                            size_t padding = 64) {
    std::string raw = "%PDF-1.4\n";
    raw.append(padding, 'x');
    std::vector<std::byte> bytes(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        bytes[i] = static_cast<std::byte>(raw[i]);
    }
    return extraction::Document::fromBuffer(std::move(bytes), name);
}

/**
 * Extractor whose output is scripted by the test
 */
class FakeExtractor : public extraction::ITextExtractor {
public:
    using Producer = std::function<Result<extraction::ExtractionResult>(
        const extraction::Document&, const core::StopCondition&)>;

    FakeExtractor(extraction::EngineId id, Producer producer)
        : id_(id), producer_(std::move(producer)) {}

    /// Always succeeds with the given text
    static std::unique_ptr<FakeExtractor> returning(extraction::EngineId id, std::string text,
                                                    int* calls = nullptr) {
        return std::make_unique<FakeExtractor>(
            id, [text = std::move(text), calls](const extraction::Document&,
                                                const core::StopCondition&)
                    -> Result<extraction::ExtractionResult> {
                if (calls) {
                    ++*calls;
                }
                extraction::ExtractionResult r;
                r.text = text;
                r.pageCount = 1;
                return r;
            });
    }

    /// Always fails with the given code
    static std::unique_ptr<FakeExtractor> failing(extraction::EngineId id, ErrorCode code,
                                                  std::string message, int* calls = nullptr) {
        return std::make_unique<FakeExtractor>(
            id, [code, message = std::move(message), calls](const extraction::Document&,
                                                            const core::StopCondition&)
                    -> Result<extraction::ExtractionResult> {
                if (calls) {
                    ++*calls;
                }
                return Error{code, message};
            });
    }

    Result<extraction::ExtractionResult> extract(const extraction::Document& document,
                                                 const extraction::ExtractionConfig&,
                                                 const core::StopCondition& stop) override {
        return producer_(document, stop);
    }

    extraction::EngineId id() const override { return id_; }

private:
    extraction::EngineId id_;
    Producer producer_;
};

} // namespace cvpipe::test
