#include <spdlog/spdlog.h>
#include <cvpipe/core/ids.h>
#include <cvpipe/extraction/document.h>
#include <cvpipe/extraction/pdftotext_extractor.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sys/wait.h>

namespace cvpipe::extraction {

namespace {

// Removes the spooled copy of an in-memory document when extraction ends.
class TempFileGuard {
public:
    explicit TempFileGuard(std::filesystem::path p) : path_(std::move(p)) {}
    ~TempFileGuard() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
        }
    }
    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

private:
    std::filesystem::path path_;
};

Result<std::filesystem::path> spoolToTempFile(const Document& document) {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return Error{ErrorCode::InternalError, "No temporary directory: " + ec.message()};
    }
    auto path = dir / (core::generateId("cvpipe") + ".pdf");
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return Error{ErrorCode::PermissionDenied, "Cannot create " + path.string()};
    }
    out.write(document.data(), static_cast<std::streamsize>(document.byteSize()));
    if (!out) {
        return Error{ErrorCode::InternalError, "Failed writing " + path.string()};
    }
    return path;
}

} // namespace

std::string shellQuote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

bool PdftotextExtractor::isAvailable(const std::string& executable) {
    std::string test = "command -v " + shellQuote(executable) + " >/dev/null 2>&1";
    return std::system(test.c_str()) == 0;
}

Result<std::string> PdftotextExtractor::runCommand(const std::string& command) {
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        return Error{ErrorCode::ExtractionFailed, "Failed to open pipe to pdftotext"};
    }

    std::string output;
    char buffer[4096];
    size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        output.append(buffer, n);
    }

    int rc = pclose(pipe);
    if (rc != 0) {
        int code = WIFEXITED(rc) ? WEXITSTATUS(rc) : rc;
        return Error{ErrorCode::ExtractionFailed,
                     "pdftotext exited with status " + std::to_string(code)};
    }
    return output;
}

Result<ExtractionResult> PdftotextExtractor::extract(const Document& document,
                                                     const ExtractionConfig& config,
                                                     const core::StopCondition& stop) {
    if (stop.cancelled()) {
        return Error{ErrorCode::OperationCancelled, "Extraction cancelled"};
    }

    std::filesystem::path input;
    std::filesystem::path spooled;
    if (document.path()) {
        input = *document.path();
    } else {
        auto tmp = spoolToTempFile(document);
        if (!tmp) {
            return tmp.error();
        }
        spooled = tmp.value();
        input = spooled;
    }
    TempFileGuard guard(spooled);

    std::string cmd = shellQuote(config.pdftotextPath) + " -layout -q -enc UTF-8";
    if (config.maxPages) {
        cmd += " -l " + std::to_string(*config.maxPages);
    }
    cmd += " " + shellQuote(input.string()) + " - 2>/dev/null";

    auto output = runCommand(cmd);
    if (!output) {
        return output.error();
    }

    // Pages are separated by form feeds; keep non-blank pages joined by a blank line
    ExtractionResult result;
    result.method = EngineId::Pdftotext;
    const std::string& raw = output.value();
    size_t start = 0;
    while (start <= raw.size()) {
        size_t ff = raw.find('\f', start);
        std::string page = raw.substr(start, ff == std::string::npos ? std::string::npos
                                                                     : ff - start);
        bool last = ff == std::string::npos;
        // A trailing form feed closes the final page rather than opening a new one
        if (!(last && page.empty())) {
            ++result.pageCount;
        }
        if (page.find_first_not_of(" \t\r\n") != std::string::npos) {
            if (!result.text.empty()) {
                result.text += "\n\n";
            }
            result.text += page;
        }
        if (last) {
            break;
        }
        start = ff + 1;
    }
    spdlog::debug("pdftotext: {} pages, {} chars from {}", result.pageCount, result.text.size(),
                  document.displayName());
    return result;
}

} // namespace cvpipe::extraction
