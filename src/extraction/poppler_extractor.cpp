#include <spdlog/spdlog.h>
#include <cvpipe/extraction/document.h>
#include <cvpipe/extraction/poppler_extractor.h>

// Poppler headers
#include <poppler/cpp/poppler-document.h>
#include <poppler/cpp/poppler-global.h>
#include <poppler/cpp/poppler-page.h>

#include <algorithm>
#include <climits>
#include <memory>

namespace cvpipe::extraction {

namespace {

std::string toUtf8(const poppler::ustring& s) {
    poppler::byte_array bytes = s.to_utf8();
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

Result<ExtractionResult> PopplerExtractor::extract(const Document& document,
                                                   const ExtractionConfig& config,
                                                   const core::StopCondition& stop) {
    if (document.byteSize() > static_cast<size_t>(INT_MAX)) {
        return Error{ErrorCode::InvalidArgument, "Document too large for poppler"};
    }

    std::unique_ptr<poppler::document> doc(poppler::document::load_from_raw_data(
        document.data(), static_cast<int>(document.byteSize())));
    if (!doc) {
        return Error{ErrorCode::InvalidData, "poppler failed to load " + document.displayName()};
    }
    if (doc->is_locked()) {
        return Error{ErrorCode::PermissionDenied, "PDF is password protected"};
    }

    int totalPages = doc->pages();
    if (totalPages <= 0) {
        return Error{ErrorCode::InvalidData, "PDF has no pages"};
    }

    ExtractionResult result;
    result.method = EngineId::Poppler;
    result.pageCount = static_cast<size_t>(totalPages);
    extractMetadata(*doc, result);

    int limit = totalPages;
    if (config.maxPages) {
        limit = static_cast<int>(std::min<size_t>(*config.maxPages, result.pageCount));
    }

    std::string text;
    for (int i = 0; i < limit; ++i) {
        if (stop.cancelled()) {
            return Error{ErrorCode::OperationCancelled, "Extraction cancelled"};
        }
        if (stop.expired()) {
            return Error{ErrorCode::Timeout, "Extraction deadline exceeded"};
        }

        std::unique_ptr<poppler::page> page(doc->create_page(i));
        if (!page) {
            result.errors.push_back("page " + std::to_string(i + 1) + ": failed to open page");
            continue;
        }

        std::string pageText = toUtf8(page->text(poppler::rectf(), poppler::page::physical_layout));
        if (pageText.find_first_not_of(" \t\r\n\f") == std::string::npos) {
            continue;
        }
        if (!text.empty()) {
            text += "\n\n";
        }
        text += pageText;
    }

    result.text = std::move(text);
    spdlog::debug("poppler: {} pages, {} chars from {}", limit, result.text.size(),
                  document.displayName());
    return result;
}

void PopplerExtractor::extractMetadata(const poppler::document& doc, ExtractionResult& result) {
    for (const auto& [key, name] : {std::pair{"Title", "title"}, std::pair{"Author", "author"},
                                    std::pair{"Creator", "creator"},
                                    std::pair{"Producer", "producer"}}) {
        std::string value = toUtf8(doc.info_key(key));
        if (!value.empty()) {
            result.metadata[name] = value;
        }
    }

    int major = 0;
    int minor = 0;
    doc.get_pdf_version(&major, &minor);
    result.metadata["pdf_version"] = std::to_string(major) + "." + std::to_string(minor);
}

} // namespace cvpipe::extraction
