#include <spdlog/spdlog.h>
#include <cvpipe/extraction/document.h>
#include <cvpipe/extraction/method_selector.h>
#include <cvpipe/extraction/ocr_extractor.h>
#include <cvpipe/extraction/pdftotext_extractor.h>

namespace cvpipe::extraction {

EngineCapabilities EngineCapabilities::probe(const ExtractionConfig& config) {
    EngineCapabilities caps{EngineId::Qpdf, EngineId::Poppler, EngineId::PlainText};

    if (PdftotextExtractor::isAvailable(config.pdftotextPath)) {
        caps.add(EngineId::Pdftotext);
    } else {
        spdlog::debug("pdftotext executable '{}' not found; engine disabled",
                      config.pdftotextPath);
    }

    if (OcrExtractor::isAvailable(config.ocrLanguages)) {
        caps.add(EngineId::Ocr);
    } else {
        spdlog::debug("Tesseract unavailable for languages '{}'; OCR disabled",
                      OcrExtractor::joinLanguages(config.ocrLanguages));
    }

    spdlog::debug("Extraction engines available: {}", caps.describe());
    return caps;
}

bool EngineCapabilities::hasDirectPdfEngine() const {
    return has(EngineId::Qpdf) || has(EngineId::Poppler) || has(EngineId::Pdftotext);
}

std::string EngineCapabilities::describe() const {
    std::string out;
    for (auto id : available_) {
        if (!out.empty()) {
            out += ", ";
        }
        out += engineName(id);
    }
    return out.empty() ? "none" : out;
}

Result<EngineId> selectMethod(const Document& document, const EngineCapabilities& caps,
                              const SelectionThresholds& thresholds) {
    if (document.kind() == DocumentKind::PlainText) {
        if (caps.has(EngineId::PlainText)) {
            return EngineId::PlainText;
        }
        return Error{ErrorCode::ExtractionFailed, "No engine available for plain text documents"};
    }

    EngineId preferred;
    if (document.byteSize() < thresholds.smallFileBytes) {
        preferred = EngineId::Qpdf;
    } else if (document.byteSize() < thresholds.mediumFileBytes) {
        preferred = EngineId::Poppler;
    } else {
        preferred = EngineId::Pdftotext;
    }
    if (caps.has(preferred)) {
        return preferred;
    }

    for (auto id : kFallbackOrder) {
        if (id != EngineId::Ocr && caps.has(id)) {
            return id;
        }
    }
    if (caps.has(EngineId::Ocr)) {
        return EngineId::Ocr;
    }
    return Error{ErrorCode::ExtractionFailed, "No PDF extraction engine available"};
}

} // namespace cvpipe::extraction
