#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <cvpipe/core/cancellation.h>
#include <cvpipe/core/types.h>

namespace cvpipe::extraction {

class Document;

/**
 * @brief Closed set of text extraction engines
 */
enum class EngineId {
    Qpdf,      // QPDF content-stream text operators (fastest)
    Poppler,   // poppler-cpp physical layout text (best layout fidelity)
    Pdftotext, // poppler-utils pdftotext subprocess (most robust)
    Ocr,       // poppler page raster + Tesseract recognition
    PlainText  // non-PDF text documents
};

const char* engineName(EngineId id);
std::optional<EngineId> engineFromString(std::string_view name);

/**
 * @brief One engine attempt recorded while extracting a document
 */
struct EngineAttempt {
    EngineId engine;
    size_t textLength = 0;
    double confidence = 0.0;
    std::string error; // empty when the engine produced a result
};

/**
 * @brief Result of text extraction from a document
 */
struct ExtractionResult {
    std::string text;                          // Extracted text content
    EngineId method = EngineId::PlainText;     // Engine that produced the text
    double confidence = 0.0;                   // Quality estimate in [0,1]
    size_t pageCount = 0;                      // Number of pages (1 for plain text)
    std::vector<std::string> errors;           // Per-page / recoverable errors
    std::chrono::milliseconds elapsed{0};      // Time spent in extract()
    std::map<std::string, std::string> metadata; // title, author, producer, pdf_version...
    std::vector<EngineAttempt> attempts;       // Every engine tried, in order

    [[nodiscard]] size_t contentLength() const { return text.length(); }
};

/**
 * @brief Configuration for text extraction
 */
struct ExtractionConfig {
    std::optional<EngineId> preferredMethod;     // nullopt = automatic selection
    bool useFallback = true;                     // Try other engines on poor output
    std::optional<size_t> maxPages;              // Page limit (nullopt = all pages)
    bool cleanText = true;                       // Normalize the selected text
    std::vector<std::string> ocrLanguages{"eng"}; // Tesseract language set
    int ocrDpi = 300;                            // Raster resolution for OCR
    std::string pdftotextPath = "pdftotext";     // Executable used by the pdftotext engine
    uint64_t maxFileSize = 50ull * 1024 * 1024;  // 50MB default limit
};

/**
 * @brief Base interface for text extraction engines
 *
 * Engines return raw text plus page information. Confidence is assigned by the
 * ExtractionEngine so that every engine is scored with the same weights.
 */
class ITextExtractor {
public:
    virtual ~ITextExtractor() = default;

    /**
     * @brief Extract text from a document
     * @param document Input document bytes and metadata
     * @param config Extraction configuration
     * @param stop Cancellation token and deadline, checked between pages
     * @return Extraction result or error
     */
    virtual Result<ExtractionResult> extract(const Document& document,
                                             const ExtractionConfig& config,
                                             const core::StopCondition& stop) = 0;

    /**
     * @brief Engine implemented by this extractor
     */
    virtual EngineId id() const = 0;

    /**
     * @brief Human-readable name of the extractor
     */
    virtual std::string name() const { return engineName(id()); }
};

} // namespace cvpipe::extraction
