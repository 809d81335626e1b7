#pragma once

#include <array>
#include <cstdint>
#include <initializer_list>
#include <set>
#include <string>

#include <cvpipe/core/types.h>
#include <cvpipe/extraction/text_extractor.h>

namespace cvpipe::extraction {

class Document;

/**
 * @brief Set of engines usable on this host, computed once at startup
 */
class EngineCapabilities {
public:
    EngineCapabilities() = default;
    EngineCapabilities(std::initializer_list<EngineId> engines) : available_(engines) {}

    /**
     * @brief Probe linked libraries and external tools
     *
     * QPDF, poppler and plain text are linked and always present. pdftotext is present
     * when the executable resolves on PATH; OCR when Tesseract initializes with the
     * configured languages.
     */
    static EngineCapabilities probe(const ExtractionConfig& config = {});

    [[nodiscard]] bool has(EngineId id) const { return available_.count(id) > 0; }
    [[nodiscard]] bool hasDirectPdfEngine() const;
    [[nodiscard]] const std::set<EngineId>& engines() const { return available_; }

    void add(EngineId id) { available_.insert(id); }
    void remove(EngineId id) { available_.erase(id); }

    [[nodiscard]] std::string describe() const;

private:
    std::set<EngineId> available_;
};

/**
 * @brief File size tiers for automatic engine selection
 */
struct SelectionThresholds {
    uint64_t smallFileBytes = 5ull * 1024 * 1024;   // below: fastest engine
    uint64_t mediumFileBytes = 20ull * 1024 * 1024; // below: best layout engine
};

/// Engines tried after the primary attempt, in order
inline constexpr std::array<EngineId, 4> kFallbackOrder{EngineId::Poppler, EngineId::Pdftotext,
                                                        EngineId::Qpdf, EngineId::Ocr};

/**
 * @brief Pick the primary engine for a document
 * @return The chosen engine, or ExtractionFailed when no engine can handle the document
 */
Result<EngineId> selectMethod(const Document& document, const EngineCapabilities& caps,
                              const SelectionThresholds& thresholds = {});

} // namespace cvpipe::extraction
