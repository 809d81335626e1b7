#include <spdlog/spdlog.h>
#include <cvpipe/extraction/document.h>
#include <cvpipe/extraction/ocr_extractor.h>

#include <leptonica/allheaders.h>
#include <poppler/cpp/poppler-document.h>
#include <poppler/cpp/poppler-image.h>
#include <poppler/cpp/poppler-page-renderer.h>
#include <poppler/cpp/poppler-page.h>
#include <tesseract/baseapi.h>

#include <algorithm>
#include <climits>
#include <memory>
#include <semaphore>
#include <thread>

namespace cvpipe::extraction {

namespace {

constexpr std::ptrdiff_t kMaxRecognizers = 256;

// Process-wide gate bounding concurrent Tesseract recognitions
std::counting_semaphore<kMaxRecognizers>& recognitionGate() {
    static std::counting_semaphore<kMaxRecognizers> gate(
        std::clamp<std::ptrdiff_t>(std::thread::hardware_concurrency(), 1, kMaxRecognizers));
    return gate;
}

class GateLease {
public:
    GateLease() { recognitionGate().acquire(); }
    ~GateLease() { recognitionGate().release(); }
    GateLease(const GateLease&) = delete;
    GateLease& operator=(const GateLease&) = delete;
};

struct PixDeleter {
    void operator()(Pix* pix) const { pixDestroy(&pix); }
};
using PixPtr = std::unique_ptr<Pix, PixDeleter>;

struct TessDeleter {
    void operator()(tesseract::TessBaseAPI* api) const {
        api->End();
        delete api;
    }
};
using TessPtr = std::unique_ptr<tesseract::TessBaseAPI, TessDeleter>;

TessPtr initTesseract(const std::string& languages) {
    TessPtr api(new tesseract::TessBaseAPI());
    if (api->Init(nullptr, languages.c_str(), tesseract::OEM_DEFAULT) != 0) {
        return nullptr;
    }
    // Uniform block of text, the layout a résumé page usually has
    api->SetPageSegMode(tesseract::PSM_SINGLE_BLOCK);
    return api;
}

// Copy an 8-bit grey poppler raster into a Leptonica pix
PixPtr toPix(const poppler::image& img, int dpi) {
    PixPtr pix(pixCreate(img.width(), img.height(), 8));
    if (!pix) {
        return nullptr;
    }
    l_uint32* data = pixGetData(pix.get());
    int wpl = pixGetWpl(pix.get());
    const char* src = img.const_data();
    for (int y = 0; y < img.height(); ++y) {
        l_uint32* line = data + static_cast<ptrdiff_t>(y) * wpl;
        const auto* row = reinterpret_cast<const unsigned char*>(src + y * img.bytes_per_row());
        for (int x = 0; x < img.width(); ++x) {
            SET_DATA_BYTE(line, x, row[x]);
        }
    }
    pixSetResolution(pix.get(), dpi, dpi);
    return pix;
}

} // namespace

std::string OcrExtractor::joinLanguages(const std::vector<std::string>& languages) {
    std::string joined;
    for (const auto& lang : languages) {
        if (lang.empty()) {
            continue;
        }
        if (!joined.empty()) {
            joined += '+';
        }
        joined += lang;
    }
    return joined.empty() ? "eng" : joined;
}

bool OcrExtractor::isAvailable(const std::vector<std::string>& languages) {
    return initTesseract(joinLanguages(languages)) != nullptr;
}

Result<ExtractionResult> OcrExtractor::extract(const Document& document,
                                               const ExtractionConfig& config,
                                               const core::StopCondition& stop) {
    if (document.byteSize() > static_cast<size_t>(INT_MAX)) {
        return Error{ErrorCode::InvalidArgument, "Document too large for OCR"};
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

    std::string languages = joinLanguages(config.ocrLanguages);
    TessPtr api = initTesseract(languages);
    if (!api) {
        return Error{ErrorCode::NotSupported,
                     "Tesseract failed to initialize for languages '" + languages + "'"};
    }

    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_gray8);

    ExtractionResult result;
    result.method = EngineId::Ocr;
    result.pageCount = static_cast<size_t>(totalPages);
    result.metadata["ocr_languages"] = languages;
    result.metadata["ocr_dpi"] = std::to_string(config.ocrDpi);

    int limit = totalPages;
    if (config.maxPages) {
        limit = static_cast<int>(std::min<size_t>(*config.maxPages, result.pageCount));
    }

    for (int i = 0; i < limit; ++i) {
        if (stop.cancelled()) {
            return Error{ErrorCode::OperationCancelled, "OCR cancelled"};
        }
        if (stop.expired()) {
            return Error{ErrorCode::Timeout, "OCR deadline exceeded"};
        }

        const std::string pageLabel = "page " + std::to_string(i + 1);
        std::unique_ptr<poppler::page> page(doc->create_page(i));
        if (!page) {
            result.errors.push_back(pageLabel + ": failed to open page");
            continue;
        }

        poppler::image img = renderer.render_page(page.get(), config.ocrDpi, config.ocrDpi);
        if (!img.is_valid() || img.format() != poppler::image::format_gray8) {
            result.errors.push_back(pageLabel + ": failed to render page");
            continue;
        }

        PixPtr pix = toPix(img, config.ocrDpi);
        if (!pix) {
            result.errors.push_back(pageLabel + ": failed to allocate image");
            continue;
        }

        std::string pageText;
        {
            GateLease lease;
            api->SetImage(pix.get());
            std::unique_ptr<char[]> out(api->GetUTF8Text());
            if (!out) {
                result.errors.push_back(pageLabel + ": recognition failed");
                api->Clear();
                continue;
            }
            pageText = out.get();
            api->Clear();
        }

        if (pageText.find_first_not_of(" \t\r\n\f") == std::string::npos) {
            continue;
        }
        if (!result.text.empty()) {
            result.text += "\n\n";
        }
        result.text += pageText;
    }

    spdlog::debug("ocr: {} pages, {} chars, {} page errors from {}", limit, result.text.size(),
                  result.errors.size(), document.displayName());
    return result;
}

} // namespace cvpipe::extraction
