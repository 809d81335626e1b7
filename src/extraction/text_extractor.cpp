#include <cvpipe/extraction/text_extractor.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace cvpipe::extraction {

const char* engineName(EngineId id) {
    switch (id) {
        case EngineId::Qpdf:
            return "qpdf";
        case EngineId::Poppler:
            return "poppler";
        case EngineId::Pdftotext:
            return "pdftotext";
        case EngineId::Ocr:
            return "ocr";
        case EngineId::PlainText:
            return "plain_text";
    }
    return "unknown";
}

std::optional<EngineId> engineFromString(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (auto id : {EngineId::Qpdf, EngineId::Poppler, EngineId::Pdftotext, EngineId::Ocr,
                    EngineId::PlainText}) {
        if (lower == engineName(id)) {
            return id;
        }
    }
    if (lower == "text" || lower == "plain") {
        return EngineId::PlainText;
    }
    return std::nullopt;
}

} // namespace cvpipe::extraction
