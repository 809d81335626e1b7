#include <spdlog/spdlog.h>
#include <cvpipe/extraction/document.h>
#include <cvpipe/extraction/plain_text_extractor.h>

#include <algorithm>

namespace cvpipe::extraction {

Result<ExtractionResult> PlainTextExtractor::extract(const Document& document,
                                                     const ExtractionConfig& config,
                                                     const core::StopCondition& stop) {
    if (stop.cancelled()) {
        return Error{ErrorCode::OperationCancelled, "Extraction cancelled"};
    }
    if (document.byteSize() > config.maxFileSize) {
        return Error{ErrorCode::InvalidArgument,
                     "File too large: " + std::to_string(document.byteSize()) + " bytes"};
    }
    if (isBinaryData(document.bytes())) {
        return Error{ErrorCode::InvalidData, "Document appears to contain binary data"};
    }

    std::string_view text(document.data(), document.byteSize());
    // Strip UTF-8 byte order mark
    if (text.size() >= 3 && text.substr(0, 3) == "\xEF\xBB\xBF") {
        text.remove_prefix(3);
    }

    ExtractionResult result;
    result.method = EngineId::PlainText;
    result.pageCount = 1;
    result.text.assign(text.begin(), text.end());
    result.metadata["encoding"] = "UTF-8";

    spdlog::debug("plain_text: {} chars from {}", result.text.size(), document.displayName());
    return result;
}

bool PlainTextExtractor::isBinaryData(std::span<const std::byte> data) const {
    // NUL bytes or a high share of control characters in the first 8KB mean binary
    size_t checkSize = std::min<size_t>(data.size(), 8192);
    if (checkSize == 0) {
        return false;
    }

    size_t controlCount = 0;
    for (size_t i = 0; i < checkSize; ++i) {
        auto c = static_cast<unsigned char>(data[i]);
        if (c == 0) {
            return true;
        }
        if (c < 0x20 && c != '\n' && c != '\r' && c != '\t' && c != '\f') {
            ++controlCount;
        }
    }
    return static_cast<double>(controlCount) / static_cast<double>(checkSize) > 0.1;
}

} // namespace cvpipe::extraction
