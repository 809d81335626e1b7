#include <spdlog/spdlog.h>
#include <cvpipe/extraction/document.h>
#include <cvpipe/extraction/qpdf_extractor.h>

// QPDF headers
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <algorithm>
#include <sstream>

namespace cvpipe::extraction {

namespace {

// Collects text-showing operands of a page content stream. Operands precede their
// operator, so they are buffered until the operator arrives.
class TextOperatorCallbacks : public QPDFObjectHandle::ParserCallbacks {
public:
    explicit TextOperatorCallbacks(std::ostringstream& out) : out_(out) {}

    void handleObject(QPDFObjectHandle obj) override {
        if (!obj.isOperator()) {
            operands_.push_back(obj);
            return;
        }

        const std::string op = obj.getOperatorValue();
        if (op == "Tj") {
            showString(lastString());
        } else if (op == "'" || op == "\"") {
            newLine();
            showString(lastString());
        } else if (op == "TJ") {
            if (!operands_.empty() && operands_.back().isArray()) {
                for (auto& item : operands_.back().getArrayAsVector()) {
                    if (item.isString()) {
                        showString(item.getUTF8Value());
                    } else if (item.isNumber() && item.getNumericValue() < -200.0) {
                        // Large negative kerning is how many producers encode a word gap
                        out_ << ' ';
                    }
                }
            }
        } else if (op == "T*") {
            newLine();
        } else if (op == "Td" || op == "TD") {
            if (operands_.size() >= 2 && operands_[1].isNumber() &&
                operands_[1].getNumericValue() != 0.0) {
                newLine();
            } else if (pendingText_) {
                out_ << ' ';
            }
        } else if (op == "ET") {
            newLine();
        }
        operands_.clear();
    }

    void handleEOF() override { newLine(); }

private:
    std::string lastString() const {
        if (!operands_.empty() && operands_.back().isString()) {
            return operands_.back().getUTF8Value();
        }
        return {};
    }

    void showString(const std::string& s) {
        if (s.empty()) {
            return;
        }
        out_ << s;
        pendingText_ = true;
    }

    void newLine() {
        if (pendingText_) {
            out_ << '\n';
            pendingText_ = false;
        }
    }

    std::ostringstream& out_;
    std::vector<QPDFObjectHandle> operands_;
    bool pendingText_ = false;
};

} // namespace

Result<ExtractionResult> QpdfExtractor::extract(const Document& document,
                                                const ExtractionConfig& config,
                                                const core::StopCondition& stop) {
    ExtractionResult result;
    result.method = EngineId::Qpdf;

    try {
        QPDF pdf;
        pdf.setSuppressWarnings(true);
        pdf.processMemoryFile(document.displayName().c_str(), document.data(),
                              document.byteSize());

        extractMetadata(pdf, result);

        QPDFPageDocumentHelper dh(pdf);
        auto pages = dh.getAllPages();
        if (pages.empty()) {
            return Error{ErrorCode::InvalidData, "PDF has no pages"};
        }
        result.pageCount = pages.size();

        size_t limit = config.maxPages ? std::min(*config.maxPages, pages.size()) : pages.size();
        std::string text;
        for (size_t i = 0; i < limit; ++i) {
            if (stop.cancelled()) {
                return Error{ErrorCode::OperationCancelled, "Extraction cancelled"};
            }
            if (stop.expired()) {
                return Error{ErrorCode::Timeout, "Extraction deadline exceeded"};
            }
            try {
                std::string pageText = extractPageText(pages[i]);
                if (!pageText.empty()) {
                    if (!text.empty()) {
                        text += "\n\n";
                    }
                    text += pageText;
                }
            } catch (const std::exception& e) {
                spdlog::warn("qpdf: failed to extract text from page {}: {}", i + 1, e.what());
                result.errors.push_back("page " + std::to_string(i + 1) + ": " + e.what());
            }
        }
        result.text = std::move(text);

        auto warnings = pdf.getWarnings();
        if (!warnings.empty()) {
            result.metadata["qpdf_warnings"] = std::to_string(warnings.size());
        }
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidData, "Failed to load PDF: " + std::string(e.what())};
    }

    return result;
}

// Extract metadata from PDF using QPDF
void QpdfExtractor::extractMetadata(QPDF& pdf, ExtractionResult& result) {
    try {
        auto trailer = pdf.getTrailer();
        if (trailer.hasKey("/Info")) {
            QPDFObjectHandle info = trailer.getKey("/Info");
            for (const auto& [key, name] :
                 {std::pair{"/Title", "title"}, std::pair{"/Author", "author"},
                  std::pair{"/Creator", "creator"}, std::pair{"/Producer", "producer"}}) {
                if (info.hasKey(key)) {
                    auto val = info.getKey(key);
                    if (val.isString() && !val.getUTF8Value().empty()) {
                        result.metadata[name] = val.getUTF8Value();
                    }
                }
            }
        }
        result.metadata["pdf_version"] = pdf.getPDFVersion();
    } catch (const std::exception& e) {
        spdlog::warn("qpdf: failed to read PDF metadata: {}", e.what());
    }
}

std::string QpdfExtractor::extractPageText(QPDFPageObjectHelper& page) {
    std::ostringstream text;
    TextOperatorCallbacks callbacks(text);
    page.parsePageContents(&callbacks);

    std::string out = text.str();
    while (!out.empty() && (out.back() == '\n' || out.back() == ' ')) {
        out.pop_back();
    }
    return out;
}

} // namespace cvpipe::extraction
