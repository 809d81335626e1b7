#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdio>
#include <cstring>
#include <sstream>

#include <cvpipe/extraction/pdftotext_extractor.h>
#include <cvpipe/extraction/poppler_extractor.h>
#include <cvpipe/extraction/qpdf_extractor.h>
#include "../../common/test_helpers.h"

using namespace cvpipe;
using namespace cvpipe::extraction;
using ::testing::HasSubstr;

namespace {

// One-page PDF with a single Helvetica text run; xref offsets are computed
std::string singlePagePdf(const std::string& line) {
    const std::string stream = "BT /F1 12 Tf 72 720 Td (" + line + ") Tj ET";
    std::vector<std::string> objects{
        "<< /Type /Catalog /Pages 2 0 R >>",
        "<< /Type /Pages /Kids [3 0 R] /Count 1 >>",
        "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] /Contents 4 0 R "
        "/Resources << /Font << /F1 5 0 R >> >> >>",
        "<< /Length " + std::to_string(stream.size()) + " >>\nstream\n" + stream +
            "\nendstream",
        "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>"};

    std::string pdf = "%PDF-1.4\n";
    std::vector<size_t> offsets;
    for (size_t i = 0; i < objects.size(); ++i) {
        offsets.push_back(pdf.size());
        pdf += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
    }
    const size_t xref = pdf.size();
    std::ostringstream table;
    table << "xref\n0 " << objects.size() + 1 << "\n0000000000 65535 f \n";
    for (auto off : offsets) {
        char entry[21];
        std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", off);
        table << entry;
    }
    table << "trailer\n<< /Size " << objects.size() + 1 << " /Root 1 0 R >>\nstartxref\n"
          << xref << "\n%%EOF\n";
    return pdf + table.str();
}

Document pdfDocument(const std::string& raw, const std::string& name = "resume.pdf") {
    std::vector<std::byte> bytes(raw.size());
    std::memcpy(bytes.data(), raw.data(), raw.size());
    return Document::fromBuffer(std::move(bytes), name);
}

} // namespace

class PdfEnginesTest : public ::testing::Test {
protected:
    ExtractionConfig config_;
    core::StopCondition stop_;
};

TEST_F(PdfEnginesTest, QpdfReadsTextOperators) {
    QpdfExtractor qpdf;
    auto result = qpdf.extract(pdfDocument(singlePagePdf("Jane Doe Backend Engineer")), config_,
                               stop_);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_THAT(result.value().text, HasSubstr("Jane Doe"));
    EXPECT_EQ(result.value().pageCount, 1u);
}

TEST_F(PdfEnginesTest, PopplerReadsLayoutText) {
    PopplerExtractor poppler;
    auto result = poppler.extract(pdfDocument(singlePagePdf("Jane Doe Backend Engineer")),
                                  config_, stop_);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_THAT(result.value().text, HasSubstr("Jane Doe"));
    EXPECT_EQ(result.value().pageCount, 1u);
}

TEST_F(PdfEnginesTest, GarbageBytesAreAnErrorNotAnException) {
    auto garbage = test::fakePdfDocument("broken.pdf", 256);

    QpdfExtractor qpdf;
    Result<ExtractionResult> fromQpdf = Error{ErrorCode::Unknown};
    EXPECT_NO_THROW(fromQpdf = qpdf.extract(garbage, config_, stop_));
    EXPECT_FALSE(fromQpdf);

    PopplerExtractor poppler;
    Result<ExtractionResult> fromPoppler = Error{ErrorCode::Unknown};
    EXPECT_NO_THROW(fromPoppler = poppler.extract(garbage, config_, stop_));
    EXPECT_FALSE(fromPoppler);
}

TEST_F(PdfEnginesTest, QpdfObservesCancellation) {
    stop_.token.cancel();
    QpdfExtractor qpdf;
    auto result = qpdf.extract(pdfDocument(singlePagePdf("Cancelled")), config_, stop_);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::OperationCancelled);
}

TEST_F(PdfEnginesTest, PdftotextWhenInstalled) {
    if (!PdftotextExtractor::isAvailable(config_.pdftotextPath)) {
        GTEST_SKIP() << "pdftotext not installed";
    }
    PdftotextExtractor pdftotext;
    auto result = pdftotext.extract(pdfDocument(singlePagePdf("Jane Doe Backend Engineer")),
                                    config_, stop_);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_THAT(result.value().text, HasSubstr("Jane Doe"));
}
