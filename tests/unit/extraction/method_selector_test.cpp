#include <gtest/gtest.h>

#include <cvpipe/extraction/document.h>
#include <cvpipe/extraction/method_selector.h>
#include "../../common/test_helpers.h"

using namespace cvpipe;
using namespace cvpipe::extraction;

TEST(MethodSelectorTest, PlainTextGoesToPlainTextEngine) {
    auto doc = Document::fromString("Jane Doe\nEngineer", "resume.txt");
    EngineCapabilities caps{EngineId::PlainText, EngineId::Poppler};
    auto id = selectMethod(doc, caps);
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id.value(), EngineId::PlainText);
}

TEST(MethodSelectorTest, SmallPdfPrefersQpdf) {
    auto doc = test::fakePdfDocument();
    EngineCapabilities caps{EngineId::Qpdf, EngineId::Poppler, EngineId::Pdftotext};
    auto id = selectMethod(doc, caps);
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id.value(), EngineId::Qpdf);
}

TEST(MethodSelectorTest, SizeTiersFollowThresholds) {
    auto doc = test::fakePdfDocument("resume.pdf", 200);
    EngineCapabilities caps{EngineId::Qpdf, EngineId::Poppler, EngineId::Pdftotext};

    SelectionThresholds medium{16, 1024};
    EXPECT_EQ(selectMethod(doc, caps, medium).value(), EngineId::Poppler);

    SelectionThresholds large{16, 32};
    EXPECT_EQ(selectMethod(doc, caps, large).value(), EngineId::Pdftotext);
}

TEST(MethodSelectorTest, MissingPreferredEngineUsesFallbackOrder) {
    auto doc = test::fakePdfDocument();
    EngineCapabilities caps{EngineId::Pdftotext, EngineId::Poppler, EngineId::Ocr};
    EXPECT_EQ(selectMethod(doc, caps).value(), EngineId::Poppler);
}

TEST(MethodSelectorTest, OcrIsLastResort) {
    auto doc = test::fakePdfDocument();
    EngineCapabilities caps{EngineId::Ocr, EngineId::PlainText};
    EXPECT_EQ(selectMethod(doc, caps).value(), EngineId::Ocr);
}

TEST(MethodSelectorTest, NoEngineIsAnError) {
    auto doc = test::fakePdfDocument();
    EngineCapabilities caps{EngineId::PlainText};
    auto id = selectMethod(doc, caps);
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, ErrorCode::ExtractionFailed);
}

TEST(MethodSelectorTest, CapabilitiesDescribe) {
    EngineCapabilities caps;
    EXPECT_EQ(caps.describe(), "none");
    caps.add(EngineId::Poppler);
    caps.add(EngineId::Qpdf);
    EXPECT_TRUE(caps.hasDirectPdfEngine());
    EXPECT_NE(caps.describe().find("poppler"), std::string::npos);
    caps.remove(EngineId::Poppler);
    EXPECT_FALSE(caps.has(EngineId::Poppler));
}

TEST(MethodSelectorTest, EngineNamesRoundTrip) {
    for (auto id : {EngineId::Qpdf, EngineId::Poppler, EngineId::Pdftotext, EngineId::Ocr,
                    EngineId::PlainText}) {
        auto parsed = engineFromString(engineName(id));
        ASSERT_TRUE(parsed.has_value()) << engineName(id);
        EXPECT_EQ(*parsed, id);
    }
    EXPECT_FALSE(engineFromString("pdfium").has_value());
}
