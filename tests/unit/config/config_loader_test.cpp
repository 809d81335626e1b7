#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cvpipe/config/config_loader.h>
#include "../../common/test_helpers.h"

using namespace cvpipe;
using namespace cvpipe::config;
using ::testing::HasSubstr;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = test::make_temp_dir("cvpipe_loader_"); }
    void TearDown() override { std::filesystem::remove_all(dir_); }

    Result<pipeline::PipelineConfig> load(const std::string& toml,
                                          pipeline::PipelineConfig base = {}) {
        return loadPipelineConfig(test::write_file(dir_ / "config.toml", toml), std::move(base));
    }

    std::filesystem::path dir_;
};

TEST_F(ConfigLoaderTest, EmptyFileKeepsBase) {
    pipeline::PipelineConfig base;
    base.workers = 7;
    base.includeRawText = false;
    auto cfg = load("# nothing here\n", base);
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().workers, 7u);
    EXPECT_FALSE(cfg.value().includeRawText);
    EXPECT_TRUE(cfg.value().enableEnhancement);
}

TEST_F(ConfigLoaderTest, ExtractionSection) {
    auto cfg = load("[extraction]\n"
                    "method = \"poppler\"\n"
                    "use_fallback = false\n"
                    "max_pages = 3\n"
                    "clean_text = no\n"
                    "ocr_languages = [\"eng\", \"deu\"]\n"
                    "ocr_dpi = 200\n"
                    "pdftotext_path = \"/opt/bin/pdftotext\"\n"
                    "max_file_size_mb = 10\n"
                    "small_file_mb = 1\n"
                    "medium_file_mb = 4\n"
                    "fallback_min_text_length = 80\n"
                    "fallback_min_confidence = 0.6\n"
                    "fallback_max_special_char_ratio = 0.25\n");
    ASSERT_TRUE(cfg) << cfg.error().message;
    const auto& c = cfg.value();
    EXPECT_EQ(c.extraction.preferredMethod, extraction::EngineId::Poppler);
    EXPECT_FALSE(c.extraction.useFallback);
    EXPECT_EQ(c.extraction.maxPages, std::optional<size_t>(3));
    EXPECT_FALSE(c.extraction.cleanText);
    EXPECT_EQ(c.extraction.ocrLanguages, (std::vector<std::string>{"eng", "deu"}));
    EXPECT_EQ(c.extraction.ocrDpi, 200);
    EXPECT_EQ(c.extraction.pdftotextPath, "/opt/bin/pdftotext");
    EXPECT_EQ(c.extraction.maxFileSize, 10ull * 1024 * 1024);
    EXPECT_EQ(c.engine.thresholds.smallFileBytes, 1ull * 1024 * 1024);
    EXPECT_EQ(c.engine.thresholds.mediumFileBytes, 4ull * 1024 * 1024);
    EXPECT_EQ(c.engine.fallback.minTextLength, 80u);
    EXPECT_DOUBLE_EQ(c.engine.fallback.minConfidence, 0.6);
    EXPECT_DOUBLE_EQ(c.engine.fallback.maxSpecialCharRatio, 0.25);
}

TEST_F(ConfigLoaderTest, AutoMethodAndZeroPagesClear) {
    pipeline::PipelineConfig base;
    base.extraction.preferredMethod = extraction::EngineId::Ocr;
    base.extraction.maxPages = 5;
    auto cfg = load("[extraction]\nmethod = auto\nmax_pages = 0\n", base);
    ASSERT_TRUE(cfg);
    EXPECT_FALSE(cfg.value().extraction.preferredMethod.has_value());
    EXPECT_FALSE(cfg.value().extraction.maxPages.has_value());
}

TEST_F(ConfigLoaderTest, PipelineAndScoringSections) {
    auto cfg = load("[pipeline]\n"
                    "enable_enhancement = false\n"
                    "enable_matching = true\n"
                    "enable_validation = off\n"
                    "min_confidence_threshold = 0.45\n"
                    "include_raw_text = true\n"
                    "workers = 3\n"
                    "stage_timeout_seconds = 0\n"
                    "\n"
                    "[scoring]\n"
                    "extraction = 0.5\n"
                    "parsing = 0.5\n"
                    "summary = 0\n");
    ASSERT_TRUE(cfg) << cfg.error().message;
    const auto& c = cfg.value();
    EXPECT_FALSE(c.enableEnhancement);
    EXPECT_TRUE(c.enableMatching);
    EXPECT_FALSE(c.enableValidation);
    EXPECT_DOUBLE_EQ(c.minConfidenceThreshold, 0.45);
    EXPECT_TRUE(c.includeRawText);
    EXPECT_EQ(c.workers, 3u);
    EXPECT_EQ(c.stageTimeout.count(), 0);
    EXPECT_DOUBLE_EQ(c.scoring.extraction, 0.5);
    EXPECT_DOUBLE_EQ(c.scoring.parsing, 0.5);
    EXPECT_DOUBLE_EQ(c.scoring.summary, 0.0);
    EXPECT_DOUBLE_EQ(c.scoring.experience, 0.3);
}

TEST_F(ConfigLoaderTest, JobDescriptionFileRelativeToConfig) {
    test::write_file(dir_ / "jobs" / "backend.txt", "Senior Python engineer");
    auto cfg = load("[pipeline]\njob_description_file = \"jobs/backend.txt\"\n");
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().jobDescription, "Senior Python engineer");
}

TEST_F(ConfigLoaderTest, MissingJobDescriptionFile) {
    auto cfg = load("[pipeline]\njob_description_file = \"absent.txt\"\n");
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::FileNotFound);
    EXPECT_THAT(cfg.error().message, HasSubstr("absent.txt"));
}

TEST_F(ConfigLoaderTest, BadValuesNameTheKey) {
    struct Case {
        const char* toml;
        const char* key;
    };
    for (const auto& c : {Case{"[pipeline]\nworkers = many\n", "pipeline.workers"},
                          Case{"[pipeline]\nenable_matching = perhaps\n",
                               "pipeline.enable_matching"},
                          Case{"[pipeline]\nstage_timeout_seconds = -5\n",
                               "pipeline.stage_timeout_seconds"},
                          Case{"[extraction]\nmethod = \"magic\"\n", "extraction.method"},
                          Case{"[extraction]\nmax_file_size_mb = 0\n",
                               "extraction.max_file_size_mb"},
                          Case{"[scoring]\nparsing = 0.4x\n", "scoring.parsing"}}) {
        auto cfg = load(c.toml);
        ASSERT_FALSE(cfg) << c.toml;
        EXPECT_EQ(cfg.error().code, ErrorCode::InvalidArgument) << c.toml;
        EXPECT_THAT(cfg.error().message, HasSubstr(c.key));
    }
}

TEST_F(ConfigLoaderTest, UnknownKeysAreIgnored) {
    auto cfg = load("[pipeline]\nfuture_option = 1\n[mystery]\nkey = value\n");
    ASSERT_TRUE(cfg) << cfg.error().message;
}

TEST_F(ConfigLoaderTest, MissingFileIsReported) {
    auto cfg = loadPipelineConfig(dir_ / "missing.toml");
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::FileNotFound);
}
