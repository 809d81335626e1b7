#include <spdlog/spdlog.h>
#include <cvpipe/extraction/extraction_engine.h>
#include <cvpipe/extraction/ocr_extractor.h>
#include <cvpipe/extraction/pdftotext_extractor.h>
#include <cvpipe/extraction/plain_text_extractor.h>
#include <cvpipe/extraction/poppler_extractor.h>
#include <cvpipe/extraction/qpdf_extractor.h>
#include <cvpipe/parsing/text_normalizer.h>

#include <algorithm>
#include <set>

namespace cvpipe::extraction {

namespace {

bool isBetter(const ExtractionResult& candidate, const ExtractionResult& best) {
    if (candidate.text.size() != best.text.size()) {
        return candidate.text.size() > best.text.size();
    }
    return candidate.confidence > best.confidence;
}

} // namespace

ExtractionEngine::ExtractionEngine(EngineCapabilities caps, Options options)
    : caps_(std::move(caps)), options_(std::move(options)) {}

std::unique_ptr<ExtractionEngine> ExtractionEngine::createDefault(EngineCapabilities caps,
                                                                  Options options) {
    auto engine = std::make_unique<ExtractionEngine>(std::move(caps), std::move(options));
    engine->registerExtractor(std::make_unique<QpdfExtractor>());
    engine->registerExtractor(std::make_unique<PopplerExtractor>());
    engine->registerExtractor(std::make_unique<PdftotextExtractor>());
    engine->registerExtractor(std::make_unique<OcrExtractor>());
    engine->registerExtractor(std::make_unique<PlainTextExtractor>());
    return engine;
}

void ExtractionEngine::registerExtractor(std::unique_ptr<ITextExtractor> extractor) {
    if (!extractor) {
        return;
    }
    auto id = extractor->id();
    extractors_[id] = std::move(extractor);
}

Result<ExtractionResult> ExtractionEngine::attempt(EngineId id, const Document& document,
                                                   const ExtractionConfig& config,
                                                   const core::StopCondition& stop) const {
    auto it = extractors_.find(id);
    if (it == extractors_.end() || !caps_.has(id)) {
        return Error{ErrorCode::NotSupported, std::string("engine not available: ") + engineName(id)};
    }

    try {
        auto res = it->second->extract(document, config, stop);
        if (!res) {
            return res;
        }
        auto result = std::move(res).value();
        result.method = id;
        result.confidence = scoreConfidence(result.text, id, options_.weights);
        return result;
    } catch (const std::exception& e) {
        return Error{ErrorCode::ExtractionFailed,
                     std::string(engineName(id)) + " threw: " + e.what()};
    }
}

Result<EngineId> ExtractionEngine::choosePrimary(const Document& document,
                                                 const ExtractionConfig& config) const {
    if (config.preferredMethod) {
        auto id = *config.preferredMethod;
        if (caps_.has(id) && extractors_.count(id)) {
            return id;
        }
        if (!config.useFallback) {
            return Error{ErrorCode::NotSupported,
                         std::string("requested engine not available: ") + engineName(id)};
        }
        spdlog::warn("Requested engine {} not available; selecting automatically",
                     engineName(id));
    }
    return selectMethod(document, caps_, options_.thresholds);
}

Result<ExtractionResult> ExtractionEngine::extract(const Document& document,
                                                   const ExtractionConfig& config,
                                                   const core::StopCondition& stop) const {
    auto started = std::chrono::steady_clock::now();

    if (document.empty()) {
        return Error{ErrorCode::InvalidData, "Document is empty: " + document.displayName()};
    }
    if (document.byteSize() > config.maxFileSize) {
        return Error{ErrorCode::InvalidArgument,
                     "Document exceeds size limit: " + std::to_string(document.byteSize()) +
                         " bytes"};
    }

    auto primary = choosePrimary(document, config);
    if (!primary) {
        return primary.error();
    }

    std::vector<EngineAttempt> attempts;
    std::vector<std::string> failures;
    std::optional<ExtractionResult> best;
    std::set<EngineId> tried;

    auto record = [&](EngineId id, const Result<ExtractionResult>& res) {
        tried.insert(id);
        if (res) {
            const auto& r = res.value();
            attempts.push_back({id, r.text.size(), r.confidence, {}});
            spdlog::debug("{}: {} chars, confidence {:.2f} ({})", engineName(id), r.text.size(),
                          r.confidence, document.displayName());
        } else {
            attempts.push_back({id, 0, 0.0, res.error().message});
            failures.push_back(std::string(engineName(id)) + ": " + res.error().message);
            spdlog::warn("{} failed on {}: {}", engineName(id), document.displayName(),
                         res.error().message);
        }
    };

    auto stopError = [&]() -> std::optional<Error> {
        if (stop.cancelled()) {
            return Error{ErrorCode::OperationCancelled, "Extraction cancelled"};
        }
        if (stop.expired()) {
            return Error{ErrorCode::Timeout, "Extraction deadline exceeded"};
        }
        return std::nullopt;
    };

    if (auto err = stopError()) {
        return *err;
    }

    auto first = attempt(primary.value(), document, config, stop);
    record(primary.value(), first);
    if (first) {
        best = std::move(first).value();
    } else if (first.error().code == ErrorCode::OperationCancelled ||
               first.error().code == ErrorCode::Timeout) {
        return first.error();
    }

    bool wantFallback = config.useFallback && document.kind() == DocumentKind::Pdf &&
                        (!best || needsFallback(*best, options_.fallback));
    if (wantFallback) {
        spdlog::debug("Primary engine {} insufficient for {}; trying fallbacks",
                      engineName(primary.value()), document.displayName());
        for (auto id : kFallbackOrder) {
            if (tried.count(id) || !caps_.has(id) || !extractors_.count(id)) {
                continue;
            }
            if (auto err = stopError()) {
                if (best) {
                    spdlog::warn("Stopping fallback chain for {}: {}", document.displayName(),
                                 err->message);
                    break;
                }
                return *err;
            }

            auto next = attempt(id, document, config, stop);
            record(id, next);
            if (!next) {
                continue;
            }
            auto candidate = std::move(next).value();
            if (!best || candidate.text.size() > best->text.size()) {
                best = std::move(candidate);
                break;
            }
            if (isBetter(candidate, *best)) {
                best = std::move(candidate);
            }
        }
    }

    if (!best) {
        std::string message = "All extraction engines failed for " + document.displayName();
        for (const auto& f : failures) {
            message += "; " + f;
        }
        return Error{ErrorCode::ExtractionFailed, message};
    }

    ExtractionResult result = std::move(*best);
    if (config.cleanText) {
        result.text = parsing::normalize(result.text);
    }
    result.attempts = std::move(attempts);
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    spdlog::info("Extracted {} chars from {} with {} (confidence {:.2f}, {} attempt(s))",
                 result.text.size(), document.displayName(), engineName(result.method),
                 result.confidence, result.attempts.size());
    return result;
}

} // namespace cvpipe::extraction
