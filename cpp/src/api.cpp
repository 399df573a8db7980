#include "spytext/api.hpp"

namespace spytext {

DocumentAnalyzer::DocumentAnalyzer(const SpyTextSettings& settings, Logger logger)
    : classifier_(settings.visibility),
      aggregator_(settings.risk),
      scan_all_text_(settings.risk.scan_all_text),
      logger_(std::move(logger)) {}

AnalysisResult DocumentAnalyzer::analyze(const SpanDocument& document) const {
    AnalysisResult result;
    result.document = document.name;
    result.verdicts = classifier_.classify_all(document);
    const auto matches = matcher_.scan_spans(document, result.verdicts, scan_all_text_);
    result.assessment = aggregator_.aggregate(result.verdicts, matches);

    logger_.info("document_analyzed", {{"document", document.name},
                                       {"spans", std::to_string(result.assessment.total_spans)},
                                       {"hidden", std::to_string(result.assessment.hidden_spans)},
                                       {"risk_level", risk_level_name(result.assessment.level)}});
    if (result.assessment.prompt_injection_detected) {
        logger_.warn("prompt_injection_detected",
                     {{"document", document.name},
                      {"patterns", std::to_string(result.assessment.prompt_injection_patterns.size())}});
    }
    return result;
}

DocumentAnalyzer build_analyzer(const SpyTextSettings& settings) {
    settings.validate();
    configure_logging(settings.logging);
    return DocumentAnalyzer(settings);
}

}  // namespace spytext
