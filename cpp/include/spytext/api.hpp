#ifndef SPYTEXT_API_HPP
#define SPYTEXT_API_HPP

#include <string>
#include <vector>

#include "spytext/config.hpp"
#include "spytext/injection.hpp"
#include "spytext/logging.hpp"
#include "spytext/risk.hpp"
#include "spytext/text_span.hpp"
#include "spytext/visibility.hpp"

namespace spytext {

struct AnalysisResult {
    std::string document;
    std::vector<VisibilityVerdict> verdicts;
    RiskAssessment assessment;
};

class DocumentAnalyzer {
public:
    explicit DocumentAnalyzer(const SpyTextSettings& settings = SpyTextSettings{},
                              Logger logger = get_logger("DocumentAnalyzer"));

    // Verdicts point into document.spans: keep the document alive while using the result.
    AnalysisResult analyze(const SpanDocument& document) const;

    const VisibilityClassifier& classifier() const { return classifier_; }
    const PromptInjectionMatcher& matcher() const { return matcher_; }
    const RiskAggregator& aggregator() const { return aggregator_; }

private:
    VisibilityClassifier classifier_;
    PromptInjectionMatcher matcher_;
    RiskAggregator aggregator_;
    bool scan_all_text_ = false;
    Logger logger_;
};

DocumentAnalyzer build_analyzer(const SpyTextSettings& settings);

}  // namespace spytext

#endif  // SPYTEXT_API_HPP
