#ifndef SPYTEXT_RISK_HPP
#define SPYTEXT_RISK_HPP

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "spytext/config.hpp"
#include "spytext/logging.hpp"
#include "spytext/visibility.hpp"

namespace spytext {

enum class RiskLevel {
    kSafe,
    kLow,
    kMedium,
    kHigh,
    kCritical,
};

std::string risk_level_name(RiskLevel level);

struct IssueRecord {
    int page = 1;
    VisibilityCategory category = VisibilityCategory::kVisible;
    std::string text;
    std::vector<std::string> reasons;
    std::size_t span_index = 0;
};

struct RiskAssessment {
    int score = 0;
    RiskLevel level = RiskLevel::kSafe;
    int total_spans = 0;
    int hidden_spans = 0;
    int severe_spans = 0;
    int weighted_score = 0;
    std::map<VisibilityCategory, int> category_counts;
    std::vector<IssueRecord> issues;
    std::vector<std::string> prompt_injection_patterns;
    bool prompt_injection_detected = false;
};

bool operator==(const IssueRecord& lhs, const IssueRecord& rhs);
bool operator==(const RiskAssessment& lhs, const RiskAssessment& rhs);

struct CategoryWeight {
    VisibilityCategory category;
    int weight;
    int cap;
};

struct ScoreBand {
    int min_score;
    RiskLevel level;
};

const std::vector<CategoryWeight>& category_weights();
const std::vector<ScoreBand>& score_bands();
RiskLevel level_for_score(int score);

class RiskAggregator {
public:
    static constexpr int kMediumFloor = 30;
    static constexpr int kHighFloor = 60;
    static constexpr int kInjectionFloor = 70;
    static constexpr int kCriticalFloor = 85;

    explicit RiskAggregator(RiskThresholds thresholds = {}, Logger logger = get_logger("RiskAggregator"));

    RiskAssessment aggregate(const std::vector<VisibilityVerdict>& verdicts,
                             const std::vector<std::string>& prompt_injection_matches) const;

    const RiskThresholds& thresholds() const;

private:
    RiskThresholds thresholds_;
    Logger logger_;
};

}  // namespace spytext

#endif  // SPYTEXT_RISK_HPP
