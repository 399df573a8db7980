#include "spytext/risk.hpp"

#include <algorithm>
#include <cmath>

namespace spytext {

const std::vector<CategoryWeight>& category_weights() {
    static const std::vector<CategoryWeight> weights = {
        {VisibilityCategory::kInvisible, 15, 60},
        {VisibilityCategory::kMicroscopic, 12, 48},
        {VisibilityCategory::kOffscreen, 10, 40},
        {VisibilityCategory::kLowContrast, 6, 30},
        {VisibilityCategory::kSmall, 4, 20},
    };
    return weights;
}

const std::vector<ScoreBand>& score_bands() {
    static const std::vector<ScoreBand> bands = {
        {0, RiskLevel::kSafe},
        {1, RiskLevel::kLow},
        {30, RiskLevel::kMedium},
        {60, RiskLevel::kHigh},
        {85, RiskLevel::kCritical},
    };
    return bands;
}

RiskLevel level_for_score(int score) {
    RiskLevel level = RiskLevel::kSafe;
    for (const auto& band : score_bands()) {
        if (score >= band.min_score) {
            level = band.level;
        }
    }
    return level;
}

std::string risk_level_name(RiskLevel level) {
    switch (level) {
        case RiskLevel::kSafe:
            return "SAFE";
        case RiskLevel::kLow:
            return "LOW";
        case RiskLevel::kMedium:
            return "MEDIUM";
        case RiskLevel::kHigh:
            return "HIGH";
        case RiskLevel::kCritical:
            return "CRITICAL";
    }
    return "SAFE";
}

bool operator==(const IssueRecord& lhs, const IssueRecord& rhs) {
    return lhs.page == rhs.page && lhs.category == rhs.category && lhs.text == rhs.text &&
           lhs.reasons == rhs.reasons && lhs.span_index == rhs.span_index;
}

bool operator==(const RiskAssessment& lhs, const RiskAssessment& rhs) {
    return lhs.score == rhs.score && lhs.level == rhs.level && lhs.total_spans == rhs.total_spans &&
           lhs.hidden_spans == rhs.hidden_spans && lhs.severe_spans == rhs.severe_spans &&
           lhs.weighted_score == rhs.weighted_score && lhs.category_counts == rhs.category_counts &&
           lhs.issues == rhs.issues && lhs.prompt_injection_patterns == rhs.prompt_injection_patterns &&
           lhs.prompt_injection_detected == rhs.prompt_injection_detected;
}

RiskAggregator::RiskAggregator(RiskThresholds thresholds, Logger logger)
    : thresholds_(thresholds), logger_(std::move(logger)) {}

const RiskThresholds& RiskAggregator::thresholds() const {
    return thresholds_;
}

RiskAssessment RiskAggregator::aggregate(const std::vector<VisibilityVerdict>& verdicts,
                                         const std::vector<std::string>& prompt_injection_matches) const {
    RiskAssessment assessment;
    if (verdicts.empty()) {
        logger_.debug("empty_document_assessed");
        return assessment;
    }

    assessment.total_spans = static_cast<int>(verdicts.size());
    for (const auto& verdict : verdicts) {
        assessment.category_counts[verdict.category] += 1;
        if (!verdict.is_hidden) {
            continue;
        }
        assessment.hidden_spans += 1;
        if (is_severe(verdict.category)) {
            assessment.severe_spans += 1;
        }
        IssueRecord issue;
        issue.category = verdict.category;
        issue.reasons = verdict.reasons;
        issue.span_index = verdict.span_index;
        if (verdict.span != nullptr) {
            issue.page = verdict.span->page;
            issue.text = verdict.span->text;
        }
        assessment.issues.push_back(std::move(issue));
    }
    std::stable_sort(assessment.issues.begin(), assessment.issues.end(),
                     [](const IssueRecord& lhs, const IssueRecord& rhs) { return lhs.page < rhs.page; });

    for (const auto& match : prompt_injection_matches) {
        auto& patterns = assessment.prompt_injection_patterns;
        if (std::find(patterns.begin(), patterns.end(), match) == patterns.end()) {
            patterns.push_back(match);
        }
    }
    assessment.prompt_injection_detected = !assessment.prompt_injection_patterns.empty();

    int severity = 0;
    for (const auto& entry : category_weights()) {
        auto it = assessment.category_counts.find(entry.category);
        if (it == assessment.category_counts.end()) {
            continue;
        }
        severity += std::min(entry.cap, entry.weight * it->second);
    }
    severity = std::min(severity, 100);

    const double hidden_ratio =
        static_cast<double>(assessment.hidden_spans) / static_cast<double>(assessment.total_spans);
    assessment.weighted_score = static_cast<int>(std::lround(severity * (0.5 + 0.5 * hidden_ratio)));

    int score = assessment.weighted_score;
    if (assessment.hidden_spans > 0) {
        score = std::max(score, 1);
    }
    if (assessment.hidden_spans >= thresholds_.suspicious_threshold) {
        score = std::max(score, kMediumFloor);
    }
    if (assessment.severe_spans >= thresholds_.invisible_threshold) {
        score = std::max(score, kHighFloor);
    }
    if (assessment.prompt_injection_detected) {
        score = std::max(score, kInjectionFloor);
        if (assessment.severe_spans > 0) {
            score = std::max(score, kCriticalFloor);
        }
    }
    assessment.score = std::clamp(score, 0, 100);
    assessment.level = level_for_score(assessment.score);

    logger_.debug("document_assessed", {{"score", std::to_string(assessment.score)},
                                        {"level", risk_level_name(assessment.level)},
                                        {"hidden_spans", std::to_string(assessment.hidden_spans)},
                                        {"total_spans", std::to_string(assessment.total_spans)}});
    return assessment;
}

}  // namespace spytext
