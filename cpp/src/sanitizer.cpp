#include "spytext/sanitizer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <tuple>

#include "spytext/common.hpp"

namespace spytext {

namespace {

double sort_coordinate(double value) {
    return std::isfinite(value) ? value : 0.0;
}

// Reading order: page, then top edge, then left edge.
std::string reconstruct_text(std::vector<const TextSpan*> spans) {
    std::stable_sort(spans.begin(), spans.end(), [](const TextSpan* lhs, const TextSpan* rhs) {
        return std::make_tuple(lhs->page, sort_coordinate(lhs->bbox.y0), sort_coordinate(lhs->bbox.x0)) <
               std::make_tuple(rhs->page, sort_coordinate(rhs->bbox.y0), sort_coordinate(rhs->bbox.x0));
    });
    std::vector<std::string> parts;
    parts.reserve(spans.size());
    for (const auto* span : spans) {
        parts.push_back(span->text);
    }
    return join(parts, " ");
}

bool is_suspicious(const VisibilityVerdict& verdict) {
    return verdict.is_hidden && !is_severe(verdict.category);
}

void record_removed(SanitizationReport& report, const TextSpan& span) {
    report.removed_count += 1;
    if (report.removed_text_sample.size() < TextSanitizer::kRemovedSampleSize) {
        report.removed_text_sample.push_back(span.text);
    }
}

}  // namespace

std::string strategy_name(SanitizationStrategy strategy) {
    switch (strategy) {
        case SanitizationStrategy::kStrip:
            return "strip";
        case SanitizationStrategy::kFlag:
            return "flag";
        case SanitizationStrategy::kPreserve:
            return "preserve";
    }
    return "strip";
}

SanitizationStrategy parse_strategy(const std::string& name) {
    const auto lowered = to_lower(trim(name));
    if (lowered == "strip") {
        return SanitizationStrategy::kStrip;
    }
    if (lowered == "flag") {
        return SanitizationStrategy::kFlag;
    }
    if (lowered == "preserve") {
        return SanitizationStrategy::kPreserve;
    }
    throw std::runtime_error("unknown sanitization strategy: " + name);
}

TextSanitizer::TextSanitizer(SanitizationConfig config) : config_(std::move(config)) {}

SanitizationReport TextSanitizer::sanitize(const std::vector<VisibilityVerdict>& verdicts,
                                           std::optional<SanitizationStrategy> strategy,
                                           std::optional<RiskLevel> risk_level) const {
    if (!strategy.has_value()) {
        if (risk_level == RiskLevel::kHigh || risk_level == RiskLevel::kCritical) {
            strategy = SanitizationStrategy::kStrip;
        } else if (risk_level == RiskLevel::kMedium) {
            strategy = SanitizationStrategy::kFlag;
        } else {
            strategy = parse_strategy(config_.default_strategy);
        }
    }

    switch (*strategy) {
        case SanitizationStrategy::kStrip:
            return strip(verdicts);
        case SanitizationStrategy::kFlag:
            return flag(verdicts);
        case SanitizationStrategy::kPreserve:
            return preserve(verdicts);
    }
    return strip(verdicts);
}

SanitizationReport TextSanitizer::strip(const std::vector<VisibilityVerdict>& verdicts) const {
    SanitizationReport report;
    report.strategy = SanitizationStrategy::kStrip;
    report.original_span_count = static_cast<int>(verdicts.size());

    std::vector<const TextSpan*> kept;
    for (const auto& verdict : verdicts) {
        if (verdict.span == nullptr) {
            continue;
        }
        const bool remove = (verdict.is_hidden && is_severe(verdict.category)) ||
                            (config_.remove_suspicious && is_suspicious(verdict));
        if (remove) {
            record_removed(report, *verdict.span);
        } else {
            kept.push_back(verdict.span);
        }
    }
    report.sanitized_span_count = static_cast<int>(kept.size());
    report.safe_text = reconstruct_text(std::move(kept));
    return report;
}

SanitizationReport TextSanitizer::flag(const std::vector<VisibilityVerdict>& verdicts) const {
    SanitizationReport report;
    report.strategy = SanitizationStrategy::kFlag;
    report.original_span_count = static_cast<int>(verdicts.size());

    std::vector<std::string> parts;
    for (const auto& verdict : verdicts) {
        if (verdict.span == nullptr) {
            continue;
        }
        if (verdict.is_hidden && is_severe(verdict.category)) {
            record_removed(report, *verdict.span);
            continue;
        }
        if (is_suspicious(verdict)) {
            report.flagged_count += 1;
            parts.push_back(config_.flag_prefix + verdict.span->text);
        } else {
            parts.push_back(verdict.span->text);
        }
    }
    report.sanitized_span_count = static_cast<int>(parts.size());
    report.safe_text = join(parts, " ");
    return report;
}

SanitizationReport TextSanitizer::preserve(const std::vector<VisibilityVerdict>& verdicts) const {
    SanitizationReport report;
    report.strategy = SanitizationStrategy::kPreserve;
    report.original_span_count = static_cast<int>(verdicts.size());

    std::vector<const TextSpan*> kept;
    for (const auto& verdict : verdicts) {
        if (verdict.span != nullptr) {
            kept.push_back(verdict.span);
        }
    }
    report.sanitized_span_count = static_cast<int>(kept.size());
    report.safe_text = reconstruct_text(std::move(kept));
    return report;
}

}  // namespace spytext
