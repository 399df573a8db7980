#ifndef SPYTEXT_SANITIZER_HPP
#define SPYTEXT_SANITIZER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "spytext/config.hpp"
#include "spytext/risk.hpp"
#include "spytext/visibility.hpp"

namespace spytext {

enum class SanitizationStrategy {
    kStrip,
    kFlag,
    kPreserve,
};

std::string strategy_name(SanitizationStrategy strategy);
SanitizationStrategy parse_strategy(const std::string& name);

struct SanitizationReport {
    int original_span_count = 0;
    int sanitized_span_count = 0;
    int removed_count = 0;
    int flagged_count = 0;
    SanitizationStrategy strategy = SanitizationStrategy::kStrip;
    std::vector<std::string> removed_text_sample;
    std::string safe_text;
};

class TextSanitizer {
public:
    static constexpr std::size_t kRemovedSampleSize = 10;

    explicit TextSanitizer(SanitizationConfig config = {});

    SanitizationReport sanitize(const std::vector<VisibilityVerdict>& verdicts,
                                std::optional<SanitizationStrategy> strategy = std::nullopt,
                                std::optional<RiskLevel> risk_level = std::nullopt) const;

private:
    SanitizationReport strip(const std::vector<VisibilityVerdict>& verdicts) const;
    SanitizationReport flag(const std::vector<VisibilityVerdict>& verdicts) const;
    SanitizationReport preserve(const std::vector<VisibilityVerdict>& verdicts) const;

    SanitizationConfig config_;
};

}  // namespace spytext

#endif  // SPYTEXT_SANITIZER_HPP
