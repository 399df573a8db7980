#ifndef SPYTEXT_VISIBILITY_HPP
#define SPYTEXT_VISIBILITY_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "spytext/config.hpp"
#include "spytext/logging.hpp"
#include "spytext/text_span.hpp"

namespace spytext {

enum class VisibilityCategory {
    kVisible,
    kLowContrast,
    kInvisible,
    kMicroscopic,
    kSmall,
    kOffscreen,
};

std::string category_name(VisibilityCategory category);

int category_severity(VisibilityCategory category);

bool is_severe(VisibilityCategory category);

struct VisibilityVerdict {
    VisibilityCategory category = VisibilityCategory::kVisible;
    std::vector<VisibilityCategory> categories;
    std::vector<std::string> reasons;
    bool is_hidden = false;
    std::optional<double> contrast_ratio;
    std::size_t span_index = 0;
    // Points into the analysed SpanDocument, which must outlive the verdict.
    const TextSpan* span = nullptr;
};

class VisibilityClassifier {
public:
    explicit VisibilityClassifier(VisibilityThresholds thresholds = {},
                                  Logger logger = get_logger("VisibilityClassifier"));

    VisibilityVerdict classify(const TextSpan& span, const PageGeometry& page,
                               std::size_t span_index = 0) const;

    std::vector<VisibilityVerdict> classify_all(const SpanDocument& document) const;

    const VisibilityThresholds& thresholds() const;

private:
    VisibilityThresholds thresholds_;
    Logger logger_;
};

}  // namespace spytext

#endif  // SPYTEXT_VISIBILITY_HPP
