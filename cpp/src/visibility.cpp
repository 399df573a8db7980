#include "spytext/visibility.hpp"

#include <algorithm>
#include <array>
#include <cmath>

#include "spytext/color.hpp"
#include "spytext/common.hpp"

namespace spytext {

namespace {

constexpr std::array<VisibilityCategory, 5> kSeverityOrder = {
    VisibilityCategory::kInvisible,
    VisibilityCategory::kMicroscopic,
    VisibilityCategory::kOffscreen,
    VisibilityCategory::kLowContrast,
    VisibilityCategory::kSmall,
};

// Adds decimals until the printed value stays below the limit it fell under: 0.999 -> "0.999", not "1.00".
std::string format_below(double value, double limit, int decimals) {
    auto text = format_fixed(value, decimals);
    while (decimals < 9 && std::stod(text) >= limit) {
        ++decimals;
        text = format_fixed(value, decimals);
    }
    return text;
}

// At least one decimal, trailing zeros dropped: 3 -> "3.0pt", 0.25 -> "0.25pt".
std::string format_points(double size, double limit) {
    auto text = format_below(size, limit, 2);
    while (text.size() > 1 && text.back() == '0' && text[text.size() - 2] != '.') {
        text.pop_back();
    }
    return text + "pt";
}

bool entirely_outside(const BoundingBox& bbox, const PageGeometry& page) {
    return bbox.x1 < 0.0 || bbox.y1 < 0.0 || bbox.x0 > page.width || bbox.y0 > page.height;
}

}  // namespace

std::string category_name(VisibilityCategory category) {
    switch (category) {
        case VisibilityCategory::kVisible:
            return "VISIBLE";
        case VisibilityCategory::kLowContrast:
            return "LOW_CONTRAST";
        case VisibilityCategory::kInvisible:
            return "INVISIBLE";
        case VisibilityCategory::kMicroscopic:
            return "MICROSCOPIC";
        case VisibilityCategory::kSmall:
            return "SMALL";
        case VisibilityCategory::kOffscreen:
            return "OFFSCREEN";
    }
    return "VISIBLE";
}

int category_severity(VisibilityCategory category) {
    for (std::size_t i = 0; i < kSeverityOrder.size(); ++i) {
        if (kSeverityOrder[i] == category) {
            return static_cast<int>(kSeverityOrder.size() - i);
        }
    }
    return 0;
}

bool is_severe(VisibilityCategory category) {
    return category == VisibilityCategory::kInvisible || category == VisibilityCategory::kMicroscopic ||
           category == VisibilityCategory::kOffscreen;
}

VisibilityClassifier::VisibilityClassifier(VisibilityThresholds thresholds, Logger logger)
    : thresholds_(thresholds), logger_(std::move(logger)) {}

const VisibilityThresholds& VisibilityClassifier::thresholds() const {
    return thresholds_;
}

VisibilityVerdict VisibilityClassifier::classify(const TextSpan& span, const PageGeometry& page,
                                                 std::size_t span_index) const {
    VisibilityVerdict verdict;
    verdict.span = &span;
    verdict.span_index = span_index;

    std::vector<VisibilityCategory> triggered;
    std::vector<std::string> notes;

    if (span.bbox.finite()) {
        if (entirely_outside(span.bbox, page)) {
            triggered.push_back(VisibilityCategory::kOffscreen);
            verdict.reasons.push_back("positioned outside the visible page area");
        }
        if (thresholds_.check_zero_area && (span.bbox.width() <= 0.0 || span.bbox.height() <= 0.0)) {
            triggered.push_back(VisibilityCategory::kMicroscopic);
            verdict.reasons.push_back("zero-area bounding box (" + format_fixed(span.bbox.width(), 2) + "x" +
                                      format_fixed(span.bbox.height(), 2) + ")");
        }
    } else {
        notes.push_back("malformed bounding box; position not assessed");
        logger_.warn("span_bbox_malformed",
                     {{"span", std::to_string(span_index)}, {"page", std::to_string(span.page)}});
    }

    const bool contrast_known = span.font_color.has_value() && span.background_color.has_value();
    if (contrast_known) {
        const double ratio = contrast_ratio(*span.font_color, *span.background_color);
        verdict.contrast_ratio = ratio;
        if (ratio < thresholds_.invisible_threshold) {
            triggered.push_back(VisibilityCategory::kInvisible);
            verdict.reasons.push_back("nearly invisible (contrast: " +
                                      format_below(ratio, thresholds_.invisible_threshold, 2) + ":1)");
        } else if (ratio < thresholds_.contrast_threshold) {
            triggered.push_back(VisibilityCategory::kLowContrast);
            verdict.reasons.push_back("low contrast (" + format_below(ratio, thresholds_.contrast_threshold, 2) +
                                      ":1)");
        }
    }

    bool font_known = false;
    if (span.font_size.has_value()) {
        const double size = *span.font_size;
        if (!std::isfinite(size) || size < 0.0) {
            notes.push_back("malformed font size; size not assessed");
            logger_.warn("span_font_size_malformed", {{"span", std::to_string(span_index)}});
        } else {
            font_known = true;
            if (size < thresholds_.microscopic_font_size) {
                triggered.push_back(VisibilityCategory::kMicroscopic);
                verdict.reasons.push_back("impossible to read, " +
                                          format_points(size, thresholds_.microscopic_font_size));
            } else if (size < thresholds_.small_font_size) {
                triggered.push_back(VisibilityCategory::kSmall);
                verdict.reasons.push_back("very difficult to read, " +
                                          format_points(size, thresholds_.small_font_size));
            }
        }
    }

    if (!contrast_known && !font_known) {
        notes.push_back("insufficient metadata to assess");
    }
    verdict.reasons.insert(verdict.reasons.end(), notes.begin(), notes.end());

    for (auto category : kSeverityOrder) {
        if (std::find(triggered.begin(), triggered.end(), category) != triggered.end()) {
            verdict.categories.push_back(category);
        }
    }
    if (!verdict.categories.empty()) {
        verdict.category = verdict.categories.front();
    }
    verdict.is_hidden = verdict.category != VisibilityCategory::kVisible;
    return verdict;
}

std::vector<VisibilityVerdict> VisibilityClassifier::classify_all(const SpanDocument& document) const {
    const PageGeometry fallback{thresholds_.default_page_width, thresholds_.default_page_height};
    std::vector<VisibilityVerdict> verdicts;
    verdicts.reserve(document.spans.size());
    for (std::size_t index = 0; index < document.spans.size(); ++index) {
        const auto& span = document.spans[index];
        verdicts.push_back(classify(span, document.page_geometry(span.page, fallback), index));
    }
    return verdicts;
}

}  // namespace spytext
