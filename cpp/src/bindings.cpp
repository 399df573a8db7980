#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <optional>
#include <string>
#include <vector>

#include "spytext/api.hpp"
#include "spytext/color.hpp"
#include "spytext/injection.hpp"
#include "spytext/report.hpp"
#include "spytext/risk.hpp"
#include "spytext/sanitizer.hpp"
#include "spytext/text_span.hpp"
#include "spytext/visibility.hpp"

namespace py = pybind11;

namespace {

// Verdicts hold pointers into the document, so Python gets both back together.
struct PyAnalysis {
    std::shared_ptr<spytext::SpanDocument> document;
    spytext::AnalysisResult result;
    spytext::SanitizationConfig sanitization;
};

struct PyAnalyzer {
    spytext::DocumentAnalyzer analyzer;
    spytext::SanitizationConfig sanitization;
};

std::optional<spytext::SanitizationStrategy> optional_strategy(const std::optional<std::string>& name) {
    if (!name.has_value()) {
        return std::nullopt;
    }
    return spytext::parse_strategy(*name);
}

}  // namespace

PYBIND11_MODULE(spytext_python, m) {
    m.doc() = "Pybind11 bindings for the spytext visibility and risk engine.";

    py::class_<spytext::Rgb>(m, "Rgb")
        .def(py::init<>())
        .def(py::init([](int r, int g, int b) {
            if (r < 0 || r > 255 || g < 0 || g > 255 || b < 0 || b > 255) {
                throw py::value_error("RGB channels must be within 0..255");
            }
            return spytext::Rgb{static_cast<std::uint8_t>(r), static_cast<std::uint8_t>(g),
                                static_cast<std::uint8_t>(b)};
        }))
        .def_readwrite("r", &spytext::Rgb::r)
        .def_readwrite("g", &spytext::Rgb::g)
        .def_readwrite("b", &spytext::Rgb::b)
        .def("__repr__", [](const spytext::Rgb& color) { return spytext::to_string(color); });

    m.def("relative_luminance", &spytext::relative_luminance);
    m.def("contrast_ratio", &spytext::contrast_ratio);

    py::class_<spytext::BoundingBox>(m, "BoundingBox")
        .def(py::init<>())
        .def(py::init<double, double, double, double>())
        .def_readwrite("x0", &spytext::BoundingBox::x0)
        .def_readwrite("y0", &spytext::BoundingBox::y0)
        .def_readwrite("x1", &spytext::BoundingBox::x1)
        .def_readwrite("y1", &spytext::BoundingBox::y1);

    py::class_<spytext::PageGeometry>(m, "PageGeometry")
        .def(py::init<>())
        .def(py::init<double, double>())
        .def_readwrite("width", &spytext::PageGeometry::width)
        .def_readwrite("height", &spytext::PageGeometry::height);

    py::class_<spytext::TextSpan>(m, "TextSpan")
        .def(py::init<>())
        .def_readwrite("text", &spytext::TextSpan::text)
        .def_readwrite("page", &spytext::TextSpan::page)
        .def_readwrite("bbox", &spytext::TextSpan::bbox)
        .def_readwrite("font_size", &spytext::TextSpan::font_size)
        .def_readwrite("font_color", &spytext::TextSpan::font_color)
        .def_readwrite("background_color", &spytext::TextSpan::background_color);

    py::class_<spytext::SpanDocument, std::shared_ptr<spytext::SpanDocument>>(m, "SpanDocument")
        .def(py::init<>())
        .def_readwrite("name", &spytext::SpanDocument::name)
        .def_readwrite("pages", &spytext::SpanDocument::pages)
        .def_readwrite("spans", &spytext::SpanDocument::spans);

    m.def("parse_span_document", [](const std::string& text) {
        return std::make_shared<spytext::SpanDocument>(spytext::parse_span_document(text));
    });

    py::enum_<spytext::VisibilityCategory>(m, "VisibilityCategory")
        .value("VISIBLE", spytext::VisibilityCategory::kVisible)
        .value("LOW_CONTRAST", spytext::VisibilityCategory::kLowContrast)
        .value("INVISIBLE", spytext::VisibilityCategory::kInvisible)
        .value("MICROSCOPIC", spytext::VisibilityCategory::kMicroscopic)
        .value("SMALL", spytext::VisibilityCategory::kSmall)
        .value("OFFSCREEN", spytext::VisibilityCategory::kOffscreen);

    py::enum_<spytext::RiskLevel>(m, "RiskLevel")
        .value("SAFE", spytext::RiskLevel::kSafe)
        .value("LOW", spytext::RiskLevel::kLow)
        .value("MEDIUM", spytext::RiskLevel::kMedium)
        .value("HIGH", spytext::RiskLevel::kHigh)
        .value("CRITICAL", spytext::RiskLevel::kCritical);

    py::class_<spytext::VisibilityThresholds>(m, "VisibilityThresholds")
        .def(py::init<>())
        .def_readwrite("contrast_threshold", &spytext::VisibilityThresholds::contrast_threshold)
        .def_readwrite("invisible_threshold", &spytext::VisibilityThresholds::invisible_threshold)
        .def_readwrite("microscopic_font_size", &spytext::VisibilityThresholds::microscopic_font_size)
        .def_readwrite("small_font_size", &spytext::VisibilityThresholds::small_font_size)
        .def_readwrite("default_page_width", &spytext::VisibilityThresholds::default_page_width)
        .def_readwrite("default_page_height", &spytext::VisibilityThresholds::default_page_height)
        .def_readwrite("check_zero_area", &spytext::VisibilityThresholds::check_zero_area);

    py::class_<spytext::RiskThresholds>(m, "RiskThresholds")
        .def(py::init<>())
        .def_readwrite("invisible_threshold", &spytext::RiskThresholds::invisible_threshold)
        .def_readwrite("suspicious_threshold", &spytext::RiskThresholds::suspicious_threshold)
        .def_readwrite("scan_all_text", &spytext::RiskThresholds::scan_all_text);

    py::class_<spytext::SanitizationConfig>(m, "SanitizationConfig")
        .def(py::init<>())
        .def_readwrite("default_strategy", &spytext::SanitizationConfig::default_strategy)
        .def_readwrite("remove_suspicious", &spytext::SanitizationConfig::remove_suspicious)
        .def_readwrite("flag_prefix", &spytext::SanitizationConfig::flag_prefix);

    py::class_<spytext::SpyTextSettings>(m, "SpyTextSettings")
        .def(py::init<>())
        .def_static("from_toml", &spytext::SpyTextSettings::from_toml)
        .def("validate", &spytext::SpyTextSettings::validate)
        .def_readwrite("visibility", &spytext::SpyTextSettings::visibility)
        .def_readwrite("risk", &spytext::SpyTextSettings::risk)
        .def_readwrite("sanitization", &spytext::SpyTextSettings::sanitization);

    py::class_<spytext::VisibilityVerdict>(m, "VisibilityVerdict")
        .def_readonly("category", &spytext::VisibilityVerdict::category)
        .def_readonly("categories", &spytext::VisibilityVerdict::categories)
        .def_readonly("reasons", &spytext::VisibilityVerdict::reasons)
        .def_readonly("is_hidden", &spytext::VisibilityVerdict::is_hidden)
        .def_readonly("contrast_ratio", &spytext::VisibilityVerdict::contrast_ratio)
        .def_readonly("span_index", &spytext::VisibilityVerdict::span_index);

    py::class_<spytext::VisibilityClassifier>(m, "VisibilityClassifier")
        .def(py::init([](spytext::VisibilityThresholds thresholds) {
                 return spytext::VisibilityClassifier(thresholds);
             }),
             py::arg("thresholds") = spytext::VisibilityThresholds{})
        .def("classify",
             [](const spytext::VisibilityClassifier& classifier, const spytext::TextSpan& span,
                const spytext::PageGeometry& page) {
                 auto verdict = classifier.classify(span, page);
                 verdict.span = nullptr;
                 return verdict;
             },
             py::arg("span"), py::arg("page") = spytext::PageGeometry{});

    py::class_<spytext::PromptInjectionMatcher>(m, "PromptInjectionMatcher")
        .def(py::init<>())
        .def("scan", &spytext::PromptInjectionMatcher::scan);

    py::class_<spytext::IssueRecord>(m, "IssueRecord")
        .def_readonly("page", &spytext::IssueRecord::page)
        .def_readonly("category", &spytext::IssueRecord::category)
        .def_readonly("text", &spytext::IssueRecord::text)
        .def_readonly("reasons", &spytext::IssueRecord::reasons)
        .def_readonly("span_index", &spytext::IssueRecord::span_index);

    py::class_<spytext::RiskAssessment>(m, "RiskAssessment")
        .def_readonly("score", &spytext::RiskAssessment::score)
        .def_readonly("level", &spytext::RiskAssessment::level)
        .def_readonly("total_spans", &spytext::RiskAssessment::total_spans)
        .def_readonly("hidden_spans", &spytext::RiskAssessment::hidden_spans)
        .def_readonly("severe_spans", &spytext::RiskAssessment::severe_spans)
        .def_readonly("weighted_score", &spytext::RiskAssessment::weighted_score)
        .def_readonly("category_counts", &spytext::RiskAssessment::category_counts)
        .def_readonly("issues", &spytext::RiskAssessment::issues)
        .def_readonly("prompt_injection_patterns", &spytext::RiskAssessment::prompt_injection_patterns)
        .def_readonly("prompt_injection_detected", &spytext::RiskAssessment::prompt_injection_detected);

    py::class_<spytext::RiskAggregator>(m, "RiskAggregator")
        .def(py::init([](spytext::RiskThresholds thresholds) { return spytext::RiskAggregator(thresholds); }),
             py::arg("thresholds") = spytext::RiskThresholds{})
        .def("aggregate", &spytext::RiskAggregator::aggregate, py::arg("verdicts"),
             py::arg("prompt_injection_matches") = std::vector<std::string>{});

    py::enum_<spytext::SanitizationStrategy>(m, "SanitizationStrategy")
        .value("STRIP", spytext::SanitizationStrategy::kStrip)
        .value("FLAG", spytext::SanitizationStrategy::kFlag)
        .value("PRESERVE", spytext::SanitizationStrategy::kPreserve);

    py::class_<spytext::SanitizationReport>(m, "SanitizationReport")
        .def_readonly("original_span_count", &spytext::SanitizationReport::original_span_count)
        .def_readonly("sanitized_span_count", &spytext::SanitizationReport::sanitized_span_count)
        .def_readonly("removed_count", &spytext::SanitizationReport::removed_count)
        .def_readonly("flagged_count", &spytext::SanitizationReport::flagged_count)
        .def_readonly("strategy", &spytext::SanitizationReport::strategy)
        .def_readonly("removed_text_sample", &spytext::SanitizationReport::removed_text_sample)
        .def_readonly("safe_text", &spytext::SanitizationReport::safe_text);

    py::class_<PyAnalysis>(m, "Analysis")
        .def_readonly("document", &PyAnalysis::document)
        .def_property_readonly("verdicts",
                               [](const PyAnalysis& analysis) {
                                   auto verdicts = analysis.result.verdicts;
                                   for (auto& verdict : verdicts) {
                                       verdict.span = nullptr;
                                   }
                                   return verdicts;
                               })
        .def_property_readonly("assessment", [](const PyAnalysis& analysis) { return analysis.result.assessment; })
        .def("to_json",
             [](const PyAnalysis& analysis) { return spytext::render_json(analysis.result); })
        .def("sanitize",
             [](const PyAnalysis& analysis, const std::optional<std::string>& strategy) {
                 spytext::TextSanitizer sanitizer(analysis.sanitization);
                 return sanitizer.sanitize(analysis.result.verdicts, optional_strategy(strategy),
                                           analysis.result.assessment.level);
             },
             py::arg("strategy") = py::none())
        .def("safe_text",
             [](const PyAnalysis& analysis, const std::optional<std::string>& strategy) {
                 spytext::TextSanitizer sanitizer(analysis.sanitization);
                 const auto report = sanitizer.sanitize(analysis.result.verdicts, optional_strategy(strategy),
                                                        analysis.result.assessment.level);
                 return report.safe_text;
             },
             py::arg("strategy") = py::none());

    py::class_<PyAnalyzer>(m, "DocumentAnalyzer")
        .def(py::init([](const spytext::SpyTextSettings& settings) {
                 settings.validate();
                 return PyAnalyzer{spytext::DocumentAnalyzer(settings), settings.sanitization};
             }),
             py::arg("settings") = spytext::SpyTextSettings{})
        .def("analyze", [](const PyAnalyzer& self, std::shared_ptr<spytext::SpanDocument> document) {
            auto snapshot = std::make_shared<spytext::SpanDocument>(*document);
            auto result = self.analyzer.analyze(*snapshot);
            return PyAnalysis{std::move(snapshot), std::move(result), self.sanitization};
        });

    m.def("exit_code_for", [](const spytext::RiskAssessment& assessment) {
        return spytext::exit_code(spytext::document_status(assessment));
    });
}
