#include "spytext/report.hpp"

#include <algorithm>
#include <sstream>

#include <nlohmann/json.hpp>

#include "spytext/common.hpp"

namespace spytext {

namespace {

constexpr std::size_t kPreviewLength = 40;

void append_unique(std::vector<std::string>& target, const std::vector<std::string>& values) {
    for (const auto& value : values) {
        if (std::find(target.begin(), target.end(), value) == target.end()) {
            target.push_back(value);
        }
    }
}

int count_of(const RiskAssessment& assessment, VisibilityCategory category) {
    auto it = assessment.category_counts.find(category);
    return it == assessment.category_counts.end() ? 0 : it->second;
}

}  // namespace

std::string status_name(DocumentStatus status) {
    switch (status) {
        case DocumentStatus::kSafe:
            return "SAFE";
        case DocumentStatus::kSuspicious:
            return "SUSPICIOUS";
        case DocumentStatus::kError:
            return "ERROR";
    }
    return "ERROR";
}

DocumentStatus document_status(const RiskAssessment& assessment) {
    if (assessment.hidden_spans == 0 && !assessment.prompt_injection_detected) {
        return DocumentStatus::kSafe;
    }
    return DocumentStatus::kSuspicious;
}

int exit_code(DocumentStatus status) {
    switch (status) {
        case DocumentStatus::kSafe:
            return 1;
        case DocumentStatus::kSuspicious:
            return 2;
        case DocumentStatus::kError:
            return 3;
    }
    return 3;
}

std::vector<std::string> recommendations(const RiskAssessment& assessment) {
    std::vector<std::string> output;
    const int severe = assessment.severe_spans;
    const int suspicious = assessment.hidden_spans - assessment.severe_spans;

    switch (assessment.level) {
        case RiskLevel::kCritical:
            output.push_back("DO NOT process this document with LLMs");
            if (assessment.prompt_injection_detected) {
                output.push_back("Prompt injection attack detected in hidden text");
            }
            output.push_back("Manual security review required");
            output.push_back("Consider reporting as malicious document");
            break;
        case RiskLevel::kHigh:
            if (assessment.prompt_injection_detected) {
                output.push_back("Block LLM processing - prompt injection detected");
                output.push_back("Review detected patterns before proceeding");
            } else {
                output.push_back("Block LLM processing - excessive hidden text");
                output.push_back("Found " + std::to_string(assessment.hidden_spans) + " hidden text spans");
            }
            output.push_back("Manual review strongly recommended");
            break;
        case RiskLevel::kMedium:
            if (severe > 0) {
                output.push_back("Warn user about invisible text before LLM processing");
                output.push_back("Strip " + std::to_string(severe) + " invisible spans from output");
            }
            if (suspicious > 0) {
                output.push_back("Review " + std::to_string(suspicious) + " suspicious spans for legitimacy");
            }
            output.push_back("Consider manual verification");
            break;
        case RiskLevel::kLow:
            output.push_back("Safe to process with caution");
            output.push_back("Monitor " + std::to_string(assessment.hidden_spans) + " suspicious spans");
            output.push_back("Likely legitimate low-contrast or small text");
            break;
        case RiskLevel::kSafe:
            output.push_back("Safe to process with LLMs");
            output.push_back("No suspicious content detected");
            break;
    }
    return output;
}

std::vector<IssueRecord> consolidate_issues(const std::vector<IssueRecord>& issues) {
    std::vector<IssueRecord> output;
    for (const auto& issue : issues) {
        if (!output.empty() && output.back().page == issue.page && output.back().category == issue.category) {
            auto& current = output.back();
            current.text += " " + issue.text;
            append_unique(current.reasons, issue.reasons);
            continue;
        }
        IssueRecord copy = issue;
        copy.reasons.clear();
        append_unique(copy.reasons, issue.reasons);
        output.push_back(std::move(copy));
    }
    return output;
}

std::string render_json(const AnalysisResult& result, const ReportConfig& config) {
    const auto& assessment = result.assessment;
    nlohmann::json payload;
    payload["status"] = status_name(document_status(assessment));
    payload["document"] = result.document;
    payload["risk_score"] = assessment.score;
    payload["risk_level"] = risk_level_name(assessment.level);
    payload["total_spans"] = assessment.total_spans;
    payload["visible_spans"] = assessment.total_spans - assessment.hidden_spans;
    payload["hidden_spans"] = assessment.hidden_spans;

    nlohmann::json counts = nlohmann::json::object();
    for (const auto& [category, count] : assessment.category_counts) {
        counts[category_name(category)] = count;
    }
    payload["category_counts"] = counts;

    const auto issues = config.consolidate_issues ? consolidate_issues(assessment.issues) : assessment.issues;
    nlohmann::json issue_list = nlohmann::json::array();
    for (const auto& issue : issues) {
        issue_list.push_back({
            {"page", issue.page},
            {"text", truncate_utf8(issue.text, static_cast<std::size_t>(config.max_issue_text))},
            {"severity", category_name(issue.category)},
            {"reasons", join(issue.reasons, ", ")},
        });
    }
    payload["issues"] = issue_list;
    payload["prompt_injection"] = assessment.prompt_injection_detected;
    payload["prompt_injection_patterns"] = assessment.prompt_injection_patterns;
    payload["recommendations"] = recommendations(assessment);
    return payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string render_error_json(const std::string& document, const std::string& message) {
    nlohmann::json payload;
    payload["status"] = status_name(DocumentStatus::kError);
    payload["document"] = document;
    payload["error"] = message;
    payload["risk_score"] = 0;
    payload["total_spans"] = 0;
    payload["issues"] = nlohmann::json::array();
    return payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string render_text(const AnalysisResult& result, bool verbose) {
    const auto& assessment = result.assessment;
    std::ostringstream out;
    out << "Scanning: " << result.document << "\n";
    out << "  Status: " << status_name(document_status(assessment)) << " ("
        << assessment.total_spans - assessment.hidden_spans << " visible, " << assessment.hidden_spans
        << " hidden of " << assessment.total_spans << " spans)\n";
    if (assessment.hidden_spans > 0) {
        out << "  Hidden:";
        for (const auto& entry : category_weights()) {
            const int count = count_of(assessment, entry.category);
            if (count > 0) {
                out << " " << category_name(entry.category) << "=" << count;
            }
        }
        out << "\n";
    }
    out << "  Risk: " << risk_level_name(assessment.level) << " (score " << assessment.score << "/100)\n";
    if (assessment.prompt_injection_detected) {
        out << "  WARNING: Prompt injection detected (" << assessment.prompt_injection_patterns.size()
            << " patterns: " << join(assessment.prompt_injection_patterns, ", ") << ")\n";
    }

    if (verbose) {
        out << "\n";
        for (const auto& recommendation : recommendations(assessment)) {
            out << "  - " << recommendation << "\n";
        }
        if (!assessment.issues.empty()) {
            out << "\n  Hidden text:\n";
            for (const auto& issue : assessment.issues) {
                out << "    [page " << issue.page << "] " << category_name(issue.category) << " '"
                    << truncate_utf8(issue.text, kPreviewLength) << "'";
                if (!issue.reasons.empty()) {
                    out << " - " << join(issue.reasons, "; ");
                }
                out << "\n";
            }
        }
    }
    return out.str();
}

}  // namespace spytext
