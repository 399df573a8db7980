#ifndef SPYTEXT_REPORT_HPP
#define SPYTEXT_REPORT_HPP

#include <string>
#include <vector>

#include "spytext/api.hpp"
#include "spytext/config.hpp"
#include "spytext/risk.hpp"

namespace spytext {

enum class DocumentStatus {
    kSafe,
    kSuspicious,
    kError,
};

std::string status_name(DocumentStatus status);

DocumentStatus document_status(const RiskAssessment& assessment);

int exit_code(DocumentStatus status);

std::vector<std::string> recommendations(const RiskAssessment& assessment);

std::vector<IssueRecord> consolidate_issues(const std::vector<IssueRecord>& issues);

std::string render_json(const AnalysisResult& result, const ReportConfig& config = {});
std::string render_error_json(const std::string& document, const std::string& message);
std::string render_text(const AnalysisResult& result, bool verbose = false);

}  // namespace spytext

#endif  // SPYTEXT_REPORT_HPP
