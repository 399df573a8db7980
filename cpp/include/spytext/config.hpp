#ifndef SPYTEXT_CONFIG_HPP
#define SPYTEXT_CONFIG_HPP

#include <optional>
#include <string>

namespace spytext {

struct LoggingConfig {
    std::string level = "WARN";
    bool json = false;
    std::optional<std::string> log_file = std::nullopt;
    int max_bytes = 10'485'760;
    int backup_count = 5;
};

struct VisibilityThresholds {
    double contrast_threshold = 3.0;
    double invisible_threshold = 1.5;
    double microscopic_font_size = 1.0;
    double small_font_size = 4.0;
    double default_page_width = 612.0;
    double default_page_height = 792.0;
    bool check_zero_area = true;
};

struct RiskThresholds {
    int invisible_threshold = 2;
    int suspicious_threshold = 5;
    bool scan_all_text = false;
};

struct SanitizationConfig {
    std::string default_strategy = "strip";
    bool remove_suspicious = false;
    std::string flag_prefix = "[SUSPICIOUS] ";
};

struct ReportConfig {
    int max_issue_text = 100;
    bool consolidate_issues = false;
};

struct BatchConfig {
    int max_workers = 4;
};

struct SpyTextSettings {
    LoggingConfig logging{};
    VisibilityThresholds visibility{};
    RiskThresholds risk{};
    SanitizationConfig sanitization{};
    ReportConfig report{};
    BatchConfig batch{};

    static SpyTextSettings from_toml(const std::string& path);
    static SpyTextSettings from_toml_string(const std::string& content);

    void validate() const;
};

}  // namespace spytext

#endif  // SPYTEXT_CONFIG_HPP
