#include "spytext/config.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "spytext/common.hpp"

namespace spytext {

namespace {

bool parse_bool(const std::string& value) {
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    throw std::runtime_error("invalid boolean: " + value);
}

double parse_double(const std::string& key, const std::string& value) {
    try {
        std::size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(parsed)) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::runtime_error("invalid number for " + key + ": " + value);
    }
}

int parse_int(const std::string& key, const std::string& value) {
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::runtime_error("invalid integer for " + key + ": " + value);
    }
}

std::optional<std::string> parse_optional_string(const std::string& value) {
    auto stripped = strip_quotes(trim(value));
    if (stripped == "null" || stripped == "none") {
        return std::nullopt;
    }
    return stripped;
}

// Drops a trailing comment unless the '#' sits inside a quoted string.
std::string strip_comment(const std::string& line) {
    char quote = 0;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (quote != 0) {
            if (ch == quote) {
                quote = 0;
            }
        } else if (ch == '"' || ch == '\'') {
            quote = ch;
        } else if (ch == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

SpyTextSettings parse_stream(std::istream& input) {
    SpyTextSettings settings;
    std::string current_section;
    std::string line;

    while (std::getline(input, line)) {
        line = trim(strip_comment(line));
        if (line.empty()) {
            continue;
        }
        if (line.front() == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            continue;
        }
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        auto key = trim(line.substr(0, eq_pos));
        auto value = trim(line.substr(eq_pos + 1));

        if (current_section == "logging") {
            if (key == "level") {
                settings.logging.level = strip_quotes(value);
            } else if (key == "json") {
                settings.logging.json = parse_bool(value);
            } else if (key == "log_file") {
                settings.logging.log_file = parse_optional_string(value);
            } else if (key == "max_bytes") {
                settings.logging.max_bytes = parse_int(key, value);
            } else if (key == "backup_count") {
                settings.logging.backup_count = parse_int(key, value);
            }
        } else if (current_section == "visibility") {
            if (key == "contrast_threshold") {
                settings.visibility.contrast_threshold = parse_double(key, value);
            } else if (key == "invisible_threshold") {
                settings.visibility.invisible_threshold = parse_double(key, value);
            } else if (key == "microscopic_font_size") {
                settings.visibility.microscopic_font_size = parse_double(key, value);
            } else if (key == "small_font_size") {
                settings.visibility.small_font_size = parse_double(key, value);
            } else if (key == "default_page_width") {
                settings.visibility.default_page_width = parse_double(key, value);
            } else if (key == "default_page_height") {
                settings.visibility.default_page_height = parse_double(key, value);
            } else if (key == "check_zero_area") {
                settings.visibility.check_zero_area = parse_bool(value);
            }
        } else if (current_section == "risk") {
            if (key == "invisible_threshold") {
                settings.risk.invisible_threshold = parse_int(key, value);
            } else if (key == "suspicious_threshold") {
                settings.risk.suspicious_threshold = parse_int(key, value);
            } else if (key == "scan_all_text") {
                settings.risk.scan_all_text = parse_bool(value);
            }
        } else if (current_section == "sanitization") {
            if (key == "default_strategy") {
                settings.sanitization.default_strategy = to_lower(strip_quotes(value));
            } else if (key == "remove_suspicious") {
                settings.sanitization.remove_suspicious = parse_bool(value);
            } else if (key == "flag_prefix") {
                settings.sanitization.flag_prefix = strip_quotes(value);
            }
        } else if (current_section == "report") {
            if (key == "max_issue_text") {
                settings.report.max_issue_text = parse_int(key, value);
            } else if (key == "consolidate_issues") {
                settings.report.consolidate_issues = parse_bool(value);
            }
        } else if (current_section == "batch") {
            if (key == "max_workers") {
                settings.batch.max_workers = parse_int(key, value);
            }
        }
    }

    return settings;
}

}  // namespace

SpyTextSettings SpyTextSettings::from_toml(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("unable to open config file: " + path);
    }
    return parse_stream(file);
}

SpyTextSettings SpyTextSettings::from_toml_string(const std::string& content) {
    std::istringstream stream(content);
    return parse_stream(stream);
}

void SpyTextSettings::validate() const {
    for (const double value : {visibility.contrast_threshold, visibility.invisible_threshold,
                               visibility.microscopic_font_size, visibility.small_font_size,
                               visibility.default_page_width, visibility.default_page_height}) {
        if (!std::isfinite(value)) {
            throw std::runtime_error("visibility thresholds must be finite numbers");
        }
    }
    if (visibility.invisible_threshold <= 0.0 || visibility.contrast_threshold <= 0.0) {
        throw std::runtime_error("contrast thresholds must be positive");
    }
    if (visibility.invisible_threshold >= visibility.contrast_threshold) {
        throw std::runtime_error("visibility.invisible_threshold must be below visibility.contrast_threshold");
    }
    if (visibility.microscopic_font_size <= 0.0 || visibility.small_font_size <= 0.0) {
        throw std::runtime_error("font size thresholds must be positive");
    }
    if (visibility.microscopic_font_size >= visibility.small_font_size) {
        throw std::runtime_error("visibility.microscopic_font_size must be below visibility.small_font_size");
    }
    if (visibility.default_page_width <= 0.0 || visibility.default_page_height <= 0.0) {
        throw std::runtime_error("default page geometry must be positive");
    }
    if (risk.invisible_threshold < 1 || risk.suspicious_threshold < 1) {
        throw std::runtime_error("risk span-count thresholds must be at least 1");
    }
    const auto& strategy = sanitization.default_strategy;
    if (strategy != "strip" && strategy != "flag" && strategy != "preserve") {
        throw std::runtime_error("unknown sanitization strategy: " + strategy);
    }
    if (report.max_issue_text < 1) {
        throw std::runtime_error("report.max_issue_text must be at least 1");
    }
    if (batch.max_workers < 1) {
        throw std::runtime_error("batch.max_workers must be at least 1");
    }
}

}  // namespace spytext
