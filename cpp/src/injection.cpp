#include "spytext/injection.hpp"

#include <cctype>
#include <regex>
#include <utility>

namespace spytext {

namespace {

struct CompiledPattern {
    std::string id;
    std::regex expression;
};

const std::vector<CompiledPattern>& compiled_catalog() {
    static const std::vector<CompiledPattern> compiled = [] {
        std::vector<CompiledPattern> output;
        for (const auto& entry : injection_catalog()) {
            output.push_back(CompiledPattern{
                entry.id, std::regex(entry.pattern, std::regex::ECMAScript | std::regex::icase)});
        }
        return output;
    }();
    return compiled;
}

// Whitespace runs become one space so \s+ in the catalog never walks a long run.
std::string collapse_whitespace(const std::string& text) {
    std::string output;
    output.reserve(text.size());
    bool in_space = false;
    for (const char ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            if (!in_space) {
                output.push_back(' ');
            }
            in_space = true;
        } else {
            output.push_back(ch);
            in_space = false;
        }
    }
    return output;
}

}  // namespace

const std::vector<InjectionPattern>& injection_catalog() {
    static const std::vector<InjectionPattern> catalog = {
        {"ignore_previous_instructions",
         R"(\bignore\s+(?:all\s+|the\s+|any\s+)?(?:previous|prior|above|earlier|all)\s+(?:instructions?|prompts?|commands?|rules)\b)"},
        {"disregard_previous",
         R"(\bdisregard\s+(?:all\s+|the\s+|any\s+)?(?:previous|prior|above|earlier|all)\b)"},
        {"forget_everything", R"(\bforget\s+(?:everything|all|previous|prior|above)\b)"},
        {"system_role_marker", R"(\bsystem\s*:)"},
        {"assistant_role_marker", R"(\bassistant\s*:)"},
        {"user_role_marker", R"(\buser\s*:)"},
        {"you_are_now", R"(\byou\s+are\s+now\b)"},
        {"pretend_identity", R"(\bpretend\s+(?:to\s+be|you\s+are)\b)"},
        {"act_as", R"(\bact\s+as\s+(?:if|a|an)\b)"},
        {"role_marker", R"(\brole\s*:)"},
        {"new_instructions", R"(\bnew\s+(?:instructions?|prompts?|commands?)\b)"},
        {"override_instructions", R"(\boverride\s+(?:previous|settings?|instructions?)\b)"},
        {"system_prompt", R"(\bsystem\s+prompt\b)"},
        {"privileged_mode", R"(\b(?:debug|developer|jailbreak|god)\s+mode\b)"},
        {"reveal_instructions", R"(\b(?:reveal|print|show)\s+(?:your|the)\s+(?:system\s+)?(?:prompt|instructions)\b)"},
    };
    return catalog;
}

std::vector<std::string> PromptInjectionMatcher::scan(const std::string& text) const {
    std::vector<std::string> matches;
    if (text.empty()) {
        return matches;
    }
    const auto normalized = collapse_whitespace(text);
    for (const auto& entry : compiled_catalog()) {
        if (std::regex_search(normalized, entry.expression)) {
            matches.push_back(entry.id);
        }
    }
    return matches;
}

std::vector<std::string> PromptInjectionMatcher::scan_spans(const SpanDocument& document,
                                                            const std::vector<VisibilityVerdict>& verdicts,
                                                            bool scan_all_text) const {
    std::string combined;
    auto append = [&combined](const std::string& text) {
        if (!combined.empty()) {
            combined.push_back(' ');
        }
        combined += text;
    };

    if (scan_all_text) {
        for (const auto& span : document.spans) {
            append(span.text);
        }
    } else {
        for (const auto& verdict : verdicts) {
            if (verdict.is_hidden && verdict.span != nullptr) {
                append(verdict.span->text);
            }
        }
    }
    return scan(combined);
}

}  // namespace spytext
