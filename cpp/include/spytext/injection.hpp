#ifndef SPYTEXT_INJECTION_HPP
#define SPYTEXT_INJECTION_HPP

#include <string>
#include <vector>

#include "spytext/text_span.hpp"
#include "spytext/visibility.hpp"

namespace spytext {

struct InjectionPattern {
    const char* id;
    const char* pattern;
};

const std::vector<InjectionPattern>& injection_catalog();

class PromptInjectionMatcher {
public:
    std::vector<std::string> scan(const std::string& text) const;

    std::vector<std::string> scan_spans(const SpanDocument& document,
                                        const std::vector<VisibilityVerdict>& verdicts,
                                        bool scan_all_text = false) const;
};

}  // namespace spytext

#endif  // SPYTEXT_INJECTION_HPP
