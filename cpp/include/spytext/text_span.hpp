#ifndef SPYTEXT_TEXT_SPAN_HPP
#define SPYTEXT_TEXT_SPAN_HPP

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "spytext/color.hpp"

namespace spytext {

struct BoundingBox {
    double x0 = 0.0;
    double y0 = 0.0;
    double x1 = 0.0;
    double y1 = 0.0;

    double width() const { return x1 - x0; }
    double height() const { return y1 - y0; }
    bool finite() const;
};

struct PageGeometry {
    double width = 612.0;
    double height = 792.0;
};

struct TextSpan {
    std::string text;
    int page = 1;
    BoundingBox bbox{};
    std::optional<double> font_size;
    std::optional<Rgb> font_color;
    std::optional<Rgb> background_color;
};

class DocumentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SpanDocument {
    std::string name;
    std::map<int, PageGeometry> pages;
    std::vector<TextSpan> spans;

    PageGeometry page_geometry(int page, const PageGeometry& fallback) const;
};

SpanDocument parse_span_document(const std::string& json_text);
SpanDocument load_span_document(const std::string& path);

}  // namespace spytext

#endif  // SPYTEXT_TEXT_SPAN_HPP
