#include "spytext/text_span.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

namespace spytext {

namespace {

using nlohmann::json;

std::string span_context(std::size_t index) {
    return "span " + std::to_string(index) + ": ";
}

double coordinate(const json& value, const std::string& context) {
    if (value.is_null()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (!value.is_number()) {
        throw DocumentError(context + "bbox coordinates must be numbers");
    }
    return value.get<double>();
}

std::optional<Rgb> parse_color(const json& span, const char* key, const std::string& context) {
    auto it = span.find(key);
    if (it == span.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_array() || it->size() != 3) {
        throw DocumentError(context + key + " must be an [r, g, b] array");
    }
    int channels[3] = {0, 0, 0};
    for (std::size_t i = 0; i < 3; ++i) {
        const auto& channel = (*it)[i];
        if (!channel.is_number_integer()) {
            throw DocumentError(context + key + " channels must be integers");
        }
        const auto raw = channel.get<long long>();
        if (raw < 0 || raw > 255) {
            throw DocumentError(context + key + " channels must be within 0..255");
        }
        channels[i] = static_cast<int>(raw);
    }
    return Rgb{static_cast<std::uint8_t>(channels[0]), static_cast<std::uint8_t>(channels[1]),
               static_cast<std::uint8_t>(channels[2])};
}

int parse_page_number(const json& value, const std::string& context) {
    if (!value.is_number_integer()) {
        throw DocumentError(context + "page must be an integer");
    }
    const auto page = value.get<long long>();
    if (page < 1 || page > std::numeric_limits<int>::max()) {
        throw DocumentError(context + "page numbers are 1-indexed");
    }
    return static_cast<int>(page);
}

TextSpan parse_span(const json& entry, std::size_t index) {
    const auto context = span_context(index);
    if (!entry.is_object()) {
        throw DocumentError(context + "expected an object");
    }

    TextSpan span;
    auto text = entry.find("text");
    if (text == entry.end() || !text->is_string()) {
        throw DocumentError(context + "text is required");
    }
    span.text = text->get<std::string>();

    auto page = entry.find("page");
    if (page == entry.end()) {
        throw DocumentError(context + "page is required");
    }
    span.page = parse_page_number(*page, context);

    auto bbox = entry.find("bbox");
    if (bbox == entry.end() || !bbox->is_array() || bbox->size() != 4) {
        throw DocumentError(context + "bbox must be [x0, y0, x1, y1]");
    }
    span.bbox = BoundingBox{coordinate((*bbox)[0], context), coordinate((*bbox)[1], context),
                            coordinate((*bbox)[2], context), coordinate((*bbox)[3], context)};

    auto font_size = entry.find("font_size");
    if (font_size != entry.end() && !font_size->is_null()) {
        if (!font_size->is_number()) {
            throw DocumentError(context + "font_size must be a number");
        }
        span.font_size = font_size->get<double>();
    }

    span.font_color = parse_color(entry, "font_color", context);
    span.background_color = parse_color(entry, "background_color", context);
    return span;
}

}  // namespace

bool BoundingBox::finite() const {
    return std::isfinite(x0) && std::isfinite(y0) && std::isfinite(x1) && std::isfinite(y1);
}

PageGeometry SpanDocument::page_geometry(int page, const PageGeometry& fallback) const {
    auto it = pages.find(page);
    if (it == pages.end()) {
        return fallback;
    }
    return it->second;
}

SpanDocument parse_span_document(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::exception& exc) {
        throw DocumentError(std::string("invalid span document: ") + exc.what());
    }
    if (!root.is_object()) {
        throw DocumentError("span document must be a JSON object");
    }

    SpanDocument document;
    auto name = root.find("document");
    if (name != root.end() && name->is_string()) {
        document.name = name->get<std::string>();
    }

    auto pages = root.find("pages");
    if (pages != root.end() && !pages->is_null()) {
        if (!pages->is_array()) {
            throw DocumentError("pages must be an array");
        }
        for (const auto& entry : *pages) {
            if (!entry.is_object() || !entry.contains("number") || !entry.contains("width") ||
                !entry.contains("height")) {
                throw DocumentError("page entries need number, width and height");
            }
            const int number = parse_page_number(entry.at("number"), "page entry: ");
            const auto& width = entry.at("width");
            const auto& height = entry.at("height");
            if (!width.is_number() || !height.is_number() || width.get<double>() <= 0.0 ||
                height.get<double>() <= 0.0) {
                throw DocumentError("page " + std::to_string(number) + ": geometry must be positive numbers");
            }
            document.pages[number] = PageGeometry{width.get<double>(), height.get<double>()};
        }
    }

    auto spans = root.find("spans");
    if (spans == root.end() || !spans->is_array()) {
        throw DocumentError("span document needs a spans array");
    }
    document.spans.reserve(spans->size());
    for (std::size_t index = 0; index < spans->size(); ++index) {
        document.spans.push_back(parse_span((*spans)[index], index));
    }
    return document;
}

SpanDocument load_span_document(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw DocumentError("unable to open span document: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    auto document = parse_span_document(buffer.str());
    if (document.name.empty()) {
        document.name = std::filesystem::path(path).filename().string();
    }
    return document;
}

}  // namespace spytext
