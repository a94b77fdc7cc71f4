#include "style/color.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_map>

namespace geobim::style {

static std::optional<unsigned int> parse_hex_byte(const std::string& hex, size_t pos) {
    unsigned int value = 0;
    for (size_t i = pos; i < pos + 2; ++i) {
        char c = hex[i];
        value <<= 4;
        if (c >= '0' && c <= '9') value |= static_cast<unsigned int>(c - '0');
        else if (c >= 'a' && c <= 'f') value |= static_cast<unsigned int>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') value |= static_cast<unsigned int>(c - 'A' + 10);
        else return std::nullopt;
    }
    return value;
}

std::optional<Color> parse_color(const std::string& color_str) {
    if (color_str.empty()) return std::nullopt;

    // Named colors commonly used in style tables
    static const std::unordered_map<std::string, Color> named_colors = {
        {"red",         {0.8f, 0.2f, 0.2f, 1.0f}},
        {"green",       {0.2f, 0.6f, 0.2f, 1.0f}},
        {"blue",        {0.2f, 0.4f, 0.8f, 1.0f}},
        {"yellow",      {0.9f, 0.85f, 0.2f, 1.0f}},
        {"orange",      {0.9f, 0.5f, 0.1f, 1.0f}},
        {"brown",       {0.55f, 0.35f, 0.2f, 1.0f}},
        {"white",       {0.95f, 0.95f, 0.95f, 1.0f}},
        {"black",       {0.1f, 0.1f, 0.1f, 1.0f}},
        {"grey",        {0.5f, 0.5f, 0.5f, 1.0f}},
        {"gray",        {0.5f, 0.5f, 0.5f, 1.0f}},
        {"beige",       {0.9f, 0.85f, 0.7f, 1.0f}},
        {"tan",         {0.82f, 0.7f, 0.55f, 1.0f}},
        {"pink",        {1.0f, 0.7f, 0.75f, 1.0f}},
        {"maroon",      {0.5f, 0.15f, 0.15f, 1.0f}},
        {"terracotta",  {0.8f, 0.45f, 0.3f, 1.0f}},
        {"brick",       {0.7f, 0.35f, 0.25f, 1.0f}},
        {"slate",       {0.4f, 0.45f, 0.5f, 1.0f}},
        {"silver",      {0.75f, 0.75f, 0.8f, 1.0f}},
    };

    // Convert to lowercase for matching
    std::string lower = color_str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    auto it = named_colors.find(lower);
    if (it != named_colors.end()) {
        return it->second;
    }

    std::string hex = color_str;
    if (hex[0] == '#') {
        hex = hex.substr(1);
    }

    if (hex.length() == 3) {
        // #RGB -> #RRGGBB
        hex = std::string() + hex[0] + hex[0] + hex[1] + hex[1] + hex[2] + hex[2];
    }

    if (hex.length() != 6 && hex.length() != 8) {
        return std::nullopt;
    }

    auto r = parse_hex_byte(hex, 0);
    auto g = parse_hex_byte(hex, 2);
    auto b = parse_hex_byte(hex, 4);
    if (!r || !g || !b) return std::nullopt;

    float alpha = 1.0f;
    if (hex.length() == 8) {
        auto a = parse_hex_byte(hex, 6);
        if (!a) return std::nullopt;
        alpha = static_cast<float>(*a) / 255.0f;
    }

    return Color(static_cast<float>(*r) / 255.0f,
                 static_cast<float>(*g) / 255.0f,
                 static_cast<float>(*b) / 255.0f,
                 alpha);
}

bool is_valid_color(const Color& color) {
    for (int i = 0; i < 4; ++i) {
        float c = color[i];
        if (!std::isfinite(c) || c < 0.0f || c > 1.0f) {
            return false;
        }
    }
    return true;
}

std::string color_to_hex(const Color& color) {
    auto to_byte = [](float c) {
        return static_cast<unsigned int>(std::lround(std::clamp(c, 0.0f, 1.0f) * 255.0f));
    };

    if (color.a < 1.0f) {
        return fmt::format("#{:02X}{:02X}{:02X}{:02X}",
                           to_byte(color.r), to_byte(color.g), to_byte(color.b), to_byte(color.a));
    }
    return fmt::format("#{:02X}{:02X}{:02X}", to_byte(color.r), to_byte(color.g), to_byte(color.b));
}

} // namespace geobim::style
