#pragma once

#include <glm/glm.hpp>
#include <optional>
#include <string>

namespace geobim::style {

/// RGBA color, components in [0, 1]
using Color = glm::vec4;

/// Neutral gray used when no rule matches and nothing else is configured
inline const Color DEFAULT_COLOR{0.7f, 0.7f, 0.7f, 1.0f};

/**
 * @brief Parse a color string: "#RGB", "#RRGGBB", "#RRGGBBAA" (the '#' is optional)
 *        or a common color name
 * @return Parsed color, or nullopt if the string is not recognized
 */
[[nodiscard]] std::optional<Color> parse_color(const std::string& color_str);

/**
 * @brief Check that all components are finite and within [0, 1]
 */
[[nodiscard]] bool is_valid_color(const Color& color);

/**
 * @brief Format as "#RRGGBB" (or "#RRGGBBAA" when not opaque)
 */
[[nodiscard]] std::string color_to_hex(const Color& color);

} // namespace geobim::style
