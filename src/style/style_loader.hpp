#pragma once

#include "style/style_table.hpp"
#include <filesystem>
#include <string>

namespace geobim::style {

/**
 * @brief Loads a StyleTable from its JSON form
 *
 * Document layout:
 * @code
 * {
 *   "default": { "color": [0.7, 0.7, 0.7], "category": "Unclassified" },
 *   "rules": [
 *     { "id": "dwelling",
 *       "conditions": { "objtype": "Bygning", "bygningstype": 111 },
 *       "color": "#CC9966", "category": "Bolig", "priority": 10 }
 *   ]
 * }
 * @endcode
 *
 * `conditions` may also be an array of [field, value] pairs. Colors are
 * [r, g, b(, a)] in 0..1, [r, g, b(, a)] in 0..255, or a color string.
 * Any structural problem throws InvalidStyleRule.
 */
class StyleLoader {
public:
    /**
     * @brief Load and validate a style file
     * @throws InvalidStyleRule if the file cannot be read or is malformed
     */
    static StyleTable load_file(const std::filesystem::path& filepath);

    /**
     * @brief Parse and validate a JSON document
     * @throws InvalidStyleRule if the text is malformed
     */
    static StyleTable load_string(const std::string& text);
};

} // namespace geobim::style
