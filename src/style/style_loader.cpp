#include "style/style_loader.hpp"
#include "core/error.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <iterator>
#include <limits>

namespace geobim::style {

using json = nlohmann::json;

static Color parse_json_color(const json& value, const std::string& where) {
    if (value.is_string()) {
        auto color = parse_color(value.get<std::string>());
        if (!color) {
            throw InvalidStyleRule(where + ": unrecognized color '" + value.get<std::string>() + "'");
        }
        return *color;
    }

    if (!value.is_array() || (value.size() != 3 && value.size() != 4)) {
        throw InvalidStyleRule(where + ": color must be a string or an array of 3 or 4 numbers");
    }

    float components[4] = {0.0f, 0.0f, 0.0f, 1.0f};
    bool byte_range = false;
    for (size_t i = 0; i < value.size(); ++i) {
        if (!value[i].is_number()) {
            throw InvalidStyleRule(where + ": color component " + std::to_string(i) + " is not a number");
        }
        components[i] = value[i].get<float>();
        if (components[i] > 1.0f) {
            byte_range = true;
        }
    }

    // 0..255 integer triples, as exported by most GIS styling tools
    if (byte_range) {
        for (size_t i = 0; i < value.size(); ++i) {
            if (!value[i].is_number_integer()) {
                throw InvalidStyleRule(where + ": color mixes fractional and 0..255 components");
            }
            components[i] /= 255.0f;
        }
    }

    Color color(components[0], components[1], components[2], components[3]);
    if (!is_valid_color(color)) {
        throw InvalidStyleRule(where + ": color component out of range");
    }
    return color;
}

static AttributeValue parse_condition_value(const json& value, const std::string& where,
                                            const std::string& field) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number()) return value.get<double>();

    throw InvalidStyleRule(where + ": condition on '" + field +
                           "' must be a string, number or boolean, got " + value.type_name());
}

static std::vector<MatchCondition> parse_conditions(const json& value, const std::string& where) {
    std::vector<MatchCondition> conditions;

    if (value.is_object()) {
        for (const auto& [field, expected] : value.items()) {
            conditions.push_back({field, parse_condition_value(expected, where, field)});
        }
    } else if (value.is_array()) {
        for (const auto& pair : value) {
            if (!pair.is_array() || pair.size() != 2 || !pair[0].is_string()) {
                throw InvalidStyleRule(where + ": conditions array entries must be [field, value] pairs");
            }
            std::string field = pair[0].get<std::string>();
            conditions.push_back({field, parse_condition_value(pair[1], where, field)});
        }
    } else {
        throw InvalidStyleRule(where + ": conditions must be an object or an array");
    }

    return conditions;
}

static std::string require_string(const json& object, const char* key, const std::string& where) {
    auto it = object.find(key);
    if (it == object.end()) {
        throw InvalidStyleRule(where + ": missing '" + key + "'");
    }
    if (!it->is_string()) {
        throw InvalidStyleRule(where + ": '" + key + "' must be a string");
    }
    return it->get<std::string>();
}

static StyleRule parse_rule(const json& entry, size_t index) {
    std::string where = "Style rule #" + std::to_string(index);
    if (!entry.is_object()) {
        throw InvalidStyleRule(where + ": must be an object");
    }

    StyleRule rule;
    if (auto it = entry.find("id"); it != entry.end()) {
        if (!it->is_string()) {
            throw InvalidStyleRule(where + ": 'id' must be a string");
        }
        rule.id = it->get<std::string>();
        where = "Style rule '" + rule.id + "' (#" + std::to_string(index) + ")";
    }

    if (auto it = entry.find("conditions"); it != entry.end()) {
        rule.conditions = parse_conditions(*it, where);
    }

    auto color_it = entry.find("color");
    if (color_it == entry.end()) {
        throw InvalidStyleRule(where + ": missing 'color'");
    }
    rule.color = parse_json_color(*color_it, where);

    if (auto it = entry.find("opacity"); it != entry.end()) {
        if (!it->is_number()) {
            throw InvalidStyleRule(where + ": 'opacity' must be a number");
        }
        rule.color.a = it->get<float>();
    }

    rule.category = require_string(entry, "category", where);

    if (auto it = entry.find("priority"); it != entry.end()) {
        if (!it->is_number_integer()) {
            throw InvalidStyleRule(where + ": 'priority' must be an integer");
        }
        bool in_range = it->is_number_unsigned()
            ? it->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
            : it->get<int64_t>() >= std::numeric_limits<int>::min() &&
              it->get<int64_t>() <= std::numeric_limits<int>::max();
        if (!in_range) {
            throw InvalidStyleRule(where + ": 'priority' " + it->dump() + " is out of range");
        }
        rule.priority = it->get<int>();
    }

    return rule;
}

StyleTable StyleLoader::load_string(const std::string& text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        throw InvalidStyleRule(std::string("Style table is not valid JSON: ") + e.what());
    }

    if (!document.is_object()) {
        throw InvalidStyleRule("Style table must be a JSON object");
    }

    DefaultStyle default_style;
    if (auto it = document.find("default"); it != document.end()) {
        if (!it->is_object()) {
            throw InvalidStyleRule("Style table 'default' must be an object");
        }
        if (auto color_it = it->find("color"); color_it != it->end()) {
            default_style.color = parse_json_color(*color_it, "Default style");
        }
        if (it->contains("category")) {
            default_style.category = require_string(*it, "category", "Default style");
        }
    }

    std::vector<StyleRule> rules;
    if (auto it = document.find("rules"); it != document.end()) {
        if (!it->is_array()) {
            throw InvalidStyleRule("Style table 'rules' must be an array");
        }
        rules.reserve(it->size());
        for (size_t i = 0; i < it->size(); ++i) {
            rules.push_back(parse_rule((*it)[i], i));
        }
    }

    return StyleTable(std::move(rules), std::move(default_style));
}

StyleTable StyleLoader::load_file(const std::filesystem::path& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        spdlog::error("StyleLoader: Cannot open style file: {}", filepath.string());
        throw InvalidStyleRule("Cannot open style file: " + filepath.string());
    }

    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    StyleTable table = load_string(text);
    spdlog::info("StyleLoader: Loaded {} style rules from {}", table.size(), filepath.filename().string());
    return table;
}

} // namespace geobim::style
