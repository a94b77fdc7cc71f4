#include "model/property_set.hpp"
#include <unordered_set>

namespace geobim::model {

static bool is_ascii_alnum(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

static bool is_ascii_digit(unsigned char c) {
    return c >= '0' && c <= '9';
}

const Property* PropertySet::find(std::string_view property_name) const {
    for (const auto& property : properties) {
        if (property.name == property_name) {
            return &property;
        }
    }
    return nullptr;
}

bool is_valid_property_name(std::string_view name) {
    if (name.empty()) return false;
    if (is_ascii_digit(static_cast<unsigned char>(name.front()))) return false;

    for (char ch : name) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (!is_ascii_alnum(c) && c != '_') return false;
    }
    return true;
}

std::string sanitize_property_name(std::string_view name) {
    std::string result;
    result.reserve(name.size() + 1);

    for (size_t i = 0; i < name.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(name[i]);

        if (is_ascii_alnum(c) || c == '_') {
            result.push_back(static_cast<char>(c));
            continue;
        }

        result.push_back('_');

        // Swallow the continuation bytes of a UTF-8 sequence
        if (c >= 0xC0) {
            while (i + 1 < name.size() &&
                   (static_cast<unsigned char>(name[i + 1]) & 0xC0) == 0x80) {
                ++i;
            }
        }
    }

    if (result.empty()) {
        return "_";
    }
    if (is_ascii_digit(static_cast<unsigned char>(result.front()))) {
        result.insert(result.begin(), '_');
    }
    return result;
}

PropertySet to_property_set(const AttributeList& attributes, const std::string& set_name) {
    PropertySet set;
    set.name = set_name;
    set.properties.reserve(attributes.size());

    std::unordered_set<std::string> used;
    used.reserve(attributes.size());

    for (const auto& attribute : attributes) {
        std::string base = sanitize_property_name(attribute.name);
        std::string name = base;

        // Collision after sanitization: suffix a counter, never overwrite
        for (int counter = 2; used.count(name) > 0; ++counter) {
            name = base + "_" + std::to_string(counter);
        }
        used.insert(name);

        set.properties.push_back(Property{name, attribute.name, attribute.value});
    }

    return set;
}

} // namespace geobim::model
