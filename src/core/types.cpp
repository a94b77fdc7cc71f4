#include "core/types.hpp"
#include <spdlog/fmt/fmt.h>

namespace geobim {

ValueKind value_kind(const AttributeValue& value) {
    switch (value.index()) {
        case 0: return ValueKind::String;
        case 1: return ValueKind::Number;
        default: return ValueKind::Boolean;
    }
}

bool values_equal(const AttributeValue& a, const AttributeValue& b) {
    if (a.index() != b.index()) return false;

    if (const auto* sa = std::get_if<std::string>(&a)) {
        return *sa == std::get<std::string>(b);
    }
    if (const auto* na = std::get_if<double>(&a)) {
        return *na == std::get<double>(b);
    }
    return std::get<bool>(a) == std::get<bool>(b);
}

std::string value_to_string(const AttributeValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    if (const auto* n = std::get_if<double>(&value)) {
        return fmt::format("{}", *n);
    }
    return std::get<bool>(value) ? "true" : "false";
}

const Attribute* find_attribute(const AttributeList& attributes, std::string_view name) {
    for (const auto& attribute : attributes) {
        if (attribute.name == name) {
            return &attribute;
        }
    }
    return nullptr;
}

} // namespace geobim
