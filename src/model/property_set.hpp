#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace geobim::model {

/// Default name of the property set attached to each element
inline constexpr const char* DEFAULT_PROPERTY_SET_NAME = "Attributes";

/**
 * @brief One typed property of an element
 */
struct Property {
    std::string name;           ///< Sanitized identifier, unique within its set
    std::string source_name;    ///< Field name as found in the source
    AttributeValue value;       ///< Unchanged source value
};

/**
 * @brief Named, ordered collection of properties derived from a record
 */
struct PropertySet {
    std::string name = DEFAULT_PROPERTY_SET_NAME;
    std::vector<Property> properties;

    [[nodiscard]] bool empty() const { return properties.empty(); }
    [[nodiscard]] size_t size() const { return properties.size(); }

    /**
     * @brief Find a property by its sanitized name
     * @return Pointer into the set, or nullptr if absent
     */
    [[nodiscard]] const Property* find(std::string_view property_name) const;
};

/**
 * @brief Normalize a field name to [A-Za-z0-9_], not starting with a digit
 *
 * Each invalid ASCII character and each multi-byte UTF-8 sequence becomes
 * one '_'; a leading digit is prefixed with '_'; an empty name becomes "_".
 * Applying it to its own output is a no-op.
 */
[[nodiscard]] std::string sanitize_property_name(std::string_view name);

/**
 * @brief Check whether a name is already in sanitized form
 */
[[nodiscard]] bool is_valid_property_name(std::string_view name);

/**
 * @brief Convert a record's attributes into a property set
 *
 * Every attribute is kept with its original value and type. Names that
 * collide after sanitization get a numeric suffix ("name_2", "name_3", ...).
 * Empty input yields an empty set.
 */
[[nodiscard]] PropertySet to_property_set(const AttributeList& attributes,
                                          const std::string& set_name = DEFAULT_PROPERTY_SET_NAME);

} // namespace geobim::model
