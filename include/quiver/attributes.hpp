#pragma once

/** \file attributes.hpp
 *  \brief Typed metadata attached to stored vectors.
 */

#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace quiver {

/** \brief One attribute value: string, floating point, integer or boolean. */
using AttributeValue = std::variant<std::string, double, std::int64_t, bool>;

/** \brief Attribute name to value, ordered so serialization is deterministic. */
using Attributes = std::map<std::string, AttributeValue>;

} // namespace quiver
