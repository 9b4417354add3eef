#pragma once

/** \file filter_expr.hpp
 *  \brief Filter expression AST for metadata predicates.
 *
 * Use cases: post-filter search results against per-vector Attributes.
 * Ownership: this AST is value-semantic and self-contained.
 */

#include <string>
#include <variant>
#include <vector>

#include "quiver/attributes.hpp"

namespace quiver {

/** \brief A typed equality predicate field == value. */
struct term {
  std::string field;     /**< attribute name */
  AttributeValue value;  /**< integers and doubles compare numerically */
};

/** \brief A numeric range predicate min_value ≤ field ≤ max_value. */
struct range {
  std::string field; /**< attribute name */
  double min_value{}; /**< inclusive */
  double max_value{}; /**< inclusive */
};

/** \brief Recursive filter expression. */
struct filter_expr {
  struct and_t { std::vector<filter_expr> children; };
  struct or_t  { std::vector<filter_expr> children; };
  struct not_t { std::vector<filter_expr> children; };

  std::variant<term, range, and_t, or_t, not_t> node; /**< root node */
};

} // namespace quiver
