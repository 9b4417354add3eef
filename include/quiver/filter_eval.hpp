#pragma once

/** \file filter_eval.hpp
 *  \brief In-memory evaluation of filter_expr against typed attribute maps.
 */

#include <cstdint>
#include <vector>

#include "quiver/attributes.hpp"
#include "quiver/filter_expr.hpp"

namespace quiver::filter_eval {

// Evaluate whether a record with the given attributes matches the expression.
// A missing field fails term and range; range only matches numeric values.
auto matches(const filter_expr& expr, const Attributes& attrs) -> bool;

// Apply filter to in-memory records: returns ids satisfying expr; if expr==nullptr include all
struct id_view { std::uint64_t id; const Attributes* attrs; };
auto apply_filter(const filter_expr* expr, const std::vector<id_view>& records) -> std::vector<std::uint64_t>;

} // namespace quiver::filter_eval
