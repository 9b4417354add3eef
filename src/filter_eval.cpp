#include "quiver/filter_eval.hpp"

#include <optional>

namespace quiver::filter_eval {

static auto as_number(const AttributeValue& v) -> std::optional<double> {
  if (const auto* d = std::get_if<double>(&v)) return *d;
  if (const auto* i = std::get_if<std::int64_t>(&v)) return static_cast<double>(*i);
  return std::nullopt;
}

static auto equal_values(const AttributeValue& a, const AttributeValue& b) -> bool {
  auto na = as_number(a);
  auto nb = as_number(b);
  if (na && nb) return *na == *nb;
  return a == b;
}

static auto matches_node(const filter_expr& e, const Attributes& attrs) -> bool {
  if (std::holds_alternative<term>(e.node)) {
    const auto& t = std::get<term>(e.node);
    auto it = attrs.find(t.field);
    return it != attrs.end() && equal_values(it->second, t.value);
  } else if (std::holds_alternative<range>(e.node)) {
    const auto& r = std::get<range>(e.node);
    auto it = attrs.find(r.field);
    if (it == attrs.end()) return false;
    auto n = as_number(it->second);
    if (!n) return false;
    return (*n >= r.min_value) && (*n <= r.max_value);
  } else if (std::holds_alternative<filter_expr::and_t>(e.node)) {
    const auto& a = std::get<filter_expr::and_t>(e.node);
    for (const auto& c : a.children) if (!matches_node(c, attrs)) return false;
    return true; // and([]) == true
  } else if (std::holds_alternative<filter_expr::or_t>(e.node)) {
    const auto& o = std::get<filter_expr::or_t>(e.node);
    for (const auto& c : o.children) if (matches_node(c, attrs)) return true;
    return false; // or([]) == false
  } else if (std::holds_alternative<filter_expr::not_t>(e.node)) {
    const auto& n = std::get<filter_expr::not_t>(e.node);
    bool v = true; // not([]) == true
    for (const auto& c : n.children) v = v && (!matches_node(c, attrs));
    return v;
  }
  return false;
}

auto matches(const filter_expr& expr, const Attributes& attrs) -> bool {
  return matches_node(expr, attrs);
}

auto apply_filter(const filter_expr* expr, const std::vector<id_view>& records) -> std::vector<std::uint64_t> {
  std::vector<std::uint64_t> ids;
  ids.reserve(records.size());
  if (!expr) {
    for (auto& v : records) ids.push_back(v.id);
    return ids;
  }
  for (auto& v : records) if (matches(*expr, *v.attrs)) ids.push_back(v.id);
  return ids;
}

} // namespace quiver::filter_eval
