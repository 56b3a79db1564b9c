#include "quiver/filter_eval.hpp"

namespace quiver {

auto in_set(const std::string& field, const std::vector<metadata::MetadataValue>& values) -> filter_expr {
  filter_expr::or_t any;
  any.children.reserve(values.size());
  for (const auto& v : values) any.children.push_back(filter_expr{term{field, v}});
  return filter_expr{std::move(any)};
}

} // namespace quiver

namespace quiver::filter_eval {

static auto within(const range& r, double v) -> bool {
  if (r.min_value) {
    if (r.min_inclusive ? v < *r.min_value : v <= *r.min_value) return false;
  }
  if (r.max_value) {
    if (r.max_inclusive ? v > *r.max_value : v >= *r.max_value) return false;
  }
  return true;
}

static auto matches_node(const filter_expr& e, const metadata::MetadataMap& attrs) -> bool {
  if (std::holds_alternative<term>(e.node)) {
    const auto& t = std::get<term>(e.node);
    auto it = attrs.find(t.field);
    return it != attrs.end() && it->second == t.value;
  } else if (std::holds_alternative<range>(e.node)) {
    const auto& r = std::get<range>(e.node);
    auto it = attrs.find(r.field);
    if (it == attrs.end()) return false;
    auto v = metadata::numeric_view(it->second);
    return v && within(r, *v);
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

auto matches(const filter_expr& expr, const metadata::MetadataMap& attrs) -> bool {
  return matches_node(expr, attrs);
}

} // namespace quiver::filter_eval
