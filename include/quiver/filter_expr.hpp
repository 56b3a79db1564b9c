#pragma once

/** \file filter_expr.hpp
 *  \brief Filter expression AST for metadata predicates.
 *
 * Ownership: this AST is value-semantic and self-contained.
 */

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "quiver/metadata/metadata_value.hpp"

namespace quiver {

/** \brief Equality predicate field == value (type and value must both match). */
struct term {
  std::string field;              /**< attribute name */
  metadata::MetadataValue value;  /**< typed value */
};

/** \brief Numeric/timestamp range predicate; an absent bound is unbounded. */
struct range {
  std::string field;                /**< attribute name */
  std::optional<double> min_value;  /**< lower bound */
  std::optional<double> max_value;  /**< upper bound */
  bool min_inclusive{true};
  bool max_inclusive{true};
};

/** \brief Recursive filter expression. */
struct filter_expr {
  struct and_t { std::vector<filter_expr> children; };
  struct or_t  { std::vector<filter_expr> children; };
  struct not_t { std::vector<filter_expr> children; };

  std::variant<term, range, and_t, or_t, not_t> node; /**< root node */
};

/** \brief field ∈ values, expressed as a disjunction of terms. */
auto in_set(const std::string& field, const std::vector<metadata::MetadataValue>& values) -> filter_expr;

} // namespace quiver
