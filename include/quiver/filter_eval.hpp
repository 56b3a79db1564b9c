#pragma once

/** \file filter_eval.hpp
 *  \brief In-memory evaluation of filter_expr against record metadata.
 */

#include "quiver/filter_expr.hpp"
#include "quiver/metadata/metadata_value.hpp"

namespace quiver::filter_eval {

// Evaluate whether a record with the given metadata matches the expression.
// Absent fields never match a term or range.
auto matches(const filter_expr& expr, const metadata::MetadataMap& attrs) -> bool;

} // namespace quiver::filter_eval
