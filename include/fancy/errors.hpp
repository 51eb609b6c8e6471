#pragma once

#include <stdexcept>
#include <string>

namespace fancy {

// =============================================================================
// Exception kinds raised by array construction and indexing operations
// =============================================================================

struct error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Bad axis, bad reshape, unusable execution policy for an operand's memory
struct invalid_argument : error {
    using error::error;
};

// Output dtype differs from the result dtype, or an index has a non-integer dtype
struct type_mismatch : error {
    using error::error;
};

// Output shape differs from the result shape, or shapes do not broadcast
struct shape_mismatch : error {
    using error::error;
};

// Selector values outside the accepted range
struct value_error : error {
    using error::error;
};

// Scalar index outside an axis
struct index_error : error {
    using error::error;
};

} // namespace fancy
