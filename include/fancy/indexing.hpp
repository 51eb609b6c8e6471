#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include "errors.hpp"
#include "exec_context.hpp"
#include "ndarray.hpp"

namespace fancy {

// =============================================================================
// Out-of-range policy for choose
// =============================================================================

enum class clip_mode {
    raise,
    wrap,
    clip
};

inline auto to_string(clip_mode m) -> const char* {
    switch (m) {
        case clip_mode::raise: return "raise";
        case clip_mode::wrap:  return "wrap";
        case clip_mode::clip:  return "clip";
    }
    return "unknown";
}

inline auto from_string(std::type_identity<clip_mode>, const std::string& s) -> clip_mode {
    if (s == "raise") return clip_mode::raise;
    if (s == "wrap")  return clip_mode::wrap;
    if (s == "clip")  return clip_mode::clip;
    throw type_mismatch("clipmode not understood: " + s);
}

// =============================================================================
// take: elements of `a` at `indices` along `axis` (numpy.take without `mode`)
// =============================================================================
//
// With no axis, `a` is flattened in C order. The result shape is
// a.shape[:axis] + indices.shape + a.shape[axis+1:]. When `out` is given it
// must have a's dtype and exactly that shape; it is filled and returned.
//
// Index values in an index array are NOT bounds checked: an index outside
// [0, a.shape[axis]) reads outside the array and is undefined behaviour.
// A scalar index may be negative and is bounds checked (index_error).
//
ndarray_t take(const ndarray_t& a, std::int64_t index,
               std::optional<std::int64_t> axis = std::nullopt,
               std::optional<ndarray_t> out = std::nullopt,
               const exec_context_t& ctx = default_context());

ndarray_t take(const ndarray_t& a, const ndarray_t& indices,
               std::optional<std::int64_t> axis = std::nullopt,
               std::optional<ndarray_t> out = std::nullopt,
               const exec_context_t& ctx = default_context());

// Array-like indices, converted to an int64 array in a's memory
ndarray_t take(const ndarray_t& a, const std::vector<std::int64_t>& indices,
               std::optional<std::int64_t> axis = std::nullopt,
               std::optional<ndarray_t> out = std::nullopt,
               const exec_context_t& ctx = default_context());

// =============================================================================
// choose: result[j] = choices[a[j], j] over the broadcast shape
// =============================================================================
//
// Throws value_error under clip_mode::raise if any entry of `a` lies outside
// [0, choices.shape[0]); the check completes before anything is written.
//
ndarray_t choose(const ndarray_t& a, const ndarray_t& choices,
                 std::optional<ndarray_t> out = std::nullopt,
                 clip_mode mode = clip_mode::raise,
                 const exec_context_t& ctx = default_context());

ndarray_t choose(const ndarray_t& a, const ndarray_t& choices,
                 std::optional<ndarray_t> out, const std::string& mode,
                 const exec_context_t& ctx = default_context());

// =============================================================================
// diagonal: writable view of the diagonals along axis1/axis2
// =============================================================================
//
// The remaining axes lead the result and the diagonal is the last axis. The
// result aliases `a` unless the diagonal is empty, in which case a new empty
// array is returned.
//
ndarray_t diagonal(const ndarray_t& a, std::int64_t offset = 0,
                   std::int64_t axis1 = 0, std::int64_t axis2 = 1,
                   const exec_context_t& ctx = default_context());

} // namespace fancy
