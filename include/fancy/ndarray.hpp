#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "buffer.hpp"
#include "core.hpp"
#include "dtype.hpp"
#include "errors.hpp"
#include "exec_context.hpp"

namespace fancy {

// NumPy's limit; kernels carry shapes in fixed-capacity vectors of this size
inline constexpr std::size_t max_rank = 32;

using shape_t = std::vector<std::size_t>;
using strides_t = std::vector<std::ptrdiff_t>;

enum class contiguity {
    no,
    yes,
    unknown
};

// =============================================================================
// ndarray_t: Runtime-typed strided array over a shared buffer
// =============================================================================
//
// Strides and the offset are counted in elements. Copying an ndarray_t copies
// the handle, not the data: both copies address the same buffer.
//
struct ndarray_t {
    std::shared_ptr<buffer_t> _buffer;
    std::ptrdiff_t _offset = 0;
    shape_t _shape;
    strides_t _strides;
    dtype _dtype = dtype::float64;
    contiguity _c_contiguous = contiguity::yes;
    contiguity _f_contiguous = contiguity::yes;

    ndarray_t() = default;
};

// =============================================================================
// Free functions for ndarray_t
// =============================================================================

inline const shape_t& shape(const ndarray_t& a) { return a._shape; }
inline const strides_t& strides(const ndarray_t& a) { return a._strides; }
inline std::size_t rank(const ndarray_t& a) { return a._shape.size(); }
inline dtype dtype_of(const ndarray_t& a) { return a._dtype; }
inline std::ptrdiff_t offset(const ndarray_t& a) { return a._offset; }
inline contiguity c_contiguous(const ndarray_t& a) { return a._c_contiguous; }
inline contiguity f_contiguous(const ndarray_t& a) { return a._f_contiguous; }

inline memory location(const ndarray_t& a) {
    return a._buffer ? a._buffer->_location : memory::host;
}

inline std::size_t size(const shape_t& sh) {
    std::size_t n = 1;
    for (auto d : sh) n *= d;
    return n;
}

inline std::size_t size(const ndarray_t& a) { return size(a._shape); }

inline bool shares_memory(const ndarray_t& a, const ndarray_t& b) {
    return a._buffer && a._buffer == b._buffer;
}

std::string to_string(const shape_t& sh);

// Typed pointer to the first addressed element
template<Element T>
T* data(const ndarray_t& a) {
    if (dtype_v<T> != a._dtype) {
        throw type_mismatch(std::string("data: array has dtype ") + to_string(a._dtype)
            + ", requested " + to_string(dtype_v<T>));
    }
    if (!a._buffer || !a._buffer->_data) return nullptr;
    return static_cast<T*>(a._buffer->_data) + a._offset;
}

// =============================================================================
// Layout helpers
// =============================================================================

strides_t c_strides(const shape_t& sh);
contiguity is_c_contiguous(const shape_t& sh, const strides_t& st);
contiguity is_f_contiguous(const shape_t& sh, const strides_t& st);

// Flag value, recomputed from the layout when it is unknown
inline bool is_c_contiguous(const ndarray_t& a) {
    if (a._c_contiguous == contiguity::unknown) {
        return is_c_contiguous(a._shape, a._strides) == contiguity::yes;
    }
    return a._c_contiguous == contiguity::yes;
}

// Normalise a possibly negative axis against a rank; throws invalid_argument
std::size_t normalize_axis(std::int64_t axis, std::size_t ndim, const char* where);

// =============================================================================
// Allocation
// =============================================================================

// New C-contiguous array; the buffer is zero filled
ndarray_t empty(const shape_t& sh, dtype t, memory loc = memory::host);

inline ndarray_t zeros(const shape_t& sh, dtype t, memory loc = memory::host) {
    return empty(sh, t, loc);
}

// New view over the buffer of `base` with flags computed from the layout
ndarray_t make_view(const ndarray_t& base, std::ptrdiff_t offset, shape_t sh, strides_t st);

// New view with explicitly supplied contiguity flags
ndarray_t make_view(const ndarray_t& base, std::ptrdiff_t offset, shape_t sh, strides_t st,
                    contiguity c, contiguity f);

template<Element T>
ndarray_t from_vector(const std::vector<T>& values, const shape_t& sh, memory loc = memory::host) {
    if (values.size() != size(sh)) {
        throw shape_mismatch("from_vector: " + std::to_string(values.size())
            + " values cannot fill shape " + to_string(sh));
    }
    auto a = empty(sh, dtype_v<T>, loc);
    auto staging = std::make_unique<T[]>(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        staging[i] = values[i];
    }
    detail::memcpy_any(data<T>(a), staging.get(), values.size() * sizeof(T), loc, memory::host);
    return a;
}

template<Element T>
ndarray_t from_vector(const std::vector<T>& values, memory loc = memory::host) {
    return from_vector(values, shape_t{values.size()}, loc);
}

// 1D sequence 0, 1, ..., n - 1
template<Element T>
ndarray_t arange(std::size_t n, memory loc = memory::host) {
    std::vector<T> values(n);
    for (std::size_t i = 0; i < n; ++i) {
        values[i] = static_cast<T>(i);
    }
    return from_vector(values, shape_t{n}, loc);
}

// =============================================================================
// Views
// =============================================================================

ndarray_t transpose(const ndarray_t& a, const std::vector<std::size_t>& axes);
ndarray_t transpose(const ndarray_t& a);

// Move `axis` so it lies before position `start` (numpy.rollaxis)
ndarray_t rollaxis(const ndarray_t& a, std::int64_t axis, std::int64_t start = 0);

// Insert a unit axis at position `axis`
ndarray_t expand_dims(const ndarray_t& a, std::int64_t axis);

// Element `k` along `axis`, removing the axis
ndarray_t index(const ndarray_t& a, std::int64_t axis, std::int64_t k);

// Elements [begin, end) along `axis`
ndarray_t window(const ndarray_t& a, std::size_t axis, std::size_t begin, std::size_t end);

// =============================================================================
// Broadcasting
// =============================================================================

shape_t broadcast_shapes(const shape_t& a, const shape_t& b);
ndarray_t broadcast_to(const ndarray_t& a, const shape_t& sh);
std::pair<ndarray_t, ndarray_t> broadcast_arrays(const ndarray_t& a, const ndarray_t& b);

// =============================================================================
// Materialising operations (launch kernels through the execution context)
// =============================================================================

// C-contiguous copy in the same memory
ndarray_t copy(const ndarray_t& a, const exec_context_t& ctx = default_context());

// Write `src`, broadcast to the shape of `dst`, into `dst`
void assign(const ndarray_t& dst, const ndarray_t& src, const exec_context_t& ctx = default_context());

// View when C-contiguous, otherwise a reshaped copy
ndarray_t reshape(const ndarray_t& a, const shape_t& sh, const exec_context_t& ctx = default_context());
ndarray_t ravel(const ndarray_t& a, const exec_context_t& ctx = default_context());

// Throws invalid_argument when the context's policy cannot address the array's memory
void require_accessible(const exec_context_t& ctx, const ndarray_t& a, const char* where);

// =============================================================================
// Host access
// =============================================================================

template<Element T>
std::vector<T> to_vector(const ndarray_t& a, const exec_context_t& ctx = default_context()) {
    auto n = size(a);
    auto c = is_c_contiguous(a) ? a : copy(a, ctx);
    auto staging = std::make_unique<T[]>(n);
    detail::memcpy_any(staging.get(), data<T>(c), n * sizeof(T), memory::host, location(c));
    return std::vector<T>(staging.get(), staging.get() + n);
}

// Single element read, host/device transparent
template<Element T>
T item(const ndarray_t& a, const std::vector<std::int64_t>& idx) {
    if (idx.size() != rank(a)) {
        throw index_error("item: expected " + std::to_string(rank(a)) + " indices, got "
            + std::to_string(idx.size()));
    }
    std::ptrdiff_t off = 0;
    for (std::size_t d = 0; d < idx.size(); ++d) {
        auto k = idx[d] < 0 ? idx[d] + std::int64_t(a._shape[d]) : idx[d];
        if (k < 0 || k >= std::int64_t(a._shape[d])) {
            throw index_error("item: index " + std::to_string(idx[d]) + " is out of bounds for axis "
                + std::to_string(d) + " with size " + std::to_string(a._shape[d]));
        }
        off += std::ptrdiff_t(k) * a._strides[d];
    }
    T value{};
    detail::memcpy_any(&value, data<T>(a) + off, sizeof(T), memory::host, location(a));
    return value;
}

} // namespace fancy
