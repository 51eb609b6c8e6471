#include "fancy/ndarray.hpp"

#include <algorithm>
#include <sstream>
#include "fancy/kernels.hpp"

namespace fancy {

// =============================================================================
// Formatting and layout helpers
// =============================================================================

std::string to_string(const shape_t& sh) {
    auto oss = std::ostringstream{};
    oss << "(";
    for (std::size_t i = 0; i < sh.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << sh[i];
    }
    if (sh.size() == 1) oss << ",";
    oss << ")";
    return oss.str();
}

strides_t c_strides(const shape_t& sh) {
    auto st = strides_t(sh.size());
    std::ptrdiff_t s = 1;
    for (std::size_t i = sh.size(); i > 0; --i) {
        st[i - 1] = s;
        s *= std::ptrdiff_t(sh[i - 1]);
    }
    return st;
}

// Unit extents never move the address, so their strides are ignored
contiguity is_c_contiguous(const shape_t& sh, const strides_t& st) {
    if (size(sh) == 0) return contiguity::yes;
    std::ptrdiff_t expected = 1;
    for (std::size_t i = sh.size(); i > 0; --i) {
        if (sh[i - 1] == 1) continue;
        if (st[i - 1] != expected) return contiguity::no;
        expected *= std::ptrdiff_t(sh[i - 1]);
    }
    return contiguity::yes;
}

contiguity is_f_contiguous(const shape_t& sh, const strides_t& st) {
    if (size(sh) == 0) return contiguity::yes;
    std::ptrdiff_t expected = 1;
    for (std::size_t i = 0; i < sh.size(); ++i) {
        if (sh[i] == 1) continue;
        if (st[i] != expected) return contiguity::no;
        expected *= std::ptrdiff_t(sh[i]);
    }
    return contiguity::yes;
}

std::size_t normalize_axis(std::int64_t axis, std::size_t ndim, const char* where) {
    auto n = std::int64_t(ndim);
    if (axis < -n || axis >= n) {
        throw invalid_argument(std::string(where) + ": axis " + std::to_string(axis)
            + " is out of bounds for array of dimension " + std::to_string(ndim));
    }
    return std::size_t(axis < 0 ? axis + n : axis);
}

static void require_rank(std::size_t ndim, const char* where) {
    if (ndim > max_rank) {
        throw invalid_argument(std::string(where) + ": rank " + std::to_string(ndim)
            + " exceeds the maximum of " + std::to_string(max_rank));
    }
}

// =============================================================================
// Allocation and views
// =============================================================================

ndarray_t empty(const shape_t& sh, dtype t, memory loc) {
    require_rank(sh.size(), "empty");
    auto a = ndarray_t{};
    a._buffer = make_buffer(size(sh) * itemsize(t), loc);
    a._offset = 0;
    a._shape = sh;
    a._strides = c_strides(sh);
    a._dtype = t;
    a._c_contiguous = contiguity::yes;
    a._f_contiguous = is_f_contiguous(a._shape, a._strides);
    return a;
}

ndarray_t make_view(const ndarray_t& base, std::ptrdiff_t offset, shape_t sh, strides_t st,
                    contiguity c, contiguity f) {
    require_rank(sh.size(), "make_view");
    auto v = ndarray_t{};
    v._buffer = base._buffer;
    v._offset = offset;
    v._shape = std::move(sh);
    v._strides = std::move(st);
    v._dtype = base._dtype;
    v._c_contiguous = c;
    v._f_contiguous = f;
    return v;
}

ndarray_t make_view(const ndarray_t& base, std::ptrdiff_t offset, shape_t sh, strides_t st) {
    auto c = is_c_contiguous(sh, st);
    auto f = is_f_contiguous(sh, st);
    return make_view(base, offset, std::move(sh), std::move(st), c, f);
}

ndarray_t transpose(const ndarray_t& a, const std::vector<std::size_t>& axes) {
    auto n = rank(a);
    if (axes.size() != n) {
        throw invalid_argument("transpose: axes don't match array");
    }
    auto seen = std::vector<bool>(n, false);
    auto sh = shape_t(n);
    auto st = strides_t(n);
    for (std::size_t i = 0; i < n; ++i) {
        if (axes[i] >= n || seen[axes[i]]) {
            throw invalid_argument("transpose: axes must be a permutation of the array's axes");
        }
        seen[axes[i]] = true;
        sh[i] = a._shape[axes[i]];
        st[i] = a._strides[axes[i]];
    }
    return make_view(a, a._offset, std::move(sh), std::move(st));
}

ndarray_t transpose(const ndarray_t& a) {
    auto axes = std::vector<std::size_t>(rank(a));
    for (std::size_t i = 0; i < axes.size(); ++i) {
        axes[i] = axes.size() - 1 - i;
    }
    return transpose(a, axes);
}

ndarray_t rollaxis(const ndarray_t& a, std::int64_t axis, std::int64_t start) {
    auto n = rank(a);
    auto ax = normalize_axis(axis, n, "rollaxis");
    auto st = start < 0 ? start + std::int64_t(n) : start;
    if (st < 0 || st > std::int64_t(n)) {
        throw invalid_argument("rollaxis: start " + std::to_string(start) + " is out of bounds");
    }
    auto pos = std::size_t(st);
    if (ax < pos) pos -= 1;
    if (ax == pos) return a;

    auto axes = std::vector<std::size_t>{};
    for (std::size_t i = 0; i < n; ++i) {
        if (i != ax) axes.push_back(i);
    }
    axes.insert(axes.begin() + std::ptrdiff_t(pos), ax);
    return transpose(a, axes);
}

ndarray_t expand_dims(const ndarray_t& a, std::int64_t axis) {
    auto ax = normalize_axis(axis, rank(a) + 1, "expand_dims");
    auto sh = a._shape;
    auto st = a._strides;
    sh.insert(sh.begin() + std::ptrdiff_t(ax), 1);
    st.insert(st.begin() + std::ptrdiff_t(ax), 0);
    return make_view(a, a._offset, std::move(sh), std::move(st));
}

ndarray_t index(const ndarray_t& a, std::int64_t axis, std::int64_t k) {
    auto ax = normalize_axis(axis, rank(a), "index");
    auto dim = std::int64_t(a._shape[ax]);
    if (k < -dim || k >= dim) {
        throw index_error("index " + std::to_string(k) + " is out of bounds for axis "
            + std::to_string(ax) + " with size " + std::to_string(dim));
    }
    if (k < 0) k += dim;
    auto sh = a._shape;
    auto st = a._strides;
    auto off = a._offset + std::ptrdiff_t(k) * st[ax];
    sh.erase(sh.begin() + std::ptrdiff_t(ax));
    st.erase(st.begin() + std::ptrdiff_t(ax));
    return make_view(a, off, std::move(sh), std::move(st));
}

ndarray_t window(const ndarray_t& a, std::size_t axis, std::size_t begin, std::size_t end) {
    if (axis >= rank(a)) {
        throw invalid_argument("window: axis " + std::to_string(axis) + " is out of bounds");
    }
    end = std::min(end, a._shape[axis]);
    begin = std::min(begin, end);
    auto sh = a._shape;
    sh[axis] = end - begin;
    auto off = a._offset + std::ptrdiff_t(begin) * a._strides[axis];
    return make_view(a, off, std::move(sh), a._strides);
}

// =============================================================================
// Broadcasting
// =============================================================================

shape_t broadcast_shapes(const shape_t& a, const shape_t& b) {
    auto n = std::max(a.size(), b.size());
    auto r = shape_t(n);
    for (std::size_t i = 0; i < n; ++i) {
        auto da = i < n - a.size() ? 1 : a[i - (n - a.size())];
        auto db = i < n - b.size() ? 1 : b[i - (n - b.size())];
        if (da != db && da != 1 && db != 1) {
            throw shape_mismatch("shape mismatch: objects cannot be broadcast to a single shape: "
                + to_string(a) + " and " + to_string(b));
        }
        r[i] = da == 1 ? db : da;
    }
    return r;
}

ndarray_t broadcast_to(const ndarray_t& a, const shape_t& sh) {
    auto n = sh.size();
    auto m = rank(a);
    if (m > n) {
        throw shape_mismatch("broadcast_to: cannot broadcast " + to_string(a._shape) + " to " + to_string(sh));
    }
    auto st = strides_t(n, 0);
    for (std::size_t i = 0; i < m; ++i) {
        auto d = a._shape[i];
        auto j = i + (n - m);
        if (d == sh[j]) {
            st[j] = a._strides[i];
        } else if (d == 1) {
            st[j] = 0;
        } else {
            throw shape_mismatch("broadcast_to: cannot broadcast " + to_string(a._shape) + " to " + to_string(sh));
        }
    }
    return make_view(a, a._offset, sh, std::move(st));
}

std::pair<ndarray_t, ndarray_t> broadcast_arrays(const ndarray_t& a, const ndarray_t& b) {
    auto sh = broadcast_shapes(a._shape, b._shape);
    return {broadcast_to(a, sh), broadcast_to(b, sh)};
}

// =============================================================================
// Kernel-backed operations
// =============================================================================

strided_t strided(const ndarray_t& a) {
    require_rank(rank(a), "strided");
    auto s = strided_t{};
    s.ndim = std::int32_t(rank(a));
    for (std::size_t d = 0; d < rank(a); ++d) {
        s.shape[d] = std::int64_t(a._shape[d]);
        s.strides[d] = std::int64_t(a._strides[d]);
    }
    return s;
}

void require_accessible(const exec_context_t& ctx, const ndarray_t& a, const char* where) {
    auto loc = location(a);
    if (ctx.policy == exec::gpu && loc == memory::host && size(a) > 0) {
        throw invalid_argument(std::string(where) + ": exec::gpu cannot address host memory");
    }
    if (ctx.policy != exec::gpu && loc == memory::device && size(a) > 0) {
        throw invalid_argument(std::string(where) + ": exec::" + to_string(ctx.policy)
            + " cannot address device memory");
    }
}

static void copy_into(const ndarray_t& dst, const ndarray_t& src, const exec_context_t& ctx) {
    switch_dtype(dst._dtype, [&]<typename T>() {
        auto kernel = copy_kernel_t<T>{data<T>(src), strided(src), data<T>(dst), strided(dst)};
        launch(ctx, "copy", size(dst), kernel);
    });
}

ndarray_t copy(const ndarray_t& a, const exec_context_t& ctx) {
    auto r = empty(a._shape, a._dtype, location(a));
    if (size(a) > 0) {
        require_accessible(ctx, a, "copy");
        copy_into(r, a, ctx);
    }
    return r;
}

void assign(const ndarray_t& dst, const ndarray_t& src, const exec_context_t& ctx) {
    if (dst._dtype != src._dtype) {
        throw type_mismatch(std::string("assign: cannot write ") + to_string(src._dtype)
            + " into " + to_string(dst._dtype));
    }
    auto b = broadcast_to(src, dst._shape);
    if (size(dst) == 0) return;
    require_accessible(ctx, dst, "assign");
    require_accessible(ctx, b, "assign");
    copy_into(dst, b, ctx);
}

ndarray_t reshape(const ndarray_t& a, const shape_t& sh, const exec_context_t& ctx) {
    if (size(sh) != size(a)) {
        throw invalid_argument("reshape: cannot reshape array of shape " + to_string(a._shape)
            + " into shape " + to_string(sh));
    }
    auto c = is_c_contiguous(a) ? a : copy(a, ctx);
    return make_view(c, c._offset, sh, c_strides(sh));
}

ndarray_t ravel(const ndarray_t& a, const exec_context_t& ctx) {
    return reshape(a, shape_t{size(a)}, ctx);
}

} // namespace fancy
