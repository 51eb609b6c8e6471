#include "fancy/indexing.hpp"

#include <algorithm>
#include "fancy/kernels.hpp"

namespace fancy {

// =============================================================================
// Shared validation
// =============================================================================

static void check_out(const ndarray_t& out, dtype expected_dtype, const shape_t& expected_shape, const char* where) {
    if (dtype_of(out) != expected_dtype) {
        throw type_mismatch(std::string(where) + ": output dtype mismatch (expected "
            + to_string(expected_dtype) + ", got " + to_string(dtype_of(out)) + ")");
    }
    if (shape(out) != expected_shape) {
        throw shape_mismatch(std::string(where) + ": output shape mismatch (expected "
            + to_string(expected_shape) + ", got " + to_string(shape(out)) + ")");
    }
}

static std::size_t take_axis(const ndarray_t& a, std::int64_t axis) {
    auto n = std::int64_t(rank(a));
    if (axis < -n || axis >= n) {
        throw invalid_argument("take: axis overrun (axis " + std::to_string(axis)
            + " for array of dimension " + std::to_string(n) + ")");
    }
    return std::size_t(axis < 0 ? axis + n : axis);
}

// =============================================================================
// take
// =============================================================================

ndarray_t take(const ndarray_t& a, std::int64_t k,
               std::optional<std::int64_t> axis,
               std::optional<ndarray_t> out,
               const exec_context_t& ctx) {
    ctx.log("take: scalar index " + std::to_string(k) + " from " + to_string(shape(a)));

    auto slice = ndarray_t{};

    if (!axis) {
        // Element k of the C-order flattening, addressed in place
        auto n = std::int64_t(size(a));
        if (k < -n || k >= n) {
            throw index_error("take: index " + std::to_string(k)
                + " is out of bounds for size " + std::to_string(n));
        }
        auto flat = k < 0 ? k + n : k;
        auto off = offset(a);
        for (std::size_t d = rank(a); d > 0; --d) {
            auto dim = std::int64_t(shape(a)[d - 1]);
            off += std::ptrdiff_t(flat % dim) * strides(a)[d - 1];
            flat /= dim;
        }
        slice = make_view(a, off, shape_t{}, strides_t{});
    } else {
        auto ax = take_axis(a, *axis);
        slice = index(rollaxis(a, std::int64_t(ax)), 0, k);
    }

    if (out) {
        check_out(*out, dtype_of(a), shape(slice), "take");
        assign(*out, slice, ctx);
        return *out;
    }
    return copy(slice, ctx);
}

ndarray_t take(const ndarray_t& a, const ndarray_t& indices,
               std::optional<std::int64_t> axis,
               std::optional<ndarray_t> out,
               const exec_context_t& ctx) {
    ctx.log("take: indices " + to_string(shape(indices)) + " from " + to_string(shape(a)));

    if (!is_integer(dtype_of(indices))) {
        throw type_mismatch(std::string("take: indices must have an integer dtype, got ")
            + to_string(dtype_of(indices)));
    }

    auto lshape = shape_t{};
    auto rshape = shape_t{};
    std::size_t adim = size(a);

    if (axis) {
        auto ax = take_axis(a, *axis);
        lshape.assign(shape(a).begin(), shape(a).begin() + std::ptrdiff_t(ax));
        rshape.assign(shape(a).begin() + std::ptrdiff_t(ax) + 1, shape(a).end());
        adim = shape(a)[ax];
    }

    auto out_shape = lshape;
    out_shape.insert(out_shape.end(), shape(indices).begin(), shape(indices).end());
    out_shape.insert(out_shape.end(), rshape.begin(), rshape.end());

    if (out) {
        check_out(*out, dtype_of(a), out_shape, "take");
    }
    auto result = out ? *out : empty(out_shape, dtype_of(a), location(a));
    if (size(result) == 0) {
        return result;
    }
    require_accessible(ctx, a, "take");
    require_accessible(ctx, indices, "take");
    require_accessible(ctx, result, "take");

    auto src = axis ? a : ravel(a, ctx);
    auto cdim = std::int64_t(size(indices));
    auto rdim = std::int64_t(size(rshape));

    switch_dtype(dtype_of(a), [&]<typename T>() {
        switch_index_dtype(dtype_of(indices), [&]<typename I>() {
            auto kernel = take_kernel_t<T, I>{
                data<T>(src), strided(src),
                data<I>(indices), strided(indices),
                data<T>(result), strided(result),
                cdim, rdim, std::int64_t(adim)
            };
            launch(ctx, "take", size(result), kernel);
        });
    });
    return result;
}

ndarray_t take(const ndarray_t& a, const std::vector<std::int64_t>& indices,
               std::optional<std::int64_t> axis,
               std::optional<ndarray_t> out,
               const exec_context_t& ctx) {
    return take(a, from_vector(indices, location(a)), axis, std::move(out), ctx);
}

// =============================================================================
// choose
// =============================================================================

template<typename Projection>
static void launch_choose(const ndarray_t& selector, const ndarray_t& choices, const ndarray_t& result,
                          std::int64_t n, const exec_context_t& ctx) {
    auto n_channel = std::int64_t(size(result));

    switch_dtype(dtype_of(choices), [&]<typename T>() {
        switch_index_dtype(dtype_of(selector), [&]<typename I>() {
            auto kernel = choose_kernel_t<T, I, Projection>{
                data<I>(selector), strided(selector),
                data<T>(choices), strided(choices),
                data<T>(result), strided(result),
                n_channel, n
            };
            launch(ctx, Projection::kernel_name, size(result), kernel);
        });
    });
}

static bool all_in_range(const ndarray_t& a, std::int64_t n, const exec_context_t& ctx) {
    return switch_index_dtype(dtype_of(a), [&]<typename I>() {
        auto check = in_range_t<I>{data<I>(a), strided(a), n};
        ctx.profiler.start();
        auto ok = map_reduce(size(a), true, check, logical_and_t{}, ctx.policy);
        ctx.profiler.record("choose_check", size(a));
        return ok;
    });
}

ndarray_t choose(const ndarray_t& a, const ndarray_t& choices,
                 std::optional<ndarray_t> out,
                 clip_mode mode,
                 const exec_context_t& ctx) {
    ctx.log("choose: selector " + to_string(shape(a)) + " choices " + to_string(shape(choices))
        + " mode=" + to_string(mode));

    if (!is_integer(dtype_of(a))) {
        throw type_mismatch(std::string("choose: selector must have an integer dtype, got ")
            + to_string(dtype_of(a)));
    }
    if (rank(choices) == 0) {
        throw invalid_argument("choose: choices must have at least one dimension");
    }
    auto n = std::int64_t(shape(choices)[0]);

    // Line up a with choices[i]: leading unit axes on a, or unit axes after
    // the choice axis of choices
    auto sel = a;
    auto chs = choices;
    while (rank(sel) < rank(chs) - 1) {
        sel = expand_dims(sel, 0);
    }
    while (rank(sel) > rank(chs) - 1) {
        chs = expand_dims(chs, 1);
    }
    auto channel_shape = shape_t(shape(chs).begin() + 1, shape(chs).end());
    auto bshape = broadcast_shapes(shape(sel), channel_shape);
    auto full_shape = shape_t{shape(chs)[0]};
    full_shape.insert(full_shape.end(), bshape.begin(), bshape.end());

    auto ba = broadcast_to(sel, bshape);
    auto bcs = broadcast_to(chs, full_shape);

    if (out) {
        check_out(*out, dtype_of(choices), bshape, "choose");
    }
    if (n == 0 && size(bshape) > 0) {
        throw value_error("choose: choices is empty");
    }
    if (size(bshape) == 0) {
        return out ? *out : empty(bshape, dtype_of(choices), location(choices));
    }
    require_accessible(ctx, a, "choose");
    require_accessible(ctx, choices, "choose");
    if (out) {
        require_accessible(ctx, *out, "choose");
    }

    if (mode == clip_mode::raise && !all_in_range(a, n, ctx)) {
        throw value_error("invalid entry in choice array");
    }

    auto result = out ? *out : empty(bshape, dtype_of(choices), location(choices));

    switch (mode) {
        case clip_mode::raise:
            launch_choose<raise_index>(ba, bcs, result, n, ctx);
            break;
        case clip_mode::wrap:
            launch_choose<wrap_index>(ba, bcs, result, n, ctx);
            break;
        case clip_mode::clip:
            launch_choose<clip_index>(ba, bcs, result, n, ctx);
            break;
    }
    return result;
}

ndarray_t choose(const ndarray_t& a, const ndarray_t& choices,
                 std::optional<ndarray_t> out, const std::string& mode,
                 const exec_context_t& ctx) {
    return choose(a, choices, std::move(out), from_string(std::type_identity<clip_mode>{}, mode), ctx);
}

// =============================================================================
// diagonal
// =============================================================================

ndarray_t diagonal(const ndarray_t& a, std::int64_t offset, std::int64_t axis1, std::int64_t axis2,
                   const exec_context_t& ctx) {
    ctx.log("diagonal: offset " + std::to_string(offset) + " axes (" + std::to_string(axis1) + ", "
        + std::to_string(axis2) + ") of " + to_string(shape(a)));

    auto n = rank(a);
    if (n < 2) {
        throw invalid_argument("diagonal: array must have at least two dimensions");
    }
    auto ax1 = normalize_axis(axis1, n, "diagonal");
    auto ax2 = normalize_axis(axis2, n, "diagonal");
    if (ax1 == ax2) {
        throw invalid_argument("diagonal: axis1 and axis2 cannot be the same");
    }

    auto tr = std::vector<std::size_t>{};
    for (std::size_t i = 0; i < n; ++i) {
        if (i != ax1 && i != ax2) tr.push_back(i);
    }
    if (offset >= 0) {
        tr.push_back(ax1);
        tr.push_back(ax2);
    } else {
        tr.push_back(ax2);
        tr.push_back(ax1);
    }
    auto shift = offset >= 0 ? std::uint64_t(offset) : std::uint64_t(-(offset + 1)) + 1;

    // Columns before the shift are dropped; the window clamps a shift past the end
    auto t = transpose(a, tr);
    auto cols = shape(t)[n - 1];
    t = window(t, n - 1, std::size_t(std::min<std::uint64_t>(shift, cols)), cols);

    auto diag_size = std::min(shape(t)[n - 2], shape(t)[n - 1]);

    auto ret_shape = shape_t(shape(t).begin(), shape(t).end() - 2);
    ret_shape.push_back(diag_size);
    if (diag_size == 0) {
        return empty(ret_shape, dtype_of(a), location(a));
    }

    auto ret_strides = strides_t(strides(t).begin(), strides(t).end() - 2);
    ret_strides.push_back(strides(t)[n - 2] + strides(t)[n - 1]);
    return make_view(t, t._offset, std::move(ret_shape), std::move(ret_strides),
                     contiguity::unknown, contiguity::unknown);
}

} // namespace fancy
