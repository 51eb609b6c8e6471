#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include "core.hpp"
#include "exec_context.hpp"
#include "ndarray.hpp"

namespace fancy {

// =============================================================================
// strided_t: Device-copyable layout, maps a C-order flat index to an offset
// =============================================================================

struct strided_t {
    std::int32_t ndim = 0;
    vec_t<std::int64_t, max_rank> shape = vec_t<std::int64_t, max_rank>::zeros();
    vec_t<std::int64_t, max_rank> strides = vec_t<std::int64_t, max_rank>::zeros();

    FANCY_HD std::int64_t operator()(std::int64_t flat) const {
        std::int64_t off = 0;
        for (std::int32_t d = ndim; d > 0; --d) {
            auto n = shape[d - 1];
            off += (flat % n) * strides[d - 1];
            flat /= n;
        }
        return off;
    }
};

strided_t strided(const ndarray_t& a);

// =============================================================================
// Kernel functors: one call per flat output index
// =============================================================================

template<typename T>
struct copy_kernel_t {
    const T* src;
    strided_t src_layout;
    T* dst;
    strided_t dst_layout;

    FANCY_HD void operator()(std::size_t i) const {
        auto n = std::int64_t(i);
        dst[dst_layout(n)] = src[src_layout(n)];
    }
};

// Output index i splits into (left block, index slot, right block); the
// source is addressed as C-order flat index over its own (flattened) shape.
// Index values are not checked.
template<typename T, typename I>
struct take_kernel_t {
    const T* src;
    strided_t src_layout;
    const I* indices;
    strided_t indices_layout;
    T* out;
    strided_t out_layout;
    std::int64_t cdim;  // number of indices
    std::int64_t rdim;  // product of the extents right of the axis
    std::int64_t adim;  // extent of the indexed axis

    FANCY_HD void operator()(std::size_t i) const {
        auto n = std::int64_t(i);
        auto li = n / (rdim * cdim);
        auto ci = (n / rdim) % cdim;
        auto ri = n % rdim;
        auto k = std::int64_t(indices[indices_layout(ci)]);
        out[out_layout(n)] = src[src_layout((li * adim + k) * rdim + ri)];
    }
};

// -----------------------------------------------------------------------------
// Selector projections for choose
// -----------------------------------------------------------------------------

struct raise_index {
    static constexpr const char* kernel_name = "choose";

    template<typename I>
    FANCY_HD std::int64_t operator()(I x, std::int64_t) const {
        return std::int64_t(x);
    }
};

struct wrap_index {
    static constexpr const char* kernel_name = "choose_wrap";

    template<typename I>
    FANCY_HD std::int64_t operator()(I x, std::int64_t n) const {
        if constexpr (std::is_signed_v<I>) {
            auto r = std::int64_t(x) % n;
            return r < 0 ? r + n : r;
        } else {
            return std::int64_t(std::uint64_t(x) % std::uint64_t(n));
        }
    }
};

struct clip_index {
    static constexpr const char* kernel_name = "choose_clip";

    template<typename I>
    FANCY_HD std::int64_t operator()(I x, std::int64_t n) const {
        if constexpr (std::is_signed_v<I>) {
            if (x < 0) return 0;
        }
        // Compare unsigned values without narrowing them to int64 first
        if (std::uint64_t(x) >= std::uint64_t(n)) return n - 1;
        return std::int64_t(x);
    }
};

template<typename T, typename I, typename Projection>
struct choose_kernel_t {
    const I* selector;
    strided_t selector_layout;
    const T* choices;
    strided_t choices_layout;
    T* out;
    strided_t out_layout;
    std::int64_t n_channel;
    std::int64_t n;

    FANCY_HD void operator()(std::size_t i) const {
        auto j = std::int64_t(i);
        auto c = Projection{}(selector[selector_layout(j)], n);
        out[out_layout(j)] = choices[choices_layout(j + n_channel * c)];
    }
};

// -----------------------------------------------------------------------------
// Selector range check, reduced with logical_and_t
// -----------------------------------------------------------------------------

template<typename I>
struct in_range_t {
    const I* selector;
    strided_t selector_layout;
    std::int64_t n;

    FANCY_HD bool operator()(std::size_t i) const {
        auto x = selector[selector_layout(std::int64_t(i))];
        if constexpr (std::is_signed_v<I>) {
            if (x < 0) return false;
        }
        return std::uint64_t(x) < std::uint64_t(n);
    }
};

struct logical_and_t {
    FANCY_HD bool operator()(bool a, bool b) const { return a && b; }
};

// =============================================================================
// Launch: run a functor over [0, n) under the context's policy and time it
// =============================================================================

template<FlatKernel F>
void launch(const exec_context_t& ctx, const std::string& name, std::size_t n, const F& kernel) {
    ctx.log("launch " + name + " n=" + std::to_string(n) + " exec=" + to_string(ctx.policy));
    ctx.profiler.start();
    for_each(n, kernel, ctx.policy);
    #ifdef __CUDACC__
    if (ctx.policy == exec::gpu) {
        check_cuda(cudaDeviceSynchronize(), name.c_str());
    }
    #endif
    ctx.profiler.record(name, n);
}

} // namespace fancy
