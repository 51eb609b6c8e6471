#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

// CUDA compatibility macros
#ifdef __CUDACC__
#define FANCY_HD __host__ __device__
#include <cub/cub.cuh>
#else
#define FANCY_HD
#define __host__
#define __device__
#endif

namespace fancy {

// =============================================================================
// Concepts
// =============================================================================

template<typename T>
concept Arithmetic = std::is_arithmetic_v<T>;

template<typename F>
concept FlatKernel = requires(const F& f, std::size_t i) {
    { f(i) };
};

// =============================================================================
// vec_t: Statically sized array type (passed by value to device code)
// =============================================================================

template<Arithmetic T, std::size_t S>
    requires (S > 0)
struct vec_t {
    T data[S];

    FANCY_HD constexpr T& operator[](std::size_t i) { return data[i]; }
    FANCY_HD constexpr const T& operator[](std::size_t i) const { return data[i]; }

    FANCY_HD constexpr std::size_t size() const { return S; }

    FANCY_HD static constexpr vec_t constant(T v) {
        vec_t r{};
        for (std::size_t i = 0; i < S; ++i) r.data[i] = v;
        return r;
    }
    FANCY_HD static constexpr vec_t zeros() { return constant(T(0)); }

    constexpr auto operator<=>(const vec_t&) const = default;
};

template<Arithmetic T, std::size_t S>
FANCY_HD constexpr T* begin(vec_t<T, S>& v) { return v.data; }

template<Arithmetic T, std::size_t S>
FANCY_HD constexpr const T* begin(const vec_t<T, S>& v) { return v.data; }

template<Arithmetic T, std::size_t S>
FANCY_HD constexpr T* end(vec_t<T, S>& v) { return v.data + S; }

template<Arithmetic T, std::size_t S>
FANCY_HD constexpr const T* end(const vec_t<T, S>& v) { return v.data + S; }

// Product of the first n entries
template<Arithmetic T, std::size_t S>
FANCY_HD constexpr T product(const vec_t<T, S>& v, std::size_t n = S) {
    T result = T(1);
    for (std::size_t i = 0; i < n && i < S; ++i) {
        result *= v.data[i];
    }
    return result;
}

// =============================================================================
// Execution policies
// =============================================================================

enum class exec {
    cpu,
    omp,
    gpu
};

inline auto to_string(exec e) -> const char* {
    switch (e) {
        case exec::cpu: return "cpu";
        case exec::omp: return "omp";
        case exec::gpu: return "gpu";
    }
    return "unknown";
}

inline auto from_string(std::type_identity<exec>, const std::string& s) -> exec {
    if (s == "cpu") return exec::cpu;
    if (s == "omp") return exec::omp;
    if (s == "gpu") return exec::gpu;
    throw std::runtime_error("invalid exec: " + s);
}

// =============================================================================
// Device helpers
// =============================================================================

#ifdef __CUDACC__
inline void check_cuda(cudaError_t status, const char* what) {
    if (status != cudaSuccess) {
        throw std::runtime_error(std::string(what) + ": " + cudaGetErrorString(status));
    }
}

// Grid-stride loop, so a capped grid covers any n
template<typename F>
__global__ void flat_kernel(std::size_t n, F func) {
    auto stride = std::size_t(blockDim.x) * gridDim.x;
    for (auto i = std::size_t(blockIdx.x) * blockDim.x + threadIdx.x; i < n; i += stride) {
        func(i);
    }
}

// Scratch allocation released on scope exit
struct device_scratch_t {
    void* ptr = nullptr;

    explicit device_scratch_t(std::size_t bytes) {
        check_cuda(cudaMalloc(&ptr, bytes == 0 ? 1 : bytes), "device_scratch_t");
    }
    ~device_scratch_t() { cudaFree(ptr); }

    device_scratch_t(const device_scratch_t&) = delete;
    device_scratch_t& operator=(const device_scratch_t&) = delete;
};

inline constexpr unsigned int flat_block_size = 256;
inline constexpr std::size_t flat_max_blocks = 65535;

inline auto flat_grid_size(std::size_t n) -> unsigned int {
    auto blocks = (n + flat_block_size - 1) / flat_block_size;
    return unsigned(blocks < flat_max_blocks ? blocks : flat_max_blocks);
}
#endif

// =============================================================================
// for_each: one logical worker per flat index in [0, n)
// =============================================================================

template<FlatKernel F>
void for_each(std::size_t n, const F& func, exec e) {
    switch (e) {
        case exec::cpu:
            for (std::size_t i = 0; i < n; ++i) {
                func(i);
            }
            return;

        case exec::omp:
            #ifdef _OPENMP
            #pragma omp parallel for schedule(static)
            for (std::int64_t i = 0; i < std::int64_t(n); ++i) {
                func(std::size_t(i));
            }
            return;
            #else
            throw std::runtime_error("unsupported exec::omp");
            #endif

        case exec::gpu:
            #ifdef __CUDACC__
            if (n > 0) {
                flat_kernel<<<flat_grid_size(n), flat_block_size>>>(n, func);
                check_cuda(cudaGetLastError(), "for_each");
            }
            return;
            #else
            throw std::runtime_error("unsupported exec::gpu");
            #endif
    }
}

template<FlatKernel F>
void for_each(std::size_t n, const F& func) {
    for_each(n, func, exec::cpu);
}

// =============================================================================
// map_reduce: fold map(0) ... map(n - 1) into init with an associative op
// =============================================================================
//
// On the GPU the mapped values are never stored: CUB reads them through a
// transform iterator over the counting sequence. The call is synchronous.
//
template<typename T, typename MapF, typename ReduceF>
T map_reduce(std::size_t n, T init, const MapF& map, const ReduceF& reduce_op, exec e) {
    switch (e) {
        case exec::cpu: {
            auto acc = init;
            for (std::size_t i = 0; i < n; ++i) {
                acc = reduce_op(acc, map(i));
            }
            return acc;
        }

        case exec::omp: {
            #ifdef _OPENMP
            auto acc = init;
            #pragma omp parallel
            {
                auto partial = init;
                #pragma omp for schedule(static) nowait
                for (std::int64_t i = 0; i < std::int64_t(n); ++i) {
                    partial = reduce_op(partial, map(std::size_t(i)));
                }
                #pragma omp critical(fancy_map_reduce)
                acc = reduce_op(acc, partial);
            }
            return acc;
            #else
            throw std::runtime_error("unsupported exec::omp");
            #endif
        }

        case exec::gpu: {
            #ifdef __CUDACC__
            if (n == 0) return init;

            auto values = cub::TransformInputIterator<T, MapF, cub::CountingInputIterator<std::size_t>>(
                cub::CountingInputIterator<std::size_t>(0), map);
            auto result = device_scratch_t{sizeof(T)};
            auto temp_bytes = std::size_t(0);

            check_cuda(cub::DeviceReduce::Reduce(
                nullptr, temp_bytes, values, static_cast<T*>(result.ptr), n, reduce_op, init), "map_reduce");
            auto temp = device_scratch_t{temp_bytes};
            check_cuda(cub::DeviceReduce::Reduce(
                temp.ptr, temp_bytes, values, static_cast<T*>(result.ptr), n, reduce_op, init), "map_reduce");

            T host_result;
            check_cuda(cudaMemcpy(&host_result, result.ptr, sizeof(T), cudaMemcpyDeviceToHost), "map_reduce");
            return host_result;
            #else
            throw std::runtime_error("unsupported exec::gpu");
            #endif
        }
    }
    return init;
}

template<typename T, typename MapF, typename ReduceF>
T map_reduce(std::size_t n, T init, const MapF& map, const ReduceF& reduce_op) {
    return map_reduce(n, init, map, reduce_op, exec::cpu);
}

} // namespace fancy
