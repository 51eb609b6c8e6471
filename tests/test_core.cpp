#include <cassert>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>
#include "fancy/core.hpp"
#include "fancy/dtype.hpp"
#include "fancy/exec_context.hpp"
#include "fancy/profiler.hpp"

using namespace fancy;

// =============================================================================
// vec_t tests
// =============================================================================

void test_vec_constant() {
    std::cout << "Testing vec_t constant/zeros... ";

    auto v = vec_t<int, 4>::constant(3);
    auto z = vec_t<int, 4>::zeros();

    for (std::size_t i = 0; i < 4; ++i) {
        assert(v[i] == 3);
        assert(z[i] == 0);
    }
    assert(v.size() == 4);
    assert(v != z);
    assert((z == vec_t<int, 4>::zeros()));

    std::cout << "PASSED\n";
}

void test_vec_product() {
    std::cout << "Testing vec_t product... ";

    auto v = vec_t<std::int64_t, 4>{2, 3, 4, 5};
    assert(product(v) == 120);
    assert(product(v, 2) == 6);
    assert(product(v, 0) == 1);

    auto sum = std::int64_t(0);
    for (auto x : v) sum += x;
    assert(sum == 14);

    std::cout << "PASSED\n";
}

// =============================================================================
// Execution policy tests
// =============================================================================

void test_exec_strings() {
    std::cout << "Testing exec string conversion... ";

    assert(std::string(to_string(exec::cpu)) == "cpu");
    assert(std::string(to_string(exec::omp)) == "omp");
    assert(std::string(to_string(exec::gpu)) == "gpu");
    assert(from_string(std::type_identity<exec>{}, "omp") == exec::omp);

    try {
        from_string(std::type_identity<exec>{}, "tpu");
        assert(false);
    } catch (const std::runtime_error&) {
    }

    std::cout << "PASSED\n";
}

void test_for_each_cpu() {
    std::cout << "Testing for_each cpu... ";

    auto out = std::vector<int>(100, 0);
    auto* p = out.data();
    for_each(out.size(), [p] FANCY_HD (std::size_t i) { p[i] = int(i) * 2; });

    for (std::size_t i = 0; i < out.size(); ++i) {
        assert(out[i] == int(i) * 2);
    }

    std::cout << "PASSED\n";
}

void test_for_each_omp() {
    std::cout << "Testing for_each omp... ";

    auto out = std::vector<int>(1000, 0);
    auto* p = out.data();
    auto body = [p] FANCY_HD (std::size_t i) { p[i] = int(i) + 1; };

    #ifdef _OPENMP
    for_each(out.size(), body, exec::omp);
    for (std::size_t i = 0; i < out.size(); ++i) {
        assert(out[i] == int(i) + 1);
    }
    #else
    try {
        for_each(out.size(), body, exec::omp);
        assert(false);
    } catch (const std::runtime_error&) {
    }
    #endif

    std::cout << "PASSED\n";
}

void test_for_each_gpu_unavailable() {
    std::cout << "Testing for_each gpu without CUDA... ";

    #ifndef __CUDACC__
    try {
        for_each(std::size_t(4), [](std::size_t) {}, exec::gpu);
        assert(false);
    } catch (const std::runtime_error&) {
    }
    #endif

    std::cout << "PASSED\n";
}

void test_map_reduce() {
    std::cout << "Testing map_reduce... ";

    auto sum = map_reduce(std::size_t(10), 0, [] FANCY_HD (std::size_t i) { return int(i); },
                          [] FANCY_HD (int a, int b) { return a + b; });
    assert(sum == 45);

    auto all_small = map_reduce(std::size_t(10), true, [] FANCY_HD (std::size_t i) { return i < 10; },
                                [] FANCY_HD (bool a, bool b) { return a && b; });
    assert(all_small);

    auto none = map_reduce(std::size_t(0), 7, [] FANCY_HD (std::size_t) { return 1; },
                           [] FANCY_HD (int a, int b) { return a + b; });
    assert(none == 7);

    #ifdef _OPENMP
    auto omp_sum = map_reduce(std::size_t(1000), std::int64_t(0),
                              [] FANCY_HD (std::size_t i) { return std::int64_t(i); },
                              [] FANCY_HD (std::int64_t a, std::int64_t b) { return a + b; },
                              exec::omp);
    assert(omp_sum == 499500);
    #endif

    std::cout << "PASSED\n";
}

// =============================================================================
// dtype tests
// =============================================================================

void test_dtype_traits() {
    std::cout << "Testing dtype traits... ";

    assert(dtype_v<float> == dtype::float32);
    assert(dtype_v<const std::int64_t> == dtype::int64);
    assert(itemsize(dtype::int16) == 2);
    assert(itemsize(dtype::float64) == 8);
    assert(itemsize(dtype::bool_) == sizeof(bool));
    assert(is_integer(dtype::uint8));
    assert(!is_integer(dtype::bool_));
    assert(!is_integer(dtype::float32));
    assert(std::string(to_string(dtype::bool_)) == "bool");
    assert(from_string(std::type_identity<dtype>{}, "uint32") == dtype::uint32);

    std::cout << "PASSED\n";
}

void test_switch_dtype() {
    std::cout << "Testing switch_dtype... ";

    auto name = switch_dtype(dtype::int32, []<typename T>() {
        return std::is_same_v<T, std::int32_t>;
    });
    assert(name);

    auto bits = switch_index_dtype(dtype::uint16, []<typename I>() { return sizeof(I) * 8; });
    assert(bits == 16);

    try {
        switch_index_dtype(dtype::float32, []<typename I>() { return 0; });
        assert(false);
    } catch (const type_mismatch&) {
    }

    std::cout << "PASSED\n";
}

// =============================================================================
// Profiler and context tests
// =============================================================================

void test_profiler() {
    std::cout << "Testing profiler... ";

    auto p = perf::profiler_t{};
    p.start();
    p.record("take", 10);
    p.record("take", 6);
    p.record("copy");

    auto d = p.data();
    assert(d.size() == 2);
    assert(d["take"].launches == 2);
    assert(d["take"].elements == 16);
    assert(d["copy"].launches == 1);
    assert(d["copy"].elements == 0);
    assert(d["take"].seconds >= 0.0);
    assert(p.total_seconds() >= d["take"].seconds);

    p.clear();
    assert(p.data().empty());

    std::cout << "PASSED\n";
}

void test_context_log() {
    std::cout << "Testing exec_context_t log... ";

    auto ctx = exec_context_t{};
    ctx.log("dropped");

    auto oss = std::ostringstream{};
    ctx.set_log_stream(&oss);
    ctx.log("first");
    ctx.log("second");
    assert(oss.str() == "first\nsecond\n");

    ctx.set_log_stream(nullptr);
    ctx.log("third");
    assert(oss.str() == "first\nsecond\n");

    try {
        ctx.set_log_file("/nonexistent-directory/fancy.log");
        assert(false);
    } catch (const std::runtime_error&) {
    }

    std::cout << "PASSED\n";
}

void test_context_threads() {
    std::cout << "Testing exec_context_t threads... ";

    auto ctx = exec_context_t{exec::omp};
    assert(ctx.policy == exec::omp);
    assert(ctx.num_threads() >= 1);

    #ifdef _OPENMP
    ctx.set_num_threads(2);
    assert(ctx.num_threads() == 2);
    ctx.set_num_threads(0);
    assert(ctx.num_threads() == 2);
    #endif

    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Core Tests ===\n\n";

    std::cout << "--- vec_t ---\n";
    test_vec_constant();
    test_vec_product();

    std::cout << "\n--- execution ---\n";
    test_exec_strings();
    test_for_each_cpu();
    test_for_each_omp();
    test_for_each_gpu_unavailable();
    test_map_reduce();

    std::cout << "\n--- dtype ---\n";
    test_dtype_traits();
    test_switch_dtype();

    std::cout << "\n--- context ---\n";
    test_profiler();
    test_context_log();
    test_context_threads();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
