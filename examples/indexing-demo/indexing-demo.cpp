#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include "fancy/fancy.hpp"

using namespace fancy;

// =============================================================================
// Helper functions
// =============================================================================

template<typename T>
void print(const std::string& label, const ndarray_t& a, const exec_context_t& ctx) {
    std::cout << label << " " << to_string(shape(a)) << ":";
    for (auto v : to_vector<T>(a, ctx)) {
        std::cout << " " << v;
    }
    std::cout << "\n";
}

// Host arrays are staged into device memory when running on the GPU
auto place(const ndarray_t& a, const exec_context_t& ctx) -> ndarray_t {
    if (ctx.policy != exec::gpu) {
        return a;
    }
    auto d = empty(shape(a), dtype_of(a), memory::managed);
    assign(d, a, default_context());
    return d;
}

// =============================================================================
// Main
// =============================================================================

int main(int argc, char* argv[]) {
    auto cfg = config_t{};

    try {
        for (int i = 1; i < argc; ++i) {
            auto arg = std::string(argv[i]);
            auto eq = arg.find('=');

            if (eq != std::string::npos) {
                set(cfg, arg.substr(0, eq), arg.substr(eq + 1));
            } else {
                auto file = std::ifstream(arg);
                if (!file) {
                    std::cerr << "Error: cannot open file '" << arg << "'\n";
                    return 1;
                }
                cfg = read_config(file);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return 1;
    }

    auto ctx = exec_context_t{};

    try {
        configure(ctx, cfg);
        ctx.log("indexing-demo: exec=" + std::string(to_string(ctx.policy))
            + " threads=" + std::to_string(ctx.num_threads()));

        std::cout << "Configuration:\n";
        write_config(std::cout, cfg);
        std::cout << "\n";

        auto grid = place(reshape(arange<std::int32_t>(12), shape_t{3, 4}), ctx);
        print<std::int32_t>("grid", grid, ctx);

        // take
        print<std::int32_t>("take(grid, 1, axis=0)", take(grid, 1, 0, std::nullopt, ctx), ctx);
        print<std::int32_t>("take(grid, [3, 0], axis=1)",
            take(grid, place(from_vector(std::vector<std::int64_t>{3, 0}), ctx), 1, std::nullopt, ctx), ctx);
        print<std::int32_t>("take(grid, [11, 5, 0])",
            take(grid, place(from_vector(std::vector<std::int64_t>{11, 5, 0}), ctx), std::nullopt, std::nullopt, ctx), ctx);

        // choose
        auto selector = place(from_vector(std::vector<std::int64_t>{2, 0, -1, 5}), ctx);
        for (auto mode : {clip_mode::wrap, clip_mode::clip}) {
            print<std::int32_t>(std::string("choose(mode=") + to_string(mode) + ")",
                choose(selector, grid, std::nullopt, mode, ctx), ctx);
        }
        try {
            choose(selector, grid, std::nullopt, clip_mode::raise, ctx);
        } catch (const value_error& e) {
            std::cout << "choose(mode=raise): " << e.what() << "\n";
        }

        // diagonal
        print<std::int32_t>("diagonal(grid)", diagonal(grid, 0, 0, 1, ctx), ctx);
        print<std::int32_t>("diagonal(grid, 1)", diagonal(grid, 1, 0, 1, ctx), ctx);
        print<std::int32_t>("diagonal(grid, -1)", diagonal(grid, -1, 0, 1, ctx), ctx);

        auto d = diagonal(grid, 0, 0, 1, ctx);
        assign(d, place(from_vector(std::vector<std::int32_t>{-1}), ctx), ctx);
        print<std::int32_t>("grid after writing its diagonal", grid, ctx);

        std::cout << "\nKernel timings:\n";
        for (const auto& [name, entry] : ctx.profiler.data()) {
            std::cout << "  " << name << ": " << entry.launches << " launches, "
                      << entry.elements << " elements, " << entry.seconds * 1e6 << " us\n";
        }
        std::cout << "  total: " << ctx.profiler.total_seconds() * 1e6 << " us\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
