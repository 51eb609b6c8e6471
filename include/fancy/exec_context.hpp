#pragma once

#include <cstddef>
#include <fstream>
#include <ostream>
#include <string>
#include "core.hpp"
#include "profiler.hpp"

namespace fancy {

// =============================================================================
// Execution context: policy, kernel timings and an optional log sink
// =============================================================================
//
// Operations take the context by const reference. The profiler is mutable
// and log() is const, so a const context still records. A context is not
// safe to share between threads that launch concurrently.
//
struct exec_context_t {
    exec policy = exec::cpu;
    mutable perf::profiler_t profiler;

    exec_context_t() = default;
    explicit exec_context_t(exec e) : policy(e) {}

    exec_context_t(const exec_context_t&) = delete;
    exec_context_t& operator=(const exec_context_t&) = delete;

    void log(const std::string& message) const;

    // Append log lines to a file (truncated on open)
    void set_log_file(const std::string& path);

    // Append log lines to a caller-owned stream; nullptr detaches
    void set_log_stream(std::ostream* os);

    auto num_threads() const -> std::size_t;
    void set_num_threads(std::size_t n);

private:
    std::ofstream _log_file;
    std::ostream* _log = nullptr;
};

// Process-wide context used when a call does not name one
exec_context_t& default_context();

} // namespace fancy
