#include "fancy/exec_context.hpp"

#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace fancy {

void exec_context_t::log(const std::string& message) const {
    if (_log) {
        *_log << message << "\n";
        _log->flush();
    }
}

void exec_context_t::set_log_file(const std::string& path) {
    _log = nullptr;
    if (_log_file.is_open()) {
        _log_file.close();
    }
    _log_file.open(path, std::ios::out | std::ios::trunc);
    if (!_log_file) {
        throw std::runtime_error("set_log_file: cannot open " + path);
    }
    _log = &_log_file;
}

void exec_context_t::set_log_stream(std::ostream* os) {
    _log = os;
}

auto exec_context_t::num_threads() const -> std::size_t {
    #ifdef _OPENMP
    return std::size_t(omp_get_max_threads());
    #else
    return 1;
    #endif
}

void exec_context_t::set_num_threads(std::size_t n) {
    // Zero keeps the runtime default
    if (n == 0) return;
    #ifdef _OPENMP
    omp_set_num_threads(int(n));
    #else
    (void)n;
    #endif
}

exec_context_t& default_context() {
    static exec_context_t ctx;
    return ctx;
}

} // namespace fancy
