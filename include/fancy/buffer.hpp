#pragma once

#include <cstddef>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include "core.hpp"

namespace fancy {

// =============================================================================
// Memory location
// =============================================================================

enum class memory {
    host,
    device,
    managed
};

inline auto to_string(memory m) -> const char* {
    switch (m) {
        case memory::host:    return "host";
        case memory::device:  return "device";
        case memory::managed: return "managed";
    }
    return "unknown";
}

inline auto from_string(std::type_identity<memory>, const std::string& s) -> memory {
    if (s == "host")    return memory::host;
    if (s == "device")  return memory::device;
    if (s == "managed") return memory::managed;
    throw std::runtime_error("invalid memory: " + s);
}

// =============================================================================
// buffer_t: Owning untyped allocation, shared between an array and its views
// =============================================================================

struct buffer_t {
    void* _data = nullptr;
    std::size_t _bytes = 0;
    memory _location = memory::host;

    buffer_t(std::size_t bytes, memory loc)
        : _data(nullptr), _bytes(bytes), _location(loc)
    {
        if (bytes == 0) return;
        switch (_location) {
            case memory::host:
                _data = ::operator new[](bytes);
                std::memset(_data, 0, bytes);
                break;
            case memory::device:
                #ifdef __CUDACC__
                check_cuda(cudaMalloc(&_data, bytes), "buffer_t");
                zero_or_release(bytes);
                #else
                throw std::runtime_error("buffer_t: device memory requires a CUDA build");
                #endif
                break;
            case memory::managed:
                #ifdef __CUDACC__
                check_cuda(cudaMallocManaged(&_data, bytes), "buffer_t");
                zero_or_release(bytes);
                #else
                throw std::runtime_error("buffer_t: managed memory requires a CUDA build");
                #endif
                break;
        }
    }

    #ifdef __CUDACC__
    // The destructor does not run if the constructor throws, so a failed
    // clear frees the allocation itself
    void zero_or_release(std::size_t bytes) {
        auto status = cudaMemset(_data, 0, bytes);
        if (status != cudaSuccess) {
            cudaFree(_data);
            _data = nullptr;
            check_cuda(status, "buffer_t");
        }
    }
    #endif

    ~buffer_t() {
        if (!_data) return;
        if (_location == memory::host) {
            ::operator delete[](_data);
        } else {
            #ifdef __CUDACC__
            cudaFree(_data);
            #endif
        }
    }

    // No copy, no move: shared through std::shared_ptr
    buffer_t(const buffer_t&) = delete;
    buffer_t& operator=(const buffer_t&) = delete;
};

inline auto make_buffer(std::size_t bytes, memory loc) -> std::shared_ptr<buffer_t> {
    return std::make_shared<buffer_t>(bytes, loc);
}

// =============================================================================
// Host/device transparent copies
// =============================================================================

namespace detail {

// Host-to-host copies use memcpy; anything touching device or managed memory
// goes through cudaMemcpyDefault, which infers the direction from the pointers
inline void memcpy_any(void* dst, const void* src, std::size_t bytes, memory dst_loc, memory src_loc) {
    if (bytes == 0) return;
    if (dst_loc == memory::host && src_loc == memory::host) {
        std::memcpy(dst, src, bytes);
        return;
    }
    #ifdef __CUDACC__
    check_cuda(cudaMemcpy(dst, src, bytes, cudaMemcpyDefault), "memcpy_any");
    #else
    throw std::runtime_error(std::string("memcpy_any: ") + to_string(src_loc) + " to "
        + to_string(dst_loc) + " copy requires a CUDA build");
    #endif
}

} // namespace detail

} // namespace fancy
