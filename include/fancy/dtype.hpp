#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include "errors.hpp"

namespace fancy {

// =============================================================================
// Element type tag
// =============================================================================

enum class dtype : std::uint8_t {
    bool_,
    int8,
    int16,
    int32,
    int64,
    uint8,
    uint16,
    uint32,
    uint64,
    float32,
    float64
};

inline auto to_string(dtype t) -> const char* {
    switch (t) {
        case dtype::bool_:   return "bool";
        case dtype::int8:    return "int8";
        case dtype::int16:   return "int16";
        case dtype::int32:   return "int32";
        case dtype::int64:   return "int64";
        case dtype::uint8:   return "uint8";
        case dtype::uint16:  return "uint16";
        case dtype::uint32:  return "uint32";
        case dtype::uint64:  return "uint64";
        case dtype::float32: return "float32";
        case dtype::float64: return "float64";
    }
    return "unknown";
}

inline auto from_string(std::type_identity<dtype>, const std::string& s) -> dtype {
    if (s == "bool")    return dtype::bool_;
    if (s == "int8")    return dtype::int8;
    if (s == "int16")   return dtype::int16;
    if (s == "int32")   return dtype::int32;
    if (s == "int64")   return dtype::int64;
    if (s == "uint8")   return dtype::uint8;
    if (s == "uint16")  return dtype::uint16;
    if (s == "uint32")  return dtype::uint32;
    if (s == "uint64")  return dtype::uint64;
    if (s == "float32") return dtype::float32;
    if (s == "float64") return dtype::float64;
    throw std::runtime_error("unknown dtype: " + s);
}

// =============================================================================
// C++ type -> dtype
// =============================================================================

template<typename T>
struct dtype_enum;

template<> struct dtype_enum<bool>          { static constexpr auto value = dtype::bool_; };
template<> struct dtype_enum<std::int8_t>   { static constexpr auto value = dtype::int8; };
template<> struct dtype_enum<std::int16_t>  { static constexpr auto value = dtype::int16; };
template<> struct dtype_enum<std::int32_t>  { static constexpr auto value = dtype::int32; };
template<> struct dtype_enum<std::int64_t>  { static constexpr auto value = dtype::int64; };
template<> struct dtype_enum<std::uint8_t>  { static constexpr auto value = dtype::uint8; };
template<> struct dtype_enum<std::uint16_t> { static constexpr auto value = dtype::uint16; };
template<> struct dtype_enum<std::uint32_t> { static constexpr auto value = dtype::uint32; };
template<> struct dtype_enum<std::uint64_t> { static constexpr auto value = dtype::uint64; };
template<> struct dtype_enum<float>         { static constexpr auto value = dtype::float32; };
template<> struct dtype_enum<double>        { static constexpr auto value = dtype::float64; };

template<typename T>
inline constexpr dtype dtype_v = dtype_enum<std::remove_cv_t<T>>::value;

template<typename T>
concept Element = requires { dtype_enum<std::remove_cv_t<T>>::value; };

template<typename T>
concept IndexElement = Element<T> && std::is_integral_v<T> && !std::is_same_v<T, bool>;

// =============================================================================
// Runtime dtype -> static type dispatch
// =============================================================================

template<typename F>
auto switch_dtype(dtype t, F&& f) {
    switch (t) {
        case dtype::bool_:   return f.template operator()<bool>();
        case dtype::int8:    return f.template operator()<std::int8_t>();
        case dtype::int16:   return f.template operator()<std::int16_t>();
        case dtype::int32:   return f.template operator()<std::int32_t>();
        case dtype::int64:   return f.template operator()<std::int64_t>();
        case dtype::uint8:   return f.template operator()<std::uint8_t>();
        case dtype::uint16:  return f.template operator()<std::uint16_t>();
        case dtype::uint32:  return f.template operator()<std::uint32_t>();
        case dtype::uint64:  return f.template operator()<std::uint64_t>();
        case dtype::float32: return f.template operator()<float>();
        case dtype::float64: return f.template operator()<double>();
    }
    throw type_mismatch("unknown dtype");
}

// Integer dtypes only; anything else cannot address elements
template<typename F>
auto switch_index_dtype(dtype t, F&& f) {
    switch (t) {
        case dtype::int8:    return f.template operator()<std::int8_t>();
        case dtype::int16:   return f.template operator()<std::int16_t>();
        case dtype::int32:   return f.template operator()<std::int32_t>();
        case dtype::int64:   return f.template operator()<std::int64_t>();
        case dtype::uint8:   return f.template operator()<std::uint8_t>();
        case dtype::uint16:  return f.template operator()<std::uint16_t>();
        case dtype::uint32:  return f.template operator()<std::uint32_t>();
        case dtype::uint64:  return f.template operator()<std::uint64_t>();
        default:
            throw type_mismatch(std::string("index arrays must have an integer dtype, got ") + to_string(t));
    }
}

inline auto itemsize(dtype t) -> std::size_t {
    return switch_dtype(t, []<typename T>() { return sizeof(T); });
}

inline auto is_integer(dtype t) -> bool {
    return t != dtype::bool_ && t != dtype::float32 && t != dtype::float64;
}

} // namespace fancy
