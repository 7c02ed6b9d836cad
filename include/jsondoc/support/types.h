#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>

namespace jsondoc {

#ifndef JSONDOC_ARCH
#if _WIN32 || _WIN64
#if _WIN64
#define JSONDOC_ARCH 64
#else
#define JSONDOC_ARCH 32
#endif
#endif

#if __GNUC__
#if __x86_64__ || __ppc64__ || __aarch64__
#define JSONDOC_ARCH 64
#else
#define JSONDOC_ARCH 32
#endif
#endif
#endif // JSONDOC_ARCH

#if JSONDOC_ARCH == 32
using refcnt_t = uint32_t;
#else
using refcnt_t = uint64_t;
#endif

using Int = int64_t;
using UInt = uint64_t;
using Float = double;
using String = std::string;
using StringView = std::string_view;
using StringStream = std::stringstream;

struct nil_t {};
constexpr static nil_t nil;

template <typename T>
concept is_bool = std::is_same<T, bool>::value;

template<typename T>
concept is_like_Int = std::is_signed<T>::value && std::is_integral<T>::value && std::is_convertible_v<T, Int>;

template<typename T>
concept is_like_UInt = !is_bool<T> && std::is_unsigned<T>::value && std::is_integral<T>::value && std::is_convertible_v<T, UInt>;

template<typename T>
concept is_integral = std::is_integral<T>::value;

template<typename T>
concept is_like_Float = std::is_floating_point<T>::value;

template<typename T>
concept is_number = is_integral<T> || is_like_Float<T>;

template <typename T>
concept is_byvalue = std::is_same<T, bool>::value || is_number<T>;

} // namespace jsondoc
