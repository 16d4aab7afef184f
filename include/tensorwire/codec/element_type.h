#pragma once

#include <cmath>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace tensorwire::codec {

/**
 * @brief Native element kinds an NdArray can hold
 *
 * Bytes, FixedBytes and Unicode are all stored as std::string. Only Bytes and FixedBytes
 * are byte strings; Unicode models text that was never encoded to bytes.
 */
enum class ElementType : uint8_t {
    Float16,
    Float32,
    Float64,
    Int8,
    Int16,
    Int32,
    Int64,
    UInt8,
    UInt16,
    UInt32,
    UInt64,
    Bool,
    Complex64,
    Complex128,
    Bytes,
    FixedBytes,
    Unicode,
};

/**
 * @brief IEEE 754 binary16 value kept as its raw bit pattern
 */
struct Float16 {
    uint16_t bits = 0;

    Float16() = default;
    explicit Float16(float value);
    explicit operator float() const;

    static Float16 fromBits(uint16_t raw) {
        Float16 h;
        h.bits = raw;
        return h;
    }

    friend bool operator==(Float16 a, Float16 b) {
        return static_cast<float>(a) == static_cast<float>(b);
    }
};

static_assert(sizeof(Float16) == 2, "Float16 must be two bytes");
static_assert(sizeof(bool) == 1, "bool elements are stored as single bytes");

// Compile-time mapping from C++ element types to ElementType
template <typename T> struct ElementTraits; // no default

#define TENSORWIRE_ELEMENT_TRAITS(cpp_type, element_type)                                        \
    template <> struct ElementTraits<cpp_type> {                                                 \
        static constexpr ElementType type = ElementType::element_type;                           \
    }

TENSORWIRE_ELEMENT_TRAITS(Float16, Float16);
TENSORWIRE_ELEMENT_TRAITS(float, Float32);
TENSORWIRE_ELEMENT_TRAITS(double, Float64);
TENSORWIRE_ELEMENT_TRAITS(int8_t, Int8);
TENSORWIRE_ELEMENT_TRAITS(int16_t, Int16);
TENSORWIRE_ELEMENT_TRAITS(int32_t, Int32);
TENSORWIRE_ELEMENT_TRAITS(int64_t, Int64);
TENSORWIRE_ELEMENT_TRAITS(uint8_t, UInt8);
TENSORWIRE_ELEMENT_TRAITS(uint16_t, UInt16);
TENSORWIRE_ELEMENT_TRAITS(uint32_t, UInt32);
TENSORWIRE_ELEMENT_TRAITS(uint64_t, UInt64);
TENSORWIRE_ELEMENT_TRAITS(bool, Bool);
TENSORWIRE_ELEMENT_TRAITS(std::complex<float>, Complex64);
TENSORWIRE_ELEMENT_TRAITS(std::complex<double>, Complex128);
TENSORWIRE_ELEMENT_TRAITS(std::string, Bytes);

#undef TENSORWIRE_ELEMENT_TRAITS

template <typename T>
concept Element = requires { ElementTraits<T>::type; };

template <typename T>
concept NumericElement = Element<T> && !std::is_same_v<T, std::string>;

template <typename T> struct IsComplex : std::false_type {};
template <typename T> struct IsComplex<std::complex<T>> : std::true_type {};

constexpr bool isStringType(ElementType type) {
    return type == ElementType::Bytes || type == ElementType::FixedBytes ||
           type == ElementType::Unicode;
}

constexpr bool isByteStringType(ElementType type) {
    return type == ElementType::Bytes || type == ElementType::FixedBytes;
}

// Width of one element in a dense buffer, 0 for string kinds
constexpr std::size_t elementByteWidth(ElementType type) {
    switch (type) {
        case ElementType::Int8:
        case ElementType::UInt8:
        case ElementType::Bool:
            return 1;
        case ElementType::Float16:
        case ElementType::Int16:
        case ElementType::UInt16:
            return 2;
        case ElementType::Float32:
        case ElementType::Int32:
        case ElementType::UInt32:
            return 4;
        case ElementType::Float64:
        case ElementType::Int64:
        case ElementType::UInt64:
        case ElementType::Complex64:
            return 8;
        case ElementType::Complex128:
            return 16;
        case ElementType::Bytes:
        case ElementType::FixedBytes:
        case ElementType::Unicode:
            return 0;
    }
    return 0;
}

std::string_view elementTypeName(ElementType type);

// Inverse of elementTypeName; also accepts a few common aliases ("half", "str", ...)
std::optional<ElementType> parseElementType(std::string_view name);

/**
 * @brief Invoke @p fn with std::type_identity of the C++ type backing @p type
 *
 * All string kinds resolve to std::string.
 */
template <typename Fn> decltype(auto) visitElementType(ElementType type, Fn&& fn) {
    switch (type) {
        case ElementType::Float16: return fn(std::type_identity<Float16>{});
        case ElementType::Float32: return fn(std::type_identity<float>{});
        case ElementType::Float64: return fn(std::type_identity<double>{});
        case ElementType::Int8: return fn(std::type_identity<int8_t>{});
        case ElementType::Int16: return fn(std::type_identity<int16_t>{});
        case ElementType::Int32: return fn(std::type_identity<int32_t>{});
        case ElementType::Int64: return fn(std::type_identity<int64_t>{});
        case ElementType::UInt8: return fn(std::type_identity<uint8_t>{});
        case ElementType::UInt16: return fn(std::type_identity<uint16_t>{});
        case ElementType::UInt32: return fn(std::type_identity<uint32_t>{});
        case ElementType::UInt64: return fn(std::type_identity<uint64_t>{});
        case ElementType::Bool: return fn(std::type_identity<bool>{});
        case ElementType::Complex64: return fn(std::type_identity<std::complex<float>>{});
        case ElementType::Complex128: return fn(std::type_identity<std::complex<double>>{});
        default: break;
    }
    return fn(std::type_identity<std::string>{});
}

// Floating to integer with saturation at the type's bounds; NaN becomes zero.
template <typename To>
    requires(std::is_integral_v<To> && !std::is_same_v<To, bool>)
To saturatingCast(double value) {
    if (std::isnan(value))
        return To{0};
    if (value <= static_cast<double>(std::numeric_limits<To>::lowest()))
        return std::numeric_limits<To>::lowest();
    if (value >= static_cast<double>(std::numeric_limits<To>::max()))
        return std::numeric_limits<To>::max();
    return static_cast<To>(value);
}

/**
 * @brief Numeric element conversion with numpy-style casting semantics
 *
 * Complex to real keeps the real part; anything to bool tests against zero. Floating
 * values outside an integer target's range saturate, and NaN converts to zero.
 */
template <NumericElement To, NumericElement From> To convertElement(const From& from) {
    if constexpr (std::is_same_v<To, From>) {
        return from;
    } else if constexpr (IsComplex<To>::value) {
        using Part = typename To::value_type;
        if constexpr (IsComplex<From>::value) {
            return To(static_cast<Part>(from.real()), static_cast<Part>(from.imag()));
        } else if constexpr (std::is_same_v<From, Float16>) {
            return To(static_cast<Part>(static_cast<float>(from)), Part{});
        } else {
            return To(static_cast<Part>(from), Part{});
        }
    } else if constexpr (std::is_same_v<To, Float16>) {
        if constexpr (IsComplex<From>::value) {
            return Float16(static_cast<float>(from.real()));
        } else {
            return Float16(static_cast<float>(from));
        }
    } else if constexpr (std::is_integral_v<To> && !std::is_same_v<To, bool> &&
                         !std::is_integral_v<From>) {
        if constexpr (IsComplex<From>::value) {
            return saturatingCast<To>(static_cast<double>(from.real()));
        } else if constexpr (std::is_same_v<From, Float16>) {
            return saturatingCast<To>(static_cast<float>(from));
        } else {
            return saturatingCast<To>(static_cast<double>(from));
        }
    } else {
        if constexpr (IsComplex<From>::value) {
            return static_cast<To>(from.real());
        } else if constexpr (std::is_same_v<From, Float16>) {
            return static_cast<To>(static_cast<float>(from));
        } else {
            return static_cast<To>(from);
        }
    }
}

} // namespace tensorwire::codec
