#include <tensorwire/codec/element_type.h>

#include <algorithm>
#include <array>
#include <bit>
#include <cctype>
#include <utility>

namespace tensorwire::codec {

namespace {

constexpr std::array<std::pair<ElementType, std::string_view>, 17> kElementTypeNames{{
    {ElementType::Float16, "float16"},
    {ElementType::Float32, "float32"},
    {ElementType::Float64, "float64"},
    {ElementType::Int8, "int8"},
    {ElementType::Int16, "int16"},
    {ElementType::Int32, "int32"},
    {ElementType::Int64, "int64"},
    {ElementType::UInt8, "uint8"},
    {ElementType::UInt16, "uint16"},
    {ElementType::UInt32, "uint32"},
    {ElementType::UInt64, "uint64"},
    {ElementType::Bool, "bool"},
    {ElementType::Complex64, "complex64"},
    {ElementType::Complex128, "complex128"},
    {ElementType::Bytes, "bytes"},
    {ElementType::FixedBytes, "fixed_bytes"},
    {ElementType::Unicode, "unicode"},
}};

} // namespace

// Round to nearest, ties to even. Overflow saturates to infinity.
Float16::Float16(float value) {
    const auto f = std::bit_cast<uint32_t>(value);
    const auto sign = static_cast<uint16_t>((f >> 16) & 0x8000u);
    const int32_t exponent = static_cast<int32_t>((f >> 23) & 0xffu);
    uint32_t mantissa = f & 0x7fffffu;

    if (exponent == 0xff) {
        bits = static_cast<uint16_t>(sign | 0x7c00u | (mantissa ? 0x200u | (mantissa >> 13) : 0u));
        return;
    }

    const int32_t halfExponent = exponent - 127 + 15;
    if (halfExponent >= 0x1f) {
        bits = static_cast<uint16_t>(sign | 0x7c00u);
        return;
    }

    if (halfExponent <= 0) {
        if (halfExponent < -10) {
            bits = sign;
            return;
        }
        mantissa |= 0x800000u;
        const auto shift = static_cast<uint32_t>(14 - halfExponent);
        uint32_t halfMantissa = mantissa >> shift;
        const uint32_t remainder = mantissa & ((1u << shift) - 1u);
        const uint32_t halfway = 1u << (shift - 1u);
        if (remainder > halfway || (remainder == halfway && (halfMantissa & 1u)))
            ++halfMantissa;
        bits = static_cast<uint16_t>(sign | halfMantissa);
        return;
    }

    uint32_t half = sign | (static_cast<uint32_t>(halfExponent) << 10) | (mantissa >> 13);
    const uint32_t remainder = mantissa & 0x1fffu;
    // A carry out of the mantissa correctly bumps the exponent.
    if (remainder > 0x1000u || (remainder == 0x1000u && (half & 1u)))
        ++half;
    bits = static_cast<uint16_t>(half);
}

Float16::operator float() const {
    const uint32_t sign = static_cast<uint32_t>(bits & 0x8000u) << 16;
    const uint32_t exponent = (bits >> 10) & 0x1fu;
    uint32_t mantissa = bits & 0x3ffu;

    uint32_t f = 0;
    if (exponent == 0) {
        if (mantissa == 0) {
            f = sign;
        } else {
            int32_t e = 1;
            while ((mantissa & 0x400u) == 0) {
                mantissa <<= 1;
                --e;
            }
            mantissa &= 0x3ffu;
            f = sign | (static_cast<uint32_t>(e + 112) << 23) | (mantissa << 13);
        }
    } else if (exponent == 0x1f) {
        f = sign | 0x7f800000u | (mantissa << 13);
    } else {
        f = sign | ((exponent + 112) << 23) | (mantissa << 13);
    }
    return std::bit_cast<float>(f);
}

std::string_view elementTypeName(ElementType type) {
    auto it = std::find_if(kElementTypeNames.begin(), kElementTypeNames.end(),
                           [type](const auto& entry) { return entry.first == type; });
    return it != kElementTypeNames.end() ? it->second : std::string_view{"unknown"};
}

std::optional<ElementType> parseElementType(std::string_view name) {
    std::string lowered;
    lowered.reserve(name.size());
    for (char c : name)
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lowered == "half")
        return ElementType::Float16;
    if (lowered == "float")
        return ElementType::Float32;
    if (lowered == "double")
        return ElementType::Float64;

    for (const auto& [type, typeName] : kElementTypeNames) {
        if (typeName == lowered)
            return type;
    }
    return std::nullopt;
}

} // namespace tensorwire::codec
