#include <tensorwire/codec/tensor_encoder.h>
#include <tensorwire/codec/type_registry.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdint>
#include <limits>

namespace tensorwire::codec {

namespace {

bool fitsInt32(std::span<const int64_t> values) {
    return std::all_of(values.begin(), values.end(), [](int64_t v) {
        return v >= std::numeric_limits<int32_t>::min() &&
               v <= std::numeric_limits<int32_t>::max();
    });
}

// Float64 becomes Float32 unconditionally; Int64 becomes Int32 only when lossless.
// Returns an empty optional when the array goes out at its own width.
Result<std::optional<NdArray>> narrowForWire(const NdArray& array) {
    ElementType target = array.elementType();
    if (array.elementType() == ElementType::Float64) {
        target = ElementType::Float32;
    } else if (array.elementType() == ElementType::Int64) {
        if (!fitsInt32(array.values<int64_t>())) {
            spdlog::debug("encode: keeping int64, narrowing would lose values");
            return std::optional<NdArray>{};
        }
        target = ElementType::Int32;
    } else {
        return std::optional<NdArray>{};
    }

    auto narrowed = array.astype(target);
    if (!narrowed)
        return narrowed.error();
    spdlog::debug("encode: narrowing {} {} elements to {}", array.size(),
                  elementTypeName(array.elementType()), elementTypeName(target));
    return std::optional<NdArray>{std::move(narrowed).value()};
}

} // namespace

Result<void> encode_into(const NdArray& array, TensorProto& out) {
    auto narrowed = narrowForWire(array);
    if (!narrowed)
        return narrowed.error();
    const NdArray& source = narrowed.value() ? *narrowed.value() : array;

    auto logical = logical_type_of(source.elementType());
    if (!logical)
        return logical.error();

    const bool stringPayload = logical.value() == tensorwire::proto::DT_STRING;
    if (stringPayload && !isByteStringType(source.elementType())) {
        return Error{ErrorCode::InvalidStringElement,
                     "expected a sequence of byte strings when encoding DT_STRING, got " +
                         std::string(elementTypeName(source.elementType())) + " elements"};
    }

    out.Clear();
    out.set_dtype(logical.value());
    auto* shape = out.mutable_tensor_shape();
    for (auto dim : source.shape())
        shape->add_dim()->set_size(dim);

    if (stringPayload) {
        auto* strings = out.mutable_string_val();
        strings->Reserve(static_cast<int>(source.size()));
        for (const auto& s : source.strings())
            strings->Add(std::string{s});
    } else {
        const auto bytes = source.bytes();
        out.set_tensor_content(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }

    spdlog::debug("encode: dtype={} shape={} elements={}", dataTypeName(logical.value()),
                  formatShape(source.shape()), source.size());
    return Result<void>();
}

Result<TensorProto> encode(const NdArray& array) {
    TensorProto tensor;
    auto r = encode_into(array, tensor);
    if (!r)
        return r.error();
    return tensor;
}

Result<TensorProto> encode(const ValueTree& values, std::optional<ElementType> elementType) {
    auto array = toNdArray(values, elementType);
    if (!array)
        return array.error();
    return encode(array.value());
}

} // namespace tensorwire::codec
