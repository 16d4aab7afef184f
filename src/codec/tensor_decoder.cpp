#include <tensorwire/codec/tensor_decoder.h>
#include <tensorwire/codec/type_registry.h>

#include <spdlog/spdlog.h>
#include <google/protobuf/repeated_field.h>
#include <new>
#include <string>
#include <vector>

namespace tensorwire::codec {

namespace pb = tensorwire::proto;

namespace {

// Shared length policy for every typed value list. Returns an error, or Success when the
// list may be used (possibly after padding).
Result<void> checkListLength(std::size_t listSize, std::size_t count, DataType dtype,
                             const Shape& shape, const DecodeOptions& options) {
    if (listSize > count) {
        return Error{ErrorCode::InvalidData,
                     "value list holds " + std::to_string(listSize) + " elements but shape " +
                         formatShape(shape) + " has " + std::to_string(count)};
    }
    if (listSize < count) {
        if (options.padding == PaddingPolicy::Reject) {
            return Error{ErrorCode::InvalidLength,
                         "value list holds " + std::to_string(listSize) + " of " +
                             std::to_string(count) + " elements for shape " +
                             formatShape(shape)};
        }
        spdlog::warn("decode: {} value list holds {} of {} elements, repeating last value",
                     dataTypeName(dtype), listSize, count);
    }
    return Result<void>();
}

template <typename Wire>
Result<NdArray> decodeNumericList(const google::protobuf::RepeatedField<Wire>& field,
                                  ElementType native, DataType dtype, Shape shape,
                                  std::size_t count, const DecodeOptions& options) {
    const auto listSize = static_cast<std::size_t>(field.size());
    if (listSize == 0) {
        spdlog::debug("decode: empty {} value list, returning zeros", dataTypeName(dtype));
        return NdArray::zeros(native, std::move(shape));
    }
    if (auto r = checkListLength(listSize, count, dtype, shape, options); !r)
        return r.error();

    return visitElementType(native, [&]<typename T>(std::type_identity<T>) -> Result<NdArray> {
        if constexpr (NumericElement<T>) {
            std::vector<T> values;
            values.reserve(count);
            for (const auto& w : field)
                values.push_back(convertElement<T>(w));
            const T last = values.back();
            values.resize(count, last);
            return NdArray::fromValues(std::move(values), std::move(shape));
        } else {
            return Error{ErrorCode::InternalError,
                         "numeric value list decoded into " +
                             std::string(elementTypeName(native))};
        }
    });
}

Result<NdArray> decodeStringList(const google::protobuf::RepeatedPtrField<std::string>& field,
                                 ElementType native, DataType dtype, Shape shape,
                                 std::size_t count, const DecodeOptions& options) {
    const auto listSize = static_cast<std::size_t>(field.size());
    if (listSize == 0) {
        spdlog::debug("decode: empty {} value list, returning empty strings",
                      dataTypeName(dtype));
        return NdArray::zeros(native, std::move(shape));
    }
    if (auto r = checkListLength(listSize, count, dtype, shape, options); !r)
        return r.error();

    std::vector<std::string> values(field.begin(), field.end());
    const std::string last = values.back();
    values.resize(count, last);
    return NdArray::fromStrings(std::move(values), std::move(shape), native);
}

// Typed value list for the dtype, padded or rejected per the options
Result<NdArray> decodeValueList(const TensorProto& tensor, ElementType native, Shape shape,
                                std::size_t count, const DecodeOptions& options) {
    const DataType dtype = tensor.dtype();
    switch (dtype) {
        case pb::DT_FLOAT:
            return decodeNumericList(tensor.float_val(), native, dtype, std::move(shape), count,
                                     options);
        case pb::DT_DOUBLE:
            return decodeNumericList(tensor.double_val(), native, dtype, std::move(shape), count,
                                     options);
        case pb::DT_INT64:
            // TensorFlow peers fill int64_val; int_val is the shared fallback.
            if (tensor.int64_val_size() > 0) {
                return decodeNumericList(tensor.int64_val(), native, dtype, std::move(shape),
                                         count, options);
            }
            return decodeNumericList(tensor.int_val(), native, dtype, std::move(shape), count,
                                     options);
        case pb::DT_INT8:
        case pb::DT_INT16:
        case pb::DT_INT32:
        case pb::DT_UINT8:
        case pb::DT_UINT16:
            return decodeNumericList(tensor.int_val(), native, dtype, std::move(shape), count,
                                     options);
        case pb::DT_BOOL:
            return decodeNumericList(tensor.bool_val(), native, dtype, std::move(shape), count,
                                     options);
        case pb::DT_STRING:
            return decodeStringList(tensor.string_val(), native, dtype, std::move(shape), count,
                                    options);
        default:
            break;
    }
    return Error{ErrorCode::UnsupportedEncoding,
                 "Unsupported tensor type: " + dataTypeName(dtype)};
}

} // namespace

Shape tensorShape(const TensorProto& tensor) {
    Shape shape;
    shape.reserve(static_cast<std::size_t>(tensor.tensor_shape().dim_size()));
    for (const auto& dim : tensor.tensor_shape().dim())
        shape.push_back(dim.size());
    return shape;
}

Result<NdArray> decode(const TensorProto& tensor, const DecodeOptions& options) {
    const DataType dtype = tensor.dtype();
    auto native = native_type_of(dtype);
    if (!native)
        return native.error();

    Shape shape = tensorShape(tensor);
    auto count = shapeElementCount(shape);
    if (!count)
        return count.error();
    if (auto bytes = storageByteSize(native.value(), count.value()); !bytes)
        return bytes.error();

    if (!tensor.tensor_content().empty()) {
        if (isStringType(native.value())) {
            return Error{ErrorCode::UnsupportedEncoding,
                         dataTypeName(dtype) + " tensors cannot use tensor_content"};
        }
        const auto& content = tensor.tensor_content();
        spdlog::debug("decode: {} from {} raw bytes, shape={}", dataTypeName(dtype),
                      content.size(), formatShape(shape));
        // fromBytes copies, the result never aliases the message.
        return NdArray::fromBytes(
            native.value(),
            ByteSpan{reinterpret_cast<const std::byte*>(content.data()), content.size()},
            std::move(shape));
    }

    try {
        return decodeValueList(tensor, native.value(), std::move(shape), count.value(), options);
    } catch (const std::bad_alloc&) {
        return Error{ErrorCode::InvalidShape,
                     "cannot allocate " + std::to_string(count.value()) + " " +
                         dataTypeName(dtype) + " elements for shape " +
                         formatShape(tensorShape(tensor))};
    }
}

} // namespace tensorwire::codec
