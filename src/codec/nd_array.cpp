#include <tensorwire/codec/nd_array.h>

#include <algorithm>
#include <cstddef>
#include <limits>
#include <new>

namespace tensorwire::codec {

Result<std::size_t> shapeElementCount(const Shape& shape) {
    std::size_t count = 1;
    for (auto dim : shape) {
        if (dim < 0) {
            return Error{ErrorCode::InvalidShape,
                         "negative dimension in shape " + formatShape(shape)};
        }
        const auto udim = static_cast<std::size_t>(dim);
        if (udim != 0 && count > std::numeric_limits<std::size_t>::max() / udim) {
            return Error{ErrorCode::InvalidShape, "shape " + formatShape(shape) + " overflows"};
        }
        count *= udim;
    }
    return count;
}

Result<std::size_t> storageByteSize(ElementType type, std::size_t count) {
    const std::size_t width =
        isStringType(type) ? sizeof(std::string) : elementByteWidth(type);
    constexpr auto kMaxBytes =
        static_cast<std::size_t>(std::numeric_limits<std::ptrdiff_t>::max());
    if (width != 0 && count > kMaxBytes / width) {
        return Error{ErrorCode::InvalidShape,
                     std::to_string(count) + " " + std::string(elementTypeName(type)) +
                         " elements exceed the addressable buffer size"};
    }
    return count * width;
}

std::string formatShape(const Shape& shape) {
    std::string out = "[";
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (i > 0)
            out += ", ";
        out += std::to_string(shape[i]);
    }
    out += "]";
    return out;
}

Result<NdArray> NdArray::zeros(ElementType type, Shape shape) {
    auto count = shapeElementCount(shape);
    if (!count)
        return count.error();
    auto byteSize = storageByteSize(type, count.value());
    if (!byteSize)
        return byteSize.error();

    NdArray array;
    array.type_ = type;
    array.shape_ = std::move(shape);
    array.count_ = count.value();
    try {
        if (isStringType(type)) {
            array.strings_.assign(array.count_, std::string{});
        } else {
            // All-zero bytes are zero for every numeric kind, including Float16 and complex.
            array.buffer_.assign(byteSize.value(), std::byte{0});
        }
    } catch (const std::bad_alloc&) {
        return Error{ErrorCode::InvalidShape,
                     "cannot allocate " + std::to_string(byteSize.value()) +
                         " bytes for shape " + formatShape(array.shape_)};
    }
    return array;
}

Result<NdArray> NdArray::fromBytes(ElementType type, ByteSpan bytes, Shape shape) {
    if (isStringType(type)) {
        return Error{ErrorCode::UnsupportedEncoding,
                     std::string("raw bytes cannot hold ") + std::string(elementTypeName(type)) +
                         " elements"};
    }
    auto count = shapeElementCount(shape);
    if (!count)
        return count.error();

    auto byteSize = storageByteSize(type, count.value());
    if (!byteSize)
        return byteSize.error();
    if (bytes.size() != byteSize.value()) {
        return Error{ErrorCode::InvalidData,
                     "raw payload of " + std::to_string(bytes.size()) + " bytes does not hold " +
                         std::to_string(count.value()) + " " +
                         std::string(elementTypeName(type)) + " elements of shape " +
                         formatShape(shape)};
    }

    NdArray array;
    array.type_ = type;
    array.shape_ = std::move(shape);
    array.count_ = count.value();
    array.buffer_.assign(bytes.begin(), bytes.end());
    if (type == ElementType::Bool) {
        // Any non-zero byte is true; only 0 and 1 are valid bool representations.
        for (auto& b : array.buffer_)
            b = b == std::byte{0} ? std::byte{0} : std::byte{1};
    }
    return array;
}

Result<NdArray> NdArray::fromStrings(std::vector<std::string> values, Shape shape,
                                     ElementType type) {
    if (!isStringType(type)) {
        return Error{ErrorCode::InvalidArgument,
                     std::string(elementTypeName(type)) + " is not a string element type"};
    }
    auto count = shapeElementCount(shape);
    if (!count)
        return count.error();
    if (count.value() != values.size()) {
        return Error{ErrorCode::InvalidShape, "cannot reshape " + std::to_string(values.size()) +
                                                  " elements into shape " + formatShape(shape)};
    }

    NdArray array;
    array.type_ = type;
    array.shape_ = std::move(shape);
    array.count_ = values.size();
    array.strings_ = std::move(values);
    return array;
}

const std::vector<std::string>& NdArray::strings() const {
    if (!isString()) {
        throw std::invalid_argument(std::string("NdArray holds ") +
                                    std::string(elementTypeName(type_)) + ", not strings");
    }
    return strings_;
}

std::vector<std::string>& NdArray::mutableStrings() {
    if (!isString()) {
        throw std::invalid_argument(std::string("NdArray holds ") +
                                    std::string(elementTypeName(type_)) + ", not strings");
    }
    return strings_;
}

Result<void> NdArray::reshape(Shape shape) {
    auto count = shapeElementCount(shape);
    if (!count)
        return count.error();
    if (count.value() != count_) {
        return Error{ErrorCode::InvalidShape, "cannot reshape array of size " +
                                                  std::to_string(count_) + " into shape " +
                                                  formatShape(shape)};
    }
    shape_ = std::move(shape);
    return Result<void>();
}

Result<NdArray> NdArray::astype(ElementType type) const {
    if (type == type_)
        return *this;

    if (isString() || isStringType(type)) {
        if (isString() && isStringType(type)) {
            NdArray relabelled = *this;
            relabelled.type_ = type;
            return relabelled;
        }
        return Error{ErrorCode::UnsupportedEncoding,
                     std::string("cannot convert ") + std::string(elementTypeName(type_)) +
                         " elements to " + std::string(elementTypeName(type))};
    }

    auto converted = NdArray::zeros(type, shape_);
    if (!converted)
        return converted.error();
    NdArray out = std::move(converted).value();

    visitElementType(type_, [&]<typename From>(std::type_identity<From>) {
        if constexpr (NumericElement<From>) {
            const auto src = values<From>();
            visitElementType(type, [&]<typename To>(std::type_identity<To>) {
                if constexpr (NumericElement<To>) {
                    auto dst = out.mutableValues<To>();
                    std::transform(src.begin(), src.end(), dst.begin(),
                                   [](const From& v) { return convertElement<To>(v); });
                }
            });
        }
    });
    return out;
}

bool NdArray::operator==(const NdArray& other) const {
    if (type_ != other.type_ || shape_ != other.shape_)
        return false;
    if (isString())
        return strings_ == other.strings_;

    bool equal = true;
    visitElementType(type_, [&]<typename T>(std::type_identity<T>) {
        if constexpr (NumericElement<T>) {
            const auto lhs = values<T>();
            const auto rhs = other.values<T>();
            equal = std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
        }
    });
    return equal;
}

} // namespace tensorwire::codec
