#pragma once

#include <tensorwire/codec/element_type.h>
#include <tensorwire/core/types.h>

#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace tensorwire::codec {

/**
 * @brief Number of elements described by @p shape
 *
 * An empty shape is a scalar (one element). Negative dimensions are rejected with
 * ErrorCode::InvalidShape.
 */
Result<std::size_t> shapeElementCount(const Shape& shape);

std::string formatShape(const Shape& shape);

/**
 * @brief Bytes needed to store @p count elements of @p type
 *
 * String kinds are sized by their std::string slots. Fails with ErrorCode::InvalidShape
 * when the size overflows or exceeds what a single buffer can address.
 */
Result<std::size_t> storageByteSize(ElementType type, std::size_t count);

/**
 * @brief Owning, row-major, typed multi-dimensional array
 *
 * Numeric elements live in one contiguous byte buffer at their native width; string
 * kinds (Bytes, FixedBytes, Unicode) live in a vector of std::string. Copies are deep.
 */
class NdArray {
public:
    NdArray() = default;

    // Zero-filled array; string kinds are filled with empty strings.
    static Result<NdArray> zeros(ElementType type, Shape shape);

    // Copy a dense native buffer. bytes.size() must equal count * width. Bool bytes are
    // normalised so any non-zero byte reads as true.
    static Result<NdArray> fromBytes(ElementType type, ByteSpan bytes, Shape shape);

    static Result<NdArray> fromStrings(std::vector<std::string> values, Shape shape,
                                       ElementType type = ElementType::Bytes);

    template <NumericElement T>
    static Result<NdArray> fromValues(std::vector<T> values, Shape shape) {
        auto count = shapeElementCount(shape);
        if (!count)
            return count.error();
        if (count.value() != values.size()) {
            return Error{ErrorCode::InvalidShape,
                         "cannot reshape " + std::to_string(values.size()) +
                             " elements into shape " + formatShape(shape)};
        }
        NdArray array;
        array.type_ = ElementTraits<T>::type;
        array.shape_ = std::move(shape);
        array.count_ = values.size();
        array.buffer_.resize(values.size() * sizeof(T));
        if constexpr (std::is_same_v<T, bool>) {
            for (std::size_t i = 0; i < values.size(); ++i)
                array.buffer_[i] = std::byte{static_cast<uint8_t>(values[i] ? 1 : 0)};
        } else if (!values.empty()) {
            std::memcpy(array.buffer_.data(), values.data(), array.buffer_.size());
        }
        return array;
    }

    // Rank-1 convenience
    template <NumericElement T> static NdArray vector(std::vector<T> values) {
        const auto n = static_cast<int64_t>(values.size());
        return fromValues(std::move(values), Shape{n}).value();
    }

    [[nodiscard]] ElementType elementType() const noexcept { return type_; }
    [[nodiscard]] const Shape& shape() const noexcept { return shape_; }
    [[nodiscard]] std::size_t rank() const noexcept { return shape_.size(); }
    [[nodiscard]] std::size_t size() const noexcept { return count_; }
    [[nodiscard]] bool isString() const noexcept { return isStringType(type_); }

    // Dense element buffer; empty for string kinds
    [[nodiscard]] ByteSpan bytes() const noexcept { return {buffer_.data(), buffer_.size()}; }

    template <NumericElement T> std::span<const T> values() const {
        requireType<T>();
        return {reinterpret_cast<const T*>(buffer_.data()), count_};
    }

    template <NumericElement T> std::span<T> mutableValues() {
        requireType<T>();
        return {reinterpret_cast<T*>(buffer_.data()), count_};
    }

    const std::vector<std::string>& strings() const;
    std::vector<std::string>& mutableStrings();

    // Change the shape without touching the elements; the element count must match.
    Result<void> reshape(Shape shape);

    /**
     * @brief Convert to another element type
     *
     * Numeric kinds convert among themselves with convertElement(); string kinds convert
     * among themselves by relabelling. Crossing between the two fails with
     * ErrorCode::UnsupportedEncoding.
     */
    Result<NdArray> astype(ElementType type) const;

    bool operator==(const NdArray& other) const;

private:
    template <NumericElement T> void requireType() const {
        if (ElementTraits<T>::type != type_) {
            throw std::invalid_argument(std::string("NdArray holds ") +
                                        std::string(elementTypeName(type_)) + ", not " +
                                        std::string(elementTypeName(ElementTraits<T>::type)));
        }
    }

    ElementType type_ = ElementType::Float64;
    Shape shape_{0};
    std::size_t count_ = 0;
    ByteVector buffer_;
    std::vector<std::string> strings_;
};

using SampleMatrix = NdArray;

} // namespace tensorwire::codec
