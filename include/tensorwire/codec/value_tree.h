#pragma once

#include <tensorwire/codec/element_type.h>
#include <tensorwire/codec/nd_array.h>
#include <tensorwire/core/types.h>

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace tensorwire::codec {

using Scalar = std::variant<bool, int64_t, double, std::string>;

/**
 * @brief Strictly typed nested sequence of scalars
 *
 * Builds with brace initialisation, e.g. ValueTree{{1, 2}, {3, 4}} or
 * ValueTree{{"x"}, {"y"}}. Leaves are bool, int64, double or byte strings; the leaf
 * kinds and the nesting are checked by toNdArray() before anything is encoded.
 */
class ValueTree {
public:
    ValueTree(bool value) : scalar_(value), leaf_(true) {}

    template <std::integral T>
        requires(!std::is_same_v<T, bool>)
    ValueTree(T value) : scalar_(static_cast<int64_t>(value)), leaf_(true) {}

    template <std::floating_point T>
    ValueTree(T value) : scalar_(static_cast<double>(value)), leaf_(true) {}

    ValueTree(std::string value) : scalar_(std::move(value)), leaf_(true) {}
    ValueTree(const char* value) : scalar_(std::string(value)), leaf_(true) {}

    ValueTree(std::initializer_list<ValueTree> children) : children_(children), leaf_(false) {}

    static ValueTree list(std::vector<ValueTree> children) {
        ValueTree tree(std::initializer_list<ValueTree>{});
        tree.children_ = std::move(children);
        return tree;
    }

    [[nodiscard]] bool isLeaf() const noexcept { return leaf_; }
    [[nodiscard]] const Scalar& scalar() const noexcept { return scalar_; }
    [[nodiscard]] const std::vector<ValueTree>& children() const noexcept { return children_; }

private:
    Scalar scalar_;
    std::vector<ValueTree> children_;
    bool leaf_ = false;
};

/**
 * @brief Materialise a ValueTree as a dense NdArray
 *
 * Without @p target the element type is inferred from the leaves: all bool gives Bool,
 * bool and integers give Int64, any double gives Float64, all strings give Bytes, an
 * empty tree gives Float64 of shape [0].
 *
 * Errors:
 *  - InvalidShape: ragged nesting
 *  - InvalidStringElement: strings mixed with numbers, or numbers under a string target
 *  - UnsupportedEncoding: strings under a numeric target
 */
Result<NdArray> toNdArray(const ValueTree& tree,
                          std::optional<ElementType> target = std::nullopt);

} // namespace tensorwire::codec
