#include <tensorwire/codec/value_tree.h>

namespace tensorwire::codec {

namespace {

Shape leadingShape(const ValueTree& root) {
    Shape shape;
    const ValueTree* node = &root;
    while (!node->isLeaf()) {
        shape.push_back(static_cast<int64_t>(node->children().size()));
        if (node->children().empty())
            break;
        node = &node->children().front();
    }
    return shape;
}

Result<void> collectLeaves(const ValueTree& node, std::size_t depth, const Shape& shape,
                           std::vector<const Scalar*>& leaves) {
    if (depth == shape.size()) {
        if (!node.isLeaf()) {
            return Error{ErrorCode::InvalidShape,
                         "ragged sequence: expected a scalar at depth " + std::to_string(depth)};
        }
        leaves.push_back(&node.scalar());
        return Result<void>();
    }
    if (node.isLeaf() ||
        node.children().size() != static_cast<std::size_t>(shape[depth])) {
        return Error{ErrorCode::InvalidShape, "ragged sequence: expected " +
                                                  std::to_string(shape[depth]) +
                                                  " elements at depth " + std::to_string(depth)};
    }
    for (const auto& child : node.children()) {
        auto r = collectLeaves(child, depth + 1, shape, leaves);
        if (!r)
            return r;
    }
    return Result<void>();
}

template <NumericElement T> T scalarAs(const Scalar& scalar) {
    return std::visit(
        [](const auto& v) -> T {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::string>) {
                return T{}; // rejected before conversion
            } else {
                return convertElement<T>(v);
            }
        },
        scalar);
}

Result<NdArray> buildNumeric(ElementType type, const std::vector<const Scalar*>& leaves,
                             Shape shape) {
    return visitElementType(type, [&]<typename T>(std::type_identity<T>) -> Result<NdArray> {
        if constexpr (NumericElement<T>) {
            std::vector<T> values;
            values.reserve(leaves.size());
            for (const auto* leaf : leaves)
                values.push_back(scalarAs<T>(*leaf));
            return NdArray::fromValues(std::move(values), std::move(shape));
        } else {
            return Error{ErrorCode::InternalError, "numeric build requested for strings"};
        }
    });
}

} // namespace

Result<NdArray> toNdArray(const ValueTree& tree, std::optional<ElementType> target) {
    Shape shape = leadingShape(tree);
    std::vector<const Scalar*> leaves;
    if (auto r = collectLeaves(tree, 0, shape, leaves); !r)
        return r.error();

    bool hasString = false;
    bool hasNumber = false;
    bool hasInteger = false;
    bool hasDouble = false;
    for (const auto* leaf : leaves) {
        if (std::holds_alternative<std::string>(*leaf)) {
            hasString = true;
        } else {
            hasNumber = true;
            hasInteger = hasInteger || std::holds_alternative<int64_t>(*leaf);
            hasDouble = hasDouble || std::holds_alternative<double>(*leaf);
        }
    }

    ElementType type = ElementType::Float64;
    if (target) {
        type = *target;
        if (isStringType(type) && hasNumber) {
            return Error{ErrorCode::InvalidStringElement,
                         "expected a sequence of byte strings for " +
                             std::string(elementTypeName(type)) + " elements"};
        }
        if (!isStringType(type) && hasString) {
            return Error{ErrorCode::UnsupportedEncoding,
                         "cannot convert string elements to " +
                             std::string(elementTypeName(type))};
        }
    } else if (hasString) {
        if (hasNumber) {
            return Error{ErrorCode::InvalidStringElement,
                         "sequence mixes byte strings with numeric elements"};
        }
        type = ElementType::Bytes;
    } else if (hasDouble) {
        type = ElementType::Float64;
    } else if (hasInteger) {
        type = ElementType::Int64;
    } else if (hasNumber) {
        type = ElementType::Bool;
    }

    if (isStringType(type)) {
        std::vector<std::string> values;
        values.reserve(leaves.size());
        for (const auto* leaf : leaves)
            values.push_back(std::get<std::string>(*leaf));
        return NdArray::fromStrings(std::move(values), std::move(shape), type);
    }
    return buildNumeric(type, leaves, std::move(shape));
}

} // namespace tensorwire::codec
