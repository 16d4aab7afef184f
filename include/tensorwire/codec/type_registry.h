#pragma once

#include <tensorwire/codec/element_type.h>
#include <tensorwire/core/types.h>
#include <tensorwire/proto/tensor.pb.h>

#include <string>
#include <unordered_map>

namespace tensorwire::codec {

using DataType = tensorwire::proto::DataType;

/**
 * @brief Bidirectional mapping between wire DataType codes and native element types
 *
 * Both directions are derived once from the same source table and never mutated, so
 * concurrent lookups need no synchronisation.
 */
class TypeRegistry {
public:
    static const TypeRegistry& instance();

    /**
     * @brief Wire type for a native element type
     * @return DataType or ErrorCode::UnknownNativeType
     */
    [[nodiscard]] Result<DataType> logicalTypeOf(ElementType type) const;

    /**
     * @brief Native element type used when decoding a wire type
     * @return ElementType or ErrorCode::UnknownLogicalType
     */
    [[nodiscard]] Result<ElementType> nativeTypeOf(DataType type) const;

private:
    TypeRegistry();

    std::unordered_map<int, ElementType> toNative_;
    std::unordered_map<ElementType, DataType> toLogical_;
};

inline Result<DataType> logical_type_of(ElementType type) {
    return TypeRegistry::instance().logicalTypeOf(type);
}

inline Result<ElementType> native_type_of(DataType type) {
    return TypeRegistry::instance().nativeTypeOf(type);
}

std::string dataTypeName(DataType type);

} // namespace tensorwire::codec
