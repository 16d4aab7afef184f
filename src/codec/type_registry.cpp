#include <tensorwire/codec/type_registry.h>

#include <array>
#include <utility>

namespace tensorwire::codec {

namespace pb = tensorwire::proto;

namespace {

// Single source of truth for both lookup directions. The first entry for a DataType
// wins on decode; every entry resolves on encode.
constexpr std::array<std::pair<pb::DataType, ElementType>, 17> kTypeTable{{
    {pb::DT_HALF, ElementType::Float16},
    {pb::DT_FLOAT, ElementType::Float32},
    {pb::DT_DOUBLE, ElementType::Float64},
    {pb::DT_INT32, ElementType::Int32},
    {pb::DT_UINT8, ElementType::UInt8},
    {pb::DT_UINT16, ElementType::UInt16},
    {pb::DT_UINT32, ElementType::UInt32},
    {pb::DT_UINT64, ElementType::UInt64},
    {pb::DT_INT16, ElementType::Int16},
    {pb::DT_INT8, ElementType::Int8},
    {pb::DT_STRING, ElementType::Bytes},
    {pb::DT_COMPLEX64, ElementType::Complex64},
    {pb::DT_COMPLEX128, ElementType::Complex128},
    {pb::DT_INT64, ElementType::Int64},
    {pb::DT_BOOL, ElementType::Bool},
    // Encode-only aliases
    {pb::DT_STRING, ElementType::FixedBytes},
    {pb::DT_STRING, ElementType::Unicode},
}};

} // namespace

const TypeRegistry& TypeRegistry::instance() {
    static const TypeRegistry registry;
    return registry;
}

TypeRegistry::TypeRegistry() {
    for (const auto& [logical, native] : kTypeTable) {
        toNative_.try_emplace(static_cast<int>(logical), native);
        toLogical_.try_emplace(native, logical);
    }
}

Result<DataType> TypeRegistry::logicalTypeOf(ElementType type) const {
    auto it = toLogical_.find(type);
    if (it == toLogical_.end()) {
        return Error{ErrorCode::UnknownNativeType,
                     "Could not infer wire type for " + std::string(elementTypeName(type))};
    }
    return it->second;
}

Result<ElementType> TypeRegistry::nativeTypeOf(DataType type) const {
    auto it = toNative_.find(static_cast<int>(type));
    if (it == toNative_.end()) {
        return Error{ErrorCode::UnknownLogicalType,
                     "Could not infer native type for " + dataTypeName(type)};
    }
    return it->second;
}

std::string dataTypeName(DataType type) {
    if (pb::DataType_IsValid(type))
        return pb::DataType_Name(type);
    return "DataType(" + std::to_string(static_cast<int>(type)) + ")";
}

} // namespace tensorwire::codec
