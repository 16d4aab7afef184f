#pragma once

#include <tensorwire/codec/nd_array.h>
#include <tensorwire/codec/value_tree.h>
#include <tensorwire/core/types.h>
#include <tensorwire/proto/tensor.pb.h>

#include <optional>

namespace tensorwire::codec {

using TensorProto = tensorwire::proto::TensorProto;

/**
 * @brief Encode a native array as a wire tensor
 *
 * Float64 arrays are always narrowed to Float32; Int64 arrays are narrowed to Int32 when
 * every element fits. Byte-string arrays go to string_val, everything else to
 * tensor_content in row-major order at the native element width.
 *
 * @return TensorProto, or UnknownNativeType / InvalidStringElement
 */
Result<TensorProto> encode(const NdArray& array);

/**
 * @brief Encode a nested sequence, optionally forcing the element type
 *
 * The tree is materialised with toNdArray() first, so nesting and leaf kinds are
 * validated before any encoding decision.
 */
Result<TensorProto> encode(const ValueTree& values,
                           std::optional<ElementType> elementType = std::nullopt);

// Encode into a caller-owned message. On failure @p out is left untouched.
Result<void> encode_into(const NdArray& array, TensorProto& out);

} // namespace tensorwire::codec
