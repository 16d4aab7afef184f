#pragma once

#include <tensorwire/codec/nd_array.h>
#include <tensorwire/core/types.h>
#include <tensorwire/proto/tensor.pb.h>

namespace tensorwire::codec {

using TensorProto = tensorwire::proto::TensorProto;

/**
 * @brief What to do when a typed value list is shorter than the declared shape
 */
enum class PaddingPolicy : uint8_t {
    EdgeReplicate = 0, ///< Repeat the last value up to the element count
    Reject = 1,        ///< Fail with ErrorCode::InvalidLength
};

struct DecodeOptions {
    PaddingPolicy padding = PaddingPolicy::EdgeReplicate;
};

// Dimension sizes of the tensor's declared shape, in order
Shape tensorShape(const TensorProto& tensor);

/**
 * @brief Decode a wire tensor into a native array of its declared shape
 *
 * A non-empty tensor_content is copied and reinterpreted at the native width of the
 * tensor's dtype. Otherwise the typed value list for the dtype is used: float_val,
 * double_val, int_val (every signed width and uint8/uint16), int64_val (int64,
 * preferred over int_val when present), bool_val or string_val. An empty list yields
 * zeros; a short list is padded according to @p options. DT_BOOL raw bytes are read as
 * false for zero and true otherwise.
 *
 * Errors:
 *  - UnknownLogicalType: dtype has no native counterpart
 *  - UnsupportedEncoding: dtype has no typed value list, or string dtype with raw bytes
 *  - InvalidData: raw length does not match the shape, or value list longer than shape
 *  - InvalidLength: short value list under PaddingPolicy::Reject
 *  - InvalidShape: negative dimension, or a shape too large to allocate
 */
Result<NdArray> decode(const TensorProto& tensor, const DecodeOptions& options = {});

} // namespace tensorwire::codec
