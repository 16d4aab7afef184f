#include <tensorwire/codec/request_validators.h>

namespace tensorwire::codec {

std::optional<int64_t> firstDimension(const TensorProto& tensor) {
    if (tensor.tensor_shape().dim_size() == 0)
        return std::nullopt;
    return tensor.tensor_shape().dim(0).size();
}

Result<void> check_valid_length(const TensorProto& tensor, const std::string& featureName,
                                int64_t nbSamples) {
    auto dim = firstDimension(tensor);
    if (!dim || *dim != nbSamples) {
        return Error{ErrorCode::InvalidLength, featureName + " has invalid length."};
    }
    return Result<void>();
}

Result<void> check_column_shape(const NdArray& array, const std::string& featureName) {
    if (array.rank() != 2 || array.shape()[1] != 1) {
        return Error{ErrorCode::InvalidShape,
                     featureName + ": all input vectors should be 1D tensor, got shape " +
                         formatShape(array.shape())};
    }
    return Result<void>();
}

} // namespace tensorwire::codec
