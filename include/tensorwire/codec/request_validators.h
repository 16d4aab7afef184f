#pragma once

#include <tensorwire/codec/nd_array.h>
#include <tensorwire/core/types.h>
#include <tensorwire/proto/tensor.pb.h>

#include <concepts>
#include <optional>
#include <string>

namespace tensorwire::codec {

using TensorProto = tensorwire::proto::TensorProto;

// Any associative container keyed by feature name: google::protobuf::Map, std::map,
// std::unordered_map.
template <typename M>
concept TensorMapping = requires(const M& m, const std::string& key) {
    { m.find(key) == m.end() } -> std::convertible_to<bool>;
    { m.find(key)->second } -> std::convertible_to<const TensorProto&>;
};

// Size of the first declared dimension, if the tensor has one
std::optional<int64_t> firstDimension(const TensorProto& tensor);

// InvalidLength unless the tensor's first dimension equals nbSamples
Result<void> check_valid_length(const TensorProto& tensor, const std::string& featureName,
                                int64_t nbSamples);

// InvalidShape unless the array is 2-D with a trailing dimension of 1
Result<void> check_column_shape(const NdArray& array, const std::string& featureName);

template <TensorMapping M>
Result<void> check_feature_exists(const M& inputs, const std::string& featureName) {
    if (inputs.find(featureName) == inputs.end()) {
        return Error{ErrorCode::MissingFeature,
                     featureName + " not set in the predict request."};
    }
    return Result<void>();
}

template <TensorMapping M>
Result<void> check_valid_length(const M& inputs, const std::string& featureName,
                                int64_t nbSamples) {
    auto it = inputs.find(featureName);
    if (it == inputs.end()) {
        return Error{ErrorCode::MissingFeature,
                     featureName + " not set in the predict request."};
    }
    return check_valid_length(it->second, featureName, nbSamples);
}

} // namespace tensorwire::codec
