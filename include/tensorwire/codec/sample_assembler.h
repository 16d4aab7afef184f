#pragma once

#include <tensorwire/codec/codec_options.h>
#include <tensorwire/codec/nd_array.h>
#include <tensorwire/codec/request_validators.h>
#include <tensorwire/codec/tensor_decoder.h>
#include <tensorwire/core/types.h>

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tensorwire::codec {

/**
 * @brief Build the (nb_samples, nb_features) matrix from tensors already looked up
 *
 * @p tensors[i] is the tensor for @p featureNames[i]. Used by assemble() once every
 * feature is known to be present.
 */
Result<SampleMatrix> assemble_columns(std::span<const std::string> featureNames,
                                      std::span<const TensorProto* const> tensors,
                                      std::size_t nbFeatures,
                                      std::optional<ElementType> elementType,
                                      const DecodeOptions& options);

/**
 * @brief Assemble one request's feature tensors into a dense sample matrix
 *
 * Column i holds feature featureNames[i], one row per sample. The sample count is the
 * first dimension of the first feature; every feature must decode to shape
 * (nb_samples, 1). Columns past featureNames.size() are zero. The matrix element type is
 * @p elementType, or Float64 when not given.
 *
 * Errors (no partial matrix is ever returned):
 *  - MissingFeature: a name is absent from @p inputs
 *  - InvalidLength: first dimension differs from the sample count
 *  - InvalidShape: decoded feature is not a column vector
 *  - InvalidArgument: no feature names, or more names than nbFeatures
 *  - any decode() error, prefixed with the feature name
 */
template <TensorMapping M>
Result<SampleMatrix> assemble(const M& inputs, std::span<const std::string> featureNames,
                              std::size_t nbFeatures,
                              std::optional<ElementType> elementType = std::nullopt,
                              const DecodeOptions& options = {}) {
    std::vector<const TensorProto*> tensors;
    tensors.reserve(featureNames.size());
    for (const auto& name : featureNames) {
        if (auto r = check_feature_exists(inputs, name); !r)
            return r.error();
        tensors.push_back(&inputs.find(name)->second);
    }
    return assemble_columns(featureNames, tensors, nbFeatures, elementType, options);
}

template <TensorMapping M>
Result<SampleMatrix> assemble(const M& inputs, std::span<const std::string> featureNames,
                              std::size_t nbFeatures, const CodecOptions& codecOptions) {
    return assemble(inputs, featureNames, nbFeatures, codecOptions.sampleType,
                    codecOptions.decodeOptions());
}

} // namespace tensorwire::codec
