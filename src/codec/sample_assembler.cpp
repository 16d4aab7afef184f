#include <tensorwire/codec/sample_assembler.h>

#include <spdlog/spdlog.h>

namespace tensorwire::codec {

namespace {

Error withFeature(const std::string& featureName, const Error& error) {
    return Error{error.code, featureName + ": " + error.message};
}

// Write a (nbSamples, 1) column into column @p index of a row-major matrix
void writeColumn(const NdArray& column, std::size_t index, SampleMatrix& matrix) {
    const auto nbFeatures = static_cast<std::size_t>(matrix.shape()[1]);
    const auto nbSamples = column.size();
    visitElementType(matrix.elementType(), [&]<typename T>(std::type_identity<T>) {
        if constexpr (NumericElement<T>) {
            const auto src = column.values<T>();
            auto dst = matrix.mutableValues<T>();
            for (std::size_t row = 0; row < nbSamples; ++row)
                dst[row * nbFeatures + index] = src[row];
        } else {
            const auto& src = column.strings();
            auto& dst = matrix.mutableStrings();
            for (std::size_t row = 0; row < nbSamples; ++row)
                dst[row * nbFeatures + index] = src[row];
        }
    });
}

} // namespace

Result<SampleMatrix> assemble_columns(std::span<const std::string> featureNames,
                                      std::span<const TensorProto* const> tensors,
                                      std::size_t nbFeatures,
                                      std::optional<ElementType> elementType,
                                      const DecodeOptions& options) {
    if (featureNames.empty()) {
        return Error{ErrorCode::InvalidArgument, "no feature names requested"};
    }
    if (featureNames.size() != tensors.size()) {
        return Error{ErrorCode::InvalidArgument,
                     std::to_string(featureNames.size()) + " feature names but " +
                         std::to_string(tensors.size()) + " tensors"};
    }
    if (featureNames.size() > nbFeatures) {
        return Error{ErrorCode::InvalidArgument,
                     std::to_string(featureNames.size()) + " features requested but matrix has " +
                         std::to_string(nbFeatures) + " columns"};
    }

    const auto& firstName = featureNames.front();
    const auto nbSamples = firstDimension(*tensors.front());
    if (!nbSamples || *nbSamples < 0) {
        return Error{ErrorCode::InvalidShape, firstName + " has no sample dimension"};
    }

    const ElementType matrixType = elementType.value_or(kDefaultSampleType);
    auto allocated =
        NdArray::zeros(matrixType, Shape{*nbSamples, static_cast<int64_t>(nbFeatures)});
    if (!allocated)
        return allocated.error();
    SampleMatrix matrix = std::move(allocated).value();

    for (std::size_t i = 0; i < featureNames.size(); ++i) {
        const auto& name = featureNames[i];
        const auto& tensor = *tensors[i];

        if (auto r = check_valid_length(tensor, name, *nbSamples); !r)
            return r.error();

        auto decoded = decode(tensor, options);
        if (!decoded)
            return withFeature(name, decoded.error());

        if (auto r = check_column_shape(decoded.value(), name); !r)
            return r.error();

        auto column = decoded.value().astype(matrixType);
        if (!column)
            return withFeature(name, column.error());

        writeColumn(column.value(), i, matrix);
    }

    spdlog::debug("assemble: {} samples x {} features as {}", *nbSamples, nbFeatures,
                  elementTypeName(matrixType));
    return matrix;
}

} // namespace tensorwire::codec
