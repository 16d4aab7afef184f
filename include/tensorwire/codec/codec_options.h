#pragma once

#include <tensorwire/codec/element_type.h>
#include <tensorwire/codec/tensor_decoder.h>

namespace tensorwire::codec {

inline constexpr ElementType kDefaultSampleType = ElementType::Float64;

// Process-level codec settings, usually resolved by config::resolve_codec_options_from_config()
struct CodecOptions {
    PaddingPolicy padding = PaddingPolicy::EdgeReplicate;
    ElementType sampleType = kDefaultSampleType;

    [[nodiscard]] DecodeOptions decodeOptions() const { return DecodeOptions{padding}; }
};

} // namespace tensorwire::codec
