#include <gtest/gtest.h>

#include <tensorwire/codec/tensor_encoder.h>

#include <cstring>
#include <string>
#include <vector>

using namespace tensorwire;
using namespace tensorwire::codec;
namespace pb = tensorwire::proto;

namespace {

Shape dims(const TensorProto& tensor) {
    Shape shape;
    for (const auto& d : tensor.tensor_shape().dim())
        shape.push_back(d.size());
    return shape;
}

template <typename T> std::string rawBytes(const std::vector<T>& values) {
    std::string out(values.size() * sizeof(T), '\0');
    std::memcpy(out.data(), values.data(), out.size());
    return out;
}

} // namespace

TEST(TensorEncoderTest, Float64IsAlwaysNarrowedToFloat32) {
    auto enc = encode(ValueTree{1.0, 2.0, 3.0});
    ASSERT_TRUE(enc) << enc.error().message;
    const auto& tensor = enc.value();
    EXPECT_EQ(tensor.dtype(), pb::DT_FLOAT);
    EXPECT_EQ(dims(tensor), (Shape{3}));
    EXPECT_EQ(tensor.tensor_content(), rawBytes(std::vector<float>{1.0f, 2.0f, 3.0f}));
    EXPECT_EQ(tensor.float_val_size(), 0);
}

TEST(TensorEncoderTest, Int64NarrowedWhenLossless) {
    auto enc = encode(ValueTree{{1, 2}, {3, 4}});
    ASSERT_TRUE(enc) << enc.error().message;
    EXPECT_EQ(enc.value().dtype(), pb::DT_INT32);
    EXPECT_EQ(dims(enc.value()), (Shape{2, 2}));
    EXPECT_EQ(enc.value().tensor_content(), rawBytes(std::vector<int32_t>{1, 2, 3, 4}));
}

TEST(TensorEncoderTest, Int64KeptWhenNarrowingWouldLoseValues) {
    auto enc = encode(ValueTree{int64_t{1} << 40, 2});
    ASSERT_TRUE(enc) << enc.error().message;
    EXPECT_EQ(enc.value().dtype(), pb::DT_INT64);
    EXPECT_EQ(enc.value().tensor_content(),
              rawBytes(std::vector<int64_t>{int64_t{1} << 40, 2}));
}

TEST(TensorEncoderTest, Int32BoundaryStillNarrows) {
    auto array = NdArray::vector<int64_t>({-2147483648LL, 2147483647LL});
    auto enc = encode(array);
    ASSERT_TRUE(enc);
    EXPECT_EQ(enc.value().dtype(), pb::DT_INT32);

    auto over = NdArray::vector<int64_t>({2147483648LL});
    auto encOver = encode(over);
    ASSERT_TRUE(encOver);
    EXPECT_EQ(encOver.value().dtype(), pb::DT_INT64);
}

TEST(TensorEncoderTest, OtherWidthsAreNotTouched) {
    auto enc = encode(NdArray::vector<uint64_t>({1, 2}));
    ASSERT_TRUE(enc);
    EXPECT_EQ(enc.value().dtype(), pb::DT_UINT64);
    EXPECT_EQ(enc.value().tensor_content().size(), 16u);

    auto f16 = encode(NdArray::vector<Float16>({Float16(1.0f)}));
    ASSERT_TRUE(f16);
    EXPECT_EQ(f16.value().dtype(), pb::DT_HALF);
    EXPECT_EQ(f16.value().tensor_content(), std::string("\x00\x3C", 2));
}

TEST(TensorEncoderTest, BoolsAreOneBytePerElement) {
    auto enc = encode(ValueTree{true, false, true});
    ASSERT_TRUE(enc);
    EXPECT_EQ(enc.value().dtype(), pb::DT_BOOL);
    EXPECT_EQ(enc.value().tensor_content(), std::string("\x01\x00\x01", 3));
}

TEST(TensorEncoderTest, ScalarHasEmptyShape) {
    auto enc = encode(ValueTree(7));
    ASSERT_TRUE(enc);
    EXPECT_EQ(enc.value().dtype(), pb::DT_INT32);
    EXPECT_EQ(enc.value().tensor_shape().dim_size(), 0);
    EXPECT_EQ(enc.value().tensor_content(), rawBytes(std::vector<int32_t>{7}));
}

TEST(TensorEncoderTest, EmptySequenceEncodesAsEmptyFloatVector) {
    auto enc = encode(ValueTree::list({}));
    ASSERT_TRUE(enc);
    EXPECT_EQ(enc.value().dtype(), pb::DT_FLOAT);
    EXPECT_EQ(dims(enc.value()), (Shape{0}));
    EXPECT_TRUE(enc.value().tensor_content().empty());
}

TEST(TensorEncoderTest, ByteStringsGoToStringVal) {
    auto enc = encode(ValueTree{{"x"}, {"y"}});
    ASSERT_TRUE(enc) << enc.error().message;
    const auto& tensor = enc.value();
    EXPECT_EQ(tensor.dtype(), pb::DT_STRING);
    EXPECT_EQ(dims(tensor), (Shape{2, 1}));
    ASSERT_EQ(tensor.string_val_size(), 2);
    EXPECT_EQ(tensor.string_val(0), "x");
    EXPECT_EQ(tensor.string_val(1), "y");
    EXPECT_TRUE(tensor.tensor_content().empty());
}

TEST(TensorEncoderTest, FixedBytesAreByteStrings) {
    auto array = NdArray::fromStrings({"ab", "cd"}, {2}, ElementType::FixedBytes);
    ASSERT_TRUE(array);
    auto enc = encode(array.value());
    ASSERT_TRUE(enc);
    EXPECT_EQ(enc.value().dtype(), pb::DT_STRING);
    EXPECT_EQ(enc.value().string_val_size(), 2);
}

TEST(TensorEncoderTest, NumbersTargetedAtByteStringsFail) {
    auto enc = encode(ValueTree{{1}, {2}}, ElementType::Bytes);
    ASSERT_FALSE(enc);
    EXPECT_EQ(enc.error().code, ErrorCode::InvalidStringElement);
}

TEST(TensorEncoderTest, UnicodeTextIsNotAByteString) {
    auto array = NdArray::fromStrings({"caf\xC3\xA9"}, {1}, ElementType::Unicode);
    ASSERT_TRUE(array);
    auto enc = encode(array.value());
    ASSERT_FALSE(enc);
    EXPECT_EQ(enc.error().code, ErrorCode::InvalidStringElement);
}

TEST(TensorEncoderTest, MixedStringAndNumberLeavesFail) {
    auto enc = encode(ValueTree{"x", 1});
    ASSERT_FALSE(enc);
    EXPECT_EQ(enc.error().code, ErrorCode::InvalidStringElement);
}

TEST(TensorEncoderTest, StringsTargetedAtNumericTypeFail) {
    auto enc = encode(ValueTree{"1", "2"}, ElementType::Int32);
    ASSERT_FALSE(enc);
    EXPECT_EQ(enc.error().code, ErrorCode::UnsupportedEncoding);
}

TEST(TensorEncoderTest, RaggedNestingFails) {
    auto enc = encode(ValueTree{{1, 2}, {3}});
    ASSERT_FALSE(enc);
    EXPECT_EQ(enc.error().code, ErrorCode::InvalidShape);

    auto mixedDepth = encode(ValueTree{{1, 2}, 3});
    ASSERT_FALSE(mixedDepth);
    EXPECT_EQ(mixedDepth.error().code, ErrorCode::InvalidShape);
}

TEST(TensorEncoderTest, ExplicitTargetConvertsLeaves) {
    auto enc = encode(ValueTree{1, 2, 3}, ElementType::UInt8);
    ASSERT_TRUE(enc);
    EXPECT_EQ(enc.value().dtype(), pb::DT_UINT8);
    EXPECT_EQ(enc.value().tensor_content(), std::string("\x01\x02\x03", 3));
}

TEST(TensorEncoderTest, MixedIntAndDoublePromotesToFloat) {
    auto enc = encode(ValueTree{1, 2.5});
    ASSERT_TRUE(enc);
    EXPECT_EQ(enc.value().dtype(), pb::DT_FLOAT);
    EXPECT_EQ(enc.value().tensor_content(), rawBytes(std::vector<float>{1.0f, 2.5f}));
}

TEST(TensorEncoderTest, EncodeIntoLeavesMessageUntouchedOnFailure) {
    TensorProto out;
    out.set_dtype(pb::DT_DOUBLE);
    out.add_double_val(4.0);

    auto unicode = NdArray::fromStrings({"x"}, {1}, ElementType::Unicode);
    ASSERT_TRUE(unicode);
    auto r = encode_into(unicode.value(), out);
    ASSERT_FALSE(r);
    EXPECT_EQ(out.dtype(), pb::DT_DOUBLE);
    EXPECT_EQ(out.double_val_size(), 1);
}

TEST(TensorEncoderTest, EncodeIntoReplacesPreviousContent) {
    TensorProto out;
    out.add_float_val(9.0f);
    ASSERT_TRUE(encode_into(NdArray::vector<int32_t>({5}), out));
    EXPECT_EQ(out.dtype(), pb::DT_INT32);
    EXPECT_EQ(out.float_val_size(), 0);
    EXPECT_EQ(out.tensor_content(), rawBytes(std::vector<int32_t>{5}));
}

TEST(TensorEncoderTest, IntegerTargetSaturatesOutOfRangeFloats) {
    auto enc = encode(ValueTree{1e30, -1e30, -2.5}, ElementType::Int16);
    ASSERT_TRUE(enc) << enc.error().message;
    EXPECT_EQ(enc.value().dtype(), pb::DT_INT16);
    EXPECT_EQ(enc.value().tensor_content(),
              rawBytes(std::vector<int16_t>{32767, -32768, -2}));
}
