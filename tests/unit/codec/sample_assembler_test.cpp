#include <gtest/gtest.h>

#include <tensorwire/codec/sample_assembler.h>
#include <tensorwire/codec/tensor_encoder.h>

#include <google/protobuf/map.h>
#include <limits>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

using namespace tensorwire;
using namespace tensorwire::codec;
namespace pb = tensorwire::proto;

class SampleAssemblerTest : public ::testing::Test {
protected:
    // Column vector of shape (values.size(), 1) encoded through the regular encoder
    static TensorProto column(const std::vector<double>& values) {
        std::vector<ValueTree> rows;
        rows.reserve(values.size());
        for (double v : values)
            rows.push_back(ValueTree::list({ValueTree(v)}));
        auto enc = encode(ValueTree::list(std::move(rows)));
        EXPECT_TRUE(enc) << enc.error().message;
        return std::move(enc).value();
    }

    static TensorProto matrix(int64_t rows, int64_t cols) {
        auto array = NdArray::zeros(ElementType::Float32, {rows, cols});
        return encode(array.value()).value();
    }

    std::map<std::string, TensorProto> inputs_{
        {"a", column({1, 2, 3, 4, 5})},
        {"b", column({0.5, 1.5, 2.5, 3.5, 4.5})},
    };
    std::vector<std::string> names_{"a", "b"};
};

TEST_F(SampleAssemblerTest, ColumnsFollowFeatureNameOrder) {
    auto result = assemble(inputs_, names_, 2);
    ASSERT_TRUE(result) << result.error().message;
    const auto& samples = result.value();
    EXPECT_EQ(samples.elementType(), ElementType::Float64);
    EXPECT_EQ(samples.shape(), (Shape{5, 2}));

    const auto values = samples.values<double>();
    const std::vector<double> expected{1, 0.5, 2, 1.5, 3, 2.5, 4, 3.5, 5, 4.5};
    EXPECT_EQ(std::vector<double>(values.begin(), values.end()), expected);

    std::vector<std::string> reversed{"b", "a"};
    auto swapped = assemble(inputs_, reversed, 2);
    ASSERT_TRUE(swapped);
    EXPECT_EQ(swapped.value().values<double>()[0], 0.5);
    EXPECT_EQ(swapped.value().values<double>()[1], 1.0);
}

TEST_F(SampleAssemblerTest, MissingFeatureIsReported) {
    inputs_.erase("b");
    auto result = assemble(inputs_, names_, 2);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::MissingFeature);
    EXPECT_EQ(result.error().message, "b not set in the predict request.");
}

TEST_F(SampleAssemblerTest, SampleCountMismatchIsInvalidLength) {
    inputs_["b"] = column({1, 2, 3, 4});
    auto result = assemble(inputs_, names_, 2);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidLength);
    EXPECT_EQ(result.error().message, "b has invalid length.");
}

TEST_F(SampleAssemblerTest, NonColumnFeatureIsInvalidShape) {
    inputs_["a"] = matrix(5, 2);
    auto result = assemble(inputs_, names_, 2);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidShape);
    EXPECT_NE(result.error().message.find("a"), std::string::npos);
}

TEST_F(SampleAssemblerTest, RankOneFeatureIsInvalidShape) {
    inputs_["b"] = encode(ValueTree{1, 2, 3, 4, 5}).value();
    auto result = assemble(inputs_, names_, 2);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidShape);
}

TEST_F(SampleAssemblerTest, ScalarFirstFeatureHasNoSampleDimension) {
    inputs_["a"] = encode(ValueTree(1.0)).value();
    auto result = assemble(inputs_, names_, 2);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidShape);
}

TEST_F(SampleAssemblerTest, ExplicitElementType) {
    auto result = assemble(inputs_, names_, 2, ElementType::Float32);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().elementType(), ElementType::Float32);
    EXPECT_EQ(result.value().values<float>()[3], 1.5f);

    auto ints = assemble(inputs_, names_, 2, ElementType::Int32);
    ASSERT_TRUE(ints);
    EXPECT_EQ(ints.value().values<int32_t>()[1], 0);
    EXPECT_EQ(ints.value().values<int32_t>()[9], 4);
}

TEST_F(SampleAssemblerTest, ExtraColumnsAreZero) {
    auto result = assemble(inputs_, names_, 3);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().shape(), (Shape{5, 3}));
    const auto values = result.value().values<double>();
    for (std::size_t row = 0; row < 5; ++row)
        EXPECT_EQ(values[row * 3 + 2], 0.0);
}

TEST_F(SampleAssemblerTest, InvalidFeatureCounts) {
    auto tooMany = assemble(inputs_, names_, 1);
    ASSERT_FALSE(tooMany);
    EXPECT_EQ(tooMany.error().code, ErrorCode::InvalidArgument);

    std::vector<std::string> none;
    auto empty = assemble(inputs_, none, 2);
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, ErrorCode::InvalidArgument);
}

TEST_F(SampleAssemblerTest, ShortValueListIsPaddedByDefault) {
    TensorProto truncated;
    truncated.set_dtype(pb::DT_FLOAT);
    truncated.mutable_tensor_shape()->add_dim()->set_size(5);
    truncated.mutable_tensor_shape()->add_dim()->set_size(1);
    truncated.add_float_val(7.0f);
    truncated.add_float_val(8.0f);
    inputs_["b"] = truncated;

    auto result = assemble(inputs_, names_, 2);
    ASSERT_TRUE(result) << result.error().message;
    const auto values = result.value().values<double>();
    EXPECT_EQ(values[1], 7.0);
    EXPECT_EQ(values[3], 8.0);
    EXPECT_EQ(values[9], 8.0);

    CodecOptions strict;
    strict.padding = PaddingPolicy::Reject;
    auto rejected = assemble(inputs_, names_, 2, strict);
    ASSERT_FALSE(rejected);
    EXPECT_EQ(rejected.error().code, ErrorCode::InvalidLength);
    EXPECT_EQ(rejected.error().message.rfind("b: ", 0), 0u);
}

TEST_F(SampleAssemblerTest, StringFeaturesNeedStringMatrix) {
    inputs_["a"] = encode(ValueTree{{"w"}, {"x"}, {"y"}, {"z"}, {"q"}}).value();
    auto numeric = assemble(inputs_, names_, 2);
    ASSERT_FALSE(numeric);
    EXPECT_EQ(numeric.error().code, ErrorCode::UnsupportedEncoding);

    std::vector<std::string> onlyA{"a"};
    auto strings = assemble(inputs_, onlyA, 1, ElementType::Bytes);
    ASSERT_TRUE(strings) << strings.error().message;
    EXPECT_EQ(strings.value().strings(),
              (std::vector<std::string>{"w", "x", "y", "z", "q"}));
}

TEST_F(SampleAssemblerTest, AcceptsProtobufAndUnorderedMaps) {
    google::protobuf::Map<std::string, TensorProto> protoInputs;
    std::unordered_map<std::string, TensorProto> hashInputs;
    for (const auto& [name, tensor] : inputs_) {
        protoInputs[name] = tensor;
        hashInputs[name] = tensor;
    }

    auto fromProto = assemble(protoInputs, names_, 2);
    auto fromHash = assemble(hashInputs, names_, 2);
    auto fromMap = assemble(inputs_, names_, 2);
    ASSERT_TRUE(fromProto);
    ASSERT_TRUE(fromHash);
    ASSERT_TRUE(fromMap);
    EXPECT_EQ(fromProto.value(), fromMap.value());
    EXPECT_EQ(fromHash.value(), fromMap.value());
}

TEST(RequestValidatorsTest, ChecksAreUsableOnTheirOwn) {
    std::map<std::string, TensorProto> inputs;
    inputs["x"] = encode(ValueTree{{1}, {2}}).value();

    EXPECT_TRUE(check_feature_exists(inputs, "x"));
    EXPECT_EQ(check_feature_exists(inputs, "y").error().code, ErrorCode::MissingFeature);
    EXPECT_TRUE(check_valid_length(inputs, "x", 2));
    EXPECT_EQ(check_valid_length(inputs, "x", 3).error().code, ErrorCode::InvalidLength);

    auto column = NdArray::zeros(ElementType::Float32, {2, 1});
    auto wide = NdArray::zeros(ElementType::Float32, {2, 2});
    EXPECT_TRUE(check_column_shape(column.value(), "x"));
    EXPECT_EQ(check_column_shape(wide.value(), "x").error().code, ErrorCode::InvalidShape);
}

TEST_F(SampleAssemblerTest, SampleCountTooLargeToAllocateIsInvalidShape) {
    TensorProto huge;
    huge.set_dtype(pb::DT_DOUBLE);
    huge.mutable_tensor_shape()->add_dim()->set_size((int64_t{1} << 61) + 1);
    huge.mutable_tensor_shape()->add_dim()->set_size(1);
    huge.set_tensor_content(std::string(8, '\0'));
    inputs_["a"] = huge;

    std::vector<std::string> onlyA{"a"};
    auto result = assemble(inputs_, onlyA, 1);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidShape);
}

TEST_F(SampleAssemblerTest, FloatFeaturesSaturateInIntegerMatrix) {
    TensorProto extreme;
    extreme.set_dtype(pb::DT_FLOAT);
    extreme.mutable_tensor_shape()->add_dim()->set_size(5);
    extreme.mutable_tensor_shape()->add_dim()->set_size(1);
    for (float v : {1e30f, -1e30f, std::numeric_limits<float>::quiet_NaN(), 2.5f, 3.0f})
        extreme.add_float_val(v);
    inputs_["b"] = extreme;

    auto result = assemble(inputs_, names_, 2, ElementType::Int32);
    ASSERT_TRUE(result) << result.error().message;
    const auto values = result.value().values<int32_t>();
    EXPECT_EQ(values[1], std::numeric_limits<int32_t>::max());
    EXPECT_EQ(values[3], std::numeric_limits<int32_t>::min());
    EXPECT_EQ(values[5], 0);
    EXPECT_EQ(values[7], 2);
    EXPECT_EQ(values[9], 3);
}
