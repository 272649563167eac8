#include <gtest/gtest.h>
#include "shikaku/inference/schema_adapter.hpp"
#include "shikaku/utils/errors.hpp"

using namespace shikaku;

namespace {

const std::string kTopology =
    "<net name=\"classifier\" version=\"11\">"
    "<layers>"
    "<layer id=\"0\" name=\"input\" type=\"Parameter\" version=\"opset1\">"
    "<data shape=\"1,224,224,3\" element_type=\"f32\"/>"
    "<output><port id=\"0\" precision=\"FP32\"><dim>1</dim><dim>3</dim></port></output>"
    "</layer>"
    "<layer id=\"1\" name=\"dense\" type=\"MatMul\" version=\"opset1\">"
    "<data transpose_a=\"false\" quantization_config=\"{&quot;mode&quot;: null}\" transpose_b=\"false\"/>"
    "</layer>"
    "</layers>"
    "<!-- exported -->"
    "<rt_info><framework><data value=\"keep &amp; me\"/></framework></rt_info>"
    "</net>";

} // namespace

TEST(SchemaAdapterTest, DropsQuantizationConfig) {
    AdaptResult result = SchemaAdapter::default_adapter().adapt(kTopology);
    EXPECT_EQ(result.dropped, 1u);
    EXPECT_EQ(result.renamed, 0u);
    EXPECT_EQ(result.xml.find("quantization_config"), std::string::npos);
    EXPECT_NE(result.xml.find("<data transpose_a=\"false\" transpose_b=\"false\"/>"),
              std::string::npos);
}

TEST(SchemaAdapterTest, LeavesRecognizedContentUnchanged) {
    AdaptResult result = SchemaAdapter::default_adapter().adapt(kTopology);

    std::string expected = kTopology;
    const std::string removed = " quantization_config=\"{&quot;mode&quot;: null}\"";
    expected.erase(expected.find(removed), removed.size());
    EXPECT_EQ(result.xml, expected);
}

TEST(SchemaAdapterTest, NoMatchingRulesIsIdentity) {
    const std::string xml =
        "<net><layers><layer id=\"3\" type=\"Softmax\">\n"
        "  <data axis=\"1\"/>\n"
        "</layer></layers></net>";
    AdaptResult result = SchemaAdapter::default_adapter().adapt(xml);
    EXPECT_EQ(result.xml, xml);
    EXPECT_EQ(result.dropped, 0u);
}

TEST(SchemaAdapterTest, OutputIsDeterministic) {
    SchemaAdapter adapter = SchemaAdapter::default_adapter({"dtype_policy"});
    EXPECT_EQ(adapter.adapt(kTopology).xml, adapter.adapt(kTopology).xml);
}

TEST(SchemaAdapterTest, ExtraIgnoredAttributesFromConfig) {
    const std::string xml =
        "<net><layers><layer id=\"0\" type=\"Convolution\">"
        "<data strides=\"1,1\" dtype_policy=\"mixed_float16\"/>"
        "</layer></layers></net>";
    AdaptResult result = SchemaAdapter::default_adapter({"dtype_policy"}).adapt(xml);
    EXPECT_EQ(result.dropped, 1u);
    EXPECT_EQ(result.xml,
              "<net><layers><layer id=\"0\" type=\"Convolution\">"
              "<data strides=\"1,1\"/>"
              "</layer></layers></net>");
}

TEST(SchemaAdapterTest, RulesOnlyTouchLayerData) {
    // quantization_config outside <layer><data> is not a layer attribute
    const std::string xml =
        "<net quantization_config=\"x\"><rt_info><data quantization_config=\"y\"/></rt_info></net>";
    AdaptResult result = SchemaAdapter::default_adapter().adapt(xml);
    EXPECT_EQ(result.dropped, 0u);
    EXPECT_EQ(result.xml, xml);
}

TEST(SchemaAdapterTest, TypeSpecificRename) {
    SchemaAdapter adapter("2", {
        {"Interpolate", "antialias_mode", AttributeAction::Rename, "antialias"},
    });
    const std::string xml =
        "<net><layers>"
        "<layer id=\"0\" type=\"Interpolate\"><data antialias_mode=\"true\" mode=\"linear\"/></layer>"
        "<layer id=\"1\" type=\"MatMul\"><data antialias_mode=\"true\"/></layer>"
        "</layers></net>";

    AdaptResult result = adapter.adapt(xml);
    EXPECT_EQ(result.renamed, 1u);
    EXPECT_NE(result.xml.find("type=\"Interpolate\"><data antialias=\"true\" mode=\"linear\"/>"),
              std::string::npos);
    EXPECT_NE(result.xml.find("type=\"MatMul\"><data antialias_mode=\"true\"/>"),
              std::string::npos);
}

TEST(SchemaAdapterTest, RenameNeverOverridesExistingAttribute) {
    SchemaAdapter adapter("2", {{"*", "axis_v2", AttributeAction::Rename, "axis"}});
    AdaptResult result = adapter.adapt(
        "<net><layers><layer type=\"Softmax\"><data axis_v2=\"0\" axis=\"1\"/></layer></layers></net>");
    EXPECT_EQ(result.renamed, 0u);
    EXPECT_EQ(result.dropped, 1u);
    EXPECT_NE(result.xml.find("<data axis=\"1\"/>"), std::string::npos);
}

TEST(SchemaAdapterTest, ExactTypeRuleWinsOverWildcard) {
    SchemaAdapter adapter("2", {
        {"*", "mode", AttributeAction::Drop, ""},
        {"Interpolate", "mode", AttributeAction::Rename, "interpolation_mode"},
    });
    const AttributeRule* rule = adapter.find_rule("Interpolate", "mode");
    ASSERT_NE(rule, nullptr);
    EXPECT_EQ(rule->action, AttributeAction::Rename);
    rule = adapter.find_rule("MatMul", "mode");
    ASSERT_NE(rule, nullptr);
    EXPECT_EQ(rule->action, AttributeAction::Drop);
    EXPECT_EQ(adapter.find_rule("MatMul", "axis"), nullptr);
}

TEST(SchemaAdapterTest, DefaultVersionIsDeclared) {
    SchemaAdapter adapter = SchemaAdapter::default_adapter();
    EXPECT_EQ(adapter.version(), SchemaAdapter::kDefaultVersion);
    ASSERT_FALSE(adapter.rules().empty());
    EXPECT_EQ(adapter.rules().front().attribute, "quantization_config");
}

TEST(SchemaAdapterTest, MalformedTopologyThrowsModelLoadError) {
    SchemaAdapter adapter = SchemaAdapter::default_adapter();
    EXPECT_THROW(adapter.adapt("<net><layers></net>"), ModelLoadError);
    EXPECT_THROW(adapter.adapt(""), ModelLoadError);
}

TEST(SchemaAdapterTest, InvalidRulesAreRejected) {
    EXPECT_THROW(SchemaAdapter("2", {{"*", "", AttributeAction::Drop, ""}}), std::invalid_argument);
    EXPECT_THROW(SchemaAdapter("2", {{"*", "axis", AttributeAction::Rename, ""}}),
                 std::invalid_argument);
}
