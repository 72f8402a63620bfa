#include <gtest/gtest.h>

#include "arsenal_tool.h"

using namespace arsenal;

TEST(ToolBuilderTest, BuildsObjectSchema) {
    tool t = tool_builder("run_kali_security_scan")
        .with_description("Run a scan")
        .with_string_param("target", "Target for security scanning")
        .with_string_param("scan_type", "Type of scan", false)
        .build();

    EXPECT_EQ(t.name, "run_kali_security_scan");
    EXPECT_EQ(t.description, "Run a scan");
    EXPECT_EQ(t.input_schema["type"], "object");
    EXPECT_EQ(t.input_schema["properties"]["target"]["type"], "string");
    EXPECT_EQ(t.input_schema["properties"]["target"]["description"], "Target for security scanning");
    ASSERT_EQ(t.input_schema["required"].size(), 1u);
    EXPECT_EQ(t.input_schema["required"][0], "target");
}

TEST(ToolBuilderTest, EmptySchemaKeepsRequiredList) {
    tool t = tool_builder("get_bleeding_edge_status").build();

    EXPECT_TRUE(t.input_schema["properties"].is_object());
    EXPECT_TRUE(t.input_schema["properties"].empty());
    ASSERT_TRUE(t.input_schema.contains("required"));
    EXPECT_TRUE(t.input_schema["required"].is_array());
    EXPECT_TRUE(t.input_schema["required"].empty());
}

TEST(ToolBuilderTest, ToJsonUsesWireNames) {
    json j = tool_builder("echo").with_description("Echo").build().to_json();
    EXPECT_EQ(j["name"], "echo");
    EXPECT_EQ(j["description"], "Echo");
    EXPECT_TRUE(j.contains("inputSchema"));
}

TEST(ToolBuilderTest, ArrayParamDescribesItems) {
    tool t = tool_builder("batch")
        .with_array_param("targets", "Targets", "string")
        .with_number_param("limit", "Limit", false)
        .with_boolean_param("verbose", "Verbose", false)
        .build();

    EXPECT_EQ(t.input_schema["properties"]["targets"]["items"]["type"], "string");
    EXPECT_EQ(t.input_schema["properties"]["limit"]["type"], "number");
    EXPECT_EQ(t.input_schema["properties"]["verbose"]["type"], "boolean");
}

TEST(ToolBuilderTest, CreateToolFromDefinitions) {
    tool t = create_tool("report", "Generate a report", {
        {"report_type", "Type of report", "string", false},
        {"pages", "Page count", "number", true}
    });

    EXPECT_EQ(t.input_schema["properties"].size(), 2u);
    EXPECT_EQ(t.input_schema["required"], json::array({"pages"}));

    EXPECT_THROW(create_tool("bad", "Bad", {{"x", "x", "object", true}}), std::invalid_argument);
}

TEST(ToolResultTest, SuccessAndFailure) {
    tool_result ok = tool_result::success("done");
    EXPECT_TRUE(ok.ok());
    EXPECT_EQ(ok.text(), "done");

    tool_result failed = tool_result::failure("boom");
    EXPECT_FALSE(failed.ok());
    EXPECT_EQ(failed.text(), "boom");
}
