#include <gtest/gtest.h>

#include "arsenal_registry.h"

#include <future>

using namespace arsenal;

namespace {

    tool make_tool(const std::string& name) {
        return tool_builder(name).with_description("Tool " + name).build();
    }

    tool_handler text_handler(const std::string& text) {
        return [text](const json&) { return tool_result::success(text); };
    }

} // namespace

TEST(ToolRegistryTest, ListPreservesRegistrationOrder) {
    tool_registry registry;
    registry.register_tool(make_tool("zeta"), text_handler("z"));
    registry.register_tool(make_tool("alpha"), text_handler("a"));
    registry.register_tool(make_tool("mid"), text_handler("m"));

    auto tools = registry.list();
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0].name, "zeta");
    EXPECT_EQ(tools[1].name, "alpha");
    EXPECT_EQ(tools[2].name, "mid");
    EXPECT_EQ(registry.size(), 3u);
}

TEST(ToolRegistryTest, DuplicateNameIsRejected) {
    tool_registry registry;
    registry.register_tool(make_tool("echo"), text_handler("first"));

    try {
        registry.register_tool(make_tool("echo"), text_handler("second"));
        FAIL() << "expected duplicate_tool_error";
    } catch (const duplicate_tool_error& e) {
        EXPECT_EQ(e.tool_name(), "echo");
    }

    // The first registration is untouched
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.get("echo").handler(json::object()).text(), "first");
}

TEST(ToolRegistryTest, GetUnknownThrowsToolNotFound) {
    tool_registry registry;
    registry.register_tool(make_tool("echo"), text_handler("x"));

    EXPECT_THROW(registry.get("nonexistent_tool"), tool_not_found_error);
    EXPECT_FALSE(registry.contains("nonexistent_tool"));
    EXPECT_TRUE(registry.contains("echo"));
}

TEST(ToolRegistryTest, GetReturnsHandlerRegisteredForName) {
    tool_registry registry;
    registry.register_tool(make_tool("a"), text_handler("from a"));
    registry.register_tool(make_tool("b"), text_handler("from b"));

    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(registry.get("a").handler(json::object()).text(), "from a");
        EXPECT_EQ(registry.get("b").handler(json::object()).text(), "from b");
    }
    EXPECT_EQ(registry.get("b").descriptor.description, "Tool b");
}

TEST(ToolRegistryTest, AsyncHandlerIsStored) {
    tool_registry registry;
    async_tool_handler handler = [](const json&) {
        std::promise<tool_result> p;
        p.set_value(tool_result::success("later"));
        return p.get_future();
    };
    registry.register_tool(make_tool("slow"), handler);

    const registered_tool& entry = registry.get("slow");
    EXPECT_TRUE(entry.is_async());
    EXPECT_EQ(entry.async_handler(json::object()).get().text(), "later");
}

TEST(ToolRegistryTest, RejectsEmptyNameOrHandler) {
    tool_registry registry;
    EXPECT_THROW(registry.register_tool(make_tool(""), text_handler("x")), std::invalid_argument);
    EXPECT_THROW(registry.register_tool(make_tool("empty"), tool_handler()), std::invalid_argument);
    EXPECT_EQ(registry.size(), 0u);
}
