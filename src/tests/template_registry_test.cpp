#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "templates/template_registry.hpp"
#include "test_utils.hpp"

using namespace fileclient::templates;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Return;

class MockRenderer : public TemplateRenderer {
public:
    MOCK_METHOD(RenderResult, render, (const std::filesystem::path& source, const TemplateParams& params), (override));
};

class TemplateRegistryTest : public ::testing::Test {
protected:
    TemplateRegistry registry;

    void SetUp() override {
        init_logging();
    }
};

TEST_F(TemplateRegistryTest, UnknownEngineIsSoftFailure) {
    const auto result = registry.render("jinja", "/srv/salt/motd", {});
    EXPECT_FALSE(result.result);
    EXPECT_EQ(result.data, "Unknown template engine: jinja");
}

TEST_F(TemplateRegistryTest, DispatchesToNamedEngine) {
    auto jinja = std::make_unique<MockRenderer>();
    auto mako = std::make_unique<MockRenderer>();
    const TemplateParams params{{"env", "base"}};

    EXPECT_CALL(*jinja, render(std::filesystem::path("/tmp/motd"), params))
        .WillOnce(Return(RenderResult{true, "/tmp/motd.out"}));
    EXPECT_CALL(*mako, render(_, _)).Times(0);

    registry.register_renderer("jinja", std::move(jinja));
    registry.register_renderer("mako", std::move(mako));

    EXPECT_THAT(registry.names(), ElementsAre("jinja", "mako"));
    EXPECT_TRUE(registry.contains("mako"));
    EXPECT_FALSE(registry.contains("cheetah"));

    const auto result = registry.render("jinja", "/tmp/motd", params);
    EXPECT_TRUE(result.result);
    EXPECT_EQ(result.data, "/tmp/motd.out");
}

TEST_F(TemplateRegistryTest, RegisteringAgainReplaces) {
    auto first = std::make_unique<MockRenderer>();
    auto second = std::make_unique<MockRenderer>();
    EXPECT_CALL(*second, render(_, _)).WillOnce(Return(RenderResult{false, "syntax error"}));

    registry.register_renderer("jinja", std::move(first));
    registry.register_renderer("jinja", std::move(second));

    const auto result = registry.render("jinja", "/tmp/motd", {});
    EXPECT_FALSE(result.result);
    EXPECT_EQ(result.data, "syntax error");
}
