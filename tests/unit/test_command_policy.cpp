#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/gate_config.hpp"
#include "policy/command_policy.hpp"

namespace {

using cmdgate::core::config::CommandSet;
using cmdgate::core::config::GateConfig;
using cmdgate::policy::CommandPolicy;

TEST(CommandPolicyTest, DefaultsAllowKnownCommands) {
    CommandPolicy policy;
    EXPECT_TRUE(policy.is_allowed("service"));
    EXPECT_TRUE(policy.is_allowed("log-tail"));
    EXPECT_TRUE(policy.is_allowed("stats"));
    EXPECT_FALSE(policy.is_allowed("malicious"));
    EXPECT_FALSE(policy.is_allowed(""));
    EXPECT_FALSE(policy.is_allowed("Service"));
    EXPECT_EQ(policy.allow_set().size(), 43u);
}

TEST(CommandPolicyTest, DefaultsDenyRealtimeAndCustomVcl) {
    CommandPolicy policy;
    EXPECT_TRUE(policy.is_denied("stats", {"realtime"}));
    EXPECT_FALSE(policy.is_denied("stats", {"historical"}));
    EXPECT_TRUE(policy.is_denied("log-tail", {}));
    EXPECT_TRUE(policy.is_denied("vcl", {"snippet", "update", "--version", "2"}));
    EXPECT_FALSE(policy.is_denied("vcl", {"snippet", "list"}));
}

TEST(CommandPolicyTest, AllowedAndDeniedAreIndependent) {
    // log-tail is on both lists; the caller combines the predicates.
    CommandPolicy policy;
    EXPECT_TRUE(policy.is_allowed("log-tail"));
    EXPECT_TRUE(policy.is_denied("log-tail", {}));
}

TEST(CommandPolicyTest, DeniedPathAgreesWithIsDenied) {
    CommandPolicy policy;
    const std::vector<std::vector<std::string>> cases = {
        {"stats", "realtime"}, {"stats", "historical"}, {"vcl", "custom", "describe"},
        {"vcl", "list"}, {"log-tail"}, {"service"}};
    for (const auto& tokens : cases) {
        const std::string command = tokens.front();
        const std::vector<std::string> args(tokens.begin() + 1, tokens.end());
        EXPECT_EQ(policy.denied_path(command, args).has_value(), policy.is_denied(command, args))
            << command;
    }
    EXPECT_EQ(policy.denied_path("vcl", {"custom", "describe"}).value(), "vcl custom describe");
}

TEST(CommandPolicyTest, CustomSetsReplaceDefaults) {
    GateConfig config;
    config.custom_allow_set = CommandSet{"deploy"};
    config.custom_deny_set = CommandSet{"deploy prod"};
    const auto policy = CommandPolicy::from_config(config);

    EXPECT_TRUE(policy.is_allowed("deploy"));
    EXPECT_FALSE(policy.is_allowed("service"));
    EXPECT_TRUE(policy.is_denied("deploy", {"prod"}));
    EXPECT_FALSE(policy.is_denied("stats", {"realtime"}));
}

TEST(CommandPolicyTest, EmptyAllowSetWhenDefaultsDisabled) {
    GateConfig config;
    config.use_default_allow_set = false;
    const auto policy = CommandPolicy::from_config(config);
    EXPECT_TRUE(policy.allow_set().empty());
    EXPECT_FALSE(policy.is_allowed("service"));
    EXPECT_EQ(policy.deny_set(), CommandPolicy::default_deny_set());
}

TEST(CommandPolicyTest, DecisionsAreStable) {
    CommandPolicy policy;
    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(policy.is_allowed("service"));
        EXPECT_TRUE(policy.is_denied("stats", {"realtime"}));
    }
}

}  // namespace
