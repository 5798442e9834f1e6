#include "claw/resolver.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::_;
using ::testing::Return;

class MockConfigQuery : public claw::ConfigQuery {
 public:
  MOCK_METHOD1(Get, absl::optional<std::string>(const std::string& key));
};

claw::Settings TestSettings() {
  claw::Settings settings;
  settings.config_key = "analysis.default_columnar_sandbox";
  settings.default_sandbox = "venv_columnar_dev";
  return settings;
}

/*
 * NormalizeSandboxName
 */

// NOLINTNEXTLINE
TEST(NormalizeSandboxName, StripsDirectoryAndExtension) {
  EXPECT_EQ(claw::NormalizeSandboxName("/path/to/foo.cfg"), "foo_dev");
}

// NOLINTNEXTLINE
TEST(NormalizeSandboxName, KeepsExistingDevSuffix) {
  EXPECT_EQ(claw::NormalizeSandboxName("bar_dev.cfg"), "bar_dev");
  EXPECT_EQ(claw::NormalizeSandboxName("$CF_BASE/sandboxes/bar_dev.sh"),
            "bar_dev");
}

// NOLINTNEXTLINE
TEST(NormalizeSandboxName, PlainName) {
  EXPECT_EQ(claw::NormalizeSandboxName("venv_columnar"), "venv_columnar_dev");
}

// NOLINTNEXTLINE
TEST(NormalizeSandboxName, OnlyLastExtensionIsRemoved) {
  EXPECT_EQ(claw::NormalizeSandboxName("a/venv.columnar.sh"),
            "venv.columnar_dev");
}

// NOLINTNEXTLINE
TEST(NormalizeSandboxName, TrailingSlash) {
  EXPECT_EQ(claw::NormalizeSandboxName("sandboxes/venv_ml/"), "venv_ml_dev");
}

/*
 * SandboxResolver
 */

// NOLINTNEXTLINE
TEST(SandboxResolver, OverrideWins) {
  for (const char* value : {"my_sandbox", "x", "/some/path.sh", "ends_dev"}) {
    claw::Settings settings = TestSettings();
    settings.override_sandbox = value;
    MockConfigQuery query;
    EXPECT_CALL(query, Get(_)).Times(0);
    claw::SandboxResolver resolver(settings, &query);
    EXPECT_EQ(resolver.Resolve(), value);
  }
}

// NOLINTNEXTLINE
TEST(SandboxResolver, ConfiguredValueIsNormalized) {
  claw::Settings settings = TestSettings();
  MockConfigQuery query;
  EXPECT_CALL(query, Get("analysis.default_columnar_sandbox"))
      .WillOnce(Return(std::string("/path/to/foo.cfg")));
  claw::SandboxResolver resolver(settings, &query);
  EXPECT_EQ(resolver.Resolve(), "foo_dev");
}

// NOLINTNEXTLINE
TEST(SandboxResolver, ConfiguredDevValueIsNotSuffixedTwice) {
  claw::Settings settings = TestSettings();
  MockConfigQuery query;
  EXPECT_CALL(query, Get(_)).WillOnce(Return(std::string("bar_dev.cfg")));
  claw::SandboxResolver resolver(settings, &query);
  EXPECT_EQ(resolver.Resolve(), "bar_dev");
}

// NOLINTNEXTLINE
TEST(SandboxResolver, FailedQueryUsesDefault) {
  claw::Settings settings = TestSettings();
  MockConfigQuery query;
  EXPECT_CALL(query, Get(_)).WillOnce(Return(absl::nullopt));
  claw::SandboxResolver resolver(settings, &query);
  EXPECT_EQ(resolver.Resolve(), "venv_columnar_dev");
}

// NOLINTNEXTLINE
TEST(SandboxResolver, CustomDefault) {
  claw::Settings settings = TestSettings();
  settings.default_sandbox = "venv_other_dev";
  MockConfigQuery query;
  EXPECT_CALL(query, Get(_)).WillOnce(Return(absl::nullopt));
  claw::SandboxResolver resolver(settings, &query);
  EXPECT_EQ(resolver.Resolve(), "venv_other_dev");
}

// NOLINTNEXTLINE
TEST(SandboxResolver, EmptyDefaultFallsBack) {
  claw::Settings settings = TestSettings();
  settings.default_sandbox = "";
  MockConfigQuery query;
  EXPECT_CALL(query, Get(_)).WillOnce(Return(absl::nullopt));
  claw::SandboxResolver resolver(settings, &query);
  EXPECT_EQ(resolver.Resolve(), claw::kFallbackSandbox);
}

// NOLINTNEXTLINE
TEST(SandboxResolver, QueriesConfiguredKey) {
  claw::Settings settings = TestSettings();
  settings.config_key = "analysis.other_sandbox";
  MockConfigQuery query;
  EXPECT_CALL(query, Get("analysis.other_sandbox"))
      .WillOnce(Return(std::string("venv_other")));
  claw::SandboxResolver resolver(settings, &query);
  EXPECT_EQ(resolver.Resolve(), "venv_other_dev");
}

}  // namespace
