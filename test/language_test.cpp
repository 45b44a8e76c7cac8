#include <msb/sandbox.h>

#include "utils.h"

namespace {

class RubyLanguage : public msb::Language {
 public:
  std::string DefaultImage() const override { return "example/ruby"; }
  std::string Tag() const override { return "ruby"; }
};

} // namespace

TEST(Language, BuiltIns) {
  EXPECT_EQ(msb::Python()->Tag(), "python");
  EXPECT_EQ(msb::Python()->DefaultImage(), "appcypher/msb-python");
  EXPECT_EQ(msb::Node()->Tag(), "javascript");
  EXPECT_EQ(msb::Node()->DefaultImage(), "appcypher/msb-node");
}

TEST(Language, FromName) {
  EXPECT_EQ(msb::LanguageFromName("python"), msb::Python());
  EXPECT_EQ(msb::LanguageFromName("python3"), msb::Python());
  EXPECT_EQ(msb::LanguageFromName("node"), msb::Node());
  EXPECT_EQ(msb::LanguageFromName("javascript"), msb::Node());
  EXPECT_EQ(msb::LanguageFromName("js"), msb::Node());
  EXPECT_EQ(msb::LanguageFromName("cobol"), nullptr);
}

struct LangParam {
  std::shared_ptr<const msb::Language> lang;
  std::string tag, image;
};

class LanguageVariant : public testing::TestWithParam<LangParam> {
 protected:
  FakeServer server;
};

TEST_P(LanguageVariant, SharedProtocol) {
  auto& param = GetParam();
  msb::SandboxOptions options;
  options.server_url = server.Url();
  msb::Sandbox sandbox(param.lang, options);
  sandbox.Start();
  sandbox.Run("1");
  EXPECT_EQ(server.Last("sandbox.start").params["config"]["image"], param.image);
  EXPECT_EQ(server.Last("sandbox.repl.run").params["language"], param.tag);
}

INSTANTIATE_TEST_SUITE_P(Languages, LanguageVariant,
    testing::Values(
      LangParam{msb::Python(), "python", "appcypher/msb-python"},
      LangParam{msb::Node(), "javascript", "appcypher/msb-node"},
      LangParam{std::make_shared<RubyLanguage>(), "ruby", "example/ruby"}
    ),
    [](const testing::TestParamInfo<LangParam>& info) { return info.param.tag; });
