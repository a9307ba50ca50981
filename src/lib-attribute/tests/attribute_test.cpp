#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "lfs/attribute.hpp"
#include "lfs/selfpath.hpp"

using ::testing::_;
using ::testing::InSequence;
using ::testing::Return;
using lfs::Attribute;
using lfs::ConfigScope;
using lfs::FilterOptions;

namespace {

class MockGitConfiguration : public lfs::GitConfiguration {
 public:
  MOCK_METHOD(std::string, find, (ConfigScope, const std::string&),
              (override));
  MOCK_METHOD(void, set,
              (ConfigScope, const std::string&, const std::string&),
              (override));
  MOCK_METHOD(void, unsetSection, (ConfigScope, const std::string&),
              (override));
};

// git config в памяти, по словарю на область
class FakeGitConfiguration : public lfs::GitConfiguration {
 public:
  std::string find(ConfigScope scope, const std::string& key) override {
    auto& values = scopes_[scope];
    auto it = values.find(key);
    return it == values.end() ? std::string() : it->second;
  }

  void set(ConfigScope scope, const std::string& key,
           const std::string& value) override {
    ++writes;
    scopes_[scope][key] = value;
  }

  void unsetSection(ConfigScope scope, const std::string& section) override {
    auto& values = scopes_[scope];
    for (auto it = values.begin(); it != values.end();) {
      if (it->first.rfind(section + ".", 0) == 0) {
        it = values.erase(it);
      } else {
        ++it;
      }
    }
  }

  std::map<std::string, std::string>& values(ConfigScope scope) {
    return scopes_[scope];
  }

  int writes = 0;

 private:
  std::map<ConfigScope, std::map<std::string, std::string>> scopes_;
};

const std::string kExe = "/usr/bin/git-lfs";

class AttributeTest : public ::testing::Test {
 protected:
  AttributeTest() { options_.gitConfig = &git_; }

  FakeGitConfiguration git_;
  FilterOptions options_;
};

}  // namespace

TEST_F(AttributeTest, FreshInstallWritesEveryProperty) {
  lfs::filterAttribute(kExe).install(options_);

  const std::map<std::string, std::string> expected = {
      {"filter.lfs.clean", kExe + " clean -- %f"},
      {"filter.lfs.smudge", kExe + " smudge -- %f"},
      {"filter.lfs.process", kExe + " filter-process"},
      {"filter.lfs.required", "true"},
  };
  EXPECT_EQ(git_.values(ConfigScope::Global), expected);
  EXPECT_TRUE(git_.values(ConfigScope::Local).empty());
}

TEST_F(AttributeTest, ReinstallLeavesConfigUnchanged) {
  Attribute attr = lfs::filterAttribute(kExe);
  attr.install(options_);
  auto before = git_.values(ConfigScope::Global);

  EXPECT_NO_THROW(attr.install(options_));
  EXPECT_EQ(git_.values(ConfigScope::Global), before);
}

TEST_F(AttributeTest, ConflictStopsBeforeRemainingProperties) {
  git_.values(ConfigScope::Global)["filter.lfs.clean"] = "other-tool clean %f";

  try {
    lfs::filterAttribute(kExe).install(options_);
    FAIL() << "expected AttributeConflictError";
  } catch (const lfs::AttributeConflictError& e) {
    EXPECT_EQ(e.key(), "filter.lfs.clean");
    EXPECT_EQ(e.expected(), kExe + " clean -- %f");
    EXPECT_EQ(e.actual(), "other-tool clean %f");
    EXPECT_STREQ(e.what(),
                 "the \"filter.lfs.clean\" attribute should be "
                 "\"/usr/bin/git-lfs clean -- %f\" but is "
                 "\"other-tool clean %f\"");
  }

  EXPECT_EQ(git_.writes, 0);
  EXPECT_EQ(git_.values(ConfigScope::Global).size(), 1u);
}

TEST_F(AttributeTest, ForceOverwritesConflictingValue) {
  git_.values(ConfigScope::Global)["filter.lfs.smudge"] = "other-tool smudge";
  options_.force = true;

  lfs::filterAttribute(kExe).install(options_);

  EXPECT_EQ(git_.values(ConfigScope::Global)["filter.lfs.smudge"],
            kExe + " smudge -- %f");
}

TEST_F(AttributeTest, LegacyValuesAreUpgradedWithoutForce) {
  auto& global = git_.values(ConfigScope::Global);
  global["filter.lfs.clean"] = kExe + " clean %f";
  global["filter.lfs.smudge"] = kExe + " smudge --skip %f";
  global["filter.lfs.process"] = kExe + " filter --skip";

  lfs::filterAttribute(kExe).install(options_);

  EXPECT_EQ(global["filter.lfs.clean"], kExe + " clean -- %f");
  EXPECT_EQ(global["filter.lfs.smudge"], kExe + " smudge -- %f");
  EXPECT_EQ(global["filter.lfs.process"], kExe + " filter-process");
}

TEST_F(AttributeTest, SkipSmudgeReplacesStandardFilter) {
  Attribute standard = lfs::filterAttribute(kExe);
  standard.install(options_);

  lfs::skipSmudgeFilterAttribute(kExe).install(options_);

  auto& global = git_.values(ConfigScope::Global);
  EXPECT_EQ(global["filter.lfs.smudge"], kExe + " smudge --skip -- %f");
  EXPECT_EQ(global["filter.lfs.process"], kExe + " filter-process --skip");

  lfs::filterAttribute(kExe).install(options_);
  EXPECT_EQ(global["filter.lfs.smudge"], kExe + " smudge -- %f");
}

TEST_F(AttributeTest, ValueMatchingDesiredIsNotAConflict) {
  Attribute attr;
  attr.section = "core";
  attr.properties = {{"autocrlf", "input"}};
  git_.values(ConfigScope::Global)["core.autocrlf"] = "input";

  EXPECT_NO_THROW(attr.install(options_));
  EXPECT_EQ(git_.writes, 0);
}

TEST_F(AttributeTest, UninstallRemovesOnlyTheSection) {
  options_.local = true;
  lfs::filterAttribute(kExe).install(options_);
  git_.values(ConfigScope::Local)["core.bare"] = "false";

  options_.uninstall();

  const std::map<std::string, std::string> expected = {{"core.bare", "false"}};
  EXPECT_EQ(git_.values(ConfigScope::Local), expected);
}

TEST(FilterOptionsTest, ScopePrecedence) {
  FilterOptions options;
  EXPECT_EQ(options.scope(), ConfigScope::Global);
  options.system = true;
  EXPECT_EQ(options.scope(), ConfigScope::System);
  options.worktree = true;
  EXPECT_EQ(options.scope(), ConfigScope::Worktree);
  options.local = true;
  EXPECT_EQ(options.scope(), ConfigScope::Local);
}

TEST(FilterOptionsTest, MissingGitConfigIsRejected) {
  FilterOptions options;
  EXPECT_THROW(options.install(), std::invalid_argument);
  EXPECT_THROW(options.uninstall(), std::invalid_argument);
}

TEST(FilterOptionsTest, InstallUsesSelectedScopeAndSelfPath) {
  MockGitConfiguration git;
  FilterOptions options;
  options.gitConfig = &git;
  options.worktree = true;
  options.skipSmudge = true;

  const std::string exe = lfs::selfPath();
  {
    InSequence seq;
    for (const auto& [property, value] :
         lfs::skipSmudgeFilterAttribute(exe).properties) {
      const std::string key = "filter.lfs." + property;
      EXPECT_CALL(git, find(ConfigScope::Worktree, key)).WillOnce(Return(""));
      EXPECT_CALL(git, set(ConfigScope::Worktree, key, value));
    }
  }

  options.install();
}

TEST(FilterOptionsTest, UninstallTargetsStandardSection) {
  MockGitConfiguration git;
  FilterOptions options;
  options.gitConfig = &git;
  options.system = true;

  EXPECT_CALL(git, unsetSection(ConfigScope::System, "filter.lfs"));
  EXPECT_CALL(git, find(_, _)).Times(0);

  options.uninstall();
}

TEST(SelfPathTest, ReturnsAbsolutePath) {
  const std::string& path = lfs::selfPath();
  ASSERT_FALSE(path.empty());
  EXPECT_EQ(path.front(), '/');
  EXPECT_EQ(&path, &lfs::selfPath());
}
