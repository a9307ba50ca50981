#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include "lfs/customadapter.hpp"
#include "lfs/jsonenvironment.hpp"
#include "lfs/manifest.hpp"
#include "lfs/manifestconfig.hpp"

using lfs::JsonEnvironment;

TEST(JsonEnvironmentTest, FlattensNestedObjects) {
  JsonEnvironment env(nlohmann::json::parse(R"({
    "lfs": {
      "concurrenttransfers": 8,
      "transfer": {"maxretries": 4},
      "customtransfer.agent.path": "/bin/agent"
    }
  })"));

  EXPECT_EQ(env.get("lfs.concurrenttransfers").value_or(""), "8");
  EXPECT_EQ(env.get("lfs.transfer.maxretries").value_or(""), "4");
  EXPECT_EQ(env.get("lfs.customtransfer.agent.path").value_or(""),
            "/bin/agent");
  EXPECT_FALSE(env.get("lfs").has_value());
  EXPECT_EQ(env.all().size(), 3u);
}

TEST(JsonEnvironmentTest, ConvertsScalarTypes) {
  JsonEnvironment env(nlohmann::json::parse(R"({
    "flag": true,
    "off": false,
    "negative": -2,
    "ratio": 1.5,
    "nothing": null,
    "many": ["first", {"skip": 1}, "last"],
    "objects": [{"a": 1}],
    "empty": []
  })"));

  EXPECT_EQ(env.get("flag").value_or(""), "true");
  EXPECT_EQ(env.get("off").value_or(""), "false");
  EXPECT_EQ(env.get("negative").value_or(""), "-2");
  EXPECT_EQ(env.get("ratio").value_or(""), "1.5");
  EXPECT_FALSE(env.get("nothing").has_value());
  EXPECT_EQ(env.get("many").value_or(""), "last");
  EXPECT_FALSE(env.get("objects").has_value());
  EXPECT_FALSE(env.get("empty").has_value());

  EXPECT_TRUE(env.getBool("flag", false));
  EXPECT_EQ(env.getInt("negative", 0), -2);
}

TEST(JsonEnvironmentTest, ExpandsEnvironmentVariables) {
  ::setenv("LFS_TEST_PREFIX", "/usr/local", 1);
  JsonEnvironment env(nlohmann::json::parse(
      R"({"lfs": {"customtransfer": {"x": {"path": "$ENV{LFS_TEST_PREFIX}/bin/x"}}}})"));

  EXPECT_EQ(env.get("lfs.customtransfer.x.path").value_or(""),
            "/usr/local/bin/x");
}

TEST(JsonEnvironmentTest, ExpandVariablesHandlesEdgeCases) {
  ::setenv("LFS_TEST_WORD", "ab", 1);
  ::unsetenv("LFS_TEST_UNSET_VAR");

  EXPECT_EQ(JsonEnvironment::expandVariables("$ENV{LFS_TEST_WORD}-$ENV{LFS_TEST_WORD}"),
            "ab-ab");
  EXPECT_EQ(JsonEnvironment::expandVariables("$ENV{LFS_TEST_UNSET_VAR}/x"),
            "$ENV{LFS_TEST_UNSET_VAR}/x");
  EXPECT_EQ(JsonEnvironment::expandVariables("pre $ENV{LFS_TEST_WORD"),
            "pre $ENV{LFS_TEST_WORD");
  EXPECT_EQ(JsonEnvironment::expandVariables("plain"), "plain");
}

TEST(JsonEnvironmentTest, ExpandsInsideArraysAndKeepsKeys) {
  ::setenv("LFS_TEST_AGENT_DIR", "/opt/agents", 1);
  JsonEnvironment env(nlohmann::json::parse(
      R"({"$ENV{LFS_TEST_AGENT_DIR}": "k", "list": ["x", "$ENV{LFS_TEST_AGENT_DIR}"]})"));

  EXPECT_EQ(env.get("list").value_or(""), "/opt/agents");
  EXPECT_EQ(env.get("$env{lfs_test_agent_dir}").value_or(""), "k");
}

TEST(JsonEnvironmentTest, SectionAndVariableNamesAreCaseInsensitive) {
  JsonEnvironment env(nlohmann::json::parse(R"({
    "LFS": {
      "concurrentTransfers": 8,
      "customTransfer": {"MyAgent": {"Path": "/bin/agent"}}
    }
  })"));

  EXPECT_EQ(env.getInt("lfs.concurrenttransfers", 0), 8);
  EXPECT_EQ(env.get("lfs.customTransfer.MyAgent.path").value_or(""),
            "/bin/agent");
  EXPECT_FALSE(env.get("lfs.concurrentTransfers").has_value());
}

TEST(JsonEnvironmentTest, CanonicalKeyKeepsSubsection) {
  EXPECT_EQ(JsonEnvironment::canonicalKey("Core"), "core");
  EXPECT_EQ(JsonEnvironment::canonicalKey("LFS.TusTransfers"),
            "lfs.tustransfers");
  EXPECT_EQ(JsonEnvironment::canonicalKey("Lfs.CustomTransfer.MyAgent.Path"),
            "lfs.CustomTransfer.MyAgent.path");
}

TEST(JsonEnvironmentTest, MixedCaseConfigDrivesManifest) {
  JsonEnvironment env(nlohmann::json::parse(R"({
    "lfs": {"ConcurrentTransfers": 7, "TusTransfers": "yes"}
  })"));

  lfs::Manifest manifest;
  lfs::configureManifest(manifest, env);
  manifest.initAdapters();

  EXPECT_EQ(manifest.concurrentTransfers(), 7);
  EXPECT_TRUE(manifest.hasAdapter("tus", lfs::Direction::Upload));
}

TEST(JsonEnvironmentTest, NonObjectDocumentIsEmpty) {
  EXPECT_TRUE(JsonEnvironment(nlohmann::json::array({1, 2})).all().empty());
  EXPECT_TRUE(JsonEnvironment(nlohmann::json()).all().empty());
}

TEST(JsonEnvironmentTest, FromFileDrivesManifest) {
  const std::string path =
      (std::filesystem::temp_directory_path() / "lfs_jsonenv_test.json")
          .string();
  std::ofstream(path) << R"({
    "lfs": {
      "concurrenttransfers": 6,
      "tustransfers": true,
      "customtransfer": {
        "lz": {"path": "/bin/lz", "direction": "upload", "concurrent": false}
      }
    }
  })";

  JsonEnvironment env = JsonEnvironment::fromFile(path);
  std::remove(path.c_str());

  lfs::Manifest manifest;
  lfs::configureManifest(manifest, env);
  manifest.initAdapters();
  manifest.initCustomAdapters(env);

  EXPECT_EQ(manifest.concurrentTransfers(), 6);
  EXPECT_TRUE(manifest.hasAdapter("tus", lfs::Direction::Upload));
  EXPECT_TRUE(manifest.hasAdapter("lz", lfs::Direction::Upload));
  EXPECT_FALSE(manifest.hasAdapter("lz", lfs::Direction::Download));

  auto adapter = manifest.newUploadAdapter("lz");
  auto* custom = dynamic_cast<lfs::CustomAdapter*>(adapter.get());
  ASSERT_NE(custom, nullptr);
  EXPECT_FALSE(custom->isConcurrent());
}

TEST(JsonEnvironmentTest, FromFileMissingThrows) {
  EXPECT_THROW(JsonEnvironment::fromFile("/nonexistent/lfs.json"),
               std::runtime_error);
}
