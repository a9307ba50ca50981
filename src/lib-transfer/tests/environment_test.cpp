#include <gtest/gtest.h>

#include "lfs/environment.hpp"
#include "lfs/manifestconfig.hpp"

using lfs::MapEnvironment;

TEST(EnvironmentTest, GetReportsPresence) {
  MapEnvironment env({{"lfs.url", "https://example.com"}, {"empty", ""}});

  EXPECT_EQ(env.get("lfs.url").value_or(""), "https://example.com");
  ASSERT_TRUE(env.get("empty").has_value());
  EXPECT_TRUE(env.get("empty")->empty());
  EXPECT_FALSE(env.get("missing").has_value());
}

TEST(EnvironmentTest, BoolFollowsGitRules) {
  MapEnvironment env({{"a", "TRUE"},
                      {"b", "on"},
                      {"c", "t"},
                      {"d", "0"},
                      {"e", "No"},
                      {"f", ""},
                      {"g", "maybe"}});

  EXPECT_TRUE(env.getBool("a", false));
  EXPECT_TRUE(env.getBool("b", false));
  EXPECT_TRUE(env.getBool("c", false));
  EXPECT_FALSE(env.getBool("d", true));
  EXPECT_FALSE(env.getBool("e", true));
  EXPECT_TRUE(env.getBool("f", true));
  EXPECT_FALSE(env.getBool("g", true));
  EXPECT_TRUE(env.getBool("missing", true));
}

TEST(EnvironmentTest, IntFallsBackToDefaultOnBadInput) {
  MapEnvironment env({{"ok", "42"},
                      {"negative", "-3"},
                      {"junk", "12abc"},
                      {"space", " 7"},
                      {"huge", "99999999999999999999"},
                      {"empty", ""}});

  EXPECT_EQ(env.getInt("ok", 0), 42);
  EXPECT_EQ(env.getInt("negative", 0), -3);
  EXPECT_EQ(env.getInt("junk", 5), 5);
  EXPECT_EQ(env.getInt("space", 5), 5);
  EXPECT_EQ(env.getInt("huge", 5), 5);
  EXPECT_EQ(env.getInt("empty", 5), 5);
  EXPECT_EQ(env.getInt("missing", 5), 5);
}

TEST(EnvironmentTest, SetAndUnset) {
  MapEnvironment env;
  env.set("k", "v");
  EXPECT_EQ(env.all().size(), 1u);
  env.unset("k");
  EXPECT_TRUE(env.all().empty());
}

TEST(ManifestConfigTest, ResolvesTuningValues) {
  MapEnvironment env({{"lfs.transfer.maxretries", "4"},
                      {"lfs.concurrenttransfers", "0"},
                      {"lfs.basictransfersonly", "true"},
                      {"lfs.tustransfers", "yes"}});
  lfs::Manifest manifest;

  lfs::configureManifest(manifest, env);

  EXPECT_EQ(manifest.maxRetries(), 4);
  EXPECT_EQ(manifest.concurrentTransfers(), 0);
  EXPECT_TRUE(manifest.basicTransfersOnly());
  EXPECT_TRUE(manifest.tusTransfersAllowed());

  manifest.initAdapters();
  EXPECT_EQ(manifest.concurrentTransfers(), 3);
  EXPECT_TRUE(manifest.hasAdapter("tus", lfs::Direction::Upload));
}

TEST(ManifestConfigTest, MissingKeysKeepCurrentValues) {
  MapEnvironment env;
  lfs::Manifest manifest;
  manifest.setConcurrentTransfers(12);

  lfs::configureManifest(manifest, env);

  EXPECT_EQ(manifest.maxRetries(), 1);
  EXPECT_EQ(manifest.concurrentTransfers(), 12);
  EXPECT_FALSE(manifest.basicTransfersOnly());
  EXPECT_FALSE(manifest.tusTransfersAllowed());
}
