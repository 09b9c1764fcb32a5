#include <gtest/gtest.h>
#include "jdki/environment.hpp"
#include "jdki/errors.hpp"
#include "testing.hpp"

#include <cstdlib>

namespace jdki {

namespace fs = std::filesystem;

class EnvironmentConfiguratorTest : public ::testing::Test {
  protected:
    testutil::MemoryEnvironment store;
    EnvironmentConfigurator configurator{store, "JAVA_HOME", "Path", ';'};
};

TEST_F(EnvironmentConfiguratorTest, SetsHomeAndAppendsToPath) {
    store.values["Path"] = "C:\\Windows\\system32;C:\\Windows";

    auto update = configurator.applyPathUpdate("C:\\Java\\jdk");

    EXPECT_TRUE(update.homeChanged);
    EXPECT_TRUE(update.pathChanged);
    EXPECT_EQ(store.values["JAVA_HOME"], "C:\\Java\\jdk");
    EXPECT_EQ(store.values["Path"], "C:\\Windows\\system32;C:\\Windows;C:\\Java\\jdk");
}

TEST_F(EnvironmentConfiguratorTest, SecondRunChangesNothing) {
    store.values["Path"] = "/usr/bin";

    configurator.applyPathUpdate("/opt/java");
    auto snapshot = store.values;
    int writes = store.totalWrites();

    auto update = configurator.applyPathUpdate("/opt/java");

    EXPECT_FALSE(update.homeChanged);
    EXPECT_FALSE(update.pathChanged);
    EXPECT_EQ(store.values, snapshot);
    EXPECT_EQ(store.totalWrites(), writes);
    EXPECT_EQ(testutil::CountSegments(store.values["Path"], "/opt/java", ';'), 1u);
}

TEST_F(EnvironmentConfiguratorTest, EmptyPathBecomesSingleEntry) {
    configurator.applyPathUpdate("/opt/java");
    EXPECT_EQ(store.values["Path"], "/opt/java");
}

TEST_F(EnvironmentConfiguratorTest, TrailingSeparatorIsNotDoubled) {
    store.values["Path"] = "/usr/bin;";
    configurator.applyPathUpdate("/opt/java");
    EXPECT_EQ(store.values["Path"], "/usr/bin;/opt/java");
}

TEST_F(EnvironmentConfiguratorTest, ExistingSegmentWithTrailingSlashCounts) {
    store.values["JAVA_HOME"] = "/opt/java/";
    store.values["Path"] = "/usr/bin; /opt/java/ ;/bin";

    auto update = configurator.applyPathUpdate("/opt/java");

    EXPECT_FALSE(update.homeChanged);
    EXPECT_FALSE(update.pathChanged);
    EXPECT_EQ(store.totalWrites(), 0);
}

TEST_F(EnvironmentConfiguratorTest, PrefixOfSegmentIsNotAMatch) {
    store.values["Path"] = "/opt/java-old/bin";
    auto update = configurator.applyPathUpdate("/opt/java");
    EXPECT_TRUE(update.pathChanged);
    EXPECT_EQ(store.values["Path"], "/opt/java-old/bin;/opt/java");
}

TEST_F(EnvironmentConfiguratorTest, HomeWriteSurvivesPathFailure) {
    store.values["Path"] = "/usr/bin";
    store.failOn = "Path";

    EXPECT_THROW(configurator.applyPathUpdate("/opt/java"), EnvironmentError);
    EXPECT_EQ(store.values["JAVA_HOME"], "/opt/java");
    EXPECT_EQ(store.values["Path"], "/usr/bin");
}

TEST_F(EnvironmentConfiguratorTest, PathIsStillTriedWhenHomeFails) {
    store.failOn = "JAVA_HOME";

    EXPECT_THROW(configurator.applyPathUpdate("/opt/java"), EnvironmentError);
    EXPECT_EQ(store.values.count("JAVA_HOME"), 0u);
    EXPECT_EQ(store.values["Path"], "/opt/java");
}

TEST_F(EnvironmentConfiguratorTest, UnreadablePathIsNeverOverwritten) {
    store.values["Path"] = "/usr/bin;/bin";
    store.failReadOn = "Path";

    EXPECT_THROW(configurator.applyPathUpdate("/opt/java"), EnvironmentError);
    EXPECT_EQ(store.writes.count("Path"), 0u);
    EXPECT_EQ(store.values["Path"], "/usr/bin;/bin");
    EXPECT_EQ(store.values["JAVA_HOME"], "/opt/java");
}

TEST_F(EnvironmentConfiguratorTest, UnreadableStoreWritesNothing) {
    testutil::MemoryEnvironment broken;
    broken.failReadOn = "JAVA_HOME";
    EnvironmentConfigurator home(broken, "JAVA_HOME", "Path", ';');
    EXPECT_THROW(home.applyPathUpdate("/opt/java"), EnvironmentError);
    EXPECT_EQ(broken.writes.count("JAVA_HOME"), 0u);
    EXPECT_EQ(broken.values["Path"], "/opt/java");

    broken.failReadOn = "Path";
    broken.values.clear();
    broken.writes.clear();
    broken.values["JAVA_HOME"] = "/opt/java";
    EXPECT_THROW(home.applyPathUpdate("/opt/java"), EnvironmentError);
    EXPECT_EQ(broken.totalWrites(), 0);
}

TEST(ContainsSegmentTest, SplitsOnSeparator) {
    EXPECT_TRUE(EnvironmentConfigurator::containsSegment("a:b:c", "b", ':'));
    EXPECT_FALSE(EnvironmentConfigurator::containsSegment("a:b:c", "b", ';'));
    EXPECT_FALSE(EnvironmentConfigurator::containsSegment("", "b", ':'));
    EXPECT_FALSE(EnvironmentConfigurator::containsSegment("::", "", ':'));
}

#ifndef _WIN32

TEST(FileEnvironmentTest, RoundTripsAndPreservesOtherLines) {
    testutil::TemporaryDirectory temp_dir;
    fs::path file = temp_dir.Path() / "environment";
    testutil::WriteFile(file,
                        "# system environment\n"
                        "PATH=\"/usr/local/bin:/usr/bin\"\n"
                        "LANG=C.UTF-8\n");

    FileEnvironment env(file);
    EXPECT_EQ(env.get("PATH").value_or(""), "/usr/local/bin:/usr/bin");
    EXPECT_EQ(env.get("LANG").value_or(""), "C.UTF-8");

    env.set("PATH", "/usr/local/bin:/usr/bin:/opt/java");
    env.set("JAVA_HOME", "/opt/java");

    EXPECT_EQ(env.get("PATH").value_or(""), "/usr/local/bin:/usr/bin:/opt/java");
    EXPECT_EQ(env.get("JAVA_HOME").value_or(""), "/opt/java");
    EXPECT_EQ(testutil::ReadFile(file),
              "# system environment\n"
              "PATH=\"/usr/local/bin:/usr/bin:/opt/java\"\n"
              "LANG=C.UTF-8\n"
              "JAVA_HOME=\"/opt/java\"\n");
}

TEST(FileEnvironmentTest, ProcessEnvironmentIsNotMachineScope) {
    testutil::TemporaryDirectory temp_dir;
    fs::path file = temp_dir.Path() / "environment";
    testutil::WriteFile(file, "LANG=C.UTF-8\n");

    const char* oldHome = std::getenv("JAVA_HOME");
    std::optional<std::string> savedHome;
    if (oldHome) savedHome = oldHome;
    std::string savedPath = std::getenv("PATH") ? std::getenv("PATH") : "";
    ::setenv("JAVA_HOME", "/opt/java", 1);
    ::setenv("PATH", "/usr/bin:/bin:/opt/java", 1);

    FileEnvironment env(file);
    EXPECT_FALSE(env.get("JAVA_HOME").has_value());
    EXPECT_FALSE(env.get("PATH").has_value());

    EnvironmentConfigurator configurator(env, "JAVA_HOME", "PATH", ':');
    auto update = configurator.applyPathUpdate("/opt/java");

    if (savedHome) {
        ::setenv("JAVA_HOME", savedHome->c_str(), 1);
    } else {
        ::unsetenv("JAVA_HOME");
    }
    ::setenv("PATH", savedPath.c_str(), 1);

    EXPECT_TRUE(update.homeChanged);
    EXPECT_TRUE(update.pathChanged);
    EXPECT_EQ(testutil::ReadFile(file),
              "LANG=C.UTF-8\n"
              "JAVA_HOME=\"/opt/java\"\n"
              "PATH=\"/opt/java\"\n");
}

TEST(FileEnvironmentTest, MissingFileHoldsNoVariables) {
    testutil::TemporaryDirectory temp_dir;
    FileEnvironment env(temp_dir.Path() / "environment");
    EXPECT_FALSE(env.get("PATH").has_value());
}

TEST(FileEnvironmentTest, UnreadableFileIsErrorAndLeftAlone) {
    testutil::TemporaryDirectory temp_dir;
    fs::path file = temp_dir.Path() / "environment";
    fs::create_directories(file / "not-a-file");

    FileEnvironment env(file);
    EXPECT_THROW(env.get("PATH"), EnvironmentError);
    EXPECT_THROW(env.set("PATH", "/opt/java"), EnvironmentError);

    EnvironmentConfigurator configurator(env, "JAVA_HOME", "PATH", ':');
    EXPECT_THROW(configurator.applyPathUpdate("/opt/java"), EnvironmentError);
    EXPECT_TRUE(fs::is_directory(file / "not-a-file"));
}

TEST(FileEnvironmentTest, RejectsQuotesInValues) {
    testutil::TemporaryDirectory temp_dir;
    FileEnvironment env(temp_dir.Path() / "environment");
    EXPECT_THROW(env.set("JAVA_HOME", "/opt/\"java\""), EnvironmentError);
}

TEST(FileEnvironmentTest, ConfiguratorIsIdempotentOnFile) {
    testutil::TemporaryDirectory temp_dir;
    fs::path file = temp_dir.Path() / "environment";
    testutil::WriteFile(file, "PATH=\"/usr/bin:/bin\"\n");

    FileEnvironment env(file);
    EnvironmentConfigurator configurator(env, "JAVA_HOME", "PATH", ':');
    configurator.applyPathUpdate("/opt/java");
    std::string afterFirst = testutil::ReadFile(file);
    auto update = configurator.applyPathUpdate("/opt/java");

    EXPECT_FALSE(update.homeChanged);
    EXPECT_FALSE(update.pathChanged);
    EXPECT_EQ(testutil::ReadFile(file), afterFirst);
    EXPECT_EQ(testutil::CountSegments(env.get("PATH").value_or(""), "/opt/java", ':'), 1u);
}

#endif

} // namespace jdki
