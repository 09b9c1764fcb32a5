#include <gtest/gtest.h>
#include "jdki/zip_util.hpp"
#include "jdki/errors.hpp"
#include "testing.hpp"

#include <set>

namespace jdki {

namespace fs = std::filesystem;

class ZipUtilTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory temp_dir;
    ZipUtil extractor;

    fs::path Dest() {
        fs::path dest = temp_dir.Path() / "out";
        fs::create_directories(dest);
        return dest;
    }

    fs::path SampleZip() {
        fs::path zip = temp_dir.Path() / "sample.zip";
        testutil::BuildArchive(zip, {
            {"sample-root/", "", AE_IFDIR},
            {"sample-root/bin/", "", AE_IFDIR},
            {"sample-root/bin/tool.exe", "MZ binary"},
            {"sample-root/lib/data.txt", "payload"},
        });
        return zip;
    }
};

TEST(StripComponentsTest, DropsLeadingSegments) {
    EXPECT_EQ(ZipUtil::stripComponents("jdk-21/bin/java", 1), "bin/java");
    EXPECT_EQ(ZipUtil::stripComponents("jdk-21/bin/java", 0), "jdk-21/bin/java");
    EXPECT_EQ(ZipUtil::stripComponents("jdk-21/bin/java", 2), "java");
    EXPECT_EQ(ZipUtil::stripComponents("jdk-21/", 1), "");
    EXPECT_EQ(ZipUtil::stripComponents("jdk-21", 3), "");
}

TEST(StripComponentsTest, NormalizesSeparatorsAndDots) {
    EXPECT_EQ(ZipUtil::stripComponents("jdk-21\\bin\\java.exe", 1), "bin/java.exe");
    EXPECT_EQ(ZipUtil::stripComponents("./jdk-21//lib/./x", 1), "lib/x");
    EXPECT_EQ(ZipUtil::stripComponents("/jdk-21/bin", 1), "bin");
}

TEST(StripComponentsTest, DetectsParentReferences) {
    EXPECT_TRUE(ZipUtil::hasParentReference("root/../../etc/passwd"));
    EXPECT_TRUE(ZipUtil::hasParentReference("..\\evil"));
    EXPECT_FALSE(ZipUtil::hasParentReference("root/..hidden/file"));
}

TEST_F(ZipUtilTest, UnwrapsSingleRootFolder) {
    fs::path dest = Dest();
    extractor.extract(SampleZip().string(), dest.string(), 1);

    EXPECT_TRUE(fs::is_regular_file(dest / "bin" / "tool.exe"));
    EXPECT_TRUE(fs::is_regular_file(dest / "lib" / "data.txt"));
    EXPECT_FALSE(fs::exists(dest / "sample-root"));
    EXPECT_EQ(testutil::ReadFile(dest / "lib" / "data.txt"), "payload");
}

TEST_F(ZipUtilTest, ExtractedTreeMatchesArchiveWithoutWrapper) {
    fs::path dest = Dest();
    extractor.extract(SampleZip().string(), dest.string(), 1);

    std::set<std::string> files;
    for (const auto& entry : fs::recursive_directory_iterator(dest)) {
        if (entry.is_regular_file()) {
            files.insert(fs::relative(entry.path(), dest).generic_string());
        }
    }
    EXPECT_EQ(files, (std::set<std::string>{"bin/tool.exe", "lib/data.txt"}));
}

TEST_F(ZipUtilTest, StripZeroKeepsWrapper) {
    fs::path dest = Dest();
    extractor.extract(SampleZip().string(), dest.string(), 0);
    EXPECT_TRUE(fs::is_regular_file(dest / "sample-root" / "bin" / "tool.exe"));
}

TEST_F(ZipUtilTest, MergesIntoExistingDestination) {
    fs::path dest = Dest();
    testutil::WriteFile(dest / "notes.txt", "keep me");
    testutil::WriteFile(dest / "lib" / "data.txt", "old");
    testutil::WriteFile(dest / "lib" / "extra.jar", "unrelated");

    extractor.extract(SampleZip().string(), dest.string(), 1);

    EXPECT_EQ(testutil::ReadFile(dest / "notes.txt"), "keep me");
    EXPECT_EQ(testutil::ReadFile(dest / "lib" / "extra.jar"), "unrelated");
    EXPECT_EQ(testutil::ReadFile(dest / "lib" / "data.txt"), "payload");
}

TEST_F(ZipUtilTest, ExtractsTarballs) {
    fs::path tarball = temp_dir.Path() / "jdk.tar";
    testutil::BuildArchive(tarball, {
        {"jdk-21.0.5+11/bin/java", "#!/bin/sh\n", AE_IFREG, 0755},
        {"jdk-21.0.5+11/release", "JAVA_VERSION=\"21.0.5\"\n"},
    }, testutil::ArchiveFormat::Tar);

    fs::path dest = Dest();
    extractor.extract(tarball.string(), dest.string(), 1);

    EXPECT_TRUE(fs::is_regular_file(dest / "bin" / "java"));
    auto perms = fs::status(dest / "bin" / "java").permissions();
    EXPECT_NE(perms & fs::perms::owner_exec, fs::perms::none);
    EXPECT_EQ(testutil::ReadFile(dest / "release"), "JAVA_VERSION=\"21.0.5\"\n");
}

TEST_F(ZipUtilTest, SkipsTraversalEntries) {
    fs::path tarball = temp_dir.Path() / "evil.tar";
    testutil::BuildArchive(tarball, {
        {"root/ok.txt", "fine"},
        {"root/../../escaped.txt", "nope"},
    }, testutil::ArchiveFormat::Tar);

    fs::path dest = Dest();
    extractor.extract(tarball.string(), dest.string(), 1);

    EXPECT_TRUE(fs::exists(dest / "ok.txt"));
    EXPECT_FALSE(fs::exists(temp_dir.Path() / "escaped.txt"));
    EXPECT_FALSE(fs::exists(dest.parent_path().parent_path() / "escaped.txt"));
}

TEST_F(ZipUtilTest, MissingArchiveNamesArchiveAndDestination) {
    fs::path dest = Dest();
    fs::path missing = temp_dir.Path() / "missing.zip";
    try {
        extractor.extract(missing.string(), dest.string(), 1);
        FAIL() << "expected ExtractionError";
    } catch (const ExtractionError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find(missing.string()), std::string::npos);
        EXPECT_NE(msg.find(dest.string()), std::string::npos);
        EXPECT_EQ(e.stage(), Stage::Extraction);
    }
}

TEST_F(ZipUtilTest, GarbageArchiveFails) {
    fs::path bogus = temp_dir.Path() / "bogus.zip";
    testutil::WriteFile(bogus, std::string(4096, 'x'));
    EXPECT_THROW(extractor.extract(bogus.string(), Dest().string(), 1), ExtractionError);
}

TEST_F(ZipUtilTest, DestinationMustExist) {
    fs::path dest = temp_dir.Path() / "not-created";
    EXPECT_THROW(extractor.extract(SampleZip().string(), dest.string(), 1), ExtractionError);
}

TEST_F(ZipUtilTest, HardlinkTargetsAreStrippedToo) {
    fs::path tarball = temp_dir.Path() / "links.tar";
    testutil::BuildArchive(tarball, {
        {"jdk-21/bin/java", "launcher", AE_IFREG, 0755},
        {"jdk-21/bin/javac", "", AE_IFREG, 0755, "jdk-21/bin/java"},
    }, testutil::ArchiveFormat::Tar);

    fs::path dest = Dest();
    extractor.extract(tarball.string(), dest.string(), 1);

    ASSERT_TRUE(fs::is_regular_file(dest / "bin" / "javac"));
    EXPECT_EQ(testutil::ReadFile(dest / "bin" / "javac"), "launcher");
    EXPECT_TRUE(fs::equivalent(dest / "bin" / "java", dest / "bin" / "javac"));
    EXPECT_FALSE(fs::exists(dest / "jdk-21"));
}

TEST_F(ZipUtilTest, SkipsHardlinksWithUnusableTargets) {
    fs::path outside = temp_dir.Path() / "outside.txt";
    testutil::WriteFile(outside, "keep");

    fs::path tarball = temp_dir.Path() / "links.tar";
    testutil::BuildArchive(tarball, {
        {"jdk-21/bin/java", "launcher", AE_IFREG, 0755},
        {"jdk-21/bin/escape", "", AE_IFREG, 0644, "jdk-21/../../outside.txt"},
        {"jdk-21/bin/wrapper", "", AE_IFREG, 0644, "jdk-21"},
    }, testutil::ArchiveFormat::Tar);

    fs::path dest = Dest();
    extractor.extract(tarball.string(), dest.string(), 1);

    EXPECT_TRUE(fs::is_regular_file(dest / "bin" / "java"));
    EXPECT_FALSE(fs::exists(dest / "bin" / "escape"));
    EXPECT_FALSE(fs::exists(dest / "bin" / "wrapper"));
    EXPECT_EQ(testutil::ReadFile(outside), "keep");
}

TEST_F(ZipUtilTest, TruncatedDataReportsReadSide) {
    fs::path tarball = temp_dir.Path() / "cut.tar";
    testutil::BuildArchive(tarball, {
        {"jdk-21/lib/modules", std::string(64 * 1024, 'x')},
    }, testutil::ArchiveFormat::Tar);
    fs::resize_file(tarball, 4096);

    fs::path dest = Dest();
    try {
        extractor.extract(tarball.string(), dest.string(), 1);
        FAIL() << "expected ExtractionError";
    } catch (const ExtractionError& e) {
        std::string what = e.what();
        EXPECT_NE(what.find("cannot read data for"), std::string::npos) << what;
        EXPECT_NE(what.find(tarball.string()), std::string::npos) << what;
    }
}

} // namespace jdki
