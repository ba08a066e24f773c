#include <gtest/gtest.h>
#include "manifest.hpp"

#include <algorithm>

namespace {
    const std::string REPO = "https://dl.google.com/android/repository/";

    ManifestEntry entry(const std::string& url, const std::string& properties) {
        return ManifestEntry{url, parse_properties(properties), ""};
    }

    bool has_alias(const NormalizedEntry& n, const PackageIdentifier& id) {
        return std::find(n.aliases.begin(), n.aliases.end(), id) != n.aliases.end();
    }
}

TEST(ManifestTest, IdentifierRoundTrip) {
    EXPECT_EQ(parse_identifier("build-tools;30.0.3"), (PackageIdentifier{"build-tools", "30.0.3"}));
    EXPECT_EQ(parse_identifier("platform-tools"), (PackageIdentifier{"platform-tools"}));
    EXPECT_EQ(render_identifier({"extras", "android", "m2repository"}), "extras;android;m2repository");
}

TEST(ManifestTest, ParsesSourceProperties) {
    Properties p = parse_properties(
        "#comment\n"
        "Pkg.Revision = 30.0.3\r\n"
        "Pkg.Path=build-tools;30.0.3\n"
        "Pkg.Desc=first line\n"
        "  second line\n"
        "\n");
    EXPECT_EQ(p.at("pkg.revision"), "30.0.3");
    EXPECT_EQ(p.at("pkg.path"), "build-tools;30.0.3");
    EXPECT_EQ(p.at("pkg.desc"), "first line\nsecond line");
    EXPECT_EQ(p.count("#comment"), 0u);
}

TEST(ManifestTest, ClassifiesByFileName) {
    EXPECT_EQ(classify_url(REPO + "build-tools_r30.0.3-linux.zip"), PackageFamily::BuildTools);
    EXPECT_EQ(classify_url(REPO + "cmake-3.18.1-linux.zip"), PackageFamily::CMake);
    EXPECT_EQ(classify_url(REPO + "commandlinetools-linux-8512546_latest.zip"), PackageFamily::CmdlineTools);
    EXPECT_EQ(classify_url(REPO + "emulator-linux_x64-9322596.zip"), PackageFamily::Emulator);
    EXPECT_EQ(classify_url(REPO + "android_m2repository_r47.zip"), PackageFamily::M2Repository);
    EXPECT_EQ(classify_url(REPO + "android-ndk-r25b-linux.zip"), PackageFamily::Ndk);
    EXPECT_EQ(classify_url(REPO + "platform-tools_r33.0.3-linux.zip"), PackageFamily::PlatformTools);
    EXPECT_EQ(classify_url(REPO + "platform-33_r02.zip"), PackageFamily::Platforms);
    EXPECT_EQ(classify_url(REPO + "android-2.3.3_r02.zip"), PackageFamily::Platforms);
    EXPECT_EQ(classify_url(REPO + "skiaparser-7478287-linux.zip"), PackageFamily::SkiaParser);
    EXPECT_EQ(classify_url(REPO + "sdk-tools-linux-4333796.zip"), PackageFamily::Tools);

    EXPECT_FALSE(classify_url(REPO + "build-tools_r30.0.3-linux.tar.gz").has_value());
    EXPECT_FALSE(classify_url(REPO + "sources-33_r01.zip").has_value());
}

TEST(ManifestTest, BuildToolsReplacesSpacesInRevision) {
    const std::string url = REPO + "build-tools_r30-rc2-linux.zip";
    auto n = normalize_entry(PackageFamily::BuildTools, entry(url, "Pkg.Revision=30.0.0 rc2"));
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n->identifier, (PackageIdentifier{"build-tools", "30.0.0-rc2"}));
    EXPECT_EQ(n->revision, parse_revision("30.0.0"));
}

TEST(ManifestTest, PackagePathFamilies) {
    const std::string url = REPO + "cmake-3.18.1-linux.zip";
    auto n = normalize_entry(PackageFamily::CMake, entry(url, "Pkg.Path=cmake;3.18.1\nPkg.Revision=3.18.1"));
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n->identifier, (PackageIdentifier{"cmake", "3.18.1"}));

    auto skia = normalize_entry(PackageFamily::SkiaParser, entry(REPO + "skiaparser-1.zip", "Pkg.Path=skiaparser;1\nPkg.Revision=6"));
    ASSERT_TRUE(skia.has_value());
    EXPECT_EQ(skia->identifier, (PackageIdentifier{"skiaparser", "1"}));
    EXPECT_EQ(skia->revision, parse_revision("6"));
}

TEST(ManifestTest, EmulatorAddsVersionedAlias) {
    auto n = normalize_entry(PackageFamily::Emulator,
                             entry(REPO + "emulator-linux_x64-9322596.zip", "Pkg.Path=emulator\nPkg.Revision=32.1.8"));
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n->identifier, (PackageIdentifier{"emulator"}));
    EXPECT_TRUE(has_alias(*n, {"emulator", "32.1.8"}));
}

TEST(ManifestTest, M2RepositoryRevisionFromFileName) {
    ManifestEntry e{REPO + "android_m2repository_r047.zip", std::nullopt, ""};
    auto n = normalize_entry(PackageFamily::M2Repository, e);
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n->identifier, (PackageIdentifier{"extras", "android", "m2repository"}));
    EXPECT_TRUE(has_alias(*n, {"extras", "android", "m2repository", "047"}));
    EXPECT_TRUE(has_alias(*n, {"extras", "android", "m2repository", "47"}));
    EXPECT_EQ(n->revision, parse_revision("47"));
}

TEST(ManifestTest, NdkWithoutPropertiesSynthesizesRevision) {
    ManifestEntry e{REPO + "android-ndk-r25b-linux.zip", std::nullopt, ""};
    auto n = normalize_entry(PackageFamily::Ndk, e);
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n->identifier, (PackageIdentifier{"ndk", "r25b"}));
    EXPECT_TRUE(has_alias(*n, {"ndk-bundle", "r25b"}));
    EXPECT_EQ(n->revision.numbers, (std::vector<std::uint64_t>{25, 1}));
    EXPECT_FALSE(n->revision.letter.has_value());
}

TEST(ManifestTest, NdkWithUnrecognizedFileNameGetsRevisionOne) {
    ManifestEntry e{REPO + "android-ndk-r10-darwin.zip", std::nullopt, ""};
    auto n = normalize_entry(PackageFamily::Ndk, e);
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n->identifier, (PackageIdentifier{"ndk", "r10"}));
    EXPECT_EQ(n->revision.numbers, (std::vector<std::uint64_t>{1}));
}

TEST(ManifestTest, NdkWithPropertiesRecordsRelease) {
    auto n = normalize_entry(PackageFamily::Ndk,
                             entry(REPO + "android-ndk-r25b-linux.zip", "Pkg.Desc = Android NDK\nPkg.Revision = 25.1.8937393"));
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n->identifier, (PackageIdentifier{"ndk", "25.1.8937393"}));
    EXPECT_TRUE(has_alias(*n, {"ndk-bundle", "25.1.8937393"}));
    EXPECT_TRUE(has_alias(*n, {"ndk", "r25b"}));
    EXPECT_TRUE(has_alias(*n, {"ndk-bundle", "r25b"}));
    ASSERT_TRUE(n->ndk_release.has_value());
    EXPECT_EQ(n->ndk_release->first, "r25b");
    EXPECT_EQ(n->ndk_release->second, "25.1.8937393");
}

TEST(ManifestTest, PlatformsCombineVersionAndRevision) {
    auto n = normalize_entry(PackageFamily::Platforms,
                             entry(REPO + "platform-29_r05.zip",
                                   "AndroidVersion.ApiLevel=29\nPlatform.Version=10\nPkg.Revision=5"));
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n->identifier, (PackageIdentifier{"platforms", "android-29"}));
    EXPECT_EQ(n->revision, parse_revision("10.5"));
}

TEST(ManifestTest, PlatformPreviewsAreIneligible) {
    auto n = normalize_entry(PackageFamily::Platforms,
                             entry(REPO + "platform-24_r01.zip",
                                   "AndroidVersion.ApiLevel=24\nPlatform.Version=N\nPkg.Revision=1"));
    EXPECT_FALSE(n.has_value());
}

TEST(ManifestTest, ToolsUsesPackagePath) {
    auto plain = normalize_entry(PackageFamily::Tools, entry(REPO + "sdk-tools-linux-4333796.zip", "Pkg.Revision=26.1.1"));
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(plain->identifier, (PackageIdentifier{"tools", "26.1.1"}));

    auto pathed = normalize_entry(PackageFamily::Tools, entry(REPO + "tools_r25.2.5-linux.zip", "Pkg.Path=tools\nPkg.Revision=25.2.5"));
    ASSERT_TRUE(pathed.has_value());
    EXPECT_EQ(pathed->identifier, (PackageIdentifier{"tools", "25.2.5"}));
}

TEST(ManifestTest, MissingFieldsAreSkipped) {
    EXPECT_FALSE(normalize_entry(PackageFamily::BuildTools, entry(REPO + "build-tools_r1.zip", "Pkg.Desc=none")).has_value());
    EXPECT_FALSE(normalize_entry(PackageFamily::CMake, entry(REPO + "cmake-1.zip", "Pkg.Revision=1")).has_value());
    EXPECT_FALSE(normalize_entry(PackageFamily::PlatformTools, ManifestEntry{REPO + "platform-tools_r1.zip", std::nullopt, ""}).has_value());
    EXPECT_FALSE(normalize_entry(PackageFamily::Platforms, entry(REPO + "platform-29_r01.zip", "Pkg.Revision=1")).has_value());
}
