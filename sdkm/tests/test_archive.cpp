#include <gtest/gtest.h>
#include "archive.hpp"
#include "exception.hpp"
#include "utils.hpp"
#include "zip_fixture.hpp"

#include <algorithm>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

class ArchiveTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_root = fs::temp_directory_path() / ("sdkm_test_archive_" + std::to_string(getpid()));
        fs::remove_all(test_root);
        fs::create_directories(test_root / "out");
        fs::create_directories(test_root / "outside");
        out = test_root / "out";
        zip = test_root / "pkg.zip";

        set_log_sink([this](LogLevel level, std::string_view msg) {
            if (level == LogLevel::WARNING) warnings.emplace_back(msg);
        });
    }

    void TearDown() override {
        set_log_sink(nullptr);
        fs::remove_all(test_root);
    }

    static fs::perms mode_of(const fs::path& p) {
        return fs::status(p).permissions() & fs::perms::mask;
    }

    fs::path test_root;
    fs::path out;
    fs::path zip;
    std::vector<std::string> warnings;
};

TEST_F(ArchiveTest, ExtractsFilesAndNormalizesPermissions) {
    write_zip(zip, {
        ZipMember::dir("tool/"),
        ZipMember::dir("tool/bin/"),
        ZipMember::file("tool/bin/run", "#!/bin/sh\n", 0700),
        ZipMember::file("tool/README", "hello", 0600),
    });

    ExtractionReport report = extract_zip(zip, out);

    EXPECT_EQ(report.top_levels, (std::set<std::string>{"tool"}));
    EXPECT_TRUE(report.dropped.empty());
    ASSERT_TRUE(fs::is_regular_file(out / "tool/README"));
    std::ifstream f(out / "tool/README");
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "hello");

    EXPECT_EQ(mode_of(out / "tool/bin/run"), static_cast<fs::perms>(0755));
    EXPECT_EQ(mode_of(out / "tool/README"), static_cast<fs::perms>(0644));
    EXPECT_EQ(mode_of(out / "tool/bin"), static_cast<fs::perms>(0755));
}

TEST_F(ArchiveTest, RecordsEveryTopLevelName) {
    write_zip(zip, {
        ZipMember::file("a.txt", "a"),
        ZipMember::file("lib/b.txt", "b"),
        ZipMember::file("bin/c", "c", 0755),
    });

    ExtractionReport report = extract_zip(zip, out);
    EXPECT_EQ(report.top_levels, (std::set<std::string>{"a.txt", "bin", "lib"}));
    EXPECT_EQ(report.extracted, 3u);
}

TEST_F(ArchiveTest, KeepsSymlinkResolvingInside) {
    write_zip(zip, {
        ZipMember::file("wrapper/lib/libfoo.so", "elf"),
        ZipMember::symlink("wrapper/lib/libfoo.so.1", "libfoo.so"),
        ZipMember::symlink("wrapper/bin/foo", "../lib/libfoo.so"),
    });

    ExtractionReport report = extract_zip(zip, out);

    EXPECT_TRUE(report.dropped.empty());
    ASSERT_TRUE(fs::is_symlink(out / "wrapper/lib/libfoo.so.1"));
    EXPECT_EQ(fs::read_symlink(out / "wrapper/lib/libfoo.so.1"), "libfoo.so");
    ASSERT_TRUE(fs::is_symlink(out / "wrapper/bin/foo"));
    EXPECT_EQ(fs::read_symlink(out / "wrapper/bin/foo"), "../lib/libfoo.so");
}

TEST_F(ArchiveTest, DropsSymlinkResolvingOutside) {
    write_zip(zip, {
        ZipMember::file("wrapper/ok.txt", "ok"),
        ZipMember::symlink("wrapper/abs", "/etc/passwd"),
        ZipMember::symlink("wrapper/rel", "../../outside"),
    });

    ExtractionReport report = extract_zip(zip, out);

    EXPECT_FALSE(fs::exists(fs::symlink_status(out / "wrapper/abs")));
    EXPECT_FALSE(fs::exists(fs::symlink_status(out / "wrapper/rel")));
    EXPECT_TRUE(fs::exists(out / "wrapper/ok.txt"));

    ASSERT_EQ(report.dropped.size(), 2u);
    EXPECT_EQ(report.dropped[0].name, "wrapper/abs");
    EXPECT_EQ(report.dropped[0].target, "/etc/passwd");
    EXPECT_EQ(report.dropped[1].name, "wrapper/rel");
    EXPECT_EQ(warnings.size(), 2u);
}

TEST_F(ArchiveTest, ChainedSymlinkCannotEscape) {
    write_zip(zip, {
        ZipMember::symlink("a", "b"),
        ZipMember::symlink("b", (test_root / "outside").string()),
        ZipMember::symlink("up", ".."),
    });

    ExtractionReport report = extract_zip(zip, out);

    // "a" dangles once "b" is gone
    EXPECT_TRUE(fs::is_symlink(out / "a"));
    EXPECT_FALSE(fs::exists(out / "a"));
    EXPECT_FALSE(fs::exists(fs::symlink_status(out / "b")));
    EXPECT_FALSE(fs::exists(fs::symlink_status(out / "up")));
    EXPECT_EQ(report.dropped.size(), 2u);
}

TEST_F(ArchiveTest, LinkRedirectedByLaterMemberIsDropped) {
    // "c" dangles when written, then "d" turns it into a path to the parent of out
    write_zip(zip, {
        ZipMember::symlink("c", "d/.."),
        ZipMember::symlink("d", "."),
    });

    ExtractionReport report = extract_zip(zip, out);

    EXPECT_FALSE(fs::exists(fs::symlink_status(out / "c")));
    EXPECT_TRUE(fs::is_symlink(out / "d"));
    ASSERT_EQ(report.dropped.size(), 1u);
    EXPECT_EQ(report.dropped[0].name, "c");
    EXPECT_EQ(report.dropped[0].target, "d/..");
    EXPECT_EQ(report.top_levels, (std::set<std::string>{"d"}));
    EXPECT_EQ(report.extracted, 1u);
    EXPECT_EQ(warnings.size(), 1u);
}

TEST_F(ArchiveTest, FilesNeverLandBehindDroppedLink) {
    const fs::path outside = test_root / "outside";
    write_zip(zip, {
        ZipMember::symlink("escape", outside.string()),
        ZipMember::file("escape/planted.txt", "owned"),
    });

    extract_zip(zip, out);

    EXPECT_FALSE(fs::exists(outside / "planted.txt"));
    EXPECT_FALSE(fs::is_symlink(out / "escape"));
}

TEST_F(ArchiveTest, DropsMembersWithEscapingPaths) {
    write_zip(zip, {
        ZipMember::file("../evil.txt", "evil"),
        ZipMember::file("good.txt", "good"),
    });

    ExtractionReport report = extract_zip(zip, out);

    EXPECT_FALSE(fs::exists(test_root / "evil.txt"));
    EXPECT_TRUE(fs::exists(out / "good.txt"));
    ASSERT_EQ(report.dropped.size(), 1u);
    EXPECT_EQ(report.dropped[0].name, "../evil.txt");
    EXPECT_EQ(report.top_levels, (std::set<std::string>{"good.txt"}));
}

TEST_F(ArchiveTest, RejectsNonZipFile) {
    {
        std::ofstream f(zip);
        f << "this is not a zip file";
    }
    EXPECT_THROW(extract_zip(zip, out), BadArchive);
}

TEST_F(ArchiveTest, BadArchiveCarriesSource) {
    {
        std::ofstream f(zip);
        f << "garbage";
    }
    try {
        extract_zip(zip, out);
        FAIL() << "expected BadArchive";
    } catch (const BadArchive& e) {
        EXPECT_EQ(e.source(), zip.string());
    }
}
