// File: tests/unit/ArtifactLocatorTests.cpp
// Purpose: Validate exactly-one-per-category artifact resolution.
// Key invariants: Missing and duplicate categories are reported with the
//                 directory and category; unrelated files are ignored.
// Ownership/Lifetime: Tests own their scratch directories.
// Links: build/ArtifactLocator.hpp

#include <gtest/gtest.h>

#include "build/ArtifactLocator.hpp"
#include "support/logger.hpp"
#include "tests/common/TempDir.hpp"

#include <filesystem>
#include <sstream>
#include <string>

using namespace screeps;
using namespace screeps::build;

TEST(ArtifactLocator, FindsOneOfEach)
{
    test::TempDir tmp;
    test::writeFile(tmp.path() / "out.wasm", "wasm");
    test::writeFile(tmp.path() / "out.js", "js");

    auto found = scanArtifacts(tmp.path(), defaultExtensionMap());
    ASSERT_TRUE(found.hasValue()) << found.error().message;
    EXPECT_EQ(found.value().size(), 2u);
    EXPECT_EQ(found.value().at(ArtifactKind::BinaryModule), tmp.path() / "out.wasm");
    EXPECT_EQ(found.value().at(ArtifactKind::LoaderScript), tmp.path() / "out.js");
}

TEST(ArtifactLocator, IgnoresUnrecognisedEntriesAndDirectories)
{
    test::TempDir tmp;
    test::writeFile(tmp.path() / "app.wasm", "wasm");
    test::writeFile(tmp.path() / "app.js", "js");
    test::writeFile(tmp.path() / "app.d", "deps");
    test::writeFile(tmp.path() / "README", "text");
    std::filesystem::create_directories(tmp.path() / "build.js");
    std::filesystem::create_directories(tmp.path() / "deps");

    std::ostringstream err;
    support::Logger log(err, true);
    auto found = scanArtifacts(tmp.path(), defaultExtensionMap(), &log);
    ASSERT_TRUE(found.hasValue()) << found.error().message;
    EXPECT_EQ(found.value().at(ArtifactKind::LoaderScript), tmp.path() / "app.js");
    EXPECT_NE(err.str().find("note: ignoring"), std::string::npos);
    EXPECT_NE(err.str().find("app.d"), std::string::npos);
    EXPECT_EQ(log.problemCount(), 0u);
}

TEST(ArtifactLocator, MissingWasmIsReported)
{
    test::TempDir tmp;
    test::writeFile(tmp.path() / "out.js", "js");

    auto found = scanArtifacts(tmp.path(), defaultExtensionMap());
    ASSERT_FALSE(found.hasValue());
    EXPECT_EQ(found.error().code, support::DiagCode::MissingArtifact);
    EXPECT_NE(found.error().message.find("wasm"), std::string::npos);
    EXPECT_NE(found.error().message.find(tmp.path().string()), std::string::npos);
}

TEST(ArtifactLocator, MissingJsIsReported)
{
    test::TempDir tmp;
    test::writeFile(tmp.path() / "out.wasm", "wasm");

    auto found = scanArtifacts(tmp.path(), defaultExtensionMap());
    ASSERT_FALSE(found.hasValue());
    EXPECT_EQ(found.error().code, support::DiagCode::MissingArtifact);
    EXPECT_NE(found.error().message.find("no js files"), std::string::npos);
}

TEST(ArtifactLocator, DuplicateWasmIsAmbiguous)
{
    test::TempDir tmp;
    test::writeFile(tmp.path() / "a.wasm", "a");
    test::writeFile(tmp.path() / "b.wasm", "b");
    test::writeFile(tmp.path() / "a.js", "js");

    auto found = scanArtifacts(tmp.path(), defaultExtensionMap());
    ASSERT_FALSE(found.hasValue());
    EXPECT_EQ(found.error().code, support::DiagCode::AmbiguousArtifact);
    EXPECT_NE(found.error().message.find("multiple wasm files"), std::string::npos);
    EXPECT_NE(found.error().message.find("a.wasm b.wasm"), std::string::npos);
}

TEST(ArtifactLocator, DuplicateJsIsAmbiguous)
{
    test::TempDir tmp;
    test::writeFile(tmp.path() / "a.wasm", "a");
    test::writeFile(tmp.path() / "one.js", "1");
    test::writeFile(tmp.path() / "two.js", "2");
    test::writeFile(tmp.path() / "three.js", "3");

    auto found = scanArtifacts(tmp.path(), defaultExtensionMap());
    ASSERT_FALSE(found.hasValue());
    EXPECT_EQ(found.error().code, support::DiagCode::AmbiguousArtifact);
    EXPECT_NE(found.error().message.find("multiple js files"), std::string::npos);
}

TEST(ArtifactLocator, MissingDirectoryReportsMissingArtifact)
{
    test::TempDir tmp;
    auto found = scanArtifacts(tmp.path() / "nope", defaultExtensionMap());
    ASSERT_FALSE(found.hasValue());
    EXPECT_EQ(found.error().code, support::DiagCode::MissingArtifact);
}

TEST(ArtifactLocator, ClassifyDirectoryIsSorted)
{
    test::TempDir tmp;
    test::writeFile(tmp.path() / "z.js", "");
    test::writeFile(tmp.path() / "a.txt", "");
    test::writeFile(tmp.path() / "m.wasm", "");

    auto files = classifyDirectory(tmp.path(), defaultExtensionMap());
    ASSERT_TRUE(files.hasValue());
    ASSERT_EQ(files.value().size(), 3u);
    EXPECT_EQ(files.value()[0].kind, ArtifactKind::Ignored);
    EXPECT_EQ(files.value()[1].kind, ArtifactKind::BinaryModule);
    EXPECT_EQ(files.value()[2].kind, ArtifactKind::LoaderScript);
}
