//===----------------------------------------------------------------------===//
//
// Part of the sshconf project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/io/test_sshconf_file_io.cpp
// Purpose: Exercise reading and writing configuration files on disk.
// Key invariants: Bytes survive read/write unchanged; I/O failures surface as
//                 error diagnostics naming the path.
// Ownership/Lifetime: Each test creates and removes its own temporary files.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "sshconf/io/FileIO.hpp"
#include "sshconf/io/Parser.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using namespace sshconf;

namespace
{
fs::path tempPath(const std::string &name)
{
    return fs::temp_directory_path() / ("sshconf_fileio_" + name);
}
} // namespace

TEST(FileIO, ReadMatchesParsedText)
{
    const std::string text = "# a comment\n"
                             "\t # one more comment \t\r\n"
                             "\t Host example.com \n"
                             "User root\n"
                             "\n";
    const fs::path path = tempPath("read");
    ASSERT_TRUE(io::writeText(path, text));

    auto file = io::readConfigFile(path);
    ASSERT_TRUE(file);
    EXPECT_EQ(file.value(), io::Parser::parse(text, path));

    fs::remove(path);
}

TEST(FileIO, WriteUsesRecordedPath)
{
    const fs::path path = tempPath("write");
    ASSERT_TRUE(io::writeText(path, "Host a\n"));

    auto file = io::readConfigFile(path);
    ASSERT_TRUE(file);
    file.value().lines[0].expression.keyword = "Match";
    ASSERT_TRUE(io::writeConfigFile(file.value()));

    auto text = io::readText(path);
    ASSERT_TRUE(text);
    EXPECT_EQ(text.value(), "Match a\n");

    fs::remove(path);
}

TEST(FileIO, WriteToExplicitPath)
{
    const fs::path path = tempPath("explicit");
    const core::File file = io::Parser::parse("User root\r\nPort 22");
    ASSERT_TRUE(io::writeConfigFile(file, path));

    auto text = io::readText(path);
    ASSERT_TRUE(text);
    EXPECT_EQ(text.value(), "User root\r\nPort 22");

    fs::remove(path);
}

TEST(FileIO, WriteWithoutPathFails)
{
    const core::File file = io::Parser::parse("Host a\n");
    auto result = io::writeConfigFile(file);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().message, "cannot write configuration: file has no path");
}

TEST(FileIO, MissingFileReportsPath)
{
    const fs::path path = tempPath("missing_does_not_exist");
    fs::remove(path);

    auto text = io::readText(path);
    ASSERT_FALSE(text);
    EXPECT_EQ(text.error().severity, support::Severity::Error);
    EXPECT_NE(text.error().message.find("cannot open " + path.generic_string()),
              std::string::npos);

    EXPECT_FALSE(io::readConfigFile(path));
}

TEST(FileIO, DirectoryIsAnError)
{
    const fs::path dir = tempPath("dir");
    fs::create_directories(dir);

    auto text = io::readText(dir);
    ASSERT_FALSE(text);
    EXPECT_EQ(text.error().severity, support::Severity::Error);
    EXPECT_EQ(text.error().message, "cannot read " + dir.generic_string() + ": is a directory");

    auto file = io::readConfigFile(dir);
    ASSERT_FALSE(file);
    EXPECT_EQ(file.error().message, text.error().message);

    fs::remove(dir);
}

TEST(FileIO, UnwritableDirectoryFails)
{
    const fs::path path = tempPath("no_such_dir") / "config";
    EXPECT_FALSE(io::writeText(path, "Host a\n"));
}
