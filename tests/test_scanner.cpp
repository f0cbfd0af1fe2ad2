#include <gtest/gtest.h>
#include "engine/ignore.hpp"
#include "engine/scanner.hpp"
#include "lectern/errors.hpp"
#include "test_support.hpp"

using namespace lectern::engine;
using lectern::test::TempDir;

namespace {

    std::vector<std::string> names(const std::vector<std::filesystem::path>& paths, const std::filesystem::path& root) {
        std::vector<std::string> out;
        for (const auto& p : paths) out.push_back(std::filesystem::relative(p, root).generic_string());
        return out;
    }

}

TEST(Ignore, MatchesGlobsAgainstNames) {
    Ignore ignore;
    ignore.add("*.log");
    ignore.add("cache/");
    ignore.add("draft?.md");

    EXPECT_TRUE(ignore.check("/a/b/server.log"));
    EXPECT_TRUE(ignore.check("/a/cache"));
    EXPECT_TRUE(ignore.check("draft1.md"));
    EXPECT_FALSE(ignore.check("draft10.md"));
    EXPECT_FALSE(ignore.check("/a/b/server.txt"));
    EXPECT_FALSE(ignore.check("xlog"));
}

TEST(Ignore, LoadSkipsCommentsAndBlankLines) {
    TempDir dir;
    auto file = dir.write(".lectern_ignore", "# comment\n\n  *.tmp  \nsecret.txt\n");

    Ignore ignore;
    ignore.load(file);
    EXPECT_EQ(ignore.size(), 2u);
    EXPECT_TRUE(ignore.check("x.tmp"));
    EXPECT_TRUE(ignore.check("secret.txt"));

    ignore.load(dir.path() / "missing");
    EXPECT_EQ(ignore.size(), 2u);
}

TEST(Scanner, CollectsSupportedFilesRecursively) {
    TempDir dir;
    dir.write("a.txt", "a");
    dir.write("b.md", "b");
    dir.write("image.png", "png");
    dir.write("sub/c.py", "c");
    dir.write("sub/deeper/d.json", "{}");
    dir.write(".git/config.txt", "x");
    dir.write("node_modules/pkg/index.js", "x");
    dir.write("lectern.db", "x");

    auto files = Scanner().collect(dir.path(), true);
    EXPECT_EQ(names(files, dir.path()),
              (std::vector<std::string>{"a.txt", "b.md", "sub/c.py", "sub/deeper/d.json"}));
}

TEST(Scanner, NonRecursiveStaysAtTopLevel) {
    TempDir dir;
    dir.write("a.txt", "a");
    dir.write("sub/c.py", "c");

    auto files = Scanner().collect(dir.path(), false);
    EXPECT_EQ(names(files, dir.path()), (std::vector<std::string>{"a.txt"}));
}

TEST(Scanner, HonoursIgnoreFileInRoot) {
    TempDir dir;
    dir.write(".lectern_ignore", "*.md\nprivate\n");
    dir.write("keep.txt", "k");
    dir.write("skip.md", "s");
    dir.write("private/secret.txt", "s");

    auto files = Scanner().collect(dir.path(), true);
    EXPECT_EQ(names(files, dir.path()), (std::vector<std::string>{"keep.txt"}));
}

TEST(Scanner, ExtraPatternsApply) {
    TempDir dir;
    dir.write("a.txt", "a");
    dir.write("b.txt", "b");

    Scanner scanner;
    scanner.ignore().add("b.*");
    EXPECT_EQ(names(scanner.collect(dir.path(), true), dir.path()), (std::vector<std::string>{"a.txt"}));
}

TEST(Scanner, RootMustBeADirectory) {
    TempDir dir;
    auto file = dir.write("a.txt", "a");
    EXPECT_THROW(Scanner().collect(file, true), Error);
    EXPECT_THROW(Scanner().collect(dir.path() / "missing", true), Error);
}
