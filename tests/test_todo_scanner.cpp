#include <notevault/core/todo_scanner.hpp>
#include <notevault/core/limits.hpp>

#include "test_helpers.hpp"

using namespace notevault;
using namespace notevault::testutil;

TEST(TodoPattern, MatchesOnlyOpenItemsWithText) {
    EXPECT_TRUE(is_open_todo("- [ ] buy milk"));
    EXPECT_TRUE(is_open_todo("    - [ ] indented"));
    EXPECT_TRUE(is_open_todo("text - [ ] inline"));
    EXPECT_FALSE(is_open_todo("- [x] done"));
    EXPECT_FALSE(is_open_todo("- [X] done"));
    EXPECT_FALSE(is_open_todo("- [ ] "));
    EXPECT_FALSE(is_open_todo("- [ ]"));
    EXPECT_FALSE(is_open_todo("-[ ] no space"));
    EXPECT_FALSE(is_open_todo("- [ ] \r"));
    EXPECT_TRUE(is_open_todo("- [ ] x\r"));
}

TEST(TodoScanner, BlankItemInCrlfFileIsNotATodo) {
    TempVault vault;
    create_file(vault.path(), "crlf.md", "- [ ] \r\n- [ ] real\r\n");

    std::vector<TodoRecord> todos;
    ASSERT_TRUE(scan_todos(vault.path(), todos));
    ASSERT_EQ(todos.size(), 1u);
    EXPECT_EQ(todos[0].line, "- [ ] real");
}

TEST(TodoScanner, CollectsTrimmedLinesInOrder) {
    TempVault vault;
    set_mtime(create_file(vault.path(), "old.md",
        "# Old\n- [ ] first old\n- [x] closed\n  - [ ] second old  \n"), 1000);
    set_mtime(create_file(vault.path(), "projects/new.md",
        "- [ ] newest task\r\n"), 2000);

    std::vector<TodoRecord> todos;
    ASSERT_TRUE(scan_todos(vault.path(), todos));
    ASSERT_EQ(todos.size(), 3u);
    EXPECT_EQ(todos[0].path, "projects/new.md");
    EXPECT_EQ(todos[0].line, "- [ ] newest task");
    EXPECT_EQ(todos[1].path, "old.md");
    EXPECT_EQ(todos[1].line, "- [ ] first old");
    EXPECT_EQ(todos[2].line, "- [ ] second old");
}

TEST(TodoScanner, OnlyMarkdownFiles) {
    TempVault vault;
    create_file(vault.path(), "list.txt", "- [ ] in txt\n");
    create_file(vault.path(), "upper.MD", "- [ ] in upper\n");
    create_file(vault.path(), "note.md", "- [ ] in md\n");

    std::vector<TodoRecord> todos;
    ASSERT_TRUE(scan_todos(vault.path(), todos));
    ASSERT_EQ(todos.size(), 1u);
    EXPECT_EQ(todos[0].path, "note.md");
}

TEST(TodoScanner, IgnoresSymlinksAndDotPaths) {
    TempVault vault;
    TempVault outside;
    std::string secret = create_file(outside.path(), "secret.md", "- [ ] outside task\n");
    create_symlink(vault.path(), "linked.md", secret);
    create_symlink(vault.path(), "linked-dir", outside.path());
    create_file(vault.path(), ".trash/old.md", "- [ ] trashed\n");

    std::vector<TodoRecord> todos;
    ASSERT_TRUE(scan_todos(vault.path(), todos));
    EXPECT_TRUE(todos.empty());
}

TEST(TodoScanner, SkipsOversizeFiles) {
    TempVault vault;
    std::string big = create_file(vault.path(), "big.md", "- [ ] hidden in big file\n");
    ASSERT_EQ(truncate(big.c_str(), static_cast<off_t>(limits::kMaxReadBytes) + 1), 0);
    create_file(vault.path(), "small.md", "- [ ] visible\n");

    std::vector<TodoRecord> todos;
    ASSERT_TRUE(scan_todos(vault.path(), todos));
    ASSERT_EQ(todos.size(), 1u);
    EXPECT_EQ(todos[0].path, "small.md");
}

TEST(TodoScanner, EmptyVault) {
    TempVault vault;
    std::vector<TodoRecord> todos;
    ASSERT_TRUE(scan_todos(vault.path(), todos));
    EXPECT_TRUE(todos.empty());
}
