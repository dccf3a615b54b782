#include <notevault/core/file_writer.hpp>
#include <notevault/core/limits.hpp>

#include "test_helpers.hpp"

using namespace notevault;
using namespace notevault::testutil;

namespace {

GuardResult write_to(const TempVault& vault, const std::string& rel, const std::string& content,
                     WriteOutcome* outcome = nullptr) {
    WriteOutcome tmp = WriteOutcome::Created;
    GuardResult r = write_file(vault.path(), rel, content, tmp);
    if (outcome) *outcome = tmp;
    return r;
}

} // namespace

TEST(FileWriter, CreatesNewFile) {
    TempVault vault;
    WriteOutcome outcome = WriteOutcome::Updated;
    ASSERT_TRUE(write_to(vault, "notes/hello.md", "hello", &outcome));
    EXPECT_EQ(outcome, WriteOutcome::Created);
    EXPECT_EQ(read_file(vault.abs("notes/hello.md")), "hello");

    struct stat st;
    ASSERT_EQ(lstat(vault.abs("notes/hello.md").c_str(), &st), 0);
    EXPECT_TRUE(S_ISREG(st.st_mode));
}

TEST(FileWriter, UpdatesExistingFile) {
    TempVault vault;
    create_file(vault.path(), "existing.md", "old content that is longer");

    WriteOutcome outcome = WriteOutcome::Created;
    ASSERT_TRUE(write_to(vault, "existing.md", "new", &outcome));
    EXPECT_EQ(outcome, WriteOutcome::Updated);
    EXPECT_EQ(read_file(vault.abs("existing.md")), "new");
}

TEST(FileWriter, UpdateDetectionUsesNormalizedPath) {
    TempVault vault;
    create_file(vault.path(), "notes/a.md", "old");

    WriteOutcome outcome = WriteOutcome::Created;
    ASSERT_TRUE(write_to(vault, "notes//a.md", "new", &outcome));
    EXPECT_EQ(outcome, WriteOutcome::Updated);
}

TEST(FileWriter, CreatesIntermediateDirectories) {
    TempVault vault;
    ASSERT_TRUE(write_to(vault, "new/deep/dir/file.md", "deep"));
    EXPECT_EQ(read_file(vault.abs("new/deep/dir/file.md")), "deep");
}

TEST(FileWriter, EmptyContentAllowed) {
    TempVault vault;
    ASSERT_TRUE(write_to(vault, "empty.md", ""));
    EXPECT_TRUE(path_exists(vault.abs("empty.md")));
    EXPECT_EQ(read_file(vault.abs("empty.md")), "");
}

TEST(FileWriter, ContentCeiling) {
    TempVault vault;
    EXPECT_TRUE(write_to(vault, "exact.md", std::string(limits::kMaxWriteBytes, 'x')));

    GuardResult r = write_to(vault, "over.md", std::string(limits::kMaxWriteBytes + 1, 'x'));
    EXPECT_FALSE(r);
    EXPECT_EQ(r.code, GuardError::InvalidArgument);
    EXPECT_FALSE(path_exists(vault.abs("over.md")));
}

TEST(FileWriter, RejectsTraversal) {
    TempVault vault;
    EXPECT_EQ(write_to(vault, "../../etc/passwd.md", "pwned").code, GuardError::DotSegment);
    EXPECT_EQ(write_to(vault, "notes/../../../etc/shadow.md", "pwned").code, GuardError::DotSegment);
    EXPECT_EQ(write_to(vault, "/etc/passwd.md", "pwned").code, GuardError::Containment);
}

TEST(FileWriter, RejectsDotPathsAndBadExtensions) {
    TempVault vault;
    EXPECT_EQ(write_to(vault, ".obsidian/plugins/evil/main.js", "x").code, GuardError::DotSegment);
    EXPECT_EQ(write_to(vault, ".git/hooks/pre-commit", "x").code, GuardError::DotSegment);
    EXPECT_EQ(write_to(vault, "evil.sh", "x").code, GuardError::Extension);
    EXPECT_EQ(write_to(vault, "Makefile", "x").code, GuardError::Extension);
    EXPECT_FALSE(path_exists(vault.abs(".obsidian")));
    EXPECT_FALSE(path_exists(vault.abs("evil.sh")));
}

TEST(FileWriter, RejectsSymlinkTargetAndKeepsOriginal) {
    TempVault vault;
    std::string real = create_file(vault.path(), "real.md", "original");
    create_symlink(vault.path(), "link.md", real);

    GuardResult r = write_to(vault, "link.md", "overwrite");
    EXPECT_EQ(r.code, GuardError::SymlinkTarget);
    EXPECT_EQ(r.message, "Cannot write to a symbolic link.");
    EXPECT_EQ(read_file(real), "original");
}

TEST(FileWriter, RejectsSymlinkPointingOutside) {
    TempVault vault;
    TempVault outside;
    std::string target = create_file(outside.path(), "target.md", "outside");
    create_symlink(vault.path(), "escape.md", target);

    EXPECT_EQ(write_to(vault, "escape.md", "pwned").code, GuardError::SymlinkTarget);
    EXPECT_EQ(read_file(target), "outside");
}

TEST(FileWriter, RejectsSymlinkedParentDirectory) {
    TempVault vault;
    TempVault outside;
    create_symlink(vault.path(), "linked-dir", outside.path());

    GuardResult r = write_to(vault, "linked-dir/payload.md", "escaped");
    EXPECT_EQ(r.code, GuardError::SymlinkedParent);
    EXPECT_EQ(r.message, "Cannot write through a symlinked directory.");
    EXPECT_FALSE(path_exists(outside.abs("payload.md")));

    r = write_to(vault, "linked-dir/new/sub/payload.md", "escaped");
    EXPECT_EQ(r.code, GuardError::SymlinkedParent);
    EXPECT_FALSE(path_exists(outside.abs("new")));
}

TEST(FileWriter, RegularSubdirectoryAllowed) {
    TempVault vault;
    ASSERT_EQ(mkdir(vault.abs("real-dir").c_str(), 0755), 0);
    EXPECT_TRUE(write_to(vault, "real-dir/note.md", "safe"));
}

TEST(FileWriter, ParentIsRegularFileFailsGenerically) {
    TempVault vault;
    create_file(vault.path(), "note.md", "x");

    GuardResult r = write_to(vault, "note.md/child.md", "y");
    EXPECT_FALSE(r);
    EXPECT_EQ(r.code, GuardError::UnexpectedIO);
    EXPECT_FALSE(r.is_safe_to_echo());
}

TEST(FileWriter, FifoTargetFailsWithoutBlocking) {
    TempVault vault;
    ASSERT_EQ(mkfifo(vault.abs("pipe.md").c_str(), 0644), 0);

    GuardResult r = write_to(vault, "pipe.md", "x");
    EXPECT_FALSE(r);
    EXPECT_EQ(r.code, GuardError::UnexpectedIO);
    EXPECT_FALSE(r.is_safe_to_echo());

    // With a reader attached the open succeeds, but the target is still
    // not a regular file
    int reader = open(vault.abs("pipe.md").c_str(), O_RDONLY | O_NONBLOCK);
    ASSERT_GE(reader, 0);
    r = write_to(vault, "pipe.md", "x");
    EXPECT_EQ(r.code, GuardError::UnexpectedIO);
    close(reader);

    EXPECT_TRUE(write_to(vault, "after.md", "still serving"));
}

TEST(FileWriter, DepthLimits) {
    TempVault vault;
    EXPECT_EQ(write_to(vault, "a/b/c/d/e/f/g/h/i/j/k/file.md", "x").code, GuardError::PathDepth);
    EXPECT_TRUE(write_to(vault, "a/b/c/d/e/f/g/h/i/file.md", "x"));
}
