#include <notevault/core/file_reader.hpp>
#include <notevault/core/limits.hpp>

#include "test_helpers.hpp"

using namespace notevault;
using namespace notevault::testutil;

namespace {

std::string render(const std::string& root, const std::vector<std::string>& names) {
    std::string out;
    GuardResult r = read_files_by_name(root, names, out);
    EXPECT_TRUE(r) << r.message;
    return out;
}

} // namespace

TEST(BoundedReader, ReadsRegularFile) {
    TempVault vault;
    create_file(vault.path(), "notes/a.md", "hello\nworld");

    std::string content;
    ASSERT_TRUE(read_bounded(vault.path(), "notes/a.md", content));
    EXPECT_EQ(content, "hello\nworld");
}

TEST(BoundedReader, RejectsEscapingPath) {
    TempVault vault;
    std::string content;
    GuardResult r = read_bounded(vault.path(), "../etc/passwd", content);
    EXPECT_FALSE(r);
    EXPECT_EQ(r.code, GuardError::Containment);
}

TEST(BoundedReader, RejectsSymlink) {
    TempVault vault;
    std::string real = create_file(vault.path(), "real.md", "x");
    create_symlink(vault.path(), "link.md", real);

    std::string content;
    EXPECT_EQ(read_bounded(vault.path(), "link.md", content).code, GuardError::SymlinkTarget);
}

TEST(BoundedReader, EnforcesSizeCeiling) {
    TempVault vault;
    std::string full = create_file(vault.path(), "big.md", "");
    ASSERT_EQ(truncate(full.c_str(), static_cast<off_t>(limits::kMaxReadBytes) + 1), 0);

    std::string content;
    GuardResult r = read_bounded(vault.path(), "big.md", content);
    EXPECT_FALSE(r);
    EXPECT_EQ(r.code, GuardError::TooLarge);
    EXPECT_EQ(r.message, "File too large to read (limit is 10 MiB).");
    EXPECT_TRUE(content.empty());
}

TEST(BoundedReader, AcceptsFileAtCeiling) {
    TempVault vault;
    std::string full = create_file(vault.path(), "edge.md", "");
    ASSERT_EQ(truncate(full.c_str(), static_cast<off_t>(limits::kMaxReadBytes)), 0);

    std::string content;
    ASSERT_TRUE(read_bounded(vault.path(), "edge.md", content));
    EXPECT_EQ(content.size(), limits::kMaxReadBytes);
}

TEST(ResolveNames, LookupOrder) {
    std::vector<std::string> inventory;
    inventory.push_back("notes/Meeting.md");
    inventory.push_back("daily/2024-01-01.md");
    inventory.push_back("projects/meeting-notes.md");

    std::vector<std::string> names;
    names.push_back("notes/Meeting.md");   // exact
    names.push_back("NOTES/meeting.MD");   // case-insensitive
    names.push_back("2024");               // partial on base name
    names.push_back("daily");              // directory names do not count
    std::vector<NameMatch> m = resolve_names(inventory, names);

    ASSERT_EQ(m.size(), 4u);
    ASSERT_EQ(m[0].paths.size(), 1u);
    EXPECT_EQ(m[0].paths[0], "notes/Meeting.md");
    EXPECT_FALSE(m[0].partial);

    ASSERT_EQ(m[1].paths.size(), 1u);
    EXPECT_EQ(m[1].paths[0], "notes/Meeting.md");
    EXPECT_FALSE(m[1].partial);

    ASSERT_EQ(m[2].paths.size(), 1u);
    EXPECT_EQ(m[2].paths[0], "daily/2024-01-01.md");
    EXPECT_TRUE(m[2].partial);

    EXPECT_FALSE(m[3].found());
}

TEST(ResolveNames, CaseInsensitiveTiePicksOldest) {
    // Inventory order is newest first
    std::vector<std::string> inventory;
    inventory.push_back("Notes/Plan.md");
    inventory.push_back("notes/plan.md");

    std::vector<NameMatch> m = resolve_names(inventory, std::vector<std::string>(1, "NOTES/PLAN.MD"));
    ASSERT_EQ(m.size(), 1u);
    ASSERT_EQ(m[0].paths.size(), 1u);
    EXPECT_EQ(m[0].paths[0], "notes/plan.md");
    EXPECT_FALSE(m[0].partial);
}

TEST(ResolveNames, PartialMatchesAreCapped) {
    std::vector<std::string> inventory;
    for (int i = 0; i < 8; ++i) {
        inventory.push_back("log-" + std::to_string(i) + ".md");
    }
    std::vector<NameMatch> m = resolve_names(inventory, std::vector<std::string>(1, "LOG"));

    ASSERT_EQ(m.size(), 1u);
    ASSERT_EQ(m[0].paths.size(), limits::kMaxPartialMatches);
    EXPECT_EQ(m[0].paths[0], "log-0.md");
    EXPECT_EQ(m[0].paths[4], "log-4.md");
    EXPECT_EQ(m[0].suppressed, 3u);
}

TEST(ReadFilesByName, RendersBlocks) {
    TempVault vault;
    set_mtime(create_file(vault.path(), "a.md", "alpha"), 2000);
    set_mtime(create_file(vault.path(), "sub/b.md", "beta"), 1000);

    std::vector<std::string> names;
    names.push_back("a.md");
    names.push_back("B.MD");
    names.push_back("missing.md");

    EXPECT_EQ(render(vault.path(), names),
              "# File: a.md\n\nalpha\n\n"
              "# File: sub/b.md\n\nbeta\n\n"
              "# File: missing.md\n\nFile not found in vault.");
}

TEST(ReadFilesByName, EmptyListMessage) {
    TempVault vault;
    create_file(vault.path(), "a.md", "alpha");
    EXPECT_EQ(render(vault.path(), std::vector<std::string>()),
              "No matching files found in the vault.");
}

TEST(ReadFilesByName, SymlinksAndDotFilesAreNotFound) {
    TempVault vault;
    TempVault outside;
    std::string secret = create_file(outside.path(), "secret.md", "top secret");
    create_symlink(vault.path(), "secret.md", secret);
    create_file(vault.path(), ".obsidian/config.json", "{\"k\": 1}");

    std::vector<std::string> names;
    names.push_back("secret.md");
    names.push_back(".obsidian/config.json");
    std::string out = render(vault.path(), names);

    EXPECT_FALSE(contains(out, "top secret"));
    EXPECT_FALSE(contains(out, "\"k\""));
    EXPECT_EQ(out,
              "# File: secret.md\n\nFile not found in vault.\n\n"
              "# File: .obsidian/config.json\n\nFile not found in vault.");
}

TEST(ReadFilesByName, TraversalNamesAreNotFound) {
    TempVault vault;
    create_file(vault.path(), "a.md", "alpha");
    std::string out = render(vault.path(), std::vector<std::string>(1, "../../etc/passwd"));
    EXPECT_EQ(out, "# File: ../../etc/passwd\n\nFile not found in vault.");
}

TEST(ReadFilesByName, OversizeFileReportedInline) {
    TempVault vault;
    std::string big = create_file(vault.path(), "big.md", "");
    ASSERT_EQ(truncate(big.c_str(), static_cast<off_t>(limits::kMaxReadBytes) + 10), 0);
    set_mtime(big, 2000);
    set_mtime(create_file(vault.path(), "small.md", "tiny"), 1000);

    std::vector<std::string> names;
    names.push_back("big.md");
    names.push_back("small.md");
    EXPECT_EQ(render(vault.path(), names),
              "# File: big.md\n\nFile too large to read (limit is 10 MiB).\n\n"
              "# File: small.md\n\ntiny");
}

TEST(ReadFilesByName, SuppressedPartialMatchesNote) {
    TempVault vault;
    for (int i = 0; i < 7; ++i) {
        std::string name = "meeting-" + std::to_string(i) + ".md";
        set_mtime(create_file(vault.path(), name, "m" + std::to_string(i)), 1000 + i);
    }

    std::string out = render(vault.path(), std::vector<std::string>(1, "meeting"));
    // Newest first: 6, 5, 4, 3, 2 are shown
    EXPECT_TRUE(contains(out, "# File: meeting-6.md\n\nm6"));
    EXPECT_TRUE(contains(out, "# File: meeting-2.md\n\nm2"));
    EXPECT_FALSE(contains(out, "# File: meeting-1.md"));
    EXPECT_TRUE(contains(out,
        "# Note: 2 more files match \"meeting\" and were not shown. "
        "Please use a more specific name."));
}

TEST(ReadFilesByName, SingleSuppressedMatchNote) {
    TempVault vault;
    for (int i = 0; i < 6; ++i) {
        create_file(vault.path(), "draft-" + std::to_string(i) + ".md", "d");
    }
    std::string out = render(vault.path(), std::vector<std::string>(1, "draft"));
    EXPECT_TRUE(contains(out,
        "# Note: 1 more file matches \"draft\" and was not shown. "
        "Please use a more specific name."));
}
