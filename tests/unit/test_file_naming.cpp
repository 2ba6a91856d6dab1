#include <gtest/gtest.h>
#include "nearshare/storage/file_naming.hpp"
#include "nearshare/storage/transferable_file.hpp"
#include <string>
#include <vector>

using namespace nearshare::storage;

class FileNamingTest : public ::testing::Test {
protected:
    static bool has_forbidden(const std::string& name) {
        return name.find_first_of(FORBIDDEN_NAME_CHARACTERS) != std::string::npos;
    }
};

TEST_F(FileNamingTest, KeepsOrdinaryNames) {
    EXPECT_EQ(sanitize_file_name("holiday photo.jpg"), "holiday photo.jpg");
    EXPECT_EQ(sanitize_file_name("résumé.pdf"), "résumé.pdf");
    EXPECT_TRUE(is_safe_file_name("report.txt"));
}

TEST_F(FileNamingTest, ReplacesForbiddenCharacters) {
    EXPECT_EQ(sanitize_file_name("a/b\\c:d*e?f\"g<h>i|j"), "a_b_c_d_e_f_g_h_i_j");
    EXPECT_EQ(sanitize_file_name("../../etc/passwd"), ".._.._etc_passwd");
    EXPECT_FALSE(is_safe_file_name("dir/file"));
}

TEST_F(FileNamingTest, TrimsWhitespace) {
    EXPECT_EQ(sanitize_file_name("  notes.txt \t"), "notes.txt");
}

TEST_F(FileNamingTest, FallsBackToPlaceholder) {
    EXPECT_EQ(sanitize_file_name(""), PLACEHOLDER_FILE_NAME);
    EXPECT_EQ(sanitize_file_name("   "), PLACEHOLDER_FILE_NAME);
    EXPECT_EQ(sanitize_file_name("."), PLACEHOLDER_FILE_NAME);
    EXPECT_EQ(sanitize_file_name(".."), PLACEHOLDER_FILE_NAME);
    EXPECT_FALSE(is_safe_file_name(""));
}

TEST_F(FileNamingTest, TruncatesToMaximumLength) {
    std::string long_name(400, 'x');
    auto result = sanitize_file_name(long_name + ".bin");
    EXPECT_EQ(result.size(), MAX_FILE_NAME_BYTES);
}

TEST_F(FileNamingTest, TruncationKeepsUtf8Sequences) {
    // 254 ASCII bytes followed by a two byte character straddling the limit.
    std::string name(254, 'a');
    name += "\xC3\xA9tail";

    auto result = sanitize_file_name(name);
    EXPECT_EQ(result.size(), 254u);
    EXPECT_EQ(result, std::string(254, 'a'));
}

TEST_F(FileNamingTest, TrailingSpaceAfterTruncationIsTrimmed) {
    std::string name(254, 'b');
    name += "  more";

    auto result = sanitize_file_name(name);
    EXPECT_EQ(result, std::string(254, 'b'));
}

TEST_F(FileNamingTest, Idempotent) {
    std::vector<std::string> samples = {
        "", " ", "..", "a/b", "  x:y  ", std::string(300, 'z'),
        std::string(253, 'q') + " \xE2\x82\xAC", "<>|?*", "normal.txt", " . "
    };

    for (const auto& sample : samples) {
        auto once = sanitize_file_name(sample);
        EXPECT_EQ(sanitize_file_name(once), once) << "input: " << sample;
        EXPECT_FALSE(has_forbidden(once));
        EXPECT_LE(once.size(), MAX_FILE_NAME_BYTES);
        EXPECT_FALSE(once.empty());
    }
}

TEST_F(FileNamingTest, TransferableFileHelpers) {
    TransferableFile file;
    file.name = "bad:name.txt";
    EXPECT_EQ(file.safe_name(), "bad_name.txt");
    EXPECT_EQ(file.mime_or_default(), DEFAULT_MIME_TYPE);

    file.mime_type = "text/plain";
    EXPECT_EQ(file.mime_or_default(), "text/plain");
}
