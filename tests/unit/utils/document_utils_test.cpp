#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "chunkwise_core/errors.hpp"
#include "chunkwise_core/utils/document_utils.hpp"
#include "../../common/utilities_test.hpp"

namespace chunkwise_core {

class DocumentUtilsTest : public ::testing::Test {
 protected:
  static ProcessedFile create_test_processed_file() {
    return {.id = "file-1",
            .filename = "guide.md",
            .original_size = 2048,
            .content_hash = "abc123",
            .markdown = std::string(400, 'm'),
            .chunks = {"one", "two"},
            .processed_at = chunkwise_tests::TestUtilities::fixed_time_point()};
  }
};

TEST_F(DocumentUtilsTest, GenerateFileMetadataSummarizesProcessedFile) {
  // Act
  FileMetadata metadata = generate_file_metadata(create_test_processed_file());

  // Assert
  EXPECT_EQ(metadata.id, "file-1");
  EXPECT_EQ(metadata.filename, "guide.md");
  EXPECT_EQ(metadata.extension, ".md");
  EXPECT_EQ(metadata.size, 2048u);
  EXPECT_EQ(metadata.content_hash, "abc123");
  EXPECT_EQ(metadata.chunk_count, 2u);
  EXPECT_EQ(metadata.token_count, 100u);
}

TEST_F(DocumentUtilsTest, MetadataSerializesToJson) {
  nlohmann::json j = generate_file_metadata(create_test_processed_file());

  EXPECT_EQ(j["hash"], "abc123");
  EXPECT_EQ(j["processed_at"], "2024-05-01T12:00:00Z");
  EXPECT_EQ(j["chunk_count"], 2);
}

TEST_F(DocumentUtilsTest, SourceTypeFromFilename) {
  EXPECT_EQ(get_source_type("text-20240501-120000.txt"), SourceType::Text);
  EXPECT_EQ(get_source_type("text-notes.md"), SourceType::File);
  EXPECT_EQ(get_source_type("website-example.com.md"), SourceType::Website);
  EXPECT_EQ(get_source_type("report.pdf"), SourceType::File);

  EXPECT_EQ(to_string(SourceType::Website), "website");
  EXPECT_EQ(source_type_from_string("text"), SourceType::Text);
  EXPECT_EQ(source_type_from_string("unknown"), SourceType::File);
}

TEST_F(DocumentUtilsTest, StoredFilenamesRoundTrip) {
  std::string stored = generate_stored_filename("owner1", "dir/report.pdf");

  EXPECT_EQ(stored, "owner1-report.pdf");
  EXPECT_EQ(parse_stored_filename(stored, "owner1"), "report.pdf");
  EXPECT_EQ(parse_stored_filename("other-report.pdf", "owner1"), "other-report.pdf");
  EXPECT_EQ(generate_document_id("owner1", "report.pdf", 3), "owner1-report.pdf-3");
}

TEST_F(DocumentUtilsTest, ValidateFilename) {
  EXPECT_NO_THROW(validate_filename("report-2024.final.pdf"));
  EXPECT_THROW(validate_filename(""), ValidationError);
  EXPECT_THROW(validate_filename("   "), ValidationError);
  EXPECT_THROW(validate_filename("../etc/passwd"), ValidationError);
  for (const char* name : {"a/b", "a\\b", "a:b", "a*b", "a?b", "a\"b", "a<b", "a>b", "a|b"}) {
    EXPECT_THROW(validate_filename(name), ValidationError) << name;
  }
}

TEST_F(DocumentUtilsTest, FormatFileSize) {
  EXPECT_EQ(format_file_size(0), "0 B");
  EXPECT_EQ(format_file_size(512), "512 B");
  EXPECT_EQ(format_file_size(1536), "1.5 KB");
  EXPECT_EQ(format_file_size(10 * 1024 * 1024), "10.0 MB");
  EXPECT_EQ(format_file_size(3ULL * 1024 * 1024 * 1024), "3.0 GB");
}

TEST_F(DocumentUtilsTest, CleanMarkdownCollapsesBlankRuns) {
  EXPECT_EQ(clean_markdown("a\n\n\n\nb\n  \n\t\nc"), "a\n\nb\n\nc");
}

TEST_F(DocumentUtilsTest, ExtractTitle) {
  EXPECT_EQ(extract_title("intro\n# My Title \n## Sub"), "My Title");
  EXPECT_EQ(extract_title("## Only Sub"), "");
}

TEST_F(DocumentUtilsTest, CountWordsAndTruncate) {
  EXPECT_EQ(count_words("  one two\tthree\nfour  "), 4u);
  EXPECT_EQ(count_words(""), 0u);

  EXPECT_EQ(truncate_text("short", 10), "short");
  EXPECT_EQ(truncate_text("hello world", 8), "hello...");
  EXPECT_EQ(truncate_text("hello", 2), "...");
}

}  // namespace chunkwise_core
