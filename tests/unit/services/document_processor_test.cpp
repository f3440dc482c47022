#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <regex>
#include <string>
#include <vector>

#include "chunkwise_core/errors.hpp"
#include "chunkwise_core/services/content_hasher.hpp"
#include "chunkwise_core/services/document_processor.hpp"
#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

namespace chunkwise_core {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class DocumentProcessorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    converter_ = std::make_shared<NiceMock<chunkwise_tests::MockDocumentConverter>>();
    processor_ = std::make_unique<DocumentProcessor>(converter_);
  }

  std::shared_ptr<NiceMock<chunkwise_tests::MockDocumentConverter>> converter_;
  std::unique_ptr<DocumentProcessor> processor_;
  RequestContext ctx_;
};

// --- process_file ---

TEST_F(DocumentProcessorTest, ProcessFile_ConvertsHashesAndChunks) {
  // Arrange
  const std::string data = "raw bytes of a markdown file";
  EXPECT_CALL(*converter_, convert(_, "notes.md", data))
      .WillOnce(Return(std::string("# Title\n\nHello world")));

  // Act
  ProcessedFile result = processor_->process_file(ctx_, UploadedFile::from_bytes("notes.md", data));

  // Assert
  EXPECT_EQ(result.filename, "notes.md");
  EXPECT_EQ(result.original_size, data.size());
  EXPECT_EQ(result.content_hash, ContentHasher::sha256_hex(data));
  EXPECT_EQ(result.markdown, "# Title\n\nHello world");
  ASSERT_EQ(result.chunks.size(), 1u);
  EXPECT_EQ(result.chunks[0], "# Title\n\nHello world");
  EXPECT_EQ(result.id.size(), 36u);
}

TEST_F(DocumentProcessorTest, ProcessFile_UsesBaseNameAndIgnoresExtensionCase) {
  EXPECT_CALL(*converter_, convert(_, "Report.PDF", _)).WillOnce(Return(std::string("text")));

  ProcessedFile result =
      processor_->process_file(ctx_, UploadedFile::from_bytes("../../tmp/Report.PDF", "%PDF-1.7"));

  EXPECT_EQ(result.filename, "Report.PDF");
}

TEST_F(DocumentProcessorTest, ProcessFile_RejectsOversizedUploadBeforeConverting) {
  // Arrange
  ProcessorOptions options;
  options.max_file_bytes = 10;
  DocumentProcessor processor(converter_, options);
  EXPECT_CALL(*converter_, supported_extensions(_)).Times(0);
  EXPECT_CALL(*converter_, convert(_, _, _)).Times(0);

  // Act & Assert
  try {
    processor.process_file(ctx_, UploadedFile::from_bytes("big.md", std::string(11, 'x')));
    FAIL() << "Expected ValidationError";
  } catch (const ValidationError& e) {
    EXPECT_THAT(e.what(), HasSubstr("file exceeds maximum size"));
    EXPECT_THAT(e.what(), HasSubstr("big.md"));
  }
}

TEST_F(DocumentProcessorTest, ProcessFile_RequiresNameAndExtension) {
  EXPECT_CALL(*converter_, convert(_, _, _)).Times(0);

  EXPECT_THROW(processor_->process_file(ctx_, UploadedFile::from_bytes("", "x")), ValidationError);
  EXPECT_THROW(processor_->process_file(ctx_, UploadedFile::from_bytes("README", "x")),
               ValidationError);
  EXPECT_THROW(processor_->process_file(ctx_, UploadedFile::from_bytes("trailing.", "x")),
               ValidationError);
}

TEST_F(DocumentProcessorTest, ProcessFile_DotfileNameIsItsOwnExtension) {
  EXPECT_CALL(*converter_, convert(_, ".pdf", _)).WillOnce(Return(std::string("text")));

  ProcessedFile result = processor_->process_file(ctx_, UploadedFile::from_bytes(".pdf", "%PDF"));

  EXPECT_EQ(result.filename, ".pdf");
}

TEST_F(DocumentProcessorTest, ProcessFile_RejectsUnsupportedType) {
  EXPECT_CALL(*converter_, convert(_, _, _)).Times(0);

  try {
    processor_->process_file(ctx_, UploadedFile::from_bytes("setup.exe", "MZ"));
    FAIL() << "Expected ValidationError";
  } catch (const ValidationError& e) {
    EXPECT_THAT(e.what(), HasSubstr("unsupported file type: .exe"));
  }
}

TEST_F(DocumentProcessorTest, ProcessFile_FetchesExtensionsOnce) {
  EXPECT_CALL(*converter_, supported_extensions(_))
      .Times(1)
      .WillOnce(Return(std::vector<std::string>{"md"}));
  EXPECT_CALL(*converter_, convert(_, _, _)).WillRepeatedly(Return(std::string("content")));

  processor_->process_file(ctx_, UploadedFile::from_bytes("a.md", "a"));
  processor_->process_file(ctx_, UploadedFile::from_bytes("b.MD", "b"));
}

TEST_F(DocumentProcessorTest, ProcessFile_WrapsConverterFailure) {
  EXPECT_CALL(*converter_, convert(_, _, _)).WillOnce(Throw(ConverterError("bad gateway", 502)));

  try {
    processor_->process_file(ctx_, UploadedFile::from_bytes("notes.md", "data"));
    FAIL() << "Expected ConverterError";
  } catch (const ConverterError& e) {
    EXPECT_THAT(e.what(), HasSubstr("failed to convert file to markdown"));
    EXPECT_THAT(e.what(), HasSubstr("bad gateway"));
    EXPECT_EQ(e.status_code(), 502);
  }
}

TEST_F(DocumentProcessorTest, ProcessFile_BlankConversionIsValidationError) {
  EXPECT_CALL(*converter_, convert(_, _, _)).WillOnce(Return(std::string(" \n\t ")));

  EXPECT_THROW(processor_->process_file(ctx_, UploadedFile::from_bytes("notes.md", "data")),
               ValidationError);
}

TEST_F(DocumentProcessorTest, ProcessFile_ExtensionLoadFailureIsRetried) {
  EXPECT_CALL(*converter_, supported_extensions(_))
      .WillOnce(Throw(ConverterError("connection refused")))
      .WillOnce(Return(std::vector<std::string>{".md"}));
  EXPECT_CALL(*converter_, convert(_, _, _)).WillOnce(Return(std::string("content")));

  try {
    processor_->process_file(ctx_, UploadedFile::from_bytes("notes.md", "data"));
    FAIL() << "Expected ConverterError";
  } catch (const ConverterError& e) {
    EXPECT_THAT(e.what(), HasSubstr("failed to load supported file types"));
  }

  EXPECT_NO_THROW(processor_->process_file(ctx_, UploadedFile::from_bytes("notes.md", "data")));
}

TEST_F(DocumentProcessorTest, ProcessFile_WithoutConverterFails) {
  DocumentProcessor processor(nullptr);

  EXPECT_THROW(processor.process_file(ctx_, UploadedFile::from_bytes("notes.md", "data")),
               ValidationError);
}

TEST_F(DocumentProcessorTest, ProcessFile_UnreadableUploadFails) {
  UploadedFile upload;
  upload.filename = "notes.md";
  upload.size = 4;
  upload.open = []() -> std::unique_ptr<std::istream> { return nullptr; };

  EXPECT_THROW(processor_->process_file(ctx_, upload), ProcessingError);
}

// --- supported extensions ---

TEST_F(DocumentProcessorTest, SupportedExtensions_AreNormalizedAndSorted) {
  EXPECT_CALL(*converter_, supported_extensions(_))
      .WillOnce(Return(std::vector<std::string>{"PDF", " .md", "", ".Docx"}));

  EXPECT_EQ(processor_->get_supported_extensions(ctx_),
            (std::vector<std::string>{".docx", ".md", ".pdf"}));
}

TEST_F(DocumentProcessorTest, SupportedExtensions_InvalidateRefetches) {
  EXPECT_CALL(*converter_, supported_extensions(_))
      .WillOnce(Return(std::vector<std::string>{".md"}))
      .WillOnce(Return(std::vector<std::string>{".pdf"}));

  EXPECT_EQ(processor_->get_supported_extensions(ctx_), std::vector<std::string>{".md"});
  processor_->invalidate_supported_extensions();
  EXPECT_EQ(processor_->get_supported_extensions(ctx_), std::vector<std::string>{".pdf"});
}

// --- process_text ---

TEST_F(DocumentProcessorTest, ProcessText_RejectsEmptyAndBlank) {
  EXPECT_THROW(processor_->process_text(""), ValidationError);
  EXPECT_THROW(processor_->process_text("   \n"), ValidationError);
}

TEST_F(DocumentProcessorTest, ProcessText_RejectsOversizedText) {
  EXPECT_THROW(processor_->process_text(std::string(200001, 'a')), ValidationError);
  EXPECT_NO_THROW(processor_->process_text(std::string(200000, 'a')));
}

TEST_F(DocumentProcessorTest, ProcessText_ChunksInFixedWindows) {
  // Arrange
  const std::string text = std::string(2500, 'a');

  // Act
  ProcessedFile result = processor_->process_text(text);

  // Assert
  EXPECT_EQ(result.chunks.size(), 3u);
  EXPECT_EQ(result.original_size, text.size());
  EXPECT_EQ(result.markdown, text);
  EXPECT_EQ(result.content_hash, ContentHasher::sha256_hex(text));
  EXPECT_TRUE(std::regex_match(result.filename, std::regex(R"(text-\d{8}-\d{6}\.txt)")))
      << result.filename;
}

TEST_F(DocumentProcessorTest, ProcessText_DoesNotTouchConverter) {
  EXPECT_CALL(*converter_, supported_extensions(_)).Times(0);
  EXPECT_CALL(*converter_, convert(_, _, _)).Times(0);

  processor_->process_text("hello world");
}

// --- chunking pass-throughs ---

TEST_F(DocumentProcessorTest, WrapMarkdownWithMetadata_StaysWithinBudget) {
  std::string markdown = "# A\n" + std::string(5000, 'x') + "\n## B\n" + std::string(5000, 'y');

  std::vector<std::string> wrapped = processor_->wrap_markdown_with_metadata(
      markdown, chunkwise_tests::TestUtilities::create_test_address());

  ASSERT_EQ(wrapped.size(), 2u);
  EXPECT_THAT(wrapped[0], HasSubstr("section: \"A\""));
  EXPECT_THAT(wrapped[1], HasSubstr("section: \"B\""));
}

TEST_F(DocumentProcessorTest, ChunkHelpersDelegateToChunkers) {
  EXPECT_EQ(processor_->chunk_text("abcdefghij", 4).size(), 3u);
  EXPECT_EQ(processor_->chunk_markdown("# A\n\none\n\n# B\n\ntwo").size(), 2u);

  ChunkOptions invalid{.max_tokens = 0};
  EXPECT_THROW(processor_->chunk_markdown_with_options("text", invalid), ChunkingError);
}

}  // namespace chunkwise_core
