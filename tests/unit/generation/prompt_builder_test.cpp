#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../../common/mocks_test.hpp"
#include "docu_core/errors.hpp"
#include "docu_core/generation/prompt_builder.hpp"

namespace docu_tests {

using namespace docu_core;
using ::testing::HasSubstr;

class PromptBuilderTest : public ::testing::Test {
 protected:
  GenerationSettings settings_;
};

TEST_F(PromptBuilderTest, FormatSources_NumbersBlocksInOrder) {
  // Arrange
  PromptBuilder builder(settings_);
  auto paragraph = MockUtilities::create_retrieved_chunk("Second excerpt", "notes.md", 3);
  paragraph.provenance.section_kind = SectionKind::Paragraph;
  std::vector<RetrievedChunk> chunks = {
      MockUtilities::create_retrieved_chunk("First excerpt", "report.txt", 2), paragraph};

  // Act
  auto sources = builder.format_sources(chunks);

  // Assert
  EXPECT_EQ(sources,
            "[1] report.txt - Page 2\n\"First excerpt\"\n\n"
            "[2] notes.md - Paragraph 3\n\"Second excerpt\"");
}

TEST_F(PromptBuilderTest, FormatSources_TruncatesLongExcerpts) {
  settings_.excerpt_max_chars = 10;
  PromptBuilder builder(settings_);

  auto sources = builder.format_sources(
      {MockUtilities::create_retrieved_chunk("0123456789abcdef", "long.txt")});

  EXPECT_EQ(sources, "[1] long.txt - Page 1\n\"0123456789...\"");
}

TEST_F(PromptBuilderTest, FormatSources_TruncatesOnCodePointBoundaries) {
  settings_.excerpt_max_chars = 3;
  PromptBuilder builder(settings_);

  auto sources =
      builder.format_sources({MockUtilities::create_retrieved_chunk("日本語のテキスト", "ja.txt")});

  EXPECT_EQ(sources, "[1] ja.txt - Page 1\n\"日本語...\"");
}

TEST_F(PromptBuilderTest, Build_KeepsChunkOrderAndPrompts) {
  // Arrange
  PromptBuilder builder(settings_);
  std::vector<RetrievedChunk> chunks = {
      MockUtilities::create_retrieved_chunk("B text", "b.txt", 1, 0.5f, "b"),
      MockUtilities::create_retrieved_chunk("A text", "a.txt", 1, 0.9f, "a")};

  // Act
  const PromptContext context = builder.build("What happened?", chunks);

  // Assert
  ASSERT_EQ(context.chunks().size(), 2u);
  EXPECT_EQ(context.chunks()[0].id, "b");
  EXPECT_EQ(context.chunks()[1].id, "a");
  EXPECT_EQ(context.query(), "What happened?");
  EXPECT_EQ(context.system_prompt(), PromptBuilder::system_prompt());
  EXPECT_THAT(context.user_prompt(), HasSubstr("Sources:\n[1] b.txt - Page 1\n\"B text\""));
  EXPECT_THAT(context.user_prompt(), HasSubstr("[2] a.txt - Page 1\n\"A text\""));
  EXPECT_THAT(context.user_prompt(), HasSubstr("\n\nQuestion: What happened?\n\n"));
  EXPECT_THAT(context.user_prompt(), HasSubstr("Remember to cite your sources using [1], [2], etc."));
}

TEST_F(PromptBuilderTest, SystemPrompt_RequiresCitations) {
  auto system = PromptBuilder::system_prompt();

  EXPECT_THAT(system, HasSubstr("ALWAYS cite your sources using [1], [2]"));
  EXPECT_THAT(system, HasSubstr("I don't find supporting information in the provided sources."));
}

TEST_F(PromptBuilderTest, Constructor_RejectsNonPositiveExcerptLength) {
  settings_.excerpt_max_chars = 0;
  EXPECT_THROW(PromptBuilder{settings_}, ValidationError);
}

}  // namespace docu_tests
