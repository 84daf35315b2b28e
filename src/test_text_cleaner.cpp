#include "ocrbatch/TextCleaner.hpp"

#include <gtest/gtest.h>

using namespace ocrbatch;

TEST(CleanText, EmptyInputStaysEmpty) {
  EXPECT_EQ("", cleanText(""));
  EXPECT_EQ("", cleanText("  \n\t\r\n  "));
}

TEST(CleanText, TrimsAndCollapsesWhitespaceInsideLines) {
  EXPECT_EQ("hello world", cleanText("   hello \t   world   "));
  EXPECT_EQ("a b c", cleanText("a\t\tb\f\vc"));
}

TEST(CleanText, DropsEmptyLines) {
  EXPECT_EQ("first\nsecond\nthird",
            cleanText("\n\nfirst\n\n\n   \nsecond\n\t\nthird\n\n"));
}

TEST(CleanText, HandlesAllLineEndings) {
  EXPECT_EQ("one\ntwo\nthree\nfour", cleanText("one\r\ntwo\rthree\nfour"));
}

TEST(CleanText, RemovesReplacementCharacters) {
  EXPECT_EQ("abc", cleanText("a\xEF\xBF\xBD"
                             "bc"));
  EXPECT_EQ("x y", cleanText("x \xEF\xBF\xBD y"));
  EXPECT_EQ("", cleanText("\xEF\xBF\xBD\n\xEF\xBF\xBD"));
}

TEST(CleanText, KeepsCyrillicText) {
  std::string raw = "  Привет,   мир!  \n\n Вторая строка ";
  EXPECT_EQ("Привет, мир!\nВторая строка", cleanText(raw));
}

TEST(CleanText, IsIdempotent) {
  const char *samples[] = {
      "  Lorem   ipsum \n\n\n dolor\r\nsit\tamet  ",
      "\xEF\xBF\xBD  leading\n  trailing  \n",
      "single",
      "",
      "a\n\n\n\nb\r\r\rc",
  };
  for (const char *sample : samples) {
    std::string once = cleanText(sample);
    EXPECT_EQ(once, cleanText(once)) << sample;
  }
}
