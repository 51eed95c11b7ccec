#include "contentflow/exception.hpp"

#include <gtest/gtest.h>

#include "contentflow/invalid_argument_exception.hpp"

namespace contentflow {

TEST(ExceptionTest, InfoTakenFromConstCharStar) {
  EXPECT_STREQ(exception("This string can fill the inline storage").what(), "This string can fill the inline storage");
}

TEST(ExceptionTest, FormatUntruncated) {
  EXPECT_STREQ(exception("Decoder buffer of {} bytes is smaller than {}", 12, 64).what(),
               "Decoder buffer of 12 bytes is smaller than 64");
}

TEST(ExceptionTest, FormatTruncated) {
  EXPECT_STREQ(exception("This is a {} that will not {} and it will be {} because it's too {}. Nowadays the screens "
                         "are wide so we need to increase the max size of the exception.",
                         "string", "fit inside the buffer", "truncated", "long")
                   .what(),
               "This is a string that will not fit inside the buffer and it will be truncated becaus...");
}

TEST(ExceptionTest, InvalidArgumentIsAnException) {
  try {
    throw invalid_argument("maxExpansionRatio must be >= 0, got {}", -1.5);
  } catch (const exception &ex) {
    EXPECT_STREQ(ex.what(), "maxExpansionRatio must be >= 0, got -1.5");
  }
}

}  // namespace contentflow
