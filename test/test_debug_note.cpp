#include <gtest/gtest.h>

#include <string.h>

#include "utils/DebugNote.h"

namespace {

TEST(DebugNote, EmptyUntilWritten) {
  DebugNote note;
  EXPECT_EQ(note.get(0), nullptr);
  EXPECT_STREQ(note.text(), "");
  EXPECT_EQ(note.sequence(), 0u);
}

TEST(DebugNote, VisibleForHoldWindow) {
  DebugNote note;
  note.set(1000, "OBSTACLE %.1fcm", 12.5);

  ASSERT_NE(note.get(1000), nullptr);
  EXPECT_STREQ(note.get(1000), "OBSTACLE 12.5cm");
  EXPECT_NE(note.get(2500), nullptr);
  EXPECT_EQ(note.get(2501), nullptr);

  // Still readable for the serial echo
  EXPECT_STREQ(note.text(), "OBSTACLE 12.5cm");
}

TEST(DebugNote, SequenceBumpsOnEveryWrite) {
  DebugNote note;
  note.set(0, "a");
  note.set(0, "a");
  EXPECT_EQ(note.sequence(), 2u);

  note.clear();
  EXPECT_EQ(note.sequence(), 0u);
  EXPECT_EQ(note.get(0), nullptr);
}

TEST(DebugNote, LongTextIsTruncated) {
  DebugNote note;
  char longer[200];
  memset(longer, 'x', sizeof(longer) - 1);
  longer[sizeof(longer) - 1] = '\0';

  note.set(0, "%s", longer);
  EXPECT_EQ(strlen(note.text()), DebugNote::MAX_LEN - 1);
}

}  // namespace
