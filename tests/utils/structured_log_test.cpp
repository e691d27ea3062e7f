/**
 * @file structured_log_test.cpp
 * @brief Unit tests for StructuredLog line rendering
 */

#include "utils/structured_log.h"

#include <gtest/gtest.h>

#include <string>

using namespace snapkeep::utils;

class StructuredLogTest : public ::testing::Test {
 protected:
  void TearDown() override { StructuredLog::SetFormat(LogFormat::JSON); }
};

TEST_F(StructuredLogTest, JsonLine) {
  StructuredLog::SetFormat(LogFormat::JSON);
  const auto line = StructuredLog()
                        .Event("snapshot_delete_disk")
                        .Field("camera", "front-door")
                        .Field("removed_entries", static_cast<uint64_t>(6))
                        .Build();
  EXPECT_EQ(line, R"({"event":"snapshot_delete_disk","camera":"front-door","removed_entries":"6"})");
}

TEST_F(StructuredLogTest, JsonEscapesQuotesAndControlCharacters) {
  StructuredLog::SetFormat(LogFormat::JSON);
  const auto line = StructuredLog().Field("error", std::string("bad \"name\"\n\x01")).Build();
  EXPECT_EQ(line, R"({"error":"bad \"name\"\n\u0001"})");
}

TEST_F(StructuredLogTest, TextQuotesOnlyWhenNeeded) {
  StructuredLog::SetFormat(LogFormat::TEXT);
  const auto line = StructuredLog()
                        .Event("update_status")
                        .Field("camera", "front-door")
                        .Field("error_total", static_cast<int64_t>(-3))
                        .Field("error", "connection refused")
                        .Build();
  EXPECT_EQ(line, R"(event=update_status camera=front-door error_total=-3 error="connection refused")");
}
