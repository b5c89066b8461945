#include "sql_rc.h"

#include <sstream>

#include "gtest/gtest.h"

// Test the integer value of the enum
TEST(u32ValueTest, HandlesOk) {
  EXPECT_EQ(0, static_cast<int>(ResultCode::kOk));
}

TEST(u32ValueTest, HandlesFull) {
  EXPECT_EQ(13, static_cast<int>(ResultCode::kFull));
}

TEST(u32ValueTest, IOErrorShortRead) {
  EXPECT_EQ(522, static_cast<u32>(ResultCode::kIOErrorShortRead));
}

TEST(u32ValueTest, ConstraintPrimaryKey) {
  EXPECT_EQ(1555, static_cast<u32>(ResultCode::kConstraintPrimaryKey));
}

// Test the ToString() function
TEST(ToStringTest, HandlesOk) {
  EXPECT_EQ("OK", ToString(ResultCode::kOk));
}

TEST(ToStringTest, HandlesCorrupt) {
  EXPECT_EQ("CORRUPT", ToString(ResultCode::kCorrupt));
}

TEST(ToStringTest, HandlesDuplicateKey) {
  EXPECT_EQ("CONSTRAINT_PRIMARY_KEY",
            ToString(ResultCode::kConstraintPrimaryKey));
}

TEST(ToStringTest, HandlesUnknownCode) {
  EXPECT_EQ("", ToString(static_cast<ResultCode>(999)));
}

// Test the << operator
TEST(OstreamTest, HandlesIOErrorWrite) {
  std::ostringstream os;
  os << ResultCode::kIOErrorWrite;
  EXPECT_EQ("IO_ERROR_WRITE", os.str());
}

TEST(OstreamTest, HandlesFullWithOtherText) {
  std::ostringstream os;
  os << "The return code is " << ResultCode::kFull << " and that's it.";
  EXPECT_EQ("The return code is FULL and that's it.", os.str());
}

// Test the GetPrimaryResultCode() function
TEST(GetPrimaryTest, PrimaryCodeIsUnchanged) {
  ResultCode rc = ResultCode::kCorrupt;
  EXPECT_EQ(rc, GetPrimaryResultCode(rc));
}

TEST(GetPrimaryTest, ShortReadIsIOError) {
  EXPECT_EQ(ResultCode::kIOError,
            GetPrimaryResultCode(ResultCode::kIOErrorShortRead));
}

TEST(GetPrimaryTest, DuplicateKeyIsConstraint) {
  EXPECT_EQ(ResultCode::kConstraint,
            GetPrimaryResultCode(ResultCode::kConstraintPrimaryKey));
}

// Test the DbException class
TEST(DbExceptionTest, CarriesCodeAndMessage) {
  DbException e(ResultCode::kCantOpen);
  EXPECT_EQ(ResultCode::kCantOpen, e.code());
  EXPECT_STREQ("PageDB error: CANT_OPEN", e.what());
}
