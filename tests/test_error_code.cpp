#include <gtest/gtest.h>
#include "jmatrix/core/ErrorCode.hpp"
#include "jmatrix/core/Errors.hpp"
#include "jmatrix/core/RaiseConfig.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <sstream>
#include <string>
#include <vector>

using namespace jmatrix;

class ErrorCodeTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_raise_mode(RaiseMode::Manual);
    }

    void TearDown() override {
        reset_raise_mode();
    }

    // Declaration order of ErrorCode::values().
    const std::vector<int32_t> expected_errno = {201, 202, 203, 400};
    const std::vector<std::string> expected_code = {"INVIDX", "INVTYP", "NULLMT", "UNKERR"};
};

TEST_F(ErrorCodeTest, Errno) {
    const auto& all = ErrorCode::values();
    ASSERT_EQ(all.size(), expected_errno.size());
    for (size_t i = 0; i < all.size(); ++i) {
        EXPECT_EQ(all[i].get_errno(), expected_errno[i]);
    }
}

TEST_F(ErrorCodeTest, ErrnoStrIsPrefixedErrno) {
    const auto& all = ErrorCode::values();
    for (size_t i = 0; i < all.size(); ++i) {
        EXPECT_EQ(all[i].get_errno_str(), "JM" + std::to_string(expected_errno[i]));
    }
}

TEST_F(ErrorCodeTest, Code) {
    const auto& all = ErrorCode::values();
    for (size_t i = 0; i < all.size(); ++i) {
        EXPECT_EQ(all[i].get_code(), expected_code[i]);
    }
}

TEST_F(ErrorCodeTest, MessageIsNeverEmpty) {
    for (const auto& ec : ErrorCode::values()) {
        EXPECT_FALSE(ec.get_message().empty()) << ec.to_string();
    }
    EXPECT_EQ(ErrorCode(ErrorCode::NULLMT).get_message(), "Matrix is null");
}

TEST_F(ErrorCodeTest, CanonicalString) {
    const auto& all = ErrorCode::values();
    for (size_t i = 0; i < all.size(); ++i) {
        const std::string expected = expected_code[i] + "[" + std::to_string(expected_errno[i]) + "]";
        EXPECT_EQ(all[i].to_string(), expected);
    }
    EXPECT_EQ(ErrorCode(ErrorCode::INVIDX).to_string(), "INVIDX[201]");

    std::ostringstream oss;
    oss << ErrorCode(ErrorCode::UNKERR);
    EXPECT_EQ(oss.str(), "UNKERR[400]");
}

TEST_F(ErrorCodeTest, ErrnoAndCodeAreOneToOne) {
    std::map<int32_t, std::string> seen;
    for (const auto& ec : ErrorCode::values()) {
        auto [it, inserted] = seen.emplace(ec.get_errno(), std::string(ec.get_code()));
        EXPECT_TRUE(inserted) << "duplicate errno " << ec.get_errno();
        EXPECT_EQ(ErrorCode::from_code(ec.get_code()), ec);
        EXPECT_EQ(ErrorCode::from_errno(ec.get_errno()), ec);
    }
}

TEST_F(ErrorCodeTest, ValueOfString) {
    auto from_str = ErrorCode::value_of("NULLMT");
    ASSERT_TRUE(from_str.has_value());
    EXPECT_EQ(from_str->get_code(), "NULLMT");
    EXPECT_EQ(from_str->get_errno(), 203);

    auto from_std_string = ErrorCode::value_of(std::string("INVTYP"));
    ASSERT_TRUE(from_std_string.has_value());
    EXPECT_EQ(from_std_string->get_errno(), 202);
}

TEST_F(ErrorCodeTest, ValueOfInteger) {
    auto from_int = ErrorCode::value_of(201);
    ASSERT_TRUE(from_int.has_value());
    EXPECT_EQ(from_int->get_code(), "INVIDX");
    EXPECT_EQ(from_int->get_errno(), 201);

    EXPECT_EQ(ErrorCode::value_of(400L), ErrorCode(ErrorCode::UNKERR));
    EXPECT_FALSE(ErrorCode::value_of(999).has_value());
}

TEST_F(ErrorCodeTest, ValueOfUnsupportedKeyIsQuiet) {
    EXPECT_NO_THROW({
        EXPECT_FALSE(ErrorCode::value_of(std::vector<int>(1)).has_value());
        EXPECT_FALSE(ErrorCode::value_of(201.0).has_value());
        EXPECT_FALSE(ErrorCode::value_of(true).has_value());
    });
}

TEST_F(ErrorCodeTest, ValueOfExtremeIntegersIsQuiet) {
    EXPECT_FALSE(ErrorCode::value_of(std::numeric_limits<int64_t>::max()).has_value());
    EXPECT_FALSE(ErrorCode::value_of(std::numeric_limits<int64_t>::min()).has_value());
    EXPECT_FALSE(ErrorCode::value_of(std::numeric_limits<uint64_t>::max()).has_value());
    EXPECT_FALSE(ErrorCode::value_of(-201).has_value());
}

TEST_F(ErrorCodeTest, ValueOfNullKeyIsQuiet) {
    const char* null_code = nullptr;
    char* null_mutable = nullptr;
    EXPECT_NO_THROW({
        EXPECT_FALSE(ErrorCode::value_of(nullptr).has_value());
        EXPECT_FALSE(ErrorCode::value_of(null_code).has_value());
        EXPECT_FALSE(ErrorCode::value_of(null_mutable).has_value());
    });

    const char* code = "INVIDX";
    EXPECT_EQ(ErrorCode::value_of(code), ErrorCode(ErrorCode::INVIDX));
}

TEST_F(ErrorCodeTest, FromCodeThrowsOnUnknownMnemonic) {
    EXPECT_THROW(ErrorCode::from_code("UNKNOWN"), UnknownCodeError);
    EXPECT_THROW(ErrorCode::value_of("UNKNOWN"), UnknownCodeError);
    // Lookup is exact, not case-insensitive.
    EXPECT_THROW(ErrorCode::from_code("invidx"), UnknownCodeError);

    try {
        ErrorCode::from_code("UNKNOWN");
        FAIL() << "expected UnknownCodeError";
    } catch (const UnknownCodeError& e) {
        EXPECT_EQ(e.error_code(), ErrorCode(ErrorCode::UNKERR));
        EXPECT_NE(std::string(e.what()).find("UNKNOWN"), std::string::npos);
    }
}
