#include <gtest/gtest.h>

#include "cloak/cloak_checksum.h"

namespace CloakPII {
namespace {

TEST(IbanTest, AcceptsValidFrenchIban) {
  EXPECT_TRUE(IsValidIBAN("FR7630006000011234567890189"));
}

TEST(IbanTest, AcceptsGroupedAndLowerCase) {
  EXPECT_TRUE(IsValidIBAN("FR76 3000 6000 0112 3456 7890 189"));
  EXPECT_TRUE(IsValidIBAN("fr7630006000011234567890189"));
}

TEST(IbanTest, RejectsSingleDigitChange) {
  EXPECT_FALSE(IsValidIBAN("FR7630006000011234567890188"));
  EXPECT_FALSE(IsValidIBAN("FR7730006000011234567890189"));
  EXPECT_FALSE(IsValidIBAN("FR7630006000021234567890189"));
}

TEST(IbanTest, RejectsWrongLengthOrCountry) {
  EXPECT_FALSE(IsValidIBAN(""));
  EXPECT_FALSE(IsValidIBAN("FR76"));
  EXPECT_FALSE(IsValidIBAN("FR76300060000112345678901"));
  EXPECT_FALSE(IsValidIBAN("DE7630006000011234567890189"));
}

TEST(IbanTest, RejectsPunctuation) {
  EXPECT_FALSE(IsValidIBAN("FR763000600001123456789018."));
}

TEST(LuhnTest, AcceptsValidCardNumber) {
  EXPECT_TRUE(IsValidLuhn("4539148803436467"));
  EXPECT_TRUE(IsValidLuhn("4539 1488 0343 6467"));
  EXPECT_TRUE(IsValidLuhn("4539-1488-0343-6467"));
}

TEST(LuhnTest, RejectsBadCheckDigit) {
  EXPECT_FALSE(IsValidLuhn("4539148803436468"));
}

TEST(LuhnTest, RejectsOutOfRangeLengths) {
  EXPECT_FALSE(IsValidLuhn(""));
  EXPECT_FALSE(IsValidLuhn("0"));
  EXPECT_FALSE(IsValidLuhn("000000000000"));
  EXPECT_FALSE(IsValidLuhn("00000000000000000000"));
}

TEST(NirTest, AcceptsValidKeys) {
  EXPECT_TRUE(IsValidNIR("185057800604830"));
  EXPECT_TRUE(IsValidNIR("269054958815780"));
  EXPECT_TRUE(IsValidNIR("1 85 05 78 006 048 30"));
}

TEST(NirTest, RejectsWrongKey) {
  EXPECT_FALSE(IsValidNIR("185057800604831"));
  EXPECT_FALSE(IsValidNIR("185057800604800"));
}

TEST(NirTest, RejectsMalformedInput) {
  EXPECT_FALSE(IsValidNIR(""));
  EXPECT_FALSE(IsValidNIR("18505780060483"));
  EXPECT_FALSE(IsValidNIR("1850578006048301"));
  EXPECT_FALSE(IsValidNIR("2A5057800604830"));
}

}  // namespace
}  // namespace CloakPII
