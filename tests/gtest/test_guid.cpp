// =============================================================================
// GlobalId Codec Tests
// =============================================================================

#include <gtest/gtest.h>
#include "ifc2lbd/error.hpp"
#include "ifc2lbd/geometry/guid.hpp"

using namespace ifc2lbd;
using namespace ifc2lbd::geometry;

class GuidTest : public ::testing::Test {};

TEST_F(GuidTest, CompressKnownVectors) {
    EXPECT_EQ(compress_guid("00000000000000000000000000000000"), "0000000000000000000000");
    EXPECT_EQ(compress_guid("ffffffffffffffffffffffffffffffff"), "3$$$$$$$$$$$$$$$$$$$$$");
    EXPECT_EQ(compress_guid("0a1b2c3d4e5f60718293a4b5c6d7e8f9"), "0A6omzJbzWSOAJfBN6r_Zv");
    EXPECT_EQ(compress_guid("1f0e7d523a5b4c9d8e2f0123456789ab"), "0V3drIEbjCdOul0ID5Puch");
}

TEST_F(GuidTest, CompressAcceptsUuidFormAndUppercase) {
    EXPECT_EQ(compress_guid("0A1B2C3D-4E5F-6071-8293-A4B5C6D7E8F9"), "0A6omzJbzWSOAJfBN6r_Zv");
}

TEST_F(GuidTest, CompressRejectsMalformedHex) {
    EXPECT_THROW(compress_guid(""), InvalidArgumentError);
    EXPECT_THROW(compress_guid("0a1b2c3d"), InvalidArgumentError);
    EXPECT_THROW(compress_guid("0a1b2c3d4e5f60718293a4b5c6d7e8fg"), InvalidArgumentError);
    EXPECT_THROW(compress_guid("0a1b2c3d4e5f60718293a4b5c6d7e8f900"), InvalidArgumentError);
}

TEST_F(GuidTest, ExpandInvertsCompress) {
    EXPECT_EQ(expand_guid("0A6omzJbzWSOAJfBN6r_Zv"), "0a1b2c3d4e5f60718293a4b5c6d7e8f9");
    EXPECT_EQ(expand_guid("3$$$$$$$$$$$$$$$$$$$$$"), "ffffffffffffffffffffffffffffffff");
}

TEST_F(GuidTest, IsCompressedGuid) {
    EXPECT_TRUE(is_compressed_guid("0V3drIEbjCdOul0ID5Puch"));
    EXPECT_FALSE(is_compressed_guid("0V3drIEbjCdOul0ID5Puc"));
    EXPECT_FALSE(is_compressed_guid("0V3drIEbjCdOul0ID5Puc!"));
    // First digit only carries two bits
    EXPECT_FALSE(is_compressed_guid("4000000000000000000000"));
    EXPECT_THROW(expand_guid("4000000000000000000000"), InvalidArgumentError);
}

TEST_F(GuidTest, DecodeFeatureGuid) {
    auto guid = decode_feature_guid("http://example.org/product_0a1b2c3d_4e5f_6071_8293_a4b5c6d7e8f9_body");
    ASSERT_TRUE(guid.has_value());
    EXPECT_EQ(*guid, "0A6omzJbzWSOAJfBN6r_Zv");

    // Underscores inside the middle part are separators only
    auto packed = decode_feature_guid("urn:x/p_1f0e7d523a5b4c9d8e2f0123456789ab_footprint");
    ASSERT_TRUE(packed.has_value());
    EXPECT_EQ(*packed, "0V3drIEbjCdOul0ID5Puch");
}

TEST_F(GuidTest, DecodeFeatureGuidUsesWholeNameWithoutSlash) {
    auto guid = decode_feature_guid("product_0a1b2c3d_4e5f_6071_8293_a4b5c6d7e8f9_body");
    ASSERT_TRUE(guid.has_value());
    EXPECT_EQ(*guid, "0A6omzJbzWSOAJfBN6r_Zv");

    auto urn = decode_feature_guid("urn:p_1f0e7d523a5b4c9d8e2f0123456789ab_footprint");
    ASSERT_TRUE(urn.has_value());
    EXPECT_EQ(*urn, "0V3drIEbjCdOul0ID5Puch");

    EXPECT_FALSE(decode_feature_guid("product_body").has_value());
}

TEST_F(GuidTest, DecodeFeatureGuidRejectsOtherShapes) {
    EXPECT_FALSE(decode_feature_guid("http://example.org/product_body").has_value());
    EXPECT_FALSE(decode_feature_guid("http://example.org/0a1b2c3d4e5f60718293a4b5c6d7e8f9").has_value());
    EXPECT_FALSE(decode_feature_guid("http://example.org/p_0a1b2c3d_body").has_value());
    EXPECT_FALSE(decode_feature_guid("http://example.org/p_0a1b2c3d4e5f60718293a4b5c6d7e8fz_body").has_value());
}
