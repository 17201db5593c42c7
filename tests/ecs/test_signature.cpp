/**
 * @file test_signature.cpp
 * @brief Unit tests for sorted type-id signatures
 *
 * @date 2025-11-02
 */

#include <strata/ecs/signature.hpp>

#include <gtest/gtest.h>

#include <array>

using namespace strata::ecs;

TEST(SignatureTest, MakeSignatureSortsAndDeduplicates) {
    const std::array<TypeId, 5> ids{4, 1, 3, 1, 4};
    EXPECT_EQ(make_signature(ids), (Signature{1, 3, 4}));
}

TEST(SignatureTest, KeyIsOrderIndependent) {
    const std::array<TypeId, 3> a{3, 1, 2};
    const std::array<TypeId, 3> b{2, 3, 1};

    EXPECT_EQ(signature_key(make_signature(a)), "1,2,3");
    EXPECT_EQ(signature_key(make_signature(a)), signature_key(make_signature(b)));
    EXPECT_EQ(signature_key(Signature{}), "");
}

TEST(SignatureTest, MergeInsertsInOrder) {
    const Signature base{1, 5};
    EXPECT_EQ(merge_signature(base, 3), (Signature{1, 3, 5}));
    EXPECT_EQ(merge_signature(base, 5), (Signature{1, 5}));  // already present

    const std::array<TypeId, 3> more{7, 2, 5};
    EXPECT_EQ(merge_signature(base, more), (Signature{1, 2, 5, 7}));
}

TEST(SignatureTest, SubtractRemovesPresentIds) {
    const Signature base{1, 3, 5};
    EXPECT_EQ(subtract_signature(base, 3), (Signature{1, 5}));
    EXPECT_EQ(subtract_signature(base, 4), base);

    const std::array<TypeId, 2> gone{1, 5};
    EXPECT_EQ(subtract_signature(base, gone), (Signature{3}));
}

TEST(SignatureTest, HasAllAndContains) {
    const Signature have{1, 2, 4, 8};

    EXPECT_TRUE(signature_has_all(have, Signature{2, 8}));
    EXPECT_TRUE(signature_has_all(have, Signature{}));
    EXPECT_FALSE(signature_has_all(have, Signature{2, 3}));
    EXPECT_FALSE(signature_has_all(Signature{}, Signature{1}));

    EXPECT_TRUE(signature_contains(have, 4));
    EXPECT_FALSE(signature_contains(have, 5));
}
