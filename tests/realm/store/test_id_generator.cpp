#include <gtest/gtest.h>

#include <cctype>
#include <set>
#include <stdexcept>

#include "realm/store/id_generator.hpp"

using namespace reaches::realm::store;

class IdGeneratorTest : public ::testing::Test {};

TEST_F(IdGeneratorTest, GeneratesAlphanumericIdsOfConfiguredLength) {
    IdGenerator generator;
    for (int i = 0; i < 100; ++i) {
        auto id = generator.next();
        ASSERT_EQ(id.size(), 16u);
        for (char ch : id) {
            EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(ch))) << id;
        }
    }

    IdGenerator shortIds(8);
    EXPECT_EQ(shortIds.next().size(), 8u);
}

TEST_F(IdGeneratorTest, SeededGeneratorsRepeat) {
    IdGenerator a(16, 42);
    IdGenerator b(16, 42);
    EXPECT_EQ(a.next(), b.next());
    EXPECT_EQ(a.next(), b.next());
}

TEST_F(IdGeneratorTest, IdsAreDistinct) {
    IdGenerator generator;
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        seen.insert(generator.next());
    }
    EXPECT_EQ(seen.size(), 1000u);
}

TEST_F(IdGeneratorTest, ZeroLengthRejected) {
    EXPECT_THROW(IdGenerator(0), std::invalid_argument);
}
