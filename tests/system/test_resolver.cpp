#include <gtest/gtest.h>

#include "hoststat/system/resolver.hpp"

namespace hoststat::system::test {

class SystemHostResolverTest : public ::testing::Test {
protected:
    SystemHostResolver resolver;
};

TEST_F(SystemHostResolverTest, DottedAddressResolvesToItself) {
    EXPECT_EQ(resolver.resolve("127.0.0.1"), "127.0.0.1");
    EXPECT_EQ(resolver.resolve("10.1.1.1"), "10.1.1.1");
}

TEST_F(SystemHostResolverTest, LocalhostResolvesToIpv4) {
    auto address = resolver.resolve("localhost");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->rfind("127.", 0), 0U);
}

TEST_F(SystemHostResolverTest, UnknownNameDoesNotResolve) {
    // .invalid is reserved and never resolves.
    EXPECT_FALSE(resolver.resolve("master.invalid").has_value());
}

}  // namespace hoststat::system::test
