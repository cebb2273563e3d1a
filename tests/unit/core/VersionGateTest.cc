#include "keepsake/core/VersionGate.hh"

#include <gtest/gtest.h>

using namespace keepsake;

TEST(VersionGateTest, MatchingVersionIsValid) {
    VersionGate gate("1.2.0", true);
    EXPECT_TRUE(gate.isValid("1.2.0"));
}

TEST(VersionGateTest, DifferentVersionIsInvalid) {
    VersionGate gate("1.2.0", true);
    EXPECT_FALSE(gate.isValid("1.1.9"));
    EXPECT_FALSE(gate.isValid("1.2.0 "));
    EXPECT_FALSE(gate.isValid("1.2"));
}

TEST(VersionGateTest, UnversionedFollowsLeniency) {
    EXPECT_TRUE(VersionGate("1.2.0", true).isValid(""));
    EXPECT_FALSE(VersionGate("1.2.0", false).isValid(""));
}

TEST(VersionGateTest, ChecksPayloadVersion) {
    VersionGate gate("0.0.1", false);
    SessionPayload payload;
    EXPECT_FALSE(gate.isValid(payload));
    payload.version = "0.0.1";
    EXPECT_TRUE(gate.isValid(payload));
    EXPECT_EQ(gate.appVersion(), "0.0.1");
    EXPECT_FALSE(gate.acceptsUnversioned());
}
