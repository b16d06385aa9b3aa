#include <gtest/gtest.h>

#include "settings/ProximitySettings.hpp"
#include "settings/RegistryClientSettings.hpp"
#include "settings/SnapshotCacheSettings.hpp"

#include <cstdlib>

using namespace proximity;
using namespace proximity::settings;

// ============================================================================
// Test Fixture
// ============================================================================

class ProximitySettingsTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* name : {"PROXIMITY_BEACON_UUID", "PROXIMITY_TX_POWER", "PROXIMITY_ORG_CODES",
                                 "PROXIMITY_MAX_SESSION_SECONDS", "REGISTRY_SERVICE_HOST",
                                 "REGISTRY_SERVICE_PORT", "SNAPSHOT_CACHE_TTL_SECONDS"}) {
            unsetenv(name);
        }
    }
};

// ============================================================================
// ТЕСТЫ: значения по умолчанию
// ============================================================================

TEST_F(ProximitySettingsTest, Defaults) {
    ProximitySettings settings;

    EXPECT_EQ(settings.getBeaconNamespace().toString(), "550E8400-E29B-41D4-A716-446655440000");
    EXPECT_EQ(settings.getTxPower(), -57);
    EXPECT_EQ(settings.getAdvertiseInterval(), std::chrono::milliseconds(1000));
    EXPECT_EQ(settings.getMaxSessionSeconds(), 86400);
    EXPECT_EQ(settings.getDuplicateWindow(), std::chrono::seconds(30));
    EXPECT_DOUBLE_EQ(settings.getMinTokenEntropyBits(), 30.0);

    auto codes = settings.getOrganizationCodes();
    EXPECT_EQ(codes.size(), 2u);
    EXPECT_EQ(codes["nhs"], 1);
    EXPECT_EQ(codes["nhsa"], 2);
}

TEST_F(ProximitySettingsTest, ClientDefaults) {
    RegistryClientSettings client;
    SnapshotCacheSettings cache;

    EXPECT_EQ(client.getHost(), "session-registry");
    EXPECT_EQ(client.getPort(), 8080);
    EXPECT_EQ(cache.getCacheSize(), 64u);
    EXPECT_EQ(cache.getTtlSeconds(), 5);
}

// ============================================================================
// ТЕСТЫ: ENV
// ============================================================================

TEST_F(ProximitySettingsTest, FromEnvironment) {
    setenv("PROXIMITY_BEACON_UUID", "fda50693-a4e2-4fb1-afcf-c6eb07647825", 1);
    setenv("PROXIMITY_TX_POWER", "-59", 1);
    setenv("PROXIMITY_ORG_CODES", "nhs=1,nhsa=2,key-club=7", 1);
    setenv("REGISTRY_SERVICE_HOST", "localhost", 1);
    setenv("REGISTRY_SERVICE_PORT", "18080", 1);

    ProximitySettings settings;
    RegistryClientSettings client;

    EXPECT_EQ(settings.getBeaconNamespace().toString(), "FDA50693-A4E2-4FB1-AFCF-C6EB07647825");
    EXPECT_EQ(settings.getTxPower(), -59);
    EXPECT_EQ(settings.getOrganizationCodes().at("key-club"), 7);
    EXPECT_EQ(client.getHost(), "localhost");
    EXPECT_EQ(client.getPort(), 18080);
}

TEST_F(ProximitySettingsTest, NilNamespace_Rejected) {
    setenv("PROXIMITY_BEACON_UUID", "00000000-0000-0000-0000-000000000000", 1);

    EXPECT_THROW(ProximitySettings(), std::invalid_argument);
}

TEST_F(ProximitySettingsTest, MalformedNamespace_Rejected) {
    setenv("PROXIMITY_BEACON_UUID", "not-a-uuid", 1);

    EXPECT_THROW(ProximitySettings(), std::invalid_argument);
}

TEST_F(ProximitySettingsTest, ParseOrganizationCodes_Invalid) {
    EXPECT_THROW(ProximitySettings::parseOrganizationCodes("nhs"), std::invalid_argument);
    EXPECT_THROW(ProximitySettings::parseOrganizationCodes("=3"), std::invalid_argument);
    EXPECT_THROW(ProximitySettings::parseOrganizationCodes("nhs=0"), std::invalid_argument);
    EXPECT_THROW(ProximitySettings::parseOrganizationCodes("nhs=70000"), std::invalid_argument);
    EXPECT_THROW(ProximitySettings::parseOrganizationCodes("nhs=abc"), std::invalid_argument);
}

TEST_F(ProximitySettingsTest, ParseOrganizationCodes_SkipsEmptyItems) {
    auto codes = ProximitySettings::parseOrganizationCodes("nhs=1,,nhsa=2,");

    EXPECT_EQ(codes.size(), 2u);
}
