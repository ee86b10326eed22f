#include "gtest/gtest.h"
#include <relgraph/core/app_config.h>
#include <relgraph/db/settings_store.h>
#include <relgraph/db/sqlite_connection.h>

#include <cstdlib>
#include <stdexcept>

using namespace relgraph;

namespace {

class SettingsStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv(ENDPOINT_ENV_VAR);
    }

    db::SQLiteConnection conn{":memory:"};
    db::SettingsStore store{conn};
};

} // namespace

TEST_F(SettingsStoreTest, GetAndPut) {
    EXPECT_FALSE(store.get("theme").has_value());

    store.put("theme", "WHITE");
    ASSERT_TRUE(store.get("theme").has_value());
    EXPECT_EQ(store.get("theme").value(), "WHITE");

    store.put("theme", "DARK");
    EXPECT_EQ(store.get("theme").value(), "DARK");

    store.put("empty", "");
    ASSERT_TRUE(store.get("empty").has_value());
    EXPECT_EQ(store.get("empty").value(), "");
}

TEST_F(SettingsStoreTest, ConnectionReportsErrors) {
    EXPECT_EQ(conn.getPath(), ":memory:");
    EXPECT_NE(conn.getDbHandle(), nullptr);
    EXPECT_THROW(conn.exec("NOT VALID SQL"), std::runtime_error);
    EXPECT_NO_THROW(conn.exec("CREATE TABLE scratch (id INTEGER); DROP TABLE scratch;"));
    EXPECT_THROW(db::Statement(conn, "SELECT nothing FROM nowhere"), std::runtime_error);
}

TEST_F(SettingsStoreTest, FreshDatabaseIsAtCurrentSchemaVersion) {
    EXPECT_EQ(conn.schemaVersion(), db::SQLiteConnection::kSchemaVersion);
}

TEST_F(SettingsStoreTest, MissingTableThrows) {
    conn.exec("DROP TABLE settings");
    EXPECT_THROW(store.get("theme"), std::runtime_error);
    EXPECT_THROW(store.put("theme", "DARK"), std::runtime_error);
    EXPECT_THROW(store.saveConfig(AppConfig()), std::runtime_error);

    // Config loading falls back to defaults instead.
    AppConfig config = store.loadConfig();
    EXPECT_EQ(config.theme, ThemeType::DARK);
    EXPECT_EQ(config.endpoint_url, DEFAULT_ENDPOINT_URL);
}

TEST_F(SettingsStoreTest, DefaultsWhenNothingStored) {
    AppConfig config = store.loadConfig();
    EXPECT_EQ(config.theme, ThemeType::DARK);
    EXPECT_EQ(config.endpoint_url, DEFAULT_ENDPOINT_URL);
    EXPECT_EQ(config.model_id, DEFAULT_MODEL_ID);
    EXPECT_FLOAT_EQ(config.layout_params.charge_strength, 120.0f);
    EXPECT_FLOAT_EQ(config.layout_params.collision_radius_multiplier, 1.2f);
}

TEST_F(SettingsStoreTest, ConfigRoundTrip) {
    AppConfig config;
    config.theme = ThemeType::WHITE;
    config.endpoint_url = "http://example.test:8080";
    config.model_id = "other-model";
    config.layout_params.charge_strength = 250.0f;
    store.saveConfig(config);

    EXPECT_EQ(store.get(SettingKeys::kTheme).value(), "WHITE");
    AppConfig loaded = store.loadConfig();
    EXPECT_EQ(loaded.theme, ThemeType::WHITE);
    EXPECT_EQ(loaded.endpoint_url, "http://example.test:8080");
    EXPECT_EQ(loaded.model_id, "other-model");
    EXPECT_FLOAT_EQ(loaded.layout_params.charge_strength, 250.0f);
    EXPECT_FLOAT_EQ(loaded.layout_params.collision_radius_multiplier, 1.2f);
}

TEST_F(SettingsStoreTest, EmptyStoredStringsKeepDefaults) {
    store.put(SettingKeys::kEndpointUrl, "");
    store.put(SettingKeys::kModelId, "");
    AppConfig config = store.loadConfig();
    EXPECT_EQ(config.endpoint_url, DEFAULT_ENDPOINT_URL);
    EXPECT_EQ(config.model_id, DEFAULT_MODEL_ID);
}

TEST_F(SettingsStoreTest, UnknownThemeKeepsDefault) {
    store.put(SettingKeys::kTheme, "SEPIA");
    EXPECT_EQ(store.loadTheme(), ThemeType::DARK);

    store.saveTheme(ThemeType::WHITE);
    EXPECT_EQ(store.loadTheme(), ThemeType::WHITE);

    store.put(SettingKeys::kTheme, "white");
    EXPECT_EQ(store.loadConfig().theme, ThemeType::WHITE);
}

TEST_F(SettingsStoreTest, EnvironmentOverridesEndpoint) {
    store.put(SettingKeys::kEndpointUrl, "http://stored.test");
    setenv(ENDPOINT_ENV_VAR, "http://env.test", 1);
    EXPECT_EQ(store.loadConfig().endpoint_url, "http://env.test");

    setenv(ENDPOINT_ENV_VAR, "", 1);
    EXPECT_EQ(store.loadConfig().endpoint_url, "http://stored.test");
    unsetenv(ENDPOINT_ENV_VAR);
}

TEST_F(SettingsStoreTest, LayoutParamsFromSettings) {
    store.put(SettingKeys::kChargeStrength, "250");
    store.put(SettingKeys::kCollisionRadiusMultiplier, "1.5");
    auto params = store.loadLayoutParams();
    EXPECT_FLOAT_EQ(params.charge_strength, 250.0f);
    EXPECT_FLOAT_EQ(params.collision_radius_multiplier, 1.5f);
}

TEST_F(SettingsStoreTest, InvalidLayoutParamsAreIgnored) {
    const graph::ForceDirectedLayout::LayoutParams defaults;
    const char* invalid[] = {"-5", "0", "abc", "12px", "nan", "inf", "1e99", ""};
    for (const char* value : invalid) {
        store.put(SettingKeys::kChargeStrength, value);
        store.put(SettingKeys::kCollisionRadiusMultiplier, value);
        auto params = store.loadLayoutParams();
        EXPECT_FLOAT_EQ(params.charge_strength, defaults.charge_strength) << "value '" << value << "'";
        EXPECT_FLOAT_EQ(params.collision_radius_multiplier, defaults.collision_radius_multiplier);
    }
}
