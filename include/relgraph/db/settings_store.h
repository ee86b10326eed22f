#pragma once

#include <relgraph/core/app_config.h>

#include <optional>
#include <string>

namespace relgraph {
namespace db {

class SQLiteConnection;

/*
 * Typed access to the viewer settings kept in the `settings` table.
 *
 * Raw get/put throw std::runtime_error on database errors. The typed
 * loaders never throw for bad stored values: an unknown theme or an
 * unparsable layout parameter keeps its default and is logged.
 */
class SettingsStore {
public:
    explicit SettingsStore(SQLiteConnection& db_conn);

    std::optional<std::string> get(const std::string& key);
    void put(const std::string& key, const std::string& value);

    ThemeType loadTheme();
    void saveTheme(ThemeType theme);

    // Only positive finite values override the defaults.
    graph::ForceDirectedLayout::LayoutParams loadLayoutParams();
    void saveLayoutParams(const graph::ForceDirectedLayout::LayoutParams& params);

    // Stored settings, then the RELGRAPH_ENDPOINT override. A failing
    // database yields the defaults.
    AppConfig loadConfig();
    void saveConfig(const AppConfig& config);

private:
    std::optional<float> loadPositiveFloat(const char* key);
    std::optional<std::string> loadNonEmpty(const char* key);

    SQLiteConnection& m_db_conn;
};

} // namespace db
} // namespace relgraph
