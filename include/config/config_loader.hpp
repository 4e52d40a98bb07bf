#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace relsync {

/**
 * @brief relsync.toml reader
 *
 * Sections: [database], [pool], [sync], [source], [logging]. Missing keys
 * keep their defaults. String values may reference ${ENV_VAR}.
 */
class ConfigLoader {
public:
    static constexpr size_t kMaxInsertBatchSize = 32767;

    // Either a validated config or the reason there is none
    struct LoadResult {
        bool success = false;
        std::string error_message;
        RelsyncConfig config;

        static LoadResult ok(RelsyncConfig cfg) {
            return LoadResult{true, {}, std::move(cfg)};
        }

        static LoadResult error(std::string message) {
            return LoadResult{false, std::move(message), {}};
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    // One message per violated rule; empty when valid
    [[nodiscard]] static std::vector<std::string> validate_config(const RelsyncConfig& config);

private:
    static DatabaseConfig extract_database(const toml::table& root);
    static PoolSettings extract_pool(const toml::table& root);
    static SyncConfig extract_sync(const toml::table& root);
    static SourceConfig extract_source(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);

    static RelsyncConfig extract_all_sections(const toml::table& tbl);

    // ${VAR} substitution, extraction and validation of a parsed document
    static LoadResult finish(toml::table tbl);
};

} // namespace relsync
