#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace pgcrud {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        ClientConfig config;

        static LoadResult ok(ClientConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     *
     * Supports `include = "other.toml"` (or an array of paths) relative to
     * the including file; the including file wins on conflicts.
     * ${VAR} references in string values are replaced from the environment.
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML text
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check a parsed config
     * @return Every problem found, empty when the config is usable
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const ClientConfig& config);

private:
    static DatabaseConfig extract_database(const toml::table& root);
    static MetadataConfig extract_metadata(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);

    static ClientConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(ClientConfig config);
};

} // namespace pgcrud
