#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace querygate {

/**
 * @brief TOML configuration loader
 *
 * Missing sections and keys fall back to the GatewayConfig defaults.
 * `${VAR}` in any string value is replaced by the environment variable
 * (empty when unset).
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        GatewayConfig config;

        static LoadResult ok(GatewayConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Semantic checks; one message per problem
    [[nodiscard]] static std::vector<std::string> validate_config(const GatewayConfig& config);

    /// Replace ${VAR} references with environment values
    /// @throws std::runtime_error on an unclosed reference
    [[nodiscard]] static std::string expand_env_vars(const std::string& input);

private:
    static GatewayConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(GatewayConfig config);
};

} // namespace querygate
