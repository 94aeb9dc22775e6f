#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <utility>
#include <nlohmann/json.hpp>
#include "ignore.hpp"
#include "resolver.hpp"

namespace parts::engine {

    struct Config {
        std::string source; // e.g. "parts.json" or "package.json:parts"
        std::optional<std::string> default_part;
        std::filesystem::path state_file = ".parts/state.db";
        size_t jobs = 0;
        IgnoreOptions ignore;
        std::vector<PartDefinition> parts;

        /**
         * @brief Builds a configuration from an already parsed JSON object.
         * @throws ConfigError on wrong types or unknown keys.
         */
        static Config parse(const nlohmann::ordered_json& j, const std::string& source);

        /**
         * @brief Loads "file" or "file:key.path" relative to root.
         * @throws ConfigError if the file is missing, malformed or lacks the keys.
         */
        static Config load(const std::filesystem::path& root, const std::string& location);

        /**
         * @brief Tries the default locations in order and returns the first that loads.
         * @throws ConfigError if none does.
         */
        static Config find(const std::filesystem::path& root);

        /**
         * @brief The named part, or the default part when name is empty.
         * @return nullptr if there is no such part.
         */
        const PartDefinition* get(const std::optional<std::string>& name) const;
    };

    extern const std::vector<std::string> kConfigLocations;

    /**
     * @brief Splits "Cargo.json:metadata.parts" into the path and its key list.
     */
    std::pair<std::string, std::vector<std::string>> split_path_and_keys(const std::string& location);

}
