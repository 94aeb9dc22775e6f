#include "config.hpp"
#include "errors.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>

namespace parts::engine {

    const std::vector<std::string> kConfigLocations = {
        "parts.json",
        ".parts.json",
        "package.json:parts",
    };

    namespace {
        using json = nlohmann::ordered_json;

        const std::vector<std::string> kTopLevelKeys = {
            "default", "state_file", "jobs", "ignore_hidden", "use_gitignore", "ignore_files", "ignore", "parts",
        };
        const std::vector<std::string> kPartKeys = {
            "name", "globs", "regexes", "exclude_globs", "exclude_regexes", "directory",
        };

        bool allowed(const std::vector<std::string>& keys, const std::string& key) {
            return std::find(keys.begin(), keys.end(), key) != keys.end();
        }

        std::vector<std::string> string_list(const json& j, const std::string& key, const std::string& where) {
            std::vector<std::string> out;
            auto it = j.find(key);
            if (it == j.end()) return out;
            if (!it->is_array()) throw ConfigError(where + ": \"" + key + "\" must be an array of strings");
            for (const auto& item : *it) {
                if (!item.is_string()) throw ConfigError(where + ": \"" + key + "\" must be an array of strings");
                out.push_back(item.get<std::string>());
            }
            return out;
        }

        bool boolean(const json& j, const std::string& key, bool fallback, const std::string& where) {
            auto it = j.find(key);
            if (it == j.end()) return fallback;
            if (!it->is_boolean()) throw ConfigError(where + ": \"" + key + "\" must be true or false");
            return it->get<bool>();
        }

        // nlohmann keeps the last of two equal keys; a repeated part name must
        // be reported instead of silently replacing the first definition.
        json::parser_callback_t duplicate_key_check(const std::string& location) {
            struct Frame {
                bool is_array = false;
                std::vector<std::string> path; // keys leading to this container, "[]" for array items
                std::set<std::string> keys;
                std::string last_key;
            };
            auto stack = std::make_shared<std::vector<Frame>>();
            std::vector<std::string> parts_path = split_path_and_keys(location).second;
            parts_path.push_back("parts");

            return [stack, location, parts_path](int, json::parse_event_t event, json& parsed) {
                switch (event) {
                    case json::parse_event_t::object_start:
                    case json::parse_event_t::array_start: {
                        Frame frame;
                        frame.is_array = event == json::parse_event_t::array_start;
                        if (!stack->empty()) {
                            frame.path = stack->back().path;
                            frame.path.push_back(stack->back().is_array ? "[]" : stack->back().last_key);
                        }
                        stack->push_back(std::move(frame));
                        break;
                    }
                    case json::parse_event_t::object_end:
                    case json::parse_event_t::array_end:
                        if (!stack->empty()) stack->pop_back();
                        break;
                    case json::parse_event_t::key: {
                        Frame& frame = stack->back();
                        const std::string key = parsed.get<std::string>();
                        if (!frame.keys.insert(key).second) {
                            if (frame.path == parts_path) {
                                throw ConfigError(key, "", "duplicate part name in " + location);
                            }
                            throw ConfigError(location + ": duplicate key \"" + key + "\"");
                        }
                        frame.last_key = key;
                        break;
                    }
                    default:
                        break;
                }
                return true;
            };
        }

        PartDefinition parse_part(const std::string& name, const json& body, const std::string& source) {
            if (!body.is_object()) {
                throw ConfigError(name, "", "definition in " + source + " must be an object");
            }
            for (auto it = body.begin(); it != body.end(); ++it) {
                if (!allowed(kPartKeys, it.key())) {
                    throw ConfigError(name, "", "unknown key \"" + it.key() + "\" in " + source);
                }
            }

            const std::string where = source + ", part \"" + name + "\"";
            PartDefinition def;
            def.name = name;
            for (auto& p : string_list(body, "globs", where)) def.rules.push_back(SelectionRule::glob(p));
            for (auto& p : string_list(body, "regexes", where)) def.rules.push_back(SelectionRule::regex(p));
            for (auto& p : string_list(body, "exclude_globs", where)) def.exclusions.push_back(SelectionRule::glob(p));
            for (auto& p : string_list(body, "exclude_regexes", where)) def.exclusions.push_back(SelectionRule::regex(p));

            auto dir = body.find("directory");
            if (dir != body.end()) {
                if (!dir->is_string()) throw ConfigError(name, "", "\"directory\" must be a string");
                def.directory = dir->get<std::string>();
            }
            return def;
        }
    }

    std::pair<std::string, std::vector<std::string>> split_path_and_keys(const std::string& location) {
        size_t colon = location.find(':');
        if (colon == std::string::npos) return {location, {}};

        std::vector<std::string> keys;
        std::string rest = location.substr(colon + 1);
        size_t start = 0;
        while (true) {
            size_t dot = rest.find('.', start);
            keys.push_back(rest.substr(start, dot - start));
            if (dot == std::string::npos) break;
            start = dot + 1;
        }
        return {location.substr(0, colon), keys};
    }

    Config Config::parse(const json& j, const std::string& source) {
        if (!j.is_object()) throw ConfigError(source + ": configuration must be a JSON object");
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (!allowed(kTopLevelKeys, it.key())) {
                throw ConfigError(source + ": unknown key \"" + it.key() + "\"");
            }
        }

        Config cfg;
        cfg.source = source;

        if (j.contains("default")) {
            if (!j["default"].is_string()) throw ConfigError(source + ": \"default\" must be a string");
            cfg.default_part = j["default"].get<std::string>();
        }
        if (j.contains("state_file")) {
            if (!j["state_file"].is_string()) throw ConfigError(source + ": \"state_file\" must be a string");
            cfg.state_file = j["state_file"].get<std::string>();
        }
        if (j.contains("jobs")) {
            if (!j["jobs"].is_number_unsigned()) throw ConfigError(source + ": \"jobs\" must be a non-negative integer");
            cfg.jobs = j["jobs"].get<size_t>();
        }

        cfg.ignore.ignore_hidden = boolean(j, "ignore_hidden", cfg.ignore.ignore_hidden, source);
        cfg.ignore.use_gitignore = boolean(j, "use_gitignore", cfg.ignore.use_gitignore, source);
        if (j.contains("ignore_files")) cfg.ignore.ignore_files = string_list(j, "ignore_files", source);
        cfg.ignore.patterns = string_list(j, "ignore", source);

        if (j.contains("parts")) {
            const json& parts = j["parts"];
            if (parts.is_object()) {
                for (auto it = parts.begin(); it != parts.end(); ++it) {
                    cfg.parts.push_back(parse_part(it.key(), it.value(), source));
                }
            } else if (parts.is_array()) {
                for (const auto& body : parts) {
                    if (!body.is_object() || !body.contains("name") || !body["name"].is_string()) {
                        throw ConfigError(source + ": every entry of \"parts\" needs a string \"name\"");
                    }
                    cfg.parts.push_back(parse_part(body["name"].get<std::string>(), body, source));
                }
            } else {
                throw ConfigError(source + ": \"parts\" must be an object or an array");
            }
        }

        if (cfg.default_part && !cfg.get(cfg.default_part)) {
            throw ConfigError(source + ": default part \"" + *cfg.default_part + "\" is not defined");
        }
        return cfg;
    }

    Config Config::load(const std::filesystem::path& root, const std::string& location) {
        auto [path, keys] = split_path_and_keys(location);
        const std::filesystem::path file = root / path;

        std::error_code ec;
        if (!std::filesystem::is_regular_file(file, ec)) {
            throw ConfigError(location + ": config file does not exist");
        }

        std::ifstream f(file);
        if (!f) throw ConfigError(location + ": cannot read config file");

        json j;
        try {
            j = json::parse(f, duplicate_key_check(location));
        } catch (const json::parse_error& e) {
            throw ConfigError(location + ": " + e.what());
        }

        const json* node = &j;
        for (const auto& key : keys) {
            if (!node->is_object()) {
                throw ConfigError(location + ": does not contain (nested) objects as expected");
            }
            auto it = node->find(key);
            if (it == node->end()) {
                throw ConfigError(location + ": does not contain key \"" + key + "\"");
            }
            node = &*it;
        }
        return parse(*node, location);
    }

    Config Config::find(const std::filesystem::path& root) {
        for (const auto& location : kConfigLocations) {
            const std::filesystem::path file = root / split_path_and_keys(location).first;
            std::error_code ec;
            if (!std::filesystem::exists(file, ec)) continue;

            try {
                return load(root, location);
            } catch (const ConfigError& e) {
                std::cerr << "[Config] Skipping " << location << ": " << e.what() << "\n";
            }
        }
        throw ConfigError("no config file was found in " + root.string() + ", tried parts.json, .parts.json, package.json:parts");
    }

    const PartDefinition* Config::get(const std::optional<std::string>& name) const {
        const std::optional<std::string>& wanted = (name && !name->empty()) ? name : default_part;
        if (!wanted) return nullptr;
        for (const auto& p : parts) {
            if (p.name == *wanted) return &p;
        }
        return nullptr;
    }

}
