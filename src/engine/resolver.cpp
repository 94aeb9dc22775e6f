#include "resolver.hpp"
#include "errors.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace parts::engine {

    namespace {
        std::vector<CompiledRule> compile_rules(const std::string& part, const std::vector<SelectionRule>& rules) {
            std::vector<CompiledRule> compiled;
            compiled.reserve(rules.size());
            for (const auto& rule : rules) {
                try {
                    compiled.emplace_back(rule);
                } catch (const std::regex_error& e) {
                    throw ConfigError(part, rule.describe(), std::string("invalid pattern (") + e.what() + ")");
                } catch (const std::invalid_argument& e) {
                    throw ConfigError(part, rule.describe(), std::string("invalid pattern (") + e.what() + ")");
                }
            }
            return compiled;
        }

        std::string definition_digest(const PartDefinition& def, const std::string& directory, const std::string& context) {
            crypto::SHA256 sha;
            sha.update(std::string("parts-definition-v1"));
            auto field = [&sha](const std::string& s) {
                sha.update_u64(s.size());
                sha.update(s);
            };
            field(directory);
            sha.update_u64(def.rules.size());
            for (const auto& r : def.rules) field(r.describe());
            sha.update_u64(def.exclusions.size());
            for (const auto& r : def.exclusions) field(r.describe());
            field(context);

            Fingerprint fp;
            fp.bytes = sha.finish();
            return fp.hex();
        }
    }

    PartResolver PartResolver::compile(const std::vector<PartDefinition>& definitions, const std::string& context) {
        std::vector<CompiledPart> parts;
        std::set<std::string> seen;

        for (const auto& def : definitions) {
            if (def.name.empty()) {
                throw ConfigError("part with an empty name");
            }
            if (!seen.insert(def.name).second) {
                throw ConfigError(def.name, "", "duplicate part name");
            }

            std::string directory;
            try {
                directory = normalize_directory(def.directory);
            } catch (const std::invalid_argument& e) {
                throw ConfigError(def.name, "", "invalid directory \"" + def.directory + "\" (" + e.what() + ")");
            }

            CompiledPart part;
            part.name = def.name;
            part.matcher = PathMatcher(compile_rules(def.name, def.rules), compile_rules(def.name, def.exclusions), directory);
            part.definition = definition_digest(def, directory, context);
            parts.push_back(std::move(part));
        }
        return PartResolver(std::move(parts));
    }

    std::vector<std::vector<FileRecord>> PartResolver::resolve(const TreeSource& source) const {
        std::vector<std::vector<FileRecord>> members(m_parts.size());
        source.for_each_path([&](const FileRecord& record) {
            for (size_t i = 0; i < m_parts.size(); ++i) {
                if (m_parts[i].matcher.matches(record.path)) {
                    members[i].push_back(record);
                }
            }
        });
        return members;
    }

    std::vector<FileRecord> PartResolver::members_of(const std::string& name, const TreeSource& source) const {
        const CompiledPart* part = find(name);
        if (!part) throw ConfigError("unknown part name: \"" + name + "\"");

        std::vector<FileRecord> members;
        source.for_each_path([&](const FileRecord& record) {
            if (part->matcher.matches(record.path)) members.push_back(record);
        });
        std::sort(members.begin(), members.end());
        return members;
    }

    const CompiledPart* PartResolver::find(const std::string& name) const {
        for (const auto& p : m_parts) {
            if (p.name == name) return &p;
        }
        return nullptr;
    }

    std::vector<std::string> PartResolver::names() const {
        std::vector<std::string> out;
        for (const auto& p : m_parts) out.push_back(p.name);
        return out;
    }

}
