#pragma once

#include <string>
#include <vector>
#include "pattern.hpp"
#include "tree_source.hpp"
#include "parts/types.hpp"

namespace parts::engine {

    /**
     * @brief A part as declared in configuration, before compilation.
     */
    struct PartDefinition {
        std::string name;
        std::vector<SelectionRule> rules;
        std::vector<SelectionRule> exclusions;
        std::string directory = ".";
    };

    struct CompiledPart {
        std::string name;
        PathMatcher matcher;
        std::string definition; // hex digest of directory, rules and context
    };

    class PartResolver {
    public:
        /**
         * @brief Validates and compiles every definition, in declared order.
         * @param context Extra text folded into each definition digest (ignore settings).
         * @throws ConfigError naming the first offending part and rule. No I/O is done.
         */
        static PartResolver compile(const std::vector<PartDefinition>& definitions, const std::string& context = "");

        /**
         * @brief One pass over the source; result[i] holds the members of parts()[i].
         * Member lists are in enumeration order.
         */
        std::vector<std::vector<FileRecord>> resolve(const TreeSource& source) const;

        /**
         * @brief Sorted members of a single part.
         * @throws ConfigError if no part has that name.
         */
        std::vector<FileRecord> members_of(const std::string& name, const TreeSource& source) const;

        const std::vector<CompiledPart>& parts() const { return m_parts; }
        const CompiledPart* find(const std::string& name) const;

        std::vector<std::string> names() const;

    private:
        explicit PartResolver(std::vector<CompiledPart> parts)
            : m_parts(std::move(parts)) {}

        std::vector<CompiledPart> m_parts;
    };

}
