#pragma once

#include <stdexcept>
#include <string>

namespace parts::engine {

    /**
     * @brief Base of every error raised by the engine.
     */
    class Error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Malformed or duplicate part definitions, invalid patterns,
     * unreadable configuration files.
     */
    class ConfigError : public Error {
    public:
        explicit ConfigError(const std::string& message)
            : Error(message) {}

        ConfigError(const std::string& part, const std::string& rule, const std::string& message)
            : Error("part \"" + part + "\": " + (rule.empty() ? "" : "rule \"" + rule + "\": ") + message),
              m_part(part), m_rule(rule) {}

        const std::string& part() const { return m_part; }
        const std::string& rule() const { return m_rule; }

    private:
        std::string m_part;
        std::string m_rule;
    };

    class IoError : public Error {
    public:
        IoError(const std::string& path, const std::string& message)
            : Error(message + ": " + path), m_path(path) {}

        const std::string& path() const { return m_path; }

    private:
        std::string m_path;
    };

    // Persisted state has an unknown format, version or is corrupt.
    class StateFormatError : public Error {
    public:
        using Error::Error;
    };

    // Another writer committed after this run loaded its snapshot.
    class StateConflictError : public Error {
    public:
        using Error::Error;
    };

    class Cancelled : public Error {
    public:
        Cancelled() : Error("run cancelled") {}
    };

}
