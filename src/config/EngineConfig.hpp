#pragma once

#include "../session/Session.hpp"

#include <toml++/toml.h>

#include <cstddef>
#include <map>
#include <string>

namespace lexanon
{

struct LoggingSettings
{
    int level = 4; // plog severity, 0 (none) .. 6 (verbose)
    bool append = true;
    std::string file = "logs/lexanon.log";
    bool console = false;
    bool verbose = false; // Allows document snippets in the log
    std::size_t max_preview = 160;
};

/// Engine settings read from config.toml.
///
/// A missing file leaves every default in place. A file that fails to parse
/// is reported as a configuration warning and also leaves the defaults;
/// individual invalid values are reported and skipped.
class EngineConfig
{
public:
    explicit EngineConfig(std::string path = "config.toml");

    /// Returns false only when the file exists but cannot be parsed.
    bool load();
    bool loadFromString(const std::string& content);

    const std::string& path() const { return path_; }
    const std::string& lastError() const { return last_error_; }

    const LoggingSettings& logging() const { return logging_; }
    const ReplacementPolicy& policy() const { return policy_; }
    const ResolverOptions& resolver() const { return resolver_; }
    const SubstitutionOptions& substitution() const { return substitution_; }
    const std::map<EntitySource, bool>& sourceFilters() const { return source_filters_; }

    SessionOptions sessionOptions() const;

private:
    void apply(const toml::table& root);
    void reportInvalid(const std::string& key, const std::string& detail);

    std::string path_;
    std::string last_error_;
    LoggingSettings logging_;
    ReplacementPolicy policy_;
    ResolverOptions resolver_;
    SubstitutionOptions substitution_;
    std::map<EntitySource, bool> source_filters_ = SessionOptions{}.source_filters;
};

} // namespace lexanon
