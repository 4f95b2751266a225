#include "EngineConfig.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <cmath>
#include <fstream>
#include <iterator>

namespace lexanon
{

EngineConfig::EngineConfig(std::string path)
    : path_(std::move(path))
{
}

void EngineConfig::reportInvalid(const std::string& key, const std::string& detail)
{
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                        "Ignoring invalid setting '" + key + "'", detail + "\nFile: " + path_);
}

bool EngineConfig::load()
{
    last_error_.clear();
    std::ifstream ifs(path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "No configuration at " << path_ << ", using defaults";
        return true;
    }

    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return loadFromString(content);
}

bool EngineConfig::loadFromString(const std::string& content)
{
    last_error_.clear();
    try
    {
        const toml::table root = toml::parse(content, path_);
        apply(root);
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_;

        std::string error_details;
        if (pe.source().begin.line > 0)
        {
            error_details =
                "Error at line " + std::to_string(pe.source().begin.line) + ": " + std::string(pe.description());
        }
        else
        {
            error_details = std::string(pe.description());
        }

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.",
                                            error_details + "\nFile: " + path_);
        return false;
    }
}

void EngineConfig::apply(const toml::table& root)
{
    if (auto* logging = root["logging"].as_table())
    {
        if (auto level = (*logging)["level"].value<int64_t>())
        {
            if (*level >= 0 && *level <= 6)
                logging_.level = static_cast<int>(*level);
            else
                reportInvalid("logging.level", "expected 0..6, got " + std::to_string(*level));
        }
        if (auto v = (*logging)["append"].value<bool>())
            logging_.append = *v;
        if (auto v = (*logging)["file"].value<std::string>())
            logging_.file = *v;
        if (auto v = (*logging)["console"].value<bool>())
            logging_.console = *v;
        if (auto v = (*logging)["verbose"].value<bool>())
            logging_.verbose = *v;
        if (auto v = (*logging)["max_preview"].value<int64_t>())
        {
            if (*v > 0)
                logging_.max_preview = static_cast<std::size_t>(*v);
            else
                reportInvalid("logging.max_preview", "must be positive");
        }
    }

    if (auto* resolver = root["resolver"].as_table())
    {
        if (auto v = (*resolver)["deduplicate_text"].value<bool>())
            resolver_.deduplicate_text = *v;
        if (auto v = (*resolver)["min_confidence"].value<double>())
        {
            if (!std::isnan(*v) && *v >= 0.0 && *v <= 1.0)
                resolver_.min_confidence = *v;
            else
                reportInvalid("resolver.min_confidence", "expected a value within [0, 1]");
        }
    }

    if (auto* substitution = root["substitution"].as_table())
    {
        if (auto v = (*substitution)["collapse_repeated_prefix"].value<bool>())
            substitution_.collapse_repeated_prefix = *v;
    }

    if (auto* sources = root["sources"].as_table())
    {
        for (auto&& [key, node] : *sources)
        {
            const std::string name(key.str());
            auto source = parseEntitySource(name);
            auto enabled = node.value<bool>();
            if (!source || !enabled)
            {
                reportInvalid("sources." + name, "expected a known source with a boolean value");
                continue;
            }
            source_filters_[*source] = *enabled;
        }
    }

    if (auto* types = root["types"].as_table())
    {
        for (auto&& [key, node] : *types)
        {
            const std::string name(key.str());
            auto type = parseEntityType(name);
            const toml::table* rule = node.as_table();
            if (!type || !rule)
            {
                reportInvalid("types." + name, "unknown entity type");
                continue;
            }
            if (auto v = (*rule)["replacement"].value<std::string>())
            {
                if (v->empty())
                    reportInvalid("types." + name + ".replacement", "must not be empty");
                else
                    policy_.setTemplate(*type, *v);
            }
            if (auto v = (*rule)["default_selected"].value<bool>())
                policy_.setDefaultSelected(*type, *v);
        }
    }
}

SessionOptions EngineConfig::sessionOptions() const
{
    SessionOptions options;
    options.policy = policy_;
    options.resolver = resolver_;
    options.substitution = substitution_;
    options.source_filters = source_filters_;
    return options;
}

} // namespace lexanon
