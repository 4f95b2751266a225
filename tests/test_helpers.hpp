#pragma once

#include "entity/EntityTypes.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

// Writes `content` to a file that is removed again when the helper goes
// out of scope.
class TempFile
{
public:
    TempFile(const std::string& name, const std::string& content)
        : path_((std::filesystem::temp_directory_path() / name).string())
    {
        std::ofstream file(path_, std::ios::binary);
        file << content;
        file.close();
    }

    explicit TempFile(const std::string& name)
        : path_((std::filesystem::temp_directory_path() / name).string())
    {
    }

    ~TempFile()
    {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string getPath() const { return path_; }

    std::string read() const
    {
        std::ifstream file(path_, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

private:
    std::string path_;
};

inline lexanon::Candidate makeCandidate(const std::string& text, lexanon::EntityType type,
                                        lexanon::EntitySource source, double confidence,
                                        std::optional<std::size_t> start = std::nullopt,
                                        std::optional<std::size_t> end = std::nullopt)
{
    lexanon::Candidate c;
    c.text = text;
    c.type = type;
    c.source = source;
    c.confidence = confidence;
    c.start_offset = start;
    c.end_offset = end;
    return c;
}

inline lexanon::Entity makeEntity(const std::string& text, const std::string& replacement,
                                  lexanon::EntityType type = lexanon::EntityType::Person,
                                  lexanon::EntitySource source = lexanon::EntitySource::Manual)
{
    lexanon::Entity e;
    e.text = text;
    e.replacement = replacement;
    e.type = type;
    e.source = source;
    e.selected = !replacement.empty();
    return e;
}
