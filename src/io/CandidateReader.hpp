#pragma once

#include "../entity/EntityTypes.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace lexanon
{

/// Reads detector output: a JSON array of candidate records, or an object
/// with such an array under "entities".
///
/// Records that cannot be used (no text, unknown source) are skipped with a
/// warning; a document that is not valid JSON fails as a whole.
class CandidateReader
{
public:
    struct Stats
    {
        std::size_t read = 0;
        std::size_t skipped = 0;
    };

    static bool parse(const std::string& jsonContent, std::vector<Candidate>& outCandidates, std::string& outError,
                      Stats* outStats = nullptr);
    static bool parseFile(const std::string& filePath, std::vector<Candidate>& outCandidates, std::string& outError,
                          Stats* outStats = nullptr);

private:
    static bool parseRecord(const nlohmann::json& record, Candidate& out, std::string& outReason);
};

} // namespace lexanon
