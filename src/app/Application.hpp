#pragma once

#include <memory>
#include <string>

namespace lexanon
{
class EngineConfig;
class Session;
} // namespace lexanon

namespace lexanon::app
{

enum ExitCode
{
    kExitSuccess = 0,
    kExitUsage = 1,
    kExitStageFailure = 2
};

struct CommandLine
{
    std::string text_path;
    std::string candidates_path;
    std::string script_path;
    std::string config_path = "config.toml";
    std::string output_path; // Empty: anonymized text goes to stdout
    std::string bundle_path;
    bool verbose = false;
};

void PrintUsage(const char* program_name);
void PrintVersion();

// Batch front end: document + detector output + scripted decisions in,
// anonymized text and export bundle out.
class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

    const CommandLine& commandLine() const { return args_; }

private:
    enum class ParseOutcome
    {
        Run,
        Exit,
        UsageError
    };

    ParseOutcome parseCommandLineArgs();
    bool initializeLogging();
    int runPipeline();
    void reportPendingErrors();
    void cleanup();

    int argc_;
    char** argv_;
    CommandLine args_;
    std::unique_ptr<EngineConfig> config_;
    std::unique_ptr<Session> session_;
    bool logging_ready_ = false;
};

} // namespace lexanon::app
