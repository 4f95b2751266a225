#include "Application.hpp"
#include "StageRunner.hpp"
#include "Version.hpp"
#include "config/EngineConfig.hpp"
#include "export/ExportBundle.hpp"
#include "io/CandidateReader.hpp"
#include "io/SessionScript.hpp"
#include "session/Session.hpp"
#include "utils/Diagnostics.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace lexanon::app
{

namespace
{

std::string readDocument(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
        throw std::runtime_error("cannot open document: " + path);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace

void PrintUsage(const char* program_name)
{
    std::cout << "Usage: " << program_name << " --text <document.txt> [OPTIONS]\n";
    std::cout << "lexanon - entity anonymization for legal documents\n\n";
    std::cout << "Options:\n";
    std::cout << "  --text <file>        Extracted document text (UTF-8), required\n";
    std::cout << "  --candidates <file>  Detector output (JSON array of candidates)\n";
    std::cout << "  --script <file>      Review decisions (manual entities, filters, groups)\n";
    std::cout << "  --config <file>      Configuration file (default: config.toml)\n";
    std::cout << "  --output <file>      Write anonymized text here instead of stdout\n";
    std::cout << "  --bundle <file>      Write the export bundle (text, audit, entities) as JSON\n";
    std::cout << "  --verbose            Allow document snippets in the log\n";
    std::cout << "  --version            Show version information\n";
    std::cout << "  --help               Show this help message\n";
}

void PrintVersion()
{
    std::cout << "lexanon entity anonymization engine\n";
    std::cout << "Version: " << LEXANON_VERSION_STRING << "\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

Application::ParseOutcome Application::parseCommandLineArgs()
{
    for (int i = 1; i < argc_; ++i)
    {
        const char* arg = argv_[i];
        auto takeValue = [&](std::string& target) -> bool
        {
            if (i + 1 >= argc_)
            {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            target = argv_[++i];
            return true;
        };

        if (std::strcmp(arg, "--version") == 0)
        {
            PrintVersion();
            return ParseOutcome::Exit;
        }
        else if (std::strcmp(arg, "--help") == 0)
        {
            PrintUsage(argv_[0]);
            return ParseOutcome::Exit;
        }
        else if (std::strcmp(arg, "--verbose") == 0)
        {
            args_.verbose = true;
        }
        else if (std::strcmp(arg, "--text") == 0)
        {
            if (!takeValue(args_.text_path))
                return ParseOutcome::UsageError;
        }
        else if (std::strcmp(arg, "--candidates") == 0)
        {
            if (!takeValue(args_.candidates_path))
                return ParseOutcome::UsageError;
        }
        else if (std::strcmp(arg, "--script") == 0)
        {
            if (!takeValue(args_.script_path))
                return ParseOutcome::UsageError;
        }
        else if (std::strcmp(arg, "--config") == 0)
        {
            if (!takeValue(args_.config_path))
                return ParseOutcome::UsageError;
        }
        else if (std::strcmp(arg, "--output") == 0)
        {
            if (!takeValue(args_.output_path))
                return ParseOutcome::UsageError;
        }
        else if (std::strcmp(arg, "--bundle") == 0)
        {
            if (!takeValue(args_.bundle_path))
                return ParseOutcome::UsageError;
        }
        else
        {
            std::cerr << "Unknown option: " << arg << "\n";
            return ParseOutcome::UsageError;
        }
    }

    if (args_.text_path.empty())
    {
        std::cerr << "--text is required\n";
        return ParseOutcome::UsageError;
    }
    return ParseOutcome::Run;
}

bool Application::initializeLogging()
{
    const LoggingSettings& settings = config_->logging();

    utils::Diagnostics::SetVerbose(settings.verbose || args_.verbose);
    utils::Diagnostics::SetMaxPreview(settings.max_preview);

    if (!utils::LogManager::Initialize(settings.append, static_cast<plog::Severity>(settings.level)))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Failed to initialize logging system", "");
        return false;
    }

    if (!utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                .filepath = settings.file,
                                                .append_override = std::nullopt,
                                                .level_override = std::nullopt,
                                                .max_file_size = 10 * 1024 * 1024,
                                                .backup_count = 3,
                                                .add_console_appender = settings.console }))
    {
        return false;
    }

    logging_ready_ = utils::LogManager::ForwardToDefault<utils::Diagnostics::kLogInstance>();
    return logging_ready_;
}

int Application::run()
{
    switch (parseCommandLineArgs())
    {
    case ParseOutcome::Exit:
        return kExitSuccess;
    case ParseOutcome::UsageError:
        PrintUsage(argv_[0]);
        return kExitUsage;
    case ParseOutcome::Run:
        break;
    }

    config_ = std::make_unique<EngineConfig>(args_.config_path);
    config_->load();

    if (!initializeLogging())
        std::cerr << "Logging unavailable, continuing without a log file\n";

    PLOG_INFO << "lexanon " << LEXANON_VERSION_STRING << " starting";
    const int code = runPipeline();
    reportPendingErrors();
    PLOG_INFO << "lexanon finished with exit code " << code;
    return code;
}

int Application::runPipeline()
{
    using utils::ErrorCategory;

    auto document = run_stage<std::string>("read-document", ErrorCategory::Input,
                                           [&] { return readDocument(args_.text_path); });
    if (!document.succeeded)
        return kExitStageFailure;

    session_ = std::make_unique<Session>(args_.text_path, std::move(document.result), config_->sessionOptions());

    if (!args_.candidates_path.empty())
    {
        auto candidates = run_stage<std::vector<Candidate>>(
            "read-candidates", ErrorCategory::Input,
            [&]
            {
                std::vector<Candidate> out;
                std::string error;
                if (!CandidateReader::parseFile(args_.candidates_path, out, error))
                    throw std::runtime_error(error);
                return out;
            });
        if (!candidates.succeeded)
            return kExitStageFailure;

        auto ingested = run_stage<bool>("resolve", ErrorCategory::Resolution,
                                        [&]
                                        {
                                            auto res = session_->ingest(candidates.result);
                                            if (!res)
                                            {
                                                throw std::runtime_error(std::string(toString(res.error->kind)) +
                                                                         ": " + res.error->message);
                                            }
                                            for (const auto& rejected : res->rejected)
                                            {
                                                PLOG_DEBUG_(utils::Diagnostics::kLogInstance)
                                                    << "[Resolve] rejected " << rejected.candidate.id << ": "
                                                    << rejected.reason;
                                            }
                                            return true;
                                        });
        if (!ingested.succeeded)
            return kExitStageFailure;
    }

    if (!args_.script_path.empty())
    {
        auto scripted = run_stage<bool>("apply-script", ErrorCategory::Grouping,
                                        [&]
                                        {
                                            SessionScript script;
                                            std::string error;
                                            if (!SessionScript::parseFile(args_.script_path, script, error))
                                                throw std::runtime_error(error);
                                            if (auto st = script.applyTo(*session_); !st)
                                            {
                                                throw std::runtime_error(std::string(toString(st.error->kind)) +
                                                                         ": " + st.error->message);
                                            }
                                            return true;
                                        });
        if (!scripted.succeeded)
            return kExitStageFailure;
    }

    auto bundle = run_stage<ExportBundle>("anonymize", ErrorCategory::Substitution,
                                          [&] { return session_->anonymize(); });
    if (!bundle.succeeded)
        return kExitStageFailure;

    auto written = run_stage<bool>("write-output", ErrorCategory::Export,
                                   [&]
                                   {
                                       std::string error;
                                       if (args_.output_path.empty())
                                           std::cout << bundle.result.anonymized_text;
                                       else if (!ExportWriter::writeText(bundle.result.anonymized_text,
                                                                         args_.output_path, error))
                                           throw std::runtime_error(error);

                                       if (!args_.bundle_path.empty() &&
                                           !ExportWriter::writeBundle(bundle.result, args_.bundle_path, error))
                                           throw std::runtime_error(error);
                                       return true;
                                   });
    if (!written.succeeded)
        return kExitStageFailure;

    const EntityStats stats = session_->stats();
    PLOG_INFO << "Entities: " << stats.total << " tracked, " << stats.selected_count << " selected, "
              << bundle.result.totalReplacements() << " replacements";
    if (!args_.output_path.empty())
    {
        std::cout << "Anonymized " << bundle.result.entitiesAnonymized() << " entities ("
                  << bundle.result.totalReplacements() << " replacements) -> " << args_.output_path << "\n";
    }
    return kExitSuccess;
}

void Application::reportPendingErrors()
{
    const std::size_t failures = utils::ErrorReporter::CountAtLeast(utils::ErrorSeverity::Error);
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
        std::cerr << utils::ErrorReporter::Format(report) << "\n";
    if (failures > 0)
        PLOG_WARNING << failures << " error(s) reported during the run";
}

void Application::cleanup()
{
    session_.reset();
    if (logging_ready_)
    {
        utils::LogManager::Shutdown();
        logging_ready_ = false;
    }
}

} // namespace lexanon::app
