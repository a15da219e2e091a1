#include "Application.hpp"
#include "TranscriptRunner.hpp"
#include "config/DiffConfig.hpp"
#include "diff/NeedlemanWunschAligner.hpp"
#include "diff/TextDiff.hpp"
#include "processing/Diagnostics.hpp"
#include "processing/LanguageTag.hpp"
#include "processing/NormalizationPipeline.hpp"
#include "processing/ProcessingErrors.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "utils/Profile.hpp"

#include <plog/Log.h>

#include <iostream>
#include <string_view>

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

int Application::run()
{
    PROFILE_SCOPE_FUNCTION();

    if (!parseCommandLineArgs())
    {
        std::cerr << "transcript-diff: " << usage_error_ << "\n";
        printUsage(true);
        return app::kExitUsage;
    }
    if (options_.help)
    {
        printUsage(false);
        return app::kExitOk;
    }

    initializeConfig();
    if (!initializeLogging())
    {
        flushReports();
        return app::kExitFailure;
    }

    try
    {
        const auto tag = processing::resolveLanguageTag(config_->normalization.language);
        PLOG_INFO << "Normalizing as " << tag.toString() << (processing::isEnglish(tag) ? " with" : " without")
                  << " English expansion";
    }
    catch (const processing::InvalidLanguageTagError& ex)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization, "Unsupported language tag",
                                          ex.what());
        flushReports();
        return app::kExitUsage;
    }

    const int status = options_.normalize_path ? runNormalize() : runDiff();
    flushReports();
    return status;
}

bool Application::parseCommandLineArgs()
{
    for (int i = 1; i < argc_; ++i)
    {
        const std::string_view arg = argv_[i];
        auto next_value = [&](std::string& out)
        {
            if (i + 1 >= argc_)
            {
                usage_error_ = std::string("missing value for ") + std::string(arg);
                return false;
            }
            out = argv_[++i];
            return true;
        };

        std::string value;
        if (arg == "--help" || arg == "-h")
            options_.help = true;
        else if (arg == "--config")
        {
            if (!next_value(options_.config_path))
                return false;
        }
        else if (arg == "--lang")
        {
            if (!next_value(value))
                return false;
            options_.language = value;
        }
        else if (arg == "--normalize")
        {
            if (!next_value(value))
                return false;
            options_.normalize_path = value;
        }
        else if (arg == "--fault-tolerant")
            options_.fault_tolerant = true;
        else if (arg == "--no-color")
            options_.no_color = true;
        else if (arg == "--verbose")
            options_.verbose = true;
        else if (arg.size() > 1 && arg.front() == '-')
        {
            usage_error_ = "unknown option " + std::string(arg);
            return false;
        }
        else
            options_.positional.emplace_back(arg);
    }

    if (options_.help)
        return true;

    const std::size_t expected = options_.normalize_path ? 0 : 2;
    if (options_.positional.size() != expected)
    {
        usage_error_ = options_.normalize_path ? "--normalize takes no other file"
                                               : "expected a reference file and a hypothesis file";
        return false;
    }
    return true;
}

void Application::initializeConfig()
{
    config_ = std::make_unique<config::DiffConfig>(config::DiffConfig::loadFile(options_.config_path));

    // Command line wins over the file
    if (options_.language)
        config_->normalization.language = *options_.language;
    if (options_.fault_tolerant)
        config_->normalization.fault_tolerant = true;
    if (options_.no_color)
        config_->render.colors = false;
    if (options_.verbose)
        config_->diagnostics.verbose = true;

    processing::Diagnostics::SetVerbose(config_->diagnostics.verbose);
    processing::Diagnostics::SetMaxPreview(config_->diagnostics.max_preview);
}

bool Application::initializeLogging()
{
    PROFILE_SCOPE_FUNCTION();

    const auto& logging = config_->logging;
    if (!utils::LogManager::Initialize(logging))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            logging.file);
        return false;
    }

    const bool registered =
        utils::LogManager::RegisterLogger<0>({ .name = "main",
                                               .filepath = logging.file,
                                               .append_override = std::nullopt,
                                               .level_override = std::nullopt,
                                               .max_file_size = 10 * 1024 * 1024,
                                               .backup_count = 3,
                                               .add_console_appender = logging.console });

    // Stage tracing and profiling go to their own files beside the main log
    utils::LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>(
        { .name = "diagnostics",
          .filepath = utils::LogManager::SiblingLogPath(logging.file, "diagnostics.log"),
          .append_override = std::nullopt,
          .level_override = config_->diagnostics.verbose ? plog::verbose : plog::warning,
          .max_file_size = 10 * 1024 * 1024,
          .backup_count = 3,
          .add_console_appender = false });

#if TDIFF_PROFILING_LEVEL >= 1
    utils::LogManager::RegisterLogger<profiling::kProfilingLogInstance>(
        { .name = "profiling",
          .filepath = utils::LogManager::SiblingLogPath(logging.file, "profiling.log"),
          .append_override = std::nullopt,
          .level_override = std::nullopt,
          .max_file_size = 10 * 1024 * 1024,
          .backup_count = 3,
          .add_console_appender = false });
#endif

    if (registered)
    {
        PLOG_INFO << "transcript-diff starting, language=" << config_->normalization.language
                  << " fault_tolerant=" << config_->normalization.fault_tolerant;
    }
    return registered;
}

int Application::runDiff()
{
    PROFILE_SCOPE_FUNCTION();

    std::vector<std::string> references;
    std::vector<std::string> hypotheses;
    if (!app::readLines(options_.positional[0], references) || !app::readLines(options_.positional[1], hypotheses))
        return app::kExitFailure;

    const auto pipeline = processing::NormalizationPipeline::forLanguage(config_->normalization.language,
                                                                         config_->normalization.fault_tolerant);
    const diff::NeedlemanWunschAligner aligner;
    const diff::DiffProjector projector(aligner);
    return app::diffLines(references, hypotheses, pipeline, projector, config_->render.colors, std::cout);
}

int Application::runNormalize()
{
    PROFILE_SCOPE_FUNCTION();

    std::vector<std::string> lines;
    if (!app::readLines(*options_.normalize_path, lines))
        return app::kExitFailure;

    const auto pipeline = processing::NormalizationPipeline::forLanguage(config_->normalization.language,
                                                                         config_->normalization.fault_tolerant);
    return app::normalizeLines(lines, pipeline, std::cout);
}

void Application::printUsage(bool to_stderr) const
{
    std::ostream& os = to_stderr ? std::cerr : std::cout;
    os << "Usage: transcript-diff [options] REFERENCE_FILE HYPOTHESIS_FILE\n"
          "       transcript-diff [options] --normalize FILE\n"
          "\n"
          "Options:\n"
          "  --config PATH       configuration file (default transcript_diff.toml)\n"
          "  --lang TAG          language of the texts, e.g. en-us\n"
          "  --fault-tolerant    recover from normalization inconsistencies\n"
          "  --no-color          plain output without ANSI colors\n"
          "  --verbose           trace every normalization stage in the log\n"
          "  --help              show this message\n";
}

void Application::flushReports() const
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        std::cerr << utils::ErrorReporter::SeverityToString(report.severity) << ": " << report.user_message;
        if (!report.technical_details.empty())
            std::cerr << " (" << report.technical_details << ")";
        std::cerr << "\n";
    }
}

void Application::cleanup() { utils::LogManager::Shutdown(); }
