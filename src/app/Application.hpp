#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace config
{
class DiffConfig;
}

// Command-line front end: diffs two transcript files line by line, or prints normalized lines
class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    // Process exit status: 0 success, 1 failed pair or unreadable input, 2 usage error
    int run();

private:
    struct Options
    {
        std::string config_path = "transcript_diff.toml";
        std::optional<std::string> language;
        bool fault_tolerant = false;
        bool no_color = false;
        bool verbose = false;
        bool help = false;
        std::optional<std::string> normalize_path;
        std::vector<std::string> positional;
    };

    bool parseCommandLineArgs();
    void initializeConfig();
    bool initializeLogging();

    int runDiff();
    int runNormalize();

    void printUsage(bool to_stderr) const;
    void flushReports() const;
    void cleanup();

    Options options_;
    std::unique_ptr<config::DiffConfig> config_;
    std::string usage_error_;

    int argc_ = 0;
    char** argv_ = nullptr;
};
