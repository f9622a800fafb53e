#pragma once

#include "config/AppSettings.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace updater
{
class PackageDownloader;
}

class Application
{
public:
    enum ExitCode
    {
        ExitSuccess = 0,
        ExitFailure = 1,
        ExitUsage = 2
    };

    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    bool parseCommandLineArgs();
    bool initialize();
    bool initializeLogging();
    void printUsage() const;
    void printPendingErrors() const;

    int runCheck();
    int runSelfUpdate();
    int runInstall();
    int runProfiles();
    int runGames();
    int runInstallGame();
    int runVersion();

    std::filesystem::path resolveUnderRoot(const std::string& path) const;

    int argc_;
    char** argv_;

    std::filesystem::path root_;
    std::string command_;
    std::vector<std::string> commandArgs_;
    bool assumeYes_ = false;
    bool experimental_ = false;
    bool verbose_ = false;
    std::string profileName_;

    config::AppSettings settings_;
    std::string settingsError_;
    std::unique_ptr<updater::PackageDownloader> downloader_;
};
