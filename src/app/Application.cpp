#include "Application.hpp"
#include "config/ModManagerConfig.hpp"
#include "config/ProfileStore.hpp"
#include "install/ArchiveInstaller.hpp"
#include "install/ModSource.hpp"
#include "updater/GameReleaseCatalog.hpp"
#include "updater/PackageDownloader.hpp"
#include "updater/UpdateDecisionService.hpp"
#include "updater/UpdaterService.hpp"
#include "updater/VersionRecord.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <iostream>

namespace fs = std::filesystem;

namespace
{

utils::http::SessionConfig sessionFor(const config::NetworkSettings& network, int timeoutMs)
{
    utils::http::SessionConfig session;
    session.connect_timeout_ms = network.connect_timeout_ms;
    session.timeout_ms = timeoutMs;
    session.user_agent = network.user_agent;
    return session;
}

void printDownloadProgress(const updater::DownloadProgress& progress)
{
    if (progress.totalBytes > 0)
        std::cerr << "\r  " << static_cast<int>(progress.percentage) << "% (" << progress.speed << ")   " << std::flush;
    else
        std::cerr << "\r  " << progress.bytesDownloaded / 1024 << " KB (" << progress.speed << ")   " << std::flush;
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { utils::LogManager::Shutdown(); }

int Application::run()
{
    if (!parseCommandLineArgs())
    {
        printUsage();
        return ExitUsage;
    }
    if (command_ == "help")
    {
        printUsage();
        return ExitSuccess;
    }

    if (!initialize())
    {
        printPendingErrors();
        return ExitFailure;
    }

    PLOG_INFO << "modkeep " << MODKEEP_VERSION_STRING << ": " << command_ << " in " << root_.string();

    int code = ExitFailure;
    if (command_ == "check")
        code = runCheck();
    else if (command_ == "self-update")
        code = runSelfUpdate();
    else if (command_ == "install")
        code = runInstall();
    else if (command_ == "profiles")
        code = runProfiles();
    else if (command_ == "games")
        code = runGames();
    else if (command_ == "install-game")
        code = runInstallGame();
    else if (command_ == "version")
        code = runVersion();

    printPendingErrors();
    return code;
}

bool Application::parseCommandLineArgs()
{
    std::error_code ec;
    root_ = fs::current_path(ec);

    for (int i = 1; i < argc_; ++i)
    {
        std::string arg = argv_[i];
        if (arg == "--root" || arg == "--profile")
        {
            if (i + 1 >= argc_)
            {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            if (arg == "--root")
                root_ = argv_[++i];
            else
                profileName_ = argv_[++i];
        }
        else if (arg == "--yes" || arg == "-y")
            assumeYes_ = true;
        else if (arg == "--experimental")
            experimental_ = true;
        else if (arg == "--verbose" || arg == "-v")
            verbose_ = true;
        else if (arg == "--help" || arg == "-h")
            command_ = "help";
        else if (arg.rfind("--", 0) == 0)
        {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
        else if (command_.empty())
            command_ = arg;
        else
            commandArgs_.push_back(arg);
    }

    if (command_ == "help")
        return true;

    static const std::vector<std::string> known = { "check", "self-update", "install", "profiles",
                                                    "games", "install-game", "version" };
    if (std::find(known.begin(), known.end(), command_) == known.end())
    {
        if (!command_.empty())
            std::cerr << "Unknown command: " << command_ << "\n";
        return false;
    }

    size_t expectedArgs = command_ == "install-game" ? 1 : 0;
    if (commandArgs_.size() != expectedArgs)
    {
        std::cerr << "Wrong number of arguments for " << command_ << "\n";
        return false;
    }

    root_ = fs::absolute(root_, ec);
    return true;
}

void Application::printUsage() const
{
    std::cerr << "Usage: modkeep [--root DIR] [--verbose] <command>\n"
                 "\n"
                 "Commands:\n"
                 "  check                          check for a new modkeep release\n"
                 "  self-update [--yes]            replace modkeep with the latest release\n"
                 "  install [--profile NAME]       install every mod of a profile\n"
                 "  profiles                       list profiles\n"
                 "  games [--experimental]         list installable game builds\n"
                 "  install-game <n> [--experimental]  install game build number n\n"
                 "  version                        show installed versions\n";
}

bool Application::initialize()
{
    std::error_code ec;
    if (!fs::is_directory(root_, ec))
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization,
                                          "Installation folder does not exist: " + root_.string());
        return false;
    }

    // Settings first: they decide where and how to log
    fs::path settingsPath = root_ / config::AppSettings::kDefaultFile;
    if (!config::AppSettings::load(settingsPath.string(), settings_, settingsError_))
        settings_ = config::AppSettings{};

    if (!initializeLogging())
        return false;

    if (!settingsError_.empty())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Settings file is malformed, using defaults", settingsError_);
    }

    downloader_ = std::make_unique<updater::PackageDownloader>(
        sessionFor(settings_.network, settings_.network.download_timeout_ms));
    return true;
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(settings_.logging))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            "");
        return false;
    }

    return utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                  .filepath = resolveUnderRoot(settings_.logging.file).string(),
                                                  .append_override = std::nullopt,
                                                  .level_override = std::nullopt,
                                                  .max_file_size = settings_.logging.max_file_size,
                                                  .backup_count = settings_.logging.backup_count,
                                                  .add_console_appender = verbose_ });
}

void Application::printPendingErrors() const
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        std::cerr << utils::ErrorReporter::Summarize(report) << "\n";
    }
}

fs::path Application::resolveUnderRoot(const std::string& path) const
{
    fs::path p(path);
    return p.is_absolute() ? p : root_ / p;
}

int Application::runVersion()
{
    updater::VersionRecord record(resolveUnderRoot(settings_.paths.version_file));
    std::string error;
    if (record.load(error) == config::LoadStatus::Invalid)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Version record is unreadable",
                                            error);
    }

    std::string program = record.programVersion().empty() ? MODKEEP_VERSION_STRING : record.programVersion();
    std::cout << "modkeep " << program << "\n";
    std::cout << "game    " << (record.gameVersion().empty() ? "(not installed)" : record.gameVersion()) << "\n";
    return ExitSuccess;
}

int Application::runCheck()
{
    updater::UpdaterService service(settings_, root_,
                                    updater::UpdateDecisionService::defaultHttpGet(
                                        sessionFor(settings_.network, settings_.network.timeout_ms)),
                                    *downloader_, MODKEEP_VERSION_STRING);

    updater::UpdateAvailability availability;
    updater::CheckError error;
    if (!service.checkForUpdates(availability, error))
        return ExitFailure;

    switch (availability.status)
    {
    case updater::AvailabilityStatus::NotConfigured:
        std::cout << "No update URL configured.\n";
        break;
    case updater::AvailabilityStatus::NoReleaseFound:
        std::cout << "No releases published yet.\n";
        break;
    case updater::AvailabilityStatus::UpToDate:
        std::cout << "Up to date (" << availability.currentVersion << ").\n";
        break;
    case updater::AvailabilityStatus::UpdateAvailable:
        std::cout << "Update available: " << availability.currentVersion << " -> "
                  << availability.release.tagVersion << (availability.release.isExperimental ? " (experimental)" : "")
                  << "\n";
        if (!availability.release.releaseNotes.empty())
            std::cout << "\n" << availability.release.releaseNotes << "\n";
        break;
    }
    return ExitSuccess;
}

int Application::runSelfUpdate()
{
    updater::UpdaterService service(settings_, root_,
                                    updater::UpdateDecisionService::defaultHttpGet(
                                        sessionFor(settings_.network, settings_.network.timeout_ms)),
                                    *downloader_, MODKEEP_VERSION_STRING);

    updater::UpdateAvailability availability;
    updater::CheckError checkError;
    if (!service.checkForUpdates(availability, checkError))
        return ExitFailure;

    if (!availability.updateAvailable())
    {
        std::cout << "No update available.\n";
        return ExitSuccess;
    }

    std::cout << "Update " << availability.currentVersion << " -> " << availability.release.tagVersion << "\n";
    if (!assumeYes_)
    {
        std::cout << "Replace the program files now? Preserved folders stay as they are. [y/N] " << std::flush;
        std::string answer;
        std::getline(std::cin, answer);
        if (answer != "y" && answer != "Y" && answer != "yes")
        {
            std::cout << "Cancelled.\n";
            return ExitSuccess;
        }
    }

    service.setStateCallback([](updater::UpdateState state)
                             { std::cout << "\n" << updater::updateStateToString(state) << "..." << std::flush; });

    updater::UpdateError error;
    bool ok = service.applyUpdate(error, printDownloadProgress);
    std::cout << "\n";
    if (!ok)
    {
        if (!error.recoveryPath.empty())
            std::cerr << "Backup of your preserved files: " << error.recoveryPath << "\n";
        return ExitFailure;
    }

    for (const auto& warning : service.getVerificationWarnings())
        std::cerr << "Warning: " << warning << "\n";
    std::cout << "Updated to " << availability.release.tagVersion << ". Restart modkeep to use it.\n";
    return ExitSuccess;
}

int Application::runProfiles()
{
    config::ProfileStore store(resolveUnderRoot(settings_.paths.profiles_file), root_,
                               settings_.paths.default_install_dir);
    std::string error;
    if (store.load(error) == config::LoadStatus::Invalid)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Profile file is unreadable", error);
        return ExitFailure;
    }

    const std::string current = store.current().name;
    for (const auto& name : store.names())
    {
        const config::Profile* profile = store.find(name);
        std::cout << (name == current ? "* " : "  ") << name << "  (" << profile->mods.size() << " mods, "
                  << profile->installRoot.string() << ")\n";
    }
    return ExitSuccess;
}

int Application::runInstall()
{
    config::ProfileStore store(resolveUnderRoot(settings_.paths.profiles_file), root_,
                               settings_.paths.default_install_dir);
    std::string error;
    if (store.load(error) == config::LoadStatus::Invalid)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Profile file is unreadable", error);
        return ExitFailure;
    }

    if (!profileName_.empty() && !store.switchTo(profileName_))
    {
        std::cerr << "No profile named '" << profileName_ << "'\n";
        return ExitFailure;
    }

    const config::Profile& profile = store.current();
    if (profile.mods.empty())
    {
        std::cout << "Profile '" << profile.name << "' has no mods.\n";
        return ExitSuccess;
    }

    install::ArchiveInstaller installer(settings_.content, *downloader_);
    updater::BatchInstallSummary summary = installer.installAll(
        profile.mods, profile.installRoot,
        [](size_t index, size_t total, const config::Mod& mod)
        {
            std::cout << "[" << index + 1 << "/" << total << "] "
                      << install::displayName(install::normalizeSourceUrl(mod.sourceUrl)) << "\n";
        });

    std::cout << summary.successCount << " installed, " << summary.failures.size() << " failed\n";
    for (const auto& failure : summary.failures)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Install, failure.name + ": " + failure.message);
    }
    return summary.allSucceeded() ? ExitSuccess : ExitFailure;
}

int Application::runGames()
{
    updater::GameReleaseCatalog catalog(
        updater::UpdateDecisionService::defaultHttpGet(sessionFor(settings_.network, settings_.network.timeout_ms)),
        settings_.game.releases_url, settings_.game.experimental_url);

    std::vector<updater::GameRelease> releases;
    updater::CheckError error;
    if (!catalog.fetch(experimental_, releases, error))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Network, error.message, error.technicalInfo);
        return ExitFailure;
    }

    if (releases.empty())
    {
        std::cout << "No releases found.\n";
        return ExitSuccess;
    }
    for (size_t i = 0; i < releases.size(); ++i)
        std::cout << i + 1 << ". " << releases[i].name << "  (" << releases[i].asset.name << ")\n";
    return ExitSuccess;
}

int Application::runInstallGame()
{
    size_t index = 0;
    try
    {
        index = std::stoul(commandArgs_.front());
    }
    catch (const std::exception&)
    {
        std::cerr << "Not a release number: " << commandArgs_.front() << "\n";
        return ExitUsage;
    }

    updater::GameReleaseCatalog catalog(
        updater::UpdateDecisionService::defaultHttpGet(sessionFor(settings_.network, settings_.network.timeout_ms)),
        settings_.game.releases_url, settings_.game.experimental_url);

    std::vector<updater::GameRelease> releases;
    updater::CheckError checkError;
    if (!catalog.fetch(experimental_, releases, checkError))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Network, checkError.message, checkError.technicalInfo);
        return ExitFailure;
    }
    if (index == 0 || index > releases.size())
    {
        std::cerr << "Release number out of range (1-" << releases.size() << ")\n";
        return ExitUsage;
    }

    config::ModManagerConfig cfg;
    std::string cfgError;
    if (config::ModManagerConfig::load(resolveUnderRoot(settings_.paths.config_file).string(), cfg, cfgError) ==
        config::LoadStatus::Invalid)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Config file is unreadable, using defaults", cfgError);
    }
    fs::path gameDir = resolveUnderRoot(cfg.gameInstallDir.empty() ? settings_.game.default_install_dir
                                                                   : cfg.gameInstallDir);

    install::ArchiveInstaller installer(settings_.content, *downloader_);
    installer.setDownloadProgress(printDownloadProgress);

    const updater::GameRelease& release = releases[index - 1];
    updater::InstallError error;
    bool ok = updater::installGameRelease(installer, release, gameDir, resolveUnderRoot(settings_.paths.version_file),
                                          error);
    std::cerr << "\n";
    if (!ok)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Install, error.message, error.technicalInfo);
        return ExitFailure;
    }

    std::cout << "Installed " << release.name << " to " << gameDir.string() << "\n";
    return ExitSuccess;
}
