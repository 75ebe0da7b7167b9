#include "core/generation_errors.hpp"
#include "core/generator_registry.hpp"
#include "core/pipeline_config.hpp"
#include "core/pipeline_runner.hpp"
#include "core/shot_list_io.hpp"
#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <iostream>
#include <optional>
#include <string>

namespace
{
    const int EXIT_RUN_FAILED = 1;
    const int EXIT_USAGE = 2;

    void printUsage(const char *program)
    {
        std::cout << "storyreel - dependency-aware frame and video generation" << std::endl;
        std::cout << "Usage: " << program << " --shots <shots.json> [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c <file>     YAML configuration (default: built-in defaults)" << std::endl;
        std::cout << "  --shots <file>          Shot list JSON" << std::endl;
        std::cout << "  --working-dir <dir>     Cache directory, overrides working_dir" << std::endl;
        std::cout << "  --log-level <level>     TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --frames-only           Generate first and last frames, no videos" << std::endl;
        std::cout << "  --plan                  Print cameras and tasks, generate nothing" << std::endl;
        std::cout << "  --help, -h              Show this help message" << std::endl;
    }

    struct CommandLine
    {
        std::optional<std::string> config_path;
        std::optional<std::string> shots_path;
        std::optional<std::string> working_dir;
        std::optional<std::string> log_level;
        bool frames_only = false;
        bool plan_only = false;
        bool help = false;
    };

    CommandLine parseCommandLine(int argc, char *argv[])
    {
        CommandLine cmd;
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            auto value = [&]() -> std::string
            {
                if (i + 1 >= argc)
                {
                    throw ConfigError("Missing value for " + arg);
                }
                return argv[++i];
            };

            if (arg == "--config" || arg == "-c")
                cmd.config_path = value();
            else if (arg == "--shots")
                cmd.shots_path = value();
            else if (arg == "--working-dir")
                cmd.working_dir = value();
            else if (arg == "--log-level")
                cmd.log_level = value();
            else if (arg == "--frames-only")
                cmd.frames_only = true;
            else if (arg == "--plan")
                cmd.plan_only = true;
            else if (arg == "--help" || arg == "-h")
                cmd.help = true;
            else
                throw ConfigError("Unknown option: " + arg);
        }
        if (!cmd.help && !cmd.shots_path)
        {
            throw ConfigError("--shots is required");
        }
        return cmd;
    }

    // Keeps the runner's stop hook registered only while the runner is alive
    struct ScopedStopHook
    {
        explicit ScopedStopHook(int hook_id) : id(hook_id) {}
        ~ScopedStopHook() { ShutdownManager::getInstance().removeStopHook(id); }

        ScopedStopHook(const ScopedStopHook &) = delete;
        ScopedStopHook &operator=(const ScopedStopHook &) = delete;

        int id;
    };
}

int main(int argc, char *argv[])
{
    CommandLine cmd;
    PipelineConfig config;
    try
    {
        cmd = parseCommandLine(argc, argv);
        if (cmd.help)
        {
            printUsage(argv[0]);
            return 0;
        }

        if (cmd.config_path)
        {
            config = PipelineConfig::loadFromFile(*cmd.config_path);
        }
        if (cmd.working_dir)
        {
            config.setWorkingDir(*cmd.working_dir);
        }
        if (cmd.log_level)
        {
            config.setLogLevel(*cmd.log_level);
        }
    }
    catch (const ConfigError &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Use --help or -h for usage." << std::endl;
        return EXIT_USAGE;
    }

    Logger::init(config.getLogLevel());
    Logger::info("Starting storyreel, working directory " + config.getWorkingDir());

    try
    {
        GeneratorSuite generators = PipelineRunner::buildGenerators(config, GeneratorRegistry::withBuiltins());
        PipelineRunner runner(config, generators);
        std::vector<Shot> shots = ShotListIO::loadShots(*cmd.shots_path);

        if (cmd.plan_only)
        {
            std::cout << runner.describePlan(shots);
            return 0;
        }

        Logger::attachRunLog((runner.cache().workingDir() / "storyreel.log").string());

        auto &shutdown = ShutdownManager::getInstance();
        shutdown.installSignalHandlers();
        ScopedStopHook hook(shutdown.addStopHook([&runner]()
                                                 { runner.requestStop(); }));

        RunReport report = runner.run(shots, cmd.frames_only ? RunTarget::FRAMES : RunTarget::VIDEOS);

        if (report.fatal)
        {
            Logger::error("Run aborted: " + report.fatal_error);
            return EXIT_RUN_FAILED;
        }
        if (report.stopped && !report.succeeded())
        {
            Logger::warn("Run interrupted; rerun with the same working directory to resume");
            return shutdown.interruptedExitCode();
        }
        return report.succeeded() ? 0 : EXIT_RUN_FAILED;
    }
    catch (const ConfigError &e)
    {
        Logger::error("Configuration error: " + std::string(e.what()));
        return EXIT_USAGE;
    }
    catch (const std::exception &e)
    {
        Logger::error(errorKindName(e) + ": " + e.what());
        return EXIT_RUN_FAILED;
    }
}
