#include <iostream>
#include <string>
#include <vector>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <stdexcept>

#include "core/BackupEngine.hpp"
#include "core/ConfigLoader.hpp"
#include "core/Errors.hpp"
#include "core/Matcher.hpp"
#include "core/RecordSinks.hpp"
#include "core/RunControl.hpp"
#include "utils/ConsoleLogger.hpp"

namespace {

// SIGINT / SIGTERM 只设置标志，由运行在条目边界检查
std::atomic<bool> interruptRequested(false);

void handleSignal(int) {
    interruptRequested = true;
}

} // namespace

// 退出码
enum ExitCode {
    EXIT_COMPLETED = 0,
    EXIT_COMPLETED_WITH_ERRORS = 1,
    EXIT_FAILED = 2
};

// 配置结构体定义
struct AppConfig {
    JobFile jobFile;
    std::string reportPath;     // 非空时写 YAML 报告
    bool verbose = false;
};

// 用户界面抽象接口
class IUserInterface {
public:
    virtual ~IUserInterface() = default;

    // 初始化界面
    virtual void initialize() = 0;

    // 运行界面，返回进程退出码
    virtual int run() = 0;

    // 显示帮助信息
    virtual void showHelp() = 0;

    // 执行备份
    virtual int performBackup() = 0;

    // 显示消息
    virtual void showMessage(const std::string& message) = 0;

    // 显示错误
    virtual void showError(const std::string& message) = 0;
};

// 控制器类 - 处理业务逻辑，与具体界面实现解耦合
class ApplicationController {
private:
    IUserInterface* ui;  // 使用原始指针避免循环依赖
    ConsoleLogger& logger;
    AppConfig config;

public:
    ApplicationController(IUserInterface* ui, ConsoleLogger& logger)
        : ui(ui), logger(logger) {}

    // 设置用户界面（用于后期绑定）
    void setUserInterface(IUserInterface* ui) {
        this->ui = ui;
    }

    // Start application
    int start() {
        if (!ui) {
            return EXIT_FAILED;
        }
        ui->initialize();
        return ui->run();
    }

    // 获取配置
    AppConfig& getConfig() {
        return config;
    }

    // 执行备份操作
    int executeBackup() {
        EngineSettings& settings = config.jobFile.settings;
        logger.setLogLevel(config.verbose ? LogLevel::DEBUG : settings.logLevel);
        if (!settings.logFile.empty() && !logger.openLogFile(settings.logFile)) {
            logger.warn("Cannot open log file: " + settings.logFile);
        }

        logger.info("Backup operation started...");

        LoggingRecordSink logSink(&logger);
        CompositeRecordSink sinks;
        sinks.add(&logSink);
        std::unique_ptr<YamlReportSink> reportSink;
        if (!config.reportPath.empty()) {
            reportSink.reset(new YamlReportSink(config.reportPath, &logger));
            sinks.add(reportSink.get());
        }

        RunControl control(&interruptRequested);
        JobResult result = BackupEngine::backup(config.jobFile.job, settings, &logger, &sinks, &control);

        switch (result.status) {
            case JobStatus::COMPLETED:
                if (ui) ui->showMessage("Backup completed: " + result.summary());
                return EXIT_COMPLETED;
            case JobStatus::COMPLETED_WITH_ERRORS:
                if (ui) ui->showError("Backup completed with errors: " + result.summary());
                return EXIT_COMPLETED_WITH_ERRORS;
            case JobStatus::ABORTED:
                if (ui) ui->showError("Backup aborted: " + result.summary());
                return EXIT_FAILED;
            default:
                if (ui) ui->showError("Backup failed: " + result.errorMessage);
                return EXIT_FAILED;
        }
    }

    // 获取日志记录器
    ConsoleLogger& getLogger() {
        return logger;
    }
};

// 命令行界面实现 - 作为IUserInterface的具体实现
class CommandLineInterface : public IUserInterface {
private:
    ApplicationController& controller;
    int argc;
    char** argv;

public:
    CommandLineInterface(ApplicationController& controller, int argc, char** argv)
        : controller(controller), argc(argc), argv(argv) {}

    void initialize() override {
        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);
    }

    int run() override {
        bool helpRequested = false;
        if (!parseArguments(helpRequested)) {
            return EXIT_FAILED;
        }
        if (helpRequested) {
            showHelp();
            return EXIT_COMPLETED;
        }
        return performBackup();
    }

    void showHelp() override {
        std::cout << "=== SafeBackup Help Information ===\n";
        std::cout << "Usage: SafeBackup [options]\n\n";
        std::cout << "Options:\n";
        std::cout << "  --config <file>     Load job and settings from a YAML file\n";
        std::cout << "  --source <path>     Add a source directory or file (repeatable)\n";
        std::cout << "  --target <path>     Set local target directory\n";
        std::cout << "  --include <list>    Include patterns, ';' separated\n";
        std::cout << "  --exclude <list>    Exclude patterns, ';' separated\n";
        std::cout << "  --policy <name>     Conflict policy: overwrite, rename, skip (default: rename)\n";
        std::cout << "  --name <name>       Job name used in logs and reports\n";
        std::cout << "  --case-insensitive  Match patterns without case sensitivity\n";
        std::cout << "  --chunk-kb <n>      Copy and checksum chunk size in KiB (default: 64)\n";
        std::cout << "  --jobs <n>          Maximum concurrent transfers (default: 1)\n";
        std::cout << "  --scratch <path>    Stage files in this directory instead of beside the destination\n";
        std::cout << "  --report <file>     Write a YAML report of the run\n";
        std::cout << "  --log-file <file>   Mirror log output to a file\n";
        std::cout << "  --verbose           Enable debug logging\n";
        std::cout << "  -h, --help          Show this help information\n\n";
        std::cout << "Exit codes: 0 completed, 1 completed with errors, 2 failed or aborted\n\n";
        std::cout << "Examples:\n";
        std::cout << "  SafeBackup --source ./docs --target /mnt/backup\n";
        std::cout << "  SafeBackup --source ./docs --target /mnt/backup --include '*.docx;*.pdf' --policy skip\n";
        std::cout << "  SafeBackup --config job.yaml --report run.yaml\n";
    }

    int performBackup() override {
        return controller.executeBackup();
    }

    void showMessage(const std::string& message) override {
        std::cout << "[Info] " << message << "\n";
    }

    void showError(const std::string& message) override {
        std::cerr << "[Error] " << message << "\n";
    }

private:
    // 取选项的参数，缺失时报错
    bool takeValue(const std::vector<std::string>& args, size_t& i, std::string& value) {
        if (i + 1 >= args.size()) {
            showError("Missing value for option " + args[i]);
            return false;
        }
        value = args[++i];
        return true;
    }

    bool parseUnsigned(const std::string& option, const std::string& text, unsigned long& value) {
        char* end = nullptr;
        value = std::strtoul(text.c_str(), &end, 10);
        if (text.empty() || *end != '\0' || value == 0) {
            showError("Option " + option + " expects a positive number, got '" + text + "'");
            return false;
        }
        return true;
    }

    // Parse command line arguments
    // 先加载 --config，命令行其余选项覆盖文件中的值
    bool parseArguments(bool& helpRequested) {
        AppConfig& config = controller.getConfig();
        std::vector<std::string> args(argv + 1, argv + argc);

        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--config") {
                std::string path;
                if (!takeValue(args, i, path)) {
                    return false;
                }
                try {
                    config.jobFile = ConfigLoader::loadFile(path);
                } catch (const ValidationError& e) {
                    showError(e.what());
                    return false;
                }
            }
        }

        JobDefinition& job = config.jobFile.job;
        EngineSettings& settings = config.jobFile.settings;
        bool sourcesFromCommandLine = false;
        std::string value;

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg == "-h" || arg == "--help") {
                helpRequested = true;
                return true;
            } else if (arg == "--config") {
                ++i;
            } else if (arg == "--source") {
                if (!takeValue(args, i, value)) return false;
                if (!sourcesFromCommandLine) {
                    job.sourceRoots.clear();
                    sourcesFromCommandLine = true;
                }
                job.sourceRoots.push_back(value);
            } else if (arg == "--target") {
                if (!takeValue(args, i, value)) return false;
                job.target.kind = "local";
                job.target.location = value;
            } else if (arg == "--include") {
                if (!takeValue(args, i, value)) return false;
                job.includePatterns = Matcher::parsePatternList(value);
            } else if (arg == "--exclude") {
                if (!takeValue(args, i, value)) return false;
                job.excludePatterns = Matcher::parsePatternList(value);
            } else if (arg == "--policy") {
                if (!takeValue(args, i, value)) return false;
                try {
                    job.conflictPolicy = parseConflictPolicy(value);
                } catch (const std::invalid_argument& e) {
                    showError(e.what());
                    return false;
                }
            } else if (arg == "--name") {
                if (!takeValue(args, i, value)) return false;
                job.name = value;
            } else if (arg == "--case-insensitive") {
                settings.caseSensitive = false;
            } else if (arg == "--chunk-kb") {
                unsigned long kb = 0;
                if (!takeValue(args, i, value) || !parseUnsigned(arg, value, kb)) return false;
                settings.chunkSize = static_cast<size_t>(kb) * 1024;
            } else if (arg == "--jobs") {
                unsigned long jobs = 0;
                if (!takeValue(args, i, value) || !parseUnsigned(arg, value, jobs)) return false;
                settings.maxConcurrentTransfers = static_cast<unsigned int>(jobs);
            } else if (arg == "--scratch") {
                if (!takeValue(args, i, value)) return false;
                settings.scratchDirectory = value;
            } else if (arg == "--report") {
                if (!takeValue(args, i, value)) return false;
                config.reportPath = value;
            } else if (arg == "--log-file") {
                if (!takeValue(args, i, value)) return false;
                settings.logFile = value;
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else {
                showError("Unknown option: " + arg);
                std::cerr << "Run 'SafeBackup --help' for usage.\n";
                return false;
            }
        }

        if (job.name.empty()) {
            job.name = "backup";
        }
        if (job.sourceRoots.empty() || job.target.location.empty()) {
            showError("At least one --source and a --target (or --config) are required");
            std::cerr << "Run 'SafeBackup --help' for usage.\n";
            return false;
        }
        return true;
    }
};

int main(int argc, char* argv[]) {
    ConsoleLogger logger;

    // 1. First create controller with null interface pointer
    ApplicationController controller(nullptr, logger);

    // 2. Create command line interface and pass controller reference
    CommandLineInterface cli(controller, argc, argv);

    // 3. Set interface to controller
    controller.setUserInterface(&cli);

    // 启动应用
    return controller.start();
}
