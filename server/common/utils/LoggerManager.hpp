#pragma once

#include "Constants.hpp"

/**
 * @brief 日志输出：trantor::AsyncFileLogger 按自然日（UTC）分文件，可选同时写控制台
 *
 * 文件: <logDir>/circulation-server_YYYY-MM-DD.log
 * 可调项只有三个：目录、级别（custom_config.log_level）、控制台（custom_config.console_log）。
 */
class LoggerManager {
public:
    using LogLevel = trantor::Logger::LogLevel;

    static void initialize(const std::string& logDir) {
        std::filesystem::create_directories(logDir);
        auto& sink = Sink::get();
        {
            std::unique_lock lock(sink.mutex);
            sink.dir = logDir;
            sink.open(today());
        }
        trantor::Logger::setOutputFunction(write, flush);
        trantor::Logger::setLogLevel(trantor::Logger::kInfo);
    }

    /**
     * @brief 级别名（不区分大小写）转 trantor 级别，未知名称返回空
     */
    static std::optional<LogLevel> parseLevel(const std::string& name) {
        static const std::array<std::pair<std::string_view, LogLevel>, 6> levels{{
            {"TRACE", trantor::Logger::kTrace},
            {"DEBUG", trantor::Logger::kDebug},
            {"INFO", trantor::Logger::kInfo},
            {"WARN", trantor::Logger::kWarn},
            {"ERROR", trantor::Logger::kError},
            {"FATAL", trantor::Logger::kFatal},
        }};

        std::string upper(name);
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        for (const auto& [key, level] : levels) {
            if (upper == key) return level;
        }
        return std::nullopt;
    }

    static void setLogLevel(const std::string& name) {
        if (auto level = parseLevel(name)) {
            trantor::Logger::setLogLevel(*level);
        } else {
            LOG_WARN << "Unknown log level '" << name << "', keeping INFO";
        }
    }

    static void setConsoleOutput(bool enabled) {
        Sink::get().console.store(enabled, std::memory_order_relaxed);
    }

    static void close() {
        auto& sink = Sink::get();
        std::unique_lock lock(sink.mutex);
        sink.file.reset();
    }

    /** 当日日志文件名（不含目录与扩展名） */
    static std::string fileNameFor(std::chrono::sys_days day) {
        std::chrono::year_month_day ymd{day};
        char buf[11];
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()),
                      static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
        return std::string(Constants::LOG_FILE_PREFIX) + "_" + buf;
    }

private:
    struct Sink {
        std::shared_mutex mutex;
        std::string dir;
        std::chrono::sys_days day{};
        std::unique_ptr<trantor::AsyncFileLogger> file;
        std::atomic<bool> console{false};

        static Sink& get() {
            static Sink sink;
            return sink;
        }

        /** 调用方持有写锁；旧文件随 unique_ptr 析构刷盘 */
        void open(std::chrono::sys_days newDay) {
            auto logger = std::make_unique<trantor::AsyncFileLogger>();
            logger->setFileName(fileNameFor(newDay), ".log", dir + "/");
            logger->startLogging();
            file = std::move(logger);
            day = newDay;
        }
    };

    static std::chrono::sys_days today() {
        return std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
    }

    static void write(const char* msg, const uint64_t len) {
        auto& sink = Sink::get();
        if (sink.console.load(std::memory_order_relaxed)) {
            std::fwrite(msg, 1, len, stdout);
        }

        auto now = today();
        {
            std::shared_lock lock(sink.mutex);
            if (!sink.file) return;
            if (sink.day == now) {
                sink.file->output(msg, len);
                return;
            }
        }

        std::unique_lock lock(sink.mutex);
        if (!sink.file) return;
        if (sink.day != now) sink.open(now);
        sink.file->output(msg, len);
    }

    static void flush() {
        auto& sink = Sink::get();
        std::shared_lock lock(sink.mutex);
        if (sink.file) sink.file->flush();
    }
};
