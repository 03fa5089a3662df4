#pragma once

#include "common/database/DatabaseService.hpp"
#include "common/utils/LoggerManager.hpp"
#include "common/utils/RetryPolicy.hpp"
#include "modules/loan/domain/CirculationPolicy.hpp"

namespace fs = std::filesystem;

/**
 * @brief 配置管理器 - 负责加载、验证和管理应用配置
 *
 * 启动时检查配置文件的完整性和正确性：
 * - JSON 语法检查
 * - 必填字段检查（listeners、db_clients）
 * - 端口范围、类型合法性校验
 * - 占位符值警告（YOUR_*、CHANGE_ME 等）
 * - 借阅规则（custom_config.circulation）与重试参数（custom_config.retry）校验
 */
class ConfigManager {
public:
    /**
     * @brief 加载并验证配置文件
     * @return 是否成功加载，失败时已输出详细错误信息到 stderr 和日志
     */
    static bool load() {
        // 每次加载前重置为默认值，避免读取失败时沿用旧值
        AppDbConfig::useFast() = false;
        numberOfThreads_ = 0;

        // 1. 查找配置文件
        auto configPath = findConfigFile();
        if (!configPath) {
            return false;
        }

        // 2. 解析 JSON
        Json::Value root;
        if (!parseConfigFile(*configPath, root)) {
            return false;
        }

        // 3. 验证配置
        if (!validateConfig(root, *configPath)) {
            return false;
        }

        // 4. 提取自定义配置（is_fast、线程数、借阅规则等）
        applyConfig(root);

        // 5. 加载到 Drogon 框架
        try {
            drogon::app().loadConfigFile(*configPath);
        } catch (const std::exception& e) {
            printErrors("Drogon 加载配置失败", {e.what()});
            return false;
        }

        LOG_INFO << "Config loaded from: " << *configPath;
        return true;
    }

    /**
     * @brief 获取日志级别配置
     */
    static std::string getLogLevel() {
        auto& config = drogon::app().getCustomConfig();
        return config.get("log_level", "INFO").asString();
    }

    /**
     * @brief 获取是否启用控制台日志
     */
    static bool isConsoleLogEnabled() {
        auto& config = drogon::app().getCustomConfig();
        return config.get("console_log", false).asBool();
    }

    /**
     * @brief 借阅规则（custom_config.circulation，已在加载时校验）
     */
    static const CirculationPolicy& getCirculationPolicy() {
        return circulationPolicy_;
    }

    static const RetryPolicy& getRetryPolicy() {
        return retryPolicy_;
    }

    /**
     * @brief 存储引擎："postgres"（默认）或 "memory"
     */
    static const std::string& getStorage() {
        return storage_;
    }

    /**
     * @brief 逾期对账间隔（秒），0 表示不启用定时对账
     */
    static int getOverdueSweepIntervalSec() {
        return overdueSweepIntervalSec_;
    }

    /**
     * @brief 校验配置根节点（不加载），错误阻断启动，警告仅提示
     */
    static void validate(const Json::Value& root,
                         std::vector<std::string>& errors,
                         std::vector<std::string>& warnings) {
        validateListeners(root, errors);
        validateCustomConfig(root, errors);

        // 内存存储不需要数据库连接
        const auto& custom = root.get("custom_config", Json::Value::null);
        bool memoryStorage = custom.isObject() && custom.get("storage", "").asString() == Constants::STORAGE_MEMORY;
        if (!memoryStorage || root.isMember("db_clients")) {
            validateDbClients(root, errors, warnings);
        }
    }

    /**
     * @brief 获取线程数配置
     * @return 线程数，0 表示自动（使用 CPU 核心数）
     */
    static size_t getNumberOfThreads() {
        return numberOfThreads_;
    }

private:
    inline static size_t numberOfThreads_ = 0;
    inline static CirculationPolicy circulationPolicy_;
    inline static RetryPolicy retryPolicy_;
    inline static std::string storage_ = Constants::STORAGE_POSTGRES;
    inline static int overdueSweepIntervalSec_ = 0;

    // ─── 配置文件查找 ───────────────────────────────────────────

    static std::optional<std::string> findConfigFile() {
        static const std::vector<std::string> paths = {
            "./config/config.local.json",
            "../../config/config.local.json",
            "../config/config.local.json",
            "./config/config.json",
            "../../config/config.json",
            "../config/config.json",
            "config.json"
        };

        for (const auto& path : paths) {
            if (fs::exists(path)) {
                return path;
            }
        }

        std::vector<std::string> hints = {"请在以下位置之一创建配置文件:"};
        for (const auto& p : paths) {
            hints.push_back("  - " + p);
        }
        hints.emplace_back("可参考 config/config.example.json");
        printErrors("未找到配置文件", hints);
        return std::nullopt;
    }

    // ─── JSON 解析 ──────────────────────────────────────────────

    static bool parseConfigFile(const std::string& path, Json::Value& root) {
        std::ifstream ifs(path);
        if (!ifs) {
            printErrors("无法打开配置文件: " + path, {"请检查文件是否存在及读取权限"});
            return false;
        }

        Json::CharReaderBuilder builder;
        std::string errs;
        if (!Json::parseFromStream(builder, ifs, &root, &errs)) {
            printErrors("JSON 解析失败: " + path, {
                errs,
                "请检查 JSON 语法（缺少逗号、引号不匹配、尾部逗号等）"
            });
            return false;
        }

        if (!root.isObject()) {
            printErrors("JSON 格式错误: " + path, {"配置文件根节点必须是 JSON 对象"});
            return false;
        }

        return true;
    }

    // ─── 配置验证 ──────────────────────────────────────────────

    static bool validateConfig(const Json::Value& root, const std::string& path) {
        std::vector<std::string> errors;
        std::vector<std::string> warnings;

        validate(root, errors, warnings);

        // 先输出警告（不阻断启动）
        if (!warnings.empty()) {
            printWarnings("配置警告 (" + path + ")", warnings);
        }

        // 有错误则中断启动
        if (!errors.empty()) {
            printErrors("配置验证失败: " + path, errors);
            return false;
        }

        return true;
    }

    static void validateListeners(const Json::Value& root, std::vector<std::string>& errors) {
        if (!root.isMember("listeners") || !root["listeners"].isArray() || root["listeners"].empty()) {
            errors.emplace_back("[listeners] 缺少监听配置，需要至少一个监听地址");
            return;
        }

        for (Json::ArrayIndex i = 0; i < root["listeners"].size(); ++i) {
            const auto& item = root["listeners"][i];
            auto prefix = "[listeners[" + std::to_string(i) + "]] ";

            if (!item.isMember("address") || !item["address"].isString() ||
                item["address"].asString().empty()) {
                errors.push_back(prefix + "缺少 address 字段");
            }

            validatePort(item, prefix, errors);
        }
    }

    static void validateDbClients(const Json::Value& root,
                                  std::vector<std::string>& errors,
                                  std::vector<std::string>& warnings) {
        if (!root.isMember("db_clients") || !root["db_clients"].isArray() ||
            root["db_clients"].empty()) {
            errors.emplace_back("[db_clients] 缺少数据库配置，需要至少一个 PostgreSQL 连接");
            return;
        }

        for (Json::ArrayIndex i = 0; i < root["db_clients"].size(); ++i) {
            const auto& db = root["db_clients"][i];
            auto prefix = "[db_clients[" + std::to_string(i) + "]] ";

            // 必填字符串字段
            for (const char* field : {"name", "rdbms", "host", "user", "dbname"}) {
                if (!db.isMember(field) || !db[field].isString() ||
                    db[field].asString().empty()) {
                    errors.push_back(prefix + "缺少必填字段: " + field);
                }
            }

            validatePort(db, prefix, errors);

            // 密码字段：必须存在，检测占位符
            if (!db.isMember("passwd") || !db["passwd"].isString()) {
                errors.push_back(prefix + "缺少 passwd 字段");
            } else if (isPlaceholder(db["passwd"].asString())) {
                warnings.push_back(prefix + "passwd 看起来是占位符，请填入实际密码");
            }
        }
    }

    static void validateCustomConfig(const Json::Value& root, std::vector<std::string>& errors) {
        if (!root.isMember("custom_config")) return;
        const auto& custom = root["custom_config"];
        if (!custom.isObject()) {
            errors.emplace_back("[custom_config] 必须是 JSON 对象");
            return;
        }

        try {
            CirculationPolicy::fromJson(custom.get("circulation", Json::Value::null));
        } catch (const ValidationException& e) {
            errors.push_back(e.getMessage());
        }

        try {
            RetryPolicy::fromJson(custom.get("retry", Json::Value::null));
        } catch (const ValidationException& e) {
            errors.push_back(e.getMessage());
        }

        if (custom.isMember("storage")) {
            const auto& storage = custom["storage"];
            if (!storage.isString() ||
                (storage.asString() != Constants::STORAGE_POSTGRES &&
                 storage.asString() != Constants::STORAGE_MEMORY)) {
                errors.push_back(std::string("[custom_config.storage] 必须是 \"")
                    + Constants::STORAGE_POSTGRES + "\" 或 \"" + Constants::STORAGE_MEMORY + "\"");
            }
        }

        if (custom.isMember("overdue_sweep_interval_sec") &&
            (!custom["overdue_sweep_interval_sec"].isInt() || custom["overdue_sweep_interval_sec"].asInt() < 0)) {
            errors.emplace_back("[custom_config.overdue_sweep_interval_sec] 必须是非负整数");
        }

        if (custom.isMember("log_level") &&
            (!custom["log_level"].isString() || !LoggerManager::parseLevel(custom["log_level"].asString()))) {
            errors.emplace_back("[custom_config.log_level] 必须是 TRACE/DEBUG/INFO/WARN/ERROR/FATAL 之一");
        }
    }

    // ─── 配置应用 ──────────────────────────────────────────────

    static void applyConfig(const Json::Value& root) {
        if (root.isMember("db_clients") && root["db_clients"].isArray() &&
            !root["db_clients"].empty()) {
            AppDbConfig::useFast() = root["db_clients"][0].get("is_fast", false).asBool();
        }
        if (root.isMember("app") && root["app"].isMember("number_of_threads")) {
            numberOfThreads_ = static_cast<size_t>(root["app"]["number_of_threads"].asUInt());
        }

        const auto& custom = root.get("custom_config", Json::Value::null);
        circulationPolicy_ = CirculationPolicy::fromJson(custom.get("circulation", Json::Value::null));
        retryPolicy_ = RetryPolicy::fromJson(custom.get("retry", Json::Value::null));
        storage_ = custom.get("storage", Constants::STORAGE_POSTGRES).asString();
        overdueSweepIntervalSec_ = custom.get("overdue_sweep_interval_sec", 0).asInt();
    }

    // ─── 工具方法 ──────────────────────────────────────────────

    static void validatePort(const Json::Value& obj, const std::string& prefix,
                             std::vector<std::string>& errors) {
        if (!obj.isMember("port") || !obj["port"].isNumeric()) {
            errors.push_back(prefix + "缺少 port 字段");
        } else {
            int port = obj["port"].asInt();
            if (port < 1 || port > 65535) {
                errors.push_back(prefix + "port 值无效: " +
                    std::to_string(port) + "（有效范围: 1-65535）");
            }
        }
    }

    static bool isPlaceholder(const std::string& value) {
        if (value.empty()) return false;
        if (value.starts_with("YOUR_") || value.starts_with("your_")) return true;
        if (value.find("CHANGE_ME") != std::string::npos) return true;
        if (value.find("TODO") != std::string::npos) return true;
        if (value == "password" || value == "PASSWORD") return true;
        return false;
    }

    static void printErrors(const std::string& title, const std::vector<std::string>& messages) {
        std::string border(60, '=');
        std::cerr << "\n" << border << "\n";
        std::cerr << " [ERROR] " << title << "\n";
        std::cerr << std::string(60, '-') << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_ERROR << "[Config] " << msg;
        }
        std::cerr << border << "\n" << std::endl;
    }

    static void printWarnings(const std::string& title, const std::vector<std::string>& messages) {
        std::cerr << "\n" << std::string(60, '-') << "\n";
        std::cerr << " [WARN] " << title << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_WARN << "[Config] " << msg;
        }
        std::cerr << std::string(60, '-') << "\n" << std::endl;
    }
};
