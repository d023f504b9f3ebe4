#include "transaction/txlog_database.hpp"
#include "index/txlog_index.hpp"
#include "txlog_logger.hpp"
#include <iostream>
#include <string>

namespace txlog {

// 打印帮助信息
void printHelp() {
    std::cout << "txlog - 事务时间轴记录器演示 v0.1\n" << std::endl;
    std::cout << "用法: txlog_demo [选项]\n" << std::endl;
    std::cout << "选项:" << std::endl;
    std::cout << "  -c, --config <file>        使用指定的配置文件" << std::endl;
    std::cout << "  -n, --users <num>          写入的用户数量（默认：8）" << std::endl;
    std::cout << "  -w, --workers <num>        设置工作线程数量（默认：4）" << std::endl;
    std::cout << "  -s, --show-commands        在时间轴中显示命令详情" << std::endl;
    std::cout << "  -l, --log-level <level>    设置日志等级（debug, info, warning, error, critical, 默认：info）" << std::endl;
    std::cout << "  -f, --log-file <file>      设置日志文件路径" << std::endl;
    std::cout << "  -v, --version              显示版本信息" << std::endl;
    std::cout << "  -h, --help                 显示帮助信息" << std::endl;
    std::cout << "\n示例:" << std::endl;
    std::cout << "  txlog_demo                     # 使用默认配置运行" << std::endl;
    std::cout << "  txlog_demo -n 20 -s            # 写入20个用户并显示命令" << std::endl;
    std::cout << "  txlog_demo -l debug -f txlog.log # 启用调试日志并输出到文件" << std::endl;
}

// 打印版本信息
void printVersion() {
    std::cout << "txlog v0.1.0" << std::endl;
    std::cout << "基于C++17的事务执行时间轴记录器" << std::endl;
}

struct DemoConfig {
    std::string config_file;
    bool show_help = false;
    bool show_version = false;
    bool show_commands = false;
    int num_users = 8;
    size_t num_workers = 0;       // 0 表示使用配置文件中的值
    std::string log_level;        // 为空表示使用配置文件中的值
    std::string log_file;
};

// 解析命令行参数，出错时返回false
bool parseArguments(int argc, char* argv[], DemoConfig& config) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto requireValue = [&](const char* what) -> const char* {
            if (i + 1 < argc) {
                return argv[++i];
            }
            std::cerr << "错误: " << arg << " 需要指定" << what << std::endl;
            return nullptr;
        };

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            config.show_version = true;
        } else if (arg == "-s" || arg == "--show-commands") {
            config.show_commands = true;
        } else if (arg == "-c" || arg == "--config") {
            const char* value = requireValue("配置文件");
            if (!value) return false;
            config.config_file = value;
        } else if (arg == "-n" || arg == "--users") {
            const char* value = requireValue("用户数量");
            if (!value || !Utils::isNumeric(value)) return false;
            config.num_users = std::stoi(value);
        } else if (arg == "-w" || arg == "--workers") {
            const char* value = requireValue("工作线程数量");
            if (!value || !Utils::isNumeric(value)) return false;
            config.num_workers = std::stoul(value);
        } else if (arg == "-l" || arg == "--log-level") {
            const char* value = requireValue("日志等级");
            if (!value) return false;
            config.log_level = value;
        } else if (arg == "-f" || arg == "--log-file") {
            const char* value = requireValue("日志文件路径");
            if (!value) return false;
            config.log_file = value;
        } else {
            std::cerr << "未知参数: " << arg << std::endl;
            std::cerr << "使用 -h 或 --help 查看帮助信息" << std::endl;
            return false;
        }
    }
    return true;
}

namespace {

const char* CITIES[] = {"Paris", "Berlin", "Tokyo", "Lima"};

Key userKey(const Subspace& users, int64_t id) {
    return users.pack(id);
}

// 写入用户并维护城市索引
void createUsers(Database& db, const Subspace& users, const Index<int64_t, std::optional<std::string>>& by_city,
                 int count) {
    db.run([&](LoggedTransaction& tr) {
        tr.annotate("创建 " + std::to_string(count) + " 个用户");
        for (int64_t id = 1; id <= count; ++id) {
            std::optional<std::string> city;
            if (id % 5 != 0) {
                city = CITIES[id % 4];
            }
            tr.set(userKey(users, id), "user-" + std::to_string(id) + "|" + city.value_or(""));
            by_city.add(tr, id, city);
        }
        tr.atomicOp(users.pack(std::string("count")), std::string("\x01\x00\x00\x00\x00\x00\x00\x00", 8),
                    MutationType::ADD);
    });
}

// 并发读取若干用户并按城市查询
void readUsers(Database& db, const Subspace& users, const Index<int64_t, std::optional<std::string>>& by_city,
               int count) {
    db.read([&](LoggedTransaction& tr) {
        std::vector<std::future<std::optional<Value>>> pending;
        for (int64_t id = 1; id <= count && id <= 4; ++id) {
            pending.push_back(tr.getAsync(userKey(users, id)));
        }
        for (auto& future : pending) {
            future.get();
        }
        std::vector<int64_t> ids = by_city.lookup(tr, std::optional<std::string>("Paris"));
        tr.annotate("Paris: " + std::to_string(ids.size()) + " 个用户");
    });
}

// 第一次尝试时由另一个事务修改读过的键，迫使提交冲突后重试
void moveUserWithConflict(Database& db, const Subspace& users,
                          const Index<int64_t, std::optional<std::string>>& by_city) {
    const int64_t id = 1;
    bool interfered = false;
    db.run([&](LoggedTransaction& tr) {
        std::optional<Value> record = tr.get(userKey(users, id));
        if (!interfered) {
            interfered = true;
            auto other = db.createTransaction();
            other->set(userKey(users, id), record.value_or("") + "|touched");
            other->commit();
        }
        std::optional<std::string> previous = std::string(CITIES[id % 4]);
        std::optional<std::string> next = std::string("Tokyo");
        by_city.update(tr, id, next, previous);
        tr.set(userKey(users, id), "user-1|Tokyo");
    });
}

} // namespace

} // namespace txlog

int main(int argc, char* argv[]) {
    using namespace txlog;

    // 初始化日志系统
    auto& logger = Logger::getInstance();
    setSignalHandler();

    // 解析命令行参数
    DemoConfig config;
    if (!parseArguments(argc, argv, config)) {
        return 1;
    }

    // 处理帮助和版本信息
    if (config.show_help) {
        printHelp();
        return 0;
    }

    if (config.show_version) {
        printVersion();
        return 0;
    }

    // 加载配置文件（如果指定），命令行参数优先
    DatabaseOptions options;
    if (!config.config_file.empty()) {
        if (!options.loadFromFile(config.config_file)) {
            TXLOG_LOG_ERROR("加载配置文件失败: ", config.config_file);
            return 1;
        }
        TXLOG_LOG_INFO("成功加载配置文件: ", config.config_file);
    }
    if (config.num_workers > 0) {
        options.worker_threads = config.num_workers;
    }
    if (!config.log_level.empty()) {
        options.log_level = config.log_level;
    }
    if (!config.log_file.empty()) {
        options.log_file = config.log_file;
    }

    // 配置日志系统
    LogLevel level = LogLevel::INFO;
    if (Logger::parseLogLevel(options.log_level, level)) {
        logger.setLogLevel(level);
    } else {
        std::cerr << "无效的日志等级: " << options.log_level << ", 使用默认等级 (info)" << std::endl;
    }

    // 设置日志文件
    if (!options.log_file.empty()) {
        if (!logger.setLogFile(options.log_file)) {
            std::cerr << "无法打开日志文件: " << options.log_file << std::endl;
            return 1;
        }
        TXLOG_LOG_INFO("日志文件已设置为: ", options.log_file);
    }

    Database db(options);
    const bool show_commands = config.show_commands || options.trace_show_commands;
    db.setLogHandler([show_commands](const EventLog& log) {
        std::cout << log.getCommandsReport() << "\n" << log.getTimingsReport(show_commands) << std::endl;
    });

    Subspace root(Key("demo"));
    Subspace users = root.sub("users");
    Index<int64_t, std::optional<std::string>> by_city("by_city", root.sub("by_city"));

    try {
        createUsers(db, users, by_city, config.num_users);
        readUsers(db, users, by_city, config.num_users);
        moveUserWithConflict(db, users, by_city);
    } catch (const TransactionError& e) {
        TXLOG_LOG_ERRORF("演示事务失败: [{}] {}", Utils::errorCodeToString(e.code()), e.what());
        return 1;
    }

    StorageStats stats = db.getStorage().getStats();
    TXLOG_LOG_INFOF("完成: 提交事务 {} 个, 冲突 {} 次, 当前版本 {}", stats.committed_transactions, stats.conflicts,
                    stats.version);
    return 0;
}
