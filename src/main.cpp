#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "utils/config_manager.hpp"
#include "utils/logger.hpp"
#include "core/audit_log.hpp"
#include "core/batch_processor.hpp"
#include "core/exceptions.hpp"
#include "core/notification_router.hpp"
#include "core/trigger_detectors.hpp"
#include "core/weekly_digest_processor.hpp"
#include "data/database_manager.hpp"
#include "data/dedup_ledger.hpp"
#include "data/notification_store.hpp"
#include "log_channel.hpp"
#include "sms_channel.hpp"
#include "telegram_channel.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void print_usage() {
    std::cerr <<
        "Usage: attn_router [--config PATH] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  intake <priority> <event_kind> <message> [--source ID] [--meta K=V]...\n"
        "  run-batch\n"
        "  run-weekly\n"
        "  pending [priority]\n"
        "  history [limit]\n"
        "  wip-check <current> <limit>\n";
}

std::shared_ptr<attn::notification::ChannelRegistry> build_channels(attn::config::ConfigManager& config) {
    auto registry = std::make_shared<attn::notification::ChannelRegistry>();
    registry->register_adapter(std::make_shared<attn::notification::LogChannel>());

    if (config.get_telegram_config().enabled) {
        registry->register_adapter(
            std::make_shared<attn::notification::TelegramChannel>(config.get_telegram_config()));
    } else {
        ATTN_LOG_WARN("Telegram disabled; primary chat deliveries will fail");
    }

    if (config.get_sms_config().enabled) {
        registry->register_adapter(std::make_shared<attn::notification::SmsChannel>(config.get_sms_config()));
    } else {
        ATTN_LOG_INFO("SMS disabled");
    }
    return registry;
}

void print_notification(const attn::Notification& n) {
    std::cout << n.id << "  " << attn::priority_to_string(n.priority)
              << "  " << n.context.event_kind
              << "  created=" << attn::format_iso8601(n.created_at);
    if (n.scheduled_for) {
        std::cout << "  scheduled=" << attn::format_iso8601(*n.scheduled_for);
    }
    if (n.sent_at) {
        std::cout << "  sent=" << attn::format_iso8601(*n.sent_at);
    }
    std::cout << "\n    " << n.message << "\n";
}

void print_intake(const attn::IntakeResult& result) {
    std::cout << attn::outcome_to_string(result.outcome);
    if (result.notification) {
        std::cout << " " << result.notification->id;
        if (result.notification->scheduled_for) {
            std::cout << " scheduled_for=" << attn::format_iso8601(*result.notification->scheduled_for);
        }
    }
    std::cout << "\n";
}

int run_intake(attn::NotificationRouter& router, const std::vector<std::string>& args) {
    if (args.size() < 3) {
        print_usage();
        return kExitUsage;
    }

    auto priority = attn::parse_priority(args[0]);
    if (priority.is_error()) {
        std::cerr << priority.error() << "\n";
        return kExitUsage;
    }

    std::optional<std::string> source;
    attn::Metadata metadata;
    for (size_t i = 3; i < args.size(); ++i) {
        if (args[i] == "--source" && i + 1 < args.size()) {
            source = args[++i];
        } else if (args[i] == "--meta" && i + 1 < args.size()) {
            const std::string& pair = args[++i];
            auto eq = pair.find('=');
            if (eq == std::string::npos) {
                std::cerr << "--meta expects K=V, got '" << pair << "'\n";
                return kExitUsage;
            }
            metadata[pair.substr(0, eq)] = pair.substr(eq + 1);
        } else {
            std::cerr << "Unknown intake option '" << args[i] << "'\n";
            return kExitUsage;
        }
    }

    print_intake(router.intake(priority.value(), args[2], args[1], source, metadata));
    return kExitOk;
}

int run_pending(attn::NotificationStore& store, const std::vector<std::string>& args) {
    std::vector<attn::Priority> tiers{attn::Priority::IMMEDIATE, attn::Priority::BATCHED, attn::Priority::WEEKLY};
    if (!args.empty()) {
        auto priority = attn::parse_priority(args[0]);
        if (priority.is_error()) {
            std::cerr << priority.error() << "\n";
            return kExitUsage;
        }
        tiers = {priority.value()};
    }

    for (auto tier : tiers) {
        if (tier == attn::Priority::SILENT) {
            continue;
        }
        for (const auto& n : store.pending(tier)) {
            print_notification(n);
        }
    }
    return kExitOk;
}

int run_history(attn::NotificationStore& store, const std::vector<std::string>& args) {
    int limit = 20;
    if (!args.empty()) {
        try {
            limit = std::stoi(args[0]);
        } catch (const std::exception&) {
            std::cerr << "history expects a numeric limit\n";
            return kExitUsage;
        }
    }
    for (const auto& n : store.recent(limit)) {
        print_notification(n);
    }
    return kExitOk;
}

int run_wip_check(attn::NotificationRouter& router, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        print_usage();
        return kExitUsage;
    }

    int current = 0;
    int limit = 0;
    try {
        current = std::stoi(args[0]);
        limit = std::stoi(args[1]);
    } catch (const std::exception&) {
        std::cerr << "wip-check expects two integers\n";
        return kExitUsage;
    }

    auto result = attn::triggers::notify_wip_warning(router, current, limit);
    if (!result) {
        std::cout << "below warning threshold\n";
        return kExitOk;
    }
    print_intake(*result);
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/settings.json";
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return kExitOk;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        print_usage();
        return kExitUsage;
    }
    std::string command = args.front();
    args.erase(args.begin());

    // Load configuration
    attn::config::ConfigManager config_manager;
    if (!config_manager.load(config_path)) {
        std::cerr << "Could not load " << config_path << "; using defaults\n";
    }
    config_manager.apply_env_overrides();

    // Initialize logger
    const auto& logging = config_manager.get_logging_config();
    attn::utils::Logger::initialize(logging.file_path,
                                    attn::utils::Logger::parse_level(config_manager.get_app_config().log_level),
                                    static_cast<size_t>(logging.max_file_size_mb) * 1024 * 1024,
                                    static_cast<size_t>(logging.max_backup_files),
                                    logging.console_output,
                                    logging.file_output);

    if (!config_manager.validate_config()) {
        for (const auto& error : config_manager.get_validation_errors()) {
            ATTN_LOG_WARN("Configuration problem: {}", error);
        }
    }

    int exit_code = kExitOk;
    try {
        attn::DatabaseManager db(config_manager.get_database_config().path);
        if (!db.open()) {
            ATTN_LOG_CRITICAL("Failed to open database {}. Exiting.", db.path());
            attn::utils::Logger::shutdown();
            return kExitFailure;
        }

        const auto& router_config = config_manager.get_router_config();
        const auto& audit_config = config_manager.get_audit_config();

        attn::NotificationStore store(&db);
        attn::DedupLedger ledger(&db, router_config.cooldowns);
        auto audit = std::make_shared<attn::AuditLog>(audit_config.file_path, audit_config.message_max_length);
        auto channels = build_channels(config_manager);

        attn::NotificationRouter router(&db, &store, &ledger, channels, audit, router_config);
        attn::BatchProcessor batch_processor(&store, channels, audit, router_config);
        attn::WeeklyDigestProcessor weekly_processor(&store, channels, audit, router_config);

        auto now = std::chrono::system_clock::now();

        if (command == "intake") {
            exit_code = run_intake(router, args);
        } else if (command == "run-batch") {
            size_t sent = batch_processor.run_batch(now);
            std::cout << "sent " << sent << "\n";
            if (sent == 0 && !store.pending(attn::Priority::BATCHED, now).empty()) {
                exit_code = kExitFailure;
            }
        } else if (command == "run-weekly") {
            bool sent = weekly_processor.run_weekly(now);
            std::cout << (sent ? "sent" : "nothing sent") << "\n";
            if (!sent && !store.pending(attn::Priority::WEEKLY, now).empty()) {
                exit_code = kExitFailure;
            }
        } else if (command == "pending") {
            exit_code = run_pending(store, args);
        } else if (command == "history") {
            exit_code = run_history(store, args);
        } else if (command == "wip-check") {
            exit_code = run_wip_check(router, args);
        } else {
            std::cerr << "Unknown command '" << command << "'\n";
            print_usage();
            exit_code = kExitUsage;
        }
    } catch (const attn::ValidationError& e) {
        std::cerr << e.what() << "\n";
        exit_code = kExitUsage;
    } catch (const attn::AttnException& e) {
        ATTN_LOG_ERROR("{} failed: {}", command, e.what());
        std::cerr << e.what() << "\n";
        exit_code = kExitFailure;
    }

    attn::utils::Logger::shutdown();
    return exit_code;
}
