// apps/journal_cli.cpp
#include "trade_journal/service/journal_service.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include "trade_journal/config/engine_config.hpp"
#include "trade_journal/core/logger.hpp"
#include "trade_journal/data/in_memory_trade_store.hpp"
#include "trade_journal/data/postgres_trade_store.hpp"

using namespace trade_journal;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " <operation> [--config FILE] [--csv FILE] [--params JSON]\n"
              << "       " << program << " --list\n\n"
              << "--csv imports the file before running the operation; with the\n"
              << "importTradesCsv operation the import itself is the result.\n";
}

bool read_file(const std::string& path, std::string& contents) {
    std::ifstream file(path);
    if (!file) {
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    contents = buffer.str();
    return true;
}

Result<std::shared_ptr<TradeStore>> open_store(const DatabaseConfig& database) {
    if (!database.enabled) {
        INFO("Using in-memory trade store");
        return Result<std::shared_ptr<TradeStore>>(std::make_shared<InMemoryTradeStore>());
    }

    auto store = std::make_shared<PostgresTradeStore>(database.connection_string, database.schema);
    auto connected = store->connect();
    if (connected.is_error()) {
        return forward_error<std::shared_ptr<TradeStore>>(connected);
    }
    auto schema = store->initialize_schema();
    if (schema.is_error()) {
        return forward_error<std::shared_ptr<TradeStore>>(schema);
    }
    INFO("Connected to PostgreSQL trade store, schema " << database.schema);
    return Result<std::shared_ptr<TradeStore>>(std::static_pointer_cast<TradeStore>(store));
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        if (argc < 2) {
            print_usage(argv[0]);
            return 1;
        }

        std::string operation = argv[1];
        if (operation == "--list") {
            for (const auto& name : JournalService::operation_names()) {
                std::cout << name << std::endl;
            }
            return 0;
        }

        std::string config_path;
        std::string csv_path;
        nlohmann::json params = nlohmann::json::object();

        for (int i = 2; i < argc; ++i) {
            const std::string arg = argv[i];
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
            if (arg == "--config") {
                config_path = argv[++i];
            } else if (arg == "--csv") {
                csv_path = argv[++i];
            } else if (arg == "--params") {
                params = nlohmann::json::parse(argv[++i]);
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }

        EngineConfig config;
        if (!config_path.empty()) {
            auto loaded = EngineConfig::load(config_path);
            if (loaded.is_error()) {
                std::cerr << "Failed to load config: " << loaded.error()->to_string() << std::endl;
                return 1;
            }
            config = loaded.value();
        }

        // Initialize logger
        Logger::reset_for_tests();
        auto& logger = Logger::instance();
        auto logger_init = logger.initialize(config.logger);
        if (logger_init.is_error() || !logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("JournalCli");

        auto store = open_store(config.database);
        if (store.is_error()) {
            std::cerr << "Failed to open trade store: " << store.error()->to_string() << std::endl;
            return 1;
        }

        JournalService service(store.value(), config);

        if (!csv_path.empty()) {
            std::string csv_text;
            if (!read_file(csv_path, csv_text)) {
                std::cerr << "Cannot read CSV file: " << csv_path << std::endl;
                return 1;
            }
            if (operation == "importTradesCsv") {
                params["csv"] = csv_text;
            } else {
                auto imported = service.import_trades_csv(csv_text);
                if (imported.is_error()) {
                    std::cerr << "CSV import failed: " << imported.error()->what() << std::endl;
                    return 1;
                }
            }
        }

        auto response = service.execute(operation, params);
        if (response.is_error()) {
            nlohmann::json failure = {{"error", response.error()->what()},
                                      {"code", static_cast<int>(response.error()->code())}};
            std::cout << failure.dump(2) << std::endl;
            return 2;
        }

        std::cout << response.value().dump(2) << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
