/**
 * Resolve a batch of operations collected from several replicas.
 *
 * Usage: resolve_batch <input.json> [--db <path>] [--verbose]
 *
 * input.json:
 * {
 *   "config": {"batch_size": 50, "detection_mode": "grouped"},
 *   "operations": [ { "id": "op-1", "entity_type": "course", ... }, ... ]
 * }
 *
 * The run is recorded as a sync transaction, in the SQLite database given by
 * --db or in memory otherwise. Surviving operations are printed as JSON in
 * causal order.
 */

#include "synccore/sync/conflict.hpp"
#include "synccore/sync/json.hpp"
#include "synccore/transaction/handler.hpp"
#include "synccore/transaction/sqlite_store.hpp"
#include "synccore/transaction/store.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

using json = nlohmann::json;
using synccore::sync::ConflictResolver;
using synccore::sync::ResolverConfig;
using synccore::transaction::SyncEvent;
using synccore::transaction::SyncTransactionHandler;
using synccore::transaction::TransactionStore;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <input.json> [--db <path>] [--verbose]\n";
}

// Finalise a started transaction as failed; the caller exits non-zero either way.
int abandon(SyncTransactionHandler& transaction, const synccore::Error& error) {
    spdlog::error("{}", error.to_string());
    auto failed = transaction.fail(error.message);
    if (failed.is_error()) {
        spdlog::error("Cannot record failure: {}", failed.error().to_string());
    }
    return 1;
}

int run(const std::string& input_path, TransactionStore& store) {
    std::ifstream input(input_path);
    if (!input) {
        spdlog::error("Cannot open {}", input_path);
        return 1;
    }
    auto document = json::parse(input, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        spdlog::error("{} is not a JSON object", input_path);
        return 1;
    }

    ResolverConfig config;
    if (document.contains("config")) {
        auto parsed = ResolverConfig::from_json(document["config"]);
        if (parsed.is_error()) {
            spdlog::error("Invalid config: {}", parsed.error().to_string());
            return 1;
        }
        config = parsed.value();
    }

    SyncEvent event;
    event.entity_type = "batch";
    event.entity_id = input_path;
    event.operation = "resolve";
    event.source_system = "replicas";
    event.target_system = "storage";
    event.timestamp = std::chrono::system_clock::now();

    SyncTransactionHandler transaction(event, store);
    auto begun = transaction.begin();
    if (begun.is_error()) {
        spdlog::error("Cannot start transaction: {}", begun.error().to_string());
        return 1;
    }

    auto operations = synccore::sync::operations_from_json(document.value("operations", json::array()));
    if (operations.is_error()) {
        return abandon(transaction, operations.error());
    }

    auto loaded = transaction.record_step("Loaded operations", json{{"count", operations.value().size()}});
    if (loaded.is_error()) {
        return abandon(transaction, loaded.error());
    }

    ConflictResolver resolver(config);
    auto resolved = synccore::sync::causal_sort(resolver.resolve_conflicts_batch(operations.value()));

    auto step = transaction.record_step("Resolved conflicts", json{
        {"input", operations.value().size()},
        {"output", resolved.size()},
    });
    if (step.is_error()) {
        return abandon(transaction, step.error());
    }

    json output = json::array();
    for (const auto& operation : resolved) {
        output.push_back(synccore::sync::operation_to_json(operation));
    }

    auto committed = transaction.commit();
    if (committed.is_error()) {
        return abandon(transaction, committed.error());
    }
    std::cout << output.dump(2) << std::endl;
    spdlog::info("Transaction {} completed in {} ms", transaction.transaction_id(),
                 transaction.transaction().duration_ms.value_or(0));
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string input_path = argv[1];
    std::string db_path;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--db" && i + 1 < argc) {
            db_path = argv[++i];
        } else if (arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (db_path.empty()) {
        synccore::transaction::InMemoryTransactionStore store;
        return run(input_path, store);
    }

    auto store = synccore::transaction::SqliteTransactionStore::open(db_path);
    if (store.is_error()) {
        spdlog::error("{}", store.error().to_string());
        return 1;
    }
    return run(input_path, *store.value());
}
