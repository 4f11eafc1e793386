/*
 * agentmem C++ - Agent Memory Store
 *
 * Opens (or creates) the configured store and reports what it holds.
 *
 * Usage:
 *   ./agentmem [config.json]
 *
 * Without a config file the store runs on an in-memory database.
 */
#include <agentmem/core/config.hpp>
#include <agentmem/core/errors.hpp>
#include <agentmem/core/logger.hpp>
#include <agentmem/core/runtime.hpp>
#include <cstdio>
#include <cstring>

static void print_usage(const char* prog) {
    fprintf(stderr,
        "Usage: %s [config.json]\n"
        "\n"
        "Options:\n"
        "  -h, --help       Show this help\n"
        "  -v, --version    Show version\n",
        prog);
}

int main(int argc, char* argv[]) {
    std::string config_file;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            printf("%s v%s\n", agentmem::AppInfo::NAME, agentmem::AppInfo::VERSION);
            return 0;
        }
        config_file = argv[i];
    }

    agentmem::Config config;
    if (!config_file.empty()) {
        if (!config.load_file(config_file)) {
            LOG_ERROR("Failed to load config from %s, aborting!", config_file.c_str());
            return 1;
        }
        LOG_INFO("Loaded config from %s", config_file.c_str());
    }

    agentmem::AgentRuntime runtime;
    if (!runtime.init(config)) {
        return 1;
    }

    static const char* const tables[] = {
        "accounts", "rooms", "participants", "memories", "knowledge",
        "goals", "relationships", "cache", "logs"
    };

    try {
        auto& db = runtime.sqlite();
        LOG_INFO("Schema version %d", db.schema_version());
        for (const char* table : tables) {
            LOG_INFO("  %-14s %lld rows", table, static_cast<long long>(db.count_rows(table)));
        }
    } catch (const agentmem::Error& e) {
        LOG_ERROR("Failed to inspect store: %s", e.what());
        runtime.shutdown();
        return 1;
    }

    runtime.shutdown();
    return 0;
}
