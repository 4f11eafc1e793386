/*
 * agentmem C++ - Embedding helpers and SQL vector functions
 *
 * vec_distance_l2 is a brute-force scalar function: every similarity
 * query scans the candidate rows and computes the distance per row.
 */
#include <agentmem/memory/embedding.hpp>
#include <agentmem/core/config.hpp>
#include <agentmem/core/errors.hpp>
#include <agentmem/core/logger.hpp>
#include <agentmem/core/utils.hpp>

#include <sqlite3.h>
#include <cmath>
#include <cstring>
#include <algorithm>

namespace agentmem {

// ============================================================================
// Configuration
// ============================================================================

EmbeddingConfig resolve_embedding_config(const Config& cfg) {
    EmbeddingConfig ec;
    std::string provider = to_lower(cfg.get_string("embedding.provider", "bge"));

    if (provider == "openai") {
        ec.dimensions = 1536;
        ec.model = "text-embedding-3-small";
        ec.provider = "OpenAI";
    } else if (provider == "ollama") {
        ec.dimensions = 1024;
        ec.model = "mxbai-embed-large";
        ec.provider = "Ollama";
    } else if (provider == "gaianet") {
        ec.dimensions = 768;
        ec.model = "nomic-embed";
        ec.provider = "GaiaNet";
    } else if (provider == "heurist") {
        ec.dimensions = 1024;
        ec.model = "BAAI/bge-large-en-v1.5";
        ec.provider = "Heurist";
    } else if (provider != "bge") {
        LOG_WARN("[Embedding] Unknown provider '%s', using BGE", provider.c_str());
    }

    int64_t override_dims = cfg.get_int("embedding.dimensions", 0);
    if (override_dims > 0) {
        ec.dimensions = static_cast<int>(override_dims);
    }
    return ec;
}

Embedding zero_vector(int dimensions) {
    return Embedding(static_cast<size_t>(std::max(dimensions, 0)), 0.0f);
}

Embedding zero_vector(const EmbeddingConfig& config) {
    return zero_vector(config.dimensions);
}

// ============================================================================
// Vector math
// ============================================================================

static double l2_raw(const float* a, const float* b, size_t n) {
    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double d = static_cast<double>(a[i]) - static_cast<double>(b[i]);
        sum += d * d;
    }
    return std::sqrt(sum);
}

double l2_distance(const Embedding& a, const Embedding& b) {
    if (a.size() != b.size()) {
        throw ValidationError("embedding length mismatch: " + std::to_string(a.size()) +
                              " vs " + std::to_string(b.size()));
    }
    return l2_raw(a.data(), b.data(), a.size());
}

double distance_to_score(double distance) {
    return 1.0 / (1.0 + distance);
}

// ============================================================================
// Blob codec
// ============================================================================

std::string encode_embedding(const Embedding& v) {
    std::string blob(v.size() * sizeof(float), '\0');
    if (!v.empty()) {
        std::memcpy(&blob[0], v.data(), blob.size());
    }
    return blob;
}

Embedding decode_embedding(const void* data, int bytes) {
    if (!data || bytes <= 0) return Embedding();
    Embedding v(static_cast<size_t>(bytes) / sizeof(float));
    std::memcpy(v.data(), data, v.size() * sizeof(float));
    return v;
}

size_t levenshtein(const std::string& a, const std::string& b) {
    std::vector<size_t> prev(b.size() + 1);
    std::vector<size_t> cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;

    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            cur[j] = std::min(std::min(prev[j] + 1, cur[j - 1] + 1), prev[j - 1] + cost);
        }
        prev.swap(cur);
    }
    return prev[b.size()];
}

// ============================================================================
// SQL functions
// ============================================================================

static void sql_vec_distance_l2(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
    if (argc != 2 ||
        sqlite3_value_type(argv[0]) == SQLITE_NULL ||
        sqlite3_value_type(argv[1]) == SQLITE_NULL) {
        sqlite3_result_null(ctx);
        return;
    }

    const void* a = sqlite3_value_blob(argv[0]);
    int a_bytes = sqlite3_value_bytes(argv[0]);
    const void* b = sqlite3_value_blob(argv[1]);
    int b_bytes = sqlite3_value_bytes(argv[1]);

    if (a_bytes != b_bytes || a_bytes % static_cast<int>(sizeof(float)) != 0) {
        sqlite3_result_error(ctx, "vec_distance_l2: vectors have different dimensions", -1);
        return;
    }

    // Blob pointers are not guaranteed to be float-aligned
    Embedding va = decode_embedding(a, a_bytes);
    Embedding vb = decode_embedding(b, b_bytes);
    sqlite3_result_double(ctx, l2_raw(va.data(), vb.data(), va.size()));
}

static void sql_levenshtein(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
    if (argc != 2 ||
        sqlite3_value_type(argv[0]) == SQLITE_NULL ||
        sqlite3_value_type(argv[1]) == SQLITE_NULL) {
        sqlite3_result_null(ctx);
        return;
    }
    const char* a = reinterpret_cast<const char*>(sqlite3_value_text(argv[0]));
    const char* b = reinterpret_cast<const char*>(sqlite3_value_text(argv[1]));
    sqlite3_result_int64(ctx, static_cast<sqlite3_int64>(
        levenshtein(a ? a : "", b ? b : "")));
}

bool register_vector_functions(sqlite3* db) {
    if (!db) return false;

    int rc = sqlite3_create_function(db, "vec_distance_l2", 2,
                                     SQLITE_UTF8 | SQLITE_DETERMINISTIC,
                                     nullptr, sql_vec_distance_l2, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[Embedding] Failed to register vec_distance_l2: %s", sqlite3_errmsg(db));
        return false;
    }

    rc = sqlite3_create_function(db, "levenshtein", 2,
                                 SQLITE_UTF8 | SQLITE_DETERMINISTIC,
                                 nullptr, sql_levenshtein, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("[Embedding] Failed to register levenshtein: %s", sqlite3_errmsg(db));
        return false;
    }
    return true;
}

} // namespace agentmem
