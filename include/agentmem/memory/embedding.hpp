/*
 * agentmem C++ - Embeddings
 *
 * Embedding configuration (dimensionality per provider), the provider
 * seam the runtime owns, and the vector math/blob codec the store uses.
 * Vectors are stored as little-endian float32 blobs.
 */
#ifndef agentmem_MEMORY_EMBEDDING_HPP
#define agentmem_MEMORY_EMBEDDING_HPP

#include "types.hpp"
#include <string>

struct sqlite3;

namespace agentmem {

class Config;

const int DEFAULT_EMBEDDING_DIMENSIONS = 384;

struct EmbeddingConfig {
    int dimensions;
    std::string model;
    std::string provider;

    EmbeddingConfig()
        : dimensions(DEFAULT_EMBEDDING_DIMENSIONS), model("BGE-small-en-v1.5"), provider("BGE") {}
};

// Reads embedding.provider (bge|openai|ollama|gaianet|heurist) and the
// embedding.dimensions override.
EmbeddingConfig resolve_embedding_config(const Config& cfg);

Embedding zero_vector(int dimensions);
Embedding zero_vector(const EmbeddingConfig& config);

// Produces embeddings for text. Owned by whoever needs one and passed by
// reference; there is no process-wide instance.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() {}
    virtual Embedding embed(const std::string& text) = 0;
    virtual int dimensions() const = 0;
};

// ============================================================================
// Vector math
// ============================================================================

// Euclidean distance. Throws ValidationError on mismatched lengths.
double l2_distance(const Embedding& a, const Embedding& b);

// 1 / (1 + distance): 1 for identical vectors, towards 0 as they diverge
double distance_to_score(double distance);

// ============================================================================
// Blob codec
// ============================================================================

std::string encode_embedding(const Embedding& v);
Embedding decode_embedding(const void* data, int bytes);

// Case-sensitive edit distance (insert/delete/substitute all cost 1)
size_t levenshtein(const std::string& a, const std::string& b);

// Registers vec_distance_l2(blob, blob) and levenshtein(text, text) on the
// connection. Returns false if SQLite rejects the registration.
bool register_vector_functions(sqlite3* db);

} // namespace agentmem

#endif // agentmem_MEMORY_EMBEDDING_HPP
