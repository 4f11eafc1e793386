#ifndef agentmem_TESTS_TEST_HELPERS_HPP
#define agentmem_TESTS_TEST_HELPERS_HPP

#include <agentmem/memory/types.hpp>
#include <agentmem/memory/embedding.hpp>
#include <agentmem/core/logger.hpp>

#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <cstdlib>

namespace agentmem {
namespace test {

// scale * e_index in `dims` dimensions
inline Embedding basis(size_t index, float scale = 1.0f, int dims = DEFAULT_EMBEDDING_DIMENSIONS) {
    Embedding v = zero_vector(dims);
    v[index] = scale;
    return v;
}

// Creates a fresh directory under the system temp dir, removed on scope exit
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "agentmem_test_XXXXXX").string();
        char* made = mkdtemp(&tmpl[0]);
        if (!made) {
            ADD_FAILURE() << "mkdtemp failed for " << tmpl;
        }
        path_ = tmpl;
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Keeps expected warnings out of the test output
class QuietLogs {
public:
    QuietLogs() : saved_(Logger::instance().level()) {
        Logger::instance().set_level(LogLevel::ERROR);
    }
    ~QuietLogs() {
        Logger::instance().set_level(saved_);
    }

private:
    LogLevel saved_;
};

} // namespace test
} // namespace agentmem

#endif // agentmem_TESTS_TEST_HELPERS_HPP
