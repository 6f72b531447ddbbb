#pragma once

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

static int g_fail_count = 0;
static int g_pass_count = 0;

#define CHECK(cond) \
    do { \
        if (!(cond)) { \
            std::fprintf(stderr, "FAIL: %s:%d: %s\n", __FILE__, __LINE__, #cond); \
            g_fail_count++; \
        } else { \
            g_pass_count++; \
        } \
    } while (0)

#define CHECK_EQ(a, b) \
    do { \
        auto _a = (a); \
        auto _b = (b); \
        if (_a != _b) { \
            std::fprintf(stderr, "FAIL: %s:%d: %s == %s  (got %lld vs %lld)\n", \
                         __FILE__, __LINE__, #a, #b, \
                         (long long)_a, (long long)_b); \
            g_fail_count++; \
        } else { \
            g_pass_count++; \
        } \
    } while (0)

#define CHECK_STR_EQ(a, b) \
    do { \
        std::string _a = (a); \
        std::string _b = (b); \
        if (_a != _b) { \
            std::fprintf(stderr, "FAIL: %s:%d: %s == %s  (got \"%s\" vs \"%s\")\n", \
                         __FILE__, __LINE__, #a, #b, _a.c_str(), _b.c_str()); \
            g_fail_count++; \
        } else { \
            g_pass_count++; \
        } \
    } while (0)

// Passes if expr throws ex_type or a subclass of it.
#define CHECK_THROWS(expr, ex_type) \
    do { \
        bool _thrown = false; \
        try { \
            (void)(expr); \
        } catch (const ex_type&) { \
            _thrown = true; \
        } \
        if (!_thrown) { \
            std::fprintf(stderr, "FAIL: %s:%d: %s did not throw %s\n", \
                         __FILE__, __LINE__, #expr, #ex_type); \
            g_fail_count++; \
        } else { \
            g_pass_count++; \
        } \
    } while (0)

#define TEST_SUMMARY() \
    do { \
        std::fprintf(stderr, "%d passed, %d failed\n", g_pass_count, g_fail_count); \
    } while (0)

// Per-process scratch directory under the system temp dir.
inline std::string make_test_dir(const char* name) {
    auto dir = std::filesystem::temp_directory_path() /
               (std::string("genotrack_") + name + "_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir.string();
}

inline void remove_test_dir(const std::string& dir) {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary);
    f << content;
}
