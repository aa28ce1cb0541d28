#pragma once

#include <cstdio>
#include <cstdlib>
#include <string>

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
            std::fprintf(stderr, "FAIL: %s:%d: %s == %s  (got %llu vs %llu)\n", \
                         __FILE__, __LINE__, #a, #b, \
                         (unsigned long long)_a, (unsigned long long)_b); \
            g_fail_count++; \
        } else { \
            g_pass_count++; \
        } \
    } while (0)

// String comparison that prints both sides on failure
#define CHECK_STR(a, b) \
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

// Expect a fastaseek::Status with the given FastaErrc code
#define CHECK_ERRC(expr, errc) \
    do { \
        auto _st = (expr); \
        if (_st.code != (errc)) { \
            std::fprintf(stderr, "FAIL: %s:%d: %s -> %s, expected %s\n", \
                         __FILE__, __LINE__, #expr, _st.to_string().c_str(), \
                         fastaseek::errc_name(errc)); \
            g_fail_count++; \
        } else { \
            g_pass_count++; \
        } \
    } while (0)

#define CHECK_OK(expr) CHECK_ERRC(expr, fastaseek::FastaErrc::kOk)

#define TEST_SUMMARY() \
    do { \
        std::fprintf(stderr, "%d passed, %d failed\n", g_pass_count, g_fail_count); \
    } while (0)
