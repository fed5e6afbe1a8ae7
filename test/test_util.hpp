#pragma once

#include "kfe_error.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

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

#define CHECK_NEAR(a, b, eps) \
    do { \
        double _a = (a); \
        double _b = (b); \
        if (std::fabs(_a - _b) > (eps)) { \
            std::fprintf(stderr, "FAIL: %s:%d: %s ~= %s  (got %.6f vs %.6f)\n", \
                         __FILE__, __LINE__, #a, #b, _a, _b); \
            g_fail_count++; \
        } else { \
            g_pass_count++; \
        } \
    } while (0)

// Expect `expr` to throw KfeError with the given KfeErrc.
#define CHECK_KFE_ERROR(expr, errc) \
    do { \
        bool _thrown = false; \
        try { \
            expr; \
        } catch (const KfeError& _e) { \
            _thrown = true; \
            if (_e.code() != (errc)) { \
                std::fprintf(stderr, "FAIL: %s:%d: %s threw %s, expected %s\n", \
                             __FILE__, __LINE__, #expr, kfe_errc_name(_e.code()), \
                             kfe_errc_name(errc)); \
                g_fail_count++; \
            } else { \
                g_pass_count++; \
            } \
        } \
        if (!_thrown) { \
            std::fprintf(stderr, "FAIL: %s:%d: %s did not throw %s\n", \
                         __FILE__, __LINE__, #expr, kfe_errc_name(errc)); \
            g_fail_count++; \
        } \
    } while (0)

#define TEST_SUMMARY() \
    do { \
        std::fprintf(stderr, "%d passed, %d failed\n", g_pass_count, g_fail_count); \
    } while (0)
