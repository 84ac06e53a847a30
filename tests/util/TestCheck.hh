/* -- C++ -- */
/**
 *  @file  tests/util/TestCheck.hh
 *
 *  @brief Minimal checks for the plain test executables. A failed check
 *         reports its location and makes the test return a non-zero code
 *         derived from the line number.
 */

#ifndef EVE_TESTS_TEST_CHECK_H
#define EVE_TESTS_TEST_CHECK_H

#include <cmath>
#include <iostream>

#define EVE_FAIL_CODE (1 + (__LINE__ % 250))

#define EVE_CHECK(cond)                                                              \
    do                                                                               \
    {                                                                                \
        if (!(cond))                                                                 \
        {                                                                            \
            std::cerr << __FILE__ << ":" << __LINE__ << ": check failed: " #cond "\n"; \
            return EVE_FAIL_CODE;                                                    \
        }                                                                            \
    } while (0)

#define EVE_CHECK_THROWS(expr, type)                                                        \
    do                                                                                      \
    {                                                                                       \
        bool eve_thrown = false;                                                            \
        try                                                                                 \
        {                                                                                   \
            (void)(expr);                                                                   \
        }                                                                                   \
        catch (const type &)                                                                \
        {                                                                                   \
            eve_thrown = true;                                                              \
        }                                                                                   \
        if (!eve_thrown)                                                                    \
        {                                                                                   \
            std::cerr << __FILE__ << ":" << __LINE__ << ": expected " #type " from " #expr "\n"; \
            return EVE_FAIL_CODE;                                                           \
        }                                                                                   \
    } while (0)

#define EVE_CHECK_NEAR(a, b, tol) EVE_CHECK(std::fabs((a) - (b)) <= (tol))

/// Run one test function of a test executable; stops at the first failure.
#define EVE_RUN(fn)                                      \
    do                                                   \
    {                                                    \
        const int eve_rc = fn();                         \
        if (eve_rc != 0)                                 \
        {                                                \
            std::cerr << "FAILED " #fn "\n";             \
            return eve_rc;                               \
        }                                                \
    } while (0)

#endif // EVE_TESTS_TEST_CHECK_H
