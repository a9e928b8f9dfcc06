#pragma once

#include <cstdlib>
#include <iostream>

// -----------------------------------------------------------------------------
// Minimal test assertion helpers
// -----------------------------------------------------------------------------
#define TEST_CHECK(expr)                                                     \
    do {                                                                     \
        if (!(expr)) {                                                       \
            std::cerr << "[TEST FAILED] " << #expr                           \
                      << " at " << __FILE__ << ":" << __LINE__ << std::endl; \
            std::abort();                                                    \
        }                                                                    \
    } while (0)

// Same as TEST_CHECK, printing both sides on mismatch
#define TEST_CHECK_EQ(lhs, rhs)                                              \
    do {                                                                     \
        const auto& lhs_v_ = (lhs);                                          \
        const auto& rhs_v_ = (rhs);                                          \
        if (!(lhs_v_ == rhs_v_)) {                                           \
            std::cerr << "[TEST FAILED] " << #lhs << " == " << #rhs          \
                      << "\n  left : " << lhs_v_                             \
                      << "\n  right: " << rhs_v_                             \
                      << "\n  at " << __FILE__ << ":" << __LINE__ << std::endl; \
            std::abort();                                                    \
        }                                                                    \
    } while (0)
