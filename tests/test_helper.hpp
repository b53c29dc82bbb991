#pragma once

#include <cmath>
#include <cstddef>
#include <exception>
#include <iostream>
#include <string>

// Common test framework - no external dependencies
struct TestResult {
    int passed = 0;
    int failed = 0;

    void assert_true(bool condition, const std::string& message) {
        if (condition) {
            passed++;
            std::cout << "[PASS] " << message << "\n";
        } else {
            failed++;
            std::cout << "[FAIL] " << message << "\n";
        }
    }

    void assert_false(bool condition, const std::string& message) {
        assert_true(!condition, message);
    }

    void assert_eq(int expected, int actual, const std::string& message) {
        assert_true(expected == actual, message + " (expected: " + std::to_string(expected) +
                                            ", actual: " + std::to_string(actual) + ")");
    }

    void assert_eq(std::size_t expected, std::size_t actual, const std::string& message) {
        assert_true(expected == actual, message + " (expected: " + std::to_string(expected) +
                                            ", actual: " + std::to_string(actual) + ")");
    }

    void assert_eq(double expected, double actual, const std::string& message,
                   double tolerance = 1e-9) {
        assert_true(std::abs(expected - actual) < tolerance,
                    message + " (expected: " + std::to_string(expected) +
                        ", actual: " + std::to_string(actual) + ")");
    }

    void assert_eq(const std::string& expected, const std::string& actual,
                   const std::string& message) {
        assert_true(expected == actual,
                    message + " (expected: '" + expected + "', actual: '" + actual + "')");
    }

    void assert_ge(std::size_t value, std::size_t min_value, const std::string& message) {
        assert_true(value >= min_value, message + " (" + std::to_string(value) +
                                            " >= " + std::to_string(min_value) + ")");
    }

    void assert_lt(int value, int max_value, const std::string& message) {
        assert_true(value < max_value, message + " (" + std::to_string(value) + " < " +
                                           std::to_string(max_value) + ")");
    }

    /// Passes when `fn` throws an exception of type E
    template <typename E, typename Fn>
    void assert_throws(Fn&& fn, const std::string& message) {
        try {
            fn();
        } catch (const E&) {
            assert_true(true, message);
            return;
        } catch (const std::exception& e) {
            assert_true(false, message + " (unexpected exception: " + e.what() + ")");
            return;
        }
        assert_true(false, message + " (no exception thrown)");
    }

    int summary() {
        std::cout << "\n=== Test Summary ===\n";
        std::cout << "Passed: " << passed << "\n";
        std::cout << "Failed: " << failed << "\n";
        std::cout << "Total:  " << (passed + failed) << "\n";
        return failed == 0 ? 0 : 1;
    }

    bool all_passed() const { return failed == 0; }
};
