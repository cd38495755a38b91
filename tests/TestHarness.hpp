//===----------------------------------------------------------------------===//
//
// Part of the Quill project, under the GNU GPL v3.
// SPDX-License-Identifier: GPL-3.0-only
//
//===----------------------------------------------------------------------===//
///
/// @file TestHarness.hpp
/// @brief Minimal, dependency-free unit testing framework for Quill.
///
/// @details Tests register themselves at static initialization with `TEST()`
/// and run from `quill_test::run_all_tests()`:
///
/// ```cpp
/// TEST(Buffer, SplitsOnNewline) {
///     ASSERT_EQ(buffer.lineCount(), 2u);
///     EXPECT_EQ(buffer.line(1).content(), "tail");
/// }
///
/// int main(int argc, char **argv) {
///     quill_test::init(&argc, &argv);
///     return quill_test::run_all_tests();
/// }
/// ```
///
/// | Macro family | On failure                                   |
/// |--------------|----------------------------------------------|
/// | `EXPECT_*`   | Records the failure, the test keeps running  |
/// | `ASSERT_*`   | Records the failure and leaves the test      |
///
/// `EXPECT_EQ`/`ASSERT_EQ` print both operands when they are streamable.
/// `QUILL_TEST_SKIP(reason)` marks the running test as skipped.
/// `--filter=<text>` runs only tests whose "Suite.Name" contains the text.
///
//===----------------------------------------------------------------------===//

#pragma once

#include <exception>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace quill_test
{

/// @brief Thrown by ASSERT_* to leave the current test.
struct TestAbort final : public std::exception
{
    const char *what() const noexcept override
    {
        return "fatal test failure";
    }
};

/// @brief Thrown by QUILL_TEST_SKIP.
struct TestSkip final : public std::exception
{
    explicit TestSkip(std::string reason) : reason(std::move(reason)) {}

    std::string reason;

    const char *what() const noexcept override
    {
        return reason.c_str();
    }
};

struct TestCase
{
    std::string suite;
    std::string name;
    std::function<void()> fn;
};

inline std::vector<TestCase> &registry()
{
    static std::vector<TestCase> tests;
    return tests;
}

/// @brief Number of failed checks in the test currently running.
inline int &currentFailures()
{
    static int failures = 0;
    return failures;
}

inline std::string &filter()
{
    static std::string text;
    return text;
}

struct TestRegistrar
{
    TestRegistrar(std::string suiteName, std::string testName, std::function<void()> fn)
    {
        registry().push_back({std::move(suiteName), std::move(testName), std::move(fn)});
    }
};

/// @brief Consume harness options from the command line.
inline void init(int *argc, char ***argv)
{
    constexpr std::string_view kFilter = "--filter=";
    int out = 1;
    for (int i = 1; i < *argc; ++i)
    {
        const std::string_view arg = (*argv)[i];
        if (arg.substr(0, kFilter.size()) == kFilter)
            filter() = std::string(arg.substr(kFilter.size()));
        else
            (*argv)[out++] = (*argv)[i];
    }
    *argc = out;
}

template <class T, class = void> struct IsStreamable : std::false_type
{
};

template <class T>
struct IsStreamable<T, std::void_t<decltype(std::declval<std::ostream &>() << std::declval<const T &>())>>
    : std::true_type
{
};

template <class T> std::string describe(const T &value)
{
    if constexpr (IsStreamable<T>::value)
    {
        std::ostringstream os;
        os << value;
        return os.str();
    }
    else
    {
        return "<unprintable>";
    }
}

/// @brief Record a failed check; throws TestAbort when @p fatal.
inline void report_failure(std::string_view expr, const char *file, int line, bool fatal)
{
    std::cerr << file << ":" << line << ": failure\n";
    std::cerr << "  expected: " << expr << "\n";
    ++currentFailures();
    if (fatal)
        throw TestAbort();
}

template <class A, class B>
void check_eq(const A &a,
              const B &b,
              std::string_view expr,
              const char *file,
              int line,
              bool fatal)
{
    if (a == b)
        return;
    std::cerr << file << ":" << line << ": failure\n";
    std::cerr << "  expected: " << expr << "\n";
    std::cerr << "  actual:   " << describe(a) << " vs " << describe(b) << "\n";
    ++currentFailures();
    if (fatal)
        throw TestAbort();
}

[[noreturn]] inline void skip(std::string reason)
{
    throw TestSkip(std::move(reason));
}

/// @brief Run every registered test matching the filter.
/// @return Number of failed tests.
inline int run_all_tests()
{
    int failures = 0;
    int skips = 0;
    int ran = 0;
    for (const auto &t : registry())
    {
        const std::string fullName = t.suite + "." + t.name;
        if (!filter().empty() && fullName.find(filter()) == std::string::npos)
            continue;
        ++ran;
        currentFailures() = 0;
        try
        {
            t.fn();
        }
        catch (const TestSkip &s)
        {
            ++skips;
            std::cout << "[ SKIPPED  ] " << fullName << ": " << s.what() << "\n";
            continue;
        }
        catch (const TestAbort &)
        {
        }
        catch (const std::exception &e)
        {
            ++currentFailures();
            std::cerr << "  unhandled exception: " << e.what() << "\n";
        }

        if (currentFailures() == 0)
        {
            std::cout << "[  PASSED  ] " << fullName << "\n";
        }
        else
        {
            ++failures;
            std::cerr << "[  FAILED  ] " << fullName << " (" << currentFailures()
                      << " check(s))\n";
        }
    }
    if (failures != 0)
        std::cerr << failures << " of " << ran << " test(s) failed.\n";
    if (skips != 0)
        std::cout << skips << " test(s) skipped.\n";
    return failures;
}

} // namespace quill_test

#define QUILL_TEST_DETAIL_CAT_INNER(a, b) a##b
#define QUILL_TEST_DETAIL_CAT(a, b) QUILL_TEST_DETAIL_CAT_INNER(a, b)

#define TEST(SuiteName, TestName)                                                                  \
    static void QUILL_TEST_DETAIL_CAT(SuiteName, TestName)();                                      \
    static const ::quill_test::TestRegistrar QUILL_TEST_DETAIL_CAT(SuiteName,                      \
                                                                   TestName##Registrar)(           \
        #SuiteName, #TestName, QUILL_TEST_DETAIL_CAT(SuiteName, TestName));                        \
    static void QUILL_TEST_DETAIL_CAT(SuiteName, TestName)()

#define EXPECT_TRUE(expr)                                                                          \
    do                                                                                             \
    {                                                                                              \
        if (!(expr))                                                                               \
            ::quill_test::report_failure(#expr, __FILE__, __LINE__, false);                        \
    } while (false)

#define EXPECT_FALSE(expr) EXPECT_TRUE(!(expr))

#define EXPECT_EQ(val1, val2)                                                                      \
    ::quill_test::check_eq((val1), (val2), #val1 " == " #val2, __FILE__, __LINE__, false)

#define EXPECT_NE(val1, val2)                                                                      \
    do                                                                                             \
    {                                                                                              \
        if (!((val1) != (val2)))                                                                   \
            ::quill_test::report_failure(#val1 " != " #val2, __FILE__, __LINE__, false);           \
    } while (false)

#define ASSERT_TRUE(expr)                                                                          \
    do                                                                                             \
    {                                                                                              \
        if (!(expr))                                                                               \
            ::quill_test::report_failure(#expr, __FILE__, __LINE__, true);                         \
    } while (false)

#define ASSERT_FALSE(expr) ASSERT_TRUE(!(expr))

#define ASSERT_EQ(val1, val2)                                                                      \
    ::quill_test::check_eq((val1), (val2), #val1 " == " #val2, __FILE__, __LINE__, true)

#define ASSERT_NE(val1, val2)                                                                      \
    do                                                                                             \
    {                                                                                              \
        if (!((val1) != (val2)))                                                                   \
            ::quill_test::report_failure(#val1 " != " #val2, __FILE__, __LINE__, true);            \
    } while (false)

#define QUILL_TEST_SKIP(reason)                                                                    \
    do                                                                                             \
    {                                                                                              \
        ::quill_test::skip(reason);                                                                \
    } while (false)
