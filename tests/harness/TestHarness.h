//
// HeronOS Unit Test Harness - Assertions and Test Runner
//

#ifndef HERONOS_TESTHARNESS_H
#define HERONOS_TESTHARNESS_H

#include "../assert_support.h"
#include "MemoryTracker.h"

namespace HeronOSTest {

    struct TestInfo;

    // Test result tracking
    struct TestResult {
        const char* testName;
        bool passed;
        std::string errorMessage;

        TestResult(const char* name, bool success, std::string error = "")
            : testName(name), passed(success), errorMessage(error) {}
    };

    // Test runner class
    class TestRunner {
    private:
        static const TestInfo* const* getTests(size_t& testCount);
        static TestResult runSingleTest(const TestInfo* test);

        static void (*beforeEach)();

    public:
        // Runs before every test, after memory tracking has been reset
        static void setBeforeEach(void (*hook)());
        static int runAllTests();
        static int runTest(const char* testName);
    };

    // Assertion macros
    #define ASSERT_TRUE(condition) \
        do { \
            if (!(condition)) { \
                throw HeronOSTest::AssertionFailure("Assertion failed: " #condition); \
            } \
        } while(0)

    #define ASSERT_FALSE(condition) \
        do { \
            if (condition) { \
                throw HeronOSTest::AssertionFailure("Assertion failed: expected false but got true: " #condition); \
            } \
        } while(0)

    #define ASSERT_EQ(expected, actual) \
        do { \
            if (!((expected) == (actual))) { \
                throw HeronOSTest::AssertionFailure("Assertion failed: expected == actual (" #expected " == " #actual ")"); \
            } \
        } while(0)

    #define ASSERT_NE(expected, actual) \
        do { \
            if ((expected) == (actual)) { \
                throw HeronOSTest::AssertionFailure("Assertion failed: expected != actual (" #expected " != " #actual ")"); \
            } \
        } while(0)

    #define ASSERT_LT(a, b) \
        do { \
            if (!((a) < (b))) { \
                throw HeronOSTest::AssertionFailure("Assertion failed: " #a " < " #b); \
            } \
        } while(0)

    #define ASSERT_LE(a, b) \
        do { \
            if (!((a) <= (b))) { \
                throw HeronOSTest::AssertionFailure("Assertion failed: " #a " <= " #b); \
            } \
        } while(0)

    #define ASSERT_GT(a, b) \
        do { \
            if (!((a) > (b))) { \
                throw HeronOSTest::AssertionFailure("Assertion failed: " #a " > " #b); \
            } \
        } while(0)

    #define ASSERT_GE(a, b) \
        do { \
            if (!((a) >= (b))) { \
                throw HeronOSTest::AssertionFailure("Assertion failed: " #a " >= " #b); \
            } \
        } while(0)

    #define ASSERT_NO_ALLOCS() \
        do { \
            if (HeronOSTest::MemoryTracker::getTotalAllocated() != 0) { \
                throw HeronOSTest::AssertionFailure("Assertion failed: test should not have allocated any memory"); \
            } \
        } while(0)

    // Test information structure stored in custom section
    struct TestInfo {
        const char* name;
        void (*testFunc)();
        const char* fileName;
        int lineNumber;
    };

    // The linker provides __start_/__stop_ symbols for sections whose names are C identifiers
    #define HERONOS_TEST_SECTION __attribute__((used, section("heronos_unit_tests")))

    // Test registration macro using custom section
    #define TEST(testName) \
    void testName(); \
    namespace { \
    const HeronOSTest::TestInfo testName##_info { \
    #testName, \
    testName, \
    __FILE__, \
    __LINE__ \
    }; \
    HERONOS_TEST_SECTION \
    const HeronOSTest::TestInfo* testName##_registration = &testName##_info; \
    } \
    void testName()
}

#endif //HERONOS_TESTHARNESS_H
