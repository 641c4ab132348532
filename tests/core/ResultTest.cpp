//
// Unit tests for Result
//

#include "../harness/TestHarness.h"

#include <core/ds/Result.h>

using namespace HeronOSTest;

namespace {
    enum class ParseError {
        EMPTY,
        NOT_A_NUMBER
    };

    enum class WireError {
        MALFORMED
    };

    Result<int, ParseError> parseDigit(const char* text) {
        if (text == nullptr || text[0] == 0) {
            return ParseError::EMPTY;
        }
        if (text[0] < '0' || text[0] > '9') {
            return ParseError::NOT_A_NUMBER;
        }
        return text[0] - '0';
    }

    Result<void, ParseError> requireDigit(const char* text) {
        auto digit = parseDigit(text);
        if (!digit) {
            return digit.error();
        }
        return {};
    }

    struct Counted {
        static int alive;
        int value;
        explicit Counted(int v) : value(v) { ++alive; }
        Counted(const Counted& other) : value(other.value) { ++alive; }
        Counted(Counted&& other) noexcept : value(other.value) { ++alive; }
        ~Counted() { --alive; }
    };

    int Counted::alive = 0;
}

TEST(Result_SuccessHoldsValue) {
    auto res = parseDigit("7");
    ASSERT_TRUE(res.ok());
    ASSERT_TRUE(static_cast<bool>(res));
    ASSERT_EQ(7, *res);
    ASSERT_EQ(7, res.value());
    ASSERT_EQ(7, res.value_or(-1));
}

TEST(Result_FailureHoldsError) {
    auto empty = parseDigit("");
    ASSERT_FALSE(empty.ok());
    ASSERT_TRUE(empty.error() == ParseError::EMPTY);
    ASSERT_EQ(-1, empty.value_or(-1));

    auto letter = parseDigit("x");
    ASSERT_TRUE(letter.error() == ParseError::NOT_A_NUMBER);
}

TEST(Result_VoidSpecialization) {
    ASSERT_TRUE(requireDigit("3").ok());
    auto failed = requireDigit(nullptr);
    ASSERT_FALSE(failed.ok());
    ASSERT_TRUE(failed.error() == ParseError::EMPTY);
}

TEST(Result_TransformErrorLeavesSuccessAlone) {
    auto toWire = [](ParseError) { return WireError::MALFORMED; };

    auto good = parseDigit("4").transform_error(toWire);
    ASSERT_TRUE(good.ok());
    ASSERT_EQ(4, *good);

    auto bad = parseDigit("q").transform_error(toWire);
    ASSERT_FALSE(bad.ok());
    ASSERT_TRUE(bad.error() == WireError::MALFORMED);

    auto voidBad = requireDigit("").transform_error(toWire);
    ASSERT_TRUE(voidBad.error() == WireError::MALFORMED);
}

TEST(Result_DestroysHeldValue) {
    Counted::alive = 0;
    {
        Result<Counted, ParseError> res(Counted(1));
        Result<Counted, ParseError> copy(res);
        ASSERT_EQ(2, Counted::alive);
        copy = Result<Counted, ParseError>(ParseError::EMPTY);
        ASSERT_EQ(1, Counted::alive);
        copy = res;
        ASSERT_EQ(2, Counted::alive);
        ASSERT_EQ(1, copy->value);
    }
    ASSERT_EQ(0, Counted::alive);
}
