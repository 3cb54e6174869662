#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <core/error/flat_error.h>
#include <core/error/error_chain.h>
#include <core/error/type_name.h>
#include <format>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../../test_utils.h"

using namespace flat::core::error;
using flat::core::test::HandleError;
using flat::core::test::MyError;
using flat::core::test::WrappedError;
using testing::HasSubstr;
using testing::Not;
using testing::StartsWith;

class FlatErrorTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    // outer -> middle -> inner, linked through ErrorSource
    static WrappedError three_level_chain() {
        return WrappedError("outer", WrappedError("middle", std::runtime_error("inner")));
    }

    // outer -> inner, linked through std::throw_with_nested
    static FlatError flatten_nested_chain() {
        try {
            try {
                throw std::runtime_error("inner");
            } catch (...) {
                std::throw_with_nested(std::logic_error("outer"));
            }
        } catch (const std::exception& e) {
            return FlatError::from_any(e);
        }
        return FlatError::from_exception_ptr(nullptr);
    }
};

// ==============================================================================
// Capture
// ==============================================================================

TEST_F(FlatErrorTest, CapturesMessageOfLeaf) {
    FlatError flat = FlatError::from_any(MyError{});

    EXPECT_EQ(flat.message(), "MyError!");
    EXPECT_STREQ(flat.what(), "MyError!");
    EXPECT_EQ(flat.flat_source(), nullptr);
    EXPECT_EQ(flat.source(), nullptr);
}

TEST_F(FlatErrorTest, CapturesDynamicTypeName) {
    MyError original;
    const std::exception& as_base = original;

    FlatError flat = FlatError::from_any(as_base);

    EXPECT_THAT(std::string(flat.original_type_name()), HasSubstr("MyError"));
    EXPECT_EQ(flat.original_type_name(), type_name<MyError>());
}

TEST_F(FlatErrorTest, CapturesSourceThroughErrorSource) {
    WrappedError original("outer", std::runtime_error("inner"));

    FlatError flat = FlatError::from_any(original);

    EXPECT_EQ(flat.message(), "outer");
    ASSERT_NE(flat.flat_source(), nullptr);
    EXPECT_EQ(flat.flat_source()->message(), "inner");
    EXPECT_EQ(flat.flat_source()->original_type_name(), type_name<std::runtime_error>());
    EXPECT_EQ(flat.flat_source()->flat_source(), nullptr);
    EXPECT_EQ(flat.source(), flat.flat_source());
}

TEST_F(FlatErrorTest, CapturesSourceThroughNestedException) {
    FlatError flat = flatten_nested_chain();

    EXPECT_EQ(flat.message(), "outer");
    EXPECT_THAT(std::string(flat.original_type_name()), HasSubstr("logic_error"));
    ASSERT_NE(flat.flat_source(), nullptr);
    EXPECT_EQ(flat.flat_source()->message(), "inner");
    EXPECT_EQ(flat.flat_source()->original_type_name(), type_name<std::runtime_error>());
}

TEST_F(FlatErrorTest, PreservesChainDepth) {
    WrappedError original = three_level_chain();

    FlatError flat = FlatError::from_any(original);

    EXPECT_EQ(ErrorChain::depth(flat), 3u);
    EXPECT_EQ(ErrorChain::depth(flat), ErrorChain::depth(original));
    EXPECT_EQ(ErrorChain::messages(flat), ErrorChain::messages(original));
}

TEST_F(FlatErrorTest, CapturesNonCopyableFailure) {
    FlatError flat = FlatError::from_any(HandleError(7));

    EXPECT_EQ(flat.message(), "handle closed");
    EXPECT_THAT(std::string(flat.original_type_name()), HasSubstr("HandleError"));
}

TEST_F(FlatErrorTest, CapturesEmptyMessage) {
    FlatError flat = FlatError::from_any(std::runtime_error(""));

    EXPECT_EQ(flat.message(), "");
    EXPECT_EQ(std::format("{}", flat), "");
}

TEST_F(FlatErrorTest, FlatteningFlatErrorCopiesIt) {
    FlatError flat = FlatError::from_any(three_level_chain());

    FlatError again = FlatError::from_any(flat);

    EXPECT_EQ(again, flat);
    EXPECT_EQ(again.original_type_name(), flat.original_type_name());
    EXPECT_EQ(ErrorChain::depth(again), 3u);
}

TEST_F(FlatErrorTest, FlatErrorThrownWithNestedKeepsCause) {
    const FlatError outer = FlatError::from_any(std::logic_error("outer"));
    FlatError flat = FlatError::from_exception_ptr(nullptr);
    try {
        try {
            throw std::runtime_error("inner");
        } catch (...) {
            std::throw_with_nested(outer);
        }
    } catch (const std::exception& e) {
        flat = FlatError::from_any(e);
    }

    EXPECT_EQ(flat.message(), "outer");
    EXPECT_EQ(flat.original_type_name(), outer.original_type_name());
    EXPECT_EQ(ErrorChain::depth(flat), 2u);
    ASSERT_NE(flat.flat_source(), nullptr);
    EXPECT_EQ(flat.flat_source()->message(), "inner");
    EXPECT_EQ(flat.flat_source()->original_type_name(), type_name<std::runtime_error>());
}

TEST_F(FlatErrorTest, CauselessErrorSourceThrownWithNestedKeepsCause) {
    FlatError flat = FlatError::from_exception_ptr(nullptr);
    try {
        try {
            throw std::runtime_error("inner");
        } catch (...) {
            std::throw_with_nested(WrappedError("outer"));
        }
    } catch (const std::exception& e) {
        flat = FlatError::from_any(e);
        EXPECT_EQ(ErrorChain::depth(flat), ErrorChain::depth(e));
    }

    EXPECT_EQ(flat.message(), "outer");
    ASSERT_NE(flat.flat_source(), nullptr);
    EXPECT_EQ(flat.flat_source()->message(), "inner");
}

// ==============================================================================
// Foreign payloads
// ==============================================================================

TEST_F(FlatErrorTest, ForeignNestedPayloadBecomesUnknownLeaf) {
    FlatError flat = FlatError::from_exception_ptr(nullptr);
    try {
        try {
            throw 42;
        } catch (...) {
            std::throw_with_nested(std::runtime_error("wrapper"));
        }
    } catch (const std::exception& e) {
        flat = FlatError::from_any(e);
    }

    EXPECT_EQ(flat.message(), "wrapper");
    ASSERT_NE(flat.flat_source(), nullptr);
    EXPECT_EQ(flat.flat_source()->message(), "Unknown nested exception");
    EXPECT_EQ(flat.flat_source()->original_type_name(), "unknown");
    EXPECT_EQ(flat.flat_source()->flat_source(), nullptr);
}

TEST_F(FlatErrorTest, ForeignExceptionPtrBecomesUnknownLeaf) {
    FlatError flat = FlatError::from_exception_ptr(std::make_exception_ptr(42));

    EXPECT_EQ(flat.message(), "Unknown exception");
    EXPECT_EQ(flat.original_type_name(), "unknown");
    EXPECT_EQ(flat.flat_source(), nullptr);
}

TEST_F(FlatErrorTest, NullExceptionPtrBecomesUnknownLeaf) {
    FlatError flat = FlatError::from_exception_ptr(nullptr);

    EXPECT_EQ(flat.message(), "Unknown exception");
    EXPECT_EQ(flat.original_type_name(), "unknown");
}

TEST_F(FlatErrorTest, FlattensExceptionPtrOfStdException) {
    auto eptr = std::make_exception_ptr(std::out_of_range("index 9"));

    FlatError flat = FlatError::from_exception_ptr(eptr);

    EXPECT_EQ(flat.message(), "index 9");
    EXPECT_EQ(flat.original_type_name(), type_name<std::out_of_range>());
}

TEST_F(FlatErrorTest, FlattensCurrentException) {
    try {
        throw std::invalid_argument("bad input");
    } catch (...) {
        FlatError flat = FlatError::from_current_exception();
        EXPECT_EQ(flat.message(), "bad input");
        EXPECT_EQ(flat.original_type_name(), type_name<std::invalid_argument>());
    }
}

// ==============================================================================
// Rendering
// ==============================================================================

TEST_F(FlatErrorTest, CompactRenderingIsMessage) {
    FlatError flat = FlatError::from_any(MyError{});

    EXPECT_EQ(std::format("{}", flat), "MyError!");
    EXPECT_EQ(to_string(flat), "MyError!");

    std::ostringstream oss;
    oss << flat;
    EXPECT_EQ(oss.str(), "MyError!");
}

TEST_F(FlatErrorTest, CompactRenderingOmitsSource) {
    FlatError flat = FlatError::from_any(WrappedError("outer", std::runtime_error("inner")));

    EXPECT_EQ(std::format("{}", flat), "outer");
}

TEST_F(FlatErrorTest, VerboseRenderingOfLeaf) {
    FlatError flat = FlatError::from_any(MyError{});

    std::string verbose = std::format("{:#}", flat);

    EXPECT_THAT(verbose, StartsWith("MyError! (original type: `"));
    EXPECT_THAT(verbose, HasSubstr("MyError`)"));
    EXPECT_EQ(verbose, std::format("MyError! (original type: `{}`)", flat.original_type_name()));
}

TEST_F(FlatErrorTest, VerboseRenderingShowsOneSourceLevel) {
    FlatError flat = FlatError::from_any(three_level_chain());

    std::string verbose = std::format("{:#}", flat);

    EXPECT_EQ(verbose, std::format("outer (source: middle, original type: `{}`)",
                                   flat.original_type_name()));
    EXPECT_THAT(verbose, Not(HasSubstr("inner")));
}

TEST_F(FlatErrorTest, RejectsUnknownFormatOption) {
    FlatError flat = FlatError::from_any(MyError{});

    EXPECT_THROW({
        [[maybe_unused]] auto s = std::vformat("{:x}", std::make_format_args(flat));
    }, std::format_error);
}

TEST_F(FlatErrorTest, DescribeLeaf) {
    FlatError flat = FlatError::from_any(std::runtime_error("boom"));

    EXPECT_EQ(flat.describe(),
              std::format("FlatError {{ original_type_name: \"{}\", message: \"boom\", source: None }}",
                          type_name<std::runtime_error>()));
}

TEST_F(FlatErrorTest, DescribeWholeChain) {
    FlatError flat = FlatError::from_any(three_level_chain());

    std::string described = flat.describe();

    EXPECT_THAT(described, StartsWith("FlatError { original_type_name: \""));
    EXPECT_THAT(described, HasSubstr("message: \"outer\", source: Some(FlatError {"));
    EXPECT_THAT(described, HasSubstr("message: \"middle\", source: Some(FlatError {"));
    EXPECT_THAT(described, HasSubstr("message: \"inner\", source: None }"));
}

// ==============================================================================
// Equality
// ==============================================================================

TEST_F(FlatErrorTest, EqualWhenFlattenedFromEqualFailures) {
    EXPECT_EQ(FlatError::from_any(MyError{}), FlatError::from_any(MyError{}));
    EXPECT_EQ(FlatError::from_any(three_level_chain()), FlatError::from_any(three_level_chain()));
}

TEST_F(FlatErrorTest, DifferentMessagesAreNotEqual) {
    EXPECT_NE(FlatError::from_any(std::runtime_error("a")),
              FlatError::from_any(std::runtime_error("b")));
}

TEST_F(FlatErrorTest, DifferentTypesAreNotEqual) {
    EXPECT_NE(FlatError::from_any(std::runtime_error("same")),
              FlatError::from_any(std::logic_error("same")));
}

TEST_F(FlatErrorTest, DifferentSourcesAreNotEqual) {
    FlatError with_source = FlatError::from_any(WrappedError("outer", std::runtime_error("inner")));
    FlatError other_source = FlatError::from_any(WrappedError("outer", std::runtime_error("other")));
    FlatError without_source = FlatError::from_any(WrappedError("outer"));

    EXPECT_NE(with_source, other_source);
    EXPECT_NE(with_source, without_source);
    EXPECT_NE(without_source, with_source);
}

TEST_F(FlatErrorTest, EqualityIsReflexiveAndSymmetric) {
    FlatError a = FlatError::from_any(three_level_chain());
    FlatError b = FlatError::from_any(three_level_chain());

    EXPECT_TRUE(a == a);
    EXPECT_TRUE(a == b);
    EXPECT_TRUE(b == a);
}

// ==============================================================================
// Ownership
// ==============================================================================

TEST_F(FlatErrorTest, CopyIsDeep) {
    FlatError original = FlatError::from_any(three_level_chain());

    FlatError copy = original;

    EXPECT_EQ(copy, original);
    ASSERT_NE(copy.flat_source(), nullptr);
    EXPECT_NE(copy.flat_source(), original.flat_source());
    EXPECT_NE(copy.flat_source()->flat_source(), original.flat_source()->flat_source());
}

TEST_F(FlatErrorTest, CopyOutlivesOriginal) {
    auto original = std::make_unique<FlatError>(FlatError::from_any(three_level_chain()));
    FlatError copy = *original;

    original.reset();

    EXPECT_EQ(ErrorChain::messages(copy),
              (std::vector<std::string>{"outer", "middle", "inner"}));
}

TEST_F(FlatErrorTest, CopyAssignmentReplacesChain) {
    FlatError target = FlatError::from_any(MyError{});
    FlatError source = FlatError::from_any(three_level_chain());

    target = source;

    EXPECT_EQ(target, source);
    EXPECT_EQ(ErrorChain::depth(target), 3u);
}

TEST_F(FlatErrorTest, IndependentOfOriginalAfterCapture) {
    WrappedError original("before", std::runtime_error("inner"));

    FlatError flat = FlatError::from_any(original);
    original.set_message("after");

    EXPECT_EQ(flat.message(), "before");
}

TEST_F(FlatErrorTest, MoveKeepsChain) {
    FlatError original = FlatError::from_any(three_level_chain());
    FlatError expected = original;

    FlatError moved = std::move(original);

    EXPECT_EQ(moved, expected);
}

TEST_F(FlatErrorTest, CanBeThrownAndCaught) {
    FlatError flat = FlatError::from_any(WrappedError("outer", std::runtime_error("inner")));

    try {
        throw flat;
    } catch (const std::exception& e) {
        EXPECT_STREQ(e.what(), "outer");
        EXPECT_EQ(ErrorChain::depth(e), 2u);
    }
}

// ==============================================================================
// Concepts and helpers
// ==============================================================================

TEST_F(FlatErrorTest, SatisfiesExtendedError) {
    static_assert(ExtendedError<FlatError>);
    static_assert(std::is_nothrow_move_constructible_v<FlatError>);
    SUCCEED();
}

TEST_F(FlatErrorTest, FlattenIfNeededKeepsExtendedErrors) {
    auto kept = flatten_if_needed(MyError{});
    auto flat = flatten_if_needed(WrappedError("outer"));

    static_assert(std::is_same_v<decltype(kept), MyError>);
    static_assert(std::is_same_v<decltype(flat), FlatError>);
    EXPECT_EQ(flat.message(), "outer");
}

// ==============================================================================
// Thread Safety
// ==============================================================================

TEST_F(FlatErrorTest, ConcurrentFlatteningAndCopying) {
    const FlatError shared = FlatError::from_any(three_level_chain());
    constexpr int num_threads = 8;
    std::vector<std::thread> threads;
    std::vector<int> matches(num_threads, 0);

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&shared, &matches, t]() {
            for (int i = 0; i < 100; ++i) {
                FlatError local = FlatError::from_any(three_level_chain());
                FlatError copy = shared;
                if (local == copy) {
                    ++matches[t];
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    for (int count : matches) {
        EXPECT_EQ(count, 100);
    }
}
