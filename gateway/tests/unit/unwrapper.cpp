#include <conduit/gateway/unwrapper.hpp>
#include <conduit/messaging/exceptions.hpp>

#include "../mocks.hpp"

#include <gtest/gtest.h>

TEST(ExceptionUnwrapper, DeclaredType)
{
  auto exc = nested_chain();

  auto result = ExceptionUnwrapper::unwrap(exc, throws<DeclaredError>());
  EXPECT_THROW(std::rethrow_exception(result), DeclaredError);

  result = ExceptionUnwrapper::unwrap(exc, throws<std::logic_error, RuntimeCause>());
  EXPECT_THROW(std::rethrow_exception(result), RuntimeCause);

  // Declared base types match derived exceptions, the wrapper included.
  result = ExceptionUnwrapper::unwrap(exc, throws<std::runtime_error>());
  EXPECT_EQ(result, exc);

  // The wrapper is returned only when declared.
  result = ExceptionUnwrapper::unwrap(exc, throws<messaging::MessagingException>());
  EXPECT_EQ(result, exc);
}

TEST(ExceptionUnwrapper, FirstUncheckedCause)
{
  auto exc = nested_chain();

  auto result = ExceptionUnwrapper::unwrap(exc, {});
  EXPECT_THROW(std::rethrow_exception(result), RuntimeCause);

  EXPECT_EQ(ExceptionUnwrapper::find_declared(exc, {}), nullptr);
  EXPECT_EQ(ExceptionUnwrapper::find_declared(exc, throws<std::logic_error>()), nullptr);
}

TEST(ExceptionUnwrapper, NoUncheckedCause)
{
  std::exception_ptr exc;
  try {
    try {
      throw DeclaredError{};
    } catch (...) {
      std::throw_with_nested(messaging::MessageHandlingException{"wrapper"});
    }
  } catch (...) {
    exc = std::current_exception();
  }

  EXPECT_EQ(ExceptionUnwrapper::unwrap(exc, {}), exc);

  auto plain = std::make_exception_ptr(messaging::MessageDeliveryException{"rejected"});
  EXPECT_EQ(ExceptionUnwrapper::unwrap(plain, {}), plain);
}

TEST(ExceptionUnwrapper, Classification)
{
  EXPECT_TRUE(ExceptionUnwrapper::is_unchecked(std::make_exception_ptr(std::logic_error{"l"})));
  EXPECT_TRUE(ExceptionUnwrapper::is_unchecked(std::make_exception_ptr(RuntimeCause{})));
  EXPECT_FALSE(ExceptionUnwrapper::is_unchecked(std::make_exception_ptr(DeclaredError{})));
  EXPECT_FALSE(
      ExceptionUnwrapper::is_unchecked(std::make_exception_ptr(messaging::MessagingException{"w"}))
  );
}
