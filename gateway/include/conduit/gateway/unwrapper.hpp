#ifndef CONDUIT_GATEWAY_UNWRAPPER_HPP
#define CONDUIT_GATEWAY_UNWRAPPER_HPP

#include <conduit/gateway/method.hpp>

#include <exception>
#include <vector>

namespace conduit::gateway {

  /**
   * Selects the exception presented to the caller of a proxied method.
   *
   * The cause chain is walked from the outermost exception to the innermost one.
   * A MessagingException is a wrapper of the messaging layer: it is returned only
   * when it is declared by the method, or when nothing else qualifies.
   */
  struct ExceptionUnwrapper {

    // First element of the chain matching a declared type; null when none does.
    static std::exception_ptr
    find_declared(const std::exception_ptr& exc, const std::vector<ExceptionDeclaration>& declared);

    // Derived from std::runtime_error or std::logic_error and not a wrapper.
    static bool is_unchecked(const std::exception_ptr& exc);

    // First unchecked cause, or the original exception.
    static std::exception_ptr fallback(const std::exception_ptr& exc);

    static std::exception_ptr
    unwrap(const std::exception_ptr& exc, const std::vector<ExceptionDeclaration>& declared);
  };

} // namespace conduit::gateway

#endif
