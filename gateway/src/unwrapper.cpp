#include <conduit/gateway/unwrapper.hpp>

#include <conduit/common/util.hpp>
#include <conduit/messaging/exceptions.hpp>

#include <stdexcept>

namespace conduit::gateway {

  std::exception_ptr ExceptionUnwrapper::find_declared(
      const std::exception_ptr& exc, const std::vector<ExceptionDeclaration>& declared
  )
  {
    if (declared.empty()) {
      return nullptr;
    }

    for (auto& cause : common::util::cause_chain(exc)) {
      for (auto& decl : declared) {
        if (decl.matches(cause)) {
          return cause;
        }
      }
    }
    return nullptr;
  }

  bool ExceptionUnwrapper::is_unchecked(const std::exception_ptr& exc)
  {
    try {
      std::rethrow_exception(exc);
    } catch (const messaging::MessagingException&) {
      return false;
    } catch (const std::runtime_error&) {
      return true;
    } catch (const std::logic_error&) {
      return true;
    } catch (...) {
      return false;
    }
  }

  std::exception_ptr ExceptionUnwrapper::fallback(const std::exception_ptr& exc)
  {
    for (auto& cause : common::util::cause_chain(exc)) {
      if (is_unchecked(cause)) {
        return cause;
      }
    }
    return exc;
  }

  std::exception_ptr ExceptionUnwrapper::unwrap(
      const std::exception_ptr& exc, const std::vector<ExceptionDeclaration>& declared
  )
  {
    auto match = find_declared(exc, declared);
    if (match) {
      return match;
    }
    return fallback(exc);
  }

} // namespace conduit::gateway
