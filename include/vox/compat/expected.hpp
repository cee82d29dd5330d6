/**
* @file expected.hpp
 * @brief Compatibility alias for std::expected (C++23) and tl::expected (C++20).
 *
 * Queue, reader and config factories return vox_detail::expected<T, E> so the
 * rest of the codebase never names a specific implementation.
 *
 * - C++23 and later: <expected> from the standard library.
 * - C++20: <tl/expected.hpp> (TartanLlama's header-only backport).
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
  #include <expected>
  namespace vox_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace vox_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
