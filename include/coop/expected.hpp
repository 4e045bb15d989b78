#pragma once

#include <version>

#if defined(__cpp_lib_expected)
    #include <expected>
namespace coop
{
template<typename T, typename E>
using expected = std::expected<T, E>;

template<typename E>
using unexpected = std::unexpected<E>;
} // namespace coop
#else
    #include <tl/expected.hpp>
namespace coop
{
template<typename T, typename E>
using expected = tl::expected<T, E>;

template<typename E>
using unexpected = tl::unexpected<E>;
} // namespace coop
#endif
