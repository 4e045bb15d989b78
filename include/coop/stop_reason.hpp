#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace coop
{
/**
 * Why an operation raced against a deadline did not produce its result.
 */
enum class stop_reason : std::uint8_t
{
    /// The deadline's token was stopped by its source.
    cancelled,
    /// The deadline's instant was reached.
    timed_out
};

auto to_string(stop_reason reason) -> const std::string&;

/**
 * Maps the reason onto the generic category so callers can fold it into std::error_code based
 * error handling, timed_out compares equal to std::errc::timed_out.
 */
auto make_error_code(stop_reason reason) noexcept -> std::error_code;

} // namespace coop
