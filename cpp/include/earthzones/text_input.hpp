#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace earthzones {

/**
 * Parse a longitude typed by a user.
 *
 * Accepts "116.7", "116.7,39.9" and "116.7 39.9"; the second number is a
 * latitude and is discarded. Only signed decimals (no exponent) are
 * accepted. Values outside [-180, 180] are wrapped into point form,
 * so "300" reads as -60.
 *
 * @return Longitude in degrees, or std::nullopt if the text is not a longitude
 */
std::optional<double> parse_longitude_text(std::string_view text);

/**
 * "q", "quit" or "exit", case-insensitive, surrounding blanks ignored
 */
bool is_quit_command(std::string_view text);

std::string trim(std::string_view text);

} // namespace earthzones
