#include "earthzones/text_input.hpp"
#include "earthzones/longitude.hpp"
#include "earthzones/types.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <regex>

namespace earthzones {

namespace {

// "<lon>" or "<lon>[, ]<lat>", signed decimals only
const std::regex& longitude_pattern()
{
    static const std::regex pattern(
        R"(^\s*([-+]?\d+(?:\.\d+)?)\s*(?:[,\s]\s*([-+]?\d+(?:\.\d+)?))?\s*$)");
    return pattern;
}

std::optional<double> to_double(const std::string& token)
{
    std::string_view digits(token);
    if (!digits.empty() && digits.front() == '+')
        digits.remove_prefix(1);

    double value = 0.0;
    auto res = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (res.ec != std::errc{} || res.ptr != digits.data() + digits.size())
        return std::nullopt;
    if (!std::isfinite(value))
        return std::nullopt;
    return value;
}

} // namespace

std::string trim(std::string_view text)
{
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    auto begin = std::find_if(text.begin(), text.end(), not_space);
    auto end = std::find_if(text.rbegin(), text.rend(), not_space).base();
    if (begin >= end)
        return {};
    return std::string(begin, end);
}

std::optional<double> parse_longitude_text(std::string_view text)
{
    const std::string input = trim(text);
    std::smatch m;
    if (!std::regex_match(input, m, longitude_pattern()))
        return std::nullopt;

    auto lon = to_double(m[1].str());
    if (!lon)
        return std::nullopt;

    if (*lon < MIN_LONGITUDE || *lon > MAX_LONGITUDE)
        return normalize_point(*lon);
    return lon;
}

bool is_quit_command(std::string_view text)
{
    std::string word = trim(text);
    std::transform(word.begin(), word.end(), word.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return word == "q" || word == "quit" || word == "exit";
}

} // namespace earthzones
