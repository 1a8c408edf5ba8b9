#include "ds/clock.hpp"

#include <format>

namespace ds {

namespace {

bool two_digits(std::string_view s, std::size_t pos, int &out)
{
    if (pos + 2 > s.size()) return false;
    const char a = s[pos];
    const char b = s[pos + 1];
    if (a < '0' || a > '9' || b < '0' || b > '9') return false;
    out = (a - '0') * 10 + (b - '0');
    return true;
}

} // namespace

std::optional<TimestampMs> parse_clock(std::string_view token)
{
    // HH:MM:SS[.f{1,6}]
    if (token.size() < 8 || token[2] != ':' || token[5] != ':') return std::nullopt;

    int h = 0, m = 0, s = 0;
    if (!two_digits(token, 0, h) || !two_digits(token, 3, m) || !two_digits(token, 6, s))
        return std::nullopt;
    if (m >= 60 || s >= 60) return std::nullopt;

    TimestampMs ms = 0;
    if (token.size() > 8)
    {
        if (token[8] != '.') return std::nullopt;
        std::string_view frac = token.substr(9);
        if (frac.empty() || frac.size() > 6) return std::nullopt;
        int scale = 100;
        for (std::size_t i = 0; i < frac.size(); ++i)
        {
            const char c = frac[i];
            if (c < '0' || c > '9') return std::nullopt;
            if (i < 3)
            {
                ms += (c - '0') * scale;
                scale /= 10;
            }
        }
    }

    return static_cast<TimestampMs>(h) * 3'600'000 +
           static_cast<TimestampMs>(m) * 60'000 +
           static_cast<TimestampMs>(s) * 1'000 + ms;
}

std::optional<TimestampMs> find_bracketed_clock(std::string_view line)
{
    std::size_t pos = 0;
    while ((pos = line.find('[', pos)) != std::string_view::npos)
    {
        const std::size_t close = line.find(']', pos + 1);
        if (close == std::string_view::npos) break;
        if (auto t = parse_clock(line.substr(pos + 1, close - pos - 1))) return t;
        pos += 1;
    }
    return std::nullopt;
}

std::string format_clock(TimestampMs t)
{
    const bool negative = t < 0;
    if (negative) t = -t;
    const TimestampMs h  = t / 3'600'000;
    const TimestampMs m  = (t / 60'000) % 60;
    const TimestampMs s  = (t / 1'000) % 60;
    const TimestampMs ms = t % 1'000;

    std::string out = std::format("{}{:02}:{:02}:{:02}", negative ? "-" : "", h, m, s);
    if (ms != 0) out += std::format(".{:03}", ms);
    return out;
}

} // namespace ds
