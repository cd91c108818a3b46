#include <stencil/timestamp.hpp>

#include <cctype>
#include <cstdio>
#include <ctime>

namespace stencil {

std::string format_timestamp(Timestamp t) {
    using namespace std::chrono;
    auto ms_since_epoch = duration_cast<milliseconds>(t.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms_since_epoch / 1000);
    int millis = static_cast<int>(ms_since_epoch % 1000);
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }

    std::tm tm{};
    gmtime_r(&secs, &tm);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return buf;
}

static int digits(const std::string& s, size_t pos, size_t count, bool& ok) {
    int v = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
            ok = false;
            return 0;
        }
        v = v * 10 + (s[i] - '0');
    }
    return v;
}

Result<Timestamp> parse_timestamp(const std::string& s) {
    auto fail = [&s]() {
        return StencilError{StencilError::Parse, "invalid ISO-8601 timestamp: '" + s + "'"};
    };

    if (s.size() < 20 || s[4] != '-' || s[7] != '-' || s[10] != 'T' ||
        s[13] != ':' || s[16] != ':') {
        return fail();
    }

    bool ok = true;
    std::tm tm{};
    tm.tm_year = digits(s, 0, 4, ok) - 1900;
    tm.tm_mon = digits(s, 5, 2, ok) - 1;
    tm.tm_mday = digits(s, 8, 2, ok);
    tm.tm_hour = digits(s, 11, 2, ok);
    tm.tm_min = digits(s, 14, 2, ok);
    tm.tm_sec = digits(s, 17, 2, ok);
    if (!ok || tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
        return fail();
    }

    size_t pos = 19;
    long millis = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        size_t start = pos;
        long scale = 100;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            millis += (s[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
        if (pos == start) return fail();
    }

    long offset_seconds = 0;
    if (pos < s.size() && (s[pos] == 'Z' || s[pos] == 'z')) {
        ++pos;
    } else if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
        int sign = s[pos] == '+' ? 1 : -1;
        if (pos + 6 > s.size() || s[pos + 3] != ':') return fail();
        int oh = digits(s, pos + 1, 2, ok);
        int om = digits(s, pos + 4, 2, ok);
        if (!ok) return fail();
        offset_seconds = sign * (oh * 3600L + om * 60L);
        pos += 6;
    } else {
        return fail();
    }
    if (pos != s.size()) return fail();

    std::time_t secs = timegm(&tm);
    if (secs == static_cast<std::time_t>(-1)) return fail();

    Timestamp t = std::chrono::system_clock::from_time_t(secs - offset_seconds) +
                  std::chrono::milliseconds(millis);
    return Result<Timestamp>::ok(t);
}

} // namespace stencil
