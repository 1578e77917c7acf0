#include "stats/timestamp.hpp"
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace cred {

namespace {

bool read_digits(const std::string& s, size_t pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        value = value * 10 + (s[i] - '0');
    }
    out = value;
    return true;
}

} // anonymous namespace

TimePoint from_epoch_millis(int64_t millis) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis)));
}

int64_t max_epoch_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::duration::max()).count();
}

std::optional<TimePoint> checked_from_epoch_millis(double millis) {
    // Strictly inside the limit: the limit itself may round up as a double
    if (!(std::fabs(millis) < static_cast<double>(max_epoch_millis()))) {
        return std::nullopt;
    }
    return from_epoch_millis(static_cast<int64_t>(millis));
}

int64_t to_epoch_millis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::optional<TimePoint> parse_iso8601(const std::string& text) {
    std::tm tm{};
    int year = 0, month = 0, day = 0;
    if (!read_digits(text, 0, 4, year) || text.size() < 10 ||
        text[4] != '-' || !read_digits(text, 5, 2, month) ||
        text[7] != '-' || !read_digits(text, 8, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }

    int hour = 0, minute = 0, second = 0;
    int64_t millis = 0;
    int64_t offset_minutes = 0;
    size_t pos = 10;

    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        if (!read_digits(text, pos + 1, 2, hour) || text.size() < pos + 6 ||
            text[pos + 3] != ':' || !read_digits(text, pos + 4, 2, minute)) {
            return std::nullopt;
        }
        pos += 6;

        if (pos < text.size() && text[pos] == ':') {
            if (!read_digits(text, pos + 1, 2, second)) return std::nullopt;
            pos += 3;

            if (pos < text.size() && text[pos] == '.') {
                ++pos;
                int64_t scale = 100;
                while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                    millis += (text[pos] - '0') * scale;
                    scale /= 10;
                    ++pos;
                }
            }
        }

        if (pos < text.size()) {
            char c = text[pos];
            if (c == 'Z' || c == 'z') {
                ++pos;
            } else if (c == '+' || c == '-') {
                int oh = 0, om = 0;
                if (!read_digits(text, pos + 1, 2, oh)) return std::nullopt;
                size_t mpos = pos + 3;
                if (mpos < text.size() && text[mpos] == ':') ++mpos;
                if (!read_digits(text, mpos, 2, om)) return std::nullopt;
                offset_minutes = (c == '+' ? 1 : -1) * (oh * 60 + om);
                pos = mpos + 2;
            }
        }
    }

    if (pos != text.size()) {
        return std::nullopt;
    }
    if (hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    std::time_t seconds = timegm(&tm);
    int64_t epoch_ms = static_cast<int64_t>(seconds) * 1000 + millis - offset_minutes * 60 * 1000;
    return checked_from_epoch_millis(static_cast<double>(epoch_ms));
}

std::string format_iso8601(TimePoint tp) {
    int64_t ms = to_epoch_millis(tp);
    int64_t secs = ms / 1000;
    int64_t rem = ms % 1000;
    if (rem < 0) {
        rem += 1000;
        secs -= 1;
    }

    std::time_t time = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&time, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << rem << 'Z';
    return ss.str();
}

double days_between(TimePoint from, TimePoint to) {
    return static_cast<double>(to_epoch_millis(to) - to_epoch_millis(from)) / kMillisPerDay;
}

} // namespace cred
