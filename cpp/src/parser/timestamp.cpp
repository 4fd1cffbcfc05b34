#include "anamnesis/parser/timestamp.hpp"

#include <cstdio>

namespace anamnesis::parser {
    namespace {
        // Days since 1970-01-01 for a proleptic Gregorian date.
        core::i64 days_from_civil(core::i64 y, unsigned m, unsigned d) noexcept {
            y -= m <= 2 ? 1 : 0;
            const core::i64 era = (y >= 0 ? y : y - 399) / 400;
            const unsigned yoe = static_cast<unsigned>(y - era * 400);
            const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
            const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + static_cast<core::i64>(doe) - 719468;
        }

        void civil_from_days(core::i64 z, core::i64* y, unsigned* m, unsigned* d) noexcept {
            z += 719468;
            const core::i64 era = (z >= 0 ? z : z - 146096) / 146097;
            const unsigned doe = static_cast<unsigned>(z - era * 146097);
            const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const unsigned mp = (5 * doy + 2) / 153;
            *d = doy - (153 * mp + 2) / 5 + 1;
            *m = mp < 10 ? mp + 3 : mp - 9;
            *y = static_cast<core::i64>(yoe) + era * 400 + (*m <= 2 ? 1 : 0);
        }

        bool digits(std::string_view s, size_t pos, size_t n, unsigned* out) noexcept {
            if (pos + n > s.size()) return false;
            unsigned v = 0;
            for (size_t i = pos; i < pos + n; ++i) {
                if (s[i] < '0' || s[i] > '9') return false;
                v = v * 10 + static_cast<unsigned>(s[i] - '0');
            }
            *out = v;
            return true;
        }

        bool leap(core::i64 y) noexcept {
            return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
        }
    } // namespace

    bool parse_rfc3339(std::string_view s, core::Timestamp* out) noexcept {
        if (out == nullptr) return false;

        unsigned year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        if (!digits(s, 0, 4, &year) || s.size() < 19) return false;
        if (s[4] != '-' || !digits(s, 5, 2, &month) || s[7] != '-' || !digits(s, 8, 2, &day)) return false;
        if (s[10] != 'T' && s[10] != 't' && s[10] != ' ') return false;
        if (!digits(s, 11, 2, &hour) || s[13] != ':' || !digits(s, 14, 2, &minute) ||
            s[16] != ':' || !digits(s, 17, 2, &second)) {
            return false;
        }

        static constexpr unsigned kDaysIn[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (month < 1 || month > 12 || day < 1) return false;
        const unsigned max_day = kDaysIn[month - 1] + ((month == 2 && leap(year)) ? 1 : 0);
        if (day > max_day || hour > 23 || minute > 59 || second > 60) return false;

        size_t pos = 19;
        if (pos < s.size() && s[pos] == '.') {
            ++pos;
            const size_t start = pos;
            while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') ++pos;
            if (pos == start) return false;
        }

        core::i64 offset = 0;
        if (pos < s.size() && (s[pos] == 'Z' || s[pos] == 'z')) {
            ++pos;
        } else if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
            const bool neg = s[pos] == '-';
            unsigned oh = 0, om = 0;
            if (!digits(s, pos + 1, 2, &oh) || pos + 3 >= s.size() || s[pos + 3] != ':' ||
                !digits(s, pos + 4, 2, &om) || oh > 23 || om > 59) {
                return false;
            }
            offset = static_cast<core::i64>(oh) * 3600 + static_cast<core::i64>(om) * 60;
            if (neg) offset = -offset;
            pos += 6;
        } else {
            return false;
        }
        if (pos != s.size()) return false;

        const core::i64 days = days_from_civil(year, month, day);
        *out = days * 86400 + static_cast<core::i64>(hour) * 3600 + static_cast<core::i64>(minute) * 60 +
               static_cast<core::i64>(second) - offset;
        return true;
    }

    std::string format_rfc3339(core::Timestamp ts) {
        core::i64 days = ts / 86400;
        core::i64 rem = ts % 86400;
        if (rem < 0) {
            rem += 86400;
            days -= 1;
        }

        core::i64 y = 0;
        unsigned m = 0, d = 0;
        civil_from_days(days, &y, &m, &d);

        char buf[40];
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02u:%02u:%02uZ",
                      static_cast<long long>(y), m, d,
                      static_cast<unsigned>(rem / 3600),
                      static_cast<unsigned>((rem % 3600) / 60),
                      static_cast<unsigned>(rem % 60));
        return std::string(buf);
    }
} // namespace anamnesis::parser
