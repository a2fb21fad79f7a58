#include "cron_expression.h"
#include "exceptions.h"

#include <ctime>
#include <sstream>
#include <vector>

namespace certsync::infrastructure {

using common::ConfigException;

namespace {

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream in(s);
    while (std::getline(in, part, delimiter)) {
        parts.push_back(part);
    }
    if (!s.empty() && s.back() == delimiter) {
        parts.push_back("");
    }
    return parts;
}

int parseNumber(const std::string& text, const std::string& field) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos || text.size() > 4) {
        throw ConfigException("invalid number '" + text + "' in cron field '" + field + "'");
    }
    return std::stoi(text);
}

/**
 * @brief Expand one cron field into the set of matching values
 * @return Values in [min, max]; the caller maps aliases (day-of-week 7)
 */
std::vector<bool> parseField(const std::string& field, int min, int max) {
    if (field.empty()) {
        throw ConfigException("empty cron field");
    }

    std::vector<bool> values(max + 1, false);
    for (const auto& item : split(field, ',')) {
        if (item.empty()) {
            throw ConfigException("empty list item in cron field '" + field + "'");
        }

        std::string range = item;
        int step = 1;
        auto slash = item.find('/');
        if (slash != std::string::npos) {
            range = item.substr(0, slash);
            step = parseNumber(item.substr(slash + 1), field);
            if (step < 1) {
                throw ConfigException("step must be positive in cron field '" + field + "'");
            }
        }

        int lo = 0;
        int hi = 0;
        if (range == "*") {
            lo = min;
            hi = max;
        } else {
            auto dash = range.find('-');
            if (dash == std::string::npos) {
                lo = parseNumber(range, field);
                // "a/n" runs from a to the end of the range
                hi = slash != std::string::npos ? max : lo;
            } else {
                lo = parseNumber(range.substr(0, dash), field);
                hi = parseNumber(range.substr(dash + 1), field);
            }
        }

        if (lo < min || hi > max || lo > hi) {
            throw ConfigException("value out of range " + std::to_string(min) + "-" +
                                  std::to_string(max) + " in cron field '" + field + "'");
        }
        for (int v = lo; v <= hi; v += step) {
            values[v] = true;
        }
    }
    return values;
}

template <size_t N>
void fill(std::bitset<N>& bits, const std::vector<bool>& values) {
    for (size_t i = 0; i < N && i < values.size(); i++) {
        bits[i] = values[i];
    }
}

} // anonymous namespace

CronExpression CronExpression::parse(const std::string& expression) {
    std::istringstream in(expression);
    std::vector<std::string> fields;
    std::string field;
    while (in >> field) {
        fields.push_back(field);
    }
    if (fields.size() != 5) {
        throw ConfigException("cron expression must have exactly 5 fields, got " +
                              std::to_string(fields.size()) + ": '" + expression + "'");
    }

    CronExpression cron;
    cron.expression_ = fields[0] + " " + fields[1] + " " + fields[2] + " " + fields[3] + " " + fields[4];
    fill(cron.minutes_, parseField(fields[0], 0, 59));
    fill(cron.hours_, parseField(fields[1], 0, 23));
    fill(cron.daysOfMonth_, parseField(fields[2], 1, 31));
    fill(cron.months_, parseField(fields[3], 1, 12));

    auto dow = parseField(fields[4], 0, 7);
    for (int d = 0; d < 7; d++) {
        cron.daysOfWeek_[d] = dow[d];
    }
    if (dow[7]) {
        cron.daysOfWeek_[0] = true;
    }

    cron.domRestricted_ = fields[2][0] != '*';
    cron.dowRestricted_ = fields[4][0] != '*';
    return cron;
}

bool CronExpression::matchesDay(int dayOfMonth, int dayOfWeek) const {
    bool dom = daysOfMonth_.test(dayOfMonth);
    bool dow = daysOfWeek_.test(dayOfWeek);
    if (domRestricted_ && dowRestricted_) {
        return dom || dow;
    }
    if (domRestricted_) {
        return dom;
    }
    if (dowRestricted_) {
        return dow;
    }
    return true;
}

std::chrono::system_clock::time_point CronExpression::nextAfter(std::chrono::system_clock::time_point time) const {
    std::time_t start = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    localtime_r(&start, &tm);

    // Next whole minute
    tm.tm_sec = 0;
    tm.tm_min += 1;
    tm.tm_isdst = -1;
    std::mktime(&tm);

    const int yearLimit = tm.tm_year + 5;
    while (tm.tm_year <= yearLimit) {
        if (!months_.test(tm.tm_mon + 1)) {
            tm.tm_mon += 1;
            tm.tm_mday = 1;
            tm.tm_hour = 0;
            tm.tm_min = 0;
        } else if (!matchesDay(tm.tm_mday, tm.tm_wday)) {
            tm.tm_mday += 1;
            tm.tm_hour = 0;
            tm.tm_min = 0;
        } else if (!hours_.test(tm.tm_hour)) {
            tm.tm_hour += 1;
            tm.tm_min = 0;
        } else if (!minutes_.test(tm.tm_min)) {
            tm.tm_min += 1;
        } else {
            std::tm match = tm;
            match.tm_isdst = -1;
            return std::chrono::system_clock::from_time_t(std::mktime(&match));
        }
        tm.tm_isdst = -1;
        std::mktime(&tm);
    }

    throw common::ValidationException("cron expression '" + expression_ + "' never matches");
}

} // namespace certsync::infrastructure
