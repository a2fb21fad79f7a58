/**
 * @file cron_expression.h
 * @brief Standard 5-field cron expression (minute hour day-of-month month day-of-week)
 *
 * Supported field syntax: "*", "*\/n", "a", "a-b", "a-b/n", "a/n" and comma lists.
 * Day-of-week accepts 0-7, both 0 and 7 meaning Sunday. When day-of-month and
 * day-of-week are both restricted a day matches if either one matches.
 */
#pragma once

#include <bitset>
#include <chrono>
#include <string>

namespace certsync::infrastructure {

class CronExpression {
public:
    /// @throws ConfigException on a malformed expression
    static CronExpression parse(const std::string& expression);

    /**
     * @brief First matching minute strictly after the given time (local time)
     * @throws ValidationException when nothing matches within five years (e.g. "0 0 31 2 *")
     */
    std::chrono::system_clock::time_point nextAfter(std::chrono::system_clock::time_point time) const;

    const std::string& expression() const { return expression_; }

    bool matchesMinute(int minute) const { return minutes_.test(minute); }
    bool matchesHour(int hour) const { return hours_.test(hour); }
    bool matchesMonth(int month) const { return months_.test(month); }

    /// @param dayOfMonth 1-31, @param dayOfWeek 0-6 (Sunday = 0)
    bool matchesDay(int dayOfMonth, int dayOfWeek) const;

private:
    CronExpression() = default;

    std::string expression_;
    std::bitset<60> minutes_;
    std::bitset<24> hours_;
    std::bitset<32> daysOfMonth_;   // 1-31
    std::bitset<13> months_;        // 1-12
    std::bitset<7> daysOfWeek_;     // 0-6
    bool domRestricted_ = false;
    bool dowRestricted_ = false;
};

} // namespace certsync::infrastructure
