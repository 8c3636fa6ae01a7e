#pragma once

#include <string>
#include <cmath>
#include <cstdint>
#include <fmt/format.h>

namespace xlbind {
namespace utils {

/**
 * @brief 时间工具类 - 宿主日期序列号与日历日期互转
 *
 * 序列号以1899-12-30为0日；宿主把1900年当作闰年，序列号60对应不存在的1900-02-29，
 * 因此1900-03-01之前的序列号比真实天数多1。
 */
class TimeUtils {
public:
    struct DateTime {
        int year = 1899;
        int month = 12;
        int day = 30;
        int hour = 0;
        int minute = 0;
        int second = 0;
    };

    /**
     * @brief 日历日期转宿主序列号
     */
    static double toSerialNumber(int year, int month, int day,
                                 int hour = 0, int minute = 0, int second = 0) {
        int64_t days = daysFromCivil(year, month, day) - daysFromCivil(1899, 12, 30);
        // 1900-03-01之前补上不存在的2月29日
        if (days < 61 && days > 0) {
            days -= 1;
        }
        double fraction = (hour * 3600.0 + minute * 60.0 + second) / 86400.0;
        return static_cast<double>(days) + fraction;
    }

    /**
     * @brief 宿主序列号转日历日期（精确到秒，四舍五入）
     */
    static DateTime fromSerialNumber(double serial) {
        double whole = std::floor(serial);
        int64_t seconds = static_cast<int64_t>(std::llround((serial - whole) * 86400.0));
        int64_t days = static_cast<int64_t>(whole);
        if (seconds >= 86400) {
            days += 1;
            seconds -= 86400;
        }
        // 序列号60是不存在的1900-02-29，落到1900-02-28
        if (days > 0 && days < 60) {
            days += 1;
        }

        DateTime dt;
        civilFromDays(days + daysFromCivil(1899, 12, 30), dt.year, dt.month, dt.day);
        dt.hour = static_cast<int>(seconds / 3600);
        dt.minute = static_cast<int>((seconds % 3600) / 60);
        dt.second = static_cast<int>(seconds % 60);
        return dt;
    }

    /**
     * @brief 序列号格式化为ISO 8601；没有时间部分时只输出日期
     * @return "YYYY-MM-DD" 或 "YYYY-MM-DDTHH:MM:SS"
     */
    static std::string formatSerialISO8601(double serial) {
        DateTime dt = fromSerialNumber(serial);
        if (dt.hour == 0 && dt.minute == 0 && dt.second == 0) {
            return fmt::format("{:04d}-{:02d}-{:02d}", dt.year, dt.month, dt.day);
        }
        return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}",
                           dt.year, dt.month, dt.day, dt.hour, dt.minute, dt.second);
    }

private:
    // 公历日期与1970-01-01起的天数互转（与时区无关）
    static int64_t daysFromCivil(int y, int m, int d) {
        y -= m <= 2;
        const int64_t era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<int64_t>(doe) - 719468;
    }

    static void civilFromDays(int64_t z, int& y, int& m, int& d) {
        z += 719468;
        const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(z - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
        m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
        y = static_cast<int>(static_cast<int64_t>(yoe) + era * 400 + (m <= 2));
    }
};

}} // namespace xlbind::utils
