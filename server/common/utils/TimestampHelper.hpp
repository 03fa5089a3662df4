#pragma once

#include "AppException.hpp"

/**
 * @brief 业务时间点（UTC，秒精度，与数据库 TIMESTAMPTZ 往返一致）
 */
using Timestamp = std::chrono::sys_seconds;

/**
 * @brief 时间戳助手
 */
class TimestampHelper {
public:
    static std::string now() {
        return format(std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()));
    }

    /**
     * @brief 格式化为 ISO 8601（YYYY-MM-DDTHH:MM:SSZ）
     */
    static std::string format(Timestamp ts) {
        auto dp = std::chrono::floor<std::chrono::days>(ts);
        std::chrono::year_month_day ymd{dp};
        std::chrono::hh_mm_ss hms{ts - dp};

        std::ostringstream oss;
        oss << std::setfill('0')
            << std::setw(4) << static_cast<int>(ymd.year()) << "-"
            << std::setw(2) << static_cast<unsigned>(ymd.month()) << "-"
            << std::setw(2) << static_cast<unsigned>(ymd.day()) << "T"
            << std::setw(2) << hms.hours().count() << ":"
            << std::setw(2) << hms.minutes().count() << ":"
            << std::setw(2) << hms.seconds().count() << "Z";
        return oss.str();
    }

    /**
     * @brief 解析 "YYYY-MM-DD"、"YYYY-MM-DDTHH:MM:SS[Z]" 或 "YYYY-MM-DD HH:MM:SS"
     * @throws ValidationException 格式非法
     */
    static Timestamp parse(const std::string& text) {
        int y = 0;
        unsigned mo = 0, d = 0, h = 0, mi = 0, s = 0;
        char sep = 0;
        int dateEnd = -1;
        int timeEnd = -1;
        int matched = std::sscanf(text.c_str(), "%d-%u-%u%n%c%u:%u:%u%n",
                                  &y, &mo, &d, &dateEnd, &sep, &h, &mi, &s, &timeEnd);

        // 整串必须被消费；只接受 UTC 的 "Z" 后缀，带偏移量的时间不接受
        bool dateOnly = matched >= 3 && dateEnd == 10 && text.size() == 10;
        bool dateTime = matched == 7 && (sep == 'T' || sep == ' ') && timeEnd == 19 &&
                        (text.size() == 19 || (text.size() == 20 && sep == 'T' && text[19] == 'Z'));
        if (!dateOnly && !dateTime) {
            throw ValidationException("时间格式无效: " + text);
        }

        std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{mo}, std::chrono::day{d}};
        if (!ymd.ok() || h > 23 || mi > 59 || s > 59) {
            throw ValidationException("时间格式无效: " + text);
        }

        return std::chrono::sys_days{ymd}
            + std::chrono::hours{h} + std::chrono::minutes{mi} + std::chrono::seconds{s};
    }

    static Timestamp fromEpochSeconds(int64_t seconds) {
        return Timestamp{std::chrono::seconds{seconds}};
    }

    static int64_t toEpochSeconds(Timestamp ts) {
        return ts.time_since_epoch().count();
    }
};
