#ifndef GATESENSE_TIME_UTILS_H
#define GATESENSE_TIME_UTILS_H

#include <string>
#include <ctime>

// All timestamps are stored as "YYYY-MM-DD HH:MM:SS" in UTC
class TimeUtils {
public:
    static std::string getCurrentTimestamp();
    // Accepts "YYYY-MM-DD HH:MM:SS", "YYYY-MM-DDTHH:MM:SS[.fff][Z]"
    static std::string normalizeTimestamp(const std::string& timestamp);
    static std::string addSeconds(const std::string& timestamp, long long seconds);
    static int getHourOfDay(const std::string& timestamp);
    static long long getSecondsBetween(const std::string& start, const std::string& end);
    static int getMinutesBetween(const std::string& start, const std::string& end);

private:
    static time_t stringToTime(const std::string& timestamp);
    static std::string timeToString(time_t time);
};

#endif // GATESENSE_TIME_UTILS_H
