#include "TimeUtils.h"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string TimeUtils::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    return timeToString(std::chrono::system_clock::to_time_t(now));
}

std::string TimeUtils::normalizeTimestamp(const std::string& timestamp) {
    return timeToString(stringToTime(timestamp));
}

std::string TimeUtils::addSeconds(const std::string& timestamp, long long seconds) {
    time_t t = stringToTime(timestamp);
    t += static_cast<time_t>(seconds);
    return timeToString(t);
}

int TimeUtils::getHourOfDay(const std::string& timestamp) {
    time_t t = stringToTime(timestamp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm.tm_hour;
}

long long TimeUtils::getSecondsBetween(const std::string& start, const std::string& end) {
    return static_cast<long long>(std::difftime(stringToTime(end), stringToTime(start)));
}

int TimeUtils::getMinutesBetween(const std::string& start, const std::string& end) {
    return static_cast<int>(getSecondsBetween(start, end) / 60);
}

time_t TimeUtils::stringToTime(const std::string& timestamp) {
    std::string text = timestamp;
    if (text.size() > 10 && text[10] == 'T') text[10] = ' ';
    // drop fractional seconds and zone designator; scanners report UTC
    if (text.size() > 19) text = text.substr(0, 19);

    std::tm tm = {};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");

    if (ss.fail()) {
        throw std::runtime_error("Failed to parse timestamp: " + timestamp);
    }

    return timegm(&tm);
}

std::string TimeUtils::timeToString(time_t time) {
    std::tm tm{};
    gmtime_r(&time, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}
