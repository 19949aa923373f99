#pragma once

#include "CalendarDate.hpp"
#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cctype>

namespace penny::domain {

/**
 * @brief Временная метка (UTC)
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Начало календарного дня (00:00:00 UTC)
     */
    static Timestamp startOf(const CalendarDate& date) {
        return Timestamp(std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            std::chrono::sys_time<std::chrono::seconds>(date.days())));
    }

    /**
     * @brief Разобрать ISO 8601 ("2025-01-15T10:30:00Z", "2025-01-15T10:30:00.250Z")
     *
     * Строка трактуется как UTC. Голая дата даёт полночь.
     * Дробная часть секунд учитывается до миллисекунд.
     * @throws ValidationError если дата некорректна
     */
    static Timestamp fromString(const std::string& str) {
        auto date = CalendarDate::fromString(str);

        std::tm tm = {};
        int millis = 0;
        if (str.size() > 10 && (str[10] == 'T' || str[10] == ' ')) {
            std::istringstream ss(str.substr(11));
            ss >> std::get_time(&tm, "%H:%M:%S");
            if (ss.fail()) {
                tm = {};
            } else if (str.size() > 19 && str[19] == '.') {
                int scale = 100;
                for (size_t i = 20; i < str.size() && std::isdigit(static_cast<unsigned char>(str[i])); ++i) {
                    millis += (str[i] - '0') * scale;
                    scale /= 10;
                }
            }
        }

        auto point = std::chrono::sys_time<std::chrono::milliseconds>(date.days())
                   + std::chrono::hours{tm.tm_hour}
                   + std::chrono::minutes{tm.tm_min}
                   + std::chrono::seconds{tm.tm_sec}
                   + std::chrono::milliseconds{millis};
        return Timestamp(std::chrono::time_point_cast<std::chrono::system_clock::duration>(point));
    }

    /**
     * @brief ISO 8601 с миллисекундами: "2025-01-15T10:30:00.250Z"
     *
     * Фиксированная ширина, поэтому строки сравниваются в порядке времени.
     */
    std::string toString() const {
        auto seconds = std::chrono::floor<std::chrono::seconds>(value);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(value - seconds).count();
        auto time_t_val = std::chrono::system_clock::to_time_t(seconds);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
        return ss.str();
    }

    /**
     * @brief Календарная дата метки (UTC)
     */
    CalendarDate date() const {
        return CalendarDate(std::chrono::floor<std::chrono::days>(value));
    }

    bool operator<(const Timestamp& other) const {
        return value < other.value;
    }

    bool operator>(const Timestamp& other) const {
        return value > other.value;
    }

    bool operator==(const Timestamp& other) const {
        return value == other.value;
    }
};

} // namespace penny::domain
