#pragma once

#include <string>
#include <random>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <atomic>
#include <algorithm>
#include <cstdint>

namespace penny::utils {

/**
 * @brief Генератор идентификаторов записей
 *
 * Формат: "<prefix>-tttttttttttt-ssss-rrrrrrrr", где t: миллисекунды
 * Unix-времени, s: номер внутри миллисекунды, r: случайный хвост.
 * В пределах процесса идентификаторы строго растут, поэтому
 * лексикографический порядок совпадает с порядком создания.
 */
class IdGenerator {
public:
    /**
     * @param prefix "acc", "op", "cat", "bud"
     */
    static std::string newId(const std::string& prefix) {
        const uint64_t stamp = nextStamp();

        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<uint32_t> dist;

        std::ostringstream ss;
        ss << prefix << '-' << std::hex << std::setfill('0')
           << std::setw(12) << (stamp >> 16) << '-'
           << std::setw(4) << (stamp & 0xFFFF) << '-'
           << std::setw(8) << dist(gen);
        return ss.str();
    }

private:
    /// (миллисекунды << 16) | номер; монотонно растёт между потоками
    static uint64_t nextStamp() {
        static std::atomic<uint64_t> last{0};

        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        const uint64_t candidate = static_cast<uint64_t>(millis) << 16;

        uint64_t prev = last.load();
        uint64_t next = 0;
        do {
            next = std::max(candidate, prev + 1);
        } while (!last.compare_exchange_weak(prev, next));
        return next;
    }
};

} // namespace penny::utils
