#pragma once

#include "ports/output/IEventPublisher.hpp"
#include <iostream>
#include <mutex>

namespace penny::adapters::secondary {

/**
 * @brief Публикация событий в лог
 *
 * Подписчиков (UI) в процессе нет, события только фиксируются.
 */
class LoggingEventPublisher : public ports::output::IEventPublisher {
public:
    LoggingEventPublisher() {
        std::cout << "[LoggingEventPublisher] Created" << std::endl;
    }

    void publish(const std::string& routingKey, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++published_;
        std::cout << "[LoggingEventPublisher] " << routingKey << " " << message << std::endl;
    }

    size_t publishedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_;
    }

private:
    mutable std::mutex mutex_;
    size_t published_ = 0;
};

} // namespace penny::adapters::secondary
