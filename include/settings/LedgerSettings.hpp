// include/settings/LedgerSettings.hpp
#pragma once

#include "domain/errors/LedgerError.hpp"
#include <string>
#include <cstdlib>

namespace penny::settings
{

    /**
     * @brief Настройки ядра учёта
     *
     * Переменные окружения:
     * - PENNY_DEFAULT_CURRENCY (default: "USD"): валюта новых счетов
     * - PENNY_POPULATE_HISTORY_ON_START (default: true): восстанавливать историю при старте
     * - PENNY_STORAGE (default: "postgres"): memory | postgres
     */
    class LedgerSettings
    {
    public:
        LedgerSettings()
        {
            defaultCurrency_ = getEnvOrDefault("PENNY_DEFAULT_CURRENCY", "USD");
            populateHistoryOnStart_ = parseBool(getEnvOrDefault("PENNY_POPULATE_HISTORY_ON_START", "true"));
            storage_ = getEnvOrDefault("PENNY_STORAGE", "postgres");

            if (storage_ != "memory" && storage_ != "postgres") {
                throw domain::ValidationError("Unknown PENNY_STORAGE: " + storage_);
            }
        }

        std::string getDefaultCurrency() const { return defaultCurrency_; }
        bool populateHistoryOnStart() const { return populateHistoryOnStart_; }
        std::string getStorage() const { return storage_; }
        bool useInMemoryStorage() const { return storage_ == "memory"; }

    private:
        std::string defaultCurrency_;
        bool populateHistoryOnStart_;
        std::string storage_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }

        static bool parseBool(const std::string &value)
        {
            return value == "1" || value == "true" || value == "yes";
        }
    };

} // namespace penny::settings
