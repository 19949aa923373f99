#pragma once

#include "ports/input/IBalanceHistoryService.hpp"
#include <gmock/gmock.h>

namespace penny::tests {

class MockBalanceHistoryService : public ports::input::IBalanceHistoryService {
public:
    MOCK_METHOD(void, populateCurrentMonthHistory, (ports::output::ITransaction*), (override));
    MOCK_METHOD(void, updateTodayBalance,
                (const std::string&, const domain::Money&, ports::output::ITransaction*), (override));
    MOCK_METHOD(std::vector<domain::BalanceSnapshot>, getBalanceHistory,
                (const std::string&, const domain::CalendarDate&, const domain::CalendarDate&), (override));
    MOCK_METHOD(std::optional<domain::Money>, getAccountBalanceOnDate,
                (const std::string&, const domain::CalendarDate&), (override));
    MOCK_METHOD(std::vector<domain::AccountBalanceOnDate>, getAllAccountsBalanceOnDate,
                (const domain::CalendarDate&), (override));
    MOCK_METHOD(std::optional<domain::CalendarDate>, getLastSnapshotDate, (const std::string&), (override));
    MOCK_METHOD(void, upsertBalanceHistory,
                (const std::string&, const domain::CalendarDate&, const domain::Money&), (override));
    MOCK_METHOD(void, deleteBalanceHistory, (const std::string&, const domain::CalendarDate&), (override));
    MOCK_METHOD(int, deleteAccountHistory, (const std::string&), (override));
};

} // namespace penny::tests
