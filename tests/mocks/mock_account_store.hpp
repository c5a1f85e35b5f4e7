#pragma once

#include "dispatch/iaccount_store.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace auditpipe::testing {

/**
 * @brief In-memory accounts keyed by user id
 */
class MockAccountStore : public IAccountStore {
public:
    struct Account {
        AccountStatus status = AccountStatus::ACTIVE;
        int risk_score = 0;
    };

    void set_account_status(const std::string& user_id, AccountStatus status) override {
        if (fail_.load()) throw std::runtime_error("mock account store unavailable");
        std::lock_guard lock(mutex_);
        accounts_[user_id].status = status;
        status_calls_.fetch_add(1);
    }

    void raise_risk_score(const std::string& user_id, int floor) override {
        if (fail_.load()) throw std::runtime_error("mock account store unavailable");
        std::lock_guard lock(mutex_);
        auto& account = accounts_[user_id];
        account.risk_score = std::max(account.risk_score, floor);
        score_calls_.fetch_add(1);
    }

    [[nodiscard]] std::string name() const override { return "mock-accounts"; }

    void set_fail(bool v) { fail_ = v; }

    void seed(const std::string& user_id, Account account) {
        std::lock_guard lock(mutex_);
        accounts_[user_id] = account;
    }

    [[nodiscard]] Account get(const std::string& user_id) const {
        std::lock_guard lock(mutex_);
        const auto it = accounts_.find(user_id);
        return it != accounts_.end() ? it->second : Account{};
    }

    [[nodiscard]] int status_calls() const { return status_calls_.load(); }
    [[nodiscard]] int score_calls() const { return score_calls_.load(); }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Account> accounts_;
    std::atomic<bool> fail_{false};
    std::atomic<int> status_calls_{0};
    std::atomic<int> score_calls_{0};
};

} // namespace auditpipe::testing
