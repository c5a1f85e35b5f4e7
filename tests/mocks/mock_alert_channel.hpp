#pragma once

#include "alerting/alert_channel.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace auditpipe::testing {

/**
 * @brief Records delivered payloads; can be told to fail or throw
 */
class MockAlertChannel : public IAlertChannel {
public:
    enum class Mode { SUCCEED, FAIL, THROW };

    explicit MockAlertChannel(AlertChannelKind kind, Mode mode = Mode::SUCCEED)
        : kind_(kind), mode_(mode) {}

    [[nodiscard]] bool deliver(const AlertPayload& payload) override {
        attempts_.fetch_add(1);
        if (mode_.load() == Mode::THROW) {
            throw std::runtime_error("mock channel exploded");
        }
        if (mode_.load() == Mode::FAIL) return false;
        std::lock_guard lock(mutex_);
        delivered_.push_back(payload);
        return true;
    }

    [[nodiscard]] AlertChannelKind kind() const override { return kind_; }
    [[nodiscard]] std::string name() const override {
        return std::string("mock:") + std::string(alert_channel_to_string(kind_));
    }

    void set_mode(Mode m) { mode_ = m; }

    [[nodiscard]] int attempts() const { return attempts_.load(); }

    [[nodiscard]] std::vector<AlertPayload> delivered() const {
        std::lock_guard lock(mutex_);
        return delivered_;
    }

private:
    AlertChannelKind kind_;
    std::atomic<Mode> mode_;
    std::atomic<int> attempts_{0};
    mutable std::mutex mutex_;
    std::vector<AlertPayload> delivered_;
};

} // namespace auditpipe::testing
