#include "CommandPoller.hpp"

#include "MigrationTypes.hpp"
#include "RetryPolicy.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

namespace {
constexpr std::chrono::minutes kMaxPollDelay(5);
} // namespace

CommandPoller::CommandPoller(NetworkClient& client, CommandDispatcher& dispatcher, std::string agentId, std::chrono::seconds interval)
    : client_(client),
      dispatcher_(dispatcher),
      agentId_(std::move(agentId)),
      interval_(interval) {}

CommandPoller::~CommandPoller() {
    Stop();
}

void CommandPoller::Start() {
    if (running_.exchange(true)) {
        return;
    }

    worker_ = std::thread(&CommandPoller::Run, this);
}

void CommandPoller::Stop() {
    if (!running_.exchange(false)) {
        return;
    }

    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void CommandPoller::Run() {
    while (running_) {
        std::vector<CommandPayload> commands;
        if (client_.PollCommands(agentId_, commands)) {
            failures_ = 0;
            for (const auto& command : commands) {
                if (TimestampPassed(command.expiresAt)) {
                    std::cerr << "[Agent] Command expired: " << command.commandId << std::endl;
                    dispatcher_.ReportExpired(command);
                    continue;
                }
                std::cout << "[Agent] Dispatching " << command.action << " (" << command.commandId << ")" << std::endl;
                dispatcher_.Dispatch(command);
            }
        } else {
            ++failures_;
        }

        const auto delay = PollDelay(interval_, failures_);
        if (failures_ > 0) {
            std::cerr << "[Agent] Coordinator poll failed " << failures_ << " time(s). Next poll in " << delay.count() << "ms."
                      << std::endl;
        }
        std::unique_lock<std::mutex> lock(mutex_);
        wake_.wait_for(lock, delay, [this] { return !running_.load(); });
    }
}

std::chrono::milliseconds CommandPoller::PollDelay(std::chrono::seconds interval, int failures) {
    const std::chrono::milliseconds base(interval);
    if (failures <= 0) {
        return base;
    }
    const RetryPolicy backoff(failures + 1, base, std::max<std::chrono::milliseconds>(base, kMaxPollDelay));
    return backoff.Delay(failures);
}
