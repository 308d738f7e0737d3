#pragma once

#include "CommandDispatcher.hpp"
#include "NetworkClient.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

class CommandPoller {
public:
    CommandPoller(NetworkClient& client, CommandDispatcher& dispatcher, std::string agentId, std::chrono::seconds interval);
    ~CommandPoller();

    void Start();
    void Stop();

    // Wait before the next poll; grows while the coordinator keeps failing.
    static std::chrono::milliseconds PollDelay(std::chrono::seconds interval, int failures);

private:
    void Run();

    NetworkClient& client_;
    CommandDispatcher& dispatcher_;
    std::string agentId_;
    std::chrono::seconds interval_;
    int failures_ = 0;
    std::atomic<bool> running_{false};
    std::mutex mutex_;
    std::condition_variable wake_;
    std::thread worker_;
};
