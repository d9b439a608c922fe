#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

namespace ledger::adapters::secondary {

/**
 * @brief Фоновая задача с фиксированным интервалом
 *
 * Один поток на задачу; задачи не блокируют друг друга.
 * Исключение в итерации логируется, задача продолжает работать.
 */
class PeriodicTask {
public:
    using Job = std::function<void()>;

    PeriodicTask(std::string name, Job job, std::chrono::milliseconds interval)
        : name_(std::move(name))
        , job_(std::move(job))
        , interval_(interval)
        , running_(false)
        , runCount_(0)
        , failureCount_(0)
    {}

    ~PeriodicTask() {
        stop();
    }

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start() {
        if (running_.exchange(true)) return;

        std::cout << "[PeriodicTask] " << name_ << " started, interval "
                  << interval_.count() << "ms" << std::endl;

        thread_ = std::thread([this]() {
            while (running_) {
                runOnce();

                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait_for(lock, interval_, [this] { return !running_; });
            }
        });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
            std::cout << "[PeriodicTask] " << name_ << " stopped" << std::endl;
        }
    }

    bool isRunning() const { return running_; }
    uint64_t runCount() const { return runCount_; }
    uint64_t failureCount() const { return failureCount_; }
    const std::string& name() const { return name_; }

    /**
     * @brief Выполнить одну итерацию в текущем потоке (для тестов)
     */
    void runOnce() {
        try {
            job_();
        } catch (const std::exception& e) {
            ++failureCount_;
            std::cerr << "[PeriodicTask] " << name_ << " iteration failed: " << e.what() << std::endl;
        }
        ++runCount_;
    }

private:
    std::string name_;
    Job job_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> runCount_;
    std::atomic<uint64_t> failureCount_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace ledger::adapters::secondary
