#pragma once

#include "ports/output/ILedgerRepository.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace issuer::application {

/**
 * @brief Фоновый поток снятия просроченных холдов
 *
 * Каждые interval вызывает releaseExpiredHolds(batchSize), пока проход
 * возвращает полный батч. Ошибка прохода логируется, следующий проход
 * выполняется по расписанию.
 */
class HoldSweeper {
public:
    HoldSweeper(
        std::shared_ptr<ports::output::ILedgerRepository> repository,
        std::chrono::milliseconds interval = std::chrono::milliseconds{5000},
        int batchSize = 500)
        : repository_(std::move(repository))
        , interval_(interval)
        , batchSize_(batchSize > 0 ? batchSize : 1)
        , running_(false)
        , stopRequested_(false)
        , sweepCount_(0)
        , releasedTotal_(0)
    {}

    ~HoldSweeper() {
        stop();
    }

    // Non-copyable, non-movable
    HoldSweeper(const HoldSweeper&) = delete;
    HoldSweeper& operator=(const HoldSweeper&) = delete;

    void start() {
        if (running_.exchange(true)) return;
        stopRequested_ = false;

        std::cout << "[HoldSweeper] Started (interval " << interval_.count()
                  << "ms, batch " << batchSize_ << ")" << std::endl;

        thread_ = std::thread([this]() {
            while (running_) {
                sweepOnce();

                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait_for(lock, interval_, [this] { return !running_; });
            }
        });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopRequested_ = true;
            running_ = false;
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
            std::cout << "[HoldSweeper] Stopped, released " << releasedTotal_ << " holds" << std::endl;
        }
    }

    bool isRunning() const { return running_; }

    uint64_t sweepCount() const { return sweepCount_; }

    uint64_t releasedTotal() const { return releasedTotal_; }

    /**
     * @brief Один проход вручную (для тестов)
     * @return Сколько холдов снято за проход
     */
    int sweepOnce() {
        int releasedNow = 0;
        try {
            int released = 0;
            do {
                released = repository_->releaseExpiredHolds(batchSize_);
                releasedNow += released;
            } while (released >= batchSize_ && !stopRequested_);

        } catch (const std::exception& e) {
            std::cerr << "[HoldSweeper] Sweep failed: " << e.what() << std::endl;
        }

        if (releasedNow > 0) {
            std::cout << "[HoldSweeper] Released " << releasedNow << " expired holds" << std::endl;
        }
        releasedTotal_ += static_cast<uint64_t>(releasedNow);
        ++sweepCount_;
        return releasedNow;
    }

private:
    std::shared_ptr<ports::output::ILedgerRepository> repository_;
    std::chrono::milliseconds interval_;
    int batchSize_;
    std::atomic<bool> running_;
    std::atomic<bool> stopRequested_;
    std::atomic<uint64_t> sweepCount_;
    std::atomic<uint64_t> releasedTotal_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace issuer::application
