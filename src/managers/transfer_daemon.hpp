#pragma once

#include <vector>
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <core/types.hpp>
#include "transfer_queue.hpp"

// Fixed pool of workers draining one TransferQueue. Each worker claims a
// job, drives it step by step until it settles, waits or is interrupted,
// then releases it.
class TransferDaemon {
public:
    TransferDaemon(TransferQueue& queue, int workers);
    ~TransferDaemon();

    TransferDaemon(const TransferDaemon&) = delete;
    TransferDaemon& operator=(const TransferDaemon&) = delete;

    void start();

    // Interrupt running steps at their next chunk boundary and join.
    // Jobs keep their current step and resume on the next start.
    void stop();

    bool running() const { return running_.load(); }
    void wake();

    // Drive one claimed job. Every failure is converted to job state here;
    // nothing escapes to the worker loop.
    void drive(Job& job);

private:
    TransferQueue& queue_;
    int workers_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    void worker_loop(int index);
    void handle_error(Job& job, const JobError& err);
};
