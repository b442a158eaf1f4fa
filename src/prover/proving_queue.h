// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#ifndef CONTINUITY_PROVER_PROVING_QUEUE_H
#define CONTINUITY_PROVER_PROVING_QUEUE_H

#include <commitment/commitment.h>
#include <prover/prover.h>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct ProvingResult {
    std::string chainId;
    ProverStatus status{ProverStatus::CANCELLED};
    StorageCommitment commitment;
    std::string error;
};

/**
 * CProvingQueue - worker pool for independent chains.
 *
 * Jobs are taken in submission order. Chains share no state, so any number
 * of jobs may run at once. Stop() raises the cooperative cancel flag so
 * in-flight VDF work ends with CANCELLED, and resolves queued jobs the same way.
 */
class CProvingQueue {
public:
    struct Stats {
        size_t queue_depth{0};
        size_t total_submitted{0};
        size_t total_completed{0};
        size_t total_failed{0};
        size_t total_cancelled{0};
    };

    /** @throws std::invalid_argument if threads is zero */
    explicit CProvingQueue(size_t threads);

    ~CProvingQueue();

    CProvingQueue(const CProvingQueue&) = delete;
    CProvingQueue& operator=(const CProvingQueue&) = delete;

    bool Start();
    void Stop();
    bool IsRunning() const { return m_running.load(); }

    /**
     * Queue one proving job. The prover is kept alive until the job ends.
     * If the queue is not running the future is already resolved as CANCELLED.
     */
    std::future<ProvingResult> Submit(const std::string& chainId,
                                      std::shared_ptr<const CStorageProver> prover);

    size_t GetQueueDepth() const;
    Stats GetStats() const;

private:
    struct Job {
        std::string chainId;
        std::shared_ptr<const CStorageProver> prover;
        std::promise<ProvingResult> promise;
    };

    void ProvingWorker();

    static ProvingResult Cancelled(const std::string& chainId);

    size_t m_threads;

    std::deque<Job> m_queue;
    mutable std::mutex m_queue_mutex;
    std::condition_variable m_queue_cv;

    std::vector<std::thread> m_workers;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_cancel{false};

    mutable Stats m_stats{};
    mutable std::mutex m_stats_mutex;
};

#endif // CONTINUITY_PROVER_PROVING_QUEUE_H
