// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#include <prover/proving_queue.h>

#include <util/logging.h>

#include <exception>
#include <stdexcept>
#include <utility>

CProvingQueue::CProvingQueue(size_t threads)
    : m_threads(threads)
{
    if (threads == 0) {
        throw std::invalid_argument("proving queue needs at least one worker thread");
    }
}

CProvingQueue::~CProvingQueue() {
    Stop();
}

bool CProvingQueue::Start() {
    if (m_running.load()) {
        return false;  // Already running
    }

    m_cancel.store(false);
    m_running.store(true);
    for (size_t i = 0; i < m_threads; i++) {
        m_workers.emplace_back(&CProvingQueue::ProvingWorker, this);
    }
    LogPrintProver(INFO, "Proving queue started with %zu worker(s)", m_threads);
    return true;
}

void CProvingQueue::Stop() {
    if (!m_running.load()) {
        return;  // Already stopped
    }

    m_cancel.store(true);
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_running.store(false);
    }
    m_queue_cv.notify_all();  // Wake workers to check m_running

    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    m_workers.clear();

    // Resolve anything still queued
    std::deque<Job> leftover;
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        leftover.swap(m_queue);
    }
    for (auto& job : leftover) {
        job.promise.set_value(Cancelled(job.chainId));
    }
    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_stats.total_cancelled += leftover.size();
        m_stats.queue_depth = 0;
    }

    LogPrintProver(INFO, "Proving queue stopped (%zu queued job(s) cancelled)", leftover.size());
}

ProvingResult CProvingQueue::Cancelled(const std::string& chainId) {
    ProvingResult result;
    result.chainId = chainId;
    result.status = ProverStatus::CANCELLED;
    result.error = "proving queue stopped";
    return result;
}

std::future<ProvingResult> CProvingQueue::Submit(const std::string& chainId,
                                                 std::shared_ptr<const CStorageProver> prover)
{
    Job job;
    job.chainId = chainId;
    job.prover = std::move(prover);
    std::future<ProvingResult> future = job.promise.get_future();

    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        if (m_running.load() && job.prover) {
            m_queue.push_back(std::move(job));
            std::lock_guard<std::mutex> stats_lock(m_stats_mutex);
            m_stats.total_submitted++;
            m_stats.queue_depth = m_queue.size();
            m_queue_cv.notify_one();
            return future;
        }
    }

    job.promise.set_value(Cancelled(chainId));
    return future;
}

void CProvingQueue::ProvingWorker() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            m_queue_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running.load();
            });

            if (!m_running.load()) {
                break;  // Shutting down; Stop() resolves queued jobs
            }

            job = std::move(m_queue.front());
            m_queue.pop_front();

            std::lock_guard<std::mutex> stats_lock(m_stats_mutex);
            m_stats.queue_depth = m_queue.size();
        }

        ProvingResult result;
        result.chainId = job.chainId;
        try {
            result.status = job.prover->GenerateCommitment(result.commitment, result.error, &m_cancel);
        } catch (const std::exception& e) {
            // Configuration errors surface through the future
            LogPrintProver(ERROR, "Proving %s threw: %s", job.chainId.c_str(), e.what());
            {
                std::lock_guard<std::mutex> stats_lock(m_stats_mutex);
                m_stats.total_failed++;
            }
            job.promise.set_exception(std::current_exception());
            continue;
        }

        if (result.status != ProverStatus::OK) {
            LogPrintProver(WARN, "Proving %s failed: %s (%s)", job.chainId.c_str(),
                           ProverStatusToString(result.status), result.error.c_str());
        }

        {
            std::lock_guard<std::mutex> stats_lock(m_stats_mutex);
            if (result.status == ProverStatus::OK) {
                m_stats.total_completed++;
            } else if (result.status == ProverStatus::CANCELLED) {
                m_stats.total_cancelled++;
            } else {
                m_stats.total_failed++;
            }
        }

        job.promise.set_value(std::move(result));
    }
}

size_t CProvingQueue::GetQueueDepth() const {
    std::lock_guard<std::mutex> lock(m_queue_mutex);
    return m_queue.size();
}

CProvingQueue::Stats CProvingQueue::GetStats() const {
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    return m_stats;
}
