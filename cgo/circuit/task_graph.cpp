// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc

#include "circuit/task_graph.h"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

namespace fheauction {
namespace circuit {

TaskGraph::TaskId TaskGraph::add(std::function<void()> fn, std::vector<TaskId> deps) {
    const TaskId id = tasks_.size();
    for (TaskId dep : deps) {
        if (dep >= id) {
            throw std::out_of_range("task " + std::to_string(id) + " depends on unknown task " +
                                    std::to_string(dep));
        }
    }
    for (TaskId dep : deps) {
        tasks_[dep].dependents.push_back(id);
    }
    tasks_.push_back(Task{std::move(fn), std::move(deps), {}});
    return id;
}

size_t TaskGraph::depth() const {
    std::vector<size_t> level(tasks_.size(), 1);
    size_t deepest = 0;
    for (TaskId id = 0; id < tasks_.size(); ++id) {
        for (TaskId dep : tasks_[id].deps) {
            level[id] = std::max(level[id], level[dep] + 1);
        }
        deepest = std::max(deepest, level[id]);
    }
    return deepest;
}

unsigned TaskGraph::defaultWorkers() {
    unsigned num_threads = std::thread::hardware_concurrency();
    if (num_threads == 0) num_threads = 4;
    return num_threads;
}

void TaskGraph::runSerial() {
    for (auto& task : tasks_) {
        task.fn();
    }
}

void TaskGraph::run(unsigned workers) {
    if (tasks_.empty()) {
        return;
    }
    if (workers == 0) {
        workers = defaultWorkers();
    }
    workers = static_cast<unsigned>(std::min<size_t>(workers, tasks_.size()));
    if (workers == 1) {
        runSerial();
        return;
    }

    std::mutex mtx;
    std::condition_variable cv;
    std::queue<TaskId> ready;
    std::vector<size_t> pending(tasks_.size());
    size_t finished = 0;
    bool aborted = false;
    std::exception_ptr failure;

    for (TaskId id = 0; id < tasks_.size(); ++id) {
        pending[id] = tasks_[id].deps.size();
        if (pending[id] == 0) {
            ready.push(id);
        }
    }

    auto worker = [&]() {
        std::unique_lock<std::mutex> lock(mtx);
        for (;;) {
            cv.wait(lock, [&] { return aborted || !ready.empty() || finished == tasks_.size(); });
            if (aborted || ready.empty()) {
                return;
            }

            TaskId id = ready.front();
            ready.pop();
            lock.unlock();

            std::exception_ptr error;
            try {
                tasks_[id].fn();
            } catch (...) {
                error = std::current_exception();
            }

            lock.lock();
            ++finished;
            if (error) {
                if (!failure) failure = error;
                aborted = true;
            } else {
                for (TaskId next : tasks_[id].dependents) {
                    if (--pending[next] == 0) {
                        ready.push(next);
                    }
                }
            }
            cv.notify_all();
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(workers);
    try {
        for (unsigned t = 0; t < workers; ++t) {
            pool.emplace_back(worker);
        }
    } catch (const std::system_error&) {
        // Started workers must stop before the pool can be destroyed
        {
            std::lock_guard<std::mutex> guard(mtx);
            aborted = true;
        }
        cv.notify_all();
        for (auto& thread : pool) {
            thread.join();
        }
        throw;
    }
    for (auto& thread : pool) {
        thread.join();
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
}

} // namespace circuit
} // namespace fheauction
