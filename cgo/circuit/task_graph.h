// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2025, Lux Industries Inc
//
// Dependency graph of circuit tasks executed by a bounded worker pool

#ifndef FHEAUCTION_TASK_GRAPH_H
#define FHEAUCTION_TASK_GRAPH_H

#include <cstddef>
#include <functional>
#include <vector>

namespace fheauction {
namespace circuit {

// Tasks may only depend on tasks added before them, so the graph is acyclic
// by construction and insertion order is a valid serial schedule.
//
// Each task writes its own outputs; ordering through dependencies is the
// only synchronisation tasks get.
class TaskGraph {
public:
    using TaskId = size_t;

    // Throws std::out_of_range if a dependency does not exist yet
    TaskId add(std::function<void()> fn, std::vector<TaskId> deps = {});

    size_t size() const { return tasks_.size(); }

    // Longest dependency chain, in tasks
    size_t depth() const;

    // Runs every task once, at most `workers` at a time (0 = hardware
    // concurrency). After a task throws, no further tasks start; the first
    // exception is rethrown once running tasks have drained.
    void run(unsigned workers = 0);

    static unsigned defaultWorkers();

private:
    struct Task {
        std::function<void()> fn;
        std::vector<TaskId> deps;
        std::vector<TaskId> dependents;
    };

    void runSerial();

    std::vector<Task> tasks_;
};

} // namespace circuit
} // namespace fheauction

#endif // FHEAUCTION_TASK_GRAPH_H
