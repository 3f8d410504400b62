/*
Copyright 2023-2026 Leil Storage OÜ

This file is part of KestrelFS.

KestrelFS is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, version 3.

KestrelFS is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with KestrelFS  If not, see <http://www.gnu.org/licenses/>.
*/

#pragma once

#include "common/platform.h"

#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace parallel {

    class CriticalZone {
    public:
        static void run(std::mutex &mutex, std::function<void()> callback);
    };

    /// Outcome of a single task started by a WorkerGroup.
    struct TaskResult {
        std::string name;              ///< Name given at spawn time.
        std::exception_ptr error;      ///< Set when the task threw.
        bool finished = false;         ///< The task returned or threw.

        bool failed() const { return error != nullptr; }
    };

    /**
     * @brief Runs one thread per task and collects every outcome.
     *
     * Exceptions thrown by a task never cross the thread boundary, they are
     * stored in the task's TaskResult. A failing task does not cancel its
     * siblings. Threads still running when the group is destroyed are joined.
     */
    class WorkerGroup {
    public:
        WorkerGroup();
        ~WorkerGroup() = default;

        // No need to copy or move them so far
        WorkerGroup(const WorkerGroup &) = delete;
        WorkerGroup(WorkerGroup &&) = delete;
        WorkerGroup &operator=(const WorkerGroup &) = delete;
        WorkerGroup &operator=(WorkerGroup &&) = delete;

        /// Starts task on its own thread.
        void spawn(std::string name, std::function<void()> task);

        /// Waits for every spawned task. Results follow the spawn order.
        std::vector<TaskResult> joinAll();

        /// Waits for every spawned task unless stop is requested first.
        /// Returns false on interruption. In both cases results receives a
        /// snapshot in spawn order, unfinished tasks have finished == false.
        bool joinAll(const std::stop_token &stop, std::vector<TaskResult> &results);

        /// Number of spawned tasks.
        size_t size() const { return threads_.size(); }

    private:
        struct SharedState {
            std::mutex mutex;
            std::condition_variable_any allFinished;
            std::vector<TaskResult> results;
            size_t running = 0;
        };

        std::shared_ptr<SharedState> state_;
        std::vector<std::jthread> threads_;
    };

} // parallel
