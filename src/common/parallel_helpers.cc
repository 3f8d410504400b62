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

#include "common/platform.h"
#include "parallel_helpers.h"

namespace parallel {

    void CriticalZone::run(std::mutex &mutex, std::function<void()> callback) {
        const std::lock_guard<std::mutex> lock(mutex);
        callback();
    }

    WorkerGroup::WorkerGroup() : state_(std::make_shared<SharedState>()) {}

    void WorkerGroup::spawn(std::string name, std::function<void()> task) {
        size_t index = 0;
        CriticalZone::run(state_->mutex, [&]() {
            index = state_->results.size();
            state_->results.push_back(TaskResult{std::move(name), nullptr, false});
            ++state_->running;
        });

        // The thread keeps its own reference to the state, so a group
        // abandoned by an interrupted join stays valid for it.
        threads_.emplace_back([state = state_, index, task = std::move(task)]() {
            std::exception_ptr error;
            try {
                task();
            } catch (...) {
                error = std::current_exception();
            }
            std::scoped_lock<std::mutex> const lock(state->mutex);
            state->results[index].error = error;
            state->results[index].finished = true;
            --state->running;
            state->allFinished.notify_all();
        });
    }

    std::vector<TaskResult> WorkerGroup::joinAll() {
        for (auto &thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        std::scoped_lock<std::mutex> const lock(state_->mutex);
        return state_->results;
    }

    bool WorkerGroup::joinAll(const std::stop_token &stop,
                              std::vector<TaskResult> &results) {
        std::unique_lock<std::mutex> lock(state_->mutex);
        bool allDone = state_->allFinished.wait(lock, stop, [this]() {
            return state_->running == 0;
        });
        results = state_->results;
        lock.unlock();

        if (allDone) {
            for (auto &thread : threads_) {
                if (thread.joinable()) {
                    thread.join();
                }
            }
        }
        return allDone;
    }

} // parallel
