#include "TaskQueue.hpp"
#include "Log.hpp"

namespace Skirmish {

	TaskQueue::TaskQueue(size_t numWorkers) {
		size_t threadsToCreate = numWorkers > 0 ? numWorkers : 1;

		for (size_t i = 0; i < threadsToCreate; ++i) {
			workers.emplace_back(&TaskQueue::workerLoop, this);
		}

		Log::log("[TaskQueue] Started {} workers", threadsToCreate);
	}

	TaskQueue::~TaskQueue() {
		{
			std::unique_lock<std::mutex> lock(queueMutex);
			stop = true;
		}
		cv.notify_all();
		for (auto& worker : workers) {
			if (worker.joinable()) {
				worker.join();
			}
		}
	}

	bool TaskQueue::enqueue(std::function<void()> task) {
		{
			std::unique_lock<std::mutex> lock(queueMutex);
			if (stop) {
				return false;
			}
			tasks.push(std::move(task));
		}
		cv.notify_one();
		return true;
	}

	size_t TaskQueue::pending() const {
		std::unique_lock<std::mutex> lock(queueMutex);
		return tasks.size();
	}

	void TaskQueue::waitIdle() {
		std::unique_lock<std::mutex> lock(queueMutex);
		idleCv.wait(lock, [this]() { return tasks.empty() && running == 0; });
	}

	void TaskQueue::workerLoop() {
		while (true) {
			std::function<void()> task;
			{
				std::unique_lock<std::mutex> lock(queueMutex);
				cv.wait(lock, [this]() { return stop || !tasks.empty(); });
				if (stop && tasks.empty()) {
					return;
				}
				task = std::move(tasks.front());
				tasks.pop();
				++running;
			}
			try {
				task();
			}
			catch (const std::exception& e) {
				Log::log("[TaskQueue] Exception in task: {}", e.what());
			}
			catch (...) {
				Log::log("[TaskQueue] Unknown exception in task");
			}
			{
				std::unique_lock<std::mutex> lock(queueMutex);
				--running;
				if (tasks.empty() && running == 0) {
					idleCv.notify_all();
				}
			}
		}
	}
}
