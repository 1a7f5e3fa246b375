#pragma once

#include <queue>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <vector>

namespace Skirmish {

	// Worker pool for storage-bound request handling.
	class TaskQueue {
	public:
		explicit TaskQueue(size_t numWorkers = std::thread::hardware_concurrency());
		~TaskQueue();

		TaskQueue(const TaskQueue&) = delete;
		TaskQueue& operator=(const TaskQueue&) = delete;

		// Returns false once shutdown has begun; the task is dropped.
		bool enqueue(std::function<void()> task);

		size_t workerCount() const { return workers.size(); }
		size_t pending() const;

		// Blocks until the queue is empty and no task is running.
		void waitIdle();

	private:
		std::vector<std::thread> workers;
		std::queue<std::function<void()>> tasks;

		mutable std::mutex queueMutex;
		std::condition_variable cv;
		std::condition_variable idleCv;

		size_t running{ 0 };
		bool stop{ false };
		void workerLoop();
	};

}
