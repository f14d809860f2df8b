#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace MemoryDuel {
	
	// Fixed pool of workers draining a FIFO of jobs.
	class TaskQueue {
	public:
		explicit TaskQueue(size_t numWorkers = std::thread::hardware_concurrency());
		~TaskQueue();

		TaskQueue(const TaskQueue&) = delete;
		TaskQueue& operator=(const TaskQueue&) = delete;

		void enqueue(std::function<void()> task);

		// Like enqueue, but the caller can wait on the result. Exceptions travel through the future.
		template <typename F>
		auto submit(F&& fn) -> std::future<std::invoke_result_t<F>> {
			using R = std::invoke_result_t<F>;
			auto job = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
			std::future<R> result = job->get_future();
			enqueue([job]() { (*job)(); });
			return result;
		}

		size_t workerCount() const { return workers.size(); }

	private:
		std::vector<std::thread> workers;
		std::queue<std::function<void()>> tasks;

		std::mutex queueMutex;
		std::condition_variable cv;

		bool stop;
		void workerLoop();
	};

}
