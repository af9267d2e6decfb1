#pragma once

#include "queue.hpp"
#include <functional>
#include <string>
#include <thread>
#include <vector>
#include <stdexcept>

// Tasks must not throw: wrap them when failures need to be reported.
class ThreadPool {
	public:
		ThreadPool(const std::string &name = "", int threadCount = std::thread::hardware_concurrency())
			: name(name) {
			if (threadCount < 1)
				threadCount = 1;
			for (int i = 0; i < threadCount; ++i) {
				threads.push_back(std::thread(&ThreadPool::run, this));
			}
		}

		// pending tasks are completed before the workers exit
		~ThreadPool() {
			for(auto& t : threads) {
				(void)t;
				workQueue.push(nullptr);
			}
			for(auto& t : threads) {
				t.join();
			}
		}

		void submit(std::function<void()> f)	{
			if (!f)
				throw std::runtime_error("ThreadPool '" + name + "': can't submit an empty task");

			workQueue.push(f);
		}

	private:
		ThreadPool(const ThreadPool&) = delete;
		ThreadPool& operator= (const ThreadPool&) = delete;

		void run() {
			while (auto task = workQueue.pop()) {
				task();
			}
		}

		Queue<std::function<void(void)>> workQueue;
		std::vector<std::thread> threads;
		std::string name;
};
