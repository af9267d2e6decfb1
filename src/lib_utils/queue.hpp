#pragma once

#include <condition_variable>
#include <mutex>
#include <queue>

// Blocking multi-producer/multi-consumer queue.
template<typename T>
class Queue {
	public:
		void push(T data) {
			std::lock_guard<std::mutex> lock(mutex);
			dataQueue.push(std::move(data));
			dataAvailable.notify_one();
		}

		T pop() {
			std::unique_lock<std::mutex> lock(mutex);
			dataAvailable.wait(lock, [this]() {
				return !dataQueue.empty();
			});
			T p = std::move(dataQueue.front());
			dataQueue.pop();
			return p;
		}

	private:
		std::mutex mutex;
		std::queue<T> dataQueue;
		std::condition_variable dataAvailable;
};
