#include "tests/tests.hpp"
#include "lib_utils/queue.hpp"
#include "lib_utils/threadpool.hpp"
#include <atomic>
#include <thread>

using namespace Tests;

namespace {

unittest("thread-safe queue keeps insertion order") {
	Queue<int> queue;
	queue.push(1);
	queue.push(2);
	ASSERT_EQUALS(1, queue.pop());
	queue.push(3);
	ASSERT_EQUALS(2, queue.pop());
	ASSERT_EQUALS(3, queue.pop());
}

unittest("thread-safe queue: pop() blocks until a push") {
	Queue<int> queue;
	auto f = [&]() {
		auto data = queue.pop();
		ASSERT_EQUALS(7, data);
	};
	std::thread tf(f);
	queue.push(7);
	tf.join();
}

unittest("thread pool: pending tasks complete before destruction") {
	std::atomic<int> count(0);
	{
		ThreadPool pool("test", 3);
		for(int i = 0; i < 50; ++i)
			pool.submit([&]() {
				++count;
			});
	}
	ASSERT_EQUALS(50, count.load());
}

unittest("thread pool: empty task") {
	ThreadPool pool("test", 1);
	ASSERT_THROWN(pool.submit(nullptr));
}

}
