#include <print>

#include "src/graphics/ember.graphics.release.hpp"

namespace ember::graphics {

	ReleaseQueue::~ReleaseQueue() {
		if (!entries.empty()) {
			std::println(stderr, "[Release] {} deferred releases were never flushed", entries.size());
		}
	}

	void ReleaseQueue::defer(Release release) {
		std::lock_guard lock(mutex);
		entries.push_back({ frame_serial, std::move(release) });
	}

	void ReleaseQueue::advance() {
		std::lock_guard lock(mutex);
		++frame_serial;
	}

	size_t ReleaseQueue::collect(uint64_t completed_serial) {
		std::deque<Entry> ready;
		{
			std::lock_guard lock(mutex);
			// 序号单调递增，队首即最旧
			while (!entries.empty() && entries.front().serial <= completed_serial) {
				ready.push_back(std::move(entries.front()));
				entries.pop_front();
			}
		}
		return run(ready);
	}

	size_t ReleaseQueue::flush() {
		size_t count = 0;
		while (true) {
			std::deque<Entry> ready;
			{
				std::lock_guard lock(mutex);
				ready.swap(entries);
			}
			if (ready.empty()) break;
			count += run(ready);
		}
		return count;
	}

	uint64_t ReleaseQueue::current_serial() const {
		std::lock_guard lock(mutex);
		return frame_serial;
	}

	size_t ReleaseQueue::pending() const {
		std::lock_guard lock(mutex);
		return entries.size();
	}

	size_t ReleaseQueue::run(std::deque<Entry>& ready) {
		// 锁外执行：release 回调里可能再次 defer (例如 Texture 持有的最后一个 Image)
		size_t count = 0;
		for (auto& entry : ready) {
			entry.release();
			++count;
		}
		return count;
	}

	DeferredRelease& DeferredRelease::operator=(DeferredRelease&& other) {
		if (this != &other) {
			reset();
			queue = std::exchange(other.queue, nullptr);
			release = std::move(other.release);
		}
		return *this;
	}

	void DeferredRelease::reset() {
		if (owns()) {
			queue->defer(std::move(release));
		}
		queue = nullptr;
		release = nullptr;
	}
}
