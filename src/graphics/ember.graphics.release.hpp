#pragma once

#include <deque>
#include <mutex>
#include <cstdint>
#include <utility>
#include <functional>

namespace ember::graphics {

	// 延迟销毁队列
	// GPU 可能仍在读取的对象不能立即销毁，按提交帧序号挂起，等 fence 确认完成后再执行
	class ReleaseQueue {
	public:
		using Release = std::function<void()>;

		ReleaseQueue() = default;
		~ReleaseQueue();

		ReleaseQueue(const ReleaseQueue&) = delete;
		ReleaseQueue& operator=(const ReleaseQueue&) = delete;

		// 以当前打开的帧序号标记
		void defer(Release release);

		// 当前帧已提交，之后的 defer 归属下一帧
		void advance();

		// 执行所有序号 <= completed_serial 的销毁，返回执行数量
		size_t collect(uint64_t completed_serial);

		// device idle 之后调用：全部执行，包括执行过程中新挂起的
		size_t flush();

		uint64_t current_serial() const;
		size_t pending() const;

	private:
		struct Entry {
			uint64_t serial;
			Release release;
		};

		size_t run(std::deque<Entry>& ready);

		std::deque<Entry> entries;
		uint64_t frame_serial = 1;
		mutable std::mutex mutex;
	};

	// 拥有一个销毁回调，析构时交给 ReleaseQueue
	// 默认构造的实例什么也不拥有 (借用的资源，如交换链图像)
	class DeferredRelease {
	public:
		DeferredRelease() = default;
		DeferredRelease(ReleaseQueue& queue, ReleaseQueue::Release release)
			: queue(&queue), release(std::move(release)) {
		}
		~DeferredRelease() { reset(); }

		DeferredRelease(DeferredRelease&& other) noexcept
			: queue(std::exchange(other.queue, nullptr)), release(std::move(other.release)) {
		}
		DeferredRelease& operator=(DeferredRelease&& other);

		DeferredRelease(const DeferredRelease&) = delete;
		DeferredRelease& operator=(const DeferredRelease&) = delete;

		// 立即挂到当前帧，之后不再拥有
		void reset();

		bool owns() const { return queue != nullptr && static_cast<bool>(release); }

	private:
		ReleaseQueue* queue = nullptr;
		ReleaseQueue::Release release;
	};
}
