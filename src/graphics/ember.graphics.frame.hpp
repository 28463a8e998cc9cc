#pragma once

#include <vector>
#include <cstdint>
#include <functional>

#include "src/graphics/ember.graphics.types.hpp"
#include "src/graphics/ember.graphics.release.hpp"

namespace ember::graphics {

	enum class AcquireStatus {
		Ok,
		Suboptimal,
		OutOfDate,
		Timeout,      // in-flight fence 在超时内没有 signal
	};

	struct AcquireResult {
		AcquireStatus status = AcquireStatus::Ok;
		uint32_t image_index = 0;
	};

	// 帧循环对设备的全部需求，Context 实现
	class FrameBackend {
	public:
		virtual ~FrameBackend() = default;

		// 等 fence -> acquire -> 成功时 reset fence
		virtual AcquireResult start_frame(uint64_t timeout_ns) = 0;
		virtual SwapchainStatus end_frame(uint32_t image_index) = 0;

		// 录制失败时调用：不提交命令，只消耗 image_available 并让 fence 重新 signal
		// 本帧已经提交过时什么也不做
		virtual void abandon_frame() = 0;

		virtual void wait_idle() = 0;

		// extent 为 0 时只返回信息，不创建
		virtual SwapchainInfo recreate_swapchain() = 0;
		virtual SwapchainInfo swapchain_info() const = 0;

		virtual ReleaseQueue& release_queue() = 0;
	};

	// framebuffer、烘焙了 viewport 的 pipeline 等随交换链重建的对象
	class SwapchainDependent {
	public:
		virtual ~SwapchainDependent() = default;
		virtual void release_swapchain_resources() = 0;
		virtual void create_swapchain_resources(const SwapchainInfo& info) = 0;
	};

	class FrameController {
	public:
		using RecordFn = std::function<void(uint32_t image_index)>;

		FrameController(FrameBackend& backend, uint64_t fence_timeout_ms);

		FrameController(const FrameController&) = delete;
		FrameController& operator=(const FrameController&) = delete;

		// 按注册顺序创建，逆序释放
		void add_dependent(SwapchainDependent& dependent);

		// record 负责录制并提交，image_index 为本帧 acquire 到的图像
		FrameStatus run_frame(const RecordFn& record);

		// 返回 false 表示 extent 为 0，依赖对象保持释放状态，下一帧重试
		bool recreate_swapchain();

		void request_recreate() { recreate_pending = true; }
		bool is_recreate_pending() const { return recreate_pending; }

		// 等待 GPU 空闲，释放所有依赖对象并清空延迟销毁队列
		void shutdown();

		uint64_t frames_submitted() const { return submitted; }

	private:
		struct Dependent {
			SwapchainDependent* object = nullptr;
			bool live = false;
		};

		void release_dependents();

		FrameBackend& backend;
		uint64_t fence_timeout_ns;
		std::vector<Dependent> dependents;
		bool recreate_pending = false;
		uint64_t submitted = 0;
	};
}
