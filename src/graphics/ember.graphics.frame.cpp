#include <print>
#include <ranges>

#include "src/graphics/ember.graphics.errors.hpp"
#include "src/graphics/ember.graphics.frame.hpp"

namespace ember::graphics {

	FrameController::FrameController(FrameBackend& backend, uint64_t fence_timeout_ms)
		: backend(backend), fence_timeout_ns(fence_timeout_ms * 1'000'000ull) {
	}

	void FrameController::add_dependent(SwapchainDependent& dependent) {
		auto& entry = dependents.emplace_back(Dependent{ &dependent, false });

		auto info = backend.swapchain_info();
		if (!recreate_pending && info.is_renderable()) {
			dependent.create_swapchain_resources(info);
			entry.live = true;
		}
		else {
			recreate_pending = true;
		}
	}

	FrameStatus FrameController::run_frame(const RecordFn& record) {
		bool recreated = false;
		if (recreate_pending) {
			if (!recreate_swapchain()) {
				return FrameStatus::Deferred;
			}
			recreated = true;
		}

		auto acquired = backend.start_frame(fence_timeout_ns);
		if (acquired.status == AcquireStatus::Timeout) {
			throw FrameError(FrameErrorKind::FenceTimeout,
				std::format("in-flight fence not signalled within {} ms", fence_timeout_ns / 1'000'000ull));
		}

		// fence 已 signal，之前所有帧的延迟销毁都可以执行
		auto& releases = backend.release_queue();
		releases.collect(releases.current_serial() - 1);

		if (acquired.status == AcquireStatus::OutOfDate) {
			return recreate_swapchain() ? FrameStatus::SwapchainRecreated : FrameStatus::Deferred;
		}

		try {
			record(acquired.image_index);
		}
		catch (...) {
			// start_frame 已经 reset 了 fence，不恢复的话下一帧只能等到超时
			backend.abandon_frame();
			releases.advance();
			throw;
		}
		releases.advance();
		++submitted;

		auto presented = backend.end_frame(acquired.image_index);
		if (acquired.status == AcquireStatus::Suboptimal || presented != SwapchainStatus::Ok) {
			recreate_swapchain();
			return FrameStatus::SwapchainRecreated;
		}

		return recreated ? FrameStatus::SwapchainRecreated : FrameStatus::Rendered;
	}

	bool FrameController::recreate_swapchain() {
		backend.wait_idle();
		release_dependents();
		backend.release_queue().flush();

		auto info = backend.recreate_swapchain();
		if (!info.is_renderable()) {
			if (!recreate_pending) {
				std::println("[Frame] Swapchain extent is zero, deferring recreation");
			}
			recreate_pending = true;
			return false;
		}

		for (auto& entry : dependents) {
			if (!entry.live) {
				entry.object->create_swapchain_resources(info);
				entry.live = true;
			}
		}

		recreate_pending = false;
		std::println("[Frame] Swapchain recreated: {}x{}, {} images", info.extent.width, info.extent.height, info.image_count);
		return true;
	}

	void FrameController::shutdown() {
		backend.wait_idle();
		release_dependents();
		backend.release_queue().flush();
	}

	void FrameController::release_dependents() {
		for (auto& entry : dependents | std::views::reverse) {
			if (entry.live) {
				entry.object->release_swapchain_resources();
				entry.live = false;
			}
		}
	}
}
