#include <print>
#include <filesystem>

#include "src/graphics/ember.graphics.errors.hpp"
#include "src/graphics/vulkan/ember.vulkan.image.hpp"
#include "src/graphics/vulkan/ember.vulkan.context.hpp"

namespace ember::graphics::vulkan {

	Context::Context(const EngineConfig& config, const platform::Window& window)
		: config(config), window(window) {
		instance = std::make_unique<Instance>(config.name, config.enable_validation);
		surface = std::make_unique<Surface>(*instance, window);
		device = std::make_unique<Device>(*instance, surface->get());
		swapchain = std::make_unique<Swapchain>(*device, window.get_extent());
		allocator = std::make_unique<VulkanAllocator>(*device, config.heap_size);
		command_pool = std::make_unique<command::Pool>(*device);

		create_sync_objects();
		create_render_finished_semaphores();

		const Device& shader_device = *device;
		std::filesystem::path shader_dir = config.shader_dir;
		shaders = std::make_unique<ShaderRegistry>([&shader_device, shader_dir](const std::string& path) {
			return Shader::load(shader_device, shader_dir / path);
		});

		wrap_swapchain_images();

		std::println("[Vulkan] Context initialized ({}x{}, {} swapchain images).",
			swapchain->info().extent.width, swapchain->info().extent.height, swapchain->images().size());
	}

	Context::~Context() {
		if (device) device->wait_idle();

		swapchain_images.clear();
		if (shaders) shaders->clear();

		size_t released = releases.flush();
		if (released > 0) {
			std::println("[Vulkan] Flushed {} deferred releases on shutdown.", released);
		}

		if (allocator) allocator->log_stats();

		if (device) {
			destroy_render_finished_semaphores();
			if (image_available) vkDestroySemaphore(device->get(), image_available, nullptr);
			if (in_flight) vkDestroyFence(device->get(), in_flight, nullptr);
		}

		shaders.reset();
		command_pool.reset();
		allocator.reset();
		swapchain.reset();
		device.reset();
		surface.reset();
		instance.reset();
	}

	void Context::create_sync_objects() {
		VkSemaphoreCreateInfo semaphore_info{ VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO };

		// 以 signaled 状态创建，第一帧不会阻塞
		VkFenceCreateInfo fence_info{ VK_STRUCTURE_TYPE_FENCE_CREATE_INFO };
		fence_info.flags = VK_FENCE_CREATE_SIGNALED_BIT;

		vk_check(vkCreateSemaphore(device->get(), &semaphore_info, nullptr, &image_available), Subsystem::Sync, "Failed to create image_available semaphore");
		vk_check(vkCreateFence(device->get(), &fence_info, nullptr, &in_flight), Subsystem::Sync, "Failed to create in-flight fence");
	}

	void Context::create_render_finished_semaphores() {
		VkSemaphoreCreateInfo semaphore_info{ VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO };

		render_finished.assign(swapchain->images().size(), VK_NULL_HANDLE);
		for (auto& semaphore : render_finished) {
			vk_check(vkCreateSemaphore(device->get(), &semaphore_info, nullptr, &semaphore), Subsystem::Sync, "Failed to create render_finished semaphore");
		}
	}

	void Context::destroy_render_finished_semaphores() {
		for (auto semaphore : render_finished) {
			if (semaphore) vkDestroySemaphore(device->get(), semaphore, nullptr);
		}
		render_finished.clear();
	}

	void Context::wrap_swapchain_images() {
		swapchain_images.clear();
		auto info = swapchain->info();
		for (VkImage image : swapchain->images()) {
			swapchain_images.push_back(Image::from_swapchain(*this, image, info.format, info.extent));
		}
	}

	AcquireResult Context::start_frame(uint64_t timeout_ns) {
		VkResult wait_result = vkWaitForFences(device->get(), 1, &in_flight, VK_TRUE, timeout_ns);
		if (wait_result == VK_TIMEOUT) {
			return { AcquireStatus::Timeout, 0 };
		}
		if (wait_result == VK_ERROR_DEVICE_LOST) {
			throw FrameError(FrameErrorKind::DeviceLost, "Device lost while waiting for the in-flight fence");
		}
		vk_check(wait_result, Subsystem::Sync, "Failed to wait for in-flight fence");

		// 上一帧已经完成，command buffer 可以批量回收
		command_pool->clear();

		uint32_t image_index = 0;
		VkResult result = swapchain->acquire(image_available, timeout_ns, image_index);

		// fence 保持 signaled，重建之后的下一帧不会卡住
		if (result == VK_ERROR_OUT_OF_DATE_KHR) {
			return { AcquireStatus::OutOfDate, 0 };
		}
		if (result == VK_TIMEOUT || result == VK_NOT_READY) {
			return { AcquireStatus::Timeout, 0 };
		}
		if (result != VK_SUCCESS && result != VK_SUBOPTIMAL_KHR) {
			throw ResourceError(Subsystem::Swapchain, result, "Failed to acquire swapchain image");
		}

		vk_check(vkResetFences(device->get(), 1, &in_flight), Subsystem::Sync, "Failed to reset in-flight fence");
		frame_submitted = false;

		return { result == VK_SUBOPTIMAL_KHR ? AcquireStatus::Suboptimal : AcquireStatus::Ok, image_index };
	}

	void Context::submit(command::BufferBuilder& cmd, uint32_t image_index) {
		if (cmd.state() != graphics::command::RecordingState::Executable) {
			throw std::logic_error("[Vulkan] Submitted command buffer is not in the executable state");
		}
		if (image_index >= render_finished.size()) {
			throw ResourceError(Subsystem::Sync, VK_ERROR_OUT_OF_DATE_KHR, "No render_finished semaphore for image index");
		}

		VkCommandBuffer command_buffer = cmd.get();
		VkPipelineStageFlags wait_stages[] = { VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT | VK_PIPELINE_STAGE_COMPUTE_SHADER_BIT };
		VkSemaphore signal_semaphores[] = { render_finished[image_index] };

		VkSubmitInfo submit_info{ VK_STRUCTURE_TYPE_SUBMIT_INFO };
		submit_info.waitSemaphoreCount = 1;
		submit_info.pWaitSemaphores = &image_available;
		submit_info.pWaitDstStageMask = wait_stages;
		submit_info.commandBufferCount = 1;
		submit_info.pCommandBuffers = &command_buffer;
		submit_info.signalSemaphoreCount = 1;
		submit_info.pSignalSemaphores = signal_semaphores;

		vk_check(vkQueueSubmit(device->graphics_queue(), 1, &submit_info, in_flight), Subsystem::Command, "Failed to submit draw command buffer");
		frame_submitted = true;
	}

	void Context::abandon_frame() {
		if (frame_submitted) return;

		// 空提交：等待 image_available，signal fence，没有 command buffer
		VkPipelineStageFlags wait_stage = VK_PIPELINE_STAGE_ALL_COMMANDS_BIT;
		VkSubmitInfo submit_info{ VK_STRUCTURE_TYPE_SUBMIT_INFO };
		submit_info.waitSemaphoreCount = 1;
		submit_info.pWaitSemaphores = &image_available;
		submit_info.pWaitDstStageMask = &wait_stage;

		vk_check(vkQueueSubmit(device->graphics_queue(), 1, &submit_info, in_flight), Subsystem::Sync, "Failed to signal in-flight fence for an abandoned frame");
		frame_submitted = true;
		std::println(stderr, "[Vulkan] Frame abandoned after a recording failure; in-flight fence restored");
	}

	SwapchainStatus Context::end_frame(uint32_t image_index) {
		VkResult result = swapchain->present(render_finished[image_index], image_index);

		if (result == VK_ERROR_OUT_OF_DATE_KHR) return SwapchainStatus::OutOfDate;
		if (result == VK_SUBOPTIMAL_KHR) return SwapchainStatus::Suboptimal;
		vk_check(result, Subsystem::Swapchain, "Failed to present swapchain image");
		return SwapchainStatus::Ok;
	}

	void Context::wait_idle() {
		device->wait_idle();
	}

	SwapchainInfo Context::recreate_swapchain() {
		destroy_render_finished_semaphores();
		swapchain_images.clear();

		auto info = swapchain->recreate(window.get_extent());

		create_render_finished_semaphores();
		wrap_swapchain_images();
		return info;
	}

	SwapchainInfo Context::swapchain_info() const {
		return swapchain->info();
	}
}
