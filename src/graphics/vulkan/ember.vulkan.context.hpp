#pragma once

#include <memory>
#include <vector>

#include <vulkan/vulkan.h>

#include "src/graphics/ember.graphics.types.hpp"
#include "src/graphics/ember.graphics.frame.hpp"
#include "src/graphics/ember.graphics.release.hpp"
#include "src/graphics/ember.graphics.registry.hpp"
#include "src/platform/ember.platform.hpp"

#include "src/graphics/vulkan/ember.vulkan.device.hpp"
#include "src/graphics/vulkan/ember.vulkan.command.hpp"
#include "src/graphics/vulkan/ember.vulkan.pipeline.hpp"
#include "src/graphics/vulkan/ember.vulkan.allocator.hpp"
#include "src/graphics/vulkan/ember.vulkan.swapchain.hpp"

namespace ember::graphics::vulkan {

	class Image;

	using ShaderRegistry = Registry<Shader>;

	// 设备、交换链、同步对象和资源子系统的所有者
	// 单帧 in-flight：一个 fence，一个 image_available，每张交换链图像一个 render_finished
	class Context : public FrameBackend {
	public:
		Context(const EngineConfig& config, const platform::Window& window);
		~Context() override;

		Context(const Context&) = delete;
		Context& operator=(const Context&) = delete;

		// FrameBackend
		AcquireResult start_frame(uint64_t timeout_ns) override;
		SwapchainStatus end_frame(uint32_t image_index) override;
		void abandon_frame() override;
		void wait_idle() override;
		SwapchainInfo recreate_swapchain() override;
		SwapchainInfo swapchain_info() const override;
		ReleaseQueue& release_queue() override { return releases; }

		// 等待 image_available，signal render_finished 和 in-flight fence
		void submit(command::BufferBuilder& cmd, uint32_t image_index);

		const Device& get_device() const { return *device; }
		VulkanAllocator& get_allocator() { return *allocator; }
		command::Pool& get_command_pool() { return *command_pool; }
		const Swapchain& get_swapchain() const { return *swapchain; }
		ShaderRegistry& get_shaders() { return *shaders; }
		const EngineConfig& get_config() const { return config; }

	private:
		void create_sync_objects();
		void create_render_finished_semaphores();
		void destroy_render_finished_semaphores();
		void wrap_swapchain_images();

		EngineConfig config;
		const platform::Window& window;

		std::unique_ptr<Instance> instance;
		std::unique_ptr<Surface> surface;
		std::unique_ptr<Device> device;
		std::unique_ptr<Swapchain> swapchain;
		std::unique_ptr<VulkanAllocator> allocator;
		std::unique_ptr<command::Pool> command_pool;
		std::unique_ptr<ShaderRegistry> shaders;
		std::vector<std::unique_ptr<Image>> swapchain_images;

		ReleaseQueue releases;

		VkSemaphore image_available = VK_NULL_HANDLE;
		std::vector<VkSemaphore> render_finished;
		VkFence in_flight = VK_NULL_HANDLE;
		// fence reset 之后是否已有一次 submit 会 signal 它
		bool frame_submitted = true;
	};
}
