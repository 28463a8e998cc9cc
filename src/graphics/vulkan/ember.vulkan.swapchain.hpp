#pragma once

#include <vector>
#include <cstdint>

#include <vulkan/vulkan.h>

#include "src/graphics/ember.graphics.types.hpp"
#include "src/graphics/vulkan/ember.vulkan.device.hpp"

namespace ember::graphics::vulkan {

	class Swapchain {
	public:
		// window_extent 为 0 时不创建，等待下一次 recreate
		Swapchain(const Device& device, VkExtent2D window_extent);
		~Swapchain();

		Swapchain(const Swapchain&) = delete;
		Swapchain& operator=(const Swapchain&) = delete;

		// 返回新的信息；extent 为 0 时旧的交换链已销毁，不会创建新的
		SwapchainInfo recreate(VkExtent2D window_extent);

		VkResult acquire(VkSemaphore image_available, uint64_t timeout_ns, uint32_t& image_index) const;
		VkResult present(VkSemaphore render_finished, uint32_t image_index) const;

		SwapchainInfo info() const;
		bool is_valid() const { return swapchain != VK_NULL_HANDLE; }

		VkSwapchainKHR get() const { return swapchain; }
		const std::vector<VkImage>& images() const { return swapchain_images; }
		const std::vector<VkImageView>& views() const { return image_views; }

	private:
		void create(VkExtent2D window_extent);
		void create_image_views();
		void destroy_image_views();

		const Device& device;
		VkSwapchainKHR swapchain = VK_NULL_HANDLE;
		std::vector<VkImage> swapchain_images;
		std::vector<VkImageView> image_views;
		VkFormat image_format = VK_FORMAT_UNDEFINED;
		VkExtent2D extent = { 0, 0 };
	};

	VkSurfaceFormatKHR choose_swap_surface_format(const std::vector<VkSurfaceFormatKHR>& available_formats);
	VkPresentModeKHR choose_swap_present_mode(const std::vector<VkPresentModeKHR>& available_present_modes);
	VkExtent2D choose_swap_extent(const VkSurfaceCapabilitiesKHR& capabilities, VkExtent2D window_extent);
}
