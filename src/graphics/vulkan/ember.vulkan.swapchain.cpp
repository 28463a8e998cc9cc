#include <limits>
#include <algorithm>

#include "src/graphics/ember.graphics.errors.hpp"
#include "src/graphics/vulkan/ember.vulkan.swapchain.hpp"

namespace ember::graphics::vulkan {

	Swapchain::Swapchain(const Device& device, VkExtent2D window_extent)
		: device(device) {
		create(window_extent);
	}

	Swapchain::~Swapchain() {
		destroy_image_views();
		if (swapchain) vkDestroySwapchainKHR(device.get(), swapchain, nullptr);
	}

	SwapchainInfo Swapchain::recreate(VkExtent2D window_extent) {
		destroy_image_views();
		create(window_extent);
		return info();
	}

	SwapchainInfo Swapchain::info() const {
		SwapchainInfo result;
		if (!swapchain) return result;
		result.extent = extent;
		result.format = image_format;
		result.image_count = static_cast<uint32_t>(swapchain_images.size());
		return result;
	}

	void Swapchain::create(VkExtent2D window_extent) {
		SwapChainSupportDetails support = device.query_swapchain_support();
		VkExtent2D new_extent = choose_swap_extent(support.capabilities, window_extent);

		VkSwapchainKHR old_swapchain = swapchain;
		if (new_extent.width == 0 || new_extent.height == 0) {
			// 最小化：释放旧交换链，保持无效状态
			if (old_swapchain) vkDestroySwapchainKHR(device.get(), old_swapchain, nullptr);
			swapchain = VK_NULL_HANDLE;
			swapchain_images.clear();
			extent = { 0, 0 };
			return;
		}

		if (support.formats.empty() || support.present_modes.empty()) {
			throw ResourceError(Subsystem::Swapchain, VK_ERROR_FORMAT_NOT_SUPPORTED, "Surface reports no formats or present modes");
		}

		VkSurfaceFormatKHR surface_format = choose_swap_surface_format(support.formats);
		VkPresentModeKHR present_mode = choose_swap_present_mode(support.present_modes);

		auto image_count = support.capabilities.minImageCount + 1;
		if (support.capabilities.maxImageCount > 0 && image_count > support.capabilities.maxImageCount) {
			image_count = support.capabilities.maxImageCount;
		}

		VkSwapchainCreateInfoKHR create_info{ VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR };
		create_info.surface = device.surface();
		create_info.minImageCount = image_count;
		create_info.imageFormat = surface_format.format;
		create_info.imageColorSpace = surface_format.colorSpace;
		create_info.imageExtent = new_extent;
		create_info.imageArrayLayers = 1;
		create_info.imageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT; // 允许作为 Blit 目标

		const auto& indices = device.queue_families();
		uint32_t queue_family_indices[] = { indices.graphics_family.value(), indices.present_family.value() };

		if (indices.graphics_family != indices.present_family) {
			create_info.imageSharingMode = VK_SHARING_MODE_CONCURRENT;
			create_info.queueFamilyIndexCount = 2;
			create_info.pQueueFamilyIndices = queue_family_indices;
		}
		else {
			create_info.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
		}

		create_info.preTransform = support.capabilities.currentTransform;
		create_info.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
		create_info.presentMode = present_mode;
		create_info.clipped = VK_TRUE;
		create_info.oldSwapchain = old_swapchain;

		VkSwapchainKHR new_swapchain = VK_NULL_HANDLE;
		VkResult result = vkCreateSwapchainKHR(device.get(), &create_info, nullptr, &new_swapchain);
		if (old_swapchain) vkDestroySwapchainKHR(device.get(), old_swapchain, nullptr);
		swapchain = VK_NULL_HANDLE;
		vk_check(result, Subsystem::Swapchain, "Failed to create swapchain");
		swapchain = new_swapchain;

		vkGetSwapchainImagesKHR(device.get(), swapchain, &image_count, nullptr);
		swapchain_images.resize(image_count);
		vkGetSwapchainImagesKHR(device.get(), swapchain, &image_count, swapchain_images.data());

		image_format = surface_format.format;
		extent = new_extent;

		create_image_views();
	}

	void Swapchain::create_image_views() {
		image_views.resize(swapchain_images.size(), VK_NULL_HANDLE);
		for (size_t i = 0; i < swapchain_images.size(); i++) {
			VkImageViewCreateInfo create_info{ VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO };
			create_info.image = swapchain_images[i];
			create_info.viewType = VK_IMAGE_VIEW_TYPE_2D;
			create_info.format = image_format;
			create_info.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
			create_info.subresourceRange.baseMipLevel = 0;
			create_info.subresourceRange.levelCount = 1;
			create_info.subresourceRange.baseArrayLayer = 0;
			create_info.subresourceRange.layerCount = 1;

			vk_check(vkCreateImageView(device.get(), &create_info, nullptr, &image_views[i]), Subsystem::Swapchain, "Failed to create image views");
		}
	}

	void Swapchain::destroy_image_views() {
		for (auto view : image_views) {
			if (view) vkDestroyImageView(device.get(), view, nullptr);
		}
		image_views.clear();
	}

	VkResult Swapchain::acquire(VkSemaphore image_available, uint64_t timeout_ns, uint32_t& image_index) const {
		if (!swapchain) return VK_ERROR_OUT_OF_DATE_KHR;
		return vkAcquireNextImageKHR(device.get(), swapchain, timeout_ns, image_available, VK_NULL_HANDLE, &image_index);
	}

	VkResult Swapchain::present(VkSemaphore render_finished, uint32_t image_index) const {
		VkPresentInfoKHR present_info{ VK_STRUCTURE_TYPE_PRESENT_INFO_KHR };
		present_info.waitSemaphoreCount = 1;
		present_info.pWaitSemaphores = &render_finished;
		present_info.swapchainCount = 1;
		present_info.pSwapchains = &swapchain;
		present_info.pImageIndices = &image_index;

		return vkQueuePresentKHR(device.present_queue(), &present_info);
	}

	VkSurfaceFormatKHR choose_swap_surface_format(const std::vector<VkSurfaceFormatKHR>& available_formats) {
		for (const auto& available_format : available_formats) {
			if (available_format.format == VK_FORMAT_B8G8R8A8_SRGB && available_format.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR) {
				return available_format;
			}
		}
		return available_formats[0];
	}

	VkPresentModeKHR choose_swap_present_mode(const std::vector<VkPresentModeKHR>& available_present_modes) {
		for (const auto& available_present_mode : available_present_modes) {
			if (available_present_mode == VK_PRESENT_MODE_MAILBOX_KHR) return available_present_mode;
		}
		return VK_PRESENT_MODE_FIFO_KHR;
	}

	VkExtent2D choose_swap_extent(const VkSurfaceCapabilitiesKHR& capabilities, VkExtent2D window_extent) {
		if (capabilities.currentExtent.width != std::numeric_limits<uint32_t>::max()) {
			return capabilities.currentExtent;
		}
		if (window_extent.width == 0 || window_extent.height == 0) {
			return { 0, 0 };
		}

		VkExtent2D actual_extent = window_extent;
		actual_extent.width = std::clamp(actual_extent.width, capabilities.minImageExtent.width, capabilities.maxImageExtent.width);
		actual_extent.height = std::clamp(actual_extent.height, capabilities.minImageExtent.height, capabilities.maxImageExtent.height);
		return actual_extent;
	}
}
