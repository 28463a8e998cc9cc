#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include <optional>

#include <vulkan/vulkan.h>

#include "src/platform/ember.platform.hpp"

namespace ember::graphics::vulkan {

	struct QueueFamilyIndices {
		std::optional<uint32_t> graphics_family;
		std::optional<uint32_t> present_family;

		bool is_complete() const { return graphics_family.has_value() && present_family.has_value(); }
	};

	struct SwapChainSupportDetails {
		VkSurfaceCapabilitiesKHR capabilities{};
		std::vector<VkSurfaceFormatKHR> formats;
		std::vector<VkPresentModeKHR> present_modes;
	};

	class Instance {
	public:
		Instance(const std::string& app_name, bool enable_validation);
		~Instance();

		Instance(const Instance&) = delete;
		Instance& operator=(const Instance&) = delete;

		VkInstance get() const { return instance; }
		bool validation_enabled() const { return enable_validation_layers; }

	private:
		void setup_debug_messenger();

		static VKAPI_ATTR VkBool32 VKAPI_CALL debug_callback(
			VkDebugUtilsMessageSeverityFlagBitsEXT message_severity,
			VkDebugUtilsMessageTypeFlagsEXT message_type,
			const VkDebugUtilsMessengerCallbackDataEXT* callback_data,
			void* user_data);

		VkInstance instance = VK_NULL_HANDLE;
		VkDebugUtilsMessengerEXT debug_messenger = VK_NULL_HANDLE;
		bool enable_validation_layers = false;
	};

	class Surface {
	public:
		Surface(const Instance& instance, const platform::Window& window);
		~Surface();

		Surface(const Surface&) = delete;
		Surface& operator=(const Surface&) = delete;

		VkSurfaceKHR get() const { return surface; }

	private:
		VkInstance instance;
		VkSurfaceKHR surface = VK_NULL_HANDLE;
	};

	class Device {
	public:
		Device(const Instance& instance, VkSurfaceKHR surface);
		~Device();

		Device(const Device&) = delete;
		Device& operator=(const Device&) = delete;

		VkDevice get() const { return device; }
		VkPhysicalDevice physical() const { return physical_device; }
		VkSurfaceKHR surface() const { return vk_surface; }

		VkQueue graphics_queue() const { return graphics; }
		VkQueue present_queue() const { return present; }
		const QueueFamilyIndices& queue_families() const { return indices; }

		const VkPhysicalDeviceProperties& properties() const { return physical_properties; }
		bool supports_anisotropy() const { return anisotropy_supported; }

		SwapChainSupportDetails query_swapchain_support() const;

		void wait_idle() const;

	private:
		void pick_physical_device(VkInstance instance);
		void create_logical_device();
		QueueFamilyIndices find_queue_families(VkPhysicalDevice candidate) const;

		VkSurfaceKHR vk_surface;
		VkPhysicalDevice physical_device = VK_NULL_HANDLE;
		VkDevice device = VK_NULL_HANDLE;
		VkQueue graphics = VK_NULL_HANDLE;
		VkQueue present = VK_NULL_HANDLE;
		QueueFamilyIndices indices;
		VkPhysicalDeviceProperties physical_properties{};
		bool anisotropy_supported = false;
	};
}
