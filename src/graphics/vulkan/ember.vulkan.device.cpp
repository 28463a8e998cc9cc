#include <set>
#include <print>
#include <vector>
#include <cstring>

#include <SDL3/SDL.h>
#include <SDL3/SDL_vulkan.h>

#include "src/graphics/ember.graphics.errors.hpp"
#include "src/graphics/vulkan/ember.vulkan.device.hpp"

namespace ember::graphics::vulkan {

	static const std::vector<const char*> validation_layers = { "VK_LAYER_KHRONOS_validation" };
	static const std::vector<const char*> device_extensions = { VK_KHR_SWAPCHAIN_EXTENSION_NAME };

	// --- Instance ---

	Instance::Instance(const std::string& app_name, bool enable_validation) {
		enable_validation_layers = enable_validation;

		VkApplicationInfo app_info{ VK_STRUCTURE_TYPE_APPLICATION_INFO };
		app_info.pApplicationName = app_name.c_str();
		app_info.pEngineName = "Ember";
		app_info.apiVersion = VK_API_VERSION_1_3;

		VkInstanceCreateInfo create_info{ VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO };
		create_info.pApplicationInfo = &app_info;

		uint32_t count = 0;
		auto extensions = SDL_Vulkan_GetInstanceExtensions(&count);
		if (!extensions) {
			throw ResourceError(Subsystem::Instance, VK_ERROR_EXTENSION_NOT_PRESENT, "SDL could not report the required instance extensions");
		}

		std::vector<const char*> exts(extensions, extensions + count);
		if (enable_validation) exts.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);

		create_info.enabledExtensionCount = static_cast<uint32_t>(exts.size());
		create_info.ppEnabledExtensionNames = exts.data();
		if (enable_validation) {
			create_info.enabledLayerCount = static_cast<uint32_t>(validation_layers.size());
			create_info.ppEnabledLayerNames = validation_layers.data();
		}

		vk_check(vkCreateInstance(&create_info, nullptr, &instance), Subsystem::Instance, "Instance creation failed");

		setup_debug_messenger();
	}

	Instance::~Instance() {
		if (debug_messenger) {
			auto func = (PFN_vkDestroyDebugUtilsMessengerEXT)vkGetInstanceProcAddr(instance, "vkDestroyDebugUtilsMessengerEXT");
			if (func != nullptr) func(instance, debug_messenger, nullptr);
		}
		if (instance) vkDestroyInstance(instance, nullptr);
	}

	void Instance::setup_debug_messenger() {
		if (!enable_validation_layers) return;

		VkDebugUtilsMessengerCreateInfoEXT create_info{ VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT };
		create_info.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_VERBOSE_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
		create_info.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
		create_info.pfnUserCallback = debug_callback;

		auto func = (PFN_vkCreateDebugUtilsMessengerEXT)vkGetInstanceProcAddr(instance, "vkCreateDebugUtilsMessengerEXT");
		VkResult result = func ? func(instance, &create_info, nullptr, &debug_messenger) : VK_ERROR_EXTENSION_NOT_PRESENT;
		vk_check(result, Subsystem::Instance, "Failed to set up debug messenger");
	}

	VKAPI_ATTR VkBool32 VKAPI_CALL Instance::debug_callback(VkDebugUtilsMessageSeverityFlagBitsEXT message_severity, VkDebugUtilsMessageTypeFlagsEXT, const VkDebugUtilsMessengerCallbackDataEXT* callback_data, void*) {
		if (message_severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT) {
			std::println(stderr, "[Validation Layer]: {}", callback_data->pMessage);
		}
		return VK_FALSE;
	}

	// --- Surface ---

	Surface::Surface(const Instance& instance, const platform::Window& window)
		: instance(instance.get()) {
		surface = window.create_surface(this->instance);
	}

	Surface::~Surface() {
		if (surface) vkDestroySurfaceKHR(instance, surface, nullptr);
	}

	// --- Device ---

	Device::Device(const Instance& instance, VkSurfaceKHR surface)
		: vk_surface(surface) {
		pick_physical_device(instance.get());
		create_logical_device();
	}

	Device::~Device() {
		if (device) {
			vkDeviceWaitIdle(device);
			vkDestroyDevice(device, nullptr);
		}
	}

	void Device::wait_idle() const {
		if (device) vk_check(vkDeviceWaitIdle(device), Subsystem::Device, "vkDeviceWaitIdle failed");
	}

	static bool supports_device_extensions(VkPhysicalDevice candidate) {
		uint32_t count = 0;
		vkEnumerateDeviceExtensionProperties(candidate, nullptr, &count, nullptr);
		std::vector<VkExtensionProperties> available(count);
		vkEnumerateDeviceExtensionProperties(candidate, nullptr, &count, available.data());

		for (auto required : device_extensions) {
			bool found = false;
			for (const auto& ext : available) {
				if (std::strcmp(ext.extensionName, required) == 0) {
					found = true;
					break;
				}
			}
			if (!found) return false;
		}
		return true;
	}

	void Device::pick_physical_device(VkInstance instance) {
		uint32_t device_count = 0;
		vkEnumeratePhysicalDevices(instance, &device_count, nullptr);
		if (device_count == 0) {
			throw ResourceError(Subsystem::Device, VK_ERROR_INITIALIZATION_FAILED, "No GPUs with Vulkan support");
		}

		std::vector<VkPhysicalDevice> devices(device_count);
		vkEnumeratePhysicalDevices(instance, &device_count, devices.data());

		VkPhysicalDevice fallback = VK_NULL_HANDLE;
		for (const auto& dev : devices) {
			if (!find_queue_families(dev).is_complete() || !supports_device_extensions(dev)) continue;

			VkPhysicalDeviceProperties props;
			vkGetPhysicalDeviceProperties(dev, &props);
			if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU) {
				physical_device = dev;
				std::println("[Vulkan] Selected Discrete GPU: {}", props.deviceName);
				break;
			}
			if (fallback == VK_NULL_HANDLE) fallback = dev;
		}

		if (physical_device == VK_NULL_HANDLE) {
			if (fallback == VK_NULL_HANDLE) {
				throw ResourceError(Subsystem::Device, VK_ERROR_FEATURE_NOT_PRESENT, "No GPU supports graphics, presentation and swapchains");
			}
			physical_device = fallback;
			std::println("[Vulkan] Warning: Using Integrated/Fallback GPU.");
		}

		vkGetPhysicalDeviceProperties(physical_device, &physical_properties);
		indices = find_queue_families(physical_device);

		VkPhysicalDeviceFeatures supported{};
		vkGetPhysicalDeviceFeatures(physical_device, &supported);
		anisotropy_supported = supported.samplerAnisotropy == VK_TRUE;
	}

	void Device::create_logical_device() {
		std::vector<VkDeviceQueueCreateInfo> queue_infos;
		std::set<uint32_t> unique_families = { indices.graphics_family.value(), indices.present_family.value() };
		float priority = 1.0f;
		for (uint32_t family : unique_families) {
			VkDeviceQueueCreateInfo info{ VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO };
			info.queueFamilyIndex = family;
			info.queueCount = 1;
			info.pQueuePriorities = &priority;
			queue_infos.push_back(info);
		}

		VkPhysicalDeviceFeatures2 device_features2{ VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2 };
		device_features2.features.samplerAnisotropy = anisotropy_supported ? VK_TRUE : VK_FALSE;

		VkDeviceCreateInfo create_info{ VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO };
		create_info.pNext = &device_features2;
		create_info.queueCreateInfoCount = static_cast<uint32_t>(queue_infos.size());
		create_info.pQueueCreateInfos = queue_infos.data();
		create_info.pEnabledFeatures = nullptr;
		create_info.enabledExtensionCount = static_cast<uint32_t>(device_extensions.size());
		create_info.ppEnabledExtensionNames = device_extensions.data();

		VkResult res = vkCreateDevice(physical_device, &create_info, nullptr, &device);
		if (res != VK_SUCCESS) {
			std::println(stderr, "[Vulkan] vkCreateDevice failed with code: {}", (int)res);
			throw ResourceError(Subsystem::Device, res, "Device creation failed");
		}
		std::println("[Vulkan] Logical Device created successfully.");

		vkGetDeviceQueue(device, indices.graphics_family.value(), 0, &graphics);
		vkGetDeviceQueue(device, indices.present_family.value(), 0, &present);
	}

	QueueFamilyIndices Device::find_queue_families(VkPhysicalDevice candidate) const {
		QueueFamilyIndices result;
		uint32_t queue_family_count = 0;
		vkGetPhysicalDeviceQueueFamilyProperties(candidate, &queue_family_count, nullptr);
		std::vector<VkQueueFamilyProperties> queue_families(queue_family_count);
		vkGetPhysicalDeviceQueueFamilyProperties(candidate, &queue_family_count, queue_families.data());

		// compute 和 graphics 共用一个队列
		uint32_t i = 0;
		for (const auto& queue_family : queue_families) {
			if ((queue_family.queueFlags & VK_QUEUE_GRAPHICS_BIT) && (queue_family.queueFlags & VK_QUEUE_COMPUTE_BIT)) {
				result.graphics_family = i;
			}
			VkBool32 present_support = VK_FALSE;
			vkGetPhysicalDeviceSurfaceSupportKHR(candidate, i, vk_surface, &present_support);
			if (present_support) result.present_family = i;
			if (result.is_complete()) break;
			i++;
		}
		return result;
	}

	SwapChainSupportDetails Device::query_swapchain_support() const {
		SwapChainSupportDetails details;
		vk_check(vkGetPhysicalDeviceSurfaceCapabilitiesKHR(physical_device, vk_surface, &details.capabilities),
			Subsystem::Surface, "Failed to query surface capabilities");

		uint32_t format_count = 0;
		vkGetPhysicalDeviceSurfaceFormatsKHR(physical_device, vk_surface, &format_count, nullptr);
		if (format_count != 0) {
			details.formats.resize(format_count);
			vkGetPhysicalDeviceSurfaceFormatsKHR(physical_device, vk_surface, &format_count, details.formats.data());
		}

		uint32_t present_mode_count = 0;
		vkGetPhysicalDeviceSurfacePresentModesKHR(physical_device, vk_surface, &present_mode_count, nullptr);
		if (present_mode_count != 0) {
			details.present_modes.resize(present_mode_count);
			vkGetPhysicalDeviceSurfacePresentModesKHR(physical_device, vk_surface, &present_mode_count, details.present_modes.data());
		}
		return details;
	}
}
