#include <print>
#include <cstring>
#include <algorithm>

#include "src/graphics/vulkan/ember.vulkan.allocator.hpp"

namespace ember::graphics::vulkan {

	VulkanAllocator::VulkanAllocator(const Device& device, VkDeviceSize heap_size)
		: device(device.get()) {
		VkPhysicalDeviceMemoryProperties mem_props;
		vkGetPhysicalDeviceMemoryProperties(device.physical(), &mem_props);

		for (uint32_t i = 0; i < mem_props.memoryTypeCount; i++) {
			const auto& type = mem_props.memoryTypes[i];
			if (type.propertyFlags & VK_MEMORY_PROPERTY_PROTECTED_BIT) continue;

			VkDeviceSize size = std::min(heap_size, mem_props.memoryHeaps[type.heapIndex].size);

			VkMemoryAllocateInfo alloc_info{ VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO };
			alloc_info.allocationSize = size;
			alloc_info.memoryTypeIndex = i;

			VkDeviceMemory memory = VK_NULL_HANDLE;
			VkResult result = vkAllocateMemory(this->device, &alloc_info, nullptr, &memory);
			if (result != VK_SUCCESS) {
				// 部分 memory type (如 lazily allocated) 不允许这么大的分配，跳过
				std::println(stderr, "[Memory] Skipping memory type {}: vkAllocateMemory failed ({})", i, static_cast<int>(result));
				continue;
			}

			heap_memory.push_back(memory);
			add_heap({ i, type.propertyFlags, size });
		}

		if (heap_count() == 0) {
			throw ResourceError(Subsystem::Memory, VK_ERROR_OUT_OF_DEVICE_MEMORY, "No device memory heap could be created");
		}
		std::println("[Memory] {} heaps initialized ({} MB each at most)", heap_count(), heap_size / (1024 * 1024));
	}

	VulkanAllocator::~VulkanAllocator() {
		for (auto memory : heap_memory) {
			vkFreeMemory(device, memory, nullptr);
		}
	}

	BufferAllocation VulkanAllocator::create_buffer(const VkBufferCreateInfo& create_info, VkMemoryPropertyFlags required) {
		return create_buffer(create_info, required, required);
	}

	BufferAllocation VulkanAllocator::create_buffer(const VkBufferCreateInfo& create_info, VkMemoryPropertyFlags preferred, VkMemoryPropertyFlags fallback) {
		BufferAllocation result;
		vk_check(vkCreateBuffer(device, &create_info, nullptr, &result.buffer), Subsystem::Buffer, "Failed to create buffer");

		VkMemoryRequirements requirements;
		vkGetBufferMemoryRequirements(device, result.buffer, &requirements);

		try {
			result.allocation = allocate(requirements, preferred, fallback);
		}
		catch (const std::exception&) {
			vkDestroyBuffer(device, result.buffer, nullptr);
			throw;
		}

		VkResult bound = vkBindBufferMemory(device, result.buffer, heap_memory[result.allocation.heap_index], result.allocation.region.offset);
		if (bound != VK_SUCCESS) {
			destroy_buffer(result);
			throw ResourceError(Subsystem::Buffer, bound, "Failed to bind buffer memory");
		}
		return result;
	}

	ImageAllocation VulkanAllocator::create_image(const VkImageCreateInfo& create_info, VkMemoryPropertyFlags required) {
		ImageAllocation result;
		vk_check(vkCreateImage(device, &create_info, nullptr, &result.image), Subsystem::Image, "Failed to create image");

		VkMemoryRequirements requirements;
		vkGetImageMemoryRequirements(device, result.image, &requirements);

		try {
			result.allocation = allocate(requirements, required);
		}
		catch (const std::exception&) {
			vkDestroyImage(device, result.image, nullptr);
			throw;
		}

		VkResult bound = vkBindImageMemory(device, result.image, heap_memory[result.allocation.heap_index], result.allocation.region.offset);
		if (bound != VK_SUCCESS) {
			destroy_image(result);
			throw ResourceError(Subsystem::Image, bound, "Failed to bind image memory");
		}
		return result;
	}

	void VulkanAllocator::destroy_buffer(const BufferAllocation& buffer) {
		if (buffer.buffer) vkDestroyBuffer(device, buffer.buffer, nullptr);
		if (buffer.allocation.is_valid()) free(buffer.allocation);
	}

	void VulkanAllocator::destroy_image(const ImageAllocation& image) {
		if (image.image) vkDestroyImage(device, image.image, nullptr);
		if (image.allocation.is_valid()) free(image.allocation);
	}

	void VulkanAllocator::write_region(uint32_t heap_index, VkDeviceSize offset, std::span<const uint8_t> bytes) {
		if ((heap_desc(heap_index).properties & VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT) == 0) {
			throw ResourceError(Subsystem::Memory, VK_ERROR_MEMORY_MAP_FAILED, "Cannot write to memory that is not host visible");
		}

		void* mapped = nullptr;
		vk_check(vkMapMemory(device, heap_memory[heap_index], offset, bytes.size(), 0, &mapped), Subsystem::Memory, "Failed to map heap memory");
		std::memcpy(mapped, bytes.data(), bytes.size());
		vkUnmapMemory(device, heap_memory[heap_index]);
	}

	void VulkanAllocator::log_stats() const {
		for (const auto& heap : stats()) {
			std::println("[Memory] type {}: {} allocations, {} bytes used, largest free {} bytes",
				heap.memory_type_index, heap.allocation_count, heap.used, heap.largest_free);
		}
	}
}
