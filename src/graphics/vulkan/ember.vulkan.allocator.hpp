#pragma once

#include <span>
#include <vector>

#include <vulkan/vulkan.h>

#include "src/graphics/ember.graphics.memory.hpp"
#include "src/graphics/vulkan/ember.vulkan.device.hpp"

namespace ember::graphics::vulkan {

	struct BufferAllocation {
		VkBuffer buffer = VK_NULL_HANDLE;
		Allocation allocation;
	};

	struct ImageAllocation {
		VkImage image = VK_NULL_HANDLE;
		Allocation allocation;
	};

	// 每个 memory type 一块 VkDeviceMemory，资源按区间绑定在上面
	class VulkanAllocator : public Allocator {
	public:
		VulkanAllocator(const Device& device, VkDeviceSize heap_size);
		~VulkanAllocator() override;

		// 分配失败时原生对象已销毁，异常继续上抛
		BufferAllocation create_buffer(const VkBufferCreateInfo& create_info, VkMemoryPropertyFlags required);
		BufferAllocation create_buffer(const VkBufferCreateInfo& create_info, VkMemoryPropertyFlags preferred, VkMemoryPropertyFlags fallback);
		ImageAllocation create_image(const VkImageCreateInfo& create_info, VkMemoryPropertyFlags required);

		void destroy_buffer(const BufferAllocation& buffer);
		void destroy_image(const ImageAllocation& image);

		void log_stats() const;

	protected:
		void write_region(uint32_t heap_index, VkDeviceSize offset, std::span<const uint8_t> bytes) override;

	private:
		VkDevice device;
		std::vector<VkDeviceMemory> heap_memory;
	};
}
