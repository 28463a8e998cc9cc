#include <stdexcept>

#include "src/graphics/vulkan/ember.vulkan.buffer.hpp"
#include "src/graphics/vulkan/ember.vulkan.context.hpp"

namespace ember::graphics::vulkan {

	static constexpr VkMemoryPropertyFlags host_memory = VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT;
	// 优先 ReBAR / UMA 的 device local + host visible，没有时退回普通 host 内存
	static constexpr VkMemoryPropertyFlags mapped_device_memory = host_memory | VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT;

	Buffer::Buffer(Context& context, VkDeviceSize size, VkBufferUsageFlags usage)
		: context(context), buffer_size(size) {
		if (size == 0) {
			throw std::invalid_argument("[Buffer] Vulkan does not allow zero-sized buffers");
		}

		VkBufferCreateInfo buffer_info{ VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO };
		buffer_info.size = size;
		buffer_info.usage = usage;
		buffer_info.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

		auto& allocator = context.get_allocator();
		resource = allocator.create_buffer(buffer_info, mapped_device_memory, host_memory);
		memory = DeferredRelease(context.release_queue(), [&allocator, resource = resource]() {
			allocator.destroy_buffer(resource);
		});
	}

	Buffer::Buffer(Context& context, std::span<const uint8_t> data, VkBufferUsageFlags usage)
		: Buffer(context, static_cast<VkDeviceSize>(data.size()), usage) {
		upload(data);
	}

	void Buffer::upload(std::span<const uint8_t> bytes) {
		context.get_allocator().write(resource.allocation, bytes, buffer_size);
	}
}
