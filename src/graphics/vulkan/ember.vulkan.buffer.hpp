#pragma once

#include <span>
#include <cstdint>

#include <vulkan/vulkan.h>

#include "src/graphics/ember.graphics.types.hpp"
#include "src/graphics/ember.graphics.release.hpp"
#include "src/graphics/vulkan/ember.vulkan.allocator.hpp"

namespace ember::graphics::vulkan {

	class Context;

	// 拥有一个 Allocation，所有写入都经过分配器
	// 析构时句柄与区间交给 release queue，等 GPU 用完再释放
	class Buffer {
	public:
		Buffer(Context& context, std::span<const uint8_t> data, VkBufferUsageFlags usage);
		Buffer(Context& context, VkDeviceSize size, VkBufferUsageFlags usage);

		Buffer(const Buffer&) = delete;
		Buffer& operator=(const Buffer&) = delete;

		// bytes.size() 超出缓冲大小时抛出 AllocationError(Overflow)
		void upload(std::span<const uint8_t> bytes);

		template <typename T>
		void upload_value(const T& value) {
			upload(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(&value), sizeof(T)));
		}

		VkBuffer get() const { return resource.buffer; }
		VkDeviceSize size() const { return buffer_size; }
		const Allocation& allocation() const { return resource.allocation; }

	private:
		Context& context;
		BufferAllocation resource;
		VkDeviceSize buffer_size = 0;
		DeferredRelease memory;
	};
}
