#pragma once

#include <mutex>
#include <span>
#include <vector>
#include <cstdint>
#include <optional>

#include <vulkan/vulkan.h>

#include "src/graphics/ember.graphics.types.hpp"
#include "src/graphics/ember.graphics.errors.hpp"

namespace ember::graphics {

	struct HeapDesc {
		uint32_t memory_type_index = 0;
		VkMemoryPropertyFlags properties = 0;
		VkDeviceSize size = 0;
	};

	struct HeapStats {
		uint32_t memory_type_index = 0;
		size_t allocation_count = 0;
		VkDeviceSize used = 0;
		VkDeviceSize largest_free = 0;
	};

	// 固定大小堆 + First-Fit 子分配
	// 只负责区间簿记，真正的显存读写交给子类 (write_region)
	class Allocator {
	public:
		virtual ~Allocator() = default;

		Allocator(const Allocator&) = delete;
		Allocator& operator=(const Allocator&) = delete;

		// 选第一个 type 位兼容且包含 required 属性的堆，在堆内找空闲区间
		Allocation allocate(const VkMemoryRequirements& requirements, VkMemoryPropertyFlags required);

		// 没有带 preferred 属性的堆时再按 fallback 分配一次
		// preferred 堆已满 (OutOfRegion) 不会回退
		Allocation allocate(const VkMemoryRequirements& requirements, VkMemoryPropertyFlags preferred, VkMemoryPropertyFlags fallback);

		// 上限取区间大小与 limit 中较小者，超出抛出 Overflow 且不写入
		// limit 用于资源的逻辑大小 (驱动给出的 requirements.size 通常向上取整)
		void write(const Allocation& allocation, std::span<const uint8_t> bytes, VkDeviceSize limit = VK_WHOLE_SIZE);

		void free(const Allocation& allocation);

		bool contains(const Allocation& allocation) const;

		std::vector<HeapStats> stats() const;

		size_t heap_count() const { return heaps.size(); }
		const HeapDesc& heap_desc(uint32_t heap_index) const { return heaps.at(heap_index).desc; }

		static std::optional<Region> find_region(VkDeviceSize size, VkDeviceSize alignment, std::vector<Region> occupied, VkDeviceSize heap_end);

		static VkDeviceSize align_up(VkDeviceSize offset, VkDeviceSize alignment) {
			if (alignment <= 1) return offset;
			return (offset + alignment - 1) / alignment * alignment;
		}

	protected:
		Allocator() = default;

		uint32_t add_heap(const HeapDesc& desc);

		virtual void write_region(uint32_t heap_index, VkDeviceSize offset, std::span<const uint8_t> bytes) = 0;

	private:
		struct Heap {
			HeapDesc desc;
			std::vector<Allocation> allocations;
		};

		static std::vector<Region> occupied_regions(const Heap& heap);

		std::vector<Heap> heaps;
		uint64_t next_id = 1;
		mutable std::mutex mutex;
	};
}
