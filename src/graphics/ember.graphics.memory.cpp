#include <print>
#include <format>
#include <algorithm>

#include "src/graphics/ember.graphics.memory.hpp"

namespace ember::graphics {

	uint32_t Allocator::add_heap(const HeapDesc& desc) {
		std::lock_guard lock(mutex);
		heaps.push_back({ desc, {} });
		return static_cast<uint32_t>(heaps.size() - 1);
	}

	Allocation Allocator::allocate(const VkMemoryRequirements& requirements, VkMemoryPropertyFlags required) {
		if (requirements.size == 0) {
			throw std::invalid_argument("[Memory] Zero-sized allocation requested");
		}

		std::lock_guard lock(mutex);

		for (uint32_t i = 0; i < heaps.size(); ++i) {
			auto& heap = heaps[i];
			if ((requirements.memoryTypeBits & (1u << heap.desc.memory_type_index)) == 0) continue;
			if ((heap.desc.properties & required) != required) continue;

			// First-Fit：只看第一个兼容的堆，堆满即失败
			auto region = find_region(requirements.size, requirements.alignment, occupied_regions(heap), heap.desc.size);
			if (!region) {
				throw AllocationError(AllocationErrorKind::OutOfRegion,
					std::format("no free region of {} bytes (alignment {}) in heap of memory type {}",
						requirements.size, requirements.alignment, heap.desc.memory_type_index));
			}

			Allocation allocation;
			allocation.id = next_id++;
			allocation.heap_index = i;
			allocation.region = *region;
			heap.allocations.push_back(allocation);
			return allocation;
		}

		throw AllocationError(AllocationErrorKind::NoCompatibleHeap,
			std::format("no heap matches type bits {:#x} with properties {:#x}", requirements.memoryTypeBits, required));
	}

	Allocation Allocator::allocate(const VkMemoryRequirements& requirements, VkMemoryPropertyFlags preferred, VkMemoryPropertyFlags fallback) {
		if (preferred == fallback) return allocate(requirements, preferred);

		try {
			return allocate(requirements, preferred);
		}
		catch (const AllocationError& e) {
			if (e.kind() != AllocationErrorKind::NoCompatibleHeap) throw;
		}

		std::println("[Memory] No heap with properties {:#x}, falling back to {:#x}", preferred, fallback);
		return allocate(requirements, fallback);
	}

	void Allocator::write(const Allocation& allocation, std::span<const uint8_t> bytes, VkDeviceSize limit) {
		std::lock_guard lock(mutex);

		if (allocation.heap_index >= heaps.size()) {
			throw AllocationError(AllocationErrorKind::UnknownAllocation, std::format("heap {} does not exist", allocation.heap_index));
		}

		const auto& allocations = heaps[allocation.heap_index].allocations;
		auto it = std::find_if(allocations.begin(), allocations.end(), [&](const Allocation& a) { return a.id == allocation.id; });
		if (it == allocations.end()) {
			throw AllocationError(AllocationErrorKind::UnknownAllocation, std::format("allocation {} is not live", allocation.id));
		}

		VkDeviceSize capacity = std::min(it->region.size, limit);
		if (bytes.size() > capacity) {
			throw AllocationError(AllocationErrorKind::Overflow,
				std::format("write of {} bytes exceeds capacity of {} bytes", bytes.size(), capacity));
		}

		if (bytes.empty()) return;
		write_region(allocation.heap_index, it->region.offset, bytes);
	}

	void Allocator::free(const Allocation& allocation) {
		std::lock_guard lock(mutex);

		if (allocation.heap_index < heaps.size()) {
			auto& allocations = heaps[allocation.heap_index].allocations;
			auto it = std::find_if(allocations.begin(), allocations.end(), [&](const Allocation& a) { return a.id == allocation.id; });
			if (it != allocations.end()) {
				allocations.erase(it);
				return;
			}
		}

		throw AllocationError(AllocationErrorKind::DoubleFree, std::format("allocation {} was already freed", allocation.id));
	}

	bool Allocator::contains(const Allocation& allocation) const {
		std::lock_guard lock(mutex);
		if (allocation.heap_index >= heaps.size()) return false;

		const auto& allocations = heaps[allocation.heap_index].allocations;
		return std::any_of(allocations.begin(), allocations.end(), [&](const Allocation& a) { return a.id == allocation.id; });
	}

	std::vector<HeapStats> Allocator::stats() const {
		std::lock_guard lock(mutex);

		std::vector<HeapStats> result;
		result.reserve(heaps.size());
		for (const auto& heap : heaps) {
			HeapStats s;
			s.memory_type_index = heap.desc.memory_type_index;
			s.allocation_count = heap.allocations.size();

			VkDeviceSize cursor = 0;
			for (const auto& region : occupied_regions(heap)) {
				s.used += region.size;
				s.largest_free = std::max(s.largest_free, region.offset - cursor);
				cursor = region.end();
			}
			s.largest_free = std::max(s.largest_free, heap.desc.size - cursor);
			result.push_back(s);
		}
		return result;
	}

	std::optional<Region> Allocator::find_region(VkDeviceSize size, VkDeviceSize alignment, std::vector<Region> occupied, VkDeviceSize heap_end) {
		if (size == 0 || size > heap_end) return std::nullopt;

		std::sort(occupied.begin(), occupied.end(), [](const Region& a, const Region& b) { return a.offset < b.offset; });

		// 边界点: 0, [offset, end]..., heap_end  两两成对即为空闲区间
		std::vector<VkDeviceSize> points;
		points.reserve(occupied.size() * 2 + 2);
		points.push_back(0);
		for (const auto& region : occupied) {
			points.push_back(region.offset);
			points.push_back(region.end());
		}
		points.push_back(heap_end);

		for (size_t i = 0; i + 1 < points.size(); i += 2) {
			VkDeviceSize begin = align_up(points[i], alignment);
			VkDeviceSize end = points[i + 1];
			if (begin >= end) continue;

			if (end - begin >= size) {
				return Region{ begin, size };
			}
		}

		return std::nullopt;
	}

	std::vector<Region> Allocator::occupied_regions(const Heap& heap) {
		std::vector<Region> regions;
		regions.reserve(heap.allocations.size());
		for (const auto& allocation : heap.allocations) {
			regions.push_back(allocation.region);
		}
		std::sort(regions.begin(), regions.end(), [](const Region& a, const Region& b) { return a.offset < b.offset; });
		return regions;
	}
}
