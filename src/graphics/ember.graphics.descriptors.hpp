#pragma once

#include <span>
#include <vector>
#include <cstdint>

#include <vulkan/vulkan.h>

namespace ember::graphics {

	// 按 layout 中各类型的数量 * capacity 统计池大小，顺序为各类型首次出现的顺序
	std::vector<VkDescriptorPoolSize> descriptor_pool_sizes(std::span<const VkDescriptorType> types, uint32_t capacity);

	// 越界抛出 ResourceError(Descriptor)
	VkDescriptorType binding_type(std::span<const VkDescriptorType> bindings, uint32_t binding);

	// 池里已分配的 set 数量，达到 capacity 后拒绝
	class DescriptorBudget {
	public:
		explicit DescriptorBudget(uint32_t capacity);

		// 满了抛出 ResourceError(VK_ERROR_OUT_OF_POOL_MEMORY)，不改变计数
		void require_available() const;

		// 分配成功之后调用
		void consume();

		uint32_t capacity() const { return max_sets; }
		uint32_t allocated() const { return used; }

	private:
		uint32_t max_sets;
		uint32_t used = 0;
	};
}
