#pragma once

#include <memory>
#include <vector>
#include <cstdint>

#include <vulkan/vulkan.h>

#include "src/graphics/ember.graphics.descriptors.hpp"
#include "src/graphics/vulkan/ember.vulkan.device.hpp"

namespace ember::graphics::vulkan {

	class Buffer;
	class Texture;

	class SetLayout {
	public:
		SetLayout(VkDevice device, VkDescriptorSetLayout layout, std::vector<VkDescriptorType> bindings)
			: device(device), layout(layout), bindings(std::move(bindings)) {
		}
		~SetLayout();

		SetLayout(const SetLayout&) = delete;
		SetLayout& operator=(const SetLayout&) = delete;

		VkDescriptorSetLayout get() const { return layout; }
		const std::vector<VkDescriptorType>& get_bindings() const { return bindings; }

		// 越界抛出 ResourceError
		VkDescriptorType binding_type(uint32_t binding) const;

	private:
		VkDevice device;
		VkDescriptorSetLayout layout;
		std::vector<VkDescriptorType> bindings;
	};

	// binding 按 add 的顺序从 0 连续编号，所有 stage 可见
	class SetLayoutBuilder {
	public:
		explicit SetLayoutBuilder(const Device& device) : device(device.get()) {}

		SetLayoutBuilder& add(VkDescriptorType type);

		std::shared_ptr<SetLayout> build() const;

	private:
		VkDevice device;
		std::vector<VkDescriptorType> bindings;
	};

	// 可变的绑定表，每次 update 立即写入一个槽位
	class Set {
	public:
		Set(VkDevice device, VkDescriptorSet set, std::shared_ptr<SetLayout> layout)
			: device(device), set(set), layout(std::move(layout)) {
		}

		void update_buffer(uint32_t binding, const Buffer& buffer) const;

		// storage image 使用 GENERAL，combined image sampler 使用传入的 layout
		void update_texture(uint32_t binding, const Texture& texture, VkImageLayout image_layout) const;

		VkDescriptorSet get() const { return set; }
		const SetLayout& get_layout() const { return *layout; }

	private:
		VkDevice device;
		VkDescriptorSet set;
		std::shared_ptr<SetLayout> layout;
	};

	// 固定容量，只为一个 SetLayout 分配
	class Pool {
	public:
		Pool(const Device& device, std::shared_ptr<SetLayout> layout, uint32_t capacity);
		~Pool();

		Pool(const Pool&) = delete;
		Pool& operator=(const Pool&) = delete;

		// 超出容量时抛出 ResourceError
		Set allocate();

		uint32_t get_capacity() const { return budget.capacity(); }
		uint32_t get_allocated() const { return budget.allocated(); }

	private:
		VkDevice device;
		VkDescriptorPool pool = VK_NULL_HANDLE;
		std::shared_ptr<SetLayout> layout;
		DescriptorBudget budget;
	};
}
