#include "src/graphics/ember.graphics.errors.hpp"
#include "src/graphics/ember.graphics.descriptors.hpp"
#include "src/graphics/vulkan/ember.vulkan.image.hpp"
#include "src/graphics/vulkan/ember.vulkan.buffer.hpp"
#include "src/graphics/vulkan/ember.vulkan.descriptors.hpp"

namespace ember::graphics::vulkan {

	// --- SetLayout ---

	SetLayout::~SetLayout() {
		if (layout) vkDestroyDescriptorSetLayout(device, layout, nullptr);
	}

	VkDescriptorType SetLayout::binding_type(uint32_t binding) const {
		return graphics::binding_type(bindings, binding);
	}

	// --- SetLayoutBuilder ---

	SetLayoutBuilder& SetLayoutBuilder::add(VkDescriptorType type) {
		bindings.push_back(type);
		return *this;
	}

	std::shared_ptr<SetLayout> SetLayoutBuilder::build() const {
		std::vector<VkDescriptorSetLayoutBinding> vk_bindings;
		vk_bindings.reserve(bindings.size());

		for (uint32_t i = 0; i < bindings.size(); ++i) {
			VkDescriptorSetLayoutBinding bind{};
			bind.binding = i;
			bind.descriptorCount = 1;
			bind.descriptorType = bindings[i];
			bind.stageFlags = VK_SHADER_STAGE_ALL;
			vk_bindings.push_back(bind);
		}

		VkDescriptorSetLayoutCreateInfo info{ VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO };
		info.pBindings = vk_bindings.data();
		info.bindingCount = static_cast<uint32_t>(vk_bindings.size());

		VkDescriptorSetLayout layout = VK_NULL_HANDLE;
		vk_check(vkCreateDescriptorSetLayout(device, &info, nullptr, &layout), Subsystem::Descriptor, "Failed to create descriptor set layout");
		return std::make_shared<SetLayout>(device, layout, bindings);
	}

	// --- Set ---

	void Set::update_buffer(uint32_t binding, const Buffer& buffer) const {
		VkDescriptorBufferInfo buffer_info{
			.buffer = buffer.get(),
			.offset = 0,
			.range = buffer.size()
		};

		VkWriteDescriptorSet write{
			.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET,
			.dstSet = set,
			.dstBinding = binding,
			.descriptorCount = 1,
			.descriptorType = layout->binding_type(binding),
			.pBufferInfo = &buffer_info
		};

		vkUpdateDescriptorSets(device, 1, &write, 0, nullptr);
	}

	void Set::update_texture(uint32_t binding, const Texture& texture, VkImageLayout image_layout) const {
		VkDescriptorType type = layout->binding_type(binding);

		VkDescriptorImageInfo image_info{
			.sampler = texture.get_sampler(),
			.imageView = texture.get_view(),
			.imageLayout = type == VK_DESCRIPTOR_TYPE_STORAGE_IMAGE ? VK_IMAGE_LAYOUT_GENERAL : image_layout
		};

		VkWriteDescriptorSet write{
			.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET,
			.dstSet = set,
			.dstBinding = binding,
			.descriptorCount = 1,
			.descriptorType = type,
			.pImageInfo = &image_info
		};

		vkUpdateDescriptorSets(device, 1, &write, 0, nullptr);
	}

	// --- Pool ---

	Pool::Pool(const Device& device, std::shared_ptr<SetLayout> layout, uint32_t capacity)
		: device(device.get()), layout(std::move(layout)), budget(capacity) {
		auto sizes = descriptor_pool_sizes(this->layout->get_bindings(), capacity);

		VkDescriptorPoolCreateInfo info{ VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO };
		info.maxSets = capacity;
		info.poolSizeCount = static_cast<uint32_t>(sizes.size());
		info.pPoolSizes = sizes.data();

		vk_check(vkCreateDescriptorPool(this->device, &info, nullptr, &pool), Subsystem::Descriptor, "Failed to create descriptor pool");
	}

	Pool::~Pool() {
		if (pool) vkDestroyDescriptorPool(device, pool, nullptr);
	}

	Set Pool::allocate() {
		budget.require_available();

		VkDescriptorSetLayout vk_layout = layout->get();
		VkDescriptorSetAllocateInfo alloc_info{ VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO };
		alloc_info.descriptorPool = pool;
		alloc_info.descriptorSetCount = 1;
		alloc_info.pSetLayouts = &vk_layout;

		VkDescriptorSet set = VK_NULL_HANDLE;
		vk_check(vkAllocateDescriptorSets(device, &alloc_info, &set), Subsystem::Descriptor, "Failed to allocate descriptor set");
		budget.consume();

		return Set(device, set, layout);
	}
}
