#pragma once

#include <vector>

#include <vulkan/vulkan.h>

#include "src/graphics/ember.graphics.command.hpp"
#include "src/graphics/vulkan/ember.vulkan.device.hpp"

namespace ember::graphics::vulkan::command {

	class BufferBuilder final : public graphics::command::Recorder {
	public:
		explicit BufferBuilder(VkCommandBuffer command_buffer)
			: command_buffer(command_buffer) {
		}

		VkCommandBuffer get() const { return command_buffer; }

		// 一次性提交：提交后等待队列空闲
		void submit(VkQueue queue);

	protected:
		void record_begin() override;
		void record_end() override;
		void record_begin_renderpass(const graphics::command::RenderPassBeginInfo& info) override;
		void record_next_subpass() override;
		void record_end_renderpass() override;
		void record_bind_pipeline(const PipelineBinding& pipeline) override;
		void record_bind_descriptor_set(const PipelineBinding& pipeline, uint32_t index, VkDescriptorSet set) override;
		void record_bind_vertex_buffer(VkBuffer buffer) override;
		void record_bind_index_buffer(VkBuffer buffer) override;
		void record_draw(const DrawOptions& options) override;
		void record_dispatch(uint32_t x, uint32_t y, uint32_t z) override;
		void record_copy_buffer_to_image(VkBuffer buffer, const ImageRef& image) override;
		void record_copy_image(const ImageRef& src, const ImageRef& dst) override;
		void record_blit_image(const ImageRef& src, const ImageRef& dst, VkFilter filter) override;
		void record_transition(const ImageRef& image, const TransitionLayoutOptions& options) override;

	private:
		VkCommandBuffer command_buffer;
	};

	class Pool {
	public:
		explicit Pool(const Device& device);
		~Pool();

		Pool(const Pool&) = delete;
		Pool& operator=(const Pool&) = delete;

		BufferBuilder allocate();

		// 批量释放之前分配的所有 command buffer，每帧 fence 之后调用一次
		void clear();

		size_t allocated_count() const { return allocated.size(); }

	private:
		VkDevice device;
		VkCommandPool command_pool = VK_NULL_HANDLE;
		std::vector<VkCommandBuffer> allocated;
	};

	VkImageAspectFlags aspect_for_format(VkFormat format);
}
