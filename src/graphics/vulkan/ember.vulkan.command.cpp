#include <stdexcept>
#include <algorithm>

#include "src/graphics/ember.graphics.errors.hpp"
#include "src/graphics/vulkan/ember.vulkan.command.hpp"

namespace ember::graphics::vulkan::command {

	VkImageAspectFlags aspect_for_format(VkFormat format) {
		return format == VK_FORMAT_D32_SFLOAT ? VK_IMAGE_ASPECT_DEPTH_BIT : VK_IMAGE_ASPECT_COLOR_BIT;
	}

	static VkImageSubresourceLayers subresource_layers(const ImageRef& image) {
		return { aspect_for_format(image.format), 0, 0, 1 };
	}

	// --- Pool ---

	Pool::Pool(const Device& device)
		: device(device.get()) {
		VkCommandPoolCreateInfo pool_info{ VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO };
		pool_info.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
		pool_info.queueFamilyIndex = device.queue_families().graphics_family.value();

		vk_check(vkCreateCommandPool(this->device, &pool_info, nullptr, &command_pool), Subsystem::Command, "Failed to create command pool");
	}

	Pool::~Pool() {
		clear();
		if (command_pool) vkDestroyCommandPool(device, command_pool, nullptr);
	}

	BufferBuilder Pool::allocate() {
		VkCommandBufferAllocateInfo alloc_info{ VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO };
		alloc_info.commandPool = command_pool;
		alloc_info.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
		alloc_info.commandBufferCount = 1;

		VkCommandBuffer command_buffer = VK_NULL_HANDLE;
		vk_check(vkAllocateCommandBuffers(device, &alloc_info, &command_buffer), Subsystem::Command, "Failed to allocate command buffer");
		allocated.push_back(command_buffer);

		return BufferBuilder(command_buffer);
	}

	void Pool::clear() {
		if (allocated.empty()) return;
		vkFreeCommandBuffers(device, command_pool, static_cast<uint32_t>(allocated.size()), allocated.data());
		allocated.clear();
	}

	// --- BufferBuilder ---

	void BufferBuilder::submit(VkQueue queue) {
		if (state() != graphics::command::RecordingState::Executable) {
			throw std::logic_error("[Command] submit rejected: the buffer has not been ended");
		}

		VkSubmitInfo submit_info{ VK_STRUCTURE_TYPE_SUBMIT_INFO };
		submit_info.commandBufferCount = 1;
		submit_info.pCommandBuffers = &command_buffer;

		vk_check(vkQueueSubmit(queue, 1, &submit_info, VK_NULL_HANDLE), Subsystem::Command, "Failed to submit one-shot command buffer");
		vk_check(vkQueueWaitIdle(queue), Subsystem::Command, "vkQueueWaitIdle failed after one-shot submit");
	}

	void BufferBuilder::record_begin() {
		VkCommandBufferBeginInfo begin_info{ VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO };
		begin_info.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
		vk_check(vkBeginCommandBuffer(command_buffer, &begin_info), Subsystem::Command, "Failed to begin recording command buffer");
	}

	void BufferBuilder::record_end() {
		vk_check(vkEndCommandBuffer(command_buffer), Subsystem::Command, "Failed to record command buffer");
	}

	void BufferBuilder::record_begin_renderpass(const graphics::command::RenderPassBeginInfo& info) {
		VkClearValue clear_values[2]{};
		clear_values[0].color = { { info.clear_color.r, info.clear_color.g, info.clear_color.b, info.clear_color.a } };
		clear_values[1].depthStencil = { 1.0f, 0 };

		VkRenderPassBeginInfo begin_info{ VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO };
		begin_info.renderPass = info.renderpass;
		begin_info.framebuffer = info.framebuffer;
		begin_info.renderArea.offset = { 0, 0 };
		begin_info.renderArea.extent = info.extent;
		begin_info.clearValueCount = info.has_depth ? 2 : 1;
		begin_info.pClearValues = clear_values;

		vkCmdBeginRenderPass(command_buffer, &begin_info, VK_SUBPASS_CONTENTS_INLINE);
	}

	void BufferBuilder::record_next_subpass() {
		vkCmdNextSubpass(command_buffer, VK_SUBPASS_CONTENTS_INLINE);
	}

	void BufferBuilder::record_end_renderpass() {
		vkCmdEndRenderPass(command_buffer);
	}

	void BufferBuilder::record_bind_pipeline(const PipelineBinding& pipeline) {
		vkCmdBindPipeline(command_buffer, pipeline.bind_point, pipeline.pipeline);
	}

	void BufferBuilder::record_bind_descriptor_set(const PipelineBinding& pipeline, uint32_t index, VkDescriptorSet set) {
		vkCmdBindDescriptorSets(command_buffer, pipeline.bind_point, pipeline.layout, index, 1, &set, 0, nullptr);
	}

	void BufferBuilder::record_bind_vertex_buffer(VkBuffer buffer) {
		VkDeviceSize offset = 0;
		vkCmdBindVertexBuffers(command_buffer, 0, 1, &buffer, &offset);
	}

	void BufferBuilder::record_bind_index_buffer(VkBuffer buffer) {
		vkCmdBindIndexBuffer(command_buffer, buffer, 0, VK_INDEX_TYPE_UINT32);
	}

	void BufferBuilder::record_draw(const DrawOptions& options) {
		if (options.index_count > 0) {
			vkCmdDrawIndexed(command_buffer, options.index_count, options.instance_count, options.first_index, options.vertex_offset, options.first_instance);
		}
		else {
			vkCmdDraw(command_buffer, options.vertex_count, options.instance_count, 0, options.first_instance);
		}
	}

	void BufferBuilder::record_dispatch(uint32_t x, uint32_t y, uint32_t z) {
		vkCmdDispatch(command_buffer, x, y, z);
	}

	void BufferBuilder::record_copy_buffer_to_image(VkBuffer buffer, const ImageRef& image) {
		VkBufferImageCopy region{};
		region.bufferOffset = 0;
		region.bufferRowLength = 0;
		region.bufferImageHeight = 0;
		region.imageSubresource = subresource_layers(image);
		region.imageOffset = { 0, 0, 0 };
		region.imageExtent = { image.extent.width, image.extent.height, 1 };

		vkCmdCopyBufferToImage(command_buffer, buffer, image.image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &region);
	}

	void BufferBuilder::record_copy_image(const ImageRef& src, const ImageRef& dst) {
		VkImageCopy region{};
		region.srcSubresource = subresource_layers(src);
		region.dstSubresource = subresource_layers(dst);
		region.extent = {
			std::min(src.extent.width, dst.extent.width),
			std::min(src.extent.height, dst.extent.height),
			1
		};

		vkCmdCopyImage(command_buffer, src.image, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL, dst.image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &region);
	}

	void BufferBuilder::record_blit_image(const ImageRef& src, const ImageRef& dst, VkFilter filter) {
		VkImageBlit blit{};
		blit.srcSubresource = subresource_layers(src);
		blit.srcOffsets[0] = { 0, 0, 0 };
		blit.srcOffsets[1] = { static_cast<int32_t>(src.extent.width), static_cast<int32_t>(src.extent.height), 1 };
		blit.dstSubresource = subresource_layers(dst);
		blit.dstOffsets[0] = { 0, 0, 0 };
		blit.dstOffsets[1] = { static_cast<int32_t>(dst.extent.width), static_cast<int32_t>(dst.extent.height), 1 };

		vkCmdBlitImage(command_buffer, src.image, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL, dst.image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &blit, filter);
	}

	void BufferBuilder::record_transition(const ImageRef& image, const TransitionLayoutOptions& options) {
		VkImageMemoryBarrier barrier{ VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER };
		barrier.oldLayout = options.old_layout;
		barrier.newLayout = options.new_layout;
		barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
		barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
		barrier.image = image.image;
		barrier.subresourceRange.aspectMask = aspect_for_format(image.format);
		barrier.subresourceRange.baseMipLevel = 0;
		barrier.subresourceRange.levelCount = 1;
		barrier.subresourceRange.baseArrayLayer = 0;
		barrier.subresourceRange.layerCount = 1;
		barrier.srcAccessMask = options.source_access;
		barrier.dstAccessMask = options.destination_access;

		vkCmdPipelineBarrier(command_buffer, options.source_stage, options.destination_stage, 0, 0, nullptr, 0, nullptr, 1, &barrier);
	}
}
