#pragma once

#include <cstdint>
#include <string_view>

#include <vulkan/vulkan.h>

#include "src/core/ember.math.hpp"
#include "src/graphics/ember.graphics.types.hpp"

namespace ember::graphics::command {

	enum class RecordingState {
		Initial,
		Recording,
		InRenderPass,
		Executable,
	};

	constexpr std::string_view to_string(RecordingState state) {
		switch (state) {
		case RecordingState::Initial: return "Initial";
		case RecordingState::Recording: return "Recording";
		case RecordingState::InRenderPass: return "InRenderPass";
		case RecordingState::Executable: return "Executable";
		}
		return "Unknown";
	}

	struct RenderPassBeginInfo {
		VkRenderPass renderpass = VK_NULL_HANDLE;
		VkFramebuffer framebuffer = VK_NULL_HANDLE;
		VkExtent2D extent = { 0, 0 };
		math::vec4 clear_color = { 0.0f, 0.0f, 0.0f, 1.0f };
		bool has_depth = false;
	};

	// 命令录制会话
	// 公开接口负责状态校验 (Initial -> Recording -> InRenderPass -> Recording -> Executable)，
	// 真正的录制由子类的 record_* 完成。Vulkan 实现见 BufferBuilder
	class Recorder {
	public:
		virtual ~Recorder() = default;

		void begin();
		void end();

		void begin_renderpass(const RenderPassBeginInfo& info);
		void next_subpass();
		void end_renderpass();

		void bind_graphics_pipeline(const PipelineBinding& pipeline);
		void bind_compute_pipeline(const PipelineBinding& pipeline);

		// 使用当前绑定管线的 bind point 和 layout
		void bind_descriptor_set(uint32_t index, VkDescriptorSet set);

		void bind_vertex_buffer(VkBuffer buffer);
		void bind_index_buffer(VkBuffer buffer);

		void draw(const DrawOptions& options);
		void dispatch(uint32_t x, uint32_t y, uint32_t z);

		void copy_buffer_to_image(VkBuffer buffer, const ImageRef& image);
		void copy_image(const ImageRef& src, const ImageRef& dst);
		void blit_image(const ImageRef& src, const ImageRef& dst, VkFilter filter);

		void transition_image_layout(const ImageRef& image, const TransitionLayoutOptions& options);

		RecordingState state() const { return recording_state; }
		const PipelineBinding& bound_pipeline() const { return pipeline_binding; }
		bool has_bound_pipeline() const { return pipeline_binding.pipeline != VK_NULL_HANDLE; }

	protected:
		virtual void record_begin() = 0;
		virtual void record_end() = 0;
		virtual void record_begin_renderpass(const RenderPassBeginInfo& info) = 0;
		virtual void record_next_subpass() = 0;
		virtual void record_end_renderpass() = 0;
		virtual void record_bind_pipeline(const PipelineBinding& pipeline) = 0;
		virtual void record_bind_descriptor_set(const PipelineBinding& pipeline, uint32_t index, VkDescriptorSet set) = 0;
		virtual void record_bind_vertex_buffer(VkBuffer buffer) = 0;
		virtual void record_bind_index_buffer(VkBuffer buffer) = 0;
		virtual void record_draw(const DrawOptions& options) = 0;
		virtual void record_dispatch(uint32_t x, uint32_t y, uint32_t z) = 0;
		virtual void record_copy_buffer_to_image(VkBuffer buffer, const ImageRef& image) = 0;
		virtual void record_copy_image(const ImageRef& src, const ImageRef& dst) = 0;
		virtual void record_blit_image(const ImageRef& src, const ImageRef& dst, VkFilter filter) = 0;
		virtual void record_transition(const ImageRef& image, const TransitionLayoutOptions& options) = 0;

	private:
		void require(bool condition, std::string_view operation, std::string_view reason) const;
		void require_outside_renderpass(std::string_view operation) const;

		RecordingState recording_state = RecordingState::Initial;
		PipelineBinding pipeline_binding;
	};
}
