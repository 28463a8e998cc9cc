#include <format>
#include <stdexcept>

#include "src/graphics/ember.graphics.command.hpp"

namespace ember::graphics::command {

	void Recorder::begin() {
		require(recording_state == RecordingState::Initial, "begin", "the buffer was already begun");
		record_begin();
		recording_state = RecordingState::Recording;
		pipeline_binding = {};
	}

	void Recorder::end() {
		require(recording_state == RecordingState::Recording, "end", "recording is not open or a render pass is still active");
		record_end();
		recording_state = RecordingState::Executable;
	}

	void Recorder::begin_renderpass(const RenderPassBeginInfo& info) {
		require(recording_state == RecordingState::Recording, "begin_renderpass", "recording is not open or a render pass is already active");
		require(info.renderpass != VK_NULL_HANDLE && info.framebuffer != VK_NULL_HANDLE, "begin_renderpass", "render pass and framebuffer are required");
		record_begin_renderpass(info);
		recording_state = RecordingState::InRenderPass;
	}

	void Recorder::next_subpass() {
		require(recording_state == RecordingState::InRenderPass, "next_subpass", "no render pass is active");
		record_next_subpass();
	}

	void Recorder::end_renderpass() {
		require(recording_state == RecordingState::InRenderPass, "end_renderpass", "no render pass is active");
		record_end_renderpass();
		recording_state = RecordingState::Recording;
	}

	void Recorder::bind_graphics_pipeline(const PipelineBinding& pipeline) {
		require(recording_state == RecordingState::Recording || recording_state == RecordingState::InRenderPass,
			"bind_graphics_pipeline", "recording is not open");
		require(pipeline.bind_point == VK_PIPELINE_BIND_POINT_GRAPHICS, "bind_graphics_pipeline", "pipeline is not a graphics pipeline");
		record_bind_pipeline(pipeline);
		pipeline_binding = pipeline;
	}

	void Recorder::bind_compute_pipeline(const PipelineBinding& pipeline) {
		require(recording_state == RecordingState::Recording, "bind_compute_pipeline", "recording is not open or a render pass is active");
		require(pipeline.bind_point == VK_PIPELINE_BIND_POINT_COMPUTE, "bind_compute_pipeline", "pipeline is not a compute pipeline");
		record_bind_pipeline(pipeline);
		pipeline_binding = pipeline;
	}

	void Recorder::bind_descriptor_set(uint32_t index, VkDescriptorSet set) {
		require(recording_state == RecordingState::Recording || recording_state == RecordingState::InRenderPass,
			"bind_descriptor_set", "recording is not open");
		require(has_bound_pipeline(), "bind_descriptor_set", "no pipeline is bound");
		record_bind_descriptor_set(pipeline_binding, index, set);
	}

	void Recorder::bind_vertex_buffer(VkBuffer buffer) {
		require(recording_state == RecordingState::InRenderPass, "bind_vertex_buffer", "no render pass is active");
		record_bind_vertex_buffer(buffer);
	}

	void Recorder::bind_index_buffer(VkBuffer buffer) {
		require(recording_state == RecordingState::InRenderPass, "bind_index_buffer", "no render pass is active");
		record_bind_index_buffer(buffer);
	}

	void Recorder::draw(const DrawOptions& options) {
		require(recording_state == RecordingState::InRenderPass, "draw", "no render pass is active");
		require(has_bound_pipeline() && pipeline_binding.bind_point == VK_PIPELINE_BIND_POINT_GRAPHICS, "draw", "no graphics pipeline is bound");
		record_draw(options);
	}

	void Recorder::dispatch(uint32_t x, uint32_t y, uint32_t z) {
		require_outside_renderpass("dispatch");
		require(has_bound_pipeline() && pipeline_binding.bind_point == VK_PIPELINE_BIND_POINT_COMPUTE, "dispatch", "no compute pipeline is bound");
		record_dispatch(x, y, z);
	}

	void Recorder::copy_buffer_to_image(VkBuffer buffer, const ImageRef& image) {
		require_outside_renderpass("copy_buffer_to_image");
		record_copy_buffer_to_image(buffer, image);
	}

	void Recorder::copy_image(const ImageRef& src, const ImageRef& dst) {
		require_outside_renderpass("copy_image");
		record_copy_image(src, dst);
	}

	void Recorder::blit_image(const ImageRef& src, const ImageRef& dst, VkFilter filter) {
		require_outside_renderpass("blit_image");
		record_blit_image(src, dst, filter);
	}

	void Recorder::transition_image_layout(const ImageRef& image, const TransitionLayoutOptions& options) {
		require_outside_renderpass("transition_image_layout");
		record_transition(image, options);
	}

	void Recorder::require(bool condition, std::string_view operation, std::string_view reason) const {
		if (!condition) {
			throw std::logic_error(std::format("[Command] {} rejected in state {}: {}", operation, to_string(recording_state), reason));
		}
	}

	void Recorder::require_outside_renderpass(std::string_view operation) const {
		require(recording_state == RecordingState::Recording, operation, "requires open recording outside a render pass");
	}
}
