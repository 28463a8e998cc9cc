#pragma once

#include <memory>
#include <optional>

#include "src/core/ember.math.hpp"
#include "src/graphics/ember.graphics.types.hpp"
#include "src/graphics/ember.graphics.frame.hpp"
#include "src/graphics/ember.graphics.scene.hpp"
#include "src/graphics/ember.graphics.passes.hpp"
#include "src/graphics/graph/ember.graphics.graph.hpp"

#include "src/graphics/vulkan/ember.vulkan.buffer.hpp"
#include "src/graphics/vulkan/ember.vulkan.context.hpp"
#include "src/graphics/vulkan/ember.vulkan.descriptors.hpp"

namespace ember::graphics {

	// Geometry -> UI -> Present，每帧重建 render graph
	class Renderer {
	public:
		Renderer(vulkan::Context& context, const RenderConfig& config = {});
		~Renderer();

		Renderer(const Renderer&) = delete;
		Renderer& operator=(const Renderer&) = delete;

		void add(const std::shared_ptr<Renderable>& renderable) { geometry_pass->add(renderable); }
		void add_light(const std::shared_ptr<Emissive>& emissive) { geometry_pass->add_light(emissive); }

		FrameStatus render(const CameraUniform& camera, const TimeUniform& time);

		// 窗口 resize 事件
		void request_recreate() { frames->request_recreate(); }

		VkExtent2D get_swapchain_extent() const { return context.swapchain_info().extent; }
		uint64_t frames_submitted() const { return frames->frames_submitted(); }

	private:
		void record_frame(uint32_t image_index, const CameraUniform& camera, const TimeUniform& time);

		vulkan::Context& context;
		RenderConfig config;

		// 每帧 uniform
		std::shared_ptr<vulkan::SetLayout> frame_layout;
		std::unique_ptr<vulkan::Pool> frame_pool;
		std::optional<vulkan::Set> frame_set;
		std::unique_ptr<vulkan::Buffer> camera_buffer;
		std::unique_ptr<vulkan::Buffer> time_buffer;

		std::unique_ptr<GeometryPass> geometry_pass;
		std::unique_ptr<UIPass> ui_pass;
		std::unique_ptr<PresentPass> present_pass;

		RenderGraph render_graph;
		std::unique_ptr<FrameController> frames;
	};
}
