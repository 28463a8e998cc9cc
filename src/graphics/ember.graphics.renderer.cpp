#include <print>

#include "src/graphics/ember.graphics.renderer.hpp"

namespace ember::graphics {

	Renderer::Renderer(vulkan::Context& context, const RenderConfig& config)
		: context(context), config(config) {
		const auto& engine_config = context.get_config();
		VkExtent2D render_extent = { engine_config.render_width, engine_config.render_height };

		frame_layout = vulkan::SetLayoutBuilder(context.get_device())
			.add(VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER)
			.add(VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER)
			.build();
		frame_pool = std::make_unique<vulkan::Pool>(context.get_device(), frame_layout, 1);
		frame_set = frame_pool->allocate();

		camera_buffer = std::make_unique<vulkan::Buffer>(context, sizeof(CameraUniform), VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT);
		time_buffer = std::make_unique<vulkan::Buffer>(context, sizeof(TimeUniform), VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT);
		camera_buffer->upload_value(CameraUniform{});
		time_buffer->upload_value(TimeUniform{});
		frame_set->update_buffer(0, *camera_buffer);
		frame_set->update_buffer(1, *time_buffer);

		geometry_pass = std::make_unique<GeometryPass>(context, frame_layout, render_extent);
		ui_pass = std::make_unique<UIPass>(context, geometry_pass->get_output(), render_extent);
		present_pass = std::make_unique<PresentPass>(context, ui_pass->get_output(), config);

		frames = std::make_unique<FrameController>(context, engine_config.fence_timeout_ms);
		frames->add_dependent(*present_pass);

		std::println("[Renderer] Initialized ({}x{} render target).", render_extent.width, render_extent.height);
	}

	Renderer::~Renderer() {
		// 依赖对象先于 pass 释放
		frames->shutdown();
	}

	FrameStatus Renderer::render(const CameraUniform& camera, const TimeUniform& time) {
		return frames->run_frame([&](uint32_t image_index) {
			record_frame(image_index, camera, time);
		});
	}

	void Renderer::record_frame(uint32_t image_index, const CameraUniform& camera, const TimeUniform& time) {
		// fence 已经等过，上一帧不再读取这些缓冲
		camera_buffer->upload_value(camera);
		time_buffer->upload_value(time);
		geometry_pass->set_geometry();

		auto geometry_output = render_graph.import_image("GeometryOutput", geometry_pass->get_output()->ref(), GeometryPass::output_state);
		auto ui_output = render_graph.import_image("UIOutput", ui_pass->get_output()->ref(), UIPass::output_state);

		geometry_pass->add_to_graph(render_graph, geometry_output, frame_set->get());
		ui_pass->add_to_graph(render_graph, geometry_output, ui_output);
		present_pass->add_to_graph(render_graph, ui_output, image_index);

		auto cmd = context.get_command_pool().allocate();
		cmd.begin();
		render_graph.execute(cmd);
		cmd.end();

		context.submit(cmd, image_index);
	}
}
