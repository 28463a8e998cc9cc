#include <stdexcept>

#include "src/graphics/ember.graphics.passes.hpp"

namespace ember::graphics {

	// 新建的离屏图像是 UNDEFINED，一次性提交把它转到帧间停留的状态
	// 之后每帧以这个状态导入 render graph，帧末又回到这里
	static void settle_output(vulkan::Context& context, const vulkan::Image& image, ResourceState state) {
		auto cmd = context.get_command_pool().allocate();
		cmd.begin();
		cmd.transition_image_layout(image.ref(), make_transition(ResourceState::Undefined, state));
		cmd.end();
		cmd.submit(context.get_device().graphics_queue());
	}

	// GeometryPass, begin
	GeometryPass::GeometryPass(vulkan::Context& context, const std::shared_ptr<vulkan::SetLayout>& frame_layout, VkExtent2D extent)
		: context(context), extent(extent) {
		auto image = std::make_shared<vulkan::Image>(context, extent.width, extent.height,
			VK_FORMAT_R8G8B8A8_UNORM, VK_IMAGE_USAGE_STORAGE_BIT | VK_IMAGE_USAGE_SAMPLED_BIT);
		output = std::make_unique<vulkan::Texture>(context, std::move(image), VK_FILTER_NEAREST, VK_FILTER_NEAREST);
		settle_output(context, output->get_image(), output_state);

		geometry_layout = vulkan::SetLayoutBuilder(context.get_device())
			.add(VK_DESCRIPTOR_TYPE_STORAGE_IMAGE)
			.add(VK_DESCRIPTOR_TYPE_STORAGE_BUFFER)
			.add(VK_DESCRIPTOR_TYPE_STORAGE_BUFFER)
			.add(VK_DESCRIPTOR_TYPE_STORAGE_BUFFER)
			.add(VK_DESCRIPTOR_TYPE_STORAGE_BUFFER)
			.add(VK_DESCRIPTOR_TYPE_STORAGE_BUFFER)
			.build();
		geometry_pool = std::make_unique<vulkan::Pool>(context.get_device(), geometry_layout, 1);
		geometry_set = geometry_pool->allocate();
		geometry_set->update_texture(0, *output, VK_IMAGE_LAYOUT_GENERAL);

		auto shader = context.get_shaders().get("geometry.comp.spv");
		std::shared_ptr<vulkan::SetLayout> layouts[] = { frame_layout, geometry_layout };
		pipeline = std::make_unique<vulkan::ComputePipeline>(context.get_device(), *shader, layouts);

		// 第一帧之前 set 也必须完整
		set_geometry();
	}

	void GeometryPass::upload(uint32_t binding, const std::vector<uint8_t>& bytes) {
		auto& buffer = buffers[binding - 1];

		// 大小不变时原地覆写，否则换一个新缓冲，旧的交给 release queue
		if (buffer && buffer->size() == bytes.size()) {
			buffer->upload(bytes);
			return;
		}

		buffer = std::make_unique<vulkan::Buffer>(context, bytes, VK_BUFFER_USAGE_STORAGE_BUFFER_BIT);
		geometry_set->update_buffer(binding, *buffer);
	}

	void GeometryPass::set_geometry() {
		auto geometry = aggregator.aggregate();

		upload(1, geometry.vertices);
		upload(2, geometry.indices);
		upload(3, geometry.meshes);
		upload(4, geometry.materials);
		upload(5, geometry.lights);

		meshes = geometry.mesh_count;
		lights = geometry.light_count;
	}

	void GeometryPass::add_to_graph(RenderGraph& graph, RGHandle output_handle, VkDescriptorSet frame_set) {
		auto binding = pipeline->binding();
		VkDescriptorSet set = geometry_set->get();
		auto groups = dispatch_size(extent);

		graph.add_pass("Geometry",
			[=](RGBuilder& builder) {
				builder.write(output_handle, ResourceState::StorageWrite);
			},
			[=](command::Recorder& cmd) {
				cmd.bind_compute_pipeline(binding);
				cmd.bind_descriptor_set(0, frame_set);
				cmd.bind_descriptor_set(1, set);
				cmd.dispatch(groups.x, groups.y, groups.z);
			});
	}
	// GeometryPass, end

	// UIPass, begin
	UIPass::UIPass(vulkan::Context& context, std::shared_ptr<vulkan::Image> input_image, VkExtent2D extent)
		: context(context), extent(extent) {
		auto image = std::make_shared<vulkan::Image>(context, extent.width, extent.height,
			VK_FORMAT_R8G8B8A8_UNORM, VK_IMAGE_USAGE_STORAGE_BIT | VK_IMAGE_USAGE_SAMPLED_BIT);
		output = std::make_unique<vulkan::Texture>(context, std::move(image), VK_FILTER_NEAREST, VK_FILTER_NEAREST);
		settle_output(context, output->get_image(), output_state);
		input = std::make_unique<vulkan::Texture>(context, std::move(input_image), VK_FILTER_NEAREST, VK_FILTER_NEAREST);

		ui_layout = vulkan::SetLayoutBuilder(context.get_device())
			.add(VK_DESCRIPTOR_TYPE_STORAGE_IMAGE)
			.add(VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER)
			.build();
		ui_pool = std::make_unique<vulkan::Pool>(context.get_device(), ui_layout, 1);
		ui_set = ui_pool->allocate();
		ui_set->update_texture(0, *output, VK_IMAGE_LAYOUT_GENERAL);
		ui_set->update_texture(1, *input, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);

		auto shader = context.get_shaders().get("ui.comp.spv");
		std::shared_ptr<vulkan::SetLayout> layouts[] = { ui_layout };
		pipeline = std::make_unique<vulkan::ComputePipeline>(context.get_device(), *shader, layouts);
	}

	void UIPass::add_to_graph(RenderGraph& graph, RGHandle input_handle, RGHandle output_handle) {
		auto binding = pipeline->binding();
		VkDescriptorSet set = ui_set->get();
		auto groups = dispatch_size(extent);

		graph.add_pass("UI",
			[=](RGBuilder& builder) {
				builder.read(input_handle, ResourceState::ComputeRead);
				builder.write(output_handle, ResourceState::StorageWrite);
			},
			[=](command::Recorder& cmd) {
				cmd.bind_compute_pipeline(binding);
				cmd.bind_descriptor_set(0, set);
				cmd.dispatch(groups.x, groups.y, groups.z);
			});
	}
	// UIPass, end

	// PresentPass, begin
	PresentPass::PresentPass(vulkan::Context& context, std::shared_ptr<vulkan::Image> input_image, const RenderConfig& config)
		: context(context), config(config) {
		input = std::make_unique<vulkan::Texture>(context, std::move(input_image), config.upscale_filter, config.upscale_filter);

		present_layout = vulkan::SetLayoutBuilder(context.get_device())
			.add(VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER)
			.build();
		present_pool = std::make_unique<vulkan::Pool>(context.get_device(), present_layout, 1);
		present_set = present_pool->allocate();
		present_set->update_texture(0, *input, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);

		vertex_shader = context.get_shaders().get("upscale.vert.spv");
		fragment_shader = context.get_shaders().get("upscale.frag.spv");
	}

	PresentPass::~PresentPass() {
		release_swapchain_resources();
	}

	void PresentPass::release_swapchain_resources() {
		framebuffers.clear();
		pipeline.reset();
		renderpass.reset();
		extent = { 0, 0 };
	}

	void PresentPass::create_swapchain_resources(const SwapchainInfo& info) {
		const auto& device = context.get_device();
		const auto& swapchain = context.get_swapchain();

		renderpass = vulkan::Renderpass::new_upscale_ui(device, info.format);

		framebuffers.clear();
		for (VkImageView view : swapchain.views()) {
			VkImageView attachments[] = { view };
			framebuffers.push_back(renderpass->create_framebuffer(info.extent.width, info.extent.height, attachments));
		}

		vulkan::GraphicsPipelineDesc desc;
		desc.vertex = vertex_shader.get();
		desc.fragment = fragment_shader.get();
		desc.extent = info.extent;
		desc.subpass = 0;
		desc.depth_test = false;
		desc.cull_back_faces = false;

		// 全屏三角形由 gl_VertexIndex 生成，没有顶点输入
		vulkan::VertexInputBuilder vertex_input;
		std::shared_ptr<vulkan::SetLayout> layouts[] = { present_layout };
		pipeline = std::make_unique<vulkan::GraphicsPipeline>(device, *renderpass, desc, layouts, vertex_input);

		extent = info.extent;
	}

	void PresentPass::add_to_graph(RenderGraph& graph, RGHandle input_handle, uint32_t image_index) {
		if (!is_ready() || image_index >= framebuffers.size()) {
			throw std::logic_error("[PresentPass] Swapchain resources are not created for this image");
		}

		graphics::command::RenderPassBeginInfo info;
		info.renderpass = renderpass->get();
		info.framebuffer = framebuffers[image_index]->get();
		info.extent = extent;
		info.clear_color = config.clear_color;
		info.has_depth = renderpass->has_depth();

		auto binding = pipeline->binding();
		VkDescriptorSet set = present_set->get();

		graph.add_pass("Present",
			[=](RGBuilder& builder) {
				builder.read(input_handle, ResourceState::FragmentRead);
			},
			[=](command::Recorder& cmd) {
				cmd.begin_renderpass(info);
				cmd.bind_graphics_pipeline(binding);
				cmd.bind_descriptor_set(0, set);

				DrawOptions draw;
				draw.vertex_count = 3;
				cmd.draw(draw);

				// overlay
				cmd.next_subpass();
				cmd.end_renderpass();
			});
	}
	// PresentPass, end
}
