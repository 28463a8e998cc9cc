#pragma once

#include <array>
#include <memory>
#include <vector>
#include <optional>

#include <vulkan/vulkan.h>

#include "src/graphics/ember.graphics.types.hpp"
#include "src/graphics/ember.graphics.frame.hpp"
#include "src/graphics/ember.graphics.scene.hpp"
#include "src/graphics/ember.graphics.geometry.hpp"
#include "src/graphics/graph/ember.graphics.graph.hpp"

#include "src/graphics/vulkan/ember.vulkan.image.hpp"
#include "src/graphics/vulkan/ember.vulkan.buffer.hpp"
#include "src/graphics/vulkan/ember.vulkan.context.hpp"
#include "src/graphics/vulkan/ember.vulkan.pipeline.hpp"
#include "src/graphics/vulkan/ember.vulkan.renderpass.hpp"
#include "src/graphics/vulkan/ember.vulkan.descriptors.hpp"

namespace ember::graphics {

	// 场景光栅化 (compute)：set 0 = 每帧 uniform，set 1 = 输出图像 + 五个几何缓冲
	class GeometryPass {
	public:
		GeometryPass(vulkan::Context& context, const std::shared_ptr<vulkan::SetLayout>& frame_layout, VkExtent2D extent);

		// 帧与帧之间输出图像停留的状态 (UI pass 最后一次读取)
		static constexpr ResourceState output_state = ResourceState::ComputeRead;

		GeometryPass(const GeometryPass&) = delete;
		GeometryPass& operator=(const GeometryPass&) = delete;

		// 只保存弱引用
		void add(const std::shared_ptr<Renderable>& renderable) { aggregator.add(renderable); }
		void add_light(const std::shared_ptr<Emissive>& emissive) { aggregator.add_light(emissive); }

		// fence 之后调用：重建并上传 binding 1..5
		void set_geometry();

		void add_to_graph(RenderGraph& graph, RGHandle output, VkDescriptorSet frame_set);

		const std::shared_ptr<vulkan::Image>& get_output() const { return output->get_shared_image(); }
		uint32_t mesh_count() const { return meshes; }
		uint32_t light_count() const { return lights; }

	private:
		void upload(uint32_t binding, const std::vector<uint8_t>& bytes);

		vulkan::Context& context;
		VkExtent2D extent;
		GeometryAggregator aggregator;

		std::unique_ptr<vulkan::Texture> output;
		std::shared_ptr<vulkan::SetLayout> geometry_layout;
		std::unique_ptr<vulkan::Pool> geometry_pool;
		std::optional<vulkan::Set> geometry_set;
		std::unique_ptr<vulkan::ComputePipeline> pipeline;

		// binding 1..5
		std::array<std::unique_ptr<vulkan::Buffer>, 5> buffers;
		uint32_t meshes = 0;
		uint32_t lights = 0;
	};

	// UI 合成 (compute)：采样几何输出，写入自己的图像
	class UIPass {
	public:
		UIPass(vulkan::Context& context, std::shared_ptr<vulkan::Image> input, VkExtent2D extent);

		// present pass 最后一次读取
		static constexpr ResourceState output_state = ResourceState::FragmentRead;

		UIPass(const UIPass&) = delete;
		UIPass& operator=(const UIPass&) = delete;

		void add_to_graph(RenderGraph& graph, RGHandle input, RGHandle output);

		const std::shared_ptr<vulkan::Image>& get_output() const { return output->get_shared_image(); }

	private:
		vulkan::Context& context;
		VkExtent2D extent;

		std::unique_ptr<vulkan::Texture> output;
		std::unique_ptr<vulkan::Texture> input;
		std::shared_ptr<vulkan::SetLayout> ui_layout;
		std::unique_ptr<vulkan::Pool> ui_pool;
		std::optional<vulkan::Set> ui_set;
		std::unique_ptr<vulkan::ComputePipeline> pipeline;
	};

	// 把低分辨率结果放大到交换链图像
	// subpass 0 画全屏三角形，subpass 1 留给 overlay
	class PresentPass : public SwapchainDependent {
	public:
		PresentPass(vulkan::Context& context, std::shared_ptr<vulkan::Image> input, const RenderConfig& config);
		~PresentPass() override;

		PresentPass(const PresentPass&) = delete;
		PresentPass& operator=(const PresentPass&) = delete;

		void release_swapchain_resources() override;
		void create_swapchain_resources(const SwapchainInfo& info) override;

		void add_to_graph(RenderGraph& graph, RGHandle input, uint32_t image_index);

		bool is_ready() const { return pipeline != nullptr; }
		size_t framebuffer_count() const { return framebuffers.size(); }

	private:
		vulkan::Context& context;
		RenderConfig config;

		std::unique_ptr<vulkan::Texture> input;
		std::shared_ptr<vulkan::SetLayout> present_layout;
		std::unique_ptr<vulkan::Pool> present_pool;
		std::optional<vulkan::Set> present_set;
		std::shared_ptr<vulkan::Shader> vertex_shader;
		std::shared_ptr<vulkan::Shader> fragment_shader;

		// 随交换链重建
		std::unique_ptr<vulkan::Renderpass> renderpass;
		std::vector<std::unique_ptr<vulkan::Framebuffer>> framebuffers;
		std::unique_ptr<vulkan::GraphicsPipeline> pipeline;
		VkExtent2D extent = { 0, 0 };
	};
}
