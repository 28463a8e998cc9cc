#pragma once

#include <span>
#include <memory>
#include <vector>
#include <cstdint>
#include <filesystem>

#include <vulkan/vulkan.h>

#include "src/graphics/ember.graphics.types.hpp"
#include "src/graphics/vulkan/ember.vulkan.device.hpp"

namespace ember::graphics::vulkan {

	class Renderpass;
	class SetLayout;

	class Shader {
	public:
		Shader(const Device& device, std::span<const char> code, VkShaderStageFlagBits stage);
		~Shader();

		// 按文件名推导 stage (.vert / .frag / .comp)
		static std::shared_ptr<Shader> load(const Device& device, const std::filesystem::path& path);

		Shader(const Shader&) = delete;
		Shader& operator=(const Shader&) = delete;

		VkShaderModule get() const { return module; }
		VkShaderStageFlagBits get_stage() const { return stage; }

		VkPipelineShaderStageCreateInfo stage_info() const;

	private:
		VkDevice device;
		VkShaderModule module = VK_NULL_HANDLE;
		VkShaderStageFlagBits stage;
	};

	// 无法识别时抛出 ResourceError(Shader)
	VkShaderStageFlagBits shader_stage_from_path(const std::filesystem::path& path);

	// 顶点属性的字节大小，不支持的格式抛出 std::invalid_argument
	uint32_t vertex_format_size(VkFormat format);

	// location 在所有 binding 间连续递增
	class VertexBinding {
	public:
		VertexBinding(uint32_t binding, uint32_t first_location)
			: binding(binding), next_location(first_location) {
		}

		VertexBinding& add_attribute(VkFormat format);

		VkVertexInputBindingDescription description() const;
		const std::vector<VkVertexInputAttributeDescription>& get_attributes() const { return attributes; }
		uint32_t get_stride() const { return stride; }
		uint32_t get_next_location() const { return next_location; }

	private:
		uint32_t binding;
		uint32_t next_location;
		uint32_t stride = 0;
		std::vector<VkVertexInputAttributeDescription> attributes;
	};

	class VertexInputBuilder {
	public:
		VertexBinding& add_binding();

		std::vector<VkVertexInputBindingDescription> binding_descriptions() const;
		std::vector<VkVertexInputAttributeDescription> attribute_descriptions() const;

	private:
		std::vector<VertexBinding> bindings;
	};

	struct GraphicsPipelineDesc {
		const Shader* vertex = nullptr;
		const Shader* fragment = nullptr;
		VkExtent2D extent = { 0, 0 };
		uint32_t subpass = 0;
		bool depth_test = false;
		bool cull_back_faces = false;
	};

	class GraphicsPipeline {
	public:
		GraphicsPipeline(const Device& device,
			const Renderpass& renderpass,
			const GraphicsPipelineDesc& desc,
			std::span<const std::shared_ptr<SetLayout>> layouts,
			const VertexInputBuilder& vertex_input);
		~GraphicsPipeline();

		GraphicsPipeline(const GraphicsPipeline&) = delete;
		GraphicsPipeline& operator=(const GraphicsPipeline&) = delete;

		VkPipeline get() const { return pipeline; }
		VkPipelineLayout get_layout() const { return layout; }
		PipelineBinding binding() const { return { pipeline, layout, VK_PIPELINE_BIND_POINT_GRAPHICS }; }

	private:
		VkDevice device;
		VkPipelineLayout layout = VK_NULL_HANDLE;
		VkPipeline pipeline = VK_NULL_HANDLE;
		std::vector<std::shared_ptr<SetLayout>> set_layouts;
	};

	class ComputePipeline {
	public:
		ComputePipeline(const Device& device, const Shader& shader, std::span<const std::shared_ptr<SetLayout>> layouts);
		~ComputePipeline();

		ComputePipeline(const ComputePipeline&) = delete;
		ComputePipeline& operator=(const ComputePipeline&) = delete;

		VkPipeline get() const { return pipeline; }
		VkPipelineLayout get_layout() const { return layout; }
		PipelineBinding binding() const { return { pipeline, layout, VK_PIPELINE_BIND_POINT_COMPUTE }; }

	private:
		VkDevice device;
		VkPipelineLayout layout = VK_NULL_HANDLE;
		VkPipeline pipeline = VK_NULL_HANDLE;
		std::vector<std::shared_ptr<SetLayout>> set_layouts;
	};
}
