#include <string>
#include <stdexcept>

#include "src/io/ember.io.hpp"
#include "src/graphics/ember.graphics.errors.hpp"
#include "src/graphics/vulkan/ember.vulkan.pipeline.hpp"
#include "src/graphics/vulkan/ember.vulkan.renderpass.hpp"
#include "src/graphics/vulkan/ember.vulkan.descriptors.hpp"

namespace ember::graphics::vulkan {

	Shader::Shader(const Device& device, std::span<const char> code, VkShaderStageFlagBits stage)
		: device(device.get()), stage(stage) {
		if (code.empty() || code.size() % 4 != 0) {
			throw ResourceError(Subsystem::Shader, VK_ERROR_INITIALIZATION_FAILED, "SPIR-V code size must be a non-zero multiple of 4");
		}

		VkShaderModuleCreateInfo create_info{};
		create_info.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
		create_info.codeSize = code.size();
		create_info.pCode = reinterpret_cast<const uint32_t*>(code.data());

		vk_check(vkCreateShaderModule(this->device, &create_info, nullptr, &module), Subsystem::Shader, "failed to create shader module");
	}

	Shader::~Shader() {
		if (module) vkDestroyShaderModule(device, module, nullptr);
	}

	std::shared_ptr<Shader> Shader::load(const Device& device, const std::filesystem::path& path) {
		auto stage = shader_stage_from_path(path);
		auto code = io::FileSystem::read_binary(path);
		if (!code) {
			throw ResourceError(Subsystem::Shader, VK_ERROR_INITIALIZATION_FAILED, "failed to read " + path.string());
		}
		return std::make_shared<Shader>(device, *code, stage);
	}

	VkPipelineShaderStageCreateInfo Shader::stage_info() const {
		VkPipelineShaderStageCreateInfo info{};
		info.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
		info.stage = stage;
		info.module = module;
		info.pName = "main";
		return info;
	}

	VkShaderStageFlagBits shader_stage_from_path(const std::filesystem::path& path) {
		// geometry.comp.spv -> .comp
		auto name = path.filename().string();
		if (name.contains(".vert")) return VK_SHADER_STAGE_VERTEX_BIT;
		if (name.contains(".frag")) return VK_SHADER_STAGE_FRAGMENT_BIT;
		if (name.contains(".comp")) return VK_SHADER_STAGE_COMPUTE_BIT;
		throw ResourceError(Subsystem::Shader, VK_ERROR_FORMAT_NOT_SUPPORTED, "cannot deduce shader stage from " + name);
	}

	uint32_t vertex_format_size(VkFormat format) {
		switch (format) {
		case VK_FORMAT_R32G32_SFLOAT: return 8;
		case VK_FORMAT_R32G32B32_SFLOAT: return 12;
		case VK_FORMAT_R32G32B32A32_SFLOAT: return 16;
		case VK_FORMAT_R8G8B8A8_UINT: return 4;
		default:
			throw std::invalid_argument("[Pipeline] Unsupported vertex attribute format " + std::to_string(static_cast<int>(format)));
		}
	}

	VertexBinding& VertexBinding::add_attribute(VkFormat format) {
		uint32_t size = vertex_format_size(format);
		attributes.push_back({ next_location, binding, format, stride });
		stride += size;
		next_location++;
		return *this;
	}

	VkVertexInputBindingDescription VertexBinding::description() const {
		return { binding, stride, VK_VERTEX_INPUT_RATE_VERTEX };
	}

	VertexBinding& VertexInputBuilder::add_binding() {
		uint32_t first_location = bindings.empty() ? 0 : bindings.back().get_next_location();
		bindings.emplace_back(static_cast<uint32_t>(bindings.size()), first_location);
		return bindings.back();
	}

	std::vector<VkVertexInputBindingDescription> VertexInputBuilder::binding_descriptions() const {
		std::vector<VkVertexInputBindingDescription> result;
		result.reserve(bindings.size());
		for (const auto& binding : bindings) {
			result.push_back(binding.description());
		}
		return result;
	}

	std::vector<VkVertexInputAttributeDescription> VertexInputBuilder::attribute_descriptions() const {
		std::vector<VkVertexInputAttributeDescription> result;
		for (const auto& binding : bindings) {
			result.insert(result.end(), binding.get_attributes().begin(), binding.get_attributes().end());
		}
		return result;
	}

	static VkPipelineLayout create_pipeline_layout(VkDevice device, std::span<const std::shared_ptr<SetLayout>> layouts) {
		std::vector<VkDescriptorSetLayout> handles;
		handles.reserve(layouts.size());
		for (const auto& layout : layouts) {
			handles.push_back(layout->get());
		}

		VkPipelineLayoutCreateInfo layout_info{};
		layout_info.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
		layout_info.setLayoutCount = static_cast<uint32_t>(handles.size());
		layout_info.pSetLayouts = handles.data();

		VkPipelineLayout layout = VK_NULL_HANDLE;
		vk_check(vkCreatePipelineLayout(device, &layout_info, nullptr, &layout), Subsystem::Pipeline, "failed to create pipeline layout");
		return layout;
	}

	GraphicsPipeline::GraphicsPipeline(const Device& device,
		const Renderpass& renderpass,
		const GraphicsPipelineDesc& desc,
		std::span<const std::shared_ptr<SetLayout>> layouts,
		const VertexInputBuilder& vertex_input)
		: device(device.get()), set_layouts(layouts.begin(), layouts.end()) {
		if (!desc.vertex || !desc.fragment) {
			throw std::invalid_argument("[Pipeline] Graphics pipeline requires a vertex and a fragment shader");
		}

		layout = create_pipeline_layout(this->device, layouts);

		VkPipelineShaderStageCreateInfo shader_stages[] = { desc.vertex->stage_info(), desc.fragment->stage_info() };

		auto binding_descriptions = vertex_input.binding_descriptions();
		auto attribute_descriptions = vertex_input.attribute_descriptions();

		VkPipelineVertexInputStateCreateInfo vertex_input_info{};
		vertex_input_info.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
		vertex_input_info.vertexBindingDescriptionCount = static_cast<uint32_t>(binding_descriptions.size());
		vertex_input_info.pVertexBindingDescriptions = binding_descriptions.data();
		vertex_input_info.vertexAttributeDescriptionCount = static_cast<uint32_t>(attribute_descriptions.size());
		vertex_input_info.pVertexAttributeDescriptions = attribute_descriptions.data();

		VkPipelineInputAssemblyStateCreateInfo input_assembly{};
		input_assembly.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
		input_assembly.topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
		input_assembly.primitiveRestartEnable = VK_FALSE;

		// viewport 与 scissor 固定在创建时的尺寸，交换链重建时整个管线重建
		VkViewport viewport{};
		viewport.x = 0.0f;
		viewport.y = 0.0f;
		viewport.width = static_cast<float>(desc.extent.width);
		viewport.height = static_cast<float>(desc.extent.height);
		viewport.minDepth = 0.0f;
		viewport.maxDepth = 1.0f;

		VkRect2D scissor{};
		scissor.offset = { 0, 0 };
		scissor.extent = desc.extent;

		VkPipelineViewportStateCreateInfo viewport_state{};
		viewport_state.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
		viewport_state.viewportCount = 1;
		viewport_state.pViewports = &viewport;
		viewport_state.scissorCount = 1;
		viewport_state.pScissors = &scissor;

		VkPipelineRasterizationStateCreateInfo rasterizer{};
		rasterizer.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
		rasterizer.depthClampEnable = VK_FALSE;
		rasterizer.rasterizerDiscardEnable = VK_FALSE;
		rasterizer.polygonMode = VK_POLYGON_MODE_FILL;
		rasterizer.lineWidth = 1.0f;
		rasterizer.cullMode = desc.cull_back_faces ? VK_CULL_MODE_BACK_BIT : VK_CULL_MODE_NONE;
		rasterizer.frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;
		rasterizer.depthBiasEnable = VK_FALSE;

		VkPipelineMultisampleStateCreateInfo multisampling{};
		multisampling.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
		multisampling.sampleShadingEnable = VK_FALSE;
		multisampling.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

		VkPipelineDepthStencilStateCreateInfo depth_stencil{};
		depth_stencil.sType = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
		depth_stencil.depthTestEnable = desc.depth_test ? VK_TRUE : VK_FALSE;
		depth_stencil.depthWriteEnable = desc.depth_test ? VK_TRUE : VK_FALSE;
		depth_stencil.depthCompareOp = VK_COMPARE_OP_LESS;
		depth_stencil.depthBoundsTestEnable = VK_FALSE;
		depth_stencil.stencilTestEnable = VK_FALSE;

		VkPipelineColorBlendAttachmentState color_blend_attachment{};
		color_blend_attachment.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT | VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
		color_blend_attachment.blendEnable = VK_FALSE;

		VkPipelineColorBlendStateCreateInfo color_blending{};
		color_blending.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
		color_blending.logicOpEnable = VK_FALSE;
		color_blending.attachmentCount = 1;
		color_blending.pAttachments = &color_blend_attachment;

		VkGraphicsPipelineCreateInfo pipeline_info{};
		pipeline_info.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
		pipeline_info.stageCount = 2;
		pipeline_info.pStages = shader_stages;
		pipeline_info.pVertexInputState = &vertex_input_info;
		pipeline_info.pInputAssemblyState = &input_assembly;
		pipeline_info.pViewportState = &viewport_state;
		pipeline_info.pRasterizationState = &rasterizer;
		pipeline_info.pMultisampleState = &multisampling;
		pipeline_info.pDepthStencilState = renderpass.has_depth() ? &depth_stencil : nullptr;
		pipeline_info.pColorBlendState = &color_blending;
		pipeline_info.layout = layout;
		pipeline_info.renderPass = renderpass.get();
		pipeline_info.subpass = desc.subpass;
		pipeline_info.basePipelineHandle = VK_NULL_HANDLE;
		pipeline_info.basePipelineIndex = -1;

		VkResult result = vkCreateGraphicsPipelines(this->device, VK_NULL_HANDLE, 1, &pipeline_info, nullptr, &pipeline);
		if (result != VK_SUCCESS) {
			vkDestroyPipelineLayout(this->device, layout, nullptr);
			throw ResourceError(Subsystem::Pipeline, result, "failed to create graphics pipeline");
		}
	}

	GraphicsPipeline::~GraphicsPipeline() {
		if (pipeline) vkDestroyPipeline(device, pipeline, nullptr);
		if (layout) vkDestroyPipelineLayout(device, layout, nullptr);
	}

	ComputePipeline::ComputePipeline(const Device& device, const Shader& shader, std::span<const std::shared_ptr<SetLayout>> layouts)
		: device(device.get()), set_layouts(layouts.begin(), layouts.end()) {
		if (shader.get_stage() != VK_SHADER_STAGE_COMPUTE_BIT) {
			throw std::invalid_argument("[Pipeline] Compute pipeline requires a compute shader");
		}

		layout = create_pipeline_layout(this->device, layouts);

		VkComputePipelineCreateInfo pipeline_info{};
		pipeline_info.sType = VK_STRUCTURE_TYPE_COMPUTE_PIPELINE_CREATE_INFO;
		pipeline_info.stage = shader.stage_info();
		pipeline_info.layout = layout;
		pipeline_info.basePipelineHandle = VK_NULL_HANDLE;
		pipeline_info.basePipelineIndex = -1;

		VkResult result = vkCreateComputePipelines(this->device, VK_NULL_HANDLE, 1, &pipeline_info, nullptr, &pipeline);
		if (result != VK_SUCCESS) {
			vkDestroyPipelineLayout(this->device, layout, nullptr);
			throw ResourceError(Subsystem::Pipeline, result, "failed to create compute pipeline");
		}
	}

	ComputePipeline::~ComputePipeline() {
		if (pipeline) vkDestroyPipeline(device, pipeline, nullptr);
		if (layout) vkDestroyPipelineLayout(device, layout, nullptr);
	}
}
