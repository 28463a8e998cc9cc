#include "src/graphics/ember.graphics.errors.hpp"
#include "src/graphics/vulkan/ember.vulkan.renderpass.hpp"

namespace ember::graphics::vulkan {

	Framebuffer::~Framebuffer() {
		if (framebuffer) vkDestroyFramebuffer(device, framebuffer, nullptr);
	}

	static VkSubpassDependency color_output_dependency() {
		VkSubpassDependency dependency{};
		dependency.srcSubpass = 0;
		dependency.dstSubpass = 1;
		dependency.srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
		dependency.srcAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;
		dependency.dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
		dependency.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;
		return dependency;
	}

	static VkAttachmentDescription color_attachment(VkFormat format, VkImageLayout final_layout) {
		VkAttachmentDescription attachment{};
		attachment.format = format;
		attachment.samples = VK_SAMPLE_COUNT_1_BIT;
		attachment.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
		attachment.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
		attachment.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
		attachment.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
		attachment.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
		attachment.finalLayout = final_layout;
		return attachment;
	}

	std::unique_ptr<Renderpass> Renderpass::new_upscale_ui(const Device& device, VkFormat color_format) {
		VkAttachmentReference color_ref{ 0, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL };

		VkSubpassDescription subpasses[2]{};
		for (auto& subpass : subpasses) {
			subpass.pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
			subpass.colorAttachmentCount = 1;
			subpass.pColorAttachments = &color_ref;
		}

		VkAttachmentDescription attachment = color_attachment(color_format, VK_IMAGE_LAYOUT_PRESENT_SRC_KHR);
		VkSubpassDependency dependency = color_output_dependency();

		VkRenderPassCreateInfo create_info{ VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO };
		create_info.attachmentCount = 1;
		create_info.pAttachments = &attachment;
		create_info.subpassCount = 2;
		create_info.pSubpasses = subpasses;
		create_info.dependencyCount = 1;
		create_info.pDependencies = &dependency;

		VkRenderPass renderpass = VK_NULL_HANDLE;
		vk_check(vkCreateRenderPass(device.get(), &create_info, nullptr, &renderpass), Subsystem::Renderpass, "Failed to create upscale render pass");
		return std::make_unique<Renderpass>(Token{}, device.get(), renderpass, 2, false);
	}

	Renderpass::~Renderpass() {
		if (renderpass) vkDestroyRenderPass(device, renderpass, nullptr);
	}

	std::unique_ptr<Framebuffer> Renderpass::create_framebuffer(uint32_t width, uint32_t height, std::span<const VkImageView> attachments) const {
		VkFramebufferCreateInfo create_info{ VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO };
		create_info.renderPass = renderpass;
		create_info.attachmentCount = static_cast<uint32_t>(attachments.size());
		create_info.pAttachments = attachments.data();
		create_info.width = width;
		create_info.height = height;
		create_info.layers = 1;

		VkFramebuffer framebuffer = VK_NULL_HANDLE;
		vk_check(vkCreateFramebuffer(device, &create_info, nullptr, &framebuffer), Subsystem::Renderpass, "Failed to create framebuffer");
		return std::make_unique<Framebuffer>(device, framebuffer, VkExtent2D{ width, height });
	}
}
