#pragma once

#include <span>
#include <memory>

#include <vulkan/vulkan.h>

#include "src/graphics/vulkan/ember.vulkan.device.hpp"

namespace ember::graphics::vulkan {

	class Framebuffer {
	public:
		Framebuffer(VkDevice device, VkFramebuffer framebuffer, VkExtent2D extent)
			: device(device), framebuffer(framebuffer), extent(extent) {
		}
		~Framebuffer();

		Framebuffer(const Framebuffer&) = delete;
		Framebuffer& operator=(const Framebuffer&) = delete;

		VkFramebuffer get() const { return framebuffer; }
		VkExtent2D get_extent() const { return extent; }

	private:
		VkDevice device;
		VkFramebuffer framebuffer;
		VkExtent2D extent;
	};

	class Renderpass {
		struct Token {
			explicit Token() = default;
		};

	public:
		// 单颜色附件，两个 subpass (upscale + overlay)，最终为 PRESENT_SRC
		static std::unique_ptr<Renderpass> new_upscale_ui(const Device& device, VkFormat color_format);

		// 只能经由 new_* 构造
		Renderpass(Token, VkDevice device, VkRenderPass renderpass, uint32_t subpasses, bool depth)
			: device(device), renderpass(renderpass), subpasses(subpasses), depth(depth) {
		}
		~Renderpass();

		Renderpass(const Renderpass&) = delete;
		Renderpass& operator=(const Renderpass&) = delete;

		std::unique_ptr<Framebuffer> create_framebuffer(uint32_t width, uint32_t height, std::span<const VkImageView> attachments) const;

		VkRenderPass get() const { return renderpass; }
		uint32_t subpass_count() const { return subpasses; }
		bool has_depth() const { return depth; }

	private:
		VkDevice device;
		VkRenderPass renderpass;
		uint32_t subpasses;
		bool depth;
	};
}
