#pragma once

#include <memory>
#include <cstdint>

#include <vulkan/vulkan.h>

#include "src/graphics/ember.graphics.types.hpp"
#include "src/graphics/ember.graphics.release.hpp"
#include "src/graphics/vulkan/ember.vulkan.allocator.hpp"

namespace ember::graphics::vulkan {

	class Context;

	// GPU-only 2D 图像；交换链图像是借用的，不拥有内存
	class Image {
		struct Borrowed {
			explicit Borrowed() = default;
		};

	public:
		Image(Context& context, uint32_t width, uint32_t height, VkFormat format, VkImageUsageFlags usage);
		Image(Borrowed, Context& context, VkImage image, VkFormat format, VkExtent2D extent);

		static std::unique_ptr<Image> from_swapchain(Context& context, VkImage image, VkFormat format, VkExtent2D extent);

		Image(const Image&) = delete;
		Image& operator=(const Image&) = delete;

		// 调用方负责销毁返回的 view
		VkImageView create_view() const;

		VkImage get() const { return resource.image; }
		VkFormat get_format() const { return format; }
		VkExtent2D get_extent() const { return extent; }
		bool is_borrowed() const { return !memory.owns(); }

		ImageRef ref() const { return { resource.image, format, extent }; }

	private:
		Context& context;
		ImageAllocation resource;
		VkFormat format;
		VkExtent2D extent;
		DeferredRelease memory;
	};

	// repeat 寻址，设备支持时开启各向异性
	VkSampler create_sampler(const Device& device, VkFilter mag_filter, VkFilter min_filter);

	// 共享的 Image + 自己的 view 和 sampler，不会重新分配显存
	class Texture {
	public:
		Texture(Context& context, std::shared_ptr<Image> image, VkFilter mag_filter, VkFilter min_filter);

		Texture(const Texture&) = delete;
		Texture& operator=(const Texture&) = delete;

		const Image& get_image() const { return *image; }
		const std::shared_ptr<Image>& get_shared_image() const { return image; }
		VkImageView get_view() const { return view; }
		VkSampler get_sampler() const { return sampler; }

	private:
		std::shared_ptr<Image> image;
		VkImageView view = VK_NULL_HANDLE;
		VkSampler sampler = VK_NULL_HANDLE;
		// 持有 image 的一个引用，最后一个 Texture 释放后才轮到 Image 的内存
		DeferredRelease views;
	};
}
