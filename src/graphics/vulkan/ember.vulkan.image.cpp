#include "src/graphics/vulkan/ember.vulkan.image.hpp"
#include "src/graphics/vulkan/ember.vulkan.command.hpp"
#include "src/graphics/vulkan/ember.vulkan.context.hpp"

namespace ember::graphics::vulkan {

	Image::Image(Context& context, uint32_t width, uint32_t height, VkFormat format, VkImageUsageFlags usage)
		: context(context), format(format), extent{ width, height } {
		VkImageCreateInfo image_info{ VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO };
		image_info.imageType = VK_IMAGE_TYPE_2D;
		image_info.extent = { width, height, 1 };
		image_info.mipLevels = 1;
		image_info.arrayLayers = 1;
		image_info.format = format;
		image_info.tiling = VK_IMAGE_TILING_OPTIMAL;
		image_info.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
		image_info.usage = usage;
		image_info.samples = VK_SAMPLE_COUNT_1_BIT;
		image_info.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

		auto& allocator = context.get_allocator();
		resource = allocator.create_image(image_info, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT);
		memory = DeferredRelease(context.release_queue(), [&allocator, resource = resource]() {
			allocator.destroy_image(resource);
		});
	}

	Image::Image(Borrowed, Context& context, VkImage image, VkFormat format, VkExtent2D extent)
		: context(context), format(format), extent(extent) {
		resource.image = image;
	}

	std::unique_ptr<Image> Image::from_swapchain(Context& context, VkImage image, VkFormat format, VkExtent2D extent) {
		return std::make_unique<Image>(Borrowed{}, context, image, format, extent);
	}

	VkImageView Image::create_view() const {
		VkImageViewCreateInfo view_info{ VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO };
		view_info.image = resource.image;
		view_info.viewType = VK_IMAGE_VIEW_TYPE_2D;
		view_info.format = format;
		view_info.subresourceRange.aspectMask = command::aspect_for_format(format);
		view_info.subresourceRange.baseMipLevel = 0;
		view_info.subresourceRange.levelCount = 1;
		view_info.subresourceRange.baseArrayLayer = 0;
		view_info.subresourceRange.layerCount = 1;

		VkImageView view = VK_NULL_HANDLE;
		vk_check(vkCreateImageView(context.get_device().get(), &view_info, nullptr, &view), Subsystem::Image, "Failed to create image view");
		return view;
	}

	VkSampler create_sampler(const Device& device, VkFilter mag_filter, VkFilter min_filter) {
		VkSamplerCreateInfo sampler_info{ VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO };
		sampler_info.magFilter = mag_filter;
		sampler_info.minFilter = min_filter;
		sampler_info.addressModeU = VK_SAMPLER_ADDRESS_MODE_REPEAT;
		sampler_info.addressModeV = VK_SAMPLER_ADDRESS_MODE_REPEAT;
		sampler_info.addressModeW = VK_SAMPLER_ADDRESS_MODE_REPEAT;
		sampler_info.anisotropyEnable = device.supports_anisotropy() ? VK_TRUE : VK_FALSE;
		sampler_info.maxAnisotropy = device.supports_anisotropy() ? device.properties().limits.maxSamplerAnisotropy : 1.0f;
		sampler_info.borderColor = VK_BORDER_COLOR_INT_OPAQUE_BLACK;
		sampler_info.unnormalizedCoordinates = VK_FALSE;
		sampler_info.compareEnable = VK_FALSE;
		sampler_info.compareOp = VK_COMPARE_OP_ALWAYS;
		sampler_info.mipmapMode = VK_SAMPLER_MIPMAP_MODE_LINEAR;
		sampler_info.minLod = 0.0f;
		sampler_info.maxLod = 0.0f;

		VkSampler sampler = VK_NULL_HANDLE;
		vk_check(vkCreateSampler(device.get(), &sampler_info, nullptr, &sampler), Subsystem::Image, "Failed to create texture sampler");
		return sampler;
	}

	Texture::Texture(Context& context, std::shared_ptr<Image> image, VkFilter mag_filter, VkFilter min_filter)
		: image(std::move(image)) {
		VkDevice device = context.get_device().get();
		view = this->image->create_view();
		try {
			sampler = create_sampler(context.get_device(), mag_filter, min_filter);
		}
		catch (const ResourceError&) {
			vkDestroyImageView(device, view, nullptr);
			throw;
		}

		views = DeferredRelease(context.release_queue(), [device, view = view, sampler = sampler, image = this->image]() mutable {
			vkDestroySampler(device, sampler, nullptr);
			vkDestroyImageView(device, view, nullptr);
			image.reset();
		});
	}
}
