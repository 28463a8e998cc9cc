#pragma once

#include <cstdint>
#include <string>

#include <vulkan/vulkan.h>

#include "src/core/ember.math.hpp"

namespace ember::graphics {
	// Enum, begin
	enum class ResourceState {
		Undefined,
		StorageWrite,      // Compute Shader Write (Storage Image, GENERAL)
		ComputeRead,       // Compute Shader Sampled Read
		FragmentRead,      // Fragment Shader Sampled Read
		ColorAttachment,   // Color Attachment Write
		DepthAttachment,   // Depth Attachment Write
		TransferSrc,       // Copy / Blit Source
		TransferDst,       // Copy / Blit Dest
		Present,           // Swapchain Present
	};

	enum class SwapchainStatus {
		Ok,
		Suboptimal,
		OutOfDate,
	};

	enum class FrameStatus {
		Rendered,
		SwapchainRecreated,
		Deferred,          // 窗口最小化，跳过这一帧
	};
	// Enum, end

	// POD, begin
	struct EngineConfig {
		std::string name = "Ember";
		int width = 1280;
		int height = 720;
		bool enable_validation = true;

		// 每个 memory type 一个固定大小的堆
		uint64_t heap_size = 32ull * 1024 * 1024;

		// in-flight fence 的等待上限
		uint64_t fence_timeout_ms = 2000;

		// 低分辨率离屏渲染，最终由 PresentPass 放大到交换链
		uint32_t render_width = 480;
		uint32_t render_height = 270;

		std::string shader_dir = "shaders";
	};

	struct RenderConfig {
		math::vec4 clear_color = { 0.0f, 0.0f, 0.0f, 1.0f };
		VkFilter upscale_filter = VK_FILTER_NEAREST;
	};

	struct Region {
		VkDeviceSize offset = 0;
		VkDeviceSize size = 0;

		VkDeviceSize end() const { return offset + size; }
		bool overlaps(const Region& other) const {
			return offset < other.end() && other.offset < end();
		}
		bool operator==(const Region&) const = default;
	};

	struct Allocation {
		uint64_t id = 0;
		uint32_t heap_index = 0;
		Region region;

		bool is_valid() const { return id != 0; }
	};

	struct SwapchainInfo {
		VkExtent2D extent = { 0, 0 };
		VkFormat format = VK_FORMAT_UNDEFINED;
		uint32_t image_count = 0;

		bool is_renderable() const { return extent.width > 0 && extent.height > 0; }
	};

	struct TransitionLayoutOptions {
		VkImageLayout old_layout = VK_IMAGE_LAYOUT_UNDEFINED;
		VkImageLayout new_layout = VK_IMAGE_LAYOUT_UNDEFINED;
		VkAccessFlags source_access = 0;
		VkAccessFlags destination_access = 0;
		VkPipelineStageFlags source_stage = VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT;
		VkPipelineStageFlags destination_stage = VK_PIPELINE_STAGE_BOTTOM_OF_PIPE_BIT;
	};

	// 录制命令时引用一张图像所需的最少信息
	struct ImageRef {
		VkImage image = VK_NULL_HANDLE;
		VkFormat format = VK_FORMAT_UNDEFINED;
		VkExtent2D extent = { 0, 0 };
	};

	struct PipelineBinding {
		VkPipeline pipeline = VK_NULL_HANDLE;
		VkPipelineLayout layout = VK_NULL_HANDLE;
		VkPipelineBindPoint bind_point = VK_PIPELINE_BIND_POINT_GRAPHICS;
	};

	// compute shader 的 local_size 为 16x16
	constexpr uint32_t COMPUTE_GROUP_SIZE = 16;

	struct DispatchSize {
		uint32_t x = 0;
		uint32_t y = 0;
		uint32_t z = 1;
	};

	// 宽度向下取整，高度向上取整
	constexpr DispatchSize dispatch_size(VkExtent2D extent) {
		return { extent.width / COMPUTE_GROUP_SIZE, (extent.height + COMPUTE_GROUP_SIZE - 1) / COMPUTE_GROUP_SIZE, 1 };
	}

	struct DrawOptions {
		uint32_t vertex_count = 0;
		uint32_t index_count = 0;
		uint32_t instance_count = 1;
		uint32_t first_index = 0;
		int32_t vertex_offset = 0;
		uint32_t first_instance = 0;
	};
	// 每帧 uniform：set 0 binding 0
	struct CameraUniform {
		math::mat4 view{ 1.0f };
		math::mat4 proj{ 1.0f };
	};
	static_assert(sizeof(CameraUniform) == 128);

	// set 0 binding 1
	struct TimeUniform {
		float time = 0.0f;
		float delta = 0.0f;
	};
	static_assert(sizeof(TimeUniform) == 8);
	// POD, end
}
