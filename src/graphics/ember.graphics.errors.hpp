#pragma once

#include <string>
#include <format>
#include <stdexcept>
#include <string_view>

#include <vulkan/vulkan.h>

namespace ember::graphics {

	enum class AllocationErrorKind {
		NoCompatibleHeap,
		OutOfRegion,
		Overflow,
		DoubleFree,
		UnknownAllocation,
	};

	enum class Subsystem {
		Instance,
		Device,
		Surface,
		Swapchain,
		Memory,
		Buffer,
		Image,
		Descriptor,
		Command,
		Pipeline,
		Renderpass,
		Sync,
		Shader,
	};

	enum class FrameErrorKind {
		FenceTimeout,
		DeviceLost,
	};

	constexpr std::string_view to_string(AllocationErrorKind kind) {
		switch (kind) {
		case AllocationErrorKind::NoCompatibleHeap: return "NoCompatibleHeap";
		case AllocationErrorKind::OutOfRegion: return "OutOfRegion";
		case AllocationErrorKind::Overflow: return "Overflow";
		case AllocationErrorKind::DoubleFree: return "DoubleFree";
		case AllocationErrorKind::UnknownAllocation: return "UnknownAllocation";
		}
		return "Unknown";
	}

	constexpr std::string_view to_string(Subsystem subsystem) {
		switch (subsystem) {
		case Subsystem::Instance: return "Instance";
		case Subsystem::Device: return "Device";
		case Subsystem::Surface: return "Surface";
		case Subsystem::Swapchain: return "Swapchain";
		case Subsystem::Memory: return "Memory";
		case Subsystem::Buffer: return "Buffer";
		case Subsystem::Image: return "Image";
		case Subsystem::Descriptor: return "Descriptor";
		case Subsystem::Command: return "Command";
		case Subsystem::Pipeline: return "Pipeline";
		case Subsystem::Renderpass: return "Renderpass";
		case Subsystem::Sync: return "Sync";
		case Subsystem::Shader: return "Shader";
		}
		return "Unknown";
	}

	class AllocationError : public std::runtime_error {
	public:
		AllocationError(AllocationErrorKind kind, const std::string& message)
			: std::runtime_error(std::format("[Memory] {}: {}", to_string(kind), message)), error_kind(kind) {
		}

		AllocationErrorKind kind() const noexcept { return error_kind; }

	private:
		AllocationErrorKind error_kind;
	};

	class ResourceError : public std::runtime_error {
	public:
		ResourceError(Subsystem subsystem, VkResult result, const std::string& message)
			: std::runtime_error(std::format("[{}] {} (VkResult {})", to_string(subsystem), message, static_cast<int>(result))),
			  error_subsystem(subsystem), error_result(result) {
		}

		Subsystem subsystem() const noexcept { return error_subsystem; }
		VkResult result() const noexcept { return error_result; }

	private:
		Subsystem error_subsystem;
		VkResult error_result;
	};

	class FrameError : public std::runtime_error {
	public:
		FrameError(FrameErrorKind kind, const std::string& message)
			: std::runtime_error(std::format("[Frame] {}", message)), error_kind(kind) {
		}

		FrameErrorKind kind() const noexcept { return error_kind; }

	private:
		FrameErrorKind error_kind;
	};

	inline void vk_check(VkResult result, Subsystem subsystem, const char* what) {
		if (result != VK_SUCCESS) {
			throw ResourceError(subsystem, result, what);
		}
	}
}
