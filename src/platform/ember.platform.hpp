#pragma once

#include <string>
#include <memory>
#include <cstdint>

#include <SDL3/SDL.h>
#include <vulkan/vulkan.h>

namespace ember::platform {

	class Window {
	public:
		virtual ~Window() = default;

		virtual SDL_Window* get_sdl_window() const = 0;
		virtual void get_size_in_pixels(int& width, int& height) const = 0;
		virtual bool should_close() const = 0;
		virtual void poll_events() = 0;

		// 自上次调用以来窗口尺寸是否变化
		virtual bool consume_resized() = 0;

		virtual void set_title(const std::string& title) = 0;

		// 失败抛出 std::runtime_error
		virtual VkSurfaceKHR create_surface(VkInstance instance) const = 0;

		VkExtent2D get_extent() const {
			int w = 0, h = 0;
			get_size_in_pixels(w, h);
			return { static_cast<uint32_t>(w > 0 ? w : 0), static_cast<uint32_t>(h > 0 ? h : 0) };
		}

		bool is_minimized() const {
			auto extent = get_extent();
			return extent.width == 0 || extent.height == 0;
		}
	};

	std::unique_ptr<Window> create_window(const std::string& title, int width, int height);
}
