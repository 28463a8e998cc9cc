#include <print>
#include <format>
#include <string>
#include <memory>
#include <stdexcept>

#include <SDL3/SDL.h>
#include <SDL3/SDL_vulkan.h>

#include "src/platform/ember.platform.hpp"

namespace ember::platform {

	static std::string sdl_error() {
		auto err = SDL_GetError();
		return std::format("SDL Error: {}", (err && *err) ? err : "Unknown error");
	}

	class SDLWindow : public Window {
	public:
		SDLWindow(const std::string& title, int width, int height) {
			if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
				throw std::runtime_error("Failed to initialize SDL3: " + sdl_error());
			}

			window = SDL_CreateWindow(
				title.c_str(),
				width,
				height,
				SDL_WINDOW_VULKAN | SDL_WINDOW_HIDDEN | SDL_WINDOW_RESIZABLE
			);

			if (!window) {
				auto msg = sdl_error();
				std::println(stderr, "[Platform] CRITICAL FAILURE: {}", msg);
				SDL_Quit();
				throw std::runtime_error("Failed to create SDL window: " + msg);
			}

			SDL_ShowWindow(window);
			std::println("[Platform] Created window: {} ({}x{})", title, width, height);
		}

		~SDLWindow() override {
			if (window) {
				SDL_DestroyWindow(window);
				window = nullptr;
			}
			SDL_Quit();
		}

		SDL_Window* get_sdl_window() const override {
			return window;
		}

		void set_title(const std::string& title) override {
			if (window) {
				SDL_SetWindowTitle(window, title.c_str());
			}
		}

		void get_size_in_pixels(int& width_out, int& height_out) const override {
			width_out = 0;
			height_out = 0;
			if (!window) return;

			// 最小化时按 0 处理，交换链重建会被推迟
			if (SDL_GetWindowFlags(window) & SDL_WINDOW_MINIMIZED) return;

			if (!SDL_GetWindowSizeInPixels(window, &width_out, &height_out)) {
				SDL_GetWindowSize(window, &width_out, &height_out);
			}
		}

		bool should_close() const override {
			return close_requested;
		}

		bool consume_resized() override {
			bool value = resized;
			resized = false;
			return value;
		}

		void poll_events() override {
			SDL_Event event;
			while (SDL_PollEvent(&event)) {
				switch (event.type) {
				case SDL_EVENT_QUIT:
				case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
					close_requested = true;
					break;

				case SDL_EVENT_WINDOW_RESIZED:
				case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
				case SDL_EVENT_WINDOW_MINIMIZED:
				case SDL_EVENT_WINDOW_RESTORED:
					resized = true;
					break;

				case SDL_EVENT_KEY_DOWN:
					if (event.key.key == SDLK_ESCAPE)
						close_requested = true;
					break;
				}
			}
		}

		VkSurfaceKHR create_surface(VkInstance instance) const override {
			VkSurfaceKHR surface = VK_NULL_HANDLE;
			if (!SDL_Vulkan_CreateSurface(window, instance, nullptr, &surface)) {
				throw std::runtime_error("Failed to create Vulkan surface: " + sdl_error());
			}
			return surface;
		}

	private:
		SDL_Window* window = nullptr;
		bool close_requested = false;
		bool resized = false;
	};

	std::unique_ptr<Window> create_window(const std::string& title, int width, int height) {
		return std::make_unique<SDLWindow>(title, width, height);
	}
}
