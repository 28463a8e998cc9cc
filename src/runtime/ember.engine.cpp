#include <print>
#include <thread>
#include <chrono>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#else
#define ZoneScoped
#define FrameMark
#endif

#include "src/runtime/ember.engine.hpp"
#include "src/graphics/ember.graphics.errors.hpp"

namespace ember::engine {

	Engine::Engine(const graphics::EngineConfig& config, const graphics::RenderConfig& render_config)
		: engine_config(config) {
		window = platform::create_window(engine_config.name, engine_config.width, engine_config.height);
		context = std::make_unique<graphics::vulkan::Context>(engine_config, *window);
		renderer = std::make_unique<graphics::Renderer>(*context, render_config);
	}

	Engine::~Engine() {
		// Renderer 的资源要进入 Context 的 release queue，窗口最后销毁
		renderer.reset();
		context.reset();
		window.reset();
	}

	bool Engine::run(const GameLogic& perform_game_logic) {
		try {
			while (!window->should_close()) {
				window->poll_events();
				if (window->consume_resized()) {
					renderer->request_recreate();
				}

				clock.tick();

				if (perform_game_logic) {
					perform_game_logic(clock.get_delta());
				}

				perform_rendering();

				FrameMark;
			}
		}
		catch (const graphics::ResourceError& e) {
			std::println(stderr, "[Engine] {} error, rendering stopped: {}", graphics::to_string(e.subsystem()), e.what());
			return false;
		}
		catch (const graphics::AllocationError& e) {
			std::println(stderr, "[Engine] Memory error ({}), rendering stopped: {}", graphics::to_string(e.kind()), e.what());
			return false;
		}
		catch (const graphics::FrameError& e) {
			std::println(stderr, "[Engine] Frame error, rendering stopped: {}", e.what());
			return false;
		}

		context->wait_idle();
		return true;
	}

	void Engine::perform_rendering() {
		ZoneScoped;

		auto status = renderer->render(camera.get_uniform(renderer->get_swapchain_extent()), clock.get_uniform());

		// 最小化时不占满 CPU
		if (status == graphics::FrameStatus::Deferred) {
			std::this_thread::sleep_for(std::chrono::milliseconds(16));
		}
	}
}
