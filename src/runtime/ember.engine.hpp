#pragma once

#include <memory>
#include <functional>

#include "src/runtime/ember.scene.hpp"
#include "src/platform/ember.platform.hpp"

#include "src/graphics/ember.graphics.types.hpp"
#include "src/graphics/ember.graphics.renderer.hpp"
#include "src/graphics/vulkan/ember.vulkan.context.hpp"

namespace ember::engine {

	class Engine {
	public:
		using GameLogic = std::function<void(float delta_time)>;

		Engine(const graphics::EngineConfig& config, const graphics::RenderConfig& render_config = {});
		~Engine();

		Engine(const Engine&) = delete;
		Engine& operator=(const Engine&) = delete;

		// 窗口关闭时返回 true；渲染出现不可恢复的错误时记录日志并返回 false
		bool run(const GameLogic& perform_game_logic);

		auto& get_renderer() { return *renderer; }
		auto& get_context() { return *context; }
		auto& get_camera() { return camera; }
		const auto& get_clock() const { return clock; }
		const auto& get_engine_config() const { return engine_config; }

	private:
		void perform_rendering();

		const graphics::EngineConfig engine_config;

		std::unique_ptr<platform::Window> window;
		std::unique_ptr<graphics::vulkan::Context> context;
		std::unique_ptr<graphics::Renderer> renderer;

		scene::Camera camera;
		scene::Clock clock;
	};
}
