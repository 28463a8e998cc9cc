#pragma once

#include <chrono>

#include <vulkan/vulkan.h>

#include "src/core/ember.math.hpp"
#include "src/graphics/ember.graphics.types.hpp"

namespace ember::scene {

	// 等距正交相机：视野随交换链尺寸缩放
	class Camera {
	public:
		static constexpr float DEFAULT_ZOOM = 1000.0f;

		math::vec3 eye;
		math::vec3 target;
		math::vec3 world_up{ 0.0f, 1.0f, 0.0f };
		float zoom = DEFAULT_ZOOM;
		float near_plane = 0.1f;
		float far_plane = 100.0f;

		Camera();

		math::mat4 get_view_matrix() const;
		math::mat4 get_projection_matrix(VkExtent2D extent) const;

		graphics::CameraUniform get_uniform(VkExtent2D extent) const;
	};

	// 累计时间与帧间隔
	class Clock {
	public:
		using TimePoint = std::chrono::steady_clock::time_point;

		Clock();

		// 每帧开始调用一次
		void tick();
		void tick(TimePoint now);

		float get_time() const { return time; }
		float get_delta() const { return delta; }

		graphics::TimeUniform get_uniform() const { return { time, delta }; }

	private:
		TimePoint last_frame;
		float time = 0.0f;
		float delta = 0.0f;
	};
}
