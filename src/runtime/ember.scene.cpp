#include <cmath>
#include <algorithm>

#include "src/runtime/ember.scene.hpp"

namespace ember::scene {

	Camera::Camera()
		: eye(0.0f, 5.0f * std::tan(math::radians(35.264f)), 5.0f),
		  target(0.0f, 0.5f, 0.0f) {
	}

	math::mat4 Camera::get_view_matrix() const {
		return math::lookAt(eye, target, world_up);
	}

	math::mat4 Camera::get_projection_matrix(VkExtent2D extent) const {
		// 最小化时 extent 为 0
		float half_width = static_cast<float>(std::max(extent.width, 1u)) / zoom;
		float half_height = static_cast<float>(std::max(extent.height, 1u)) / zoom;
		return math::ortho_vk(-half_width, half_width, -half_height, half_height, near_plane, far_plane);
	}

	graphics::CameraUniform Camera::get_uniform(VkExtent2D extent) const {
		return { get_view_matrix(), get_projection_matrix(extent) };
	}

	Clock::Clock() : last_frame(std::chrono::steady_clock::now()) {
	}

	void Clock::tick() {
		tick(std::chrono::steady_clock::now());
	}

	void Clock::tick(TimePoint now) {
		// 断点或拖动窗口后不让动画跳帧
		delta = std::clamp(std::chrono::duration<float>(now - last_frame).count(), 0.0f, 0.25f);
		time += delta;
		last_frame = now;
	}
}
