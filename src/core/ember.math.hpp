#pragma once

#include <limits>
#include <algorithm>

// 集中管理 GLM 依赖
#define GLM_FORCE_RADIANS
#define GLM_FORCE_DEPTH_ZERO_TO_ONE

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

namespace ember::math {
	using vec2 = glm::vec2;
	using vec3 = glm::vec3;
	using vec4 = glm::vec4;

	using mat3 = glm::mat3;
	using mat4 = glm::mat4;

	using quat = glm::quat;

	using glm::radians;
	using glm::lookAt;
	using glm::normalize;
	using glm::cross;
	using glm::dot;
	using glm::length;
	using glm::inverse;
	using glm::transpose;

	using glm::translate;
	using glm::rotate;
	using glm::scale;
	using glm::angleAxis;
	using glm::mat4_cast;

	constexpr float PI = 3.14159265358979323846f;

	inline mat4 ortho_vk(float left, float right, float bottom, float top, float near_plane, float far_plane) {
		mat4 proj = glm::ortho(left, right, bottom, top, near_plane, far_plane);
		proj[1][1] *= -1; // Vulkan Y-flip
		return proj;
	}

	inline mat4 perspective_vk(float fov, float aspect, float near_plane, float far_plane) {
		mat4 proj = glm::perspective(glm::radians(fov), aspect, near_plane, far_plane);
		proj[1][1] *= -1;
		return proj;
	}

	struct AABB {
		vec3 min{ std::numeric_limits<float>::max() };
		vec3 max{ std::numeric_limits<float>::lowest() };

		inline void merge(const vec3& p) {
			min = glm::min(min, p);
			max = glm::max(max, p);
		}

		inline void merge(const AABB& other) {
			min = glm::min(min, other.min);
			max = glm::max(max, other.max);
		}

		inline bool is_empty() const { return min.x > max.x || min.y > max.y || min.z > max.z; }
		inline vec3 center() const { return (min + max) * 0.5f; }
		inline vec3 size() const { return max - min; }
	};

	// 平移 + 旋转 + 缩放，矩阵顺序为 T * R * S
	struct Transform {
		vec3 translation{ 0.0f };
		quat rotation{ 1.0f, 0.0f, 0.0f, 0.0f };
		vec3 scale{ 1.0f };

		inline mat4 get_matrix() const {
			mat4 m = glm::translate(mat4(1.0f), translation);
			m = m * glm::mat4_cast(rotation);
			return glm::scale(m, scale);
		}

		// parent.combine(child): child 先应用
		inline Transform combine(const Transform& child) const {
			Transform result;
			result.scale = scale * child.scale;
			result.rotation = rotation * child.rotation;
			result.translation = translation + rotation * (scale * child.translation);
			return result;
		}

		static Transform identity() { return {}; }
	};
}
