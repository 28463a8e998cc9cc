#pragma once

#include <memory>
#include <vector>
#include <cstdint>

#include "src/core/ember.math.hpp"

namespace ember::graphics {

	// GPU 端布局 (std430)，字段顺序即为 shader 中的顺序
	struct Vertex {
		math::vec3 position{ 0.0f };
		float u = 0.0f;
		math::vec3 normal{ 0.0f, 1.0f, 0.0f };
		float v = 0.0f;
	};
	static_assert(sizeof(Vertex) == 32);

	struct Material {
		math::vec3 albedo{ 1.0f };
		float roughness = 1.0f;
		float metalness = 0.0f;
		float pad[3] = { 0.0f, 0.0f, 0.0f };
	};
	static_assert(sizeof(Material) == 32);

	struct Mesh {
		std::vector<Vertex> vertices;
		std::vector<uint32_t> indices;
	};

	struct Light {
		math::vec3 position{ 0.0f };
		float strength = 1.0f;
		math::vec3 color{ 1.0f };
	};

	// 每帧由 Renderable 产出，拍平后即丢弃
	struct RenderObject {
		std::shared_ptr<const Mesh> mesh;
		Material material;
		math::Transform transform;
	};

	class Renderable {
	public:
		virtual ~Renderable() = default;
		virtual std::vector<RenderObject> get_objects() const = 0;
	};

	class Emissive {
	public:
		virtual ~Emissive() = default;
		virtual std::vector<Light> get_lights() const = 0;
	};

	// 只持有弱引用，lock_all() 时顺带清理已经销毁的对象
	template <typename T>
	class WeakRegistry {
	public:
		void add(const std::shared_ptr<T>& object) {
			entries.push_back(object);
		}

		std::vector<std::shared_ptr<T>> lock_all() {
			std::vector<std::shared_ptr<T>> alive;
			alive.reserve(entries.size());

			auto it = entries.begin();
			while (it != entries.end()) {
				if (auto strong = it->lock()) {
					alive.push_back(std::move(strong));
					++it;
				}
				else {
					it = entries.erase(it);
				}
			}
			return alive;
		}

		size_t size() const { return entries.size(); }

	private:
		std::vector<std::weak_ptr<T>> entries;
	};
}
