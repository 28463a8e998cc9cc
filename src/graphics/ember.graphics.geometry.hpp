#pragma once

#include <memory>
#include <vector>
#include <cstdint>

#include "src/core/ember.math.hpp"
#include "src/graphics/ember.graphics.scene.hpp"

namespace ember::graphics {

	// GPU 布局, begin
	struct MeshData {
		int32_t first_index = 0;
		int32_t num_indices = 0;
		int32_t material = 0;
		int32_t pad0 = 0;
		math::vec3 min_aabb{ 0.0f };
		float pad1 = 0.0f;
		math::vec3 max_aabb{ 0.0f };
		float pad2 = 0.0f;
		math::mat4 transform{ 1.0f };
	};
	static_assert(sizeof(MeshData) == 112);

	struct LightData {
		math::vec3 position{ 0.0f };
		float strength = 0.0f;
		math::vec3 color{ 0.0f };
		float pad = 0.0f;
	};
	static_assert(sizeof(LightData) == 32);
	// GPU 布局, end

	// 空缓冲以 16 字节的 0 上传
	constexpr size_t MIN_GEOMETRY_BUFFER_SIZE = 16;

	// 与 compute shader 中 binding 1..5 一一对应
	struct GeometryBuffers {
		std::vector<uint8_t> vertices;   // binding 1
		std::vector<uint8_t> indices;    // binding 2, [index, 0, 0, 0]
		std::vector<uint8_t> meshes;     // binding 3, header [count, 0, 0, 0]
		std::vector<uint8_t> materials;  // binding 4
		std::vector<uint8_t> lights;     // binding 5, header [count, 0, 0, 0]

		uint32_t mesh_count = 0;
		uint32_t light_count = 0;
	};

	// 每帧把所有存活的 Renderable / Emissive 拍平成 GPU 缓冲
	class GeometryAggregator {
	public:
		void add(const std::shared_ptr<Renderable>& renderable);
		void add_light(const std::shared_ptr<Emissive>& emissive);

		GeometryBuffers aggregate();

		size_t renderable_count() const { return renderables.size(); }
		size_t emissive_count() const { return emissives.size(); }

	private:
		WeakRegistry<Renderable> renderables;
		WeakRegistry<Emissive> emissives;
	};

	// 按 transform 变换每个顶点后求包围盒
	math::AABB calculate_box(const Mesh& mesh, const math::mat4& transform);
}
