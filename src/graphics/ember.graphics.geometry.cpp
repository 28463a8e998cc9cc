#include <cstring>
#include <unordered_map>

#include "src/graphics/ember.graphics.geometry.hpp"

namespace ember::graphics {

	template <typename T>
	static void append_bytes(std::vector<uint8_t>& out, const T& value) {
		size_t offset = out.size();
		out.resize(offset + sizeof(T));
		std::memcpy(out.data() + offset, &value, sizeof(T));
	}

	static void append_header(std::vector<uint8_t>& out, uint32_t count) {
		int32_t header[4] = { static_cast<int32_t>(count), 0, 0, 0 };
		append_bytes(out, header);
	}

	static void pad_empty(std::vector<uint8_t>& buffer) {
		if (buffer.empty()) {
			buffer.assign(MIN_GEOMETRY_BUFFER_SIZE, 0);
		}
	}

	void GeometryAggregator::add(const std::shared_ptr<Renderable>& renderable) {
		renderables.add(renderable);
	}

	void GeometryAggregator::add_light(const std::shared_ptr<Emissive>& emissive) {
		emissives.add(emissive);
	}

	math::AABB calculate_box(const Mesh& mesh, const math::mat4& transform) {
		math::AABB box;
		for (const auto& vertex : mesh.vertices) {
			math::vec4 p = transform * math::vec4(vertex.position, 1.0f);
			box.merge(math::vec3(p));
		}
		return box;
	}

	GeometryBuffers GeometryAggregator::aggregate() {
		std::vector<RenderObject> objects;
		for (const auto& renderable : renderables.lock_all()) {
			auto produced = renderable->get_objects();
			objects.insert(objects.end(), std::make_move_iterator(produced.begin()), std::make_move_iterator(produced.end()));
		}

		std::vector<Light> lights;
		for (const auto& emissive : emissives.lock_all()) {
			auto produced = emissive->get_lights();
			lights.insert(lights.end(), produced.begin(), produced.end());
		}

		GeometryBuffers out;
		std::vector<MeshData> meshes;
		meshes.reserve(objects.size());

		// 同一个 Mesh 只写入一次顶点和索引
		std::unordered_map<const Mesh*, int32_t> mesh_to_index;
		uint32_t vertex_count = 0;
		uint32_t index_count = 0;

		for (const auto& object : objects) {
			if (!object.mesh) continue;

			const Mesh* mesh = object.mesh.get();
			auto [it, inserted] = mesh_to_index.try_emplace(mesh, static_cast<int32_t>(index_count));
			if (inserted) {
				for (uint32_t index : mesh->indices) {
					int32_t padded[4] = { static_cast<int32_t>(index + vertex_count), 0, 0, 0 };
					append_bytes(out.indices, padded);
				}
				for (const auto& vertex : mesh->vertices) {
					append_bytes(out.vertices, vertex);
				}
				index_count += static_cast<uint32_t>(mesh->indices.size());
				vertex_count += static_cast<uint32_t>(mesh->vertices.size());
			}

			math::mat4 matrix = object.transform.get_matrix();
			math::AABB box = calculate_box(*mesh, matrix);

			MeshData data;
			data.first_index = it->second;
			data.num_indices = static_cast<int32_t>(mesh->indices.size());
			data.material = static_cast<int32_t>(meshes.size());
			data.min_aabb = box.min;
			data.max_aabb = box.max;
			data.transform = matrix;
			meshes.push_back(data);

			append_bytes(out.materials, object.material);
		}

		out.mesh_count = static_cast<uint32_t>(meshes.size());
		append_header(out.meshes, out.mesh_count);
		for (const auto& data : meshes) {
			append_bytes(out.meshes, data);
		}

		out.light_count = static_cast<uint32_t>(lights.size());
		append_header(out.lights, out.light_count);
		for (const auto& light : lights) {
			LightData data;
			data.position = light.position;
			data.strength = light.strength;
			data.color = light.color;
			append_bytes(out.lights, data);
		}

		pad_empty(out.vertices);
		pad_empty(out.indices);
		pad_empty(out.materials);

		return out;
	}
}
