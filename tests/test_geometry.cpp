#include <cstring>

#include <gtest/gtest.h>

#include "src/graphics/ember.graphics.geometry.hpp"

using namespace ember;
using namespace ember::graphics;

namespace {

	std::shared_ptr<const Mesh> make_triangle(float offset = 0.0f) {
		auto mesh = std::make_shared<Mesh>();
		mesh->vertices = {
			{ { 0.0f + offset, 0.0f, 0.0f } },
			{ { 1.0f + offset, 0.0f, 0.0f } },
			{ { 0.0f + offset, 1.0f, 0.0f } },
		};
		mesh->indices = { 0, 1, 2 };
		return mesh;
	}

	class StaticRenderable : public Renderable {
	public:
		std::vector<RenderObject> objects;
		std::vector<RenderObject> get_objects() const override { return objects; }
	};

	class StaticEmissive : public Emissive {
	public:
		std::vector<Light> lights;
		std::vector<Light> get_lights() const override { return lights; }
	};

	template <typename T>
	T read_at(const std::vector<uint8_t>& bytes, size_t offset) {
		T value{};
		std::memcpy(&value, bytes.data() + offset, sizeof(T));
		return value;
	}

	int32_t header_count(const std::vector<uint8_t>& bytes) {
		return read_at<int32_t>(bytes, 0);
	}

	MeshData mesh_at(const GeometryBuffers& buffers, size_t i) {
		return read_at<MeshData>(buffers.meshes, 16 + i * sizeof(MeshData));
	}

	int32_t index_at(const GeometryBuffers& buffers, size_t i) {
		return read_at<int32_t>(buffers.indices, i * 16);
	}
}

TEST(Geometry, EmptySceneProducesPaddedBuffers) {
	GeometryAggregator aggregator;
	auto out = aggregator.aggregate();

	EXPECT_EQ(out.mesh_count, 0u);
	EXPECT_EQ(out.light_count, 0u);
	EXPECT_EQ(out.vertices.size(), MIN_GEOMETRY_BUFFER_SIZE);
	EXPECT_EQ(out.indices.size(), MIN_GEOMETRY_BUFFER_SIZE);
	EXPECT_EQ(out.materials.size(), MIN_GEOMETRY_BUFFER_SIZE);
	ASSERT_EQ(out.meshes.size(), 16u);
	ASSERT_EQ(out.lights.size(), 16u);
	EXPECT_EQ(header_count(out.meshes), 0);
	EXPECT_EQ(header_count(out.lights), 0);
}

TEST(Geometry, AggregationIsIdempotent) {
	GeometryAggregator aggregator;
	auto renderable = std::make_shared<StaticRenderable>();
	renderable->objects.push_back({ make_triangle(), {}, {} });
	aggregator.add(renderable);

	auto first = aggregator.aggregate();
	auto second = aggregator.aggregate();

	EXPECT_EQ(first.vertices, second.vertices);
	EXPECT_EQ(first.indices, second.indices);
	EXPECT_EQ(first.meshes, second.meshes);
	EXPECT_EQ(first.materials, second.materials);
	EXPECT_EQ(first.lights, second.lights);
}

TEST(Geometry, DestroyedObjectsArePruned) {
	GeometryAggregator aggregator;
	auto keep = std::make_shared<StaticRenderable>();
	keep->objects.push_back({ make_triangle(), {}, {} });
	auto drop = std::make_shared<StaticRenderable>();
	drop->objects.push_back({ make_triangle(5.0f), {}, {} });
	auto light = std::make_shared<StaticEmissive>();
	light->lights.push_back({});

	aggregator.add(keep);
	aggregator.add(drop);
	aggregator.add_light(light);
	EXPECT_EQ(aggregator.aggregate().mesh_count, 2u);

	drop.reset();
	light.reset();
	auto out = aggregator.aggregate();

	EXPECT_EQ(out.mesh_count, 1u);
	EXPECT_EQ(header_count(out.meshes), 1);
	EXPECT_EQ(out.light_count, 0u);
	EXPECT_EQ(out.lights.size(), 16u);
	EXPECT_EQ(aggregator.renderable_count(), 1u);
	EXPECT_EQ(aggregator.emissive_count(), 0u);
}

TEST(Geometry, SharedMeshIsUploadedOnce) {
	GeometryAggregator aggregator;
	auto shared = make_triangle();
	auto other = make_triangle(3.0f);

	auto renderable = std::make_shared<StaticRenderable>();
	math::Transform moved;
	moved.translation = { 10.0f, 0.0f, 0.0f };
	renderable->objects.push_back({ shared, {}, {} });
	renderable->objects.push_back({ other, {}, {} });
	renderable->objects.push_back({ shared, {}, moved });
	aggregator.add(renderable);

	auto out = aggregator.aggregate();
	ASSERT_EQ(out.mesh_count, 3u);

	// 两个不同的 mesh: 6 个顶点, 6 个索引
	EXPECT_EQ(out.vertices.size(), 6 * sizeof(Vertex));
	EXPECT_EQ(out.indices.size(), 6u * 16u);

	auto a = mesh_at(out, 0);
	auto b = mesh_at(out, 1);
	auto c = mesh_at(out, 2);
	EXPECT_EQ(a.first_index, 0);
	EXPECT_EQ(b.first_index, 3);
	EXPECT_EQ(c.first_index, a.first_index);
	EXPECT_EQ(c.num_indices, 3);

	// 第二个 mesh 的索引按已写入的顶点数偏移
	EXPECT_EQ(index_at(out, 0), 0);
	EXPECT_EQ(index_at(out, 3), 3);
	EXPECT_EQ(index_at(out, 5), 5);
	EXPECT_EQ(read_at<int32_t>(out.indices, 3 * 16 + 4), 0);

	EXPECT_FLOAT_EQ(c.min_aabb.x, 10.0f);
	EXPECT_FLOAT_EQ(c.max_aabb.x, 11.0f);
}

TEST(Geometry, MaterialIndexFollowsObjectOrder) {
	GeometryAggregator aggregator;
	auto renderable = std::make_shared<StaticRenderable>();

	Material red;
	red.albedo = { 1.0f, 0.0f, 0.0f };
	Material blue;
	blue.albedo = { 0.0f, 0.0f, 1.0f };
	renderable->objects.push_back({ make_triangle(), red, {} });
	renderable->objects.push_back({ make_triangle(), blue, {} });
	aggregator.add(renderable);

	auto out = aggregator.aggregate();
	ASSERT_EQ(out.materials.size(), 2 * sizeof(Material));
	EXPECT_EQ(mesh_at(out, 0).material, 0);
	EXPECT_EQ(mesh_at(out, 1).material, 1);

	auto second = read_at<Material>(out.materials, sizeof(Material));
	EXPECT_FLOAT_EQ(second.albedo.z, 1.0f);
	EXPECT_FLOAT_EQ(second.albedo.x, 0.0f);
}

TEST(Geometry, ObjectsWithoutMeshAreSkipped) {
	GeometryAggregator aggregator;
	auto renderable = std::make_shared<StaticRenderable>();
	renderable->objects.push_back({ nullptr, {}, {} });
	renderable->objects.push_back({ make_triangle(), {}, {} });
	aggregator.add(renderable);

	auto out = aggregator.aggregate();
	EXPECT_EQ(out.mesh_count, 1u);
	EXPECT_EQ(mesh_at(out, 0).material, 0);
}

TEST(Geometry, BoundingBoxUsesTransform) {
	Mesh mesh = *make_triangle();
	math::Transform transform;
	transform.translation = { 0.0f, 2.0f, 0.0f };
	transform.scale = { 2.0f, 2.0f, 2.0f };

	auto box = calculate_box(mesh, transform.get_matrix());
	EXPECT_FLOAT_EQ(box.min.x, 0.0f);
	EXPECT_FLOAT_EQ(box.max.x, 2.0f);
	EXPECT_FLOAT_EQ(box.min.y, 2.0f);
	EXPECT_FLOAT_EQ(box.max.y, 4.0f);
	EXPECT_FLOAT_EQ(box.min.z, 0.0f);
	EXPECT_FLOAT_EQ(box.max.z, 0.0f);
}

TEST(Geometry, LightsAreWrittenAfterHeader) {
	GeometryAggregator aggregator;
	auto emissive = std::make_shared<StaticEmissive>();
	Light light;
	light.position = { 1.0f, 2.0f, 3.0f };
	light.strength = 4.0f;
	light.color = { 0.5f, 0.25f, 1.0f };
	emissive->lights = { {}, light };
	aggregator.add_light(emissive);

	auto out = aggregator.aggregate();
	ASSERT_EQ(out.lights.size(), 16u + 2 * sizeof(LightData));
	EXPECT_EQ(header_count(out.lights), 2);
	EXPECT_EQ(read_at<int32_t>(out.lights, 4), 0);

	auto data = read_at<LightData>(out.lights, 16 + sizeof(LightData));
	EXPECT_FLOAT_EQ(data.position.y, 2.0f);
	EXPECT_FLOAT_EQ(data.strength, 4.0f);
	EXPECT_FLOAT_EQ(data.color.y, 0.25f);
}
