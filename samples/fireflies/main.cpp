#include <cmath>
#include <print>
#include <memory>
#include <random>
#include <vector>
#include <exception>

#include "src/runtime/ember.engine.hpp"
#include "src/graphics/ember.graphics.scene.hpp"

using namespace ember;

namespace {

	constexpr int NUM_FIREFLIES = 10;
	constexpr int NUM_CRATES = 3;

	std::shared_ptr<graphics::Mesh> make_cube(float half_extent) {
		auto mesh = std::make_shared<graphics::Mesh>();

		const math::vec3 normals[] = {
			{ 1, 0, 0 }, { -1, 0, 0 }, { 0, 1, 0 }, { 0, -1, 0 }, { 0, 0, 1 }, { 0, 0, -1 },
		};

		for (const auto& n : normals) {
			// 每个面独立的 4 个顶点，法线不共享
			math::vec3 tangent = std::abs(n.y) > 0.5f ? math::vec3(1, 0, 0) : math::vec3(0, 1, 0);
			math::vec3 bitangent = math::cross(n, tangent);

			auto base = static_cast<uint32_t>(mesh->vertices.size());
			const float corners[4][2] = { { -1, -1 }, { 1, -1 }, { 1, 1 }, { -1, 1 } };
			for (const auto& c : corners) {
				graphics::Vertex vertex;
				vertex.position = (n + tangent * c[0] + bitangent * c[1]) * half_extent;
				vertex.normal = n;
				vertex.u = (c[0] + 1.0f) * 0.5f;
				vertex.v = (c[1] + 1.0f) * 0.5f;
				mesh->vertices.push_back(vertex);
			}
			mesh->indices.insert(mesh->indices.end(), { base, base + 1, base + 2, base, base + 2, base + 3 });
		}
		return mesh;
	}

	std::shared_ptr<graphics::Mesh> make_plane(float half_extent) {
		auto mesh = std::make_shared<graphics::Mesh>();
		const float corners[4][2] = { { -1, -1 }, { 1, -1 }, { 1, 1 }, { -1, 1 } };
		for (const auto& c : corners) {
			graphics::Vertex vertex;
			vertex.position = { c[0] * half_extent, 0.0f, c[1] * half_extent };
			vertex.u = (c[0] + 1.0f) * 0.5f;
			vertex.v = (c[1] + 1.0f) * 0.5f;
			mesh->vertices.push_back(vertex);
		}
		mesh->indices = { 0, 2, 1, 0, 3, 2 };
		return mesh;
	}

	class Ground : public graphics::Renderable {
	public:
		explicit Ground(std::shared_ptr<const graphics::Mesh> mesh) : mesh(std::move(mesh)) {}

		std::vector<graphics::RenderObject> get_objects() const override {
			graphics::RenderObject object;
			object.mesh = mesh;
			object.material.albedo = { 0.25f, 0.45f, 0.2f };
			return { object };
		}

	private:
		std::shared_ptr<const graphics::Mesh> mesh;
	};

	class Crate : public graphics::Renderable {
	public:
		Crate(std::shared_ptr<const graphics::Mesh> mesh, math::vec3 position, math::vec3 color)
			: mesh(std::move(mesh)), color(color) {
			transform.translation = position;
		}

		void update(float delta_time) {
			angle += delta_time;
			transform.rotation = math::angleAxis(angle, math::vec3(0.0f, 1.0f, 0.0f));
		}

		std::vector<graphics::RenderObject> get_objects() const override {
			graphics::RenderObject object;
			object.mesh = mesh;
			object.material.albedo = color;
			object.transform = transform;
			return { object };
		}

	private:
		std::shared_ptr<const graphics::Mesh> mesh;
		math::vec3 color;
		math::Transform transform;
		float angle = 0.0f;
	};

	// 小方块 + 一个跟随的点光源，绕原点漂浮
	class Firefly : public graphics::Renderable, public graphics::Emissive {
	public:
		Firefly(std::shared_ptr<const graphics::Mesh> mesh, float radius, float phase, float speed, math::vec3 color)
			: mesh(std::move(mesh)), radius(radius), phase(phase), speed(speed), color(color) {
			update(0.0f);
		}

		void update(float delta_time) {
			phase += speed * delta_time;
			position = { radius * std::cos(phase), 0.35f + 0.1f * std::sin(phase * 3.0f), radius * std::sin(phase) };
		}

		std::vector<graphics::RenderObject> get_objects() const override {
			graphics::RenderObject object;
			object.mesh = mesh;
			object.material.albedo = color;
			object.material.metalness = 0.0f;
			object.transform.translation = position;
			return { object };
		}

		std::vector<graphics::Light> get_lights() const override {
			return { graphics::Light{ position, 0.6f, color } };
		}

	private:
		std::shared_ptr<const graphics::Mesh> mesh;
		float radius;
		float phase;
		float speed;
		math::vec3 color;
		math::vec3 position{ 0.0f };
	};
}

class GameApp {
public:
	void init(engine::Engine* engine_instance) {
		engine = engine_instance;
		auto& renderer = engine->get_renderer();

		auto cube = make_cube(0.1f);
		auto spark = make_cube(0.02f);

		ground = std::make_shared<Ground>(make_plane(1.5f));
		renderer.add(ground);

		for (int i = 0; i < NUM_CRATES; ++i) {
			float angle = 2.0f * math::PI * static_cast<float>(i) / NUM_CRATES;
			math::vec3 position = { 0.5f * std::cos(angle), 0.1f, 0.5f * std::sin(angle) };
			auto crate = std::make_shared<Crate>(cube, position, math::vec3(0.6f, 0.4f, 0.25f));
			renderer.add(crate);
			crates.push_back(std::move(crate));
		}

		std::mt19937 rng(1234);
		std::uniform_real_distribution<float> radius_dist(0.2f, 1.0f);
		std::uniform_real_distribution<float> phase_dist(0.0f, 2.0f * math::PI);
		std::uniform_real_distribution<float> speed_dist(0.3f, 1.2f);

		for (int i = 0; i < NUM_FIREFLIES; ++i) {
			auto firefly = std::make_shared<Firefly>(spark, radius_dist(rng), phase_dist(rng), speed_dist(rng), math::vec3(1.0f, 0.9f, 0.3f));
			renderer.add(firefly);
			renderer.add_light(firefly);
			fireflies.push_back(std::move(firefly));
		}

		std::println("[Game] Spawned {} crates and {} fireflies.", crates.size(), fireflies.size());
	}

	void update(float delta_time) {
		for (auto& crate : crates) crate->update(delta_time);
		for (auto& firefly : fireflies) firefly->update(delta_time);
	}

	void shutdown() {
		// 渲染端只持有弱引用，下一帧自动清理
		fireflies.clear();
		crates.clear();
		ground.reset();
		std::println("[Game] App shutting down.");
	}

private:
	engine::Engine* engine = nullptr;

	std::shared_ptr<Ground> ground;
	std::vector<std::shared_ptr<Crate>> crates;
	std::vector<std::shared_ptr<Firefly>> fireflies;
};

int main() {
	try {
		graphics::EngineConfig config;
		config.name = "Ember - Fireflies";
		config.width = 1280;
		config.height = 720;
#ifdef NDEBUG
		config.enable_validation = false;
#endif

		engine::Engine engine(config);

		GameApp app;
		app.init(&engine);

		bool ok = engine.run([&app](float delta_time) { app.update(delta_time); });

		app.shutdown();
		return ok ? 0 : 1;
	}
	catch (const std::exception& e) {
		std::println(stderr, "[Fatal] {}", e.what());
		return 1;
	}
}
