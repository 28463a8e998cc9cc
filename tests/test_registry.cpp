#include <stdexcept>

#include <gtest/gtest.h>

#include "src/graphics/ember.graphics.registry.hpp"

using ember::graphics::Registry;

namespace {
	struct Blob {
		std::string name;
	};
}

TEST(Registry, SecondLookupHitsTheCache) {
	int loads = 0;
	Registry<Blob> registry([&](const std::string& path) {
		++loads;
		return std::make_shared<Blob>(Blob{ path });
	});

	auto first = registry.get("geometry.comp.spv");
	auto second = registry.get("geometry.comp.spv");

	EXPECT_EQ(loads, 1);
	EXPECT_EQ(first, second);
	EXPECT_EQ(first->name, "geometry.comp.spv");
	EXPECT_TRUE(registry.contains("geometry.comp.spv"));
}

TEST(Registry, DistinctPathsLoadSeparately) {
	int loads = 0;
	Registry<Blob> registry([&](const std::string& path) {
		++loads;
		return std::make_shared<Blob>(Blob{ path });
	});

	auto vert = registry.get("upscale.vert.spv");
	auto frag = registry.get("upscale.frag.spv");

	EXPECT_EQ(loads, 2);
	EXPECT_NE(vert, frag);
	EXPECT_EQ(registry.size(), 2u);
}

TEST(Registry, FailedLoadIsNotCached) {
	bool fail = true;
	Registry<Blob> registry([&](const std::string& path) -> std::shared_ptr<Blob> {
		if (fail) throw std::runtime_error("missing " + path);
		return std::make_shared<Blob>(Blob{ path });
	});

	EXPECT_THROW(registry.get("ui.comp.spv"), std::runtime_error);
	EXPECT_FALSE(registry.contains("ui.comp.spv"));

	fail = false;
	EXPECT_NE(registry.get("ui.comp.spv"), nullptr);
	EXPECT_TRUE(registry.contains("ui.comp.spv"));
}

TEST(Registry, ClearDropsCachedEntries) {
	int loads = 0;
	Registry<Blob> registry([&](const std::string& path) {
		++loads;
		return std::make_shared<Blob>(Blob{ path });
	});

	auto held = registry.get("a");
	registry.clear();
	EXPECT_EQ(registry.size(), 0u);

	auto reloaded = registry.get("a");
	EXPECT_EQ(loads, 2);
	EXPECT_NE(held, reloaded);
	EXPECT_EQ(held->name, "a");
}
