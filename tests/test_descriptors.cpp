#include <array>
#include <stdexcept>

#include <gtest/gtest.h>

#include "src/graphics/ember.graphics.errors.hpp"
#include "src/graphics/ember.graphics.descriptors.hpp"

using namespace ember::graphics;

TEST(DescriptorPoolSizes, CountsEachTypeTimesCapacity) {
	std::array types = {
		VK_DESCRIPTOR_TYPE_STORAGE_IMAGE,
		VK_DESCRIPTOR_TYPE_STORAGE_BUFFER,
		VK_DESCRIPTOR_TYPE_STORAGE_BUFFER,
		VK_DESCRIPTOR_TYPE_STORAGE_BUFFER,
		VK_DESCRIPTOR_TYPE_STORAGE_BUFFER,
		VK_DESCRIPTOR_TYPE_STORAGE_BUFFER,
	};

	auto sizes = descriptor_pool_sizes(types, 3);
	ASSERT_EQ(sizes.size(), 2u);
	EXPECT_EQ(sizes[0].type, VK_DESCRIPTOR_TYPE_STORAGE_IMAGE);
	EXPECT_EQ(sizes[0].descriptorCount, 3u);
	EXPECT_EQ(sizes[1].type, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER);
	EXPECT_EQ(sizes[1].descriptorCount, 15u);
}

TEST(DescriptorPoolSizes, KeepsFirstSeenOrder) {
	std::array types = {
		VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER,
		VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER,
		VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER,
	};

	auto sizes = descriptor_pool_sizes(types, 1);
	ASSERT_EQ(sizes.size(), 2u);
	EXPECT_EQ(sizes[0].type, VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER);
	EXPECT_EQ(sizes[0].descriptorCount, 2u);
	EXPECT_EQ(sizes[1].type, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER);
	EXPECT_EQ(sizes[1].descriptorCount, 1u);
}

TEST(DescriptorPoolSizes, EmptyLayoutNeedsNothing) {
	EXPECT_TRUE(descriptor_pool_sizes({}, 4).empty());
}

TEST(DescriptorPoolSizes, ZeroCapacityIsRejected) {
	std::array types = { VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER };
	EXPECT_THROW(descriptor_pool_sizes(types, 0), std::invalid_argument);
}

TEST(DescriptorBindings, InRangeBindingReturnsItsType) {
	std::array types = {
		VK_DESCRIPTOR_TYPE_STORAGE_IMAGE,
		VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER,
	};
	EXPECT_EQ(binding_type(types, 0), VK_DESCRIPTOR_TYPE_STORAGE_IMAGE);
	EXPECT_EQ(binding_type(types, 1), VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER);
}

TEST(DescriptorBindings, OutOfRangeBindingIsRejected) {
	// UI 布局只有两个 binding
	std::array types = {
		VK_DESCRIPTOR_TYPE_STORAGE_IMAGE,
		VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER,
	};

	try {
		binding_type(types, 2);
		FAIL() << "expected ResourceError";
	}
	catch (const ResourceError& e) {
		EXPECT_EQ(e.subsystem(), Subsystem::Descriptor);
	}

	EXPECT_THROW(binding_type({}, 0), ResourceError);
}

TEST(DescriptorBudget, AllowsExactlyCapacitySets) {
	DescriptorBudget budget(2);
	budget.require_available();
	budget.consume();
	budget.require_available();
	budget.consume();
	EXPECT_EQ(budget.allocated(), 2u);

	try {
		budget.require_available();
		FAIL() << "expected ResourceError";
	}
	catch (const ResourceError& e) {
		EXPECT_EQ(e.subsystem(), Subsystem::Descriptor);
		EXPECT_EQ(e.result(), VK_ERROR_OUT_OF_POOL_MEMORY);
	}

	// 失败不改变计数
	EXPECT_THROW(budget.consume(), ResourceError);
	EXPECT_EQ(budget.allocated(), 2u);
	EXPECT_EQ(budget.capacity(), 2u);
}

TEST(DescriptorBudget, ZeroCapacityIsRejected) {
	EXPECT_THROW({ DescriptorBudget budget(0); }, std::invalid_argument);
}
