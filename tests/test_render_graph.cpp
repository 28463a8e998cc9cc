#include <stdexcept>

#include <gtest/gtest.h>

#include "tests/fakes.hpp"
#include "src/graphics/graph/ember.graphics.graph.hpp"

using namespace ember;
using namespace ember::graphics;
using test::FakeRecorder;
using test::fake_handle;

namespace {

	ImageRef storage_image(uint64_t id) {
		return { fake_handle<VkImage>(id), VK_FORMAT_R8G8B8A8_UNORM, { 64, 64 } };
	}

	auto compute_work() {
		return [](command::Recorder& cmd) {
			cmd.bind_compute_pipeline(test::compute_pipeline());
			cmd.dispatch(4, 4, 1);
		};
	}
}

TEST(RenderGraph, GeometryThenUiProducesMatchingBarriers) {
	RenderGraph graph;
	auto target = graph.import_image("Target", storage_image(1), ResourceState::Undefined);

	graph.add_pass("Geometry",
		[&](RGBuilder& builder) { builder.write(target, ResourceState::StorageWrite); },
		compute_work());
	graph.add_pass("UI",
		[&](RGBuilder& builder) { builder.read(target, ResourceState::ComputeRead); },
		compute_work());

	FakeRecorder cmd;
	cmd.begin();
	graph.execute(cmd);

	std::vector<std::string> expected = {
		"begin",
		"transition", "bind_compute_pipeline", "dispatch",
		"transition", "bind_compute_pipeline", "dispatch",
	};
	EXPECT_EQ(cmd.calls, expected);

	ASSERT_EQ(cmd.transitions.size(), 2u);
	const auto& first = cmd.transitions[0].options;
	const auto& second = cmd.transitions[1].options;

	EXPECT_EQ(first.old_layout, VK_IMAGE_LAYOUT_UNDEFINED);
	EXPECT_EQ(first.new_layout, VK_IMAGE_LAYOUT_GENERAL);
	EXPECT_EQ(first.destination_access, static_cast<VkAccessFlags>(VK_ACCESS_SHADER_WRITE_BIT));
	EXPECT_EQ(first.destination_stage, static_cast<VkPipelineStageFlags>(VK_PIPELINE_STAGE_COMPUTE_SHADER_BIT));

	EXPECT_EQ(second.old_layout, VK_IMAGE_LAYOUT_GENERAL);
	EXPECT_EQ(second.new_layout, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
	EXPECT_EQ(second.source_access, first.destination_access);
	EXPECT_EQ(second.source_access, static_cast<VkAccessFlags>(VK_ACCESS_SHADER_WRITE_BIT));
	EXPECT_EQ(second.destination_access, static_cast<VkAccessFlags>(VK_ACCESS_SHADER_READ_BIT));

	EXPECT_EQ(cmd.transitions[0].image.image, storage_image(1).image);
	EXPECT_EQ(cmd.transitions[0].image.extent.width, 64u);
}

TEST(RenderGraph, FullFrameChainEndsInFragmentRead) {
	RenderGraph graph;
	auto geometry = graph.import_image("Geometry", storage_image(1), ResourceState::Undefined);
	auto ui = graph.import_image("UI", storage_image(2), ResourceState::Undefined);

	graph.add_pass("Geometry",
		[&](RGBuilder& builder) { builder.write(geometry); },
		compute_work());
	graph.add_pass("UI",
		[&](RGBuilder& builder) {
			builder.read(geometry);
			builder.write(ui);
		},
		compute_work());
	graph.add_pass("Present",
		[&](RGBuilder& builder) { builder.read(ui, ResourceState::FragmentRead); },
		[](command::Recorder&) {});

	graph.compile();
	EXPECT_EQ(graph.final_state(geometry), ResourceState::ComputeRead);
	EXPECT_EQ(graph.final_state(ui), ResourceState::FragmentRead);

	const auto& passes = graph.get_passes();
	ASSERT_EQ(passes.size(), 3u);
	EXPECT_EQ(passes[0].before_barriers.size(), 1u);
	EXPECT_EQ(passes[1].before_barriers.size(), 2u);
	ASSERT_EQ(passes[2].before_barriers.size(), 1u);

	const auto& present = passes[2].before_barriers[0].transition;
	EXPECT_EQ(present.old_layout, VK_IMAGE_LAYOUT_GENERAL);
	EXPECT_EQ(present.new_layout, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
	EXPECT_EQ(present.destination_stage, static_cast<VkPipelineStageFlags>(VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT));
	EXPECT_EQ(graph.get_execution_order(), (std::vector<int>{ 0, 1, 2 }));
}

TEST(RenderGraph, FrameChainReturnsImagesToTheirImportedStates) {
	// 离屏图像在构造时已转到帧间状态，每帧按该状态导入
	RenderGraph graph;
	auto geometry = graph.import_image("Geometry", storage_image(1), ResourceState::ComputeRead);
	auto ui = graph.import_image("UI", storage_image(2), ResourceState::FragmentRead);

	graph.add_pass("Geometry",
		[&](RGBuilder& builder) { builder.write(geometry); },
		compute_work());
	graph.add_pass("UI",
		[&](RGBuilder& builder) {
			builder.read(geometry);
			builder.write(ui);
		},
		compute_work());
	graph.add_pass("Present",
		[&](RGBuilder& builder) { builder.read(ui, ResourceState::FragmentRead); },
		[](command::Recorder&) {});

	graph.compile();
	EXPECT_EQ(graph.final_state(geometry), ResourceState::ComputeRead);
	EXPECT_EQ(graph.final_state(ui), ResourceState::FragmentRead);

	// 上一帧的读取必须在本帧写入之前完成
	const auto& passes = graph.get_passes();
	ASSERT_EQ(passes[0].before_barriers.size(), 1u);
	const auto& war = passes[0].before_barriers[0].transition;
	EXPECT_EQ(war.old_layout, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
	EXPECT_EQ(war.new_layout, VK_IMAGE_LAYOUT_GENERAL);
	EXPECT_EQ(war.source_access, static_cast<VkAccessFlags>(VK_ACCESS_SHADER_READ_BIT));
	EXPECT_EQ(war.source_stage, static_cast<VkPipelineStageFlags>(VK_PIPELINE_STAGE_COMPUTE_SHADER_BIT));
}

TEST(LayoutTransition, SetupTransitionLeavesUndefined) {
	auto settle = make_transition(ResourceState::Undefined, ResourceState::FragmentRead);
	EXPECT_EQ(settle.old_layout, VK_IMAGE_LAYOUT_UNDEFINED);
	EXPECT_EQ(settle.new_layout, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
	EXPECT_EQ(settle.source_access, 0u);
	EXPECT_EQ(settle.source_stage, static_cast<VkPipelineStageFlags>(VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT));
	EXPECT_EQ(settle.destination_stage, static_cast<VkPipelineStageFlags>(VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT));
}

TEST(RenderGraph, RepeatedReadsShareOneBarrier) {
	RenderGraph graph;
	auto target = graph.import_image("Target", storage_image(1), ResourceState::Undefined);

	graph.add_pass("Write", [&](RGBuilder& b) { b.write(target); }, compute_work());
	graph.add_pass("ReadA", [&](RGBuilder& b) { b.read(target); }, compute_work());
	graph.add_pass("ReadB", [&](RGBuilder& b) { b.read(target); }, compute_work());

	graph.compile();
	const auto& passes = graph.get_passes();
	EXPECT_EQ(passes[1].before_barriers.size(), 1u);
	EXPECT_TRUE(passes[2].before_barriers.empty());
}

TEST(RenderGraph, WriteAfterWriteStillGetsABarrier) {
	RenderGraph graph;
	auto target = graph.import_image("Target", storage_image(1), ResourceState::Undefined);

	graph.add_pass("First", [&](RGBuilder& b) { b.write(target); }, compute_work());
	graph.add_pass("Second", [&](RGBuilder& b) { b.write(target); }, compute_work());

	graph.compile();
	const auto& passes = graph.get_passes();
	ASSERT_EQ(passes[1].before_barriers.size(), 1u);

	const auto& barrier = passes[1].before_barriers[0].transition;
	EXPECT_EQ(barrier.old_layout, VK_IMAGE_LAYOUT_GENERAL);
	EXPECT_EQ(barrier.new_layout, VK_IMAGE_LAYOUT_GENERAL);
	EXPECT_EQ(barrier.source_access, static_cast<VkAccessFlags>(VK_ACCESS_SHADER_WRITE_BIT));
	ASSERT_EQ(passes[1].dependencies.size(), 1u);
	EXPECT_EQ(passes[1].dependencies[0], 0);
}

TEST(RenderGraph, ImportedStateIsRespected) {
	RenderGraph graph;
	auto target = graph.import_image("Target", storage_image(1), ResourceState::ComputeRead);

	// 已经处于目标状态的只读访问不需要 barrier
	graph.add_pass("Read", [&](RGBuilder& b) { b.read(target); }, compute_work());
	graph.compile();
	EXPECT_TRUE(graph.get_passes()[0].before_barriers.empty());
}

TEST(RenderGraph, IndependentPassesKeepDeclarationOrder) {
	RenderGraph graph;
	auto a = graph.import_image("A", storage_image(1), ResourceState::Undefined);
	auto b = graph.import_image("B", storage_image(2), ResourceState::Undefined);
	auto c = graph.import_image("C", storage_image(3), ResourceState::Undefined);

	graph.add_pass("A", [&](RGBuilder& builder) { builder.write(a); }, compute_work());
	graph.add_pass("B", [&](RGBuilder& builder) { builder.write(b); }, compute_work());
	graph.add_pass("C", [&](RGBuilder& builder) { builder.write(c); }, compute_work());

	graph.compile();
	EXPECT_EQ(graph.get_execution_order(), (std::vector<int>{ 0, 1, 2 }));
}

TEST(RenderGraph, ExecuteResetsTheGraph) {
	RenderGraph graph;
	auto target = graph.import_image("Target", storage_image(1), ResourceState::Undefined);
	graph.add_pass("Write", [&](RGBuilder& b) { b.write(target); }, compute_work());

	FakeRecorder cmd;
	cmd.begin();
	graph.execute(cmd);

	EXPECT_TRUE(graph.get_passes().empty());
	EXPECT_THROW(graph.get_image(target), std::out_of_range);
}

TEST(RenderGraph, UnknownHandlesAreRejected) {
	RenderGraph graph;
	RGHandle bogus{ 42 };
	graph.add_pass("Bad", [&](RGBuilder& b) { b.read(bogus); }, compute_work());

	EXPECT_THROW(graph.compile(), std::out_of_range);
	EXPECT_THROW(graph.get_image(RGHandle{}), std::out_of_range);
}

TEST(RenderGraph, FinalStateRequiresCompile) {
	RenderGraph graph;
	auto target = graph.import_image("Target", storage_image(1), ResourceState::Undefined);
	EXPECT_THROW(graph.final_state(target), std::out_of_range);
}

TEST(LayoutTransition, StatesMapToVulkanTriples) {
	auto storage = to_layout_state(ResourceState::StorageWrite);
	EXPECT_EQ(storage.layout, VK_IMAGE_LAYOUT_GENERAL);
	EXPECT_EQ(storage.access, static_cast<VkAccessFlags>(VK_ACCESS_SHADER_WRITE_BIT));

	auto present = to_layout_state(ResourceState::Present);
	EXPECT_EQ(present.layout, VK_IMAGE_LAYOUT_PRESENT_SRC_KHR);

	auto transition = make_transition(ResourceState::TransferDst, ResourceState::Present);
	EXPECT_EQ(transition.old_layout, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);
	EXPECT_EQ(transition.source_access, static_cast<VkAccessFlags>(VK_ACCESS_TRANSFER_WRITE_BIT));
	EXPECT_EQ(transition.new_layout, VK_IMAGE_LAYOUT_PRESENT_SRC_KHR);
}
