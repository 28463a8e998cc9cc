#include <stdexcept>

#include <gtest/gtest.h>

#include "tests/fakes.hpp"

using namespace ember;
using namespace ember::graphics;
using command::RecordingState;
using test::FakeRecorder;
using test::fake_handle;

TEST(Recorder, FullSessionWalksAllStates) {
	FakeRecorder cmd;
	EXPECT_EQ(cmd.state(), RecordingState::Initial);

	cmd.begin();
	EXPECT_EQ(cmd.state(), RecordingState::Recording);

	cmd.bind_compute_pipeline(test::compute_pipeline());
	cmd.bind_descriptor_set(0, fake_handle<VkDescriptorSet>(1));
	cmd.dispatch(30, 17, 1);

	cmd.begin_renderpass(test::renderpass_info());
	EXPECT_EQ(cmd.state(), RecordingState::InRenderPass);

	cmd.bind_graphics_pipeline(test::graphics_pipeline());
	DrawOptions draw;
	draw.vertex_count = 3;
	cmd.draw(draw);
	cmd.next_subpass();
	cmd.end_renderpass();
	EXPECT_EQ(cmd.state(), RecordingState::Recording);

	cmd.end();
	EXPECT_EQ(cmd.state(), RecordingState::Executable);

	std::vector<std::string> expected = {
		"begin", "bind_compute_pipeline", "bind_descriptor_set", "dispatch",
		"begin_renderpass", "bind_graphics_pipeline", "draw", "next_subpass", "end_renderpass", "end",
	};
	EXPECT_EQ(cmd.calls, expected);
}

TEST(Recorder, DescriptorSetUsesBoundPipelineBindPoint) {
	FakeRecorder cmd;
	cmd.begin();

	cmd.bind_compute_pipeline(test::compute_pipeline());
	cmd.bind_descriptor_set(1, fake_handle<VkDescriptorSet>(2));

	cmd.begin_renderpass(test::renderpass_info());
	cmd.bind_graphics_pipeline(test::graphics_pipeline());
	cmd.bind_descriptor_set(0, fake_handle<VkDescriptorSet>(3));

	ASSERT_EQ(cmd.descriptor_bind_pipelines.size(), 2u);
	EXPECT_EQ(cmd.descriptor_bind_pipelines[0].bind_point, VK_PIPELINE_BIND_POINT_COMPUTE);
	EXPECT_EQ(cmd.descriptor_bind_pipelines[0].layout, test::compute_pipeline().layout);
	EXPECT_EQ(cmd.descriptor_bind_pipelines[1].bind_point, VK_PIPELINE_BIND_POINT_GRAPHICS);
	EXPECT_EQ(cmd.descriptor_bind_pipelines[1].layout, test::graphics_pipeline().layout);
}

TEST(Recorder, RecordingBeforeBeginIsRejected) {
	FakeRecorder cmd;
	EXPECT_THROW(cmd.dispatch(1, 1, 1), std::logic_error);
	EXPECT_THROW(cmd.end(), std::logic_error);
	EXPECT_THROW(cmd.begin_renderpass(test::renderpass_info()), std::logic_error);
	EXPECT_TRUE(cmd.calls.empty());
}

TEST(Recorder, DrawOutsideRenderPassIsRejected) {
	FakeRecorder cmd;
	cmd.begin();
	cmd.bind_graphics_pipeline(test::graphics_pipeline());

	DrawOptions draw;
	draw.vertex_count = 3;
	EXPECT_THROW(cmd.draw(draw), std::logic_error);
	EXPECT_TRUE(cmd.draws.empty());
}

TEST(Recorder, DrawWithoutGraphicsPipelineIsRejected) {
	FakeRecorder cmd;
	cmd.begin();
	cmd.bind_compute_pipeline(test::compute_pipeline());
	cmd.begin_renderpass(test::renderpass_info());

	EXPECT_THROW(cmd.draw(DrawOptions{}), std::logic_error);
}

TEST(Recorder, DispatchWithoutComputePipelineIsRejected) {
	FakeRecorder cmd;
	cmd.begin();
	EXPECT_THROW(cmd.dispatch(1, 1, 1), std::logic_error);

	cmd.bind_graphics_pipeline(test::graphics_pipeline());
	EXPECT_THROW(cmd.dispatch(1, 1, 1), std::logic_error);
}

TEST(Recorder, DispatchInsideRenderPassIsRejected) {
	FakeRecorder cmd;
	cmd.begin();
	cmd.bind_compute_pipeline(test::compute_pipeline());
	cmd.begin_renderpass(test::renderpass_info());

	EXPECT_THROW(cmd.dispatch(1, 1, 1), std::logic_error);
	EXPECT_THROW(cmd.bind_compute_pipeline(test::compute_pipeline()), std::logic_error);
}

TEST(Recorder, DescriptorSetWithoutPipelineIsRejected) {
	FakeRecorder cmd;
	cmd.begin();
	EXPECT_THROW(cmd.bind_descriptor_set(0, fake_handle<VkDescriptorSet>(1)), std::logic_error);
}

TEST(Recorder, MismatchedBindPointIsRejected) {
	FakeRecorder cmd;
	cmd.begin();
	EXPECT_THROW(cmd.bind_compute_pipeline(test::graphics_pipeline()), std::logic_error);
	EXPECT_THROW(cmd.bind_graphics_pipeline(test::compute_pipeline()), std::logic_error);
}

TEST(Recorder, TransitionsAndCopiesMustBeOutsideRenderPass) {
	FakeRecorder cmd;
	cmd.begin();
	cmd.begin_renderpass(test::renderpass_info());

	ImageRef image{ fake_handle<VkImage>(5), VK_FORMAT_R8G8B8A8_UNORM, { 64, 64 } };
	EXPECT_THROW(cmd.transition_image_layout(image, {}), std::logic_error);
	EXPECT_THROW(cmd.copy_image(image, image), std::logic_error);
	EXPECT_THROW(cmd.blit_image(image, image, VK_FILTER_NEAREST), std::logic_error);

	cmd.end_renderpass();
	cmd.transition_image_layout(image, {});
	EXPECT_EQ(cmd.transitions.size(), 1u);
}

TEST(Recorder, EndWithOpenRenderPassIsRejected) {
	FakeRecorder cmd;
	cmd.begin();
	cmd.begin_renderpass(test::renderpass_info());
	EXPECT_THROW(cmd.end(), std::logic_error);
}

TEST(Recorder, RecordingAfterEndIsRejected) {
	FakeRecorder cmd;
	cmd.begin();
	cmd.bind_compute_pipeline(test::compute_pipeline());
	cmd.end();

	EXPECT_THROW(cmd.dispatch(1, 1, 1), std::logic_error);
	EXPECT_THROW(cmd.begin(), std::logic_error);
	EXPECT_THROW(cmd.end(), std::logic_error);
	EXPECT_EQ(cmd.state(), RecordingState::Executable);
}

TEST(Recorder, RenderPassRequiresHandles) {
	FakeRecorder cmd;
	cmd.begin();
	command::RenderPassBeginInfo info;
	EXPECT_THROW(cmd.begin_renderpass(info), std::logic_error);
	EXPECT_EQ(cmd.state(), RecordingState::Recording);
}
