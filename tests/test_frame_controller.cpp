#include <deque>
#include <cstdint>
#include <string>
#include <vector>
#include <stdexcept>

#include <gtest/gtest.h>

#include "src/graphics/ember.graphics.errors.hpp"
#include "src/graphics/ember.graphics.frame.hpp"

using namespace ember::graphics;

namespace {

	class FakeBackend : public FrameBackend {
	public:
		std::deque<AcquireResult> acquires;
		std::deque<SwapchainStatus> presents;
		std::deque<VkExtent2D> recreate_extents;

		SwapchainInfo info{ { 800, 600 }, VK_FORMAT_B8G8R8A8_SRGB, 3 };
		ReleaseQueue releases;

		int wait_idle_calls = 0;
		int recreate_calls = 0;
		int abandon_calls = 0;
		std::vector<uint32_t> presented;

		// 与 Context 一致：acquire 成功后 reset，提交后 signal
		bool fence_signalled = true;

		AcquireResult start_frame(uint64_t) override {
			if (!fence_signalled) return { AcquireStatus::Timeout, 0 };

			AcquireResult result{ AcquireStatus::Ok, 0 };
			if (!acquires.empty()) {
				result = acquires.front();
				acquires.pop_front();
			}
			if (result.status == AcquireStatus::Ok || result.status == AcquireStatus::Suboptimal) {
				fence_signalled = false;
			}
			return result;
		}

		SwapchainStatus end_frame(uint32_t image_index) override {
			// 录制回调不会真正提交，这里代替 submit signal fence
			fence_signalled = true;
			presented.push_back(image_index);
			if (presents.empty()) return SwapchainStatus::Ok;
			auto status = presents.front();
			presents.pop_front();
			return status;
		}

		void abandon_frame() override {
			++abandon_calls;
			fence_signalled = true;
		}

		void wait_idle() override { ++wait_idle_calls; }

		SwapchainInfo recreate_swapchain() override {
			++recreate_calls;
			if (!recreate_extents.empty()) {
				info.extent = recreate_extents.front();
				recreate_extents.pop_front();
			}
			return info;
		}

		SwapchainInfo swapchain_info() const override { return info; }
		ReleaseQueue& release_queue() override { return releases; }
	};

	class FakeDependent : public SwapchainDependent {
	public:
		explicit FakeDependent(std::string name = "dependent", std::vector<std::string>* log = nullptr)
			: name(std::move(name)), log(log) {
		}

		void release_swapchain_resources() override {
			if (!live) double_release = true;
			live = false;
			++releases;
			if (log) log->push_back("release " + name);
		}

		void create_swapchain_resources(const SwapchainInfo& info) override {
			if (live) double_create = true;
			live = true;
			++creates;
			last_info = info;
			if (log) log->push_back("create " + name);
		}

		std::string name;
		std::vector<std::string>* log;

		bool live = false;
		bool double_release = false;
		bool double_create = false;
		int creates = 0;
		int releases = 0;
		SwapchainInfo last_info;
	};

	constexpr uint64_t TIMEOUT_MS = 2000;
}

TEST(FrameController, RendersAndPresentsAcquiredImage) {
	FakeBackend backend;
	backend.acquires.push_back({ AcquireStatus::Ok, 2 });
	FrameController frames(backend, TIMEOUT_MS);

	FakeDependent dependent;
	frames.add_dependent(dependent);
	EXPECT_EQ(dependent.creates, 1);
	EXPECT_EQ(dependent.last_info.extent.width, 800u);

	uint32_t recorded = UINT32_MAX;
	auto status = frames.run_frame([&](uint32_t image_index) { recorded = image_index; });

	EXPECT_EQ(status, FrameStatus::Rendered);
	EXPECT_EQ(recorded, 2u);
	ASSERT_EQ(backend.presented.size(), 1u);
	EXPECT_EQ(backend.presented[0], 2u);
	EXPECT_EQ(frames.frames_submitted(), 1u);
	EXPECT_EQ(backend.releases.current_serial(), 2u);
	EXPECT_EQ(dependent.releases, 0);
}

TEST(FrameController, OutOfDateAcquireRecreatesWithoutRecording) {
	FakeBackend backend;
	backend.acquires.push_back({ AcquireStatus::OutOfDate, 0 });
	backend.recreate_extents.push_back({ 1024, 768 });
	FrameController frames(backend, TIMEOUT_MS);

	FakeDependent dependent;
	frames.add_dependent(dependent);

	bool recorded = false;
	auto status = frames.run_frame([&](uint32_t) { recorded = true; });

	EXPECT_EQ(status, FrameStatus::SwapchainRecreated);
	EXPECT_FALSE(recorded);
	EXPECT_TRUE(backend.presented.empty());
	EXPECT_EQ(frames.frames_submitted(), 0u);
	EXPECT_EQ(dependent.releases, 1);
	EXPECT_EQ(dependent.creates, 2);
	EXPECT_EQ(dependent.last_info.extent.width, 1024u);
	EXPECT_FALSE(dependent.double_release);
	EXPECT_FALSE(dependent.double_create);
	EXPECT_GE(backend.wait_idle_calls, 1);
}

TEST(FrameController, SuboptimalPresentRecreatesAfterSubmitting) {
	FakeBackend backend;
	backend.presents.push_back(SwapchainStatus::Suboptimal);
	FrameController frames(backend, TIMEOUT_MS);

	FakeDependent dependent;
	frames.add_dependent(dependent);

	bool recorded = false;
	auto status = frames.run_frame([&](uint32_t) { recorded = true; });

	EXPECT_EQ(status, FrameStatus::SwapchainRecreated);
	EXPECT_TRUE(recorded);
	EXPECT_EQ(frames.frames_submitted(), 1u);
	EXPECT_EQ(backend.recreate_calls, 1);
	EXPECT_EQ(dependent.creates, 2);
	EXPECT_TRUE(dependent.live);
}

TEST(FrameController, SuboptimalAcquireStillRendersThenRecreates) {
	FakeBackend backend;
	backend.acquires.push_back({ AcquireStatus::Suboptimal, 1 });
	FrameController frames(backend, TIMEOUT_MS);

	FakeDependent dependent;
	frames.add_dependent(dependent);

	uint32_t recorded = UINT32_MAX;
	auto status = frames.run_frame([&](uint32_t image_index) { recorded = image_index; });

	EXPECT_EQ(status, FrameStatus::SwapchainRecreated);
	EXPECT_EQ(recorded, 1u);
	EXPECT_EQ(backend.recreate_calls, 1);
}

TEST(FrameController, ZeroExtentDefersUntilWindowIsVisible) {
	FakeBackend backend;
	backend.recreate_extents = { { 0, 0 }, { 0, 0 }, { 640, 480 } };
	FrameController frames(backend, TIMEOUT_MS);

	FakeDependent dependent;
	frames.add_dependent(dependent);
	frames.request_recreate();

	int recorded = 0;
	auto record = [&](uint32_t) { ++recorded; };

	EXPECT_EQ(frames.run_frame(record), FrameStatus::Deferred);
	EXPECT_EQ(frames.run_frame(record), FrameStatus::Deferred);
	EXPECT_TRUE(frames.is_recreate_pending());
	EXPECT_FALSE(dependent.live);
	EXPECT_EQ(dependent.releases, 1);
	EXPECT_EQ(recorded, 0);

	EXPECT_EQ(frames.run_frame(record), FrameStatus::SwapchainRecreated);
	EXPECT_FALSE(frames.is_recreate_pending());
	EXPECT_EQ(recorded, 1);
	EXPECT_EQ(dependent.creates, 2);
	EXPECT_EQ(dependent.last_info.extent.height, 480u);
	EXPECT_FALSE(dependent.double_release);
	EXPECT_FALSE(dependent.double_create);
}

TEST(FrameController, DependentAddedWhileMinimizedIsCreatedLater) {
	FakeBackend backend;
	backend.info.extent = { 0, 0 };
	backend.recreate_extents.push_back({ 800, 600 });
	FrameController frames(backend, TIMEOUT_MS);

	FakeDependent dependent;
	frames.add_dependent(dependent);
	EXPECT_EQ(dependent.creates, 0);
	EXPECT_TRUE(frames.is_recreate_pending());

	EXPECT_EQ(frames.run_frame([](uint32_t) {}), FrameStatus::SwapchainRecreated);
	EXPECT_EQ(dependent.creates, 1);
	EXPECT_EQ(dependent.releases, 0);
}

TEST(FrameController, FenceTimeoutIsFatal) {
	FakeBackend backend;
	backend.acquires.push_back({ AcquireStatus::Timeout, 0 });
	FrameController frames(backend, TIMEOUT_MS);

	bool recorded = false;
	try {
		frames.run_frame([&](uint32_t) { recorded = true; });
		FAIL() << "expected FrameError";
	}
	catch (const FrameError& e) {
		EXPECT_EQ(e.kind(), FrameErrorKind::FenceTimeout);
	}
	EXPECT_FALSE(recorded);
	EXPECT_TRUE(backend.presented.empty());
}

TEST(FrameController, DeferredReleasesRunOnceTheirFrameCompletes) {
	FakeBackend backend;
	FrameController frames(backend, TIMEOUT_MS);

	int released = 0;
	frames.run_frame([&](uint32_t) {
		backend.releases.defer([&] { ++released; });
	});
	EXPECT_EQ(released, 0);
	EXPECT_EQ(backend.releases.pending(), 1u);

	int released_before_record = -1;
	frames.run_frame([&](uint32_t) { released_before_record = released; });
	EXPECT_EQ(released_before_record, 1);
	EXPECT_EQ(backend.releases.pending(), 0u);
}

TEST(FrameController, DependentsReleaseInReverseOrder) {
	FakeBackend backend;
	backend.acquires.push_back({ AcquireStatus::OutOfDate, 0 });
	FrameController frames(backend, TIMEOUT_MS);

	std::vector<std::string> log;
	FakeDependent first("first", &log);
	FakeDependent second("second", &log);
	frames.add_dependent(first);
	frames.add_dependent(second);
	log.clear();

	frames.run_frame([](uint32_t) {});

	std::vector<std::string> expected = { "release second", "release first", "create first", "create second" };
	EXPECT_EQ(log, expected);
}

TEST(FrameController, ShutdownReleasesEverythingOnce) {
	FakeBackend backend;
	FrameController frames(backend, TIMEOUT_MS);

	FakeDependent dependent;
	frames.add_dependent(dependent);

	int released = 0;
	backend.releases.defer([&] { ++released; });

	frames.shutdown();
	EXPECT_FALSE(dependent.live);
	EXPECT_EQ(dependent.releases, 1);
	EXPECT_EQ(released, 1);
	EXPECT_EQ(backend.releases.pending(), 0u);

	frames.shutdown();
	EXPECT_EQ(dependent.releases, 1);
	EXPECT_FALSE(dependent.double_release);
}

TEST(FrameController, FailedRecordingRestoresFenceAndRethrows) {
	FakeBackend backend;
	backend.acquires.push_back({ AcquireStatus::Ok, 1 });
	FrameController frames(backend, TIMEOUT_MS);

	int released = 0;
	EXPECT_THROW(frames.run_frame([&](uint32_t) {
		backend.releases.defer([&] { ++released; });
		throw std::runtime_error("pipeline missing");
	}), std::runtime_error);

	EXPECT_EQ(backend.abandon_calls, 1);
	EXPECT_TRUE(backend.fence_signalled);
	EXPECT_TRUE(backend.presented.empty());
	EXPECT_EQ(frames.frames_submitted(), 0u);
	EXPECT_EQ(released, 0);

	// 下一帧照常进行，而不是 FenceTimeout
	bool recorded = false;
	auto status = frames.run_frame([&](uint32_t) { recorded = true; });
	EXPECT_EQ(status, FrameStatus::Rendered);
	EXPECT_TRUE(recorded);
	EXPECT_EQ(released, 1);
	EXPECT_EQ(backend.abandon_calls, 1);
}
