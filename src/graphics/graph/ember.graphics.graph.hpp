#pragma once

#include <vector>
#include <string>
#include <functional>

#include "src/graphics/ember.graphics.types.hpp"
#include "src/graphics/ember.graphics.command.hpp"

namespace ember::graphics {

	// ResourceState -> (layout, access, stage)
	struct LayoutState {
		VkImageLayout layout;
		VkAccessFlags access;
		VkPipelineStageFlags stage;
	};

	LayoutState to_layout_state(ResourceState state);

	// 由前后两个状态合成一次 layout transition
	TransitionLayoutOptions make_transition(ResourceState old_state, ResourceState new_state);

	struct RGHandle {
		uint32_t id = 0;
		bool is_valid() const { return id != 0; }
		auto operator<=>(const RGHandle&) const = default;
	};

	struct RGResourceNode {
		std::string name;
		ImageRef image;
		ResourceState initial_state = ResourceState::Undefined;
	};

	struct RGPassNode {
		std::string name;
		std::function<void(command::Recorder&)> execute;

		struct Access {
			RGHandle handle;
			ResourceState state;
		};

		std::vector<Access> reads;
		std::vector<Access> writes;
		std::vector<int> dependencies;

		// compile() 计算得到
		struct BarrierInfo {
			RGHandle handle;
			ResourceState old_state;
			ResourceState new_state;
			TransitionLayoutOptions transition;
		};
		std::vector<BarrierInfo> before_barriers;
	};

	class RGBuilder {
	public:
		RGBuilder(class RenderGraph& graph, struct RGPassNode& pass)
			: render_graph(graph), pass_node(pass) {
		}

		RGHandle read(RGHandle handle, ResourceState state = ResourceState::ComputeRead);
		RGHandle write(RGHandle handle, ResourceState state = ResourceState::StorageWrite);

	private:
		class RenderGraph& render_graph;
		struct RGPassNode& pass_node;
	};

	// 每帧重建：import 外部图像 -> add_pass 声明读写 -> compile 推导 barrier -> execute 录制
	class RenderGraph {
		friend class RGBuilder;
	public:
		RenderGraph() { reset(); }

		void reset();

		template <typename SetupFn, typename ExecFn>
		void add_pass(const std::string& name, SetupFn setup, ExecFn execute) {
			auto& pass = passes.emplace_back();
			pass.name = name;
			pass.execute = [exec = std::move(execute)](command::Recorder& recorder) {
				exec(recorder);
			};

			RGBuilder builder(*this, pass);
			setup(builder);
		}

		RGHandle import_image(const std::string& name, const ImageRef& image, ResourceState current_state);

		const ImageRef& get_image(RGHandle handle) const;

		// 资源在所有 pass 之后的最终状态
		ResourceState final_state(RGHandle handle) const;

		void compile();
		void execute(command::Recorder& recorder);

		const std::vector<RGPassNode>& get_passes() const { return passes; }
		const std::vector<int>& get_execution_order() const { return sorted_passes; }

	private:
		std::vector<RGPassNode> passes;
		std::vector<RGResourceNode> resources;
		std::vector<ResourceState> final_states;

		std::vector<std::vector<int>> adjacency_list;
		std::vector<int> sorted_passes;
		bool compiled = false;
	};
}
