#include <queue>
#include <stdexcept>
#include <unordered_map>

#include "src/graphics/graph/ember.graphics.graph.hpp"

namespace ember::graphics {

	LayoutState to_layout_state(ResourceState state) {
		switch (state) {
		case ResourceState::Undefined:
			return { VK_IMAGE_LAYOUT_UNDEFINED, 0, VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT };
		case ResourceState::StorageWrite:
			return { VK_IMAGE_LAYOUT_GENERAL, VK_ACCESS_SHADER_WRITE_BIT, VK_PIPELINE_STAGE_COMPUTE_SHADER_BIT };
		case ResourceState::ComputeRead:
			return { VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL, VK_ACCESS_SHADER_READ_BIT, VK_PIPELINE_STAGE_COMPUTE_SHADER_BIT };
		case ResourceState::FragmentRead:
			return { VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL, VK_ACCESS_SHADER_READ_BIT, VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT };
		case ResourceState::ColorAttachment:
			return { VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL, VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT, VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT };
		case ResourceState::DepthAttachment:
			return { VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL, VK_ACCESS_DEPTH_STENCIL_ATTACHMENT_WRITE_BIT,
				VK_PIPELINE_STAGE_EARLY_FRAGMENT_TESTS_BIT | VK_PIPELINE_STAGE_LATE_FRAGMENT_TESTS_BIT };
		case ResourceState::TransferSrc:
			return { VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL, VK_ACCESS_TRANSFER_READ_BIT, VK_PIPELINE_STAGE_TRANSFER_BIT };
		case ResourceState::TransferDst:
			return { VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, VK_ACCESS_TRANSFER_WRITE_BIT, VK_PIPELINE_STAGE_TRANSFER_BIT };
		case ResourceState::Present:
			return { VK_IMAGE_LAYOUT_PRESENT_SRC_KHR, 0, VK_PIPELINE_STAGE_BOTTOM_OF_PIPE_BIT };
		}
		return { VK_IMAGE_LAYOUT_GENERAL, 0, VK_PIPELINE_STAGE_ALL_COMMANDS_BIT };
	}

	TransitionLayoutOptions make_transition(ResourceState old_state, ResourceState new_state) {
		auto src = to_layout_state(old_state);
		auto dst = to_layout_state(new_state);

		TransitionLayoutOptions options;
		options.old_layout = src.layout;
		options.new_layout = dst.layout;
		options.source_access = src.access;
		options.destination_access = dst.access;
		options.source_stage = src.stage;
		options.destination_stage = dst.stage;
		return options;
	}

	static bool is_write_state(ResourceState state) {
		return state == ResourceState::StorageWrite
			|| state == ResourceState::ColorAttachment
			|| state == ResourceState::DepthAttachment
			|| state == ResourceState::TransferDst;
	}

	RGHandle RGBuilder::read(RGHandle handle, ResourceState state) {
		pass_node.reads.push_back({ handle, state });
		return handle;
	}

	RGHandle RGBuilder::write(RGHandle handle, ResourceState state) {
		pass_node.writes.push_back({ handle, state });
		return handle;
	}

	void RenderGraph::reset() {
		passes.clear();
		resources.clear();
		final_states.clear();
		adjacency_list.clear();
		sorted_passes.clear();
		compiled = false;
		// ID 0 保留为无效句柄
		resources.emplace_back();
	}

	RGHandle RenderGraph::import_image(const std::string& name, const ImageRef& image, ResourceState current_state) {
		RGResourceNode node;
		node.name = name;
		node.image = image;
		node.initial_state = current_state;

		resources.push_back(node);
		compiled = false;
		return RGHandle{ static_cast<uint32_t>(resources.size() - 1) };
	}

	const ImageRef& RenderGraph::get_image(RGHandle handle) const {
		if (handle.id == 0 || handle.id >= resources.size()) {
			throw std::out_of_range("[RenderGraph] Invalid resource handle");
		}
		return resources[handle.id].image;
	}

	ResourceState RenderGraph::final_state(RGHandle handle) const {
		if (!compiled || handle.id == 0 || handle.id >= final_states.size()) {
			throw std::out_of_range("[RenderGraph] Final state requested before compile() or for an invalid handle");
		}
		return final_states[handle.id];
	}

	void RenderGraph::compile() {
		for (const auto& pass : passes) {
			for (const auto& access : pass.reads) {
				if (!access.handle.is_valid() || access.handle.id >= resources.size())
					throw std::out_of_range("[RenderGraph] Pass '" + pass.name + "' reads an unknown resource");
			}
			for (const auto& access : pass.writes) {
				if (!access.handle.is_valid() || access.handle.id >= resources.size())
					throw std::out_of_range("[RenderGraph] Pass '" + pass.name + "' writes an unknown resource");
			}
		}

		// 1. 依赖关系: RAW / WAR / WAW
		adjacency_list.assign(passes.size(), {});
		std::vector<int> in_degree(passes.size(), 0);

		std::unordered_map<uint32_t, int> last_writer;
		std::unordered_map<uint32_t, std::vector<int>> readers_since_write;

		auto add_edge = [&](int producer, int consumer) {
			if (producer == consumer) return;
			adjacency_list[producer].push_back(consumer);
			passes[consumer].dependencies.push_back(producer);
			in_degree[consumer]++;
		};

		for (int i = 0; i < static_cast<int>(passes.size()); ++i) {
			auto& pass = passes[i];
			pass.dependencies.clear();
			pass.before_barriers.clear();

			for (auto& access : pass.reads) {
				if (last_writer.contains(access.handle.id)) {
					add_edge(last_writer[access.handle.id], i);
				}
				readers_since_write[access.handle.id].push_back(i);
			}

			for (auto& access : pass.writes) {
				if (last_writer.contains(access.handle.id)) {
					add_edge(last_writer[access.handle.id], i);
				}
				for (int reader : readers_since_write[access.handle.id]) {
					add_edge(reader, i);
				}
				readers_since_write[access.handle.id].clear();
				last_writer[access.handle.id] = i;
			}
		}

		// 2. 拓扑排序 (Kahn)，同层按声明顺序
		std::priority_queue<int, std::vector<int>, std::greater<int>> ready;
		for (int i = 0; i < static_cast<int>(passes.size()); ++i) {
			if (in_degree[i] == 0) ready.push(i);
		}

		sorted_passes.clear();
		while (!ready.empty()) {
			int u = ready.top();
			ready.pop();
			sorted_passes.push_back(u);

			for (int v : adjacency_list[u]) {
				if (--in_degree[v] == 0) {
					ready.push(v);
				}
			}
		}

		if (sorted_passes.size() != passes.size()) {
			throw std::runtime_error("[RenderGraph] Cycle detected between passes");
		}

		// 3. 按执行顺序跟踪每个资源的状态，推导 barrier
		final_states.assign(resources.size(), ResourceState::Undefined);
		for (size_t i = 1; i < resources.size(); ++i) {
			final_states[i] = resources[i].initial_state;
		}

		for (int pass_idx : sorted_passes) {
			auto& pass = passes[pass_idx];

			auto transition_to = [&](const RGPassNode::Access& access) {
				uint32_t rid = access.handle.id;
				ResourceState old_state = final_states[rid];
				ResourceState new_state = access.state;

				// 写后写同样需要内存依赖
				if (old_state != new_state || old_state == ResourceState::Undefined || is_write_state(new_state)) {
					pass.before_barriers.push_back({ access.handle, old_state, new_state, make_transition(old_state, new_state) });
					final_states[rid] = new_state;
				}
			};

			for (auto& access : pass.reads) transition_to(access);
			for (auto& access : pass.writes) transition_to(access);
		}

		compiled = true;
	}

	void RenderGraph::execute(command::Recorder& recorder) {
		if (!compiled) compile();

		for (int pass_idx : sorted_passes) {
			auto& pass = passes[pass_idx];

			for (auto& barrier : pass.before_barriers) {
				recorder.transition_image_layout(resources[barrier.handle.id].image, barrier.transition);
			}

			if (pass.execute) {
				pass.execute(recorder);
			}
		}

		reset();
	}
}
