#include <format>
#include <algorithm>
#include <stdexcept>

#include "src/graphics/ember.graphics.errors.hpp"
#include "src/graphics/ember.graphics.descriptors.hpp"

namespace ember::graphics {

	std::vector<VkDescriptorPoolSize> descriptor_pool_sizes(std::span<const VkDescriptorType> types, uint32_t capacity) {
		if (capacity == 0) {
			throw std::invalid_argument("[Descriptor] Pool capacity must be greater than zero");
		}

		std::vector<VkDescriptorPoolSize> sizes;
		for (auto type : types) {
			auto it = std::find_if(sizes.begin(), sizes.end(), [type](const VkDescriptorPoolSize& s) { return s.type == type; });
			if (it != sizes.end()) {
				it->descriptorCount += capacity;
			}
			else {
				sizes.push_back({ type, capacity });
			}
		}
		return sizes;
	}

	VkDescriptorType binding_type(std::span<const VkDescriptorType> bindings, uint32_t binding) {
		if (binding >= bindings.size()) {
			throw ResourceError(Subsystem::Descriptor, VK_ERROR_UNKNOWN,
				std::format("Binding {} is out of range for a layout with {} bindings", binding, bindings.size()));
		}
		return bindings[binding];
	}

	DescriptorBudget::DescriptorBudget(uint32_t capacity)
		: max_sets(capacity) {
		if (capacity == 0) {
			throw std::invalid_argument("[Descriptor] Pool capacity must be greater than zero");
		}
	}

	void DescriptorBudget::require_available() const {
		if (used >= max_sets) {
			throw ResourceError(Subsystem::Descriptor, VK_ERROR_OUT_OF_POOL_MEMORY,
				std::format("Descriptor pool exhausted ({} sets)", max_sets));
		}
	}

	void DescriptorBudget::consume() {
		require_available();
		++used;
	}
}
