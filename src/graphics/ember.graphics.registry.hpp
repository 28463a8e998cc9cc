#pragma once

#include <mutex>
#include <print>
#include <memory>
#include <string>
#include <functional>
#include <unordered_map>

namespace ember::graphics {

	// 按路径缓存共享资源 (shader module 等)
	// 加载失败时异常直接抛出，不写入缓存
	template <typename T>
	class Registry {
	public:
		using Loader = std::function<std::shared_ptr<T>(const std::string& path)>;

		explicit Registry(Loader loader) : loader(std::move(loader)) {}

		std::shared_ptr<T> get(const std::string& path) {
			std::lock_guard lock(mutex);

			if (auto it = entries.find(path); it != entries.end()) {
				return it->second;
			}

			auto resource = loader(path);
			entries.emplace(path, resource);
			std::println("[Registry] Loaded {}", path);
			return resource;
		}

		bool contains(const std::string& path) const {
			std::lock_guard lock(mutex);
			return entries.contains(path);
		}

		size_t size() const {
			std::lock_guard lock(mutex);
			return entries.size();
		}

		void clear() {
			std::lock_guard lock(mutex);
			entries.clear();
		}

	private:
		Loader loader;
		std::unordered_map<std::string, std::shared_ptr<T>> entries;
		mutable std::mutex mutex;
	};
}
