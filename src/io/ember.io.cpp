#include <print>
#include <fstream>

#include "src/io/ember.io.hpp"

namespace ember::io {

	std::optional<std::filesystem::path> FileSystem::resolve_path(const std::filesystem::path& path) {
		auto check_exists = [](const std::filesystem::path& p) {
			std::error_code ec;
			return std::filesystem::exists(p, ec) && !std::filesystem::is_directory(p, ec);
		};

		for (const auto& candidate : { path, std::filesystem::path("..") / path, std::filesystem::path("../..") / path }) {
			if (check_exists(candidate)) {
				if (candidate != path) {
					std::println("[IO] Resolved path via fallback: {}", candidate.string());
				}
				return candidate;
			}
		}
		return std::nullopt;
	}

	std::optional<std::vector<char>> FileSystem::read_binary(const std::filesystem::path& path) {
		auto resolved_path = resolve_path(path);
		if (!resolved_path) {
			std::println(stderr, "[IO] Failed to find file: {}", path.string());
			std::println(stderr, "[IO] CWD: {}", std::filesystem::current_path().string());
			return std::nullopt;
		}

		std::ifstream file(*resolved_path, std::ios::ate | std::ios::binary);
		if (!file.is_open()) return std::nullopt;

		size_t file_size = static_cast<size_t>(file.tellg());
		std::vector<char> buffer(file_size);
		file.seekg(0);
		file.read(buffer.data(), static_cast<std::streamsize>(file_size));
		if (!file) return std::nullopt;
		return buffer;
	}
}
