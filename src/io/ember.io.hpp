#pragma once

#include <vector>
#include <optional>
#include <filesystem>

namespace ember::io {

	class FileSystem {
	public:
		// 依次尝试 path, ../path, ../../path (从 build 目录运行时)
		static std::optional<std::filesystem::path> resolve_path(const std::filesystem::path& path);

		// 通用二进制读取 (SPIR-V 等)
		static std::optional<std::vector<char>> read_binary(const std::filesystem::path& path);
	};
}
