// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <filesystem>
#include <cstddef>
#include <string>
#include <string_view>

/**
 * A private temporary directory which is deleted (recursively) by
 * the destructor.
 */
class TempDirectory {
	std::filesystem::path path;

public:
	TempDirectory();
	~TempDirectory() noexcept;

	TempDirectory(const TempDirectory &) = delete;
	TempDirectory &operator=(const TempDirectory &) = delete;

	const std::filesystem::path &GetPath() const noexcept {
		return path;
	}

	std::filesystem::path operator/(const std::filesystem::path &p) const {
		return path / p;
	}
};

void
WriteTextFile(const std::filesystem::path &path, std::string_view contents);

std::string
ReadTextFile(const std::filesystem::path &path);

/**
 * Generate deterministic pseudo-random contents.
 */
std::string
MakeTestData(std::size_t size);
