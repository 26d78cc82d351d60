// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "copy/ControlLoop.hxx"

#include <chrono>
#include <cstdint>

#include <stdio.h>

namespace XCopy {

/**
 * A #ProgressListener which draws a single status line on a
 * terminal.
 */
class ProgressBar final : public ProgressListener {
	using Clock = std::chrono::steady_clock;

	FILE *const file;

	const Clock::time_point start_time = Clock::now();
	Clock::time_point last_draw{};

	uint_least64_t total = 0, done = 0;

public:
	explicit ProgressBar(FILE *_file) noexcept
		:file(_file) {}

	/* virtual methods from class ProgressListener */
	void Increment(uint_least64_t bytes) noexcept override;
	void IncrementTotal(uint_least64_t bytes) noexcept override;
	void Finish() noexcept override;

private:
	void Draw(bool final) noexcept;
};

} // namespace XCopy
