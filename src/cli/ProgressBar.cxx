// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ProgressBar.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <string_view>

using std::string_view_literals::operator""sv;

namespace XCopy {

static constexpr auto REDRAW_INTERVAL = std::chrono::milliseconds{100};
static constexpr std::size_t BAR_WIDTH = 30;

template<typename OutputIt>
static OutputIt
FormatBytes(OutputIt out, double value) noexcept
{
	static constexpr std::array units{"B", "KiB", "MiB", "GiB", "TiB"};

	std::size_t unit = 0;
	while (value >= 1024 && unit + 1 < units.size()) {
		value /= 1024;
		++unit;
	}

	if (unit == 0)
		return fmt::format_to(out, "{:.0f} {}"sv, value, units[unit]);

	return fmt::format_to(out, "{:.1f} {}"sv, value, units[unit]);
}

void
ProgressBar::Draw(bool final) noexcept
{
	const auto now = Clock::now();
	if (!final && now - last_draw < REDRAW_INTERVAL)
		return;

	last_draw = now;

	const double fraction = total > 0
		? std::min(double(done) / double(total), 1.0)
		: 1.0;
	const std::size_t filled = fraction * BAR_WIDTH;

	const double elapsed = std::chrono::duration<double>(now - start_time).count();

	fmt::memory_buffer buffer;
	auto out = std::back_inserter(buffer);

	*out++ = '\r';
	out = FormatBytes(out, done);
	out = fmt::format_to(out, " / "sv);
	out = FormatBytes(out, total);

	out = fmt::format_to(out, " [{:=<{}}{:<{}}] {:3.0f}%"sv,
			     "", filled, "", BAR_WIDTH - filled,
			     fraction * 100);

	if (elapsed > 0.01) {
		out = fmt::format_to(out, "  "sv);
		out = FormatBytes(out, done / elapsed);
		out = fmt::format_to(out, "/s"sv);
	}

	out = fmt::format_to(out, "   "sv);

	if (final)
		*out++ = '\n';

	fwrite(buffer.data(), 1, buffer.size(), file);
	fflush(file);
}

void
ProgressBar::Increment(uint_least64_t bytes) noexcept
{
	done += bytes;
	Draw(false);
}

void
ProgressBar::IncrementTotal(uint_least64_t bytes) noexcept
{
	total += bytes;
	Draw(false);
}

void
ProgressBar::Finish() noexcept
{
	Draw(true);
}

} // namespace XCopy
