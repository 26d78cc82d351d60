// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <array>

#include <sys/uio.h>
#include <unistd.h>

unsigned LoggerDetail::max_level = 1;

static constexpr struct iovec
MakeIovec(std::string_view s) noexcept
{
	return { const_cast<char *>(s.data()), s.size() };
}

void
LoggerDetail::Write(std::string_view domain, std::string_view msg) noexcept
{
	std::array<struct iovec, 5> v;
	std::size_t n = 0;

	if (!domain.empty()) {
		v[n++] = MakeIovec("[");
		v[n++] = MakeIovec(domain);
		v[n++] = MakeIovec("] ");
	}

	v[n++] = MakeIovec(msg);
	v[n++] = MakeIovec("\n");

	/* a single writev() call, so lines written by concurrent
	   threads do not get mixed up */
	ssize_t nbytes = writev(STDERR_FILENO, v.data(), n);
	(void)nbytes;
}

void
LoggerDetail::Fmt(unsigned level, std::string_view domain,
		  fmt::string_view format_str, fmt::format_args args) noexcept
{
	if (!CheckLevel(level))
		return;

	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);

	Write(domain, {buffer.data(), buffer.size()});
}

void
LoggerDetail::WriteException(std::string_view domain, std::string_view prefix,
			     std::exception_ptr ep) noexcept
{
	const auto msg = GetFullMessage(std::move(ep));
	if (prefix.empty()) {
		Write(domain, msg);
		return;
	}

	fmt::memory_buffer buffer;
	fmt::format_to(std::back_inserter(buffer), "{}: {}", prefix, msg);
	Write(domain, {buffer.data(), buffer.size()});
}
