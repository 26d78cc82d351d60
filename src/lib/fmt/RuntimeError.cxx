// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "RuntimeError.hxx"

#include <fmt/format.h>

std::runtime_error
VFmtRuntimeError(fmt::string_view format_str, fmt::format_args args) noexcept
{
	return std::runtime_error(fmt::vformat(format_str, args));
}
