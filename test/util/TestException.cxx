// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "util/Exception.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "lib/fmt/SystemError.hxx"

#include <gtest/gtest.h>

#include <errno.h>

TEST(ExceptionTest, RuntimeError)
{
	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(std::runtime_error("Foo"))), "Foo");
}

TEST(ExceptionTest, DerivedError)
{
	class DerivedError : public std::runtime_error {
	public:
		explicit DerivedError(const char *_msg)
			:std::runtime_error(_msg) {}
	};

	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(DerivedError("Foo"))), "Foo");
}

static std::exception_ptr
MakeNested()
{
	try {
		try {
			throw FmtErrno(ENOENT, "Failed to open {:?}", "/foo");
		} catch (...) {
			std::throw_with_nested(FmtRuntimeError("Failed to copy {}", 42));
		}
	} catch (...) {
		return std::current_exception();
	}
}

TEST(ExceptionTest, Nested)
{
	const auto ep = MakeNested();

	const auto msg = GetFullMessage(ep);
	EXPECT_EQ(msg.find("Failed to copy 42; Failed to open \"/foo\": "), 0U);

	EXPECT_EQ(GetFullMessage(ep, "?", " / ").find("Failed to copy 42 / "), 0U);
}

TEST(ExceptionTest, FindNested)
{
	const auto ep = MakeNested();

	const auto *se = FindNested<std::system_error>(ep);
	ASSERT_NE(se, nullptr);
	EXPECT_TRUE(IsErrno(*se, ENOENT));

	EXPECT_NE(FindNested<std::runtime_error>(ep), nullptr);
	EXPECT_EQ(FindNested<std::invalid_argument>(ep), nullptr);
}

TEST(ExceptionTest, Fallback)
{
	EXPECT_EQ(GetFullMessage(std::make_exception_ptr(42), "Unknown"),
		  "Unknown");
}
