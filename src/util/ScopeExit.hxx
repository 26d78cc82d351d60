// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <utility>

/**
 * Internal class.  Do not use directly.
 */
template<typename F>
class ScopeExitGuard : F {
	bool enabled = true;

public:
	explicit ScopeExitGuard(F &&f) noexcept:F(std::forward<F>(f)) {}

	ScopeExitGuard(ScopeExitGuard &&src) noexcept
		:F(std::move(src)),
		 enabled(std::exchange(src.enabled, false)) {}

	/* destructors are "noexcept" by default; this explicit
	   "noexcept" declaration allows the destructor to throw if
	   the function can throw; without this, a throwing function
	   would std::terminate() */
	~ScopeExitGuard() noexcept(noexcept(std::declval<F>()())) {
		if (enabled)
			F::operator()();
	}

	ScopeExitGuard(const ScopeExitGuard &) = delete;
	ScopeExitGuard &operator=(const ScopeExitGuard &) = delete;
};

/**
 * Internal class.  Do not use directly.
 */
struct ScopeExitTag {
	/* this operator is a trick so we don't need to close
	   parantheses at the end of the expression AtScopeExit()
	   call */
	template<typename F>
	ScopeExitGuard<F> operator+(F &&f) noexcept {
		return ScopeExitGuard<F>(std::forward<F>(f));
	}
};

#define ScopeExitCat(a, b) a ## b
#define ScopeExitName(line) ScopeExitCat(at_scope_exit_, line)

/**
 * Call the block right after this macro invocation when the current
 * scope exits.
 */
#define AtScopeExit(...) auto ScopeExitName(__LINE__) = ScopeExitTag{} + [__VA_ARGS__]()
