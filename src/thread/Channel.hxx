// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

template<typename T> class ChannelSender;
template<typename T> class ChannelReceiver;

/**
 * Internal class.  Do not use directly; see MakeChannel().
 */
template<typename T>
class ChannelState {
	friend class ChannelSender<T>;
	friend class ChannelReceiver<T>;

	std::mutex mutex;
	std::condition_variable cond;

	std::deque<T> queue;

	/**
	 * The number of #ChannelSender instances referring to this
	 * object.
	 */
	unsigned n_senders = 0;

	/**
	 * Has the #ChannelReceiver been destroyed?  From then on,
	 * new values are discarded.
	 */
	bool closed = false;

	void AddSender() noexcept {
		const std::scoped_lock lock{mutex};
		++n_senders;
	}

	void RemoveSender() noexcept {
		bool last;

		{
			const std::scoped_lock lock{mutex};
			last = --n_senders == 0;
		}

		if (last)
			cond.notify_all();
	}

	void Push(T &&value) {
		{
			const std::scoped_lock lock{mutex};
			if (closed)
				return;

			queue.emplace_back(std::move(value));
		}

		cond.notify_one();
	}

	std::optional<T> Pop(bool wait) {
		std::unique_lock lock{mutex};
		if (wait)
			cond.wait(lock, [this]{
				return !queue.empty() || n_senders == 0;
			});

		if (queue.empty())
			return std::nullopt;

		std::optional<T> value{std::move(queue.front())};
		queue.pop_front();
		return value;
	}

	void Close() noexcept {
		const std::scoped_lock lock{mutex};
		closed = true;
		queue.clear();
	}
};

/**
 * The producing end of a channel created by MakeChannel().  Each
 * instance (copies included) counts as one producer; the channel
 * ends once all of them have been destroyed or released.
 *
 * Instances may be used by different threads concurrently without
 * further locking.  Sending never blocks.
 */
template<typename T>
class ChannelSender {
	std::shared_ptr<ChannelState<T>> state;

public:
	ChannelSender() noexcept = default;

	explicit ChannelSender(std::shared_ptr<ChannelState<T>> _state) noexcept
		:state(std::move(_state))
	{
		if (state)
			state->AddSender();
	}

	ChannelSender(const ChannelSender &src) noexcept
		:ChannelSender(src.state) {}

	ChannelSender(ChannelSender &&src) noexcept = default;

	~ChannelSender() noexcept {
		Release();
	}

	ChannelSender &operator=(const ChannelSender &src) noexcept {
		if (this != &src) {
			Release();
			state = src.state;
			if (state)
				state->AddSender();
		}

		return *this;
	}

	ChannelSender &operator=(ChannelSender &&src) noexcept {
		if (this != &src) {
			Release();
			state = std::move(src.state);
		}

		return *this;
	}

	bool IsDefined() const noexcept {
		return state != nullptr;
	}

	/**
	 * Enqueue a value.  If the receiver has already been
	 * destroyed, the value is discarded.
	 */
	void Send(T value) {
		state->Push(std::move(value));
	}

	/**
	 * Give up this producer's reference to the channel.  After
	 * the last producer has released it, the receiver sees the
	 * end of the stream.
	 */
	void Release() noexcept {
		if (state) {
			state->RemoveSender();
			state.reset();
		}
	}
};

/**
 * The consuming end of a channel created by MakeChannel().  There is
 * only one instance per channel, and it must be used by only one
 * thread at a time.
 */
template<typename T>
class ChannelReceiver {
	std::shared_ptr<ChannelState<T>> state;

public:
	explicit ChannelReceiver(std::shared_ptr<ChannelState<T>> _state) noexcept
		:state(std::move(_state)) {}

	ChannelReceiver(ChannelReceiver &&src) noexcept = default;
	ChannelReceiver &operator=(ChannelReceiver &&src) noexcept = default;

	~ChannelReceiver() noexcept {
		if (state)
			state->Close();
	}

	/**
	 * Wait for the next value.
	 *
	 * @return the value or std::nullopt if all senders have been
	 * released and there are no more pending values
	 */
	std::optional<T> Receive() {
		return state->Pop(true);
	}

	/**
	 * Like Receive(), but do not wait; returns std::nullopt if
	 * no value is pending.
	 */
	std::optional<T> TryReceive() {
		return state->Pop(false);
	}
};

/**
 * Create an unbounded many-producer/single-consumer queue.
 */
template<typename T>
std::pair<ChannelSender<T>, ChannelReceiver<T>>
MakeChannel()
{
	auto state = std::make_shared<ChannelState<T>>();
	return {ChannelSender<T>{state}, ChannelReceiver<T>{state}};
}
