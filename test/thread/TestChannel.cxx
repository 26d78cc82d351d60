// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "thread/Channel.hxx"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

TEST(Channel, Basic)
{
	auto [sender, receiver] = MakeChannel<int>();

	sender.Send(1);
	sender.Send(2);

	EXPECT_EQ(receiver.TryReceive(), 1);
	EXPECT_EQ(receiver.Receive(), 2);
	EXPECT_EQ(receiver.TryReceive(), std::nullopt);

	sender.Release();
	EXPECT_FALSE(sender.IsDefined());
	EXPECT_EQ(receiver.Receive(), std::nullopt);
}

TEST(Channel, PendingAfterRelease)
{
	auto [sender, receiver] = MakeChannel<int>();

	sender.Send(42);
	sender.Release();

	/* values sent before the release are still delivered */
	EXPECT_EQ(receiver.Receive(), 42);
	EXPECT_EQ(receiver.Receive(), std::nullopt);
}

TEST(Channel, Copies)
{
	auto [sender, receiver] = MakeChannel<int>();

	auto copy = sender;
	sender.Release();

	/* the copy keeps the channel open */
	copy.Send(7);
	EXPECT_EQ(receiver.Receive(), 7);
	EXPECT_EQ(receiver.TryReceive(), std::nullopt);

	auto moved = std::move(copy);
	EXPECT_FALSE(copy.IsDefined());
	EXPECT_TRUE(moved.IsDefined());

	moved.Release();
	EXPECT_EQ(receiver.Receive(), std::nullopt);
}

TEST(Channel, ReceiverGone)
{
	auto [sender, receiver] = MakeChannel<int>();

	{
		auto r = std::move(receiver);
	}

	/* must not crash or block */
	sender.Send(1);
}

TEST(Channel, Threads)
{
	constexpr unsigned N_THREADS = 8;
	constexpr unsigned N_VALUES = 1000;

	auto [sender, receiver] = MakeChannel<unsigned>();

	std::vector<std::thread> threads;
	for (unsigned i = 0; i < N_THREADS; ++i)
		threads.emplace_back([s = sender]() mutable {
			for (unsigned j = 1; j <= N_VALUES; ++j)
				s.Send(j);
		});

	sender.Release();

	unsigned long sum = 0;
	unsigned count = 0;
	while (auto value = receiver.Receive()) {
		sum += *value;
		++count;
	}

	for (auto &t : threads)
		t.join();

	EXPECT_EQ(count, N_THREADS * N_VALUES);
	EXPECT_EQ(sum, N_THREADS * (N_VALUES * (N_VALUES + 1) / 2UL));
}
