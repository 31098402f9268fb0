#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "activelocationregistry.hpp"

using namespace ::testing;
using namespace ::ferry::resume;

TEST(ActiveLocationRegistryTest, AcquireAndRelease)
{
    ActiveLocationRegistry registry;

    EXPECT_TRUE(registry.acquire("/data/a.bin", "job-1"));
    EXPECT_TRUE(registry.contains("/data/a.bin"));
    EXPECT_EQ(registry.owner("/data/a.bin"), "job-1");

    EXPECT_FALSE(registry.acquire("/data/a.bin", "job-2"));
    EXPECT_FALSE(registry.acquire("/data/a.bin", "job-1"));
    EXPECT_EQ(registry.owner("/data/a.bin"), "job-1");

    EXPECT_FALSE(registry.release("/data/a.bin", "job-2"));
    EXPECT_TRUE(registry.release("/data/a.bin", "job-1"));
    EXPECT_FALSE(registry.contains("/data/a.bin"));
    EXPECT_EQ(registry.owner("/data/a.bin"), "");

    EXPECT_TRUE(registry.acquire("/data/a.bin", "job-2"));
}

TEST(ActiveLocationRegistryTest, ConcurrentAcquireHasSingleWinner)
{
    ActiveLocationRegistry   registry;
    std::atomic_int          winners {0};
    std::vector<std::thread> threads;

    for (int i = 0; i != 16; ++i)
    {
        threads.emplace_back([&, i] {
            if (registry.acquire("stream://stdin", "job-" + std::to_string(i)))
            {
                ++winners;
            }
        });
    }
    for (auto &t : threads)
    {
        t.join();
    }

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(registry.size(), 1u);
}
