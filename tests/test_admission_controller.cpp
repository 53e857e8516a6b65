#include <gtest/gtest.h>
#include "admission_controller.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace edgegate;

TEST(AdmissionControllerTest, PerSessionLimit) {
    AdmissionController ac(2, 100);

    EXPECT_TRUE(ac.try_admit("sess-1").accepted);
    EXPECT_TRUE(ac.try_admit("sess-1").accepted);

    auto third = ac.try_admit("sess-1");
    EXPECT_FALSE(third.accepted);
    EXPECT_EQ(third.reason, AdmitResult::Reason::PER_SESSION_LIMIT);
    EXPECT_EQ(ac.session_count("sess-1"), 2u);
    EXPECT_EQ(ac.global_count(), 2u);

    // Other sessions are unaffected
    EXPECT_TRUE(ac.try_admit("sess-2").accepted);
}

TEST(AdmissionControllerTest, GlobalLimitAcrossSessions) {
    AdmissionController ac(5, 3);

    EXPECT_TRUE(ac.try_admit("a").accepted);
    EXPECT_TRUE(ac.try_admit("b").accepted);
    EXPECT_TRUE(ac.try_admit("c").accepted);

    auto result = ac.try_admit("d");
    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.reason, AdmitResult::Reason::GLOBAL_LIMIT);
    EXPECT_EQ(ac.global_count(), 3u);
    EXPECT_EQ(ac.session_count("d"), 0u);
}

TEST(AdmissionControllerTest, ReleaseFreesSlot) {
    AdmissionController ac(1, 10);

    EXPECT_TRUE(ac.try_admit("s").accepted);
    EXPECT_FALSE(ac.try_admit("s").accepted);

    ac.release("s");
    EXPECT_EQ(ac.session_count("s"), 0u);
    EXPECT_EQ(ac.global_count(), 0u);
    EXPECT_TRUE(ac.try_admit("s").accepted);
}

TEST(AdmissionControllerTest, ReleaseIsFlooredAtZero) {
    AdmissionController ac(3, 10);

    ac.release("never-admitted");
    EXPECT_EQ(ac.global_count(), 0u);

    EXPECT_TRUE(ac.try_admit("s").accepted);
    ac.release("s");
    ac.release("s");
    EXPECT_EQ(ac.global_count(), 0u);
    EXPECT_EQ(ac.session_count("s"), 0u);
    EXPECT_EQ(ac.per_session_sum(), ac.global_count());
}

// Six concurrent attempts against a per-session cap of five: exactly one
// is rejected no matter how the threads interleave.
TEST(AdmissionControllerTest, ConcurrentAdmitsRespectPerSessionCap) {
    for (int round = 0; round < 50; ++round) {
        AdmissionController ac(5, 1000);
        std::atomic<int> accepted{0};
        std::atomic<int> rejected{0};

        std::vector<std::thread> threads;
        for (int i = 0; i < 6; ++i) {
            threads.emplace_back([&] {
                auto r = ac.try_admit("S");
                if (r.accepted) {
                    ++accepted;
                } else {
                    EXPECT_EQ(r.reason, AdmitResult::Reason::PER_SESSION_LIMIT);
                    ++rejected;
                }
            });
        }
        for (auto& t : threads) t.join();

        ASSERT_EQ(accepted.load(), 5);
        ASSERT_EQ(rejected.load(), 1);
        ASSERT_EQ(ac.session_count("S"), 5u);
        ASSERT_EQ(ac.global_count(), 5u);
    }
}

TEST(AdmissionControllerTest, GlobalEqualsSumUnderChurn) {
    AdmissionController ac(3, 20);
    std::vector<std::thread> threads;

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&ac, t] {
            std::string key = "user-" + std::to_string(t % 4);
            for (int i = 0; i < 500; ++i) {
                if (ac.try_admit(key).accepted) {
                    ac.release(key);
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(ac.global_count(), 0u);
    EXPECT_EQ(ac.per_session_sum(), ac.global_count());
}
