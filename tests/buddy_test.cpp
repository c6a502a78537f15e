#include "buddy.hpp"
#include <algorithm>
#include <gtest/gtest.h>
#include <memory>
#include <set>
#include <utility>
#include <vector>

namespace {

using Buddy = BuddyAllocator<>;
using pfn_t = Buddy::pfn_t;

constexpr Buddy::paddr_t WINDOW_START = 0x80400000;
constexpr Buddy::paddr_t WINDOW_END = 0x80700000;
constexpr size_t WINDOW_PAGES = (WINDOW_END - WINDOW_START) / Buddy::PAGESIZE;

class BuddyTest : public ::testing::Test {
protected:
    void SetUp() override {
        buddy = std::make_unique<Buddy>();
        buddy->create_pages(WINDOW_START, WINDOW_END);
    }

    std::vector<std::vector<pfn_t>> snapshot() const {
        std::vector<std::vector<pfn_t>> lists;
        for (uint32_t order = 0; order <= Buddy::MAX_ORDER; order++) {
            lists.push_back(buddy->free_blocks(order));
        }
        return lists;
    }

    std::unique_ptr<Buddy> buddy;
};

TEST_F(BuddyTest, SeedsLargestAlignedBlocks) {
    EXPECT_EQ(buddy->window_pages(), WINDOW_PAGES);
    EXPECT_EQ(buddy->free_blocks(9), std::vector<pfn_t>{0x80400});
    EXPECT_EQ(buddy->free_blocks(8), std::vector<pfn_t>{0x80600});
    for (uint32_t order = 0; order <= Buddy::MAX_ORDER; order++) {
        if (order != 8 && order != 9) {
            EXPECT_TRUE(buddy->free_blocks(order).empty()) << "order " << order;
        }
    }
    EXPECT_EQ(buddy->get_usage(), 0u);
}

TEST_F(BuddyTest, ExhaustsAfterEveryFrameIsHandedOut) {
    std::set<pfn_t> seen;
    for (size_t i = 0; i < WINDOW_PAGES; i++) {
        auto page = buddy->alloc_order(0);
        ASSERT_TRUE(page.has_value()) << "allocation " << i;
        pfn_t pfn = buddy->to_pfn(*page);
        EXPECT_GE(pfn, 0x80400u);
        EXPECT_LT(pfn, 0x80700u);
        EXPECT_TRUE(seen.insert(pfn).second) << "PFN 0x" << std::hex << pfn << " handed out twice";
    }
    EXPECT_FALSE(buddy->alloc_order(0).has_value());
    EXPECT_EQ(buddy->get_usage(), WINDOW_PAGES * Buddy::PAGESIZE);
}

TEST_F(BuddyTest, FreeingEverythingRestoresLargeBlocks) {
    std::vector<RawPageHandle> pages;
    for (size_t i = 0; i < WINDOW_PAGES; i++) {
        pages.push_back(*buddy->alloc_order(0));
    }
    for (RawPageHandle page : pages) {
        buddy->dealloc(page);
    }
    EXPECT_EQ(buddy->get_usage(), 0u);

    auto big = buddy->alloc_order(9);
    ASSERT_TRUE(big.has_value());
    EXPECT_EQ(buddy->to_pfn(*big), 0x80400u);
    auto rest = buddy->alloc_order(8);
    ASSERT_TRUE(rest.has_value());
    EXPECT_EQ(buddy->to_pfn(*rest), 0x80600u);
    EXPECT_FALSE(buddy->alloc_order(0).has_value());
}

TEST_F(BuddyTest, AllocThenFreeLeavesFreeListsUnchanged) {
    const auto before = snapshot();
    for (uint32_t order = 0; order <= 8; order++) {
        auto page = buddy->alloc_order(order);
        ASSERT_TRUE(page.has_value()) << "order " << order;
        buddy->dealloc(*page);
        EXPECT_EQ(snapshot(), before) << "order " << order;
    }
}

TEST_F(BuddyTest, SplitsSmallestSufficientBlock) {
    // the order 8 block is the smallest one that can serve a single frame
    auto first = buddy->alloc_order(0);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(buddy->to_pfn(*first), 0x80600u);
    EXPECT_EQ(buddy->page(*first).order, 0u);
    for (uint32_t order = 0; order < 8; order++) {
        EXPECT_EQ(buddy->free_blocks(order), std::vector<pfn_t>{0x80600u + (pfn_t(1) << order)});
    }
    EXPECT_TRUE(buddy->free_blocks(8).empty());
    EXPECT_EQ(buddy->free_blocks(9), std::vector<pfn_t>{0x80400});
}

TEST_F(BuddyTest, CoalescesWithFreeBuddy) {
    auto a = *buddy->alloc_order(0);
    auto b = *buddy->alloc_order(0);
    EXPECT_EQ(buddy->to_pfn(b), buddy->to_pfn(a) ^ 1);

    buddy->dealloc(a);
    // b is still allocated, a cannot merge
    EXPECT_EQ(buddy->free_blocks(0), std::vector<pfn_t>{buddy->to_pfn(a)});

    buddy->dealloc(b);
    EXPECT_TRUE(buddy->free_blocks(0).empty());
    EXPECT_EQ(buddy->free_blocks(8), std::vector<pfn_t>{0x80600});
    EXPECT_FALSE(buddy->page(b).buddy);
    EXPECT_FALSE(buddy->page(b).free);
}

// 只留下0x80610和0x80611两个页被占用，order 9的块也被取走，
// 此时order 8的请求只能靠这两个页合并后得到
TEST(BuddyCoalesceTest, MergedBuddiesServeTheNextOrder) {
    const std::pair<pfn_t, pfn_t> free_orders[] = {{0x80610, 0x80611}, {0x80611, 0x80610}};
    for (auto [first, second] : free_orders) {
        SCOPED_TRACE(testing::Message() << "freeing 0x" << std::hex << first << " first");
        auto buddy = std::make_unique<Buddy>();
        buddy->create_pages(WINDOW_START, WINDOW_END);

        std::vector<RawPageHandle> pages;
        for (size_t i = 0; i < WINDOW_PAGES; i++) {
            pages.push_back(*buddy->alloc_order(0));
        }
        for (RawPageHandle page : pages) {
            pfn_t pfn = buddy->to_pfn(page);
            if (pfn != first && pfn != second) {
                buddy->dealloc(page);
            }
        }
        auto big = buddy->alloc_order(9);
        ASSERT_TRUE(big.has_value());
        EXPECT_EQ(buddy->to_pfn(*big), 0x80400u);
        EXPECT_FALSE(buddy->alloc_order(8).has_value());

        buddy->dealloc(buddy->from_pfn(first));
        EXPECT_FALSE(buddy->alloc_order(8).has_value());

        buddy->dealloc(buddy->from_pfn(second));
        auto merged = buddy->alloc_order(8);
        ASSERT_TRUE(merged.has_value());
        EXPECT_EQ(buddy->to_pfn(*merged), 0x80600u);
        EXPECT_FALSE(buddy->alloc_order(0).has_value());
    }
}

TEST_F(BuddyTest, BlocksNeverOverlap) {
    std::vector<std::pair<pfn_t, pfn_t>> ranges;
    const uint32_t orders[] = {3, 0, 5, 1, 7, 2, 0, 4, 6, 1};
    for (uint32_t order : orders) {
        auto page = buddy->alloc_order(order);
        ASSERT_TRUE(page.has_value());
        pfn_t pfn = buddy->to_pfn(*page);
        EXPECT_EQ(pfn % (pfn_t(1) << order), 0u) << "order " << order << " block misaligned";
        ranges.emplace_back(pfn, pfn + (pfn_t(1) << order));
    }
    std::sort(ranges.begin(), ranges.end());
    for (size_t i = 1; i < ranges.size(); i++) {
        EXPECT_LE(ranges[i - 1].second, ranges[i].first);
    }
    EXPECT_GE(ranges.front().first, 0x80400u);
    EXPECT_LE(ranges.back().second, 0x80700u);
}

TEST_F(BuddyTest, RejectsOrdersThatCannotBeServed) {
    EXPECT_FALSE(buddy->alloc_order(Buddy::MAX_ORDER).has_value());
    EXPECT_FALSE(buddy->alloc_order(Buddy::MAX_ORDER + 1).has_value());
    EXPECT_EQ(buddy->get_usage(), 0u);
}

TEST_F(BuddyTest, HandleConversions) {
    RawPageHandle handle = buddy->from_pfn(0x80432);
    EXPECT_EQ(handle.index, 0x32u);
    EXPECT_EQ(buddy->to_pfn(handle), 0x80432u);
    EXPECT_TRUE(buddy->has_management_over(handle));
    EXPECT_FALSE(buddy->has_management_over(RawPageHandle{static_cast<uint32_t>(WINDOW_PAGES)}));
}

using BuddyDeathTest = BuddyTest;

TEST_F(BuddyDeathTest, SecondRegistrationPanics) {
    EXPECT_DEATH(buddy->create_pages(WINDOW_START, WINDOW_END), "create_pages called twice");
}

TEST_F(BuddyDeathTest, DoubleFreePanics) {
    auto page = *buddy->alloc_order(0);
    buddy->dealloc(page);
    EXPECT_DEATH(buddy->dealloc(page), "Double free");
}

TEST_F(BuddyDeathTest, FreeingTailFramePanics) {
    auto page = *buddy->alloc_order(1);
    EXPECT_DEATH(buddy->dealloc(RawPageHandle{page.index + 1}), "not the head of a block");
}

TEST_F(BuddyDeathTest, FreeingReferencedPagePanics) {
    auto page = *buddy->alloc_order(0);
    buddy->page(page).refcount.store(1);
    EXPECT_DEATH(buddy->dealloc(page), "freed with refcount 1");
}

TEST_F(BuddyDeathTest, PfnOutsideWindowPanics) {
    EXPECT_DEATH(buddy->from_pfn(0x80700), "PFN out of range: 0x80700");
    EXPECT_DEATH(buddy->from_pfn(0x803ff), "PFN out of range");
}

TEST(BuddyRegistrationDeathTest, AllocationBeforeRegistrationPanics) {
    auto buddy = std::make_unique<Buddy>();
    EXPECT_DEATH(buddy->alloc_order(0), "before create_pages");
}

TEST(BuddyRegistrationDeathTest, BadWindowsPanic) {
    auto buddy = std::make_unique<Buddy>();
    EXPECT_DEATH(buddy->create_pages(0x80400800, 0x80700000), "Invalid physical window");
    EXPECT_DEATH(buddy->create_pages(0x80700000, 0x80400000), "Invalid physical window");
    EXPECT_DEATH(buddy->create_pages(0x80000000, 0x80800000), "exceeds capacity");
}

} // namespace
