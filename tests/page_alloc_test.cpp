#include "page_alloc.hpp"
#include "spin_lock.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace {

class PageAllocTest : public ::testing::Test {
protected:
    void SetUp() override {
        alloc = std::make_shared<BuddyPageAlloc>();
        alloc->create_pages(0x80400000, 0x80700000);
    }

    std::shared_ptr<BuddyPageAlloc> alloc;
};

TEST_F(PageAllocTest, AdapterForwardsToBuddy) {
    auto raw = alloc->alloc_order(2);
    ASSERT_TRUE(raw.has_value());
    EXPECT_TRUE(alloc->has_management_over(*raw));
    EXPECT_EQ(alloc->order(*raw), 2u);
    EXPECT_EQ(alloc->from_pfn(alloc->to_pfn(*raw)), *raw);
    EXPECT_EQ(alloc->get_usage(), 4 * PhysicalMemoryInterface::PAGESIZE);
    alloc->dealloc(*raw);
    EXPECT_EQ(alloc->get_usage(), 0u);
}

TEST_F(PageAllocTest, WindowBoundaries) {
    EXPECT_EQ(alloc->from_pfn(0x80400).index, 0u);
    EXPECT_EQ(alloc->from_pfn(0x806ff).index, 767u);
    EXPECT_FALSE(alloc->has_management_over(RawPageHandle{768}));
}

TEST_F(PageAllocTest, PageOwnsOneReference) {
    {
        Page page = Page::alloc_in(alloc);
        EXPECT_TRUE(page.valid());
        EXPECT_EQ(page.refcount(), 1u);
        EXPECT_EQ(page.order(), 0u);
        EXPECT_EQ(page.size(), PhysicalMemoryInterface::PAGESIZE);
        EXPECT_EQ(page.start(), PhysicalMemoryInterface::addr_of(page.pfn()));
        EXPECT_EQ(alloc->get_usage(), PhysicalMemoryInterface::PAGESIZE);
    }
    EXPECT_EQ(alloc->get_usage(), 0u);
}

TEST_F(PageAllocTest, CloneSharesTheBlock) {
    Page page = Page::alloc_in(alloc, 3);
    {
        Page copy = page.clone();
        EXPECT_EQ(copy.raw(), page.raw());
        EXPECT_EQ(page.refcount(), 2u);
    }
    EXPECT_EQ(page.refcount(), 1u);
    EXPECT_EQ(alloc->get_usage(), 8 * PhysicalMemoryInterface::PAGESIZE);

    Page moved = std::move(page);
    EXPECT_FALSE(page.valid());
    EXPECT_EQ(moved.refcount(), 1u);
}

TEST_F(PageAllocTest, RawRoundTripKeepsOwnership) {
    Page page = Page::alloc_in(alloc);
    RawPageHandle raw = page.into_raw();
    EXPECT_FALSE(page.valid());
    EXPECT_EQ(alloc->refcount(raw).load(), 1u);
    EXPECT_EQ(alloc->get_usage(), PhysicalMemoryInterface::PAGESIZE);

    {
        Page again = Page::from_raw(alloc, raw);
        EXPECT_EQ(again.refcount(), 1u);
    }
    EXPECT_EQ(alloc->get_usage(), 0u);
}

TEST_F(PageAllocTest, TryAllocReportsExhaustion) {
    std::vector<Page> pages;
    for (int i = 0; i < 768; i++) {
        pages.push_back(Page::alloc_in(alloc));
    }
    EXPECT_FALSE(Page::try_alloc_in(alloc).has_value());
    pages.pop_back();
    EXPECT_TRUE(Page::try_alloc_in(alloc).has_value());
}

TEST_F(PageAllocTest, ConcurrentAllocationsStayConsistent) {
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; t++) {
        workers.emplace_back([this] {
            for (int i = 0; i < 200; i++) {
                std::optional<Page> page = Page::try_alloc_in(alloc, i % 3);
                ASSERT_TRUE(page.has_value());
            }
        });
    }
    for (auto &worker : workers) {
        worker.join();
    }
    EXPECT_EQ(alloc->get_usage(), 0u);
    EXPECT_EQ(alloc->free_blocks(9), std::vector<PhysicalMemoryInterface::pfn_t>{0x80400});
    EXPECT_EQ(alloc->free_blocks(8), std::vector<PhysicalMemoryInterface::pfn_t>{0x80600});
}

using PageAllocDeathTest = PageAllocTest;

TEST_F(PageAllocDeathTest, OutOfRangePfnPanics) {
    EXPECT_DEATH(alloc->from_pfn(0x80000), "PFN out of range: 0x80000");
}

TEST_F(PageAllocDeathTest, AllocInPanicsWhenExhausted) {
    std::vector<Page> pages;
    for (int i = 0; i < 3; i++) {
        pages.push_back(Page::alloc_in(alloc, 8));
    }
    EXPECT_DEATH(Page::alloc_in(alloc, 8), "Out of memory allocating a page of order 8");
}

TEST_F(PageAllocDeathTest, AdoptingUnownedPagePanics) {
    auto raw = *alloc->alloc_order(0);
    EXPECT_DEATH(Page::from_raw(alloc, raw), "has no owner");
}

TEST(LockedTest, GuardGivesExclusiveAccess) {
    Locked<std::vector<int>> numbers;
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; t++) {
        workers.emplace_back([&numbers, t] {
            for (int i = 0; i < 1000; i++) {
                numbers.lock()->push_back(t);
            }
        });
    }
    for (auto &worker : workers) {
        worker.join();
    }
    EXPECT_EQ(numbers.lock()->size(), 4000u);

    SpinLock lock;
    EXPECT_TRUE(lock.try_lock());
    EXPECT_FALSE(lock.try_lock());
    lock.unlock();
    EXPECT_TRUE(lock.try_lock());
    lock.unlock();
}

} // namespace
