#include "hart.hpp"
#include "page_alloc.hpp"
#include "physical_mem.hpp"
#include "sv39.hpp"
#include "sv48.hpp"
#include <cstring>
#include <gtest/gtest.h>
#include <memory>
#include <vector>

namespace {

class SimHartTest : public ::testing::Test {
protected:
    void SetUp() override {
        pmem = std::make_shared<PhysicalMemoryBasicSim>();
        alloc = std::make_shared<BuddyPageAlloc>();
        alloc->create_pages(0x80400000, 0x80700000);
    }

    // 0x40000000.. -> 0x80100000.., count pages of 4KiB
    SV39_pagetable map_pages(size_t count) {
        auto table = SV39_pagetable::create(alloc, pmem);
        const RawAttribute attr =
            RawAttribute::from_page_attr(PageFlag::READ | PageFlag::WRITE | PageFlag::PRESENT);
        size_t idx = 0;
        for (auto ref : table.iter_kernel(VRange::from(0x40000000).grow(count * 0x1000))) {
            ref.pte.set(0x80100 + idx++, attr);
        }
        return table;
    }

    std::shared_ptr<PhysicalMemoryBasicSim> pmem;
    std::shared_ptr<BuddyPageAlloc> alloc;
};

TEST_F(SimHartTest, SatpLayout) {
    SimHart hart(0, pmem);
    EXPECT_EQ(hart.mode(), SimHart::SATP_MODE_BARE);
    hart.set_satp(SV39_Trait::SATP_MODE, 0x1234, 0x80400);
    EXPECT_EQ(hart.satp(), (8ull << 60) | (0x1234ull << 44) | 0x80400);
    EXPECT_EQ(hart.mode(), 8u);
    EXPECT_EQ(hart.root_pfn(), 0x80400u);

    hart.set_satp(SV48_Trait::SATP_MODE, 0, 0xfffffffffffull);
    EXPECT_EQ(hart.satp(), (9ull << 60) | 0xfffffffffffull);
}

TEST_F(SimHartTest, BareModeIsIdentity) {
    SimHart hart(0, pmem);
    EXPECT_EQ(hart.translate(0x80001234), 0x80001234u);
    uint32_t value = 0xdeadbeef;
    ASSERT_EQ(hart.write(0x80001000, &value, sizeof(value)), 0);
    uint32_t readback = 0;
    ASSERT_EQ(pmem->read(0x80001000, &readback, sizeof(readback)), 0);
    EXPECT_EQ(readback, value);
}

TEST_F(SimHartTest, AccessesGoThroughThePageTable) {
    auto table = map_pages(2);
    SimHart hart(1, pmem);
    hart.set_satp(SV39_Trait::SATP_MODE, 0, table.root_pfn());
    hart.sfence_vma();

    std::vector<uint8_t> data(0x1800);
    for (size_t i = 0; i < data.size(); i++) {
        data[i] = static_cast<uint8_t>(i * 7);
    }
    // straddles the two mapped pages
    ASSERT_EQ(hart.write(0x40000400, data.data(), data.size()), 0);

    std::vector<uint8_t> physical(data.size());
    ASSERT_EQ(pmem->read(0x80100400, physical.data(), physical.size()), 0);
    EXPECT_EQ(physical, data);

    std::vector<uint8_t> readback(data.size());
    ASSERT_EQ(hart.read(0x40000400, readback.data(), readback.size()), 0);
    EXPECT_EQ(readback, data);
}

TEST_F(SimHartTest, UnmappedAccessFaults) {
    auto table = map_pages(1);
    SimHart hart(0, pmem);
    hart.set_satp(SV39_Trait::SATP_MODE, 0, table.root_pfn());
    uint8_t byte = 1;
    EXPECT_EQ(hart.translate(0x40001000), 0u);
    EXPECT_EQ(hart.write(0x40000fff, &byte, 2), -1);
    EXPECT_EQ(hart.read(0x7000000000, &byte, 1), -1);
}

TEST_F(SimHartTest, TlbHoldsTranslationsUntilFence) {
    auto table = map_pages(1);
    SimHart hart(0, pmem);
    hart.set_satp(SV39_Trait::SATP_MODE, 0, table.root_pfn());
    EXPECT_EQ(hart.translate(0x40000010), 0x80100010u);
    EXPECT_EQ(hart.tlb_entries(), 1u);

    // remap without a fence: the stale translation is still used
    for (auto ref : table.iter_kernel(VRange::from(0x40000000).grow(0x1000))) {
        ref.pte.set(0x80200, RawAttribute::from_page_attr(PageFlag::READ | PageFlag::PRESENT));
    }
    EXPECT_EQ(hart.translate(0x40000010), 0x80100010u);
    hart.sfence_vma();
    EXPECT_EQ(hart.tlb_entries(), 0u);
    EXPECT_EQ(hart.translate(0x40000010), 0x80200010u);
}

TEST_F(SimHartTest, UnsupportedModePanics) {
    SimHart hart(0, pmem);
    EXPECT_DEATH(hart.set_satp(10, 0, 0), "Unsupported satp mode 10");
    EXPECT_DEATH(hart.set_satp(8, 0, 1ull << 44), "too wide");
}

} // namespace
