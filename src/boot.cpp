#include "boot.hpp"
#include "panic.hpp"
#include "sv39.hpp"
#include "sv48.hpp"
#include <spdlog/spdlog.h>
#include <string_view>

const char *boot_state_name(BootState state) {
    switch (state) {
    case BootState::UNINITIALIZED:
        return "Uninitialized";
    case BootState::WINDOW_REGISTERED:
        return "WindowRegistered";
    case BootState::ROOT_TABLE_ALLOCATED:
        return "RootTableAllocated";
    case BootState::MAPPINGS_INSTALLED:
        return "MappingsInstalled";
    case BootState::TRANSLATION_ACTIVE:
        return "TranslationActive";
    case BootState::SERVING:
        return "Serving";
    }
    return "Unknown";
}

template <typename Trait>
BootSequencer<Trait>::BootSequencer(
    BootConfig config, std::shared_ptr<PhysicalMemoryInterface> pmem,
    std::shared_ptr<BuddyPageAlloc> alloc, std::shared_ptr<ConsoleInterface> console,
    std::shared_ptr<spdlog::logger> logger
)
    : m_config(config), m_pmem(pmem), m_alloc(alloc), m_console(console),
      m_logger(logger ? logger : spdlog::default_logger()) {}

template <typename Trait>
void BootSequencer<Trait>::expect_state(BootState expected, const char *step) const {
    BOOTMM_ASSERT(
        m_state == expected, "Boot step {} called in state {}, expected {}", step,
        boot_state_name(m_state), boot_state_name(expected)
    );
}

template <typename Trait> void BootSequencer<Trait>::advance(BootState next) {
    SPDLOG_LOGGER_DEBUG(
        m_logger, "boot: {} -> {}", boot_state_name(m_state), boot_state_name(next)
    );
    m_state = next;
}

template <typename Trait> void BootSequencer<Trait>::register_window() {
    expect_state(BootState::UNINITIALIZED, "register_window");
    m_alloc->create_pages(m_config.window_start, m_config.window_end);
    m_logger->info(
        "page frames [0x{:x}, 0x{:x}) registered", m_config.window_start, m_config.window_end
    );
    advance(BootState::WINDOW_REGISTERED);
}

template <typename Trait> void BootSequencer<Trait>::allocate_root_table() {
    expect_state(BootState::WINDOW_REGISTERED, "allocate_root_table");
    m_table.emplace(SV_pagetable<Trait>::create(m_alloc, m_pmem, m_logger));
    m_logger->info("{} root pagetable at 0x{:x}", Trait::NAME, m_table->addr());
    advance(BootState::ROOT_TABLE_ALLOCATED);
}

template <typename Trait>
size_t BootSequencer<Trait>::map_range(
    VRange range, size_t depth, pfn_t first_pfn, PageAttribute attr
) {
    const uint64_t page_size = Trait::LEVEL[depth - 1].page_size();
    BOOTMM_ASSERT(
        range.start % page_size == 0 &&
            PhysicalMemoryInterface::addr_of(first_pfn) % page_size == 0,
        "Mapping 0x{:x} -> PFN 0x{:x} is not aligned to 0x{:x}", range.start, first_pfn, page_size
    );
    const pfn_t step = page_size / PAGESIZE;
    const RawAttribute raw = RawAttribute::from_page_attr(attr);
    size_t idx = 0;
    for (auto ref : m_table->iter_kernel_levels(range, depth)) {
        ref.pte.set(first_pfn + idx * step, raw);
        idx++;
    }
    return idx;
}

template <typename Trait> void BootSequencer<Trait>::install_mappings() {
    expect_state(BootState::ROOT_TABLE_ALLOCATED, "install_mappings");
    const PageAttribute attr = PAGE_ATTR_RWX | PageFlag::GLOBAL | PageFlag::PRESENT;
    const PageAttribute mmio_attr =
        PageFlag::READ | PageFlag::WRITE | PageFlag::GLOBAL | PageFlag::PRESENT;
    const pfn_t kimage_pfn = PhysicalMemoryInterface::pfn_of(m_config.kimage_phys_base);

    // kernel image identity, 2MiB pages
    m_stats.identity = map_range(
        VRange::from(m_config.kimage_phys_base).grow(m_config.kimage_identity_size), LEVELS - 1,
        kimage_pfn, attr
    );
    // physical memory from address 0, 1GiB pages
    m_stats.phys_map = map_range(
        VRange::from(m_config.phys_map_virt).grow(m_config.phys_map_size), LEVELS - 2, 0, attr
    );
    m_stats.mmio = map_range(
        VRange::from(m_config.mmio_base).grow(m_config.mmio_size), LEVELS,
        PhysicalMemoryInterface::pfn_of(m_config.mmio_base), mmio_attr
    );
    m_stats.kimage = map_range(
        VRange::from(m_config.kimage_virt_base).grow(m_config.kimage_virt_size), LEVELS,
        kimage_pfn, attr
    );
    m_logger->info(
        "mappings installed: identity {} x 2MiB, phys map {} x 1GiB, mmio {} x 4KiB, kimage {} x "
        "4KiB, {} table pages",
        m_stats.identity, m_stats.phys_map, m_stats.mmio, m_stats.kimage, m_table->table_pages()
    );
    advance(BootState::MAPPINGS_INSTALLED);
}

template <typename Trait>
void BootSequencer<Trait>::activate_translation(TranslationControl &hart) {
    expect_state(BootState::MAPPINGS_INSTALLED, "activate_translation");
    SV_basic<Trait> mmu(m_pmem, m_logger);
    BOOTMM_ASSERT(
        mmu.translate(m_table->addr(), m_config.boot_pc) == m_config.boot_pc,
        "Boot code at 0x{:x} is not identity mapped, refusing to enable paging", m_config.boot_pc
    );
    hart.set_satp(Trait::SATP_MODE, 0, m_table->root_pfn());
    hart.sfence_vma();
    advance(BootState::TRANSLATION_ACTIVE);
    console_print(*m_console, "paging enabled\n");
}

template <typename Trait> void BootSequencer<Trait>::start_secondary(TranslationControl &hart) {
    BOOTMM_ASSERT(
        m_state == BootState::TRANSLATION_ACTIVE || m_state == BootState::SERVING,
        "Secondary hart started in state {}", boot_state_name(m_state)
    );
    hart.set_satp(Trait::SATP_MODE, 0, m_table->root_pfn());
    hart.sfence_vma();
}

template <typename Trait>
typename BootSequencer<Trait>::vaddr_t BootSequencer<Trait>::line_buffer_vaddr() const {
    const uint64_t size = align_up(m_config.line_buffer_size, PAGESIZE);
    return m_config.kimage_virt_base + m_config.kimage_virt_size - size;
}

template <typename Trait> void BootSequencer<Trait>::serve(SimHart &hart) {
    expect_state(BootState::TRANSLATION_ACTIVE, "serve");
    BOOTMM_ASSERT(
        hart.mode() == Trait::SATP_MODE, "hart {} does not run in {} mode", hart.hartid(),
        Trait::NAME
    );
    advance(BootState::SERVING);

    const size_t capacity = m_config.line_buffer_size;
    const vaddr_t buffer = line_buffer_vaddr();
    std::vector<uint8_t> input(capacity);
    std::vector<uint8_t> line(capacity);
    while (true) {
        auto count = console_read_line(*m_console, input.data(), capacity);
        if (!count) {
            if (m_console->closed()) {
                break;
            }
            continue;
        }
        BOOTMM_ASSERT(
            hart.write(buffer, input.data(), *count) == 0 &&
                hart.read(buffer, line.data(), *count) == 0,
            "Page fault on line buffer at 0x{:x}", buffer
        );
        BOOTMM_ASSERT(is_valid_utf8(line.data(), *count), "Input is not valid UTF-8");
        console_print(*m_console, "Input string: ");
        console_print(
            *m_console, std::string_view(reinterpret_cast<const char *>(line.data()), *count)
        );
        console_print(*m_console, "\n");
    }
    m_logger->info("console closed, leaving echo loop");
}

template <typename Trait> size_t BootSequencer<Trait>::count_harts(DeviceTreeQuery *dt) const {
    if (dt == nullptr || m_config.dtb_addr == 0) {
        return 1;
    }
    size_t harts = dt->count_cpus(m_config.dtb_addr);
    BOOTMM_ASSERT(harts > 0, "Device tree at 0x{:x} lists no harts", m_config.dtb_addr);
    return harts;
}

template <typename Trait>
void BootSequencer<Trait>::run(
    SimHart &boot_hart, const std::vector<TranslationControl *> &secondaries
) {
    console_print(*m_console, "Hello World!\n");
    register_window();
    allocate_root_table();
    install_mappings();
    activate_translation(boot_hart);
    for (TranslationControl *hart : secondaries) {
        start_secondary(*hart);
    }
    serve(boot_hart);
}

template <typename Trait> SV_pagetable<Trait> &BootSequencer<Trait>::page_table() {
    BOOTMM_ASSERT(m_table.has_value(), "Root pagetable not allocated yet");
    return *m_table;
}

template class BootSequencer<SV39_Trait>;
template class BootSequencer<SV48_Trait>;
