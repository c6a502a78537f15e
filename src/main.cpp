#include "boot.hpp"
#include "console.hpp"
#include "device_tree.hpp"
#include "hart.hpp"
#include "page_alloc.hpp"
#include "panic.hpp"
#include "physical_mem.hpp"
#include "sv39.hpp"
#include "sv48.hpp"
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>
#include <spdlog/cfg/argv.h>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace {

struct Options {
    bool sv48 = false;
    std::string dtb_path;
};

void usage(const char *prog) {
    fprintf(stderr, "usage: %s [--sv39 | --sv48] [--dtb <file>] [SPDLOG_LEVEL=<levels>]\n", prog);
}

// 返回0表示成功；spdlog的SPDLOG_LEVEL=参数留给load_argv_levels处理
int parse_args(int argc, char **argv, Options &opts) {
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--sv39") == 0) {
            opts.sv48 = false;
        } else if (strcmp(argv[i], "--sv48") == 0) {
            opts.sv48 = true;
        } else if (strcmp(argv[i], "--dtb") == 0) {
            if (i + 1 >= argc) {
                return -1;
            }
            opts.dtb_path = argv[++i];
        } else if (strncmp(argv[i], "SPDLOG_LEVEL=", 13) != 0) {
            return -1;
        }
    }
    return 0;
}

// 把设备树放在模拟RAM的顶端，返回其物理地址
int load_dtb(
    const std::string &path, PhysicalMemoryInterface &pmem, const BootConfig &config,
    std::shared_ptr<spdlog::logger> logger, PhysicalMemoryInterface::paddr_t &dtb_addr
) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        logger->error("cannot open device tree {}", path);
        return -1;
    }
    std::vector<uint8_t> blob(
        (std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>()
    );
    const uint64_t size = align_up(blob.size(), PhysicalMemoryInterface::PAGESIZE);
    if (blob.empty() || size > config.ram_size) {
        logger->error("device tree {} has a bad size of {} bytes", path, blob.size());
        return -1;
    }
    dtb_addr = config.ram_base + config.ram_size - size;
    if (dtb_addr < config.window_end) {
        logger->error("device tree {} overlaps the page frame window", path);
        return -1;
    }
    if (pmem.write(dtb_addr, blob.data(), blob.size())) {
        return -1;
    }
    logger->info("device tree {} loaded at 0x{:x}", path, dtb_addr);
    return 0;
}

template <typename Trait>
int boot(
    const Options &opts, std::shared_ptr<ConsoleInterface> console,
    std::shared_ptr<spdlog::logger> logger
) {
    BootConfig config = BootConfig::defaults<Trait>();
    auto pmem = std::make_shared<PhysicalMemoryBasicSim>(config.ram_base, config.ram_size, logger);
    auto alloc = std::make_shared<BuddyPageAlloc>(logger);

    if (!opts.dtb_path.empty() && load_dtb(opts.dtb_path, *pmem, config, logger, config.dtb_addr)) {
        return -1;
    }

    BootSequencer<Trait> seq(config, pmem, alloc, console, logger);
    FdtDeviceTree dt(pmem, logger);
    const size_t harts = seq.count_harts(&dt);

    SimHart boot_hart(0, pmem, logger);
    std::vector<std::unique_ptr<SimHart>> others;
    std::vector<TranslationControl *> secondaries;
    for (size_t i = 1; i < harts; i++) {
        others.push_back(std::make_unique<SimHart>(static_cast<unsigned>(i), pmem, logger));
        secondaries.push_back(others.back().get());
    }
    seq.run(boot_hart, secondaries);

    SPDLOG_LOGGER_INFO(
        logger, "{} harts halted, {} bytes of page frames in use", harts, alloc->get_usage()
    );
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    Options opts;
    if (parse_args(argc, argv, opts)) {
        usage(argv[0]);
        return -1;
    }

    auto console = std::make_shared<StdioConsole>();
    auto logger = std::make_shared<spdlog::logger>(
        "bootmm", std::make_shared<console_sink_mt>(*console)
    );
    spdlog::set_default_logger(logger);
    spdlog::cfg::load_env_levels();
    spdlog::cfg::load_argv_levels(argc, argv);
    set_panic_console(console.get());

    if (opts.sv48) {
        return boot<SV48_Trait>(opts, console, logger);
    }
    return boot<SV39_Trait>(opts, console, logger);
}
