#pragma once

#include "sv_basic.hpp"
#include "sv_pagetable.hpp"
#include "sv_pte.hpp"
#include <cstdint>

struct SV39_Trait {
    static constexpr int LEVELS = 3;
    static constexpr const char *NAME = "Sv39";
    static constexpr unsigned VA_BITS = 39;
    static constexpr uint64_t SATP_MODE = 8;
    using vaddr_t = uint64_t;
    using pte_t = uint64_t;

    // root to leaf
    static constexpr PageTableLevel LEVEL[LEVELS] = {{30, 9}, {21, 9}, {12, 9}};

    struct BITRANGE {
        struct VA {
            static constexpr std::pair<uint8_t, uint8_t> PAGEOFFSET = {11, 00};
            static constexpr std::pair<uint8_t, uint8_t> VPN0 = {20, 12};
            static constexpr std::pair<uint8_t, uint8_t> VPN1 = {29, 21};
            static constexpr std::pair<uint8_t, uint8_t> VPN2 = {38, 30};
            static constexpr std::pair<uint8_t, uint8_t> VPN[LEVELS] = {VPN0, VPN1, VPN2};
        };
        struct PA {
            static constexpr std::pair<uint8_t, uint8_t> PAGEOFFSET = {11, 00};
            static constexpr std::pair<uint8_t, uint8_t> PPNFULL = {55, 12};
            static constexpr std::pair<uint8_t, uint8_t> PPN0 = {20, 12};
            static constexpr std::pair<uint8_t, uint8_t> PPN1 = {29, 21};
            static constexpr std::pair<uint8_t, uint8_t> PPN2 = {55, 30};
            static constexpr std::pair<uint8_t, uint8_t> PPN[LEVELS] = {PPN0, PPN1, PPN2};
        };
        struct PTE {
            static constexpr std::pair<uint8_t, uint8_t> V = {0, 0};
            static constexpr std::pair<uint8_t, uint8_t> R = {1, 1};
            static constexpr std::pair<uint8_t, uint8_t> W = {2, 2};
            static constexpr std::pair<uint8_t, uint8_t> X = {3, 3};
            static constexpr std::pair<uint8_t, uint8_t> U = {4, 4};
            static constexpr std::pair<uint8_t, uint8_t> G = {5, 5};
            static constexpr std::pair<uint8_t, uint8_t> A = {6, 6};
            static constexpr std::pair<uint8_t, uint8_t> D = {7, 7};
            static constexpr std::pair<uint8_t, uint8_t> XWR = {3, 1};
            static constexpr std::pair<uint8_t, uint8_t> RSW = {9, 8};
            static constexpr std::pair<uint8_t, uint8_t> PPNFULL = {53, 10};
            static constexpr std::pair<uint8_t, uint8_t> PPN0 = {18, 10};
            static constexpr std::pair<uint8_t, uint8_t> PPN1 = {27, 19};
            static constexpr std::pair<uint8_t, uint8_t> PPN2 = {53, 28};
            static constexpr std::pair<uint8_t, uint8_t> PPN[LEVELS] = {PPN0, PPN1, PPN2};
            static constexpr std::pair<uint8_t, uint8_t> RESERVED = {60, 54};
            static constexpr std::pair<uint8_t, uint8_t> PBMT = {62, 61};
            static constexpr std::pair<uint8_t, uint8_t> N = {63, 63};
        };
    };
};

static_assert(levels_well_formed<SV39_Trait>(), "Sv39 levels must cover the 39-bit VA");

using SV39_basic = SV_basic<SV39_Trait>;
using SV39_pagetable = SV_pagetable<SV39_Trait>;
