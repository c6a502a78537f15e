#pragma once

#include "panic.hpp"
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>

/**
 * @brief 页框句柄：页元数据数组中的下标，不拥有页框
 */
struct RawPageHandle {
    uint32_t index;

    bool operator==(const RawPageHandle &other) const { return index == other.index; }
    bool operator!=(const RawPageHandle &other) const { return index != other.index; }
};

// 侵入式双向链表节点，前后节点用同一数组中的下标表示
struct Link {
    static constexpr uint32_t NIL = UINT32_MAX;
    uint32_t prev = NIL;
    uint32_t next = NIL;
};

/**
 * @brief 每个物理页框的元数据
 */
struct RawPage {
    Link link;
    bool free = false;
    bool buddy = false; // head frame of a block (free or allocated)
    uint32_t order = 0;
    std::atomic<size_t> refcount{0};
};

/**
 * @brief 固定容量的页元数据数组
 */
template <size_t Capacity> class PageMetadataStore {
public:
    static constexpr size_t CAPACITY = Capacity;

    RawPage &at(uint32_t index) {
        BOOTMM_ASSERT(index < Capacity, "Page index out of range: {}", index);
        return m_pages[index];
    }
    const RawPage &at(uint32_t index) const {
        BOOTMM_ASSERT(index < Capacity, "Page index out of range: {}", index);
        return m_pages[index];
    }

private:
    std::array<RawPage, Capacity> m_pages;
};

/**
 * @brief 以下标串联的空闲链表，节点存放在PageMetadataStore的RawPage::link中
 */
template <size_t Capacity> class FreeList {
public:
    using Store = PageMetadataStore<Capacity>;

    bool empty() const { return m_head == Link::NIL; }
    size_t size() const { return m_size; }
    std::optional<uint32_t> front() const {
        if (empty()) return std::nullopt;
        return m_head;
    }

    void push_front(Store &store, uint32_t index) {
        Link &link = store.at(index).link;
        BOOTMM_ASSERT(
            link.prev == Link::NIL && link.next == Link::NIL && m_head != index,
            "Page {} is already linked", index
        );
        link.next = m_head;
        if (m_head != Link::NIL) {
            store.at(m_head).link.prev = index;
        }
        m_head = index;
        m_size++;
    }

    void remove(Store &store, uint32_t index) {
        Link &link = store.at(index).link;
        if (link.prev != Link::NIL) {
            store.at(link.prev).link.next = link.next;
        } else {
            BOOTMM_ASSERT(m_head == index, "Page {} is not on this free list", index);
            m_head = link.next;
        }
        if (link.next != Link::NIL) {
            store.at(link.next).link.prev = link.prev;
        }
        link = Link{};
        m_size--;
    }

    std::optional<uint32_t> pop_front(Store &store) {
        if (empty()) return std::nullopt;
        uint32_t index = m_head;
        remove(store, index);
        return index;
    }

    template <typename Fn> void for_each(const Store &store, Fn fn) const {
        for (uint32_t i = m_head; i != Link::NIL; i = store.at(i).link.next) {
            fn(i);
        }
    }

private:
    uint32_t m_head = Link::NIL;
    size_t m_size = 0;
};
