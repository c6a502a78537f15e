#include "sv_pte.hpp"

TableAttribute RawAttribute::as_table_attr() const {
    BOOTMM_ASSERT((m_raw & PA_RWX) == 0, "Invalid page attribute combination");

    TableAttribute attr;
    if (m_raw & PA_V) attr |= TableFlag::PRESENT;
    if (m_raw & PA_U) attr |= TableFlag::USER;
    if (m_raw & PA_G) attr |= TableFlag::GLOBAL;
    if (m_raw & PA_A) attr |= TableFlag::ACCESSED;
    return attr;
}

PageAttribute RawAttribute::as_page_attr() const {
    BOOTMM_ASSERT((m_raw & PA_RWX) != 0, "Invalid page attribute combination");

    PageAttribute attr;
    if (m_raw & PA_V) attr |= PageFlag::PRESENT;
    if (m_raw & PA_R) attr |= PageFlag::READ;
    if (m_raw & PA_W) attr |= PageFlag::WRITE;
    if (m_raw & PA_X) attr |= PageFlag::EXECUTE;
    if (m_raw & PA_U) attr |= PageFlag::USER;
    if (m_raw & PA_G) attr |= PageFlag::GLOBAL;
    if (m_raw & PA_A) attr |= PageFlag::ACCESSED;
    if (m_raw & PA_D) attr |= PageFlag::DIRTY;
    if (m_raw & PA_COW) attr |= PageFlag::COPY_ON_WRITE;
    if (m_raw & PA_MMAP) attr |= PageFlag::MAPPED;
    return attr;
}

DecodedAttribute RawAttribute::decode() const {
    if (is_leaf()) {
        return as_page_attr();
    }
    if (is_valid()) {
        return as_table_attr();
    }
    return NotPresent{};
}

RawAttribute RawAttribute::from_table_attr(TableAttribute attr) {
    raw_t raw = 0;
    if (attr.contains(TableFlag::PRESENT)) raw |= PA_V;
    if (attr.contains(TableFlag::USER)) raw |= PA_U;
    if (attr.contains(TableFlag::GLOBAL)) raw |= PA_G;
    if (attr.contains(TableFlag::ACCESSED)) raw |= PA_A;
    return RawAttribute(raw);
}

RawAttribute RawAttribute::from_page_attr(PageAttribute attr) {
    BOOTMM_ASSERT(attr.intersects(PAGE_ATTR_RWX), "Invalid page attribute combination");

    raw_t raw = 0;
    if (attr.contains(PageFlag::PRESENT)) raw |= PA_V;
    if (attr.contains(PageFlag::READ)) raw |= PA_R;
    if (attr.contains(PageFlag::WRITE)) raw |= PA_W;
    if (attr.contains(PageFlag::EXECUTE)) raw |= PA_X;
    if (attr.contains(PageFlag::USER)) raw |= PA_U;
    if (attr.contains(PageFlag::GLOBAL)) raw |= PA_G;
    if (attr.contains(PageFlag::ACCESSED)) raw |= PA_A;
    if (attr.contains(PageFlag::DIRTY)) raw |= PA_D;
    if (attr.contains(PageFlag::COPY_ON_WRITE)) raw |= PA_COW;
    if (attr.contains(PageFlag::MAPPED)) raw |= PA_MMAP;
    return RawAttribute(raw);
}
