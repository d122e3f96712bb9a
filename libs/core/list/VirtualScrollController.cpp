#include "list/VirtualScrollController.hpp"
#include "adaptive/RenderPolicy.hpp"
#include "BeaconLogging.hpp"

VirtualScrollController::VirtualScrollController(int overscan, QObject* parent)
    : QObject(parent) {
    m_input.overscan = overscan;
}

void VirtualScrollController::setItemCount(int count) {
    if (m_input.itemCount == count) return;
    m_input.itemCount = count;
    recompute();
}

void VirtualScrollController::setItemHeight(double height) {
    if (m_input.itemHeight == height) return;
    m_input.itemHeight = height;
    recompute();
}

void VirtualScrollController::setViewportHeight(double height) {
    if (m_input.viewportHeight == height) return;
    m_input.viewportHeight = height;
    recompute();
}

void VirtualScrollController::setScrollTop(double scrollTop) {
    if (m_input.scrollTop == scrollTop) return;
    m_input.scrollTop = scrollTop;
    emit scrollTopChanged(scrollTop);
    recompute();
}

void VirtualScrollController::setOverscan(int overscan) {
    if (m_input.overscan == overscan) return;
    m_input.overscan = overscan;
    recompute();
}

void VirtualScrollController::applyPolicy(const RenderPolicy& policy) {
    setOverscan(policy.recommendedOverscan);
}

void VirtualScrollController::recompute() {
    const VirtualWindow next = computeVirtualWindow(m_input);
    if (next == m_window) return;

    m_window = next;
    bLog_RenderN(30, "List window" << m_window.startIndex << "-" << m_window.endIndex
                 << "offset" << m_window.offsetY << "of" << m_window.totalHeight);
    emit windowChanged(m_window);
}
