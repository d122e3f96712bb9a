#pragma once

#include <QMetaType>
#include <QtGlobal>
#include <algorithm>
#include <utility>
#include <vector>

struct VirtualWindowInput {
    int itemCount = 0;
    double itemHeight = 0.0;
    double viewportHeight = 0.0;
    double scrollTop = 0.0;
    int overscan = 5;
};

// Inclusive index range of rows to materialize. An empty list yields
// startIndex 0, endIndex -1.
struct VirtualWindow {
    int startIndex = 0;
    int endIndex = -1;
    double offsetY = 0.0;
    double totalHeight = 0.0;
    int visibleStart = 0;       // First row actually inside the viewport
    int visibleEnd = -1;

    bool isEmpty() const { return endIndex < startIndex; }
    int count() const { return isEmpty() ? 0 : endIndex - startIndex + 1; }
    bool contains(int index) const { return index >= startIndex && index <= endIndex; }

    bool operator==(const VirtualWindow& other) const = default;
};

Q_DECLARE_METATYPE(VirtualWindow)

VirtualWindow computeVirtualWindow(const VirtualWindowInput& input);

// Items of the window paired with their absolute index.
template <typename T>
std::vector<std::pair<const T*, int>> visibleSlice(const std::vector<T>& items, const VirtualWindow& window) {
    std::vector<std::pair<const T*, int>> slice;
    if (window.isEmpty() || items.empty()) return slice;

    const int last = std::min(window.endIndex, static_cast<int>(items.size()) - 1);
    if (window.startIndex > last) return slice;

    slice.reserve(static_cast<size_t>(last - window.startIndex + 1));
    for (int i = window.startIndex; i <= last; ++i) {
        slice.emplace_back(&items[static_cast<size_t>(i)], i);
    }
    return slice;
}
