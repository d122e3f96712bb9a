#include "list/VirtualWindow.hpp"
#include <algorithm>
#include <cmath>

VirtualWindow computeVirtualWindow(const VirtualWindowInput& input) {
    VirtualWindow window;
    if (input.itemCount <= 0 || !(input.itemHeight > 0.0)) {
        return window;
    }

    const int lastIndex = input.itemCount - 1;
    const double scrollTop = std::max(0.0, input.scrollTop);
    const double viewportHeight = std::max(0.0, input.viewportHeight);
    const int overscan = std::max(0, input.overscan);

    // Row arithmetic stays in double until it is clamped to [0, lastIndex]; overscan is
    // applied in 64 bits so neither step can overflow int.
    const double last = static_cast<double>(lastIndex);
    const double firstRow = std::min(std::floor(scrollTop / input.itemHeight), last);
    const double visibleRows = std::ceil(viewportHeight / input.itemHeight);
    const int visibleStart = static_cast<int>(firstRow);
    const int visibleEnd = static_cast<int>(std::min(firstRow + visibleRows, last));

    window.visibleStart = visibleStart;
    window.visibleEnd = visibleEnd;
    window.startIndex = static_cast<int>(std::max<qint64>(0, qint64(visibleStart) - overscan));
    window.endIndex = static_cast<int>(std::min<qint64>(lastIndex, qint64(visibleEnd) + overscan));
    window.offsetY = window.startIndex * input.itemHeight;
    window.totalHeight = input.itemCount * input.itemHeight;
    return window;
}
