/*
Beacon — VirtualScrollController
Role: Holds list geometry and scroll position and republishes the row window to render.
Inputs/Outputs: setItemCount/setItemHeight/setViewportHeight/setScrollTop/setOverscan in;
      windowChanged(VirtualWindow) out, only when the computed window differs.
Threading: GUI thread only.
Integration: Overscan normally follows RenderPolicy::recommendedOverscan via applyPolicy().
Related: VirtualWindow.hpp, AdaptivePerformanceController.hpp.
*/
#pragma once

#include "list/VirtualWindow.hpp"
#include <QObject>

struct RenderPolicy;

class VirtualScrollController : public QObject {
    Q_OBJECT
    Q_PROPERTY(double scrollTop READ scrollTop WRITE setScrollTop NOTIFY scrollTopChanged)
    Q_PROPERTY(int startIndex READ startIndex NOTIFY windowChanged)
    Q_PROPERTY(int endIndex READ endIndex NOTIFY windowChanged)
    Q_PROPERTY(double offsetY READ offsetY NOTIFY windowChanged)
    Q_PROPERTY(double totalHeight READ totalHeight NOTIFY windowChanged)

public:
    explicit VirtualScrollController(int overscan = 5, QObject* parent = nullptr);

    void setItemCount(int count);
    void setItemHeight(double height);
    void setViewportHeight(double height);
    void setScrollTop(double scrollTop);
    void setOverscan(int overscan);

    const VirtualWindowInput& input() const { return m_input; }
    const VirtualWindow& window() const { return m_window; }

    double scrollTop() const { return m_input.scrollTop; }
    int startIndex() const { return m_window.startIndex; }
    int endIndex() const { return m_window.endIndex; }
    double offsetY() const { return m_window.offsetY; }
    double totalHeight() const { return m_window.totalHeight; }

public slots:
    void applyPolicy(const RenderPolicy& policy);

signals:
    void windowChanged(const VirtualWindow& window);
    void scrollTopChanged(double scrollTop);

private:
    void recompute();

    VirtualWindowInput m_input;
    VirtualWindow m_window;
};
