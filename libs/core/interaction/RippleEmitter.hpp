#pragma once

#include "config/InteractionConfig.hpp"
#include "scheduling/Scheduler.hpp"
#include <QObject>
#include <QPointF>
#include <QRectF>
#include <QVariantList>
#include <memory>
#include <unordered_map>
#include <vector>

struct RippleToken {
    quint64 id = 0;
    double x = 0.0;         // Relative to the target's top-left corner
    double y = 0.0;
    qint64 createdAt = 0;   // Scheduler clock
};

Q_DECLARE_METATYPE(RippleToken)

/**
 * Touch feedback bookkeeping: each tap/press spawns a token that lives for a fixed
 * expiry regardless of further input. Tokens never block or cancel each other.
 */
class RippleEmitter : public QObject {
    Q_OBJECT
    Q_PROPERTY(QVariantList ripples READ ripples NOTIFY ripplesChanged)
    Q_PROPERTY(qint64 expiryMs READ expiryMs CONSTANT)

public:
    explicit RippleEmitter(Scheduler& scheduler, const RippleConfig& config = {},
                           QObject* parent = nullptr);
    ~RippleEmitter() override;

    // pointerPos and targetBounds share one coordinate space.
    RippleToken createRipple(const QPointF& pointerPos, const QRectF& targetBounds);

    // Live tokens ordered by creation.
    std::vector<RippleToken> liveTokens() const;
    // liveTokens() as {id, x, y} maps for QML.
    QVariantList ripples() const;
    qint64 expiryMs() const { return m_config.expiryMs; }
    size_t liveCount() const { return m_tokens.size(); }
    bool contains(quint64 id) const { return m_tokens.find(id) != m_tokens.end(); }

    // Drops every token and its pending expiry.
    void clear();

signals:
    void rippleCreated(const RippleToken& token);
    void rippleExpired(quint64 id);
    void ripplesChanged();

private:
    struct LiveToken {
        RippleToken token;
        std::unique_ptr<ScheduledTask> expiry;
    };

    void expire(quint64 id);

    Scheduler& m_scheduler;
    RippleConfig m_config;
    std::unordered_map<quint64, LiveToken> m_tokens;
    quint64 m_nextId = 0;
};
