#include "interaction/RippleEmitter.hpp"
#include "BeaconLogging.hpp"
#include <QVariantMap>
#include <algorithm>

RippleEmitter::RippleEmitter(Scheduler& scheduler, const RippleConfig& config, QObject* parent)
    : QObject(parent)
    , m_scheduler(scheduler)
    , m_config(config) {
}

RippleEmitter::~RippleEmitter() {
    // Expiry handles cancel themselves; no signals during teardown.
    m_tokens.clear();
}

RippleToken RippleEmitter::createRipple(const QPointF& pointerPos, const QRectF& targetBounds) {
    RippleToken token;
    token.id = m_nextId++;
    token.x = pointerPos.x() - targetBounds.left();
    token.y = pointerPos.y() - targetBounds.top();
    token.createdAt = m_scheduler.nowMs();

    const quint64 id = token.id;
    auto expiry = std::make_unique<ScheduledTask>(&m_scheduler,
        m_scheduler.schedule(m_config.expiryMs, [this, id]() { expire(id); }));

    m_tokens.emplace(id, LiveToken{token, std::move(expiry)});

    bLog_InputN(10, "Ripple" << id << "at" << token.x << token.y << "live:" << m_tokens.size());
    emit rippleCreated(token);
    emit ripplesChanged();
    return token;
}

std::vector<RippleToken> RippleEmitter::liveTokens() const {
    std::vector<RippleToken> tokens;
    tokens.reserve(m_tokens.size());
    for (const auto& entry : m_tokens) {
        tokens.push_back(entry.second.token);
    }
    std::sort(tokens.begin(), tokens.end(),
              [](const RippleToken& a, const RippleToken& b) { return a.id < b.id; });
    return tokens;
}

QVariantList RippleEmitter::ripples() const {
    QVariantList list;
    for (const RippleToken& token : liveTokens()) {
        list.append(QVariantMap{
            {QStringLiteral("id"), token.id},
            {QStringLiteral("x"), token.x},
            {QStringLiteral("y"), token.y},
        });
    }
    return list;
}

void RippleEmitter::clear() {
    if (m_tokens.empty()) return;
    m_tokens.clear();
    emit ripplesChanged();
}

void RippleEmitter::expire(quint64 id) {
    auto it = m_tokens.find(id);
    if (it == m_tokens.end()) return;

    // The expiry task has already fired; release the handle without cancelling anything.
    m_tokens.erase(it);
    emit rippleExpired(id);
    emit ripplesChanged();
}
