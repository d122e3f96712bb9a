#include "QtPlatformProbe.hpp"
#include "QtNetworkMonitor.hpp"
#include "adaptive/SystemResources.hpp"
#include "BeaconLogging.hpp"
#include <QGuiApplication>
#include <QInputDevice>
#include <QNetworkInformation>
#include <QOffscreenSurface>
#include <QOpenGLContext>
#include <QOpenGLFunctions>
#include <QScreen>
#include <QThread>

namespace {

constexpr double BYTES_PER_GB = 1024.0 * 1024.0 * 1024.0;

std::optional<QString> glString(QOpenGLFunctions* gl, GLenum name) {
    const GLubyte* value = gl->glGetString(name);
    if (!value) return std::nullopt;
    return QString::fromLatin1(reinterpret_cast<const char*>(value));
}

} // namespace

PlatformSignals QtPlatformProbe::probe() {
    PlatformSignals out;
    out.hardwareConcurrency = readCores();
    out.deviceMemoryGB = readMemoryGB();
    readGpu(out);
    readInputDevices(out);
    out.viewportWidth = readViewportWidth();
    readNetwork(out);
    return out;
}

std::optional<int> QtPlatformProbe::readCores() {
    const int cores = QThread::idealThreadCount();
    if (cores <= 0) return std::nullopt;
    return cores;
}

std::optional<double> QtPlatformProbe::readMemoryGB() {
    const size_t bytes = SystemResources::totalPhysicalMemoryBytes();
    if (bytes == 0) return std::nullopt;
    return static_cast<double>(bytes) / BYTES_PER_GB;
}

void QtPlatformProbe::readGpu(PlatformSignals& out) {
    if (!QGuiApplication::instance()) {
        bLog_Warning("QtPlatformProbe: no QGuiApplication, GPU left unknown");
        return;
    }

    QOffscreenSurface surface;
    surface.create();

    QOpenGLContext context;
    if (!context.create() || !context.makeCurrent(&surface)) {
        bLog_Render("QtPlatformProbe: no OpenGL context available, GPU left unknown");
        return;
    }

    QOpenGLFunctions* gl = context.functions();
    out.gpuRenderer = glString(gl, GL_RENDERER);
    out.gpuVendor = glString(gl, GL_VENDOR);
    context.doneCurrent();

    bLog_Render("🖥️ GL renderer:" << out.gpuRenderer.value_or(QString()) << "vendor:" << out.gpuVendor.value_or(QString()));
}

void QtPlatformProbe::readInputDevices(PlatformSignals& out) {
    bool touch = false;
    for (const QInputDevice* device : QInputDevice::devices()) {
        if (device->type() == QInputDevice::DeviceType::TouchScreen) {
            touch = true;
            break;
        }
    }
    out.hasTouchSupport = touch;
    // A touchscreen is the primary pointer on the devices we target.
    out.hasCoarsePointer = touch;
}

std::optional<int> QtPlatformProbe::readViewportWidth() {
    const QScreen* screen = QGuiApplication::primaryScreen();
    if (!screen) return std::nullopt;
    return screen->availableGeometry().width();
}

void QtPlatformProbe::readNetwork(PlatformSignals& out) {
    if (!QNetworkInformation::loadDefaultBackend() || !QNetworkInformation::instance()) {
        bLog_App("QtPlatformProbe: no network information backend");
        return;
    }

    const NetworkSnapshot snapshot = QtNetworkMonitor::readSnapshot(*QNetworkInformation::instance());
    out.saveData = snapshot.metered;
    out.effectiveConnectionType = NetworkHints::effectiveConnectionType(snapshot);
}
