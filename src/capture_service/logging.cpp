#include <posecast/logging.hpp>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>

Q_LOGGING_CATEGORY(lcCapture,   "posecast.capture")
Q_LOGGING_CATEGORY(lcTransport, "posecast.transport")
Q_LOGGING_CATEGORY(lcSeating,   "posecast.seating")
Q_LOGGING_CATEGORY(lcEditor,    "posecast.editor")
Q_LOGGING_CATEGORY(lcProvider,  "posecast.provider")
Q_LOGGING_CATEGORY(lcApp,       "posecast.app")

namespace posecast {

namespace {

QMutex g_sinkMutex;
DiagnosticsSink g_sink;

void sinkHandler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    DiagnosticsSink sink;
    {
        QMutexLocker lock(&g_sinkMutex);
        sink = g_sink;
    }
    if (sink) sink(type, QString::fromUtf8(ctx.category ? ctx.category : "default"), msg);
}

} // namespace

void setDiagnosticsSink(DiagnosticsSink sink) {
    const bool install = static_cast<bool>(sink);
    {
        QMutexLocker lock(&g_sinkMutex);
        g_sink = std::move(sink);
    }
    qInstallMessageHandler(install ? sinkHandler : nullptr);
}

void installLogging(bool debug) {
    qSetMessagePattern(QStringLiteral(
        "%{time yyyy-MM-dd hh:mm:ss.zzz} [%{type}] %{category}: %{message}"));
    QLoggingCategory::setFilterRules(debug
        ? QStringLiteral("posecast.*.debug=true")
        : QStringLiteral("posecast.*.debug=false"));
}

} // namespace posecast
