#pragma once
// 日志分类与可注入的诊断输出（Qt message handler）

#include <QtCore/QLoggingCategory>
#include <QtCore/QString>
#include <functional>

Q_DECLARE_LOGGING_CATEGORY(lcCapture)
Q_DECLARE_LOGGING_CATEGORY(lcTransport)
Q_DECLARE_LOGGING_CATEGORY(lcSeating)
Q_DECLARE_LOGGING_CATEGORY(lcEditor)
Q_DECLARE_LOGGING_CATEGORY(lcProvider)
Q_DECLARE_LOGGING_CATEGORY(lcApp)

namespace posecast {

// Receives every message logged through the posecast categories.
using DiagnosticsSink = std::function<void(QtMsgType type, const QString& category, const QString& message)>;

// Routes Qt messages into sink; an empty sink restores the default handler.
void setDiagnosticsSink(DiagnosticsSink sink);

// Message pattern for the launchers; debug output only when debug == true.
void installLogging(bool debug);

} // namespace posecast
