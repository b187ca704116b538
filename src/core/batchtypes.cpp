module;
#include <QString>

module reel.core.batchtypes;

QString failureReasonName(FailureReason reason)
{
    switch (reason) {
    case FailureReason::NoMetadata: return QStringLiteral("no-metadata");
    case FailureReason::PrivateOrInaccessible: return QStringLiteral("private-or-inaccessible");
    case FailureReason::UnhandledType: return QStringLiteral("unhandled-type");
    case FailureReason::DownloadError: return QStringLiteral("download-error");
    case FailureReason::Cancelled: return QStringLiteral("cancelled");
    }
    return QStringLiteral("unknown");
}

QString FailureRecord::reasonText() const
{
    if (reason == FailureReason::DownloadError && !detail.isEmpty()) return detail;
    if (reason == FailureReason::UnhandledType && !detail.isEmpty()) {
        return QStringLiteral("unhandled-type: %1").arg(detail);
    }
    return failureReasonName(reason);
}

QString FailureRecord::toString() const
{
    return QStringLiteral("%1 - %2").arg(url.isEmpty() ? QStringLiteral("Unknown URL") : url, reasonText());
}
