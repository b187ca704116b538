module;
#include <QString>
#include <QStringList>

module reel.utils.filename_utils;

namespace reel::utils {

namespace {

QString chopTrailingDotsAndSpaces(QString value)
{
    while (!value.isEmpty() && (value.back() == QLatin1Char('.') || value.back().isSpace())) {
        value.chop(1);
    }
    return value;
}

// A suffix is a short alphanumeric run after the last dot, e.g. ".mp4" or ".info".
int suffixStart(const QString& name)
{
    const int dot = name.lastIndexOf('.');
    if (dot <= 0) return -1;
    const int length = name.size() - dot;
    if (length < 2 || length > 16) return -1;
    for (int i = dot + 1; i < name.size(); ++i) {
        if (!name.at(i).isLetterOrNumber()) return -1;
    }
    return dot;
}

QString truncateUnits(const QString& value, int maxUnits)
{
    if (value.size() <= maxUnits) return value;
    QString out = value.left(qMax(0, maxUnits));
    // never leave half of a surrogate pair behind
    if (!out.isEmpty() && out.back().isHighSurrogate()) out.chop(1);
    return out;
}

QString boundLength(const QString& name)
{
    if (name.size() <= kMaxFileNameLength) return name;

    const int dot = suffixStart(name);
    if (dot > 0) {
        const QString suffix = name.mid(dot);
        QString stem = chopTrailingDotsAndSpaces(truncateUnits(name.left(dot), kMaxFileNameLength - suffix.size()));
        if (stem.isEmpty()) stem = QString::fromLatin1(kFallbackFileName);
        return stem + suffix;
    }
    return chopTrailingDotsAndSpaces(truncateUnits(name, kMaxFileNameLength));
}

} // namespace

bool isForbiddenFileNameChar(QChar ch)
{
    if (ch.unicode() < 0x20 || ch.unicode() == 0x7F) return true;
    switch (ch.unicode()) {
    case '<': case '>': case ':': case '"':
    case '/': case '\\': case '|': case '?': case '*':
        return true;
    default:
        return false;
    }
}

bool isReservedDeviceName(const QString& name)
{
    const QString base = name.section('.', 0, 0).trimmed().toUpper();
    static const QStringList fixed = { "CON", "PRN", "AUX", "NUL" };
    if (fixed.contains(base)) return true;
    if (base.size() == 4 && (base.startsWith("COM") || base.startsWith("LPT"))) {
        const QChar digit = base.at(3);
        return digit >= QLatin1Char('1') && digit <= QLatin1Char('9');
    }
    return false;
}

QString sanitizeFileName(const QString& rawName)
{
    QString replaced;
    QString kept;
    replaced.reserve(rawName.size());
    kept.reserve(rawName.size());
    for (const QChar ch : rawName) {
        if (isForbiddenFileNameChar(ch)) {
            replaced.append(QLatin1Char('_'));
        } else {
            replaced.append(ch);
            kept.append(ch);
        }
    }

    if (chopTrailingDotsAndSpaces(kept.trimmed()).isEmpty()) {
        return QString::fromLatin1(kFallbackFileName);
    }

    QString out = boundLength(chopTrailingDotsAndSpaces(replaced.trimmed()));
    if (out.isEmpty()) return QString::fromLatin1(kFallbackFileName);

    if (isReservedDeviceName(out)) {
        out = boundLength(QLatin1Char('_') + out);
    }
    return out;
}

QString sanitizeFileStem(const QString& rawName, int reservedSuffixLength)
{
    const int limit = qMax(1, kMaxFileNameLength - qMax(0, reservedSuffixLength));
    const QString name = sanitizeFileName(rawName);
    if (name.size() <= limit) return name;

    const QString out = chopTrailingDotsAndSpaces(truncateUnits(name, limit));
    return out.isEmpty() ? QString::fromLatin1(kFallbackFileName) : out;
}

} // namespace reel::utils
