#include "router_cli.h"

#include <QJsonDocument>

namespace hq {

RouterCli::RouterCli(const RouterSettings& settings, bool pretty)
    : m_router(settings)
    , m_pretty(pretty)
{
}

QByteArray RouterCli::render(const QString& query) const
{
    const ClassificationResult result = m_router.classify(query);
    return QJsonDocument(result.toJson())
        .toJson(m_pretty ? QJsonDocument::Indented : QJsonDocument::Compact)
        .trimmed();
}

int RouterCli::run(const QStringList& queries, QTextStream& out) const
{
    for (const QString& query : queries) {
        out << QString::fromUtf8(render(query)) << '\n';
    }
    out.flush();
    return 0;
}

int RouterCli::runStream(QTextStream& in, QTextStream& out) const
{
    QString line;
    while (in.readLineInto(&line)) {
        if (line.trimmed().isEmpty()) {
            continue;
        }
        out << QString::fromUtf8(render(line)) << '\n';
        out.flush();
    }
    return 0;
}

} // namespace hq
