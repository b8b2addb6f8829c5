#pragma once

#include "core/query/lane_router.h"

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QTextStream>

namespace hq {

// Classifies each positional argument, or each stdin line when there are
// none, and writes one JSON document per query.
class RouterCli {
public:
    explicit RouterCli(const RouterSettings& settings, bool pretty = false);

    QByteArray render(const QString& query) const;

    int run(const QStringList& queries, QTextStream& out) const;
    int runStream(QTextStream& in, QTextStream& out) const;

private:
    LaneRouter m_router;
    bool m_pretty = false;
};

} // namespace hq
