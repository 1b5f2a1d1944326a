#include "core/evidence/stopwords.h"

namespace rc {

const QSet<QString>& retrievalStopwords()
{
    static const QSet<QString> stopwords = {
        QStringLiteral("a"), QStringLiteral("an"), QStringLiteral("and"),
        QStringLiteral("are"), QStringLiteral("as"), QStringLiteral("at"),
        QStringLiteral("be"), QStringLiteral("by"), QStringLiteral("did"),
        QStringLiteral("do"), QStringLiteral("does"), QStringLiteral("during"),
        QStringLiteral("for"), QStringLiteral("from"), QStringLiteral("how"),
        QStringLiteral("in"), QStringLiteral("is"), QStringLiteral("it"),
        QStringLiteral("its"), QStringLiteral("many"), QStringLiteral("much"),
        QStringLiteral("of"), QStringLiteral("on"), QStringLiteral("or"),
        QStringLiteral("our"), QStringLiteral("the"), QStringLiteral("this"),
        QStringLiteral("to"), QStringLiteral("was"), QStringLiteral("we"),
        QStringLiteral("were"), QStringLiteral("what"), QStringLiteral("when"),
        QStringLiteral("which"), QStringLiteral("who"), QStringLiteral("with"),
        QStringLiteral("according"), QStringLiteral("return"), QStringLiteral("all"),
        QStringLiteral("time"),
    };
    return stopwords;
}

} // namespace rc
