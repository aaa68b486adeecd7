#include "core/query/query_terms.h"

#include <QRegularExpression>
#include <QSet>

namespace mc {

namespace {

const QSet<QString>& stopWords()
{
    static const QSet<QString> words = {
        QStringLiteral("the"), QStringLiteral("a"), QStringLiteral("an"),
        QStringLiteral("and"), QStringLiteral("or"), QStringLiteral("but"),
        QStringLiteral("in"), QStringLiteral("on"), QStringLiteral("at"),
        QStringLiteral("to"), QStringLiteral("for"), QStringLiteral("of"),
        QStringLiteral("with"), QStringLiteral("by"), QStringLiteral("from"),
        QStringLiteral("as"), QStringLiteral("is"), QStringLiteral("was"),
        QStringLiteral("are"), QStringLiteral("were"), QStringLiteral("been"),
        QStringLiteral("be"), QStringLiteral("have"), QStringLiteral("has"),
        QStringLiteral("had"), QStringLiteral("do"), QStringLiteral("does"),
        QStringLiteral("did"), QStringLiteral("will"), QStringLiteral("would"),
        QStringLiteral("could"), QStringLiteral("should"), QStringLiteral("may"),
        QStringLiteral("might"), QStringLiteral("must"), QStringLiteral("can"),
        QStringLiteral("this"), QStringLiteral("that"), QStringLiteral("these"),
        QStringLiteral("those"), QStringLiteral("what"), QStringLiteral("which"),
        QStringLiteral("who"), QStringLiteral("whom"), QStringLiteral("whose"),
        QStringLiteral("where"), QStringLiteral("when"), QStringLiteral("why"),
        QStringLiteral("how"), QStringLiteral("all"), QStringLiteral("each"),
        QStringLiteral("every"), QStringLiteral("both"), QStringLiteral("few"),
        QStringLiteral("more"), QStringLiteral("most"), QStringLiteral("other"),
        QStringLiteral("some"), QStringLiteral("such"), QStringLiteral("no"),
        QStringLiteral("nor"), QStringLiteral("not"), QStringLiteral("only"),
        QStringLiteral("own"), QStringLiteral("same"), QStringLiteral("so"),
        QStringLiteral("than"), QStringLiteral("too"), QStringLiteral("very"),
        QStringLiteral("just"), QStringLiteral("about"), QStringLiteral("into"),
        QStringLiteral("through"), QStringLiteral("during"), QStringLiteral("before"),
        QStringLiteral("after"), QStringLiteral("above"), QStringLiteral("below"),
        QStringLiteral("up"), QStringLiteral("down"), QStringLiteral("out"),
        QStringLiteral("off"), QStringLiteral("over"), QStringLiteral("under"),
        QStringLiteral("again"), QStringLiteral("further"), QStringLiteral("then"),
        QStringLiteral("once"),
    };
    return words;
}

} // namespace

NormalizedQuery QueryTerms::normalize(const QString& raw)
{
    NormalizedQuery result;
    result.original = raw;
    result.normalized = raw.simplified();
    result.lower = result.normalized.toLower();
    return result;
}

QStringList QueryTerms::meaningfulWords(const QString& query)
{
    static const QRegularExpression whitespace(QStringLiteral(R"(\s+)"));
    const QStringList tokens = query.toLower().split(whitespace, Qt::SkipEmptyParts);

    QStringList words;
    words.reserve(tokens.size());
    for (const QString& token : tokens) {
        if (token.size() > 2 && !isStopWord(token)) {
            words.append(token);
        }
    }
    return words;
}

bool QueryTerms::isStopWord(const QString& word)
{
    return stopWords().contains(word.toLower());
}

} // namespace mc
