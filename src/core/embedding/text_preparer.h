#pragma once

#include "core/shared/types.h"

#include <QString>
#include <QStringList>

namespace mc {

// Builds the text handed to the embedding provider for a record:
// title, description, media keywords (audio/video only), then content.
class TextPreparer {
public:
    static QString prepare(const MediaRecord& record);

    static QStringList mediaKeywords(const MediaRecord& record);
};

} // namespace mc
