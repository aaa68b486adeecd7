#pragma once

#include "core/shared/engine_config.h"
#include "core/shared/types.h"

#include <QString>

namespace mc {

// Secondary additive bonus for query text appearing in a record's title or
// description. Applied after relevance boosting; result capped at 1.0.
class ContextBooster {
public:
    explicit ContextBooster(const SemanticSettings& settings = {});

    double apply(const MediaRecord& record, const QString& query, double score) const;

private:
    SemanticSettings m_settings;
};

} // namespace mc
