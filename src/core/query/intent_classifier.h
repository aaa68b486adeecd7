#pragma once

#include "core/shared/types.h"

#include <QString>

#include <optional>

namespace mc {

// Recognizes what kind of media a query is after (tutorial, review, ...).
class IntentClassifier {
public:
    // First intent, in table order, whose keyword occurs in queryLower and
    // which applies to the given media type. Returns nullopt otherwise.
    static std::optional<QString> classify(const QString& queryLower, MediaType type);
};

} // namespace mc
