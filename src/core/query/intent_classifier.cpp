#include "core/query/intent_classifier.h"

namespace mc {

namespace {

struct IntentPattern {
    const char* intent;
    const char* keywords[10];
    bool audioOnly;
};

constexpr IntentPattern kIntentPatterns[] = {
    {"tutorial",
     {"tutorial", "how to", "learn", "guide", "course", "lesson", "teach", "explain",
      "walkthrough", nullptr},
     false},
    {"review",
     {"review", "opinion", "thoughts", "rating", "critique", "analysis", "evaluation", nullptr},
     false},
    {"music",
     {"music", "song", "track", "album", "artist", "musician", "band", "lyrics", "melody",
      nullptr},
     true},
    {"interview",
     {"interview", "conversation", "discussion", "talk", "chat", "q&a", "qa", nullptr},
     false},
    {"lecture",
     {"lecture", "presentation", "talk", "speech", "seminar", "webinar", nullptr},
     false},
    {"demo",
     {"demo", "demonstration", "example", "sample", "showcase", "preview", nullptr},
     false},
    {"news",
     {"news", "report", "update", "breaking", "latest", "current events", nullptr},
     false},
};

} // namespace

std::optional<QString> IntentClassifier::classify(const QString& queryLower, MediaType type)
{
    if (queryLower.isEmpty()) {
        return std::nullopt;
    }

    for (const auto& pattern : kIntentPatterns) {
        if (pattern.audioOnly && type != MediaType::Audio) {
            continue;
        }
        for (const char* const* keyword = pattern.keywords; *keyword; ++keyword) {
            if (queryLower.contains(QLatin1String(*keyword))) {
                return QString::fromLatin1(pattern.intent);
            }
        }
    }

    return std::nullopt;
}

} // namespace mc
