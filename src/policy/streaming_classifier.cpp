#include "policy/streaming_classifier.hpp"

#include <mutex>
#include <utility>
#include "core/logging/logger.hpp"
#include "policy/command_path_matcher.hpp"

namespace cmdgate::policy {

using core::config::CommandSet;

StreamingClassifier::StreamingClassifier() : paths_(default_paths()) {}

StreamingClassifier::StreamingClassifier(CommandSet paths) : paths_(std::move(paths)) {}

CommandSet StreamingClassifier::default_paths() {
    return {"log-tail", "stats realtime"};
}

bool StreamingClassifier::is_streaming(const std::string& command,
                                       const std::vector<std::string>& args) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return CommandPathMatcher::matches(paths_, command, args);
}

bool StreamingClassifier::add(const std::string& path) {
    bool inserted = false;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        inserted = paths_.insert(path).second;
    }
    if (inserted) {
        CMDGATE_LOG_INFO("StreamingClassifier: added '" + path + "'");
    }
    return inserted;
}

bool StreamingClassifier::remove(const std::string& path) {
    bool erased = false;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        erased = paths_.erase(path) != 0;
    }
    if (erased) {
        CMDGATE_LOG_INFO("StreamingClassifier: removed '" + path + "'");
    }
    return erased;
}

CommandSet StreamingClassifier::list() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return paths_;
}

}  // namespace cmdgate::policy
