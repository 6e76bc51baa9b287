#pragma once

#include <shared_mutex>
#include <string>
#include <vector>
#include "core/config/gate_config.hpp"

namespace cmdgate::policy {

// Command paths eligible for long-running/background execution.
// Same depth-bounded matching as the deny-set, but mutable at runtime.
// Readers take a shared lock; add/remove take an exclusive one.
class StreamingClassifier {
public:
    StreamingClassifier();
    explicit StreamingClassifier(core::config::CommandSet paths);

    StreamingClassifier(const StreamingClassifier&) = delete;
    StreamingClassifier& operator=(const StreamingClassifier&) = delete;

    bool is_streaming(const std::string& command,
                      const std::vector<std::string>& args) const;

    // Returns true when the set changed.
    bool add(const std::string& path);
    bool remove(const std::string& path);

    // Independent copy; mutating it never touches the classifier.
    core::config::CommandSet list() const;

    static core::config::CommandSet default_paths();

private:
    mutable std::shared_mutex mutex_;
    core::config::CommandSet paths_;
};

}  // namespace cmdgate::policy
