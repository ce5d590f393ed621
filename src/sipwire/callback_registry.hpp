#pragma once

#include <functional>
#include <mutex>
#include <string_view>

// Holds at most one event callback. The registry only keeps the capability to call it;
// whoever registers the callback keeps the code and data behind it alive until it is
// cleared or replaced.
//
// The mutex is held for the whole invocation, so after set() or clear() returns the old
// callback is neither running nor called again. A callback must not call back into the
// registry (or anything that clears it) from the dispatching thread.
class CallbackRegistry {
public:
    using Callback = std::function<void(const char* event, const char* payload)>;

    void set(Callback callback);

    void clear();

    [[nodiscard]] bool has_callback() const;

    // Strings passed to the callback die when it returns; the callee copies what it keeps.
    void dispatch(std::string_view event, std::string_view payload) const;

private:
    mutable std::mutex m_mutex;
    Callback m_callback;
};
