#pragma once

#include "export.hpp"

#include <functional>
#include <memory>
#include <utility>

namespace libbeans {

/// Teardown callback registered for a bean name.  The disposable may be a
/// different object than the cached singleton (e.g. an adapter that calls
/// a close() method on it).
class LIBBEANS_EXPORT disposable {
public:
    virtual ~disposable() = default;

    /// Release the resources of the associated bean.  May throw; the
    /// registry logs and swallows any std::exception raised here.
    virtual void destroy() = 0;
};

namespace detail {

class callback_disposable final : public disposable {
public:
    explicit callback_disposable(std::function<void()> fn)
        : fn_(std::move(fn)) {}

    void destroy() override {
        if (fn_) fn_();
    }

private:
    std::function<void()> fn_;
};

} // namespace detail

/// Adapt a plain callable into a disposable.
inline std::shared_ptr<disposable> make_disposable(std::function<void()> fn) {
    return std::make_shared<detail::callback_disposable>(std::move(fn));
}

} // namespace libbeans
