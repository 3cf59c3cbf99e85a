// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <router/Router.hpp>

namespace mcprouter
{

/// @brief Shuts a Router down when the scope ends, however it ends.
///
/// Use release() to shut down early and see the outcome; otherwise the
/// destructor shuts down and logs a CloseError.
class RouterScope
{
  public:
    explicit RouterScope(Router& router);
    ~RouterScope();

    RouterScope(const RouterScope&) = delete;
    RouterScope& operator=(const RouterScope&) = delete;

    /// @brief The guarded router.
    [[nodiscard]] auto router() const -> Router& { return *_router; }
    auto operator->() const -> Router* { return _router; }

    /// @brief Shuts the router down now. Later calls and the destructor do nothing.
    [[nodiscard]] auto release() -> VoidResult;

  private:
    Router* _router;
    bool _released = false;
};

} // namespace mcprouter
